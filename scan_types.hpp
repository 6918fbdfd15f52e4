#ifndef SCAN_TYPES_HPP
#define SCAN_TYPES_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @enum ScanTechnique
 * @brief Closed set of probing techniques. Every switch over it is exhaustive.
 */
enum class ScanTechnique {
    SYN,
    ACK,
    FIN,
    XMAS,
    NULL_SCAN,
    WINDOW,
    UDP,
    SSL,
    TLS_ECHO,
    MIMIC,
    FRAG
};

// Port state strings as reported per technique.
extern const char* const STATE_OPEN;
extern const char* const STATE_CLOSED;
extern const char* const STATE_FILTERED;
extern const char* const STATE_OPEN_FILTERED;
extern const char* const STATE_UNFILTERED;

/** @brief Lower-case technique name, e.g. "syn", "tls_echo". */
const char* techniqueName(ScanTechnique technique);

/**
 * @brief Parses a technique name (case-insensitive; "tlsecho" is accepted too).
 * @throws std::invalid_argument for unknown names.
 */
ScanTechnique parseTechnique(const std::string& name);

const std::vector<ScanTechnique>& allTechniques();

/** @brief True for techniques that need raw sockets (everything but SSL). */
bool requiresRawSocket(ScanTechnique technique);

/** @brief SYN, TLS_ECHO and MIMIC: SYN probes whose open reply is fingerprinted. */
bool isSynFamily(ScanTechnique technique);

/**
 * @struct CertInfo
 * @brief Summary of the peer certificate seen during a TLS handshake.
 */
struct CertInfo {
    std::string subject;              ///< RFC 2253 subject name.
    std::string issuer;               ///< RFC 2253 issuer name.
    std::string version;              ///< Certificate version, e.g. "v3".
    std::string serial;               ///< Serial number in decimal.
    std::string not_valid_before;     ///< Start of validity window.
    std::string not_valid_after;      ///< End of validity window.
    std::string signature_algorithm;  ///< OpenSSL long name, e.g. "sha256WithRSAEncryption".
};

/**
 * @struct PortResult
 * @brief Aggregate record for one scanned port.
 */
struct PortResult {
    std::map<ScanTechnique, std::string> tcp_states; ///< Only techniques that ran.
    std::string udp_state;
    std::string filtering;                           ///< ACK technique verdict.
    std::string service;
    std::string version;
    std::string banner;                              ///< At most 256 characters.
    std::string os_guess;
    std::optional<CertInfo> cert_info;
    std::vector<std::string> vulns;                  ///< Append-only.
    std::string scan_time;                           ///< ISO-8601 creation time.

    /** @brief Open iff some TCP technique or the UDP technique says "open". */
    bool isOpen() const;
};

/** @brief Current local time as "YYYY-MM-DDTHH:MM:SS". */
std::string isoTimestamp();

/**
 * @struct TargetDescriptor
 * @brief Resolved scan target. Immutable once the scan starts.
 */
struct TargetDescriptor {
    std::string ip;         ///< Resolved address literal.
    bool ipv6 = false;
    std::string source_ip;  ///< Local address used to reach ip; empty if unknown.
};

#endif // SCAN_TYPES_HPP
