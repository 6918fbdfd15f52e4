#ifndef SCAN_TECHNIQUES_HPP
#define SCAN_TECHNIQUES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "fragmentation.hpp"
#include "packet_builder.hpp"
#include "probe_engine.hpp"
#include "retry_policy.hpp"
#include "scan_config.hpp"
#include "scan_types.hpp"
#include "tls_inspector.hpp"

// Bytes of the mimicked banner carried by a MIMIC probe.
constexpr size_t MIMIC_PAYLOAD_LIMIT = 16;

/**
 * @struct TechniqueOutcome
 * @brief Verdict of one technique on one port plus what it learned on the way.
 */
struct TechniqueOutcome {
    std::string state;
    std::string os_guess;             ///< Set when a SYN-family probe found the port open.
    std::optional<CertInfo> cert;     ///< SSL only.
    std::string tls_version;          ///< SSL only, e.g. "TLSv1.2".
};

/**
 * @class TechniqueRunner
 * @brief Runs one scan technique against one port. Every call blocks.
 *
 * The runner holds no per-port state, so one instance serves all port tasks
 * concurrently.
 */
class TechniqueRunner {
public:
    TechniqueRunner(const ScanConfig& config, const TargetDescriptor& target,
                    ProbeTransport& transport, TlsProber& tls, FragmentScanner& fragments);

    TechniqueOutcome run(ScanTechnique technique, uint16_t port);

    /** @brief Retry budget: max_tries for SYN, TLS_ECHO, MIMIC and FRAG, one try otherwise. */
    RetryPolicy policyFor(ScanTechnique technique) const;

private:
    TechniqueOutcome synFamily(ScanTechnique technique, uint16_t port, const std::vector<uint8_t>& payload);
    std::string singleProbe(ScanTechnique technique, uint16_t port);
    std::string udpProbe(uint16_t port);
    TechniqueOutcome sslProbe(uint16_t port);

    const ScanConfig& config_;
    TargetDescriptor target_;
    PacketBuilder builder_;
    ProbeTransport& transport_;
    TlsProber& tls_;
    FragmentScanner& fragments_;
    std::vector<uint8_t> mimic_payload_;
};

/** @brief SYN+ACK -> open, RST -> closed, anything else -> filtered. */
std::string classifySyn(const std::optional<Packet>& reply);

/** @brief RST -> unfiltered, anything else -> filtered. */
std::string classifyAck(const std::optional<Packet>& reply);

/** @brief FIN/XMAS/NULL: RST -> closed, anything else -> open|filtered. */
std::string classifyStealth(const std::optional<Packet>& reply);

/** @brief No reply -> filtered; TCP reply with window != 0 -> open, 0 -> closed. */
std::string classifyWindow(const std::optional<Packet>& reply);

/**
 * @brief UDP reply -> open; ICMP port unreachable -> closed; other ICMP ->
 * filtered; no reply -> open|filtered.
 */
std::string classifyUdp(const std::optional<Packet>& reply);

/** @brief TCP flags of the single-packet probe of @p technique. */
uint8_t probeFlags(ScanTechnique technique);

/**
 * @brief Leading MIMIC_PAYLOAD_LIMIT bytes of the canned banner of
 * @p protocol (HTTP, SSH, FTP, SMTP, IMAP, POP3, MySQL, RDP; any case).
 * Unknown protocols log a warning and give an empty payload.
 */
std::vector<uint8_t> mimicPayload(const std::string& protocol);

/** @brief Minimal TLS 1.2 ServerHello record head with a random 32-byte nonce. */
std::vector<uint8_t> tlsEchoPayload();

/** @brief Settings of the fragmentation engine derived from the scan config. */
FragmentSettings fragmentSettings(const ScanConfig& config);

#endif // SCAN_TECHNIQUES_HPP
