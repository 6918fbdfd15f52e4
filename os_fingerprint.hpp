#ifndef OS_FINGERPRINT_HPP
#define OS_FINGERPRINT_HPP

#include <string>

#include "packet_builder.hpp"

/**
 * @struct OSFingerprint
 * @brief Observations taken from one open-port reply and the resulting guess.
 */
struct OSFingerprint {
    int ttl = -1;                 ///< TTL (v4) or hop limit (v6) of the reply.
    int window_size = -1;         ///< TCP window of the reply.
    int mss = -1;                 ///< MSS option value, -1 if absent.
    bool has_timestamp = false;   ///< TCP Timestamp option present.
    std::string os_name;          ///< Best guess, e.g. "Linux/Unix".
};

/**
 * @brief Fingerprints the SYN+ACK (or other open-classifying reply) of a port.
 *
 * TTL <= 64 suggests Linux/Unix, <= 128 Windows, anything higher
 * Solaris/Cisco. A Timestamp option then refines the guess to
 * "Linux/Unix (Timestamp)", otherwise an MSS of exactly 1460 to "Linux/Unix".
 */
OSFingerprint fingerprintReply(const Packet& reply);

/** @brief Shorthand for fingerprintReply(reply).os_name. */
std::string guessOs(const Packet& reply);

#endif // OS_FINGERPRINT_HPP
