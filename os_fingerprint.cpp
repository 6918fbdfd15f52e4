#include "os_fingerprint.hpp"

namespace {

std::string osFromTtl(int ttl) {
    if (ttl <= 64) return "Linux/Unix";
    if (ttl <= 128) return "Windows";
    return "Solaris/Cisco";
}

} // namespace

OSFingerprint fingerprintReply(const Packet& reply) {
    OSFingerprint fingerprint;
    fingerprint.ttl = reply.ttl;
    fingerprint.window_size = reply.window;

    const TcpOption* mss = reply.findOption(TCPOPT_KIND_MSS);
    if (mss && mss->data.size() >= 2) {
        fingerprint.mss = (mss->data[0] << 8) | mss->data[1];
    }
    fingerprint.has_timestamp = reply.findOption(TCPOPT_KIND_TIMESTAMP) != nullptr;

    fingerprint.os_name = osFromTtl(fingerprint.ttl);
    if (fingerprint.has_timestamp) {
        fingerprint.os_name = "Linux/Unix (Timestamp)";
    } else if (fingerprint.mss == 1460) {
        fingerprint.os_name = "Linux/Unix";
    }
    return fingerprint;
}

std::string guessOs(const Packet& reply) {
    return fingerprintReply(reply).os_name;
}
