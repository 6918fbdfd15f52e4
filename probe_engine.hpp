#ifndef PROBE_ENGINE_HPP
#define PROBE_ENGINE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "packet_builder.hpp"

/**
 * @class ProbeTransport
 * @brief Sends crafted packets and collects the reply of the probed flow.
 *
 * All calls block; the orchestrator runs them on its I/O worker pool.
 */
class ProbeTransport {
public:
    virtual ~ProbeTransport() = default;

    /** @brief Fire-and-forget send (RST teardown). */
    virtual bool send(const Packet& packet) = 0;

    /**
     * @brief Sends @p packet and waits for the first reply of its flow.
     * @param timeout_ms Upper bound on the wait.
     * @return The reply, or empty on timeout or socket failure.
     */
    virtual std::optional<Packet> sendAndWait(const Packet& packet, int timeout_ms) = 0;

    /**
     * @brief Sends an already serialized datagram (IP header included).
     * Used for hand-built IP fragments.
     */
    virtual bool sendDatagram(const std::vector<uint8_t>& datagram, bool ipv6,
                              const std::string& dst_ip) = 0;
};

/**
 * @class RawSocketTransport
 * @brief ProbeTransport over raw sockets.
 *
 * IPv4 is sent with IP_HDRINCL, IPv6 through an IPPROTO_RAW socket. Replies
 * are read from raw TCP/UDP sockets plus an ICMP (ICMPv6) socket so that
 * unreachable errors are seen as well.
 */
class RawSocketTransport : public ProbeTransport {
public:
    bool send(const Packet& packet) override;
    std::optional<Packet> sendAndWait(const Packet& packet, int timeout_ms) override;
    bool sendDatagram(const std::vector<uint8_t>& datagram, bool ipv6,
                      const std::string& dst_ip) override;
};

/**
 * @brief True if @p reply belongs to the flow opened by @p probe: a TCP/UDP
 * answer from the target with swapped ports, or an ICMP error from any
 * sender quoting the probe's destination and ports.
 */
bool matchesFlow(const Packet& probe, const Packet& reply);

/**
 * @brief Local address the kernel would use to reach @p ip.
 * @return Empty string if no route is found.
 */
std::string localAddressFor(const std::string& ip, bool ipv6);

/**
 * @brief Plain TCP connect bounded by @p timeout_ms.
 * @return Connected blocking descriptor with send/receive timeouts set to
 * @p timeout_ms, or -1. The caller closes it.
 */
int openTcpConnection(const std::string& ip, bool ipv6, int port, int timeout_ms);

/** @brief Effective root or a raw socket can be opened. */
bool hasRawSocketPrivileges();

#endif // PROBE_ENGINE_HPP
