#ifndef PACKET_BUILDER_HPP
#define PACKET_BUILDER_HPP

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "scan_types.hpp"

// TCP option kinds used by the OS fingerprinter.
constexpr uint8_t TCPOPT_KIND_MSS = 2;
constexpr uint8_t TCPOPT_KIND_TIMESTAMP = 8;

/**
 * @struct TcpOption
 * @brief One TCP option as carried on the wire (kind + raw data).
 */
struct TcpOption {
    uint8_t kind = 0;
    std::vector<uint8_t> data;
};

/**
 * @struct Packet
 * @brief Decoded view of one IPv4/IPv6 datagram carrying TCP, UDP or ICMP.
 *
 * Used both for probes built by PacketBuilder and for replies captured by the
 * probe engine or the passive capture. Addresses are textual literals; ports
 * and numeric fields are in host byte order.
 */
struct Packet {
    bool ipv6 = false;
    std::string src_ip;
    std::string dst_ip;
    uint8_t ttl = 64;                ///< TTL (v4) or hop limit (v6).
    uint16_t ip_id = 0;
    uint8_t protocol = 0;            ///< IPPROTO_TCP, IPPROTO_UDP, IPPROTO_ICMP or IPPROTO_ICMPV6.

    uint16_t src_port = 0;
    uint16_t dst_port = 0;

    uint32_t seq = 0;
    uint32_t ack_seq = 0;
    uint8_t tcp_flags = 0;           ///< TH_* bits from <netinet/tcp.h>.
    uint16_t window = 0;
    std::vector<TcpOption> tcp_options;

    uint8_t icmp_type = 0;
    uint8_t icmp_code = 0;
    std::string quoted_dst_ip;       ///< Destination of the datagram an ICMP error refers to.
    uint16_t quoted_src_port = 0;    ///< Ports of that datagram.
    uint16_t quoted_dst_port = 0;
    uint8_t quoted_protocol = 0;

    std::vector<uint8_t> payload;

    bool isTcp() const;
    bool isUdp() const;
    bool isIcmp() const;
    bool hasFlags(uint8_t flags) const { return (tcp_flags & flags) == flags; }

    /** @brief Option with the given kind, if present. */
    const TcpOption* findOption(uint8_t kind) const;
};

/**
 * @class PacketBuilder
 * @brief Crafts probe packets for one target.
 *
 * Each call draws a fresh ephemeral source port (1024-65535) and a fresh
 * initial sequence number. With evasion enabled the TTL/hop limit is drawn
 * from {64, 128, 255} and the IPv4 identification is randomized.
 */
class PacketBuilder {
public:
    PacketBuilder(const TargetDescriptor& target, bool evasions);

    Packet tcp(uint16_t dst_port, uint8_t flags, const std::vector<uint8_t>& payload = {});
    Packet udp(uint16_t dst_port, const std::vector<uint8_t>& payload);

    /** @brief RST (same ports, seq + 1) tearing down the half-open connection opened by @p probe. */
    Packet rstFor(const Packet& probe) const;

    uint8_t pickTtl();
    uint16_t randomIpId();
    uint16_t randomSourcePort();
    uint32_t randomSequence();

    const TargetDescriptor& target() const { return target_; }
    bool evasions() const { return evasions_; }

private:
    Packet base(uint8_t protocol);

    TargetDescriptor target_;
    bool evasions_;
};

/** @brief Random engine shared by the crafting code of the calling thread. */
std::mt19937& packetRng();

/** @brief RFC 1071 ones' complement sum over @p data, folded and inverted. */
uint16_t internetChecksum(const uint8_t* data, size_t length, uint32_t initial = 0);

/**
 * @brief Serializes the transport part (TCP/UDP header + options + payload)
 * with a checksum computed over the IPv4 or IPv6 pseudo-header.
 */
std::vector<uint8_t> serializeTransport(const Packet& packet);

/** @brief Full datagram: IPv4 header (or IPv6 fixed header) + transport part. */
std::vector<uint8_t> serializePacket(const Packet& packet);

/**
 * @brief Parses a complete IPv4 or IPv6 datagram.
 *
 * ICMP/ICMPv6 errors are decoded down to the quoted transport ports.
 * @return Empty optional for truncated or unsupported data.
 */
std::optional<Packet> parsePacket(const uint8_t* data, size_t length);

/**
 * @brief Parses a transport segment delivered without its IP header (as a raw
 * IPv6 socket does) and fills @p packet's transport fields.
 */
bool parseSegment(uint8_t protocol, const uint8_t* data, size_t length, Packet& packet);

/** @brief "SA", "R", "RA"... for logs. */
std::string tcpFlagString(uint8_t flags);

#endif // PACKET_BUILDER_HPP
