#include "packet_builder.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip6.h>
#include <netinet/tcp.h>
#include <netinet/udp.h>

#include <cstring>

namespace {

constexpr size_t TCP_HEADER_LEN = 20;
constexpr size_t UDP_HEADER_LEN = 8;
constexpr size_t IPV4_HEADER_LEN = 20;
constexpr size_t IPV6_HEADER_LEN = 40;

uint16_t readU16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t readU32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

std::string addressToString(int family, const void* addr) {
    char buffer[INET6_ADDRSTRLEN] = {0};
    if (inet_ntop(family, addr, buffer, sizeof(buffer)) == nullptr) return "";
    return buffer;
}

// Sum of the pseudo-header words, unfolded, for the transport checksum.
uint32_t pseudoHeaderSum(const Packet& packet, size_t transport_length) {
    std::vector<uint8_t> pseudo;
    if (packet.ipv6) {
        pseudo.resize(40, 0);
        inet_pton(AF_INET6, packet.src_ip.c_str(), pseudo.data());
        inet_pton(AF_INET6, packet.dst_ip.c_str(), pseudo.data() + 16);
        uint32_t length = htonl(static_cast<uint32_t>(transport_length));
        std::memcpy(pseudo.data() + 32, &length, 4);
        pseudo[39] = packet.protocol;
    } else {
        pseudo.resize(12, 0);
        inet_pton(AF_INET, packet.src_ip.c_str(), pseudo.data());
        inet_pton(AF_INET, packet.dst_ip.c_str(), pseudo.data() + 4);
        pseudo[9] = packet.protocol;
        uint16_t length = htons(static_cast<uint16_t>(transport_length));
        std::memcpy(pseudo.data() + 10, &length, 2);
    }
    uint32_t sum = 0;
    for (size_t i = 0; i + 1 < pseudo.size(); i += 2) {
        sum += readU16(&pseudo[i]);
    }
    return sum;
}

std::vector<uint8_t> serializeOptions(const std::vector<TcpOption>& options) {
    std::vector<uint8_t> bytes;
    for (const auto& option : options) {
        bytes.push_back(option.kind);
        if (option.kind == 0 || option.kind == 1) continue;
        bytes.push_back(static_cast<uint8_t>(option.data.size() + 2));
        bytes.insert(bytes.end(), option.data.begin(), option.data.end());
    }
    while (bytes.size() % 4 != 0) bytes.push_back(0);
    return bytes;
}

std::vector<TcpOption> parseOptions(const uint8_t* data, size_t length) {
    std::vector<TcpOption> options;
    size_t i = 0;
    while (i < length) {
        uint8_t kind = data[i];
        if (kind == 0) break;
        if (kind == 1) {
            options.push_back(TcpOption{kind, {}});
            ++i;
            continue;
        }
        if (i + 1 >= length) break;
        uint8_t option_len = data[i + 1];
        if (option_len < 2 || i + option_len > length) break;
        options.push_back(TcpOption{kind, std::vector<uint8_t>(data + i + 2, data + i + option_len)});
        i += option_len;
    }
    return options;
}

// Destination and ports of the datagram quoted inside an ICMP/ICMPv6 error.
void parseQuoted(bool ipv6, const uint8_t* inner, size_t length, Packet& packet) {
    size_t header_len;
    if (ipv6) {
        if (length < IPV6_HEADER_LEN) return;
        packet.quoted_protocol = inner[6];
        packet.quoted_dst_ip = addressToString(AF_INET6, inner + 24);
        header_len = IPV6_HEADER_LEN;
    } else {
        if (length < IPV4_HEADER_LEN) return;
        packet.quoted_protocol = inner[9];
        packet.quoted_dst_ip = addressToString(AF_INET, inner + 16);
        header_len = static_cast<size_t>(inner[0] & 0x0f) * 4;
    }
    if (length < header_len + 4) return;
    packet.quoted_src_port = readU16(inner + header_len);
    packet.quoted_dst_port = readU16(inner + header_len + 2);
}

} // namespace

bool Packet::isTcp() const {
    return protocol == IPPROTO_TCP;
}

bool Packet::isUdp() const {
    return protocol == IPPROTO_UDP;
}

bool Packet::isIcmp() const {
    return protocol == IPPROTO_ICMP || protocol == IPPROTO_ICMPV6;
}

const TcpOption* Packet::findOption(uint8_t kind) const {
    for (const auto& option : tcp_options) {
        if (option.kind == kind) return &option;
    }
    return nullptr;
}

std::mt19937& packetRng() {
    thread_local std::mt19937 rng(std::random_device{}());
    return rng;
}

PacketBuilder::PacketBuilder(const TargetDescriptor& target, bool evasions)
    : target_(target), evasions_(evasions) {}

uint8_t PacketBuilder::pickTtl() {
    if (!evasions_) return 64;
    static const uint8_t choices[] = {64, 128, 255};
    std::uniform_int_distribution<int> dist(0, 2);
    return choices[dist(packetRng())];
}

uint16_t PacketBuilder::randomIpId() {
    std::uniform_int_distribution<int> dist(1, 65535);
    return static_cast<uint16_t>(dist(packetRng()));
}

uint16_t PacketBuilder::randomSourcePort() {
    std::uniform_int_distribution<int> dist(1024, 65535);
    return static_cast<uint16_t>(dist(packetRng()));
}

uint32_t PacketBuilder::randomSequence() {
    std::uniform_int_distribution<uint32_t> dist(1000, 0xffffffffu);
    return dist(packetRng());
}

Packet PacketBuilder::base(uint8_t protocol) {
    Packet packet;
    packet.ipv6 = target_.ipv6;
    packet.src_ip = target_.source_ip;
    packet.dst_ip = target_.ip;
    packet.ttl = pickTtl();
    packet.ip_id = evasions_ ? randomIpId() : 0;
    packet.protocol = protocol;
    packet.src_port = randomSourcePort();
    return packet;
}

Packet PacketBuilder::tcp(uint16_t dst_port, uint8_t flags, const std::vector<uint8_t>& payload) {
    Packet packet = base(IPPROTO_TCP);
    packet.dst_port = dst_port;
    packet.seq = randomSequence();
    packet.tcp_flags = flags;
    packet.window = 5840;
    packet.payload = payload;
    return packet;
}

Packet PacketBuilder::udp(uint16_t dst_port, const std::vector<uint8_t>& payload) {
    Packet packet = base(IPPROTO_UDP);
    packet.dst_port = dst_port;
    packet.payload = payload;
    return packet;
}

Packet PacketBuilder::rstFor(const Packet& probe) const {
    Packet rst;
    rst.ipv6 = probe.ipv6;
    rst.src_ip = probe.src_ip;
    rst.dst_ip = probe.dst_ip;
    rst.ttl = probe.ttl;
    rst.ip_id = probe.ip_id;
    rst.protocol = IPPROTO_TCP;
    rst.src_port = probe.src_port;
    rst.dst_port = probe.dst_port;
    rst.seq = probe.seq + 1;
    rst.tcp_flags = TH_RST;
    rst.window = 0;
    return rst;
}

uint16_t internetChecksum(const uint8_t* data, size_t length, uint32_t initial) {
    uint32_t sum = initial;
    size_t i = 0;
    for (; i + 1 < length; i += 2) {
        sum += readU16(data + i);
    }
    if (length % 2 != 0) {
        sum += static_cast<uint32_t>(data[length - 1]) << 8;
    }
    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }
    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> serializeTransport(const Packet& packet) {
    std::vector<uint8_t> segment;
    if (packet.isTcp()) {
        std::vector<uint8_t> options = serializeOptions(packet.tcp_options);
        segment.resize(TCP_HEADER_LEN + options.size(), 0);
        struct tcphdr* tcp = reinterpret_cast<struct tcphdr*>(segment.data());
        tcp->th_sport = htons(packet.src_port);
        tcp->th_dport = htons(packet.dst_port);
        tcp->th_seq = htonl(packet.seq);
        tcp->th_ack = htonl(packet.ack_seq);
        tcp->th_off = static_cast<uint8_t>((TCP_HEADER_LEN + options.size()) / 4);
        tcp->th_flags = packet.tcp_flags;
        tcp->th_win = htons(packet.window);
        tcp->th_sum = 0;
        tcp->th_urp = 0;
        std::copy(options.begin(), options.end(), segment.begin() + TCP_HEADER_LEN);
        segment.insert(segment.end(), packet.payload.begin(), packet.payload.end());
        uint16_t sum = internetChecksum(segment.data(), segment.size(),
                                        pseudoHeaderSum(packet, segment.size()));
        reinterpret_cast<struct tcphdr*>(segment.data())->th_sum = htons(sum);
    } else if (packet.isUdp()) {
        segment.resize(UDP_HEADER_LEN, 0);
        segment.insert(segment.end(), packet.payload.begin(), packet.payload.end());
        struct udphdr* udp = reinterpret_cast<struct udphdr*>(segment.data());
        udp->uh_sport = htons(packet.src_port);
        udp->uh_dport = htons(packet.dst_port);
        udp->uh_ulen = htons(static_cast<uint16_t>(segment.size()));
        udp->uh_sum = 0;
        uint16_t sum = internetChecksum(segment.data(), segment.size(),
                                        pseudoHeaderSum(packet, segment.size()));
        // A computed zero is transmitted as all ones.
        udp->uh_sum = htons(sum == 0 ? 0xffff : sum);
    } else {
        segment = packet.payload;
    }
    return segment;
}

std::vector<uint8_t> serializePacket(const Packet& packet) {
    std::vector<uint8_t> segment = serializeTransport(packet);
    std::vector<uint8_t> datagram;
    if (packet.ipv6) {
        datagram.resize(IPV6_HEADER_LEN, 0);
        struct ip6_hdr* ip6 = reinterpret_cast<struct ip6_hdr*>(datagram.data());
        ip6->ip6_flow = htonl(6u << 28);
        ip6->ip6_plen = htons(static_cast<uint16_t>(segment.size()));
        ip6->ip6_nxt = packet.protocol;
        ip6->ip6_hlim = packet.ttl;
        inet_pton(AF_INET6, packet.src_ip.c_str(), &ip6->ip6_src);
        inet_pton(AF_INET6, packet.dst_ip.c_str(), &ip6->ip6_dst);
    } else {
        datagram.resize(IPV4_HEADER_LEN, 0);
        struct iphdr* ip = reinterpret_cast<struct iphdr*>(datagram.data());
        ip->version = 4;
        ip->ihl = 5;
        ip->tos = 0;
        ip->tot_len = htons(static_cast<uint16_t>(IPV4_HEADER_LEN + segment.size()));
        ip->id = htons(packet.ip_id);
        ip->frag_off = 0;
        ip->ttl = packet.ttl;
        ip->protocol = packet.protocol;
        ip->check = 0;
        inet_pton(AF_INET, packet.src_ip.c_str(), &ip->saddr);
        inet_pton(AF_INET, packet.dst_ip.c_str(), &ip->daddr);
        ip->check = htons(internetChecksum(datagram.data(), IPV4_HEADER_LEN));
    }
    datagram.insert(datagram.end(), segment.begin(), segment.end());
    return datagram;
}

bool parseSegment(uint8_t protocol, const uint8_t* data, size_t length, Packet& packet) {
    packet.protocol = protocol;
    if (protocol == IPPROTO_TCP) {
        if (length < TCP_HEADER_LEN) return false;
        packet.src_port = readU16(data);
        packet.dst_port = readU16(data + 2);
        packet.seq = readU32(data + 4);
        packet.ack_seq = readU32(data + 8);
        size_t header_len = static_cast<size_t>(data[12] >> 4) * 4;
        if (header_len < TCP_HEADER_LEN || header_len > length) return false;
        packet.tcp_flags = data[13];
        packet.window = readU16(data + 14);
        packet.tcp_options = parseOptions(data + TCP_HEADER_LEN, header_len - TCP_HEADER_LEN);
        packet.payload.assign(data + header_len, data + length);
        return true;
    }
    if (protocol == IPPROTO_UDP) {
        if (length < UDP_HEADER_LEN) return false;
        packet.src_port = readU16(data);
        packet.dst_port = readU16(data + 2);
        packet.payload.assign(data + UDP_HEADER_LEN, data + length);
        return true;
    }
    if (protocol == IPPROTO_ICMP || protocol == IPPROTO_ICMPV6) {
        if (length < 8) return false;
        packet.icmp_type = data[0];
        packet.icmp_code = data[1];
        parseQuoted(protocol == IPPROTO_ICMPV6, data + 8, length - 8, packet);
        return true;
    }
    return false;
}

std::optional<Packet> parsePacket(const uint8_t* data, size_t length) {
    if (length < 1) return std::nullopt;
    Packet packet;
    int version = data[0] >> 4;
    if (version == 4) {
        if (length < IPV4_HEADER_LEN) return std::nullopt;
        const struct iphdr* ip = reinterpret_cast<const struct iphdr*>(data);
        size_t header_len = static_cast<size_t>(ip->ihl) * 4;
        size_t total = ntohs(ip->tot_len);
        if (header_len < IPV4_HEADER_LEN || header_len > length) return std::nullopt;
        if (total == 0 || total > length) total = length;
        packet.ipv6 = false;
        packet.ttl = ip->ttl;
        packet.ip_id = ntohs(ip->id);
        packet.src_ip = addressToString(AF_INET, &ip->saddr);
        packet.dst_ip = addressToString(AF_INET, &ip->daddr);
        packet.protocol = ip->protocol;
        // Non-first fragments carry no transport header.
        if ((ntohs(ip->frag_off) & IP_OFFMASK) != 0) return packet;
        if (!parseSegment(ip->protocol, data + header_len, total - header_len, packet)) {
            return std::nullopt;
        }
        return packet;
    }
    if (version == 6) {
        if (length < IPV6_HEADER_LEN) return std::nullopt;
        const struct ip6_hdr* ip6 = reinterpret_cast<const struct ip6_hdr*>(data);
        packet.ipv6 = true;
        packet.ttl = ip6->ip6_hlim;
        packet.src_ip = addressToString(AF_INET6, &ip6->ip6_src);
        packet.dst_ip = addressToString(AF_INET6, &ip6->ip6_dst);
        size_t end = IPV6_HEADER_LEN + ntohs(ip6->ip6_plen);
        if (end > length) end = length;
        uint8_t next = ip6->ip6_nxt;
        size_t offset = IPV6_HEADER_LEN;
        // Skip the extension headers we may meet in replies.
        while (next == IPPROTO_HOPOPTS || next == IPPROTO_ROUTING ||
               next == IPPROTO_DSTOPTS || next == IPPROTO_FRAGMENT) {
            if (offset + 8 > end) return std::nullopt;
            uint8_t following = data[offset];
            if (next == IPPROTO_FRAGMENT) {
                if ((readU16(data + offset + 2) & 0xfff8) != 0) {
                    packet.protocol = following;
                    return packet;
                }
                offset += 8;
            } else {
                offset += (static_cast<size_t>(data[offset + 1]) + 1) * 8;
            }
            next = following;
        }
        if (offset > end) return std::nullopt;
        if (!parseSegment(next, data + offset, end - offset, packet)) return std::nullopt;
        return packet;
    }
    return std::nullopt;
}

std::string tcpFlagString(uint8_t flags) {
    std::string text;
    if (flags & TH_FIN) text += 'F';
    if (flags & TH_SYN) text += 'S';
    if (flags & TH_RST) text += 'R';
    if (flags & TH_PUSH) text += 'P';
    if (flags & TH_ACK) text += 'A';
    if (flags & TH_URG) text += 'U';
    return text.empty() ? "-" : text;
}
