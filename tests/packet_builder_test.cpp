#include <gtest/gtest.h>

#include <netinet/in.h>
#include <netinet/tcp.h>

#include "fragmentation.hpp"
#include "packet_builder.hpp"
#include "probe_engine.hpp"

namespace {

TargetDescriptor ipv4Target() {
    TargetDescriptor target;
    target.ip = "10.0.0.5";
    target.source_ip = "10.0.0.1";
    return target;
}

TargetDescriptor ipv6Target() {
    TargetDescriptor target;
    target.ip = "2001:db8::5";
    target.ipv6 = true;
    target.source_ip = "2001:db8::1";
    return target;
}

} // namespace

TEST(PacketBuilderTest, TcpProbeCarriesTargetAndFlags) {
    PacketBuilder builder(ipv4Target(), false);
    Packet probe = builder.tcp(443, TH_SYN);

    EXPECT_TRUE(probe.isTcp());
    EXPECT_EQ(probe.src_ip, "10.0.0.1");
    EXPECT_EQ(probe.dst_ip, "10.0.0.5");
    EXPECT_EQ(probe.dst_port, 443);
    EXPECT_GE(probe.src_port, 1024);
    EXPECT_EQ(probe.tcp_flags, TH_SYN);
    EXPECT_EQ(probe.window, 5840);
    EXPECT_EQ(probe.ttl, 64);
    EXPECT_EQ(probe.ip_id, 0);
}

TEST(PacketBuilderTest, EvasionsRandomiseTtlAndIpId) {
    PacketBuilder builder(ipv4Target(), true);
    bool saw_nonzero_id = false;
    for (int i = 0; i < 50; ++i) {
        Packet probe = builder.tcp(80, TH_SYN);
        EXPECT_TRUE(probe.ttl == 64 || probe.ttl == 128 || probe.ttl == 255) << int(probe.ttl);
        if (probe.ip_id != 0) saw_nonzero_id = true;
    }
    EXPECT_TRUE(saw_nonzero_id);
}

TEST(PacketBuilderTest, RstTeardownMirrorsProbe) {
    PacketBuilder builder(ipv4Target(), false);
    Packet probe = builder.tcp(22, TH_SYN);
    Packet rst = builder.rstFor(probe);

    EXPECT_EQ(rst.tcp_flags, TH_RST);
    EXPECT_EQ(rst.src_port, probe.src_port);
    EXPECT_EQ(rst.dst_port, 22);
    EXPECT_EQ(rst.dst_ip, probe.dst_ip);
    EXPECT_EQ(rst.seq, probe.seq + 1);
}

TEST(PacketBuilderTest, ChecksumMatchesRfc1071Example) {
    const uint8_t data[] = {0x00, 0x01, 0xf2, 0x03, 0xf4, 0xf5, 0xf6, 0xf7};
    EXPECT_EQ(internetChecksum(data, sizeof(data)), 0x220d);
}

TEST(PacketBuilderTest, Ipv4HeaderChecksumVerifies) {
    PacketBuilder builder(ipv4Target(), true);
    std::vector<uint8_t> datagram = serializePacket(builder.tcp(80, TH_SYN));
    ASSERT_GE(datagram.size(), 40u);
    EXPECT_EQ(internetChecksum(datagram.data(), 20), 0);
}

TEST(PacketBuilderTest, TcpSegmentSurvivesSerialisation) {
    PacketBuilder builder(ipv4Target(), false);
    Packet probe = builder.tcp(8080, TH_SYN | TH_ACK, {'h', 'i'});
    probe.tcp_options.push_back(TcpOption{TCPOPT_KIND_MSS, {0x05, 0xb4}});

    std::vector<uint8_t> datagram = serializePacket(probe);
    std::optional<Packet> parsed = parsePacket(datagram.data(), datagram.size());
    ASSERT_TRUE(parsed.has_value());

    EXPECT_FALSE(parsed->ipv6);
    EXPECT_EQ(parsed->src_ip, "10.0.0.1");
    EXPECT_EQ(parsed->dst_ip, "10.0.0.5");
    EXPECT_EQ(parsed->ttl, 64);
    EXPECT_EQ(parsed->src_port, probe.src_port);
    EXPECT_EQ(parsed->dst_port, 8080);
    EXPECT_EQ(parsed->seq, probe.seq);
    EXPECT_EQ(parsed->tcp_flags, TH_SYN | TH_ACK);
    EXPECT_EQ(parsed->window, 5840);
    EXPECT_EQ(parsed->payload, std::vector<uint8_t>({'h', 'i'}));

    const TcpOption* mss = parsed->findOption(TCPOPT_KIND_MSS);
    ASSERT_NE(mss, nullptr);
    EXPECT_EQ(mss->data, std::vector<uint8_t>({0x05, 0xb4}));
    EXPECT_EQ(parsed->findOption(TCPOPT_KIND_TIMESTAMP), nullptr);
}

TEST(PacketBuilderTest, UdpOverIpv6SurvivesSerialisation) {
    PacketBuilder builder(ipv6Target(), false);
    Packet probe = builder.udp(53, {'p', 'r', 'o', 'b', 'e'});

    std::vector<uint8_t> datagram = serializePacket(probe);
    ASSERT_EQ(datagram.size(), 40u + 8u + 5u);
    EXPECT_EQ(datagram[0] >> 4, 6);

    std::optional<Packet> parsed = parsePacket(datagram.data(), datagram.size());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->ipv6);
    EXPECT_TRUE(parsed->isUdp());
    EXPECT_EQ(parsed->src_ip, "2001:db8::1");
    EXPECT_EQ(parsed->dst_ip, "2001:db8::5");
    EXPECT_EQ(parsed->dst_port, 53);
    EXPECT_EQ(parsed->payload.size(), 5u);
}

TEST(PacketBuilderTest, IcmpErrorExposesQuotedPorts) {
    PacketBuilder builder(ipv4Target(), false);
    Packet inner = builder.udp(161, {'x'});
    std::vector<uint8_t> quoted = serializePacket(inner);

    Packet error;
    error.src_ip = "10.0.0.5";
    error.dst_ip = "10.0.0.1";
    error.protocol = IPPROTO_ICMP;
    error.payload = {3, 3, 0, 0, 0, 0, 0, 0};
    error.payload.insert(error.payload.end(), quoted.begin(), quoted.end());

    std::vector<uint8_t> datagram = serializePacket(error);
    std::optional<Packet> parsed = parsePacket(datagram.data(), datagram.size());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->isIcmp());
    EXPECT_EQ(parsed->icmp_type, 3);
    EXPECT_EQ(parsed->icmp_code, 3);
    EXPECT_EQ(parsed->quoted_dst_ip, "10.0.0.5");
    EXPECT_EQ(parsed->quoted_protocol, IPPROTO_UDP);
    EXPECT_EQ(parsed->quoted_src_port, inner.src_port);
    EXPECT_EQ(parsed->quoted_dst_port, 161);
}

TEST(PacketBuilderTest, LaterFragmentHasNoTransportHeader) {
    PacketBuilder builder(ipv4Target(), false);
    Packet probe = builder.tcp(80, TH_SYN);
    Fragment fragment;
    fragment.offset = 24;
    fragment.data.assign(16, 'A');

    std::vector<uint8_t> datagram = buildFragmentDatagram(probe, fragment, 7);
    std::optional<Packet> parsed = parsePacket(datagram.data(), datagram.size());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->isTcp());
    EXPECT_EQ(parsed->src_port, 0);
    EXPECT_EQ(parsed->dst_port, 0);
}

TEST(PacketBuilderTest, TruncatedInputIsRejected) {
    const uint8_t short_v4[] = {0x45, 0x00, 0x00};
    EXPECT_FALSE(parsePacket(short_v4, sizeof(short_v4)).has_value());
    const uint8_t bogus[] = {0x20, 0x00, 0x00, 0x00};
    EXPECT_FALSE(parsePacket(bogus, sizeof(bogus)).has_value());
}

TEST(PacketBuilderTest, FlagString) {
    EXPECT_EQ(tcpFlagString(TH_SYN | TH_ACK), "SA");
    EXPECT_EQ(tcpFlagString(TH_RST), "R");
    EXPECT_EQ(tcpFlagString(TH_FIN | TH_PUSH | TH_URG), "FPU");
    EXPECT_EQ(tcpFlagString(0), "-");
}

TEST(ProbeEngineTest, ReplyMatchesProbeFlow) {
    PacketBuilder builder(ipv4Target(), false);
    Packet probe = builder.tcp(80, TH_SYN);

    Packet reply;
    reply.src_ip = "10.0.0.5";
    reply.protocol = IPPROTO_TCP;
    reply.src_port = 80;
    reply.dst_port = probe.src_port;
    EXPECT_TRUE(matchesFlow(probe, reply));

    Packet stranger = reply;
    stranger.src_ip = "10.0.0.9";
    EXPECT_FALSE(matchesFlow(probe, stranger));

    Packet other_port = reply;
    other_port.src_port = 81;
    EXPECT_FALSE(matchesFlow(probe, other_port));
}

TEST(ProbeEngineTest, IcmpErrorMatchesOnQuotedPorts) {
    PacketBuilder builder(ipv4Target(), false);
    Packet probe = builder.udp(53, {});

    Packet error;
    error.src_ip = "10.0.0.5";
    error.protocol = IPPROTO_ICMP;
    error.icmp_type = 3;
    error.icmp_code = 3;
    error.quoted_dst_ip = "10.0.0.5";
    error.quoted_protocol = IPPROTO_UDP;
    error.quoted_src_port = probe.src_port;
    error.quoted_dst_port = 53;
    EXPECT_TRUE(matchesFlow(probe, error));

    Packet wrong_port = error;
    wrong_port.quoted_dst_port = 54;
    EXPECT_FALSE(matchesFlow(probe, wrong_port));

    Packet other_host = error;
    other_host.quoted_dst_ip = "10.0.0.6";
    EXPECT_FALSE(matchesFlow(probe, other_host));
}

TEST(ProbeEngineTest, IcmpErrorFromRouterOnPathMatches) {
    PacketBuilder builder(ipv4Target(), false);
    Packet probe = builder.udp(53, {});

    Packet error;
    error.src_ip = "192.168.1.1";
    error.protocol = IPPROTO_ICMP;
    error.icmp_type = 3;
    error.icmp_code = 13;
    error.quoted_dst_ip = "10.0.0.5";
    error.quoted_protocol = IPPROTO_UDP;
    error.quoted_src_port = probe.src_port;
    error.quoted_dst_port = 53;
    EXPECT_TRUE(matchesFlow(probe, error));

    // Non-ICMP traffic still has to come from the target itself.
    Packet datagram;
    datagram.src_ip = "192.168.1.1";
    datagram.protocol = IPPROTO_UDP;
    datagram.src_port = 53;
    datagram.dst_port = probe.src_port;
    EXPECT_FALSE(matchesFlow(probe, datagram));
}
