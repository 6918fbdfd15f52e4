#include <gtest/gtest.h>

#include <netinet/in.h>
#include <netinet/tcp.h>

#include "os_fingerprint.hpp"

namespace {

Packet synAck(uint8_t ttl, uint16_t window = 29200) {
    Packet reply;
    reply.protocol = IPPROTO_TCP;
    reply.tcp_flags = TH_SYN | TH_ACK;
    reply.ttl = ttl;
    reply.window = window;
    return reply;
}

} // namespace

TEST(OsFingerprintTest, TtlBands) {
    EXPECT_EQ(guessOs(synAck(64)), "Linux/Unix");
    EXPECT_EQ(guessOs(synAck(52)), "Linux/Unix");
    EXPECT_EQ(guessOs(synAck(128)), "Windows");
    EXPECT_EQ(guessOs(synAck(113)), "Windows");
    EXPECT_EQ(guessOs(synAck(255)), "Solaris/Cisco");
}

TEST(OsFingerprintTest, TimestampOptionWins) {
    Packet reply = synAck(128);
    reply.tcp_options.push_back(TcpOption{TCPOPT_KIND_MSS, {0x05, 0xb4}});
    reply.tcp_options.push_back(TcpOption{TCPOPT_KIND_TIMESTAMP, std::vector<uint8_t>(8, 0)});
    OSFingerprint fingerprint = fingerprintReply(reply);
    EXPECT_TRUE(fingerprint.has_timestamp);
    EXPECT_EQ(fingerprint.os_name, "Linux/Unix (Timestamp)");
}

TEST(OsFingerprintTest, Mss1460OverridesTtl) {
    Packet reply = synAck(255, 8192);
    reply.tcp_options.push_back(TcpOption{TCPOPT_KIND_MSS, {0x05, 0xb4}});
    OSFingerprint fingerprint = fingerprintReply(reply);
    EXPECT_EQ(fingerprint.mss, 1460);
    EXPECT_EQ(fingerprint.ttl, 255);
    EXPECT_EQ(fingerprint.window_size, 8192);
    EXPECT_FALSE(fingerprint.has_timestamp);
    EXPECT_EQ(fingerprint.os_name, "Linux/Unix");
}

TEST(OsFingerprintTest, OtherMssKeepsTtlGuess) {
    Packet reply = synAck(128);
    reply.tcp_options.push_back(TcpOption{TCPOPT_KIND_MSS, {0x05, 0x78}});
    EXPECT_EQ(fingerprintReply(reply).mss, 1400);
    EXPECT_EQ(guessOs(reply), "Windows");
}
