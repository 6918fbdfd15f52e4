#include <gtest/gtest.h>

#include <netinet/tcp.h>

#include <numeric>

#include "fake_network.hpp"
#include "fragmentation.hpp"
#include "log_system.hpp"

namespace {

std::vector<uint8_t> patternedSegment(size_t length) {
    std::vector<uint8_t> segment(length);
    std::iota(segment.begin(), segment.end(), static_cast<uint8_t>(1));
    return segment;
}

Packet synProbe(bool ipv6 = false) {
    TargetDescriptor target;
    target.ipv6 = ipv6;
    target.ip = ipv6 ? "2001:db8::5" : "10.0.0.5";
    target.source_ip = ipv6 ? "2001:db8::1" : "10.0.0.1";
    PacketBuilder builder(target, false);
    return builder.tcp(80, TH_SYN, std::vector<uint8_t>(FRAG_FILLER_LENGTH, 'A'));
}

} // namespace

TEST(FragmentPlanTest, SizesCoverPayloadWithinBounds) {
    std::mt19937 rng(1234);
    const size_t header_length = 20;
    for (int min_size : {24, 32, 40}) {
        for (int max_size : {min_size, 64, 96}) {
            FragmentSettings settings;
            settings.min_size = min_size;
            settings.max_size = max_size;
            for (size_t total : {40u, 220u, 241u, 1000u}) {
                std::vector<size_t> sizes = planFragmentSizes(total, header_length, settings, rng);
                ASSERT_FALSE(sizes.empty());
                EXPECT_EQ(std::accumulate(sizes.begin(), sizes.end(), size_t(0)), total);
                EXPECT_GE(sizes.front(), std::min<size_t>(total, 64));
                for (size_t i = 1; i + 1 < sizes.size(); ++i) {
                    EXPECT_EQ(sizes[i] % 8, 0u);
                    EXPECT_GE(sizes[i], static_cast<size_t>(min_size));
                    EXPECT_LE(sizes[i], static_cast<size_t>(std::max(max_size, min_size)));
                }
            }
        }
    }
}

TEST(FragmentPlanTest, TwoFragmentMode) {
    std::mt19937 rng(7);
    FragmentSettings settings;
    settings.two_frags = true;
    settings.min_size = 24;
    settings.first_min_size = 64;

    std::vector<size_t> sizes = planFragmentSizes(220, 20, settings, rng);
    ASSERT_EQ(sizes.size(), 2u);
    EXPECT_EQ(sizes[0], 64u);
    EXPECT_EQ(sizes[1], 156u);

    // Too short to split.
    EXPECT_EQ(planFragmentSizes(40, 20, settings, rng), std::vector<size_t>({40}));
}

TEST(FragmentPlanTest, FirstFragmentMinimumAppliesToEveryMode) {
    std::mt19937 rng(21);
    FragmentSettings settings;
    settings.min_size = 8;
    settings.max_size = 16;
    settings.first_min_size = 60;

    std::vector<size_t> sizes = planFragmentSizes(220, 20, settings, rng);
    ASSERT_GT(sizes.size(), 2u);
    EXPECT_EQ(sizes[0], 64u);
    for (size_t i = 1; i + 1 < sizes.size(); ++i) {
        EXPECT_LE(sizes[i], 16u);
    }

    // With no explicit minimum the TCP header still decides.
    settings.first_min_size = 0;
    sizes = planFragmentSizes(220, 20, settings, rng);
    EXPECT_EQ(sizes[0], 24u);
}

TEST(FragmentPlanTest, SplitThenReassembleRestoresSegment) {
    std::mt19937 rng(99);
    FragmentSettings settings;
    settings.min_size = 24;
    settings.max_size = 64;
    for (size_t length : {21u, 64u, 220u, 517u}) {
        std::vector<uint8_t> segment = patternedSegment(length);
        std::vector<Fragment> fragments =
            splitIntoFragments(segment, planFragmentSizes(length, 20, settings, rng));
        ASSERT_FALSE(fragments.empty());

        for (size_t i = 0; i < fragments.size(); ++i) {
            EXPECT_EQ(fragments[i].offset % 8, 0u);
            EXPECT_EQ(fragments[i].more_fragments, i + 1 < fragments.size());
        }

        std::optional<std::vector<uint8_t>> rebuilt = reassembleFragments(fragments);
        ASSERT_TRUE(rebuilt.has_value());
        EXPECT_EQ(*rebuilt, segment);
    }
}

TEST(FragmentPlanTest, ReassemblyAcceptsAnyArrivalOrder) {
    std::vector<uint8_t> segment = patternedSegment(96);
    std::vector<Fragment> fragments = splitIntoFragments(segment, {32, 32, 32});
    std::swap(fragments[0], fragments[2]);
    std::optional<std::vector<uint8_t>> rebuilt = reassembleFragments(fragments);
    ASSERT_TRUE(rebuilt.has_value());
    EXPECT_EQ(*rebuilt, segment);
}

TEST(FragmentPlanTest, ReassemblyRejectsIncompleteSets) {
    std::vector<Fragment> fragments = splitIntoFragments(patternedSegment(96), {32, 32, 32});

    std::vector<Fragment> gap = {fragments[0], fragments[2]};
    EXPECT_FALSE(reassembleFragments(gap).has_value());

    std::vector<Fragment> no_tail = {fragments[0], fragments[1]};
    EXPECT_FALSE(reassembleFragments(no_tail).has_value());

    EXPECT_FALSE(reassembleFragments({}).has_value());
}

TEST(FragmentDatagramTest, Ipv4HeaderCarriesOffsetAndFlag) {
    Packet probe = synProbe();
    Fragment fragment;
    fragment.offset = 48;
    fragment.data.assign(24, 0x41);
    fragment.more_fragments = true;

    std::vector<uint8_t> datagram = buildFragmentDatagram(probe, fragment, 0x1234);
    ASSERT_EQ(datagram.size(), 20u + 24u);
    EXPECT_EQ(datagram[0], 0x45);
    EXPECT_EQ(datagram[9], IPPROTO_TCP);
    EXPECT_EQ(internetChecksum(datagram.data(), 20), 0);

    uint32_t id = 0;
    std::optional<Fragment> parsed = parseFragmentDatagram(datagram, &id);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(id, 0x1234u);
    EXPECT_EQ(parsed->offset, 48u);
    EXPECT_TRUE(parsed->more_fragments);
    EXPECT_EQ(parsed->data, fragment.data);
}

TEST(FragmentDatagramTest, Ipv6UsesFragmentExtensionHeader) {
    Packet probe = synProbe(true);
    Fragment fragment;
    fragment.offset = 64;
    fragment.data.assign(16, 0x42);

    std::vector<uint8_t> datagram = buildFragmentDatagram(probe, fragment, 0xdeadbeef);
    ASSERT_EQ(datagram.size(), 40u + 8u + 16u);
    EXPECT_EQ(datagram[0] >> 4, 6);
    EXPECT_EQ(datagram[6], 44);
    EXPECT_EQ(datagram[40], IPPROTO_TCP);

    uint32_t id = 0;
    std::optional<Fragment> parsed = parseFragmentDatagram(datagram, &id);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(id, 0xdeadbeefu);
    EXPECT_EQ(parsed->offset, 64u);
    EXPECT_FALSE(parsed->more_fragments);
}

class FragmentScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logsys.setLevel(LogLevel::Off);
        target.ip = "10.0.0.5";
        target.source_ip = "10.0.0.1";
        settings.min_delay_ms = 1;
        settings.max_delay_ms = 2;
        settings.timeout_ms = 100;
        settings.max_tries = 2;
    }

    void TearDown() override { logsys.setLevel(LogLevel::Info); }

    TargetDescriptor target;
    FragmentSettings settings;
};

TEST_F(FragmentScannerTest, SynAckIsOpen) {
    auto queue = std::make_shared<PacketQueue>();
    ScriptedTransport transport([](const Packet& probe) { return tcpReply(probe, TH_SYN | TH_ACK); }, queue);
    ScriptedCaptureFactory captures(queue);
    FragmentScanner scanner(transport, captures, settings);
    PacketBuilder builder(target, false);

    EXPECT_EQ(scanner.scan(builder, 80), STATE_OPEN);
    ASSERT_EQ(captures.filters().size(), 1u);
    EXPECT_EQ(captures.filters()[0], "tcp and host 10.0.0.5 and port 80");
}

TEST_F(FragmentScannerTest, RstIsClosed) {
    auto queue = std::make_shared<PacketQueue>();
    ScriptedTransport transport([](const Packet& probe) { return tcpReply(probe, TH_RST | TH_ACK); }, queue);
    ScriptedCaptureFactory captures(queue);
    FragmentScanner scanner(transport, captures, settings);
    PacketBuilder builder(target, false);

    EXPECT_EQ(scanner.scan(builder, 22), STATE_CLOSED);
}

TEST_F(FragmentScannerTest, TwoFragmentModeSendsTwoDatagrams) {
    settings.two_frags = true;
    auto queue = std::make_shared<PacketQueue>();
    ScriptedTransport transport([](const Packet& probe) { return tcpReply(probe, TH_SYN | TH_ACK); }, queue);
    ScriptedCaptureFactory captures(queue);
    FragmentScanner scanner(transport, captures, settings);
    PacketBuilder builder(target, false);

    EXPECT_EQ(scanner.scan(builder, 443), STATE_OPEN);
    EXPECT_EQ(transport.datagramCount(), 2u);
}

TEST_F(FragmentScannerTest, SilenceIsRetriedThenFiltered) {
    auto queue = std::make_shared<PacketQueue>();
    ScriptedTransport transport([](const Packet&) { return std::optional<Packet>(); }, queue);
    ScriptedCaptureFactory captures(queue);
    FragmentScanner scanner(transport, captures, settings);
    PacketBuilder builder(target, false);

    EXPECT_EQ(scanner.scan(builder, 81), STATE_FILTERED);
    EXPECT_EQ(captures.filters().size(), 2u);
    EXPECT_EQ(transport.reassembled().size(), 2u);
}

TEST_F(FragmentScannerTest, UnrelatedTrafficIsIgnored) {
    auto queue = std::make_shared<PacketQueue>();
    ScriptedTransport transport([](const Packet& probe) {
        Packet reply = tcpReply(probe, TH_SYN | TH_ACK);
        reply.src_ip = "10.0.0.77";
        return reply;
    }, queue);
    ScriptedCaptureFactory captures(queue);
    settings.max_tries = 1;
    FragmentScanner scanner(transport, captures, settings);
    PacketBuilder builder(target, false);

    EXPECT_EQ(scanner.scan(builder, 80), STATE_FILTERED);
}

TEST_F(FragmentScannerTest, CaptureFailureFallsBackToFiltered) {
    auto queue = std::make_shared<PacketQueue>();
    ScriptedTransport transport([](const Packet& probe) { return tcpReply(probe, TH_SYN | TH_ACK); }, queue);
    ScriptedCaptureFactory captures(queue, true);
    FragmentScanner scanner(transport, captures, settings);
    PacketBuilder builder(target, false);

    EXPECT_EQ(scanner.scan(builder, 80), STATE_FILTERED);
    EXPECT_EQ(transport.datagramCount(), 0u);
    EXPECT_EQ(captures.filters().size(), 1u);
}
