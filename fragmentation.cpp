#include "fragmentation.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip6.h>
#include <netinet/tcp.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <thread>

#include "log_system.hpp"
#include "retry_policy.hpp"

namespace {

constexpr size_t IPV4_HEADER_LEN = 20;
constexpr size_t IPV6_HEADER_LEN = 40;
constexpr size_t IPV6_FRAG_HEADER_LEN = 8;

size_t roundUp8(size_t value) {
    return ((value + 7) / 8) * 8;
}

size_t randomMultipleOf8(size_t low, size_t high, std::mt19937& rng) {
    std::uniform_int_distribution<size_t> dist(low / 8, high / 8);
    return dist(rng) * 8;
}

// Stops and joins the capture listener if the try unwinds early.
class ListenerGuard {
public:
    ListenerGuard(std::thread& thread, std::atomic<bool>& stop) : thread_(thread), stop_(stop) {}
    ~ListenerGuard() {
        stop_ = true;
        if (thread_.joinable()) thread_.join();
    }

private:
    std::thread& thread_;
    std::atomic<bool>& stop_;
};

} // namespace

std::vector<size_t> planFragmentSizes(size_t total, size_t header_length,
                                      const FragmentSettings& settings, std::mt19937& rng) {
    std::vector<size_t> sizes;
    if (total == 0) return sizes;

    size_t low = roundUp8(static_cast<size_t>(std::max(settings.min_size, 8)));
    size_t high = std::max(low, (static_cast<size_t>(std::max(settings.max_size, 0)) / 8) * 8);
    size_t first_floor = std::max(roundUp8(std::max<size_t>(header_length, 8)),
                                  roundUp8(static_cast<size_t>(std::max(settings.first_min_size, 0))));

    if (settings.two_frags) {
        size_t first = std::max(low, first_floor);
        if (first >= total) {
            sizes.push_back(total);
            return sizes;
        }
        sizes.push_back(first);
        sizes.push_back(total - first);
        return sizes;
    }

    size_t next = std::max(randomMultipleOf8(low, high, rng), first_floor);
    size_t remaining = total;
    while (remaining > 0) {
        if (remaining <= next) {
            sizes.push_back(remaining);
            break;
        }
        sizes.push_back(next);
        remaining -= next;
        next = randomMultipleOf8(low, high, rng);
    }
    return sizes;
}

std::vector<Fragment> splitIntoFragments(const std::vector<uint8_t>& segment,
                                         const std::vector<size_t>& sizes) {
    std::vector<Fragment> fragments;
    size_t offset = 0;
    for (size_t i = 0; i < sizes.size() && offset < segment.size(); ++i) {
        size_t length = std::min(sizes[i], segment.size() - offset);
        Fragment fragment;
        fragment.offset = offset;
        fragment.data.assign(segment.begin() + offset, segment.begin() + offset + length);
        offset += length;
        fragment.more_fragments = offset < segment.size();
        fragments.push_back(std::move(fragment));
    }
    return fragments;
}

std::optional<std::vector<uint8_t>> reassembleFragments(std::vector<Fragment> fragments) {
    if (fragments.empty()) return std::nullopt;
    std::sort(fragments.begin(), fragments.end(),
              [](const Fragment& a, const Fragment& b) { return a.offset < b.offset; });

    std::vector<uint8_t> segment;
    for (size_t i = 0; i < fragments.size(); ++i) {
        const Fragment& fragment = fragments[i];
        if (fragment.offset != segment.size()) return std::nullopt;
        bool last = (i + 1 == fragments.size());
        if (fragment.more_fragments == last) return std::nullopt;
        segment.insert(segment.end(), fragment.data.begin(), fragment.data.end());
    }
    return segment;
}

std::vector<uint8_t> buildFragmentDatagram(const Packet& probe, const Fragment& fragment,
                                           uint32_t identification) {
    std::vector<uint8_t> datagram;
    if (probe.ipv6) {
        datagram.resize(IPV6_HEADER_LEN + IPV6_FRAG_HEADER_LEN, 0);
        struct ip6_hdr* ip6 = reinterpret_cast<struct ip6_hdr*>(datagram.data());
        ip6->ip6_flow = htonl(6u << 28);
        ip6->ip6_plen = htons(static_cast<uint16_t>(IPV6_FRAG_HEADER_LEN + fragment.data.size()));
        ip6->ip6_nxt = IPPROTO_FRAGMENT;
        ip6->ip6_hlim = probe.ttl;
        inet_pton(AF_INET6, probe.src_ip.c_str(), &ip6->ip6_src);
        inet_pton(AF_INET6, probe.dst_ip.c_str(), &ip6->ip6_dst);

        uint8_t* frag = datagram.data() + IPV6_HEADER_LEN;
        frag[0] = probe.protocol;
        frag[1] = 0;
        frag[2] = static_cast<uint8_t>((fragment.offset >> 8) & 0xff);
        frag[3] = static_cast<uint8_t>((fragment.offset & 0xf8) | (fragment.more_fragments ? 1 : 0));
        uint32_t ident = htonl(identification);
        std::memcpy(frag + 4, &ident, 4);
    } else {
        datagram.resize(IPV4_HEADER_LEN, 0);
        struct iphdr* ip = reinterpret_cast<struct iphdr*>(datagram.data());
        ip->version = 4;
        ip->ihl = 5;
        ip->tos = 0;
        ip->tot_len = htons(static_cast<uint16_t>(IPV4_HEADER_LEN + fragment.data.size()));
        ip->id = htons(static_cast<uint16_t>(identification));
        ip->frag_off = htons(static_cast<uint16_t>((fragment.more_fragments ? IP_MF : 0) |
                                                   (fragment.offset / 8)));
        ip->ttl = probe.ttl;
        ip->protocol = probe.protocol;
        ip->check = 0;
        inet_pton(AF_INET, probe.src_ip.c_str(), &ip->saddr);
        inet_pton(AF_INET, probe.dst_ip.c_str(), &ip->daddr);
        ip->check = htons(internetChecksum(datagram.data(), IPV4_HEADER_LEN));
    }
    datagram.insert(datagram.end(), fragment.data.begin(), fragment.data.end());
    return datagram;
}

std::optional<Fragment> parseFragmentDatagram(const std::vector<uint8_t>& datagram,
                                              uint32_t* identification) {
    if (datagram.empty()) return std::nullopt;
    Fragment fragment;
    int version = datagram[0] >> 4;
    if (version == 4) {
        if (datagram.size() < IPV4_HEADER_LEN) return std::nullopt;
        const struct iphdr* ip = reinterpret_cast<const struct iphdr*>(datagram.data());
        size_t header_len = static_cast<size_t>(ip->ihl) * 4;
        size_t total = std::min<size_t>(ntohs(ip->tot_len), datagram.size());
        if (header_len > total) return std::nullopt;
        uint16_t frag_off = ntohs(ip->frag_off);
        fragment.offset = static_cast<size_t>(frag_off & IP_OFFMASK) * 8;
        fragment.more_fragments = (frag_off & IP_MF) != 0;
        fragment.data.assign(datagram.begin() + header_len, datagram.begin() + total);
        if (identification) *identification = ntohs(ip->id);
        return fragment;
    }
    if (version == 6) {
        if (datagram.size() < IPV6_HEADER_LEN + IPV6_FRAG_HEADER_LEN) return std::nullopt;
        const struct ip6_hdr* ip6 = reinterpret_cast<const struct ip6_hdr*>(datagram.data());
        if (ip6->ip6_nxt != IPPROTO_FRAGMENT) return std::nullopt;
        const uint8_t* frag = datagram.data() + IPV6_HEADER_LEN;
        fragment.offset = static_cast<size_t>(((frag[2] << 8) | frag[3]) & 0xfff8);
        fragment.more_fragments = (frag[3] & 1) != 0;
        fragment.data.assign(datagram.begin() + IPV6_HEADER_LEN + IPV6_FRAG_HEADER_LEN, datagram.end());
        if (identification) {
            uint32_t ident = 0;
            std::memcpy(&ident, frag + 4, 4);
            *identification = ntohl(ident);
        }
        return fragment;
    }
    return std::nullopt;
}

FragmentScanner::FragmentScanner(ProbeTransport& transport, CaptureFactory& captures,
                                 const FragmentSettings& settings)
    : transport_(transport), captures_(captures), settings_(settings) {}

std::string FragmentScanner::scan(PacketBuilder& builder, uint16_t port) {
    RetryPolicy policy;
    policy.max_tries = settings_.max_tries;
    std::optional<std::string> verdict = retryWithBackoff(policy, [&](int attempt_index) {
        logsys.Debug("Fragmented SYN to port ", port, " (try ", attempt_index + 1, ")");
        return attempt(builder, port);
    });
    return verdict ? *verdict : std::string(STATE_FILTERED);
}

std::optional<std::string> FragmentScanner::attempt(PacketBuilder& builder, uint16_t port) {
    Packet probe = builder.tcp(port, TH_SYN, std::vector<uint8_t>(FRAG_FILLER_LENGTH, 'A'));
    std::vector<uint8_t> segment = serializeTransport(probe);
    size_t header_length = static_cast<size_t>(segment[12] >> 4) * 4;
    std::vector<size_t> sizes = planFragmentSizes(segment.size(), header_length, settings_, packetRng());
    std::vector<Fragment> fragments = splitIntoFragments(segment, sizes);

    std::string filter = "tcp and host " + probe.dst_ip + " and port " + std::to_string(port);
    std::unique_ptr<CaptureSource> capture = captures_.open(filter);
    if (!capture) {
        return std::string(STATE_FILTERED);
    }

    std::optional<std::string> verdict;
    std::atomic<bool> stop{false};
    const int timeout_ms = settings_.timeout_ms;
    std::thread listener([&]() {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (!stop) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) break;
            std::optional<Packet> packet = capture->next(static_cast<int>(std::min<long long>(remaining, 100)));
            if (!packet || !packet->isTcp()) continue;
            if (packet->src_ip != probe.dst_ip || packet->src_port != port ||
                packet->dst_port != probe.src_port) {
                continue;
            }
            if (packet->hasFlags(TH_SYN | TH_ACK)) {
                verdict = STATE_OPEN;
                break;
            }
            if (packet->tcp_flags & TH_RST) {
                verdict = STATE_CLOSED;
                break;
            }
        }
    });
    ListenerGuard guard(listener, stop);

    sendFragments(probe, fragments);
    listener.join();

    if (verdict) {
        logsys.Debug("Fragmented SYN verdict for port ", port, ": ", *verdict);
    }
    return verdict;
}

void FragmentScanner::sendFragments(const Packet& probe, const std::vector<Fragment>& fragments) {
    uint32_t identification;
    if (probe.ipv6) {
        identification = std::uniform_int_distribution<uint32_t>(1, 0xffffffffu)(packetRng());
    } else {
        identification = std::uniform_int_distribution<uint32_t>(1, 65535)(packetRng());
    }
    std::uniform_int_distribution<int> delay(settings_.min_delay_ms,
                                             std::max(settings_.min_delay_ms, settings_.max_delay_ms));

    for (size_t i = 0; i < fragments.size(); ++i) {
        if (!transport_.sendDatagram(buildFragmentDatagram(probe, fragments[i], identification),
                                     probe.ipv6, probe.dst_ip)) {
            logsys.Debug("Failed to send fragment ", i + 1, "/", fragments.size(), " to ", probe.dst_ip);
        }
        if (i + 1 < fragments.size()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay(packetRng())));
        }
    }
}
