#ifndef FRAGMENTATION_HPP
#define FRAGMENTATION_HPP

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "packet_builder.hpp"
#include "packet_capture.hpp"
#include "probe_engine.hpp"

// Filler carried by the fragmented SYN.
constexpr size_t FRAG_FILLER_LENGTH = 200;

/**
 * @struct FragmentSettings
 * @brief Size, pacing and capture parameters of the fragmented SYN probe.
 */
struct FragmentSettings {
    int min_size = 24;
    int max_size = 64;
    int first_min_size = 64;
    int min_delay_ms = 10;
    int max_delay_ms = 100;
    int timeout_ms = 10000;
    bool two_frags = false;
    int max_tries = 3;
};

/**
 * @struct Fragment
 * @brief One slice of the transport segment and its place in the original.
 */
struct Fragment {
    size_t offset = 0;               ///< Byte offset, always a multiple of 8.
    std::vector<uint8_t> data;
    bool more_fragments = false;
};

/**
 * @brief Chooses fragment sizes for a segment of @p total bytes.
 *
 * Every fragment but the last is a multiple of 8. The first one is at least
 * first_min_size and at least @p header_length, both rounded up to 8, so the
 * whole TCP header travels in it. Later ones are drawn from
 * [min_size, max_size]. In two-fragment mode the first fragment takes
 * max(first_min_size, min_size) and the second takes the rest.
 */
std::vector<size_t> planFragmentSizes(size_t total, size_t header_length,
                                      const FragmentSettings& settings, std::mt19937& rng);

/** @brief Cuts @p segment into fragments of the given sizes; only the last lacks MF. */
std::vector<Fragment> splitIntoFragments(const std::vector<uint8_t>& segment,
                                         const std::vector<size_t>& sizes);

/**
 * @brief Rebuilds the segment from fragments in any order.
 * @return Empty optional on gaps, overlaps, or a missing final fragment.
 */
std::optional<std::vector<uint8_t>> reassembleFragments(std::vector<Fragment> fragments);

/**
 * @brief Wraps @p fragment into an IPv4 fragment (MF + offset) or an IPv6
 * datagram with a Fragment extension header, addressed like @p probe.
 */
std::vector<uint8_t> buildFragmentDatagram(const Packet& probe, const Fragment& fragment,
                                           uint32_t identification);

/**
 * @brief Decodes a datagram produced by buildFragmentDatagram.
 * @return Empty optional if @p datagram is not an IP fragment.
 */
std::optional<Fragment> parseFragmentDatagram(const std::vector<uint8_t>& datagram,
                                              uint32_t* identification = nullptr);

/**
 * @class FragmentScanner
 * @brief Fragmented-SYN probe with classification from a passive capture.
 */
class FragmentScanner {
public:
    FragmentScanner(ProbeTransport& transport, CaptureFactory& captures,
                    const FragmentSettings& settings);

    /**
     * @brief Probes @p port and returns "open", "closed" or "filtered".
     *
     * The capture listener for each try runs on its own thread and is joined
     * before the try ends. A capture that cannot be opened yields "filtered".
     */
    std::string scan(PacketBuilder& builder, uint16_t port);

private:
    std::optional<std::string> attempt(PacketBuilder& builder, uint16_t port);
    void sendFragments(const Packet& probe, const std::vector<Fragment>& fragments);

    ProbeTransport& transport_;
    CaptureFactory& captures_;
    FragmentSettings settings_;
};

#endif // FRAGMENTATION_HPP
