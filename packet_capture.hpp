#ifndef PACKET_CAPTURE_HPP
#define PACKET_CAPTURE_HPP

#include <memory>
#include <optional>
#include <string>
#include <pcap/pcap.h>

#include "packet_builder.hpp"

/**
 * @class CaptureSource
 * @brief Passive listener yielding decoded packets that passed its filter.
 */
class CaptureSource {
public:
    virtual ~CaptureSource() = default;

    /**
     * @brief Waits for the next captured packet.
     * @param timeout_ms Maximum wait.
     * @return The packet, or empty when the wait elapses or capture fails.
     */
    virtual std::optional<Packet> next(int timeout_ms) = 0;
};

/**
 * @class CaptureFactory
 * @brief Opens one CaptureSource per fragmentation probe.
 */
class CaptureFactory {
public:
    virtual ~CaptureFactory() = default;

    /**
     * @brief Opens a capture with a BPF filter such as "tcp and host 10.0.0.5 and port 80".
     * @return nullptr if the capture cannot be opened.
     */
    virtual std::unique_ptr<CaptureSource> open(const std::string& filter) = 0;
};

/**
 * @class PcapCapture
 * @brief CaptureSource backed by a live libpcap handle.
 */
class PcapCapture : public CaptureSource {
public:
    /**
     * @brief Initializes capture on @p interface with @p filter.
     * @throws std::runtime_error if the device cannot be opened or the filter is rejected.
     */
    PcapCapture(const std::string& interface, const std::string& filter);
    ~PcapCapture() override;

    PcapCapture(const PcapCapture&) = delete;
    PcapCapture& operator=(const PcapCapture&) = delete;

    std::optional<Packet> next(int timeout_ms) override;

private:
    /** @brief Bytes of link-layer header to skip for this datalink, -1 if unsupported. */
    int linkHeaderLength(const u_char* frame, size_t length) const;

    pcap_t* handle;                 ///< libpcap session handle.
    int datalink;                   ///< DLT_* of the opened device.
    char errbuf[PCAP_ERRBUF_SIZE];  ///< libpcap error messages.
};

/**
 * @class PcapCaptureFactory
 * @brief Opens PcapCapture instances on one device ("any" by default).
 */
class PcapCaptureFactory : public CaptureFactory {
public:
    explicit PcapCaptureFactory(std::string interface = "any") : interface_(std::move(interface)) {}

    std::unique_ptr<CaptureSource> open(const std::string& filter) override;

private:
    std::string interface_;
};

#endif // PACKET_CAPTURE_HPP
