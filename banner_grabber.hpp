#ifndef BANNER_GRABBER_HPP
#define BANNER_GRABBER_HPP

#include <cstddef>
#include <optional>
#include <string>

#include "scan_types.hpp"

constexpr size_t BANNER_READ_LIMIT = 1024;
constexpr size_t BANNER_KEEP_LIMIT = 256;

/**
 * @class StreamConnector
 * @brief One request/response exchange over a plain TCP connection.
 */
class StreamConnector {
public:
    virtual ~StreamConnector() = default;

    /**
     * @brief Connects, sends @p request and reads up to @p max_bytes.
     * @return Bytes read (possibly empty), or empty optional if the
     * connection could not be established.
     */
    virtual std::optional<std::string> exchange(const TargetDescriptor& target, int port,
                                                const std::string& request, size_t max_bytes,
                                                int timeout_ms) = 0;
};

/**
 * @class TcpStreamConnector
 * @brief StreamConnector over BSD sockets.
 */
class TcpStreamConnector : public StreamConnector {
public:
    std::optional<std::string> exchange(const TargetDescriptor& target, int port,
                                        const std::string& request, size_t max_bytes,
                                        int timeout_ms) override;
};

/**
 * @class BannerGrabber
 * @brief Sends a service-specific probe to an open port and keeps the answer.
 */
class BannerGrabber {
public:
    BannerGrabber(StreamConnector& connector, int timeout_ms);

    /**
     * @brief Grabs the banner of @p port.
     * @param service Current service guess; selects the probe.
     * @return At most BANNER_KEEP_LIMIT characters, or empty optional on failure.
     */
    std::optional<std::string> grab(const TargetDescriptor& target, int port, const std::string& service);

    /**
     * @brief Probe sent for a service guess: GET for HTTP, USER for FTP, an
     * identification string for SSH, HEAD otherwise.
     */
    static std::string probeFor(const std::string& service, const std::string& host);

private:
    StreamConnector& connector_;
    int timeout_ms_;
};

/** @brief Well-known service for @p port, "unknown" if none. */
std::string serviceForPort(int port);

/**
 * @brief Refines @p service with what @p banner shows.
 *
 * "ssh" in the banner gives SSH and "http" gives HTTP, except over "SSL/TLS".
 * A banner containing both "220" and "ftp" always gives FTP.
 */
std::string refineService(const std::string& service, const std::string& banner);

/**
 * @brief Product/version token from a banner, e.g. "Apache/2.4.49",
 * "OpenSSH_8.2p1" or "vsFTPd 2.3.4". Empty if nothing is recognised.
 */
std::string extractVersion(const std::string& banner);

#endif // BANNER_GRABBER_HPP
