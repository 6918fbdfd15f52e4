#ifndef SCAN_ORCHESTRATOR_HPP
#define SCAN_ORCHESTRATOR_HPP

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include "banner_grabber.hpp"
#include "packet_capture.hpp"
#include "probe_engine.hpp"
#include "rate_limiter.hpp"
#include "result_store.hpp"
#include "scan_config.hpp"
#include "scan_techniques.hpp"
#include "tls_inspector.hpp"
#include "worker_pool.hpp"

/** @brief The target hostname could not be resolved. */
class ResolutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief Raw-socket techniques were requested without the privileges they need. */
class PrivilegeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Resolves @p host to an address of the requested family and looks up
 * the local source address for it.
 * @throws ResolutionError if no address is found.
 */
TargetDescriptor resolveTarget(const std::string& host, bool ipv6);

/**
 * @struct ProbeServices
 * @brief Network collaborators of a scan. Tests swap in fakes.
 */
struct ProbeServices {
    std::shared_ptr<ProbeTransport> transport;
    std::shared_ptr<CaptureFactory> captures;
    std::shared_ptr<StreamConnector> connector;
    std::shared_ptr<TlsProber> tls;
    std::function<bool()> has_privileges;
    std::function<TargetDescriptor(const std::string&, bool)> resolver;

    /** @brief Raw sockets, libpcap on config.interface, BSD sockets and OpenSSL. */
    static ProbeServices system(const ScanConfig& config);
};

/**
 * @class ScanOrchestrator
 * @brief Drives a whole scan: every port through every requested technique.
 *
 * Port tasks run on a pool of config.concurrency threads. Within a task the
 * techniques run in the configured order with the rate limiter between
 * them; each blocking probe is handed to a separate I/O pool. Ports found
 * open are then enriched (service, banner, version, vulnerabilities).
 */
class ScanOrchestrator {
public:
    ScanOrchestrator(ScanConfig config, ProbeServices services);

    /**
     * @brief Runs the scan to completion.
     * @return One record per requested port.
     * @throws ResolutionError, PrivilegeError before any probe is sent.
     * ResolutionError also covers a raw-socket scan with no local source
     * address for the target.
     */
    std::map<int, PortResult> runScan();

    /** @brief Target of the last runScan(). */
    const TargetDescriptor& target() const { return target_; }

private:
    void scanPort(int port, TechniqueRunner& runner, BannerGrabber& grabber,
                  RateLimiter& limiter, ResultStore& store, WorkerPool& io);
    void enrichPort(int port, BannerGrabber& grabber, ResultStore& store, WorkerPool& io);
    void checkPrivileges() const;

    ScanConfig config_;
    ProbeServices services_;
    TargetDescriptor target_;
};

/** @brief Records @p outcome of @p technique in @p result. */
void applyOutcome(PortResult& result, ScanTechnique technique, const TechniqueOutcome& outcome);

#endif // SCAN_ORCHESTRATOR_HPP
