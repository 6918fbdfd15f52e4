#include "scan_orchestrator.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

#include <algorithm>
#include <cstring>
#include <future>
#include <random>
#include <vector>

#include "log_system.hpp"
#include "vuln_correlator.hpp"

TargetDescriptor resolveTarget(const std::string& host, bool ipv6) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = ipv6 ? AF_INET6 : AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int status = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (status != 0 || res == nullptr) {
        throw ResolutionError("Could not resolve target " + host + ": " + gai_strerror(status));
    }

    char address[INET6_ADDRSTRLEN] = {0};
    if (ipv6) {
        auto* addr = reinterpret_cast<struct sockaddr_in6*>(res->ai_addr);
        inet_ntop(AF_INET6, &addr->sin6_addr, address, sizeof(address));
    } else {
        auto* addr = reinterpret_cast<struct sockaddr_in*>(res->ai_addr);
        inet_ntop(AF_INET, &addr->sin_addr, address, sizeof(address));
    }
    freeaddrinfo(res);

    TargetDescriptor target;
    target.ip = address;
    target.ipv6 = ipv6;
    target.source_ip = localAddressFor(target.ip, ipv6);
    return target;
}

ProbeServices ProbeServices::system(const ScanConfig& config) {
    ProbeServices services;
    services.transport = std::make_shared<RawSocketTransport>();
    services.captures = std::make_shared<PcapCaptureFactory>(config.interface);
    services.connector = std::make_shared<TcpStreamConnector>();
    services.tls = std::make_shared<OpenSslProber>();
    services.has_privileges = hasRawSocketPrivileges;
    services.resolver = resolveTarget;
    return services;
}

void applyOutcome(PortResult& result, ScanTechnique technique, const TechniqueOutcome& outcome) {
    switch (technique) {
        case ScanTechnique::ACK:
            result.filtering = outcome.state;
            break;
        case ScanTechnique::UDP:
            result.udp_state = outcome.state;
            break;
        case ScanTechnique::SSL:
            result.tcp_states[technique] = outcome.state;
            if (outcome.state == STATE_OPEN) {
                result.service = "SSL/TLS";
                result.version = outcome.tls_version;
                result.cert_info = outcome.cert;
            }
            break;
        case ScanTechnique::SYN:
        case ScanTechnique::FIN:
        case ScanTechnique::XMAS:
        case ScanTechnique::NULL_SCAN:
        case ScanTechnique::WINDOW:
        case ScanTechnique::TLS_ECHO:
        case ScanTechnique::MIMIC:
        case ScanTechnique::FRAG:
            result.tcp_states[technique] = outcome.state;
            break;
    }
    if (!outcome.os_guess.empty()) {
        result.os_guess = outcome.os_guess;
    }
}

ScanOrchestrator::ScanOrchestrator(ScanConfig config, ProbeServices services)
    : config_(std::move(config)), services_(std::move(services)) {
    config_.normalize();
    if (!services_.resolver) services_.resolver = resolveTarget;
    if (!services_.has_privileges) services_.has_privileges = hasRawSocketPrivileges;
}

void ScanOrchestrator::checkPrivileges() const {
    std::vector<std::string> needing;
    for (ScanTechnique technique : config_.techniques) {
        if (requiresRawSocket(technique)) needing.push_back(techniqueName(technique));
    }
    if (needing.empty() || services_.has_privileges()) return;

    std::string names;
    for (const auto& name : needing) {
        if (!names.empty()) names += ", ";
        names += name;
    }
    throw PrivilegeError("Raw socket privileges required for: " + names + " (run as root)");
}

std::map<int, PortResult> ScanOrchestrator::runScan() {
    target_ = services_.resolver(config_.target, config_.use_ipv6);
    checkPrivileges();

    // Crafted packets carry the source address in their checksums.
    bool crafts_packets = std::any_of(config_.techniques.begin(), config_.techniques.end(), requiresRawSocket);
    if (crafts_packets && target_.source_ip.empty()) {
        throw ResolutionError("No local source address to reach " + target_.ip);
    }

    if (!services_.transport || !services_.captures || !services_.connector || !services_.tls) {
        throw std::invalid_argument("ScanOrchestrator: missing network service");
    }

    std::vector<int> ports = config_.ports;
    if (config_.shuffle_ports) {
        std::shuffle(ports.begin(), ports.end(), std::mt19937(std::random_device{}()));
    }
    ResultStore store(ports);

    logsys.Info("Starting scan of ", target_.ip, " (", ports.size(), " ports, ",
                config_.techniques.size(), " techniques)");

    FragmentScanner fragments(*services_.transport, *services_.captures, fragmentSettings(config_));
    TechniqueRunner runner(config_, target_, *services_.transport, *services_.tls, fragments);
    BannerGrabber grabber(*services_.connector, config_.timeout_banner_ms);
    RateLimiter limiter(config_.max_rate);

    const size_t permits = std::min(ports.size(), static_cast<size_t>(config_.concurrency));
    {
        WorkerPool io(std::max<size_t>(permits, 1));
        WorkerPool drivers(std::max<size_t>(permits, 1));
        std::vector<std::future<void>> tasks;
        tasks.reserve(ports.size());
        for (int port : ports) {
            tasks.push_back(drivers.submit([&, port]() {
                scanPort(port, runner, grabber, limiter, store, io);
            }));
        }
        for (auto& task : tasks) task.get();
    }

    std::map<int, PortResult> results = store.snapshot();
    size_t open = std::count_if(results.begin(), results.end(),
                                [](const std::pair<const int, PortResult>& entry) { return entry.second.isOpen(); });
    logsys.Info("Scan of ", target_.ip, " complete: ", open, " open of ", results.size(), " ports");
    return results;
}

void ScanOrchestrator::scanPort(int port, TechniqueRunner& runner, BannerGrabber& grabber,
                                RateLimiter& limiter, ResultStore& store, WorkerPool& io) {
    try {
        for (ScanTechnique technique : config_.techniques) {
            TechniqueOutcome outcome = io.submit([&runner, technique, port]() {
                return runner.run(technique, static_cast<uint16_t>(port));
            }).get();
            store.update(port, [&](PortResult& result) { applyOutcome(result, technique, outcome); });
            limiter.wait();
        }
        if (store.get(port).isOpen()) {
            enrichPort(port, grabber, store, io);
        }
    } catch (const std::exception& e) {
        logsys.Error("Error scanning port ", port, ": ", e.what());
    }
}

void ScanOrchestrator::enrichPort(int port, BannerGrabber& grabber, ResultStore& store, WorkerPool& io) {
    std::string service = store.get(port).service;
    if (service.empty()) service = serviceForPort(port);

    const TargetDescriptor target = target_;
    std::optional<std::string> banner = io.submit([&grabber, target, port, service]() {
        return grabber.grab(target, port, service);
    }).get();
    if (!banner) {
        logsys.Debug("Banner grab failed on port ", port);
    }

    store.update(port, [&](PortResult& result) {
        result.service = service;
        if (banner) {
            result.banner = *banner;
            result.service = refineService(result.service, result.banner);
            if (result.version.empty()) result.version = extractVersion(result.banner);
        }
        for (const auto& finding : correlateVulnerabilities(result)) {
            if (std::find(result.vulns.begin(), result.vulns.end(), finding) == result.vulns.end()) {
                result.vulns.push_back(finding);
            }
        }
    });
}
