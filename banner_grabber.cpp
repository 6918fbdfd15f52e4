#include "banner_grabber.hpp"

#include <errno.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <regex>

#include "log_system.hpp"
#include "probe_engine.hpp"

namespace {

// Quiet period after which a banner is considered complete.
constexpr int READ_IDLE_MS = 200;

const std::map<int, std::string> commonPorts = {
    {20, "FTP-data"}, {21, "FTP"}, {22, "SSH"}, {23, "Telnet"},
    {25, "SMTP"}, {53, "DNS"}, {80, "HTTP"}, {110, "POP3"},
    {111, "RPCbind"}, {115, "SFTP"}, {123, "NTP"}, {135, "MSRPC"},
    {139, "NetBIOS-SSN"}, {143, "IMAP"}, {161, "SNMP"}, {194, "IRC"},
    {443, "HTTPS"}, {445, "SMB"}, {465, "SMTPS"}, {514, "Syslog"},
    {587, "SMTP-submission"}, {993, "IMAPS"}, {995, "POP3S"},
    {1080, "SOCKS"}, {1194, "OpenVPN"}, {1433, "MSSQL"}, {1723, "PPTP"},
    {3306, "MySQL"}, {3389, "RDP"}, {5060, "SIP"}, {5432, "PostgreSQL"},
    {5900, "VNC"}, {8080, "HTTP-Proxy"}, {8443, "HTTPS-Alt"}
};

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool sendAll(int sock, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(sock, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

std::optional<std::string> TcpStreamConnector::exchange(const TargetDescriptor& target, int port,
                                                        const std::string& request, size_t max_bytes,
                                                        int timeout_ms) {
    int sock = openTcpConnection(target.ip, target.ipv6, port, timeout_ms);
    if (sock < 0) {
        logsys.Debug("Banner connect to ", target.ip, ":", port, " failed");
        return std::nullopt;
    }

    if (!request.empty() && !sendAll(sock, request)) {
        logsys.Debug("Banner probe send to ", target.ip, ":", port, " failed");
    }

    std::string response;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (response.size() < max_bytes) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) break;
        int wait = response.empty() ? static_cast<int>(remaining)
                                    : static_cast<int>(std::min<long long>(remaining, READ_IDLE_MS));
        struct pollfd pfd;
        pfd.fd = sock;
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, wait);
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) break;

        char buffer[1024];
        size_t want = std::min(sizeof(buffer), max_bytes - response.size());
        ssize_t bytes = recv(sock, buffer, want, 0);
        if (bytes <= 0) break;
        response.append(buffer, static_cast<size_t>(bytes));
    }

    close(sock);
    return response;
}

BannerGrabber::BannerGrabber(StreamConnector& connector, int timeout_ms)
    : connector_(connector), timeout_ms_(timeout_ms) {}

std::string BannerGrabber::probeFor(const std::string& service, const std::string& host) {
    std::string guess = toLower(service);
    if (guess.find("http") != std::string::npos) {
        return "GET / HTTP/1.1\r\nHost: " + host + "\r\n\r\n";
    }
    if (guess.find("ftp") != std::string::npos) {
        return "USER anonymous\r\n";
    }
    if (guess.find("ssh") != std::string::npos) {
        return "SSH-2.0-netprobe\r\n";
    }
    return "HEAD / HTTP/1.0\r\n\r\n";
}

std::optional<std::string> BannerGrabber::grab(const TargetDescriptor& target, int port,
                                               const std::string& service) {
    std::optional<std::string> response = connector_.exchange(
        target, port, probeFor(service, target.ip), BANNER_READ_LIMIT, timeout_ms_);
    if (!response) return std::nullopt;
    if (response->size() > BANNER_KEEP_LIMIT) response->resize(BANNER_KEEP_LIMIT);
    return response;
}

std::string serviceForPort(int port) {
    auto it = commonPorts.find(port);
    return it != commonPorts.end() ? it->second : "unknown";
}

std::string refineService(const std::string& service, const std::string& banner) {
    if (banner.empty()) return service;
    std::string lowered = toLower(banner);
    std::string refined = service;
    if (service != "SSL/TLS") {
        if (lowered.find("ssh") != std::string::npos) {
            refined = "SSH";
        } else if (lowered.find("http") != std::string::npos) {
            refined = "HTTP";
        }
    }
    if (banner.find("220") != std::string::npos && lowered.find("ftp") != std::string::npos) {
        refined = "FTP";
    }
    return refined;
}

std::string extractVersion(const std::string& banner) {
    static const std::regex httpServer("(Apache|nginx|Microsoft-IIS|lighttpd|LiteSpeed)/([0-9][0-9A-Za-z\\.\\-]*)");
    static const std::regex sshVersion("SSH-[0-9\\.]+-([^\\s]+)");
    static const std::regex ftpVersion("(vsFTPd|ProFTPD|Pure-FTPd|FileZilla Server)[ /]+([0-9][0-9A-Za-z\\.\\-]*)");
    static const std::regex serverHeader("Server:[ \\t]*([^\\r\\n]+)", std::regex::ECMAScript | std::regex::icase);

    std::smatch matches;
    if (std::regex_search(banner, matches, httpServer)) {
        return matches[0].str();
    }
    if (std::regex_search(banner, matches, sshVersion) && matches.size() > 1) {
        return matches[1].str();
    }
    if (std::regex_search(banner, matches, ftpVersion)) {
        return matches[1].str() + " " + matches[2].str();
    }
    if (std::regex_search(banner, matches, serverHeader) && matches.size() > 1) {
        return matches[1].str();
    }
    return "";
}
