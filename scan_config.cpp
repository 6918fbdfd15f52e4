#include "scan_config.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace {

// Minimum fragment size able to carry a full TCP header plus alignment.
constexpr int MIN_FRAGMENT_BYTES = 24;

int roundUpTo8(int value) {
    return ((value + 7) / 8) * 8;
}

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

int parsePortNumber(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument("Invalid port spec: " + text);
    }
    if (text.size() > 5) throw std::invalid_argument("Invalid port: " + text);
    int port = std::stoi(text);
    if (port < 1 || port > 65535) {
        throw std::invalid_argument("Invalid port: " + text);
    }
    return port;
}

} // namespace

void ScanConfig::normalize() {
    concurrency = std::max(1, std::min(concurrency, MAX_CONCURRENCY));
    max_rate = std::max(1, max_rate);
    max_tries = std::max(1, max_tries);
    retry_backoff_ms = std::max(0, retry_backoff_ms);
    timeout_scan_ms = std::max(1, timeout_scan_ms);
    timeout_connect_ms = std::max(1, timeout_connect_ms);
    timeout_banner_ms = std::max(1, timeout_banner_ms);

    frag_min_size = roundUpTo8(std::max(frag_min_size, MIN_FRAGMENT_BYTES));
    frag_max_size = std::max((frag_max_size / 8) * 8, frag_min_size);
    frag_first_min_size = roundUpTo8(std::max(frag_first_min_size, MIN_FRAGMENT_BYTES));
    frag_min_delay_ms = std::max(1, frag_min_delay_ms);
    frag_max_delay_ms = std::max(frag_min_delay_ms, frag_max_delay_ms);
    frag_timeout_ms = std::max(1, frag_timeout_ms);

    if (techniques.empty()) techniques.push_back(ScanTechnique::SYN);
}

std::vector<int> parsePortList(const std::string& spec) {
    std::vector<int> ports;
    std::istringstream stream(spec);
    std::string part;
    while (std::getline(stream, part, ',')) {
        part = trim(part);
        size_t dash = part.find('-');
        if (dash != std::string::npos) {
            int start = parsePortNumber(trim(part.substr(0, dash)));
            int end = parsePortNumber(trim(part.substr(dash + 1)));
            if (start > end) throw std::invalid_argument("Invalid range: " + part);
            for (int port = start; port <= end; ++port) ports.push_back(port);
        } else {
            ports.push_back(parsePortNumber(part));
        }
    }
    if (ports.empty()) throw std::invalid_argument("No ports given");
    std::sort(ports.begin(), ports.end());
    ports.erase(std::unique(ports.begin(), ports.end()), ports.end());
    return ports;
}
