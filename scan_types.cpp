#include "scan_types.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <stdexcept>

const char* const STATE_OPEN = "open";
const char* const STATE_CLOSED = "closed";
const char* const STATE_FILTERED = "filtered";
const char* const STATE_OPEN_FILTERED = "open|filtered";
const char* const STATE_UNFILTERED = "unfiltered";

const char* techniqueName(ScanTechnique technique) {
    switch (technique) {
        case ScanTechnique::SYN:       return "syn";
        case ScanTechnique::ACK:       return "ack";
        case ScanTechnique::FIN:       return "fin";
        case ScanTechnique::XMAS:      return "xmas";
        case ScanTechnique::NULL_SCAN: return "null";
        case ScanTechnique::WINDOW:    return "window";
        case ScanTechnique::UDP:       return "udp";
        case ScanTechnique::SSL:       return "ssl";
        case ScanTechnique::TLS_ECHO:  return "tls_echo";
        case ScanTechnique::MIMIC:     return "mimic";
        case ScanTechnique::FRAG:      return "frag";
    }
    return "unknown";
}

ScanTechnique parseTechnique(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "tlsecho") lowered = "tls_echo";
    for (ScanTechnique technique : allTechniques()) {
        if (lowered == techniqueName(technique)) return technique;
    }
    throw std::invalid_argument("Unknown scan technique: " + name);
}

const std::vector<ScanTechnique>& allTechniques() {
    static const std::vector<ScanTechnique> techniques = {
        ScanTechnique::SYN, ScanTechnique::ACK, ScanTechnique::FIN,
        ScanTechnique::XMAS, ScanTechnique::NULL_SCAN, ScanTechnique::WINDOW,
        ScanTechnique::UDP, ScanTechnique::SSL, ScanTechnique::TLS_ECHO,
        ScanTechnique::MIMIC, ScanTechnique::FRAG
    };
    return techniques;
}

bool requiresRawSocket(ScanTechnique technique) {
    switch (technique) {
        case ScanTechnique::SSL:
            return false;
        case ScanTechnique::SYN:
        case ScanTechnique::ACK:
        case ScanTechnique::FIN:
        case ScanTechnique::XMAS:
        case ScanTechnique::NULL_SCAN:
        case ScanTechnique::WINDOW:
        case ScanTechnique::UDP:
        case ScanTechnique::TLS_ECHO:
        case ScanTechnique::MIMIC:
        case ScanTechnique::FRAG:
            return true;
    }
    return true;
}

bool isSynFamily(ScanTechnique technique) {
    return technique == ScanTechnique::SYN ||
           technique == ScanTechnique::TLS_ECHO ||
           technique == ScanTechnique::MIMIC;
}

bool PortResult::isOpen() const {
    if (udp_state == STATE_OPEN) return true;
    return std::any_of(tcp_states.begin(), tcp_states.end(),
                       [](const std::pair<const ScanTechnique, std::string>& entry) {
                           return entry.second == STATE_OPEN;
                       });
}

std::string isoTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t time_now = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time_now, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &local);
    return buffer;
}
