#ifndef SCAN_CONFIG_HPP
#define SCAN_CONFIG_HPP

#include <string>
#include <vector>

#include "scan_types.hpp"

constexpr int MAX_CONCURRENCY = 500;

// Scan parameters supplied by the CLI layer.
struct ScanConfig {
    std::string target;
    std::vector<int> ports;
    std::vector<ScanTechnique> techniques = {ScanTechnique::SYN};
    int concurrency = 100;
    int max_rate = 500;                 // packets per second
    bool evasions = false;
    bool use_ipv6 = false;
    int timeout_scan_ms = 3000;
    int timeout_connect_ms = 3000;
    int timeout_banner_ms = 3000;
    int max_tries = 3;
    int retry_backoff_ms = 0;
    std::string mimic_protocol = "HTTP";
    int frag_min_size = 16;
    int frag_max_size = 64;
    int frag_min_delay_ms = 10;
    int frag_max_delay_ms = 100;
    int frag_timeout_ms = 10000;
    int frag_first_min_size = 64;
    bool frag_two_frags = false;
    bool shuffle_ports = false;
    std::string interface = "any";
    bool verbose = false;
    std::string output_csv;

    // Clamps values into their supported ranges.
    void normalize();
};

/**
 * @brief Parses "80", "22,80,443", "1-1024" or any comma mix of those.
 * @return Sorted list without duplicates.
 * @throws std::invalid_argument on malformed input or ports outside 1-65535.
 */
std::vector<int> parsePortList(const std::string& spec);

#endif // SCAN_CONFIG_HPP
