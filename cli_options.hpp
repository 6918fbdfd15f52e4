#ifndef CLI_OPTIONS_HPP
#define CLI_OPTIONS_HPP

#include <ostream>
#include <string>
#include <vector>

#include "scan_config.hpp"

// Ports scanned when --ports is not given.
extern const std::vector<int> QUICK_SCAN_PORTS;

struct CliOptions {
    ScanConfig config;
    bool show_help = false;
};

/**
 * @brief Parses command-line arguments (without the program name).
 * @throws std::invalid_argument on unknown options, missing or malformed values.
 */
CliOptions parseArguments(const std::vector<std::string>& args);

void printUsage(std::ostream& os);

#endif // CLI_OPTIONS_HPP
