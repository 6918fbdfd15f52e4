#include <iostream>
#include <string>
#include <vector>

#include "cli_options.hpp"
#include "log_system.hpp"
#include "result_export.hpp"
#include "scan_orchestrator.hpp"

int main(int argc, char* argv[]) {
    try {
        CliOptions options = parseArguments(std::vector<std::string>(argv + 1, argv + argc));
        if (options.show_help) {
            printUsage(std::cout);
            return 0;
        }
        const ScanConfig& config = options.config;
        if (config.verbose) {
            logsys.setLevel(LogLevel::Debug);
        }

        std::string techniques;
        for (ScanTechnique technique : config.techniques) {
            if (!techniques.empty()) techniques += " ";
            techniques += techniqueName(technique);
        }
        std::cout << "Configuration:\n"
                  << "  Target: " << config.target << (config.use_ipv6 ? " (IPv6)" : "") << "\n"
                  << "  Ports: " << config.ports.size() << "\n"
                  << "  Techniques: " << techniques << "\n"
                  << "  Concurrency: " << config.concurrency << "\n"
                  << "  Rate: " << config.max_rate << " pps\n"
                  << "  Timeout: " << config.timeout_scan_ms << "ms\n"
                  << "  Evasions: " << (config.evasions ? "Yes" : "No") << "\n";

        ScanOrchestrator orchestrator(config, ProbeServices::system(config));
        std::map<int, PortResult> results = orchestrator.runScan();

        printSummary(std::cout, orchestrator.target(), results);

        if (!config.output_csv.empty()) {
            writeResultsCsv(config.output_csv, orchestrator.target(), results);
            std::cout << "Results written to " << config.output_csv << "\n";
        }
        std::cout << "Scan completed.\n";
    } catch (const std::exception& e) {
        logsys.Error(e.what());
        return 1;
    }

    return 0;
}
