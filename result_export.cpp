#include "result_export.hpp"

#include <fstream>
#include <stdexcept>

namespace {

std::string joinFindings(const std::vector<std::string>& vulns) {
    std::string joined;
    for (const auto& vuln : vulns) {
        if (!joined.empty()) joined += "; ";
        joined += vuln;
    }
    return joined;
}

std::string certSummary(const PortResult& result) {
    if (!result.cert_info) return "";
    const CertInfo& cert = *result.cert_info;
    return "Subject: " + cert.subject + " | Issuer: " + cert.issuer +
           " | Valid: " + cert.not_valid_before + " - " + cert.not_valid_after +
           " | Signature: " + cert.signature_algorithm;
}

} // namespace

void writeCSVRow(std::ostream& os, const std::vector<std::string>& fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            os << ",";
        }
        std::string field = fields[i];
        if (field.find_first_of(",\"\r\n") != std::string::npos) {
            size_t pos = 0;
            while ((pos = field.find('"', pos)) != std::string::npos) {
                field.replace(pos, 1, "\"\"");
                pos += 2;
            }
            os << "\"" << field << "\"";
        } else {
            os << field;
        }
    }
    os << "\n";
}

std::string formatTcpStates(const std::map<ScanTechnique, std::string>& states) {
    std::string formatted;
    for (const auto& entry : states) {
        if (!formatted.empty()) formatted += ";";
        formatted += std::string(techniqueName(entry.first)) + "=" + entry.second;
    }
    return formatted;
}

void writeResultsCsv(const std::string& filename, const TargetDescriptor& target,
                     const std::map<int, PortResult>& results) {
    std::ofstream outfile(filename);
    if (!outfile.is_open()) {
        throw std::runtime_error("Unable to open file: " + filename);
    }

    writeCSVRow(outfile, {"IP", "Port", "TcpStates", "UdpState", "Filtering", "Service", "Version",
                          "Banner", "OS", "CertInfo", "Vulns", "ScanTime"});
    for (const auto& entry : results) {
        const PortResult& result = entry.second;
        writeCSVRow(outfile, {target.ip, std::to_string(entry.first), formatTcpStates(result.tcp_states),
                              result.udp_state, result.filtering, result.service, result.version,
                              result.banner, result.os_guess, certSummary(result),
                              joinFindings(result.vulns), result.scan_time});
    }
}

void printSummary(std::ostream& os, const TargetDescriptor& target,
                  const std::map<int, PortResult>& results) {
    size_t open = 0;
    for (const auto& entry : results) {
        if (entry.second.isOpen()) ++open;
    }

    os << "\n=== Scan Summary ===\n";
    os << "Host: " << target.ip << "\n";
    os << "  Ports scanned: " << results.size() << "\n";
    os << "  Open ports: " << open << "\n";
    for (const auto& entry : results) {
        const PortResult& port = entry.second;
        if (!port.isOpen()) continue;
        os << "    " << entry.first << " [" << formatTcpStates(port.tcp_states);
        if (!port.udp_state.empty()) {
            os << (port.tcp_states.empty() ? "" : ";") << "udp=" << port.udp_state;
        }
        os << "] (" << (port.service.empty() ? "unknown" : port.service) << ")";
        if (!port.version.empty()) {
            os << " Version: " << port.version;
        }
        if (!port.os_guess.empty()) {
            os << " OS: " << port.os_guess;
        }
        if (!port.banner.empty()) {
            std::string line = port.banner.substr(0, port.banner.find_first_of("\r\n"));
            os << " - " << line;
        }
        os << "\n";
        for (const auto& vuln : port.vulns) {
            os << "      ! " << vuln << "\n";
        }
    }
}
