#include "vuln_correlator.hpp"

#include <algorithm>
#include <cctype>

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

void addFinding(std::vector<std::string>& findings, const std::string& finding) {
    if (std::find(findings.begin(), findings.end(), finding) == findings.end()) {
        findings.push_back(finding);
    }
}

} // namespace

const std::vector<VulnSignature>& knownVulnerabilities() {
    static const std::vector<VulnSignature> signatures = {
        {"apache/2.4.49", {"CVE-2021-41773 (Path Traversal)"}},
        {"apache/2.4.50", {"CVE-2021-42013 (Path Traversal and RCE)"}},
        {"openssh_8.0", {"CVE-2021-41617 (SSH Agent Vulnerability)"}},
        {"openssh_7.7", {"CVE-2018-15473 (User Enumeration)"}},
        {"iis/10.0", {"CVE-2020-0601 (CurveBall)"}},
        {"vsftpd 2.3.4", {"CVE-2011-2523 (Backdoor Command Execution)"}},
        {"proftpd 1.3.5", {"CVE-2015-3306 (mod_copy Arbitrary File Copy)"}},
    };
    return signatures;
}

std::vector<std::string> correlateVulnerabilities(const PortResult& result,
                                                  const std::vector<VulnSignature>& signatures) {
    std::vector<std::string> findings;
    const std::string version = toLower(result.version);
    const std::string banner = toLower(result.banner);

    for (const auto& signature : signatures) {
        if ((!version.empty() && version.find(signature.pattern) != std::string::npos) ||
            (!banner.empty() && banner.find(signature.pattern) != std::string::npos)) {
            for (const auto& finding : signature.findings) addFinding(findings, finding);
        }
    }

    if (result.service == "SSL/TLS" && version.find("tlsv1.0") != std::string::npos) {
        addFinding(findings, "Weak TLS version (TLSv1.0)");
    }

    if (result.cert_info) {
        const std::string algorithm = toLower(result.cert_info->signature_algorithm);
        if (algorithm.find("sha1") != std::string::npos) {
            addFinding(findings, "Weak signature (SHA1)");
        } else if (algorithm.find("md5") != std::string::npos) {
            addFinding(findings, "Weak signature (MD5)");
        }
    }
    return findings;
}
