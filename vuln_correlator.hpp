#ifndef VULN_CORRELATOR_HPP
#define VULN_CORRELATOR_HPP

#include <string>
#include <vector>

#include "scan_types.hpp"

/**
 * @struct VulnSignature
 * @brief Lower-case substring of a banner/version and the findings it implies.
 */
struct VulnSignature {
    std::string pattern;
    std::vector<std::string> findings;
};

/** @brief Built-in signature table. */
const std::vector<VulnSignature>& knownVulnerabilities();

/**
 * @brief Findings for one open port.
 *
 * Banner and version are matched case-insensitively against @p signatures.
 * An "SSL/TLS" service negotiated at TLS 1.0 is flagged, and so is a
 * certificate signed with SHA-1 or MD5. Each finding appears once.
 */
std::vector<std::string> correlateVulnerabilities(const PortResult& result,
                                                  const std::vector<VulnSignature>& signatures = knownVulnerabilities());

#endif // VULN_CORRELATOR_HPP
