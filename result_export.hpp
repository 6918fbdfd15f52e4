#ifndef RESULT_EXPORT_HPP
#define RESULT_EXPORT_HPP

#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "scan_types.hpp"

/**
 * @brief Writes one CSV record. Fields holding a comma, quote or newline are
 * quoted, with embedded quotes doubled.
 */
void writeCSVRow(std::ostream& os, const std::vector<std::string>& fields);

// "syn=open;fin=open|filtered" in technique order.
std::string formatTcpStates(const std::map<ScanTechnique, std::string>& states);

/**
 * @brief Writes a header row and one row per port.
 * @throws std::runtime_error if @p filename cannot be opened.
 */
void writeResultsCsv(const std::string& filename, const TargetDescriptor& target,
                     const std::map<int, PortResult>& results);

/** @brief Console summary: open ports with service, version, banner and findings. */
void printSummary(std::ostream& os, const TargetDescriptor& target,
                  const std::map<int, PortResult>& results);

#endif // RESULT_EXPORT_HPP
