#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "result_export.hpp"

namespace {

std::map<int, PortResult> sampleResults() {
    std::map<int, PortResult> results;

    PortResult web;
    web.tcp_states[ScanTechnique::SYN] = STATE_OPEN;
    web.tcp_states[ScanTechnique::FIN] = STATE_OPEN_FILTERED;
    web.service = "HTTP";
    web.version = "Apache/2.4.49";
    web.banner = "HTTP/1.1 200 OK\r\nServer: Apache/2.4.49\r\n\r\n";
    web.os_guess = "Linux/Unix";
    web.vulns.push_back("CVE-2021-41773 (Path Traversal)");
    web.scan_time = "2024-01-01T00:00:00";
    results[80] = web;

    PortResult closed;
    closed.tcp_states[ScanTechnique::SYN] = STATE_CLOSED;
    closed.scan_time = "2024-01-01T00:00:00";
    results[81] = closed;
    return results;
}

TargetDescriptor target() {
    TargetDescriptor descriptor;
    descriptor.ip = "10.0.0.5";
    return descriptor;
}

} // namespace

TEST(CsvRowTest, PlainAndQuotedFields) {
    std::ostringstream out;
    writeCSVRow(out, {"a", "b,c", "say \"hi\"", "line\nbreak", ""});
    EXPECT_EQ(out.str(), "a,\"b,c\",\"say \"\"hi\"\"\",\"line\nbreak\",\n");
}

TEST(CsvRowTest, CarriageReturnIsQuoted) {
    std::ostringstream out;
    writeCSVRow(out, {"220 ready\r"});
    EXPECT_EQ(out.str(), "\"220 ready\r\"\n");
}

TEST(ResultExportTest, TcpStatesInTechniqueOrder) {
    std::map<ScanTechnique, std::string> states = {{ScanTechnique::FIN, STATE_OPEN_FILTERED},
                                                   {ScanTechnique::SYN, STATE_OPEN}};
    EXPECT_EQ(formatTcpStates(states), "syn=open;fin=open|filtered");
    EXPECT_EQ(formatTcpStates({}), "");
}

TEST(ResultExportTest, CsvFileHasOneRowPerPort) {
    std::string path = ::testing::TempDir() + "netprobe_export_test.csv";
    writeResultsCsv(path, target(), sampleResults());

    std::ifstream in(path);
    ASSERT_TRUE(in.is_open());
    std::stringstream content;
    content << in.rdbuf();
    std::string text = content.str();
    std::remove(path.c_str());

    EXPECT_EQ(text.rfind("IP,Port,TcpStates,UdpState,Filtering,Service,Version,Banner,OS,CertInfo,Vulns,ScanTime\n", 0),
              0u);
    EXPECT_NE(text.find("10.0.0.5,80,syn=open;fin=open|filtered,,,HTTP,Apache/2.4.49,"), std::string::npos);
    EXPECT_NE(text.find("10.0.0.5,81,syn=closed,"), std::string::npos);
    EXPECT_NE(text.find("CVE-2021-41773 (Path Traversal)"), std::string::npos);
}

TEST(ResultExportTest, UnwritablePathThrows) {
    EXPECT_THROW(writeResultsCsv("/nonexistent-dir/out.csv", target(), sampleResults()), std::runtime_error);
}

TEST(ResultExportTest, SummaryListsOpenPortsOnly) {
    std::ostringstream out;
    printSummary(out, target(), sampleResults());
    std::string text = out.str();
    EXPECT_NE(text.find("Host: 10.0.0.5"), std::string::npos);
    EXPECT_NE(text.find("Ports scanned: 2"), std::string::npos);
    EXPECT_NE(text.find("Open ports: 1"), std::string::npos);
    EXPECT_NE(text.find("80 [syn=open;fin=open|filtered] (HTTP) Version: Apache/2.4.49 OS: Linux/Unix - HTTP/1.1 200 OK"),
              std::string::npos);
    EXPECT_NE(text.find("! CVE-2021-41773"), std::string::npos);
    EXPECT_EQ(text.find("81 ["), std::string::npos);
}
