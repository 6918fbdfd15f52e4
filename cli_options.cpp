#include "cli_options.hpp"

#include <sstream>
#include <stdexcept>

const std::vector<int> QUICK_SCAN_PORTS = {21, 22, 23, 25, 53, 80, 110, 111, 135, 139, 143, 443,
                                           445, 993, 995, 1723, 3306, 3389, 5900, 8080};

namespace {

int toInt(const std::string& option, const std::string& value) {
    size_t used = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid value for " + option + ": " + value);
    }
    if (used != value.size()) {
        throw std::invalid_argument("Invalid value for " + option + ": " + value);
    }
    return parsed;
}

int toPositive(const std::string& option, const std::string& value) {
    int parsed = toInt(option, value);
    if (parsed < 1) {
        throw std::invalid_argument(option + " must be at least 1");
    }
    return parsed;
}

std::vector<ScanTechnique> toTechniques(const std::string& value) {
    std::vector<ScanTechnique> techniques;
    std::istringstream stream(value);
    std::string name;
    while (std::getline(stream, name, ',')) {
        if (name.empty()) continue;
        techniques.push_back(parseTechnique(name));
    }
    if (techniques.empty()) {
        throw std::invalid_argument("No scan technique given");
    }
    return techniques;
}

} // namespace

CliOptions parseArguments(const std::vector<std::string>& args) {
    CliOptions options;
    ScanConfig& config = options.config;
    bool ports_given = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--target" || arg == "-t") {
            config.target = value();
        } else if (arg == "--ports" || arg == "-p") {
            config.ports = parsePortList(value());
            ports_given = true;
        } else if (arg == "--techniques" || arg == "-s") {
            config.techniques = toTechniques(value());
        } else if (arg == "--concurrency") {
            config.concurrency = toPositive(arg, value());
        } else if (arg == "--rate") {
            config.max_rate = toPositive(arg, value());
        } else if (arg == "--evasions") {
            config.evasions = true;
        } else if (arg == "--ipv6" || arg == "-6") {
            config.use_ipv6 = true;
        } else if (arg == "--timeout") {
            config.timeout_scan_ms = toPositive(arg, value());
        } else if (arg == "--connect-timeout") {
            config.timeout_connect_ms = toPositive(arg, value());
        } else if (arg == "--banner-timeout") {
            config.timeout_banner_ms = toPositive(arg, value());
        } else if (arg == "--max-tries") {
            config.max_tries = toPositive(arg, value());
        } else if (arg == "--retry-backoff") {
            config.retry_backoff_ms = toInt(arg, value());
            if (config.retry_backoff_ms < 0) {
                throw std::invalid_argument("--retry-backoff must not be negative");
            }
        } else if (arg == "--mimic") {
            config.mimic_protocol = value();
        } else if (arg == "--frag-min-size") {
            config.frag_min_size = toPositive(arg, value());
        } else if (arg == "--frag-max-size") {
            config.frag_max_size = toPositive(arg, value());
        } else if (arg == "--frag-min-delay") {
            config.frag_min_delay_ms = toInt(arg, value());
        } else if (arg == "--frag-max-delay") {
            config.frag_max_delay_ms = toInt(arg, value());
        } else if (arg == "--frag-timeout") {
            config.frag_timeout_ms = toPositive(arg, value());
        } else if (arg == "--frag-first-min-size") {
            config.frag_first_min_size = toPositive(arg, value());
        } else if (arg == "--frag-two-frags") {
            config.frag_two_frags = true;
        } else if (arg == "--shuffle") {
            config.shuffle_ports = true;
        } else if (arg == "--interface") {
            config.interface = value();
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (arg == "--output-csv") {
            config.output_csv = value();
        } else if (!arg.empty() && arg[0] != '-' && config.target.empty()) {
            config.target = arg;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (options.show_help) return options;
    if (config.target.empty()) {
        throw std::invalid_argument("No target given");
    }
    if (!ports_given) {
        config.ports = QUICK_SCAN_PORTS;
    }
    config.normalize();
    return options;
}

void printUsage(std::ostream& os) {
    os << "Usage: netprobe [options] <target>\n"
       << "  -t, --target <host>         Hostname or IP address to scan\n"
       << "  -p, --ports <list>          Ports, e.g. 22,80,1000-1010 (default: common ports)\n"
       << "  -s, --techniques <list>     syn,ack,fin,xmas,null,window,udp,ssl,tls_echo,mimic,frag (default: syn)\n"
       << "  --concurrency <num>         Ports scanned in parallel (default: 100, max: 500)\n"
       << "  --rate <pps>                Maximum packets per second (default: 500)\n"
       << "  --evasions                  Randomise TTL and IP identification\n"
       << "  -6, --ipv6                  Scan over IPv6\n"
       << "  --timeout <ms>              Probe reply timeout (default: 3000)\n"
       << "  --connect-timeout <ms>      TCP/TLS connect timeout (default: 3000)\n"
       << "  --banner-timeout <ms>       Banner read timeout (default: 3000)\n"
       << "  --max-tries <num>           Attempts for retrying techniques (default: 3)\n"
       << "  --retry-backoff <ms>        Base delay between attempts, doubled each retry (default: 0)\n"
       << "  --mimic <proto>             HTTP, SSH, FTP, SMTP, IMAP, POP3, MySQL, RDP (default: HTTP)\n"
       << "  --frag-min-size <bytes>     Smallest fragment (default: 16, raised to 24)\n"
       << "  --frag-max-size <bytes>     Largest fragment (default: 64)\n"
       << "  --frag-min-delay <ms>       Shortest gap between fragments (default: 10)\n"
       << "  --frag-max-delay <ms>       Longest gap between fragments (default: 100)\n"
       << "  --frag-timeout <ms>         Reply capture window (default: 10000)\n"
       << "  --frag-first-min-size <b>   First fragment minimum in two-fragment mode (default: 64)\n"
       << "  --frag-two-frags            Split into exactly two fragments\n"
       << "  --shuffle                   Randomise port order\n"
       << "  --interface <if>            Capture interface (default: any)\n"
       << "  -v, --verbose               Debug logging\n"
       << "  --output-csv <file>         Write per-port results as CSV\n"
       << "  -h, --help                  Show this help\n";
}
