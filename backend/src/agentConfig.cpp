#include "agentConfig.hpp"
#include <sstream>
#include <stdexcept>
#include <cstdlib>
#include <cerrno>
#include <climits>
#include <getopt.h>

namespace {

long parseNumber(const char* text, const std::string& option) {
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0') {
        throw std::invalid_argument("invalid value for " + option + ": " + text);
    }
    return value;
}

} // namespace

CliAction parseArguments(int argc, char* argv[], AgentConfig& config) {
    static const struct option long_options[] = {
        {"port", required_argument, nullptr, 'p'},
        {"interval", required_argument, nullptr, 'i'},
        {"version", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    // getopt keeps global state; restart scanning for every call
#ifdef __APPLE__
    optreset = 1;
    optind = 1;
#else
    optind = 0;
#endif
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":p:i:vh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'p': {
                long port = parseNumber(optarg, "--port");
                if (port < 0 || port > 65535) {
                    throw std::invalid_argument("port out of range (0-65535): " + std::string(optarg));
                }
                config.port = static_cast<int>(port);
                break;
            }

            case 'i': {
                long seconds = parseNumber(optarg, "--interval");
                if (seconds < 1 || seconds > INT_MAX) {
                    throw std::invalid_argument("interval must be at least 1 second: " + std::string(optarg));
                }
                config.scan_interval = std::chrono::seconds(seconds);
                break;
            }

            case 'v':
                return CliAction::SHOW_VERSION;

            case 'h':
                return CliAction::SHOW_HELP;

            case ':':
                throw std::invalid_argument("missing value for option");

            default:
                throw std::invalid_argument("unknown option");
        }
    }

    if (optind < argc) {
        throw std::invalid_argument("unexpected argument: " + std::string(argv[optind]));
    }

    return CliAction::RUN;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [-p PORT] [-i SECONDS] [-v] [-h]\n"
        << "LANAgent - Network discovery service with JSON API\n\n"
        << "  -p, --port PORT        HTTP port (default: 0, auto-select)\n"
        << "  -i, --interval SECONDS Time between scans (default: 60)\n"
        << "  -v, --version          Print version and exit\n"
        << "  -h, --help             Print this help and exit\n\n"
        << "Scan results are served at http://<host>:<port>/scan and the service\n"
        << "is advertised over mDNS as _lanagent._tcp.local.\n";
    return out.str();
}
