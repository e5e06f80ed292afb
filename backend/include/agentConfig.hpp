#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstddef>
#include "networkInterfaces.hpp"

#define LANAGENT_VERSION "0.1.0"

/**
 * Runtime settings of the agent
 * Compiled in defaults, port and interval can be overridden on the command line
 */
struct AgentConfig {
    int port = 0;                                               // 0: pick a free port
    std::chrono::seconds scan_interval{60};
    size_t probe_batch_size = 50;
    std::chrono::milliseconds probe_timeout{2000};
    std::chrono::milliseconds neighbor_timeout{5000};
    size_t max_hosts = 254;
    std::vector<std::string> virtual_prefixes = defaultVirtualPrefixes();
    std::string service_type = "_lanagent._tcp.local.";
    std::string service_version = "1.0";                        // TXT "version"
    std::string description = "LAN Agent network scanner with JSON API";
};

/**
 * What main should do after parsing the command line
 */
enum class CliAction {
    RUN,
    SHOW_VERSION,
    SHOW_HELP
};

/**
 * Parse -p/--port, -i/--interval, -v/--version, -h/--help
 * @param config: Updated in place
 * @return: Action requested by the user
 * @throws std::invalid_argument on unknown options or bad values
 */
CliAction parseArguments(int argc, char* argv[], AgentConfig& config);

std::string usage(const std::string& program);
