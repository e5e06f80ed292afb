#pragma once

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <cstddef>
#include "commandRunner.hpp"

/**
 * HostProbe pings candidate hosts so the OS resolves their hardware
 * addresses into the neighbor table
 * The reachability result itself is not used by the scanner
 */
class HostProbe {
private:
    std::shared_ptr<CommandRunner> runner;   // Shared with abandoned probe threads
    size_t batch_size;                       // Max probes in flight
    std::chrono::milliseconds probe_timeout; // Kill ping after this
    std::chrono::milliseconds join_timeout;  // Max wait for one batch

public:
    /**
     * @param runner: Used to spawn ping
     * @param batch_size: Concurrency limit (default: 50)
     * @param probe_timeout: Per ping process timeout (default: 2s)
     */
    HostProbe(std::shared_ptr<CommandRunner> runner, size_t batch_size = 50,
              std::chrono::milliseconds probe_timeout = std::chrono::milliseconds(2000));

    /**
     * One shot ping arguments for this platform
     */
    static std::vector<std::string> pingCommand(const std::string& ip);

    /**
     * Ping a single host
     * @return: true if it answered; any failure is reported as false
     */
    bool probe(const std::string& ip) const;

    /**
     * Ping every address, at most batch_size at a time
     * Each batch is awaited before the next one starts; probes still
     * running at the batch deadline are left to finish on their own
     * @return: Number of probes that were abandoned
     */
    size_t probeAll(const std::vector<std::string>& ips) const;

    size_t getBatchSize() const { return batch_size; }
};
