#pragma once

#include <string>
#include <vector>
#include <chrono>

/**
 * Outcome of running an external program
 */
struct CommandResult {
    bool started = false;      // false if the process could not be spawned
    bool timed_out = false;    // true if the process was killed at the deadline
    int exit_code = -1;        // 127 when the binary is not on PATH
    std::string output;        // Captured stdout

    bool succeeded() const { return started && !timed_out && exit_code == 0; }
};

/**
 * Runs external commands (ping, arp, ip)
 * Abstract so the scanner can be tested without spawning processes
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * Run a program and wait for it
     * @param args: argv, args[0] is looked up on PATH
     * @param timeout: The process is killed once this elapses
     */
    virtual CommandResult run(const std::vector<std::string>& args,
                              std::chrono::milliseconds timeout) = 0;
};

/**
 * fork/exec implementation
 * stdout is read through a pipe, stdin and stderr go to /dev/null
 */
class ProcessCommandRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& args,
                      std::chrono::milliseconds timeout) override;
};
