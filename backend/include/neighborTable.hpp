#pragma once

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include "protocol.hpp"
#include "commandRunner.hpp"

/**
 * Turns the output of the OS neighbor table command into devices
 * One implementation per platform family, chosen once at startup
 */
class NeighborTableParser {
public:
    virtual ~NeighborTableParser() = default;

    // Command that dumps the table
    virtual std::vector<std::string> command() const = 0;

    /**
     * Parse the whole command output
     * Lines that do not describe a resolved entry are skipped
     */
    std::vector<Device> parse(const std::string& output) const;

    /**
     * Parse one line
     * @return: true and fills device if the line holds a valid entry
     */
    virtual bool parseLine(const std::string& line, Device& device) const = 0;
};

/**
 * BSD / macOS "arp -a"
 * gateway (192.168.1.1) at aa:bb:cc:dd:ee:ff on en0 ifscope [ethernet]
 */
class ArpTableParser : public NeighborTableParser {
public:
    std::vector<std::string> command() const override;
    bool parseLine(const std::string& line, Device& device) const override;
};

/**
 * Linux "ip neigh show"
 * 192.168.1.1 dev eth0 lladdr aa:bb:cc:dd:ee:ff STALE
 */
class IpNeighParser : public NeighborTableParser {
public:
    std::vector<std::string> command() const override;
    bool parseLine(const std::string& line, Device& device) const override;
};

// Parser matching the platform this binary runs on
std::unique_ptr<NeighborTableParser> makeNeighborTableParser();

/**
 * NeighborTableReader dumps and parses the OS neighbor (ARP) table
 */
class NeighborTableReader {
private:
    std::shared_ptr<CommandRunner> runner;
    std::unique_ptr<NeighborTableParser> parser;
    std::chrono::milliseconds timeout;

public:
    /**
     * @param runner: Used to spawn the table command
     * @param parser: Platform strategy
     * @param timeout: Command timeout (default: 5s)
     */
    NeighborTableReader(std::shared_ptr<CommandRunner> runner,
                        std::unique_ptr<NeighborTableParser> parser,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    /**
     * Read the current table
     * @param devices: Receives entries in table order
     * @return: false if the command could not run, timed out or exited non-zero
     */
    bool read(std::vector<Device>& devices) const;
};
