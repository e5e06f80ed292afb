#include "neighborTable.hpp"
#include <iostream>
#include <sstream>
#include <algorithm>
#include <utility>

namespace {

std::vector<std::string> splitWhitespace(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string stripParentheses(const std::string& token) {
    size_t start = token.find_first_not_of("()");
    if (start == std::string::npos) return "";
    size_t end = token.find_last_not_of("()");
    return token.substr(start, end - start + 1);
}

} // namespace

std::vector<Device> NeighborTableParser::parse(const std::string& output) const {
    std::vector<Device> devices;
    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        Device device;
        if (parseLine(line, device)) {
            devices.push_back(device);
        }
    }
    return devices;
}

std::vector<std::string> ArpTableParser::command() const {
    return {"arp", "-a"};
}

bool ArpTableParser::parseLine(const std::string& line, Device& device) const {
    std::vector<std::string> parts = splitWhitespace(line);
    if (parts.size() < 4 || parts[2] != "at") {
        return false;
    }

    const std::string& mac = parts[3];
    if (mac == "(incomplete)" || !isValidMac(mac)) {
        return false;
    }

    device.ip = stripParentheses(parts[1]);
    device.mac = normalizeMac(mac);
    return true;
}

std::vector<std::string> IpNeighParser::command() const {
    // ip neigh needs no root, unlike arp on Linux
    return {"ip", "neigh", "show"};
}

bool IpNeighParser::parseLine(const std::string& line, Device& device) const {
    std::vector<std::string> parts = splitWhitespace(line);
    if (parts.size() < 5) {
        return false;
    }

    auto lladdr = std::find(parts.begin(), parts.end(), "lladdr");
    if (lladdr == parts.end() || lladdr + 1 == parts.end()) {
        return false;
    }

    const std::string& mac = *(lladdr + 1);
    if (!isValidMac(mac)) {
        return false;
    }

    device.ip = parts[0];
    device.mac = normalizeMac(mac);
    return true;
}

std::unique_ptr<NeighborTableParser> makeNeighborTableParser() {
#ifdef __APPLE__
    return std::unique_ptr<NeighborTableParser>(new ArpTableParser());
#else
    return std::unique_ptr<NeighborTableParser>(new IpNeighParser());
#endif
}

NeighborTableReader::NeighborTableReader(std::shared_ptr<CommandRunner> runner,
                                         std::unique_ptr<NeighborTableParser> parser,
                                         std::chrono::milliseconds timeout)
    : runner(std::move(runner)), parser(std::move(parser)), timeout(timeout) {}

bool NeighborTableReader::read(std::vector<Device>& devices) const {
    std::vector<std::string> args = parser->command();

    CommandResult result = runner->run(args, timeout);
    if (!result.started) {
        std::cerr << "Error reading ARP table: could not run " << args[0] << std::endl;
        return false;
    }
    if (result.timed_out) {
        std::cerr << "Error reading ARP table: " << args[0] << " timed out after "
                  << timeout.count() << " ms" << std::endl;
        return false;
    }
    if (result.exit_code != 0) {
        std::cerr << "Error reading ARP table: " << args[0] << " exited with status "
                  << result.exit_code << std::endl;
        return false;
    }

    devices = parser->parse(result.output);
    return true;
}
