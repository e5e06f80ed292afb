#pragma once

#include <string>
#include <vector>
#include "protocol.hpp"

/**
 * Addresses reported for one network interface
 */
struct InterfaceAddresses {
    std::string name;
    std::vector<NetworkInfo> ipv4;           // ip + netmask pairs, in OS order
    std::vector<std::string> hardware;       // link layer addresses, xx:xx:xx:xx:xx:xx
};

/**
 * Interface name prefixes skipped when looking for this machine's own entry
 * (loopback, docker bridges, veth pairs)
 */
std::vector<std::string> defaultVirtualPrefixes();

/**
 * NetworkInterfaceInspector finds the primary IPv4 network and the
 * local machine's own address pair
 * Recomputed on every call, the topology may change between scans
 */
class NetworkInterfaceInspector {
private:
    std::vector<std::string> virtual_prefixes;

protected:
    /**
     * Enumerate interfaces with getifaddrs, grouped by name in first-seen order
     */
    virtual std::vector<InterfaceAddresses> listInterfaces() const;

public:
    explicit NetworkInterfaceInspector(std::vector<std::string> prefixes = defaultVirtualPrefixes());
    virtual ~NetworkInterfaceInspector() = default;

    /**
     * First non-loopback IPv4 address of the first interface carrying one
     * @param info: Receives ip and netmask (255.255.255.0 if the OS gives none)
     * @return: false if there is no such address
     */
    virtual bool getPrimaryNetwork(NetworkInfo& info) const;

    /**
     * IP and MAC of the first non-virtual interface that has both
     * @param device: Receives ip and uppercased mac
     * @return: false if no interface qualifies
     */
    virtual bool getPrimaryMachine(Device& device) const;

    bool isVirtualInterface(const std::string& name) const;
};
