#include "networkInterfaces.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <cerrno>
#include <cstring>
#include <utility>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <net/if.h>
#include <ifaddrs.h>      // For getting network interface addresses
#ifdef __linux__
#include <linux/if_packet.h>  // sockaddr_ll
#else
#include <net/if_dl.h>        // sockaddr_dl
#endif

namespace {

const char* const kLoopbackAddress = "127.0.0.1";
const char* const kDefaultNetmask = "255.255.255.0";

std::string formatHardwareAddress(const unsigned char* bytes, size_t length) {
    std::ostringstream mac_stream;
    for (size_t i = 0; i < length; i++) {
        mac_stream << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
        if (i != length - 1) {
            mac_stream << ":";
        }
    }
    return mac_stream.str();
}

InterfaceAddresses& entryFor(std::vector<InterfaceAddresses>& interfaces, const std::string& name) {
    for (auto& entry : interfaces) {
        if (entry.name == name) return entry;
    }
    InterfaceAddresses entry;
    entry.name = name;
    interfaces.push_back(entry);
    return interfaces.back();
}

} // namespace

std::vector<std::string> defaultVirtualPrefixes() {
    return {"lo", "docker", "br-", "veth"};
}

NetworkInterfaceInspector::NetworkInterfaceInspector(std::vector<std::string> prefixes)
    : virtual_prefixes(std::move(prefixes)) {}

std::vector<InterfaceAddresses> NetworkInterfaceInspector::listInterfaces() const {
    std::vector<InterfaceAddresses> interfaces;

    struct ifaddrs* addrs = nullptr;
    if (getifaddrs(&addrs) != 0) {
        std::cerr << "Failed to list network interfaces: " << strerror(errno) << std::endl;
        return interfaces;
    }

    for (struct ifaddrs* ifa = addrs; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_name == nullptr || ifa->ifa_addr == nullptr) continue;

        int family = ifa->ifa_addr->sa_family;
        if (family == AF_INET) {
            NetworkInfo info;
            char ip_str[INET_ADDRSTRLEN];
            struct sockaddr_in* addr = (struct sockaddr_in*)ifa->ifa_addr;
            inet_ntop(AF_INET, &addr->sin_addr, ip_str, INET_ADDRSTRLEN);
            info.ip = ip_str;

            if (ifa->ifa_netmask != nullptr) {
                struct sockaddr_in* mask = (struct sockaddr_in*)ifa->ifa_netmask;
                inet_ntop(AF_INET, &mask->sin_addr, ip_str, INET_ADDRSTRLEN);
                info.netmask = ip_str;
            }

            entryFor(interfaces, ifa->ifa_name).ipv4.push_back(info);
        }
#ifdef __linux__
        else if (family == AF_PACKET) {
            struct sockaddr_ll* link = (struct sockaddr_ll*)ifa->ifa_addr;
            entryFor(interfaces, ifa->ifa_name).hardware.push_back(
                formatHardwareAddress(link->sll_addr, link->sll_halen));
        }
#else
        else if (family == AF_LINK) {
            struct sockaddr_dl* link = (struct sockaddr_dl*)ifa->ifa_addr;
            entryFor(interfaces, ifa->ifa_name).hardware.push_back(
                formatHardwareAddress((const unsigned char*)LLADDR(link), link->sdl_alen));
        }
#endif
    }

    freeifaddrs(addrs);
    return interfaces;
}

bool NetworkInterfaceInspector::getPrimaryNetwork(NetworkInfo& info) const {
    for (const auto& iface : listInterfaces()) {
        for (const auto& addr : iface.ipv4) {
            if (addr.ip.empty() || addr.ip == kLoopbackAddress) continue;

            info.ip = addr.ip;
            info.netmask = addr.netmask.empty() ? kDefaultNetmask : addr.netmask;
            return true;
        }
    }
    return false;
}

bool NetworkInterfaceInspector::getPrimaryMachine(Device& device) const {
    for (const auto& iface : listInterfaces()) {
        if (isVirtualInterface(iface.name)) continue;

        std::string ip;
        for (const auto& addr : iface.ipv4) {
            if (!addr.ip.empty() && addr.ip != kLoopbackAddress) {
                ip = addr.ip;
                break;
            }
        }

        std::string mac;
        for (const auto& hw : iface.hardware) {
            if (isValidMac(hw)) {
                mac = normalizeMac(hw);
                break;
            }
        }

        if (!ip.empty() && !mac.empty()) {
            device.ip = ip;
            device.mac = mac;
            return true;
        }
    }
    return false;
}

bool NetworkInterfaceInspector::isVirtualInterface(const std::string& name) const {
    for (const auto& prefix : virtual_prefixes) {
        if (name.compare(0, prefix.size(), prefix) == 0) {
            return true;
        }
    }
    return false;
}
