#include "addressRange.hpp"
#include <cstdint>
#include <arpa/inet.h>

std::vector<std::string> hostRange(const std::string& ip, const std::string& netmask,
                                   size_t limit) {
    std::vector<std::string> hosts;

    struct in_addr addr;
    struct in_addr mask_addr;
    if (inet_pton(AF_INET, ip.c_str(), &addr) != 1 ||
        inet_pton(AF_INET, netmask.c_str(), &mask_addr) != 1) {
        return hosts;
    }

    uint32_t mask = ntohl(mask_addr.s_addr);
    uint32_t network = ntohl(addr.s_addr) & mask;
    uint32_t broadcast = network | (~mask & 0xFFFFFFFFu);

    // /31 and /32 have no room between network and broadcast
    if (broadcast - network < 2) {
        return hosts;
    }

    size_t count = broadcast - network - 1;
    if (limit > 0 && limit < count) {
        count = limit;
    }
    hosts.reserve(count);
    char ip_str[INET_ADDRSTRLEN];
    for (uint32_t host = network + 1; host < broadcast && hosts.size() < count; host++) {
        struct in_addr host_addr;
        host_addr.s_addr = htonl(host);
        inet_ntop(AF_INET, &host_addr, ip_str, INET_ADDRSTRLEN);
        hosts.push_back(ip_str);
    }

    return hosts;
}
