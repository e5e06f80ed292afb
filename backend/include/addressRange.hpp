#pragma once

#include <cstddef>
#include <string>
#include <vector>

/**
 * Calculate all usable host addresses of the subnet containing ip
 * The network and broadcast addresses are excluded
 * @param ip: Any address of the subnet, dotted decimal
 * @param netmask: Subnet mask, dotted decimal
 * @param limit: Stop after this many addresses (0: no limit)
 * @return: Addresses in ascending order, empty if either argument is not an IPv4 address
 */
std::vector<std::string> hostRange(const std::string& ip, const std::string& netmask,
                                   size_t limit = 0);
