#include <gtest/gtest.h>
#include <arpa/inet.h>
#include "addressRange.hpp"

namespace {

uint32_t toInt(const std::string& ip) {
    struct in_addr addr;
    inet_pton(AF_INET, ip.c_str(), &addr);
    return ntohl(addr.s_addr);
}

} // namespace

TEST(AddressRangeTest, SlashTwentyFourExcludesNetworkAndBroadcast) {
    std::vector<std::string> hosts = hostRange("192.168.1.42", "255.255.255.0");

    ASSERT_EQ(hosts.size(), 254u);
    EXPECT_EQ(hosts.front(), "192.168.1.1");
    EXPECT_EQ(hosts.back(), "192.168.1.254");
}

TEST(AddressRangeTest, AddressesAreStrictlyAscending) {
    std::vector<std::string> hosts = hostRange("10.0.3.7", "255.255.252.0");

    ASSERT_EQ(hosts.size(), 1022u);
    EXPECT_EQ(hosts.front(), "10.0.0.1");
    EXPECT_EQ(hosts.back(), "10.0.3.254");
    for (size_t i = 1; i < hosts.size(); i++) {
        EXPECT_LT(toInt(hosts[i - 1]), toInt(hosts[i]));
    }
}

TEST(AddressRangeTest, SlashThirtyHasTwoHosts) {
    std::vector<std::string> hosts = hostRange("172.16.0.6", "255.255.255.252");

    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts[0], "172.16.0.5");
    EXPECT_EQ(hosts[1], "172.16.0.6");
}

TEST(AddressRangeTest, PointToPointMasksHaveNoHosts) {
    EXPECT_TRUE(hostRange("172.16.0.6", "255.255.255.254").empty());
    EXPECT_TRUE(hostRange("172.16.0.6", "255.255.255.255").empty());
}

TEST(AddressRangeTest, LimitKeepsLowestAddresses) {
    std::vector<std::string> hosts = hostRange("10.1.2.3", "255.255.0.0", 254);

    ASSERT_EQ(hosts.size(), 254u);
    EXPECT_EQ(hosts.front(), "10.1.0.1");
    EXPECT_EQ(hosts.back(), "10.1.0.254");
}

TEST(AddressRangeTest, InvalidInputGivesEmptyRange) {
    EXPECT_TRUE(hostRange("not-an-ip", "255.255.255.0").empty());
    EXPECT_TRUE(hostRange("192.168.1.1", "").empty());
    EXPECT_TRUE(hostRange("192.168.1.300", "255.255.255.0").empty());
}
