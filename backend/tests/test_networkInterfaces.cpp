#include <gtest/gtest.h>
#include "fakes.hpp"

TEST(NetworkInterfaceInspectorTest, PrimaryNetworkSkipsLoopback) {
    FakeInspector inspector({
        makeInterface("lo", "127.0.0.1", "255.0.0.0", "00:00:00:00:00:00"),
        makeInterface("eth0", "192.168.1.10", "255.255.255.0", "aa:bb:cc:dd:ee:ff")
    });

    NetworkInfo info;
    ASSERT_TRUE(inspector.getPrimaryNetwork(info));
    EXPECT_EQ(info.ip, "192.168.1.10");
    EXPECT_EQ(info.netmask, "255.255.255.0");
}

TEST(NetworkInterfaceInspectorTest, PrimaryNetworkDefaultsNetmask) {
    FakeInspector inspector({makeInterface("wlan0", "10.0.0.5", "", "")});

    NetworkInfo info;
    ASSERT_TRUE(inspector.getPrimaryNetwork(info));
    EXPECT_EQ(info.ip, "10.0.0.5");
    EXPECT_EQ(info.netmask, "255.255.255.0");
}

TEST(NetworkInterfaceInspectorTest, PrimaryNetworkDoesNotFilterVirtualInterfaces) {
    FakeInspector inspector({
        makeInterface("docker0", "172.17.0.1", "255.255.0.0", "02:42:ac:11:00:01"),
        makeInterface("eth0", "192.168.1.10", "255.255.255.0", "aa:bb:cc:dd:ee:ff")
    });

    NetworkInfo info;
    ASSERT_TRUE(inspector.getPrimaryNetwork(info));
    EXPECT_EQ(info.ip, "172.17.0.1");
}

TEST(NetworkInterfaceInspectorTest, NoNetworkWithOnlyLoopback) {
    FakeInspector inspector({makeInterface("lo", "127.0.0.1", "255.0.0.0", "")});

    NetworkInfo info;
    EXPECT_FALSE(inspector.getPrimaryNetwork(info));
}

TEST(NetworkInterfaceInspectorTest, PrimaryMachineSkipsVirtualInterfaces) {
    FakeInspector inspector({
        makeInterface("lo", "127.0.0.1", "255.0.0.0", "00:00:00:00:00:00"),
        makeInterface("docker0", "172.17.0.1", "255.255.0.0", "02:42:ac:11:00:01"),
        makeInterface("br-1234", "172.18.0.1", "255.255.0.0", "02:42:ac:12:00:01"),
        makeInterface("veth99", "", "", "0a:0b:0c:0d:0e:0f"),
        makeInterface("eth0", "192.168.1.10", "255.255.255.0", "aa:bb:cc:dd:ee:ff")
    });

    Device device;
    ASSERT_TRUE(inspector.getPrimaryMachine(device));
    EXPECT_EQ(device.ip, "192.168.1.10");
    EXPECT_EQ(device.mac, "AA:BB:CC:DD:EE:FF");
}

TEST(NetworkInterfaceInspectorTest, PrimaryMachineNeedsBothAddresses) {
    FakeInspector inspector({
        makeInterface("tun0", "10.8.0.2", "255.255.255.0", ""),
        makeInterface("eth1", "", "", "aa:bb:cc:dd:ee:01"),
        makeInterface("wlan0", "192.168.0.20", "255.255.255.0", "aa:bb:cc:dd:ee:02")
    });

    Device device;
    ASSERT_TRUE(inspector.getPrimaryMachine(device));
    EXPECT_EQ(device.ip, "192.168.0.20");
    EXPECT_EQ(device.mac, "AA:BB:CC:DD:EE:02");
}

TEST(NetworkInterfaceInspectorTest, PrimaryMachineRejectsInvalidHardwareAddress) {
    InterfaceAddresses ipip = makeInterface("ipip0", "10.9.0.1", "255.255.255.0", "");
    ipip.hardware.push_back("00:00:00:00");
    FakeInspector inspector({ipip});

    Device device;
    EXPECT_FALSE(inspector.getPrimaryMachine(device));
}

TEST(NetworkInterfaceInspectorTest, CustomPrefixes) {
    NetworkInterfaceInspector inspector({"wl"});

    EXPECT_TRUE(inspector.isVirtualInterface("wlan0"));
    EXPECT_FALSE(inspector.isVirtualInterface("lo"));
    EXPECT_FALSE(inspector.isVirtualInterface("w"));
}

TEST(NetworkInterfaceInspectorTest, DefaultPrefixes) {
    NetworkInterfaceInspector inspector;

    EXPECT_TRUE(inspector.isVirtualInterface("lo"));
    EXPECT_TRUE(inspector.isVirtualInterface("lo0"));
    EXPECT_TRUE(inspector.isVirtualInterface("docker0"));
    EXPECT_TRUE(inspector.isVirtualInterface("br-8f2a"));
    EXPECT_TRUE(inspector.isVirtualInterface("veth12ab"));
    EXPECT_FALSE(inspector.isVirtualInterface("eth0"));
    EXPECT_FALSE(inspector.isVirtualInterface("en0"));
}
