#include <gtest/gtest.h>
#include "protocol.hpp"

TEST(MacValidationTest, AcceptsColonSeparatedHex) {
    EXPECT_TRUE(isValidMac("aa:bb:cc:dd:ee:ff"));
    EXPECT_TRUE(isValidMac("AA:BB:CC:DD:EE:FF"));
    EXPECT_TRUE(isValidMac("00:1a:2B:3c:4D:5e"));
    EXPECT_TRUE(isValidMac("00:00:00:00:00:00"));
}

TEST(MacValidationTest, RejectsIncompleteMarkers) {
    EXPECT_FALSE(isValidMac("(incomplete)"));
    EXPECT_FALSE(isValidMac("<incomplete>"));
}

TEST(MacValidationTest, RejectsWrongShape) {
    EXPECT_FALSE(isValidMac(""));
    EXPECT_FALSE(isValidMac("aa:bb:cc:dd:ee"));
    EXPECT_FALSE(isValidMac("aa:bb:cc:dd:ee:ff:00"));
    EXPECT_FALSE(isValidMac("a:bb:cc:dd:ee:ff"));
    EXPECT_FALSE(isValidMac("aaa:bb:cc:dd:ee:ff"));
    EXPECT_FALSE(isValidMac("aa-bb-cc-dd-ee-ff"));
    EXPECT_FALSE(isValidMac("aa:bb:cc:dd:ee:fg"));
    EXPECT_FALSE(isValidMac("aa:bb:cc:dd:ee:ff:"));
    EXPECT_FALSE(isValidMac(":aa:bb:cc:dd:ee"));
    EXPECT_FALSE(isValidMac("aa:bb:cc:dd:ee: f"));
}

TEST(MacValidationTest, NormalizeUppercases) {
    EXPECT_EQ(normalizeMac("aa:bb:cc:0d:ee:ff"), "AA:BB:CC:0D:EE:FF");
    EXPECT_EQ(normalizeMac("AA:BB:CC:DD:EE:FF"), "AA:BB:CC:DD:EE:FF");
}

TEST(ScanResponseTest, EmptyListHasZeroCount) {
    nlohmann::ordered_json response = makeScanResponse(ScanResult());

    EXPECT_EQ(response.dump(), R"({"status":"success","count":0,"devices":[]})");
}

TEST(ScanResponseTest, DevicesKeepDiscoveryOrder) {
    ScanResult devices = {
        {"192.168.1.20", "AA:BB:CC:DD:EE:02"},
        {"192.168.1.1", "AA:BB:CC:DD:EE:01"}
    };

    nlohmann::ordered_json response = makeScanResponse(devices);

    EXPECT_EQ(response["status"], "success");
    EXPECT_EQ(response["count"], 2);
    ASSERT_EQ(response["devices"].size(), 2u);
    EXPECT_EQ(response["devices"][0]["ip"], "192.168.1.20");
    EXPECT_EQ(response["devices"][0]["mac"], "AA:BB:CC:DD:EE:02");
    EXPECT_EQ(response["devices"][1]["ip"], "192.168.1.1");
}
