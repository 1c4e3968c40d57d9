#include <gtest/gtest.h>
#include "../discovery/DeviceNames.hpp"

using namespace lan_sweep::discovery;

class DeviceNamesTest : public ::testing::Test {
protected:
    DeviceNames names_;
};

TEST_F(DeviceNamesTest, FriendlySsdpBeatsSerialLikeDns) {
    names_.ssdp = "55inTCLRokuTV";
    names_.dns = "X00012LDU0R2";
    EXPECT_EQ(names_.GetBestName(), std::optional<std::string>("55inTCLRokuTV"));
}

TEST_F(DeviceNamesTest, FallsBackToFirstNonEmptyCandidate) {
    names_.dns = "192-168-1-5";
    EXPECT_EQ(names_.GetBestName(), std::optional<std::string>("192-168-1-5"));
}

TEST_F(DeviceNamesTest, NoCandidatesYieldsNothing) {
    EXPECT_FALSE(names_.GetBestName().has_value());
    names_.httpServer = "lighttpd/1.4";
    EXPECT_FALSE(names_.GetBestName().has_value());
}

TEST_F(DeviceNamesTest, SerialOnlyCandidatesStillProduceAName) {
    names_.mdns = "AABBCCDDEEFF";
    names_.dns = "X1234567890";
    EXPECT_EQ(names_.GetBestName(), std::optional<std::string>("AABBCCDDEEFF"));
}

TEST_F(DeviceNamesTest, PriorityOrder) {
    names_.dns = "router.lan";
    EXPECT_EQ(names_.GetBestName(), names_.dns);

    names_.mdns = "macbook.local";
    EXPECT_EQ(names_.GetBestName(), names_.mdns);

    names_.netbios = "OFFICE-PC";
    EXPECT_EQ(names_.GetBestName(), names_.netbios);

    names_.httpServer = "Lexmark_Web_Server";
    names_.deviceType = "Printer";
    EXPECT_EQ(names_.GetBestName(), std::optional<std::string>("Lexmark Printer"));

    names_.rokuHttp = "Living Room";
    EXPECT_EQ(names_.GetBestName(), names_.rokuHttp);

    names_.ssdp = "Bedroom TV";
    EXPECT_EQ(names_.GetBestName(), names_.ssdp);
}

TEST_F(DeviceNamesTest, WildcardVendorDoesNotFormManufacturerName) {
    names_.httpServer = "***";
    names_.deviceType = "Printer";
    names_.netbios = "PRINTSRV";
    EXPECT_EQ(names_.GetBestName(), names_.netbios);
}

TEST_F(DeviceNamesTest, ShortNamesAreNotFriendly) {
    EXPECT_FALSE(IsUserFriendly("tv"));
    EXPECT_FALSE(IsUserFriendly("ab.local"));
    EXPECT_FALSE(IsUserFriendly("x.lan"));
    EXPECT_TRUE(IsUserFriendly("den.local"));
}

TEST_F(DeviceNamesTest, SerialPatternsAreNotFriendly) {
    EXPECT_FALSE(IsUserFriendly("X00012LDU0R2"));
    EXPECT_FALSE(IsUserFriendly("001122AABBCC"));
    EXPECT_FALSE(IsUserFriendly("0123456789ABCDEF"));
    EXPECT_FALSE(IsUserFriendly("Chromecast-a1b2c3"));
    EXPECT_FALSE(IsUserFriendly("YN00AABBCCDDEE"));
    EXPECT_FALSE(IsUserFriendly("12-34-56"));
    EXPECT_TRUE(IsUserFriendly("Kitchen Speaker"));
    EXPECT_TRUE(IsUserFriendly("Brother HL-L2350DW"));
}

TEST_F(DeviceNamesTest, ManufacturerIsFirstServerToken) {
    EXPECT_EQ(ExtractManufacturer("Apache/2.4.41 (Ubuntu)"), std::optional<std::string>("Apache"));
    EXPECT_EQ(ExtractManufacturer("HP-ChaiSOE/1.0"), std::optional<std::string>("HP"));
    EXPECT_EQ(ExtractManufacturer("Lexmark_Web_Server"), std::optional<std::string>("Lexmark"));
    EXPECT_FALSE(ExtractManufacturer("").has_value());
    EXPECT_FALSE(ExtractManufacturer("X/1.0").has_value());
    EXPECT_FALSE(ExtractManufacturer("**/1.0").has_value());
}

TEST_F(DeviceNamesTest, VendorComesFromHttpServer) {
    EXPECT_FALSE(ExtractVendor(names_).has_value());
    names_.httpServer = "*";
    EXPECT_FALSE(ExtractVendor(names_).has_value());
    names_.httpServer = "nginx/1.18";
    EXPECT_EQ(ExtractVendor(names_), std::optional<std::string>("nginx"));
}

TEST_F(DeviceNamesTest, WildcardTokens) {
    EXPECT_TRUE(IsWildcardToken("*"));
    EXPECT_TRUE(IsWildcardToken("****"));
    EXPECT_FALSE(IsWildcardToken(""));
    EXPECT_FALSE(IsWildcardToken("*a*"));
}

TEST_F(DeviceNamesTest, DebugStringListsEverySource) {
    names_.ssdp = "TV";
    names_.httpServer = "nginx";
    EXPECT_EQ(names_.ToDebugString(),
              "SSDP:TV Roku:null mDNS:null NetBIOS:null DNS:null HTTP:nginx Type:null");
}
