#include <gtest/gtest.h>
#include "../app/AppConfig.hpp"

using namespace lan_sweep::app;

class AppConfigTest : public ::testing::Test {
};

TEST_F(AppConfigTest, NoArgumentsMeansDefaultScan) {
    auto config = ParseArguments({});
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->command, Command::Scan);
    EXPECT_EQ(config->dbPath, "lansweep.db");
    EXPECT_EQ(config->concurrency, 80);
    EXPECT_EQ(config->timeoutMs, 500);
    EXPECT_EQ(config->cutoffDays, 7);
    EXPECT_TRUE(config->passive);
    EXPECT_EQ(config->listenSeconds, 10);
    EXPECT_FALSE(config->ssid.has_value());
}

TEST_F(AppConfigTest, ScanWithOptions) {
    auto config = ParseArguments({"scan", "10.0.0.0/24", "--concurrency", "16", "--timeout", "250",
                                  "--db", "/tmp/x.db", "--no-passive", "--ssid", "Home"});
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->arguments, std::vector<std::string>{"10.0.0.0/24"});
    EXPECT_EQ(config->concurrency, 16);
    EXPECT_EQ(config->timeoutMs, 250);
    EXPECT_EQ(config->dbPath, "/tmp/x.db");
    EXPECT_FALSE(config->passive);
    EXPECT_EQ(config->ssid, std::optional<std::string>("Home"));
}

TEST_F(AppConfigTest, ListAllRemovesCutoff) {
    auto config = ParseArguments({"list", "--all"});
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->command, Command::List);
    EXPECT_EQ(config->cutoffDays, ALL_HISTORY_DAYS);
}

TEST_F(AppConfigTest, RenameTakesOptionalName) {
    auto rename = ParseArguments({"rename", "10.0.0.5", "Office Printer"});
    ASSERT_TRUE(rename.has_value());
    EXPECT_EQ(rename->arguments.size(), 2u);

    auto clear_name = ParseArguments({"rename", "10.0.0.5"});
    ASSERT_TRUE(clear_name.has_value());
    EXPECT_EQ(clear_name->arguments.size(), 1u);

    EXPECT_FALSE(ParseArguments({"rename"}).has_value());
}

TEST_F(AppConfigTest, InvalidNumbersAreRejected) {
    EXPECT_FALSE(ParseArguments({"scan", "--concurrency", "abc"}).has_value());
    EXPECT_FALSE(ParseArguments({"scan", "--timeout", "0"}).has_value());
    EXPECT_FALSE(ParseArguments({"scan", "--timeout", "-5"}).has_value());
    EXPECT_FALSE(ParseArguments({"scan", "--timeout", "12ms"}).has_value());
    EXPECT_FALSE(ParseArguments({"listen", "--listen-seconds"}).has_value());
}

TEST_F(AppConfigTest, UnknownInputIsRejected) {
    EXPECT_FALSE(ParseArguments({"explode"}).has_value());
    EXPECT_FALSE(ParseArguments({"scan", "--verbose", "1"}).has_value());
    EXPECT_FALSE(ParseArguments({"forget"}).has_value());
    EXPECT_FALSE(ParseArguments({"clear", "extra"}).has_value());
    EXPECT_FALSE(ParseArguments({"scan", "10.0.0.0/24", "10.0.1.0/24"}).has_value());
}

TEST_F(AppConfigTest, UsageListsCommands) {
    auto usage = Usage("lansweep");
    EXPECT_NE(usage.find("Usage: lansweep"), std::string::npos);
    for (const char* command : {"scan", "list", "rename", "forget", "clear", "listen"})
        EXPECT_NE(usage.find(command), std::string::npos) << command;
}

TEST_F(AppConfigTest, PingTakesOneAddress) {
    auto config = ParseArguments({"ping", "192.168.1.20", "--timeout", "1000"});
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->command, Command::Ping);
    EXPECT_EQ(config->arguments, std::vector<std::string>{"192.168.1.20"});
    EXPECT_EQ(config->timeoutMs, 1000);

    EXPECT_FALSE(ParseArguments({"ping"}).has_value());
    EXPECT_FALSE(ParseArguments({"ping", "10.0.0.1", "10.0.0.2"}).has_value());
    EXPECT_FALSE(ParseArguments({"ping", "printer.lan"}).has_value());
    EXPECT_FALSE(ParseArguments({"ping", "10.0.0.0/24"}).has_value());
}

TEST_F(AppConfigTest, PortsDefaultsAndOptions) {
    auto config = ParseArguments({"ports", "10.0.0.7"});
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->command, Command::Ports);
    EXPECT_FALSE(config->all);
    EXPECT_TRUE(config->extraPorts.empty());
    EXPECT_EQ(config->portTimeoutMs, 3000);

    config = ParseArguments({"ports", "10.0.0.7", "--all", "--port", "8443", "--port", "1883", "--port-timeout", "750"});
    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->all);
    EXPECT_EQ(config->extraPorts, (std::vector<uint16_t>{8443, 1883}));
    EXPECT_EQ(config->portTimeoutMs, 750);
}

TEST_F(AppConfigTest, PortsRejectsBadInput) {
    EXPECT_FALSE(ParseArguments({"ports"}).has_value());
    EXPECT_FALSE(ParseArguments({"ports", "10.0.0.300"}).has_value());
    EXPECT_FALSE(ParseArguments({"ports", "10.0.0.7", "--port", "65536"}).has_value());
    EXPECT_FALSE(ParseArguments({"ports", "10.0.0.7", "--port", "0"}).has_value());
    EXPECT_FALSE(ParseArguments({"ports", "10.0.0.7", "--port"}).has_value());
    EXPECT_FALSE(ParseArguments({"ports", "10.0.0.7", "--port-timeout", "-5"}).has_value());
}

TEST_F(AppConfigTest, UsageListsToolCommands) {
    auto usage = Usage("lansweep");
    EXPECT_NE(usage.find("ping <ip>"), std::string::npos);
    EXPECT_NE(usage.find("ports <ip>"), std::string::npos);
    EXPECT_NE(usage.find("--port <n>"), std::string::npos);
}
