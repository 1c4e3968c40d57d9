#include <gtest/gtest.h>
#include "../storage/DeviceStore.hpp"
#include <filesystem>
#include <sqlite3.h>
#include <unistd.h>

using namespace lan_sweep::storage;
using lan_sweep::discovery::DeviceNames;

class DeviceStoreTest : public ::testing::Test {
protected:
    std::string temp_dir;
    std::string db_path;
    DeviceStore store_;

    void SetUp() override {
        char template_path[] = "/tmp/device_store_test_XXXXXX";
        char* created = mkdtemp(template_path);
        ASSERT_NE(created, nullptr);
        temp_dir = created;
        db_path = temp_dir + "/devices.db";
    }

    void TearDown() override {
        store_.Shutdown();
        std::filesystem::remove_all(temp_dir);
    }

    void open_store() {
        ASSERT_TRUE(store_.Initialize(db_path));
    }

    // Helper to run raw SQL against the database file outside the store
    void exec_raw(const std::string& sql) {
        sqlite3* db = nullptr;
        ASSERT_EQ(sqlite3_open(db_path.c_str(), &db), SQLITE_OK);
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
        std::string message = err ? err : "";
        sqlite3_free(err);
        sqlite3_close(db);
        ASSERT_EQ(rc, SQLITE_OK) << message;
    }

    DeviceNames names_with_ssdp(const std::string& ssdp) {
        DeviceNames names;
        names.ssdp = ssdp;
        return names;
    }
};

TEST_F(DeviceStoreTest, UpsertIsIdempotentApartFromLastSeen) {
    open_store();
    auto names = names_with_ssdp("Living Room TV");
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.5", names, std::string("Roku"), 1000));
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.5", names, std::string("Roku"), 2000));

    auto device = store_.GetDevice("10.0.0.5");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->firstSeen, 1000);
    EXPECT_EQ(device->lastSeen, 2000);
    EXPECT_EQ(device->status, DeviceStatus::Online);
    EXPECT_EQ(device->displayName, std::optional<std::string>("Living Room TV"));
    EXPECT_EQ(device->vendor, std::optional<std::string>("Roku"));
    EXPECT_EQ(store_.GetDeviceCount(), 1);
}

TEST_F(DeviceStoreTest, FirstSeenNeverMovesForward) {
    open_store();
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.5", DeviceNames{}, std::nullopt, 5000));
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.5", DeviceNames{}, std::nullopt, 3000));
    EXPECT_EQ(store_.GetDevice("10.0.0.5")->firstSeen, 3000);
}

TEST_F(DeviceStoreTest, NamesAreSticky) {
    open_store();
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.7", names_with_ssdp("Printer1"), std::string("HP"), 1000));

    DeviceNames later;
    later.dns = "printer.lan";
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.7", later, std::string("HP"), 2000));

    auto device = store_.GetDevice("10.0.0.7");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->ssdpName, std::optional<std::string>("Printer1"));
    EXPECT_EQ(device->dnsName, std::optional<std::string>("printer.lan"));
    EXPECT_EQ(device->displayName, std::optional<std::string>("Printer1"));
}

TEST_F(DeviceStoreTest, BlankNamesDoNotOverwrite) {
    open_store();
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.7", names_with_ssdp("Printer1"), std::nullopt, 1000));
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.7", names_with_ssdp("   "), std::nullopt, 2000));
    EXPECT_EQ(store_.GetDevice("10.0.0.7")->ssdpName, std::optional<std::string>("Printer1"));
}

TEST_F(DeviceStoreTest, VendorKeptWhenNewScanHasNone) {
    open_store();
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.7", DeviceNames{}, std::string("HP"), 1000));
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.7", DeviceNames{}, std::nullopt, 2000));
    auto device = store_.GetDevice("10.0.0.7");
    EXPECT_EQ(device->vendor, std::optional<std::string>("HP"));
    EXPECT_EQ(device->firstSeen, 1000);
}

TEST_F(DeviceStoreTest, VendorMismatchResetsDevice) {
    open_store();
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.5", names_with_ssdp("Old Printer"), std::string("HP"), 1000));
    ASSERT_TRUE(store_.SetCustomName("10.0.0.5", std::string("Front desk")));

    DeviceNames replacement;
    replacement.dns = "canon.lan";
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.5", replacement, std::string("Canon"), 5000));

    auto device = store_.GetDevice("10.0.0.5");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->firstSeen, 5000);
    EXPECT_EQ(device->lastSeen, 5000);
    EXPECT_EQ(device->vendor, std::optional<std::string>("Canon"));
    EXPECT_FALSE(device->ssdpName.has_value());
    EXPECT_FALSE(device->customName.has_value());
    EXPECT_EQ(device->displayName, std::optional<std::string>("canon.lan"));
}

TEST_F(DeviceStoreTest, CustomNameOverridesDiscoveredNames) {
    open_store();
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.9", names_with_ssdp("Samsung TV"), std::nullopt, 1000));
    ASSERT_TRUE(store_.SetCustomName("10.0.0.9", std::string("Den TV")));
    EXPECT_EQ(store_.GetDevice("10.0.0.9")->displayName, std::optional<std::string>("Den TV"));

    ASSERT_TRUE(store_.UpsertDevice("10.0.0.9", names_with_ssdp("Samsung Q60"), std::nullopt, 2000));
    auto device = store_.GetDevice("10.0.0.9");
    EXPECT_EQ(device->customName, std::optional<std::string>("Den TV"));
    EXPECT_EQ(device->displayName, std::optional<std::string>("Den TV"));
    EXPECT_EQ(device->ssdpName, std::optional<std::string>("Samsung Q60"));
}

TEST_F(DeviceStoreTest, ClearingCustomNameRestoresBestName) {
    open_store();
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.9", names_with_ssdp("Samsung TV"), std::nullopt, 1000));
    ASSERT_TRUE(store_.SetCustomName("10.0.0.9", std::string("Den TV")));
    ASSERT_TRUE(store_.SetCustomName("10.0.0.9", std::string("  ")));

    auto device = store_.GetDevice("10.0.0.9");
    EXPECT_FALSE(device->customName.has_value());
    EXPECT_EQ(device->displayName, std::optional<std::string>("Samsung TV"));
}

TEST_F(DeviceStoreTest, RenamingUnknownDeviceFails) {
    open_store();
    EXPECT_FALSE(store_.SetCustomName("10.0.0.99", std::string("Ghost")));
}

TEST_F(DeviceStoreTest, DeviceWithoutNamesHasNoDisplayName) {
    open_store();
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.3", DeviceNames{}, std::nullopt, 1000));
    EXPECT_FALSE(store_.GetDevice("10.0.0.3")->displayName.has_value());
}

TEST_F(DeviceStoreTest, OfflineSweepUsesScanStart) {
    open_store();
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.1", DeviceNames{}, std::nullopt, 1000));
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.2", DeviceNames{}, std::nullopt, 1000));
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.2", DeviceNames{}, std::nullopt, 3000));

    EXPECT_EQ(store_.MarkOfflineSince(2000), 1);
    EXPECT_EQ(store_.GetDevice("10.0.0.1")->status, DeviceStatus::Offline);
    EXPECT_EQ(store_.GetDevice("10.0.0.2")->status, DeviceStatus::Online);

    // Already offline rows are not counted again
    EXPECT_EQ(store_.MarkOfflineSince(2000), 0);

    ASSERT_TRUE(store_.UpsertDevice("10.0.0.1", DeviceNames{}, std::nullopt, 4000));
    EXPECT_EQ(store_.GetDevice("10.0.0.1")->status, DeviceStatus::Online);
}

TEST_F(DeviceStoreTest, ListingOrderAndDeletion) {
    open_store();
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.1", DeviceNames{}, std::nullopt, 1000));
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.2", DeviceNames{}, std::nullopt, 3000));
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.3", DeviceNames{}, std::nullopt, 2000));

    auto devices = store_.GetAllDevices();
    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].ip, "10.0.0.2");
    EXPECT_EQ(devices[1].ip, "10.0.0.3");
    EXPECT_EQ(devices[2].ip, "10.0.0.1");

    EXPECT_TRUE(store_.DeleteDevice("10.0.0.3"));
    EXPECT_FALSE(store_.DeleteDevice("10.0.0.3"));
    EXPECT_EQ(store_.GetDeviceCount(), 2);

    EXPECT_TRUE(store_.ClearAllDevices());
    EXPECT_EQ(store_.GetDeviceCount(), 0);
}

TEST_F(DeviceStoreTest, DataSurvivesReopen) {
    open_store();
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.5", names_with_ssdp("Office NAS"), std::string("Synology"), 1000));
    store_.Shutdown();

    DeviceStore reopened;
    ASSERT_TRUE(reopened.Initialize(db_path));
    auto device = reopened.GetDevice("10.0.0.5");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->ssdpName, std::optional<std::string>("Office NAS"));
}

TEST_F(DeviceStoreTest, MigratesVersionOneSchema) {
    exec_raw("CREATE TABLE devices (ip TEXT PRIMARY KEY, display_name TEXT, ssdp_name TEXT, mdns_name TEXT, "
             "netbios_name TEXT, dns_name TEXT, vendor TEXT, first_seen INTEGER NOT NULL, "
             "last_seen INTEGER NOT NULL, status TEXT NOT NULL);"
             "INSERT INTO devices VALUES ('10.0.0.8', 'Old Laptop', NULL, NULL, 'OLDLAPTOP', NULL, NULL, "
             "100, 200, 'offline');"
             "PRAGMA user_version = 1;");

    open_store();
    auto device = store_.GetDevice("10.0.0.8");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->displayName, std::optional<std::string>("Old Laptop"));
    EXPECT_EQ(device->netbiosName, std::optional<std::string>("OLDLAPTOP"));
    EXPECT_FALSE(device->customName.has_value());
    EXPECT_EQ(device->status, DeviceStatus::Offline);
    EXPECT_EQ(device->firstSeen, 100);

    EXPECT_TRUE(store_.SetCustomName("10.0.0.8", std::string("Spare Laptop")));
}

TEST_F(DeviceStoreTest, OperationsBeforeInitializeFail) {
    EXPECT_FALSE(store_.UpsertDevice("10.0.0.1", DeviceNames{}, std::nullopt, 1));
    EXPECT_EQ(store_.MarkOfflineSince(1), 0);
    EXPECT_TRUE(store_.GetAllDevices().empty());
    EXPECT_FALSE(store_.GetDevice("10.0.0.1").has_value());
}

TEST_F(DeviceStoreTest, StatusText) {
    EXPECT_EQ(ToString(DeviceStatus::Online), "online");
    EXPECT_EQ(ParseDeviceStatus("offline"), std::optional<DeviceStatus>(DeviceStatus::Offline));
    EXPECT_FALSE(ParseDeviceStatus("sleeping").has_value());
}

TEST_F(DeviceStoreTest, LockedDatabaseLeavesCustomNameIntact) {
    open_store();
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.5", names_with_ssdp("Roku Ultra"), std::string("Roku"), 1000));
    ASSERT_TRUE(store_.SetCustomName("10.0.0.5", std::string("Den TV")));

    sqlite3* writer = nullptr;
    ASSERT_EQ(sqlite3_open(db_path.c_str(), &writer), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(writer, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr), SQLITE_OK);

    EXPECT_FALSE(store_.UpsertDevice("10.0.0.5", names_with_ssdp("Other"), std::string("Roku"), 5000));

    ASSERT_EQ(sqlite3_exec(writer, "ROLLBACK;", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(writer);

    auto device = store_.GetDevice("10.0.0.5");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->customName, std::optional<std::string>("Den TV"));
    EXPECT_EQ(device->firstSeen, 1000);
    EXPECT_EQ(device->lastSeen, 1000);

    ASSERT_TRUE(store_.UpsertDevice("10.0.0.5", names_with_ssdp("Other"), std::string("Roku"), 6000));
    device = store_.GetDevice("10.0.0.5");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->customName, std::optional<std::string>("Den TV"));
    EXPECT_EQ(device->displayName, std::optional<std::string>("Den TV"));
    EXPECT_EQ(device->firstSeen, 1000);
}
