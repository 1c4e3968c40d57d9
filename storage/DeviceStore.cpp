#include "DeviceStore.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace lan_sweep::storage
{
    using lan_sweep::discovery::DeviceNames;

    namespace
    {
        const char *SELECT_COLUMNS =
            "SELECT ip, display_name, custom_name, ssdp_name, mdns_name, netbios_name, dns_name, "
            "vendor, first_seen, last_seen, status FROM devices";

        bool IsBlank(const std::string &text)
        {
            return std::all_of(text.begin(), text.end(), [](unsigned char c)
                               { return std::isspace(c); });
        }

        std::optional<std::string> NonBlank(const std::optional<std::string> &value)
        {
            if (!value || IsBlank(*value))
                return std::nullopt;
            return value;
        }

        std::optional<std::string> ColumnText(sqlite3_stmt *stmt, int column)
        {
            const char *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
            if (!text)
                return std::nullopt;
            return std::string(text);
        }

        void BindOptional(sqlite3_stmt *stmt, int index, const std::optional<std::string> &value)
        {
            if (value)
                sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
            else
                sqlite3_bind_null(stmt, index);
        }

        StoredDevice ReadDevice(sqlite3_stmt *stmt)
        {
            StoredDevice device;
            device.ip = ColumnText(stmt, 0).value_or("");
            device.displayName = ColumnText(stmt, 1);
            device.customName = ColumnText(stmt, 2);
            device.ssdpName = ColumnText(stmt, 3);
            device.mdnsName = ColumnText(stmt, 4);
            device.netbiosName = ColumnText(stmt, 5);
            device.dnsName = ColumnText(stmt, 6);
            device.vendor = ColumnText(stmt, 7);
            device.firstSeen = sqlite3_column_int64(stmt, 8);
            device.lastSeen = sqlite3_column_int64(stmt, 9);
            device.status = ParseDeviceStatus(ColumnText(stmt, 10).value_or("")).value_or(DeviceStatus::Offline);
            return device;
        }

        DeviceNames StoredNames(const StoredDevice &device)
        {
            DeviceNames names;
            names.ssdp = device.ssdpName;
            names.mdns = device.mdnsName;
            names.netbios = device.netbiosName;
            names.dns = device.dnsName;
            return names;
        }
    }

    std::string ToString(DeviceStatus status)
    {
        switch (status)
        {
        case DeviceStatus::Online:
            return "online";
        case DeviceStatus::Offline:
            return "offline";
        }
        return "offline";
    }

    std::optional<DeviceStatus> ParseDeviceStatus(const std::string &text)
    {
        if (text == "online")
            return DeviceStatus::Online;
        if (text == "offline")
            return DeviceStatus::Offline;
        return std::nullopt;
    }

    DeviceStore::DeviceStore() : db_(nullptr) {}

    DeviceStore::~DeviceStore()
    {
        Shutdown();
    }

    bool DeviceStore::Initialize(const std::string &db_path)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);

        if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK)
        {
            std::cerr << "[DeviceStore] Open failed: " << sqlite3_errmsg(db_) << std::endl;
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }

        sqlite3_busy_timeout(db_, 2000);
        if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr) != SQLITE_OK)
            std::cerr << "[DeviceStore] WAL unavailable: " << sqlite3_errmsg(db_) << std::endl;

        const char *sql_tables =
            "CREATE TABLE IF NOT EXISTS devices ("
            "ip TEXT PRIMARY KEY, "
            "display_name TEXT, "
            "custom_name TEXT, "
            "ssdp_name TEXT, "
            "mdns_name TEXT, "
            "netbios_name TEXT, "
            "dns_name TEXT, "
            "vendor TEXT, "
            "first_seen INTEGER NOT NULL, "
            "last_seen INTEGER NOT NULL, "
            "status TEXT NOT NULL"
            ");";

        char *err_msg = nullptr;
        if (sqlite3_exec(db_, sql_tables, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::cerr << "[DeviceStore] Schema error: " << (err_msg ? err_msg : "unknown") << std::endl;
            sqlite3_free(err_msg);
            return false;
        }

        return MigrateLocked();
    }

    void DeviceStore::Shutdown()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    int DeviceStore::ReadUserVersionLocked()
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &stmt, nullptr) != SQLITE_OK)
            return -1;

        int version = -1;
        if (sqlite3_step(stmt) == SQLITE_ROW)
            version = sqlite3_column_int(stmt, 0);
        sqlite3_finalize(stmt);
        return version;
    }

    bool DeviceStore::HasColumnLocked(const std::string &table, const std::string &column)
    {
        const std::string sql = "PRAGMA table_info(" + table + ");";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
            return false;

        bool found = false;
        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            if (ColumnText(stmt, 1).value_or("") == column)
            {
                found = true;
                break;
            }
        }
        sqlite3_finalize(stmt);
        return found;
    }

    bool DeviceStore::MigrateLocked()
    {
        int version = ReadUserVersionLocked();
        if (version < 0)
        {
            std::cerr << "[DeviceStore] Cannot read schema version: " << sqlite3_errmsg(db_) << std::endl;
            return false;
        }

        // Version 1 databases predate user-assigned names.
        if (!HasColumnLocked("devices", "custom_name"))
        {
            char *err_msg = nullptr;
            if (sqlite3_exec(db_, "ALTER TABLE devices ADD COLUMN custom_name TEXT;", nullptr, nullptr, &err_msg) != SQLITE_OK)
            {
                std::cerr << "[DeviceStore] Migration failed: " << (err_msg ? err_msg : "unknown") << std::endl;
                sqlite3_free(err_msg);
                return false;
            }
            std::cout << "[DeviceStore] Added custom_name column (schema v" << version << " -> v" << SCHEMA_VERSION << ")\n";
        }

        if (version != SCHEMA_VERSION)
        {
            const std::string pragma = "PRAGMA user_version = " + std::to_string(SCHEMA_VERSION) + ";";
            if (sqlite3_exec(db_, pragma.c_str(), nullptr, nullptr, nullptr) != SQLITE_OK)
            {
                std::cerr << "[DeviceStore] Cannot record schema version: " << sqlite3_errmsg(db_) << std::endl;
                return false;
            }
        }
        return true;
    }

    bool DeviceStore::LookupDeviceLocked(const std::string &ip, std::optional<StoredDevice> &device)
    {
        device = std::nullopt;
        if (!db_)
            return false;

        const std::string sql = std::string(SELECT_COLUMNS) + " WHERE ip = ?;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[DeviceStore] Lookup of " << ip << " failed: " << sqlite3_errmsg(db_) << std::endl;
            return false;
        }

        sqlite3_bind_text(stmt, 1, ip.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW)
            device = ReadDevice(stmt);
        else if (rc != SQLITE_DONE)
            std::cerr << "[DeviceStore] Lookup of " << ip << " failed: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_finalize(stmt);
        return rc == SQLITE_ROW || rc == SQLITE_DONE;
    }

    std::optional<StoredDevice> DeviceStore::GetDeviceLocked(const std::string &ip)
    {
        std::optional<StoredDevice> device;
        if (!LookupDeviceLocked(ip, device))
            return std::nullopt;
        return device;
    }

    bool DeviceStore::ExecLocked(const char *sql)
    {
        char *err_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::cerr << "[DeviceStore] " << sql << " failed: " << (err_msg ? err_msg : "unknown") << std::endl;
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    bool DeviceStore::UpsertDevice(const std::string &ip,
                                   const DeviceNames &names,
                                   const std::optional<std::string> &vendor,
                                   int64_t now_ms)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            return false;

        // The write lock is taken before the lookup so the merge never works from a stale row.
        if (!ExecLocked("BEGIN IMMEDIATE;"))
            return false;

        bool success = UpsertLocked(ip, names, vendor, now_ms);
        if (!ExecLocked(success ? "COMMIT;" : "ROLLBACK;"))
        {
            if (success)
                ExecLocked("ROLLBACK;");
            return false;
        }
        return success;
    }

    bool DeviceStore::UpsertLocked(const std::string &ip,
                                   const DeviceNames &names,
                                   const std::optional<std::string> &vendor,
                                   int64_t now_ms)
    {
        std::optional<StoredDevice> existing;
        if (!LookupDeviceLocked(ip, existing))
            return false;
        const auto new_vendor = NonBlank(vendor);

        bool reset = false;
        if (existing && existing->vendor && new_vendor && *existing->vendor != *new_vendor)
        {
            std::cout << "[DeviceStore] Vendor mismatch at " << ip << " (was '" << *existing->vendor
                      << "', now '" << *new_vendor << "'), treating as a new device\n";
            reset = true;
        }

        DeviceNames merged = names;
        merged.ssdp = NonBlank(names.ssdp);
        merged.mdns = NonBlank(names.mdns);
        merged.netbios = NonBlank(names.netbios);
        merged.dns = NonBlank(names.dns);

        int64_t first_seen = now_ms;
        std::optional<std::string> custom_name;
        std::optional<std::string> stored_vendor = new_vendor;

        if (existing && !reset)
        {
            first_seen = std::min(existing->firstSeen, now_ms);
            custom_name = existing->customName;
            if (!merged.ssdp)
                merged.ssdp = existing->ssdpName;
            if (!merged.mdns)
                merged.mdns = existing->mdnsName;
            if (!merged.netbios)
                merged.netbios = existing->netbiosName;
            if (!merged.dns)
                merged.dns = existing->dnsName;
            if (!stored_vendor)
                stored_vendor = existing->vendor;
        }

        std::optional<std::string> display_name = custom_name ? custom_name : merged.GetBestName();

        const char *sql =
            "INSERT OR REPLACE INTO devices (ip, display_name, custom_name, ssdp_name, mdns_name, "
            "netbios_name, dns_name, vendor, first_seen, last_seen, status) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[DeviceStore] Upsert of " << ip << " failed: " << sqlite3_errmsg(db_) << std::endl;
            return false;
        }

        const std::string status = ToString(DeviceStatus::Online);
        sqlite3_bind_text(stmt, 1, ip.c_str(), -1, SQLITE_TRANSIENT);
        BindOptional(stmt, 2, display_name);
        BindOptional(stmt, 3, custom_name);
        BindOptional(stmt, 4, merged.ssdp);
        BindOptional(stmt, 5, merged.mdns);
        BindOptional(stmt, 6, merged.netbios);
        BindOptional(stmt, 7, merged.dns);
        BindOptional(stmt, 8, stored_vendor);
        sqlite3_bind_int64(stmt, 9, first_seen);
        sqlite3_bind_int64(stmt, 10, now_ms);
        sqlite3_bind_text(stmt, 11, status.c_str(), -1, SQLITE_TRANSIENT);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        if (!success)
            std::cerr << "[DeviceStore] Upsert of " << ip << " failed: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_finalize(stmt);
        return success;
    }

    int DeviceStore::MarkOfflineSince(int64_t scan_start_ms)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            return 0;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "UPDATE devices SET status = ?1 WHERE last_seen < ?2 AND status != ?1;", -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[DeviceStore] Offline sweep failed: " << sqlite3_errmsg(db_) << std::endl;
            return 0;
        }

        const std::string status = ToString(DeviceStatus::Offline);
        sqlite3_bind_text(stmt, 1, status.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, scan_start_ms);

        int changed = 0;
        if (sqlite3_step(stmt) == SQLITE_DONE)
            changed = sqlite3_changes(db_);
        else
            std::cerr << "[DeviceStore] Offline sweep failed: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_finalize(stmt);
        return changed;
    }

    bool DeviceStore::SetCustomName(const std::string &ip, const std::optional<std::string> &custom_name)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        auto device = GetDeviceLocked(ip);
        if (!device)
            return false;

        const auto name = NonBlank(custom_name);
        const auto display_name = name ? name : StoredNames(*device).GetBestName();

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "UPDATE devices SET custom_name = ?, display_name = ? WHERE ip = ?;", -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[DeviceStore] Rename of " << ip << " failed: " << sqlite3_errmsg(db_) << std::endl;
            return false;
        }

        BindOptional(stmt, 1, name);
        BindOptional(stmt, 2, display_name);
        sqlite3_bind_text(stmt, 3, ip.c_str(), -1, SQLITE_TRANSIENT);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE) && sqlite3_changes(db_) > 0;
        sqlite3_finalize(stmt);
        return success;
    }

    std::optional<StoredDevice> DeviceStore::GetDevice(const std::string &ip)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        return GetDeviceLocked(ip);
    }

    std::vector<StoredDevice> DeviceStore::GetAllDevices()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<StoredDevice> devices;
        if (!db_)
            return devices;

        const std::string sql = std::string(SELECT_COLUMNS) + " ORDER BY last_seen DESC;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[DeviceStore] Listing devices failed: " << sqlite3_errmsg(db_) << std::endl;
            return devices;
        }

        while (sqlite3_step(stmt) == SQLITE_ROW)
            devices.push_back(ReadDevice(stmt));
        sqlite3_finalize(stmt);
        return devices;
    }

    bool DeviceStore::DeleteDevice(const std::string &ip)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            return false;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "DELETE FROM devices WHERE ip = ?;", -1, &stmt, nullptr) != SQLITE_OK)
            return false;

        sqlite3_bind_text(stmt, 1, ip.c_str(), -1, SQLITE_TRANSIENT);
        bool success = (sqlite3_step(stmt) == SQLITE_DONE) && sqlite3_changes(db_) > 0;
        sqlite3_finalize(stmt);
        return success;
    }

    bool DeviceStore::ClearAllDevices()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            return false;

        char *err_msg = nullptr;
        if (sqlite3_exec(db_, "DELETE FROM devices;", nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::cerr << "[DeviceStore] Clear failed: " << (err_msg ? err_msg : "unknown") << std::endl;
            sqlite3_free(err_msg);
            return false;
        }
        std::cout << "[DeviceStore] All devices cleared\n";
        return true;
    }

    int DeviceStore::GetDeviceCount()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            return 0;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM devices;", -1, &stmt, nullptr) != SQLITE_OK)
            return 0;

        int count = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW)
            count = sqlite3_column_int(stmt, 0);
        sqlite3_finalize(stmt);
        return count;
    }
}
