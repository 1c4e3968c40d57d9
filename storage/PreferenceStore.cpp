#include "PreferenceStore.hpp"
#include <iostream>

namespace lan_sweep::storage
{
    namespace
    {
        const char *KEY_FIRST_RUN_COMPLETED = "first_run_completed";
        const char *KEY_LAST_SSID = "last_scanned_ssid";
        const char *KEY_LAST_GATEWAY = "last_scanned_gateway";
        const char *KEY_LAST_SCAN_TIMESTAMP = "last_scan_timestamp";
        const char *KEY_UNLOCKED = "unlocked";
    }

    bool CheckNetworkChanged(const lan_sweep::discovery::NetworkIdentity &current,
                             const std::optional<LastScannedNetwork> &last)
    {
        if (!last)
            return false;

        bool gateway_changed = current.gatewayIp && last->gatewayIp && *current.gatewayIp != *last->gatewayIp;
        bool ssid_changed = current.ssid && last->ssid && *current.ssid != *last->ssid;
        return gateway_changed || ssid_changed;
    }

    PreferenceStore::PreferenceStore() : db_(nullptr) {}

    PreferenceStore::~PreferenceStore()
    {
        Shutdown();
    }

    bool PreferenceStore::Initialize(const std::string &db_path)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);

        if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK)
        {
            std::cerr << "[PreferenceStore] Open failed: " << sqlite3_errmsg(db_) << std::endl;
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }
        sqlite3_busy_timeout(db_, 2000);

        char *err_msg = nullptr;
        if (sqlite3_exec(db_, "CREATE TABLE IF NOT EXISTS preferences (key TEXT PRIMARY KEY, value TEXT);",
                         nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::cerr << "[PreferenceStore] Schema error: " << (err_msg ? err_msg : "unknown") << std::endl;
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    void PreferenceStore::Shutdown()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    std::optional<std::string> PreferenceStore::GetLocked(const std::string &key)
    {
        if (!db_)
            return std::nullopt;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "SELECT value FROM preferences WHERE key = ?;", -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[PreferenceStore] Read of " << key << " failed: " << sqlite3_errmsg(db_) << std::endl;
            return std::nullopt;
        }

        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        std::optional<std::string> value = std::nullopt;
        if (sqlite3_step(stmt) == SQLITE_ROW)
        {
            const char *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
            if (text)
                value = std::string(text);
        }
        sqlite3_finalize(stmt);
        return value;
    }

    bool PreferenceStore::SetLocked(const std::string &key, const std::optional<std::string> &value)
    {
        if (!db_)
            return false;

        const char *sql = value ? "INSERT OR REPLACE INTO preferences (key, value) VALUES (?, ?);"
                                : "DELETE FROM preferences WHERE key = ?;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[PreferenceStore] Write of " << key << " failed: " << sqlite3_errmsg(db_) << std::endl;
            return false;
        }

        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        if (value)
            sqlite3_bind_text(stmt, 2, value->c_str(), -1, SQLITE_TRANSIENT);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        return success;
    }

    std::optional<std::string> PreferenceStore::Get(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        return GetLocked(key);
    }

    bool PreferenceStore::Set(const std::string &key, const std::optional<std::string> &value)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        return SetLocked(key, value);
    }

    bool PreferenceStore::SaveScannedNetwork(const std::optional<std::string> &ssid,
                                             const std::optional<std::string> &gateway_ip,
                                             int64_t now_ms)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_ || sqlite3_exec(db_, "BEGIN;", nullptr, nullptr, nullptr) != SQLITE_OK)
            return false;

        bool ok = SetLocked(KEY_LAST_SSID, ssid) &&
                  SetLocked(KEY_LAST_GATEWAY, gateway_ip) &&
                  SetLocked(KEY_LAST_SCAN_TIMESTAMP, std::to_string(now_ms));

        if (!ok || sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK)
        {
            std::cerr << "[PreferenceStore] Saving scanned network failed: " << sqlite3_errmsg(db_) << std::endl;
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
            return false;
        }
        return true;
    }

    std::optional<LastScannedNetwork> PreferenceStore::GetLastScannedNetwork()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);

        LastScannedNetwork network;
        network.ssid = GetLocked(KEY_LAST_SSID);
        network.gatewayIp = GetLocked(KEY_LAST_GATEWAY);
        if (!network.ssid && !network.gatewayIp)
            return std::nullopt;

        auto timestamp = GetLocked(KEY_LAST_SCAN_TIMESTAMP);
        if (timestamp)
        {
            try
            {
                network.scanTimestamp = std::stoll(*timestamp);
            }
            catch (const std::exception &)
            {
                std::cerr << "[PreferenceStore] Ignoring malformed scan timestamp '" << *timestamp << "'\n";
            }
        }
        return network;
    }

    bool PreferenceStore::ClearLastScannedNetwork()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        return SetLocked(KEY_LAST_SSID, std::nullopt) &&
               SetLocked(KEY_LAST_GATEWAY, std::nullopt) &&
               SetLocked(KEY_LAST_SCAN_TIMESTAMP, std::nullopt);
    }

    bool PreferenceStore::IsUnlocked()
    {
        return Get(KEY_UNLOCKED).value_or("0") == "1";
    }

    bool PreferenceStore::SetUnlocked(bool unlocked)
    {
        return Set(KEY_UNLOCKED, std::string(unlocked ? "1" : "0"));
    }

    bool PreferenceStore::HasCompletedFirstRun()
    {
        return Get(KEY_FIRST_RUN_COMPLETED).value_or("0") == "1";
    }

    bool PreferenceStore::SetFirstRunCompleted()
    {
        return Set(KEY_FIRST_RUN_COMPLETED, std::string("1"));
    }
}
