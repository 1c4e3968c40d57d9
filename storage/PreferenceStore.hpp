#pragma once

#include "../discovery/LocalNetwork.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <sqlite3.h>

namespace lan_sweep::storage
{
    struct LastScannedNetwork
    {
        std::optional<std::string> ssid;
        std::optional<std::string> gatewayIp;
        int64_t scanTimestamp = 0;
    };

    // Changed when both sides know the gateway and it differs, or both know the SSID and it differs.
    bool CheckNetworkChanged(const lan_sweep::discovery::NetworkIdentity &current,
                             const std::optional<LastScannedNetwork> &last);

    // Key-value settings kept beside the device table in the same database file.
    class PreferenceStore
    {
    private:
        sqlite3 *db_;
        std::mutex db_mutex_;

        std::optional<std::string> GetLocked(const std::string &key);
        bool SetLocked(const std::string &key, const std::optional<std::string> &value);

    public:
        PreferenceStore();
        ~PreferenceStore();

        PreferenceStore(const PreferenceStore &) = delete;
        PreferenceStore &operator=(const PreferenceStore &) = delete;

        bool Initialize(const std::string &db_path);
        void Shutdown();

        std::optional<std::string> Get(const std::string &key);

        // A null value removes the key.
        bool Set(const std::string &key, const std::optional<std::string> &value);

        bool SaveScannedNetwork(const std::optional<std::string> &ssid,
                                const std::optional<std::string> &gateway_ip,
                                int64_t now_ms);
        std::optional<LastScannedNetwork> GetLastScannedNetwork();
        bool ClearLastScannedNetwork();

        bool IsUnlocked();
        bool SetUnlocked(bool unlocked);

        bool HasCompletedFirstRun();
        bool SetFirstRunCompleted();
    };
}
