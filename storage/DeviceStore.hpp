#pragma once

#include "../discovery/DeviceRepository.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace lan_sweep::storage
{
    enum class DeviceStatus
    {
        Online,
        Offline
    };

    std::string ToString(DeviceStatus status);
    std::optional<DeviceStatus> ParseDeviceStatus(const std::string &text);

    struct StoredDevice
    {
        std::string ip;
        std::optional<std::string> displayName;
        std::optional<std::string> customName;
        std::optional<std::string> ssdpName;
        std::optional<std::string> mdnsName;
        std::optional<std::string> netbiosName;
        std::optional<std::string> dnsName;
        std::optional<std::string> vendor;
        int64_t firstSeen = 0;
        int64_t lastSeen = 0;
        DeviceStatus status = DeviceStatus::Online;
    };

    class DeviceStore : public lan_sweep::discovery::DeviceRepository
    {
    private:
        sqlite3 *db_;
        std::mutex db_mutex_;

        bool MigrateLocked();
        int ReadUserVersionLocked();
        bool HasColumnLocked(const std::string &table, const std::string &column);
        bool ExecLocked(const char *sql);

        // False on a database error; a missing row is success with an empty device.
        bool LookupDeviceLocked(const std::string &ip, std::optional<StoredDevice> &device);
        std::optional<StoredDevice> GetDeviceLocked(const std::string &ip);
        bool UpsertLocked(const std::string &ip,
                          const lan_sweep::discovery::DeviceNames &names,
                          const std::optional<std::string> &vendor,
                          int64_t now_ms);

    public:
        static constexpr int SCHEMA_VERSION = 2;

        DeviceStore();
        ~DeviceStore() override;

        DeviceStore(const DeviceStore &) = delete;
        DeviceStore &operator=(const DeviceStore &) = delete;

        bool Initialize(const std::string &db_path);
        void Shutdown();

        // A vendor change at the same IP is treated as a new device: first_seen resets
        // and earlier names are dropped. Otherwise names and the custom name stick.
        bool UpsertDevice(const std::string &ip,
                          const lan_sweep::discovery::DeviceNames &names,
                          const std::optional<std::string> &vendor,
                          int64_t now_ms) override;

        int MarkOfflineSince(int64_t scan_start_ms) override;

        // A null or blank name clears the override. False when the IP is unknown.
        bool SetCustomName(const std::string &ip, const std::optional<std::string> &custom_name);

        std::optional<StoredDevice> GetDevice(const std::string &ip);

        // Most recently seen first.
        std::vector<StoredDevice> GetAllDevices();

        bool DeleteDevice(const std::string &ip);
        bool ClearAllDevices();
        int GetDeviceCount();
    };
}
