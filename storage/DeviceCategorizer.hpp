#pragma once

#include "DeviceStore.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace lan_sweep::storage
{
    inline constexpr int DEFAULT_CUTOFF_DAYS = 7;

    enum class DeviceState
    {
        New,
        BackOnline,
        StillOnline,
        WentOffline,
        Historical
    };

    std::string ToString(DeviceState state);

    const std::vector<DeviceState> &AllDeviceStates();

    // now_ms - cutoff_days, clamped instead of overflowing.
    int64_t CutoffTimestamp(int64_t now_ms, int cutoff_days);

    DeviceState CategorizeDevice(const StoredDevice &device, int64_t cutoff_ms);

    // Every DeviceState key is present in the result; input order is kept within each bucket.
    std::map<DeviceState, std::vector<StoredDevice>> CategorizeDevices(const std::vector<StoredDevice> &devices,
                                                                       int64_t now_ms,
                                                                       int cutoff_days = DEFAULT_CUTOFF_DAYS);
}
