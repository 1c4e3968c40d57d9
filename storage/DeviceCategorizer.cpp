#include "DeviceCategorizer.hpp"
#include "../common/Clock.hpp"
#include <algorithm>
#include <limits>

namespace lan_sweep::storage
{
    std::string ToString(DeviceState state)
    {
        switch (state)
        {
        case DeviceState::New:
            return "New";
        case DeviceState::BackOnline:
            return "Back Online";
        case DeviceState::StillOnline:
            return "Still Online";
        case DeviceState::WentOffline:
            return "Went Offline";
        case DeviceState::Historical:
            return "Historical";
        }
        return "Historical";
    }

    const std::vector<DeviceState> &AllDeviceStates()
    {
        static const std::vector<DeviceState> states = {
            DeviceState::New,
            DeviceState::BackOnline,
            DeviceState::StillOnline,
            DeviceState::WentOffline,
            DeviceState::Historical};
        return states;
    }

    int64_t CutoffTimestamp(int64_t now_ms, int cutoff_days)
    {
        const int64_t span = static_cast<int64_t>(std::max(cutoff_days, 0)) * lan_sweep::common::MILLIS_PER_DAY;
        if (now_ms < std::numeric_limits<int64_t>::min() + span)
            return std::numeric_limits<int64_t>::min();
        return now_ms - span;
    }

    DeviceState CategorizeDevice(const StoredDevice &device, int64_t cutoff_ms)
    {
        switch (device.status)
        {
        case DeviceStatus::Online:
            if (device.firstSeen == device.lastSeen)
                return DeviceState::New;
            return DeviceState::StillOnline;
        case DeviceStatus::Offline:
            if (device.lastSeen >= cutoff_ms)
                return DeviceState::WentOffline;
            return DeviceState::Historical;
        }
        return DeviceState::Historical;
    }

    std::map<DeviceState, std::vector<StoredDevice>> CategorizeDevices(const std::vector<StoredDevice> &devices,
                                                                       int64_t now_ms,
                                                                       int cutoff_days)
    {
        std::map<DeviceState, std::vector<StoredDevice>> categories;
        for (DeviceState state : AllDeviceStates())
            categories[state];

        const int64_t cutoff = CutoffTimestamp(now_ms, cutoff_days);
        for (const auto &device : devices)
            categories[CategorizeDevice(device, cutoff)].push_back(device);
        return categories;
    }
}
