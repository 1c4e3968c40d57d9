#pragma once

#include "DeviceNames.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace lan_sweep::discovery
{
    // Persistence the scan writes into; storage::DeviceStore is the production implementation.
    class DeviceRepository
    {
    public:
        virtual ~DeviceRepository() = default;

        virtual bool UpsertDevice(const std::string &ip,
                                  const DeviceNames &names,
                                  const std::optional<std::string> &vendor,
                                  int64_t now_ms) = 0;

        // Marks every device last seen before scan_start_ms offline; returns the number changed.
        virtual int MarkOfflineSince(int64_t scan_start_ms) = 0;
    };
}
