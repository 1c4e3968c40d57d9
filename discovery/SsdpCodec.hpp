#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lan_sweep::discovery::ssdp
{
    inline constexpr const char *MULTICAST_GROUP = "239.255.255.250";
    inline constexpr uint16_t PORT = 1900;
    inline constexpr uint16_t ROKU_ECP_PORT = 8060;
    inline constexpr const char *ROKU_DEVICE_INFO_PATH = "/query/device-info";

    const std::vector<std::string> &SearchTargets();

    std::string BuildMSearch(const std::string &search_target, int mx_seconds = 3);

    std::optional<std::string> ParseLocation(const std::string &response);

    // <friendlyName>, else "<manufacturer> <modelName>" with whichever is present.
    std::optional<std::string> ParseDeviceDescription(const std::string &xml);

    // <user-device-name>, else <friendly-device-name>, else (optionally) <model-name>.
    std::optional<std::string> ParseRokuDeviceInfo(const std::string &xml, bool allow_model_name);
}
