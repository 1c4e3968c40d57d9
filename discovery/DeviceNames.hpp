#pragma once

#include <optional>
#include <string>

namespace lan_sweep::discovery
{
    struct DeviceNames
    {
        std::optional<std::string> rokuHttp;
        std::optional<std::string> ssdp;
        std::optional<std::string> mdns;
        std::optional<std::string> netbios;
        std::optional<std::string> dns;
        std::optional<std::string> httpServer;
        std::optional<std::string> deviceType;

        // First user-friendly candidate in priority order, else the first non-empty one.
        std::optional<std::string> GetBestName() const;

        std::string ToDebugString() const;
    };

    // Rejects short strings and serial-number / MAC / UUID-like identifiers.
    bool IsUserFriendly(const std::string &name);

    bool IsWildcardToken(const std::string &token);

    // First token of an HTTP Server header, split on '-', '_', '/' and whitespace.
    std::optional<std::string> ExtractManufacturer(const std::string &server_header);

    std::optional<std::string> ExtractVendor(const DeviceNames &names);
}
