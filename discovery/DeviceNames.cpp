#include "DeviceNames.hpp"
#include "../common/Codec.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <vector>

namespace lan_sweep::discovery
{
    using lan_sweep::common::wire::strip_suffix;

    static const std::vector<std::regex> &SerialPatterns()
    {
        static const std::vector<std::regex> patterns = {
            std::regex("X[0-9A-Z]{8,}"),
            std::regex("[0-9A-F]{12}"),
            std::regex("[0-9A-F]{14,}"),
            std::regex(".*-[0-9a-f]{6}"),
            std::regex("[A-Z]{2}[0-9A-F]{10,}"),
            std::regex("[0-9]+-[0-9]+-[0-9]+")};
        return patterns;
    }

    bool IsUserFriendly(const std::string &name)
    {
        std::string cleaned = strip_suffix(strip_suffix(name, ".local"), ".lan");

        if (cleaned.size() < 3)
            return false;

        for (const auto &pattern : SerialPatterns())
        {
            if (std::regex_match(cleaned, pattern))
                return false;
        }
        return true;
    }

    bool IsWildcardToken(const std::string &token)
    {
        return !token.empty() && std::all_of(token.begin(), token.end(), [](char c)
                                             { return c == '*'; });
    }

    std::optional<std::string> ExtractManufacturer(const std::string &server_header)
    {
        std::string token;
        for (char c : server_header)
        {
            if (c == '-' || c == '_' || c == '/' || std::isspace(static_cast<unsigned char>(c)))
                break;
            token += c;
        }

        if (token.size() < 2 || IsWildcardToken(token))
            return std::nullopt;
        return token;
    }

    std::optional<std::string> ExtractVendor(const DeviceNames &names)
    {
        if (!names.httpServer || IsWildcardToken(*names.httpServer))
            return std::nullopt;
        return ExtractManufacturer(*names.httpServer);
    }

    std::optional<std::string> DeviceNames::GetBestName() const
    {
        if (ssdp && IsUserFriendly(*ssdp))
            return ssdp;
        if (rokuHttp && IsUserFriendly(*rokuHttp))
            return rokuHttp;

        if (deviceType && httpServer)
        {
            auto manufacturer = ExtractManufacturer(*httpServer);
            if (manufacturer)
                return *manufacturer + " " + *deviceType;
        }

        if (netbios && IsUserFriendly(*netbios))
            return netbios;
        if (mdns && IsUserFriendly(*mdns))
            return mdns;
        if (dns && IsUserFriendly(*dns))
            return dns;

        for (const auto *candidate : {&ssdp, &rokuHttp, &mdns, &netbios, &dns})
        {
            if (*candidate && !(*candidate)->empty())
                return *candidate;
        }
        return std::nullopt;
    }

    static std::string OrNull(const std::optional<std::string> &value)
    {
        return value ? *value : "null";
    }

    std::string DeviceNames::ToDebugString() const
    {
        std::stringstream ss;
        ss << "SSDP:" << OrNull(ssdp)
           << " Roku:" << OrNull(rokuHttp)
           << " mDNS:" << OrNull(mdns)
           << " NetBIOS:" << OrNull(netbios)
           << " DNS:" << OrNull(dns)
           << " HTTP:" << OrNull(httpServer)
           << " Type:" << OrNull(deviceType);
        return ss.str();
    }
}
