#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lan_sweep::common
{
    inline constexpr int MIN_SCAN_PREFIX = 22;

    struct AddressRange
    {
        uint32_t network;
        uint32_t first;
        uint32_t last;
    };

    enum class CidrError
    {
        None,
        InvalidCidr,
        NetworkTooLarge
    };

    struct CidrParseResult
    {
        CidrError error = CidrError::None;
        int prefix = -1;
        AddressRange range{};

        bool Ok() const { return error == CidrError::None; }
    };

    std::optional<uint32_t> IpToInt(const std::string &ip);
    std::string IntToIp(uint32_t value);

    uint32_t PrefixToMask(int prefix);

    CidrParseResult ParseCidrRange(const std::string &cidr);

    // Fixed approximate host counts shown when a network is refused as too large.
    std::string ApproximateHostCount(int prefix);

    std::string DescribeCidrError(const CidrParseResult &result);

    // "10.0.0.7/24" -> "10.0.0.0/24"; unparseable input yields the fallback.
    std::string NormalizeToNetworkCidr(const std::string &candidate, const std::string &fallback);
}
