#include "AddressRange.hpp"
#include <sstream>
#include <vector>

namespace lan_sweep::common
{
    static std::vector<std::string> Split(const std::string &text, char delim)
    {
        std::vector<std::string> parts;
        std::string current;
        std::stringstream ss(text);
        while (std::getline(ss, current, delim))
            parts.push_back(current);
        if (!text.empty() && text.back() == delim)
            parts.push_back("");
        return parts;
    }

    static std::optional<int> ParseDecimal(const std::string &text)
    {
        if (text.empty() || text.size() > 10)
            return std::nullopt;

        long value = 0;
        for (char c : text)
        {
            if (c < '0' || c > '9')
                return std::nullopt;
            value = value * 10 + (c - '0');
        }
        if (value > 0x7FFFFFFF)
            return std::nullopt;
        return static_cast<int>(value);
    }

    std::optional<uint32_t> IpToInt(const std::string &ip)
    {
        auto parts = Split(ip, '.');
        if (parts.size() != 4)
            return std::nullopt;

        uint32_t value = 0;
        for (const auto &part : parts)
        {
            auto octet = ParseDecimal(part);
            if (!octet || *octet > 255)
                return std::nullopt;
            value = (value << 8) | static_cast<uint32_t>(*octet);
        }
        return value;
    }

    std::string IntToIp(uint32_t value)
    {
        std::stringstream ss;
        ss << ((value >> 24) & 0xFF) << '.'
           << ((value >> 16) & 0xFF) << '.'
           << ((value >> 8) & 0xFF) << '.'
           << (value & 0xFF);
        return ss.str();
    }

    uint32_t PrefixToMask(int prefix)
    {
        if (prefix <= 0)
            return 0;
        if (prefix >= 32)
            return 0xFFFFFFFFu;
        return 0xFFFFFFFFu << (32 - prefix);
    }

    CidrParseResult ParseCidrRange(const std::string &cidr)
    {
        CidrParseResult result;
        result.error = CidrError::InvalidCidr;

        auto parts = Split(cidr, '/');
        if (parts.size() != 2)
            return result;

        auto base = IpToInt(parts[0]);
        auto prefix = ParseDecimal(parts[1]);
        if (!base || !prefix || *prefix < 1 || *prefix > 32)
            return result;

        result.prefix = *prefix;
        if (*prefix < MIN_SCAN_PREFIX)
        {
            result.error = CidrError::NetworkTooLarge;
            return result;
        }

        uint32_t mask = PrefixToMask(*prefix);
        uint32_t network = *base & mask;
        uint32_t broadcast = network | ~mask;

        result.range.network = network;
        if (*prefix == 32)
        {
            result.range.first = network;
            result.range.last = network;
        }
        else if (*prefix == 31)
        {
            result.range.first = network;
            result.range.last = broadcast;
        }
        else
        {
            result.range.first = network + 1;
            result.range.last = broadcast - 1;
        }

        result.error = CidrError::None;
        return result;
    }

    std::string ApproximateHostCount(int prefix)
    {
        switch (prefix)
        {
        case 21:
            return "2,046";
        case 20:
            return "4,094";
        case 19:
            return "8,190";
        case 18:
            return "16,382";
        case 17:
            return "32,766";
        case 16:
            return "65,534";
        default:
            return "too many";
        }
    }

    std::string DescribeCidrError(const CidrParseResult &result)
    {
        switch (result.error)
        {
        case CidrError::None:
            return "";
        case CidrError::NetworkTooLarge:
            return "Networks up to /22 (1,022 devices) are supported. Your /" + std::to_string(result.prefix) +
                   " network has " + ApproximateHostCount(result.prefix) + " potential hosts.";
        case CidrError::InvalidCidr:
            return "Use format like 10.0.0.0/24";
        }
        return "";
    }

    std::string NormalizeToNetworkCidr(const std::string &candidate, const std::string &fallback)
    {
        auto parts = Split(candidate, '/');
        if (parts.size() == 2)
        {
            auto ip = IpToInt(parts[0]);
            auto prefix = ParseDecimal(parts[1]);
            if (ip && prefix && *prefix >= 1 && *prefix <= 32)
            {
                return IntToIp(*ip & PrefixToMask(*prefix)) + "/" + std::to_string(*prefix);
            }
        }
        return fallback;
    }
}
