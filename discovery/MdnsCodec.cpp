#include "MdnsCodec.hpp"
#include "../common/AddressRange.hpp"
#include "../common/Codec.hpp"
#include <algorithm>
#include <cctype>

namespace lan_sweep::discovery::mdns
{
    namespace wire = lan_sweep::common::wire;

    std::optional<std::string> ReverseArpaName(const std::string &ip)
    {
        auto value = lan_sweep::common::IpToInt(ip);
        if (!value)
            return std::nullopt;

        return std::to_string(*value & 0xFF) + "." +
               std::to_string((*value >> 8) & 0xFF) + "." +
               std::to_string((*value >> 16) & 0xFF) + "." +
               std::to_string((*value >> 24) & 0xFF) + ".in-addr.arpa";
    }

    std::vector<uint8_t> BuildPtrQuery(uint16_t id, const std::string &name)
    {
        std::vector<uint8_t> packet;
        packet.reserve(wire::DNS_HEADER_SIZE + name.size() + 6);

        wire::append_u16_be(packet, id);
        wire::append_u16_be(packet, 0x0000);
        wire::append_u16_be(packet, 1);
        wire::append_u16_be(packet, 0);
        wire::append_u16_be(packet, 0);
        wire::append_u16_be(packet, 0);

        wire::append_dns_name(packet, name);
        wire::append_u16_be(packet, TYPE_PTR);
        wire::append_u16_be(packet, 0x0001);
        return packet;
    }

    std::vector<ResourceRecord> ParseRecords(const std::vector<uint8_t> &packet)
    {
        std::vector<ResourceRecord> records;
        if (packet.size() < wire::DNS_HEADER_SIZE)
            return records;

        std::size_t pos = 4;
        uint16_t qdcount = 0, ancount = 0, nscount = 0, arcount = 0;
        if (!wire::read_u16_be(packet, pos, qdcount) ||
            !wire::read_u16_be(packet, pos, ancount) ||
            !wire::read_u16_be(packet, pos, nscount) ||
            !wire::read_u16_be(packet, pos, arcount))
            return records;

        pos = wire::DNS_HEADER_SIZE;
        for (uint16_t i = 0; i < qdcount; ++i)
        {
            if (!wire::skip_dns_name(packet, pos) || pos + 4 > packet.size())
                return records;
            pos += 4;
        }

        const uint32_t total = static_cast<uint32_t>(ancount) + nscount + arcount;
        for (uint32_t i = 0; i < total; ++i)
        {
            ResourceRecord record;
            auto name = wire::read_dns_name(packet, pos);
            if (name)
                record.name = *name;

            if (!wire::skip_dns_name(packet, pos))
                break;

            uint16_t rclass = 0, rdlength = 0;
            uint32_t ttl = 0;
            if (!wire::read_u16_be(packet, pos, record.type) ||
                !wire::read_u16_be(packet, pos, rclass) ||
                !wire::read_u32_be(packet, pos, ttl) ||
                !wire::read_u16_be(packet, pos, rdlength))
                break;

            if (pos + rdlength > packet.size())
                break;

            record.rdata_offset = pos;
            record.rdata_length = rdlength;
            records.push_back(record);
            pos += rdlength;
        }
        return records;
    }

    std::optional<std::string> ParsePtrHostname(const std::vector<uint8_t> &packet)
    {
        for (const auto &record : ParseRecords(packet))
        {
            if (record.type != TYPE_PTR)
                continue;

            auto target = wire::read_dns_name(packet, record.rdata_offset);
            if (target && wire::ends_with(*target, ".local"))
            {
                std::string hostname = wire::strip_suffix(*target, ".local");
                if (!hostname.empty())
                    return hostname;
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> ParseServiceInstance(const std::vector<uint8_t> &packet)
    {
        for (const auto &record : ParseRecords(packet))
        {
            if (record.type != TYPE_PTR)
                continue;

            auto instance = wire::read_dns_name(packet, record.rdata_offset);
            if (!instance)
                continue;

            std::string label = instance->substr(0, instance->find("._"));
            label = wire::strip_suffix(wire::strip_suffix(label, "."), ".local");
            if (!label.empty() && label.find_first_not_of(' ') != std::string::npos)
                return label;
        }
        return std::nullopt;
    }

    bool IsUuid(const std::string &text)
    {
        return text.size() == 36 && std::all_of(text.begin(), text.end(), [](char c)
                                                { return std::isxdigit(static_cast<unsigned char>(c)) || c == '-'; });
    }

    static bool IsUsableHostname(const std::string &hostname)
    {
        bool is_service = !hostname.empty() && (hostname[0] == '_' || hostname.find("._") != std::string::npos);
        return !is_service && !IsUuid(hostname) && hostname.size() > 2;
    }

    std::optional<std::string> ParseAnnouncedHostname(const std::vector<uint8_t> &packet)
    {
        auto records = ParseRecords(packet);

        for (const auto &record : records)
        {
            if (record.type != TYPE_SRV || record.rdata_length <= 6)
                continue;

            auto target = wire::read_dns_name(packet, record.rdata_offset + 6);
            if (target && wire::ends_with(*target, ".local"))
            {
                std::string hostname = wire::strip_suffix(*target, ".local");
                if (IsUsableHostname(hostname))
                    return hostname;
            }
        }

        for (const auto &record : records)
        {
            if (!wire::ends_with(record.name, ".local"))
                continue;

            std::string hostname = wire::strip_suffix(record.name, ".local");
            if (IsUsableHostname(hostname))
                return hostname;
        }
        return std::nullopt;
    }
}
