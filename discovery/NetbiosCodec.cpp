#include "NetbiosCodec.hpp"
#include "../common/Codec.hpp"
#include <algorithm>
#include <cctype>

namespace lan_sweep::discovery::netbios
{
    namespace wire = lan_sweep::common::wire;

    std::vector<uint8_t> EncodeName(const std::string &name)
    {
        std::string padded = name.substr(0, 15);
        std::transform(padded.begin(), padded.end(), padded.begin(), [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        // The wildcard name is padded with NULs, regular names with spaces.
        padded.resize(15, name == "*" ? '\0' : ' ');
        padded.push_back('\0');

        std::vector<uint8_t> out;
        out.reserve(34);
        out.push_back(0x20);
        for (char ch : padded)
        {
            uint8_t c = static_cast<uint8_t>(ch);
            out.push_back(static_cast<uint8_t>('A' + ((c >> 4) & 0x0F)));
            out.push_back(static_cast<uint8_t>('A' + (c & 0x0F)));
        }
        out.push_back(0x00);
        return out;
    }

    std::vector<uint8_t> BuildNbstatQuery(uint16_t transaction_id)
    {
        std::vector<uint8_t> packet;
        packet.reserve(50);

        wire::append_u16_be(packet, transaction_id);
        wire::append_u16_be(packet, 0x0010);
        wire::append_u16_be(packet, 1);
        wire::append_u16_be(packet, 0);
        wire::append_u16_be(packet, 0);
        wire::append_u16_be(packet, 0);

        auto encoded = EncodeName("*");
        packet.insert(packet.end(), encoded.begin(), encoded.end());

        wire::append_u16_be(packet, TYPE_NBSTAT);
        wire::append_u16_be(packet, 0x0001);
        return packet;
    }

    static std::string TrimName(const uint8_t *data, std::size_t len)
    {
        std::string raw(reinterpret_cast<const char *>(data), len);
        auto end = raw.find_last_not_of(" \0", std::string::npos, 2);
        if (end == std::string::npos)
            return "";
        raw.erase(end + 1);
        auto begin = raw.find_first_not_of(' ');
        return raw.substr(begin);
    }

    std::optional<std::string> ParseNbstatReply(const std::vector<uint8_t> &packet)
    {
        if (packet.size() < MIN_REPLY_SIZE)
            return std::nullopt;

        std::size_t pos = 4;
        uint16_t qdcount = 0, ancount = 0;
        if (!wire::read_u16_be(packet, pos, qdcount) || !wire::read_u16_be(packet, pos, ancount) || ancount == 0)
            return std::nullopt;

        pos = wire::DNS_HEADER_SIZE;
        for (uint16_t i = 0; i < qdcount; ++i)
        {
            if (!wire::skip_dns_name(packet, pos) || pos + 4 > packet.size())
                return std::nullopt;
            pos += 4;
        }

        if (!wire::skip_dns_name(packet, pos))
            return std::nullopt;

        uint16_t type = 0, rclass = 0, rdlength = 0;
        uint32_t ttl = 0;
        if (!wire::read_u16_be(packet, pos, type) ||
            !wire::read_u16_be(packet, pos, rclass) ||
            !wire::read_u32_be(packet, pos, ttl) ||
            !wire::read_u16_be(packet, pos, rdlength))
            return std::nullopt;

        if (type != TYPE_NBSTAT || pos + rdlength > packet.size() || rdlength < 1)
            return std::nullopt;

        const std::size_t rdata_end = pos + rdlength;
        const uint8_t num_names = packet[pos++];

        std::optional<std::string> first_group;
        for (uint8_t i = 0; i < num_names; ++i)
        {
            if (pos + NAME_ENTRY_SIZE > rdata_end)
                break;

            std::string name = TrimName(packet.data() + pos, 15);
            uint16_t flags = static_cast<uint16_t>((packet[pos + 16] << 8) | packet[pos + 17]);
            pos += NAME_ENTRY_SIZE;

            if (name.empty())
                continue;
            if ((flags & 0x8000) == 0)
                return name;
            if (!first_group)
                first_group = name;
        }
        return first_group;
    }
}
