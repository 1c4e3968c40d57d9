#pragma once

#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lan_sweep::common::wire
{
    inline constexpr std::size_t DNS_HEADER_SIZE = 12;
    inline constexpr int MAX_POINTER_JUMPS = 10;

    inline void append_u16_be(std::vector<std::uint8_t>& out, std::uint16_t value)
    {
        out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
        out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    }

    inline bool read_u16_be(const std::vector<std::uint8_t>& in, std::size_t& offset, std::uint16_t& value_out)
    {
        if (offset + 2 > in.size())
            return false;

        value_out = static_cast<std::uint16_t>((in[offset] << 8) | in[offset + 1]);
        offset += 2;
        return true;
    }

    inline bool read_u32_be(const std::vector<std::uint8_t>& in, std::size_t& offset, std::uint32_t& value_out)
    {
        if (offset + 4 > in.size())
            return false;

        value_out = (static_cast<std::uint32_t>(in[offset]) << 24) |
                    (static_cast<std::uint32_t>(in[offset + 1]) << 16) |
                    (static_cast<std::uint32_t>(in[offset + 2]) << 8) |
                    static_cast<std::uint32_t>(in[offset + 3]);
        offset += 4;
        return true;
    }

    // Encodes "a.b.c." as length-prefixed labels; empty labels are skipped.
    inline void append_dns_name(std::vector<std::uint8_t>& out, std::string_view name)
    {
        std::size_t start = 0;
        while (start <= name.size())
        {
            std::size_t dot = name.find('.', start);
            if (dot == std::string_view::npos)
                dot = name.size();

            std::string_view label = name.substr(start, dot - start);
            if (!label.empty())
            {
                if (label.size() > 63)
                    label = label.substr(0, 63);
                out.push_back(static_cast<std::uint8_t>(label.size()));
                out.insert(out.end(), label.begin(), label.end());
            }
            start = dot + 1;
        }
        out.push_back(0x00);
    }

    // Advances offset past a (possibly compressed) name without decoding it.
    inline bool skip_dns_name(const std::vector<std::uint8_t>& in, std::size_t& offset)
    {
        while (offset < in.size())
        {
            std::uint8_t len = in[offset];
            if (len == 0)
            {
                offset += 1;
                return true;
            }
            if ((len & 0xC0) == 0xC0)
            {
                if (offset + 2 > in.size())
                    return false;
                offset += 2;
                return true;
            }
            offset += len + 1;
        }
        return false;
    }

    // Decodes a name starting at offset, following compression pointers.
    inline std::optional<std::string> read_dns_name(const std::vector<std::uint8_t>& in, std::size_t offset)
    {
        std::string name;
        int jumps = 0;

        while (offset < in.size() && jumps < MAX_POINTER_JUMPS)
        {
            std::uint8_t len = in[offset];
            if (len == 0)
                break;

            if ((len & 0xC0) == 0xC0)
            {
                if (offset + 1 >= in.size())
                    break;
                offset = (static_cast<std::size_t>(len & 0x3F) << 8) | in[offset + 1];
                jumps++;
                continue;
            }

            if (offset + 1 + len > in.size())
                break;

            if (!name.empty())
                name += '.';
            name.append(reinterpret_cast<const char*>(in.data() + offset + 1), len);
            offset += len + 1;
        }

        if (name.empty())
            return std::nullopt;
        return name;
    }

    inline bool ends_with(std::string_view text, std::string_view suffix)
    {
        return text.size() >= suffix.size() &&
               text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    inline std::string strip_suffix(std::string text, std::string_view suffix)
    {
        if (ends_with(text, suffix))
            text.erase(text.size() - suffix.size());
        return text;
    }
}
