#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lan_sweep::discovery::netbios
{
    inline constexpr uint16_t PORT = 137;
    inline constexpr uint16_t TYPE_NBSTAT = 0x0021;
    inline constexpr std::size_t MIN_REPLY_SIZE = 57;
    inline constexpr std::size_t NAME_ENTRY_SIZE = 18;

    // First-level encoding: length byte 0x20, 32 half-ASCII chars, terminator.
    std::vector<uint8_t> EncodeName(const std::string &name);

    std::vector<uint8_t> BuildNbstatQuery(uint16_t transaction_id);

    // First non-blank unique name in the node status table.
    std::optional<std::string> ParseNbstatReply(const std::vector<uint8_t> &packet);
}
