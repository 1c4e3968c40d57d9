#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lan_sweep::discovery::mdns
{
    inline constexpr const char *MULTICAST_GROUP = "224.0.0.251";
    inline constexpr uint16_t PORT = 5353;

    inline constexpr uint16_t TYPE_A = 1;
    inline constexpr uint16_t TYPE_PTR = 12;
    inline constexpr uint16_t TYPE_SRV = 33;

    struct ResourceRecord
    {
        std::string name;
        uint16_t type = 0;
        std::size_t rdata_offset = 0;
        uint16_t rdata_length = 0;
    };

    // "192.168.1.5" -> "5.1.168.192.in-addr.arpa"
    std::optional<std::string> ReverseArpaName(const std::string &ip);

    std::vector<uint8_t> BuildPtrQuery(uint16_t id, const std::string &name);

    // Answer, authority and additional records; stops at the first truncated record.
    std::vector<ResourceRecord> ParseRecords(const std::vector<uint8_t> &packet);

    // Hostname from a reverse-PTR answer ending in ".local", with that suffix removed.
    std::optional<std::string> ParsePtrHostname(const std::vector<uint8_t> &packet);

    // Instance label of the first PTR answer in a service browse reply.
    std::optional<std::string> ParseServiceInstance(const std::vector<uint8_t> &packet);

    // Best hostname carried by an unsolicited announcement, preferring SRV targets.
    std::optional<std::string> ParseAnnouncedHostname(const std::vector<uint8_t> &packet);

    bool IsUuid(const std::string &text);
}
