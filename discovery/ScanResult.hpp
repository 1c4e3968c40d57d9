#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace lan_sweep::discovery
{
    namespace status
    {
        struct Icmp
        {
        };
        struct Tcp
        {
            uint16_t port = 0;
        };
        struct NoResponse
        {
        };
        struct Error
        {
        };
        struct InvalidCidr
        {
        };
        struct NetworkTooLarge
        {
        };
        struct Unknown
        {
        };
    }

    using ProbeStatus = std::variant<status::Icmp,
                                     status::Tcp,
                                     status::NoResponse,
                                     status::Error,
                                     status::InvalidCidr,
                                     status::NetworkTooLarge,
                                     status::Unknown>;

    // "ICMP", "TCP:<port>", "No response", "Error", "Invalid CIDR", "Network too large", "Unknown"
    std::string ToString(const ProbeStatus &probe_status);

    bool IsAlive(const ProbeStatus &probe_status);

    struct ScanResult
    {
        std::string ip;
        ProbeStatus status = status::Unknown{};
        std::string details;
        std::optional<int64_t> latencyMs;
        std::optional<std::string> hostname;
    };
}
