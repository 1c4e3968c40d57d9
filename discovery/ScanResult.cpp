#include "ScanResult.hpp"

namespace lan_sweep::discovery
{
    namespace
    {
        struct StatusPrinter
        {
            std::string operator()(const status::Icmp &) const { return "ICMP"; }
            std::string operator()(const status::Tcp &tcp) const { return "TCP:" + std::to_string(tcp.port); }
            std::string operator()(const status::NoResponse &) const { return "No response"; }
            std::string operator()(const status::Error &) const { return "Error"; }
            std::string operator()(const status::InvalidCidr &) const { return "Invalid CIDR"; }
            std::string operator()(const status::NetworkTooLarge &) const { return "Network too large"; }
            std::string operator()(const status::Unknown &) const { return "Unknown"; }
        };
    }

    std::string ToString(const ProbeStatus &probe_status)
    {
        return std::visit(StatusPrinter{}, probe_status);
    }

    bool IsAlive(const ProbeStatus &probe_status)
    {
        return std::holds_alternative<status::Icmp>(probe_status) || std::holds_alternative<status::Tcp>(probe_status);
    }
}
