#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>

namespace lan_sweep::discovery
{
    inline constexpr const char *FALLBACK_CIDR = "192.168.1.0/24";

    struct NetworkIdentity
    {
        std::optional<std::string> ssid;
        std::optional<std::string> gatewayIp;
    };

    class LocalNetwork
    {
    public:
        // "<network>/<prefix>" of the default interface, else the first up non-loopback IPv4 interface.
        static std::optional<std::string> DetectBestCidr();

        static std::optional<std::string> DefaultGateway();

        static NetworkIdentity CurrentNetwork(const std::optional<std::string> &ssid = std::nullopt);

        // Gateway of the first default route in /proc/net/route format.
        static std::optional<std::string> ParseRouteTable(std::istream &routes);

        static std::string CidrFor(uint32_t address, uint32_t netmask);

    private:
        static std::optional<std::string> CidrFromDefaultInterface();
        static std::optional<std::string> CidrFromInterfaceList();
    };
}
