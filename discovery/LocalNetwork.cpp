#include "LocalNetwork.hpp"
#include "../common/AddressRange.hpp"
#include <tins/tins.h>
#include <arpa/inet.h>
#include <fstream>
#include <ifaddrs.h>
#include <iostream>
#include <net/if.h>
#include <netinet/in.h>
#include <sstream>

namespace lan_sweep::discovery
{
    using lan_sweep::common::IntToIp;
    using lan_sweep::common::IpToInt;

    std::string LocalNetwork::CidrFor(uint32_t address, uint32_t netmask)
    {
        int prefix = 0;
        for (uint32_t bit = 0x80000000u; bit != 0 && (netmask & bit); bit >>= 1)
            prefix++;
        return IntToIp(address & lan_sweep::common::PrefixToMask(prefix)) + "/" + std::to_string(prefix);
    }

    std::optional<std::string> LocalNetwork::CidrFromDefaultInterface()
    {
        try
        {
            Tins::NetworkInterface iface = Tins::NetworkInterface::default_interface();
            Tins::NetworkInterface::Info info = iface.info();

            auto address = IpToInt(info.ip_addr.to_string());
            auto netmask = IpToInt(info.netmask.to_string());
            if (!address || !netmask || *address == 0)
                return std::nullopt;
            return CidrFor(*address, *netmask);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[LocalNetwork] Default interface lookup failed: " << e.what() << "\n";
            return std::nullopt;
        }
    }

    std::optional<std::string> LocalNetwork::CidrFromInterfaceList()
    {
        struct ifaddrs *list = nullptr;
        if (getifaddrs(&list) != 0)
            return std::nullopt;

        std::optional<std::string> cidr;
        for (struct ifaddrs *it = list; it != nullptr; it = it->ifa_next)
        {
            if (!it->ifa_addr || !it->ifa_netmask || it->ifa_addr->sa_family != AF_INET)
                continue;
            if (!(it->ifa_flags & IFF_UP) || (it->ifa_flags & IFF_LOOPBACK))
                continue;

            auto *addr = reinterpret_cast<struct sockaddr_in *>(it->ifa_addr);
            auto *mask = reinterpret_cast<struct sockaddr_in *>(it->ifa_netmask);
            cidr = CidrFor(ntohl(addr->sin_addr.s_addr), ntohl(mask->sin_addr.s_addr));
            break;
        }

        freeifaddrs(list);
        return cidr;
    }

    std::optional<std::string> LocalNetwork::DetectBestCidr()
    {
        if (auto cidr = CidrFromDefaultInterface())
            return cidr;
        return CidrFromInterfaceList();
    }

    std::optional<std::string> LocalNetwork::ParseRouteTable(std::istream &routes)
    {
        std::string line;
        std::getline(routes, line);
        while (std::getline(routes, line))
        {
            std::stringstream ss(line);
            std::string iface, destination, gateway;
            if (!(ss >> iface >> destination >> gateway))
                continue;
            if (destination != "00000000")
                continue;

            uint32_t raw = 0;
            try
            {
                raw = static_cast<uint32_t>(std::stoul(gateway, nullptr, 16));
            }
            catch (const std::exception &)
            {
                continue;
            }
            if (raw == 0)
                continue;

            // The kernel prints the address in network byte order as a host integer.
            struct in_addr addr;
            addr.s_addr = raw;
            char ip_str[INET_ADDRSTRLEN];
            if (inet_ntop(AF_INET, &addr, ip_str, INET_ADDRSTRLEN) == nullptr)
                continue;
            return std::string(ip_str);
        }
        return std::nullopt;
    }

    std::optional<std::string> LocalNetwork::DefaultGateway()
    {
        std::ifstream routes("/proc/net/route");
        if (!routes.is_open())
            return std::nullopt;
        return ParseRouteTable(routes);
    }

    NetworkIdentity LocalNetwork::CurrentNetwork(const std::optional<std::string> &ssid)
    {
        NetworkIdentity identity;
        identity.ssid = ssid;
        identity.gatewayIp = DefaultGateway();
        return identity;
    }
}
