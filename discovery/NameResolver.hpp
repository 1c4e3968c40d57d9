#pragma once

#include "DeviceNames.hpp"
#include "PortBanner.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lan_sweep::discovery
{
    class NameDiscovery
    {
    public:
        virtual ~NameDiscovery() = default;
        virtual DeviceNames Resolve(const std::string &ip, int timeout_ms) = 0;
    };

    struct NameProbes
    {
        std::function<std::optional<std::string>(const std::string &ip)> roku;
        std::function<std::optional<std::string>(const std::string &ip, int timeout_ms)> netbios;
        std::function<std::optional<std::string>(const std::string &ip)> dns;
        std::function<std::optional<std::string>(const std::string &ip, int timeout_ms)> mdns;
        std::function<BannerScan(const std::string &ip, int timeout_ms)> banner;
    };

    // Runs the Roku, NetBIOS, reverse DNS, mDNS and port-banner probes concurrently
    // and joins them into one DeviceNames. A failed probe leaves its field empty.
    class NameResolver : public NameDiscovery
    {
    public:
        static constexpr int ROKU_TIMEOUT_MS = 3000;
        static constexpr int NETBIOS_ATTEMPTS = 3;
        static constexpr int MDNS_ATTEMPTS = 2;

        NameResolver();
        explicit NameResolver(NameProbes probes);

        DeviceNames Resolve(const std::string &ip, int timeout_ms) override;

        // The probes that talk to the network.
        static NameProbes NetworkProbes();

        static std::optional<std::string> QueryRoku(const std::string &ip);
        static std::optional<std::string> QueryNetbios(const std::string &ip, int timeout_ms);
        static std::optional<std::string> ReverseDns(const std::string &ip);
        static std::optional<std::string> QueryMdns(const std::string &ip, int timeout_ms);
        static std::optional<std::string> QueryBonjourServices(const std::string &ip, int timeout_ms);

        static const std::vector<std::string> &BonjourServices();

    private:
        NameProbes m_probes;
    };
}
