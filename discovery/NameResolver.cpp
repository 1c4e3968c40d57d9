#include "NameResolver.hpp"
#include "HttpClient.hpp"
#include "MdnsCodec.hpp"
#include "NetbiosCodec.hpp"
#include "PortBanner.hpp"
#include "SsdpCodec.hpp"
#include "../common/Random.hpp"
#include "../common/Socket.hpp"
#include <arpa/inet.h>
#include <chrono>
#include <cstring>
#include <future>
#include <iostream>
#include <netdb.h>
#include <sys/socket.h>
#include <utility>

namespace lan_sweep::discovery
{
    using lan_sweep::common::Datagram;
    using lan_sweep::common::OpenUdpSocket;
    using lan_sweep::common::ReceiveDatagram;
    using lan_sweep::common::SendDatagram;
    using lan_sweep::common::SetReceiveTimeout;

    namespace
    {
        constexpr std::size_t MAX_DATAGRAM = 1024;

        template <typename T, typename Fn>
        std::future<std::optional<T>> Launch(const char *label, const std::string &ip, Fn fn)
        {
            return std::async(std::launch::async, [label, ip, fn]() -> std::optional<T>
                              {
                try
                {
                    return fn();
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[NameResolver] " << ip << " " << label << " failed: " << e.what() << "\n";
                    return std::nullopt;
                } });
        }

        void LogProbe(const std::string &ip, const char *label, const std::optional<std::string> &value)
        {
            std::cout << "[NameResolver] " << ip << " " << label << ": " << value.value_or("null") << "\n";
        }

        // Receives until the deadline passes; returns the first datagram the handler accepts.
        template <typename Handler>
        std::optional<std::string> ReceiveUntil(int fd, int timeout_ms, Handler handler)
        {
            auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
            while (true)
            {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                     deadline - std::chrono::steady_clock::now())
                                     .count();
                if (remaining <= 0)
                    return std::nullopt;
                if (!SetReceiveTimeout(fd, static_cast<int>(remaining)))
                    return std::nullopt;

                auto datagram = ReceiveDatagram(fd, MAX_DATAGRAM);
                if (!datagram)
                    return std::nullopt;

                if (auto name = handler(*datagram))
                    return name;
            }
        }
    }

    const std::vector<std::string> &NameResolver::BonjourServices()
    {
        static const std::vector<std::string> services = {
            "_smb._tcp.local.",
            "_afpovertcp._tcp.local.",
            "_ssh._tcp.local.",
            "_device-info._tcp.local.",
            "_workstation._tcp.local.",
            "_airport._tcp.local."};
        return services;
    }

    NameResolver::NameResolver() : m_probes(NetworkProbes())
    {
    }

    NameResolver::NameResolver(NameProbes probes) : m_probes(std::move(probes))
    {
    }

    NameProbes NameResolver::NetworkProbes()
    {
        NameProbes probes;
        probes.roku = &NameResolver::QueryRoku;
        probes.netbios = &NameResolver::QueryNetbios;
        probes.dns = &NameResolver::ReverseDns;
        probes.mdns = &NameResolver::QueryMdns;
        probes.banner = [](const std::string &ip, int timeout_ms)
        { return PortBanner::Scan(ip, timeout_ms); };
        return probes;
    }

    DeviceNames NameResolver::Resolve(const std::string &ip, int timeout_ms)
    {
        const NameProbes &probes = m_probes;
        auto roku = Launch<std::string>("Roku", ip, [&probes, ip]
                                        { return probes.roku(ip); });
        auto netbios = Launch<std::string>("NetBIOS", ip, [&probes, ip, timeout_ms]
                                           { return probes.netbios(ip, timeout_ms); });
        auto dns = Launch<std::string>("DNS", ip, [&probes, ip]
                                       { return probes.dns(ip); });
        auto mdns = Launch<std::string>("mDNS", ip, [&probes, ip, timeout_ms]
                                        { return probes.mdns(ip, timeout_ms); });
        auto banner = Launch<BannerScan>("Port scan", ip, [&probes, ip, timeout_ms]
                                         { return std::optional<BannerScan>(probes.banner(ip, timeout_ms)); });

        DeviceNames names;
        names.rokuHttp = roku.get();
        names.netbios = netbios.get();
        names.dns = dns.get();
        auto active_mdns = mdns.get();
        auto banner_scan = banner.get();

        LogProbe(ip, "Roku", names.rokuHttp);
        LogProbe(ip, "NetBIOS", names.netbios);
        LogProbe(ip, "DNS", names.dns);
        LogProbe(ip, "mDNS query", active_mdns);

        names.mdns = active_mdns;
        if (banner_scan)
        {
            LogProbe(ip, "Port scan", banner_scan->sshHostname);
            if (!names.mdns)
                names.mdns = banner_scan->sshHostname;
            names.httpServer = banner_scan->httpServer;
            names.deviceType = banner_scan->deviceType;
        }
        return names;
    }

    std::optional<std::string> NameResolver::QueryRoku(const std::string &ip)
    {
        HttpUrl url;
        url.host = ip;
        url.port = ssdp::ROKU_ECP_PORT;
        url.path = ssdp::ROKU_DEVICE_INFO_PATH;

        auto response = HttpClient::Get(url, ROKU_TIMEOUT_MS);
        if (!response || response->status != 200)
            return std::nullopt;
        return ssdp::ParseRokuDeviceInfo(response->body, true);
    }

    std::optional<std::string> NameResolver::QueryNetbios(const std::string &ip, int timeout_ms)
    {
        for (int attempt = 1; attempt <= NETBIOS_ATTEMPTS; ++attempt)
        {
            auto sock = OpenUdpSocket();
            if (!sock.Valid())
                return std::nullopt;

            const int wait_ms = attempt == 1 ? timeout_ms : timeout_ms * 2;
            if (!SetReceiveTimeout(sock.Get(), wait_ms))
                return std::nullopt;

            auto query = netbios::BuildNbstatQuery(lan_sweep::common::NextTransactionId());
            if (!SendDatagram(sock.Get(), ip, netbios::PORT, query))
                continue;

            auto reply = ReceiveDatagram(sock.Get(), MAX_DATAGRAM);
            if (!reply)
                continue;

            if (auto name = netbios::ParseNbstatReply(reply->data))
                return name;
        }
        return std::nullopt;
    }

    std::optional<std::string> NameResolver::ReverseDns(const std::string &ip)
    {
        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
            return std::nullopt;

        char host[NI_MAXHOST];
        int rc = getnameinfo(reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr),
                             host, sizeof(host), nullptr, 0, NI_NAMEREQD);
        if (rc != 0)
            return std::nullopt;

        std::string name(host);
        if (name.empty() || name == ip)
            return std::nullopt;
        return name;
    }

    std::optional<std::string> NameResolver::QueryMdns(const std::string &ip, int timeout_ms)
    {
        auto reverse_name = mdns::ReverseArpaName(ip);
        if (!reverse_name)
            return std::nullopt;

        for (int attempt = 1; attempt <= MDNS_ATTEMPTS; ++attempt)
        {
            auto sock = OpenUdpSocket();
            if (!sock.Valid())
                return std::nullopt;

            auto query = mdns::BuildPtrQuery(lan_sweep::common::NextTransactionId(), *reverse_name);
            if (!SendDatagram(sock.Get(), mdns::MULTICAST_GROUP, mdns::PORT, query))
                continue;

            auto hostname = ReceiveUntil(sock.Get(), timeout_ms * attempt, [](const Datagram &reply)
                                         { return mdns::ParsePtrHostname(reply.data); });
            if (hostname)
                return hostname;
        }

        return QueryBonjourServices(ip, timeout_ms);
    }

    std::optional<std::string> NameResolver::QueryBonjourServices(const std::string &ip, int timeout_ms)
    {
        for (const auto &service : BonjourServices())
        {
            auto sock = OpenUdpSocket();
            if (!sock.Valid())
                return std::nullopt;

            auto query = mdns::BuildPtrQuery(lan_sweep::common::NextTransactionId(), service);
            if (!SendDatagram(sock.Get(), mdns::MULTICAST_GROUP, mdns::PORT, query))
                continue;

            auto instance = ReceiveUntil(sock.Get(), timeout_ms, [&ip](const Datagram &reply) -> std::optional<std::string>
                                         {
                if (reply.source_ip != ip)
                    return std::nullopt;
                return mdns::ParseServiceInstance(reply.data); });
            if (instance)
            {
                std::cout << "[NameResolver] " << ip << " Bonjour service " << service << ": " << *instance << "\n";
                return instance;
            }
        }
        return std::nullopt;
    }
}
