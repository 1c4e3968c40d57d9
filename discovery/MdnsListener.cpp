#include "MdnsListener.hpp"
#include "MdnsCodec.hpp"
#include "../common/Random.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>

namespace lan_sweep::discovery
{
    namespace
    {
        constexpr std::size_t MAX_PACKET = 9000;

        ip_mreq GroupRequest()
        {
            ip_mreq mreq;
            std::memset(&mreq, 0, sizeof(mreq));
            inet_pton(AF_INET, mdns::MULTICAST_GROUP, &mreq.imr_multiaddr);
            mreq.imr_interface.s_addr = htonl(INADDR_ANY);
            return mreq;
        }
    }

    MdnsListener::MdnsListener(NameCache &cache) : m_cache(cache), m_running(false)
    {
    }

    MdnsListener::~MdnsListener()
    {
        Stop();
    }

    const std::vector<std::string> &MdnsListener::BrowseServices()
    {
        static const std::vector<std::string> services = {
            "_http._tcp.local.",
            "_https._tcp.local.",
            "_ssh._tcp.local.",
            "_printer._tcp.local.",
            "_ipp._tcp.local.",
            "_airplay._tcp.local.",
            "_raop._tcp.local.",
            "_spotify-connect._tcp.local.",
            "_device-info._tcp.local.",
            "_companion-link._tcp.local.",
            "_rdlink._tcp.local.",
            "_apple-mobdev._tcp.local.",
            "_afpovertcp._tcp.local.",
            "_smb._tcp.local.",
            "_airport._tcp.local."};
        return services;
    }

    void MdnsListener::Start(DiscoveryCallback callback)
    {
        if (m_running)
            return;

        lan_sweep::common::Socket sock(socket(AF_INET, SOCK_DGRAM, 0));
        if (!sock.Valid())
            throw std::runtime_error("mDNS socket creation failed");

        int reuse = 1;
        if (setsockopt(sock.Get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0)
            throw std::runtime_error("mDNS SO_REUSEADDR failed");
#ifdef SO_REUSEPORT
        if (setsockopt(sock.Get(), SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse)) < 0)
            throw std::runtime_error("mDNS SO_REUSEPORT failed");
#endif

        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(mdns::PORT);

        if (bind(sock.Get(), reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) < 0)
            throw std::runtime_error("mDNS bind to port 5353 failed: " + std::string(std::strerror(errno)));

        ip_mreq mreq = GroupRequest();
        if (setsockopt(sock.Get(), IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0)
            throw std::runtime_error("mDNS multicast join failed: " + std::string(std::strerror(errno)));

        if (!lan_sweep::common::SetReceiveTimeout(sock.Get(), RECEIVE_TIMEOUT_MS))
            throw std::runtime_error("mDNS receive timeout setup failed");

        m_socket = std::move(sock);
        m_callback = callback;
        m_running = true;
        m_thread = std::thread(&MdnsListener::ReceiveLoop, this);

        std::cout << "[MdnsListener] Listening on " << mdns::MULTICAST_GROUP << ":" << mdns::PORT << "\n";
    }

    void MdnsListener::Stop()
    {
        m_running = false;
        if (m_thread.joinable())
            m_thread.join();
    }

    void MdnsListener::SendBrowseQueries()
    {
        for (const auto &service : BrowseServices())
        {
            auto query = mdns::BuildPtrQuery(lan_sweep::common::NextTransactionId(), service);
            if (!lan_sweep::common::SendDatagram(m_socket.Get(), mdns::MULTICAST_GROUP, mdns::PORT, query))
                std::cerr << "[MdnsListener] Browse query for " << service << " failed\n";
        }
    }

    void MdnsListener::HandlePacket(const std::vector<uint8_t> &packet, const std::string &source_ip)
    {
        auto hostname = mdns::ParseAnnouncedHostname(packet);
        if (!hostname)
            return;

        if (m_cache.Put(source_ip, *hostname))
        {
            std::cout << "[MdnsListener] " << source_ip << " -> " << *hostname << "\n";
            if (m_callback)
                m_callback(source_ip, *hostname);
        }
    }

    void MdnsListener::LeaveGroup()
    {
        ip_mreq mreq = GroupRequest();
        if (setsockopt(m_socket.Get(), IPPROTO_IP, IP_DROP_MEMBERSHIP, &mreq, sizeof(mreq)) < 0)
            std::cerr << "[MdnsListener] Leaving multicast group failed\n";
        m_socket.Reset();
    }

    void MdnsListener::ReceiveLoop()
    {
        auto last_browse = std::chrono::steady_clock::time_point::min();

        while (m_running)
        {
            auto now = std::chrono::steady_clock::now();
            if (last_browse == std::chrono::steady_clock::time_point::min() || now - last_browse >= BROWSE_INTERVAL)
            {
                SendBrowseQueries();
                last_browse = now;
            }

            auto datagram = lan_sweep::common::ReceiveDatagram(m_socket.Get(), MAX_PACKET);
            if (!datagram)
                continue;

            try
            {
                HandlePacket(datagram->data, datagram->source_ip);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[MdnsListener] Dropping packet from " << datagram->source_ip << ": " << e.what() << "\n";
            }
        }

        LeaveGroup();
        std::cout << "[MdnsListener] Stopped\n";
    }
}
