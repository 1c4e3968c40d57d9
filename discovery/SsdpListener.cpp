#include "SsdpListener.hpp"
#include "HttpClient.hpp"
#include "SsdpCodec.hpp"
#include <iostream>
#include <stdexcept>
#include <sys/socket.h>

namespace lan_sweep::discovery
{
    namespace
    {
        constexpr std::size_t MAX_PACKET = 2048;
    }

    SsdpListener::SsdpListener(NameCache &cache) : m_cache(cache), m_running(false)
    {
    }

    SsdpListener::~SsdpListener()
    {
        Stop();
    }

    void SsdpListener::Start(DiscoveryCallback callback)
    {
        if (m_running)
            return;

        auto sock = lan_sweep::common::OpenUdpSocket();
        if (!sock.Valid())
            throw std::runtime_error("SSDP socket creation failed");
        if (!lan_sweep::common::SetReceiveTimeout(sock.Get(), RECEIVE_TIMEOUT_MS))
            throw std::runtime_error("SSDP receive timeout setup failed");

        m_socket = std::move(sock);
        m_callback = callback;
        m_running = true;

        m_fetch_thread = std::thread(&SsdpListener::FetchLoop, this);
        m_receive_thread = std::thread(&SsdpListener::ReceiveLoop, this);

        std::cout << "[SsdpListener] Searching " << ssdp::MULTICAST_GROUP << ":" << ssdp::PORT << "\n";
    }

    void SsdpListener::Stop()
    {
        if (!m_running)
            return;

        {
            std::lock_guard<std::mutex> lock(m_fetch_mutex);
            m_running = false;
        }
        m_fetch_cv.notify_all();

        if (m_receive_thread.joinable())
            m_receive_thread.join();
        if (m_fetch_thread.joinable())
            m_fetch_thread.join();

        std::lock_guard<std::mutex> lock(m_fetch_mutex);
        std::queue<DescriptionFetch>().swap(m_fetch_queue);
        m_pending_ips.clear();
    }

    bool SsdpListener::EnqueueFetch(const std::string &ip, const std::string &location)
    {
        {
            std::lock_guard<std::mutex> lock(m_fetch_mutex);
            if (m_fetch_queue.size() >= MAX_PENDING_FETCHES || m_pending_ips.count(ip) > 0)
                return false;

            m_pending_ips.insert(ip);
            m_fetch_queue.push({ip, location});
        }
        m_fetch_cv.notify_one();
        return true;
    }

    void SsdpListener::SendSearches()
    {
        for (const auto &target : ssdp::SearchTargets())
        {
            if (!m_running)
                return;

            std::string request = ssdp::BuildMSearch(target);
            std::vector<uint8_t> payload(request.begin(), request.end());
            if (!lan_sweep::common::SendDatagram(m_socket.Get(), ssdp::MULTICAST_GROUP, ssdp::PORT, payload))
                std::cerr << "[SsdpListener] M-SEARCH for " << target << " failed\n";

            std::this_thread::sleep_for(SEARCH_SPACING);
        }
    }

    void SsdpListener::ReceiveLoop()
    {
        auto last_search = std::chrono::steady_clock::time_point::min();

        while (m_running)
        {
            auto now = std::chrono::steady_clock::now();
            if (last_search == std::chrono::steady_clock::time_point::min() || now - last_search >= SEARCH_INTERVAL)
            {
                SendSearches();
                last_search = now;
            }

            auto datagram = lan_sweep::common::ReceiveDatagram(m_socket.Get(), MAX_PACKET);
            if (!datagram)
                continue;

            try
            {
                std::string response(datagram->data.begin(), datagram->data.end());
                auto location = ssdp::ParseLocation(response);
                if (location && EnqueueFetch(datagram->source_ip, *location))
                    std::cout << "[SsdpListener] " << datagram->source_ip << " LOCATION: " << *location << "\n";
            }
            catch (const std::exception &e)
            {
                std::cerr << "[SsdpListener] Dropping response from " << datagram->source_ip << ": " << e.what() << "\n";
            }
        }

        m_socket.Reset();
        std::cout << "[SsdpListener] Stopped\n";
    }

    void SsdpListener::FetchLoop()
    {
        while (m_running)
        {
            DescriptionFetch job;

            {
                std::unique_lock<std::mutex> lock(m_fetch_mutex);
                m_fetch_cv.wait(lock, [this]
                                { return !m_fetch_queue.empty() || !m_running; });

                if (!m_running)
                    break;

                job = m_fetch_queue.front();
                m_fetch_queue.pop();
            }

            try
            {
                FetchDescription(job);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[SsdpListener] Description fetch for " << job.ip << " failed: " << e.what() << "\n";
            }

            std::lock_guard<std::mutex> lock(m_fetch_mutex);
            m_pending_ips.erase(job.ip);
        }
    }

    void SsdpListener::FetchDescription(const DescriptionFetch &job)
    {
        auto description = HttpClient::Get(job.location, FETCH_TIMEOUT_MS);
        if (description && description->status == 200)
        {
            if (auto name = ssdp::ParseDeviceDescription(description->body))
                Record(job.ip, *name);
        }

        if (!m_running)
            return;

        HttpUrl roku;
        roku.host = job.ip;
        roku.port = ssdp::ROKU_ECP_PORT;
        roku.path = ssdp::ROKU_DEVICE_INFO_PATH;

        auto device_info = HttpClient::Get(roku, FETCH_TIMEOUT_MS);
        if (device_info && device_info->status == 200)
        {
            if (auto name = ssdp::ParseRokuDeviceInfo(device_info->body, false))
                Record(job.ip, *name);
        }
    }

    void SsdpListener::Record(const std::string &ip, const std::string &name)
    {
        if (!m_cache.Put(ip, name))
            return;

        std::cout << "[SsdpListener] " << ip << " -> " << name << "\n";
        if (m_callback)
            m_callback(ip, name);
    }
}
