#pragma once

#include "NameCache.hpp"
#include "PassiveListener.hpp"
#include "../common/Socket.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace lan_sweep::discovery
{
    class MdnsListener : public PassiveListener
    {
    public:
        static constexpr int RECEIVE_TIMEOUT_MS = 1000;
        static constexpr std::chrono::seconds BROWSE_INTERVAL{60};

        explicit MdnsListener(NameCache &cache);
        ~MdnsListener() override;

        MdnsListener(const MdnsListener &) = delete;
        MdnsListener &operator=(const MdnsListener &) = delete;

        void Start(DiscoveryCallback callback) override;
        void Stop() override;
        bool IsRunning() const override { return m_running; }

        static const std::vector<std::string> &BrowseServices();

    private:
        void ReceiveLoop();
        void SendBrowseQueries();
        void HandlePacket(const std::vector<uint8_t> &packet, const std::string &source_ip);
        void LeaveGroup();

        NameCache &m_cache;
        DiscoveryCallback m_callback;
        std::atomic<bool> m_running;
        std::thread m_thread;
        lan_sweep::common::Socket m_socket;
    };
}
