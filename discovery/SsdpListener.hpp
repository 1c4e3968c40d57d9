#pragma once

#include "NameCache.hpp"
#include "PassiveListener.hpp"
#include "../common/Socket.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <set>
#include <string>
#include <thread>

namespace lan_sweep::discovery
{
    struct DescriptionFetch
    {
        std::string ip;
        std::string location;
    };

    class SsdpListener : public PassiveListener
    {
    public:
        static constexpr int RECEIVE_TIMEOUT_MS = 3000;
        static constexpr int FETCH_TIMEOUT_MS = 3000;
        static constexpr std::size_t MAX_PENDING_FETCHES = 64;
        static constexpr std::chrono::seconds SEARCH_INTERVAL{60};
        static constexpr std::chrono::milliseconds SEARCH_SPACING{100};

        explicit SsdpListener(NameCache &cache);
        ~SsdpListener() override;

        SsdpListener(const SsdpListener &) = delete;
        SsdpListener &operator=(const SsdpListener &) = delete;

        void Start(DiscoveryCallback callback) override;
        void Stop() override;
        bool IsRunning() const override { return m_running; }

        // False when the queue is full or a fetch for that IP is already pending.
        bool EnqueueFetch(const std::string &ip, const std::string &location);

    private:
        void ReceiveLoop();
        void FetchLoop();
        void SendSearches();
        void FetchDescription(const DescriptionFetch &job);
        void Record(const std::string &ip, const std::string &name);

        NameCache &m_cache;
        DiscoveryCallback m_callback;
        std::atomic<bool> m_running;

        std::thread m_receive_thread;
        std::thread m_fetch_thread;
        lan_sweep::common::Socket m_socket;

        std::mutex m_fetch_mutex;
        std::condition_variable m_fetch_cv;
        std::queue<DescriptionFetch> m_fetch_queue;
        std::set<std::string> m_pending_ips;
    };
}
