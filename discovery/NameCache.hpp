#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace lan_sweep::discovery
{
    // IP -> name map written by a passive listener and read by scan workers.
    class NameCache
    {
    private:
        std::map<std::string, std::string> m_names;
        mutable std::mutex m_mutex;

    public:
        NameCache() = default;
        NameCache(const NameCache &) = delete;
        NameCache &operator=(const NameCache &) = delete;

        std::optional<std::string> Get(const std::string &ip) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_names.find(ip);
            if (it == m_names.end())
                return std::nullopt;
            return it->second;
        }

        // Returns true when the stored name changed.
        bool Put(const std::string &ip, const std::string &name)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto &slot = m_names[ip];
            if (slot == name)
                return false;
            slot = name;
            return true;
        }

        std::size_t Size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_names.size();
        }

        void Clear()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_names.clear();
        }

        std::map<std::string, std::string> Snapshot() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_names;
        }
    };
}
