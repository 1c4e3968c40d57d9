#pragma once

#include <condition_variable>
#include <mutex>

namespace lan_sweep::common
{
    class CountingSemaphore
    {
    private:
        std::mutex m_mutex;
        std::condition_variable m_cv;
        int m_permits;

    public:
        explicit CountingSemaphore(int permits) : m_permits(permits > 0 ? permits : 1) {}

        CountingSemaphore(const CountingSemaphore &) = delete;
        CountingSemaphore &operator=(const CountingSemaphore &) = delete;

        void Acquire()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]
                      { return m_permits > 0; });
            m_permits--;
        }

        void Release()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_permits++;
            }
            m_cv.notify_one();
        }

        int Available()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_permits;
        }
    };

    // Releases one permit when it goes out of scope.
    class PermitGuard
    {
    public:
        explicit PermitGuard(CountingSemaphore &sem) : m_sem(sem) {}
        ~PermitGuard() { m_sem.Release(); }

        PermitGuard(const PermitGuard &) = delete;
        PermitGuard &operator=(const PermitGuard &) = delete;

    private:
        CountingSemaphore &m_sem;
    };
}
