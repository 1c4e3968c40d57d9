#pragma once

#include <functional>
#include <string>

namespace lan_sweep::discovery
{
    // Invoked from the listener thread whenever a cached name is added or changed.
    using DiscoveryCallback = std::function<void(const std::string &ip, const std::string &name)>;

    class PassiveListener
    {
    public:
        virtual ~PassiveListener() = default;

        // Throws std::runtime_error when the socket cannot be set up.
        virtual void Start(DiscoveryCallback callback) = 0;

        // Blocks until the listener threads have exited and the socket is closed.
        virtual void Stop() = 0;

        virtual bool IsRunning() const = 0;
    };
}
