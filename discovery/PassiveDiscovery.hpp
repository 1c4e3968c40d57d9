#pragma once

#include "MdnsListener.hpp"
#include "NameCache.hpp"
#include "SsdpListener.hpp"

namespace lan_sweep::discovery
{
    // Owns the mDNS and SSDP listeners together with the caches they fill.
    class PassiveDiscovery
    {
    public:
        PassiveDiscovery();
        ~PassiveDiscovery();

        PassiveDiscovery(const PassiveDiscovery &) = delete;
        PassiveDiscovery &operator=(const PassiveDiscovery &) = delete;

        // Listeners that fail to set up are logged and skipped. Returns how many started.
        int StartAll(const DiscoveryCallback &callback);
        void StopAll();

        bool IsRunning() const;

        const NameCache &SsdpCache() const { return m_ssdp_cache; }
        const NameCache &MdnsCache() const { return m_mdns_cache; }

        MdnsListener &Mdns() { return m_mdns; }
        SsdpListener &Ssdp() { return m_ssdp; }

    private:
        static bool StartListener(const char *label, PassiveListener &listener, const DiscoveryCallback &callback);

        // Declared before the listeners, which hold references to them.
        NameCache m_ssdp_cache;
        NameCache m_mdns_cache;
        MdnsListener m_mdns;
        SsdpListener m_ssdp;
    };
}
