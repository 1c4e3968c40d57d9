#include "PassiveDiscovery.hpp"
#include <iostream>
#include <stdexcept>

namespace lan_sweep::discovery
{
    PassiveDiscovery::PassiveDiscovery() : m_mdns(m_mdns_cache), m_ssdp(m_ssdp_cache)
    {
    }

    PassiveDiscovery::~PassiveDiscovery()
    {
        StopAll();
    }

    bool PassiveDiscovery::StartListener(const char *label, PassiveListener &listener, const DiscoveryCallback &callback)
    {
        try
        {
            listener.Start(callback);
            return true;
        }
        catch (const std::runtime_error &e)
        {
            std::cerr << "[PassiveDiscovery] " << label << " listener unavailable: " << e.what() << "\n";
            return false;
        }
    }

    int PassiveDiscovery::StartAll(const DiscoveryCallback &callback)
    {
        int started = 0;
        if (StartListener("mDNS", m_mdns, callback))
            started++;
        if (StartListener("SSDP", m_ssdp, callback))
            started++;
        return started;
    }

    void PassiveDiscovery::StopAll()
    {
        m_mdns.Stop();
        m_ssdp.Stop();
    }

    bool PassiveDiscovery::IsRunning() const
    {
        return m_mdns.IsRunning() || m_ssdp.IsRunning();
    }
}
