#pragma once

#include "ScanResult.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lan_sweep::discovery
{
    struct ProbeOutcome
    {
        bool reachable = false;
        ProbeStatus status = status::NoResponse{};
        std::string details;
        std::optional<int64_t> latencyMs;
    };

    class LivenessProbe
    {
    public:
        virtual ~LivenessProbe() = default;
        virtual ProbeOutcome Probe(const std::string &host, int count, int timeout_ms) = 0;
    };

    // ICMP echo first, then a timed TCP connect to each fallback port.
    class HostProber : public LivenessProbe
    {
    public:
        HostProber();

        // An empty port list disables the TCP tier; use_echo false skips ICMP.
        HostProber(std::vector<uint16_t> fallback_ports, bool use_echo);

        ProbeOutcome Probe(const std::string &host, int count, int timeout_ms) override;

        static const std::vector<uint16_t> &FallbackPorts();

        const std::vector<uint16_t> &Ports() const { return m_ports; }

    private:
        std::vector<uint16_t> m_ports;
        bool m_use_echo;

        bool IcmpEcho(const std::string &host, int count, int timeout_ms);
        bool SystemPing(const std::string &host, int count, int timeout_ms);
        std::optional<uint16_t> TcpConnect(const std::string &host, int timeout_ms);
    };
}
