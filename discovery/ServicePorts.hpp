#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lan_sweep::discovery
{
    struct ServicePort
    {
        uint16_t port = 0;
        std::string name;
        bool vulnerable = false;        // exposed service worth flagging when open
        bool selectedByDefault = false;
    };

    struct PortCheck
    {
        ServicePort service;
        bool open = false;
    };

    class ServicePorts
    {
    public:
        static constexpr int PROBE_TIMEOUT_MS = 3000;

        static const std::vector<ServicePort> &Table();

        // Default selection, or the whole table when all is set. Extra ports not in the
        // table are appended as "Custom-<port>"; duplicates are ignored.
        static std::vector<ServicePort> Select(bool all, const std::vector<uint16_t> &extra_ports);

        // Timed TCP connect to every port concurrently; results keep the input order.
        static std::vector<PortCheck> Check(const std::string &ip, const std::vector<ServicePort> &ports, int timeout_ms);
    };
}
