#include "ServicePorts.hpp"
#include "../common/Socket.hpp"
#include <algorithm>
#include <future>
#include <iostream>

namespace lan_sweep::discovery
{
    const std::vector<ServicePort> &ServicePorts::Table()
    {
        static const std::vector<ServicePort> table = {
            {22, "SSH", false, true},
            {23, "Telnet", true, true},
            {80, "HTTP", false, true},
            {443, "HTTPS", false, true},
            {445, "SMB", true, true},
            {3389, "RDP", true, true},
            {3306, "MySQL", true, true},
            {5432, "PostgreSQL", true, true},
            {6379, "Redis", true, true},
            {27017, "MongoDB", true, true},
            {21, "FTP", true, false},
            {25, "SMTP", false, false},
            {53, "DNS", false, false},
            {110, "POP3", false, false},
            {143, "IMAP", false, false},
            {5900, "VNC", true, false},
            {8080, "HTTP-Alt", false, false},
            {9200, "Elasticsearch", true, false}};
        return table;
    }

    std::vector<ServicePort> ServicePorts::Select(bool all, const std::vector<uint16_t> &extra_ports)
    {
        std::vector<ServicePort> selected;
        for (const auto &service : Table())
        {
            if (all || service.selectedByDefault)
                selected.push_back(service);
        }

        for (uint16_t port : extra_ports)
        {
            auto same_port = [port](const ServicePort &service)
            { return service.port == port; };
            if (std::any_of(selected.begin(), selected.end(), same_port))
                continue;

            auto known = std::find_if(Table().begin(), Table().end(), same_port);
            if (known != Table().end())
                selected.push_back(*known);
            else
                selected.push_back({port, "Custom-" + std::to_string(port), false, true});
        }
        return selected;
    }

    std::vector<PortCheck> ServicePorts::Check(const std::string &ip, const std::vector<ServicePort> &ports, int timeout_ms)
    {
        std::vector<std::future<bool>> pending;
        pending.reserve(ports.size());
        for (const auto &service : ports)
        {
            const uint16_t port = service.port;
            pending.push_back(std::async(std::launch::async, [ip, port, timeout_ms]
                                         { return lan_sweep::common::ConnectTcp(ip, port, timeout_ms).has_value(); }));
        }

        std::vector<PortCheck> results;
        results.reserve(ports.size());
        for (std::size_t i = 0; i < ports.size(); ++i)
        {
            PortCheck check;
            check.service = ports[i];
            check.open = pending[i].get();
            if (check.open)
                std::cout << "[ServicePorts] " << ip << " " << check.service.name << " port " << check.service.port << " open\n";
            results.push_back(check);
        }
        return results;
    }
}
