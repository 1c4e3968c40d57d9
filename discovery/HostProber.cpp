#include "HostProber.hpp"
#include "../common/Random.hpp"
#include "../common/Socket.hpp"
#include <tins/tins.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

namespace lan_sweep::discovery
{
    static bool IsRoot()
    {
        return geteuid() == 0;
    }

    const std::vector<uint16_t> &HostProber::FallbackPorts()
    {
        static const std::vector<uint16_t> ports = {80, 443, 8060, 22, 23};
        return ports;
    }

    HostProber::HostProber() : m_ports(FallbackPorts()), m_use_echo(true)
    {
    }

    HostProber::HostProber(std::vector<uint16_t> fallback_ports, bool use_echo)
        : m_ports(std::move(fallback_ports)), m_use_echo(use_echo)
    {
    }

    ProbeOutcome HostProber::Probe(const std::string &host, int count, int timeout_ms)
    {
        ProbeOutcome outcome;
        auto start = std::chrono::steady_clock::now();

        bool echoed = false;
        if (m_use_echo)
            echoed = IsRoot() ? IcmpEcho(host, count, timeout_ms) : SystemPing(host, count, timeout_ms);

        if (echoed)
        {
            outcome.reachable = true;
            outcome.status = status::Icmp{};
            outcome.details = "ICMP echo reply";
        }
        else if (auto port = TcpConnect(host, timeout_ms))
        {
            outcome.reachable = true;
            outcome.status = status::Tcp{*port};
            outcome.details = "TCP port " + std::to_string(*port) + " open";
        }
        else
        {
            outcome.status = status::NoResponse{};
            outcome.details = "No response";
            return outcome;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        outcome.latencyMs = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
        return outcome;
    }

    bool HostProber::IcmpEcho(const std::string &host, int count, int timeout_ms)
    {
        try
        {
            Tins::NetworkInterface iface = Tins::NetworkInterface::default_interface();

            Tins::SnifferConfiguration config;
            config.set_promisc_mode(false);
            config.set_immediate_mode(true);
            config.set_filter("icmp[icmptype] == icmp-echoreply and src host " + host);
            config.set_timeout(std::max(1, timeout_ms));

            Tins::Sniffer sniffer(iface.name(), config);
            Tins::PacketSender sender;
            const uint16_t echo_id = lan_sweep::common::NextTransactionId();

            for (int attempt = 1; attempt <= std::max(1, count); ++attempt)
            {
                Tins::IP ip = Tins::IP(host) / Tins::ICMP();
                Tins::ICMP &icmp = ip.rfind_pdu<Tins::ICMP>();
                icmp.type(Tins::ICMP::ECHO_REQUEST);
                icmp.id(echo_id);
                icmp.sequence(static_cast<uint16_t>(attempt));
                sender.send(ip);

                // pcap reads block, so wait on the capture descriptor with our own deadline.
                auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
                while (true)
                {
                    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                         deadline - std::chrono::steady_clock::now())
                                         .count();
                    if (remaining <= 0)
                        break;

                    struct pollfd pfd = {sniffer.get_fd(), POLLIN, 0};
                    if (poll(&pfd, 1, static_cast<int>(remaining)) <= 0)
                        break;

                    Tins::PtrPacket packet = sniffer.next_packet();
                    if (!packet)
                        continue;

                    const Tins::ICMP *reply = packet.pdu()->find_pdu<Tins::ICMP>();
                    if (reply && reply->type() == Tins::ICMP::ECHO_REPLY && reply->id() == echo_id)
                        return true;
                }
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[HostProber] ICMP probe of " << host << " failed: " << e.what() << "\n";
        }
        return false;
    }

    bool HostProber::SystemPing(const std::string &host, int count, int timeout_ms)
    {
        const std::string count_arg = std::to_string(std::max(1, count));
        const std::string wait_arg = std::to_string(std::max(1, timeout_ms / 1000));

        pid_t pid = fork();
        if (pid < 0)
        {
            std::cerr << "[HostProber] fork failed for ping " << host << "\n";
            return false;
        }

        if (pid == 0)
        {
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0)
            {
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
                close(devnull);
            }
            execlp("ping", "ping", "-n", "-c", count_arg.c_str(), "-W", wait_arg.c_str(), host.c_str(),
                   static_cast<char *>(nullptr));
            _exit(127);
        }

        int wstatus = 0;
        while (waitpid(pid, &wstatus, 0) < 0)
        {
            if (errno != EINTR)
                return false;
        }
        return WIFEXITED(wstatus) && WEXITSTATUS(wstatus) == 0;
    }

    std::optional<uint16_t> HostProber::TcpConnect(const std::string &host, int timeout_ms)
    {
        for (uint16_t port : m_ports)
        {
            if (lan_sweep::common::ConnectTcp(host, port, timeout_ms))
                return port;
        }
        return std::nullopt;
    }
}
