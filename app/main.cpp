#include "AppConfig.hpp"
#include "../common/AddressRange.hpp"
#include "../common/Clock.hpp"
#include "../discovery/HostProber.hpp"
#include "../discovery/LocalNetwork.hpp"
#include "../discovery/NameResolver.hpp"
#include "../discovery/PassiveDiscovery.hpp"
#include "../discovery/ScanOrchestrator.hpp"
#include "../discovery/ServicePorts.hpp"
#include "../storage/DeviceCategorizer.hpp"
#include "../storage/DeviceStore.hpp"
#include "../storage/PreferenceStore.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <thread>
#include <vector>

using namespace lan_sweep;

namespace
{
    volatile std::sig_atomic_t g_interrupted = 0;

    void HandleInterrupt(int)
    {
        g_interrupted = 1;
    }

    std::string FormatAge(int64_t age_ms)
    {
        const int64_t minutes = age_ms / 60000;
        if (minutes < 1)
            return "just now";
        if (minutes < 60)
            return std::to_string(minutes) + "m ago";
        if (minutes < 24 * 60)
            return std::to_string(minutes / 60) + "h ago";
        return std::to_string(minutes / (24 * 60)) + "d ago";
    }

    void PrintResult(const discovery::ScanResult &result)
    {
        std::cout << std::left << std::setw(16) << result.ip
                  << std::setw(18) << discovery::ToString(result.status);
        if (result.latencyMs)
            std::cout << std::setw(8) << (std::to_string(*result.latencyMs) + "ms");
        else
            std::cout << std::setw(8) << "-";
        std::cout << (result.hostname ? *result.hostname : "") << "\n";
    }

    void PrintDevices(storage::DeviceStore &store, int cutoff_days)
    {
        const int64_t now = common::NowMillis();
        auto categories = storage::CategorizeDevices(store.GetAllDevices(), now, cutoff_days);

        for (storage::DeviceState state : storage::AllDeviceStates())
        {
            const auto &devices = categories[state];
            if (devices.empty())
                continue;

            std::cout << "\n== " << storage::ToString(state) << " (" << devices.size() << ") ==\n";
            for (const auto &device : devices)
            {
                std::cout << "  " << std::left << std::setw(16) << device.ip
                          << std::setw(32) << device.displayName.value_or("Unknown Device")
                          << std::setw(14) << device.vendor.value_or("-")
                          << FormatAge(now - device.lastSeen) << "\n";
            }
        }
    }

    int RunScan(const app::AppConfig &config, storage::DeviceStore &store, storage::PreferenceStore &prefs)
    {
        std::string cidr;
        if (!config.arguments.empty())
        {
            cidr = config.arguments[0];
        }
        else
        {
            auto detected = discovery::LocalNetwork::DetectBestCidr();
            cidr = common::NormalizeToNetworkCidr(detected.value_or(discovery::FALLBACK_CIDR),
                                                  discovery::FALLBACK_CIDR);
        }

        discovery::NetworkIdentity current = discovery::LocalNetwork::CurrentNetwork(config.ssid);
        auto last = prefs.GetLastScannedNetwork();
        if (storage::CheckNetworkChanged(current, last))
        {
            std::cout << "[LanSweep] Network changed since the last scan (was "
                      << last->ssid.value_or(last->gatewayIp.value_or("unknown")) << ")\n";
        }

        discovery::PassiveDiscovery passive;
        if (config.passive)
            passive.StartAll(nullptr);

        discovery::HostProber prober;
        discovery::NameResolver resolver;
        discovery::ScanOrchestrator orchestrator(prober, resolver, store, passive.SsdpCache(), passive.MdnsCache());

        discovery::ScanOptions options;
        options.concurrency = config.concurrency;
        options.timeoutMs = config.timeoutMs;

        std::cout << "[LanSweep] Scanning " << cidr << "\n";
        const int64_t started = common::NowMillis();

        discovery::ScanSession session(orchestrator, cidr, options);

        std::atomic<bool> finished{false};
        std::thread interrupt_watcher([&session, &finished]()
        {
            while (!finished)
            {
                if (g_interrupted)
                {
                    session.Cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        while (auto result = session.Next())
            PrintResult(*result);

        discovery::ScanSummary summary = session.Wait();
        finished = true;
        interrupt_watcher.join();
        passive.StopAll();

        std::cout << "\n[LanSweep] " << summary.alive << " of " << summary.scanned << " hosts alive, "
                  << summary.markedOffline << " marked offline";
        if (summary.cancelled)
            std::cout << " (cancelled)";
        std::cout << "\n";

        if (!summary.cancelled && summary.scanned > 0)
        {
            if (!prefs.SaveScannedNetwork(current.ssid, current.gatewayIp, started))
                std::cerr << "[LanSweep] Could not record the scanned network\n";
            if (!prefs.HasCompletedFirstRun() && !prefs.SetFirstRunCompleted())
                std::cerr << "[LanSweep] Could not record first run\n";
            PrintDevices(store, config.cutoffDays);
        }
        return summary.cancelled ? 130 : 0;
    }

    int RunListen(const app::AppConfig &config)
    {
        discovery::PassiveDiscovery passive;
        int started = passive.StartAll([](const std::string &ip, const std::string &name)
        {
            std::cout << "  " << std::left << std::setw(16) << ip << name << "\n";
        });
        if (started == 0)
        {
            std::cerr << "[LanSweep] No listener could be started\n";
            return 1;
        }

        std::cout << "[LanSweep] Listening for " << config.listenSeconds << "s\n";
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config.listenSeconds);
        while (!g_interrupted && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        passive.StopAll();

        std::cout << "\n[LanSweep] mDNS: " << passive.MdnsCache().Size()
                  << " names, SSDP: " << passive.SsdpCache().Size() << " names\n";
        for (const auto *cache : {&passive.SsdpCache(), &passive.MdnsCache()})
        {
            for (const auto &[ip, name] : cache->Snapshot())
                std::cout << "  " << std::left << std::setw(16) << ip << name << "\n";
        }
        return 0;
    }

    int RunPing(const app::AppConfig &config)
    {
        const std::string &host = config.arguments[0];
        discovery::HostProber prober;
        discovery::ProbeOutcome outcome = prober.Probe(host, 1, config.timeoutMs);

        if (!outcome.reachable)
        {
            std::cout << "No response from " << host << " (ICMP blocked or host down)\n";
            return 1;
        }

        std::cout << host << ": " << outcome.details;
        if (outcome.latencyMs)
            std::cout << " in " << *outcome.latencyMs << "ms";
        std::cout << "\n";
        return 0;
    }

    int RunPorts(const app::AppConfig &config)
    {
        const std::string &host = config.arguments[0];
        auto ports = discovery::ServicePorts::Select(config.all, config.extraPorts);

        std::cout << "[LanSweep] Checking " << ports.size() << " ports on " << host << "\n";
        int open = 0;
        int risky = 0;
        for (const auto &check : discovery::ServicePorts::Check(host, ports, config.portTimeoutMs))
        {
            std::cout << "  " << std::left << std::setw(7) << check.service.port
                      << std::setw(16) << check.service.name
                      << (check.open ? "open" : "closed");
            if (check.open)
            {
                open++;
                if (check.service.vulnerable)
                {
                    risky++;
                    std::cout << "  (exposed service)";
                }
            }
            std::cout << "\n";
        }

        std::cout << "[LanSweep] " << open << " open, " << risky << " flagged\n";
        return 0;
    }
}

int main(int argc, char *argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);
    auto config = app::ParseArguments(args);
    if (!config)
    {
        std::cerr << app::Usage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, HandleInterrupt);

    if (config->command == app::Command::Listen)
        return RunListen(*config);
    if (config->command == app::Command::Ping)
        return RunPing(*config);
    if (config->command == app::Command::Ports)
        return RunPorts(*config);

    storage::DeviceStore store;
    storage::PreferenceStore prefs;
    if (!store.Initialize(config->dbPath) || !prefs.Initialize(config->dbPath))
    {
        std::cerr << "[LanSweep] Cannot open database " << config->dbPath << "\n";
        return 1;
    }

    switch (config->command)
    {
    case app::Command::Scan:
        return RunScan(*config, store, prefs);

    case app::Command::List:
        std::cout << "[LanSweep] " << store.GetDeviceCount() << " known devices\n";
        PrintDevices(store, config->cutoffDays);
        return 0;

    case app::Command::Rename:
    {
        const std::string &ip = config->arguments[0];
        std::optional<std::string> name;
        if (config->arguments.size() > 1)
            name = config->arguments[1];
        if (!store.SetCustomName(ip, name))
        {
            std::cerr << "[LanSweep] No device with IP " << ip << "\n";
            return 1;
        }
        std::cout << "[LanSweep] " << ip << (name ? " renamed to " + *name : " custom name cleared") << "\n";
        return 0;
    }

    case app::Command::Forget:
        if (!store.DeleteDevice(config->arguments[0]))
        {
            std::cerr << "[LanSweep] No device with IP " << config->arguments[0] << "\n";
            return 1;
        }
        return 0;

    case app::Command::Clear:
        if (!store.ClearAllDevices() || !prefs.ClearLastScannedNetwork())
        {
            std::cerr << "[LanSweep] Clearing history failed\n";
            return 1;
        }
        std::cout << "[LanSweep] History cleared\n";
        return 0;

    case app::Command::Listen:
    case app::Command::Ping:
    case app::Command::Ports:
        break;
    }
    return 0;
}
