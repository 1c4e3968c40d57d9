#pragma once

#include "DeviceRepository.hpp"
#include "HostProber.hpp"
#include "NameCache.hpp"
#include "NameResolver.hpp"
#include "ScanResult.hpp"
#include "../common/ThreadSafeQueue.hpp"
#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <thread>

namespace lan_sweep::discovery
{
    struct ScanOptions
    {
        int concurrency = 80;
        int timeoutMs = 500;
        int pingCount = 1;
    };

    struct ScanSummary
    {
        int scanned = 0;
        int alive = 0;
        int markedOffline = 0;
        bool cancelled = false;
    };

    using ResultCallback = std::function<void(const ScanResult &result)>;

    class CancellationToken
    {
    public:
        void Cancel() { m_cancelled = true; }
        bool IsCancelled() const { return m_cancelled; }

    private:
        std::atomic<bool> m_cancelled{false};
    };

    class ScanOrchestrator
    {
    public:
        ScanOrchestrator(LivenessProbe &prober,
                         NameDiscovery &resolver,
                         DeviceRepository &store,
                         const NameCache &ssdp_cache,
                         const NameCache &mdns_cache);

        // Emits exactly one result per address in the range, in completion order.
        // Callback invocations are serialized.
        ScanSummary Run(const std::string &cidr, const ScanOptions &options,
                        ResultCallback callback, const CancellationToken &token);

        ScanSummary Run(const std::string &cidr, const ScanOptions &options, ResultCallback callback);

    private:
        // Returns true when the host answered the liveness probe.
        bool ScanAddress(const std::string &ip, const ScanOptions &options,
                         const std::function<void(ScanResult)> &emit, const CancellationToken &token);

        LivenessProbe &m_prober;
        NameDiscovery &m_resolver;
        DeviceRepository &m_store;
        const NameCache &m_ssdp_cache;
        const NameCache &m_mdns_cache;
    };

    // Runs a scan on a background thread and hands its results out one at a time.
    class ScanSession
    {
    public:
        ScanSession(ScanOrchestrator &orchestrator, std::string cidr, ScanOptions options);
        ~ScanSession();

        ScanSession(const ScanSession &) = delete;
        ScanSession &operator=(const ScanSession &) = delete;

        // Blocks for the next result; nullopt once the scan has finished and every result was taken.
        std::optional<ScanResult> Next();

        void Cancel();

        // Joins the scan thread.
        ScanSummary Wait();

    private:
        lan_sweep::common::ThreadSafeQueue<ScanResult> m_results;
        CancellationToken m_token;
        ScanSummary m_summary;
        std::thread m_thread;
    };
}
