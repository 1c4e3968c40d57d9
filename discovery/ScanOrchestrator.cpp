#include "ScanOrchestrator.hpp"
#include "../common/AddressRange.hpp"
#include "../common/Clock.hpp"
#include "../common/Semaphore.hpp"
#include <iostream>
#include <mutex>
#include <system_error>
#include <vector>

namespace lan_sweep::discovery
{
    using lan_sweep::common::CountingSemaphore;
    using lan_sweep::common::PermitGuard;

    ScanOrchestrator::ScanOrchestrator(LivenessProbe &prober,
                                       NameDiscovery &resolver,
                                       DeviceRepository &store,
                                       const NameCache &ssdp_cache,
                                       const NameCache &mdns_cache)
        : m_prober(prober), m_resolver(resolver), m_store(store),
          m_ssdp_cache(ssdp_cache), m_mdns_cache(mdns_cache)
    {
    }

    ScanSummary ScanOrchestrator::Run(const std::string &cidr, const ScanOptions &options, ResultCallback callback)
    {
        CancellationToken token;
        return Run(cidr, options, std::move(callback), token);
    }

    ScanSummary ScanOrchestrator::Run(const std::string &cidr, const ScanOptions &options,
                                      ResultCallback callback, const CancellationToken &token)
    {
        ScanSummary summary;
        std::mutex emit_mutex;
        std::atomic<int> scanned{0};
        std::atomic<int> alive{0};

        auto emit = [&](ScanResult result)
        {
            std::lock_guard<std::mutex> lock(emit_mutex);
            scanned++;
            if (!callback)
                return;
            try
            {
                callback(result);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Scanner] Result callback failed for " << result.ip << ": " << e.what() << "\n";
            }
        };

        auto parsed = lan_sweep::common::ParseCidrRange(cidr);
        if (!parsed.Ok())
        {
            ScanResult result;
            result.ip = cidr;
            if (parsed.error == lan_sweep::common::CidrError::NetworkTooLarge)
                result.status = status::NetworkTooLarge{};
            else
                result.status = status::InvalidCidr{};
            result.details = lan_sweep::common::DescribeCidrError(parsed);

            std::cerr << "[Scanner] Rejected " << cidr << ": " << result.details << "\n";
            emit(result);
            summary.scanned = scanned;
            return summary;
        }

        const int64_t scan_start = lan_sweep::common::NowMillis();
        const auto &range = parsed.range;
        std::cout << "[Scanner] Sweeping " << cidr << " (" << lan_sweep::common::IntToIp(range.first)
                  << " - " << lan_sweep::common::IntToIp(range.last) << ") with concurrency "
                  << options.concurrency << "\n";

        CountingSemaphore permits(options.concurrency);
        std::vector<std::thread> workers;
        workers.reserve(static_cast<std::size_t>(range.last - range.first) + 1);

        for (uint32_t address = range.first;; ++address)
        {
            if (token.IsCancelled())
                break;

            permits.Acquire();
            if (token.IsCancelled())
            {
                permits.Release();
                break;
            }

            const std::string ip = lan_sweep::common::IntToIp(address);
            try
            {
                workers.emplace_back([this, ip, &options, &emit, &token, &permits, &alive]
                                     {
                    PermitGuard guard(permits);
                    if (ScanAddress(ip, options, emit, token))
                        alive++; });
            }
            catch (const std::system_error &e)
            {
                permits.Release();
                ScanResult result;
                result.ip = ip;
                result.status = status::Error{};
                result.details = e.what();
                emit(result);
            }

            if (address == range.last)
                break;
        }

        for (auto &worker : workers)
        {
            if (worker.joinable())
                worker.join();
        }

        summary.scanned = scanned;
        summary.alive = alive;
        summary.cancelled = token.IsCancelled();

        if (summary.cancelled)
        {
            std::cout << "[Scanner] Scan of " << cidr << " cancelled after " << summary.scanned << " results\n";
            return summary;
        }

        summary.markedOffline = m_store.MarkOfflineSince(scan_start);
        std::cout << "[Scanner] Scan of " << cidr << " complete: " << summary.alive << " alive, "
                  << summary.markedOffline << " marked offline\n";
        return summary;
    }

    bool ScanOrchestrator::ScanAddress(const std::string &ip, const ScanOptions &options,
                                       const std::function<void(ScanResult)> &emit, const CancellationToken &token)
    {
        if (token.IsCancelled())
            return false;

        bool emitted = false;
        bool reachable = false;
        ScanResult result;
        result.ip = ip;

        try
        {
            ProbeOutcome outcome = m_prober.Probe(ip, options.pingCount, options.timeoutMs);
            if (!outcome.reachable)
            {
                result.status = status::NoResponse{};
                result.details = outcome.details;
                emit(result);
                emitted = true;
            }
            else
            {
                reachable = true;
                DeviceNames names = m_resolver.Resolve(ip, options.timeoutMs);
                if (!names.ssdp)
                    names.ssdp = m_ssdp_cache.Get(ip);
                if (!names.mdns)
                    names.mdns = m_mdns_cache.Get(ip);

                auto best_name = names.GetBestName();
                auto vendor = ExtractVendor(names);

                if (!m_store.UpsertDevice(ip, names, vendor, lan_sweep::common::NowMillis()))
                    std::cerr << "[Scanner] Could not persist " << ip << ", continuing\n";

                result.status = outcome.status;
                result.details = names.ToDebugString();
                result.latencyMs = outcome.latencyMs;
                result.hostname = best_name;
                emit(result);
                emitted = true;
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Scanner] " << ip << " failed: " << e.what() << "\n";
            result.status = status::Error{};
            result.details = e.what();
            result.latencyMs.reset();
            result.hostname.reset();
            emit(result);
            emitted = true;
        }

        if (!emitted)
        {
            result.status = status::Unknown{};
            result.details = "No emission path taken";
            emit(result);
        }
        return reachable;
    }

    ScanSession::ScanSession(ScanOrchestrator &orchestrator, std::string cidr, ScanOptions options)
    {
        m_thread = std::thread([this, &orchestrator, cidr = std::move(cidr), options]
                               {
            m_summary = orchestrator.Run(cidr, options, [this](const ScanResult &result)
                                         { m_results.Push(result); }, m_token);
            m_results.Shutdown(); });
    }

    ScanSession::~ScanSession()
    {
        Cancel();
        if (m_thread.joinable())
            m_thread.join();
    }

    std::optional<ScanResult> ScanSession::Next()
    {
        return m_results.Pop();
    }

    void ScanSession::Cancel()
    {
        m_token.Cancel();
    }

    ScanSummary ScanSession::Wait()
    {
        if (m_thread.joinable())
            m_thread.join();
        return m_summary;
    }
}
