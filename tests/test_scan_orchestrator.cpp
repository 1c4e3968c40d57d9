#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../discovery/ScanOrchestrator.hpp"
#include "../storage/DeviceStore.hpp"
#include <atomic>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <unistd.h>

using namespace lan_sweep::discovery;
using lan_sweep::storage::DeviceStatus;
using lan_sweep::storage::DeviceStore;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class MockLivenessProbe : public LivenessProbe {
public:
    MOCK_METHOD(ProbeOutcome, Probe, (const std::string& host, int count, int timeout_ms), (override));
};

class MockNameDiscovery : public NameDiscovery {
public:
    MOCK_METHOD(DeviceNames, Resolve, (const std::string& ip, int timeout_ms), (override));
};

class ScanOrchestratorTest : public ::testing::Test {
protected:
    std::string temp_dir;
    DeviceStore store_;
    NameCache ssdp_cache_;
    NameCache mdns_cache_;
    NiceMock<MockLivenessProbe> prober_;
    NiceMock<MockNameDiscovery> resolver_;
    std::vector<ScanResult> results_;

    void SetUp() override {
        char template_path[] = "/tmp/scan_orchestrator_test_XXXXXX";
        char* created = mkdtemp(template_path);
        ASSERT_NE(created, nullptr);
        temp_dir = created;
        ASSERT_TRUE(store_.Initialize(temp_dir + "/devices.db"));
    }

    void TearDown() override {
        store_.Shutdown();
        std::filesystem::remove_all(temp_dir);
    }

    ScanOrchestrator make_orchestrator() {
        return ScanOrchestrator(prober_, resolver_, store_, ssdp_cache_, mdns_cache_);
    }

    ResultCallback collector() {
        return [this](const ScanResult& result) { results_.push_back(result); };
    }

    static ProbeOutcome tcp_alive(uint16_t port, int64_t latency) {
        ProbeOutcome outcome;
        outcome.reachable = true;
        outcome.status = status::Tcp{port};
        outcome.details = "TCP port " + std::to_string(port) + " open";
        outcome.latencyMs = latency;
        return outcome;
    }

    static ProbeOutcome icmp_alive() {
        ProbeOutcome outcome;
        outcome.reachable = true;
        outcome.status = status::Icmp{};
        outcome.details = "ICMP echo reply";
        outcome.latencyMs = 1;
        return outcome;
    }

    const ScanResult* find_result(const std::string& ip) const {
        for (const auto& result : results_) {
            if (result.ip == ip) return &result;
        }
        return nullptr;
    }
};

TEST_F(ScanOrchestratorTest, SweepsEveryHostAndPersistsOnlyLiveOnes) {
    DeviceNames names;
    names.ssdp = "Office Printer";
    names.httpServer = "HP-ChaiSOE/1.0";

    EXPECT_CALL(prober_, Probe("10.0.0.1", 1, 500)).WillOnce(Return(tcp_alive(80, 5)));
    EXPECT_CALL(prober_, Probe("10.0.0.2", 1, 500)).WillOnce(Return(ProbeOutcome{}));
    EXPECT_CALL(resolver_, Resolve("10.0.0.1", 500)).WillOnce(Return(names));
    EXPECT_CALL(resolver_, Resolve("10.0.0.2", _)).Times(0);

    auto orchestrator = make_orchestrator();
    ScanSummary summary = orchestrator.Run("10.0.0.0/30", ScanOptions{}, collector());

    ASSERT_EQ(results_.size(), 2u);
    EXPECT_EQ(summary.scanned, 2);
    EXPECT_EQ(summary.alive, 1);
    EXPECT_FALSE(summary.cancelled);

    const ScanResult* live = find_result("10.0.0.1");
    ASSERT_NE(live, nullptr);
    EXPECT_EQ(ToString(live->status), "TCP:80");
    EXPECT_EQ(live->hostname, std::optional<std::string>("Office Printer"));
    EXPECT_EQ(live->latencyMs, std::optional<int64_t>(5));
    EXPECT_NE(live->details.find("SSDP:Office Printer"), std::string::npos);

    const ScanResult* dead = find_result("10.0.0.2");
    ASSERT_NE(dead, nullptr);
    EXPECT_TRUE(std::holds_alternative<status::NoResponse>(dead->status));
    EXPECT_FALSE(dead->hostname.has_value());

    EXPECT_EQ(store_.GetDeviceCount(), 1);
    auto stored = store_.GetDevice("10.0.0.1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->vendor, std::optional<std::string>("HP"));
    EXPECT_EQ(stored->displayName, std::optional<std::string>("Office Printer"));
}

TEST_F(ScanOrchestratorTest, InvalidCidrYieldsSingleResult) {
    EXPECT_CALL(prober_, Probe(_, _, _)).Times(0);

    auto orchestrator = make_orchestrator();
    ScanSummary summary = orchestrator.Run("not-a-network", ScanOptions{}, collector());

    ASSERT_EQ(results_.size(), 1u);
    EXPECT_EQ(results_[0].ip, "not-a-network");
    EXPECT_TRUE(std::holds_alternative<status::InvalidCidr>(results_[0].status));
    EXPECT_EQ(results_[0].details, "Use format like 10.0.0.0/24");
    EXPECT_EQ(summary.scanned, 1);
    EXPECT_EQ(summary.alive, 0);
}

TEST_F(ScanOrchestratorTest, TooLargeNetworkYieldsSingleResult) {
    EXPECT_CALL(prober_, Probe(_, _, _)).Times(0);

    auto orchestrator = make_orchestrator();
    orchestrator.Run("10.0.0.0/16", ScanOptions{}, collector());

    ASSERT_EQ(results_.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<status::NetworkTooLarge>(results_[0].status));
    EXPECT_NE(results_[0].details.find("65,534"), std::string::npos);
}

TEST_F(ScanOrchestratorTest, UnseenDevicesAreMarkedOffline) {
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.2", DeviceNames{}, std::nullopt, 1));
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.99", DeviceNames{}, std::nullopt, 1));

    ON_CALL(prober_, Probe("10.0.0.1", _, _)).WillByDefault(Return(icmp_alive()));
    ON_CALL(resolver_, Resolve(_, _)).WillByDefault(Return(DeviceNames{}));

    auto orchestrator = make_orchestrator();
    ScanSummary summary = orchestrator.Run("10.0.0.0/30", ScanOptions{}, collector());

    EXPECT_EQ(summary.markedOffline, 2);
    EXPECT_EQ(store_.GetDevice("10.0.0.1")->status, DeviceStatus::Online);
    EXPECT_EQ(store_.GetDevice("10.0.0.2")->status, DeviceStatus::Offline);
    EXPECT_EQ(store_.GetDevice("10.0.0.99")->status, DeviceStatus::Offline);
}

TEST_F(ScanOrchestratorTest, CancelledScanSkipsOfflineSweep) {
    ASSERT_TRUE(store_.UpsertDevice("10.0.0.50", DeviceNames{}, std::nullopt, 1));
    EXPECT_CALL(prober_, Probe(_, _, _)).Times(0);

    CancellationToken token;
    token.Cancel();

    auto orchestrator = make_orchestrator();
    ScanSummary summary = orchestrator.Run("10.0.0.0/24", ScanOptions{}, collector(), token);

    EXPECT_TRUE(summary.cancelled);
    EXPECT_EQ(summary.scanned, 0);
    EXPECT_EQ(summary.markedOffline, 0);
    EXPECT_TRUE(results_.empty());
    EXPECT_EQ(store_.GetDevice("10.0.0.50")->status, DeviceStatus::Online);
}

TEST_F(ScanOrchestratorTest, PassiveCachesFillMissingNames) {
    ssdp_cache_.Put("10.0.0.1", "Cached TV");
    mdns_cache_.Put("10.0.0.1", "cached-host");

    DeviceNames active;
    active.mdns = "active-host";

    ON_CALL(prober_, Probe("10.0.0.1", _, _)).WillByDefault(Return(icmp_alive()));
    EXPECT_CALL(resolver_, Resolve("10.0.0.1", _)).WillOnce(Return(active));

    auto orchestrator = make_orchestrator();
    orchestrator.Run("10.0.0.1/32", ScanOptions{}, collector());

    ASSERT_EQ(results_.size(), 1u);
    EXPECT_EQ(results_[0].hostname, std::optional<std::string>("Cached TV"));

    auto stored = store_.GetDevice("10.0.0.1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->ssdpName, std::optional<std::string>("Cached TV"));
    EXPECT_EQ(stored->mdnsName, std::optional<std::string>("active-host"));
}

TEST_F(ScanOrchestratorTest, ReachabilityFailureEmitsError) {
    EXPECT_CALL(prober_, Probe("10.0.0.1", _, _)).WillOnce(Throw(std::runtime_error("socket exhausted")));
    EXPECT_CALL(prober_, Probe("10.0.0.2", _, _)).WillOnce(Return(icmp_alive()));
    ON_CALL(resolver_, Resolve(_, _)).WillByDefault(Return(DeviceNames{}));

    auto orchestrator = make_orchestrator();
    ScanSummary summary = orchestrator.Run("10.0.0.0/30", ScanOptions{}, collector());

    ASSERT_EQ(results_.size(), 2u);
    const ScanResult* failed = find_result("10.0.0.1");
    ASSERT_NE(failed, nullptr);
    EXPECT_TRUE(std::holds_alternative<status::Error>(failed->status));
    EXPECT_EQ(failed->details, "socket exhausted");
    EXPECT_EQ(summary.alive, 1);
}

TEST_F(ScanOrchestratorTest, ThrowingCallbackDoesNotStopScan) {
    auto orchestrator = make_orchestrator();
    int calls = 0;
    ScanSummary summary = orchestrator.Run("10.0.0.0/29", ScanOptions{}, [&calls](const ScanResult&) {
        calls++;
        throw std::runtime_error("display gone");
    });
    EXPECT_EQ(calls, 6);
    EXPECT_EQ(summary.scanned, 6);
}

TEST_F(ScanOrchestratorTest, ConcurrencyIsBounded) {
    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};

    ON_CALL(prober_, Probe(_, _, _)).WillByDefault(Invoke([&](const std::string&, int, int) {
        int now = ++in_flight;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        --in_flight;
        return ProbeOutcome{};
    }));

    ScanOptions options;
    options.concurrency = 3;
    auto orchestrator = make_orchestrator();
    ScanSummary summary = orchestrator.Run("10.0.0.0/28", options, collector());

    EXPECT_EQ(summary.scanned, 14);
    EXPECT_EQ(results_.size(), 14u);
    EXPECT_LE(peak.load(), 3);
}

TEST_F(ScanOrchestratorTest, SessionStreamsResults) {
    ON_CALL(prober_, Probe("10.0.0.1", _, _)).WillByDefault(Return(tcp_alive(22, 3)));
    ON_CALL(resolver_, Resolve(_, _)).WillByDefault(Return(DeviceNames{}));

    auto orchestrator = make_orchestrator();
    ScanSession session(orchestrator, "10.0.0.0/30", ScanOptions{});

    std::vector<std::string> seen;
    while (auto result = session.Next())
        seen.push_back(result->ip);

    ScanSummary summary = session.Wait();
    EXPECT_EQ(seen.size(), 2u);
    EXPECT_EQ(summary.scanned, 2);
    EXPECT_EQ(summary.alive, 1);
}
