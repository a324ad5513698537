/**
 * @file test_monitoring_scheduler.cpp
 * @brief Unit tests for per-device monitoring ticks
 *
 * Tests cover:
 * - Latency events and metrics from a probe burst
 * - Up/down transitions published before the latency event
 * - last_seen handling on total loss
 * - Interface counter polling and bandwidth on the second tick
 * - Loss ceiling and constructor validation
 * - Status writes that leave concurrent discovery updates intact
 * - Bandwidth only across consecutive ticks
 * - Overlapping ticks for one device rejected
 */

#include <gtest/gtest.h>

#include "monitor/MonitoringScheduler.hpp"
#include "storage/SqliteStore.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>

using namespace lanwatch;
using namespace lanwatch::monitor;
using namespace std::chrono_literals;

namespace {

class FakeInventory : public storage::InventorySink {
public:
    std::optional<common::Device> Get(const std::string &id) override {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = devices.find(id);
        if (it == devices.end())
            return std::nullopt;
        return it->second;
    }

    std::vector<common::Device> List() override {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<common::Device> out;
        for (const auto &pair : devices)
            out.push_back(pair.second);
        return out;
    }

    bool Upsert(const common::Device &device) override {
        std::lock_guard<std::mutex> lock(mutex);
        devices[device.id] = device;
        return true;
    }

    bool UpdateStatus(const std::string &id, common::DeviceStatus status,
                      std::optional<common::Timestamp> last_seen) override {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = devices.find(id);
        if (it == devices.end())
            return false;
        it->second.status = status;
        if (last_seen && *last_seen > it->second.last_seen)
            it->second.last_seen = *last_seen;
        return true;
    }

    std::mutex mutex;
    std::map<std::string, common::Device> devices;
};

class FakeMetrics : public storage::MetricsSink {
public:
    struct Row {
        std::string measurement;
        storage::MetricTags tags;
        storage::MetricFields fields;
    };

    bool Write(const std::string &measurement, const storage::MetricTags &tags,
               const storage::MetricFields &fields, common::Timestamp) override {
        std::lock_guard<std::mutex> lock(mutex);
        rows.push_back({measurement, tags, fields});
        return true;
    }

    size_t Count(const std::string &measurement) {
        std::lock_guard<std::mutex> lock(mutex);
        size_t n = 0;
        for (const auto &row : rows)
            if (row.measurement == measurement)
                ++n;
        return n;
    }

    std::mutex mutex;
    std::vector<Row> rows;
};

// Replies from a script; once the script runs out, every probe repeats the fallback.
class ScriptedProber : public ReachabilityProber {
public:
    std::optional<double> Probe(const std::string &, std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (script.empty())
            return fallback;
        auto next = script.front();
        script.pop_front();
        return next;
    }

    void Set(std::vector<std::optional<double>> replies) {
        std::lock_guard<std::mutex> lock(mutex);
        script.assign(replies.begin(), replies.end());
    }

    std::mutex mutex;
    std::deque<std::optional<double>> script;
    std::optional<double> fallback = 1.0;
};

// Each call advances the counters of a single interface by a fixed step.
class CountingManagement : public identify::ManagementClient {
public:
    std::optional<identify::SystemInfo> Identify(const std::string &) override {
        return std::nullopt;
    }

    std::vector<identify::InterfaceEntry> InterfaceTable(const std::string &) override {
        std::lock_guard<std::mutex> lock(mutex);
        ++calls;
        identify::InterfaceEntry entry;
        entry.if_index = 2;
        entry.if_descr = "eth0";
        entry.in_octets = 1000 * calls;
        entry.out_octets = 500 * calls;
        return {entry};
    }

    std::mutex mutex;
    std::uint64_t calls = 0;
};

// Runs a callback on the first probe, as a discovery cycle writing mid-burst would.
class InterruptingProber : public ReachabilityProber {
public:
    std::optional<double> Probe(const std::string &, std::chrono::milliseconds) override {
        if (on_first_probe) {
            auto callback = std::move(on_first_probe);
            on_first_probe = nullptr;
            callback();
        }
        return 1.0;
    }

    std::function<void()> on_first_probe;
};

// Holds the first probe until Release(), so a tick can be kept in flight.
class GatedProber : public ReachabilityProber {
public:
    std::optional<double> Probe(const std::string &, std::chrono::milliseconds) override {
        std::unique_lock<std::mutex> lock(mutex);
        entered = true;
        cv.notify_all();
        cv.wait(lock, [this] { return released; });
        return 1.0;
    }

    void WaitEntered() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this] { return entered; });
    }

    void Release() {
        std::lock_guard<std::mutex> lock(mutex);
        released = true;
        cv.notify_all();
    }

    std::mutex mutex;
    std::condition_variable cv;
    bool entered = false;
    bool released = false;
};

}

class MonitoringSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool.Start();
        sub = hub.Subscribe();

        common::Device d;
        d.id = "aa:bb:cc:00:00:01";
        d.ip = "192.168.1.10";
        d.mac = d.id;
        d.tags = {"arp"};
        d.last_seen = common::FromUnixMillis(1000);
        inventory.Upsert(d);
    }

    void TearDown() override { pool.Stop(); }

    std::unique_ptr<MonitoringScheduler> Make(identify::ManagementClient *management = nullptr,
                                              double loss_ceiling = 1.0) {
        return MakeWith(inventory, prober, management, loss_ceiling);
    }

    std::unique_ptr<MonitoringScheduler> MakeWith(storage::InventorySink &devices, ReachabilityProber &probe,
                                                  identify::ManagementClient *management = nullptr,
                                                  double loss_ceiling = 1.0) {
        SchedulerOptions options;
        options.burst_size = 5;
        options.probe_timeout = 10ms;
        options.loss_ceiling = loss_ceiling;
        options.interval = 50ms;
        return std::make_unique<MonitoringScheduler>(devices, metrics, hub, probe, management, pool, options);
    }

    std::vector<common::Event> Drain() {
        std::vector<common::Event> out;
        while (auto event = sub->TryNext())
            out.push_back(*event);
        return out;
    }

    const std::string id = "aa:bb:cc:00:00:01";

    FakeInventory inventory;
    FakeMetrics metrics;
    ScriptedProber prober;
    hub::EventHub hub;
    WorkerPool pool{2};
    hub::SubscriptionPtr sub;
};

// =============================================================================
// Latency
// =============================================================================

TEST_F(MonitoringSchedulerTest, BurstProducesLatencyEventAndMetric) {
    auto scheduler = Make();
    prober.Set({10.0, 12.0, 11.0, 13.0, std::nullopt});

    auto result = scheduler->TickDevice(id);
    ASSERT_TRUE(result.ran);
    EXPECT_EQ(result.transition, Transition::None);

    auto events = Drain();
    ASSERT_EQ(events.size(), 1u);
    const auto &latency = std::get<common::Latency>(events[0]);
    EXPECT_EQ(latency.device_id, id);
    EXPECT_DOUBLE_EQ(latency.ms, 11.5);
    EXPECT_DOUBLE_EQ(latency.min_ms, 10.0);
    EXPECT_DOUBLE_EQ(latency.max_ms, 13.0);
    EXPECT_DOUBLE_EQ(latency.loss, 0.2);

    ASSERT_EQ(metrics.Count("latency"), 1u);
    EXPECT_EQ(metrics.rows[0].tags.at("device_id"), id);
    EXPECT_DOUBLE_EQ(metrics.rows[0].fields.at("ms"), 11.5);

    auto stored = inventory.Get(id);
    EXPECT_EQ(stored->status, common::DeviceStatus::Up);
    EXPECT_GT(stored->last_seen, common::FromUnixMillis(1000));
}

TEST_F(MonitoringSchedulerTest, UnknownDeviceIsSkipped) {
    auto scheduler = Make();

    auto result = scheduler->TickDevice("missing");
    EXPECT_FALSE(result.ran);
    EXPECT_TRUE(Drain().empty());
    EXPECT_EQ(metrics.Count("latency"), 0u);
}

// =============================================================================
// Transitions
// =============================================================================

TEST_F(MonitoringSchedulerTest, TotalLossReportsDownBeforeLatency) {
    auto scheduler = Make();
    prober.fallback = std::nullopt;

    auto result = scheduler->TickDevice(id);
    EXPECT_EQ(result.transition, Transition::WentDown);

    auto events = Drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<common::DeviceDown>(events[0]));
    const auto &latency = std::get<common::Latency>(events[1]);
    EXPECT_DOUBLE_EQ(latency.loss, 1.0);
    EXPECT_DOUBLE_EQ(latency.ms, 0.0);

    auto stored = inventory.Get(id);
    EXPECT_EQ(stored->status, common::DeviceStatus::Down);
    EXPECT_EQ(stored->last_seen, common::FromUnixMillis(1000));
}

TEST_F(MonitoringSchedulerTest, RecoveryReportsUpBeforeLatency) {
    auto scheduler = Make();

    prober.fallback = std::nullopt;
    scheduler->TickDevice(id);
    Drain();

    prober.fallback = 2.0;
    auto result = scheduler->TickDevice(id);
    EXPECT_EQ(result.transition, Transition::WentUp);

    auto events = Drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<common::DeviceUp>(events[0]));
    EXPECT_TRUE(std::holds_alternative<common::Latency>(events[1]));
    EXPECT_EQ(scheduler->States().State(id), common::DeviceStatus::Up);
}

TEST_F(MonitoringSchedulerTest, LossCeilingTurnsPartialLossIntoDown) {
    auto scheduler = Make(nullptr, 0.5);
    prober.Set({1.0, 1.0, std::nullopt, std::nullopt, std::nullopt});

    auto result = scheduler->TickDevice(id);

    EXPECT_EQ(result.burst.received, 2);
    EXPECT_EQ(result.transition, Transition::WentDown);
    auto stored = inventory.Get(id);
    EXPECT_EQ(stored->status, common::DeviceStatus::Down);
    EXPECT_GT(stored->last_seen, common::FromUnixMillis(1000));
}

// =============================================================================
// Bandwidth
// =============================================================================

TEST_F(MonitoringSchedulerTest, BandwidthAppearsOnSecondTickForManagedDevice) {
    CountingManagement management;
    auto device = *inventory.Get(id);
    device.tags.insert("snmp");
    inventory.Upsert(device);

    auto scheduler = Make(&management);

    EXPECT_EQ(scheduler->TickDevice(id).bandwidth_points, 0u);
    Drain();

    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(scheduler->TickDevice(id).bandwidth_points, 1u);

    auto events = Drain();
    ASSERT_EQ(events.size(), 2u);
    const auto &bandwidth = std::get<common::Bandwidth>(events[1]);
    EXPECT_EQ(bandwidth.device_id, id);
    EXPECT_EQ(bandwidth.if_index, 2u);
    EXPECT_GT(bandwidth.in_bps, 0.0);
    EXPECT_GT(bandwidth.in_bps, bandwidth.out_bps);

    ASSERT_EQ(metrics.Count("bandwidth"), 1u);
    EXPECT_EQ(management.calls, 2u);
}

TEST_F(MonitoringSchedulerTest, CountersSkippedWithoutSnmpTag) {
    CountingManagement management;
    auto scheduler = Make(&management);

    scheduler->TickDevice(id);
    scheduler->TickDevice(id);

    EXPECT_EQ(management.calls, 0u);
    EXPECT_EQ(metrics.Count("bandwidth"), 0u);
}

TEST_F(MonitoringSchedulerTest, CountersSkippedWhenUnreachable) {
    CountingManagement management;
    auto device = *inventory.Get(id);
    device.tags.insert("snmp");
    inventory.Upsert(device);

    auto scheduler = Make(&management);
    prober.fallback = std::nullopt;
    scheduler->TickDevice(id);

    EXPECT_EQ(management.calls, 0u);
}

TEST_F(MonitoringSchedulerTest, FailedTickBreaksBandwidthBaseline) {
    CountingManagement management;
    auto device = *inventory.Get(id);
    device.tags.insert("snmp");
    inventory.Upsert(device);

    auto scheduler = Make(&management);

    EXPECT_EQ(scheduler->TickDevice(id).bandwidth_points, 0u);

    prober.fallback = std::nullopt;
    EXPECT_EQ(scheduler->TickDevice(id).bandwidth_points, 0u);

    prober.fallback = 1.0;
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(scheduler->TickDevice(id).bandwidth_points, 0u);

    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(scheduler->TickDevice(id).bandwidth_points, 1u);
    EXPECT_EQ(management.calls, 3u);
}

// =============================================================================
// Persistence
// =============================================================================

TEST_F(MonitoringSchedulerTest, StatusWriteKeepsDiscoveryChangesMadeDuringBurst) {
    storage::SqliteStore store;
    ASSERT_TRUE(store.Initialize(":memory:"));
    ASSERT_TRUE(store.Upsert(*inventory.Get(id)));

    InterruptingProber interrupting;
    interrupting.on_first_probe = [&store, this]() {
        auto moved = *store.Get(id);
        moved.ip = "192.168.1.99";
        moved.tags.insert("snmp");
        store.Upsert(moved);
    };

    auto scheduler = MakeWith(store, interrupting);
    ASSERT_TRUE(scheduler->TickDevice(id).ran);

    auto stored = store.Get(id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->ip, "192.168.1.99");
    EXPECT_TRUE(stored->HasTag("snmp"));
    EXPECT_TRUE(stored->HasTag("arp"));
    EXPECT_EQ(stored->status, common::DeviceStatus::Up);
    EXPECT_GT(stored->last_seen, common::FromUnixMillis(1000));
}

// =============================================================================
// Overlap
// =============================================================================

TEST_F(MonitoringSchedulerTest, OverlappingTickForSameDeviceIsRejected) {
    GatedProber gated;
    auto scheduler = MakeWith(inventory, gated);

    TickResult first;
    std::thread runner([&]() { first = scheduler->TickDevice(id); });
    gated.WaitEntered();

    auto second = scheduler->TickDevice(id);
    gated.Release();
    runner.join();

    EXPECT_FALSE(second.ran);
    EXPECT_TRUE(first.ran);

    auto events = Drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<common::Latency>(events[0]));
    EXPECT_EQ(metrics.Count("latency"), 1u);
}

// =============================================================================
// Scheduling
// =============================================================================

TEST_F(MonitoringSchedulerTest, TickCoversEveryDevice) {
    common::Device other;
    other.id = "192.168.1.11";
    other.ip = other.id;
    inventory.Upsert(other);

    auto scheduler = Make();
    scheduler->Tick({id, other.id});

    EXPECT_EQ(metrics.Count("latency"), 2u);
}

TEST_F(MonitoringSchedulerTest, StartStopRunsLoop) {
    auto scheduler = Make();
    scheduler->Start();
    std::this_thread::sleep_for(120ms);
    scheduler->Stop();

    EXPECT_GE(metrics.Count("latency"), 1u);
}

TEST_F(MonitoringSchedulerTest, RejectsInvalidOptions) {
    SchedulerOptions bad_burst;
    bad_burst.burst_size = 0;
    EXPECT_THROW({ MonitoringScheduler s(inventory, metrics, hub, prober, nullptr, pool, bad_burst); },
                 std::invalid_argument);

    SchedulerOptions bad_ceiling;
    bad_ceiling.loss_ceiling = 0.0;
    EXPECT_THROW({ MonitoringScheduler s(inventory, metrics, hub, prober, nullptr, pool, bad_ceiling); },
                 std::invalid_argument);
}
