/**
 * @file test_resource_monitor.cpp
 * @brief Resource monitor thresholds, alert delivery and cancellation
 */

#include "secbox/monitor.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

#include <gtest/gtest.h>

namespace secbox::monitor::test {

namespace {

using namespace std::chrono_literals;

class FakeProbe final : public ProcessProbe
{
public:
    secbox::Result<ProcessSample> sample(int pid) override
    {
        std::lock_guard lock(m_mutex);
        if (pid != kPid) {
            return std::unexpected(Error::make("ProbeFailed", "unknown pid"));
        }
        return m_sample;
    }

    void set(double rss_mb, double cpu_time_ms)
    {
        std::lock_guard lock(m_mutex);
        m_sample = ProcessSample{.rss_mb = rss_mb, .cpu_time_ms = cpu_time_ms};
    }

    static constexpr int kPid = 4242;

private:
    std::mutex m_mutex;
    ProcessSample m_sample;
};

class ResourceMonitorTest : public ::testing::Test
{
protected:
    [[nodiscard]] std::unique_ptr<ResourceMonitor> make_monitor(ExecutionLimits limits)
    {
        common::MonitorSettings settings;
        // Only the first sample of a started monitor comes from its thread
        settings.sample_interval = 1h;
        return std::make_unique<ResourceMonitor>(limits, probe, settings, [this] {
            return std::chrono::steady_clock::time_point{} + std::chrono::milliseconds(clock_ms.load());
        });
    }

    /// Attach to the fake process with the given baseline
    void attach(ResourceMonitor& monitor, double rss_mb, double cpu_time_ms)
    {
        probe->set(rss_mb, cpu_time_ms);
        monitor.on_process_started(FakeProbe::kPid);
        monitor.on_guest_ready();
    }

    std::shared_ptr<FakeProbe> probe = std::make_shared<FakeProbe>();
    std::atomic<std::int64_t> clock_ms{0};
};

}  // namespace

TEST_F(ResourceMonitorTest, MemoryIsMeasuredAgainstBaseline)
{
    auto monitor = make_monitor(ExecutionLimits{});
    attach(*monitor, 30.0, 0.0);

    probe->set(40.0, 0.0);
    const auto usage = monitor->sample_once();
    EXPECT_DOUBLE_EQ(usage.memory_mb, 10.0);
    EXPECT_DOUBLE_EQ(usage.peak_memory_mb, 10.0);
    EXPECT_TRUE(usage.alerts.empty());
}

TEST_F(ResourceMonitorTest, MemoryWarningThenCritical)
{
    auto monitor = make_monitor(ExecutionLimits{});
    attach(*monitor, 10.0, 0.0);

    probe->set(50.0, 0.0);
    auto usage = monitor->sample_once();
    ASSERT_EQ(usage.alerts.size(), 1U);
    EXPECT_EQ(usage.alerts[0].kind, AlertKind::kMemory);
    EXPECT_EQ(usage.alerts[0].severity, Severity::kWarning);
    EXPECT_EQ(usage.alerts[0].message, "Memory usage 40.0MB is above the 32MB limit");
    EXPECT_DOUBLE_EQ(usage.alerts[0].limit, 32.0);

    probe->set(60.0, 0.0);
    usage = monitor->sample_once();
    ASSERT_EQ(usage.alerts.size(), 2U);
    EXPECT_EQ(usage.alerts[1].severity, Severity::kCritical);
    EXPECT_EQ(usage.alerts[1].message, "Memory limit exceeded");

    // Each (kind, severity) pair fires once
    usage = monitor->sample_once();
    EXPECT_EQ(usage.alerts.size(), 2U);
    EXPECT_DOUBLE_EQ(usage.peak_memory_mb, 50.0);

    probe->set(15.0, 0.0);
    usage = monitor->sample_once();
    EXPECT_DOUBLE_EQ(usage.memory_mb, 5.0);
    EXPECT_DOUBLE_EQ(usage.peak_memory_mb, 50.0);
}

TEST_F(ResourceMonitorTest, CpuPercentAndCpuTime)
{
    auto monitor = make_monitor(ExecutionLimits{});
    attach(*monitor, 10.0, 100.0);

    clock_ms += 100;
    probe->set(10.0, 190.0);
    auto usage = monitor->sample_once();
    EXPECT_DOUBLE_EQ(usage.cpu_time_ms, 90.0);
    EXPECT_NEAR(usage.cpu_percent_estimate, 90.0, 1e-9);
    ASSERT_EQ(usage.alerts.size(), 1U);
    EXPECT_EQ(usage.alerts[0].kind, AlertKind::kCpu);
    EXPECT_EQ(usage.alerts[0].severity, Severity::kWarning);
    EXPECT_EQ(usage.alerts[0].message, "High CPU usage: 90%");

    clock_ms += 100;
    probe->set(10.0, 5'200.0);
    usage = monitor->sample_once();
    EXPECT_DOUBLE_EQ(usage.cpu_percent_estimate, 100.0);
    EXPECT_DOUBLE_EQ(usage.peak_cpu_percent, 100.0);
    ASSERT_EQ(usage.alerts.size(), 2U);
    EXPECT_EQ(usage.alerts[1].kind, AlertKind::kTime);
    EXPECT_EQ(usage.alerts[1].severity, Severity::kCritical);
    EXPECT_EQ(usage.alerts[1].message, "Execution time limit exceeded");
}

TEST_F(ResourceMonitorTest, WallClockAlertWithoutProcess)
{
    ExecutionLimits limits;
    limits.max_wall_clock_ms = 1'000;
    auto monitor = make_monitor(limits);

    clock_ms += 1'000;
    EXPECT_TRUE(monitor->sample_once().alerts.empty());

    clock_ms += 1;
    const auto usage = monitor->sample_once();
    EXPECT_DOUBLE_EQ(usage.execution_time_ms, 1'001.0);
    ASSERT_EQ(usage.alerts.size(), 1U);
    EXPECT_EQ(usage.alerts[0].kind, AlertKind::kWallClock);
    EXPECT_EQ(usage.alerts[0].message, "Wall-clock time limit exceeded");
    EXPECT_EQ(usage.alerts[0].sampled_at_ms, 1'001);
}

TEST_F(ResourceMonitorTest, WallClockStartsWithTheProcess)
{
    ExecutionLimits limits;
    limits.max_wall_clock_ms = 1'000;
    auto monitor = make_monitor(limits);

    // interpreter startup and prelude installation
    clock_ms += 5'000;
    attach(*monitor, 10.0, 0.0);
    clock_ms += 1'000;
    auto usage = monitor->sample_once();
    EXPECT_DOUBLE_EQ(usage.execution_time_ms, 1'000.0);
    EXPECT_TRUE(usage.alerts.empty());

    clock_ms += 1;
    usage = monitor->sample_once();
    ASSERT_EQ(usage.alerts.size(), 1U);
    EXPECT_EQ(usage.alerts[0].kind, AlertKind::kWallClock);
    EXPECT_EQ(usage.alerts[0].sampled_at_ms, 1'001);
}

TEST_F(ResourceMonitorTest, NetworkAttemptsWarnThenExceed)
{
    ExecutionLimits limits;
    limits.max_network_requests = 2;
    auto monitor = make_monitor(limits);

    monitor->on_network_attempt("https://example.com");
    monitor->on_network_attempt("https://example.org");
    auto usage = monitor->usage();
    EXPECT_EQ(usage.network_request_count, 2U);
    ASSERT_EQ(usage.alerts.size(), 1U);
    EXPECT_EQ(usage.alerts[0].message, "Blocked network request to https://example.com");

    monitor->on_network_attempt("https://example.net");
    usage = monitor->usage();
    ASSERT_EQ(usage.alerts.size(), 2U);
    EXPECT_EQ(usage.alerts[1].severity, Severity::kCritical);
    EXPECT_EQ(usage.alerts[1].message, "Network request limit exceeded");
}

TEST_F(ResourceMonitorTest, DomAndOutputLimitsOnlyWarn)
{
    ExecutionLimits limits;
    limits.max_dom_mutations = 2;
    limits.max_output_bytes = 10;
    auto monitor = make_monitor(limits);
    CancellationToken token;
    monitor->start(token);

    for (int i = 0; i < 3; ++i) {
        monitor->on_dom_mutation();
    }
    monitor->on_output(6);
    monitor->on_output(6);
    monitor->stop();

    const auto usage = monitor->usage();
    EXPECT_EQ(usage.dom_mutation_count, 3U);
    EXPECT_EQ(usage.output_bytes, 12U);
    ASSERT_EQ(usage.alerts.size(), 2U);
    EXPECT_EQ(usage.alerts[0].message, "DOM mutation limit exceeded");
    EXPECT_EQ(usage.alerts[1].message, "Output limit exceeded");
    EXPECT_FALSE(token.is_cancelled());
}

TEST_F(ResourceMonitorTest, CriticalAlertIsPublishedBeforeCancellation)
{
    ExecutionLimits limits;
    limits.max_network_requests = 0;
    auto monitor = make_monitor(limits);
    CancellationToken token;

    std::mutex seen_mutex;
    std::vector<bool> cancelled_when_seen;
    auto unsubscribe = monitor->subscribe([&](const MonitorEvent& event) {
        if (event.alert && event.alert->severity == Severity::kCritical) {
            std::lock_guard lock(seen_mutex);
            cancelled_when_seen.push_back(token.is_cancelled());
        }
    });

    monitor->start(token);
    monitor->on_network_attempt("10.0.0.1:80");
    monitor->stop();
    unsubscribe();

    ASSERT_EQ(cancelled_when_seen.size(), 1U);
    EXPECT_FALSE(cancelled_when_seen.front());
    ASSERT_TRUE(token.is_cancelled());
    EXPECT_EQ(token.kind(), FaultKind::kResourceExceeded);
    EXPECT_EQ(token.reason(), "Network request limit exceeded");
}

TEST_F(ResourceMonitorTest, QuietSamplesArePublishedWithoutAlert)
{
    auto monitor = make_monitor(ExecutionLimits{});
    std::vector<MonitorEvent> events;
    auto unsubscribe = monitor->subscribe([&](const MonitorEvent& event) { events.push_back(event); });

    clock_ms += 250;
    static_cast<void>(monitor->sample_once());
    ASSERT_EQ(events.size(), 1U);
    EXPECT_FALSE(events[0].alert.has_value());
    EXPECT_DOUBLE_EQ(events[0].usage.execution_time_ms, 250.0);

    unsubscribe();
    static_cast<void>(monitor->sample_once());
    EXPECT_EQ(events.size(), 1U);
}

TEST(ListenerRegistry, ThrowingListenerDoesNotStopDelivery)
{
    auto registry = std::make_shared<ListenerRegistry>();
    int delivered = 0;
    auto first = subscribe(registry, [](const MonitorEvent&) { throw std::runtime_error("listener failure"); });
    auto second = subscribe(registry, [&](const MonitorEvent&) { ++delivered; });

    registry->publish(MonitorEvent{});
    EXPECT_EQ(delivered, 1);

    first();
    second();
    EXPECT_TRUE(registry->empty());
}

TEST(ListenerRegistry, NonStandardThrowDoesNotStopDelivery)
{
    auto registry = std::make_shared<ListenerRegistry>();
    int delivered = 0;
    auto first = subscribe(registry, [](const MonitorEvent&) { throw 7; });
    auto second = subscribe(registry, [&](const MonitorEvent&) { ++delivered; });

    EXPECT_NO_THROW(registry->publish(MonitorEvent{}));
    EXPECT_EQ(delivered, 1);
}

TEST(ListenerRegistry, UnsubscribeOutlivesRegistry)
{
    auto registry = std::make_shared<ListenerRegistry>();
    auto unsubscribe = subscribe(registry, [](const MonitorEvent&) {});
    registry.reset();
    EXPECT_NO_THROW(unsubscribe());
}

TEST(ProcfsProbe, SamplesOwnProcess)
{
    ProcfsProbe probe;
    const auto sample = probe.sample(static_cast<int>(::getpid()));
    ASSERT_TRUE(sample) << sample.error().message;
    EXPECT_GT(sample->rss_mb, 0.0);
    EXPECT_GE(sample->cpu_time_ms, 0.0);

    const auto missing = probe.sample(-1);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, "ProbeFailed");
}

}  // namespace secbox::monitor::test
