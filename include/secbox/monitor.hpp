#pragma once

/**
 * @file monitor.hpp
 * @brief Resource monitor: periodic process sampling, threshold alerts and
 *        cancellation of runaway guests
 */

#include "secbox/common.hpp"
#include "secbox/config.hpp"
#include "secbox/execution.hpp"
#include "secbox/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace secbox::monitor {

/// Alerts retained per execution
inline constexpr std::size_t kMaxAlerts = 50;

struct ProcessSample
{
    double rss_mb = 0.0;
    double cpu_time_ms = 0.0;
};

/**
 * @brief Reads resource usage of a live process
 */
class ProcessProbe
{
public:
    virtual ~ProcessProbe() = default;

    /// @return Sample, or ProbeFailed once the process is gone
    [[nodiscard]] virtual secbox::Result<ProcessSample> sample(int pid) = 0;
};

/**
 * @brief Linux probe over /proc/<pid>/stat (utime + stime) and /proc/<pid>/statm (resident)
 */
class ProcfsProbe final : public ProcessProbe
{
public:
    [[nodiscard]] secbox::Result<ProcessSample> sample(int pid) override;
};

struct MonitorEvent
{
    ResourceUsage usage;
    /// Set when this event announces a newly raised alert
    std::optional<Alert> alert;
};

using MonitorListener = std::function<void(const MonitorEvent&)>;
using Unsubscribe = std::function<void()>;

/**
 * @brief Thread-safe listener list
 *
 * publish() calls listeners outside the lock; a listener that throws is
 * logged and skipped.
 */
class ListenerRegistry
{
public:
    std::uint64_t add(MonitorListener listener);
    void remove(std::uint64_t id);
    void publish(const MonitorEvent& event) const;
    [[nodiscard]] bool empty() const;

private:
    mutable std::mutex m_mutex;
    std::uint64_t m_next_id = 1;
    std::vector<std::pair<std::uint64_t, MonitorListener>> m_listeners;
};

/**
 * Register `listener`; the returned callable removes it and stays safe to
 * call after the registry is gone.
 */
[[nodiscard]] Unsubscribe subscribe(const std::shared_ptr<ListenerRegistry>& registry, MonitorListener listener);

/**
 * @brief Watches one execution
 *
 * Engines feed it through the ExecutionObserver callbacks; a sampling thread
 * started by start() polls the guest process. Memory and CPU time are measured
 * relative to the moment the guest became ready, so interpreter startup is not
 * charged to guest code. Each (kind, severity) alert is raised once. A critical
 * alert is recorded and published before the cancellation token fires.
 */
class ResourceMonitor final : public ExecutionObserver
{
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    ResourceMonitor(ExecutionLimits limits,
                    std::shared_ptr<ProcessProbe> probe,
                    common::MonitorSettings settings = {},
                    Clock clock = {});
    ~ResourceMonitor() override;

    ResourceMonitor(const ResourceMonitor&) = delete;
    ResourceMonitor& operator=(const ResourceMonitor&) = delete;

    [[nodiscard]] Unsubscribe subscribe(MonitorListener listener);

    /// Reset the execution clock and start the sampling thread
    void start(CancellationToken& token);

    /// Stop and join the sampling thread (idempotent)
    void stop();

    /// Take one sample, evaluate thresholds and publish
    ResourceUsage sample_once();

    /// Current usage snapshot, alerts included
    [[nodiscard]] ResourceUsage usage() const;

    void on_process_started(int pid) override;
    void on_guest_ready() override;
    void on_network_attempt(std::string_view target) override;
    void on_dom_mutation() override;
    void on_output(std::size_t bytes) override;

private:
    /// Record an alert into `raised` unless its (kind, severity) pair already fired; lock held
    void raise_locked(std::vector<Alert>& raised,
                      AlertKind kind,
                      Severity severity,
                      std::string message,
                      double value,
                      double limit);
    /// Publish pending alerts, then cancel on the first critical one
    void flush(std::vector<Alert> alerts, const ResourceUsage& usage);
    [[nodiscard]] ResourceUsage snapshot_locked() const;
    [[nodiscard]] std::int64_t elapsed_ms_locked() const;

    ExecutionLimits m_limits;
    std::shared_ptr<ProcessProbe> m_probe;
    common::MonitorSettings m_settings;
    Clock m_clock;
    std::shared_ptr<ListenerRegistry> m_listeners;

    mutable std::mutex m_mutex;
    CancellationToken* m_token = nullptr;
    std::chrono::steady_clock::time_point m_started;
    std::optional<int> m_pid;
    std::optional<ProcessSample> m_baseline;
    std::optional<ProcessSample> m_last_sample;
    std::chrono::steady_clock::time_point m_last_sampled_at;
    ResourceUsage m_usage;
    std::deque<Alert> m_alerts;
    std::set<std::pair<AlertKind, Severity>> m_raised;

    std::jthread m_thread;
};

}  // namespace secbox::monitor
