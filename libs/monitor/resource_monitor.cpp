/**
 * @file resource_monitor.cpp
 * @brief Listener registry and the per-execution resource monitor
 */

#include "secbox/monitor.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <format>
#include <iterator>
#include <ranges>
#include <utility>

#include <spdlog/spdlog.h>

namespace secbox::monitor {

namespace {

/// Memory above this multiple of the limit is critical
constexpr double kMemoryCriticalFactor = 1.5;

}  // namespace

// ============================================================================
// ListenerRegistry
// ============================================================================

std::uint64_t ListenerRegistry::add(MonitorListener listener)
{
    std::lock_guard lock(m_mutex);
    const auto id = m_next_id++;
    m_listeners.emplace_back(id, std::move(listener));
    return id;
}

void ListenerRegistry::remove(std::uint64_t id)
{
    std::lock_guard lock(m_mutex);
    std::erase_if(m_listeners, [id](const auto& entry) { return entry.first == id; });
}

void ListenerRegistry::publish(const MonitorEvent& event) const
{
    std::vector<MonitorListener> listeners;
    {
        std::lock_guard lock(m_mutex);
        listeners.reserve(m_listeners.size());
        std::ranges::transform(m_listeners, std::back_inserter(listeners), [](const auto& e) { return e.second; });
    }
    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& ex) {
            spdlog::warn("Monitor listener failed: {}", ex.what());
        } catch (...) {
            spdlog::warn("Monitor listener failed with a non-standard exception");
        }
    }
}

bool ListenerRegistry::empty() const
{
    std::lock_guard lock(m_mutex);
    return m_listeners.empty();
}

Unsubscribe subscribe(const std::shared_ptr<ListenerRegistry>& registry, MonitorListener listener)
{
    const auto id = registry->add(std::move(listener));
    std::weak_ptr<ListenerRegistry> weak = registry;
    return [weak, id]() {
        if (auto locked = weak.lock()) {
            locked->remove(id);
        }
    };
}

// ============================================================================
// ResourceMonitor
// ============================================================================

ResourceMonitor::ResourceMonitor(ExecutionLimits limits,
                                 std::shared_ptr<ProcessProbe> probe,
                                 common::MonitorSettings settings,
                                 Clock clock)
    : m_limits(limits)
    , m_probe(std::move(probe))
    , m_settings(settings)
    , m_clock(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); }))
    , m_listeners(std::make_shared<ListenerRegistry>())
{
    m_started = m_clock();
    m_last_sampled_at = m_started;
}

ResourceMonitor::~ResourceMonitor()
{
    stop();
}

Unsubscribe ResourceMonitor::subscribe(MonitorListener listener)
{
    return monitor::subscribe(m_listeners, std::move(listener));
}

void ResourceMonitor::start(CancellationToken& token)
{
    stop();
    {
        std::lock_guard lock(m_mutex);
        m_token = &token;
        m_started = m_clock();
        m_last_sampled_at = m_started;
    }
    m_thread = std::jthread([this](std::stop_token stop_token) {
        std::mutex wait_mutex;
        std::condition_variable_any wakeup;
        while (!stop_token.stop_requested()) {
            sample_once();
            std::unique_lock lock(wait_mutex);
            wakeup.wait_for(lock, stop_token, m_settings.sample_interval, [] { return false; });
        }
    });
}

void ResourceMonitor::stop()
{
    if (m_thread.joinable()) {
        m_thread.request_stop();
        m_thread.join();
    }
}

std::int64_t ResourceMonitor::elapsed_ms_locked() const
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(m_clock() - m_started).count();
}

ResourceUsage ResourceMonitor::snapshot_locked() const
{
    ResourceUsage usage = m_usage;
    usage.alerts.assign(m_alerts.begin(), m_alerts.end());
    return usage;
}

ResourceUsage ResourceMonitor::usage() const
{
    std::lock_guard lock(m_mutex);
    return snapshot_locked();
}

void ResourceMonitor::raise_locked(std::vector<Alert>& raised,
                                   AlertKind kind,
                                   Severity severity,
                                   std::string message,
                                   double value,
                                   double limit)
{
    if (!m_raised.emplace(kind, severity).second) {
        return;
    }
    Alert alert{.kind = kind,
                .severity = severity,
                .message = std::move(message),
                .value = value,
                .limit = limit,
                .sampled_at_ms = elapsed_ms_locked()};
    m_alerts.push_back(alert);
    while (m_alerts.size() > kMaxAlerts) {
        m_alerts.pop_front();
    }
    raised.push_back(std::move(alert));
}

void ResourceMonitor::flush(std::vector<Alert> alerts, const ResourceUsage& usage)
{
    for (auto& alert : alerts) {
        spdlog::warn("Resource alert ({}, {}): {}", to_string(alert.kind), to_string(alert.severity), alert.message);
        m_listeners->publish(MonitorEvent{.usage = usage, .alert = alert});
    }
    const auto critical = std::ranges::find(alerts, Severity::kCritical, &Alert::severity);
    if (critical == alerts.end()) {
        return;
    }
    CancellationToken* token = nullptr;
    {
        std::lock_guard lock(m_mutex);
        token = m_token;
    }
    if (token != nullptr) {
        token->cancel(FaultKind::kResourceExceeded, critical->message);
    }
}

ResourceUsage ResourceMonitor::sample_once()
{
    std::vector<Alert> raised;
    ResourceUsage usage;
    {
        std::lock_guard lock(m_mutex);
        const auto now = m_clock();
        const auto elapsed_ms = elapsed_ms_locked();
        m_usage.execution_time_ms = static_cast<double>(elapsed_ms);

        if (m_pid && m_baseline) {
            if (auto sample = m_probe->sample(*m_pid)) {
                m_usage.memory_mb = std::max(0.0, sample->rss_mb - m_baseline->rss_mb);
                m_usage.cpu_time_ms = std::max(0.0, sample->cpu_time_ms - m_baseline->cpu_time_ms);
                if (m_last_sample) {
                    const auto wall_ms =
                        std::chrono::duration<double, std::milli>(now - m_last_sampled_at).count();
                    if (wall_ms > 0.0) {
                        m_usage.cpu_percent_estimate =
                            std::clamp((sample->cpu_time_ms - m_last_sample->cpu_time_ms) / wall_ms * 100.0,
                                       0.0,
                                       100.0);
                    }
                }
                m_last_sample = *sample;
                m_last_sampled_at = now;
                m_usage.peak_memory_mb = std::max(m_usage.peak_memory_mb, m_usage.memory_mb);
                m_usage.peak_cpu_percent = std::max(m_usage.peak_cpu_percent, m_usage.cpu_percent_estimate);
            } else {
                spdlog::debug("Monitor sample skipped: {}", sample.error().message);
            }
        }

        const double memory_limit = m_limits.max_memory_mb;
        if (m_usage.memory_mb > memory_limit * kMemoryCriticalFactor) {
            raise_locked(raised, AlertKind::kMemory, Severity::kCritical, "Memory limit exceeded",
                         m_usage.memory_mb, memory_limit);
        } else if (m_usage.memory_mb > memory_limit) {
            raise_locked(raised, AlertKind::kMemory, Severity::kWarning,
                         std::format("Memory usage {:.1f}MB is above the {}MB limit", m_usage.memory_mb,
                                     m_limits.max_memory_mb),
                         m_usage.memory_mb, memory_limit);
        }
        if (m_usage.cpu_time_ms > m_limits.max_execution_time_ms) {
            raise_locked(raised, AlertKind::kTime, Severity::kCritical, "Execution time limit exceeded",
                         m_usage.cpu_time_ms, m_limits.max_execution_time_ms);
        }
        if (m_usage.cpu_percent_estimate > m_settings.cpu_alert_percent) {
            raise_locked(raised, AlertKind::kCpu, Severity::kWarning,
                         std::format("High CPU usage: {:.0f}%", m_usage.cpu_percent_estimate),
                         m_usage.cpu_percent_estimate, m_settings.cpu_alert_percent);
        }
        if (elapsed_ms > static_cast<std::int64_t>(m_limits.max_wall_clock_ms)) {
            raise_locked(raised, AlertKind::kWallClock, Severity::kCritical, "Wall-clock time limit exceeded",
                         static_cast<double>(elapsed_ms), m_limits.max_wall_clock_ms);
        }
        usage = snapshot_locked();
    }
    if (raised.empty()) {
        m_listeners->publish(MonitorEvent{.usage = usage, .alert = std::nullopt});
    } else {
        flush(std::move(raised), usage);
    }
    return usage;
}

void ResourceMonitor::on_process_started(int pid)
{
    std::lock_guard lock(m_mutex);
    m_pid = pid;
    // Time spent preparing the engine does not count against the guest
    m_started = m_clock();
    m_last_sampled_at = m_started;
}

void ResourceMonitor::on_guest_ready()
{
    std::lock_guard lock(m_mutex);
    if (!m_pid) {
        return;
    }
    auto sample = m_probe->sample(*m_pid);
    m_baseline = sample ? *sample : ProcessSample{};
    m_last_sample = m_baseline;
    m_last_sampled_at = m_clock();
}

void ResourceMonitor::on_network_attempt(std::string_view target)
{
    std::vector<Alert> raised;
    ResourceUsage usage;
    {
        std::lock_guard lock(m_mutex);
        const auto count = ++m_usage.network_request_count;
        raise_locked(raised, AlertKind::kNetwork, Severity::kWarning,
                     std::format("Blocked network request to {}", target), count, m_limits.max_network_requests);
        if (count > m_limits.max_network_requests) {
            raise_locked(raised, AlertKind::kNetwork, Severity::kCritical, "Network request limit exceeded", count,
                         m_limits.max_network_requests);
        }
        usage = snapshot_locked();
    }
    flush(std::move(raised), usage);
}

void ResourceMonitor::on_dom_mutation()
{
    std::vector<Alert> raised;
    ResourceUsage usage;
    {
        std::lock_guard lock(m_mutex);
        const auto count = ++m_usage.dom_mutation_count;
        if (count > m_limits.max_dom_mutations) {
            raise_locked(raised, AlertKind::kDom, Severity::kWarning, "DOM mutation limit exceeded", count,
                         m_limits.max_dom_mutations);
        }
        usage = snapshot_locked();
    }
    flush(std::move(raised), usage);
}

void ResourceMonitor::on_output(std::size_t bytes)
{
    std::vector<Alert> raised;
    ResourceUsage usage;
    {
        std::lock_guard lock(m_mutex);
        m_usage.output_bytes += bytes;
        if (m_usage.output_bytes > m_limits.max_output_bytes) {
            raise_locked(raised, AlertKind::kOutput, Severity::kWarning, "Output limit exceeded",
                         static_cast<double>(m_usage.output_bytes), static_cast<double>(m_limits.max_output_bytes));
        }
        usage = snapshot_locked();
    }
    flush(std::move(raised), usage);
}

}  // namespace secbox::monitor
