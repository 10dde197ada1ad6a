#pragma once

/**
 * @file execution.hpp
 * @brief Cancellation and observation seams between engines, monitor and runtime
 */

#include "secbox/types.hpp"

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace secbox {

/**
 * @brief Cooperative cancellation flag with the fault that caused it
 *
 * The first cancel() wins; later calls keep the original reason. Engines check
 * the token at every supervision poll.
 */
class CancellationToken
{
public:
    void cancel(FaultKind kind, std::string reason)
    {
        std::lock_guard lock(m_mutex);
        if (m_cancelled.load(std::memory_order_relaxed)) {
            return;
        }
        m_kind = kind;
        m_reason = std::move(reason);
        m_cancelled.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool is_cancelled() const noexcept { return m_cancelled.load(std::memory_order_acquire); }

    [[nodiscard]] std::string reason() const
    {
        std::lock_guard lock(m_mutex);
        return m_reason;
    }

    [[nodiscard]] FaultKind kind() const
    {
        std::lock_guard lock(m_mutex);
        return m_kind;
    }

private:
    std::atomic<bool> m_cancelled{false};
    mutable std::mutex m_mutex;
    FaultKind m_kind = FaultKind::kResourceExceeded;
    std::string m_reason;
};

/**
 * @brief Engine-side events consumed by the resource monitor
 *
 * Callbacks arrive on the engine's supervision thread.
 */
class ExecutionObserver
{
public:
    virtual ~ExecutionObserver() = default;

    /// Guest interpreter process is running
    virtual void on_process_started(int pid) = 0;
    /// Interpreter startup finished; guest code is about to run
    virtual void on_guest_ready() = 0;
    /// Guest code tried to reach the network (blocked by the prelude)
    virtual void on_network_attempt(std::string_view target) = 0;
    virtual void on_dom_mutation() = 0;
    /// Guest wrote `bytes` more bytes of output
    virtual void on_output(std::size_t bytes) = 0;
};

/**
 * @brief Per-request wiring handed to ExecutionEngine::execute
 *
 * Both pointers are optional and must outlive the call.
 */
struct ExecutionContext
{
    CancellationToken* cancellation = nullptr;
    ExecutionObserver* observer = nullptr;
    /// Analysis of the submitted code when the caller already has one
    const AnalysisResult* analysis = nullptr;
    bool inspect_variables = true;
    std::vector<std::string> hidden_prefixes;
};

}  // namespace secbox
