#pragma once

/**
 * @file engine.hpp
 * @brief Sandboxed execution engines for Python, JavaScript and TypeScript
 *
 * Each engine runs guest code in a supervised interpreter child process. The
 * interpreter first loads a host-written prelude that replays inputs, exposes
 * only an allowlisted set of bindings, enforces the recursion ceiling and
 * reports events over a control channel (fd 3, one JSON object per line).
 */

#include "secbox/common.hpp"
#include "secbox/execution.hpp"
#include "secbox/language.hpp"
#include "secbox/types.hpp"

#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace secbox::engine {

/// Appended to output cut at ExecutionLimits::max_output_bytes
inline constexpr std::string_view kTruncationMarker = "\n... (output truncated)";

struct EngineSettings
{
    /// Interpreter executable, resolved against PATH when relative
    std::string interpreter;
    /// Directory receiving the prelude and per-run payload files
    std::filesystem::path work_dir;
    /// Python only: modules guest code may import
    std::vector<std::string> allowed_modules;
};

struct EngineStatus
{
    Language language = Language::kPython;
    bool initialized = false;
    std::string version;
    std::vector<std::string> features;
    std::optional<std::string> error;
};

void to_json(nlohmann::json& j, const EngineStatus& value);

/**
 * @brief Common engine contract
 *
 * initialize() starts interpreter discovery and prelude installation on a
 * background task exactly once; execute() waits on that task, so callers
 * never need to initialize explicitly. Engines are not reentrant.
 */
class ExecutionEngine
{
public:
    explicit ExecutionEngine(Language language);
    virtual ~ExecutionEngine() = default;

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    [[nodiscard]] Language language() const noexcept { return m_language; }

    /// Start (or join) initialization
    std::shared_future<secbox::VoidResult> initialize();

    [[nodiscard]] bool is_ready() const;

    [[nodiscard]] EngineStatus status() const;

    /**
     * Run guest code to completion, fault or cancellation.
     * Failures are normalized into the result (success=false, error,
     * fault_kind, partial output); nothing is thrown.
     */
    [[nodiscard]] ExecutionResult execute(std::string_view code,
                                          const std::vector<std::string>& inputs,
                                          const ExecutionLimits& limits,
                                          ExecutionContext& context);

protected:
    /// Derived destructors call this so install() never outlives the derived members
    void join_initialization() noexcept;

    struct Installed
    {
        std::string version;
        std::vector<std::string> features;
    };

    /// Locate the interpreter and write the prelude (runs on the init task)
    [[nodiscard]] virtual secbox::Result<Installed> install() = 0;

    [[nodiscard]] virtual ExecutionResult run(std::string_view code,
                                              const std::vector<std::string>& inputs,
                                              const ExecutionLimits& limits,
                                              ExecutionContext& context) = 0;

private:
    Language m_language;
    mutable std::mutex m_mutex;
    std::optional<std::shared_future<secbox::VoidResult>> m_init;
    std::optional<Installed> m_installed;
    std::optional<std::string> m_init_error;
};

class PythonEngine final : public ExecutionEngine
{
public:
    explicit PythonEngine(EngineSettings settings);
    ~PythonEngine() override;

protected:
    [[nodiscard]] secbox::Result<Installed> install() override;
    [[nodiscard]] ExecutionResult run(std::string_view code,
                                      const std::vector<std::string>& inputs,
                                      const ExecutionLimits& limits,
                                      ExecutionContext& context) override;

private:
    EngineSettings m_settings;
    std::filesystem::path m_executable;
    std::filesystem::path m_prelude;
};

/**
 * @brief JavaScript in a fresh `vm` context of a host Node.js process
 *
 * TypeScript reuses it: the TypeScript engine blanks type-only source ranges
 * and hands the remaining JavaScript to the same prelude.
 */
class JavaScriptEngine : public ExecutionEngine
{
public:
    explicit JavaScriptEngine(EngineSettings settings);
    ~JavaScriptEngine() override;

protected:
    JavaScriptEngine(Language language, EngineSettings settings);

    [[nodiscard]] secbox::Result<Installed> install() override;
    [[nodiscard]] ExecutionResult run(std::string_view code,
                                      const std::vector<std::string>& inputs,
                                      const ExecutionLimits& limits,
                                      ExecutionContext& context) override;

    /// Run already-plain JavaScript; `analysis` names the top-level bindings
    [[nodiscard]] ExecutionResult run_script(std::string_view script,
                                             const AnalysisResult& analysis,
                                             const std::vector<std::string>& inputs,
                                             const ExecutionLimits& limits,
                                             ExecutionContext& context);

private:
    EngineSettings m_settings;
    std::filesystem::path m_executable;
    std::filesystem::path m_prelude;
};

class TypeScriptEngine final : public JavaScriptEngine
{
public:
    explicit TypeScriptEngine(EngineSettings settings);

protected:
    [[nodiscard]] ExecutionResult run(std::string_view code,
                                      const std::vector<std::string>& inputs,
                                      const ExecutionLimits& limits,
                                      ExecutionContext& context) override;
};

/**
 * Blank type-only ranges with spaces, keeping newlines so line numbers survive.
 * @return JavaScript, or TypeErasureUnsupported naming the first blocker
 */
[[nodiscard]] secbox::Result<std::string> erase_types(std::string_view code, const AnalysisResult& analysis);

/**
 * Cut output at `max_bytes` (on a UTF-8 boundary) and append kTruncationMarker.
 * @return True when the output was cut
 */
bool truncate_output(std::string& output, std::size_t max_bytes);

/**
 * Top-level binding names of a JavaScript program (declared variables,
 * functions and classes), in source order without duplicates.
 */
[[nodiscard]] std::vector<std::string> top_level_bindings(const AnalysisResult& analysis);

/// Statement inserted at the top of every instrumented function body
inline constexpr std::string_view kFunctionEntryHook = "__secbox_enter();";

/**
 * Insert kFunctionEntryHook after the opening brace of each block-bodied
 * function in `script`, on the same line so positions in messages keep their
 * line. Bodies opening with a directive prologue and concise arrow bodies are
 * left alone. `analysis` must describe `script` byte for byte (type erasure
 * keeps offsets).
 */
[[nodiscard]] std::string instrument_function_entries(std::string_view script, const AnalysisResult& analysis);

[[nodiscard]] std::unique_ptr<ExecutionEngine> make_engine(Language language, EngineSettings settings);

}  // namespace secbox::engine
