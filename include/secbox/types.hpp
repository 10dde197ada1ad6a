#pragma once

/**
 * @file types.hpp
 * @brief Value types crossing component boundaries, with JSON mappings
 *
 * JSON field names follow the wire format consumed by the dashboard and the
 * CLI (camelCase), C++ members follow the codebase naming (snake_case).
 */

#include "secbox/common.hpp"
#include "secbox/language.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace secbox::ast {
struct Node;
}  // namespace secbox::ast

namespace secbox {

// ============================================================================
// Enumerations
// ============================================================================

enum class Severity {
    kCritical,
    kWarning
};

enum class RuleCategory {
    kCodeInjection,
    kFileSystem,
    kNetwork,
    kProcess,
    kInfiniteLoop,
    kMemory,
    kDangerousFunctions
};

enum class ParserKind {
    kStrict,
    kTolerant,
    kLineScanner,
    kNone
};

enum class LoopKind {
    kFor,
    kWhile,
    kDoWhile
};

enum class FaultKind {
    kSecurityViolation,
    kRuntimeFault,
    kResourceExceeded,
    kEngineUnavailable
};

enum class AlertKind {
    kMemory,
    kCpu,
    kTime,
    kWallClock,
    kNetwork,
    kDom,
    kOutput
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;
[[nodiscard]] std::string_view to_string(RuleCategory category) noexcept;
[[nodiscard]] std::string_view to_string(ParserKind parser) noexcept;
[[nodiscard]] std::string_view to_string(LoopKind kind) noexcept;
[[nodiscard]] std::string_view to_string(FaultKind kind) noexcept;
[[nodiscard]] std::string_view to_string(AlertKind kind) noexcept;

[[nodiscard]] secbox::Result<RuleCategory> parse_rule_category(std::string_view tag);

// ============================================================================
// Static analysis
// ============================================================================

struct LoopInfo
{
    LoopKind kind = LoopKind::kWhile;
    std::uint32_t line = 0;
    std::uint32_t column = 0;
    bool has_break = false;
    bool is_infinite = false;
};

struct CallInfo
{
    std::string name;
    std::uint32_t line = 0;
    std::uint32_t column = 0;
    std::uint32_t arg_count = 0;
};

struct CodeMetrics
{
    std::size_t lines_of_code = 0;
    std::size_t complexity = 0;
    std::size_t functions = 0;
    std::size_t classes = 0;
    std::size_t imports = 0;
    std::vector<LoopInfo> loops;
    std::vector<CallInfo> calls;
};

/// Half-open byte range [begin, end) in the submitted source
struct SourceRange
{
    std::size_t begin = 0;
    std::size_t end = 0;
};

struct AnalysisResult
{
    bool success = false;
    std::shared_ptr<const ast::Node> ast;
    std::size_t node_count = 0;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    CodeMetrics metrics;
    ParserKind parser = ParserKind::kNone;
    /// TypeScript only: ranges holding pure type syntax
    std::vector<SourceRange> type_only_ranges;
    /// TypeScript only: constructs whose erasure would change runtime behavior
    std::vector<std::string> erasure_blockers;
};

// ============================================================================
// Security validation
// ============================================================================

/// A Violation (critical) or Warning (warning) produced by one rule match
struct Finding
{
    std::string rule_id;
    std::string rule_name;
    RuleCategory category = RuleCategory::kDangerousFunctions;
    Severity severity = Severity::kWarning;
    std::uint32_t line = 0;
    std::uint32_t column = 0;
    std::string snippet;
    std::string message;
};

struct EducationalFeedback
{
    RuleCategory category = RuleCategory::kDangerousFunctions;
    std::string title;
    std::string message;
    Severity severity = Severity::kWarning;
    std::optional<std::string> example_safe;
    std::optional<std::string> example_unsafe;
};

struct ValidationPerformance
{
    double analysis_time_ms = 0.0;
    double validation_time_ms = 0.0;
    double total_time_ms = 0.0;
    std::size_t rules_checked = 0;
    std::size_t ast_node_count = 0;
};

struct ValidationResult
{
    bool is_valid = false;
    int risk_score = 0;
    std::vector<Finding> violations;
    std::vector<Finding> warnings;
    std::vector<EducationalFeedback> educational_feedback;
    AnalysisResult analysis;
    ValidationPerformance performance;
};

struct QuickValidation
{
    bool is_valid = false;
    std::size_t critical_issues = 0;
    int risk_score = 0;
};

/// Scoring knobs: a result is valid only when its score stays below max_risk_score
struct RiskPolicy
{
    int critical_weight = 40;
    int warning_weight = 10;
    int max_risk_score = 30;
    bool critical_blocks = true;
};

struct ValidationOptions
{
    bool educational_mode = true;
    double performance_target_ms = 100.0;
    /// Empty means every category
    std::vector<RuleCategory> enabled_categories;
    RiskPolicy policy;
};

// ============================================================================
// Execution
// ============================================================================

struct ExecutionLimits
{
    std::uint32_t max_memory_mb = 32;
    std::uint32_t max_execution_time_ms = 5'000;
    std::uint32_t max_wall_clock_ms = 10'000;
    std::size_t max_output_bytes = 10uz * 1'024 * 1'024;
    std::uint32_t max_network_requests = 10;
    std::uint32_t max_dom_mutations = 100;
    std::uint32_t max_recursion_depth = 100;
};

inline constexpr std::uint32_t kMaxMemoryLimitMb = 64;
inline constexpr std::uint32_t kMaxExecutionTimeLimitMs = 10'000;
inline constexpr std::uint32_t kMaxWallClockLimitMs = 30'000;

/**
 * Check limits against their upper bounds.
 * @return Empty on success, LimitOutOfRange otherwise
 */
[[nodiscard]] secbox::VoidResult validate_limits(const ExecutionLimits& limits);

struct ExecutionRequest
{
    Language language = Language::kPython;
    std::string code;
    std::vector<std::string> inputs;
    ExecutionLimits limits;
    bool strict_security_mode = true;
    bool skip_security_validation = false;
    bool inspect_variables = true;
    std::vector<std::string> hidden_prefixes;
};

struct Alert
{
    AlertKind kind = AlertKind::kMemory;
    Severity severity = Severity::kWarning;
    std::string message;
    double value = 0.0;
    double limit = 0.0;
    std::int64_t sampled_at_ms = 0;
};

struct ResourceUsage
{
    double memory_mb = 0.0;
    double peak_memory_mb = 0.0;
    double cpu_percent_estimate = 0.0;
    double peak_cpu_percent = 0.0;
    double cpu_time_ms = 0.0;
    double execution_time_ms = 0.0;
    std::uint32_t network_request_count = 0;
    std::uint32_t dom_mutation_count = 0;
    std::size_t output_bytes = 0;
    std::vector<Alert> alerts;
};

struct ExecutionResult
{
    bool success = false;
    std::string output;
    std::optional<std::string> error;
    std::optional<FaultKind> fault_kind;
    ResourceUsage metrics;
    std::optional<ValidationResult> security_validation;
    std::optional<nlohmann::json> variables;
};

// ============================================================================
// JSON mappings
// ============================================================================

void to_json(nlohmann::json& j, const LoopInfo& value);
void to_json(nlohmann::json& j, const CallInfo& value);
void to_json(nlohmann::json& j, const CodeMetrics& value);
void to_json(nlohmann::json& j, const AnalysisResult& value);
void to_json(nlohmann::json& j, const Finding& value);
void to_json(nlohmann::json& j, const EducationalFeedback& value);
void to_json(nlohmann::json& j, const ValidationPerformance& value);
void to_json(nlohmann::json& j, const ValidationResult& value);
void to_json(nlohmann::json& j, const QuickValidation& value);
void to_json(nlohmann::json& j, const RiskPolicy& value);
void to_json(nlohmann::json& j, const ValidationOptions& value);
void to_json(nlohmann::json& j, const ExecutionLimits& value);
void to_json(nlohmann::json& j, const ExecutionRequest& value);
void to_json(nlohmann::json& j, const Alert& value);
void to_json(nlohmann::json& j, const ResourceUsage& value);
void to_json(nlohmann::json& j, const ExecutionResult& value);

/**
 * Decode limits; absent fields keep their defaults.
 * @return Limits, or InvalidRequest / LimitOutOfRange
 */
[[nodiscard]] secbox::Result<ExecutionLimits> limits_from_json(const nlohmann::json& j,
                                                               const ExecutionLimits& defaults);

/**
 * Decode a risk policy; absent fields keep their defaults.
 */
[[nodiscard]] secbox::Result<RiskPolicy> risk_policy_from_json(const nlohmann::json& j,
                                                               const RiskPolicy& defaults);

/**
 * Decode validation options; absent fields keep their defaults.
 */
[[nodiscard]] secbox::Result<ValidationOptions>
validation_options_from_json(const nlohmann::json& j, const ValidationOptions& defaults);

/**
 * Decode an execution request (already schema-checked or not).
 * @return Request, or InvalidRequest / UnsupportedLanguage / LimitOutOfRange
 */
[[nodiscard]] secbox::Result<ExecutionRequest>
execution_request_from_json(const nlohmann::json& j, const ExecutionLimits& default_limits);

}  // namespace secbox
