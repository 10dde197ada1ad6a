/**
 * @file types.cpp
 * @brief Enum tags and JSON mappings for boundary value types
 */

#include "secbox/types.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <utility>

namespace secbox {

namespace {

using CategoryTag = std::pair<RuleCategory, std::string_view>;

constexpr std::array<CategoryTag, 7> kCategoryTags = {
    {{RuleCategory::kCodeInjection, "code-injection"},
     {RuleCategory::kFileSystem, "file-system"},
     {RuleCategory::kNetwork, "network"},
     {RuleCategory::kProcess, "process"},
     {RuleCategory::kInfiniteLoop, "infinite-loop"},
     {RuleCategory::kMemory, "memory"},
     {RuleCategory::kDangerousFunctions, "dangerous-functions"}}
};

[[nodiscard]] secbox::Error invalid_request(std::string message)
{
    return Error::make("InvalidRequest", std::move(message));
}

/**
 * @brief Read an optional unsigned field, keeping the current value when absent
 */
template <typename T>
[[nodiscard]] secbox::VoidResult read_unsigned(const nlohmann::json& j,
                                               std::string_view key,
                                               T& out)
{
    const auto it = j.find(std::string(key));
    if (it == j.end()) {
        return {};
    }
    if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<std::int64_t>() >= 0)) {
        return std::unexpected(
            invalid_request(std::format("Field '{}' must be a non-negative integer", key)));
    }
    out = it->get<T>();
    return {};
}

[[nodiscard]] secbox::VoidResult read_bool(const nlohmann::json& j, std::string_view key, bool& out)
{
    const auto it = j.find(std::string(key));
    if (it == j.end()) {
        return {};
    }
    if (!it->is_boolean()) {
        return std::unexpected(invalid_request(std::format("Field '{}' must be a boolean", key)));
    }
    out = it->get<bool>();
    return {};
}

[[nodiscard]] secbox::VoidResult read_int(const nlohmann::json& j, std::string_view key, int& out)
{
    const auto it = j.find(std::string(key));
    if (it == j.end()) {
        return {};
    }
    if (!it->is_number_integer()) {
        return std::unexpected(invalid_request(std::format("Field '{}' must be an integer", key)));
    }
    out = it->get<int>();
    return {};
}

[[nodiscard]] secbox::VoidResult read_string_list(const nlohmann::json& j,
                                                  std::string_view key,
                                                  std::vector<std::string>& out)
{
    const auto it = j.find(std::string(key));
    if (it == j.end()) {
        return {};
    }
    if (!it->is_array()) {
        return std::unexpected(invalid_request(std::format("Field '{}' must be an array", key)));
    }
    out.clear();
    for (const auto& item : *it) {
        if (!item.is_string()) {
            return std::unexpected(
                invalid_request(std::format("Field '{}' must contain only strings", key)));
        }
        out.push_back(item.get<std::string>());
    }
    return {};
}

}  // namespace

// ============================================================================
// Enum tags
// ============================================================================

std::string_view to_string(Severity severity) noexcept
{
    return severity == Severity::kCritical ? "critical" : "warning";
}

std::string_view to_string(RuleCategory category) noexcept
{
    const auto it = std::ranges::find(kCategoryTags, category, &CategoryTag::first);
    return it == kCategoryTags.end() ? "unknown" : it->second;
}

std::string_view to_string(ParserKind parser) noexcept
{
    switch (parser) {
        case ParserKind::kStrict:
            return "strict";
        case ParserKind::kTolerant:
            return "tolerant";
        case ParserKind::kLineScanner:
            return "line-scanner";
        case ParserKind::kNone:
            return "none";
    }
    return "none";
}

std::string_view to_string(LoopKind kind) noexcept
{
    switch (kind) {
        case LoopKind::kFor:
            return "for";
        case LoopKind::kWhile:
            return "while";
        case LoopKind::kDoWhile:
            return "do-while";
    }
    return "while";
}

std::string_view to_string(FaultKind kind) noexcept
{
    switch (kind) {
        case FaultKind::kSecurityViolation:
            return "SecurityViolation";
        case FaultKind::kRuntimeFault:
            return "RuntimeFault";
        case FaultKind::kResourceExceeded:
            return "ResourceExceeded";
        case FaultKind::kEngineUnavailable:
            return "EngineUnavailable";
    }
    return "RuntimeFault";
}

std::string_view to_string(AlertKind kind) noexcept
{
    switch (kind) {
        case AlertKind::kMemory:
            return "memory";
        case AlertKind::kCpu:
            return "cpu";
        case AlertKind::kTime:
            return "time";
        case AlertKind::kWallClock:
            return "wall-clock";
        case AlertKind::kNetwork:
            return "network";
        case AlertKind::kDom:
            return "dom";
        case AlertKind::kOutput:
            return "output";
    }
    return "memory";
}

secbox::Result<RuleCategory> parse_rule_category(std::string_view tag)
{
    const auto it = std::ranges::find(kCategoryTags, tag, &CategoryTag::second);
    if (it == kCategoryTags.end()) {
        return std::unexpected(
            invalid_request(std::format("Unknown rule category: {}", tag)));
    }
    return it->first;
}

// ============================================================================
// Limits
// ============================================================================

secbox::VoidResult validate_limits(const ExecutionLimits& limits)
{
    if (limits.max_memory_mb == 0 || limits.max_memory_mb > kMaxMemoryLimitMb) {
        return std::unexpected(Error::make(
            "LimitOutOfRange",
            std::format("maxMemoryMB must be in 1..{}, got {}", kMaxMemoryLimitMb,
                        limits.max_memory_mb)));
    }
    if (limits.max_execution_time_ms == 0
        || limits.max_execution_time_ms > kMaxExecutionTimeLimitMs) {
        return std::unexpected(Error::make(
            "LimitOutOfRange",
            std::format("maxExecutionTimeMs must be in 1..{}, got {}", kMaxExecutionTimeLimitMs,
                        limits.max_execution_time_ms)));
    }
    if (limits.max_wall_clock_ms == 0 || limits.max_wall_clock_ms > kMaxWallClockLimitMs) {
        return std::unexpected(Error::make(
            "LimitOutOfRange",
            std::format("maxWallClockMs must be in 1..{}, got {}", kMaxWallClockLimitMs,
                        limits.max_wall_clock_ms)));
    }
    if (limits.max_output_bytes == 0) {
        return std::unexpected(Error::make("LimitOutOfRange", "maxOutputBytes must be positive"));
    }
    if (limits.max_recursion_depth == 0) {
        return std::unexpected(
            Error::make("LimitOutOfRange", "maxRecursionDepth must be positive"));
    }
    return {};
}

// ============================================================================
// to_json
// ============================================================================

void to_json(nlohmann::json& j, const LoopInfo& value)
{
    j = nlohmann::json{
        {      "type", to_string(value.kind)},
        {      "line",             value.line},
        {    "column",           value.column},
        {  "hasBreak",        value.has_break},
        {"isInfinite",      value.is_infinite}
    };
}

void to_json(nlohmann::json& j, const CallInfo& value)
{
    j = nlohmann::json{
        {    "name",      value.name},
        {    "line",      value.line},
        {  "column",    value.column},
        {"argCount", value.arg_count}
    };
}

void to_json(nlohmann::json& j, const CodeMetrics& value)
{
    j = nlohmann::json{
        {"linesOfCode", value.lines_of_code},
        { "complexity",    value.complexity},
        {  "functions",     value.functions},
        {    "classes",       value.classes},
        {    "imports",       value.imports},
        {      "loops",         value.loops},
        {      "calls",         value.calls}
    };
}

void to_json(nlohmann::json& j, const AnalysisResult& value)
{
    nlohmann::json ast_summary = nullptr;
    if (value.ast) {
        ast_summary = nlohmann::json{
            {     "root", "Program"},
            {"nodeCount", value.node_count}
        };
    }
    j = nlohmann::json{
        { "success",                value.success},
        {     "ast",       std::move(ast_summary)},
        {  "errors",                 value.errors},
        {"warnings",               value.warnings},
        { "metrics",                value.metrics},
        {  "parser", to_string(value.parser)}
    };
}

void to_json(nlohmann::json& j, const Finding& value)
{
    j = nlohmann::json{
        {  "ruleId",               value.rule_id},
        {"ruleName",             value.rule_name},
        {"category", to_string(value.category)},
        {"severity", to_string(value.severity)},
        {    "line",                  value.line},
        {  "column",                value.column},
        { "snippet",               value.snippet},
        { "message",               value.message}
    };
}

void to_json(nlohmann::json& j, const EducationalFeedback& value)
{
    j = nlohmann::json{
        {"category",                              to_string(value.category)},
        {   "title",                                            value.title},
        { "message",                                          value.message},
        {"severity", value.severity == Severity::kCritical ? "error" : "warning"}
    };
    if (value.example_safe) {
        j["exampleSafe"] = *value.example_safe;
    }
    if (value.example_unsafe) {
        j["exampleUnsafe"] = *value.example_unsafe;
    }
}

void to_json(nlohmann::json& j, const ValidationPerformance& value)
{
    j = nlohmann::json{
        {  "analysisTime",   value.analysis_time_ms},
        {"validationTime", value.validation_time_ms},
        {     "totalTime",      value.total_time_ms},
        {  "rulesChecked",      value.rules_checked},
        {  "astNodeCount",     value.ast_node_count}
    };
}

void to_json(nlohmann::json& j, const ValidationResult& value)
{
    j = nlohmann::json{
        {            "isValid",             value.is_valid},
        {          "riskScore",           value.risk_score},
        {         "violations",           value.violations},
        {           "warnings",             value.warnings},
        {"educationalFeedback", value.educational_feedback},
        {           "analysis",             value.analysis},
        {        "performance",          value.performance}
    };
}

void to_json(nlohmann::json& j, const QuickValidation& value)
{
    j = nlohmann::json{
        {       "isValid",        value.is_valid},
        {"criticalIssues", value.critical_issues},
        {     "riskScore",      value.risk_score}
    };
}

void to_json(nlohmann::json& j, const RiskPolicy& value)
{
    j = nlohmann::json{
        {"criticalWeight", value.critical_weight},
        { "warningWeight",  value.warning_weight},
        {  "maxRiskScore",  value.max_risk_score},
        {"criticalBlocks", value.critical_blocks}
    };
}

void to_json(nlohmann::json& j, const ValidationOptions& value)
{
    nlohmann::json categories = nlohmann::json::array();
    for (auto category : value.enabled_categories) {
        categories.push_back(to_string(category));
    }
    j = nlohmann::json{
        {     "educationalMode",       value.educational_mode},
        {"performanceTargetMs", value.performance_target_ms},
        {   "enabledCategories",      std::move(categories)},
        {              "policy",                 value.policy}
    };
}

void to_json(nlohmann::json& j, const ExecutionLimits& value)
{
    j = nlohmann::json{
        {       "maxMemoryMB",         value.max_memory_mb},
        {"maxExecutionTimeMs", value.max_execution_time_ms},
        {    "maxWallClockMs",     value.max_wall_clock_ms},
        {    "maxOutputBytes",      value.max_output_bytes},
        {"maxNetworkRequests",  value.max_network_requests},
        {   "maxDomMutations",     value.max_dom_mutations},
        { "maxRecursionDepth",   value.max_recursion_depth}
    };
}

void to_json(nlohmann::json& j, const ExecutionRequest& value)
{
    j = nlohmann::json{
        {              "language",      to_string(value.language)},
        {                  "code",                     value.code},
        {                "inputs",                   value.inputs},
        {                "limits",                   value.limits},
        {    "strictSecurityMode",     value.strict_security_mode},
        {"skipSecurityValidation", value.skip_security_validation},
        {      "inspectVariables",        value.inspect_variables},
        {        "hiddenPrefixes",          value.hidden_prefixes}
    };
}

void to_json(nlohmann::json& j, const Alert& value)
{
    j = nlohmann::json{
        {     "type",     to_string(value.kind)},
        { "severity", to_string(value.severity)},
        {  "message",             value.message},
        {    "value",               value.value},
        {    "limit",               value.limit},
        {"timestamp",       value.sampled_at_ms}
    };
}

void to_json(nlohmann::json& j, const ResourceUsage& value)
{
    j = nlohmann::json{
        {           "memoryMB",              value.memory_mb},
        {       "peakMemoryMB",         value.peak_memory_mb},
        {         "cpuPercent",   value.cpu_percent_estimate},
        {     "peakCpuPercent",       value.peak_cpu_percent},
        {          "cpuTimeMs",            value.cpu_time_ms},
        {    "executionTimeMs",      value.execution_time_ms},
        {"networkRequestCount", value.network_request_count},
        {   "domMutationCount",    value.dom_mutation_count},
        {        "outputBytes",           value.output_bytes},
        {             "alerts",                 value.alerts}
    };
}

void to_json(nlohmann::json& j, const ExecutionResult& value)
{
    j = nlohmann::json{
        {"success", value.success},
        { "output",  value.output},
        {"metrics", value.metrics}
    };
    if (value.error) {
        j["error"] = *value.error;
    }
    if (value.fault_kind) {
        j["faultKind"] = to_string(*value.fault_kind);
    }
    if (value.security_validation) {
        j["securityValidation"] = *value.security_validation;
    }
    if (value.variables) {
        j["variables"] = *value.variables;
    }
}

// ============================================================================
// from_json
// ============================================================================

secbox::Result<ExecutionLimits> limits_from_json(const nlohmann::json& j,
                                                 const ExecutionLimits& defaults)
{
    if (!j.is_object()) {
        return std::unexpected(invalid_request("limits must be an object"));
    }
    ExecutionLimits limits = defaults;
    for (auto result : {read_unsigned(j, "maxMemoryMB", limits.max_memory_mb),
                        read_unsigned(j, "maxExecutionTimeMs", limits.max_execution_time_ms),
                        read_unsigned(j, "maxWallClockMs", limits.max_wall_clock_ms),
                        read_unsigned(j, "maxOutputBytes", limits.max_output_bytes),
                        read_unsigned(j, "maxNetworkRequests", limits.max_network_requests),
                        read_unsigned(j, "maxDomMutations", limits.max_dom_mutations),
                        read_unsigned(j, "maxRecursionDepth", limits.max_recursion_depth)}) {
        if (!result) {
            return std::unexpected(result.error());
        }
    }
    if (auto valid = validate_limits(limits); !valid) {
        return std::unexpected(valid.error());
    }
    return limits;
}

secbox::Result<RiskPolicy> risk_policy_from_json(const nlohmann::json& j,
                                                 const RiskPolicy& defaults)
{
    if (!j.is_object()) {
        return std::unexpected(invalid_request("policy must be an object"));
    }
    RiskPolicy policy = defaults;
    for (auto result : {read_int(j, "criticalWeight", policy.critical_weight),
                        read_int(j, "warningWeight", policy.warning_weight),
                        read_int(j, "maxRiskScore", policy.max_risk_score),
                        read_bool(j, "criticalBlocks", policy.critical_blocks)}) {
        if (!result) {
            return std::unexpected(result.error());
        }
    }
    return policy;
}

secbox::Result<ValidationOptions> validation_options_from_json(const nlohmann::json& j,
                                                               const ValidationOptions& defaults)
{
    if (!j.is_object()) {
        return std::unexpected(invalid_request("options must be an object"));
    }
    ValidationOptions options = defaults;
    if (auto result = read_bool(j, "educationalMode", options.educational_mode); !result) {
        return std::unexpected(result.error());
    }
    if (const auto it = j.find("performanceTargetMs"); it != j.end()) {
        if (!it->is_number()) {
            return std::unexpected(invalid_request("performanceTargetMs must be a number"));
        }
        options.performance_target_ms = it->get<double>();
    }
    std::vector<std::string> tags;
    if (auto result = read_string_list(j, "enabledCategories", tags); !result) {
        return std::unexpected(result.error());
    }
    if (j.contains("enabledCategories")) {
        options.enabled_categories.clear();
        for (const auto& tag : tags) {
            auto category = parse_rule_category(tag);
            if (!category) {
                return std::unexpected(category.error());
            }
            options.enabled_categories.push_back(*category);
        }
    }
    if (const auto it = j.find("policy"); it != j.end()) {
        auto policy = risk_policy_from_json(*it, options.policy);
        if (!policy) {
            return std::unexpected(policy.error());
        }
        options.policy = *policy;
    }
    return options;
}

secbox::Result<ExecutionRequest> execution_request_from_json(const nlohmann::json& j,
                                                             const ExecutionLimits& default_limits)
{
    if (!j.is_object()) {
        return std::unexpected(invalid_request("Execution request must be a JSON object"));
    }
    const auto language_it = j.find("language");
    if (language_it == j.end() || !language_it->is_string()) {
        return std::unexpected(invalid_request("Field 'language' is required"));
    }
    auto language = parse_language(language_it->get<std::string>());
    if (!language) {
        return std::unexpected(language.error());
    }
    const auto code_it = j.find("code");
    if (code_it == j.end() || !code_it->is_string()) {
        return std::unexpected(invalid_request("Field 'code' is required"));
    }

    ExecutionRequest request{.language = *language,
                             .code = code_it->get<std::string>(),
                             .inputs = {},
                             .limits = default_limits,
                             .strict_security_mode = true,
                             .skip_security_validation = false,
                             .inspect_variables = true,
                             .hidden_prefixes = {}};

    for (auto result : {read_string_list(j, "inputs", request.inputs),
                        read_string_list(j, "hiddenPrefixes", request.hidden_prefixes),
                        read_bool(j, "strictSecurityMode", request.strict_security_mode),
                        read_bool(j, "skipSecurityValidation", request.skip_security_validation),
                        read_bool(j, "inspectVariables", request.inspect_variables)}) {
        if (!result) {
            return std::unexpected(result.error());
        }
    }
    if (const auto it = j.find("limits"); it != j.end()) {
        auto limits = limits_from_json(*it, default_limits);
        if (!limits) {
            return std::unexpected(limits.error());
        }
        request.limits = *limits;
    }
    return request;
}

}  // namespace secbox
