/**
 * @file test_types.cpp
 * @brief Request decoding, limit bounds and result serialization
 */

#include "secbox/common.hpp"
#include "secbox/language.hpp"
#include "secbox/types.hpp"

#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace secbox::test {

TEST(Language, ParsesKnownTags)
{
    auto python = parse_language("python");
    ASSERT_TRUE(python);
    EXPECT_EQ(*python, Language::kPython);
    auto typescript = parse_language("typescript");
    ASSERT_TRUE(typescript);
    EXPECT_EQ(*typescript, Language::kTypeScript);
    EXPECT_EQ(display_name(Language::kJavaScript), "JavaScript");
}

TEST(Language, RejectsUnknownTag)
{
    auto ruby = parse_language("ruby");
    ASSERT_FALSE(ruby);
    EXPECT_EQ(ruby.error().code, "UnsupportedLanguage");
}

TEST(ExecutionLimits, DefaultsAreWithinBounds)
{
    const ExecutionLimits limits;
    EXPECT_EQ(limits.max_memory_mb, 32U);
    EXPECT_EQ(limits.max_execution_time_ms, 5'000U);
    EXPECT_EQ(limits.max_wall_clock_ms, 10'000U);
    EXPECT_EQ(limits.max_output_bytes, 10U * 1'024U * 1'024U);
    EXPECT_TRUE(validate_limits(limits));
}

TEST(ExecutionLimits, UpperBoundsAreEnforced)
{
    ExecutionLimits limits;
    limits.max_memory_mb = kMaxMemoryLimitMb + 1;
    auto memory = validate_limits(limits);
    ASSERT_FALSE(memory);
    EXPECT_EQ(memory.error().code, "LimitOutOfRange");

    limits = ExecutionLimits{};
    limits.max_execution_time_ms = kMaxExecutionTimeLimitMs + 1;
    EXPECT_FALSE(validate_limits(limits));

    limits = ExecutionLimits{};
    limits.max_wall_clock_ms = kMaxWallClockLimitMs;
    EXPECT_TRUE(validate_limits(limits));
}

TEST(ExecutionRequest, DecodesWithDefaults)
{
    const nlohmann::json j = {
        {"language", "javascript"},
        {    "code", "console.log(1)"},
        {  "inputs", {"a", "b"}}
    };
    auto request = execution_request_from_json(j, ExecutionLimits{});
    ASSERT_TRUE(request) << request.error().message;
    EXPECT_EQ(request->language, Language::kJavaScript);
    EXPECT_EQ(request->inputs.size(), 2U);
    EXPECT_TRUE(request->strict_security_mode);
    EXPECT_FALSE(request->skip_security_validation);
    EXPECT_EQ(request->limits.max_memory_mb, 32U);
}

TEST(ExecutionRequest, MergesPartialLimits)
{
    const nlohmann::json j = {
        {"language", "python"},
        {    "code", "x = 1"},
        {  "limits", {{"maxWallClockMs", 2'000}}}
    };
    auto request = execution_request_from_json(j, ExecutionLimits{});
    ASSERT_TRUE(request);
    EXPECT_EQ(request->limits.max_wall_clock_ms, 2'000U);
    EXPECT_EQ(request->limits.max_execution_time_ms, 5'000U);
}

TEST(ExecutionRequest, RejectsOutOfRangeLimits)
{
    const nlohmann::json j = {
        {"language", "python"},
        {    "code", "x = 1"},
        {  "limits", {{"maxMemoryMB", 512}}}
    };
    auto request = execution_request_from_json(j, ExecutionLimits{});
    ASSERT_FALSE(request);
    EXPECT_EQ(request.error().code, "LimitOutOfRange");
}

TEST(ExecutionRequest, RejectsUnsupportedLanguage)
{
    const nlohmann::json j = {
        {"language", "cobol"},
        {    "code", "DISPLAY 'HI'."}
    };
    auto request = execution_request_from_json(j, ExecutionLimits{});
    ASSERT_FALSE(request);
    EXPECT_EQ(request.error().code, "UnsupportedLanguage");
}

TEST(ExecutionResult, SerializesFaultAndOmitsAbsentFields)
{
    ExecutionResult result;
    result.success = false;
    result.fault_kind = FaultKind::kResourceExceeded;
    result.error = "Wall-clock time limit exceeded";

    const nlohmann::json j = result;
    EXPECT_FALSE(j.at("success").get<bool>());
    EXPECT_EQ(j.at("faultKind"), "ResourceExceeded");
    EXPECT_EQ(j.at("error"), "Wall-clock time limit exceeded");
    EXPECT_FALSE(j.contains("securityValidation"));
    EXPECT_TRUE(j.at("metrics").contains("alerts"));
}

TEST(RuleCategory, RoundTripsTags)
{
    for (const auto category : {RuleCategory::kCodeInjection, RuleCategory::kNetwork}) {
        auto parsed = parse_rule_category(to_string(category));
        ASSERT_TRUE(parsed);
        EXPECT_EQ(*parsed, category);
    }
    EXPECT_FALSE(parse_rule_category("teleportation"));
}

TEST(Error, CarriesCodeForBranching)
{
    auto ruby = parse_language("ruby");
    ASSERT_FALSE(ruby);
    EXPECT_TRUE(ruby.error().is("UnsupportedLanguage"));
    EXPECT_FALSE(ruby.error().is("InvalidRequest"));
    EXPECT_TRUE(ruby.error().describe().starts_with("UnsupportedLanguage: "));
}

}  // namespace secbox::test
