/**
 * @file test_canonical_json.cpp
 * @brief Canonical JSON form behind validation cache keys
 */

#include "secbox/canonical_json.hpp"
#include "secbox/common.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace secbox::canonical;
using Json = nlohmann::json;

TEST(CanonicalJSON, SortsKeysAtEveryLevel)
{
    Json j = {
        {"options", {{"policy", {{"maxRiskScore", 30}, {"criticalWeight", 40}}}, {"educationalMode", true}}},
        {   "code",                                                                          "x = 1"}
    };
    auto canonical = canonicalize(j);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical,
              R"({"code":"x = 1","options":{"educationalMode":true,"policy":{"criticalWeight":40,"maxRiskScore":30}}})");
}

TEST(CanonicalJSON, KeepsArrayOrder)
{
    Json j = {
        {"enabledCategories", {"network", "code-injection"}}
    };
    auto canonical = canonicalize(j);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical, R"({"enabledCategories":["network","code-injection"]})");
}

TEST(CanonicalJSON, EscapesSourceText)
{
    Json j = {
        {"code", "print(\"a\")\n\tdone"}
    };
    auto canonical = canonicalize(j);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical, R"({"code":"print(\"a\")\n\tdone"})");
}

TEST(CanonicalJSON, RejectsFloatingPoint)
{
    Json j = {
        {"performanceTargetMs", 100.5}
    };
    EXPECT_FALSE(canonicalize(j));
    EXPECT_FALSE(hash_canonical(j));
}

TEST(CanonicalJSON, InsertionOrderDoesNotChangeHash)
{
    Json first;
    first["language"] = "python";
    first["code"] = "import os";

    Json second;
    second["code"] = "import os";
    second["language"] = "python";

    auto h1 = hash_canonical(first);
    auto h2 = hash_canonical(second);
    ASSERT_TRUE(h1);
    ASSERT_TRUE(h2);
    EXPECT_EQ(*h1, *h2);
    EXPECT_TRUE(h1->starts_with("sha256:"));
}

TEST(CanonicalJSON, DifferentCodeDifferentHash)
{
    auto h1 = hash_canonical(Json{
        {"code", "eval('1')"}
    });
    auto h2 = hash_canonical(Json{
        {"code", "eval('2')"}
    });
    ASSERT_TRUE(h1);
    ASSERT_TRUE(h2);
    EXPECT_NE(*h1, *h2);
}
