/**
 * @file test_validation_cache.cpp
 * @brief Validation cache keys, expiry and eviction
 */

#include "secbox/validation_cache.hpp"

#include <chrono>
#include <string>

#include <gtest/gtest.h>

namespace secbox::rules::test {

namespace {

using namespace std::chrono_literals;

class ValidationCacheTest : public ::testing::Test
{
protected:
    [[nodiscard]] ValidationCache make_cache(std::size_t capacity)
    {
        return ValidationCache(1000ms, capacity, [this] { return now; });
    }

    [[nodiscard]] static std::string key_for(std::string_view code)
    {
        auto key = ValidationCache::make_key(code, Language::kPython, ValidationOptions{});
        EXPECT_TRUE(key.has_value());
        return key.value_or(std::string{});
    }

    [[nodiscard]] static ValidationResult result_with_score(int score)
    {
        ValidationResult result;
        result.risk_score = score;
        return result;
    }

    std::chrono::steady_clock::time_point now{};
};

}  // namespace

TEST_F(ValidationCacheTest, KeyDependsOnInputsButNotPerformanceTarget)
{
    ValidationOptions options;
    const auto base = ValidationCache::make_key("print(1)", Language::kPython, options);
    ASSERT_TRUE(base);
    EXPECT_TRUE(base->starts_with("sha256:"));

    options.performance_target_ms = 5.0;
    EXPECT_EQ(ValidationCache::make_key("print(1)", Language::kPython, options).value(), *base);

    EXPECT_NE(ValidationCache::make_key("print(2)", Language::kPython, options).value(), *base);
    EXPECT_NE(ValidationCache::make_key("print(1)", Language::kJavaScript, options).value(), *base);

    options.educational_mode = false;
    EXPECT_NE(ValidationCache::make_key("print(1)", Language::kPython, options).value(), *base);

    ValidationOptions strict;
    strict.policy.max_risk_score = 10;
    EXPECT_NE(ValidationCache::make_key("print(1)", Language::kPython, strict).value(), *base);
}

TEST_F(ValidationCacheTest, ReturnsStoredResultUntilExpiry)
{
    auto cache = make_cache(4);
    const auto key = key_for("print(1)");
    EXPECT_FALSE(cache.find(key).has_value());

    cache.insert(key, result_with_score(40));
    now += 999ms;
    const auto hit = cache.find(key);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->risk_score, 40);

    now += 1ms;
    EXPECT_FALSE(cache.find(key).has_value());
    EXPECT_EQ(cache.size(), 0U);
}

TEST_F(ValidationCacheTest, EvictsExpiredEntriesBeforeOldest)
{
    auto cache = make_cache(2);
    const auto first = key_for("a = 1");
    const auto second = key_for("b = 2");
    const auto third = key_for("c = 3");

    cache.insert(first, result_with_score(1));
    now += 600ms;
    cache.insert(second, result_with_score(2));
    now += 500ms;
    // `first` has expired by now; inserting drops it and keeps `second`
    cache.insert(third, result_with_score(3));
    EXPECT_EQ(cache.size(), 2U);
    EXPECT_FALSE(cache.find(first).has_value());
    EXPECT_TRUE(cache.find(second).has_value());
    EXPECT_TRUE(cache.find(third).has_value());
}

TEST_F(ValidationCacheTest, EvictsOldestWhenNothingExpired)
{
    auto cache = make_cache(2);
    const auto first = key_for("a = 1");
    const auto second = key_for("b = 2");
    const auto third = key_for("c = 3");

    cache.insert(first, result_with_score(1));
    cache.insert(second, result_with_score(2));
    cache.insert(third, result_with_score(3));
    EXPECT_EQ(cache.size(), 2U);
    EXPECT_FALSE(cache.find(first).has_value());
    EXPECT_EQ(cache.find(third)->risk_score, 3);

    // Overwriting an existing key never evicts
    cache.insert(second, result_with_score(20));
    EXPECT_EQ(cache.size(), 2U);
    EXPECT_EQ(cache.find(second)->risk_score, 20);

    cache.clear();
    EXPECT_EQ(cache.size(), 0U);
}

}  // namespace secbox::rules::test
