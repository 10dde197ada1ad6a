/**
 * @file test_config.cpp
 * @brief Configuration decoding, schema checking and defaults
 */

#include "secbox/common.hpp"
#include "secbox/config.hpp"

#include <filesystem>
#include <string>
#include <system_error>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace secbox::common::test {

namespace {

const std::filesystem::path kSchemaDir = SECBOX_SCHEMA_DIR;
const std::filesystem::path kConfigDir = SECBOX_CONFIG_DIR;

class ConfigFileTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_dir = std::filesystem::temp_directory_path()
                / ("secbox_config_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_"
                   + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(m_dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    [[nodiscard]] std::filesystem::path write(const std::string& name, const std::string& content) const
    {
        const auto path = m_dir / name;
        EXPECT_TRUE(write_text_file(path, content));
        return path;
    }

    std::filesystem::path m_dir;
};

}  // namespace

TEST(Config, DefaultsMatchDocumentedValues)
{
    const auto config = default_config();
    EXPECT_EQ(config.default_limits.max_memory_mb, 32U);
    EXPECT_EQ(config.risk_policy.critical_weight, 40);
    EXPECT_EQ(config.risk_policy.warning_weight, 10);
    EXPECT_EQ(config.risk_policy.max_risk_score, 30);
    EXPECT_TRUE(config.risk_policy.critical_blocks);
    EXPECT_EQ(config.monitor.sample_interval.count(), 50);
    EXPECT_EQ(config.interpreters.python, "python3");
    EXPECT_TRUE(config.work_dir.empty());
    EXPECT_FALSE(config.python_allowed_modules.empty());
}

TEST(Config, ShippedConfigurationLoads)
{
    auto config = load_config(kConfigDir / "secbox.json", kSchemaDir);
    ASSERT_TRUE(config) << config.error().message;
    EXPECT_EQ(config->default_limits.max_wall_clock_ms, 10'000U);
    EXPECT_EQ(config->validation_cache.capacity, 256U);
}

TEST(Config, PartialDocumentKeepsDefaults)
{
    const nlohmann::json j = {
        {"monitor", {{"sample_interval_ms", 20}}},
        { "python",  {{"allowed_modules", {"math"}}}}
    };
    auto config = config_from_json(j);
    ASSERT_TRUE(config);
    EXPECT_EQ(config->monitor.sample_interval.count(), 20);
    EXPECT_DOUBLE_EQ(config->monitor.cpu_alert_percent, 80.0);
    ASSERT_EQ(config->python_allowed_modules.size(), 1U);
    EXPECT_EQ(config->python_allowed_modules.front(), "math");
    EXPECT_EQ(config->default_limits.max_memory_mb, 32U);
}

TEST(Config, WrongFieldTypeIsInvalid)
{
    auto config = config_from_json(nlohmann::json{
        {"work_dir", 42}
    });
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, "InvalidConfig");
}

TEST_F(ConfigFileTest, MissingFileYieldsDefaults)
{
    auto config = load_config(m_dir / "absent.json", kSchemaDir);
    ASSERT_TRUE(config);
    EXPECT_EQ(config->default_limits.max_execution_time_ms, 5'000U);
}

TEST_F(ConfigFileTest, SchemaViolationIsRejected)
{
    const auto path = write("bad.json", R"({"limits": {"maxMemoryMB": 4096}})");
    auto config = load_config(path, kSchemaDir);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, "SchemaInvalid");
}

TEST_F(ConfigFileTest, MalformedJsonIsRejected)
{
    const auto path = write("broken.json", "{ not json");
    auto config = load_config(path, kSchemaDir);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, "ParseError");
}

TEST_F(ConfigFileTest, OverridesApply)
{
    const auto path = write("custom.json", R"({
        "risk_policy": {"maxRiskScore": 50, "criticalBlocks": false},
        "validation_cache": {"ttl_ms": 1000},
        "logging": {"level": "debug"}
    })");
    auto config = load_config(path, kSchemaDir);
    ASSERT_TRUE(config) << config.error().message;
    EXPECT_EQ(config->risk_policy.max_risk_score, 50);
    EXPECT_FALSE(config->risk_policy.critical_blocks);
    EXPECT_EQ(config->validation_cache.ttl.count(), 1'000);
    EXPECT_EQ(config->logging.level, "debug");
}

}  // namespace secbox::common::test
