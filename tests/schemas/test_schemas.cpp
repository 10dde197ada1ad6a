#include "secbox/common.hpp"
#include "secbox/schema_validate.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace secbox::common::test {

namespace {

const std::filesystem::path kSchemaDir = SECBOX_SCHEMA_DIR;
const std::filesystem::path kConfigDir = SECBOX_CONFIG_DIR;

struct SchemaCase
{
    std::string description;
    std::string schema_name;
    nlohmann::json document;
};

nlohmann::json make_limits_json()
{
    return nlohmann::json{
        {       "maxMemoryMB",    32},
        {"maxExecutionTimeMs",  5000},
        {    "maxWallClockMs", 10000},
        {    "maxOutputBytes",  4096},
        {"maxNetworkRequests",    10},
        {   "maxDomMutations",   100},
        { "maxRecursionDepth",   100}
    };
}

nlohmann::json make_request_json()
{
    return nlohmann::json{
        {              "language",                       "python"},
        {                  "code",                     "print(1)"},
        {                "inputs",   nlohmann::json::array({"a"})},
        {                "limits",             make_limits_json()},
        {    "strictSecurityMode",                           true},
        {"skipSecurityValidation",                          false},
        {      "inspectVariables",                           true},
        {        "hiddenPrefixes", nlohmann::json::array({"tmp"})}
    };
}

nlohmann::json load_shipped_config()
{
    std::ifstream in(kConfigDir / "secbox.json");
    return nlohmann::json::parse(in);
}

std::vector<SchemaCase> make_valid_cases()
{
    return {
        {.description = "full request", .schema_name = "execution_request.v1", .document = make_request_json()},
        {.description = "minimal request",
         .schema_name = "execution_request.v1",
         .document = {{"language", "typescript"}, {"code", ""}}},
        {.description = "limits", .schema_name = "limits.v1", .document = make_limits_json()},
        {.description = "empty limits", .schema_name = "limits.v1", .document = nlohmann::json::object()},
        {.description = "shipped config", .schema_name = "config.v1", .document = load_shipped_config()}
    };
}

std::vector<SchemaCase> make_invalid_cases()
{
    auto unknown_key = make_request_json();
    unknown_key["timeout"] = 5;

    auto bad_language = make_request_json();
    bad_language["language"] = "ruby";

    auto missing_code = make_request_json();
    missing_code.erase("code");

    auto memory_over_bound = make_request_json();
    memory_over_bound["limits"]["maxMemoryMB"] = 65;

    auto negative_network = make_limits_json();
    negative_network["maxNetworkRequests"] = -1;

    auto wall_over_bound = make_limits_json();
    wall_over_bound["maxWallClockMs"] = 30001;

    auto bad_level = load_shipped_config();
    bad_level["logging"]["level"] = "verbose";

    auto unknown_section = load_shipped_config();
    unknown_section["plugins"] = nlohmann::json::array();

    return {
        {.description = "unknown request key", .schema_name = "execution_request.v1", .document = unknown_key},
        {.description = "unsupported language", .schema_name = "execution_request.v1", .document = bad_language},
        {.description = "missing code", .schema_name = "execution_request.v1", .document = missing_code},
        {.description = "memory above bound via $ref",
         .schema_name = "execution_request.v1",
         .document = memory_over_bound},
        {.description = "negative network budget", .schema_name = "limits.v1", .document = negative_network},
        {.description = "wall clock above bound", .schema_name = "limits.v1", .document = wall_over_bound},
        {.description = "unknown log level", .schema_name = "config.v1", .document = bad_level},
        {.description = "unknown config section", .schema_name = "config.v1", .document = unknown_section}
    };
}

}  // namespace

TEST(SchemaValidateTest, ValidDocumentsPass)
{
    for (const auto& schema_case : make_valid_cases()) {
        SCOPED_TRACE(schema_case.description);
        auto result = validate_json(schema_case.document, kSchemaDir, schema_case.schema_name);
        EXPECT_TRUE(result) << (result ? "" : result.error().message);
    }
}

TEST(SchemaValidateTest, InvalidDocumentsFail)
{
    for (const auto& schema_case : make_invalid_cases()) {
        SCOPED_TRACE(schema_case.description);
        auto result = validate_json(schema_case.document, kSchemaDir, schema_case.schema_name);
        ASSERT_FALSE(result);
        EXPECT_EQ(result.error().code, "SchemaValidationFailed");
        EXPECT_FALSE(result.error().message.empty());
    }
}

TEST(SchemaValidateTest, MissingSchemaFileIsReported)
{
    auto result = validate_json(nlohmann::json::object(), kSchemaDir, "no_such_schema.v1");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaFileOpenFailed");
}

}  // namespace secbox::common::test
