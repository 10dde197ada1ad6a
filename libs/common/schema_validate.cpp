/**
 * @file schema_validate.cpp
 * @brief valijson-backed schema checks
 */

#include "secbox/schema_validate.hpp"

#include <deque>
#include <format>
#include <string>

#include <spdlog/spdlog.h>
#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace secbox::common {

namespace {

constexpr std::string_view kRefScheme = "secbox:schema/";

[[nodiscard]] std::filesystem::path schema_file(const std::filesystem::path& dir, std::string_view stem)
{
    return dir / std::format("{}.schema.json", stem);
}

[[nodiscard]] secbox::Result<nlohmann::json> read_schema(const std::filesystem::path& path)
{
    auto document = read_json_file(path);
    if (document) {
        return document;
    }
    return std::unexpected(Error::make(document.error().is("IOError") ? "SchemaFileOpenFailed" : "SchemaParseFailed",
                                       document.error().message));
}

/**
 * @brief Supplies referenced schemas to valijson while a root schema is parsed
 *
 * Documents are kept alive in a deque for the lifetime of the parse.
 */
class RefResolver
{
public:
    explicit RefResolver(std::filesystem::path dir)
        : m_dir(std::move(dir))
    {}

    const nlohmann::json* fetch(const std::string& uri)
    {
        if (!uri.starts_with(kRefScheme)) {
            spdlog::warn("Unresolvable schema reference: {}", uri);
            return nullptr;
        }
        auto loaded = read_schema(schema_file(m_dir, std::string_view(uri).substr(kRefScheme.size())));
        if (!loaded) {
            spdlog::warn("Schema reference {} failed: {}", uri, loaded.error().message);
            return nullptr;
        }
        return &m_loaded.emplace_back(std::move(*loaded));
    }

private:
    std::filesystem::path m_dir;
    std::deque<nlohmann::json> m_loaded;
};

[[nodiscard]] std::string join_violations(valijson::ValidationResults& results)
{
    std::string text;
    valijson::ValidationResults::Error violation;
    while (results.popError(violation)) {
        std::string pointer;
        for (const auto& segment : violation.context) {
            // valijson reports "<root>" as the first segment
            if (segment != "<root>") {
                pointer += "/" + segment;
            }
        }
        text += std::format("{}{}: {}", text.empty() ? "" : "\n", pointer.empty() ? "/" : pointer,
                            violation.description);
    }
    return text.empty() ? std::string("document does not match schema") : text;
}

}  // namespace

secbox::VoidResult validate_json(const nlohmann::json& j, const std::filesystem::path& schema_path)
{
    auto root = read_schema(schema_path);
    if (!root) {
        return std::unexpected(root.error());
    }

    RefResolver resolver(schema_path.parent_path());
    valijson::Schema schema;
    try {
        valijson::SchemaParser parser(valijson::SchemaParser::kDraft7);
        valijson::adapters::NlohmannJsonAdapter root_adapter(*root);
        parser.populateSchema(
            root_adapter,
            schema,
            [&resolver](const std::string& uri) { return resolver.fetch(uri); },
            [](const nlohmann::json*) {});
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::format("{}: {}", schema_path.filename().string(), ex.what())));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter document(j);
    if (validator.validate(schema, document, &results)) {
        return {};
    }
    return std::unexpected(Error::make("SchemaValidationFailed", join_violations(results)));
}

secbox::VoidResult validate_json(const nlohmann::json& j,
                                 const std::filesystem::path& schema_dir,
                                 std::string_view stem)
{
    return validate_json(j, schema_file(schema_dir, stem));
}

}  // namespace secbox::common
