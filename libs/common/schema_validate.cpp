/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "arcas/schema_validate.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <ranges>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace arcas::common {

namespace {

constexpr std::string_view kSchemaUriPrefix = "arcas:schema/";

/// valijson understands draft-07 "definitions"; map 2020-12 "$defs" onto it.
void rewrite_defs(nlohmann::json& schema)
{
    if (schema.is_object()) {
        if (schema.contains("$defs") && !schema.contains("definitions")) {
            schema["definitions"] = schema["$defs"];
        }
        for (auto& [key, value] : schema.items()) {
            if (key == "$ref" && value.is_string()) {
                auto ref = value.get<std::string>();
                constexpr std::string_view kDefsPrefix = "#/$defs/";
                if (ref.starts_with(kDefsPrefix)) {
                    value = "#/definitions/" + ref.substr(kDefsPrefix.size());
                }
                continue;
            }
            rewrite_defs(value);
        }
        return;
    }
    if (schema.is_array()) {
        for (auto& value : schema) {
            rewrite_defs(value);
        }
    }
}

[[nodiscard]] arcas::Result<nlohmann::json> read_schema(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            arcas::make_error(errc::kIOError, "Failed to open schema file: " + path.string()));
    }
    nlohmann::json schema;
    try {
        in >> schema;
    } catch (const std::exception& ex) {
        return std::unexpected(arcas::make_error(
            errc::kParseError,
            std::format("Failed to parse schema JSON {}: {}", path.string(), ex.what())));
    }
    rewrite_defs(schema);
    return schema;
}

[[nodiscard]] std::vector<std::string> drain_errors(valijson::ValidationResults& results)
{
    std::vector<std::string> issues;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string pointer;
        for (const auto& part : error.context | std::views::drop(1)) {
            pointer += "/" + part;
        }
        issues.push_back(std::format("{}: {}", pointer.empty() ? "/" : pointer, error.description));
    }
    return issues;
}

}  // namespace

arcas::Result<std::vector<std::string>> collect_schema_issues(const nlohmann::json& j,
                                                              const std::string& schema_path)
{
    auto schema_json = read_schema(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }

    const auto schema_dir = std::filesystem::path(schema_path).parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> fetched;
    const auto fetch_doc = [&schema_dir, &fetched](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        auto doc = read_schema(schema_dir / (uri.substr(kSchemaUriPrefix.size()) + ".schema.json"));
        if (!doc) {
            return nullptr;
        }
        fetched.push_back(std::make_unique<nlohmann::json>(std::move(*doc)));
        return fetched.back().get();
    };
    const auto free_doc = [](const nlohmann::json*) {};

    valijson::Schema schema;
    valijson::SchemaParser parser;
    try {
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema, fetch_doc, free_doc);
    } catch (const std::exception& ex) {
        return std::unexpected(arcas::make_error(
            errc::kParseError, std::format("Failed to build schema {}: {}", schema_path, ex.what())));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target(j);
    if (validator.validate(schema, target, &results)) {
        return std::vector<std::string>{};
    }
    auto issues = drain_errors(results);
    if (issues.empty()) {
        issues.emplace_back("/: schema validation failed");
    }
    return issues;
}

arcas::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto issues = collect_schema_issues(j, schema_path);
    if (!issues) {
        return std::unexpected(issues.error());
    }
    if (issues->empty()) {
        return {};
    }
    std::string joined;
    for (const auto& issue : *issues) {
        if (!joined.empty()) {
            joined += '\n';
        }
        joined += issue;
    }
    return std::unexpected(arcas::make_error(errc::kSchemaValidationFailed, std::move(joined)));
}

}  // namespace arcas::common
