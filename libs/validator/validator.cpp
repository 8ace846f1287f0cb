/**
 * @file validator.cpp
 * @brief Schema-backed artifact validator
 */

#include "arcas/validator.hpp"

#include "arcas/log.hpp"
#include "arcas/schema_validate.hpp"

#include <format>

namespace arcas::validator {

SchemaArtifactValidator::SchemaArtifactValidator(std::filesystem::path schema_dir)
    : m_schema_dir(std::move(schema_dir))
{}

std::filesystem::path SchemaArtifactValidator::schema_for(std::string_view kind) const
{
    return m_schema_dir / std::format("{}.v1.schema.json", kind);
}

arcas::Result<ValidationReport> SchemaArtifactValidator::validate(const nlohmann::json& payload,
                                                                  std::string_view kind) const
{
    const auto schema_path = schema_for(kind);
    std::error_code ec;
    if (!std::filesystem::exists(schema_path, ec)) {
        log::logger()->debug("no schema for kind '{}' at {}", kind, schema_path.string());
        return ValidationReport{.is_valid = true,
                                .issues = {std::format("no schema for kind '{}'; not checked", kind)}};
    }

    auto issues = common::collect_schema_issues(payload, schema_path.string());
    if (!issues) {
        return std::unexpected(issues.error());
    }
    ValidationReport report;
    report.is_valid = issues->empty();
    report.issues = std::move(*issues);
    if (!report.is_valid) {
        log::logger()->warn("{} payload fails {}: {} issue(s)", kind, schema_path.filename().string(),
                            report.issues.size());
    }
    return report;
}

}  // namespace arcas::validator
