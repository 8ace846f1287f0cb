#pragma once

/**
 * @file validator.hpp
 * @brief Artifact content validation ahead of a transaction
 */

#include "arcas/common.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace arcas::validator {

struct ValidationReport
{
    bool is_valid = true;
    std::vector<std::string> issues;
};

/**
 * Checks an artifact payload before it reaches the coordinator.
 */
class ArtifactValidator
{
public:
    virtual ~ArtifactValidator() = default;

    [[nodiscard]] virtual arcas::Result<ValidationReport> validate(const nlohmann::json& payload,
                                                                   std::string_view kind) const = 0;
};

/**
 * Validates against <schema_dir>/<kind>.v1.schema.json.
 *
 * Kinds without a schema file are accepted with a single informational issue.
 */
class SchemaArtifactValidator : public ArtifactValidator
{
public:
    explicit SchemaArtifactValidator(std::filesystem::path schema_dir = "schemas");

    [[nodiscard]] arcas::Result<ValidationReport> validate(const nlohmann::json& payload,
                                                           std::string_view kind) const override;

    [[nodiscard]] std::filesystem::path schema_for(std::string_view kind) const;

private:
    std::filesystem::path m_schema_dir;
};

}  // namespace arcas::validator
