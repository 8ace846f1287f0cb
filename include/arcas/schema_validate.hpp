#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "arcas/common.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace arcas::common {

/**
 * Validate JSON against a JSON Schema file and list every violation.
 *
 * Schemas may reference siblings with "arcas:schema/<name>", resolved to
 * "<name>.schema.json" in the same directory.
 *
 * @return One "<json pointer>: <description>" line per violation (empty when
 *         valid), or an error when the schema itself cannot be loaded
 */
[[nodiscard]] arcas::Result<std::vector<std::string>>
collect_schema_issues(const nlohmann::json& j, const std::string& schema_path);

/**
 * Validate JSON against a JSON Schema file.
 *
 * @return Empty on success, SchemaValidationFailed carrying all issues otherwise
 */
[[nodiscard]] arcas::VoidResult validate_json(const nlohmann::json& j,
                                              const std::string& schema_path);

}  // namespace arcas::common
