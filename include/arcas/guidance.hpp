#pragma once

/**
 * @file guidance.hpp
 * @brief Actionable remediation steps for failed transactions
 */

#include "arcas/common.hpp"
#include "arcas/transaction_state.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace arcas::guidance {

struct FailedArtifact
{
    std::string artifact_name;
    std::string kind;
    transaction::ResultCode result = transaction::ResultCode::kValidationError;
    std::vector<std::string> errors;
    std::optional<std::string> requested_version;
    std::optional<std::string> resolved_version;
};

struct Guidance
{
    std::string transaction_id;
    std::size_t total_artifacts = 0;
    std::vector<FailedArtifact> failed_artifacts;
    std::vector<std::string> recommendations;
    std::vector<std::string> commands_to_run;
};

/// Guidance for every state of @p transaction that is not usable.
[[nodiscard]] Guidance generate(const transaction::Transaction& transaction);

[[nodiscard]] nlohmann::json to_json(const Guidance& guidance);

/// Human-readable rendering, one line per element.
[[nodiscard]] std::vector<std::string> render_text(const Guidance& guidance);

/// Write the JSON rendering (pretty, key-sorted) to @p path.
[[nodiscard]] arcas::VoidResult write_json(const Guidance& guidance, const std::filesystem::path& path);

}  // namespace arcas::guidance
