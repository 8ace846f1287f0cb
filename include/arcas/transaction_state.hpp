#pragma once

/**
 * @file transaction_state.hpp
 * @brief Per-artifact outcome records of a transaction
 */

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace arcas::transaction {

enum class ResultCode {
    kValid,
    kVersionMismatch,
    kContentChanged,
    kNotFound,
    kValidationError,
    kTransactionFailure
};

/// Lowercase spelling: "valid", "version_mismatch", ...
[[nodiscard]] std::string_view to_string(ResultCode code);

[[nodiscard]] std::optional<ResultCode> result_code_from_string(std::string_view text);

/// VALID and CONTENT_CHANGED let the caller proceed.
[[nodiscard]] constexpr bool is_usable(ResultCode code) noexcept
{
    return code == ResultCode::kValid || code == ResultCode::kContentChanged;
}

/**
 * Outcome of validating one artifact inside one transaction.
 *
 * Filled in while the artifact is validated; never modified afterwards.
 */
struct TransactionState
{
    std::string artifact_name;
    std::string kind = "framework";
    std::optional<std::string> requested_version;
    std::optional<std::string> resolved_version;
    std::string content_hash;
    ResultCode result = ResultCode::kValidationError;
    bool new_version_created = false;
    std::vector<std::string> errors;
    std::string transaction_id;
    std::string timestamp;
};

struct Transaction
{
    std::string transaction_id;
    std::vector<TransactionState> states;
    std::string start_time;
};

[[nodiscard]] nlohmann::json to_json(const TransactionState& state);

}  // namespace arcas::transaction
