#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for deterministic hashing
 *
 * Rules:
 * - UTF-8 encoding
 * - Object keys in lexicographic order, recursively
 * - No whitespace (minimal representation)
 * - Floating point only when the caller opts in (artifact payloads carry
 *   weights); sidecars and configuration stay integer-only
 */

#include "arcas/common.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace arcas::canonical {

enum class FloatPolicy {
    kReject,  ///< Floating point numbers make canonicalization fail
    kAllow    ///< Floating point numbers are serialized in shortest round-trip form
};

/**
 * Which parts of a payload carry meaning for change detection.
 *
 * Top-level keys starting with '_' and the listed incidental keys are dropped
 * before hashing; everything else is in scope.
 */
struct ContentScope
{
    std::vector<std::string> incidental_keys{"last_modified", "generated_at", "exported_at"};
};

/**
 * Serialize JSON to canonical form
 * @return Canonical byte string or error
 */
[[nodiscard]] arcas::Result<std::string> canonicalize(const nlohmann::json& j,
                                                      FloatPolicy floats = FloatPolicy::kReject);

/**
 * Compute SHA-256 of the canonical form
 * @return 64-hex digest (no prefix) or error
 */
[[nodiscard]] arcas::Result<std::string> hash_canonical(const nlohmann::json& j,
                                                        FloatPolicy floats = FloatPolicy::kReject);

/// Copy of @p payload restricted to the keys that matter for change detection.
[[nodiscard]] nlohmann::json scoped_payload(const nlohmann::json& payload,
                                            const ContentScope& scope);

/// hash_canonical(scoped_payload(payload, scope)) with floats allowed.
[[nodiscard]] arcas::Result<std::string> scoped_hash(const nlohmann::json& payload,
                                                     const ContentScope& scope);

/**
 * Pretty, key-sorted rendering for human-diffable sidecar files.
 */
[[nodiscard]] arcas::Result<std::string> pretty_sorted(const nlohmann::json& j);

}  // namespace arcas::canonical
