#pragma once

/**
 * @file artifact_resolver.hpp
 * @brief Locating an artifact's development file in a workspace
 */

#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace arcas::resolver {

/**
 * Relative path templates, most specific first.
 *
 * Placeholders: {name} (artifact name), {kind} (artifact kind), {dir} (kind
 * directory, i.e. the kind pluralized: "frameworks").
 */
[[nodiscard]] std::span<const std::string_view> default_patterns();

/// Expand one template.
[[nodiscard]] std::string expand_pattern(std::string_view pattern,
                                         std::string_view name,
                                         std::string_view kind);

/// Every candidate under @p root, in pattern order. Touches no filesystem.
[[nodiscard]] std::vector<std::filesystem::path> candidate_paths(const std::filesystem::path& root,
                                                                 std::string_view name,
                                                                 std::string_view kind = "framework");

using ExistsFn = std::function<bool(const std::filesystem::path&)>;

/// First candidate accepted by @p exists (defaults to a regular-file check).
[[nodiscard]] std::optional<std::filesystem::path> resolve(const std::filesystem::path& root,
                                                           std::string_view name,
                                                           std::string_view kind = "framework",
                                                           const ExistsFn& exists = {});

}  // namespace arcas::resolver
