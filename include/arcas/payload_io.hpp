#pragma once

/**
 * @file payload_io.hpp
 * @brief Reading artifact files and writing JSON documents
 */

#include "arcas/common.hpp"

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

namespace arcas::io {

/**
 * Load an artifact file into a JSON document.
 *
 * ".yaml" and ".yml" files are parsed with yaml-cpp and converted; everything
 * else is parsed as JSON.
 */
[[nodiscard]] arcas::Result<nlohmann::json> load_payload(const std::filesystem::path& path);

[[nodiscard]] arcas::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

/// Write @p content, creating parent directories as needed.
[[nodiscard]] arcas::VoidResult write_text_file(const std::filesystem::path& path,
                                                std::string_view content);

}  // namespace arcas::io
