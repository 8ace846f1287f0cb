#pragma once

/**
 * @file config.hpp
 * @brief Runtime configuration: file, environment, defaults
 */

#include "arcas/canonical_json.hpp"
#include "arcas/common.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace arcas::config {

struct LogSettings
{
    std::string level = "info";
    std::string pattern;
};

struct Config
{
    std::filesystem::path storage_root = "asset_storage";
    std::filesystem::path database_path = "arcas.db";
    std::filesystem::path schema_dir = "schemas";
    std::filesystem::path workspace_root = ".";
    std::string ingestion_method = "arcas_transaction";
    int busy_timeout_ms = 5000;
    canonical::ContentScope content_scope;
    LogSettings log;
};

/// Environment lookup; returns nullopt for unset variables.
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

[[nodiscard]] EnvLookup process_environment();

/**
 * Read a JSON configuration file.
 *
 * The document is checked against config.v1.schema.json in @p schema_dir;
 * keys absent from the file keep their defaults.
 */
[[nodiscard]] arcas::Result<Config> load_file(const std::filesystem::path& path,
                                              const std::filesystem::path& schema_dir);

/**
 * Overlay ARCAS_STORAGE_ROOT, ARCAS_DATABASE, ARCAS_SCHEMA_DIR,
 * ARCAS_WORKSPACE and ARCAS_LOG_LEVEL.
 */
void apply_environment(Config& config, const EnvLookup& env);

}  // namespace arcas::config
