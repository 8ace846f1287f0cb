/**
 * @file config.cpp
 * @brief Configuration loading
 */

#include "arcas/config.hpp"

#include "arcas/payload_io.hpp"
#include "arcas/schema_validate.hpp"

#include <cstdlib>
#include <format>

namespace arcas::config {

EnvLookup process_environment()
{
    return [](std::string_view name) -> std::optional<std::string> {
        if (const char* value = std::getenv(std::string(name).c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    };
}

arcas::Result<Config> load_file(const std::filesystem::path& path,
                                const std::filesystem::path& schema_dir)
{
    auto document = io::read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    const auto schema_path = schema_dir / "config.v1.schema.json";
    if (auto valid = common::validate_json(*document, schema_path.string()); !valid) {
        return std::unexpected(arcas::make_error(
            errc::kConfigError,
            std::format("Invalid configuration {}: {}", path.string(), valid.error().message)));
    }

    Config config;
    const nlohmann::json& doc = *document;
    config.storage_root = doc.value("storage_root", config.storage_root.string());
    config.database_path = doc.value("database_path", config.database_path.string());
    config.schema_dir = doc.value("schema_dir", schema_dir.string());
    config.workspace_root = doc.value("workspace_root", config.workspace_root.string());
    config.ingestion_method = doc.value("ingestion_method", config.ingestion_method);
    config.busy_timeout_ms = doc.value("busy_timeout_ms", config.busy_timeout_ms);
    if (doc.contains("incidental_keys")) {
        config.content_scope.incidental_keys =
            doc.at("incidental_keys").get<std::vector<std::string>>();
    }
    if (doc.contains("log")) {
        const auto& log = doc.at("log");
        config.log.level = log.value("level", config.log.level);
        config.log.pattern = log.value("pattern", config.log.pattern);
    }
    return config;
}

void apply_environment(Config& config, const EnvLookup& env)
{
    if (auto value = env("ARCAS_STORAGE_ROOT")) {
        config.storage_root = *value;
    }
    if (auto value = env("ARCAS_DATABASE")) {
        config.database_path = *value;
    }
    if (auto value = env("ARCAS_SCHEMA_DIR")) {
        config.schema_dir = *value;
    }
    if (auto value = env("ARCAS_WORKSPACE")) {
        config.workspace_root = *value;
    }
    if (auto value = env("ARCAS_LOG_LEVEL")) {
        config.log.level = *value;
    }
}

}  // namespace arcas::config
