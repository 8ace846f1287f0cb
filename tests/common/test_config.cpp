/**
 * @file test_config.cpp
 * @brief Configuration file and environment override tests
 */

#include "arcas/config.hpp"

#include "support/temp_dir.hpp"

#include <fstream>
#include <map>

#include <gtest/gtest.h>

using arcas::test::TempDir;

namespace {

arcas::config::EnvLookup fake_env(std::map<std::string, std::string> values)
{
    return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
        auto it = values.find(std::string(name));
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

}  // namespace

TEST(Config, Defaults)
{
    const arcas::config::Config config;
    EXPECT_EQ(config.storage_root, "asset_storage");
    EXPECT_EQ(config.busy_timeout_ms, 5000);
    EXPECT_EQ(config.log.level, "info");
    EXPECT_EQ(config.content_scope.incidental_keys.size(), 3U);
}

TEST(Config, LoadsFileAndKeepsDefaultsForAbsentKeys)
{
    TempDir temp_dir("arcas_config_load");
    const auto path = temp_dir.path() / "arcas.json";
    {
        std::ofstream out(path);
        out << R"({"storage_root": "/data/blobs", "busy_timeout_ms": 250,
                   "incidental_keys": ["generated_at"], "log": {"level": "debug"}})";
    }

    auto config = arcas::config::load_file(path, ARCAS_SCHEMA_DIR);
    ASSERT_TRUE(config) << config.error().message;
    EXPECT_EQ(config->storage_root, "/data/blobs");
    EXPECT_EQ(config->busy_timeout_ms, 250);
    EXPECT_EQ(config->content_scope.incidental_keys, std::vector<std::string>{"generated_at"});
    EXPECT_EQ(config->log.level, "debug");
    EXPECT_EQ(config->database_path, "arcas.db");
    EXPECT_EQ(config->schema_dir, ARCAS_SCHEMA_DIR);
}

TEST(Config, SchemaViolationIsConfigError)
{
    TempDir temp_dir("arcas_config_invalid");
    const auto path = temp_dir.path() / "arcas.json";
    {
        std::ofstream out(path);
        out << R"({"busy_timeout_ms": "soon"})";
    }
    auto config = arcas::config::load_file(path, ARCAS_SCHEMA_DIR);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, arcas::errc::kConfigError);
}

TEST(Config, EnvironmentOverridesFile)
{
    arcas::config::Config config;
    config.storage_root = "/from/file";
    arcas::config::apply_environment(config, fake_env({
                                                 {"ARCAS_STORAGE_ROOT", "/from/env"},
                                                 {    "ARCAS_DATABASE", "/env/arcas.db"},
                                                 {   "ARCAS_LOG_LEVEL",         "warn"}
    }));
    EXPECT_EQ(config.storage_root, "/from/env");
    EXPECT_EQ(config.database_path, "/env/arcas.db");
    EXPECT_EQ(config.log.level, "warn");
    EXPECT_EQ(config.workspace_root, ".");
}

TEST(Config, UnsetEnvironmentChangesNothing)
{
    arcas::config::Config config;
    config.schema_dir = "/schemas";
    arcas::config::apply_environment(config, fake_env({}));
    EXPECT_EQ(config.schema_dir, "/schemas");
}
