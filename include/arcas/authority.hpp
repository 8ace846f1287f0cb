#pragma once

/**
 * @file authority.hpp
 * @brief Backing-store gateway for artifact version records
 */

#include "arcas/common.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

struct sqlite3;

namespace arcas::authority {

/// One registered version of an artifact. Immutable once inserted.
struct VersionRecord
{
    std::string artifact_name;
    std::string kind = "framework";
    std::string version;
    std::string content_hash;  ///< digest of the scoped payload (change detection)
    std::string blob_hash;     ///< content-addressable key of the full payload
    nlohmann::json payload;
    std::string created_at;  ///< ISO-8601 UTC
};

enum class InsertOutcome {
    kInserted,
    kAlreadyExists  ///< (artifact_name, version) was taken; nothing written
};

/**
 * Capability interface over the authoritative store.
 *
 * Rows are keyed by (artifact_name, version). Implementations never retry;
 * callers decide what to do with a failure.
 */
class AuthorityGateway
{
public:
    virtual ~AuthorityGateway() = default;

    [[nodiscard]] virtual arcas::Result<std::optional<VersionRecord>>
    find(std::string_view artifact_name, std::string_view version) = 0;

    /// Most recently created version of the artifact.
    [[nodiscard]] virtual arcas::Result<std::optional<VersionRecord>>
    latest(std::string_view artifact_name) = 0;

    /// All versions of the artifact, oldest first.
    [[nodiscard]] virtual arcas::Result<std::vector<VersionRecord>>
    list(std::string_view artifact_name) = 0;

    [[nodiscard]] virtual arcas::Result<bool> exists(std::string_view artifact_name,
                                                     std::string_view version) = 0;

    /// Insert unless (artifact_name, version) already exists.
    [[nodiscard]] virtual arcas::Result<InsertOutcome> insert(const VersionRecord& record) = 0;

    /// @return true when a row was deleted, false when none matched
    [[nodiscard]] virtual arcas::Result<bool> remove(std::string_view artifact_name,
                                                     std::string_view version) = 0;

    [[nodiscard]] virtual arcas::Result<std::vector<std::string>> artifact_names() = 0;
};

/**
 * Process-local gateway for tests and dry runs.
 */
class InMemoryAuthorityGateway : public AuthorityGateway
{
public:
    [[nodiscard]] arcas::Result<std::optional<VersionRecord>>
    find(std::string_view artifact_name, std::string_view version) override;
    [[nodiscard]] arcas::Result<std::optional<VersionRecord>>
    latest(std::string_view artifact_name) override;
    [[nodiscard]] arcas::Result<std::vector<VersionRecord>>
    list(std::string_view artifact_name) override;
    [[nodiscard]] arcas::Result<bool> exists(std::string_view artifact_name,
                                             std::string_view version) override;
    [[nodiscard]] arcas::Result<InsertOutcome> insert(const VersionRecord& record) override;
    [[nodiscard]] arcas::Result<bool> remove(std::string_view artifact_name,
                                             std::string_view version) override;
    [[nodiscard]] arcas::Result<std::vector<std::string>> artifact_names() override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::vector<VersionRecord> m_rows;  // insertion order
};

/**
 * SQLite-backed gateway (table artifact_versions).
 */
class SqliteAuthorityGateway : public AuthorityGateway
{
public:
    /**
     * Open (creating if needed) the database and its schema.
     * @param busy_timeout_ms how long a writer waits on a locked database
     */
    [[nodiscard]] static arcas::Result<std::unique_ptr<SqliteAuthorityGateway>>
    open(const std::filesystem::path& db_path, int busy_timeout_ms = 5000);

    ~SqliteAuthorityGateway() override;
    SqliteAuthorityGateway(const SqliteAuthorityGateway&) = delete;
    SqliteAuthorityGateway& operator=(const SqliteAuthorityGateway&) = delete;

    [[nodiscard]] arcas::Result<std::optional<VersionRecord>>
    find(std::string_view artifact_name, std::string_view version) override;
    [[nodiscard]] arcas::Result<std::optional<VersionRecord>>
    latest(std::string_view artifact_name) override;
    [[nodiscard]] arcas::Result<std::vector<VersionRecord>>
    list(std::string_view artifact_name) override;
    [[nodiscard]] arcas::Result<bool> exists(std::string_view artifact_name,
                                             std::string_view version) override;
    [[nodiscard]] arcas::Result<InsertOutcome> insert(const VersionRecord& record) override;
    [[nodiscard]] arcas::Result<bool> remove(std::string_view artifact_name,
                                             std::string_view version) override;
    [[nodiscard]] arcas::Result<std::vector<std::string>> artifact_names() override;

private:
    explicit SqliteAuthorityGateway(sqlite3* db);

    [[nodiscard]] arcas::Result<std::vector<VersionRecord>>
    query_records(const char* sql, std::string_view artifact_name, std::string_view version);

    sqlite3* m_db;
};

}  // namespace arcas::authority
