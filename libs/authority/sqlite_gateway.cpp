/**
 * @file sqlite_gateway.cpp
 * @brief SQLite authority gateway
 */

#include "arcas/authority.hpp"

#include "arcas/canonical_json.hpp"
#include "arcas/log.hpp"

#include <format>

#include <sqlite3.h>

namespace arcas::authority {

namespace {

constexpr const char* kSchemaSql = R"sql(
CREATE TABLE IF NOT EXISTS artifact_versions (
    seq           INTEGER PRIMARY KEY AUTOINCREMENT,
    artifact_name TEXT NOT NULL,
    kind          TEXT NOT NULL,
    version       TEXT NOT NULL,
    content_hash  TEXT NOT NULL,
    blob_hash     TEXT NOT NULL,
    payload       TEXT NOT NULL,
    created_at    TEXT NOT NULL,
    UNIQUE (artifact_name, version)
);
CREATE INDEX IF NOT EXISTS idx_artifact_versions_created
    ON artifact_versions (artifact_name, created_at);
)sql";

constexpr const char* kColumns =
    "artifact_name, kind, version, content_hash, blob_hash, payload, created_at";

/// Owns one prepared statement.
class Statement
{
public:
    Statement(sqlite3* db, const std::string& sql)
    {
        m_rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr);
    }
    ~Statement() { sqlite3_finalize(m_stmt); }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] bool ok() const noexcept { return m_rc == SQLITE_OK; }
    [[nodiscard]] sqlite3_stmt* get() const noexcept { return m_stmt; }

    void bind(int index, std::string_view text)
    {
        sqlite3_bind_text(m_stmt, index, text.data(), static_cast<int>(text.size()),
                          SQLITE_TRANSIENT);
    }

private:
    sqlite3_stmt* m_stmt = nullptr;
    int m_rc = SQLITE_OK;
};

[[nodiscard]] arcas::Error db_error(sqlite3* db, std::string_view what)
{
    return arcas::make_error(errc::kDatabaseError, std::format("{}: {}", what, sqlite3_errmsg(db)));
}

[[nodiscard]] std::string column_text(sqlite3_stmt* stmt, int col)
{
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text != nullptr ? std::string(text) : std::string{};
}

}  // namespace

SqliteAuthorityGateway::SqliteAuthorityGateway(sqlite3* db)
    : m_db(db)
{}

SqliteAuthorityGateway::~SqliteAuthorityGateway()
{
    sqlite3_close(m_db);
}

arcas::Result<std::unique_ptr<SqliteAuthorityGateway>>
SqliteAuthorityGateway::open(const std::filesystem::path& db_path, int busy_timeout_ms)
{
    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(db_path.string().c_str(), &db, flags, nullptr) != SQLITE_OK) {
        auto error = arcas::make_error(
            errc::kDatabaseError,
            std::format("Cannot open database {}: {}", db_path.string(),
                        db != nullptr ? sqlite3_errmsg(db) : "out of memory"));
        sqlite3_close(db);
        return std::unexpected(std::move(error));
    }
    // Constructed before any further failure so the handle is always closed.
    std::unique_ptr<SqliteAuthorityGateway> gateway(new SqliteAuthorityGateway(db));

    sqlite3_busy_timeout(db, busy_timeout_ms);
    char* err_msg = nullptr;
    // WAL is unavailable for in-memory databases; the pragma then reports "memory".
    if (sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &err_msg) != SQLITE_OK) {
        log::logger()->warn("could not enable WAL on {}: {}", db_path.string(),
                            err_msg != nullptr ? err_msg : "unknown");
        sqlite3_free(err_msg);
        err_msg = nullptr;
    }
    if (sqlite3_exec(db, kSchemaSql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        auto error = arcas::make_error(
            errc::kDatabaseError,
            std::format("Cannot create schema in {}: {}", db_path.string(),
                        err_msg != nullptr ? err_msg : "unknown"));
        sqlite3_free(err_msg);
        return std::unexpected(std::move(error));
    }
    log::logger()->debug("opened authority database {}", db_path.string());
    return gateway;
}

arcas::Result<std::vector<VersionRecord>>
SqliteAuthorityGateway::query_records(const char* sql,
                                      std::string_view artifact_name,
                                      std::string_view version)
{
    Statement stmt(m_db, sql);
    if (!stmt.ok()) {
        return std::unexpected(db_error(m_db, "Failed to prepare query"));
    }
    stmt.bind(1, artifact_name);
    if (!version.empty()) {
        stmt.bind(2, version);
    }

    std::vector<VersionRecord> records;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        VersionRecord record;
        record.artifact_name = column_text(stmt.get(), 0);
        record.kind = column_text(stmt.get(), 1);
        record.version = column_text(stmt.get(), 2);
        record.content_hash = column_text(stmt.get(), 3);
        record.blob_hash = column_text(stmt.get(), 4);
        const std::string payload_text = column_text(stmt.get(), 5);
        record.created_at = column_text(stmt.get(), 6);
        try {
            record.payload = nlohmann::json::parse(payload_text);
        } catch (const nlohmann::json::parse_error& ex) {
            return std::unexpected(arcas::make_error(
                errc::kParseError, std::format("Stored payload of {}@{} is not JSON: {}",
                                               record.artifact_name, record.version, ex.what())));
        }
        records.push_back(std::move(record));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(db_error(m_db, "Failed to read artifact_versions"));
    }
    return records;
}

arcas::Result<std::optional<VersionRecord>>
SqliteAuthorityGateway::find(std::string_view artifact_name, std::string_view version)
{
    const auto sql = std::format(
        "SELECT {} FROM artifact_versions WHERE artifact_name = ?1 AND version = ?2", kColumns);
    auto rows = query_records(sql.c_str(), artifact_name, version);
    if (!rows) {
        return std::unexpected(rows.error());
    }
    if (rows->empty()) {
        return std::optional<VersionRecord>{};
    }
    return std::optional<VersionRecord>{std::move(rows->front())};
}

arcas::Result<std::optional<VersionRecord>>
SqliteAuthorityGateway::latest(std::string_view artifact_name)
{
    const auto sql = std::format(
        "SELECT {} FROM artifact_versions WHERE artifact_name = ?1 "
        "ORDER BY created_at DESC, seq DESC LIMIT 1",
        kColumns);
    auto rows = query_records(sql.c_str(), artifact_name, {});
    if (!rows) {
        return std::unexpected(rows.error());
    }
    if (rows->empty()) {
        return std::optional<VersionRecord>{};
    }
    return std::optional<VersionRecord>{std::move(rows->front())};
}

arcas::Result<std::vector<VersionRecord>>
SqliteAuthorityGateway::list(std::string_view artifact_name)
{
    const auto sql = std::format(
        "SELECT {} FROM artifact_versions WHERE artifact_name = ?1 ORDER BY created_at, seq",
        kColumns);
    return query_records(sql.c_str(), artifact_name, {});
}

arcas::Result<bool> SqliteAuthorityGateway::exists(std::string_view artifact_name,
                                                   std::string_view version)
{
    Statement stmt(m_db,
                   "SELECT 1 FROM artifact_versions WHERE artifact_name = ?1 AND version = ?2");
    if (!stmt.ok()) {
        return std::unexpected(db_error(m_db, "Failed to prepare exists query"));
    }
    stmt.bind(1, artifact_name);
    stmt.bind(2, version);
    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    return std::unexpected(db_error(m_db, "Failed to query artifact_versions"));
}

arcas::Result<InsertOutcome> SqliteAuthorityGateway::insert(const VersionRecord& record)
{
    auto payload_text = canonical::canonicalize(record.payload, canonical::FloatPolicy::kAllow);
    if (!payload_text) {
        return std::unexpected(payload_text.error());
    }
    const auto sql = std::format(
        "INSERT INTO artifact_versions ({}) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7) "
        "ON CONFLICT (artifact_name, version) DO NOTHING RETURNING seq",
        kColumns);
    Statement stmt(m_db, sql);
    if (!stmt.ok()) {
        return std::unexpected(db_error(m_db, "Failed to prepare insert"));
    }
    stmt.bind(1, record.artifact_name);
    stmt.bind(2, record.kind);
    stmt.bind(3, record.version);
    stmt.bind(4, record.content_hash);
    stmt.bind(5, record.blob_hash);
    stmt.bind(6, *payload_text);
    stmt.bind(7, record.created_at);
    // A row comes back only when the insert happened.
    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return InsertOutcome::kInserted;
    }
    if (rc == SQLITE_DONE) {
        return InsertOutcome::kAlreadyExists;
    }
    return std::unexpected(db_error(
        m_db, std::format("Failed to insert {}@{}", record.artifact_name, record.version)));
}

arcas::Result<bool> SqliteAuthorityGateway::remove(std::string_view artifact_name,
                                                   std::string_view version)
{
    Statement stmt(
        m_db, "DELETE FROM artifact_versions WHERE artifact_name = ?1 AND version = ?2 RETURNING seq");
    if (!stmt.ok()) {
        return std::unexpected(db_error(m_db, "Failed to prepare delete"));
    }
    stmt.bind(1, artifact_name);
    stmt.bind(2, version);
    bool removed = false;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        removed = true;
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(db_error(
            m_db, std::format("Failed to delete {}@{}", artifact_name, version)));
    }
    return removed;
}

arcas::Result<std::vector<std::string>> SqliteAuthorityGateway::artifact_names()
{
    Statement stmt(m_db, "SELECT DISTINCT artifact_name FROM artifact_versions ORDER BY artifact_name");
    if (!stmt.ok()) {
        return std::unexpected(db_error(m_db, "Failed to prepare name query"));
    }
    std::vector<std::string> names;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        names.push_back(column_text(stmt.get(), 0));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(db_error(m_db, "Failed to list artifact names"));
    }
    return names;
}

}  // namespace arcas::authority
