#pragma once

/**
 * @file transaction.hpp
 * @brief Transaction coordinator: validate, detect change, allocate, commit, roll back
 */

#include "arcas/cas_store.hpp"
#include "arcas/common.hpp"
#include "arcas/guidance.hpp"
#include "arcas/transaction_state.hpp"
#include "arcas/version_allocator.hpp"
#include "arcas/version_authority.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace arcas::transaction {

inline constexpr std::string_view kDefaultVersion = "v1.0.0";

/// ftx_YYYYMMDD_HHMMSS_<6 hex>
[[nodiscard]] std::string generate_transaction_id(std::chrono::system_clock::time_point now);

/// Version a payload declares for itself ("version" or "framework_meta.version").
[[nodiscard]] std::optional<std::string> declared_version(const nlohmann::json& payload);

struct Verdict
{
    bool valid = true;
    std::vector<std::string> errors;
};

struct RollbackEntry
{
    std::string artifact;
    std::string version;
    bool removed = false;
    std::string detail;
};

struct RollbackReport
{
    std::string transaction_id;
    std::vector<RollbackEntry> entries;

    /// True when every created record was removed.
    [[nodiscard]] bool ok() const noexcept;
};

struct CoordinatorOptions
{
    std::string transaction_id;  ///< empty: generated from the clock
    std::string ingestion_method = "arcas_transaction";
    canonical::ContentScope content_scope;
    allocator::Clock clock;  ///< empty: system clock
};

/**
 * Drives one transaction over any number of artifacts.
 *
 * Each validate_for_use() call produces one TransactionState. Failures are
 * recorded on the state rather than returned; is_transaction_valid() turns the
 * collected states into a go/no-go decision. Not thread-safe; use one
 * coordinator per thread.
 */
class TransactionCoordinator
{
public:
    TransactionCoordinator(cas::ContentAddressableStore& store,
                           authority::VersionAuthority& authority,
                           CoordinatorOptions options = {});

    /**
     * @brief Ensure an artifact is usable, importing or versioning local content
     *
     * @param file_path local artifact file; a path that does not exist counts as absent
     * @param version_hint version the caller expects; empty for latest
     */
    TransactionState validate_for_use(std::string_view artifact_name,
                                      const std::optional<std::filesystem::path>& file_path = std::nullopt,
                                      const std::optional<std::string>& version_hint = std::nullopt,
                                      std::string_view kind = "framework");

    [[nodiscard]] Verdict is_transaction_valid() const;

    [[nodiscard]] guidance::Guidance generate_guidance() const;

    /**
     * @brief Remove every authority record this transaction created
     *
     * Blobs stay in the store. May run once; a second call fails with
     * RollbackAlreadyPerformed. Later validate_for_use() calls write nothing
     * and report TRANSACTION_FAILURE.
     */
    [[nodiscard]] arcas::Result<RollbackReport> rollback();

    [[nodiscard]] const Transaction& transaction() const noexcept { return m_transaction; }
    [[nodiscard]] const std::string& transaction_id() const noexcept
    {
        return m_transaction.transaction_id;
    }

private:
    cas::ContentAddressableStore& m_store;
    authority::VersionAuthority& m_authority;
    authority::ChangeDetector m_detector;
    allocator::Clock m_clock;
    allocator::VersionAllocator m_allocator;
    std::string m_ingestion_method;
    Transaction m_transaction;
    bool m_rolled_back = false;

    void evaluate(TransactionState& state,
                  const std::optional<std::filesystem::path>& file_path,
                  const std::optional<std::string>& version_hint);

    void import_payload(TransactionState& state,
                        const nlohmann::json& payload,
                        const std::filesystem::path& source,
                        const std::optional<std::string>& version_hint);

    void commit_new_version(TransactionState& state,
                            const nlohmann::json& payload,
                            const std::filesystem::path& source,
                            std::string_view base_version);

    [[nodiscard]] arcas::Result<authority::VersionRecord> commit(const TransactionState& state,
                                                                 const nlohmann::json& payload,
                                                                 const std::string& version,
                                                                 const std::filesystem::path& source);

    void log_transition(const TransactionState& state) const;
};

}  // namespace arcas::transaction
