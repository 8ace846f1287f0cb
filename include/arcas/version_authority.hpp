#pragma once

/**
 * @file version_authority.hpp
 * @brief Version lookup over an AuthorityGateway, with caching and change detection
 */

#include "arcas/authority.hpp"
#include "arcas/canonical_json.hpp"
#include "arcas/common.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace arcas::authority {

/**
 * Spellings a version hint may be stored under: raw, "v"-prefixed,
 * "v"-stripped. Duplicates removed, order kept.
 */
[[nodiscard]] std::vector<std::string> version_variants(std::string_view hint);

/**
 * Lookup cache keyed by (artifact, requested version).
 *
 * An empty requested version stands for "latest". Only hits are cached.
 */
class VersionCache
{
public:
    [[nodiscard]] std::optional<VersionRecord> lookup(std::string_view artifact_name,
                                                      std::string_view requested) const;
    void put(std::string_view artifact_name, std::string_view requested, const VersionRecord& record);

    /// Drop every entry of @p artifact_name.
    void invalidate(std::string_view artifact_name);
    void clear();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t hits() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::pair<std::string, std::string>, VersionRecord, std::less<>> m_entries;
    mutable std::size_t m_hits = 0;
};

/**
 * Source of truth for which versions of an artifact exist.
 *
 * Does not own the gateway; the caller keeps it alive.
 */
class VersionAuthority
{
public:
    explicit VersionAuthority(AuthorityGateway& gateway);

    /**
     * @param version_hint empty for the latest version
     * @return the record, or nullopt when no spelling of the hint is registered
     */
    [[nodiscard]] arcas::Result<std::optional<VersionRecord>> get(std::string_view artifact_name,
                                                                  std::string_view version_hint = {});

    /// True when any spelling of @p version is registered.
    [[nodiscard]] arcas::Result<bool> exists(std::string_view artifact_name, std::string_view version);

    [[nodiscard]] arcas::Result<std::vector<VersionRecord>> list(std::string_view artifact_name);

    [[nodiscard]] arcas::Result<InsertOutcome> register_version(const VersionRecord& record);

    [[nodiscard]] arcas::Result<bool> remove(std::string_view artifact_name, std::string_view version);

    [[nodiscard]] arcas::Result<std::vector<std::string>> artifact_names();

    [[nodiscard]] const VersionCache& cache() const noexcept { return m_cache; }

private:
    AuthorityGateway& m_gateway;
    VersionCache m_cache;
};

struct ConsistencyReport
{
    bool consistent = false;
    std::string file_hash;
    std::string authority_hash;
};

/**
 * Decides whether a local payload differs from the registered version.
 */
class ChangeDetector
{
public:
    explicit ChangeDetector(canonical::ContentScope scope = {});

    /// Digest of the meaningful subset of @p payload.
    [[nodiscard]] arcas::Result<std::string> hash_of(const nlohmann::json& payload) const;

    [[nodiscard]] arcas::Result<ConsistencyReport> is_consistent(const nlohmann::json& file_payload,
                                                                 const VersionRecord& record) const;

    [[nodiscard]] const canonical::ContentScope& scope() const noexcept { return m_scope; }

private:
    canonical::ContentScope m_scope;
};

}  // namespace arcas::authority
