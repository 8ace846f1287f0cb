/**
 * @file version_authority.cpp
 * @brief VersionAuthority, VersionCache and ChangeDetector
 */

#include "arcas/version_authority.hpp"

#include "arcas/log.hpp"

#include <algorithm>

namespace arcas::authority {

std::vector<std::string> version_variants(std::string_view hint)
{
    std::vector<std::string> variants;
    auto add = [&variants](std::string candidate) {
        if (!candidate.empty() && std::ranges::find(variants, candidate) == variants.end()) {
            variants.push_back(std::move(candidate));
        }
    };
    add(std::string(hint));
    if (hint.starts_with('v') || hint.starts_with('V')) {
        add("v" + std::string(hint.substr(1)));
        add(std::string(hint.substr(1)));
    } else {
        add("v" + std::string(hint));
    }
    return variants;
}

// ----------------------------------------------------------------------------
// VersionCache
// ----------------------------------------------------------------------------

std::optional<VersionRecord> VersionCache::lookup(std::string_view artifact_name,
                                                  std::string_view requested) const
{
    std::lock_guard lock(m_mutex);
    auto it = m_entries.find(std::pair{std::string(artifact_name), std::string(requested)});
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    ++m_hits;
    return it->second;
}

void VersionCache::put(std::string_view artifact_name,
                       std::string_view requested,
                       const VersionRecord& record)
{
    std::lock_guard lock(m_mutex);
    m_entries.insert_or_assign(std::pair{std::string(artifact_name), std::string(requested)}, record);
}

void VersionCache::invalidate(std::string_view artifact_name)
{
    std::lock_guard lock(m_mutex);
    std::erase_if(m_entries, [&](const auto& entry) { return entry.first.first == artifact_name; });
}

void VersionCache::clear()
{
    std::lock_guard lock(m_mutex);
    m_entries.clear();
}

std::size_t VersionCache::size() const
{
    std::lock_guard lock(m_mutex);
    return m_entries.size();
}

std::size_t VersionCache::hits() const
{
    std::lock_guard lock(m_mutex);
    return m_hits;
}

// ----------------------------------------------------------------------------
// VersionAuthority
// ----------------------------------------------------------------------------

VersionAuthority::VersionAuthority(AuthorityGateway& gateway)
    : m_gateway(gateway)
{}

arcas::Result<std::optional<VersionRecord>> VersionAuthority::get(std::string_view artifact_name,
                                                                  std::string_view version_hint)
{
    if (auto cached = m_cache.lookup(artifact_name, version_hint)) {
        return std::optional<VersionRecord>{std::move(*cached)};
    }

    if (version_hint.empty()) {
        auto latest = m_gateway.latest(artifact_name);
        if (!latest) {
            return std::unexpected(latest.error());
        }
        if (*latest) {
            m_cache.put(artifact_name, version_hint, **latest);
        }
        return latest;
    }

    for (const auto& variant : version_variants(version_hint)) {
        auto found = m_gateway.find(artifact_name, variant);
        if (!found) {
            return std::unexpected(found.error());
        }
        if (*found) {
            if (variant != version_hint) {
                log::logger()->debug("{}: version '{}' matched stored spelling '{}'", artifact_name,
                                     version_hint, variant);
            }
            m_cache.put(artifact_name, version_hint, **found);
            return found;
        }
    }
    return std::optional<VersionRecord>{};
}

arcas::Result<bool> VersionAuthority::exists(std::string_view artifact_name, std::string_view version)
{
    for (const auto& variant : version_variants(version)) {
        auto found = m_gateway.exists(artifact_name, variant);
        if (!found) {
            return std::unexpected(found.error());
        }
        if (*found) {
            return true;
        }
    }
    return false;
}

arcas::Result<std::vector<VersionRecord>> VersionAuthority::list(std::string_view artifact_name)
{
    return m_gateway.list(artifact_name);
}

arcas::Result<InsertOutcome> VersionAuthority::register_version(const VersionRecord& record)
{
    auto outcome = m_gateway.insert(record);
    m_cache.invalidate(record.artifact_name);
    if (outcome && *outcome == InsertOutcome::kInserted) {
        log::logger()->info("registered {}@{} ({})", record.artifact_name, record.version,
                            common::short_hash(record.content_hash));
    }
    return outcome;
}

arcas::Result<bool> VersionAuthority::remove(std::string_view artifact_name, std::string_view version)
{
    auto removed = m_gateway.remove(artifact_name, version);
    m_cache.invalidate(artifact_name);
    return removed;
}

arcas::Result<std::vector<std::string>> VersionAuthority::artifact_names()
{
    return m_gateway.artifact_names();
}

// ----------------------------------------------------------------------------
// ChangeDetector
// ----------------------------------------------------------------------------

ChangeDetector::ChangeDetector(canonical::ContentScope scope)
    : m_scope(std::move(scope))
{}

arcas::Result<std::string> ChangeDetector::hash_of(const nlohmann::json& payload) const
{
    return canonical::scoped_hash(payload, m_scope);
}

arcas::Result<ConsistencyReport> ChangeDetector::is_consistent(const nlohmann::json& file_payload,
                                                               const VersionRecord& record) const
{
    auto file_hash = hash_of(file_payload);
    if (!file_hash) {
        return std::unexpected(file_hash.error());
    }
    std::string authority_hash = record.content_hash;
    if (authority_hash.empty()) {
        // Rows written without a scoped digest are hashed from their payload.
        auto recomputed = hash_of(record.payload);
        if (!recomputed) {
            return std::unexpected(recomputed.error());
        }
        authority_hash = std::move(*recomputed);
    }
    const bool consistent = *file_hash == common::strip_hash_prefix(authority_hash);
    return ConsistencyReport{.consistent = consistent,
                             .file_hash = std::move(*file_hash),
                             .authority_hash = std::move(authority_hash)};
}

}  // namespace arcas::authority
