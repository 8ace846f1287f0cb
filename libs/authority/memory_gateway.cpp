/**
 * @file memory_gateway.cpp
 * @brief In-memory authority gateway
 */

#include "arcas/authority.hpp"

#include <algorithm>
#include <ranges>

namespace arcas::authority {

arcas::Result<std::optional<VersionRecord>>
InMemoryAuthorityGateway::find(std::string_view artifact_name, std::string_view version)
{
    std::lock_guard lock(m_mutex);
    auto it = std::ranges::find_if(m_rows, [&](const VersionRecord& row) {
        return row.artifact_name == artifact_name && row.version == version;
    });
    if (it == m_rows.end()) {
        return std::optional<VersionRecord>{};
    }
    return std::optional<VersionRecord>{*it};
}

arcas::Result<std::optional<VersionRecord>>
InMemoryAuthorityGateway::latest(std::string_view artifact_name)
{
    std::lock_guard lock(m_mutex);
    const VersionRecord* newest = nullptr;
    // Later insertion wins ties on created_at.
    for (const auto& row : m_rows) {
        if (row.artifact_name == artifact_name
            && (newest == nullptr || row.created_at >= newest->created_at)) {
            newest = &row;
        }
    }
    if (newest == nullptr) {
        return std::optional<VersionRecord>{};
    }
    return std::optional<VersionRecord>{*newest};
}

arcas::Result<std::vector<VersionRecord>>
InMemoryAuthorityGateway::list(std::string_view artifact_name)
{
    std::lock_guard lock(m_mutex);
    std::vector<VersionRecord> rows;
    for (const auto& row : m_rows) {
        if (row.artifact_name == artifact_name) {
            rows.push_back(row);
        }
    }
    std::ranges::stable_sort(rows, {}, &VersionRecord::created_at);
    return rows;
}

arcas::Result<bool> InMemoryAuthorityGateway::exists(std::string_view artifact_name,
                                                     std::string_view version)
{
    std::lock_guard lock(m_mutex);
    return std::ranges::any_of(m_rows, [&](const VersionRecord& row) {
        return row.artifact_name == artifact_name && row.version == version;
    });
}

arcas::Result<InsertOutcome> InMemoryAuthorityGateway::insert(const VersionRecord& record)
{
    std::lock_guard lock(m_mutex);
    const bool taken = std::ranges::any_of(m_rows, [&](const VersionRecord& row) {
        return row.artifact_name == record.artifact_name && row.version == record.version;
    });
    if (taken) {
        return InsertOutcome::kAlreadyExists;
    }
    m_rows.push_back(record);
    return InsertOutcome::kInserted;
}

arcas::Result<bool> InMemoryAuthorityGateway::remove(std::string_view artifact_name,
                                                     std::string_view version)
{
    std::lock_guard lock(m_mutex);
    const auto removed = std::erase_if(m_rows, [&](const VersionRecord& row) {
        return row.artifact_name == artifact_name && row.version == version;
    });
    return removed > 0;
}

arcas::Result<std::vector<std::string>> InMemoryAuthorityGateway::artifact_names()
{
    std::lock_guard lock(m_mutex);
    std::vector<std::string> names;
    for (const auto& row : m_rows) {
        names.push_back(row.artifact_name);
    }
    std::ranges::sort(names);
    const auto [first, last] = std::ranges::unique(names);
    names.erase(first, last);
    return names;
}

std::size_t InMemoryAuthorityGateway::size() const
{
    std::lock_guard lock(m_mutex);
    return m_rows.size();
}

}  // namespace arcas::authority
