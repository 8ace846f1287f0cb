#pragma once

/**
 * @file version_allocator.hpp
 * @brief Collision-free version minting for changed artifacts
 */

#include "arcas/version_authority.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace arcas::allocator {

/// Which fallback level produced a version.
enum class Strategy {
    kPatchIncrement,    ///< v1.2.3 -> v1.2.4
    kDateStamp,         ///< vYYYY.MM.DD
    kHourStamp,         ///< vYYYY.MM.DD.HH
    kMinuteStamp,       ///< vYYYY.MM.DD.HHMM
    kSecondStamp,       ///< vYYYY.MM.DD.HHMMSS
    kMicrosecondStamp,  ///< vYYYY.MM.DD.HHMMSS.ffffff
    kAbsolute           ///< microsecond stamp + transaction id suffix
};

[[nodiscard]] std::string_view to_string(Strategy strategy);

using Clock = std::function<std::chrono::system_clock::time_point()>;

struct Allocation
{
    std::string version;
    Strategy strategy = Strategy::kPatchIncrement;
};

/**
 * Patch increment of a dotted numeric version with optional "v" prefix.
 *
 * Missing minor/patch components count as 0; major and minor keep their
 * spelling. nullopt when @p version is not 1-3 numeric components.
 */
[[nodiscard]] std::optional<std::string> next_patch(std::string_view version);

/**
 * Mints versions that are not yet registered for an artifact.
 *
 * Candidates are tried in Strategy order, each checked against the authority.
 * If a check fails the allocator goes straight to the absolute fallback, so
 * allocation itself never fails.
 */
class VersionAllocator
{
public:
    explicit VersionAllocator(authority::VersionAuthority& authority,
                              Clock clock = [] { return std::chrono::system_clock::now(); });

    [[nodiscard]] Allocation allocate(std::string_view artifact_name,
                                      std::string_view current_version,
                                      std::string_view transaction_id);

private:
    authority::VersionAuthority& m_authority;
    Clock m_clock;

    [[nodiscard]] Allocation absolute_fallback(std::string_view artifact_name,
                                               const std::string& micro_stamp,
                                               std::string_view transaction_id);
};

}  // namespace arcas::allocator
