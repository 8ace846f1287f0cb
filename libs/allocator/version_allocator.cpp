/**
 * @file version_allocator.cpp
 * @brief Layered version allocation
 */

#include "arcas/version_allocator.hpp"

#include "arcas/log.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <limits>
#include <ranges>
#include <utility>
#include <vector>

namespace arcas::allocator {

namespace {

[[nodiscard]] bool all_digits(std::string_view text)
{
    return !text.empty() && std::ranges::all_of(text, [](char c) { return c >= '0' && c <= '9'; });
}

struct Stamps
{
    std::string date;    // vYYYY.MM.DD
    std::string hour;    // HH
    std::string minute;  // HHMM
    std::string second;  // HHMMSS
    std::string micro;   // ffffff
};

[[nodiscard]] Stamps make_stamps(std::chrono::system_clock::time_point now)
{
    using namespace std::chrono;
    const auto us = floor<microseconds>(now);
    const auto day = floor<days>(us);
    const hh_mm_ss tod{us - day};
    Stamps stamps;
    stamps.date = std::format("v{:%Y.%m.%d}", year_month_day{day});
    stamps.hour = std::format("{:02}", tod.hours().count());
    stamps.minute = std::format("{}{:02}", stamps.hour, tod.minutes().count());
    stamps.second = std::format("{}{:02}", stamps.minute, tod.seconds().count());
    stamps.micro = std::format("{:06}", tod.subseconds().count());
    return stamps;
}

}  // namespace

std::string_view to_string(Strategy strategy)
{
    switch (strategy) {
        case Strategy::kPatchIncrement:
            return "patch_increment";
        case Strategy::kDateStamp:
            return "date_stamp";
        case Strategy::kHourStamp:
            return "hour_stamp";
        case Strategy::kMinuteStamp:
            return "minute_stamp";
        case Strategy::kSecondStamp:
            return "second_stamp";
        case Strategy::kMicrosecondStamp:
            return "microsecond_stamp";
        case Strategy::kAbsolute:
            return "absolute";
    }
    return "unknown";
}

std::optional<std::string> next_patch(std::string_view version)
{
    std::string_view digits = version;
    if (digits.starts_with('v') || digits.starts_with('V')) {
        digits.remove_prefix(1);
    }
    std::vector<std::string_view> parts;
    for (auto part : std::views::split(digits, '.')) {
        parts.emplace_back(part.begin(), part.end());
    }
    if (parts.empty() || parts.size() > 3 || !std::ranges::all_of(parts, all_digits)) {
        return std::nullopt;
    }

    const std::string_view major = parts[0];
    const std::string_view minor = parts.size() > 1 ? parts[1] : std::string_view{"0"};
    unsigned long long patch = 0;
    if (parts.size() > 2) {
        const auto [ptr, ec] = std::from_chars(parts[2].data(), parts[2].data() + parts[2].size(), patch);
        if (ec != std::errc{} || patch == std::numeric_limits<unsigned long long>::max()) {
            return std::nullopt;
        }
    }
    return std::format("v{}.{}.{}", major, minor, patch + 1);
}

VersionAllocator::VersionAllocator(authority::VersionAuthority& authority, Clock clock)
    : m_authority(authority)
    , m_clock(std::move(clock))
{}

Allocation VersionAllocator::allocate(std::string_view artifact_name,
                                      std::string_view current_version,
                                      std::string_view transaction_id)
{
    const Stamps stamps = make_stamps(m_clock());
    const std::string micro_stamp = std::format("{}.{}.{}", stamps.date, stamps.second, stamps.micro);

    std::vector<std::pair<std::string, Strategy>> candidates;
    if (auto patched = next_patch(current_version)) {
        candidates.emplace_back(std::move(*patched), Strategy::kPatchIncrement);
    }
    candidates.emplace_back(stamps.date, Strategy::kDateStamp);
    candidates.emplace_back(std::format("{}.{}", stamps.date, stamps.hour), Strategy::kHourStamp);
    candidates.emplace_back(std::format("{}.{}", stamps.date, stamps.minute), Strategy::kMinuteStamp);
    candidates.emplace_back(std::format("{}.{}", stamps.date, stamps.second), Strategy::kSecondStamp);
    candidates.emplace_back(micro_stamp, Strategy::kMicrosecondStamp);

    for (auto& [candidate, strategy] : candidates) {
        auto taken = m_authority.exists(artifact_name, candidate);
        if (!taken) {
            log::logger()->warn("version check for {}@{} failed ({}); using absolute fallback",
                                artifact_name, candidate, taken.error().message);
            return absolute_fallback(artifact_name, micro_stamp, transaction_id);
        }
        if (!*taken) {
            log::logger()->debug("allocated {}@{} via {}", artifact_name, candidate,
                                 to_string(strategy));
            return Allocation{.version = std::move(candidate), .strategy = strategy};
        }
    }
    return absolute_fallback(artifact_name, micro_stamp, transaction_id);
}

Allocation VersionAllocator::absolute_fallback(std::string_view artifact_name,
                                               const std::string& micro_stamp,
                                               std::string_view transaction_id)
{
    const std::string_view suffix =
        transaction_id.size() > 6 ? transaction_id.substr(transaction_id.size() - 6) : transaction_id;
    const std::string base =
        suffix.empty() ? micro_stamp : std::format("{}.{}", micro_stamp, suffix);

    std::string candidate = base;
    for (int n = 2;; ++n) {
        auto taken = m_authority.exists(artifact_name, candidate);
        // An unanswerable check still yields the transaction-scoped candidate.
        if (!taken || !*taken) {
            return Allocation{.version = std::move(candidate), .strategy = Strategy::kAbsolute};
        }
        candidate = std::format("{}-{}", base, n);
    }
}

}  // namespace arcas::allocator
