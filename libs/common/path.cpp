/**
 * @file path.cpp
 * @brief Path normalization and timestamp helpers
 */

#include "arcas/common.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <string>
#include <vector>

namespace arcas::common {

namespace {

[[nodiscard]] std::vector<std::string> split_segments(std::string_view path)
{
    std::vector<std::string> segments;
    for (auto part : path | std::views::split('/')) {
        std::string_view segment(part.begin(), part.end());
        if (!segment.empty()) {
            segments.emplace_back(segment);
        }
    }
    return segments;
}

[[nodiscard]] std::vector<std::string> collapse_dots(const std::vector<std::string>& segments,
                                                     bool absolute)
{
    std::vector<std::string> resolved;
    for (const auto& segment : segments) {
        if (segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (!resolved.empty() && resolved.back() != "..") {
                resolved.pop_back();
            } else if (!absolute) {
                resolved.emplace_back("..");
            }
            continue;
        }
        resolved.push_back(segment);
    }
    return resolved;
}

[[nodiscard]] std::string join_segments(const std::vector<std::string>& segments)
{
    std::string joined;
    for (const auto& [i, segment] : std::views::enumerate(segments)) {
        if (i != 0) {
            joined += '/';
        }
        joined += segment;
    }
    return joined;
}

}  // namespace

std::string normalize_path(std::string_view input, std::string_view base)
{
    if (input.empty()) {
        return ".";
    }
    std::string unified(input);
    std::ranges::replace(unified, '\\', '/');
    const bool absolute = unified.front() == '/';

    std::string normalized = join_segments(collapse_dots(split_segments(unified), absolute));
    if (absolute) {
        normalized.insert(normalized.begin(), '/');
    }

    if (!base.empty()) {
        const std::string norm_base = normalize_path(base);
        if (normalized == norm_base) {
            return ".";
        }
        if (normalized.starts_with(norm_base + "/")) {
            normalized.erase(0, norm_base.size() + 1);
        }
    }
    return normalized.empty() ? "." : normalized;
}

std::string iso8601_utc(std::chrono::system_clock::time_point tp)
{
    const auto micros = std::chrono::floor<std::chrono::microseconds>(tp);
    return std::format("{:%Y-%m-%dT%H:%M:%S}Z", micros);
}

}  // namespace arcas::common
