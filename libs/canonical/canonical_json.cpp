/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization and scoped content hashing
 */

#include "arcas/canonical_json.hpp"

#include <algorithm>
#include <format>
#include <ranges>

namespace arcas::canonical {

namespace {

arcas::VoidResult reject_floats(const nlohmann::json& j, const std::string& path)
{
    if (j.is_number_float()) {
        return std::unexpected(arcas::make_error(
            errc::kParseError,
            std::format("Floating point numbers not allowed in canonical JSON at: {}", path)));
    }
    if (j.is_object()) {
        for (const auto& [key, val] : j.items()) {
            if (auto result = reject_floats(val, path + "." + key); !result) {
                return result;
            }
        }
    } else if (j.is_array()) {
        for (auto [i, elem] : std::views::enumerate(j)) {
            if (auto result = reject_floats(elem, std::format("{}[{}]", path, i)); !result) {
                return result;
            }
        }
    }
    return {};
}

/**
 * @brief Deep copy with object keys in lexicographic order
 */
[[nodiscard]] nlohmann::json sorted_copy(const nlohmann::json& j)
{
    if (j.is_object()) {
        std::vector<std::string> keys;
        keys.reserve(j.size());
        for (const auto& [key, _] : j.items()) {
            keys.push_back(key);
        }
        std::ranges::sort(keys);

        nlohmann::json result = nlohmann::json::object();
        for (const auto& key : keys) {
            result[key] = sorted_copy(j.at(key));
        }
        return result;
    }
    if (j.is_array()) {
        nlohmann::json result = nlohmann::json::array();
        for (const auto& elem : j) {
            result.push_back(sorted_copy(elem));
        }
        return result;
    }
    return j;
}

}  // namespace

arcas::Result<std::string> canonicalize(const nlohmann::json& j, FloatPolicy floats)
{
    if (floats == FloatPolicy::kReject) {
        if (auto result = reject_floats(j, "$"); !result) {
            return std::unexpected(result.error());
        }
    }
    try {
        return sorted_copy(j).dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(arcas::make_error(
            errc::kParseError, std::string("Failed to serialize canonical JSON: ") + ex.what()));
    }
}

arcas::Result<std::string> hash_canonical(const nlohmann::json& j, FloatPolicy floats)
{
    auto canonical = canonicalize(j, floats);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::sha256(*canonical);
}

nlohmann::json scoped_payload(const nlohmann::json& payload, const ContentScope& scope)
{
    if (!payload.is_object()) {
        return payload;
    }
    nlohmann::json scoped = nlohmann::json::object();
    for (const auto& [key, value] : payload.items()) {
        if (key.starts_with('_') || std::ranges::contains(scope.incidental_keys, key)) {
            continue;
        }
        scoped[key] = value;
    }
    return scoped;
}

arcas::Result<std::string> scoped_hash(const nlohmann::json& payload, const ContentScope& scope)
{
    return hash_canonical(scoped_payload(payload, scope), FloatPolicy::kAllow);
}

arcas::Result<std::string> pretty_sorted(const nlohmann::json& j)
{
    try {
        return sorted_copy(j).dump(2, ' ', false, nlohmann::json::error_handler_t::strict) + "\n";
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(arcas::make_error(
            errc::kParseError, std::string("Failed to serialize JSON: ") + ex.what()));
    }
}

}  // namespace arcas::canonical
