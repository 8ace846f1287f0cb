/**
 * @file artifact_resolver.cpp
 * @brief Pattern-driven artifact file discovery
 */

#include "arcas/artifact_resolver.hpp"

#include <array>

namespace arcas::resolver {

namespace {

constexpr std::array<std::string_view, 8> kPatterns = {
    "{dir}/{name}/{kind}_consolidated.json",
    "{dir}/{name}/{name}_{kind}.yaml",
    "{dir}/{name}/{kind}.yaml",
    "{dir}/{name}/{name}_v_1.yaml",
    "{dir}/{name}/{name}_v1.yaml",
    "{dir}/{name}/{kind}.json",
    "{dir}/{name}/{name}.yaml",
    "{dir}/{name}/{name}.json",
};

void replace_all(std::string& text, std::string_view token, std::string_view value)
{
    for (auto pos = text.find(token); pos != std::string::npos;
         pos = text.find(token, pos + value.size())) {
        text.replace(pos, token.size(), value);
    }
}

}  // namespace

std::span<const std::string_view> default_patterns()
{
    return kPatterns;
}

std::string expand_pattern(std::string_view pattern, std::string_view name, std::string_view kind)
{
    std::string expanded(pattern);
    replace_all(expanded, "{dir}", std::string(kind) + "s");
    replace_all(expanded, "{name}", name);
    replace_all(expanded, "{kind}", kind);
    return expanded;
}

std::vector<std::filesystem::path> candidate_paths(const std::filesystem::path& root,
                                                   std::string_view name,
                                                   std::string_view kind)
{
    std::vector<std::filesystem::path> candidates;
    candidates.reserve(kPatterns.size());
    for (auto pattern : kPatterns) {
        candidates.push_back(root / expand_pattern(pattern, name, kind));
    }
    return candidates;
}

std::optional<std::filesystem::path> resolve(const std::filesystem::path& root,
                                             std::string_view name,
                                             std::string_view kind,
                                             const ExistsFn& exists)
{
    ExistsFn check = exists;
    if (!check) {
        check = [](const std::filesystem::path& path) {
            std::error_code ec;
            return std::filesystem::is_regular_file(path, ec);
        };
    }
    for (auto& candidate : candidate_paths(root, name, kind)) {
        if (check(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

}  // namespace arcas::resolver
