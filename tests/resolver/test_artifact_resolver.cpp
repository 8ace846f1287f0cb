/**
 * @file test_artifact_resolver.cpp
 * @brief Workspace file discovery tests
 */

#include "arcas/artifact_resolver.hpp"

#include "support/temp_dir.hpp"

#include <fstream>
#include <set>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

TEST(ArtifactResolver, ExpandsPlaceholders)
{
    EXPECT_EQ(arcas::resolver::expand_pattern("{dir}/{name}/{name}_{kind}.yaml", "mft", "framework"),
              "frameworks/mft/mft_framework.yaml");
    EXPECT_EQ(arcas::resolver::expand_pattern("{kind}.json", "x", "weighting_scheme"), "weighting_scheme.json");
}

TEST(ArtifactResolver, CandidatesFollowPatternOrder)
{
    const auto candidates = arcas::resolver::candidate_paths("/work", "civic_virtue");
    ASSERT_EQ(candidates.size(), arcas::resolver::default_patterns().size());
    EXPECT_EQ(candidates.front(), fs::path("/work/frameworks/civic_virtue/framework_consolidated.json"));
    EXPECT_EQ(candidates.back(), fs::path("/work/frameworks/civic_virtue/civic_virtue.json"));
}

TEST(ArtifactResolver, FirstExistingCandidateWins)
{
    const std::set<fs::path> present = {
        "/work/frameworks/mft/framework.yaml",
        "/work/frameworks/mft/mft.json",
    };
    const auto resolved = arcas::resolver::resolve(
        "/work", "mft", "framework", [&present](const fs::path& path) { return present.contains(path); });
    ASSERT_TRUE(resolved);
    EXPECT_EQ(*resolved, fs::path("/work/frameworks/mft/framework.yaml"));
}

TEST(ArtifactResolver, NothingFound)
{
    const auto resolved =
        arcas::resolver::resolve("/work", "ghost_framework", "framework", [](const fs::path&) { return false; });
    EXPECT_FALSE(resolved);
}

TEST(ArtifactResolver, DefaultCheckLooksAtRegularFiles)
{
    arcas::test::TempDir temp_dir("arcas_resolver");
    const auto dir = temp_dir.path() / "frameworks" / "civic_virtue";
    fs::create_directories(dir / "civic_virtue_v1.yaml");  // a directory, not a file
    {
        std::ofstream out(dir / "civic_virtue.yaml");
        out << "name: civic_virtue\n";
    }
    const auto resolved = arcas::resolver::resolve(temp_dir.path(), "civic_virtue");
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved->filename(), "civic_virtue.yaml");
}
