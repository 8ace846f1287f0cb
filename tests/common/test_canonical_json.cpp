/**
 * @file test_canonical_json.cpp
 * @brief Canonical JSON and scoped hashing tests
 */

#include "arcas/canonical_json.hpp"
#include "arcas/common.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace arcas::canonical;
using Json = nlohmann::json;

TEST(CanonicalJSON, KeyOrder)
{
    Json j = {
        {"z", 1},
        {"a", 2},
        {"m", 3}
    };
    auto canonical = canonicalize(j);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical, R"({"a":2,"m":3,"z":1})");
}

TEST(CanonicalJSON, NestedKeyOrder)
{
    Json j = {
        {  "outer", {{"z", 1}, {"a", 2}}},
        {"another",                    3}
    };
    auto canonical = canonicalize(j);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical, R"({"another":3,"outer":{"a":2,"z":1}})");
}

TEST(CanonicalJSON, NoWhitespace)
{
    Json j = {
        {"key",   "value"},
        {"arr", {1, 2, 3}}
    };
    auto canonical = canonicalize(j);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(canonical->find(' '), std::string::npos);
    EXPECT_EQ(canonical->find('\n'), std::string::npos);
}

TEST(CanonicalJSON, FloatRejectedByDefault)
{
    Json j = {
        {"weight", 0.8}
    };
    auto canonical = canonicalize(j);
    ASSERT_FALSE(canonical);
    EXPECT_EQ(canonical.error().code, arcas::errc::kParseError);
}

TEST(CanonicalJSON, FloatAllowedOnRequest)
{
    Json j = {
        {"weight", 0.8}
    };
    auto canonical = canonicalize(j, FloatPolicy::kAllow);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical, R"({"weight":0.8})");
}

TEST(CanonicalJSON, HashIsBareHex)
{
    auto hash = hash_canonical(Json{
        {"key", "value"}
    });
    ASSERT_TRUE(hash);
    EXPECT_TRUE(arcas::common::is_sha256_hex(*hash));
    EXPECT_EQ(*hash, arcas::common::sha256(R"({"key":"value"})"));
}

TEST(CanonicalJSON, DifferentOrderSameHash)
{
    Json j1;
    j1["a"] = 1;
    j1["b"] = 2;

    Json j2;
    j2["b"] = 2;
    j2["a"] = 1;

    auto h1 = hash_canonical(j1);
    auto h2 = hash_canonical(j2);
    ASSERT_TRUE(h1);
    ASSERT_TRUE(h2);
    EXPECT_EQ(*h1, *h2);
}

TEST(ScopedHash, IgnoresUnderscoreAndIncidentalKeys)
{
    Json base = {
        {   "name", "civic_virtue"},
        {"dipoles",      {1, 2, 3}}
    };
    Json noisy = base;
    noisy["_import_note"] = "cli";
    noisy["last_modified"] = "2025-06-19";
    noisy["exported_at"] = "2025-06-20T00:00:00Z";

    const ContentScope scope;
    auto h1 = scoped_hash(base, scope);
    auto h2 = scoped_hash(noisy, scope);
    ASSERT_TRUE(h1);
    ASSERT_TRUE(h2);
    EXPECT_EQ(*h1, *h2);
}

TEST(ScopedHash, MeaningfulChangeAltersHash)
{
    Json before = {
        {"dipoles", {{{"name", "Dignity"}, {"weight", 1.0}}}}
    };
    Json after = {
        {"dipoles", {{{"name", "Dignity"}, {"weight", 0.8}}}}
    };
    auto h1 = scoped_hash(before, ContentScope{});
    auto h2 = scoped_hash(after, ContentScope{});
    ASSERT_TRUE(h1);
    ASSERT_TRUE(h2);
    EXPECT_NE(*h1, *h2);
}

TEST(ScopedHash, NestedIncidentalKeysStayInScope)
{
    Json a = {
        {"meta", {{"last_modified", "x"}}}
    };
    Json b = {
        {"meta", {{"last_modified", "y"}}}
    };
    auto h1 = scoped_hash(a, ContentScope{});
    auto h2 = scoped_hash(b, ContentScope{});
    ASSERT_TRUE(h1);
    ASSERT_TRUE(h2);
    EXPECT_NE(*h1, *h2);
}

TEST(ScopedHash, CustomScope)
{
    const ContentScope scope{.incidental_keys = {"build"}};
    Json a = {
        {"name", "x"},
        {"build", 1}
    };
    Json b = {
        {"name", "x"},
        {"build", 2}
    };
    EXPECT_EQ(scoped_payload(a, scope), scoped_payload(b, scope));
    EXPECT_EQ(scoped_payload(a, scope), (Json{{"name", "x"}}));
}

TEST(PrettySorted, IndentedAndNewlineTerminated)
{
    auto text = pretty_sorted(Json{
        {"b", 1},
        {"a", 2}
    });
    ASSERT_TRUE(text);
    EXPECT_EQ(*text, "{\n  \"a\": 2,\n  \"b\": 1\n}\n");
}
