/**
 * @file test_sha256.cpp
 * @brief SHA-256 and digest helper tests
 */

#include "arcas/common.hpp"

#include <string>

#include <gtest/gtest.h>

using namespace arcas::common;

TEST(SHA256, EmptyString)
{
    // SHA-256 of empty string is well-known
    EXPECT_EQ(sha256(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256, Abc)
{
    EXPECT_EQ(sha256("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256, HelloWorld)
{
    EXPECT_EQ(sha256("Hello, World!"),
              "dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f");
}

TEST(SHA256, MillionA)
{
    EXPECT_EQ(sha256(std::string(1'000'000, 'a')),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST(SHA256, IncrementalMatchesOneShot)
{
    const std::string input(1000, 'x');
    Sha256 hasher;
    // Chunk sizes straddle the 64-byte block boundary.
    for (std::size_t offset = 0; offset < input.size(); offset += 37) {
        hasher.update(std::string_view(input).substr(offset, 37));
    }
    EXPECT_EQ(hasher.hex_digest(), sha256(input));
}

TEST(SHA256, Prefixed)
{
    std::string hash = sha256_prefixed("test");
    EXPECT_TRUE(hash.starts_with("sha256:"));
    EXPECT_EQ(hash.length(), 7 + 64);
}

TEST(SHA256, DifferentInputs)
{
    EXPECT_NE(sha256("a"), sha256("b"));
    EXPECT_NE(sha256("abc"), sha256("ABC"));
}

TEST(DigestHelpers, IsSha256Hex)
{
    EXPECT_TRUE(is_sha256_hex(sha256("x")));
    EXPECT_FALSE(is_sha256_hex(sha256_prefixed("x")));
    EXPECT_FALSE(is_sha256_hex(std::string(63, 'a')));
    EXPECT_FALSE(is_sha256_hex(std::string(64, 'A')));
    EXPECT_FALSE(is_sha256_hex(std::string(64, 'g')));
}

TEST(DigestHelpers, StripPrefix)
{
    const std::string digest = sha256("x");
    EXPECT_EQ(strip_hash_prefix("sha256:" + digest), digest);
    EXPECT_EQ(strip_hash_prefix(digest), digest);
}

TEST(DigestHelpers, ShortHashIsTwelveCharacters)
{
    const std::string digest = sha256("x");
    EXPECT_EQ(short_hash(digest), digest.substr(0, 12));
    EXPECT_EQ(short_hash("sha256:" + digest), digest.substr(0, 12));
}
