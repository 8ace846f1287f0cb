/**
 * @file sha256.cpp
 * @brief Incremental SHA-256 (FIPS 180-4), no external dependency
 */

#include "arcas/common.hpp"

#include <algorithm>
#include <bit>
#include <cstring>
#include <format>
#include <ranges>

namespace arcas::common {

namespace {

constexpr std::array<std::uint32_t, 64> kRoundConstants = {{
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
}};

constexpr std::array<std::uint32_t, 8> kInitialState = {
    {0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19}
};

[[nodiscard]] constexpr std::uint32_t big_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 2) ^ std::rotr(x, 13) ^ std::rotr(x, 22);
}

[[nodiscard]] constexpr std::uint32_t big_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 6) ^ std::rotr(x, 11) ^ std::rotr(x, 25);
}

[[nodiscard]] constexpr std::uint32_t small_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 7) ^ std::rotr(x, 18) ^ (x >> 3U);
}

[[nodiscard]] constexpr std::uint32_t small_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 17) ^ std::rotr(x, 19) ^ (x >> 10U);
}

[[nodiscard]] std::uint32_t load_be32(const std::uint8_t* bytes) noexcept
{
    std::uint32_t word{};
    std::memcpy(&word, bytes, sizeof(word));
    if constexpr (std::endian::native == std::endian::little) {
        return std::byteswap(word);
    } else {
        return word;
    }
}

}  // namespace

Sha256::Sha256()
    : m_state(kInitialState)
    , m_block{}
    , m_block_len(0)
    , m_total_bits(0)
{}

void Sha256::update(std::span<const std::uint8_t> data)
{
    for (std::uint8_t byte : data) {
        m_block[m_block_len++] = byte;
        if (m_block_len == m_block.size()) {
            compress();
            m_total_bits += 512;
            m_block_len = 0;
        }
    }
}

void Sha256::update(std::string_view data)
{
    update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(data.data()),
                                         data.size()));
}

std::array<std::uint8_t, 32> Sha256::digest()
{
    const std::uint64_t message_bits = m_total_bits + static_cast<std::uint64_t>(m_block_len) * 8U;

    m_block[m_block_len++] = 0x80;
    if (m_block_len > 56) {
        std::ranges::fill(m_block.begin() + static_cast<std::ptrdiff_t>(m_block_len),
                          m_block.end(),
                          std::uint8_t{0});
        compress();
        m_block_len = 0;
    }
    std::ranges::fill(m_block.begin() + static_cast<std::ptrdiff_t>(m_block_len),
                      m_block.begin() + 56,
                      std::uint8_t{0});
    for (auto i : std::views::iota(0, 8)) {
        m_block[56uz + static_cast<std::size_t>(i)] =
            static_cast<std::uint8_t>(message_bits >> (56U - static_cast<unsigned>(i) * 8U));
    }
    compress();

    std::array<std::uint8_t, 32> out{};
    for (auto [i, word] : std::views::enumerate(m_state)) {
        const auto base = static_cast<std::size_t>(i) * 4uz;
        out[base] = static_cast<std::uint8_t>(word >> 24U);
        out[base + 1uz] = static_cast<std::uint8_t>(word >> 16U);
        out[base + 2uz] = static_cast<std::uint8_t>(word >> 8U);
        out[base + 3uz] = static_cast<std::uint8_t>(word);
    }
    return out;
}

std::string Sha256::hex_digest()
{
    std::string hex;
    hex.reserve(64);
    for (std::uint8_t byte : digest()) {
        hex += std::format("{:02x}", byte);
    }
    return hex;
}

void Sha256::compress()
{
    std::array<std::uint32_t, 64> schedule{};
    for (auto i : std::views::iota(0uz, 16uz)) {
        schedule[i] = load_be32(&m_block[i * 4uz]);
    }
    for (auto i : std::views::iota(16uz, 64uz)) {
        schedule[i] = small_sigma1(schedule[i - 2]) + schedule[i - 7]
                      + small_sigma0(schedule[i - 15]) + schedule[i - 16];
    }

    auto [a, b, c, d, e, f, g, h] = m_state;
    for (auto [i, word] : std::views::enumerate(schedule)) {
        const std::uint32_t choose = (e & f) ^ (~e & g);
        const std::uint32_t majority = (a & b) ^ (a & c) ^ (b & c);
        const std::uint32_t t1 =
            h + big_sigma1(e) + choose + kRoundConstants[static_cast<std::size_t>(i)] + word;
        const std::uint32_t t2 = big_sigma0(a) + majority;
        h = g;
        g = f;
        f = e;
        e = d + t1;
        d = c;
        c = b;
        b = a;
        a = t1 + t2;
    }

    const std::array<std::uint32_t, 8> rounds = {a, b, c, d, e, f, g, h};
    for (auto [slot, add] : std::views::zip(m_state, rounds)) {
        slot += add;
    }
}

std::string sha256(std::string_view data)
{
    Sha256 hasher;
    hasher.update(data);
    return hasher.hex_digest();
}

std::string sha256_prefixed(std::string_view data)
{
    return "sha256:" + sha256(data);
}

bool is_sha256_hex(std::string_view hash) noexcept
{
    return hash.size() == 64 && std::ranges::all_of(hash, [](char ch) noexcept {
               return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f');
           });
}

std::string_view strip_hash_prefix(std::string_view hash) noexcept
{
    constexpr std::string_view kPrefix = "sha256:";
    if (hash.starts_with(kPrefix)) {
        hash.remove_prefix(kPrefix.size());
    }
    return hash;
}

std::string short_hash(std::string_view hash)
{
    return std::string(strip_hash_prefix(hash).substr(0, 12));
}

}  // namespace arcas::common
