#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error type, hashing, path normalization, timestamps
 */

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace arcas {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success
 */
using VoidResult = std::expected<void, Error>;

/// Error codes shared across modules.
namespace errc {
inline constexpr std::string_view kValidationError = "ValidationError";
inline constexpr std::string_view kNotFound = "NotFound";
inline constexpr std::string_view kVersionConflict = "VersionConflict";
inline constexpr std::string_view kTransactionFailure = "TransactionFailure";
inline constexpr std::string_view kIntegrityError = "IntegrityError";
inline constexpr std::string_view kUniqueViolation = "UniqueViolation";
inline constexpr std::string_view kDatabaseError = "DatabaseError";
inline constexpr std::string_view kIOError = "IOError";
inline constexpr std::string_view kParseError = "ParseError";
inline constexpr std::string_view kInvalidHash = "InvalidHash";
inline constexpr std::string_view kSchemaValidationFailed = "SchemaValidationFailed";
inline constexpr std::string_view kRollbackAlreadyPerformed = "RollbackAlreadyPerformed";
inline constexpr std::string_view kConfigError = "ConfigError";
}  // namespace errc

[[nodiscard]] inline Error make_error(std::string_view code, std::string message)
{
    return Error::make(std::string(code), std::move(message));
}

}  // namespace arcas

namespace arcas::common {

// ============================================================================
// SHA-256 Hash
// ============================================================================

/**
 * Incremental SHA-256 hasher.
 *
 * Feed bytes with update() any number of times, then call hex_digest() once.
 */
class Sha256
{
public:
    Sha256();

    void update(std::span<const std::uint8_t> data);
    void update(std::string_view data);

    /// Finish the digest. The hasher must not be updated afterwards.
    [[nodiscard]] std::array<std::uint8_t, 32> digest();
    [[nodiscard]] std::string hex_digest();

private:
    void compress();

    std::array<std::uint32_t, 8> m_state;
    std::array<std::uint8_t, 64> m_block;
    std::size_t m_block_len;
    std::uint64_t m_total_bits;
};

/**
 * Compute SHA-256 hash of data
 * @return Hex-encoded hash string (64 characters)
 */
[[nodiscard]] std::string sha256(std::string_view data);

/**
 * Compute SHA-256 hash of data with prefix
 * @return "sha256:" + hex-encoded hash
 */
[[nodiscard]] std::string sha256_prefixed(std::string_view data);

/// True when @p hash is exactly 64 lowercase hex characters.
[[nodiscard]] bool is_sha256_hex(std::string_view hash) noexcept;

/// Drop an optional "sha256:" prefix.
[[nodiscard]] std::string_view strip_hash_prefix(std::string_view hash) noexcept;

/// Display form of a digest (first 12 characters). Never used as a storage key.
[[nodiscard]] std::string short_hash(std::string_view hash);

// ============================================================================
// Path Normalization
// ============================================================================

/**
 * Normalize a path for deterministic output
 * - Use '/' as separator
 * - Remove trailing slashes
 * - Resolve '..' and '.'
 * - Optionally make relative to base
 */
[[nodiscard]] std::string normalize_path(std::string_view input, std::string_view base = "");

// ============================================================================
// Timestamps
// ============================================================================

/// ISO-8601 UTC timestamp with microseconds, e.g. 2025-06-19T14:03:07.123456Z
[[nodiscard]] std::string iso8601_utc(std::chrono::system_clock::time_point tp);

[[nodiscard]] inline std::string now_iso8601_utc()
{
    return iso8601_utc(std::chrono::system_clock::now());
}

}  // namespace arcas::common
