#pragma once

/**
 * @file cas_store.hpp
 * @brief Content-addressable blob store for artifact payloads
 *
 * Layout: <root>/<kind>/<hash[0:2]>/<hash[2:4]>/<hash>/
 *           payload.json   canonical payload bytes (hashed)
 *           .metadata      asset type, id, version, created_at, size, content_hash
 *           .provenance    source_path, ingestion_method, timestamp
 */

#include "arcas/common.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace arcas::cas {

inline constexpr std::string_view kPayloadFile = "payload.json";
inline constexpr std::string_view kMetadataFile = ".metadata";
inline constexpr std::string_view kProvenanceFile = ".provenance";

struct BlobMetadata
{
    std::string asset_type;
    std::string asset_id;
    std::string version;
    std::string created_at;
    std::uint64_t size = 0;
    std::string content_hash;
};

struct BlobProvenance
{
    std::string source_path;
    std::string ingestion_method;
    std::string timestamp;
};

struct StoredBlob
{
    std::string content_hash;
    std::filesystem::path storage_path;
    BlobMetadata metadata;
    BlobProvenance provenance;
};

/// Descriptive fields recorded in the sidecars of a new blob.
struct StoreRequest
{
    std::string asset_type = "framework";
    std::string asset_id;
    std::string version;
    std::string source_path;
    std::string ingestion_method = "arcas_transaction";
};

struct StoreResult
{
    std::string content_hash;
    std::filesystem::path storage_path;
    bool already_existed = false;
};

class ContentAddressableStore
{
public:
    /**
     * @param root Storage root directory
     * @param schema_dir Directory holding blob_metadata.v1 / blob_provenance.v1
     *        schemas; empty disables sidecar validation in describe()
     */
    explicit ContentAddressableStore(std::filesystem::path root,
                                     std::filesystem::path schema_dir = {});

    /**
     * @brief Storage key of a payload: SHA-256 over its canonical JSON form
     */
    [[nodiscard]] static arcas::Result<std::string> hash(const nlohmann::json& content);

    /**
     * @brief Directory a blob lives in; pure function of (hash, kind)
     *
     * Accepts an optional "sha256:" prefix; rejects anything that is not a
     * full 64-character lowercase hex digest.
     */
    [[nodiscard]] arcas::Result<std::filesystem::path> path_for(std::string_view hash,
                                                                std::string_view kind) const;

    /**
     * @brief Store a payload, or report that identical content is already stored
     *
     * Safe against concurrent writers of the same content: each writer builds
     * the blob in a private directory and renames it into place; losers of the
     * rename discard their copy and observe already_existed=true.
     */
    [[nodiscard]] arcas::Result<StoreResult> store(const nlohmann::json& content,
                                                   const StoreRequest& request);

    /// Stored payload, or nullopt when no blob exists under (hash, kind).
    [[nodiscard]] arcas::Result<std::optional<nlohmann::json>> load(std::string_view hash,
                                                                    std::string_view kind) const;

    /**
     * @brief Recompute the digest of the stored payload bytes
     * @return true when it matches @p hash; NotFound error when absent
     */
    [[nodiscard]] arcas::Result<bool> verify(std::string_view hash, std::string_view kind) const;

    /// Blob location plus both sidecars.
    [[nodiscard]] arcas::Result<StoredBlob> describe(std::string_view hash,
                                                     std::string_view kind) const;

    /// Every blob of @p kind, ordered by hash.
    [[nodiscard]] arcas::Result<std::vector<StoredBlob>> list(std::string_view kind) const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return m_root; }

private:
    std::filesystem::path m_root;
    std::filesystem::path m_schema_dir;

    [[nodiscard]] arcas::VoidResult write_blob_files(const std::filesystem::path& dir,
                                                     const std::string& payload_text,
                                                     const BlobMetadata& metadata,
                                                     const BlobProvenance& provenance) const;
};

}  // namespace arcas::cas
