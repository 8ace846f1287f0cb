/**
 * @file cas_store.cpp
 * @brief Content-addressable blob store implementation
 */

#include "arcas/cas_store.hpp"

#include "arcas/canonical_json.hpp"
#include "arcas/log.hpp"
#include "arcas/payload_io.hpp"
#include "arcas/schema_validate.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <fstream>
#include <random>

namespace arcas::cas {

namespace {

namespace fs = std::filesystem;

[[nodiscard]] std::string unique_suffix()
{
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return std::format("{:016x}", engine());
}

[[nodiscard]] nlohmann::json metadata_to_json(const BlobMetadata& metadata)
{
    return nlohmann::json{
        {  "asset_type",   metadata.asset_type},
        {    "asset_id",     metadata.asset_id},
        {     "version",      metadata.version},
        {  "created_at",   metadata.created_at},
        {        "size",         metadata.size},
        {"content_hash", metadata.content_hash}
    };
}

[[nodiscard]] nlohmann::json provenance_to_json(const BlobProvenance& provenance)
{
    return nlohmann::json{
        {     "source_path",      provenance.source_path},
        {"ingestion_method", provenance.ingestion_method},
        {       "timestamp",        provenance.timestamp}
    };
}

[[nodiscard]] arcas::Result<std::string> sha256_of_file(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(
            arcas::make_error(errc::kIOError, "Failed to open file for read: " + path.string()));
    }
    common::Sha256 hasher;
    std::array<char, 8192> buffer{};
    while (in.read(buffer.data(), buffer.size()) || in.gcount() > 0) {
        hasher.update(std::string_view(buffer.data(), static_cast<std::size_t>(in.gcount())));
    }
    if (in.bad()) {
        return std::unexpected(arcas::make_error(errc::kIOError, "Failed to read file: " + path.string()));
    }
    return hasher.hex_digest();
}

/// Kinds name one directory directly under the storage root.
[[nodiscard]] arcas::VoidResult check_kind(std::string_view kind)
{
    if (kind.empty() || kind.find_first_of("/\\") != std::string_view::npos || kind.starts_with('.')) {
        return std::unexpected(
            arcas::make_error(errc::kValidationError, std::format("Invalid asset kind: '{}'", kind)));
    }
    return {};
}

}  // namespace

ContentAddressableStore::ContentAddressableStore(fs::path root, fs::path schema_dir)
    : m_root(std::move(root))
    , m_schema_dir(std::move(schema_dir))
{}

arcas::Result<std::string> ContentAddressableStore::hash(const nlohmann::json& content)
{
    return canonical::hash_canonical(content, canonical::FloatPolicy::kAllow);
}

arcas::Result<fs::path> ContentAddressableStore::path_for(std::string_view hash,
                                                          std::string_view kind) const
{
    const std::string_view digest = common::strip_hash_prefix(hash);
    if (!common::is_sha256_hex(digest)) {
        return std::unexpected(arcas::make_error(
            errc::kInvalidHash, std::format("Not a SHA-256 hex digest: '{}'", hash)));
    }
    if (auto valid = check_kind(kind); !valid) {
        return std::unexpected(valid.error());
    }
    return m_root / kind / digest.substr(0, 2) / digest.substr(2, 2) / digest;
}

arcas::Result<StoreResult> ContentAddressableStore::store(const nlohmann::json& content,
                                                          const StoreRequest& request)
{
    auto canonical_text = canonical::canonicalize(content, canonical::FloatPolicy::kAllow);
    if (!canonical_text) {
        return std::unexpected(canonical_text.error());
    }
    const std::string digest = common::sha256(*canonical_text);
    auto final_dir = path_for(digest, request.asset_type);
    if (!final_dir) {
        return std::unexpected(final_dir.error());
    }

    std::error_code ec;
    if (fs::exists(*final_dir, ec)) {
        log::logger()->debug("blob {} already stored at {}", common::short_hash(digest),
                             final_dir->string());
        return StoreResult{.content_hash = digest, .storage_path = *final_dir, .already_existed = true};
    }

    const fs::path shard_dir = final_dir->parent_path();
    fs::create_directories(shard_dir, ec);
    if (ec) {
        return std::unexpected(arcas::make_error(
            errc::kIOError, std::format("Failed to create {}: {}", shard_dir.string(), ec.message())));
    }

    const std::string now = common::now_iso8601_utc();
    const BlobMetadata metadata{.asset_type = request.asset_type,
                                .asset_id = request.asset_id,
                                .version = request.version,
                                .created_at = now,
                                .size = canonical_text->size(),
                                .content_hash = digest};
    const BlobProvenance provenance{.source_path = request.source_path,
                                    .ingestion_method = request.ingestion_method,
                                    .timestamp = now};

    const fs::path staging = shard_dir / std::format(".tmp-{}-{}", digest, unique_suffix());
    if (auto written = write_blob_files(staging, *canonical_text, metadata, provenance); !written) {
        fs::remove_all(staging, ec);
        return std::unexpected(written.error());
    }

    fs::rename(staging, *final_dir, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove_all(staging, cleanup_ec);
        if (fs::exists(*final_dir, cleanup_ec)) {
            // Another writer won the race with identical bytes.
            return StoreResult{
                .content_hash = digest, .storage_path = *final_dir, .already_existed = true};
        }
        return std::unexpected(arcas::make_error(
            errc::kIOError,
            std::format("Failed to move blob into {}: {}", final_dir->string(), ec.message())));
    }

    log::logger()->info("stored {} blob {} ({} bytes) for {}:{}", request.asset_type,
                        common::short_hash(digest), metadata.size, request.asset_id,
                        request.version);
    return StoreResult{.content_hash = digest, .storage_path = *final_dir, .already_existed = false};
}

arcas::Result<std::optional<nlohmann::json>> ContentAddressableStore::load(std::string_view hash,
                                                                           std::string_view kind) const
{
    auto dir = path_for(hash, kind);
    if (!dir) {
        return std::unexpected(dir.error());
    }
    const fs::path payload_path = *dir / kPayloadFile;
    std::error_code ec;
    if (!fs::exists(payload_path, ec)) {
        return std::optional<nlohmann::json>{};
    }
    auto payload = io::read_json_file(payload_path);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    return std::optional<nlohmann::json>{std::move(*payload)};
}

arcas::Result<bool> ContentAddressableStore::verify(std::string_view hash, std::string_view kind) const
{
    auto dir = path_for(hash, kind);
    if (!dir) {
        return std::unexpected(dir.error());
    }
    const fs::path payload_path = *dir / kPayloadFile;
    std::error_code ec;
    if (!fs::exists(payload_path, ec)) {
        return std::unexpected(arcas::make_error(
            errc::kNotFound, std::format("No {} blob stored for {}", kind, hash)));
    }
    auto recomputed = sha256_of_file(payload_path);
    if (!recomputed) {
        return std::unexpected(recomputed.error());
    }
    const bool intact = *recomputed == common::strip_hash_prefix(hash);
    if (!intact) {
        log::logger()->critical("integrity failure: {} blob {} now hashes to {}", kind,
                                common::strip_hash_prefix(hash), *recomputed);
    }
    return intact;
}

arcas::Result<StoredBlob> ContentAddressableStore::describe(std::string_view hash,
                                                            std::string_view kind) const
{
    auto dir = path_for(hash, kind);
    if (!dir) {
        return std::unexpected(dir.error());
    }
    std::error_code ec;
    if (!fs::exists(*dir, ec)) {
        return std::unexpected(arcas::make_error(
            errc::kNotFound, std::format("No {} blob stored for {}", kind, hash)));
    }

    auto metadata_json = io::read_json_file(*dir / kMetadataFile);
    if (!metadata_json) {
        return std::unexpected(metadata_json.error());
    }
    auto provenance_json = io::read_json_file(*dir / kProvenanceFile);
    if (!provenance_json) {
        return std::unexpected(provenance_json.error());
    }
    if (!m_schema_dir.empty()) {
        const auto metadata_schema = m_schema_dir / "blob_metadata.v1.schema.json";
        if (auto valid = common::validate_json(*metadata_json, metadata_schema.string()); !valid) {
            return std::unexpected(valid.error());
        }
        const auto provenance_schema = m_schema_dir / "blob_provenance.v1.schema.json";
        if (auto valid = common::validate_json(*provenance_json, provenance_schema.string());
            !valid) {
            return std::unexpected(valid.error());
        }
    }

    StoredBlob blob;
    blob.content_hash = std::string(common::strip_hash_prefix(hash));
    blob.storage_path = *dir;
    try {
        const auto& m = *metadata_json;
        blob.metadata = BlobMetadata{.asset_type = m.at("asset_type").get<std::string>(),
                                     .asset_id = m.at("asset_id").get<std::string>(),
                                     .version = m.at("version").get<std::string>(),
                                     .created_at = m.at("created_at").get<std::string>(),
                                     .size = m.at("size").get<std::uint64_t>(),
                                     .content_hash = m.at("content_hash").get<std::string>()};
        const auto& p = *provenance_json;
        blob.provenance = BlobProvenance{.source_path = p.at("source_path").get<std::string>(),
                                         .ingestion_method = p.at("ingestion_method").get<std::string>(),
                                         .timestamp = p.at("timestamp").get<std::string>()};
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(arcas::make_error(
            errc::kParseError, std::format("Malformed sidecar in {}: {}", dir->string(), ex.what())));
    }
    return blob;
}

arcas::Result<std::vector<StoredBlob>> ContentAddressableStore::list(std::string_view kind) const
{
    if (auto valid = check_kind(kind); !valid) {
        return std::unexpected(valid.error());
    }
    std::vector<StoredBlob> blobs;
    const fs::path kind_root = m_root / kind;
    std::error_code ec;
    if (!fs::exists(kind_root, ec)) {
        return blobs;
    }
    for (auto it = fs::recursive_directory_iterator(kind_root, ec);
         !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        std::error_code type_ec;
        if (it.depth() != 2 || !it->is_directory(type_ec)) {
            continue;
        }
        it.disable_recursion_pending();
        const std::string name = it->path().filename().string();
        if (!common::is_sha256_hex(name)) {
            continue;
        }
        auto blob = describe(name, kind);
        if (!blob) {
            return std::unexpected(blob.error());
        }
        blobs.push_back(std::move(*blob));
    }
    if (ec) {
        return std::unexpected(arcas::make_error(
            errc::kIOError, std::format("Failed to scan {}: {}", kind_root.string(), ec.message())));
    }
    std::ranges::sort(blobs, {}, &StoredBlob::content_hash);
    return blobs;
}

arcas::VoidResult ContentAddressableStore::write_blob_files(const fs::path& dir,
                                                            const std::string& payload_text,
                                                            const BlobMetadata& metadata,
                                                            const BlobProvenance& provenance) const
{
    if (auto result = io::write_text_file(dir / kPayloadFile, payload_text); !result) {
        return result;
    }
    auto metadata_text = canonical::pretty_sorted(metadata_to_json(metadata));
    if (!metadata_text) {
        return std::unexpected(metadata_text.error());
    }
    if (auto result = io::write_text_file(dir / kMetadataFile, *metadata_text); !result) {
        return result;
    }
    auto provenance_text = canonical::pretty_sorted(provenance_to_json(provenance));
    if (!provenance_text) {
        return std::unexpected(provenance_text.error());
    }
    return io::write_text_file(dir / kProvenanceFile, *provenance_text);
}

}  // namespace arcas::cas
