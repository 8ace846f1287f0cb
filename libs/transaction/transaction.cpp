/**
 * @file transaction.cpp
 * @brief TransactionCoordinator implementation
 */

#include "arcas/transaction.hpp"

#include "arcas/log.hpp"
#include "arcas/payload_io.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <random>
#include <utility>

namespace arcas::transaction {

namespace fs = std::filesystem;

// ----------------------------------------------------------------------------
// ResultCode / TransactionState
// ----------------------------------------------------------------------------

std::string_view to_string(ResultCode code)
{
    switch (code) {
        case ResultCode::kValid:
            return "valid";
        case ResultCode::kVersionMismatch:
            return "version_mismatch";
        case ResultCode::kContentChanged:
            return "content_changed";
        case ResultCode::kNotFound:
            return "not_found";
        case ResultCode::kValidationError:
            return "validation_error";
        case ResultCode::kTransactionFailure:
            return "transaction_failure";
    }
    return "validation_error";
}

std::optional<ResultCode> result_code_from_string(std::string_view text)
{
    for (auto code : {ResultCode::kValid,
                      ResultCode::kVersionMismatch,
                      ResultCode::kContentChanged,
                      ResultCode::kNotFound,
                      ResultCode::kValidationError,
                      ResultCode::kTransactionFailure}) {
        if (to_string(code) == text) {
            return code;
        }
    }
    return std::nullopt;
}

namespace {

[[nodiscard]] nlohmann::json optional_json(const std::optional<std::string>& value)
{
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

nlohmann::json to_json(const TransactionState& state)
{
    return nlohmann::json{
        {      "artifact_name",       state.artifact_name},
        {               "kind",                state.kind},
        {  "requested_version", optional_json(state.requested_version)},
        {   "resolved_version", optional_json(state.resolved_version)},
        {       "content_hash",        state.content_hash},
        {             "result",     to_string(state.result)},
        {"new_version_created", state.new_version_created},
        {             "errors",              state.errors},
        {     "transaction_id",      state.transaction_id},
        {          "timestamp",           state.timestamp}
    };
}

std::string generate_transaction_id(std::chrono::system_clock::time_point now)
{
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint32_t> dist(0, 0xFFFFFF);
    const auto seconds = std::chrono::floor<std::chrono::seconds>(now);
    return std::format("ftx_{:%Y%m%d_%H%M%S}_{:06x}", seconds, dist(engine));
}

std::optional<std::string> declared_version(const nlohmann::json& payload)
{
    if (!payload.is_object()) {
        return std::nullopt;
    }
    if (auto it = payload.find("version"); it != payload.end() && it->is_string()) {
        return it->get<std::string>();
    }
    if (auto meta = payload.find("framework_meta"); meta != payload.end() && meta->is_object()) {
        if (auto it = meta->find("version"); it != meta->end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

bool RollbackReport::ok() const noexcept
{
    return std::ranges::all_of(entries, &RollbackEntry::removed);
}

// ----------------------------------------------------------------------------
// TransactionCoordinator
// ----------------------------------------------------------------------------

namespace {

[[nodiscard]] allocator::Clock default_clock(allocator::Clock clock)
{
    if (clock) {
        return clock;
    }
    return [] { return std::chrono::system_clock::now(); };
}

}  // namespace

TransactionCoordinator::TransactionCoordinator(cas::ContentAddressableStore& store,
                                               authority::VersionAuthority& authority,
                                               CoordinatorOptions options)
    : m_store(store)
    , m_authority(authority)
    , m_detector(std::move(options.content_scope))
    , m_clock(default_clock(std::move(options.clock)))
    , m_allocator(authority, m_clock)
    , m_ingestion_method(std::move(options.ingestion_method))
{
    const auto now = m_clock();
    m_transaction.transaction_id = options.transaction_id.empty() ? generate_transaction_id(now)
                                                                  : std::move(options.transaction_id);
    m_transaction.start_time = common::iso8601_utc(now);
    log::logger()->info("transaction {} started", m_transaction.transaction_id);
}

TransactionState TransactionCoordinator::validate_for_use(std::string_view artifact_name,
                                                          const std::optional<fs::path>& file_path,
                                                          const std::optional<std::string>& version_hint,
                                                          std::string_view kind)
{
    TransactionState state;
    state.artifact_name = std::string(artifact_name);
    state.kind = std::string(kind);
    state.requested_version = version_hint;
    state.transaction_id = m_transaction.transaction_id;
    state.timestamp = common::iso8601_utc(m_clock());

    if (m_rolled_back) {
        // Nothing written now could be undone.
        state.result = ResultCode::kTransactionFailure;
        state.errors.push_back(
            std::format("Transaction {} was rolled back; start a new one", m_transaction.transaction_id));
        m_transaction.states.push_back(state);
        log_transition(state);
        return state;
    }

    try {
        evaluate(state, file_path, version_hint);
    } catch (const std::exception& ex) {
        state.result = ResultCode::kValidationError;
        state.errors.push_back(std::format("Unexpected error while validating {}: {}", artifact_name,
                                           ex.what()));
    }

    m_transaction.states.push_back(state);
    log_transition(state);
    return state;
}

void TransactionCoordinator::evaluate(TransactionState& state,
                                      const std::optional<fs::path>& file_path,
                                      const std::optional<std::string>& version_hint)
{
    std::optional<fs::path> local_file;
    if (file_path) {
        std::error_code ec;
        if (fs::exists(*file_path, ec)) {
            local_file = *file_path;
        } else {
            log::logger()->warn("{}: file {} does not exist; relying on the authority",
                                state.artifact_name, file_path->string());
        }
    }

    std::optional<nlohmann::json> payload;
    if (local_file) {
        auto loaded = io::load_payload(*local_file);
        if (!loaded) {
            state.result = ResultCode::kValidationError;
            state.errors.push_back(std::format("Cannot read {}: {}", local_file->string(),
                                               loaded.error().message));
            return;
        }
        payload = std::move(*loaded);
    }

    auto found = m_authority.get(state.artifact_name, version_hint.value_or(""));
    if (!found) {
        state.result = ResultCode::kTransactionFailure;
        state.errors.push_back(std::format("Authority lookup failed: {}", found.error().message));
        return;
    }

    if (*found) {
        const authority::VersionRecord& record = **found;
        state.resolved_version = record.version;
        state.content_hash = record.content_hash;
        if (!payload) {
            state.result = ResultCode::kValid;
            return;
        }
        auto report = m_detector.is_consistent(*payload, record);
        if (!report) {
            state.result = ResultCode::kValidationError;
            state.errors.push_back(report.error().message);
            return;
        }
        if (report->consistent) {
            state.result = ResultCode::kValid;
            return;
        }
        log::logger()->warn("{}@{}: local content differs ({} vs {})", state.artifact_name,
                            record.version, common::short_hash(report->file_hash),
                            common::short_hash(report->authority_hash));
        commit_new_version(state, *payload, *local_file, record.version);
        if (state.result == ResultCode::kValid) {
            state.result = ResultCode::kContentChanged;
        }
        return;
    }

    if (payload) {
        import_payload(state, *payload, *local_file, version_hint);
        return;
    }

    if (version_hint) {
        auto latest = m_authority.get(state.artifact_name);
        if (!latest) {
            state.result = ResultCode::kTransactionFailure;
            state.errors.push_back(std::format("Authority lookup failed: {}", latest.error().message));
            return;
        }
        if (*latest) {
            state.result = ResultCode::kVersionMismatch;
            state.resolved_version = (*latest)->version;
            state.content_hash = (*latest)->content_hash;
            state.errors.push_back(std::format("Version {} of {} not found; latest is {}",
                                               *version_hint, state.artifact_name,
                                               (*latest)->version));
            return;
        }
    }

    state.result = ResultCode::kNotFound;
    state.errors.push_back(
        std::format("{} {} not found in authority or filesystem", state.kind, state.artifact_name));
}

void TransactionCoordinator::import_payload(TransactionState& state,
                                            const nlohmann::json& payload,
                                            const fs::path& source,
                                            const std::optional<std::string>& version_hint)
{
    std::string candidate = declared_version(payload).value_or(
        version_hint.value_or(std::string(kDefaultVersion)));

    auto existing = m_authority.get(state.artifact_name, candidate);
    if (!existing) {
        state.result = ResultCode::kTransactionFailure;
        state.errors.push_back(std::format("Authority lookup failed: {}", existing.error().message));
        return;
    }
    if (*existing) {
        auto report = m_detector.is_consistent(payload, **existing);
        if (!report) {
            state.result = ResultCode::kValidationError;
            state.errors.push_back(report.error().message);
            return;
        }
        if (report->consistent) {
            log::logger()->info("{}@{} already registered with identical content",
                                state.artifact_name, (*existing)->version);
            state.result = ResultCode::kValid;
            state.resolved_version = (*existing)->version;
            state.content_hash = report->authority_hash;
            return;
        }
        commit_new_version(state, payload, source, (*existing)->version);
        return;
    }

    auto record = commit(state, payload, candidate, source);
    if (!record) {
        state.result = ResultCode::kTransactionFailure;
        state.errors.push_back(record.error().message);
        return;
    }
    state.result = ResultCode::kValid;
    state.new_version_created = true;
    state.resolved_version = record->version;
    state.content_hash = record->content_hash;
}

void TransactionCoordinator::commit_new_version(TransactionState& state,
                                                const nlohmann::json& payload,
                                                const fs::path& source,
                                                std::string_view base_version)
{
    const auto allocation =
        m_allocator.allocate(state.artifact_name, base_version, m_transaction.transaction_id);
    auto record = commit(state, payload, allocation.version, source);
    if (!record) {
        state.result = ResultCode::kTransactionFailure;
        state.errors.push_back(record.error().message);
        return;
    }
    state.result = ResultCode::kValid;
    state.new_version_created = true;
    state.resolved_version = record->version;
    state.content_hash = record->content_hash;
}

arcas::Result<authority::VersionRecord> TransactionCoordinator::commit(const TransactionState& state,
                                                                      const nlohmann::json& payload,
                                                                      const std::string& version,
                                                                      const fs::path& source)
{
    auto stored = m_store.store(payload,
                                cas::StoreRequest{.asset_type = state.kind,
                                                  .asset_id = state.artifact_name,
                                                  .version = version,
                                                  .source_path = common::normalize_path(source.generic_string()),
                                                  .ingestion_method = m_ingestion_method});
    if (!stored) {
        return std::unexpected(stored.error());
    }
    if (stored->already_existed) {
        auto intact = m_store.verify(stored->content_hash, state.kind);
        if (!intact) {
            return std::unexpected(intact.error());
        }
        if (!*intact) {
            log::logger()->critical("{}: stored blob {} is corrupt; refusing to register {}",
                                    state.artifact_name, stored->content_hash, version);
            return std::unexpected(arcas::make_error(
                errc::kIntegrityError,
                std::format("Stored blob {} no longer matches its content hash",
                            stored->content_hash)));
        }
    }

    auto content_hash = m_detector.hash_of(payload);
    if (!content_hash) {
        return std::unexpected(content_hash.error());
    }

    authority::VersionRecord record{.artifact_name = state.artifact_name,
                                    .kind = state.kind,
                                    .version = version,
                                    .content_hash = std::move(*content_hash),
                                    .blob_hash = stored->content_hash,
                                    .payload = payload,
                                    .created_at = common::iso8601_utc(m_clock())};
    auto outcome = m_authority.register_version(record);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }
    if (*outcome == authority::InsertOutcome::kAlreadyExists) {
        return std::unexpected(arcas::make_error(
            errc::kVersionConflict,
            std::format("Version {} of {} was registered concurrently", version, state.artifact_name)));
    }
    return record;
}

Verdict TransactionCoordinator::is_transaction_valid() const
{
    Verdict verdict;
    std::size_t failed = 0;
    for (const auto& state : m_transaction.states) {
        if (is_usable(state.result)) {
            continue;
        }
        ++failed;
        verdict.errors.push_back(
            std::format("Artifact {}: {}", state.artifact_name, to_string(state.result)));
        verdict.errors.insert(verdict.errors.end(), state.errors.begin(), state.errors.end());
    }
    verdict.valid = failed == 0;

    if (verdict.valid) {
        log::logger()->info("transaction {} valid: {} artifact(s)", m_transaction.transaction_id,
                            m_transaction.states.size());
    } else {
        log::logger()->error("transaction {} invalid: {} of {} artifact(s) failed",
                             m_transaction.transaction_id, failed, m_transaction.states.size());
    }
    return verdict;
}

guidance::Guidance TransactionCoordinator::generate_guidance() const
{
    return guidance::generate(m_transaction);
}

arcas::Result<RollbackReport> TransactionCoordinator::rollback()
{
    if (m_rolled_back) {
        return std::unexpected(arcas::make_error(
            errc::kRollbackAlreadyPerformed,
            std::format("Transaction {} was already rolled back", m_transaction.transaction_id)));
    }
    m_rolled_back = true;
    log::logger()->warn("rolling back transaction {}", m_transaction.transaction_id);

    RollbackReport report{.transaction_id = m_transaction.transaction_id, .entries = {}};
    for (const auto& state : m_transaction.states) {
        if (!state.new_version_created || !state.resolved_version) {
            continue;
        }
        RollbackEntry entry{.artifact = state.artifact_name,
                            .version = *state.resolved_version,
                            .removed = false,
                            .detail = {}};
        auto removed = m_authority.remove(state.artifact_name, *state.resolved_version);
        if (!removed) {
            entry.detail = removed.error().message;
        } else if (!*removed) {
            entry.detail = "record not found";
        } else {
            entry.removed = true;
            entry.detail = "removed";
        }

        const nlohmann::json fields{
            {"transaction_id", m_transaction.transaction_id},
            {      "artifact",                 entry.artifact},
            {          "kind",                     state.kind},
            {       "version",                  entry.version},
            {       "removed",                  entry.removed},
            {        "detail",                   entry.detail}
        };
        if (entry.removed) {
            log::logger()->info("{}", log::structured("rollback", fields));
        } else {
            log::logger()->error("{}", log::structured("rollback_incomplete", fields));
            log::logger()->error("{}@{} needs manual removal from the authority", entry.artifact,
                                 entry.version);
        }
        report.entries.push_back(std::move(entry));
    }
    return report;
}

void TransactionCoordinator::log_transition(const TransactionState& state) const
{
    nlohmann::json fields = to_json(state);
    fields.erase("timestamp");
    fields["artifact"] = fields["artifact_name"];
    fields.erase("artifact_name");
    const std::string entry = log::structured("artifact_validated", fields);
    if (is_usable(state.result)) {
        log::logger()->info("{}", entry);
    } else {
        log::logger()->error("{}", entry);
    }
}

}  // namespace arcas::transaction
