/**
 * @file guidance.cpp
 * @brief Rollback guidance generation and rendering
 */

#include "arcas/guidance.hpp"

#include "arcas/artifact_resolver.hpp"
#include "arcas/canonical_json.hpp"
#include "arcas/payload_io.hpp"

#include <format>

namespace arcas::guidance {

namespace {

using transaction::ResultCode;

[[nodiscard]] std::string kind_flag(const std::string& kind)
{
    return kind == "framework" ? std::string{} : std::format(" --kind {}", kind);
}

[[nodiscard]] std::string display(const std::optional<std::string>& value)
{
    return value.value_or("(none)");
}

void add_advice(Guidance& guidance, const FailedArtifact& failed)
{
    const std::string& name = failed.artifact_name;
    const std::string flag = kind_flag(failed.kind);
    switch (failed.result) {
        case ResultCode::kNotFound: {
            const auto suggested = resolver::candidate_paths({}, name, failed.kind).front();
            guidance.recommendations.push_back(std::format(
                "{} '{}' not found. Create its definition file and import it.", failed.kind, name));
            guidance.commands_to_run.push_back(
                std::format("# Create definition file: {}", suggested.generic_string()));
            guidance.commands_to_run.push_back(std::format("arcas import {} --file {}{}", name,
                                                           suggested.generic_string(), flag));
            guidance.commands_to_run.push_back(std::format("arcas status {}", name));
            break;
        }
        case ResultCode::kVersionMismatch:
            guidance.recommendations.push_back(
                std::format("{} '{}' version mismatch. Expected: {}, Found: {}", failed.kind, name,
                            display(failed.requested_version), display(failed.resolved_version)));
            guidance.commands_to_run.push_back(std::format("arcas status {}", name));
            if (failed.resolved_version) {
                guidance.commands_to_run.push_back(
                    std::format("arcas export {} --version {} --out {}_{}.json", name,
                                *failed.resolved_version, name, *failed.resolved_version));
            }
            break;
        case ResultCode::kTransactionFailure:
            guidance.recommendations.push_back(std::format(
                "{} '{}' transaction failed. Check backing store connectivity and artifact validity.",
                failed.kind, name));
            guidance.commands_to_run.push_back(std::format("arcas validate {}{}", name, flag));
            guidance.commands_to_run.push_back("arcas status");
            break;
        case ResultCode::kValidationError:
            guidance.recommendations.push_back(std::format(
                "{} '{}' could not be validated. Fix the artifact file and re-run validation.",
                failed.kind, name));
            guidance.commands_to_run.push_back(std::format("arcas validate {}{}", name, flag));
            break;
        case ResultCode::kValid:
        case ResultCode::kContentChanged:
            break;
    }
}

}  // namespace

Guidance generate(const transaction::Transaction& transaction)
{
    Guidance guidance;
    guidance.transaction_id = transaction.transaction_id;
    guidance.total_artifacts = transaction.states.size();
    for (const auto& state : transaction.states) {
        if (transaction::is_usable(state.result)) {
            continue;
        }
        FailedArtifact failed{.artifact_name = state.artifact_name,
                              .kind = state.kind,
                              .result = state.result,
                              .errors = state.errors,
                              .requested_version = state.requested_version,
                              .resolved_version = state.resolved_version};
        add_advice(guidance, failed);
        guidance.failed_artifacts.push_back(std::move(failed));
    }
    return guidance;
}

nlohmann::json to_json(const Guidance& guidance)
{
    nlohmann::json failed = nlohmann::json::array();
    for (const auto& artifact : guidance.failed_artifacts) {
        failed.push_back({
            {    "artifact_name",                                    artifact.artifact_name},
            {             "kind",                                             artifact.kind},
            {           "result",                      transaction::to_string(artifact.result)},
            {           "errors",                                           artifact.errors},
            {"requested_version", artifact.requested_version ? nlohmann::json(*artifact.requested_version)
                                                             : nlohmann::json(nullptr)},
            { "resolved_version", artifact.resolved_version ? nlohmann::json(*artifact.resolved_version)
                                                            : nlohmann::json(nullptr)}
        });
    }
    return nlohmann::json{
        {   "transaction_id",   guidance.transaction_id},
        {  "total_artifacts",  guidance.total_artifacts},
        { "failed_artifacts",                    failed},
        {  "recommendations",  guidance.recommendations},
        {  "commands_to_run",  guidance.commands_to_run}
    };
}

std::vector<std::string> render_text(const Guidance& guidance)
{
    std::vector<std::string> lines;
    lines.push_back(std::format("Transaction {}: {} of {} artifact(s) failed",
                                guidance.transaction_id, guidance.failed_artifacts.size(),
                                guidance.total_artifacts));
    for (const auto& artifact : guidance.failed_artifacts) {
        lines.push_back(std::format("FAILED: {} ({})", artifact.artifact_name,
                                    transaction::to_string(artifact.result)));
        if (artifact.requested_version) {
            lines.push_back("  requested: " + *artifact.requested_version);
        }
        if (artifact.resolved_version) {
            lines.push_back("  found: " + *artifact.resolved_version);
        }
        for (const auto& error : artifact.errors) {
            lines.push_back("  error: " + error);
        }
    }
    if (!guidance.recommendations.empty()) {
        lines.emplace_back("Recommendations:");
        for (const auto& recommendation : guidance.recommendations) {
            lines.push_back("  - " + recommendation);
        }
    }
    if (!guidance.commands_to_run.empty()) {
        lines.emplace_back("Commands:");
        for (const auto& command : guidance.commands_to_run) {
            lines.push_back("  " + command);
        }
    }
    return lines;
}

arcas::VoidResult write_json(const Guidance& guidance, const std::filesystem::path& path)
{
    auto text = canonical::pretty_sorted(to_json(guidance));
    if (!text) {
        return std::unexpected(text.error());
    }
    return io::write_text_file(path, *text);
}

}  // namespace arcas::guidance
