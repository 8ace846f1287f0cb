/**
 * @file main.cpp
 * @brief arcas CLI entry point
 *
 * Commands:
 *   validate  - Ensure artifacts are usable, importing or versioning local files
 *   import    - Register an artifact file with the authority
 *   status    - Show registered artifacts or the versions of one artifact
 *   export    - Write a registered version to a file
 *   verify    - Recompute a stored blob's hash
 *   blobs     - List stored blobs of a kind
 *   version   - Show version information
 */

#include "arcas/require_cpp23.hpp"

#include "arcas/artifact_resolver.hpp"
#include "arcas/authority.hpp"
#include "arcas/canonical_json.hpp"
#include "arcas/cas_store.hpp"
#include "arcas/common.hpp"
#include "arcas/config.hpp"
#include "arcas/guidance.hpp"
#include "arcas/log.hpp"
#include "arcas/payload_io.hpp"
#include "arcas/transaction.hpp"
#include "arcas/validator.hpp"
#include "arcas/version.hpp"
#include "arcas/version_authority.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <print>
#include <ranges>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace fs = std::filesystem;

constexpr std::string_view kDefaultConfigFile = "arcas.json";

void print_version()
{
    std::println("arcas {} ({})", arcas::kVersion, arcas::kBuildId);
    std::println("  store layout: {}", arcas::kStoreLayoutVersion);
    std::println("  authority:    {}", arcas::kAuthoritySchemaVersion);
}

void print_help()
{
    std::print(R"(arcas - Artifact transactions over a content-addressable store

Usage: arcas <command> [options]

Commands:
  validate    Ensure artifacts are usable for a run
  import      Register an artifact file
  status      Show registered artifacts or versions
  export      Write a registered version to a file
  verify      Recompute the hash of a stored blob
  blobs       List stored blobs
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information
  --config FILE       Configuration file (default: ./arcas.json when present)
  --storage DIR       Blob storage root
  --db FILE           Authority database
  --schema-dir DIR    Path to schema directory
  --log-level LEVEL   trace, debug, info, warn, error, critical, off

Run 'arcas <command> --help' for command-specific options.
)");
}

void print_validate_help()
{
    std::print(R"(Usage: arcas validate <name>... [options]

Options:
  --file FILE             Artifact file (only with a single name)
  --version V             Expected version
  --kind KIND             Artifact kind (default: framework)
  --workspace DIR         Where artifact files are looked up
  --rollback-on-failure   Undo versions created by this run when it fails
  --guidance-json FILE    Write remediation guidance as JSON
  --help, -h              Show this help
)");
}

void print_import_help()
{
    std::print(R"(Usage: arcas import <name> --file FILE [options]

Options:
  --file FILE       Artifact file (.json, .yaml, .yml)
  --version V       Version to register when the file declares none
  --kind KIND       Artifact kind (default: framework)
  --help, -h        Show this help
)");
}

void print_status_help()
{
    std::print(R"(Usage: arcas status [<name>]

Without a name, lists every registered artifact with its latest version.
)");
}

void print_export_help()
{
    std::print(R"(Usage: arcas export <name> --out FILE [options]

Options:
  --out FILE        Output file
  --version V       Version to export (default: latest)
  --help, -h        Show this help
)");
}

void print_verify_help()
{
    std::print(R"(Usage: arcas verify <hash> [--kind KIND]
)");
}

void print_blobs_help()
{
    std::print(R"(Usage: arcas blobs [--kind KIND]
)");
}

struct GlobalOptions
{
    std::optional<fs::path> config_path;
    std::optional<fs::path> storage_root;
    std::optional<fs::path> database_path;
    std::optional<fs::path> schema_dir;
    std::optional<std::string> log_level;
};

/// Positional arguments, option values and flags of one subcommand.
struct ParsedArgs
{
    GlobalOptions global;
    std::vector<std::string> positionals;
    std::map<std::string, std::string, std::less<>> values;
    std::set<std::string, std::less<>> flags;
    bool show_help = false;

    [[nodiscard]] std::optional<std::string> value(std::string_view option) const
    {
        auto it = values.find(option);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    }
    [[nodiscard]] bool flag(std::string_view option) const { return flags.contains(option); }
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> arcas::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            arcas::Error::make("MissingArgument",
                               std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] bool set_global_option(std::string_view arg, const std::string& value, GlobalOptions& global)
{
    if (arg == "--config") {
        global.config_path = value;
    } else if (arg == "--storage") {
        global.storage_root = value;
    } else if (arg == "--db") {
        global.database_path = value;
    } else if (arg == "--schema-dir") {
        global.schema_dir = value;
    } else if (arg == "--log-level") {
        global.log_level = value;
    } else {
        return false;
    }
    return true;
}

[[nodiscard]] bool is_global_option(std::string_view arg)
{
    return arg == "--config" || arg == "--storage" || arg == "--db" || arg == "--schema-dir"
           || arg == "--log-level";
}

[[nodiscard]] arcas::Result<ParsedArgs> parse_args(std::span<char*> args,
                                                   std::initializer_list<std::string_view> value_options,
                                                   std::initializer_list<std::string_view> flag_options)
{
    ParsedArgs parsed;
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            parsed.show_help = true;
            continue;
        }
        if (std::ranges::contains(flag_options, arg)) {
            parsed.flags.emplace(arg);
            continue;
        }
        if (is_global_option(arg) || std::ranges::contains(value_options, arg)) {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            skip_next = true;
            if (!set_global_option(arg, *value, parsed.global)) {
                parsed.values.insert_or_assign(std::string(arg), std::move(*value));
            }
            continue;
        }
        if (arg.starts_with("--")) {
            return std::unexpected(
                arcas::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
        }
        parsed.positionals.emplace_back(arg);
    }
    return parsed;
}

/// Configuration, gateway, authority and store for one command.
struct AppContext
{
    arcas::config::Config config;
    std::unique_ptr<arcas::authority::SqliteAuthorityGateway> gateway;
    std::unique_ptr<arcas::authority::VersionAuthority> authority;
    std::unique_ptr<arcas::cas::ContentAddressableStore> store;
};

[[nodiscard]] arcas::Result<arcas::config::Config> load_config(const GlobalOptions& global)
{
    arcas::config::Config config;
    const auto env = arcas::config::process_environment();
    const fs::path schema_dir = global.schema_dir
                                    ? *global.schema_dir
                                    : fs::path(env("ARCAS_SCHEMA_DIR").value_or(config.schema_dir.string()));

    std::optional<fs::path> config_path = global.config_path;
    std::error_code ec;
    if (!config_path && fs::exists(kDefaultConfigFile, ec)) {
        config_path = fs::path(kDefaultConfigFile);
    }
    if (config_path) {
        auto loaded = arcas::config::load_file(*config_path, schema_dir);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    } else {
        config.schema_dir = schema_dir;
    }

    arcas::config::apply_environment(config, env);
    if (global.storage_root) {
        config.storage_root = *global.storage_root;
    }
    if (global.database_path) {
        config.database_path = *global.database_path;
    }
    if (global.schema_dir) {
        config.schema_dir = *global.schema_dir;
    }
    if (global.log_level) {
        config.log.level = *global.log_level;
    }
    return config;
}

[[nodiscard]] arcas::Result<AppContext> open_context(const GlobalOptions& global)
{
    auto config = load_config(global);
    if (!config) {
        return std::unexpected(config.error());
    }
    arcas::log::configure(config->log.level, config->log.pattern);

    AppContext context;
    context.config = std::move(*config);
    if (const auto parent = context.config.database_path.parent_path(); !parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
    }
    auto gateway = arcas::authority::SqliteAuthorityGateway::open(context.config.database_path,
                                                                  context.config.busy_timeout_ms);
    if (!gateway) {
        return std::unexpected(gateway.error());
    }
    context.gateway = std::move(*gateway);
    context.authority = std::make_unique<arcas::authority::VersionAuthority>(*context.gateway);
    context.store = std::make_unique<arcas::cas::ContentAddressableStore>(context.config.storage_root,
                                                                          context.config.schema_dir);
    return context;
}

[[nodiscard]] arcas::transaction::CoordinatorOptions coordinator_options(const AppContext& context)
{
    arcas::transaction::CoordinatorOptions options;
    options.ingestion_method = context.config.ingestion_method;
    options.content_scope = context.config.content_scope;
    return options;
}

/// Schema-check @p file; prints issues and returns false when it does not conform.
[[nodiscard]] arcas::Result<bool> precheck_file(const AppContext& context,
                                                const fs::path& file,
                                                std::string_view kind)
{
    auto payload = arcas::io::load_payload(file);
    if (!payload) {
        // The coordinator reports unreadable files as validation errors.
        return true;
    }
    const arcas::validator::SchemaArtifactValidator validator(context.config.schema_dir);
    auto report = validator.validate(*payload, kind);
    if (!report) {
        return std::unexpected(report.error());
    }
    if (!report->is_valid) {
        std::println(stderr, "Error: {} does not conform to the {} schema:", file.string(), kind);
        for (const auto& issue : report->issues) {
            std::println(stderr, "  {}", issue);
        }
    }
    return report->is_valid;
}

void print_state(const arcas::transaction::TransactionState& state)
{
    std::println("[{}] {} {}", arcas::transaction::to_string(state.result), state.artifact_name,
                 state.resolved_version.value_or("-"));
    if (!state.content_hash.empty()) {
        std::println("  content: {}", arcas::common::short_hash(state.content_hash));
    }
    if (state.new_version_created) {
        std::println("  new version created");
    }
    for (const auto& error : state.errors) {
        std::println("  error: {}", error);
    }
}

// ----------------------------------------------------------------------------
// validate
// ----------------------------------------------------------------------------

[[nodiscard]] int run_validate(const ParsedArgs& args)
{
    auto context = open_context(args.global);
    if (!context) {
        std::println(stderr, "Error: {}", context.error().message);
        return 1;
    }
    const std::string kind = args.value("--kind").value_or("framework");
    const fs::path workspace = args.value("--workspace").value_or(context->config.workspace_root.string());
    const auto version_hint = args.value("--version");

    std::vector<std::optional<fs::path>> files;
    for (const auto& name : args.positionals) {
        std::optional<fs::path> file;
        if (auto explicit_file = args.value("--file")) {
            file = fs::path(*explicit_file);
        } else {
            file = arcas::resolver::resolve(workspace, name, kind);
        }
        if (file) {
            std::error_code ec;
            if (fs::exists(*file, ec)) {
                auto conforms = precheck_file(*context, *file, kind);
                if (!conforms) {
                    std::println(stderr, "Error: {}", conforms.error().message);
                    return 1;
                }
                if (!*conforms) {
                    return 1;
                }
            }
        }
        files.push_back(std::move(file));
    }

    arcas::transaction::TransactionCoordinator coordinator(*context->store, *context->authority,
                                                           coordinator_options(*context));
    std::println("[validate] transaction {}", coordinator.transaction_id());
    for (auto [name, file] : std::views::zip(args.positionals, files)) {
        print_state(coordinator.validate_for_use(name, file, version_hint, kind));
    }

    const auto verdict = coordinator.is_transaction_valid();
    if (verdict.valid) {
        std::println("[validate] OK: {} artifact(s) usable", args.positionals.size());
        return 0;
    }

    const auto guidance = coordinator.generate_guidance();
    for (const auto& line : arcas::guidance::render_text(guidance)) {
        std::println(stderr, "{}", line);
    }
    if (auto out = args.value("--guidance-json")) {
        if (auto written = arcas::guidance::write_json(guidance, *out); !written) {
            std::println(stderr, "Error: failed to write guidance: {}", written.error().message);
        }
    }
    if (args.flag("--rollback-on-failure")) {
        auto report = coordinator.rollback();
        if (!report) {
            std::println(stderr, "Error: rollback failed: {}", report.error().message);
        } else {
            for (const auto& entry : report->entries) {
                std::println(stderr, "[rollback] {}@{}: {}", entry.artifact, entry.version, entry.detail);
            }
            if (!report->ok()) {
                std::println(stderr, "[rollback] incomplete; manual cleanup required");
            }
        }
    }
    return 1;
}

int cmd_validate(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto parsed = parse_args(args, {"--file", "--version", "--kind", "--workspace", "--guidance-json"},
                             {"--rollback-on-failure"});
    if (!parsed) {
        std::println(stderr, "Error: {}", parsed.error().message);
        return 1;
    }
    if (parsed->show_help) {
        print_validate_help();
        return 0;
    }
    if (parsed->positionals.empty()) {
        std::println(stderr, "Error: at least one artifact name is required");
        print_validate_help();
        return 1;
    }
    if (parsed->value("--file") && parsed->positionals.size() > 1) {
        std::println(stderr, "Error: --file applies to a single artifact");
        return 1;
    }
    return run_validate(*parsed);
}

// ----------------------------------------------------------------------------
// import
// ----------------------------------------------------------------------------

[[nodiscard]] int run_import(const ParsedArgs& args)
{
    auto context = open_context(args.global);
    if (!context) {
        std::println(stderr, "Error: {}", context.error().message);
        return 1;
    }
    const std::string& name = args.positionals.front();
    const fs::path file = *args.value("--file");
    const std::string kind = args.value("--kind").value_or("framework");

    std::error_code ec;
    if (!fs::exists(file, ec)) {
        std::println(stderr, "Error: file not found: {}", file.string());
        return 1;
    }
    auto conforms = precheck_file(*context, file, kind);
    if (!conforms) {
        std::println(stderr, "Error: {}", conforms.error().message);
        return 1;
    }
    if (!*conforms) {
        return 1;
    }

    arcas::transaction::TransactionCoordinator coordinator(*context->store, *context->authority,
                                                           coordinator_options(*context));
    const auto state = coordinator.validate_for_use(name, file, args.value("--version"), kind);
    print_state(state);
    return arcas::transaction::is_usable(state.result) ? 0 : 1;
}

int cmd_import(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto parsed = parse_args(args, {"--file", "--version", "--kind"}, {});
    if (!parsed) {
        std::println(stderr, "Error: {}", parsed.error().message);
        return 1;
    }
    if (parsed->show_help) {
        print_import_help();
        return 0;
    }
    if (parsed->positionals.size() != 1 || !parsed->value("--file")) {
        std::println(stderr, "Error: an artifact name and --file are required");
        print_import_help();
        return 1;
    }
    return run_import(*parsed);
}

// ----------------------------------------------------------------------------
// status
// ----------------------------------------------------------------------------

[[nodiscard]] int run_status(const ParsedArgs& args)
{
    auto context = open_context(args.global);
    if (!context) {
        std::println(stderr, "Error: {}", context.error().message);
        return 1;
    }
    auto& authority = *context->authority;

    if (args.positionals.empty()) {
        auto names = authority.artifact_names();
        if (!names) {
            std::println(stderr, "Error: {}", names.error().message);
            return 1;
        }
        std::println("[status] {} artifact(s)", names->size());
        for (const auto& name : *names) {
            auto latest = authority.get(name);
            if (!latest) {
                std::println(stderr, "Error: {}", latest.error().message);
                return 1;
            }
            if (*latest) {
                std::println("  {} ({}) latest {}", name, (*latest)->kind, (*latest)->version);
            }
        }
        return 0;
    }

    const std::string& name = args.positionals.front();
    auto versions = authority.list(name);
    if (!versions) {
        std::println(stderr, "Error: {}", versions.error().message);
        return 1;
    }
    if (versions->empty()) {
        std::println("[status] {}: not registered", name);
        return 1;
    }
    std::println("[status] {}: {} version(s)", name, versions->size());
    for (const auto& record : *versions) {
        std::println("  {}  {}  content {}  blob {}", record.version, record.created_at,
                     arcas::common::short_hash(record.content_hash),
                     arcas::common::short_hash(record.blob_hash));
    }
    return 0;
}

int cmd_status(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto parsed = parse_args(args, {}, {});
    if (!parsed) {
        std::println(stderr, "Error: {}", parsed.error().message);
        return 1;
    }
    if (parsed->show_help) {
        print_status_help();
        return 0;
    }
    return run_status(*parsed);
}

// ----------------------------------------------------------------------------
// export
// ----------------------------------------------------------------------------

[[nodiscard]] int run_export(const ParsedArgs& args)
{
    auto context = open_context(args.global);
    if (!context) {
        std::println(stderr, "Error: {}", context.error().message);
        return 1;
    }
    const std::string& name = args.positionals.front();
    const auto version = args.value("--version");
    auto record = context->authority->get(name, version.value_or(""));
    if (!record) {
        std::println(stderr, "Error: {}", record.error().message);
        return 1;
    }
    if (!*record) {
        std::println(stderr, "Error: {}{} is not registered", name,
                     version ? "@" + *version : std::string{});
        return 1;
    }
    auto text = arcas::canonical::pretty_sorted((*record)->payload);
    if (!text) {
        std::println(stderr, "Error: {}", text.error().message);
        return 1;
    }
    const fs::path out = *args.value("--out");
    if (auto written = arcas::io::write_text_file(out, *text); !written) {
        std::println(stderr, "Error: {}", written.error().message);
        return 1;
    }
    std::println("[export] {}@{} -> {}", name, (*record)->version, out.string());
    return 0;
}

int cmd_export(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto parsed = parse_args(args, {"--version", "--out"}, {});
    if (!parsed) {
        std::println(stderr, "Error: {}", parsed.error().message);
        return 1;
    }
    if (parsed->show_help) {
        print_export_help();
        return 0;
    }
    if (parsed->positionals.size() != 1 || !parsed->value("--out")) {
        std::println(stderr, "Error: an artifact name and --out are required");
        print_export_help();
        return 1;
    }
    return run_export(*parsed);
}

// ----------------------------------------------------------------------------
// verify / blobs
// ----------------------------------------------------------------------------

[[nodiscard]] int run_verify(const ParsedArgs& args)
{
    auto context = open_context(args.global);
    if (!context) {
        std::println(stderr, "Error: {}", context.error().message);
        return 1;
    }
    const std::string& hash = args.positionals.front();
    const std::string kind = args.value("--kind").value_or("framework");
    auto intact = context->store->verify(hash, kind);
    if (!intact) {
        std::println(stderr, "Error: {}", intact.error().message);
        return 1;
    }
    std::println("[verify] {} {}: {}", kind, arcas::common::short_hash(arcas::common::strip_hash_prefix(hash)),
                 *intact ? "intact" : "CORRUPT");
    return *intact ? 0 : 1;
}

int cmd_verify(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto parsed = parse_args(args, {"--kind"}, {});
    if (!parsed) {
        std::println(stderr, "Error: {}", parsed.error().message);
        return 1;
    }
    if (parsed->show_help) {
        print_verify_help();
        return 0;
    }
    if (parsed->positionals.size() != 1) {
        std::println(stderr, "Error: a blob hash is required");
        print_verify_help();
        return 1;
    }
    return run_verify(*parsed);
}

[[nodiscard]] int run_blobs(const ParsedArgs& args)
{
    auto context = open_context(args.global);
    if (!context) {
        std::println(stderr, "Error: {}", context.error().message);
        return 1;
    }
    const std::string kind = args.value("--kind").value_or("framework");
    auto blobs = context->store->list(kind);
    if (!blobs) {
        std::println(stderr, "Error: {}", blobs.error().message);
        return 1;
    }
    std::println("[blobs] {} {} blob(s) under {}", blobs->size(), kind,
                 context->store->root().string());
    for (const auto& blob : *blobs) {
        std::println("  {}  {}@{}  {} bytes  from {}", arcas::common::short_hash(blob.content_hash),
                     blob.metadata.asset_id, blob.metadata.version, blob.metadata.size,
                     blob.provenance.source_path.empty() ? "-" : blob.provenance.source_path);
    }
    return 0;
}

int cmd_blobs(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto parsed = parse_args(args, {"--kind"}, {});
    if (!parsed) {
        std::println(stderr, "Error: {}", parsed.error().message);
        return 1;
    }
    if (parsed->show_help) {
        print_blobs_help();
        return 0;
    }
    return run_blobs(*parsed);
}

}  // namespace

namespace {

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "validate") {
            return cmd_validate(sub_argc, sub_argv);
        }
        if (cmd == "import") {
            return cmd_import(sub_argc, sub_argv);
        }
        if (cmd == "status") {
            return cmd_status(sub_argc, sub_argv);
        }
        if (cmd == "export") {
            return cmd_export(sub_argc, sub_argv);
        }
        if (cmd == "verify") {
            return cmd_verify(sub_argc, sub_argv);
        }
        if (cmd == "blobs") {
            return cmd_blobs(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
