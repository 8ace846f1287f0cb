/**
 * @file test_transaction.cpp
 * @brief TransactionCoordinator outcome tests
 */

#include "arcas/transaction.hpp"

#include "support/log_capture.hpp"
#include "support/temp_dir.hpp"

#include <fstream>
#include <regex>

#include <gtest/gtest.h>

using arcas::authority::InMemoryAuthorityGateway;
using arcas::authority::VersionAuthority;
using arcas::cas::ContentAddressableStore;
using arcas::test::TempDir;
using arcas::transaction::CoordinatorOptions;
using arcas::transaction::ResultCode;
using arcas::transaction::TransactionCoordinator;

namespace {

nlohmann::json civic_virtue_v1()
{
    return nlohmann::json{
        {"name", "civic_virtue"},
        {"dipoles",
         nlohmann::json::array({{{"name", "Dignity"}, {"positive", {{"name", "Dignity"}, {"weight", 1.0}}}}})}
    };
}

/// Gateway whose lookups always fail.
class BrokenGateway : public InMemoryAuthorityGateway
{
public:
    arcas::Result<std::optional<arcas::authority::VersionRecord>> find(std::string_view,
                                                                       std::string_view) override
    {
        return std::unexpected(arcas::make_error(arcas::errc::kDatabaseError, "disk I/O error"));
    }
    arcas::Result<std::optional<arcas::authority::VersionRecord>> latest(std::string_view) override
    {
        return std::unexpected(arcas::make_error(arcas::errc::kDatabaseError, "disk I/O error"));
    }
};

class TransactionTest : public ::testing::Test
{
protected:
    TransactionTest()
        : m_temp_dir("arcas_transaction")
        , m_store(m_temp_dir.path() / "store")
        , m_authority(m_gateway)
    {}

    std::filesystem::path write_json(const std::string& name, const nlohmann::json& payload)
    {
        const auto path = m_temp_dir.path() / name;
        std::ofstream out(path);
        out << payload.dump(2);
        return path;
    }

    TempDir m_temp_dir;
    ContentAddressableStore m_store;
    InMemoryAuthorityGateway m_gateway;
    VersionAuthority m_authority;
};

}  // namespace

TEST_F(TransactionTest, ChangedContentGetsNewVersion)
{
    const auto original = write_json("civic_v1.json", civic_virtue_v1());
    {
        TransactionCoordinator setup(m_store, m_authority);
        const auto state = setup.validate_for_use("civic_virtue", original, "v1.0");
        ASSERT_EQ(state.result, ResultCode::kValid);
        ASSERT_EQ(state.resolved_version, "v1.0");
    }

    auto changed = civic_virtue_v1();
    changed["dipoles"][0]["positive"]["weight"] = 0.9;
    const auto edited = write_json("civic_v2.json", changed);

    TransactionCoordinator coordinator(m_store, m_authority);
    const auto state = coordinator.validate_for_use("civic_virtue", edited, "v1.0");
    EXPECT_EQ(state.result, ResultCode::kContentChanged);
    EXPECT_TRUE(state.new_version_created);
    EXPECT_EQ(state.requested_version, "v1.0");
    EXPECT_EQ(state.resolved_version, "v1.0.1");
    EXPECT_EQ(state.transaction_id, coordinator.transaction_id());
    EXPECT_TRUE(coordinator.is_transaction_valid().valid);

    auto old_version = m_authority.get("civic_virtue", "v1.0");
    auto new_version = m_authority.get("civic_virtue", "v1.0.1");
    ASSERT_TRUE(old_version && old_version->has_value());
    ASSERT_TRUE(new_version && new_version->has_value());
    EXPECT_NE((*old_version)->content_hash, (*new_version)->content_hash);
    EXPECT_EQ((*new_version)->payload, changed);
}

TEST_F(TransactionTest, IdenticalContentIsValidWithoutNewVersion)
{
    const auto path = write_json("civic.json", civic_virtue_v1());
    TransactionCoordinator first(m_store, m_authority);
    const auto imported = first.validate_for_use("civic_virtue", path);
    EXPECT_EQ(imported.result, ResultCode::kValid);
    EXPECT_TRUE(imported.new_version_created);
    EXPECT_EQ(imported.resolved_version, arcas::transaction::kDefaultVersion);

    TransactionCoordinator second(m_store, m_authority);
    const auto revalidated = second.validate_for_use("civic_virtue", path);
    EXPECT_EQ(revalidated.result, ResultCode::kValid);
    EXPECT_FALSE(revalidated.new_version_created);
    EXPECT_EQ(revalidated.content_hash, imported.content_hash);
    EXPECT_EQ(m_gateway.size(), 1U);
}

TEST_F(TransactionTest, IncidentalEditIsNotAChange)
{
    const auto path = write_json("civic.json", civic_virtue_v1());
    TransactionCoordinator first(m_store, m_authority);
    ASSERT_EQ(first.validate_for_use("civic_virtue", path).result, ResultCode::kValid);

    auto touched = civic_virtue_v1();
    touched["last_modified"] = "2025-07-01T00:00:00Z";
    const auto touched_path = write_json("civic_touched.json", touched);
    TransactionCoordinator second(m_store, m_authority);
    const auto state = second.validate_for_use("civic_virtue", touched_path);
    EXPECT_EQ(state.result, ResultCode::kValid);
    EXPECT_FALSE(state.new_version_created);
}

TEST_F(TransactionTest, ImportUsesDeclaredVersion)
{
    auto payload = civic_virtue_v1();
    payload["framework_meta"] = {
        {"version", "v3.2.1"}
    };
    const auto path = write_json("civic.json", payload);

    TransactionCoordinator coordinator(m_store, m_authority);
    const auto state = coordinator.validate_for_use("civic_virtue", path, "v9.9.9");
    EXPECT_EQ(state.result, ResultCode::kValid);
    EXPECT_EQ(state.resolved_version, "v3.2.1");

    auto blobs = m_store.list("framework");
    ASSERT_TRUE(blobs);
    ASSERT_EQ(blobs->size(), 1U);
    EXPECT_EQ(blobs->front().metadata.version, "v3.2.1");
    EXPECT_EQ(blobs->front().provenance.source_path, arcas::common::normalize_path(path.generic_string()));
}

TEST_F(TransactionTest, ImportWithRegisteredDeclaredVersionAndSameContentIsNoOp)
{
    auto payload = civic_virtue_v1();
    payload["framework_meta"] = {
        {"version", "v2.0.0"}
    };
    const auto path = write_json("civic.json", payload);
    {
        TransactionCoordinator setup(m_store, m_authority);
        ASSERT_EQ(setup.validate_for_use("civic_virtue", path).resolved_version, "v2.0.0");
    }
    ASSERT_EQ(m_gateway.size(), 1U);

    TransactionCoordinator coordinator(m_store, m_authority);
    const auto state = coordinator.validate_for_use("civic_virtue", path, "v9.9.9");
    EXPECT_EQ(state.result, ResultCode::kValid);
    EXPECT_FALSE(state.new_version_created);
    EXPECT_EQ(state.resolved_version, "v2.0.0");
    EXPECT_EQ(m_gateway.size(), 1U);

    auto report = coordinator.rollback();
    ASSERT_TRUE(report);
    EXPECT_TRUE(report->entries.empty());
    EXPECT_EQ(m_gateway.size(), 1U);
}

TEST_F(TransactionTest, ImportWithRegisteredDeclaredVersionAndNewContentAllocates)
{
    auto payload = civic_virtue_v1();
    payload["framework_meta"] = {
        {"version", "v2.0.0"}
    };
    {
        TransactionCoordinator setup(m_store, m_authority);
        ASSERT_EQ(setup.validate_for_use("civic_virtue", write_json("civic.json", payload)).result,
                  ResultCode::kValid);
    }

    payload["dipoles"][0]["positive"]["weight"] = 0.5;
    TransactionCoordinator coordinator(m_store, m_authority);
    const auto state = coordinator.validate_for_use("civic_virtue", write_json("civic_edit.json", payload), "v9.9.9");
    EXPECT_EQ(state.result, ResultCode::kValid);
    EXPECT_TRUE(state.new_version_created);
    EXPECT_EQ(state.resolved_version, "v2.0.1");
    EXPECT_EQ(m_gateway.size(), 2U);

    auto original = m_authority.get("civic_virtue", "v2.0.0");
    ASSERT_TRUE(original && original->has_value());
    EXPECT_NE((*original)->content_hash, state.content_hash);
}

TEST_F(TransactionTest, MissingArtifactIsNotFound)
{
    TransactionCoordinator coordinator(m_store, m_authority);
    const auto state = coordinator.validate_for_use("ghost_framework");
    EXPECT_EQ(state.result, ResultCode::kNotFound);
    EXPECT_FALSE(state.new_version_created);
    EXPECT_FALSE(state.errors.empty());

    const auto verdict = coordinator.is_transaction_valid();
    EXPECT_FALSE(verdict.valid);
    ASSERT_FALSE(verdict.errors.empty());
    EXPECT_NE(verdict.errors.front().find("ghost_framework"), std::string::npos);

    const auto guidance = coordinator.generate_guidance();
    ASSERT_EQ(guidance.failed_artifacts.size(), 1U);
    EXPECT_EQ(guidance.failed_artifacts.front().artifact_name, "ghost_framework");
    EXPECT_FALSE(guidance.commands_to_run.empty());
}

TEST_F(TransactionTest, NonexistentFileFallsBackToAuthority)
{
    const auto path = write_json("civic.json", civic_virtue_v1());
    TransactionCoordinator first(m_store, m_authority);
    ASSERT_EQ(first.validate_for_use("civic_virtue", path).result, ResultCode::kValid);

    TransactionCoordinator second(m_store, m_authority);
    const auto known = second.validate_for_use("civic_virtue", m_temp_dir.path() / "nope.json");
    EXPECT_EQ(known.result, ResultCode::kValid);
    const auto unknown = second.validate_for_use("other_framework", m_temp_dir.path() / "nope.json");
    EXPECT_EQ(unknown.result, ResultCode::kNotFound);
}

TEST_F(TransactionTest, UnknownHintReportsVersionMismatch)
{
    const auto path = write_json("civic.json", civic_virtue_v1());
    TransactionCoordinator first(m_store, m_authority);
    ASSERT_EQ(first.validate_for_use("civic_virtue", path, "v1.0.0").result, ResultCode::kValid);

    TransactionCoordinator second(m_store, m_authority);
    const auto state = second.validate_for_use("civic_virtue", std::nullopt, "v2.0.0");
    EXPECT_EQ(state.result, ResultCode::kVersionMismatch);
    EXPECT_EQ(state.requested_version, "v2.0.0");
    EXPECT_EQ(state.resolved_version, "v1.0.0");
    EXPECT_FALSE(second.is_transaction_valid().valid);
}

TEST_F(TransactionTest, HintSpellingIsNormalised)
{
    const auto path = write_json("civic.json", civic_virtue_v1());
    TransactionCoordinator first(m_store, m_authority);
    ASSERT_EQ(first.validate_for_use("civic_virtue", path, "v1.0.0").result, ResultCode::kValid);

    TransactionCoordinator second(m_store, m_authority);
    const auto state = second.validate_for_use("civic_virtue", std::nullopt, "1.0.0");
    EXPECT_EQ(state.result, ResultCode::kValid);
    EXPECT_EQ(state.resolved_version, "v1.0.0");
}

TEST_F(TransactionTest, MalformedFileIsValidationError)
{
    const auto path = m_temp_dir.path() / "broken.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    TransactionCoordinator coordinator(m_store, m_authority);
    const auto state = coordinator.validate_for_use("civic_virtue", path);
    EXPECT_EQ(state.result, ResultCode::kValidationError);
    EXPECT_FALSE(state.errors.empty());
    EXPECT_FALSE(coordinator.is_transaction_valid().valid);
}

TEST_F(TransactionTest, CorruptBlobBlocksRegistration)
{
    const auto payload = civic_virtue_v1();
    auto stored = m_store.store(payload, arcas::cas::StoreRequest{.asset_id = "civic_virtue", .version = "v1.0.0"});
    ASSERT_TRUE(stored);
    {
        std::ofstream out(stored->storage_path / arcas::cas::kPayloadFile, std::ios::trunc);
        out << R"({"tampered":true})";
    }

    const auto path = write_json("civic.json", payload);
    TransactionCoordinator coordinator(m_store, m_authority);
    const auto state = coordinator.validate_for_use("civic_virtue", path);
    EXPECT_EQ(state.result, ResultCode::kTransactionFailure);
    EXPECT_FALSE(state.new_version_created);
    EXPECT_EQ(m_gateway.size(), 0U);
}

TEST_F(TransactionTest, AuthorityOutageIsTransactionFailure)
{
    BrokenGateway broken;
    VersionAuthority authority(broken);
    TransactionCoordinator coordinator(m_store, authority);
    const auto state = coordinator.validate_for_use("civic_virtue", write_json("civic.json", civic_virtue_v1()));
    EXPECT_EQ(state.result, ResultCode::kTransactionFailure);
    ASSERT_FALSE(state.errors.empty());
    EXPECT_NE(state.errors.front().find("disk I/O error"), std::string::npos);
}

TEST_F(TransactionTest, EveryValidationIsLogged)
{
    arcas::test::LogCapture capture;
    TransactionCoordinator coordinator(m_store, m_authority);
    (void)coordinator.validate_for_use("civic_virtue", write_json("civic.json", civic_virtue_v1()));
    (void)coordinator.validate_for_use("ghost_framework");

    EXPECT_EQ(capture.count_containing("\"event\":\"artifact_validated\""), 2U);
    EXPECT_EQ(capture.count_containing("\"result\":\"not_found\""), 1U);
    for (const auto& line : capture.lines()) {
        if (line.find("ghost_framework") != std::string::npos
            && line.find("artifact_validated") != std::string::npos) {
            EXPECT_TRUE(line.starts_with("error "));
        }
    }
    EXPECT_EQ(coordinator.transaction().states.size(), 2U);
}

TEST(TransactionId, FormatIsStable)
{
    using namespace std::chrono;
    const auto now = sys_days{year{2025} / June / 19} + hours{14} + minutes{3} + seconds{7} + milliseconds{250};
    const std::string id = arcas::transaction::generate_transaction_id(now);
    EXPECT_TRUE(std::regex_match(id, std::regex("ftx_20250619_140307_[0-9a-f]{6}"))) << id;
}

TEST(TransactionId, CoordinatorUsesSuppliedId)
{
    TempDir temp_dir("arcas_transaction_id");
    ContentAddressableStore store(temp_dir.path());
    InMemoryAuthorityGateway gateway;
    VersionAuthority authority(gateway);
    TransactionCoordinator coordinator(store, authority, CoordinatorOptions{.transaction_id = "ftx_fixed"});
    EXPECT_EQ(coordinator.transaction_id(), "ftx_fixed");
    EXPECT_EQ(coordinator.validate_for_use("ghost").transaction_id, "ftx_fixed");
}

TEST(DeclaredVersion, TopLevelThenMeta)
{
    using arcas::transaction::declared_version;
    EXPECT_EQ(declared_version(nlohmann::json{{"version", "v2"}}), "v2");
    EXPECT_EQ(declared_version(nlohmann::json{{"framework_meta", {{"version", "v3"}}}}), "v3");
    EXPECT_FALSE(declared_version(nlohmann::json{{"version", 2}}));
    EXPECT_FALSE(declared_version(nlohmann::json::array()));
}

TEST(ResultCodeNames, RoundTrip)
{
    using arcas::transaction::result_code_from_string;
    EXPECT_EQ(result_code_from_string("content_changed"), ResultCode::kContentChanged);
    EXPECT_EQ(result_code_from_string("transaction_failure"), ResultCode::kTransactionFailure);
    EXPECT_FALSE(result_code_from_string("VALID"));
    EXPECT_TRUE(arcas::transaction::is_usable(ResultCode::kContentChanged));
    EXPECT_FALSE(arcas::transaction::is_usable(ResultCode::kVersionMismatch));
}
