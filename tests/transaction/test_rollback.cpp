/**
 * @file test_rollback.cpp
 * @brief Rollback of records created by a transaction
 */

#include "arcas/transaction.hpp"

#include "support/log_capture.hpp"
#include "support/temp_dir.hpp"

#include <fstream>

#include <gtest/gtest.h>

using arcas::authority::InMemoryAuthorityGateway;
using arcas::authority::VersionAuthority;
using arcas::cas::ContentAddressableStore;
using arcas::test::TempDir;
using arcas::transaction::ResultCode;
using arcas::transaction::TransactionCoordinator;

namespace {

/// Refuses to delete one artifact.
class StickyGateway : public InMemoryAuthorityGateway
{
public:
    explicit StickyGateway(std::string sticky)
        : m_sticky(std::move(sticky))
    {}

    arcas::Result<bool> remove(std::string_view artifact_name, std::string_view version) override
    {
        if (artifact_name == m_sticky) {
            return std::unexpected(arcas::make_error(arcas::errc::kDatabaseError, "database is locked"));
        }
        return InMemoryAuthorityGateway::remove(artifact_name, version);
    }

private:
    std::string m_sticky;
};

std::filesystem::path write_payload(const std::filesystem::path& dir,
                                    const std::string& name,
                                    const nlohmann::json& payload)
{
    const auto path = dir / (name + ".json");
    std::ofstream out(path);
    out << payload.dump();
    return path;
}

nlohmann::json framework(const std::string& name)
{
    return nlohmann::json{
        {   "name",                                        name},
        {"dipoles", nlohmann::json::array({{{"name", "Care"}}})}
    };
}

}  // namespace

TEST(Rollback, RemovesCreatedRecordsAndKeepsBlobs)
{
    TempDir temp_dir("arcas_rollback");
    ContentAddressableStore store(temp_dir.path() / "store");
    InMemoryAuthorityGateway gateway;
    VersionAuthority authority(gateway);

    TransactionCoordinator coordinator(store, authority);
    ASSERT_EQ(coordinator.validate_for_use("mft", write_payload(temp_dir.path(), "mft", framework("mft"))).result,
              ResultCode::kValid);
    ASSERT_EQ(coordinator.validate_for_use("lgbt", write_payload(temp_dir.path(), "lgbt", framework("lgbt"))).result,
              ResultCode::kValid);
    (void)coordinator.validate_for_use("ghost_framework");
    ASSERT_FALSE(coordinator.is_transaction_valid().valid);
    ASSERT_EQ(gateway.size(), 2U);

    auto report = coordinator.rollback();
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_TRUE(report->ok());
    EXPECT_EQ(report->transaction_id, coordinator.transaction_id());
    ASSERT_EQ(report->entries.size(), 2U);
    EXPECT_EQ(report->entries[0].artifact, "mft");
    EXPECT_EQ(report->entries[1].artifact, "lgbt");
    EXPECT_EQ(gateway.size(), 0U);

    auto blobs = store.list("framework");
    ASSERT_TRUE(blobs);
    EXPECT_EQ(blobs->size(), 2U);
}

TEST(Rollback, LeavesPreexistingVersionsAlone)
{
    TempDir temp_dir("arcas_rollback_preexisting");
    ContentAddressableStore store(temp_dir.path() / "store");
    InMemoryAuthorityGateway gateway;
    VersionAuthority authority(gateway);
    const auto path = write_payload(temp_dir.path(), "mft", framework("mft"));
    {
        TransactionCoordinator setup(store, authority);
        ASSERT_EQ(setup.validate_for_use("mft", path).result, ResultCode::kValid);
    }

    auto changed = framework("mft");
    changed["dipoles"].push_back(nlohmann::json{{"name", "Fairness"}});
    TransactionCoordinator coordinator(store, authority);
    const auto state =
        coordinator.validate_for_use("mft", write_payload(temp_dir.path(), "mft_changed", changed));
    ASSERT_EQ(state.result, ResultCode::kContentChanged);
    ASSERT_EQ(gateway.size(), 2U);

    auto report = coordinator.rollback();
    ASSERT_TRUE(report);
    ASSERT_EQ(report->entries.size(), 1U);
    EXPECT_EQ(report->entries.front().version, *state.resolved_version);
    EXPECT_EQ(gateway.size(), 1U);
    auto original = authority.get("mft", "v1.0.0");
    ASSERT_TRUE(original);
    EXPECT_TRUE(original->has_value());
}

TEST(Rollback, SecondCallIsRejected)
{
    TempDir temp_dir("arcas_rollback_twice");
    ContentAddressableStore store(temp_dir.path() / "store");
    InMemoryAuthorityGateway gateway;
    VersionAuthority authority(gateway);
    TransactionCoordinator coordinator(store, authority);
    (void)coordinator.validate_for_use("mft", write_payload(temp_dir.path(), "mft", framework("mft")));

    ASSERT_TRUE(coordinator.rollback());
    auto again = coordinator.rollback();
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, arcas::errc::kRollbackAlreadyPerformed);
}

TEST(Rollback, PartialFailureIsReportedAndLogged)
{
    arcas::test::LogCapture capture;
    TempDir temp_dir("arcas_rollback_partial");
    ContentAddressableStore store(temp_dir.path() / "store");
    StickyGateway gateway("lgbt");
    VersionAuthority authority(gateway);

    TransactionCoordinator coordinator(store, authority);
    (void)coordinator.validate_for_use("mft", write_payload(temp_dir.path(), "mft", framework("mft")));
    (void)coordinator.validate_for_use("lgbt", write_payload(temp_dir.path(), "lgbt", framework("lgbt")));

    auto report = coordinator.rollback();
    ASSERT_TRUE(report);
    EXPECT_FALSE(report->ok());
    ASSERT_EQ(report->entries.size(), 2U);
    EXPECT_TRUE(report->entries[0].removed);
    EXPECT_FALSE(report->entries[1].removed);
    EXPECT_NE(report->entries[1].detail.find("database is locked"), std::string::npos);
    EXPECT_EQ(gateway.size(), 1U);

    EXPECT_EQ(capture.count_containing("\"event\":\"rollback\""), 1U);
    EXPECT_EQ(capture.count_containing("\"event\":\"rollback_incomplete\""), 1U);
    EXPECT_EQ(capture.count_containing("needs manual removal"), 1U);
}

TEST(Rollback, NothingCreatedMeansEmptyReport)
{
    TempDir temp_dir("arcas_rollback_empty");
    ContentAddressableStore store(temp_dir.path() / "store");
    InMemoryAuthorityGateway gateway;
    VersionAuthority authority(gateway);
    TransactionCoordinator coordinator(store, authority);
    (void)coordinator.validate_for_use("ghost_framework");

    auto report = coordinator.rollback();
    ASSERT_TRUE(report);
    EXPECT_TRUE(report->entries.empty());
    EXPECT_TRUE(report->ok());
}

TEST(Rollback, CoordinatorRefusesWorkAfterRollback)
{
    arcas::test::LogCapture capture;
    TempDir temp_dir("arcas_rollback_then_validate");
    ContentAddressableStore store(temp_dir.path() / "store");
    InMemoryAuthorityGateway gateway;
    VersionAuthority authority(gateway);
    TransactionCoordinator coordinator(store, authority);
    ASSERT_TRUE(coordinator.rollback());

    const auto state = coordinator.validate_for_use("mft", write_payload(temp_dir.path(), "mft", framework("mft")));
    EXPECT_EQ(state.result, ResultCode::kTransactionFailure);
    EXPECT_FALSE(state.new_version_created);
    EXPECT_FALSE(state.resolved_version);
    ASSERT_EQ(state.errors.size(), 1U);
    EXPECT_NE(state.errors.front().find("rolled back"), std::string::npos);
    EXPECT_EQ(gateway.size(), 0U);
    auto blobs = store.list("framework");
    ASSERT_TRUE(blobs);
    EXPECT_TRUE(blobs->empty());

    EXPECT_FALSE(coordinator.is_transaction_valid().valid);
    EXPECT_EQ(capture.count_containing("\"event\":\"artifact_validated\""), 1U);
    EXPECT_FALSE(coordinator.rollback());
}
