#include <chrono>
#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "fakes/temp_workspace.hpp"
#include "runtime/workflow_orchestrator.hpp"
#include "session/orphan_collector.hpp"

namespace {

using seoflow::runtime::WorkflowOrchestrator;
using seoflow::session::OrphanCollector;
using seoflow::testing::age_path;
using seoflow::testing::TempWorkspace;
using seoflow::testing::write_file;
using namespace std::chrono_literals;

TEST(OrphanCollectorTest, RecognisesOwnedNames) {
    EXPECT_TRUE(OrphanCollector::is_snapshot_name(".workflow_state_kw_1.json"));
    EXPECT_TRUE(OrphanCollector::is_snapshot_name(".workflow_state_kw_1.json.tmp"));
    EXPECT_FALSE(OrphanCollector::is_snapshot_name("workflow_state_kw_1.json"));
    EXPECT_FALSE(OrphanCollector::is_snapshot_name(".workflow_state_kw_1.txt"));
    EXPECT_TRUE(OrphanCollector::is_staging_name(".temp_kw_1"));
    EXPECT_FALSE(OrphanCollector::is_staging_name("temp_kw_1"));
}

TEST(OrphanCollectorTest, RemovesOnlyOldArtifacts) {
    TempWorkspace ws("orphan_collector");
    const auto old_snapshot = ws.root() / ".workflow_state_old.json";
    const auto new_snapshot = ws.root() / ".workflow_state_new.json";
    const auto old_staging = ws.root() / ".temp_old";
    const auto new_staging = ws.root() / ".temp_new";
    const auto article_dir = ws.root() / "kw_20240101_000000";

    write_file(old_snapshot, "{}");
    write_file(new_snapshot, "{}");
    std::filesystem::create_directories(old_staging);
    write_file(old_staging / "article.html", "<html></html>");
    std::filesystem::create_directories(new_staging);
    std::filesystem::create_directories(article_dir);

    age_path(old_snapshot, 25h);
    age_path(old_staging, 25h);
    age_path(article_dir, 25h * 10);

    const auto result = OrphanCollector(ws.root()).sweep(24h);
    EXPECT_EQ(result.snapshots_removed, 1u);
    EXPECT_EQ(result.dirs_removed, 1u);
    EXPECT_TRUE(result.failures.empty());

    EXPECT_FALSE(std::filesystem::exists(old_snapshot));
    EXPECT_FALSE(std::filesystem::exists(old_staging));
    EXPECT_TRUE(std::filesystem::exists(new_snapshot));
    EXPECT_TRUE(std::filesystem::exists(new_staging));
    EXPECT_TRUE(std::filesystem::exists(article_dir));
}

TEST(OrphanCollectorTest, IgnoresStagingNamedFiles) {
    TempWorkspace ws("orphan_collector");
    const auto plain_file = ws.root() / ".temp_notes";
    write_file(plain_file, "keep me");
    age_path(plain_file, 48h);

    const auto result = OrphanCollector(ws.root()).sweep(24h);
    EXPECT_EQ(result.dirs_removed, 0u);
    EXPECT_TRUE(std::filesystem::exists(plain_file));
}

TEST(OrphanCollectorTest, PerItemFailureDoesNotStopSweep) {
    TempWorkspace ws("orphan_collector");
    // A non-empty directory with a snapshot name cannot be removed as a file.
    const auto stubborn = ws.root() / ".workflow_state_stubborn.json";
    std::filesystem::create_directories(stubborn);
    write_file(stubborn / "inner", "x");
    const auto removable = ws.root() / ".workflow_state_removable.json";
    write_file(removable, "{}");
    const auto staging = ws.root() / ".temp_removable";
    std::filesystem::create_directories(staging);

    age_path(stubborn, 30h);
    age_path(removable, 30h);
    age_path(staging, 30h);

    const auto result = OrphanCollector(ws.root()).sweep(24h);
    EXPECT_EQ(result.snapshots_removed, 1u);
    EXPECT_EQ(result.dirs_removed, 1u);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_NE(result.failures[0].find("stubborn"), std::string::npos);
    EXPECT_TRUE(std::filesystem::exists(stubborn));
    EXPECT_FALSE(std::filesystem::exists(removable));
}

TEST(OrphanCollectorTest, MissingRootSweepsNothing) {
    TempWorkspace ws("orphan_collector");
    const auto result = OrphanCollector(ws.root() / "does_not_exist").sweep(24h);
    EXPECT_EQ(result.snapshots_removed, 0u);
    EXPECT_EQ(result.dirs_removed, 0u);
    EXPECT_TRUE(result.failures.empty());
}

TEST(OrphanCollectorTest, OrchestratorCleanupReportsCounts) {
    TempWorkspace ws("orphan_collector");
    const auto snapshot = ws.root() / ".workflow_state_a.json";
    const auto staging = ws.root() / ".temp_a";
    write_file(snapshot, "{}");
    std::filesystem::create_directories(staging);
    age_path(snapshot, 2h);
    age_path(staging, 2h);

    const auto counts = WorkflowOrchestrator::cleanup_orphaned_files(ws.root(), 1h);
    EXPECT_EQ(counts.first, 1u);
    EXPECT_EQ(counts.second, 1u);

    const auto again = WorkflowOrchestrator::cleanup_orphaned_files(ws.root(), 1h);
    EXPECT_EQ(again.first, 0u);
    EXPECT_EQ(again.second, 0u);
}

}  // namespace
