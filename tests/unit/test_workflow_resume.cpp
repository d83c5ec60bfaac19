#include <algorithm>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "fakes/fake_operations.hpp"
#include "fakes/temp_workspace.hpp"
#include "runtime/workflow_orchestrator.hpp"
#include "session/state_store.hpp"

namespace {

using seoflow::core::config::PipelineConfig;
using seoflow::core::errors::ErrorCategory;
using seoflow::core::errors::get_error;
using seoflow::core::errors::get_value;
using seoflow::core::errors::is_error;
using seoflow::protocol::WorkflowState;
using seoflow::runtime::WorkflowOrchestrator;
using seoflow::session::ResearchPhaseData;
using seoflow::session::StateStore;
using seoflow::session::WorkflowSnapshot;
using seoflow::session::WritingPhaseData;
using seoflow::testing::FailingCommitter;
using seoflow::testing::FakeResearchOperation;
using seoflow::testing::FakeWritingOperation;
using seoflow::testing::make_article;
using seoflow::testing::make_research;
using seoflow::testing::TempWorkspace;
using seoflow::testing::write_file;

constexpr const char* kSessionId = "heart_health_20240101_090000_0badc0de";

class ResumeFixture {
public:
    ResumeFixture()
        : ws_("workflow_resume"),
          research_(std::make_shared<FakeResearchOperation>(
              std::vector<FakeResearchOperation::Outcome>{make_research("heart health", 3)})),
          writing_(std::make_shared<FakeWritingOperation>(make_article("heart health"))) {
        config_.output_dir = ws_.root() / "drafts";
        config_.initial_backoff_ms = 1;
        config_.max_backoff_ms = 10;
        std::filesystem::create_directories(config_.output_dir);
    }

    std::filesystem::path write_snapshot(WorkflowState state, bool with_research,
                                         bool with_article) const {
        WorkflowSnapshot snapshot;
        snapshot.state = state;
        snapshot.timestamp = "2024-01-01T09:05:00";
        snapshot.data.keyword = "heart health";
        snapshot.data.start_time = "2024-01-01T09:00:00";
        if (with_research) {
            snapshot.data.research =
                ResearchPhaseData{make_research("heart health", 3), "2024-01-01T09:02:00", 3};
        }
        if (with_article) {
            snapshot.data.writing =
                WritingPhaseData{make_article("heart health"), "2024-01-01T09:04:00", 1500};
        }
        return save(snapshot);
    }

    std::filesystem::path save(const WorkflowSnapshot& snapshot) const {
        const auto path = StateStore::snapshot_path(config_.output_dir, kSessionId);
        auto saved = StateStore().save(path, snapshot);
        EXPECT_FALSE(is_error(saved));
        return path;
    }

    std::unique_ptr<WorkflowOrchestrator> orchestrator() const {
        return std::make_unique<WorkflowOrchestrator>(config_, research_, writing_);
    }

    std::vector<std::string> entries() const {
        std::vector<std::string> names;
        for (const auto& entry : std::filesystem::directory_iterator(config_.output_dir)) {
            names.push_back(entry.path().filename().string());
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    const PipelineConfig& config() const { return config_; }
    FakeResearchOperation& research() { return *research_; }
    FakeWritingOperation& writing() { return *writing_; }

private:
    TempWorkspace ws_;
    PipelineConfig config_;
    std::shared_ptr<FakeResearchOperation> research_;
    std::shared_ptr<FakeWritingOperation> writing_;
};

TEST(WorkflowResumeTest, ResearchCompleteSkipsResearch) {
    ResumeFixture fixture;
    const auto state_file = fixture.write_snapshot(WorkflowState::ResearchComplete, true, false);
    auto orchestrator = fixture.orchestrator();

    std::vector<std::string> phases;
    orchestrator->set_progress_callback(
        [&phases](const std::string& phase, const std::string&) { phases.push_back(phase); });

    auto result = orchestrator->resume_workflow(state_file);
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    EXPECT_EQ(fixture.research().calls(), 0u);
    EXPECT_EQ(fixture.writing().calls(), 1u);
    EXPECT_EQ(fixture.writing().last_source_count(), 3u);
    EXPECT_EQ(orchestrator->current_state(), WorkflowState::Complete);
    EXPECT_EQ(orchestrator->session_id(), kSessionId);
    EXPECT_TRUE(orchestrator->workflow_data().resumed);
    EXPECT_FALSE(std::filesystem::exists(state_file));
    EXPECT_EQ(phases, (std::vector<std::string>{"resume", "writing", "writing_complete",
                                                "saving", "complete"}));
}

TEST(WorkflowResumeTest, WritingCompleteGoesStraightToSaving) {
    ResumeFixture fixture;
    const auto state_file = fixture.write_snapshot(WorkflowState::WritingComplete, true, true);
    auto orchestrator = fixture.orchestrator();

    auto result = orchestrator->resume_workflow(state_file);
    ASSERT_FALSE(is_error(result)) << get_error(result).message;
    EXPECT_EQ(fixture.research().calls(), 0u);
    EXPECT_EQ(fixture.writing().calls(), 0u);
    EXPECT_TRUE(std::filesystem::exists(get_value(result)));
}

TEST(WorkflowResumeTest, FailedRunReentersAtLatestCompletedPhase) {
    ResumeFixture fixture;
    const auto state_file = fixture.write_snapshot(WorkflowState::Failed, true, false);
    auto orchestrator = fixture.orchestrator();

    auto result = orchestrator->resume_workflow(state_file);
    ASSERT_FALSE(is_error(result)) << get_error(result).message;
    EXPECT_EQ(fixture.research().calls(), 0u);
    EXPECT_EQ(fixture.writing().calls(), 1u);
    EXPECT_FALSE(orchestrator->workflow_data().error.has_value());
}

TEST(WorkflowResumeTest, ResearchingRedoesResearch) {
    ResumeFixture fixture;
    const auto state_file = fixture.write_snapshot(WorkflowState::Researching, false, false);
    auto orchestrator = fixture.orchestrator();

    auto result = orchestrator->resume_workflow(state_file);
    ASSERT_FALSE(is_error(result)) << get_error(result).message;
    EXPECT_EQ(fixture.research().calls(), 1u);
    EXPECT_EQ(fixture.writing().calls(), 1u);
}

TEST(WorkflowResumeTest, ResearchCompleteWithoutPayloadRedoesResearch) {
    ResumeFixture fixture;
    const auto state_file = fixture.write_snapshot(WorkflowState::ResearchComplete, false, false);
    auto orchestrator = fixture.orchestrator();

    auto result = orchestrator->resume_workflow(state_file);
    ASSERT_FALSE(is_error(result)) << get_error(result).message;
    EXPECT_EQ(fixture.research().calls(), 1u);
}

TEST(WorkflowResumeTest, SavingDiscardsStaleStaging) {
    ResumeFixture fixture;
    const auto stale = fixture.config().output_dir / (std::string(".temp_") + kSessionId);
    std::filesystem::create_directories(stale);
    write_file(stale / "article.html", "half written");

    WorkflowSnapshot snapshot;
    snapshot.state = WorkflowState::Saving;
    snapshot.data.keyword = "heart health";
    snapshot.data.research =
        ResearchPhaseData{make_research("heart health", 3), "2024-01-01T09:02:00", 3};
    snapshot.data.writing =
        WritingPhaseData{make_article("heart health"), "2024-01-01T09:04:00", 1500};
    snapshot.staging_dir = stale;
    const auto state_file = fixture.save(snapshot);

    auto orchestrator = fixture.orchestrator();
    auto result = orchestrator->resume_workflow(state_file);
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    EXPECT_FALSE(std::filesystem::exists(stale));
    const auto names = fixture.entries();
    ASSERT_EQ(names.size(), 1u);
    EXPECT_NE(seoflow::testing::read_file(get_value(result).parent_path() / "article.html"),
              "half written");
}

TEST(WorkflowResumeTest, ForeignStagingDirectoryIsNeverDeleted) {
    ResumeFixture fixture;
    const auto foreign = fixture.config().output_dir.parent_path() / "user_documents";
    std::filesystem::create_directories(foreign);
    write_file(foreign / "thesis.txt", "years of work");

    WorkflowSnapshot snapshot;
    snapshot.state = WorkflowState::Saving;
    snapshot.data.keyword = "heart health";
    snapshot.data.research =
        ResearchPhaseData{make_research("heart health", 3), "2024-01-01T09:02:00", 3};
    snapshot.data.writing =
        WritingPhaseData{make_article("heart health"), "2024-01-01T09:04:00", 1500};
    snapshot.staging_dir = foreign;
    const auto state_file = fixture.save(snapshot);

    auto orchestrator = fixture.orchestrator();
    auto result = orchestrator->resume_workflow(state_file);
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    EXPECT_EQ(orchestrator->current_state(), WorkflowState::Complete);
    ASSERT_TRUE(std::filesystem::exists(foreign / "thesis.txt"));
    EXPECT_EQ(seoflow::testing::read_file(foreign / "thesis.txt"), "years of work");
    EXPECT_EQ(fixture.entries().size(), 1u);
}

TEST(WorkflowResumeTest, FinishedRunsAreNotResumable) {
    for (const auto state : {WorkflowState::Complete, WorkflowState::RolledBack}) {
        ResumeFixture fixture;
        const auto state_file = fixture.write_snapshot(state, true, true);
        auto orchestrator = fixture.orchestrator();

        auto result = orchestrator->resume_workflow(state_file);
        ASSERT_TRUE(is_error(result));
        EXPECT_EQ(get_error(result).code, "not_resumable");
        EXPECT_EQ(fixture.research().calls(), 0u);
        EXPECT_EQ(fixture.writing().calls(), 0u);
    }
}

TEST(WorkflowResumeTest, UnknownStateIsValidationError) {
    ResumeFixture fixture;
    const auto state_file =
        fixture.config().output_dir / (std::string(".workflow_state_") + kSessionId + ".json");
    write_file(state_file, R"({"state": "bogus", "timestamp": "t",
                               "data": {"keyword": "heart health"}, "temp_dir": null})");
    auto orchestrator = fixture.orchestrator();

    auto result = orchestrator->resume_workflow(state_file);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Validation);
    EXPECT_EQ(get_error(result).code, "unknown_state");
    EXPECT_EQ(fixture.research().calls(), 0u);
    EXPECT_TRUE(std::filesystem::exists(state_file));
}

TEST(WorkflowResumeTest, MissingSnapshotIsPersistenceError) {
    ResumeFixture fixture;
    auto orchestrator = fixture.orchestrator();

    auto result = orchestrator->resume_workflow(fixture.config().output_dir / "missing.json");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Persistence);
    EXPECT_EQ(get_error(result).code, "resume_load_failed");
}

TEST(WorkflowResumeTest, SnapshotWithoutKeywordIsRejected) {
    ResumeFixture fixture;
    WorkflowSnapshot snapshot;
    snapshot.state = WorkflowState::ResearchComplete;
    const auto state_file = fixture.save(snapshot);
    auto orchestrator = fixture.orchestrator();

    auto result = orchestrator->resume_workflow(state_file);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_keyword");
}

TEST(WorkflowResumeTest, CommitFailureDuringResumeRollsBack) {
    ResumeFixture fixture;
    const auto state_file = fixture.write_snapshot(WorkflowState::WritingComplete, true, true);
    auto committer = std::make_shared<FailingCommitter>(fixture.config().output_dir);
    WorkflowOrchestrator orchestrator(fixture.config(),
                                      std::make_shared<FakeResearchOperation>(
                                          std::vector<FakeResearchOperation::Outcome>{
                                              make_research("heart health", 3)}),
                                      std::make_shared<FakeWritingOperation>(
                                          make_article("heart health")),
                                      committer);

    auto result = orchestrator.resume_workflow(state_file);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "commit_failed");
    EXPECT_EQ(orchestrator.current_state(), WorkflowState::RolledBack);
    EXPECT_FALSE(std::filesystem::exists(state_file));
    EXPECT_TRUE(std::filesystem::exists(committer->staging_path(kSessionId)));
}

TEST(WorkflowResumeTest, EntryStateTable) {
    auto entry_for = [](WorkflowState state, bool research, bool article) {
        WorkflowSnapshot snapshot;
        snapshot.state = state;
        if (research) {
            snapshot.data.research = ResearchPhaseData{make_research("k", 1), "", 1};
        }
        if (article) {
            snapshot.data.writing = WritingPhaseData{make_article("k"), "", 1500};
        }
        return WorkflowOrchestrator::resume_entry_state(snapshot);
    };

    auto expect_entry = [&entry_for](WorkflowState state, bool research, bool article,
                                     WorkflowState expected) {
        auto entry = entry_for(state, research, article);
        ASSERT_FALSE(is_error(entry)) << seoflow::protocol::to_string(state);
        EXPECT_EQ(get_value(entry), expected) << seoflow::protocol::to_string(state);
    };

    expect_entry(WorkflowState::Initialized, false, false, WorkflowState::Initialized);
    expect_entry(WorkflowState::Researching, true, false, WorkflowState::Initialized);
    expect_entry(WorkflowState::ResearchComplete, true, false, WorkflowState::ResearchComplete);
    expect_entry(WorkflowState::Writing, true, false, WorkflowState::ResearchComplete);
    expect_entry(WorkflowState::WritingComplete, true, true, WorkflowState::WritingComplete);
    expect_entry(WorkflowState::WritingComplete, true, false, WorkflowState::ResearchComplete);
    expect_entry(WorkflowState::Saving, true, true, WorkflowState::WritingComplete);
    expect_entry(WorkflowState::Failed, false, false, WorkflowState::Initialized);
    expect_entry(WorkflowState::Failed, true, true, WorkflowState::WritingComplete);

    auto finished = entry_for(WorkflowState::Complete, true, true);
    ASSERT_TRUE(is_error(finished));
    EXPECT_EQ(get_error(finished).code, "not_resumable");
}

}  // namespace
