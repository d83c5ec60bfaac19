#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/config/pipeline_config.hpp"
#include "core/errors/pipeline_errors.hpp"
#include "protocol/collaborators.hpp"
#include "protocol/content_contract.hpp"
#include "protocol/workflow_state.hpp"
#include "runtime/retry_policy.hpp"
#include "session/output_committer.hpp"
#include "session/progress_reporter.hpp"
#include "session/state_store.hpp"

namespace seoflow::runtime {

// Outcome of a best-effort cleanup. Failures are collected, never raised.
struct CleanupReport {
    bool staging_removed = false;
    bool snapshot_removed = false;
    std::vector<std::string> errors;
};

// Drives one keyword through research -> writing -> saving. Progress is
// persisted as a snapshot after every transition so an interrupted run can be
// resumed. One instance owns one session: its snapshot file and its staging
// directory. Instances share no mutable state and may run on separate threads.
class WorkflowOrchestrator {
public:
    WorkflowOrchestrator(core::config::PipelineConfig config,
                         std::shared_ptr<protocol::ResearchOperation> research_op,
                         std::shared_ptr<protocol::WritingOperation> writing_op,
                         std::shared_ptr<session::AtomicOutputCommitter> committer = nullptr);

    WorkflowOrchestrator(const WorkflowOrchestrator&) = delete;
    WorkflowOrchestrator& operator=(const WorkflowOrchestrator&) = delete;

    // Returns the committed index.html path. On a phase failure the run is
    // moved to FAILED, rolled back, and the phase's error is returned as is.
    core::errors::Result<std::filesystem::path> run_full_workflow(const std::string& keyword);

    core::errors::Result<protocol::ResearchResult> run_research(const std::string& keyword);

    core::errors::Result<protocol::ArticleResult> run_writing(
        const std::string& keyword, const protocol::ResearchResult& research);

    // Writes straight into the final directory; no staging, no state change.
    core::errors::Result<std::filesystem::path> save_outputs(
        const std::string& keyword, const protocol::ResearchResult& research,
        const protocol::ArticleResult& article);

    // Stages, writes, and publishes with one rename. Moves the run to COMPLETE
    // and deletes the snapshot.
    core::errors::Result<std::filesystem::path> save_outputs_atomic(
        const std::string& keyword, const protocol::ResearchResult& research,
        const protocol::ArticleResult& article);

    core::errors::Result<std::filesystem::path> resume_workflow(
        const std::filesystem::path& state_file);

    // The state a resumed run restarts from, given what the snapshot carries.
    static core::errors::Result<protocol::WorkflowState> resume_entry_state(
        const session::WorkflowSnapshot& snapshot);

    // (snapshots_removed, dirs_removed). Never fails.
    static std::pair<std::size_t, std::size_t> cleanup_orphaned_files(
        const std::filesystem::path& output_root, std::chrono::hours older_than);

    // Deletes this run's staging directory and snapshot and moves to
    // ROLLED_BACK. With preserve_staging the staging directory is kept and
    // released from this instance.
    CleanupReport rollback(bool preserve_staging = false);

    // Deletes leftovers of a run that did not reach COMPLETE. No state change.
    CleanupReport release_incomplete();

    void set_progress_callback(session::ProgressCallback callback);
    void set_cancel_token(CancelToken cancel_token);
    void set_publish_sink(std::shared_ptr<protocol::PublishSink> sink);
    void set_sleeper(Sleeper sleeper);

    protocol::WorkflowState current_state() const { return state_; }
    const session::WorkflowData& workflow_data() const { return data_; }
    const std::string& session_id() const { return session_id_; }
    const std::optional<std::filesystem::path>& state_file() const { return state_file_; }
    const std::optional<std::filesystem::path>& staging_dir() const { return staging_dir_; }
    const RetryPolicy& retry_policy() const { return retry_policy_; }

private:
    core::errors::Result<std::string> validate_keyword(const std::string& keyword) const;
    void begin_session(const std::string& keyword);
    core::errors::Result<protocol::WorkflowState> transition(protocol::WorkflowState next);
    void persist();
    void report_progress(const std::string& phase, const std::string& message) const;
    core::errors::Result<std::filesystem::path> drive(const std::string& keyword);
    core::errors::Result<std::filesystem::path> fail(const core::errors::PipelineError& error);
    void publish(const std::filesystem::path& output_dir, const std::string& keyword);
    std::string tag() const;

    core::config::PipelineConfig config_;
    std::shared_ptr<protocol::ResearchOperation> research_op_;
    std::shared_ptr<protocol::WritingOperation> writing_op_;
    std::shared_ptr<session::AtomicOutputCommitter> committer_;
    std::shared_ptr<protocol::PublishSink> publish_sink_;
    session::StateStore store_;
    session::ProgressReporter progress_;
    RetryPolicy retry_policy_;
    Sleeper sleeper_ = sliced_sleep;
    CancelToken cancel_token_;

    protocol::WorkflowState state_ = protocol::WorkflowState::Initialized;
    session::WorkflowData data_;
    std::string session_id_;
    std::optional<std::filesystem::path> state_file_;
    std::optional<std::filesystem::path> staging_dir_;
};

}  // namespace seoflow::runtime
