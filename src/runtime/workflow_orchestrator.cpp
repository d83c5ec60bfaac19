#include "runtime/workflow_orchestrator.hpp"

#include <cctype>
#include <system_error>
#include "core/config/session_id.hpp"
#include "core/logging/logger.hpp"
#include "session/orphan_collector.hpp"

namespace seoflow::runtime {

using core::errors::ErrorCategory;
using core::errors::PipelineError;
using protocol::ArticleResult;
using protocol::ResearchResult;
using protocol::WorkflowState;

namespace {

constexpr int kMaxCommitAttempts = 5;

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    return text.substr(begin, end - begin);
}

// ".workflow_state_<id>.json" -> "<id>"
std::optional<std::string> session_id_from_snapshot_name(const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    const std::string prefix = ".workflow_state_";
    const std::string suffix = ".json";
    if (name.size() <= prefix.size() + suffix.size() ||
        name.compare(0, prefix.size(), prefix) != 0 ||
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return std::nullopt;
    }
    return name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
}

RetryPolicy policy_from_config(const core::config::PipelineConfig& config) {
    RetryPolicy policy;
    policy.max_attempts = config.max_retries;
    policy.initial_delay = std::chrono::milliseconds(config.initial_backoff_ms);
    policy.multiplier = config.backoff_multiplier;
    policy.max_delay = std::chrono::milliseconds(config.max_backoff_ms);
    return policy;
}

}  // namespace

WorkflowOrchestrator::WorkflowOrchestrator(
    core::config::PipelineConfig config,
    std::shared_ptr<protocol::ResearchOperation> research_op,
    std::shared_ptr<protocol::WritingOperation> writing_op,
    std::shared_ptr<session::AtomicOutputCommitter> committer)
    : config_(std::move(config)),
      research_op_(std::move(research_op)),
      writing_op_(std::move(writing_op)),
      committer_(std::move(committer)),
      retry_policy_(policy_from_config(config_)) {
    if (!committer_) {
        committer_ = std::make_shared<session::AtomicOutputCommitter>(config_.output_dir);
    }
}

void WorkflowOrchestrator::set_progress_callback(session::ProgressCallback callback) {
    progress_.set_callback(std::move(callback));
}

void WorkflowOrchestrator::set_cancel_token(CancelToken cancel_token) {
    cancel_token_ = std::move(cancel_token);
}

void WorkflowOrchestrator::set_publish_sink(std::shared_ptr<protocol::PublishSink> sink) {
    publish_sink_ = std::move(sink);
}

void WorkflowOrchestrator::set_sleeper(Sleeper sleeper) {
    sleeper_ = std::move(sleeper);
}

std::string WorkflowOrchestrator::tag() const {
    return "WorkflowOrchestrator[" + (session_id_.empty() ? std::string("-") : session_id_) +
           "]: ";
}

void WorkflowOrchestrator::report_progress(const std::string& phase,
                                           const std::string& message) const {
    progress_.report(phase, message);
}

core::errors::Result<std::string> WorkflowOrchestrator::validate_keyword(
    const std::string& keyword) const {
    const std::string trimmed = trim(keyword);
    if (trimmed.empty()) {
        return PipelineError{ErrorCategory::Validation, "Keyword cannot be empty",
                             "empty_keyword"};
    }
    if (core::config::utf8_length(trimmed) > config_.max_keyword_length) {
        return PipelineError{ErrorCategory::Validation, "Keyword too long",
                             "keyword_too_long",
                             "Maximum length is " +
                                 std::to_string(config_.max_keyword_length) + " characters."};
    }
    return trimmed;
}

void WorkflowOrchestrator::begin_session(const std::string& keyword) {
    session_id_ = core::config::generate_session_id(keyword);
    state_file_ = session::StateStore::snapshot_path(committer_->output_root(), session_id_);
    data_.keyword = keyword;
    data_.start_time = core::config::iso_timestamp();

    std::error_code ec;
    std::filesystem::create_directories(committer_->output_root(), ec);
    if (ec) {
        LOG_WARN(tag() + "unable to create output root " +
                 committer_->output_root().string() + ": " + ec.message());
    }
    LOG_INFO(tag() + "session started for keyword '" + keyword + "'");
    persist();
}

void WorkflowOrchestrator::persist() {
    if (!state_file_.has_value()) {
        return;
    }

    if (protocol::is_terminal(state_)) {
        auto removed = store_.remove(state_file_.value());
        if (core::errors::is_error(removed)) {
            LOG_WARN(tag() + core::errors::get_error(removed).message);
        }
        return;
    }

    session::WorkflowSnapshot snapshot;
    snapshot.state = state_;
    snapshot.timestamp = core::config::iso_timestamp();
    snapshot.data = data_;
    snapshot.staging_dir = staging_dir_;

    auto saved = store_.save(state_file_.value(), snapshot);
    if (core::errors::is_error(saved)) {
        data_.persistence_degraded = true;
        LOG_WARN(tag() + "snapshot not persisted, run is no longer resumable: " +
                 core::errors::get_error(saved).message);
    }
}

core::errors::Result<WorkflowState> WorkflowOrchestrator::transition(const WorkflowState next) {
    if (!protocol::is_valid_transition(state_, next)) {
        return PipelineError{ErrorCategory::Internal,
                             "Illegal workflow transition " + protocol::to_string(state_) +
                                 " -> " + protocol::to_string(next),
                             "invalid_state_transition"};
    }

    const std::string prev = protocol::to_string(state_);
    state_ = next;
    LOG_INFO(tag() + "transition " + prev + " -> " + protocol::to_string(next));
    persist();
    return state_;
}

core::errors::Result<ResearchResult> WorkflowOrchestrator::run_research(
    const std::string& keyword) {
    std::string effective = keyword;
    if (session_id_.empty()) {
        auto validated = validate_keyword(keyword);
        if (core::errors::is_error(validated)) {
            return core::errors::get_error(validated);
        }
        effective = core::errors::get_value(validated);
        begin_session(effective);
    }

    if (is_cancelled(cancel_token_)) {
        return cancelled_error("research");
    }
    auto started = transition(WorkflowState::Researching);
    if (core::errors::is_error(started)) {
        return core::errors::get_error(started);
    }
    report_progress("research", "Researching '" + effective + "'...");

    if (!research_op_) {
        return PipelineError{ErrorCategory::Internal, "No research operation configured.",
                             "missing_collaborator"};
    }

    auto researched = retry_policy_.run<ResearchResult>(
        "Research phase",
        [this, &effective](std::uint32_t attempt) {
            LOG_DEBUG(tag() + "research attempt " + std::to_string(attempt));
            return research_op_->research(effective);
        },
        cancel_token_, sleeper_);
    if (core::errors::is_error(researched)) {
        LOG_ERROR(tag() + "research phase failed: " +
                  core::errors::get_error(researched).message);
        return core::errors::get_error(researched);
    }

    const ResearchResult& research = core::errors::get_value(researched);
    const std::size_t usable = research.usable_source_count(config_.min_source_credibility);
    if (usable == 0) {
        return PipelineError{ErrorCategory::Validation,
                             "No academic sources found in research results",
                             "no_sources"};
    }
    if (usable < config_.min_recommended_sources) {
        const std::string warning =
            "Only found " + std::to_string(usable) +
            " sources, which is below the recommended minimum of " +
            std::to_string(config_.min_recommended_sources);
        LOG_WARN(tag() + warning);
        data_.warnings.push_back(warning);
    }

    LOG_INFO(tag() + "research completed: " + std::to_string(research.academic_sources.size()) +
             " sources, " + std::to_string(research.main_findings.size()) + " findings, " +
             std::to_string(research.key_statistics.size()) + " statistics");

    data_.research = session::ResearchPhaseData{research, core::config::iso_timestamp(),
                                                research.academic_sources.size()};
    auto completed = transition(WorkflowState::ResearchComplete);
    if (core::errors::is_error(completed)) {
        return core::errors::get_error(completed);
    }
    report_progress("research_complete",
                    "Found " + std::to_string(research.academic_sources.size()) + " sources");
    return research;
}

core::errors::Result<ArticleResult> WorkflowOrchestrator::run_writing(
    const std::string& keyword, const ResearchResult& research) {
    if (is_cancelled(cancel_token_)) {
        return cancelled_error("writing");
    }
    auto started = transition(WorkflowState::Writing);
    if (core::errors::is_error(started)) {
        return core::errors::get_error(started);
    }
    report_progress("writing", "Writing article for '" + keyword + "'...");
    LOG_DEBUG(tag() + "writing with " + std::to_string(research.academic_sources.size()) +
              " sources");

    if (!writing_op_) {
        return PipelineError{ErrorCategory::Internal, "No writing operation configured.",
                             "missing_collaborator"};
    }

    auto written = writing_op_->write(keyword, research);
    if (core::errors::is_error(written)) {
        LOG_ERROR(tag() + "writing phase failed: " + core::errors::get_error(written).message);
        return core::errors::get_error(written);
    }

    const ArticleResult& article = core::errors::get_value(written);
    if (article.sources_used.empty()) {
        return PipelineError{ErrorCategory::Validation, "Article cites no sources",
                             "no_citations"};
    }

    LOG_INFO(tag() + "article generated: '" + article.title + "', " +
             std::to_string(article.word_count) + " words, " +
             std::to_string(article.main_sections.size()) + " sections, " +
             std::to_string(article.sources_used.size()) + " sources cited");

    data_.writing = session::WritingPhaseData{article, core::config::iso_timestamp(),
                                              article.word_count};
    auto completed = transition(WorkflowState::WritingComplete);
    if (core::errors::is_error(completed)) {
        return core::errors::get_error(completed);
    }
    report_progress("writing_complete",
                    "Article ready (" + std::to_string(article.word_count) + " words)");
    return article;
}

core::errors::Result<std::filesystem::path> WorkflowOrchestrator::save_outputs(
    const std::string& keyword, const ResearchResult& research, const ArticleResult& article) {
    const auto output_dir = committer_->final_dir_for(keyword);
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        return PipelineError{ErrorCategory::Commit,
                             "Unable to create output directory " + output_dir.string() + ": " +
                                 ec.message(),
                             "artifact_write_failed"};
    }

    auto written = committer_->write_artifacts(output_dir, keyword, article, research);
    if (core::errors::is_error(written)) {
        LOG_ERROR(tag() + "failed to save outputs: " + core::errors::get_error(written).message);
        return core::errors::get_error(written);
    }
    LOG_DEBUG(tag() + "saved outputs to " + output_dir.string());
    return core::errors::get_value(written).index_path;
}

core::errors::Result<std::filesystem::path> WorkflowOrchestrator::save_outputs_atomic(
    const std::string& keyword, const ResearchResult& research, const ArticleResult& article) {
    if (is_cancelled(cancel_token_)) {
        return cancelled_error("saving");
    }
    auto started = transition(WorkflowState::Saving);
    if (core::errors::is_error(started)) {
        return core::errors::get_error(started);
    }
    report_progress("saving", "Saving outputs...");

    // A staging directory left by an interrupted attempt is discarded.
    if (staging_dir_.has_value()) {
        std::error_code ec;
        std::filesystem::remove_all(staging_dir_.value(), ec);
        if (ec) {
            LOG_WARN(tag() + "unable to clear stale staging directory " +
                     staging_dir_->string() + ": " + ec.message());
        }
    }

    auto staged = committer_->stage(session_id_);
    if (core::errors::is_error(staged)) {
        return core::errors::get_error(staged);
    }
    staging_dir_ = core::errors::get_value(staged);
    persist();

    auto written = committer_->write_artifacts(staging_dir_.value(), keyword, article, research);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }

    auto committed = committer_->commit(staging_dir_.value(), committer_->final_dir_for(keyword));
    for (int attempt = 1; attempt < kMaxCommitAttempts && core::errors::is_error(committed) &&
                          core::errors::get_error(committed).code == "final_dir_exists";
         ++attempt) {
        LOG_WARN(tag() + core::errors::get_error(committed).message + ", picking another name");
        committed = committer_->commit(staging_dir_.value(), committer_->final_dir_for(keyword));
    }
    if (core::errors::is_error(committed)) {
        LOG_ERROR(tag() + core::errors::get_error(committed).message);
        return core::errors::get_error(committed);
    }
    staging_dir_.reset();

    const auto index_path = core::errors::get_value(committed) / "index.html";
    data_.saving = session::SavingPhaseData{index_path, core::config::iso_timestamp()};
    auto completed = transition(WorkflowState::Complete);
    if (core::errors::is_error(completed)) {
        return core::errors::get_error(completed);
    }
    report_progress("complete", "Output saved to " + index_path.string());

    publish(core::errors::get_value(committed), keyword);
    return index_path;
}

void WorkflowOrchestrator::publish(const std::filesystem::path& output_dir,
                                   const std::string& keyword) {
    if (!publish_sink_) {
        return;
    }
    auto published = publish_sink_->publish(output_dir, keyword);
    if (core::errors::is_error(published)) {
        const std::string warning =
            "Publishing failed: " + core::errors::get_error(published).message;
        LOG_WARN(tag() + warning);
        data_.warnings.push_back(warning);
        return;
    }
    LOG_INFO(tag() + "published as " + core::errors::get_value(published));
}

core::errors::Result<std::filesystem::path> WorkflowOrchestrator::fail(
    const PipelineError& error) {
    if (error.category == ErrorCategory::Cancelled) {
        LOG_WARN(tag() + "cancelled in state " + protocol::to_string(state_));
        return error;
    }

    data_.error = error.code + ": " + error.message;
    // Only a failed publishing move leaves fully written staging content behind.
    const bool preserve_staging =
        error.category == ErrorCategory::Commit && staging_dir_.has_value() &&
        (error.code == "commit_failed" || error.code == "final_dir_exists");
    if (preserve_staging) {
        data_.warnings.push_back("Staging directory kept for inspection: " +
                                 staging_dir_->string());
    }

    auto failed = transition(WorkflowState::Failed);
    if (core::errors::is_error(failed)) {
        LOG_ERROR(tag() + core::errors::get_error(failed).message);
    }
    LOG_ERROR(tag() + "workflow failed [" + error.code + "]: " + error.message);
    report_progress("failed", error.message);

    const CleanupReport report = rollback(preserve_staging);
    for (const auto& cleanup_error : report.errors) {
        LOG_WARN(tag() + "rollback: " + cleanup_error);
    }
    return error;
}

CleanupReport WorkflowOrchestrator::rollback(const bool preserve_staging) {
    CleanupReport report;
    LOG_INFO(tag() + "rolling back");

    if (staging_dir_.has_value()) {
        if (preserve_staging) {
            LOG_WARN(tag() + "leaving staging directory " + staging_dir_->string() +
                     " for inspection");
            staging_dir_.reset();
        } else {
            std::error_code ec;
            std::filesystem::remove_all(staging_dir_.value(), ec);
            if (ec) {
                report.errors.push_back("Unable to delete staging directory " +
                                        staging_dir_->string() + ": " + ec.message());
            } else {
                report.staging_removed = true;
                staging_dir_.reset();
            }
        }
    }

    if (state_file_.has_value()) {
        auto removed = store_.remove(state_file_.value());
        if (core::errors::is_error(removed)) {
            report.errors.push_back(core::errors::get_error(removed).message);
        } else {
            report.snapshot_removed = core::errors::get_value(removed);
        }
    }

    if (!protocol::is_terminal(state_)) {
        auto rolled_back = transition(WorkflowState::RolledBack);
        if (core::errors::is_error(rolled_back)) {
            report.errors.push_back(core::errors::get_error(rolled_back).message);
        }
    }
    return report;
}

CleanupReport WorkflowOrchestrator::release_incomplete() {
    CleanupReport report;
    if (state_ == WorkflowState::Complete) {
        return report;
    }

    if (staging_dir_.has_value()) {
        std::error_code ec;
        std::filesystem::remove_all(staging_dir_.value(), ec);
        if (ec) {
            report.errors.push_back("Unable to delete staging directory " +
                                    staging_dir_->string() + ": " + ec.message());
        } else {
            report.staging_removed = true;
            staging_dir_.reset();
        }
    }

    if (state_file_.has_value()) {
        auto removed = store_.remove(state_file_.value());
        if (core::errors::is_error(removed)) {
            report.errors.push_back(core::errors::get_error(removed).message);
        } else {
            report.snapshot_removed = core::errors::get_value(removed);
        }
    }

    for (const auto& cleanup_error : report.errors) {
        LOG_WARN(tag() + "cleanup: " + cleanup_error);
    }
    return report;
}

core::errors::Result<std::filesystem::path> WorkflowOrchestrator::drive(
    const std::string& keyword) {
    if (state_ == WorkflowState::Initialized) {
        auto researched = run_research(keyword);
        if (core::errors::is_error(researched)) {
            return fail(core::errors::get_error(researched));
        }
    }

    if (state_ == WorkflowState::ResearchComplete) {
        if (!data_.research.has_value()) {
            return fail(PipelineError{ErrorCategory::Internal,
                                      "Research data missing after research phase.",
                                      "missing_phase_data"});
        }
        auto written = run_writing(keyword, data_.research->research);
        if (core::errors::is_error(written)) {
            return fail(core::errors::get_error(written));
        }
    }

    if (state_ == WorkflowState::WritingComplete) {
        if (!data_.research.has_value() || !data_.writing.has_value()) {
            return fail(PipelineError{ErrorCategory::Internal,
                                      "Phase data missing before saving.",
                                      "missing_phase_data"});
        }
        auto saved = save_outputs_atomic(keyword, data_.research->research,
                                         data_.writing->article);
        if (core::errors::is_error(saved)) {
            return fail(core::errors::get_error(saved));
        }
        LOG_INFO(tag() + "workflow completed: " + core::errors::get_value(saved).string());
        return core::errors::get_value(saved);
    }

    return fail(PipelineError{ErrorCategory::Internal,
                              "Workflow stopped in unexpected state " +
                                  protocol::to_string(state_),
                              "invalid_state_transition"});
}

core::errors::Result<std::filesystem::path> WorkflowOrchestrator::run_full_workflow(
    const std::string& keyword) {
    auto validated = validate_keyword(keyword);
    if (core::errors::is_error(validated)) {
        LOG_ERROR("WorkflowOrchestrator: rejected keyword: " +
                  core::errors::get_error(validated).message);
        return core::errors::get_error(validated);
    }
    if (!session_id_.empty() || state_ != WorkflowState::Initialized) {
        return PipelineError{ErrorCategory::Internal,
                             "Orchestrator already ran a workflow; create a new instance.",
                             "orchestrator_in_use"};
    }

    const std::string& effective = core::errors::get_value(validated);
    begin_session(effective);
    LOG_INFO(tag() + "starting full workflow");
    return drive(effective);
}

core::errors::Result<WorkflowState> WorkflowOrchestrator::resume_entry_state(
    const session::WorkflowSnapshot& snapshot) {
    const bool has_research = snapshot.data.research.has_value();
    const bool has_article = has_research && snapshot.data.writing.has_value();

    switch (snapshot.state) {
        case WorkflowState::Initialized:
        case WorkflowState::Researching:
            return WorkflowState::Initialized;
        case WorkflowState::ResearchComplete:
            return has_research ? WorkflowState::ResearchComplete : WorkflowState::Initialized;
        case WorkflowState::Writing:
        case WorkflowState::WritingComplete:
        case WorkflowState::Saving:
        case WorkflowState::Failed:
            if (has_article) {
                return WorkflowState::WritingComplete;
            }
            return has_research ? WorkflowState::ResearchComplete : WorkflowState::Initialized;
        case WorkflowState::Complete:
        case WorkflowState::RolledBack:
        default:
            return PipelineError{ErrorCategory::Validation,
                                 "Workflow already finished in state " +
                                     protocol::to_string(snapshot.state),
                                 "not_resumable"};
    }
}

core::errors::Result<std::filesystem::path> WorkflowOrchestrator::resume_workflow(
    const std::filesystem::path& state_file) {
    if (!session_id_.empty() || state_ != WorkflowState::Initialized) {
        return PipelineError{ErrorCategory::Internal,
                             "Orchestrator already ran a workflow; create a new instance.",
                             "orchestrator_in_use"};
    }

    auto loaded = store_.load(state_file);
    if (core::errors::is_error(loaded)) {
        const auto& err = core::errors::get_error(loaded);
        if (err.category == ErrorCategory::Persistence) {
            return PipelineError{ErrorCategory::Persistence,
                                 "Failed to load workflow state from " + state_file.string() +
                                     ": " + err.message,
                                 "resume_load_failed"};
        }
        return err;
    }
    const session::WorkflowSnapshot& snapshot = core::errors::get_value(loaded);

    const std::string keyword = trim(snapshot.data.keyword);
    if (keyword.empty()) {
        return PipelineError{ErrorCategory::Validation, "Snapshot has no keyword",
                             "missing_keyword"};
    }

    auto entry = resume_entry_state(snapshot);
    if (core::errors::is_error(entry)) {
        return core::errors::get_error(entry);
    }

    const auto adopted_id = session_id_from_snapshot_name(state_file);
    session_id_ = adopted_id.has_value() ? adopted_id.value()
                                         : core::config::generate_session_id(keyword);
    state_file_ = state_file;
    // Only this session's own staging directory is ever adopted for deletion.
    const auto own_staging = committer_->staging_path(session_id_);
    if (snapshot.staging_dir.has_value()) {
        if (snapshot.staging_dir->lexically_normal() == own_staging.lexically_normal()) {
            staging_dir_ = own_staging;
        } else {
            LOG_WARN(tag() + "ignoring staging directory " + snapshot.staging_dir->string() +
                     " recorded in snapshot; expected " + own_staging.string());
        }
    }
    data_ = snapshot.data;
    data_.keyword = keyword;
    data_.resumed = true;
    data_.error.reset();
    state_ = core::errors::get_value(entry);

    LOG_INFO(tag() + "resuming from " + protocol::to_string(snapshot.state) +
             ", re-entering at " + protocol::to_string(state_));
    report_progress("resume", "Resuming workflow from " + protocol::to_string(snapshot.state));
    persist();
    return drive(keyword);
}

std::pair<std::size_t, std::size_t> WorkflowOrchestrator::cleanup_orphaned_files(
    const std::filesystem::path& output_root, const std::chrono::hours older_than) {
    const session::OrphanCollector collector(output_root);
    const auto result = collector.sweep(older_than);
    return {result.snapshots_removed, result.dirs_removed};
}

}  // namespace seoflow::runtime
