#include "session/output_committer.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/session_id.hpp"
#include "core/logging/logger.hpp"
#include "protocol/content_json.hpp"
#include "session/html_renderer.hpp"

namespace seoflow::session {

using core::errors::ErrorCategory;
using core::errors::PipelineError;

namespace {

constexpr int kMaxFinalDirSuffix = 100;

core::errors::Result<std::filesystem::path> write_text_file(
    const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc | std::ios::binary);
    if (!out.is_open()) {
        return PipelineError{ErrorCategory::Commit,
                             "Unable to open artifact file: " + path.string(),
                             "artifact_write_failed"};
    }
    out << content;
    out.flush();
    if (!out.good()) {
        return PipelineError{ErrorCategory::Commit,
                             "Unable to write artifact file: " + path.string(),
                             "artifact_write_failed"};
    }
    return path;
}

}  // namespace

AtomicOutputCommitter::AtomicOutputCommitter(std::filesystem::path output_root)
    : output_root_(std::move(output_root)) {}

std::filesystem::path AtomicOutputCommitter::staging_path(
    const std::string& session_id) const {
    return output_root_ / (".temp_" + session_id);
}

core::errors::Result<std::filesystem::path> AtomicOutputCommitter::stage(
    const std::string& session_id) const {
    if (session_id.empty()) {
        return PipelineError{ErrorCategory::Internal, "Session ID cannot be empty.",
                             "invalid_session_id"};
    }

    const auto dir = staging_path(session_id);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return PipelineError{ErrorCategory::Commit,
                             "Unable to create staging directory " + dir.string() + ": " +
                                 ec.message(),
                             "staging_create_failed"};
    }
    LOG_DEBUG("AtomicOutputCommitter: staging at " + dir.string());
    return dir;
}

core::errors::Result<ArtifactSet> AtomicOutputCommitter::write_artifacts(
    const std::filesystem::path& target_dir, const std::string& keyword,
    const protocol::ArticleResult& article,
    const protocol::ResearchResult& research) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(target_dir, ec) || ec) {
        return PipelineError{ErrorCategory::Commit,
                             "Artifact directory does not exist: " + target_dir.string(),
                             "artifact_write_failed"};
    }

    ArtifactSet artifacts;

    auto article_written = write_text_file(
        target_dir / "article.html",
        inject_default_styling(render_article_html(article)));
    if (core::errors::is_error(article_written)) {
        return core::errors::get_error(article_written);
    }
    artifacts.article_path = core::errors::get_value(article_written);

    auto research_written = write_text_file(
        target_dir / "research.json", protocol::research_to_json(research).dump(
                                       2, ' ', false, nlohmann::json::error_handler_t::replace));
    if (core::errors::is_error(research_written)) {
        return core::errors::get_error(research_written);
    }
    artifacts.research_path = core::errors::get_value(research_written);

    auto index_written = write_text_file(
        target_dir / "index.html",
        render_review_page(keyword, article, research, core::config::iso_timestamp()));
    if (core::errors::is_error(index_written)) {
        return core::errors::get_error(index_written);
    }
    artifacts.index_path = core::errors::get_value(index_written);

    return artifacts;
}

std::filesystem::path AtomicOutputCommitter::final_dir_for(
    const std::string& keyword) const {
    const std::string base = core::config::sanitize_keyword(keyword) + "_" +
                             core::config::compact_timestamp();
    auto candidate = output_root_ / base;
    std::error_code ec;
    for (int suffix = 2; std::filesystem::exists(candidate, ec) && suffix <= kMaxFinalDirSuffix;
         ++suffix) {
        candidate = output_root_ / (base + "_" + std::to_string(suffix));
    }
    return candidate;
}

core::errors::Result<std::filesystem::path> AtomicOutputCommitter::commit(
    const std::filesystem::path& staging_dir,
    const std::filesystem::path& final_dir) const {
    std::error_code ec;
    if (std::filesystem::exists(final_dir, ec)) {
        return PipelineError{ErrorCategory::Commit,
                             "Final output directory already exists: " + final_dir.string(),
                             "final_dir_exists"};
    }

    std::filesystem::rename(staging_dir, final_dir, ec);
    if (ec == std::errc::directory_not_empty || ec == std::errc::file_exists) {
        // Another run published under the same name after the check above.
        return PipelineError{ErrorCategory::Commit,
                             "Final output directory already exists: " + final_dir.string(),
                             "final_dir_exists"};
    }
    if (ec) {
        return PipelineError{ErrorCategory::Commit,
                             "Failed to move " + staging_dir.string() + " to " +
                                 final_dir.string() + ": " + ec.message(),
                             "commit_failed"};
    }
    LOG_INFO("AtomicOutputCommitter: committed " + final_dir.string());
    return final_dir;
}

}  // namespace seoflow::session
