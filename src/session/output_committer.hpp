#pragma once

#include <filesystem>
#include <string>
#include "core/errors/pipeline_errors.hpp"
#include "protocol/content_contract.hpp"

namespace seoflow::session {

struct ArtifactSet {
    std::filesystem::path article_path;
    std::filesystem::path research_path;
    std::filesystem::path index_path;
};

// Builds the artifact set in a private staging directory under the output
// root and publishes it with a single rename.
class AtomicOutputCommitter {
public:
    explicit AtomicOutputCommitter(std::filesystem::path output_root);
    virtual ~AtomicOutputCommitter() = default;

    const std::filesystem::path& output_root() const { return output_root_; }

    // ".temp_<session_id>" under the output root
    std::filesystem::path staging_path(const std::string& session_id) const;

    core::errors::Result<std::filesystem::path> stage(const std::string& session_id) const;

    // Writes article.html, research.json and index.html into target_dir.
    virtual core::errors::Result<ArtifactSet> write_artifacts(
        const std::filesystem::path& target_dir, const std::string& keyword,
        const protocol::ArticleResult& article,
        const protocol::ResearchResult& research) const;

    // "<sanitized_keyword>_<YYYYmmdd_HHMMSS>", with a numeric suffix when a
    // directory of that name already exists.
    std::filesystem::path final_dir_for(const std::string& keyword) const;

    // One rename. On failure the staging directory is left untouched.
    virtual core::errors::Result<std::filesystem::path> commit(
        const std::filesystem::path& staging_dir,
        const std::filesystem::path& final_dir) const;

private:
    std::filesystem::path output_root_;
};

}  // namespace seoflow::session
