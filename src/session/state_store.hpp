#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/pipeline_errors.hpp"
#include "protocol/content_contract.hpp"
#include "protocol/workflow_state.hpp"

namespace seoflow::session {

struct ResearchPhaseData {
    protocol::ResearchResult research;
    std::string completed_at;
    std::size_t sources_found = 0;
};

struct WritingPhaseData {
    protocol::ArticleResult article;
    std::string completed_at;
    std::uint32_t word_count = 0;
};

struct SavingPhaseData {
    std::filesystem::path output_path;
    std::string completed_at;
};

// Per-run payload carried in every snapshot. Phase data is present once the
// phase has completed.
struct WorkflowData {
    std::string keyword;
    std::string start_time;
    bool resumed = false;
    bool persistence_degraded = false;
    std::optional<std::string> error;
    std::vector<std::string> warnings;
    std::optional<ResearchPhaseData> research;
    std::optional<WritingPhaseData> writing;
    std::optional<SavingPhaseData> saving;
    // Unrecognised keys from a loaded snapshot, written back untouched.
    nlohmann::json extras = nlohmann::json::object();
};

struct WorkflowSnapshot {
    protocol::WorkflowState state = protocol::WorkflowState::Initialized;
    std::string timestamp;
    WorkflowData data;
    std::optional<std::filesystem::path> staging_dir;
};

class StateStore {
public:
    // ".workflow_state_<session_id>.json" under output_root
    static std::filesystem::path snapshot_path(const std::filesystem::path& output_root,
                                               const std::string& session_id);

    // Writes via a sibling temp file and rename, so readers never see a torn
    // snapshot. Failures are returned, never thrown.
    core::errors::Result<std::filesystem::path> save(
        const std::filesystem::path& path, const WorkflowSnapshot& snapshot) const;

    core::errors::Result<WorkflowSnapshot> load(const std::filesystem::path& path) const;

    // true if a file was removed, false if there was nothing to remove
    core::errors::Result<bool> remove(const std::filesystem::path& path) const;

    static nlohmann::json to_json(const WorkflowSnapshot& snapshot);
    static core::errors::Result<WorkflowSnapshot> from_json(const nlohmann::json& doc);
};

}  // namespace seoflow::session
