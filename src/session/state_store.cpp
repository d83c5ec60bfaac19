#include "session/state_store.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include "core/config/session_id.hpp"
#include "core/logging/logger.hpp"
#include "protocol/content_json.hpp"

namespace seoflow::session {

using core::errors::ErrorCategory;
using core::errors::PipelineError;
using nlohmann::json;

namespace {

// Keys owned by WorkflowData; everything else in "data" lands in extras.
const char* const kKnownDataKeys[] = {
    "keyword",          "start_time",           "resumed",
    "persistence_degraded", "error",            "warnings",
    "research",         "research_completed_at", "sources_found",
    "article",          "writing_completed_at", "word_count",
    "output_path",      "saving_completed_at"};

bool is_known_data_key(const std::string& key) {
    for (const char* known : kKnownDataKeys) {
        if (key == known) {
            return true;
        }
    }
    return false;
}

json data_to_json(const WorkflowData& data) {
    json payload = data.extras.is_object() ? data.extras : json::object();
    payload["keyword"] = data.keyword;
    payload["start_time"] = data.start_time;
    payload["resumed"] = data.resumed;
    if (data.persistence_degraded) {
        payload["persistence_degraded"] = true;
    }
    if (data.error.has_value()) {
        payload["error"] = data.error.value();
    }
    if (!data.warnings.empty()) {
        payload["warnings"] = data.warnings;
    }
    if (data.research.has_value()) {
        payload["research"] = protocol::research_to_json(data.research->research);
        payload["research_completed_at"] = data.research->completed_at;
        payload["sources_found"] = data.research->sources_found;
    }
    if (data.writing.has_value()) {
        payload["article"] = protocol::article_to_json(data.writing->article);
        payload["writing_completed_at"] = data.writing->completed_at;
        payload["word_count"] = data.writing->word_count;
    }
    if (data.saving.has_value()) {
        payload["output_path"] = data.saving->output_path.string();
        payload["saving_completed_at"] = data.saving->completed_at;
    }
    return payload;
}

core::errors::Result<WorkflowData> data_from_json(const json& payload) {
    if (!payload.is_object()) {
        return PipelineError{ErrorCategory::Validation,
                             "Snapshot 'data' must be an object.",
                             "snapshot_malformed"};
    }

    WorkflowData data;
    try {
        data.keyword = payload.value("keyword", std::string{});
        data.start_time = payload.value("start_time", std::string{});
        data.resumed = payload.value("resumed", false);
        data.persistence_degraded = payload.value("persistence_degraded", false);
        if (payload.contains("error") && payload["error"].is_string()) {
            data.error = payload["error"].get<std::string>();
        }
        data.warnings = payload.value("warnings", std::vector<std::string>{});
        if (payload.contains("output_path") && payload["output_path"].is_string()) {
            data.saving = SavingPhaseData{payload["output_path"].get<std::string>(),
                                          payload.value("saving_completed_at", std::string{})};
        }
    } catch (const json::exception& e) {
        return PipelineError{ErrorCategory::Validation,
                             std::string("Snapshot 'data' has a wrongly typed field: ") + e.what(),
                             "snapshot_malformed"};
    }

    if (payload.contains("research") && !payload["research"].is_null()) {
        auto research = protocol::research_from_json(payload["research"]);
        if (core::errors::is_error(research)) {
            LOG_WARN("StateStore: ignoring embedded research: " +
                     core::errors::get_error(research).message);
        } else {
            ResearchPhaseData phase;
            phase.research = core::errors::get_value(research);
            phase.completed_at = payload.value("research_completed_at", std::string{});
            phase.sources_found = phase.research.academic_sources.size();
            data.research = std::move(phase);
        }
    }

    if (payload.contains("article") && !payload["article"].is_null()) {
        auto article = protocol::article_from_json(payload["article"]);
        if (core::errors::is_error(article)) {
            LOG_WARN("StateStore: ignoring embedded article: " +
                     core::errors::get_error(article).message);
        } else {
            WritingPhaseData phase;
            phase.article = core::errors::get_value(article);
            phase.completed_at = payload.value("writing_completed_at", std::string{});
            phase.word_count = phase.article.word_count;
            data.writing = std::move(phase);
        }
    }

    for (auto it = payload.begin(); it != payload.end(); ++it) {
        if (!is_known_data_key(it.key())) {
            data.extras[it.key()] = it.value();
        }
    }
    return data;
}

}  // namespace

std::filesystem::path StateStore::snapshot_path(const std::filesystem::path& output_root,
                                                const std::string& session_id) {
    return output_root / (".workflow_state_" + session_id + ".json");
}

json StateStore::to_json(const WorkflowSnapshot& snapshot) {
    json doc;
    doc["state"] = protocol::to_string(snapshot.state);
    doc["timestamp"] = snapshot.timestamp;
    doc["data"] = data_to_json(snapshot.data);
    doc["temp_dir"] = snapshot.staging_dir.has_value()
                          ? json(snapshot.staging_dir->string())
                          : json(nullptr);
    return doc;
}

core::errors::Result<WorkflowSnapshot> StateStore::from_json(const json& doc) {
    if (!doc.is_object()) {
        return PipelineError{ErrorCategory::Validation,
                             "Snapshot is not a JSON object.", "snapshot_malformed"};
    }
    if (!doc.contains("state") || !doc["state"].is_string()) {
        return PipelineError{ErrorCategory::Validation,
                             "Snapshot has no 'state' string.", "snapshot_malformed"};
    }

    const std::string state_text = doc["state"].get<std::string>();
    const auto state = protocol::parse_workflow_state(state_text);
    if (!state.has_value()) {
        return PipelineError{ErrorCategory::Validation,
                             "Unrecognized workflow state: " + state_text,
                             "unknown_state"};
    }

    WorkflowSnapshot snapshot;
    snapshot.state = state.value();
    if (doc.contains("timestamp") && doc["timestamp"].is_string()) {
        snapshot.timestamp = doc["timestamp"].get<std::string>();
    }
    if (doc.contains("temp_dir") && doc["temp_dir"].is_string()) {
        snapshot.staging_dir = std::filesystem::path(doc["temp_dir"].get<std::string>());
    }

    auto data = data_from_json(doc.contains("data") ? doc["data"] : json::object());
    if (core::errors::is_error(data)) {
        return core::errors::get_error(data);
    }
    snapshot.data = core::errors::get_value(data);
    return snapshot;
}

core::errors::Result<std::filesystem::path> StateStore::save(
    const std::filesystem::path& path, const WorkflowSnapshot& snapshot) const {
    WorkflowSnapshot stamped = snapshot;
    if (stamped.timestamp.empty()) {
        stamped.timestamp = core::config::iso_timestamp();
    }

    std::filesystem::path tmp_path = path;
    tmp_path += ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            return PipelineError{ErrorCategory::Persistence,
                                 "Unable to open snapshot file: " + tmp_path.string(),
                                 "snapshot_write_failed"};
        }
        // Invalid UTF-8 from a keyword or a payload is replaced, never thrown.
        out << to_json(stamped).dump(2, ' ', false, json::error_handler_t::replace);
        out.flush();
        if (!out.good()) {
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
            return PipelineError{ErrorCategory::Persistence,
                                 "Unable to write snapshot file: " + tmp_path.string(),
                                 "snapshot_write_failed"};
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return PipelineError{ErrorCategory::Persistence,
                             "Unable to replace snapshot file " + path.string() + ": " +
                                 ec.message(),
                             "snapshot_write_failed"};
    }
    return path;
}

core::errors::Result<WorkflowSnapshot> StateStore::load(
    const std::filesystem::path& path) const {
    std::ifstream in(path);
    if (!in.is_open()) {
        return PipelineError{ErrorCategory::Persistence,
                             "Unable to read snapshot file: " + path.string(),
                             "snapshot_unreadable"};
    }

    const json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        return PipelineError{ErrorCategory::Validation,
                             "Snapshot file is not valid JSON: " + path.string(),
                             "snapshot_malformed"};
    }
    return from_json(doc);
}

core::errors::Result<bool> StateStore::remove(const std::filesystem::path& path) const {
    std::error_code ec;
    const bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        return PipelineError{ErrorCategory::Persistence,
                             "Unable to delete snapshot file " + path.string() + ": " +
                                 ec.message(),
                             "snapshot_delete_failed"};
    }
    return removed;
}

}  // namespace seoflow::session
