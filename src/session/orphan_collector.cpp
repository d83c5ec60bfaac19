#include "session/orphan_collector.hpp"

#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace seoflow::session {

namespace {

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

OrphanCollector::OrphanCollector(std::filesystem::path output_root)
    : output_root_(std::move(output_root)) {}

bool OrphanCollector::is_snapshot_name(const std::string& name) {
    return starts_with(name, ".workflow_state_") &&
           (ends_with(name, ".json") || ends_with(name, ".json.tmp"));
}

bool OrphanCollector::is_staging_name(const std::string& name) {
    return starts_with(name, ".temp_");
}

OrphanSweepResult OrphanCollector::sweep(const std::chrono::hours older_than) const {
    OrphanSweepResult result;

    std::error_code ec;
    if (!std::filesystem::is_directory(output_root_, ec) || ec) {
        LOG_DEBUG("OrphanCollector: nothing to sweep at " + output_root_.string());
        return result;
    }

    const auto cutoff = std::filesystem::file_time_type::clock::now() - older_than;

    std::filesystem::directory_iterator it(output_root_, ec);
    if (ec) {
        result.failures.push_back("Unable to list " + output_root_.string() + ": " +
                                  ec.message());
        LOG_WARN("OrphanCollector: " + result.failures.back());
        return result;
    }

    struct Candidate {
        std::filesystem::path path;
        bool snapshot = false;
    };
    std::vector<Candidate> candidates;
    for (const auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            result.failures.push_back("Directory iteration failed: " + ec.message());
            LOG_WARN("OrphanCollector: " + result.failures.back());
            break;
        }
        const std::string name = it->path().filename().string();
        if (is_snapshot_name(name)) {
            candidates.push_back(Candidate{it->path(), true});
            continue;
        }
        std::error_code type_ec;
        if (is_staging_name(name) && it->is_directory(type_ec) && !type_ec) {
            candidates.push_back(Candidate{it->path(), false});
        }
    }

    for (const auto& candidate : candidates) {
        const auto& path = candidate.path;
        const bool snapshot = candidate.snapshot;
        std::error_code item_ec;
        const auto mtime = std::filesystem::last_write_time(path, item_ec);
        if (item_ec) {
            result.failures.push_back("Unable to stat " + path.string() + ": " +
                                      item_ec.message());
            LOG_WARN("OrphanCollector: " + result.failures.back());
            continue;
        }
        if (mtime >= cutoff) {
            continue;
        }

        if (snapshot) {
            std::filesystem::remove(path, item_ec);
            if (item_ec) {
                result.failures.push_back("Failed to delete snapshot " + path.string() + ": " +
                                          item_ec.message());
                LOG_WARN("OrphanCollector: " + result.failures.back());
                continue;
            }
            ++result.snapshots_removed;
            LOG_INFO("OrphanCollector: removed snapshot " + path.string());
        } else {
            std::filesystem::remove_all(path, item_ec);
            if (item_ec) {
                result.failures.push_back("Failed to delete staging directory " +
                                          path.string() + ": " + item_ec.message());
                LOG_WARN("OrphanCollector: " + result.failures.back());
                continue;
            }
            ++result.dirs_removed;
            LOG_INFO("OrphanCollector: removed staging directory " + path.string());
        }
    }

    LOG_INFO("OrphanCollector: swept " + output_root_.string() + " (" +
             std::to_string(result.snapshots_removed) + " snapshots, " +
             std::to_string(result.dirs_removed) + " directories, " +
             std::to_string(result.failures.size()) + " failures)");
    return result;
}

}  // namespace seoflow::session
