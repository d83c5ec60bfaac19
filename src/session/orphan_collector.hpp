#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace seoflow::session {

struct OrphanSweepResult {
    std::size_t snapshots_removed = 0;
    std::size_t dirs_removed = 0;
    std::vector<std::string> failures;
};

// Removes snapshot files (".workflow_state_*.json") and staging directories
// (".temp_*") older than a cutoff. Per-item failures are logged and counted in
// the result, never returned as errors.
class OrphanCollector {
public:
    explicit OrphanCollector(std::filesystem::path output_root);

    OrphanSweepResult sweep(std::chrono::hours older_than) const;

    static bool is_snapshot_name(const std::string& name);
    static bool is_staging_name(const std::string& name);

private:
    std::filesystem::path output_root_;
};

}  // namespace seoflow::session
