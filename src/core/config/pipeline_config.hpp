#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/pipeline_errors.hpp"

namespace seoflow::core::config {

struct PipelineConfig {
    std::filesystem::path output_dir = "drafts";
    std::uint32_t max_retries = 3;
    std::uint32_t initial_backoff_ms = 1000;
    double backoff_multiplier = 2.0;
    std::uint32_t max_backoff_ms = 60000;
    std::size_t max_keyword_length = 200;
    std::size_t min_recommended_sources = 3;
    double min_source_credibility = 0.0;
    std::uint32_t orphan_max_age_hours = 24;
    std::string log_level = "INFO";
};

// Reads a JSON settings file. Keys that are absent keep their defaults.
errors::Result<PipelineConfig> load_pipeline_config(
    const std::filesystem::path& config_path);

}  // namespace seoflow::core::config
