#include "core/config/pipeline_config.hpp"

#include <fstream>
#include <optional>
#include <type_traits>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace seoflow::core::config {

using errors::ErrorCategory;
using errors::PipelineError;
using nlohmann::json;

namespace {

PipelineError invalid_field(const std::string& key, const std::string& why) {
    return PipelineError{ErrorCategory::Validation,
                         "Invalid config value for '" + key + "': " + why,
                         "invalid_config_value"};
}

}  // namespace

errors::Result<PipelineConfig> load_pipeline_config(
    const std::filesystem::path& config_path) {
    std::ifstream in(config_path);
    if (!in.is_open()) {
        return PipelineError{ErrorCategory::Persistence,
                             "Unable to open config file: " + config_path.string(),
                             "config_unreadable"};
    }

    const json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return PipelineError{ErrorCategory::Validation,
                             "Config file is not a JSON object: " +
                                 config_path.string(),
                             "config_malformed"};
    }

    PipelineConfig config;

    if (doc.contains("output_dir")) {
        if (!doc["output_dir"].is_string()) {
            return invalid_field("output_dir", "expected a string");
        }
        config.output_dir = doc["output_dir"].get<std::string>();
    }

    const auto read_count = [&doc](const char* key, auto& target,
                                   std::uint64_t lo,
                                   std::uint64_t hi) -> std::optional<PipelineError> {
        if (!doc.contains(key)) {
            return std::nullopt;
        }
        if (!doc[key].is_number_unsigned()) {
            return invalid_field(key, "expected a non-negative integer");
        }
        const auto value = doc[key].get<std::uint64_t>();
        if (value < lo || value > hi) {
            return invalid_field(key, "must be between " + std::to_string(lo) +
                                          " and " + std::to_string(hi));
        }
        target = static_cast<std::remove_reference_t<decltype(target)>>(value);
        return std::nullopt;
    };

    if (auto err = read_count("max_retries", config.max_retries, 1, 20)) return *err;
    if (auto err = read_count("initial_backoff_ms", config.initial_backoff_ms, 0, 600000)) return *err;
    if (auto err = read_count("max_backoff_ms", config.max_backoff_ms, 0, 3600000)) return *err;
    if (auto err = read_count("max_keyword_length", config.max_keyword_length, 1, 10000)) return *err;
    if (auto err = read_count("min_recommended_sources", config.min_recommended_sources, 0, 1000)) return *err;
    if (auto err = read_count("orphan_max_age_hours", config.orphan_max_age_hours, 0, 24 * 365)) return *err;

    if (doc.contains("backoff_multiplier")) {
        if (!doc["backoff_multiplier"].is_number()) {
            return invalid_field("backoff_multiplier", "expected a number");
        }
        config.backoff_multiplier = doc["backoff_multiplier"].get<double>();
        if (config.backoff_multiplier < 1.0) {
            return invalid_field("backoff_multiplier", "must be at least 1.0");
        }
    }

    if (doc.contains("min_source_credibility")) {
        if (!doc["min_source_credibility"].is_number()) {
            return invalid_field("min_source_credibility", "expected a number");
        }
        config.min_source_credibility = doc["min_source_credibility"].get<double>();
        if (config.min_source_credibility < 0.0 || config.min_source_credibility > 1.0) {
            return invalid_field("min_source_credibility", "must be between 0 and 1");
        }
    }

    if (doc.contains("log_level")) {
        if (!doc["log_level"].is_string()) {
            return invalid_field("log_level", "expected a string");
        }
        config.log_level = doc["log_level"].get<std::string>();
        logging::LogLevel parsed;
        if (!logging::Logger::parse_level(config.log_level, parsed)) {
            return invalid_field("log_level", "expected DEBUG, INFO, WARNING or ERROR");
        }
    }

    if (config.max_backoff_ms < config.initial_backoff_ms) {
        return invalid_field("max_backoff_ms", "must not be below initial_backoff_ms");
    }

    LOG_DEBUG("PipelineConfig: loaded " + config_path.string());
    return config;
}

}  // namespace seoflow::core::config
