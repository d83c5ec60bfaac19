#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/pipeline_config.hpp"
#include "core/errors/pipeline_errors.hpp"
#include "core/logging/logger.hpp"
#include "runtime/workflow_orchestrator.hpp"
#include "session/orphan_collector.hpp"
#include "session/state_store.hpp"

namespace {

int run_cleanup(const seoflow::app::cli::CliCommand& cmd,
                const seoflow::core::config::PipelineConfig& config) {
    const std::filesystem::path root = cmd.output_dir.value_or(config.output_dir);
    const std::uint32_t hours = cmd.older_than_hours.value_or(config.orphan_max_age_hours);

    LOG_INFO("Sweeping " + root.string() + " for leftovers older than " +
             std::to_string(hours) + "h");
    const seoflow::session::OrphanCollector collector(root);
    const auto result = collector.sweep(std::chrono::hours(hours));

    std::cout << "snapshots_removed=" << result.snapshots_removed
              << " dirs_removed=" << result.dirs_removed
              << " failures=" << result.failures.size() << std::endl;
    return 0;
}

int run_inspect(const seoflow::app::cli::CliCommand& cmd) {
    seoflow::session::StateStore store;
    auto loaded = store.load(cmd.state_file);
    if (seoflow::core::errors::is_error(loaded)) {
        const auto& err = seoflow::core::errors::get_error(loaded);
        LOG_ERROR("Cannot inspect snapshot [" + err.code + "]: " + err.message);
        return 4;
    }

    const auto& snapshot = seoflow::core::errors::get_value(loaded);
    std::cout << "state: " << seoflow::protocol::to_string(snapshot.state) << "\n"
              << "keyword: " << snapshot.data.keyword << "\n"
              << "timestamp: " << snapshot.timestamp << "\n"
              << "staging_dir: "
              << (snapshot.staging_dir.has_value() ? snapshot.staging_dir->string() : "none")
              << "\n"
              << "research: " << (snapshot.data.research.has_value() ? "embedded" : "absent")
              << "\n"
              << "article: " << (snapshot.data.writing.has_value() ? "embedded" : "absent")
              << "\n";

    auto entry = seoflow::runtime::WorkflowOrchestrator::resume_entry_state(snapshot);
    if (seoflow::core::errors::is_error(entry)) {
        std::cout << "resume: not possible ("
                  << seoflow::core::errors::get_error(entry).message << ")" << std::endl;
    } else {
        std::cout << "resume: re-enters at "
                  << seoflow::protocol::to_string(seoflow::core::errors::get_value(entry))
                  << std::endl;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    LOG_INFO("seoflow: Bootstrapping...");
    auto parsed = seoflow::app::cli::parse_and_validate(argc, argv);
    if (seoflow::core::errors::is_error(parsed)) {
        const auto& err = seoflow::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& cmd = seoflow::core::errors::get_value(parsed);

    seoflow::core::config::PipelineConfig config;
    if (cmd.config_file.has_value()) {
        auto loaded = seoflow::core::config::load_pipeline_config(cmd.config_file.value());
        if (seoflow::core::errors::is_error(loaded)) {
            const auto& err = seoflow::core::errors::get_error(loaded);
            LOG_ERROR("Config error [" + err.code + "]: " + err.message);
            return 3;
        }
        config = seoflow::core::errors::get_value(loaded);
    }

    seoflow::core::logging::LogLevel level = seoflow::core::logging::LogLevel::INFO;
    if (cmd.verbose) {
        level = seoflow::core::logging::LogLevel::DEBUG;
    } else if (!seoflow::core::logging::Logger::parse_level(config.log_level, level)) {
        LOG_WARN("Unknown log level '" + config.log_level + "', using INFO");
    }
    seoflow::core::logging::Logger::get().set_min_level(level);

    switch (cmd.kind) {
        case seoflow::app::cli::CommandKind::Cleanup:
            return run_cleanup(cmd, config);
        case seoflow::app::cli::CommandKind::Inspect:
            return run_inspect(cmd);
    }
    return 4;
}
