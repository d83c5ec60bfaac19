#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include "core/errors/pipeline_errors.hpp"

namespace seoflow::app::cli {

    enum class CommandKind {
        Cleanup,
        Inspect
    };

    struct CliCommand {
        CommandKind kind = CommandKind::Cleanup;
        std::optional<std::filesystem::path> output_dir;
        std::optional<std::uint32_t> older_than_hours;
        std::optional<std::filesystem::path> config_file;
        std::filesystem::path state_file;
        bool verbose = false;
    };

    seoflow::core::errors::Result<CliCommand> parse_and_validate(int argc, char* argv[]);
}
