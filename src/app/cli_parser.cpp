#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace seoflow::app::cli {

    using namespace seoflow::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> output_dir;
        std::optional<std::string> older_than_hours;
        std::optional<std::string> config_file;
        std::vector<std::string> positionals;
        bool verbose = false;
    };

    Result<CliCommand> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return PipelineError{ErrorCategory::Validation, "No command provided.", "missing_command", "Usage: seoflow_cli cleanup --output-dir <dir> | inspect <state_file>"};
        }

        const std::string command = argv[1];
        CliCommand cmd;
        if (command == "cleanup") {
            cmd.kind = CommandKind::Cleanup;
        } else if (command == "inspect") {
            cmd.kind = CommandKind::Inspect;
        } else {
            return PipelineError{ErrorCategory::Validation, "Unknown command: " + command, "unknown_command", "Supported commands: cleanup, inspect."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--output-dir") {
                if (i + 1 < args.size()) raw.output_dir = args[++i];
                else return PipelineError{ErrorCategory::Validation, "Missing value for --output-dir", "missing_value"};
            } else if (args[i] == "--older-than-hours") {
                if (i + 1 < args.size()) raw.older_than_hours = args[++i];
                else return PipelineError{ErrorCategory::Validation, "Missing value for --older-than-hours", "missing_value"};
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config_file = args[++i];
                else return PipelineError{ErrorCategory::Validation, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else if (!args[i].empty() && args[i][0] != '-') {
                raw.positionals.push_back(args[i]);
            } else {
                return PipelineError{ErrorCategory::Validation, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        cmd.verbose = raw.verbose;
        if (raw.config_file) cmd.config_file = std::filesystem::path(raw.config_file.value());

        if (cmd.kind == CommandKind::Inspect) {
            if (raw.positionals.size() != 1) {
                return PipelineError{ErrorCategory::Validation, "inspect takes exactly one state file", "missing_required_flag", "Usage: seoflow_cli inspect <state_file>"};
            }
            cmd.state_file = raw.positionals.front();
            return cmd;
        }

        if (!raw.positionals.empty()) {
            return PipelineError{ErrorCategory::Validation, "Unknown argument: " + raw.positionals.front(), "unknown_argument"};
        }
        if (!raw.output_dir && !raw.config_file) {
            return PipelineError{ErrorCategory::Validation, "Must provide --output-dir or --config", "missing_required_flag"};
        }
        if (raw.output_dir) cmd.output_dir = std::filesystem::path(raw.output_dir.value());

        // Exception-free integer parsing
        if (raw.older_than_hours) {
            std::uint32_t hours = 0;
            const char* begin = raw.older_than_hours->data();
            const char* end = raw.older_than_hours->data() + raw.older_than_hours->size();
            auto [ptr, ec] = std::from_chars(begin, end, hours);
            if (ec != std::errc() || ptr != end) {
                return PipelineError{ErrorCategory::Validation, "Invalid number for --older-than-hours", "invalid_integer", "Provide a non-negative integer."};
            }
            if (hours > 24 * 365) {
                return PipelineError{ErrorCategory::Validation, "--older-than-hours out of bounds", "bounds_error", "Must be between 0 and 8760."};
            }
            cmd.older_than_hours = hours;
        }

        return cmd;
    }

} // namespace seoflow::app::cli
