#ifndef MAGTORQ_CLI_COMMON_HPP
#define MAGTORQ_CLI_COMMON_HPP

#include <common/logging.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace magtorq::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;
    bool help = false;

    // Overrides of values from the constraint file
    std::optional<double> max_power;
    std::optional<int> num_threads;
};

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto next_value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(flag + " requires an argument");
        }
        std::string value = argv[i + 1];
        i += 2;
        return value;
    };

    // Parse flags and positional arguments
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = next_value("-o/--output");
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = next_value("-c/--config");
        } else if (arg == "--max-power") {
            ctx.max_power = std::stod(next_value("--max-power"));
        } else if (arg == "--threads") {
            ctx.num_threads = std::stoi(next_value("--threads"));
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (!arg.empty() && arg[0] != '-') {
            // Positional argument (input file)
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    if (ctx.verbose) {
        magtorq::logging::get_logger()->set_level(spdlog::level::debug);
    }

    return {ctx, i};
}

// Resolve output path: if empty, generate from input path with given suffix
inline std::string resolve_output_path(const std::string& input,
                                       const std::string& suffix,
                                       const std::string& provided_output) {
    if (!provided_output.empty()) {
        return provided_output;
    }

    // Find last dot in input path
    size_t dot_pos = input.find_last_of('.');
    size_t slash_pos = input.find_last_of('/');

    // Make sure dot comes after last slash (if any)
    if (dot_pos != std::string::npos &&
        (slash_pos == std::string::npos || dot_pos > slash_pos)) {
        return input.substr(0, dot_pos) + suffix;
    } else {
        return input + suffix;
    }
}

// Command function declarations
int command_optimize(int argc, char** argv);
int command_geometry(int argc, char** argv);

}  // namespace magtorq::cli

#endif // MAGTORQ_CLI_COMMON_HPP
