#pragma once

#include <optional>
#include <string>
#include <vector>

namespace mhub {

/// Subcommand types for mhubrun CLI
enum class Subcommand {
    None,     // No subcommand (prints help)
    Models,   // models [query]
    Show,     // show <model>
    Status,   // status [model]
    Pull,     // pull <model>
    Rm,       // rm <model>
    Gpus,     // gpus
    Info,     // info
    Run,      // run <model> --input DIR --output DIR
};

/// Options accepted before or after any subcommand
struct GlobalOptions {
    std::string backend;      // "docker" | "udocker"; empty = configured backend
    std::string engine_path;  // overrides the engine executable
};

/// Options for models command
struct ModelsOptions {
    std::string query;
};

/// Options for model-related commands (show, pull, rm)
struct ModelOptions {
    std::string model;
};

/// Options for status command
struct StatusOptions {
    std::string model;  // empty = every catalog model
};

/// Options for run command
struct RunOptions {
    std::string model;
    std::string input;
    std::string output;
    std::vector<int> gpus;
    bool no_pull{false};
    int timeout_secs{0};
    std::vector<std::string> extra_args;  // everything after "--"
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    /// Parsed subcommand
    Subcommand subcommand{Subcommand::None};

    GlobalOptions global_options;

    ModelsOptions models_options;

    /// Options for model commands (show, pull, rm)
    ModelOptions model_options;

    StatusOptions status_options;

    /// Options for run command
    RunOptions run_options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

/// Get the help message for the CLI
///
/// @return Help message string
std::string getHelpMessage();

/// Get the version message for the CLI
///
/// @return Version message string
std::string getVersionMessage();

/// Convert subcommand enum to string
std::string subcommandToString(Subcommand cmd);

/// Parse a comma-separated GPU id list ("0,1"). nullopt on a malformed entry.
std::optional<std::vector<int>> parseGpuList(const std::string& text);

}  // namespace mhub
