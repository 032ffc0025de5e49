#include "utils/cli.h"
#include "utils/version.h"
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace mhub {

// Forward declarations for help messages
std::string getModelsHelpMessage();
std::string getShowHelpMessage();
std::string getStatusHelpMessage();
std::string getPullHelpMessage();
std::string getRmHelpMessage();
std::string getGpusHelpMessage();
std::string getInfoHelpMessage();
std::string getRunHelpMessage();

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "mhubrun " << MHUB_VERSION << " - run MHub medical imaging models locally\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    mhubrun [GLOBAL OPTIONS] <COMMAND>\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    models     List catalog models\n";
    oss << "    show       Show model metadata\n";
    oss << "    status     Show local image status\n";
    oss << "    pull       Pull or update a model image\n";
    oss << "    rm         Remove a local model image\n";
    oss << "    gpus       List GPUs visible to the engine\n";
    oss << "    info       Show the active container engine\n";
    oss << "    run        Run a model on an input directory\n";
    oss << "\n";
    oss << "GLOBAL OPTIONS:\n";
    oss << "    --backend <docker|udocker>   Container engine (default: docker, or MHUB_BACKEND)\n";
    oss << "    --engine-path <PATH>         Engine executable\n";
    oss << "    -h, --help                   Print help information\n";
    oss << "    -V, --version                Print version information\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    MHUB_CONFIG               Config file path (default: ~/.mhub/config.json)\n";
    oss << "    MHUB_CATALOG_URL          Model catalog endpoint\n";
    oss << "    MHUB_LOG_LEVEL            Log level (trace|debug|info|warn|error)\n";
    oss << "    MHUB_LOG_DIR              Log directory (default: ~/.mhub/logs)\n";
    oss << "    MHUB_LOG_RETENTION_DAYS   Log retention days (default: 7)\n";
    oss << "\n";
    oss << "Run 'mhubrun <COMMAND> --help' for more info.\n";
    return oss.str();
}

std::string getModelsHelpMessage() {
    std::ostringstream oss;
    oss << "mhubrun models - List catalog models\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    mhubrun models [QUERY]\n";
    oss << "\n";
    oss << "ARGUMENTS:\n";
    oss << "    [QUERY]          Case-insensitive filter over name, description,\n";
    oss << "                     modality, category and region\n";
    return oss.str();
}

std::string getShowHelpMessage() {
    std::ostringstream oss;
    oss << "mhubrun show - Show model metadata\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    mhubrun show <MODEL>\n";
    oss << "\n";
    oss << "ARGUMENTS:\n";
    oss << "    <MODEL>          Model id or name (e.g., totalsegmentator)\n";
    return oss.str();
}

std::string getStatusHelpMessage() {
    std::ostringstream oss;
    oss << "mhubrun status - Show local image status\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    mhubrun status [MODEL]\n";
    oss << "\n";
    oss << "Prints not-present, up-to-date or stale for each model image.\n";
    return oss.str();
}

std::string getPullHelpMessage() {
    std::ostringstream oss;
    oss << "mhubrun pull - Pull or update a model image\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    mhubrun pull <MODEL>\n";
    return oss.str();
}

std::string getRmHelpMessage() {
    std::ostringstream oss;
    oss << "mhubrun rm - Remove a local model image\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    mhubrun rm <MODEL>\n";
    return oss.str();
}

std::string getGpusHelpMessage() {
    std::ostringstream oss;
    oss << "mhubrun gpus - List GPUs visible to the engine\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    mhubrun gpus\n";
    return oss.str();
}

std::string getInfoHelpMessage() {
    std::ostringstream oss;
    oss << "mhubrun info - Show the active container engine\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    mhubrun info\n";
    return oss.str();
}

std::string getRunHelpMessage() {
    std::ostringstream oss;
    oss << "mhubrun run - Run a model on an input directory\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    mhubrun run <MODEL> --input <DIR> --output <DIR> [OPTIONS] [-- ARGS...]\n";
    oss << "\n";
    oss << "ARGUMENTS:\n";
    oss << "    <MODEL>          Model id or name\n";
    oss << "    ARGS             Extra arguments passed to the model container\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --input <DIR>       Input directory (mounted read-only)\n";
    oss << "    --output <DIR>      Output directory (mounted read-write)\n";
    oss << "    --gpus <IDS>        Comma-separated GPU ids (e.g., 0,1)\n";
    oss << "    --no-pull           Fail instead of pulling a missing image\n";
    oss << "    --timeout <SECS>    Kill the run after SECS seconds\n";
    oss << "    -h, --help          Print help\n";
    oss << "\n";
    oss << "Press Ctrl+C to cancel the run.\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "mhubrun " << MHUB_VERSION << "\n";
    return oss.str();
}

std::optional<std::vector<int>> parseGpuList(const std::string& text) {
    std::vector<int> ids;
    if (!text.empty() && text.back() == ',') return std::nullopt;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) return std::nullopt;
        for (char c : item) {
            if (c < '0' || c > '9') return std::nullopt;
        }
        try {
            ids.push_back(std::stoi(item));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    if (ids.empty()) return std::nullopt;
    return ids;
}

namespace {

// Helper to check for help flag in arguments
bool hasHelpFlag(const std::vector<std::string>& args, size_t start) {
    for (size_t i = start; i < args.size(); ++i) {
        if (args[i] == "-h" || args[i] == "--help") {
            return true;
        }
    }
    return false;
}

CliResult errorResult(const std::string& message, const std::string& usage) {
    CliResult result;
    result.should_exit = true;
    result.exit_code = 1;
    result.output = "Error: " + message + "\n\nUsage: " + usage + "\n";
    return result;
}

CliResult helpResult(std::string text) {
    CliResult result;
    result.should_exit = true;
    result.exit_code = 0;
    result.output = std::move(text);
    return result;
}

// First positional argument at or after `start`.
std::string firstPositional(const std::vector<std::string>& args, size_t start) {
    for (size_t i = start; i < args.size(); ++i) {
        if (!args[i].empty() && args[i][0] != '-') {
            return args[i];
        }
    }
    return {};
}

}  // namespace

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    // Split off global options and the pass-through tail after "--".
    std::vector<std::string> args;
    std::vector<std::string> passthrough;
    bool after_separator = false;
    for (int i = 1; i < argc; ++i) {
        if (after_separator) {
            passthrough.emplace_back(argv[i]);
        } else if (std::strcmp(argv[i], "--") == 0) {
            after_separator = true;
        } else if (std::strcmp(argv[i], "--backend") == 0) {
            if (i + 1 >= argc) {
                return errorResult("--backend requires a value", "mhubrun --backend <docker|udocker> <COMMAND>");
            }
            result.global_options.backend = argv[++i];
            if (result.global_options.backend != "docker" && result.global_options.backend != "udocker") {
                return errorResult("unknown backend '" + result.global_options.backend + "'",
                                   "mhubrun --backend <docker|udocker> <COMMAND>");
            }
        } else if (std::strcmp(argv[i], "--engine-path") == 0) {
            if (i + 1 >= argc) {
                return errorResult("--engine-path requires a value", "mhubrun --engine-path <PATH> <COMMAND>");
            }
            result.global_options.engine_path = argv[++i];
        } else {
            args.emplace_back(argv[i]);
        }
    }

    // No command - show help
    if (args.empty()) {
        result.should_exit = false;
        result.subcommand = Subcommand::None;
        return result;
    }

    const std::string& command = args[0];

    // Global help and version
    if (command == "-h" || command == "--help") {
        return helpResult(getHelpMessage());
    }

    if (command == "-V" || command == "--version") {
        return helpResult(getVersionMessage());
    }

    if (command == "models") {
        if (hasHelpFlag(args, 1)) return helpResult(getModelsHelpMessage());
        result.subcommand = Subcommand::Models;
        result.models_options.query = firstPositional(args, 1);
        return result;
    }

    if (command == "show" || command == "pull" || command == "rm") {
        if (hasHelpFlag(args, 1)) {
            if (command == "show") return helpResult(getShowHelpMessage());
            if (command == "pull") return helpResult(getPullHelpMessage());
            return helpResult(getRmHelpMessage());
        }
        result.model_options.model = firstPositional(args, 1);

        // Model name is required
        if (result.model_options.model.empty()) {
            return errorResult("model name required", "mhubrun " + command + " <MODEL>");
        }
        result.subcommand = command == "show" ? Subcommand::Show
                            : command == "pull" ? Subcommand::Pull
                                                : Subcommand::Rm;
        return result;
    }

    if (command == "status") {
        if (hasHelpFlag(args, 1)) return helpResult(getStatusHelpMessage());
        result.subcommand = Subcommand::Status;
        result.status_options.model = firstPositional(args, 1);
        return result;
    }

    if (command == "gpus") {
        if (hasHelpFlag(args, 1)) return helpResult(getGpusHelpMessage());
        result.subcommand = Subcommand::Gpus;
        return result;
    }

    if (command == "info") {
        if (hasHelpFlag(args, 1)) return helpResult(getInfoHelpMessage());
        result.subcommand = Subcommand::Info;
        return result;
    }

    if (command == "run") {
        if (hasHelpFlag(args, 1)) return helpResult(getRunHelpMessage());
        const std::string usage = "mhubrun run <MODEL> --input <DIR> --output <DIR>";

        // Parse run options
        auto& opts = result.run_options;
        for (size_t i = 1; i < args.size(); ++i) {
            const std::string& arg = args[i];
            const bool has_value = i + 1 < args.size();
            if (arg == "--input" && has_value) {
                opts.input = args[++i];
            } else if (arg == "--output" && has_value) {
                opts.output = args[++i];
            } else if (arg == "--gpus" && has_value) {
                auto ids = parseGpuList(args[++i]);
                if (!ids) {
                    return errorResult("invalid GPU list '" + args[i] + "'", usage + " --gpus 0,1");
                }
                opts.gpus = std::move(*ids);
            } else if (arg == "--timeout" && has_value) {
                try {
                    opts.timeout_secs = std::stoi(args[++i]);
                } catch (const std::exception&) {
                    return errorResult("invalid timeout '" + args[i] + "'", usage + " --timeout <SECS>");
                }
                if (opts.timeout_secs < 0) {
                    return errorResult("timeout must not be negative", usage + " --timeout <SECS>");
                }
            } else if (arg == "--no-pull") {
                opts.no_pull = true;
            } else if (!arg.empty() && arg[0] == '-') {
                return errorResult("unknown or incomplete option '" + arg + "'", usage);
            } else if (opts.model.empty()) {
                opts.model = arg;
            } else {
                return errorResult("unexpected argument '" + arg + "' (pass model arguments after --)", usage);
            }
        }
        opts.extra_args = std::move(passthrough);

        if (opts.model.empty()) {
            return errorResult("model name required", usage);
        }
        if (opts.input.empty() || opts.output.empty()) {
            return errorResult("--input and --output are required", usage);
        }
        result.subcommand = Subcommand::Run;
        return result;
    }

    // Unknown command
    result.should_exit = true;
    result.exit_code = 1;
    result.output = "Error: unknown command '" + command + "'\n\n" + getHelpMessage();
    return result;
}

std::string subcommandToString(Subcommand cmd) {
    switch (cmd) {
        case Subcommand::None:
            return "none";
        case Subcommand::Models:
            return "models";
        case Subcommand::Show:
            return "show";
        case Subcommand::Status:
            return "status";
        case Subcommand::Pull:
            return "pull";
        case Subcommand::Rm:
            return "rm";
        case Subcommand::Gpus:
            return "gpus";
        case Subcommand::Info:
            return "info";
        case Subcommand::Run:
            return "run";
    }
    return "unknown";
}

}  // namespace mhub
