#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "api/runner_backend.h"
#include "cli/commands.h"
#include "utils/cli.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/version.h"

namespace {

std::atomic<bool> g_interrupted{false};

void signalHandler(int /*signal*/) {
    g_interrupted.store(true);
}

// Apply --backend / --engine-path / --no-pull on top of file and env config.
mhub::BackendConfig applyCliOverrides(mhub::BackendConfig config, const mhub::CliResult& cli) {
    const auto& global = cli.global_options;
    if (!global.backend.empty()) {
        if (auto backend = mhub::parseEngineBackend(global.backend)) {
            config.engine.backend = *backend;
        }
    }
    if (!global.engine_path.empty()) {
        if (config.engine.backend == mhub::EngineBackend::Docker) {
            config.engine.docker_executable = global.engine_path;
        } else {
            config.engine.udocker_executable = global.engine_path;
        }
    }
    if (cli.subcommand == mhub::Subcommand::Run && cli.run_options.no_pull) {
        config.orchestrator.auto_pull = false;
    }
    // One-shot commands fetch the catalog on demand.
    config.catalog.refresh_interval = std::chrono::seconds(0);
    return config;
}

int dispatch(mhub::RunnerBackend& backend, const mhub::CliResult& cli) {
    namespace commands = mhub::cli::commands;
    switch (cli.subcommand) {
        case mhub::Subcommand::Models:
            return commands::models(backend, cli.models_options);
        case mhub::Subcommand::Show:
            return commands::show(backend, cli.model_options);
        case mhub::Subcommand::Status:
            return commands::status(backend, cli.status_options);
        case mhub::Subcommand::Pull:
            return commands::pull(backend, cli.model_options, g_interrupted);
        case mhub::Subcommand::Rm:
            return commands::rm(backend, cli.model_options);
        case mhub::Subcommand::Gpus:
            return commands::gpus(backend);
        case mhub::Subcommand::Info:
            return commands::info(backend);
        case mhub::Subcommand::Run:
            return commands::run(backend, cli.run_options, g_interrupted);
        case mhub::Subcommand::None:
            break;
    }
    std::cout << mhub::getHelpMessage();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse CLI arguments first
    auto cli_result = mhub::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }
    if (cli_result.subcommand == mhub::Subcommand::None) {
        std::cout << mhub::getHelpMessage();
        return 0;
    }

    mhub::logger::init_from_env();
    spdlog::info("mhubrun {} command={}", MHUB_VERSION, mhub::subcommandToString(cli_result.subcommand));

    auto [config, sources] = mhub::loadBackendConfigWithLog();
    spdlog::info("Config loaded: {}", sources);
    config = applyCliOverrides(std::move(config), cli_result);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    int exit_code = 0;
    try {
        mhub::RunnerBackend backend(std::move(config));
        exit_code = dispatch(backend, cli_result);
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        exit_code = 1;
    }

    spdlog::shutdown();
    return exit_code;
}
