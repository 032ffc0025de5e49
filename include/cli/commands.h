#pragma once

#include <atomic>

#include "api/runner_backend.h"
#include "core/error.h"
#include "utils/cli.h"

namespace mhub {
namespace cli {
namespace commands {

/// Exit code for interrupted commands (128 + SIGINT)
constexpr int kExitInterrupted = 130;

/// Map a failure to an exit code (1=error, 2=engine unavailable, 130=cancelled)
int exitCodeFor(ErrorKind kind);

/// Print "Error: <message>" to stderr and return exitCodeFor(kind)
int reportError(ErrorKind kind, const std::string& message);

/// Execute the 'models' command
/// @param backend Runner backend
/// @param options Models options (query)
/// @return Exit code (0=success, 1=error)
int models(RunnerBackend& backend, const ModelsOptions& options);

/// Execute the 'show' command
/// @param backend Runner backend
/// @param options Model options (model)
/// @return Exit code (0=success, 1=error)
int show(RunnerBackend& backend, const ModelOptions& options);

/// Execute the 'status' command
/// @return Exit code (0=success, 1=error, 2=engine unavailable)
int status(RunnerBackend& backend, const StatusOptions& options);

/// Execute the 'pull' command
/// @param backend Runner backend
/// @param options Model options (model)
/// @param interrupted Set by the SIGINT handler; cancels the pull
/// @return Exit code (0=success, 1=error, 2=engine unavailable, 130=interrupted)
int pull(RunnerBackend& backend, const ModelOptions& options, const std::atomic<bool>& interrupted);

/// Execute the 'rm' command
/// @return Exit code (0=success, 1=error, 2=engine unavailable)
int rm(RunnerBackend& backend, const ModelOptions& options);

/// Execute the 'gpus' command
int gpus(RunnerBackend& backend);

/// Execute the 'info' command
int info(RunnerBackend& backend);

/// Execute the 'run' command
///
/// Streams the job log to stdout until the job finishes. Once `interrupted`
/// is set the job is cancelled and the command exits with 130.
/// @return Exit code (0=completed, 1=failed, 2=engine unavailable, 130=interrupted)
int run(RunnerBackend& backend, const RunOptions& options, const std::atomic<bool>& interrupted);

}  // namespace commands
}  // namespace cli
}  // namespace mhub
