#include "cli/commands.h"

#include <chrono>
#include <iostream>
#include <thread>

namespace mhub {
namespace cli {
namespace commands {

int pull(RunnerBackend& backend, const ModelOptions& options, const std::atomic<bool>& interrupted) {
    auto model = backend.getModel(options.model);
    if (!model.ok()) {
        return reportError(model.error, model.error_message);
    }

    std::cout << "Pulling " << model.data->image_ref << std::endl;

    // Forward Ctrl+C into the pull's cancel token.
    CancelToken cancel;
    CancelToken watcher_stop;
    std::thread watcher([&]() {
        while (!watcher_stop.waitFor(std::chrono::milliseconds(100))) {
            if (interrupted.load()) {
                cancel.cancel();
                return;
            }
        }
    });

    auto result = backend.pullOrUpdate(
        options.model,
        [](const std::string& line) { std::cout << line << std::endl; },
        cancel);

    watcher_stop.cancel();
    watcher.join();

    if (!result.ok()) {
        if (result.error == ErrorKind::kCancelled) {
            std::cerr << "Pull interrupted" << std::endl;
            return kExitInterrupted;
        }
        return reportError(result.error, result.error_message);
    }

    std::cout << "Image " << model.data->image_ref << " is up to date" << std::endl;
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace mhub
