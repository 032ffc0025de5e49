#include "cli/commands.h"

#include <iomanip>
#include <iostream>

namespace mhub {
namespace cli {
namespace commands {

int gpus(RunnerBackend& backend) {
    auto result = backend.listGPUs();
    if (!result.ok()) {
        return reportError(result.error, result.error_message);
    }

    if (result.data->empty()) {
        std::cout << "No GPUs detected; runs will use the CPU" << std::endl;
        return 0;
    }

    std::cout << std::left
              << std::setw(6) << "ID"
              << std::setw(36) << "NAME"
              << std::setw(12) << "MEMORY"
              << "STATUS"
              << std::endl;
    for (const auto& gpu : *result.data) {
        std::cout << std::left
                  << std::setw(6) << gpu.id
                  << std::setw(36) << gpu.name
                  << std::setw(12) << (std::to_string(gpu.memory_bytes / (1024ULL * 1024)) + " MiB")
                  << (gpu.is_available ? "available" : "unavailable")
                  << std::endl;
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace mhub
