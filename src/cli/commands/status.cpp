#include "cli/commands.h"

#include <iomanip>
#include <iostream>

namespace mhub {
namespace cli {
namespace commands {

namespace {

std::string formatSize(uint64_t size) {
    if (size >= 1000ULL * 1000 * 1000) {
        return std::to_string(size / (1000ULL * 1000 * 1000)) + " GB";
    }
    if (size >= 1000ULL * 1000) {
        return std::to_string(size / (1000ULL * 1000)) + " MB";
    }
    return std::to_string(size) + " B";
}

void printRow(const ModelStatus& st) {
    std::string state = to_string(st.image.status);
    if (st.pulling) state += " (pulling)";
    std::cout << std::left
              << std::setw(32) << st.model.name
              << std::setw(22) << state
              << std::setw(10) << (st.image.status == ImageStatus::NotPresent ? "-" : formatSize(st.image.local_size_bytes))
              << std::setw(6) << st.active_runs
              << st.image.image_ref
              << std::endl;
}

}  // namespace

int status(RunnerBackend& backend, const StatusOptions& options) {
    std::vector<ModelStatus> rows;
    if (!options.model.empty()) {
        auto result = backend.getModelStatus(options.model);
        if (!result.ok()) {
            return reportError(result.error, result.error_message);
        }
        rows.push_back(std::move(*result.data));
    } else {
        auto result = backend.listModelStatuses();
        if (!result.ok()) {
            return reportError(result.error, result.error_message);
        }
        rows = std::move(*result.data);
    }

    std::cout << std::left
              << std::setw(32) << "NAME"
              << std::setw(22) << "STATUS"
              << std::setw(10) << "SIZE"
              << std::setw(6) << "RUNS"
              << "IMAGE"
              << std::endl;
    for (const auto& st : rows) {
        printRow(st);
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace mhub
