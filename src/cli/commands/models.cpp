#include "cli/commands.h"

#include <iomanip>
#include <iostream>

namespace mhub {
namespace cli {
namespace commands {

namespace {

std::string joinList(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ",";
        out += item;
    }
    return out;
}

}  // namespace

int models(RunnerBackend& backend, const ModelsOptions& options) {
    auto result = backend.listModels(options.query);
    if (!result.ok()) {
        return reportError(result.error, result.error_message);
    }

    if (result.data->empty()) {
        if (!options.query.empty()) {
            std::cout << "No models match '" << options.query << "'" << std::endl;
        }
        return 0;
    }

    std::cout << std::left
              << std::setw(32) << "NAME"
              << std::setw(16) << "MODALITY"
              << std::setw(40) << "IMAGE"
              << "LABEL"
              << std::endl;

    for (const auto& model : *result.data) {
        std::cout << std::left
                  << std::setw(32) << model.name
                  << std::setw(16) << joinList(model.modalities)
                  << std::setw(40) << model.image_ref
                  << model.label
                  << std::endl;
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace mhub
