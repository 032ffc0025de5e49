#include "cli/commands.h"

#include <iostream>

namespace mhub {
namespace cli {
namespace commands {

namespace {

void printList(const char* label, const std::vector<std::string>& items) {
    if (items.empty()) return;
    std::cout << "  " << label;
    for (size_t i = 0; i < items.size(); ++i) {
        std::cout << (i == 0 ? "" : ", ") << items[i];
    }
    std::cout << std::endl;
}

}  // namespace

int show(RunnerBackend& backend, const ModelOptions& options) {
    auto result = backend.getModel(options.model);
    if (!result.ok()) {
        return reportError(result.error, result.error_message);
    }
    const auto& model = *result.data;

    std::cout << "Model" << std::endl;
    std::cout << "  name          " << model.name << std::endl;
    std::cout << "  id            " << model.id << std::endl;
    std::cout << "  label         " << model.label << std::endl;
    std::cout << "  image         " << model.image_ref << std::endl;
    if (!model.image_digest.empty()) {
        std::cout << "  digest        " << model.image_digest << std::endl;
    }
    std::cout << "  docs          " << model.documentation_url << std::endl;
    std::cout << std::endl;

    printList("modalities    ", model.modalities);
    printList("categories    ", model.categories);
    printList("regions       ", model.regions);

    if (!model.inputs.empty()) {
        std::cout << std::endl << "Inputs" << std::endl;
        for (const auto& input : model.inputs) {
            std::cout << "  " << input.format;
            if (!input.description.empty()) std::cout << "  " << input.description;
            std::cout << std::endl;
        }
        if (!model.inputs_compatible) {
            std::cout << "  (inputs are not compatible with the default workflow)" << std::endl;
        }
    }

    if (!model.description.empty()) {
        std::cout << std::endl << "Description" << std::endl;
        std::cout << "  " << model.description << std::endl;
    }

    if (!model.cite.empty()) {
        std::cout << std::endl << "Cite" << std::endl;
        std::cout << "  " << model.cite << std::endl;
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace mhub
