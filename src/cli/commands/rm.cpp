#include "cli/commands.h"

#include <iostream>

namespace mhub {
namespace cli {
namespace commands {

int rm(RunnerBackend& backend, const ModelOptions& options) {
    auto model = backend.getModel(options.model);
    if (!model.ok()) {
        return reportError(model.error, model.error_message);
    }

    auto result = backend.removeLocalImage(options.model);
    if (!result.ok()) {
        if (result.error == ErrorKind::kNotFound) {
            std::cerr << "Image " << model.data->image_ref << " is not present locally" << std::endl;
            return 1;
        }
        return reportError(result.error, result.error_message);
    }

    std::cout << "Removed " << model.data->image_ref << std::endl;
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace mhub
