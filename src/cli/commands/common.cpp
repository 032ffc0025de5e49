#include "cli/commands.h"

#include <iostream>

namespace mhub {
namespace cli {
namespace commands {

int exitCodeFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kOk:
            return 0;
        case ErrorKind::kEngineUnavailable:
            return 2;
        case ErrorKind::kCancelled:
            return kExitInterrupted;
        default:
            return 1;
    }
}

int reportError(ErrorKind kind, const std::string& message) {
    std::cerr << "Error: " << message << " (" << to_string(kind) << ")" << std::endl;
    if (kind == ErrorKind::kEngineUnavailable) {
        std::cerr << "Check that the container engine is installed, or pass --backend / --engine-path" << std::endl;
    }
    return exitCodeFor(kind);
}

}  // namespace commands
}  // namespace cli
}  // namespace mhub
