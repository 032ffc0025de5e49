#include "cli/commands.h"

#include <iostream>

#include "utils/version.h"

namespace mhub {
namespace cli {
namespace commands {

int info(RunnerBackend& backend) {
    auto engine = backend.backendInfo();
    const auto& config = backend.config();

    std::cout << "mhubrun       " << MHUB_VERSION << std::endl;
    std::cout << "engine        " << engine.name << std::endl;
    std::cout << "executable    " << (engine.executable.empty() ? "(not found)" : engine.executable) << std::endl;
    std::cout << "version       " << (engine.version.empty() ? "-" : engine.version) << std::endl;
    std::cout << "available     " << (engine.available ? "yes" : "no") << std::endl;
    std::cout << "catalog       " << config.catalog.url << std::endl;
    std::cout << "auto pull     " << (config.orchestrator.auto_pull ? "yes" : "no") << std::endl;

    return engine.available ? 0 : exitCodeFor(ErrorKind::kEngineUnavailable);
}

}  // namespace commands
}  // namespace cli
}  // namespace mhub
