#include "engine/engine_client.h"

#include <filesystem>

#include "engine/docker_engine.h"
#include "engine/udocker_engine.h"

namespace fs = std::filesystem;

namespace mhub {

std::unique_ptr<EngineClient> createEngineClient(const EngineConfig& config) {
    switch (config.backend) {
        case EngineBackend::UDocker:
            return std::make_unique<UDockerEngineClient>(config);
        case EngineBackend::Docker:
            break;
    }
    return std::make_unique<DockerEngineClient>(config);
}

Result<void> validateMounts(const RunRequest& request) {
    auto check = [](const std::string& path, const char* what) -> Result<void> {
        if (path.empty()) {
            return Result<void>::failure(ErrorKind::kInvalidMount, std::string(what) + " path is empty");
        }
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return Result<void>::failure(ErrorKind::kInvalidMount,
                                         std::string(what) + " path does not exist: " + path);
        }
        if (!fs::is_directory(path, ec)) {
            return Result<void>::failure(ErrorKind::kInvalidMount,
                                         std::string(what) + " path is not a directory: " + path);
        }
        return Result<void>::success();
    };

    auto input = check(request.input_path, "input");
    if (!input.ok()) return input;
    return check(request.output_path, "output");
}

std::string absoluteMountPath(const std::string& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) return path;
    std::string out = abs.lexically_normal().string();
    while (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

}  // namespace mhub
