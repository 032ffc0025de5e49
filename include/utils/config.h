#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mhub {

enum class EngineBackend {
    Docker,
    UDocker,
};

const char* to_string(EngineBackend backend);
std::optional<EngineBackend> parseEngineBackend(const std::string& text);

struct EngineConfig {
    EngineBackend backend{EngineBackend::Docker};
    std::string docker_executable;      // empty = auto-detect
    std::string udocker_executable;     // empty = auto-detect
    std::string nvidia_smi_executable;  // empty = auto-detect
    std::string image_filter;           // e.g. "mhubai/*"; empty = all images
    std::chrono::milliseconds command_timeout{30000};
};

struct CatalogConfig {
    std::string url{"https://mhub.ai/api/v2/models/detailed"};
    std::chrono::milliseconds timeout{10000};
    std::chrono::seconds refresh_interval{0};  // 0 = on demand
    std::string image_namespace{"mhubai"};
    std::string image_tag{"latest"};
    std::string docs_base_url{"https://mhub.ai/models/"};
};

struct OrchestratorConfig {
    bool auto_pull{true};
    std::chrono::milliseconds grace_period{5000};
    std::chrono::seconds run_timeout{0};  // 0 = no limit
    std::chrono::milliseconds log_drain_timeout{2000};
    bool allow_concurrent_input{true};
    size_t max_log_lines{100000};  // per job, oldest dropped first; 0 = no limit
};

struct BackendConfig {
    EngineConfig engine;
    CatalogConfig catalog;
    OrchestratorConfig orchestrator;
    std::vector<std::string> default_run_args{"--workflow", "default", "--print"};
};

BackendConfig loadBackendConfig();
std::pair<BackendConfig, std::string> loadBackendConfigWithLog();

}  // namespace mhub
