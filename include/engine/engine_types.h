#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mhub {

// Container-side mount points expected by MHub model images.
constexpr const char* kContainerInputDir = "/app/data/input_data";
constexpr const char* kContainerOutputDir = "/app/data/output_data";

struct LocalImage {
    std::string reference;   // normalized repo:tag
    std::string repository;
    std::string tag;
    std::string digest;      // empty when the engine does not report one
    std::string image_id;
    uint64_t size_bytes{0};
    std::string created_at;  // engine-reported, free-form
};

struct GpuDevice {
    int id;
    std::string name;
    std::string uuid;
    size_t memory_bytes;
    std::string vendor;  // "nvidia"
    bool is_available;
};

struct RunRequest {
    std::string image;
    std::string input_path;
    std::string output_path;
    std::vector<int> gpus;                        // empty = CPU only
    std::vector<std::string> extra_args;
    std::optional<std::string> engine_executable;
    std::string model_id;
    std::chrono::seconds run_timeout{0};           // 0 = orchestrator default
};

struct ContainerHandle {
    std::string id;
    std::string name;
    std::string image;
};

struct BackendInfo {
    std::string name;
    std::string version;
    std::string executable;
    bool available{false};
};

// Receives one line of engine output. Called on the engine call's thread.
using LineCallback = std::function<void(const std::string& line)>;

}  // namespace mhub
