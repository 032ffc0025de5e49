#include "system/gpu_inventory.h"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace mhub {

GpuInventory::GpuInventory(EngineClient* engine)
    : engine_(engine) {}

Result<std::vector<GpuDevice>> GpuInventory::list() {
    using R = Result<std::vector<GpuDevice>>;
    std::lock_guard<std::mutex> lock(mutex_);
    if (cached_) {
        return R::success(*cached_);
    }
    if (!engine_) {
        return R::failure(ErrorKind::kEngineUnavailable, "no engine configured");
    }
    auto res = engine_->listGpus();
    if (!res.ok()) {
        return res;
    }
    cached_ = *res.data;
    spdlog::info("Detected {} GPU(s)", cached_->size());
    for (const auto& dev : *cached_) {
        spdlog::debug("GPU {}: {} ({} MiB)", dev.id, dev.name, dev.memory_bytes / (1024 * 1024));
    }
    return R::success(*cached_);
}

void GpuInventory::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    cached_.reset();
}

void GpuInventory::rebind(EngineClient* engine) {
    std::lock_guard<std::mutex> lock(mutex_);
    engine_ = engine;
    cached_.reset();
}

bool GpuInventory::hasGpu() {
    auto devices = list();
    if (!devices.ok()) return false;
    return std::any_of(devices.data->begin(), devices.data->end(),
                       [](const GpuDevice& dev) { return dev.is_available; });
}

size_t GpuInventory::totalMemory() {
    auto devices = list();
    if (!devices.ok()) return 0;
    size_t total = 0;
    for (const auto& dev : *devices.data) {
        if (dev.is_available) {
            total += dev.memory_bytes;
        }
    }
    return total;
}

std::optional<GpuDevice> GpuInventory::getGpuById(int id) {
    auto devices = list();
    if (!devices.ok()) return std::nullopt;
    for (const auto& dev : *devices.data) {
        if (dev.id == id) {
            return dev;
        }
    }
    return std::nullopt;
}

Result<std::vector<int>> GpuInventory::resolveSelection(const std::vector<int>& ids) {
    using R = Result<std::vector<int>>;
    if (ids.empty()) {
        return R::success({});
    }
    auto devices = list();
    if (!devices.ok()) return R::from(devices);

    std::vector<int> selected;
    for (int id : ids) {
        if (std::find(selected.begin(), selected.end(), id) != selected.end()) continue;
        auto it = std::find_if(devices.data->begin(), devices.data->end(),
                               [id](const GpuDevice& dev) { return dev.id == id; });
        if (it == devices.data->end()) {
            return R::failure(ErrorKind::kInvalidArgument, "unknown GPU id " + std::to_string(id));
        }
        if (!it->is_available) {
            return R::failure(ErrorKind::kInvalidArgument, "GPU " + std::to_string(id) + " is not available");
        }
        selected.push_back(id);
    }
    return R::success(std::move(selected));
}

#ifdef MHUB_TESTING
void GpuInventory::setDevicesForTest(std::vector<GpuDevice> devices) {
    std::lock_guard<std::mutex> lock(mutex_);
    cached_ = std::move(devices);
}
#endif

}  // namespace mhub
