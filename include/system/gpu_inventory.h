#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "core/error.h"
#include "engine/engine_client.h"

namespace mhub {

// Cached view of the host's GPUs. Queried through the engine client on first
// use and after invalidate(); never polled.
class GpuInventory {
public:
    explicit GpuInventory(EngineClient* engine);

    Result<std::vector<GpuDevice>> list();

    // Drop the cached list so the next call queries again.
    void invalidate();

    // Swap the engine (after a backend switch). Invalidates the cache.
    void rebind(EngineClient* engine);

    bool hasGpu();

    // Total memory of available devices.
    size_t totalMemory();

    std::optional<GpuDevice> getGpuById(int id);

    // Validate requested device ids: unknown or unavailable ids are
    // kInvalidArgument; duplicates are removed keeping first-seen order.
    Result<std::vector<int>> resolveSelection(const std::vector<int>& ids);

private:
    std::mutex mutex_;
    EngineClient* engine_;
    std::optional<std::vector<GpuDevice>> cached_;

#ifdef MHUB_TESTING
public:
    // Test-only: preload the cache without an engine query.
    void setDevicesForTest(std::vector<GpuDevice> devices);
#endif
};

}  // namespace mhub
