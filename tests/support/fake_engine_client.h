#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "engine/engine_client.h"
#include "engine/image_ref.h"

namespace mhub::test {

/// Scripted in-process engine. Each created container follows
/// `container_script`; containers with `block_until_killed` keep running
/// until kill() or cancellation.
class FakeEngineClient : public EngineClient {
public:
    struct ContainerScript {
        std::vector<std::string> log_lines;
        int exit_code{0};
        bool block_until_killed{false};
        std::chrono::milliseconds run_time{0};
        // Delay before each log line reaches the reader.
        std::chrono::milliseconds line_interval{0};
        // wait() keeps blocking after cancellation until kill() or timeout.
        bool wait_ignores_cancel{false};
    };

    struct PullScript {
        std::vector<std::string> lines{"pulling layer 1", "pulling layer 2", "done"};
        ErrorKind error{ErrorKind::kOk};
        std::string error_message{"pull failed"};
        std::chrono::milliseconds delay{0};
        bool block_until_cancelled{false};
        std::string digest{"sha256:fresh"};
    };

    // Scripting (set before use, or under lock from tests).
    std::mutex mutex;
    std::vector<LocalImage> images;
    std::vector<GpuDevice> gpus;
    ContainerScript container_script;
    PullScript pull_script;
    ErrorKind list_images_error{ErrorKind::kOk};
    ErrorKind create_error{ErrorKind::kOk};
    ErrorKind list_gpus_error{ErrorKind::kOk};
    bool available{true};

    // Observations.
    std::vector<RunRequest> created;
    std::vector<std::string> killed;
    std::vector<std::string> released;
    std::vector<std::string> pulled;
    std::vector<std::string> removed;
    std::atomic<int> list_images_calls{0};
    std::atomic<int> list_gpus_calls{0};
    std::atomic<int> active_pulls{0};
    std::atomic<int> max_concurrent_pulls{0};

    void addImage(const std::string& ref, const std::string& digest = "sha256:local") {
        std::lock_guard<std::mutex> lock(mutex);
        LocalImage img;
        img.reference = normalizeImageRef(ref);
        auto parsed = parseImageRef(ref);
        if (parsed) {
            img.repository = parsed->repository;
            img.tag = parsed->tag;
        }
        img.digest = digest;
        img.image_id = "sha256:id-" + std::to_string(images.size());
        img.size_bytes = 1024 * 1024;
        img.created_at = "2024-01-01 00:00:00 +0000 UTC";
        images.push_back(img);
    }

    size_t createdCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return created.size();
    }

    size_t killedCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return killed.size();
    }

    size_t releasedCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return released.size();
    }

    BackendInfo info() override {
        BackendInfo bi;
        bi.name = "fake";
        bi.version = "1.0";
        bi.executable = "/fake/engine";
        bi.available = available;
        return bi;
    }

    Result<std::vector<LocalImage>> listImages() override {
        ++list_images_calls;
        std::lock_guard<std::mutex> lock(mutex);
        if (list_images_error != ErrorKind::kOk) {
            return Result<std::vector<LocalImage>>::failure(list_images_error, "engine daemon is not running");
        }
        return Result<std::vector<LocalImage>>::success(images);
    }

    Result<void> pullImage(const std::string& ref,
                           const LineCallback& on_progress,
                           const CancelToken& cancel) override {
        PullScript script;
        {
            std::lock_guard<std::mutex> lock(mutex);
            script = pull_script;
            pulled.push_back(ref);
        }
        int now = ++active_pulls;
        int prev = max_concurrent_pulls.load();
        while (now > prev && !max_concurrent_pulls.compare_exchange_weak(prev, now)) {
        }

        Result<void> result = Result<void>::success();
        for (const auto& line : script.lines) {
            on_progress(line);
        }
        if (script.block_until_cancelled) {
            while (!cancel.waitFor(std::chrono::milliseconds(10))) {
            }
        } else if (script.delay.count() > 0) {
            cancel.waitFor(script.delay);
        }

        if (cancel.cancelled()) {
            result = Result<void>::failure(ErrorKind::kCancelled, "cancelled");
        } else if (script.error != ErrorKind::kOk) {
            result = Result<void>::failure(script.error, script.error_message);
        } else {
            // Replace any stale copy with the freshly pulled image.
            {
                std::lock_guard<std::mutex> lock(mutex);
                const auto wanted = normalizeImageRef(ref);
                images.erase(std::remove_if(images.begin(), images.end(),
                                            [&](const LocalImage& img) { return img.reference == wanted; }),
                             images.end());
            }
            addImage(ref, script.digest);
        }
        --active_pulls;
        return result;
    }

    Result<void> removeImage(const std::string& ref) override {
        std::lock_guard<std::mutex> lock(mutex);
        const auto wanted = normalizeImageRef(ref);
        auto it = std::find_if(images.begin(), images.end(),
                               [&](const LocalImage& img) { return img.reference == wanted; });
        if (it == images.end()) {
            return Result<void>::failure(ErrorKind::kNotFound, "no such image: " + ref);
        }
        images.erase(it);
        removed.push_back(wanted);
        return Result<void>::success();
    }

    Result<ContainerHandle> createAndStart(const RunRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (create_error != ErrorKind::kOk) {
            return Result<ContainerHandle>::failure(create_error, "create failed");
        }
        const auto wanted = normalizeImageRef(request.image);
        bool present = std::any_of(images.begin(), images.end(),
                                   [&](const LocalImage& img) { return img.reference == wanted; });
        if (!present) {
            return Result<ContainerHandle>::failure(ErrorKind::kImageNotFound, "no such image: " + request.image);
        }
        created.push_back(request);
        ContainerHandle handle;
        handle.id = "c" + std::to_string(created.size());
        handle.name = "fake-" + handle.id;
        handle.image = request.image;
        containers_[handle.id] = Container{container_script, false};
        return Result<ContainerHandle>::success(handle);
    }

    Result<void> streamLogs(const ContainerHandle& handle,
                            const LineCallback& on_line,
                            const CancelToken& cancel) override {
        ContainerScript script;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = containers_.find(handle.id);
            if (it == containers_.end()) {
                return Result<void>::failure(ErrorKind::kNotFound, "no such container");
            }
            script = it->second.script;
        }
        for (const auto& line : script.log_lines) {
            if (script.line_interval.count() > 0 && cancel.waitFor(script.line_interval)) {
                return Result<void>::failure(ErrorKind::kCancelled, "cancelled");
            }
            if (cancel.cancelled()) {
                return Result<void>::failure(ErrorKind::kCancelled, "cancelled");
            }
            on_line(line);
        }
        // Output ends when the container exits.
        std::unique_lock<std::mutex> lock(mutex);
        while (!containerExited(handle.id, script)) {
            if (cancel.cancelled()) {
                return Result<void>::failure(ErrorKind::kCancelled, "cancelled");
            }
            cv_.wait_for(lock, std::chrono::milliseconds(10));
        }
        return Result<void>::success();
    }

    Result<int> wait(const ContainerHandle& handle,
                     const CancelToken& cancel,
                     std::chrono::milliseconds timeout) override {
        const auto started = std::chrono::steady_clock::now();
        std::unique_lock<std::mutex> lock(mutex);
        auto it = containers_.find(handle.id);
        if (it == containers_.end()) {
            return Result<int>::failure(ErrorKind::kNotFound, "no such container");
        }
        const ContainerScript script = it->second.script;
        const auto finish_at = started + script.run_time;
        for (;;) {
            if (containers_[handle.id].killed) {
                return Result<int>::success(137);
            }
            if (!script.block_until_killed && std::chrono::steady_clock::now() >= finish_at) {
                containers_[handle.id].exited = true;
                cv_.notify_all();
                return Result<int>::success(script.exit_code);
            }
            if (cancel.cancelled() && !script.wait_ignores_cancel) {
                return Result<int>::failure(ErrorKind::kCancelled, "cancelled");
            }
            if (timeout.count() > 0 && std::chrono::steady_clock::now() - started >= timeout) {
                return Result<int>::failure(ErrorKind::kTimeout, "timed out");
            }
            cv_.wait_for(lock, std::chrono::milliseconds(10));
        }
    }

    Result<void> kill(const ContainerHandle& handle) override {
        std::lock_guard<std::mutex> lock(mutex);
        killed.push_back(handle.id);
        auto it = containers_.find(handle.id);
        if (it != containers_.end()) {
            it->second.killed = true;
        }
        cv_.notify_all();
        return Result<void>::success();
    }

    Result<void> releaseContainer(const ContainerHandle& handle) override {
        std::lock_guard<std::mutex> lock(mutex);
        released.push_back(handle.id);
        return Result<void>::success();
    }

    Result<std::vector<GpuDevice>> listGpus() override {
        ++list_gpus_calls;
        std::lock_guard<std::mutex> lock(mutex);
        if (list_gpus_error != ErrorKind::kOk) {
            return Result<std::vector<GpuDevice>>::failure(list_gpus_error, "gpu query failed");
        }
        return Result<std::vector<GpuDevice>>::success(gpus);
    }

private:
    struct Container {
        ContainerScript script;
        bool killed{false};
        bool exited{false};
    };

    // Caller holds mutex.
    bool containerExited(const std::string& id, const ContainerScript& script) {
        const auto& c = containers_[id];
        if (c.killed || c.exited) return true;
        return !script.block_until_killed && script.run_time.count() == 0;
    }

    std::condition_variable cv_;
    std::map<std::string, Container> containers_;
};

inline GpuDevice makeGpu(int id, bool available = true, size_t memory_bytes = 8ULL * 1024 * 1024 * 1024) {
    GpuDevice gpu;
    gpu.id = id;
    gpu.name = "NVIDIA Test GPU " + std::to_string(id);
    gpu.uuid = "GPU-" + std::to_string(id);
    gpu.memory_bytes = memory_bytes;
    gpu.vendor = "nvidia";
    gpu.is_available = available;
    return gpu;
}

}  // namespace mhub::test
