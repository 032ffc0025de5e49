#pragma once

#include <map>
#include <mutex>
#include <string>

#include "engine/engine_client.h"

namespace mhub {

/// EngineClient driving the `docker` CLI.
class DockerEngineClient : public EngineClient {
public:
    explicit DockerEngineClient(EngineConfig config);

    BackendInfo info() override;
    Result<std::vector<LocalImage>> listImages() override;
    Result<void> pullImage(const std::string& ref,
                           const LineCallback& on_progress,
                           const CancelToken& cancel) override;
    Result<void> removeImage(const std::string& ref) override;
    Result<ContainerHandle> createAndStart(const RunRequest& request) override;
    Result<void> streamLogs(const ContainerHandle& handle,
                            const LineCallback& on_line,
                            const CancelToken& cancel) override;
    Result<int> wait(const ContainerHandle& handle,
                     const CancelToken& cancel,
                     std::chrono::milliseconds timeout) override;
    Result<void> kill(const ContainerHandle& handle) override;
    Result<void> releaseContainer(const ContainerHandle& handle) override;
    Result<std::vector<GpuDevice>> listGpus() override;

    const std::string& executable() const { return executable_; }

private:
    // Executable used for a container (a per-run override sticks to its container).
    std::string executableFor(const ContainerHandle& handle) const;

    EngineConfig config_;
    std::string executable_;

    mutable std::mutex overrides_mutex_;
    std::map<std::string, std::string> container_executables_;
};

}  // namespace mhub
