#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "engine/engine_client.h"
#include "utils/subprocess.h"

namespace mhub {

/// EngineClient driving the rootless `udocker` CLI.
///
/// udocker has no daemon: a container runs as a foreground `udocker run`
/// child process owned by this client, so log streaming, wait and kill act
/// on that process. udocker cannot mount read-only or disable networking.
class UDockerEngineClient : public EngineClient {
public:
    explicit UDockerEngineClient(EngineConfig config);
    ~UDockerEngineClient() override;

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
    struct RunningContainer {
        std::shared_ptr<Subprocess> process;
        std::string executable;
    };

    std::shared_ptr<Subprocess> processFor(const std::string& id) const;

    EngineConfig config_;
    std::string executable_;

    mutable std::mutex mutex_;
    std::map<std::string, RunningContainer> running_;
};

}  // namespace mhub
