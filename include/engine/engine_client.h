#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "core/cancel_token.h"
#include "core/error.h"
#include "engine/engine_types.h"
#include "utils/config.h"

namespace mhub {

/// Capability interface over a local container engine.
///
/// Blocking calls (pullImage, streamLogs, wait) take a CancelToken and return
/// ErrorKind::kCancelled promptly once it fires. Mutating calls are never
/// retried by the client.
class EngineClient {
public:
    virtual ~EngineClient() = default;

    virtual BackendInfo info() = 0;

    virtual Result<std::vector<LocalImage>> listImages() = 0;

    /// Every output line of the pull is passed to on_progress in order.
    virtual Result<void> pullImage(const std::string& ref,
                                   const LineCallback& on_progress,
                                   const CancelToken& cancel) = 0;

    virtual Result<void> removeImage(const std::string& ref) = 0;

    /// Input is mounted read-only, output read-write. No handle is created on failure.
    virtual Result<ContainerHandle> createAndStart(const RunRequest& request) = 0;

    /// Returns Ok once the container exits and all output was delivered.
    virtual Result<void> streamLogs(const ContainerHandle& handle,
                                    const LineCallback& on_line,
                                    const CancelToken& cancel) = 0;

    /// timeout of zero waits without bound.
    virtual Result<int> wait(const ContainerHandle& handle,
                             const CancelToken& cancel,
                             std::chrono::milliseconds timeout) = 0;

    /// Idempotent: killing an exited container succeeds.
    virtual Result<void> kill(const ContainerHandle& handle) = 0;

    /// Removes the stopped container record. Idempotent.
    virtual Result<void> releaseContainer(const ContainerHandle& handle) = 0;

    virtual Result<std::vector<GpuDevice>> listGpus() = 0;
};

// Build the client for config.backend.
std::unique_ptr<EngineClient> createEngineClient(const EngineConfig& config);

// Check that both mount sources exist and are directories.
Result<void> validateMounts(const RunRequest& request);

// Absolute, lexically normalized mount source. Engines read a relative
// `-v` source as a named volume.
std::string absoluteMountPath(const std::string& path);

}  // namespace mhub
