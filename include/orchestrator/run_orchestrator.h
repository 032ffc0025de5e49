#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "core/cancel_token.h"
#include "core/error.h"
#include "engine/engine_client.h"
#include "orchestrator/job.h"
#include "orchestrator/job_registry.h"
#include "orchestrator/log_buffer.h"
#include "orchestrator/resource_locks.h"
#include "utils/config.h"

namespace mhub {

/// Drives each submitted job through
/// Queued -> Pulling? -> Starting -> Running -> {Completed, Failed, Killed}
/// on its own thread.
///
/// Transitions are monotonic; once a job is terminal nothing changes it.
/// The job log is closed before a terminal state becomes visible, so every
/// subscriber receives all lines before end-of-stream.
class RunOrchestrator {
public:
    RunOrchestrator(EngineClient& engine,
                    JobRegistry& registry,
                    ImageLockTable& image_locks,
                    OrchestratorConfig config);
    ~RunOrchestrator();

    RunOrchestrator(const RunOrchestrator&) = delete;
    RunOrchestrator& operator=(const RunOrchestrator&) = delete;

    // Register a job and start it. Never blocks on the engine.
    Result<std::string> submit(RunRequest request);

    // Ok, kNotFound or kAlreadyTerminal. Waits at most the grace period.
    Result<void> cancel(const std::string& job_id);

    // Every active job is signalled first; all of them share one grace period.
    KillAllReport killAll();

    // Lines from now on (or from the first line), ending when the job is terminal.
    Result<LogSubscription> subscribeLogs(const std::string& job_id, bool from_start = false);

    // Cancel all active jobs and join every job thread.
    void shutdown();

    const OrchestratorConfig& config() const { return config_; }

private:
    struct JobContext {
        std::mutex mutex;
        std::condition_variable cv;
        JobInfo info;
        CancelToken cancel;
        std::optional<ContainerHandle> handle;
        // Set when cancellation is requested; the job must be terminal by then.
        std::optional<std::chrono::steady_clock::time_point> stop_deadline;
        std::shared_ptr<LogBuffer> logs;
        std::thread thread;
        std::atomic<bool> thread_done{false};
    };

    void runJob(const std::shared_ptr<JobContext>& ctx);

    // Returns false when the job is already terminal. Caller holds ctx.mutex.
    bool transitionLocked(JobContext& ctx, JobState next, ErrorKind failure, const std::string& message);
    bool transition(JobContext& ctx, JobState next,
                    ErrorKind failure = ErrorKind::kOk, const std::string& message = {});

    // Mark Killed, then stop the container if one exists. Only for phases
    // without a running log pump.
    void handleCancellation(JobContext& ctx);

    // Time left for draining logs after a cancel, capped by log_drain_timeout.
    std::chrono::milliseconds stopBudget(JobContext& ctx);

    // Request cancellation; the job must be terminal by deadline.
    Result<void> signalStop(const std::string& job_id, std::chrono::steady_clock::time_point deadline);
    // Wait for a signalled job, forcing Killed once the deadline passes.
    Result<void> awaitStop(const std::string& job_id, std::chrono::steady_clock::time_point deadline);

    void stopContainer(const ContainerHandle& handle, const std::string& job_id);
    void releaseContainer(const ContainerHandle& handle, const std::string& job_id);

    // Join and drop contexts whose thread has finished.
    void reapFinished();

    std::shared_ptr<JobContext> findContext(const std::string& job_id);

    EngineClient& engine_;
    JobRegistry& registry_;
    ImageLockTable& image_locks_;
    OrchestratorConfig config_;
    VolumeLeaseTable volume_leases_;

    std::mutex jobs_mutex_;
    std::map<std::string, std::shared_ptr<JobContext>> jobs_;
    bool shutting_down_{false};
};

}  // namespace mhub
