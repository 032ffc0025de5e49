#include "orchestrator/run_orchestrator.h"

#include <algorithm>
#include <vector>

#include <spdlog/spdlog.h>

#include "engine/image_ref.h"
#include "utils/job_id.h"

namespace mhub {

namespace {

bool imagePresent(const std::vector<LocalImage>& images, const std::string& ref) {
    const auto wanted = normalizeImageRef(ref);
    return std::any_of(images.begin(), images.end(),
                       [&](const LocalImage& img) { return normalizeImageRef(img.reference) == wanted; });
}

// Completion flag shared between a job thread and its log pump.
struct PumpState {
    std::mutex mutex;
    std::condition_variable cv;
    bool done{false};
};

}  // namespace

RunOrchestrator::RunOrchestrator(EngineClient& engine,
                                 JobRegistry& registry,
                                 ImageLockTable& image_locks,
                                 OrchestratorConfig config)
    : engine_(engine)
    , registry_(registry)
    , image_locks_(image_locks)
    , config_(std::move(config)) {}

RunOrchestrator::~RunOrchestrator() {
    shutdown();
}

Result<std::string> RunOrchestrator::submit(RunRequest request) {
    if (request.image.empty()) {
        return Result<std::string>::failure(ErrorKind::kInvalidArgument, "image reference is empty");
    }
    reapFinished();

    auto ctx = std::make_shared<JobContext>();
    ctx->logs = std::make_shared<LogBuffer>(config_.max_log_lines);
    ctx->info.id = generate_job_id();
    ctx->info.request = std::move(request);
    ctx->info.state = JobState::Queued;
    ctx->info.history.push_back(JobState::Queued);
    ctx->info.created_at = std::chrono::system_clock::now();

    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        if (shutting_down_) {
            return Result<std::string>::failure(ErrorKind::kInvalidArgument, "orchestrator is shutting down");
        }
        while (jobs_.count(ctx->info.id) > 0) {
            ctx->info.id = generate_job_id();
        }
        registry_.insert(ctx->info, ctx->logs);
        jobs_[ctx->info.id] = ctx;
        // Started under jobs_mutex_ so shutdown() always sees a joinable thread.
        ctx->thread = std::thread([this, ctx]() {
            runJob(ctx);
            ctx->thread_done = true;
        });
    }

    spdlog::info("Job {} submitted: image={} input={} output={}", ctx->info.id, ctx->info.request.image,
                 ctx->info.request.input_path, ctx->info.request.output_path);
    return Result<std::string>::success(ctx->info.id);
}

bool RunOrchestrator::transitionLocked(JobContext& ctx, JobState next, ErrorKind failure,
                                       const std::string& message) {
    if (is_terminal(ctx.info.state)) {
        return false;
    }
    const bool terminal = is_terminal(next);
    if (terminal) {
        // Subscribers must see end-of-stream before anyone observes the terminal state.
        ctx.logs->close();
        ctx.info.finished_at = std::chrono::system_clock::now();
        ctx.info.failure = failure;
    }
    if (next == JobState::Running) {
        ctx.info.started_at = std::chrono::system_clock::now();
    }
    if (!message.empty()) {
        ctx.info.message = message;
    }
    ctx.info.state = next;
    ctx.info.history.push_back(next);
    registry_.update(ctx.info);
    ctx.cv.notify_all();

    if (next == JobState::Failed) {
        spdlog::warn("Job {} failed ({}): {}", ctx.info.id, to_string(failure), message);
    } else {
        spdlog::info("Job {} -> {}", ctx.info.id, to_string(next));
    }
    return true;
}

bool RunOrchestrator::transition(JobContext& ctx, JobState next, ErrorKind failure, const std::string& message) {
    std::lock_guard<std::mutex> lock(ctx.mutex);
    return transitionLocked(ctx, next, failure, message);
}

void RunOrchestrator::stopContainer(const ContainerHandle& handle, const std::string& job_id) {
    auto res = engine_.kill(handle);
    if (!res.ok() && res.error != ErrorKind::kNotFound) {
        spdlog::warn("Job {}: failed to kill container {}: {}", job_id, handle.name, res.error_message);
    }
}

void RunOrchestrator::releaseContainer(const ContainerHandle& handle, const std::string& job_id) {
    auto res = engine_.releaseContainer(handle);
    if (!res.ok()) {
        spdlog::warn("Job {}: failed to release container {}: {}", job_id, handle.name, res.error_message);
    }
}

std::chrono::milliseconds RunOrchestrator::stopBudget(JobContext& ctx) {
    const auto now = std::chrono::steady_clock::now();
    std::chrono::steady_clock::time_point deadline;
    {
        std::lock_guard<std::mutex> lock(ctx.mutex);
        deadline = ctx.stop_deadline.value_or(now + config_.grace_period);
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    return std::max(std::chrono::milliseconds(0), std::min(left, config_.log_drain_timeout));
}

void RunOrchestrator::handleCancellation(JobContext& ctx) {
    std::optional<ContainerHandle> handle;
    {
        std::lock_guard<std::mutex> lock(ctx.mutex);
        transitionLocked(ctx, JobState::Killed, ErrorKind::kCancelled, "cancelled");
        handle = ctx.handle;
    }
    if (handle) {
        stopContainer(*handle, ctx.info.id);
    }
}

void RunOrchestrator::runJob(const std::shared_ptr<JobContext>& ctx_ptr) {
    JobContext& ctx = *ctx_ptr;
    const std::string job_id = ctx.info.id;
    const RunRequest request = ctx.info.request;

    // Bad mounts fail before any lease wait or pull.
    auto mounts = validateMounts(request);
    if (!mounts.ok()) {
        if (transition(ctx, JobState::Starting)) {
            transition(ctx, JobState::Failed, mounts.error, mounts.error_message);
        }
        return;
    }

    // Queued: optionally wait for exclusive use of the input volume.
    std::unique_ptr<VolumeLease> lease;
    if (!config_.allow_concurrent_input) {
        lease = volume_leases_.acquire(request.input_path, ctx.cancel);
        if (!lease) {
            handleCancellation(ctx);
            return;
        }
    }
    if (ctx.cancel.cancelled()) {
        handleCancellation(ctx);
        return;
    }

    auto images = engine_.listImages();
    if (!images.ok()) {
        transition(ctx, JobState::Failed, ErrorKind::kEngineUnavailable, images.error_message);
        return;
    }

    if (!imagePresent(*images.data, request.image) && config_.auto_pull) {
        if (!transition(ctx, JobState::Pulling)) return;

        auto pulling = image_locks_.markPulling(request.image);
        auto image_lock = image_locks_.acquire(request.image, &ctx.cancel);
        if (!image_lock) {
            handleCancellation(ctx);
            return;
        }

        // Another job may have pulled the image while we waited for the lock.
        auto again = engine_.listImages();
        if (!again.ok() || !imagePresent(*again.data, request.image)) {
            auto pulled = engine_.pullImage(
                request.image, [&ctx](const std::string& line) { ctx.logs->append(line); }, ctx.cancel);
            if (!pulled.ok()) {
                if (pulled.error == ErrorKind::kCancelled || ctx.cancel.cancelled()) {
                    handleCancellation(ctx);
                } else {
                    transition(ctx, JobState::Failed, ErrorKind::kPullError, pulled.error_message);
                }
                return;
            }
        }
    }

    if (ctx.cancel.cancelled()) {
        handleCancellation(ctx);
        return;
    }
    if (!transition(ctx, JobState::Starting)) return;

    auto created = engine_.createAndStart(request);
    if (!created.ok()) {
        if (ctx.cancel.cancelled()) {
            handleCancellation(ctx);
        } else {
            transition(ctx, JobState::Failed, created.error, created.error_message);
        }
        return;
    }
    const ContainerHandle handle = *created.data;

    {
        std::lock_guard<std::mutex> lock(ctx.mutex);
        ctx.handle = handle;
        ctx.info.container_id = handle.id;
        if (!ctx.cancel.cancelled()) {
            transitionLocked(ctx, JobState::Running, ErrorKind::kOk, {});
        }
    }
    if (ctx.cancel.cancelled()) {
        // Created after cancellation was requested: stop it immediately.
        handleCancellation(ctx);
        releaseContainer(handle, job_id);
        return;
    }

    // Running: pump container output into the job log while we wait for exit.
    CancelToken pump_cancel;
    auto pump_state = std::make_shared<PumpState>();
    std::thread pump([this, handle, pump_cancel, pump_state, logs = ctx.logs, job_id]() {
        auto res = engine_.streamLogs(handle, [&logs](const std::string& line) { logs->append(line); },
                                      pump_cancel);
        if (!res.ok() && res.error != ErrorKind::kCancelled) {
            spdlog::warn("Job {}: log stream ended with error: {}", job_id, res.error_message);
        }
        {
            std::lock_guard<std::mutex> lock(pump_state->mutex);
            pump_state->done = true;
        }
        pump_state->cv.notify_all();
    });

    auto drain = [&](std::chrono::milliseconds timeout) {
        {
            std::unique_lock<std::mutex> lock(pump_state->mutex);
            if (!pump_state->cv.wait_for(lock, timeout, [&]() { return pump_state->done; })) {
                spdlog::warn("Job {}: log stream did not finish within {} ms", job_id, timeout.count());
            }
        }
        pump_cancel.cancel();
        pump.join();
    };

    const auto run_timeout = request.run_timeout.count() > 0 ? request.run_timeout : config_.run_timeout;
    auto waited = engine_.wait(handle, ctx.cancel, std::chrono::duration_cast<std::chrono::milliseconds>(run_timeout));

    if (!waited.ok()) {
        if (waited.error == ErrorKind::kCancelled || ctx.cancel.cancelled()) {
            // Lines the container already wrote land before Killed is published.
            stopContainer(handle, job_id);
            drain(stopBudget(ctx));
            transition(ctx, JobState::Killed, ErrorKind::kCancelled, "cancelled");
        } else if (waited.error == ErrorKind::kTimeout) {
            stopContainer(handle, job_id);
            drain(config_.log_drain_timeout);
            transition(ctx, JobState::Failed, ErrorKind::kTimeout,
                       "run exceeded " + std::to_string(run_timeout.count()) + "s");
        } else {
            stopContainer(handle, job_id);
            drain(config_.log_drain_timeout);
            transition(ctx, JobState::Failed, waited.error, waited.error_message);
        }
        releaseContainer(handle, job_id);
        return;
    }

    const int exit_code = *waited.data;
    drain(config_.log_drain_timeout);
    releaseContainer(handle, job_id);

    std::lock_guard<std::mutex> lock(ctx.mutex);
    if (is_terminal(ctx.info.state)) {
        return;
    }
    ctx.info.exit_code = exit_code;
    if (exit_code == 0) {
        transitionLocked(ctx, JobState::Completed, ErrorKind::kOk, {});
    } else {
        transitionLocked(ctx, JobState::Failed, ErrorKind::kContainerFailed,
                         "container exited with code " + std::to_string(exit_code));
    }
}

std::shared_ptr<RunOrchestrator::JobContext> RunOrchestrator::findContext(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(job_id);
    return it == jobs_.end() ? nullptr : it->second;
}

Result<void> RunOrchestrator::cancel(const std::string& job_id) {
    const auto deadline = std::chrono::steady_clock::now() + config_.grace_period;
    auto signalled = signalStop(job_id, deadline);
    if (!signalled.ok()) return signalled;
    return awaitStop(job_id, deadline);
}

Result<void> RunOrchestrator::signalStop(const std::string& job_id,
                                         std::chrono::steady_clock::time_point deadline) {
    auto ctx = findContext(job_id);
    if (!ctx) {
        auto info = registry_.get(job_id);
        if (info.ok() && is_terminal(info.data->state)) {
            return Result<void>::failure(ErrorKind::kAlreadyTerminal, "job already " +
                                         std::string(to_string(info.data->state)));
        }
        return Result<void>::failure(ErrorKind::kNotFound, "unknown job: " + job_id);
    }

    std::lock_guard<std::mutex> lock(ctx->mutex);
    if (is_terminal(ctx->info.state)) {
        return Result<void>::failure(ErrorKind::kAlreadyTerminal,
                                     "job already " + std::string(to_string(ctx->info.state)));
    }
    if (!ctx->cancel.cancelled()) {
        spdlog::info("Cancelling job {}", job_id);
        ctx->stop_deadline = deadline;
        ctx->cancel.cancel();
    }
    return Result<void>::success();
}

Result<void> RunOrchestrator::awaitStop(const std::string& job_id,
                                        std::chrono::steady_clock::time_point deadline) {
    auto ctx = findContext(job_id);
    if (!ctx) {
        // Already reaped, so already terminal.
        return Result<void>::success();
    }

    std::optional<ContainerHandle> orphan;
    {
        std::unique_lock<std::mutex> lock(ctx->mutex);
        bool done = ctx->cv.wait_until(lock, deadline, [&]() { return is_terminal(ctx->info.state); });
        if (!done) {
            spdlog::warn("Job {} did not stop within {} ms; marking killed", job_id, config_.grace_period.count());
            transitionLocked(*ctx, JobState::Killed, ErrorKind::kCancelled, "killed after grace period");
            orphan = ctx->handle;
        }
    }
    if (orphan) {
        stopContainer(*orphan, job_id);
    }
    return Result<void>::success();
}

KillAllReport RunOrchestrator::killAll() {
    const auto deadline = std::chrono::steady_clock::now() + config_.grace_period;
    return registry_.killAll([this, deadline](const std::string& id) { return signalStop(id, deadline); },
                             [this, deadline](const std::string& id) { return awaitStop(id, deadline); });
}

Result<LogSubscription> RunOrchestrator::subscribeLogs(const std::string& job_id, bool from_start) {
    auto logs = registry_.logs(job_id);
    if (!logs.ok()) return Result<LogSubscription>::from(logs);
    auto& buffer = *logs.data;
    return Result<LogSubscription>::success(from_start ? buffer->subscribeFromStart() : buffer->subscribe());
}

void RunOrchestrator::reapFinished() {
    std::vector<std::shared_ptr<JobContext>> finished;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        for (auto it = jobs_.begin(); it != jobs_.end();) {
            if (it->second->thread_done) {
                finished.push_back(it->second);
                it = jobs_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& ctx : finished) {
        if (ctx->thread.joinable()) ctx->thread.join();
    }
}

void RunOrchestrator::shutdown() {
    std::vector<std::shared_ptr<JobContext>> all;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        if (shutting_down_ && jobs_.empty()) return;
        shutting_down_ = true;
        for (auto& [id, ctx] : jobs_) {
            all.push_back(ctx);
        }
        jobs_.clear();
    }

    // Signal everyone first so the grace periods overlap.
    const auto deadline = std::chrono::steady_clock::now() + config_.grace_period;
    for (auto& ctx : all) {
        std::lock_guard<std::mutex> lock(ctx->mutex);
        if (!is_terminal(ctx->info.state) && !ctx->cancel.cancelled()) {
            ctx->stop_deadline = deadline;
            ctx->cancel.cancel();
        }
    }

    for (auto& ctx : all) {
        std::optional<ContainerHandle> orphan;
        {
            std::unique_lock<std::mutex> lock(ctx->mutex);
            if (!ctx->cv.wait_until(lock, deadline, [&]() { return is_terminal(ctx->info.state); })) {
                transitionLocked(*ctx, JobState::Killed, ErrorKind::kCancelled, "killed at shutdown");
                orphan = ctx->handle;
            }
        }
        if (orphan) stopContainer(*orphan, ctx->info.id);
    }

    for (auto& ctx : all) {
        if (ctx->thread.joinable()) ctx->thread.join();
    }
    if (!all.empty()) {
        spdlog::info("Orchestrator stopped ({} job thread(s) joined)", all.size());
    }
}

}  // namespace mhub
