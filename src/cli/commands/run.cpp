#include "cli/commands.h"

#include <chrono>
#include <iostream>

#include <spdlog/spdlog.h>

namespace mhub {
namespace cli {
namespace commands {

int run(RunnerBackend& backend, const RunOptions& options, const std::atomic<bool>& interrupted) {
    auto request = backend.buildModelRequest(options.model, options.input, options.output,
                                             options.gpus, options.extra_args);
    if (!request.ok()) {
        return reportError(request.error, request.error_message);
    }
    request.data->run_timeout = std::chrono::seconds(options.timeout_secs);

    auto submitted = backend.submit(std::move(*request.data));
    if (!submitted.ok()) {
        return reportError(submitted.error, submitted.error_message);
    }
    const std::string job_id = *submitted.data;
    std::cerr << "Job " << job_id << " submitted (" << options.model << ")" << std::endl;

    auto subscription = backend.subscribeLogs(job_id, /*from_start=*/true);
    if (!subscription.ok()) {
        return reportError(subscription.error, subscription.error_message);
    }

    bool cancel_sent = false;
    std::string line;
    for (;;) {
        auto st = subscription.data->next(line, std::chrono::milliseconds(200));
        if (st == LogSubscription::Status::kLine) {
            std::cout << line << std::endl;
        } else if (st == LogSubscription::Status::kEnd) {
            break;
        }
        if (interrupted.load() && !cancel_sent) {
            cancel_sent = true;
            std::cerr << "Cancelling job " << job_id << "..." << std::endl;
            auto cancelled = backend.cancel(job_id);
            if (!cancelled.ok() && cancelled.error != ErrorKind::kAlreadyTerminal) {
                spdlog::warn("Cancel of job {} failed: {}", job_id, cancelled.error_message);
            }
        }
    }

    auto job = backend.getJob(job_id);
    if (!job.ok()) {
        return reportError(job.error, job.error_message);
    }

    switch (job.data->state) {
        case JobState::Completed:
            std::cerr << "Job " << job_id << " completed" << std::endl;
            return 0;
        case JobState::Killed:
            std::cerr << "Job " << job_id << " killed" << std::endl;
            return kExitInterrupted;
        case JobState::Failed:
            if (job.data->failure == ErrorKind::kContainerFailed && job.data->exit_code) {
                std::cerr << "Error: container exited with code " << *job.data->exit_code << std::endl;
                return 1;
            }
            return reportError(job.data->failure, job.data->message);
        default:
            // The log stream only ends once the job is terminal.
            std::cerr << "Error: job " << job_id << " ended in state " << to_string(job.data->state) << std::endl;
            return 1;
    }
}

}  // namespace commands
}  // namespace cli
}  // namespace mhub
