#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "core/error.h"
#include "engine/engine_types.h"

namespace mhub {

enum class JobState {
    Queued,
    Pulling,
    Starting,
    Running,
    Completed,
    Failed,
    Killed,
};

inline const char* to_string(JobState state) {
    switch (state) {
        case JobState::Queued:
            return "queued";
        case JobState::Pulling:
            return "pulling";
        case JobState::Starting:
            return "starting";
        case JobState::Running:
            return "running";
        case JobState::Completed:
            return "completed";
        case JobState::Failed:
            return "failed";
        case JobState::Killed:
            return "killed";
    }
    return "unknown";
}

inline bool is_terminal(JobState state) {
    return state == JobState::Completed || state == JobState::Failed || state == JobState::Killed;
}

/// Read-only snapshot of a job, as stored in the JobRegistry.
struct JobInfo {
    std::string id;
    RunRequest request;
    JobState state{JobState::Queued};
    std::vector<JobState> history;
    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;
    std::optional<int> exit_code;
    ErrorKind failure{ErrorKind::kOk};
    std::string message;
    std::string container_id;
};

}  // namespace mhub
