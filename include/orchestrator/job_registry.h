#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/error.h"
#include "orchestrator/job.h"
#include "orchestrator/log_buffer.h"

namespace mhub {

struct KillAllReport {
    struct Entry {
        std::string job_id;
        ErrorKind outcome{ErrorKind::kOk};
        std::string message;
    };

    std::vector<Entry> entries;
    size_t killed{0};
    size_t already_terminal{0};
    size_t failed{0};
};

/// Process-wide job table. Safe for concurrent readers and writers.
class JobRegistry {
public:
    using CancelFn = std::function<Result<void>(const std::string& job_id)>;

    void insert(const JobInfo& info, std::shared_ptr<LogBuffer> logs);

    // Replace the stored snapshot. Unknown ids are ignored.
    void update(const JobInfo& info);

    Result<JobInfo> get(const std::string& id) const;

    // All jobs in creation order.
    std::vector<JobInfo> list() const;

    Result<std::shared_ptr<LogBuffer>> logs(const std::string& id) const;

    // Evict a terminal job. kInvalidArgument while it is still active.
    Result<void> clear(const std::string& id);

    // Evict every terminal job. Returns the number removed.
    size_t clearAll();

    // Stop every non-terminal job in two passes: signal_fn for all of them,
    // then wait_fn for each one signalled, so their waits overlap. Terminal
    // jobs are reported kAlreadyTerminal; a failing job does not stop the rest.
    KillAllReport killAll(const CancelFn& signal_fn, const CancelFn& wait_fn);

    size_t activeCount() const;

private:
    struct Entry {
        JobInfo info;
        std::shared_ptr<LogBuffer> logs;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> jobs_;
    std::vector<std::string> order_;
};

}  // namespace mhub
