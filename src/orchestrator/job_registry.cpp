#include "orchestrator/job_registry.h"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace mhub {

void JobRegistry::insert(const JobInfo& info, std::shared_ptr<LogBuffer> logs) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = jobs_.emplace(info.id, Entry{info, std::move(logs)});
    if (inserted) {
        order_.push_back(info.id);
    } else {
        spdlog::warn("Job {} registered twice", info.id);
    }
}

void JobRegistry::update(const JobInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(info.id);
    if (it == jobs_.end()) return;
    it->second.info = info;
}

Result<JobInfo> JobRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Result<JobInfo>::failure(ErrorKind::kNotFound, "unknown job: " + id);
    }
    return Result<JobInfo>::success(it->second.info);
}

std::vector<JobInfo> JobRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobInfo> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        auto it = jobs_.find(id);
        if (it != jobs_.end()) out.push_back(it->second.info);
    }
    return out;
}

Result<std::shared_ptr<LogBuffer>> JobRegistry::logs(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Result<std::shared_ptr<LogBuffer>>::failure(ErrorKind::kNotFound, "unknown job: " + id);
    }
    return Result<std::shared_ptr<LogBuffer>>::success(it->second.logs);
}

Result<void> JobRegistry::clear(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Result<void>::failure(ErrorKind::kNotFound, "unknown job: " + id);
    }
    if (!is_terminal(it->second.info.state)) {
        return Result<void>::failure(ErrorKind::kInvalidArgument,
                                     "job " + id + " is still " + to_string(it->second.info.state));
    }
    jobs_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    return Result<void>::success();
}

size_t JobRegistry::clearAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = order_.begin(); it != order_.end();) {
        auto job = jobs_.find(*it);
        if (job != jobs_.end() && is_terminal(job->second.info.state)) {
            jobs_.erase(job);
            it = order_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

KillAllReport JobRegistry::killAll(const CancelFn& signal_fn, const CancelFn& wait_fn) {
    // Snapshot first: the callbacks re-enter the registry through update().
    std::vector<std::pair<std::string, JobState>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& id : order_) {
            auto it = jobs_.find(id);
            if (it != jobs_.end()) targets.emplace_back(id, it->second.info.state);
        }
    }

    KillAllReport report;
    report.entries.reserve(targets.size());
    std::vector<size_t> signalled;
    for (const auto& [id, state] : targets) {
        KillAllReport::Entry entry;
        entry.job_id = id;
        if (is_terminal(state)) {
            entry.outcome = ErrorKind::kAlreadyTerminal;
        } else {
            auto res = signal_fn(id);
            entry.outcome = res.error;
            entry.message = res.error_message;
            if (res.ok()) signalled.push_back(report.entries.size());
        }
        report.entries.push_back(std::move(entry));
    }

    for (size_t index : signalled) {
        auto& entry = report.entries[index];
        auto res = wait_fn(entry.job_id);
        entry.outcome = res.error;
        entry.message = res.error_message;
    }

    for (const auto& entry : report.entries) {
        if (entry.outcome == ErrorKind::kOk) {
            ++report.killed;
        } else if (entry.outcome == ErrorKind::kAlreadyTerminal) {
            ++report.already_terminal;
        } else {
            ++report.failed;
            spdlog::warn("killAll: failed to cancel job {}: {}", entry.job_id, entry.message);
        }
    }
    spdlog::info("killAll: {} killed, {} already terminal, {} failed",
                 report.killed, report.already_terminal, report.failed);
    return report;
}

size_t JobRegistry::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(jobs_.begin(), jobs_.end(), [](const auto& kv) {
        return !is_terminal(kv.second.info.state);
    }));
}

}  // namespace mhub
