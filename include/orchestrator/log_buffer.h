#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mhub {

class LogBuffer;

/// Ordered cursor over a LogBuffer. Move-only; detach() may be called from
/// another thread to wake a blocked next(). A cursor that falls behind the
/// buffer's line cap resumes at the oldest retained line.
class LogSubscription {
public:
    enum class Status {
        kLine,
        kEnd,
        kTimeout,
    };

    LogSubscription() = default;
    LogSubscription(std::shared_ptr<LogBuffer> buffer, size_t cursor);
    ~LogSubscription();

    LogSubscription(LogSubscription&& other) noexcept;
    LogSubscription& operator=(LogSubscription&& other) noexcept;
    LogSubscription(const LogSubscription&) = delete;
    LogSubscription& operator=(const LogSubscription&) = delete;

    // Block for the next line. nullopt once the buffer is closed and drained,
    // or after detach().
    std::optional<std::string> next();

    Status next(std::string& line, std::chrono::milliseconds timeout);

    void detach();

    bool valid() const { return buffer_ != nullptr; }

private:
    // Caller holds buffer_->mutex_.
    bool lineReady() const;
    std::string takeLine();

    std::shared_ptr<LogBuffer> buffer_;
    size_t cursor_{0};
    std::shared_ptr<bool> detached_;
};

/// Append-only job log. Lines appended after close() are dropped. With a
/// non-zero max_lines only the newest max_lines lines are retained.
class LogBuffer : public std::enable_shared_from_this<LogBuffer> {
public:
    explicit LogBuffer(size_t max_lines = 0) : max_lines_(max_lines) {}

    void append(const std::string& line);
    void close();
    bool closed() const;

    // Retained lines, oldest first.
    std::vector<std::string> snapshot() const;
    size_t size() const;

    // Lines evicted by the cap so far.
    size_t dropped() const;

    // Subscribe from the current end of the log.
    LogSubscription subscribe();

    // Subscribe from the first line.
    LogSubscription subscribeFromStart();

private:
    friend class LogSubscription;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    // Cursors count from the first line ever appended; lines_[0] is line dropped_.
    std::deque<std::string> lines_;
    size_t dropped_{0};
    size_t max_lines_{0};
    bool closed_{false};
};

}  // namespace mhub
