#include "orchestrator/log_buffer.h"

namespace mhub {

LogSubscription::LogSubscription(std::shared_ptr<LogBuffer> buffer, size_t cursor)
    : buffer_(std::move(buffer)), cursor_(cursor), detached_(std::make_shared<bool>(false)) {}

LogSubscription::~LogSubscription() = default;

LogSubscription::LogSubscription(LogSubscription&& other) noexcept
    : buffer_(std::move(other.buffer_)), cursor_(other.cursor_), detached_(std::move(other.detached_)) {}

LogSubscription& LogSubscription::operator=(LogSubscription&& other) noexcept {
    if (this != &other) {
        buffer_ = std::move(other.buffer_);
        cursor_ = other.cursor_;
        detached_ = std::move(other.detached_);
    }
    return *this;
}

bool LogSubscription::lineReady() const {
    return cursor_ < buffer_->dropped_ + buffer_->lines_.size();
}

std::string LogSubscription::takeLine() {
    if (cursor_ < buffer_->dropped_) {
        cursor_ = buffer_->dropped_;
    }
    return buffer_->lines_[cursor_++ - buffer_->dropped_];
}

std::optional<std::string> LogSubscription::next() {
    if (!buffer_) return std::nullopt;
    std::unique_lock<std::mutex> lock(buffer_->mutex_);
    buffer_->cv_.wait(lock, [this]() { return *detached_ || lineReady() || buffer_->closed_; });
    if (*detached_ || !lineReady()) {
        return std::nullopt;
    }
    return takeLine();
}

LogSubscription::Status LogSubscription::next(std::string& line, std::chrono::milliseconds timeout) {
    if (!buffer_) return Status::kEnd;
    std::unique_lock<std::mutex> lock(buffer_->mutex_);
    bool ready = buffer_->cv_.wait_for(lock, timeout, [this]() {
        return *detached_ || lineReady() || buffer_->closed_;
    });
    if (!ready) return Status::kTimeout;
    if (*detached_ || !lineReady()) {
        return Status::kEnd;
    }
    line = takeLine();
    return Status::kLine;
}

void LogSubscription::detach() {
    if (!buffer_) return;
    {
        std::lock_guard<std::mutex> lock(buffer_->mutex_);
        *detached_ = true;
    }
    buffer_->cv_.notify_all();
}

void LogBuffer::append(const std::string& line) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        lines_.push_back(line);
        if (max_lines_ > 0 && lines_.size() > max_lines_) {
            lines_.pop_front();
            ++dropped_;
        }
    }
    cv_.notify_all();
}

void LogBuffer::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool LogBuffer::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::vector<std::string> LogBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(lines_.begin(), lines_.end());
}

size_t LogBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

size_t LogBuffer::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

LogSubscription LogBuffer::subscribe() {
    std::lock_guard<std::mutex> lock(mutex_);
    return LogSubscription(shared_from_this(), dropped_ + lines_.size());
}

LogSubscription LogBuffer::subscribeFromStart() {
    return LogSubscription(shared_from_this(), 0);
}

}  // namespace mhub
