#include "orchestrator/resource_locks.h"

#include <chrono>
#include <filesystem>

#include "engine/image_ref.h"

namespace mhub {

namespace {
constexpr std::chrono::milliseconds kLockPoll{50};
}  // namespace

PullingMark::~PullingMark() {
    table_->clearPulling(ref_);
}

std::optional<ImageLock> ImageLockTable::acquire(const std::string& ref, const CancelToken* cancel) {
    std::shared_ptr<std::timed_mutex> m;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = locks_[normalizeImageRef(ref)];
        if (!slot) slot = std::make_shared<std::timed_mutex>();
        m = slot;
    }
    for (;;) {
        if (cancel && cancel->cancelled()) return std::nullopt;
        if (m->try_lock_for(kLockPoll)) {
            return ImageLock(std::move(m));
        }
    }
}

std::unique_ptr<PullingMark> ImageLockTable::markPulling(const std::string& ref) {
    auto key = normalizeImageRef(ref);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pulling_.insert(key);
    }
    return std::make_unique<PullingMark>(this, key);
}

bool ImageLockTable::isPulling(const std::string& ref) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pulling_.count(normalizeImageRef(ref)) > 0;
}

void ImageLockTable::clearPulling(const std::string& ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pulling_.find(ref);
    if (it != pulling_.end()) pulling_.erase(it);
}

VolumeLease::~VolumeLease() {
    table_->release(path_);
}

std::string VolumeLeaseTable::key(const std::string& path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    std::string out = ec ? path : canonical.string();
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

std::unique_ptr<VolumeLease> VolumeLeaseTable::acquire(const std::string& path, const CancelToken& cancel) {
    const auto k = key(path);
    std::unique_lock<std::mutex> lock(mutex_);
    while (held_.count(k) > 0) {
        if (cancel.cancelled()) return nullptr;
        cv_.wait_for(lock, kLockPoll);
    }
    if (cancel.cancelled()) return nullptr;
    held_.insert(k);
    return std::make_unique<VolumeLease>(this, k);
}

bool VolumeLeaseTable::held(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.count(key(path)) > 0;
}

void VolumeLeaseTable::release(const std::string& k) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_.erase(k);
    }
    cv_.notify_all();
}

}  // namespace mhub
