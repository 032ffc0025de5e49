#pragma once

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "core/cancel_token.h"

namespace mhub {

/// Exclusive hold on one image reference. Released on destruction.
class ImageLock {
public:
    ImageLock() = default;
    explicit ImageLock(std::shared_ptr<std::timed_mutex> mutex) : mutex_(std::move(mutex)) {}
    ~ImageLock() { release(); }

    ImageLock(ImageLock&& other) noexcept : mutex_(std::move(other.mutex_)) {}
    ImageLock& operator=(ImageLock&& other) noexcept {
        if (this != &other) {
            release();
            mutex_ = std::move(other.mutex_);
        }
        return *this;
    }
    ImageLock(const ImageLock&) = delete;
    ImageLock& operator=(const ImageLock&) = delete;

    void release() {
        if (mutex_) {
            mutex_->unlock();
            mutex_.reset();
        }
    }

private:
    std::shared_ptr<std::timed_mutex> mutex_;
};

class ImageLockTable;

/// Marks an image reference as being pulled while alive.
class PullingMark {
public:
    PullingMark(ImageLockTable* table, std::string ref) : table_(table), ref_(std::move(ref)) {}
    ~PullingMark();
    PullingMark(const PullingMark&) = delete;
    PullingMark& operator=(const PullingMark&) = delete;

private:
    ImageLockTable* table_;
    std::string ref_;
};

/// Serializes pull and remove per normalized image reference.
class ImageLockTable {
public:
    // Blocks until the lock is held; nullopt when `cancel` fires first.
    std::optional<ImageLock> acquire(const std::string& ref, const CancelToken* cancel = nullptr);

    std::unique_ptr<PullingMark> markPulling(const std::string& ref);
    bool isPulling(const std::string& ref) const;

private:
    friend class PullingMark;
    void clearPulling(const std::string& ref);

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<std::timed_mutex>> locks_;
    std::multiset<std::string> pulling_;
};

class VolumeLeaseTable;

/// Exclusive use of an input volume while alive.
class VolumeLease {
public:
    VolumeLease(VolumeLeaseTable* table, std::string path) : table_(table), path_(std::move(path)) {}
    ~VolumeLease();
    VolumeLease(const VolumeLease&) = delete;
    VolumeLease& operator=(const VolumeLease&) = delete;

private:
    VolumeLeaseTable* table_;
    std::string path_;
};

/// Per-input-path leases used when concurrent runs on one volume are disallowed.
class VolumeLeaseTable {
public:
    // Blocks until the path is free; nullptr when `cancel` fires first.
    std::unique_ptr<VolumeLease> acquire(const std::string& path, const CancelToken& cancel);

    bool held(const std::string& path) const;

    // Canonical key for a path (weakly canonical, so missing paths still compare).
    static std::string key(const std::string& path);

private:
    friend class VolumeLease;
    void release(const std::string& key);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::set<std::string> held_;
};

}  // namespace mhub
