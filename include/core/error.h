#pragma once

#include <optional>
#include <string>
#include <utility>

namespace mhub {

enum class ErrorKind : int {
    kOk = 0,
    kEngineUnavailable,
    kImageNotFound,
    kInvalidMount,
    kImageInUse,
    kPullError,
    kCatalogUnreachable,
    kNotFound,
    kAlreadyTerminal,
    kCancelled,
    kTimeout,
    kContainerFailed,
    kInvalidArgument,
    kEngineError,
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kOk:
            return "OK";
        case ErrorKind::kEngineUnavailable:
            return "ENGINE_UNAVAILABLE";
        case ErrorKind::kImageNotFound:
            return "IMAGE_NOT_FOUND";
        case ErrorKind::kInvalidMount:
            return "INVALID_MOUNT";
        case ErrorKind::kImageInUse:
            return "IMAGE_IN_USE";
        case ErrorKind::kPullError:
            return "PULL_ERROR";
        case ErrorKind::kCatalogUnreachable:
            return "CATALOG_UNREACHABLE";
        case ErrorKind::kNotFound:
            return "NOT_FOUND";
        case ErrorKind::kAlreadyTerminal:
            return "ALREADY_TERMINAL";
        case ErrorKind::kCancelled:
            return "CANCELLED";
        case ErrorKind::kTimeout:
            return "TIMEOUT";
        case ErrorKind::kContainerFailed:
            return "CONTAINER_FAILED";
        case ErrorKind::kInvalidArgument:
            return "INVALID_ARGUMENT";
        case ErrorKind::kEngineError:
            return "ENGINE_ERROR";
    }
    return "UNKNOWN";
}

/// Discriminated result returned by every public operation.
template <typename T>
struct Result {
    ErrorKind error{ErrorKind::kOk};
    std::string error_message;
    std::optional<T> data;

    bool ok() const { return error == ErrorKind::kOk; }

    static Result success(T value) {
        Result r;
        r.data = std::move(value);
        return r;
    }

    static Result failure(ErrorKind kind, std::string message) {
        Result r;
        r.error = kind;
        r.error_message = std::move(message);
        return r;
    }

    template <typename U>
    static Result from(const Result<U>& other) {
        return failure(other.error, other.error_message);
    }
};

/// Specialization for void type (no data member)
template <>
struct Result<void> {
    ErrorKind error{ErrorKind::kOk};
    std::string error_message;

    bool ok() const { return error == ErrorKind::kOk; }

    static Result success() { return Result{}; }

    static Result failure(ErrorKind kind, std::string message) {
        Result r;
        r.error = kind;
        r.error_message = std::move(message);
        return r;
    }

    template <typename U>
    static Result from(const Result<U>& other) {
        return failure(other.error, other.error_message);
    }
};

}  // namespace mhub
