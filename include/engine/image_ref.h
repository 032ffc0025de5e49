#pragma once

#include <optional>
#include <string>

namespace mhub {

struct ImageRef {
    std::string registry;    // empty for Docker Hub
    std::string repository;  // e.g. "mhubai/totalsegmentator"
    std::string tag;         // defaults to "latest"
    std::string digest;      // "sha256:..." when pinned

    // Canonical "repository:tag" (registry-qualified when not Docker Hub).
    std::string normalized() const;
};

// Parse "[registry/]repo[:tag][@digest]". Returns nullopt on empty or malformed input.
std::optional<ImageRef> parseImageRef(const std::string& text);

// "docker.io/library/ubuntu" -> "ubuntu:latest"; malformed input is returned unchanged.
std::string normalizeImageRef(const std::string& text);

bool sameImage(const std::string& a, const std::string& b);

}  // namespace mhub
