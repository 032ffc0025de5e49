#include "engine/image_ref.h"

#include <algorithm>
#include <cctype>

namespace mhub {

namespace {

constexpr const char* kDefaultTag = "latest";

bool looksLikeRegistry(const std::string& component) {
    return component.find('.') != std::string::npos ||
           component.find(':') != std::string::npos ||
           component == "localhost";
}

bool validRepository(const std::string& repo) {
    if (repo.empty() || repo.front() == '/' || repo.back() == '/') return false;
    if (repo.find("//") != std::string::npos) return false;
    return std::all_of(repo.begin(), repo.end(), [](unsigned char c) {
        return std::islower(c) || std::isdigit(c) || c == '/' || c == '.' || c == '_' || c == '-';
    });
}

}  // namespace

std::string ImageRef::normalized() const {
    std::string out;
    if (!registry.empty()) {
        out = registry + "/";
    }
    out += repository;
    out += ":";
    out += tag.empty() ? kDefaultTag : tag;
    return out;
}

std::optional<ImageRef> parseImageRef(const std::string& text) {
    if (text.empty() ||
        std::any_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); })) {
        return std::nullopt;
    }

    ImageRef ref;
    std::string rest = text;

    auto at = rest.find('@');
    if (at != std::string::npos) {
        ref.digest = rest.substr(at + 1);
        rest.erase(at);
        if (ref.digest.empty()) return std::nullopt;
    }

    // A colon after the last slash separates the tag.
    auto slash = rest.rfind('/');
    auto colon = rest.rfind(':');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        ref.tag = rest.substr(colon + 1);
        rest.erase(colon);
        if (ref.tag.empty()) return std::nullopt;
    } else {
        ref.tag = kDefaultTag;
    }

    auto first_slash = rest.find('/');
    if (first_slash != std::string::npos && looksLikeRegistry(rest.substr(0, first_slash))) {
        ref.registry = rest.substr(0, first_slash);
        rest.erase(0, first_slash + 1);
    }

    if (ref.registry == "docker.io" || ref.registry == "index.docker.io" ||
        ref.registry == "registry-1.docker.io") {
        ref.registry.clear();
    }
    if (ref.registry.empty() && rest.rfind("library/", 0) == 0) {
        rest.erase(0, 8);
    }

    if (!validRepository(rest)) return std::nullopt;
    ref.repository = rest;
    return ref;
}

std::string normalizeImageRef(const std::string& text) {
    auto ref = parseImageRef(text);
    if (!ref) return text;
    return ref->normalized();
}

bool sameImage(const std::string& a, const std::string& b) {
    return normalizeImageRef(a) == normalizeImageRef(b);
}

}  // namespace mhub
