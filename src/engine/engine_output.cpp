#include "engine/engine_output.h"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <spdlog/spdlog.h>

#include "engine/image_ref.h"
#include "utils/subprocess.h"

namespace mhub {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string item;
    std::stringstream ss(s);
    while (std::getline(ss, item, delim)) {
        parts.push_back(item);
    }
    if (!s.empty() && s.back() == delim) parts.emplace_back();
    return parts;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains(const std::string& haystack_lower, const char* needle) {
    return haystack_lower.find(needle) != std::string::npos;
}

std::vector<std::string> nonEmptyLines(const std::string& output) {
    std::vector<std::string> lines;
    std::stringstream ss(output);
    std::string line;
    while (std::getline(ss, line)) {
        line = trim(line);
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

}  // namespace

std::vector<LocalImage> parseDockerImages(const std::string& output) {
    std::vector<LocalImage> images;
    for (const auto& line : nonEmptyLines(output)) {
        auto fields = split(line, '|');
        if (fields.size() < 2) {
            spdlog::debug("Skipping unrecognized image line: {}", line);
            continue;
        }
        LocalImage img;
        img.repository = trim(fields[0]);
        img.tag = trim(fields[1]);
        if (img.repository.empty() || img.repository == "<none>" || img.tag == "<none>") {
            continue;
        }
        if (fields.size() > 2 && trim(fields[2]) != "<none>") img.digest = trim(fields[2]);
        if (fields.size() > 3) img.image_id = trim(fields[3]);
        if (fields.size() > 4) img.size_bytes = parseHumanSize(fields[4]);
        if (fields.size() > 5) img.created_at = trim(fields[5]);
        img.reference = normalizeImageRef(img.repository + ":" + img.tag);
        images.push_back(std::move(img));
    }
    return images;
}

std::vector<LocalImage> parseUdockerImages(const std::string& output) {
    std::vector<LocalImage> images;
    for (const auto& line : nonEmptyLines(output)) {
        if (line.rfind("REPOSITORIES", 0) == 0) continue;
        std::istringstream iss(line);
        std::string token;
        iss >> token;
        auto ref = parseImageRef(token);
        if (!ref) {
            spdlog::debug("Skipping unrecognized udocker image line: {}", line);
            continue;
        }
        LocalImage img;
        img.repository = ref->registry.empty() ? ref->repository : ref->registry + "/" + ref->repository;
        img.tag = ref->tag;
        img.digest = ref->digest;
        img.reference = ref->normalized();
        images.push_back(std::move(img));
    }
    return images;
}

std::vector<GpuDevice> parseNvidiaSmiGpus(const std::string& output) {
    std::vector<GpuDevice> devices;
    for (const auto& line : nonEmptyLines(output)) {
        auto fields = split(line, ',');
        if (fields.size() < 2) continue;
        GpuDevice dev{};
        try {
            dev.id = std::stoi(trim(fields[0]));
        } catch (const std::exception&) {
            spdlog::debug("Skipping nvidia-smi line without index: {}", line);
            continue;
        }
        dev.name = trim(fields[1]);
        dev.memory_bytes = 0;
        if (fields.size() > 2) {
            try {
                dev.memory_bytes = static_cast<size_t>(std::stoull(trim(fields[2]))) * 1024ull * 1024ull;
            } catch (const std::exception&) {
                dev.memory_bytes = 0;
            }
        }
        if (fields.size() > 3) dev.uuid = trim(fields[3]);
        dev.vendor = "nvidia";
        dev.is_available = true;
        devices.push_back(std::move(dev));
    }
    return devices;
}

uint64_t parseHumanSize(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) return 0;
    size_t i = 0;
    while (i < s.size() && (std::isdigit(static_cast<unsigned char>(s[i])) || s[i] == '.')) ++i;
    if (i == 0) return 0;
    double value = 0.0;
    try {
        value = std::stod(s.substr(0, i));
    } catch (const std::exception&) {
        return 0;
    }
    std::string unit = toLower(trim(s.substr(i)));
    double mult = 1.0;
    if (unit == "kb" || unit == "k" || unit == "kib") mult = 1e3;
    else if (unit == "mb" || unit == "m" || unit == "mib") mult = 1e6;
    else if (unit == "gb" || unit == "g" || unit == "gib") mult = 1e9;
    else if (unit == "tb" || unit == "t" || unit == "tib") mult = 1e12;
    else if (!unit.empty() && unit != "b") return 0;
    return static_cast<uint64_t>(value * mult);
}

std::string parseVersionLine(const std::string& output) {
    for (const auto& line : nonEmptyLines(output)) {
        std::istringstream iss(line);
        std::string token;
        while (iss >> token) {
            if (!token.empty() && token.back() == ',') token.pop_back();
            if (!token.empty() && (token.front() == 'v' || token.front() == 'V') && token.size() > 1 &&
                std::isdigit(static_cast<unsigned char>(token[1]))) {
                token.erase(0, 1);
            }
            if (!token.empty() && std::isdigit(static_cast<unsigned char>(token.front())) &&
                token.find('.') != std::string::npos) {
                return token;
            }
        }
    }
    return {};
}

std::string lastLine(const std::string& output) {
    auto lines = nonEmptyLines(output);
    return lines.empty() ? std::string() : lines.back();
}

ErrorKind classifyEngineFailure(const std::string& output, ErrorKind fallback) {
    const auto lower = toLower(output);
    if (contains(lower, "cannot connect to the docker daemon") ||
        contains(lower, "permission denied while trying to connect") ||
        contains(lower, "error during connect") ||
        contains(lower, "is the docker daemon running")) {
        return ErrorKind::kEngineUnavailable;
    }
    if (contains(lower, "no such container")) {
        return ErrorKind::kNotFound;
    }
    if (contains(lower, "conflict") || contains(lower, "is being used") ||
        contains(lower, "image is in use") || contains(lower, "has dependent child images")) {
        return ErrorKind::kImageInUse;
    }
    if (contains(lower, "no such image") || contains(lower, "unable to find image")) {
        return fallback == ErrorKind::kNotFound ? ErrorKind::kNotFound : ErrorKind::kImageNotFound;
    }
    if (contains(lower, "manifest unknown") || contains(lower, "pull access denied") ||
        contains(lower, "repository does not exist")) {
        return ErrorKind::kPullError;
    }
    if (contains(lower, "invalid mount") || contains(lower, "bind source path does not exist") ||
        contains(lower, "invalid volume specification")) {
        return ErrorKind::kInvalidMount;
    }
    return fallback;
}

bool isAlreadyStopped(const std::string& output) {
    const auto lower = toLower(output);
    return contains(lower, "not running");
}

Result<std::vector<GpuDevice>> queryNvidiaGpus(const std::string& nvidia_smi_override,
                                               std::chrono::milliseconds timeout) {
    using R = Result<std::vector<GpuDevice>>;
    auto exe = resolveExecutable(nvidia_smi_override, "nvidia-smi", {"/usr/bin/nvidia-smi"});
    if (exe.empty()) {
        spdlog::debug("nvidia-smi not found; reporting no GPUs");
        return R::success({});
    }

    std::string error;
    auto out = runCommand({exe, "--query-gpu=index,name,memory.total,uuid",
                           "--format=csv,noheader,nounits"},
                          timeout, nullptr, &error);
    if (!out) {
        spdlog::warn("nvidia-smi failed to run: {}", error);
        return R::success({});
    }
    if (out->exit_code != 0) {
        // Driver missing or no device: no usable GPU, not an engine failure.
        spdlog::info("nvidia-smi exited with {}: {}", out->exit_code, lastLine(out->output));
        return R::success({});
    }
    return R::success(parseNvidiaSmiGpus(out->output));
}

}  // namespace mhub
