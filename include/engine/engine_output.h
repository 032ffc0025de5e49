// engine_output.h - parsers for container engine and nvidia-smi text output
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/error.h"
#include "engine/engine_types.h"

namespace mhub {

// Format string passed to `docker images --digests --format`.
constexpr const char* kDockerImagesFormat =
    "{{.Repository}}|{{.Tag}}|{{.Digest}}|{{.ID}}|{{.Size}}|{{.CreatedAt}}";

// Parse `docker images` output produced with kDockerImagesFormat.
// Dangling images (<none> repository or tag) are skipped.
std::vector<LocalImage> parseDockerImages(const std::string& output);

// Parse `udocker images` output ("REPOSITORIES" header, one repo:tag per line,
// optionally followed by a "." marker column).
std::vector<LocalImage> parseUdockerImages(const std::string& output);

// Parse `nvidia-smi --query-gpu=index,name,memory.total,uuid --format=csv,noheader,nounits`.
std::vector<GpuDevice> parseNvidiaSmiGpus(const std::string& output);

// "1.23GB", "512MB", "80.5 kB" -> bytes. Returns 0 when unparsable.
uint64_t parseHumanSize(const std::string& text);

// Extract "24.0.7" from "Docker version 24.0.7, build afdd53b" and similar.
std::string parseVersionLine(const std::string& output);

// Last non-empty line of engine output, used as the error message tail.
std::string lastLine(const std::string& output);

// Map engine error text to an ErrorKind. `fallback` applies when nothing matches.
ErrorKind classifyEngineFailure(const std::string& output, ErrorKind fallback);

// True when a kill/stop failure means the container already exited.
bool isAlreadyStopped(const std::string& output);

// Enumerate NVIDIA GPUs. A host without nvidia-smi yields an empty list.
Result<std::vector<GpuDevice>> queryNvidiaGpus(const std::string& nvidia_smi_override,
                                               std::chrono::milliseconds timeout);

}  // namespace mhub
