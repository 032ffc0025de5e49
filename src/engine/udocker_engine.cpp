#include "engine/udocker_engine.h"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <spdlog/spdlog.h>

#include "engine/engine_output.h"
#include "engine/image_ref.h"
#include "utils/job_id.h"

namespace mhub {

namespace {

constexpr std::chrono::milliseconds kReadPoll{100};
constexpr std::chrono::milliseconds kKillGrace{2000};

std::string joinIds(const std::vector<int>& ids) {
    std::ostringstream oss;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i) oss << ",";
        oss << ids[i];
    }
    return oss.str();
}

bool mentionsNotFound(const std::string& output) {
    std::string lower = output;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("not found") != std::string::npos;
}

Result<CommandOutput> invoke(const std::string& exe,
                             std::vector<std::string> args,
                             std::chrono::milliseconds timeout) {
    if (exe.empty()) {
        return Result<CommandOutput>::failure(ErrorKind::kEngineUnavailable, "udocker executable not found");
    }
    args.insert(args.begin(), exe);
    std::string error;
    auto out = runCommand(args, timeout, nullptr, &error);
    if (!out) {
        return Result<CommandOutput>::failure(ErrorKind::kEngineUnavailable, error);
    }
    return Result<CommandOutput>::success(std::move(*out));
}

std::string failureText(const CommandOutput& out) {
    auto line = lastLine(out.output);
    return line.empty() ? "udocker exited with code " + std::to_string(out.exit_code) : line;
}

// Undo a half-created container after a later setup step failed.
void discardContainer(const std::string& exe, const std::string& name, std::chrono::milliseconds timeout) {
    auto res = invoke(exe, {"rm", name}, timeout);
    if (!res.ok()) {
        spdlog::warn("Failed to remove udocker container {}: {}", name, res.error_message);
    } else if (res.data->exit_code != 0) {
        spdlog::warn("Failed to remove udocker container {}: {}", name, failureText(*res.data));
    }
}

}  // namespace

UDockerEngineClient::UDockerEngineClient(EngineConfig config)
    : config_(std::move(config)) {
    executable_ = resolveExecutable(config_.udocker_executable, "udocker",
                                    {"/usr/local/bin/udocker", "/usr/bin/udocker"});
    if (executable_.empty()) {
        spdlog::warn("udocker executable not found on PATH");
    }
}

UDockerEngineClient::~UDockerEngineClient() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, running] : running_) {
        spdlog::debug("Terminating udocker container {} on shutdown", id);
        running.process->terminate(kKillGrace);
    }
    running_.clear();
}

std::shared_ptr<Subprocess> UDockerEngineClient::processFor(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = running_.find(id);
    return it == running_.end() ? nullptr : it->second.process;
}

BackendInfo UDockerEngineClient::info() {
    BackendInfo bi;
    bi.name = "udocker";
    bi.executable = executable_;
    auto res = invoke(executable_, {"--version"}, config_.command_timeout);
    if (res.ok() && res.data->exit_code == 0) {
        bi.version = parseVersionLine(res.data->output);
        bi.available = true;
    }
    return bi;
}

Result<std::vector<LocalImage>> UDockerEngineClient::listImages() {
    using R = Result<std::vector<LocalImage>>;
    auto res = invoke(executable_, {"images"}, config_.command_timeout);
    if (!res.ok()) return R::from(res);
    if (res.data->exit_code != 0) {
        return R::failure(ErrorKind::kEngineUnavailable, failureText(*res.data));
    }
    return R::success(parseUdockerImages(res.data->output));
}

Result<void> UDockerEngineClient::pullImage(const std::string& ref,
                                            const LineCallback& on_progress,
                                            const CancelToken& cancel) {
    if (executable_.empty()) {
        return Result<void>::failure(ErrorKind::kEngineUnavailable, "udocker executable not found");
    }
    spdlog::info("Pulling image {} with udocker", ref);
    std::string last;
    std::string error;
    auto code = streamCommand({executable_, "pull", ref},
                              [&](const std::string& line) {
                                  if (!line.empty()) last = line;
                                  if (on_progress) on_progress(line);
                              },
                              &cancel, &error);
    if (!code) {
        if (cancel.cancelled()) return Result<void>::failure(ErrorKind::kCancelled, "pull cancelled");
        return Result<void>::failure(ErrorKind::kEngineUnavailable, error);
    }
    if (*code != 0) {
        spdlog::warn("udocker pull of {} failed ({}): {}", ref, *code, last);
        return Result<void>::failure(ErrorKind::kPullError,
                                     last.empty() ? "udocker pull exited with " + std::to_string(*code) : last);
    }
    return Result<void>::success();
}

Result<void> UDockerEngineClient::removeImage(const std::string& ref) {
    auto res = invoke(executable_, {"rmi", ref}, config_.command_timeout);
    if (!res.ok()) return Result<void>::from(res);
    if (res.data->exit_code != 0) {
        auto kind = classifyEngineFailure(res.data->output, ErrorKind::kEngineError);
        if (kind == ErrorKind::kEngineError && mentionsNotFound(res.data->output)) {
            kind = ErrorKind::kNotFound;
        } else if (kind == ErrorKind::kEngineError &&
                   res.data->output.find("in use") != std::string::npos) {
            kind = ErrorKind::kImageInUse;
        }
        return Result<void>::failure(kind, failureText(*res.data));
    }
    return Result<void>::success();
}

Result<ContainerHandle> UDockerEngineClient::createAndStart(const RunRequest& request) {
    using R = Result<ContainerHandle>;
    auto mounts = validateMounts(request);
    if (!mounts.ok()) return R::from(mounts);

    const std::string exe = request.engine_executable && !request.engine_executable->empty()
                                ? *request.engine_executable
                                : executable_;

    auto images = invoke(exe, {"images"}, config_.command_timeout);
    if (!images.ok()) return R::from(images);
    if (images.data->exit_code != 0) {
        return R::failure(ErrorKind::kEngineUnavailable, failureText(*images.data));
    }
    const auto wanted = normalizeImageRef(request.image);
    const auto local = parseUdockerImages(images.data->output);
    bool present = std::any_of(local.begin(), local.end(),
                               [&](const LocalImage& img) { return img.reference == wanted; });
    if (!present) {
        return R::failure(ErrorKind::kImageNotFound, "image not present locally: " + request.image);
    }

    ContainerHandle handle;
    handle.image = request.image;
    handle.name = generate_container_name(request.model_id.empty() ? "run" : request.model_id,
                                          generate_job_id());
    handle.id = handle.name;

    auto created = invoke(exe, {"create", "--name=" + handle.name, request.image}, config_.command_timeout);
    if (!created.ok()) return R::from(created);
    if (created.data->exit_code != 0) {
        return R::failure(ErrorKind::kEngineError, failureText(*created.data));
    }

    if (!request.gpus.empty()) {
        auto setup = invoke(exe, {"setup", "--nvidia", "--force", handle.name}, config_.command_timeout);
        if (!setup.ok() || setup.data->exit_code != 0) {
            discardContainer(exe, handle.name, config_.command_timeout);
            return R::failure(ErrorKind::kEngineError,
                              setup.ok() ? failureText(*setup.data) : setup.error_message);
        }
    }

    std::vector<std::string> args{exe, "run",
                                  "-v", absoluteMountPath(request.input_path) + ":" + kContainerInputDir,
                                  "-v", absoluteMountPath(request.output_path) + ":" + kContainerOutputDir};
    if (!request.gpus.empty()) {
        args.push_back("--env=CUDA_VISIBLE_DEVICES=" + joinIds(request.gpus));
    }
    args.push_back(handle.name);
    args.insert(args.end(), request.extra_args.begin(), request.extra_args.end());

    std::string error;
    std::shared_ptr<Subprocess> proc = Subprocess::spawn(args, executablePathDirs(exe), &error);
    if (!proc) {
        discardContainer(exe, handle.name, config_.command_timeout);
        return R::failure(ErrorKind::kEngineUnavailable, error);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_[handle.id] = RunningContainer{proc, exe};
    }
    spdlog::info("Started udocker container {} (pid {}) from {}", handle.name, proc->pid(), handle.image);
    return R::success(handle);
}

Result<void> UDockerEngineClient::streamLogs(const ContainerHandle& handle,
                                             const LineCallback& on_line,
                                             const CancelToken& cancel) {
    auto proc = processFor(handle.id);
    if (!proc) {
        return Result<void>::failure(ErrorKind::kNotFound, "no such container: " + handle.id);
    }
    std::string line;
    for (;;) {
        if (cancel.cancelled()) {
            return Result<void>::failure(ErrorKind::kCancelled, "log stream cancelled");
        }
        auto status = proc->readLine(line, kReadPoll);
        if (status == Subprocess::ReadStatus::kEof) {
            return Result<void>::success();
        }
        if (status == Subprocess::ReadStatus::kLine && on_line) {
            on_line(line);
        }
    }
}

Result<int> UDockerEngineClient::wait(const ContainerHandle& handle,
                                      const CancelToken& cancel,
                                      std::chrono::milliseconds timeout) {
    auto proc = processFor(handle.id);
    if (!proc) {
        return Result<int>::failure(ErrorKind::kNotFound, "no such container: " + handle.id);
    }
    auto code = proc->wait(&cancel, timeout);
    if (code) return Result<int>::success(*code);
    if (cancel.cancelled()) return Result<int>::failure(ErrorKind::kCancelled, "wait cancelled");
    return Result<int>::failure(ErrorKind::kTimeout, "container still running after timeout");
}

Result<void> UDockerEngineClient::kill(const ContainerHandle& handle) {
    auto proc = processFor(handle.id);
    if (!proc) {
        return Result<void>::failure(ErrorKind::kNotFound, "no such container: " + handle.id);
    }
    if (!proc->tryWait()) {
        proc->terminate(kKillGrace);
        spdlog::info("Killed udocker container {}", handle.name);
    }
    return Result<void>::success();
}

Result<void> UDockerEngineClient::releaseContainer(const ContainerHandle& handle) {
    std::string exe = executable_;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = running_.find(handle.id);
        if (it != running_.end()) {
            exe = it->second.executable;
            running_.erase(it);
        }
    }
    auto res = invoke(exe, {"rm", handle.name}, config_.command_timeout);
    if (!res.ok()) return Result<void>::from(res);
    if (res.data->exit_code != 0 && !mentionsNotFound(res.data->output)) {
        return Result<void>::failure(ErrorKind::kEngineError, failureText(*res.data));
    }
    return Result<void>::success();
}

Result<std::vector<GpuDevice>> UDockerEngineClient::listGpus() {
    return queryNvidiaGpus(config_.nvidia_smi_executable, config_.command_timeout);
}

}  // namespace mhub
