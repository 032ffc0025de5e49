#include "engine/docker_engine.h"

#include <deque>
#include <sstream>

#include <spdlog/spdlog.h>

#include "engine/engine_output.h"
#include "engine/image_ref.h"
#include "utils/job_id.h"
#include "utils/subprocess.h"

namespace mhub {

namespace {

constexpr size_t kErrorTailLines = 5;

std::string joinIds(const std::vector<int>& ids) {
    std::ostringstream oss;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i) oss << ",";
        oss << ids[i];
    }
    return oss.str();
}

// Collects the last few output lines of a streamed command for error messages.
class OutputTail {
public:
    void push(const std::string& line) {
        lines_.push_back(line);
        if (lines_.size() > kErrorTailLines) lines_.pop_front();
    }

    std::string str() const {
        std::string out;
        for (const auto& l : lines_) {
            if (!out.empty()) out.push_back('\n');
            out += l;
        }
        return out;
    }

private:
    std::deque<std::string> lines_;
};

Result<CommandOutput> invoke(const std::string& exe,
                             std::vector<std::string> args,
                             std::chrono::milliseconds timeout,
                             const CancelToken* cancel = nullptr) {
    if (exe.empty()) {
        return Result<CommandOutput>::failure(ErrorKind::kEngineUnavailable, "docker executable not found");
    }
    args.insert(args.begin(), exe);
    std::string error;
    auto out = runCommand(args, timeout, cancel, &error);
    if (!out) {
        if (cancel && cancel->cancelled()) {
            return Result<CommandOutput>::failure(ErrorKind::kCancelled, "cancelled");
        }
        if (error.rfind("timed out", 0) == 0) {
            return Result<CommandOutput>::failure(ErrorKind::kTimeout, error);
        }
        return Result<CommandOutput>::failure(ErrorKind::kEngineUnavailable, error);
    }
    return Result<CommandOutput>::success(std::move(*out));
}

template <typename T>
Result<T> commandFailure(const CommandOutput& out, ErrorKind fallback) {
    auto kind = classifyEngineFailure(out.output, fallback);
    auto message = lastLine(out.output);
    if (message.empty()) message = "docker exited with code " + std::to_string(out.exit_code);
    return Result<T>::failure(kind, message);
}

}  // namespace

DockerEngineClient::DockerEngineClient(EngineConfig config)
    : config_(std::move(config)) {
    executable_ = resolveExecutable(config_.docker_executable, "docker",
                                    {"/usr/local/bin/docker", "/usr/bin/docker"});
    if (executable_.empty()) {
        spdlog::warn("docker executable not found on PATH");
    } else {
        spdlog::debug("Using docker executable {}", executable_);
    }
}

std::string DockerEngineClient::executableFor(const ContainerHandle& handle) const {
    std::lock_guard<std::mutex> lock(overrides_mutex_);
    auto it = container_executables_.find(handle.id);
    return it != container_executables_.end() ? it->second : executable_;
}

BackendInfo DockerEngineClient::info() {
    BackendInfo bi;
    bi.name = "docker";
    bi.executable = executable_;
    auto res = invoke(executable_, {"--version"}, config_.command_timeout);
    if (res.ok() && res.data->exit_code == 0) {
        bi.version = parseVersionLine(res.data->output);
        bi.available = true;
    }
    return bi;
}

Result<std::vector<LocalImage>> DockerEngineClient::listImages() {
    using R = Result<std::vector<LocalImage>>;
    std::vector<std::string> args{"images", "--digests", "--no-trunc", "--format", kDockerImagesFormat};
    if (!config_.image_filter.empty()) {
        args.insert(args.begin() + 1, {"--filter", "reference=" + config_.image_filter});
    }
    auto res = invoke(executable_, args, config_.command_timeout);
    if (!res.ok()) {
        return R::failure(res.error == ErrorKind::kTimeout ? ErrorKind::kEngineUnavailable : res.error,
                          res.error_message);
    }
    if (res.data->exit_code != 0) {
        return commandFailure<std::vector<LocalImage>>(*res.data, ErrorKind::kEngineUnavailable);
    }
    return R::success(parseDockerImages(res.data->output));
}

Result<void> DockerEngineClient::pullImage(const std::string& ref,
                                           const LineCallback& on_progress,
                                           const CancelToken& cancel) {
    if (executable_.empty()) {
        return Result<void>::failure(ErrorKind::kEngineUnavailable, "docker executable not found");
    }
    spdlog::info("Pulling image {}", ref);

    OutputTail tail;
    std::string error;
    auto code = streamCommand({executable_, "pull", ref},
                              [&](const std::string& line) {
                                  tail.push(line);
                                  if (on_progress) on_progress(line);
                              },
                              &cancel, &error);
    if (!code) {
        if (cancel.cancelled()) {
            spdlog::info("Pull of {} cancelled", ref);
            return Result<void>::failure(ErrorKind::kCancelled, "pull cancelled");
        }
        return Result<void>::failure(ErrorKind::kEngineUnavailable, error);
    }
    if (*code != 0) {
        auto text = tail.str();
        auto kind = classifyEngineFailure(text, ErrorKind::kPullError);
        if (kind != ErrorKind::kEngineUnavailable) kind = ErrorKind::kPullError;
        spdlog::warn("Pull of {} failed ({}): {}", ref, *code, lastLine(text));
        return Result<void>::failure(kind, text.empty() ? "docker pull exited with " + std::to_string(*code) : text);
    }
    spdlog::info("Pulled image {}", ref);
    return Result<void>::success();
}

Result<void> DockerEngineClient::removeImage(const std::string& ref) {
    auto res = invoke(executable_, {"rmi", ref}, config_.command_timeout);
    if (!res.ok()) return Result<void>::from(res);
    if (res.data->exit_code != 0) {
        return commandFailure<void>(*res.data, ErrorKind::kEngineError);
    }
    spdlog::info("Removed image {}", ref);
    return Result<void>::success();
}

Result<ContainerHandle> DockerEngineClient::createAndStart(const RunRequest& request) {
    using R = Result<ContainerHandle>;
    auto mounts = validateMounts(request);
    if (!mounts.ok()) return R::from(mounts);

    const std::string exe = request.engine_executable && !request.engine_executable->empty()
                                ? *request.engine_executable
                                : executable_;

    auto inspect = invoke(exe, {"image", "inspect", "--format", "{{.Id}}", request.image},
                          config_.command_timeout);
    if (!inspect.ok()) return R::from(inspect);
    if (inspect.data->exit_code != 0) {
        auto kind = classifyEngineFailure(inspect.data->output, ErrorKind::kImageNotFound);
        return R::failure(kind == ErrorKind::kEngineUnavailable ? kind : ErrorKind::kImageNotFound,
                          "image not present locally: " + request.image);
    }

    ContainerHandle handle;
    handle.image = request.image;
    handle.name = generate_container_name(request.model_id.empty() ? "run" : request.model_id,
                                          generate_job_id());

    std::vector<std::string> args{"run", "-d", "--network=none", "--name", handle.name,
                                  "--label", "mhub.runner=1"};
    if (!request.gpus.empty()) {
        args.push_back("--gpus");
        args.push_back("device=" + joinIds(request.gpus));
    }
    args.push_back("-v");
    args.push_back(absoluteMountPath(request.input_path) + ":" + kContainerInputDir + ":ro");
    args.push_back("-v");
    args.push_back(absoluteMountPath(request.output_path) + ":" + kContainerOutputDir + ":rw");
    args.push_back(request.image);
    args.insert(args.end(), request.extra_args.begin(), request.extra_args.end());

    auto res = invoke(exe, args, config_.command_timeout);
    if (!res.ok()) return R::from(res);
    if (res.data->exit_code != 0) {
        return commandFailure<ContainerHandle>(*res.data, ErrorKind::kEngineError);
    }
    handle.id = lastLine(res.data->output);
    if (handle.id.empty()) {
        return R::failure(ErrorKind::kEngineError, "docker run did not report a container id");
    }
    if (exe != executable_) {
        std::lock_guard<std::mutex> lock(overrides_mutex_);
        container_executables_[handle.id] = exe;
    }
    spdlog::info("Started container {} ({}) from {}", handle.name, handle.id.substr(0, 12), handle.image);
    return R::success(handle);
}

Result<void> DockerEngineClient::streamLogs(const ContainerHandle& handle,
                                            const LineCallback& on_line,
                                            const CancelToken& cancel) {
    const auto exe = executableFor(handle);
    if (exe.empty()) {
        return Result<void>::failure(ErrorKind::kEngineUnavailable, "docker executable not found");
    }
    OutputTail tail;
    std::string error;
    auto code = streamCommand({exe, "logs", "-f", handle.id},
                              [&](const std::string& line) {
                                  tail.push(line);
                                  if (on_line) on_line(line);
                              },
                              &cancel, &error);
    if (!code) {
        if (cancel.cancelled()) return Result<void>::failure(ErrorKind::kCancelled, "log stream cancelled");
        return Result<void>::failure(ErrorKind::kEngineUnavailable, error);
    }
    if (*code != 0) {
        auto text = tail.str();
        return Result<void>::failure(classifyEngineFailure(text, ErrorKind::kEngineError), lastLine(text));
    }
    return Result<void>::success();
}

Result<int> DockerEngineClient::wait(const ContainerHandle& handle,
                                     const CancelToken& cancel,
                                     std::chrono::milliseconds timeout) {
    auto res = invoke(executableFor(handle), {"wait", handle.id}, timeout, &cancel);
    if (!res.ok()) return Result<int>::from(res);
    if (res.data->exit_code != 0) {
        return commandFailure<int>(*res.data, ErrorKind::kEngineError);
    }
    try {
        return Result<int>::success(std::stoi(lastLine(res.data->output)));
    } catch (const std::exception&) {
        return Result<int>::failure(ErrorKind::kEngineError,
                                    "unexpected docker wait output: " + lastLine(res.data->output));
    }
}

Result<void> DockerEngineClient::kill(const ContainerHandle& handle) {
    auto res = invoke(executableFor(handle), {"kill", handle.id}, config_.command_timeout);
    if (!res.ok()) return Result<void>::from(res);
    if (res.data->exit_code != 0) {
        if (isAlreadyStopped(res.data->output)) {
            return Result<void>::success();
        }
        return commandFailure<void>(*res.data, ErrorKind::kEngineError);
    }
    spdlog::info("Killed container {}", handle.name);
    return Result<void>::success();
}

Result<void> DockerEngineClient::releaseContainer(const ContainerHandle& handle) {
    const auto exe = executableFor(handle);
    auto res = invoke(exe, {"rm", "-f", handle.id}, config_.command_timeout);
    if (!res.ok()) return Result<void>::from(res);
    if (res.data->exit_code != 0 &&
        classifyEngineFailure(res.data->output, ErrorKind::kEngineError) != ErrorKind::kNotFound) {
        return commandFailure<void>(*res.data, ErrorKind::kEngineError);
    }
    std::lock_guard<std::mutex> lock(overrides_mutex_);
    container_executables_.erase(handle.id);
    return Result<void>::success();
}

Result<std::vector<GpuDevice>> DockerEngineClient::listGpus() {
    return queryNvidiaGpus(config_.nvidia_smi_executable, config_.command_timeout);
}

}  // namespace mhub
