#include "utils/subprocess.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

extern char** environ;

namespace fs = std::filesystem;

namespace mhub {

namespace {

constexpr std::chrono::milliseconds kPollInterval{20};

std::vector<std::string> splitPathList(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ':')) {
        if (!item.empty()) parts.push_back(item);
    }
    return parts;
}

std::vector<std::string> buildChildEnvironment(const std::vector<std::string>& extra_path_dirs) {
    std::vector<std::string> env;
    std::string path_value;
    bool has_path = false;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        if (entry.rfind("PATH=", 0) == 0) {
            path_value = entry.substr(5);
            has_path = true;
            continue;
        }
        env.push_back(std::move(entry));
    }

    std::vector<std::string> path_entries = has_path ? splitPathList(path_value)
                                                     : std::vector<std::string>{"/usr/local/bin", "/usr/bin", "/bin"};
    for (auto it = extra_path_dirs.rbegin(); it != extra_path_dirs.rend(); ++it) {
        if (it->empty()) continue;
        if (std::find(path_entries.begin(), path_entries.end(), *it) == path_entries.end()) {
            path_entries.insert(path_entries.begin(), *it);
        }
    }

    std::string joined;
    for (const auto& p : path_entries) {
        if (!joined.empty()) joined.push_back(':');
        joined += p;
    }
    env.push_back("PATH=" + joined);
    return env;
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

bool isExecutableFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return false;
    return ::access(path.c_str(), X_OK) == 0;
}

}  // namespace

std::unique_ptr<Subprocess> Subprocess::spawn(const std::vector<std::string>& args,
                                              const std::vector<std::string>& extra_path_dirs,
                                              std::string* error) {
    if (args.empty()) {
        if (error) *error = "empty command";
        return nullptr;
    }

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        if (error) *error = std::string("pipe failed: ") + std::strerror(errno);
        return nullptr;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, fds[1], STDERR_FILENO);

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    auto env = buildChildEnvironment(extra_path_dirs);
    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (auto& e : env) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);

    pid_t pid = 0;
    int rc = 0;
    if (args[0].find('/') != std::string::npos) {
        rc = posix_spawn(&pid, argv[0], &actions, nullptr, argv.data(), envp.data());
    } else {
        rc = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), envp.data());
    }
    posix_spawn_file_actions_destroy(&actions);
    ::close(fds[1]);

    if (rc != 0) {
        ::close(fds[0]);
        if (error) *error = "failed to start '" + args[0] + "': " + std::strerror(rc);
        return nullptr;
    }

    spdlog::debug("Spawned pid {}: {}", pid, args[0]);
    return std::unique_ptr<Subprocess>(new Subprocess(pid, fds[0]));
}

Subprocess::~Subprocess() {
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        if (!reaped_) {
            ::kill(pid_, SIGKILL);
            reapLocked(true);
        }
    }
    if (read_fd_ >= 0) {
        ::close(read_fd_);
    }
}

Subprocess::ReadStatus Subprocess::readLine(std::string& line, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char chunk[4096];

    for (;;) {
        auto pos = buffer_.find('\n');
        if (pos != std::string::npos) {
            line = buffer_.substr(0, pos);
            buffer_.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return ReadStatus::kLine;
        }
        if (eof_) {
            if (!buffer_.empty()) {
                line = std::move(buffer_);
                buffer_.clear();
                if (!line.empty() && line.back() == '\r') line.pop_back();
                return ReadStatus::kLine;
            }
            return ReadStatus::kEof;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0) remaining = std::chrono::milliseconds(0);

        pollfd pfd{};
        pfd.fd = read_fd_;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready == 0) {
            return ReadStatus::kTimeout;
        }
        if (ready < 0) {
            if (errno == EINTR) continue;
            eof_ = true;
            continue;
        }

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<size_t>(n));
        } else if (n == 0) {
            eof_ = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            eof_ = true;
        }
    }
}

std::optional<int> Subprocess::reapLocked(bool block) {
    if (reaped_) return exit_code_;
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    if (r == pid_) {
        reaped_ = true;
        exit_code_ = decodeWaitStatus(status);
        return exit_code_;
    }
    if (r == 0) return std::nullopt;
    if (errno == EINTR) return std::nullopt;
    reaped_ = true;
    exit_code_ = -1;
    return exit_code_;
}

std::optional<int> Subprocess::tryWait() {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return reapLocked(false);
}

std::optional<int> Subprocess::wait(const CancelToken* cancel, std::chrono::milliseconds timeout) {
    const auto start = std::chrono::steady_clock::now();
    for (;;) {
        if (auto code = tryWait()) {
            return code;
        }
        if (cancel && cancel->cancelled()) {
            return std::nullopt;
        }
        if (timeout.count() > 0 && std::chrono::steady_clock::now() - start >= timeout) {
            return std::nullopt;
        }
        if (cancel) {
            cancel->waitFor(kPollInterval);
        } else {
            std::this_thread::sleep_for(kPollInterval);
        }
    }
}

void Subprocess::kill(int signal_number) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    if (!reaped_) {
        ::kill(pid_, signal_number);
    }
}

void Subprocess::terminate(std::chrono::milliseconds grace) {
    kill(SIGTERM);
    if (wait(nullptr, grace)) {
        return;
    }
    std::lock_guard<std::mutex> lock(status_mutex_);
    if (!reaped_) {
        ::kill(pid_, SIGKILL);
        reapLocked(true);
    }
}

std::string resolveExecutable(const std::string& override_path,
                              const std::string& name,
                              const std::vector<std::string>& fallbacks) {
    if (!override_path.empty()) {
        return override_path;
    }

    if (const char* path_env = std::getenv("PATH")) {
        for (const auto& dir : splitPathList(path_env)) {
            fs::path candidate = fs::path(dir) / name;
            if (isExecutableFile(candidate)) {
                return candidate.string();
            }
        }
    }

    for (const auto& fallback : fallbacks) {
        if (isExecutableFile(fallback)) {
            return fallback;
        }
    }
    return {};
}

std::vector<std::string> executablePathDirs(const std::string& executable) {
    std::vector<std::string> dirs;
    if (executable.find('/') == std::string::npos) {
        return dirs;
    }
    fs::path exe(executable);
    dirs.push_back(exe.parent_path().string());
    std::error_code ec;
    auto real = fs::canonical(exe, ec);
    if (!ec && real.parent_path() != exe.parent_path()) {
        dirs.push_back(real.parent_path().string());
    }
    return dirs;
}

std::optional<CommandOutput> runCommand(const std::vector<std::string>& args,
                                        std::chrono::milliseconds timeout,
                                        const CancelToken* cancel,
                                        std::string* error) {
    auto proc = Subprocess::spawn(args, args.empty() ? std::vector<std::string>{} : executablePathDirs(args[0]),
                                  error);
    if (!proc) {
        return std::nullopt;
    }

    const auto start = std::chrono::steady_clock::now();
    auto expired = [&]() {
        return timeout.count() > 0 && std::chrono::steady_clock::now() - start >= timeout;
    };

    CommandOutput out;
    std::string line;
    for (;;) {
        auto status = proc->readLine(line, std::chrono::milliseconds(100));
        if (status == Subprocess::ReadStatus::kEof) break;
        if (status == Subprocess::ReadStatus::kLine) {
            if (!out.output.empty()) out.output.push_back('\n');
            out.output += line;
        }
        if (cancel && cancel->cancelled()) {
            proc->terminate(std::chrono::milliseconds(500));
            if (error) *error = "cancelled";
            return std::nullopt;
        }
        if (expired()) {
            proc->terminate(std::chrono::milliseconds(500));
            if (error) *error = "timed out after " + std::to_string(timeout.count()) + "ms: " + args[0];
            return std::nullopt;
        }
    }

    auto remaining = timeout.count() > 0
                         ? std::max(std::chrono::milliseconds(1),
                                    timeout - std::chrono::duration_cast<std::chrono::milliseconds>(
                                                  std::chrono::steady_clock::now() - start))
                         : std::chrono::milliseconds(0);
    auto code = proc->wait(cancel, remaining);
    if (!code) {
        proc->terminate(std::chrono::milliseconds(500));
        if (error) *error = (cancel && cancel->cancelled()) ? "cancelled" : "timed out waiting for exit: " + args[0];
        return std::nullopt;
    }
    out.exit_code = *code;
    return out;
}

std::optional<int> streamCommand(const std::vector<std::string>& args,
                                 const std::function<void(const std::string&)>& on_line,
                                 const CancelToken* cancel,
                                 std::string* error) {
    auto proc = Subprocess::spawn(args, args.empty() ? std::vector<std::string>{} : executablePathDirs(args[0]),
                                  error);
    if (!proc) {
        return std::nullopt;
    }

    std::string line;
    for (;;) {
        auto status = proc->readLine(line, std::chrono::milliseconds(100));
        if (status == Subprocess::ReadStatus::kEof) break;
        if (status == Subprocess::ReadStatus::kLine && on_line) {
            on_line(line);
        }
        if (cancel && cancel->cancelled()) {
            proc->terminate(std::chrono::milliseconds(500));
            if (error) *error = "cancelled";
            return std::nullopt;
        }
    }

    auto code = proc->wait(cancel);
    if (!code) {
        proc->terminate(std::chrono::milliseconds(500));
        if (error) *error = "cancelled";
        return std::nullopt;
    }
    return code;
}

}  // namespace mhub
