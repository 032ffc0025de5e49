// subprocess.h - child process with merged stdout/stderr pipe
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "core/cancel_token.h"

namespace mhub {

struct CommandOutput {
    int exit_code{-1};
    std::string output;
};

class Subprocess {
public:
    enum class ReadStatus {
        kLine,
        kEof,
        kTimeout,
    };

    // Spawn args[0] (absolute path or PATH lookup). stderr is merged into stdout.
    // extra_path_dirs are prepended to the child's PATH.
    // Returns nullptr and fills *error when the process cannot be started.
    static std::unique_ptr<Subprocess> spawn(const std::vector<std::string>& args,
                                             const std::vector<std::string>& extra_path_dirs,
                                             std::string* error);

    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;
    Subprocess(Subprocess&&) = delete;
    Subprocess& operator=(Subprocess&&) = delete;

    // Read one line (without trailing newline / carriage return).
    // A final unterminated line is returned as kLine before kEof.
    ReadStatus readLine(std::string& line, std::chrono::milliseconds timeout);

    // Non-blocking exit check. Returns exit code (128+signal when signalled).
    std::optional<int> tryWait();

    // Blocks until exit, cancellation or timeout (0 = unbounded).
    // Returns nullopt when cancelled or timed out; the process keeps running.
    std::optional<int> wait(const CancelToken* cancel = nullptr,
                            std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    // Send a signal unless the process has already been reaped.
    void kill(int signal_number);

    // SIGTERM, wait up to grace, then SIGKILL and reap.
    void terminate(std::chrono::milliseconds grace);

    pid_t pid() const { return pid_; }

private:
    Subprocess(pid_t pid, int read_fd) : pid_(pid), read_fd_(read_fd) {}

    std::optional<int> reapLocked(bool block);

    pid_t pid_;
    int read_fd_;
    std::string buffer_;
    bool eof_{false};

    std::mutex status_mutex_;
    bool reaped_{false};
    int exit_code_{-1};
};

// Resolve an executable: explicit override first, then PATH, then fallbacks.
// Returns an empty string when nothing executable is found.
std::string resolveExecutable(const std::string& override_path,
                              const std::string& name,
                              const std::vector<std::string>& fallbacks = {});

// Directories to prepend to a child's PATH for `executable`: its own
// directory and, when it is a symlink, the directory of its target.
std::vector<std::string> executablePathDirs(const std::string& executable);

// Run a command to completion, collecting merged output.
// Returns nullopt (with *error set) on spawn failure, timeout or cancellation.
std::optional<CommandOutput> runCommand(const std::vector<std::string>& args,
                                        std::chrono::milliseconds timeout,
                                        const CancelToken* cancel,
                                        std::string* error);

// Run a command, passing each output line to on_line as it arrives.
// Returns the exit code, or nullopt (with *error set) on spawn failure or
// cancellation; a cancelled process is terminated before returning.
std::optional<int> streamCommand(const std::vector<std::string>& args,
                                 const std::function<void(const std::string&)>& on_line,
                                 const CancelToken* cancel,
                                 std::string* error);

}  // namespace mhub
