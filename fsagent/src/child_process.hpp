#pragma once

#include "posix_file.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace fsagent {

struct SpawnOptions {
    std::vector<std::string> argv; // argv[0] is looked up on PATH
    std::filesystem::path cwd;     // empty: inherit
    bool pipe_stdin = false;       // otherwise stdin is /dev/null
    bool capture_stdout = true;    // otherwise stdout is /dev/null
};

/**
 * A forked child with its output pipes.
 *
 * Waiting and signalling are safe from several threads: the exit status is
 * reaped once and cached, and no signal is sent after the pid was reaped.
 * Destroying a ChildProcess that is still running kills and reaps it.
 */
class ChildProcess {
public:
    /// Throws filesystem_error when the working directory cannot be entered
    /// and system_error (carrying the exec errno) when the program cannot be
    /// executed.
    static std::unique_ptr<ChildProcess> spawn(const SpawnOptions& options);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }
    int stdin_fd() const { return stdin_.get(); }
    int stdout_fd() const { return stdout_.get(); }
    int stderr_fd() const { return stderr_.get(); }
    void close_stdin() { stdin_.reset(); }

    /// Exit code if the child has exited; negative signal number when it was
    /// killed by a signal.
    std::optional<int> try_wait();
    bool wait_for(std::chrono::milliseconds timeout);
    int wait();

    void terminate();
    void kill();

    /// SIGTERM, wait up to `grace`, then SIGKILL. Returns the exit code.
    int stop(std::chrono::milliseconds grace);

private:
    ChildProcess() = default;

    void send_signal(int sig);

    pid_t pid_ = -1;
    FileDescriptor stdin_;
    FileDescriptor stdout_;
    FileDescriptor stderr_;

    std::mutex mutex_;
    std::optional<int> exit_code_;
};

struct HelperResult {
    int exit_code = 0;
    std::string output;
    std::string error_output;
};

/// Runs a short-lived helper to completion, feeding `input` on its stdin and
/// collecting stdout and stderr.
HelperResult run_helper(const SpawnOptions& options, const std::string& input);

} // namespace fsagent
