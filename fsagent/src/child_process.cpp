#include "child_process.hpp"

#include "logger.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <log4cplus/loggingmacros.h>

namespace fsagent {

namespace {

constexpr std::chrono::milliseconds kWaitStep{10};
constexpr std::size_t kHelperReadChunk = 4096;

enum SpawnStage : int {
    kStageChdir = 1,
    kStageRedirect = 2,
    kStageExec = 3
};

// Sent from the child over a close-on-exec pipe when it fails before exec.
struct SpawnFailure {
    int stage;
    int error;
};

[[noreturn]] void fail_in_child(int report_fd, int stage) {
    SpawnFailure failure{stage, errno};
    static_cast<void>(::write(report_fd, &failure, sizeof(failure)));
    ::_exit(127);
}

void open_pipe(FileDescriptor& read_end, FileDescriptor& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw_errno("pipe");
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw_errno("fcntl");
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return -1;
}

} // namespace

std::unique_ptr<ChildProcess> ChildProcess::spawn(const SpawnOptions& options) {
    if (options.argv.empty() || options.argv.front().empty()) {
        throw std::invalid_argument("empty command");
    }

    std::vector<char*> argv;
    argv.reserve(options.argv.size() + 1);
    for (const auto& arg : options.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    FileDescriptor stdin_read, stdin_write;
    FileDescriptor stdout_read, stdout_write;
    FileDescriptor stderr_read, stderr_write;
    FileDescriptor report_read, report_write;
    if (options.pipe_stdin) {
        open_pipe(stdin_read, stdin_write);
    }
    if (options.capture_stdout) {
        open_pipe(stdout_read, stdout_write);
    }
    open_pipe(stderr_read, stderr_write);
    open_pipe(report_read, report_write);

    // Everything the child touches is prepared before fork: only
    // async-signal-safe calls are allowed between fork and exec.
    FileDescriptor dev_null = open_file("/dev/null", O_RDWR);
    const char* cwd = options.cwd.empty() ? nullptr : options.cwd.c_str();
    const int stdin_source = options.pipe_stdin ? stdin_read.get() : dev_null.get();
    const int stdout_target = options.capture_stdout ? stdout_write.get() : dev_null.get();
    const int stderr_target = stderr_write.get();
    const int report_fd = report_write.get();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw_errno("fork");
    }

    if (pid == 0) {
        if (cwd && ::chdir(cwd) != 0) {
            fail_in_child(report_fd, kStageChdir);
        }
        if (::dup2(stdin_source, STDIN_FILENO) < 0 || ::dup2(stdout_target, STDOUT_FILENO) < 0 ||
            ::dup2(stderr_target, STDERR_FILENO) < 0) {
            fail_in_child(report_fd, kStageRedirect);
        }
        // The agent ignores SIGPIPE; the child must not inherit that.
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(argv[0], argv.data());
        fail_in_child(report_fd, kStageExec);
    }

    std::unique_ptr<ChildProcess> child(new ChildProcess());
    child->pid_ = pid;

    stdin_read.reset();
    stdout_write.reset();
    stderr_write.reset();
    report_write.reset();

    SpawnFailure failure{};
    std::size_t received = 0;
    while (received < sizeof(failure)) {
        std::size_t n = read_some(report_read.get(), reinterpret_cast<char*>(&failure) + received,
                                  sizeof(failure) - received);
        if (n == 0) {
            break;
        }
        received += n;
    }

    if (received == sizeof(failure)) {
        child->wait();
        std::error_code ec(failure.error, std::generic_category());
        if (failure.stage == kStageChdir) {
            throw std::filesystem::filesystem_error("chdir", options.cwd, ec);
        }
        throw std::system_error(ec, options.argv.front());
    }

    child->stdin_ = std::move(stdin_write);
    child->stdout_ = std::move(stdout_read);
    child->stderr_ = std::move(stderr_read);
    if (child->stdout_.valid()) {
        set_nonblocking(child->stdout_.get());
    }
    set_nonblocking(child->stderr_.get());

    LOG4CPLUS_DEBUG(process_logger(), "Spawned pid=" << pid << " cmd=" << options.argv.front());
    return child;
}

ChildProcess::~ChildProcess() {
    bool running = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running = pid_ > 0 && !exit_code_;
    }
    if (!running) {
        return;
    }

    if (::kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
        LOG4CPLUS_WARN(process_logger(), "Failed to kill pid=" << pid_ << ": " << std::strerror(errno));
    }
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) {
            LOG4CPLUS_WARN(process_logger(), "Failed to reap pid=" << pid_ << ": " << std::strerror(errno));
            break;
        }
    }
}

std::optional<int> ChildProcess::try_wait() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exit_code_) {
        return exit_code_;
    }

    int status = 0;
    pid_t rc;
    do {
        rc = ::waitpid(pid_, &status, WNOHANG);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        throw_errno("waitpid");
    }
    if (rc == 0) {
        return std::nullopt;
    }
    exit_code_ = decode_status(status);
    return exit_code_;
}

bool ChildProcess::wait_for(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!try_wait()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(kWaitStep, deadline - now));
    }
    return true;
}

int ChildProcess::wait() {
    std::optional<int> code;
    while (!(code = try_wait())) {
        std::this_thread::sleep_for(kWaitStep);
    }
    return *code;
}

void ChildProcess::terminate() {
    send_signal(SIGTERM);
}

void ChildProcess::kill() {
    send_signal(SIGKILL);
}

int ChildProcess::stop(std::chrono::milliseconds grace) {
    terminate();
    if (wait_for(grace)) {
        return *try_wait();
    }
    LOG4CPLUS_WARN(process_logger(), "pid=" << pid_ << " ignored SIGTERM for " << grace.count()
                                            << "ms, sending SIGKILL");
    kill();
    return wait();
}

void ChildProcess::send_signal(int sig) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Once reaped the pid may belong to someone else.
    if (exit_code_) {
        return;
    }
    if (::kill(pid_, sig) != 0 && errno != ESRCH) {
        throw_errno("kill");
    }
}

HelperResult run_helper(const SpawnOptions& options, const std::string& input) {
    SpawnOptions helper_options = options;
    helper_options.pipe_stdin = true;
    auto child = ChildProcess::spawn(helper_options);

    set_nonblocking(child->stdin_fd());
    if (input.empty()) {
        child->close_stdin();
    }

    HelperResult result;
    std::size_t written = 0;
    bool stdout_open = child->stdout_fd() >= 0;
    bool stderr_open = true;
    char buffer[kHelperReadChunk];

    while (child->stdin_fd() >= 0 || stdout_open || stderr_open) {
        pollfd fds[3];
        int stdin_index = -1, stdout_index = -1, stderr_index = -1;
        nfds_t nfds = 0;
        if (child->stdin_fd() >= 0) {
            stdin_index = static_cast<int>(nfds);
            fds[nfds++] = pollfd{child->stdin_fd(), POLLOUT, 0};
        }
        if (stdout_open) {
            stdout_index = static_cast<int>(nfds);
            fds[nfds++] = pollfd{child->stdout_fd(), POLLIN, 0};
        }
        if (stderr_open) {
            stderr_index = static_cast<int>(nfds);
            fds[nfds++] = pollfd{child->stderr_fd(), POLLIN, 0};
        }

        if (::poll(fds, nfds, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw_errno("poll");
        }

        if (stdin_index >= 0 && fds[stdin_index].revents != 0) {
            if (fds[stdin_index].revents & POLLOUT) {
                ssize_t n = ::write(child->stdin_fd(), input.data() + written, input.size() - written);
                if (n >= 0) {
                    written += static_cast<std::size_t>(n);
                } else if (errno == EPIPE) {
                    written = input.size();
                } else if (errno != EAGAIN && errno != EINTR) {
                    throw_errno("write");
                }
            } else {
                // Reader went away without consuming everything.
                written = input.size();
            }
            if (written == input.size()) {
                child->close_stdin();
            }
        }

        auto drain = [&](int index, int fd, bool& open, std::string& sink) {
            if (index < 0 || fds[index].revents == 0) {
                return;
            }
            ssize_t n = ::read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                sink.append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0) {
                open = false;
            } else if (errno != EAGAIN && errno != EINTR) {
                throw_errno("read");
            }
        };
        drain(stdout_index, child->stdout_fd(), stdout_open, result.output);
        drain(stderr_index, child->stderr_fd(), stderr_open, result.error_output);
    }

    result.exit_code = child->wait();
    return result;
}

} // namespace fsagent
