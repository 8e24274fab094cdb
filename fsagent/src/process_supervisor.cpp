#include "process_supervisor.hpp"

#include "agent_error.hpp"
#include "base64.hpp"
#include "logger.hpp"
#include "message_writer.hpp"

#include <algorithm>
#include <cerrno>

#include <poll.h>
#include <unistd.h>

#include <log4cplus/loggingmacros.h>

namespace fsagent {

namespace {

constexpr std::size_t kStreamReadChunk = 4096;
constexpr std::size_t kDrainMessageChunk = 64 * 1024;

} // namespace

ProcessSupervisor::ProcessSupervisor(MessageWriter& writer, SupervisorOptions options)
    : writer_(writer), options_(options) {}

ProcessSupervisor::~ProcessSupervisor() {
    shutdown();
}

void ProcessSupervisor::start(int64_t id, std::unique_ptr<ChildProcess> child) {
    std::shared_ptr<ChildProcess> shared(std::move(child));
    join_finished_workers();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (processes_.count(id) != 0) {
            throw AgentError("request id already in use: " + std::to_string(id));
        }
        processes_.emplace(id, shared);

        // Created under the lock so release() always finds the worker entry.
        uint64_t worker = next_worker_++;
        workers_.emplace(worker, std::thread(&ProcessSupervisor::stream, this, id, shared, worker));
    }
    LOG4CPLUS_INFO(process_logger(), "exec id=" << id << " pid=" << shared->pid() << " started");
}

bool ProcessSupervisor::kill(int64_t target) {
    std::shared_ptr<ChildProcess> child;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(target);
        if (it == processes_.end()) {
            return false;
        }
        child = it->second;
    }

    int code = child->stop(options_.kill_grace);
    LOG4CPLUS_INFO(process_logger(), "exec id=" << target << " killed, exit code " << code);
    return true;
}

void ProcessSupervisor::cancel(int64_t target) {
    std::shared_ptr<ChildProcess> child;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(target);
        if (it == processes_.end()) {
            return;
        }
        cancelled_.insert(target);
        child = it->second;
    }

    LOG4CPLUS_INFO(process_logger(), "exec id=" << target << " cancel requested");
    child->terminate();
}

bool ProcessSupervisor::is_tracked(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.count(id) != 0;
}

bool ProcessSupervisor::is_cancelled(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_.count(id) != 0;
}

std::size_t ProcessSupervisor::tracked_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.size();
}

void ProcessSupervisor::shutdown() {
    std::vector<std::shared_ptr<ChildProcess>> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : processes_) {
            cancelled_.insert(entry.first);
            running.push_back(entry.second);
        }
    }

    if (!running.empty()) {
        LOG4CPLUS_INFO(process_logger(), "Stopping " << running.size() << " running process(es)");
    }
    for (const auto& child : running) {
        try {
            child->terminate();
        } catch (const std::exception& exc) {
            LOG4CPLUS_WARN(process_logger(), "terminate pid=" << child->pid() << " failed: " << exc.what());
        }
    }

    std::unordered_map<uint64_t, std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
        finished_workers_.clear();
    }
    for (auto& entry : workers) {
        if (entry.second.joinable()) {
            entry.second.join();
        }
    }
}

void ProcessSupervisor::stream(int64_t id, std::shared_ptr<ChildProcess> child, uint64_t worker) {
    std::optional<int> code;
    std::string failure;
    try {
        code = run_stream(id, *child);
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(process_logger(), "exec id=" << id << " streaming failed: " << exc.what());
        failure = exc.what();
        if (failure.empty()) {
            failure = "exec failed";
        }
    }

    // Untracked before the terminal message goes out, so the peer may reuse
    // the id as soon as it sees the result.
    release(id, worker);

    if (!failure.empty()) {
        writer_.send_error(id, failure);
    } else if (code) {
        writer_.send_result(id, nlohmann::json{{"code", *code}});
    } else {
        writer_.send_error(id, "cancelled");
    }
}

std::optional<int> ProcessSupervisor::run_stream(int64_t id, ChildProcess& child) {
    OutputPipe pipes[] = {
        {child.stdout_fd(), "out", child.stdout_fd() >= 0},
        {child.stderr_fd(), "err", child.stderr_fd() >= 0},
    };
    constexpr std::size_t kPipeCount = sizeof(pipes) / sizeof(pipes[0]);

    while (true) {
        if (is_cancelled(id)) {
            int code = child.stop(options_.kill_grace);
            LOG4CPLUS_INFO(process_logger(), "exec id=" << id << " cancelled, exit code " << code);
            return std::nullopt;
        }

        if (auto code = child.try_wait()) {
            drain(id, pipes, kPipeCount);
            LOG4CPLUS_INFO(process_logger(), "exec id=" << id << " exited with code " << *code);
            return code;
        }

        pump(id, pipes, kPipeCount);
    }
}

// Waits up to one poll interval and forwards whatever is readable.
void ProcessSupervisor::pump(int64_t id, OutputPipe* pipes, std::size_t count) {
    pollfd fds[2];
    OutputPipe* owners[2];
    nfds_t nfds = 0;
    for (std::size_t i = 0; i < count && nfds < 2; ++i) {
        if (pipes[i].open) {
            fds[nfds] = pollfd{pipes[i].fd, POLLIN, 0};
            owners[nfds] = &pipes[i];
            ++nfds;
        }
    }

    if (nfds == 0) {
        std::this_thread::sleep_for(options_.poll_interval);
        return;
    }

    int rc = ::poll(fds, nfds, static_cast<int>(options_.poll_interval.count()));
    if (rc < 0) {
        if (errno == EINTR) {
            return;
        }
        throw_errno("poll");
    }

    char buffer[kStreamReadChunk];
    for (nfds_t i = 0; i < nfds; ++i) {
        if (fds[i].revents == 0) {
            continue;
        }
        ssize_t n = ::read(owners[i]->fd, buffer, sizeof(buffer));
        if (n > 0) {
            writer_.send_data(id, nlohmann::json{{owners[i]->key,
                                                  codec::encode_base64(buffer, static_cast<std::size_t>(n))}});
        } else if (n == 0) {
            owners[i]->open = false;
        } else if (errno != EAGAIN && errno != EINTR) {
            throw_errno("read");
        }
    }
}

// After exit: collect what is left in both pipes, bounded by drain_timeout
// in case a grandchild still holds them open.
void ProcessSupervisor::drain(int64_t id, OutputPipe* pipes, std::size_t count) {
    const auto deadline = std::chrono::steady_clock::now() + options_.drain_timeout;
    std::vector<std::string> collected(count);
    char buffer[kStreamReadChunk];

    while (true) {
        pollfd fds[2];
        std::size_t owners[2];
        nfds_t nfds = 0;
        for (std::size_t i = 0; i < count && nfds < 2; ++i) {
            if (pipes[i].open) {
                fds[nfds] = pollfd{pipes[i].fd, POLLIN, 0};
                owners[nfds] = i;
                ++nfds;
            }
        }
        if (nfds == 0) {
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            LOG4CPLUS_WARN(process_logger(), "exec id=" << id << " output still open after "
                                                        << options_.drain_timeout.count() << "ms drain");
            break;
        }

        int rc = ::poll(fds, nfds, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw_errno("poll");
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            OutputPipe& pipe = pipes[owners[i]];
            ssize_t n = ::read(pipe.fd, buffer, sizeof(buffer));
            if (n > 0) {
                collected[owners[i]].append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0) {
                pipe.open = false;
            } else if (errno != EAGAIN && errno != EINTR) {
                throw_errno("read");
            }
        }
    }

    for (std::size_t i = 0; i < count; ++i) {
        const std::string& bytes = collected[i];
        for (std::size_t off = 0; off < bytes.size(); off += kDrainMessageChunk) {
            std::size_t len = std::min(kDrainMessageChunk, bytes.size() - off);
            writer_.send_data(id, nlohmann::json{{pipes[i].key, codec::encode_base64(bytes.data() + off, len)}});
        }
    }
}

void ProcessSupervisor::release(int64_t id, uint64_t worker) {
    std::lock_guard<std::mutex> lock(mutex_);
    processes_.erase(id);
    cancelled_.erase(id);
    finished_workers_.push_back(worker);
}

void ProcessSupervisor::join_finished_workers() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (uint64_t worker : finished_workers_) {
            auto it = workers_.find(worker);
            if (it != workers_.end()) {
                done.push_back(std::move(it->second));
                workers_.erase(it);
            }
        }
        finished_workers_.clear();
    }
    for (auto& thread : done) {
        thread.join();
    }
}

} // namespace fsagent
