#pragma once

#include "child_process.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace fsagent {

class MessageWriter;

struct SupervisorOptions {
    std::chrono::milliseconds poll_interval{50};
    std::chrono::milliseconds kill_grace{2000};
    std::chrono::milliseconds drain_timeout{5000};
};

/**
 * Owns the processes started by exec requests.
 *
 * Each tracked process gets a streaming thread that forwards its stdout and
 * stderr as data messages and sends the terminal result or error for the
 * owning request id. The tracked set and the cancel markers share one mutex,
 * which is never held across I/O or a wait.
 *
 * A cancelled process stops within one poll interval plus kill_grace.
 */
class ProcessSupervisor {
public:
    ProcessSupervisor(MessageWriter& writer, SupervisorOptions options);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /// Tracks `child` under `id` and starts streaming it. Throws AgentError
    /// if `id` already has a tracked process.
    void start(int64_t id, std::unique_ptr<ChildProcess> child);

    /// Terminates the process tracked for `target` with the kill grace bound.
    /// Returns false if nothing is tracked for it.
    bool kill(int64_t target);

    /// Marks a tracked `target` cancelled and sends SIGTERM; the streaming
    /// loop finishes the job. An untracked id leaves no marker behind.
    void cancel(int64_t target);

    bool is_tracked(int64_t id) const;
    bool is_cancelled(int64_t id) const;
    std::size_t tracked_count() const;

    /// Stops every tracked process and joins all streaming threads.
    void shutdown();

private:
    struct OutputPipe {
        int fd;
        const char* key;
        bool open;
    };

    void stream(int64_t id, std::shared_ptr<ChildProcess> child, uint64_t worker);
    // Exit code, or nullopt when the process was cancelled.
    std::optional<int> run_stream(int64_t id, ChildProcess& child);
    void pump(int64_t id, OutputPipe* pipes, std::size_t count);
    void drain(int64_t id, OutputPipe* pipes, std::size_t count);
    void release(int64_t id, uint64_t worker);
    void join_finished_workers();

    MessageWriter& writer_;
    const SupervisorOptions options_;

    mutable std::mutex mutex_;
    std::unordered_map<int64_t, std::shared_ptr<ChildProcess>> processes_;
    std::unordered_set<int64_t> cancelled_;

    std::unordered_map<uint64_t, std::thread> workers_;
    std::vector<uint64_t> finished_workers_;
    uint64_t next_worker_ = 0;
};

} // namespace fsagent
