#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

namespace fsagent {

/**
 * Single serialization point for everything the agent sends to the peer.
 *
 * Every send_* call encodes one message and hands exactly one complete line
 * to write_line() while holding the writer lock, so the dispatch loop and the
 * process streaming threads never interleave partial lines.
 */
class MessageWriter {
public:
    virtual ~MessageWriter() = default;

    void send_ready(int version);
    void send_data(int64_t id, const nlohmann::json& payload);
    void send_result(int64_t id, const nlohmann::json& payload);
    void send_error(int64_t id, const std::string& message);

protected:
    /// Called with the writer lock held. `line` has no trailing newline.
    virtual void write_line(const std::string& line) = 0;

private:
    void emit(const std::string& line);

    std::mutex mutex_;
};

/// Writes newline-terminated messages to a stream and flushes after each.
class StreamMessageWriter final : public MessageWriter {
public:
    explicit StreamMessageWriter(std::ostream& out);

protected:
    void write_line(const std::string& line) override;

private:
    std::ostream& out_;
    bool failed_ = false;
};

} // namespace fsagent
