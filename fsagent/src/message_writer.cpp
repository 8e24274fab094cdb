#include "message_writer.hpp"

#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace fsagent {

void MessageWriter::send_ready(int version) {
    emit(codec::encode_ready(version));
}

void MessageWriter::send_data(int64_t id, const nlohmann::json& payload) {
    emit(codec::encode_message(id, codec::MessageKind::Data, payload));
}

void MessageWriter::send_result(int64_t id, const nlohmann::json& payload) {
    emit(codec::encode_message(id, codec::MessageKind::Result, payload));
}

void MessageWriter::send_error(int64_t id, const std::string& message) {
    emit(codec::encode_message(id, codec::MessageKind::Error, message));
}

void MessageWriter::emit(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_line(line);
}

StreamMessageWriter::StreamMessageWriter(std::ostream& out) : out_(out) {}

void StreamMessageWriter::write_line(const std::string& line) {
    out_.write(line.data(), static_cast<std::streamsize>(line.size()));
    out_.put('\n');
    out_.flush();
    if (!out_ && !failed_) {
        // Peer is gone; the read loop sees EOF shortly after.
        failed_ = true;
        LOG4CPLUS_ERROR(agent_logger(), "Failed to write message to output stream");
    }
}

} // namespace fsagent
