#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fsagent::codec {

inline constexpr int kProtocolVersion = 1;

struct Request {
    int64_t id = 0;
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

enum class MessageKind {
    Data,
    Result,
    Error
};

/// Parses one request line. On malformed input returns nullopt and fills
/// `error`; nothing is thrown.
std::optional<Request> decode_request(const std::string& line, std::string& error);

/// Serializes `{"id": id, "d"|"r"|"e": payload}` as one compact line without
/// the trailing newline.
std::string encode_message(int64_t id, MessageKind kind, const nlohmann::json& payload);
std::string encode_ready(int version);

const nlohmann::json* find_key(const nlohmann::json& obj, const std::string& key);

// Parameter accessors. A key holding null counts as absent. Missing required
// keys and wrong types raise ValidationError naming the key.
std::string require_string(const nlohmann::json& params, const std::string& key);
std::optional<std::string> optional_string(const nlohmann::json& params, const std::string& key);
int64_t require_int64(const nlohmann::json& params, const std::string& key);
std::optional<int64_t> optional_int64(const nlohmann::json& params, const std::string& key);
bool optional_bool(const nlohmann::json& params, const std::string& key, bool fallback);
std::vector<std::string> optional_string_list(const nlohmann::json& params, const std::string& key);
const nlohmann::json& require_array(const nlohmann::json& params, const std::string& key);

/// Reads a base64 text parameter and returns the decoded bytes.
std::string require_bytes(const nlohmann::json& params, const std::string& key);

} // namespace fsagent::codec
