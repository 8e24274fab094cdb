#include "json_codec.hpp"

#include "agent_error.hpp"
#include "base64.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace fsagent::codec {

namespace {

const char* message_key(MessageKind kind) {
    switch (kind) {
        case MessageKind::Data:
            return "d";
        case MessageKind::Result:
            return "r";
        case MessageKind::Error:
            return "e";
    }
    return "e";
}

// Paths and process diagnostics are not guaranteed to be UTF-8. Invalid
// sequences become U+FFFD, so such a path cannot be used to reach the file.
std::string dump_line(const nlohmann::json& msg) {
    try {
        return msg.dump();
    } catch (const nlohmann::json::type_error& exc) {
        LOG4CPLUS_WARN(agent_logger(), "Replacing invalid UTF-8 in outgoing message: " << exc.what());
        return msg.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
}

const nlohmann::json* find_present(const nlohmann::json& params, const std::string& key) {
    const nlohmann::json* value = find_key(params, key);
    if (!value || value->is_null()) {
        return nullptr;
    }
    return value;
}

[[noreturn]] void throw_missing(const std::string& key) {
    throw ValidationError("missing parameter '" + key + "'");
}

[[noreturn]] void throw_type(const std::string& key, const char* expected) {
    throw ValidationError("parameter '" + key + "' must be " + expected);
}

} // namespace

std::optional<Request> decode_request(const std::string& line, std::string& error) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& exc) {
        error = exc.what();
        return std::nullopt;
    }
    if (!root.is_object()) {
        error = "request must be a JSON object";
        return std::nullopt;
    }

    Request req;
    if (auto id_obj = find_key(root, "id"); id_obj && id_obj->is_number_integer()) {
        req.id = id_obj->get<int64_t>();
    }
    if (auto method_obj = find_key(root, "m"); method_obj && method_obj->is_string()) {
        req.method = method_obj->get<std::string>();
    }
    if (auto params_obj = find_key(root, "p"); params_obj && !params_obj->is_null()) {
        req.params = *params_obj;
    }

    return req;
}

std::string encode_message(int64_t id, MessageKind kind, const nlohmann::json& payload) {
    nlohmann::json msg = nlohmann::json::object();
    msg["id"] = id;
    msg[message_key(kind)] = payload;
    return dump_line(msg);
}

std::string encode_ready(int version) {
    nlohmann::json msg = nlohmann::json::object();
    msg["id"] = 0;
    msg["ok"] = true;
    msg["v"] = version;
    return dump_line(msg);
}

const nlohmann::json* find_key(const nlohmann::json& obj, const std::string& key) {
    if (!obj.is_object()) {
        return nullptr;
    }
    auto it = obj.find(key);
    if (it == obj.end()) {
        return nullptr;
    }
    return &*it;
}

std::string require_string(const nlohmann::json& params, const std::string& key) {
    auto value = optional_string(params, key);
    if (!value) {
        throw_missing(key);
    }
    return *value;
}

std::optional<std::string> optional_string(const nlohmann::json& params, const std::string& key) {
    const nlohmann::json* value = find_present(params, key);
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        throw_type(key, "a string");
    }
    return value->get<std::string>();
}

int64_t require_int64(const nlohmann::json& params, const std::string& key) {
    auto value = optional_int64(params, key);
    if (!value) {
        throw_missing(key);
    }
    return *value;
}

std::optional<int64_t> optional_int64(const nlohmann::json& params, const std::string& key) {
    const nlohmann::json* value = find_present(params, key);
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_number_integer()) {
        throw_type(key, "an integer");
    }
    return value->get<int64_t>();
}

bool optional_bool(const nlohmann::json& params, const std::string& key, bool fallback) {
    const nlohmann::json* value = find_present(params, key);
    if (!value) {
        return fallback;
    }
    if (!value->is_boolean()) {
        throw_type(key, "a boolean");
    }
    return value->get<bool>();
}

std::vector<std::string> optional_string_list(const nlohmann::json& params, const std::string& key) {
    std::vector<std::string> result;
    const nlohmann::json* value = find_present(params, key);
    if (!value) {
        return result;
    }
    if (!value->is_array()) {
        throw_type(key, "an array of strings");
    }
    result.reserve(value->size());
    for (const auto& item : *value) {
        if (!item.is_string()) {
            throw_type(key, "an array of strings");
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

const nlohmann::json& require_array(const nlohmann::json& params, const std::string& key) {
    const nlohmann::json* value = find_present(params, key);
    if (!value) {
        throw_missing(key);
    }
    if (!value->is_array()) {
        throw_type(key, "an array");
    }
    return *value;
}

std::string require_bytes(const nlohmann::json& params, const std::string& key) {
    auto decoded = decode_base64(require_string(params, key));
    if (!decoded) {
        throw ValidationError("parameter '" + key + "' is not valid base64");
    }
    return std::move(*decoded);
}

} // namespace fsagent::codec
