#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace fsagent::codec {

// Standard alphabet, padded output.
std::string encode_base64(const char* data, std::size_t size);
std::string encode_base64(const std::string& bytes);

// Whitespace is ignored. Returns nullopt on characters outside the alphabet
// or a truncated final quantum.
std::optional<std::string> decode_base64(const std::string& text);

} // namespace fsagent::codec
