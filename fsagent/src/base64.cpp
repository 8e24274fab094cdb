#include "base64.hpp"

#include <array>
#include <cctype>
#include <cstdint>

namespace fsagent::codec {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

const std::array<int8_t, 256>& lookup_table() {
    static const std::array<int8_t, 256> table = [] {
        std::array<int8_t, 256> t{};
        t.fill(-1);
        for (int i = 0; kAlphabet[i] != '\0'; ++i) {
            t[static_cast<uint8_t>(kAlphabet[i])] = static_cast<int8_t>(i);
        }
        return t;
    }();
    return table;
}

} // namespace

std::string encode_base64(const char* data, std::size_t size) {
    std::string encoded;
    encoded.reserve(((size + 2) / 3) * 4);

    uint32_t buffer = 0;
    int bits_collected = 0;
    for (std::size_t i = 0; i < size; ++i) {
        buffer = (buffer << 8) | static_cast<uint8_t>(data[i]);
        bits_collected += 8;
        while (bits_collected >= 6) {
            bits_collected -= 6;
            encoded.push_back(kAlphabet[(buffer >> bits_collected) & 0x3F]);
        }
    }
    if (bits_collected > 0) {
        encoded.push_back(kAlphabet[(buffer << (6 - bits_collected)) & 0x3F]);
    }
    while (encoded.size() % 4 != 0) {
        encoded.push_back('=');
    }
    return encoded;
}

std::string encode_base64(const std::string& bytes) {
    return encode_base64(bytes.data(), bytes.size());
}

std::optional<std::string> decode_base64(const std::string& text) {
    const auto& table = lookup_table();

    std::string decoded;
    decoded.reserve((text.size() * 3) / 4);

    uint32_t buffer = 0;
    int bits_collected = 0;
    std::size_t symbols = 0;
    bool padding = false;
    for (char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            continue;
        }
        if (ch == '=') {
            padding = true;
            continue;
        }
        if (padding) {
            return std::nullopt;
        }
        int8_t value = table[static_cast<uint8_t>(ch)];
        if (value < 0) {
            return std::nullopt;
        }
        ++symbols;
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits_collected += 6;
        if (bits_collected >= 8) {
            bits_collected -= 8;
            decoded.push_back(static_cast<char>((buffer >> bits_collected) & 0xFF));
        }
    }

    // A lone symbol in the last quantum carries fewer than 8 bits.
    if (symbols % 4 == 1) {
        return std::nullopt;
    }
    return decoded;
}

} // namespace fsagent::codec
