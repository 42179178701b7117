/**
 * @file encoding.cpp
 * @brief Encoding and identifier helpers
 */

#include "kcenon/bulk_upload/core/encoding.h"

#include <array>
#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::bulk_upload::encoding {

namespace {

constexpr const char* base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr auto make_decode_table() -> std::array<int, 256> {
    std::array<int, 256> table{};
    for (auto& v : table) {
        v = -1;
    }
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(base64_chars[i])] = i;
    }
    return table;
}

constexpr auto base64_decode_table = make_decode_table();

auto random_engine() -> std::mt19937_64& {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    return gen;
}

}  // namespace

auto bytes_to_hex(std::span<const uint8_t> bytes) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

auto base64_encode(std::span<const uint8_t> data) -> std::string {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(data[i + 2]);

        result += base64_chars[(n >> 18) & 0x3F];
        result += base64_chars[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? base64_chars[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? base64_chars[n & 0x3F] : '=';
    }

    return result;
}

auto base64_decode(std::string_view encoded) -> std::optional<std::vector<uint8_t>> {
    std::vector<uint8_t> result;
    result.reserve((encoded.size() / 4) * 3);

    uint32_t bits = 0;
    int bit_count = 0;

    for (char c : encoded) {
        if (c == '=') break;
        if (c == '\n' || c == '\r') continue;
        int val = base64_decode_table[static_cast<unsigned char>(c)];
        if (val < 0) {
            return std::nullopt;
        }

        bits = ((bits << 6) | static_cast<uint32_t>(val)) & 0xFFFFFF;
        bit_count += 6;

        if (bit_count >= 8) {
            bit_count -= 8;
            result.push_back(static_cast<uint8_t>((bits >> bit_count) & 0xFF));
        }
    }

    return result;
}

auto generate_random_hex(std::size_t byte_count) -> std::string {
    std::uniform_int_distribution<int> dis(0, 255);
    std::vector<uint8_t> bytes(byte_count);
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(dis(random_engine()));
    }
    return bytes_to_hex(bytes);
}

auto generate_uuid() -> std::string {
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t part1 = dis(random_engine());
    uint64_t part2 = dis(random_engine());

    std::array<uint8_t, 16> bytes{};
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>((part1 >> (i * 8)) & 0xFF);
        bytes[i + 8] = static_cast<uint8_t>((part2 >> (i * 8)) & 0xFF);
    }

    // RFC 4122 version 4, variant 10
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    auto hex = bytes_to_hex(bytes);
    return hex.substr(0, 8) + '-' + hex.substr(8, 4) + '-' + hex.substr(12, 4) + '-' +
           hex.substr(16, 4) + '-' + hex.substr(20);
}

}  // namespace kcenon::bulk_upload::encoding
