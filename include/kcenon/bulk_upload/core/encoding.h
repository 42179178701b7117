/**
 * @file encoding.h
 * @brief Encoding and identifier helpers
 */

#ifndef KCENON_BULK_UPLOAD_CORE_ENCODING_H
#define KCENON_BULK_UPLOAD_CORE_ENCODING_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::bulk_upload::encoding {

/**
 * @brief Convert bytes to lowercase hex
 */
[[nodiscard]] auto bytes_to_hex(std::span<const uint8_t> bytes) -> std::string;

/**
 * @brief Standard base64 encoding with padding
 */
[[nodiscard]] auto base64_encode(std::span<const uint8_t> data) -> std::string;

/**
 * @brief Decode standard base64
 * @return std::nullopt if @p encoded contains characters outside the alphabet
 */
[[nodiscard]] auto base64_decode(std::string_view encoded)
    -> std::optional<std::vector<uint8_t>>;

/**
 * @brief Generate @p byte_count random bytes rendered as hex
 */
[[nodiscard]] auto generate_random_hex(std::size_t byte_count) -> std::string;

/**
 * @brief Generate a random RFC 4122 version 4 UUID string
 *
 * Used for run session ids and retry queue entry ids.
 */
[[nodiscard]] auto generate_uuid() -> std::string;

}  // namespace kcenon::bulk_upload::encoding

#endif  // KCENON_BULK_UPLOAD_CORE_ENCODING_H
