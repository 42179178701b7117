/**
 * @file device_profile.h
 * @brief Device memory class and the batch size derived from it
 */

#ifndef KCENON_BULK_UPLOAD_CORE_DEVICE_PROFILE_H
#define KCENON_BULK_UPLOAD_CORE_DEVICE_PROFILE_H

#include <cstddef>
#include <cstdint>
#include <optional>

namespace kcenon::bulk_upload {

/// Batch size for devices under the low-memory threshold
inline constexpr std::size_t low_memory_batch_size = 1000;

/// Batch size for every other device
inline constexpr std::size_t standard_batch_size = 1500;

/// Devices with less physical memory than this use the smaller batch
inline constexpr uint64_t low_memory_threshold_bytes = 4ULL * 1024 * 1024 * 1024;

/**
 * @brief Physical memory installed on this machine
 * @return std::nullopt if it cannot be determined
 */
[[nodiscard]] auto physical_memory_bytes() -> std::optional<uint64_t>;

/**
 * @brief Batch size for a given amount of physical memory
 *
 * Unknown memory is treated as low memory.
 */
[[nodiscard]] constexpr auto batch_size_for_memory(std::optional<uint64_t> memory_bytes)
    -> std::size_t {
    if (!memory_bytes || *memory_bytes < low_memory_threshold_bytes) {
        return low_memory_batch_size;
    }
    return standard_batch_size;
}

/**
 * @brief Batch size for this device
 */
[[nodiscard]] auto default_batch_size() -> std::size_t;

}  // namespace kcenon::bulk_upload

#endif  // KCENON_BULK_UPLOAD_CORE_DEVICE_PROFILE_H
