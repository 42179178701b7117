/**
 * @file concurrency_controller.h
 * @brief Adaptive worker count from a batch's file-size profile
 */

#ifndef KCENON_BULK_UPLOAD_CORE_CONCURRENCY_CONTROLLER_H
#define KCENON_BULK_UPLOAD_CORE_CONCURRENCY_CONTROLLER_H

#include <cstddef>
#include <cstdint>
#include <span>

namespace kcenon::bulk_upload {

/**
 * @brief Maps the average file size of a batch to a parallel upload count
 *
 * Step policy, keeping concurrency x average size near 120 MB:
 * | avg size        | concurrency |
 * |-----------------|-------------|
 * | empty batch     | 12          |
 * | < 5 MB          | 24          |
 * | 5 MB to < 20 MB | 16          |
 * | 20 MB to < 50 MB| 12          |
 * | >= 50 MB        | 6           |
 *
 * Stateless and deterministic.
 */
class concurrency_controller {
public:
    static constexpr std::size_t default_concurrency = 12;
    static constexpr std::size_t small_file_concurrency = 24;
    static constexpr std::size_t medium_file_concurrency = 16;
    static constexpr std::size_t large_file_concurrency = 12;
    static constexpr std::size_t huge_file_concurrency = 6;

    static constexpr double small_file_limit_mb = 5.0;
    static constexpr double medium_file_limit_mb = 20.0;
    static constexpr double large_file_limit_mb = 50.0;

    /**
     * @brief Compute concurrency for a set of file sizes in bytes
     */
    [[nodiscard]] static auto concurrency_for(std::span<const uint64_t> file_sizes)
        -> std::size_t;

    /**
     * @brief Compute concurrency, capped by a caller hint
     * @param file_sizes File sizes in bytes
     * @param hint Upper bound; 0 means no bound
     */
    [[nodiscard]] static auto concurrency_for(std::span<const uint64_t> file_sizes,
                                              std::size_t hint) -> std::size_t;

    /**
     * @brief Step function over an average size in megabytes
     */
    [[nodiscard]] static constexpr auto concurrency_for_average_mb(double avg_mb)
        -> std::size_t {
        if (avg_mb < small_file_limit_mb) {
            return small_file_concurrency;
        }
        if (avg_mb < medium_file_limit_mb) {
            return medium_file_concurrency;
        }
        if (avg_mb < large_file_limit_mb) {
            return large_file_concurrency;
        }
        return huge_file_concurrency;
    }
};

}  // namespace kcenon::bulk_upload

#endif  // KCENON_BULK_UPLOAD_CORE_CONCURRENCY_CONTROLLER_H
