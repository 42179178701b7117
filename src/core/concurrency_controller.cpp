/**
 * @file concurrency_controller.cpp
 * @brief Adaptive concurrency controller implementation
 */

#include "kcenon/bulk_upload/core/concurrency_controller.h"

#include <algorithm>

#include "kcenon/bulk_upload/core/upload_types.h"

namespace kcenon::bulk_upload {

auto concurrency_controller::concurrency_for(std::span<const uint64_t> file_sizes)
    -> std::size_t {
    if (file_sizes.empty()) {
        return default_concurrency;
    }

    double total = 0.0;
    for (auto size : file_sizes) {
        total += static_cast<double>(size);
    }
    const double avg_mb = total / static_cast<double>(file_sizes.size()) / bytes_per_mb;
    return concurrency_for_average_mb(avg_mb);
}

auto concurrency_controller::concurrency_for(std::span<const uint64_t> file_sizes,
                                             std::size_t hint) -> std::size_t {
    auto computed = concurrency_for(file_sizes);
    if (hint == 0) {
        return computed;
    }
    return std::min(computed, hint);
}

}  // namespace kcenon::bulk_upload
