/**
 * @file upload_types.cpp
 * @brief Batch statistics aggregation
 */

#include "kcenon/bulk_upload/core/upload_types.h"

namespace kcenon::bulk_upload {

auto compute_batch_stats(const std::vector<upload_result>& results,
                         std::chrono::steady_clock::duration elapsed) -> batch_stats {
    batch_stats stats;
    stats.total_files = results.size();

    uint64_t total_bytes = 0;
    for (const auto& r : results) {
        if (r.success) {
            ++stats.success_count;
        } else {
            ++stats.fail_count;
        }
        total_bytes += r.size_bytes;
    }

    stats.total_size_mb = static_cast<double>(total_bytes) / bytes_per_mb;
    stats.total_time_sec = std::chrono::duration<double>(elapsed).count();
    if (stats.total_time_sec > 0.0) {
        stats.avg_speed_mbps = stats.total_size_mb / stats.total_time_sec;
    }
    return stats;
}

}  // namespace kcenon::bulk_upload
