/**
 * @file upload_types.h
 * @brief Value types exchanged between the upload engine components
 */

#ifndef KCENON_BULK_UPLOAD_CORE_UPLOAD_TYPES_H
#define KCENON_BULK_UPLOAD_CORE_UPLOAD_TYPES_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "types.h"

namespace kcenon::bulk_upload {

/// Bytes per megabyte used for every size and throughput figure
inline constexpr double bytes_per_mb = 1024.0 * 1024.0;

/// Percent range owned by the upload phase; the rest is finalization
inline constexpr double upload_phase_percent = 90.0;

/// Error text reported for files short-circuited by cancellation
inline constexpr const char* cancelled_error = "cancelled";

/**
 * @brief A file supplied by the caller for upload
 *
 * Identity is positional within its batch.
 */
struct file_descriptor {
    std::string name;
    uint64_t size_bytes = 0;
    std::string mime_type;
    std::string relative_path;
    std::filesystem::path source_path;
};

/**
 * @brief Ordered multipart form fields, kept in issue order
 */
using form_field_list = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief A pre-authorized upload target issued for one file
 */
struct signed_destination {
    std::string url;
    form_field_list form_fields;
    std::string media_record_id;
    std::string storage_key;
};

/**
 * @brief Why a file did not upload
 *
 * Decided where the failure happens, so retry policy never has to inspect
 * message text.
 */
enum class upload_failure_kind {
    none,
    cancelled,
    missing_credential,
    destination_issuance,
    file_read,
    rejected,
    timeout,
    connection_refused,
    connection_lost,
    transport_error,
};

[[nodiscard]] constexpr auto to_string(upload_failure_kind kind) -> const char* {
    switch (kind) {
        case upload_failure_kind::none: return "none";
        case upload_failure_kind::cancelled: return "cancelled";
        case upload_failure_kind::missing_credential: return "missing_credential";
        case upload_failure_kind::destination_issuance: return "destination_issuance";
        case upload_failure_kind::file_read: return "file_read";
        case upload_failure_kind::rejected: return "rejected";
        case upload_failure_kind::timeout: return "timeout";
        case upload_failure_kind::connection_refused: return "connection_refused";
        case upload_failure_kind::connection_lost: return "connection_lost";
        case upload_failure_kind::transport_error: return "transport_error";
        default: return "unknown";
    }
}

/**
 * @brief Check whether a failure means the request got no response
 */
[[nodiscard]] constexpr auto is_connectivity_loss(upload_failure_kind kind) -> bool {
    return kind == upload_failure_kind::timeout ||
           kind == upload_failure_kind::connection_refused ||
           kind == upload_failure_kind::connection_lost;
}

/**
 * @brief Outcome of uploading one file
 */
struct upload_result {
    std::string file_name;
    std::string relative_path;
    bool success = false;
    uint64_t size_bytes = 0;
    std::optional<double> elapsed_seconds;
    std::optional<double> throughput_mbps;
    std::optional<std::string> error;
    upload_failure_kind failure = upload_failure_kind::none;
    std::optional<int> http_status;
    std::optional<std::string> media_record_id;
    std::optional<std::string> storage_key;

    [[nodiscard]] auto is_cancelled() const -> bool {
        return failure == upload_failure_kind::cancelled;
    }

    /**
     * @brief Create a failed result for a file
     */
    [[nodiscard]] static auto failed(const file_descriptor& file,
                                     upload_failure_kind kind,
                                     std::string reason) -> upload_result {
        upload_result r;
        r.file_name = file.name;
        r.relative_path = file.relative_path;
        r.size_bytes = file.size_bytes;
        r.success = false;
        r.failure = kind;
        r.error = std::move(reason);
        return r;
    }

    [[nodiscard]] static auto cancelled_for(const file_descriptor& file) -> upload_result {
        return failed(file, upload_failure_kind::cancelled, cancelled_error);
    }
};

/**
 * @brief Aggregate over a completed run
 */
struct batch_stats {
    uint64_t total_files = 0;
    uint64_t success_count = 0;
    uint64_t fail_count = 0;
    double total_size_mb = 0.0;
    double total_time_sec = 0.0;
    double avg_speed_mbps = 0.0;
};

/**
 * @brief Derive batch statistics from per-file results
 * @param results Per-file results of the run
 * @param elapsed Wall-clock duration of the run
 */
[[nodiscard]] auto compute_batch_stats(const std::vector<upload_result>& results,
                                       std::chrono::steady_clock::duration elapsed)
    -> batch_stats;

/**
 * @brief Kind of progress event
 */
enum class progress_event_kind {
    progress,
    completed,
    cancelled,
    failed,
};

[[nodiscard]] constexpr auto to_string(progress_event_kind kind) -> const char* {
    switch (kind) {
        case progress_event_kind::progress: return "progress";
        case progress_event_kind::completed: return "completed";
        case progress_event_kind::cancelled: return "cancelled";
        case progress_event_kind::failed: return "failed";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal(progress_event_kind kind) -> bool {
    return kind != progress_event_kind::progress;
}

/**
 * @brief Progress notification for the caller
 *
 * Callers must not assume one event per file.
 */
struct progress_event {
    progress_event_kind kind = progress_event_kind::progress;
    double percent = 0.0;
    std::string message;
    uint64_t completed_files = 0;
    uint64_t total_files = 0;
    std::string session_id;
};

}  // namespace kcenon::bulk_upload

#endif  // KCENON_BULK_UPLOAD_CORE_UPLOAD_TYPES_H
