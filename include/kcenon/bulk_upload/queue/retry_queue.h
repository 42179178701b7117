/**
 * @file retry_queue.h
 * @brief Durable queue of uploads that failed for lack of connectivity
 * @version 0.1.0
 *
 * Entries are persisted one JSON record per file so they survive process
 * restarts, and are replayed when connectivity returns or on demand.
 */

#ifndef KCENON_BULK_UPLOAD_QUEUE_RETRY_QUEUE_H
#define KCENON_BULK_UPLOAD_QUEUE_RETRY_QUEUE_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../core/types.h"
#include "../transport/http_transport.h"
#include "request_snapshot.h"

namespace kcenon::bulk_upload {

/**
 * @brief Retry queue configuration
 */
struct retry_queue_config {
    /// Directory holding one record per entry
    std::filesystem::path directory =
        std::filesystem::temp_directory_path() / "bulk_upload_queue";

    /// Failed replays after which an entry is discarded
    uint32_t max_retries = 3;

    /// Whether status() runs a replay pass before reporting
    bool replay_on_status = true;
};

/**
 * @brief A persisted upload awaiting replay
 */
struct retry_queue_entry {
    uint32_t schema_version = 0;
    std::string id;
    request_snapshot request;
    std::chrono::system_clock::time_point enqueued_at;
    uint32_t retry_count = 0;
};

/**
 * @brief Totals of one replay pass
 */
struct replay_report {
    std::size_t attempted = 0;
    std::size_t succeeded = 0;
    std::size_t retried = 0;
    std::size_t exhausted = 0;
    /// Set when another pass was already running and this one did nothing
    bool skipped = false;
};

enum class retry_queue_event_kind {
    enqueued,
    replay_succeeded,
    replay_failed,
    exhausted,
};

[[nodiscard]] constexpr auto to_string(retry_queue_event_kind kind) -> const char* {
    switch (kind) {
        case retry_queue_event_kind::enqueued: return "enqueued";
        case retry_queue_event_kind::replay_succeeded: return "replay_succeeded";
        case retry_queue_event_kind::replay_failed: return "replay_failed";
        case retry_queue_event_kind::exhausted: return "exhausted";
        default: return "unknown";
    }
}

/**
 * @brief Notification about an entry's lifecycle
 */
struct retry_queue_event {
    retry_queue_event_kind kind = retry_queue_event_kind::enqueued;
    std::string entry_id;
    std::string file_name;
    uint32_t retry_count = 0;
    std::optional<std::string> error;
};

/**
 * @brief Snapshot of the queue for callers
 */
struct retry_queue_status {
    std::size_t pending = 0;
    std::vector<retry_queue_entry> entries;
    std::optional<replay_report> replay;
};

/**
 * @brief Persisted record encoding
 *
 * Records carry a schema_version; decode() rejects versions newer than
 * retry_queue_codec::schema_version with queue_schema_unsupported.
 */
namespace retry_queue_codec {

inline constexpr uint32_t schema_version = 1;

[[nodiscard]] auto encode(const retry_queue_entry& entry) -> std::string;

[[nodiscard]] auto decode(const std::string& text) -> result<retry_queue_entry>;

}  // namespace retry_queue_codec

/**
 * @brief Durable retry queue
 *
 * Entry lifecycle:
 * @code
 * pending -> replaying -> succeeded          (record removed)
 *                      -> failed, retryable  (retry_count + 1, back to pending)
 *                      -> exhausted          (retry_count reached max, removed)
 * @endcode
 *
 * Every mutation of an entry is one locked operation that writes the
 * record to a temporary file and renames it into place. Enqueue may run
 * concurrently with a replay pass; only one replay pass runs at a time.
 *
 * Usage:
 * @code
 * retry_queue queue(retry_queue_config{}, transport);
 * queue.on_event([](const retry_queue_event& e) { ... });
 * // ...later, when the network is back
 * auto report = queue.on_connectivity_restored();
 * @endcode
 */
class retry_queue {
public:
    using event_callback = std::function<void(const retry_queue_event&)>;

    /**
     * @brief Open the queue, creating the directory and loading records
     */
    retry_queue(retry_queue_config config, std::shared_ptr<http_transport_interface> transport);
    ~retry_queue();

    retry_queue(const retry_queue&) = delete;
    auto operator=(const retry_queue&) -> retry_queue& = delete;
    retry_queue(retry_queue&&) noexcept;
    auto operator=(retry_queue&&) noexcept -> retry_queue&;

    /**
     * @brief Persist a request for later replay
     * @return The new entry id, or queue_storage_error
     */
    [[nodiscard]] auto enqueue(request_snapshot request) -> result<std::string>;

    /**
     * @brief Replay every pending entry once
     */
    [[nodiscard]] auto replay_pending() -> result<replay_report>;

    /**
     * @brief Connectivity came back; replay pending entries
     */
    [[nodiscard]] auto on_connectivity_restored() -> result<replay_report>;

    /**
     * @brief Caller-invoked replay
     */
    [[nodiscard]] auto retry_now() -> result<replay_report>;

    /**
     * @brief Report queue contents, replaying first if configured to
     */
    [[nodiscard]] auto status() -> result<retry_queue_status>;

    /**
     * @brief Number of pending entries, without side effects
     */
    [[nodiscard]] auto pending_count() const -> std::size_t;

    [[nodiscard]] auto entries() const -> std::vector<retry_queue_entry>;

    [[nodiscard]] auto get(const std::string& id) const -> result<retry_queue_entry>;

    [[nodiscard]] auto remove(const std::string& id) -> result<void>;

    /**
     * @brief Re-read records from disk, replacing the in-memory view
     * @return Number of entries loaded
     */
    [[nodiscard]] auto reload() -> result<std::size_t>;

    void on_event(event_callback callback);

    [[nodiscard]] auto config() const -> const retry_queue_config&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::bulk_upload

#endif  // KCENON_BULK_UPLOAD_QUEUE_RETRY_QUEUE_H
