/**
 * @file upload_engine.h
 * @brief Bulk upload orchestrator
 * @version 0.1.0
 */

#ifndef KCENON_BULK_UPLOAD_CLIENT_UPLOAD_ENGINE_H
#define KCENON_BULK_UPLOAD_CLIENT_UPLOAD_ENGINE_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "../adapters/worker_pool.h"
#include "../core/progress_reporter.h"
#include "../core/types.h"
#include "../core/upload_types.h"
#include "../queue/retry_queue.h"
#include "../transport/http_transport.h"
#include "destination_client.h"
#include "upload_task.h"

namespace kcenon::bulk_upload {

/**
 * @brief Engine configuration
 */
struct upload_engine_config {
    /// Destination API root; the bulk endpoint is appended to it
    std::string api_base;

    /// Files per destination request; 0 derives it from device memory
    std::size_t batch_size = 0;

    /// Upper bound on the adaptive concurrency; 0 means none
    std::size_t concurrency_hint = 0;

    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds inter_chunk_pause{10};
    std::size_t progress_channel_capacity = progress_channel::default_capacity;

    /// Also queue uploads that timed out (the server may have stored them)
    bool queue_on_timeout = false;

    bool retry_queue_enabled = true;
    retry_queue_config retry_queue;

    /// Worker threads; 0 means max(hardware_concurrency, 24)
    std::size_t worker_count = 0;
};

enum class upload_run_status {
    completed,
    cancelled,
    failed,
};

[[nodiscard]] constexpr auto to_string(upload_run_status status) -> const char* {
    switch (status) {
        case upload_run_status::completed: return "completed";
        case upload_run_status::cancelled: return "cancelled";
        case upload_run_status::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Final outcome of a run
 */
struct upload_completion {
    upload_run_status status = upload_run_status::completed;
    std::string session_id;
    /// Per-file results in input order (cancel() delivers the ones known so far)
    std::vector<upload_result> results;
    batch_stats stats;
    std::size_t queued_for_retry = 0;
};

/**
 * @brief Uploads large sets of files to signed destinations
 *
 * @code
 * auto engine = upload_engine::builder()
 *     .with_api_base("https://api.example.com")
 *     .build();
 * if (!engine) { ... }
 *
 * engine.value().on_complete([](const upload_completion& c) {
 *     std::cout << c.stats.success_count << " uploaded\n";
 * });
 * auto completion = engine.value().run_upload(files, token);
 * @endcode
 *
 * One run at a time. Progress goes to the callback installed with
 * on_progress() and to the bounded channel returned by progress().
 * Failures caused by lost connectivity are handed to the durable retry
 * queue and replayed when on_connectivity_restored() is called on it.
 */
class upload_engine {
public:
    using complete_callback = std::function<void(const upload_completion&)>;

    class builder {
    public:
        builder();

        auto with_api_base(std::string api_base) -> builder&;
        auto with_batch_size(std::size_t size) -> builder&;
        auto with_concurrency_hint(std::size_t hint) -> builder&;
        auto with_request_timeout(std::chrono::milliseconds timeout) -> builder&;
        auto with_inter_chunk_pause(std::chrono::milliseconds pause) -> builder&;
        auto with_progress_channel_capacity(std::size_t capacity) -> builder&;
        auto with_queue_on_timeout(bool enable) -> builder&;
        auto with_worker_count(std::size_t count) -> builder&;

        /**
         * @brief Enable or disable the retry queue
         */
        auto with_retry_queue(bool enable) -> builder&;
        auto with_retry_queue_directory(std::filesystem::path directory) -> builder&;
        auto with_retry_queue_config(retry_queue_config config) -> builder&;

        /**
         * @brief Replace the HTTP transport (defaults to network_http_transport)
         */
        auto with_transport(std::shared_ptr<http_transport_interface> transport) -> builder&;

        /**
         * @brief Replace the destination client (defaults to http_destination_client)
         */
        auto with_destination_client(std::shared_ptr<destination_client_interface> client)
            -> builder&;

        /**
         * @brief Replace where file bytes come from (defaults to disk)
         */
        auto with_content_source(std::shared_ptr<file_content_source> source) -> builder&;

        auto with_worker_pool(std::shared_ptr<adapters::upload_worker_pool> pool) -> builder&;

        /**
         * @brief Validate and build
         * @return Engine, or invalid_configuration
         */
        [[nodiscard]] auto build() -> result<upload_engine>;

    private:
        upload_engine_config config_;
        std::shared_ptr<http_transport_interface> transport_;
        std::shared_ptr<destination_client_interface> destinations_;
        std::shared_ptr<file_content_source> content_;
        std::shared_ptr<adapters::upload_worker_pool> pool_;
    };

    ~upload_engine();

    upload_engine(const upload_engine&) = delete;
    auto operator=(const upload_engine&) -> upload_engine& = delete;
    upload_engine(upload_engine&&) noexcept;
    auto operator=(upload_engine&&) noexcept -> upload_engine&;

    /**
     * @brief Upload every file and wait for all of them
     * @param files Files to upload
     * @param credential Bearer token for the destination API
     * @param batch_size Overrides the configured batch size when non-zero
     * @return Completion with one result per file, or an error if the run
     *         could not start or the retry queue failed to persist
     */
    [[nodiscard]] auto run_upload(const std::vector<file_descriptor>& files,
                                  const std::string& credential,
                                  std::size_t batch_size = 0) -> result<upload_completion>;

    /**
     * @brief run_upload on a background thread
     *
     * The engine must outlive the returned future.
     */
    [[nodiscard]] auto run_upload_async(std::vector<file_descriptor> files,
                                        std::string credential,
                                        std::size_t batch_size = 0)
        -> std::future<result<upload_completion>>;

    /**
     * @brief Cancel the active run
     *
     * Emits the terminal cancelled event and on_complete immediately with
     * the results known so far. Idempotent; no-op without an active run.
     */
    void cancel();

    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto session_id() const -> std::string;

    /**
     * @brief Bounded channel receiving every emitted progress event
     */
    [[nodiscard]] auto progress() const -> std::shared_ptr<progress_channel>;

    void on_progress(progress_reporter::callback callback);
    void on_complete(complete_callback callback);

    /**
     * @brief Durable retry queue, or nullptr when disabled
     */
    [[nodiscard]] auto queue() -> bulk_upload::retry_queue*;

    [[nodiscard]] auto config() const -> const upload_engine_config&;

private:
    upload_engine(upload_engine_config config,
                  std::shared_ptr<http_transport_interface> transport,
                  std::shared_ptr<destination_client_interface> destinations,
                  std::shared_ptr<file_content_source> content,
                  std::shared_ptr<adapters::upload_worker_pool> pool);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::bulk_upload

#endif  // KCENON_BULK_UPLOAD_CLIENT_UPLOAD_ENGINE_H
