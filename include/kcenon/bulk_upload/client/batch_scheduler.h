/**
 * @file batch_scheduler.h
 * @brief Batch and chunk scheduling of upload tasks
 */

#ifndef KCENON_BULK_UPLOAD_CLIENT_BATCH_SCHEDULER_H
#define KCENON_BULK_UPLOAD_CLIENT_BATCH_SCHEDULER_H

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "../adapters/worker_pool.h"
#include "../core/cancellation_token.h"
#include "../core/progress_reporter.h"
#include "../core/upload_types.h"
#include "destination_client.h"
#include "upload_task.h"

namespace kcenon::bulk_upload {

/**
 * @brief Scheduling parameters
 */
struct scheduler_config {
    /// Files per destination request; 0 derives it from device memory
    std::size_t batch_size = 0;

    /// Upper bound on the adaptive concurrency; 0 means none
    std::size_t concurrency_hint = 0;

    /// Cooperative pause between chunks of a batch
    std::chrono::milliseconds inter_chunk_pause{10};
};

/**
 * @brief Half-open index range [begin, end)
 */
struct index_range {
    std::size_t begin = 0;
    std::size_t end = 0;

    [[nodiscard]] auto size() const -> std::size_t { return end - begin; }
    [[nodiscard]] auto operator==(const index_range& other) const -> bool = default;
};

/**
 * @brief Outcome of a scheduler run
 */
struct scheduler_report {
    /// One result per input file, in input order
    std::vector<upload_result> results;
    batch_stats stats;
    std::size_t batch_count = 0;
    /// Concurrency chosen for each batch that reached chunking
    std::vector<std::size_t> batch_concurrency;
    bool cancelled = false;
};

/**
 * @brief Drives upload tasks batch by batch, chunk by chunk
 *
 * For each batch of batch_size files:
 * 1. Without a credential every file fails with "missing credential".
 * 2. One bulk call issues a destination per file. If it fails, every file
 *    fails with its reason and the call is not retried.
 * 3. The batch is cut into chunks of the adaptive concurrency. Chunks run
 *    one after another; tasks within a chunk run in parallel on the worker
 *    pool. Results keep issue order.
 * 4. One progress event per chunk, scaled into [0, 90].
 *
 * Files without a destination (short bulk response) fail and are never
 * indexed out of range. Once cancellation is observed the remaining files
 * are reported "cancelled".
 */
class batch_scheduler {
public:
    /// Receives each chunk's results as soon as the chunk finishes
    using results_callback = std::function<void(std::span<const upload_result>)>;

    batch_scheduler(scheduler_config config,
                    std::shared_ptr<destination_client_interface> destinations,
                    std::shared_ptr<adapters::upload_worker_pool> pool,
                    std::shared_ptr<upload_task> task);

    void on_results(results_callback cb) { on_results_ = std::move(cb); }

    [[nodiscard]] auto run(const std::vector<file_descriptor>& files,
                           const std::string& credential,
                           cancellation_token& token,
                           progress_reporter& reporter) -> scheduler_report;

    [[nodiscard]] auto config() const -> const scheduler_config& { return config_; }

    /**
     * @brief Split [0, total) into consecutive ranges of at most @p size
     */
    [[nodiscard]] static auto partition(std::size_t total, std::size_t size)
        -> std::vector<index_range>;

private:
    struct run_state;

    void run_batch(const std::vector<file_descriptor>& files,
                   index_range batch,
                   const std::string& credential,
                   run_state& state);

    void run_chunk(const std::vector<file_descriptor>& files,
                   index_range chunk,
                   std::span<const signed_destination> destinations,
                   run_state& state);

    void fail_range(const std::vector<file_descriptor>& files,
                    index_range range,
                    upload_failure_kind kind,
                    const std::string& reason,
                    run_state& state);

    void publish(std::span<const upload_result> results, run_state& state);

    scheduler_config config_;
    std::shared_ptr<destination_client_interface> destinations_;
    std::shared_ptr<adapters::upload_worker_pool> pool_;
    std::shared_ptr<upload_task> task_;
    results_callback on_results_;
};

}  // namespace kcenon::bulk_upload

#endif  // KCENON_BULK_UPLOAD_CLIENT_BATCH_SCHEDULER_H
