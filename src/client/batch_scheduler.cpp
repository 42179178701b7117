/**
 * @file batch_scheduler.cpp
 * @brief Batch and chunk scheduling implementation
 */

#include "kcenon/bulk_upload/client/batch_scheduler.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <thread>

#include "kcenon/bulk_upload/core/concurrency_controller.h"
#include "kcenon/bulk_upload/core/device_profile.h"
#include "kcenon/bulk_upload/core/logging.h"

namespace kcenon::bulk_upload {

namespace {

constexpr const char* missing_credential_error = "missing credential";
constexpr const char* unmapped_destination_error = "no signed destination issued";

// Detaches the per-run start hook from the shared task on every exit path
class start_hook_guard {
public:
    explicit start_hook_guard(upload_task& task) : task_(task) {}
    ~start_hook_guard() { task_.on_start(nullptr); }

    start_hook_guard(const start_hook_guard&) = delete;
    auto operator=(const start_hook_guard&) -> start_hook_guard& = delete;

private:
    upload_task& task_;
};

}  // namespace

struct batch_scheduler::run_state {
    std::size_t total = 0;
    std::size_t completed = 0;
    std::atomic<std::size_t> chunk_started{0};
    cancellation_token* token = nullptr;
    progress_reporter* reporter = nullptr;
    scheduler_report report;

    [[nodiscard]] auto percent_for(double done) const -> double {
        return total == 0 ? 0.0 : done / static_cast<double>(total) * upload_phase_percent;
    }
};

batch_scheduler::batch_scheduler(scheduler_config config,
                                 std::shared_ptr<destination_client_interface> destinations,
                                 std::shared_ptr<adapters::upload_worker_pool> pool,
                                 std::shared_ptr<upload_task> task)
    : config_(config),
      destinations_(std::move(destinations)),
      pool_(std::move(pool)),
      task_(std::move(task)) {}

auto batch_scheduler::partition(std::size_t total, std::size_t size)
    -> std::vector<index_range> {
    std::vector<index_range> ranges;
    if (size == 0) {
        return ranges;
    }
    ranges.reserve((total + size - 1) / size);
    for (std::size_t begin = 0; begin < total; begin += size) {
        ranges.push_back({begin, std::min(begin + size, total)});
    }
    return ranges;
}

auto batch_scheduler::run(const std::vector<file_descriptor>& files,
                          const std::string& credential,
                          cancellation_token& token,
                          progress_reporter& reporter) -> scheduler_report {
    run_state state;
    state.total = files.size();
    state.token = &token;
    state.reporter = &reporter;

    if (files.empty()) {
        return std::move(state.report);
    }

    const auto started = std::chrono::steady_clock::now();
    const std::size_t batch_size =
        config_.batch_size == 0 ? default_batch_size() : config_.batch_size;
    const auto batches = partition(files.size(), batch_size);
    state.report.results.reserve(files.size());
    state.report.batch_count = batches.size();

    upload_log_context ctx;
    ctx.session_id = reporter.session_id();
    ctx.total_files = files.size();
    BU_LOG_INFO_CTX(log_category::scheduler,
                    "Scheduling " + std::to_string(batches.size()) + " batch(es)", ctx);

    // Projected per-slot progress while a chunk is in flight
    start_hook_guard hook_guard(*task_);
    task_->on_start([&state](const file_descriptor& file) {
        auto started_in_chunk = state.chunk_started.fetch_add(1) + 1;
        double projected = static_cast<double>(state.completed) +
                           0.5 * static_cast<double>(started_in_chunk);
        state.reporter->report(state.percent_for(projected), "Uploading " + file.name,
                               state.completed, state.total);
    });

    for (std::size_t i = 0; i < batches.size(); ++i) {
        ctx.batch_index = i;
        BU_LOG_DEBUG_CTX(log_category::scheduler, "Starting batch", ctx);
        run_batch(files, batches[i], credential, state);
    }

    state.report.cancelled = token.is_cancelled();
    state.report.stats =
        compute_batch_stats(state.report.results, std::chrono::steady_clock::now() - started);
    return std::move(state.report);
}

void batch_scheduler::run_batch(const std::vector<file_descriptor>& files,
                                index_range batch,
                                const std::string& credential,
                                run_state& state) {
    if (batch.size() == 0) {
        return;
    }

    if (state.token->is_cancelled()) {
        fail_range(files, batch, upload_failure_kind::cancelled, cancelled_error, state);
        return;
    }

    if (credential.empty()) {
        BU_LOG_WARN(log_category::scheduler, "No credential, failing batch");
        fail_range(files, batch, upload_failure_kind::missing_credential,
                   missing_credential_error, state);
        return;
    }

    std::span<const file_descriptor> batch_files(files.data() + batch.begin, batch.size());
    result<std::vector<signed_destination>> issued = std::vector<signed_destination>{};
    try {
        issued = destinations_->request_destinations(batch_files, credential);
    } catch (const std::exception& e) {
        BU_LOG_ERROR(log_category::scheduler,
                     std::string("Destination client threw: ") + e.what());
        issued = unexpected{error{error_code::destination_issuance_failed,
            std::string("Bulk destination request failed: ") + e.what()}};
    }

    if (state.token->is_cancelled()) {
        fail_range(files, batch, upload_failure_kind::cancelled, cancelled_error, state);
        return;
    }

    if (!issued) {
        fail_range(files, batch, upload_failure_kind::destination_issuance,
                   issued.error().message, state);
        return;
    }

    const auto& destinations = issued.value();
    const std::size_t mapped = std::min(destinations.size(), batch.size());

    std::vector<uint64_t> sizes;
    sizes.reserve(batch.size());
    for (const auto& file : batch_files) {
        sizes.push_back(file.size_bytes);
    }
    const auto concurrency =
        concurrency_controller::concurrency_for(sizes, config_.concurrency_hint);
    state.report.batch_concurrency.push_back(concurrency);

    upload_log_context ctx;
    ctx.total_files = batch.size();
    ctx.concurrency = concurrency;
    BU_LOG_DEBUG_CTX(log_category::scheduler, "Destinations issued for batch", ctx);

    const auto chunks = partition(mapped, concurrency);
    std::span<const signed_destination> dest_span(destinations.data(), mapped);

    std::size_t next = 0;
    for (std::size_t c = 0; c < chunks.size(); ++c) {
        if (state.token->is_cancelled()) {
            break;
        }
        const auto& chunk = chunks[c];
        run_chunk(files, {batch.begin + chunk.begin, batch.begin + chunk.end},
                  dest_span.subspan(chunk.begin, chunk.size()), state);
        next = chunk.end;

        const bool last = c + 1 == chunks.size();
        if (!last && !state.token->is_cancelled() && config_.inter_chunk_pause.count() > 0) {
            std::this_thread::sleep_for(config_.inter_chunk_pause);
        }
    }

    if (next < mapped) {
        fail_range(files, {batch.begin + next, batch.begin + mapped},
                   upload_failure_kind::cancelled, cancelled_error, state);
    }

    if (mapped < batch.size()) {
        const bool cancelled = state.token->is_cancelled();
        ctx.completed_files = mapped;
        BU_LOG_WARN_CTX(log_category::scheduler, "Bulk response shorter than batch", ctx);
        fail_range(files, {batch.begin + mapped, batch.end},
                   cancelled ? upload_failure_kind::cancelled
                             : upload_failure_kind::destination_issuance,
                   cancelled ? cancelled_error : unmapped_destination_error, state);
    }
}

void batch_scheduler::run_chunk(const std::vector<file_descriptor>& files,
                                index_range chunk,
                                std::span<const signed_destination> destinations,
                                run_state& state) {
    std::vector<upload_result> chunk_results(chunk.size());
    std::vector<std::future<void>> pending;
    pending.reserve(chunk.size());
    state.chunk_started = 0;

    const cancellation_token& token = *state.token;
    for (std::size_t k = 0; k < chunk.size(); ++k) {
        const auto& file = files[chunk.begin + k];
        const auto& destination = destinations[k];
        auto* slot = &chunk_results[k];
        auto task = task_;
        try {
            pending.push_back(pool_->submit([task, &file, &destination, &token, slot]() {
                *slot = task->upload(file, destination, token);
            }));
        } catch (const std::exception& e) {
            // Already submitted tasks still reference this frame; keep going and wait below
            *slot = upload_result::failed(file, upload_failure_kind::transport_error,
                                          std::string("Cannot schedule upload: ") + e.what());
            pending.emplace_back();
            BU_LOG_ERROR(log_category::scheduler,
                         "Worker pool rejected " + file.name + ": " + e.what());
        }
    }

    for (std::size_t k = 0; k < pending.size(); ++k) {
        if (!pending[k].valid()) {
            continue;
        }
        try {
            pending[k].get();
        } catch (const std::exception& e) {
            const auto& file = files[chunk.begin + k];
            chunk_results[k] =
                upload_result::failed(file, upload_failure_kind::transport_error, e.what());
            upload_log_context ctx;
            ctx.file_name = file.name;
            ctx.error_message = e.what();
            BU_LOG_ERROR_CTX(log_category::scheduler, "Upload task threw", ctx);
        }
    }

    publish(chunk_results, state);
}

void batch_scheduler::fail_range(const std::vector<file_descriptor>& files,
                                 index_range range,
                                 upload_failure_kind kind,
                                 const std::string& reason,
                                 run_state& state) {
    std::vector<upload_result> failed;
    failed.reserve(range.size());
    for (std::size_t i = range.begin; i < range.end; ++i) {
        failed.push_back(upload_result::failed(files[i], kind, reason));
    }
    publish(failed, state);
}

void batch_scheduler::publish(std::span<const upload_result> results, run_state& state) {
    if (results.empty()) {
        return;
    }
    state.report.results.insert(state.report.results.end(), results.begin(), results.end());
    state.completed += results.size();

    if (on_results_) {
        on_results_(results);
    }

    state.reporter->report(state.percent_for(static_cast<double>(state.completed)),
                           "Processed " + std::to_string(state.completed) + " of " +
                               std::to_string(state.total) + " files",
                           state.completed, state.total);
}

}  // namespace kcenon::bulk_upload
