/**
 * @file upload_engine.cpp
 * @brief Bulk upload orchestrator implementation
 */

#include "kcenon/bulk_upload/client/upload_engine.h"

#include <atomic>
#include <exception>
#include <mutex>
#include <optional>
#include <string>

#include "kcenon/bulk_upload/client/batch_scheduler.h"
#include "kcenon/bulk_upload/core/cancellation_token.h"
#include "kcenon/bulk_upload/core/encoding.h"
#include "kcenon/bulk_upload/core/logging.h"

namespace kcenon::bulk_upload {

struct upload_engine::impl {
    upload_engine_config config;
    std::shared_ptr<http_transport_interface> transport;
    std::shared_ptr<destination_client_interface> destinations;
    std::shared_ptr<adapters::upload_worker_pool> pool;
    std::shared_ptr<upload_task> task;
    std::unique_ptr<bulk_upload::retry_queue> queue;

    std::shared_ptr<progress_channel> channel;
    progress_reporter reporter;
    cancellation_token token;

    std::atomic<bool> running{false};
    std::atomic<std::size_t> queued{0};

    mutable std::mutex state_mutex;
    std::string session_id;
    std::size_t total_files = 0;
    std::vector<upload_result> collected;
    std::optional<error> storage_error;
    complete_callback on_complete;

    impl(upload_engine_config cfg,
         std::shared_ptr<http_transport_interface> http,
         std::shared_ptr<destination_client_interface> dest,
         std::shared_ptr<file_content_source> content,
         std::shared_ptr<adapters::upload_worker_pool> workers)
        : config(std::move(cfg)),
          transport(std::move(http)),
          destinations(std::move(dest)),
          pool(std::move(workers)),
          task(std::make_shared<upload_task>(transport, std::move(content))),
          channel(std::make_shared<progress_channel>(config.progress_channel_capacity)) {
        reporter.attach_channel(channel);

        if (config.retry_queue_enabled) {
            queue = std::make_unique<bulk_upload::retry_queue>(config.retry_queue, transport);
        }

        task->on_connectivity_loss(
            [this](const upload_result& failed, const request_snapshot& snapshot) {
                handle_connectivity_loss(failed, snapshot);
            });
    }

    void handle_connectivity_loss(const upload_result& failed, const request_snapshot& snapshot) {
        if (!queue) {
            return;
        }
        if (failed.failure == upload_failure_kind::timeout && !config.queue_on_timeout) {
            return;
        }

        auto entry = queue->enqueue(snapshot);
        if (!entry) {
            upload_log_context ctx;
            ctx.file_name = failed.file_name;
            ctx.error_message = entry.error().message;
            BU_LOG_ERROR_CTX(log_category::engine, "Cannot persist failed upload", ctx);

            std::lock_guard lock(state_mutex);
            if (!storage_error) {
                storage_error = entry.error();
            }
            token.cancel();
            return;
        }
        ++queued;
    }

    // Clears the running flag on every exit path of run()
    class running_guard {
    public:
        explicit running_guard(impl& owner) : owner_(owner) {}
        ~running_guard() {
            std::lock_guard lock(owner_.state_mutex);
            owner_.running = false;
        }

        running_guard(const running_guard&) = delete;
        auto operator=(const running_guard&) -> running_guard& = delete;

    private:
        impl& owner_;
    };

    auto run(const std::vector<file_descriptor>& files,
             const std::string& credential,
             std::size_t batch_size) -> result<upload_completion> {
        const auto id = encoding::generate_uuid();
        {
            // Reset before publishing running so cancel() never sees a half-started run
            std::lock_guard lock(state_mutex);
            if (running) {
                return unexpected{error{error_code::already_running, "An upload run is active"}};
            }
            token.reset();
            queued = 0;
            session_id = id;
            total_files = files.size();
            collected.clear();
            collected.reserve(files.size());
            storage_error.reset();
            reporter.reset(id);
            running = true;
        }
        running_guard guard(*this);

        upload_log_context ctx;
        ctx.session_id = id;
        ctx.total_files = files.size();
        BU_LOG_INFO_CTX(log_category::engine, "Upload run started", ctx);

        scheduler_config sched;
        sched.batch_size = batch_size != 0 ? batch_size : config.batch_size;
        sched.concurrency_hint = config.concurrency_hint;
        sched.inter_chunk_pause = config.inter_chunk_pause;

        batch_scheduler scheduler(sched, destinations, pool, task);
        scheduler.on_results([this](std::span<const upload_result> results) {
            std::lock_guard lock(state_mutex);
            collected.insert(collected.end(), results.begin(), results.end());
        });

        scheduler_report report;
        try {
            report = scheduler.run(files, credential, token, reporter);
        } catch (const std::exception& e) {
            token.cancel();
            upload_completion aborted;
            aborted.status = upload_run_status::failed;
            aborted.session_id = id;
            {
                std::lock_guard lock(state_mutex);
                aborted.results = collected;
            }
            aborted.stats = compute_batch_stats(aborted.results,
                                                std::chrono::steady_clock::duration{});
            aborted.queued_for_retry = queued.load();

            const std::string message = std::string("Upload run aborted: ") + e.what();
            ctx.error_message = message;
            BU_LOG_ERROR_CTX(log_category::engine, "Upload run failed", ctx);
            finish(progress_event_kind::failed, message, aborted);
            return unexpected{error{error_code::internal_error, message}};
        }

        upload_completion completion;
        completion.session_id = id;
        completion.results = std::move(report.results);
        completion.stats = report.stats;
        completion.queued_for_retry = queued.load();

        std::optional<error> fault;
        {
            std::lock_guard lock(state_mutex);
            fault = storage_error;
        }

        ctx.completed_files = completion.stats.success_count;
        if (fault) {
            completion.status = upload_run_status::failed;
            ctx.error_message = fault->message;
            BU_LOG_ERROR_CTX(log_category::engine, "Upload run failed", ctx);
            finish(progress_event_kind::failed, fault->message, completion);
            return unexpected{error{error_code::queue_storage_error, fault->message}};
        }

        if (report.cancelled) {
            completion.status = upload_run_status::cancelled;
            BU_LOG_INFO_CTX(log_category::engine, "Upload run cancelled", ctx);
            finish(progress_event_kind::cancelled, "Upload cancelled", completion);
        } else {
            completion.status = upload_run_status::completed;
            BU_LOG_INFO_CTX(log_category::engine, "Upload run completed", ctx);
            finish(progress_event_kind::completed,
                   "Uploaded " + std::to_string(completion.stats.success_count) + " of " +
                       std::to_string(completion.stats.total_files) + " files",
                   completion);
        }

        return completion;
    }

    // Emits the run's terminal event and on_complete, unless cancel() did already
    void finish(progress_event_kind kind, const std::string& message,
                const upload_completion& completion) {
        const bool emitted = reporter.report_terminal(
            kind, message, completion.results.size(), completion.stats.total_files);
        if (emitted) {
            notify_complete(completion);
        }
    }

    void cancel() {
        upload_completion partial;
        partial.status = upload_run_status::cancelled;
        std::size_t total = 0;
        {
            std::lock_guard lock(state_mutex);
            if (!running || !token.cancel()) {
                return;
            }
            partial.session_id = session_id;
            partial.results = collected;
            total = total_files;
        }
        partial.stats = compute_batch_stats(partial.results, std::chrono::steady_clock::duration{});
        partial.queued_for_retry = queued.load();

        upload_log_context ctx;
        ctx.session_id = partial.session_id;
        ctx.completed_files = partial.results.size();
        ctx.total_files = total;
        BU_LOG_INFO_CTX(log_category::engine, "Cancellation requested", ctx);

        // Scoped to the cancelled session; a run started since then is not touched
        if (reporter.report_terminal_for(partial.session_id, progress_event_kind::cancelled,
                                         "Upload cancelled", partial.results.size(), total)) {
            notify_complete(partial);
        }
    }

    void notify_complete(const upload_completion& completion) {
        complete_callback callback;
        {
            std::lock_guard lock(state_mutex);
            callback = on_complete;
        }
        if (callback) {
            callback(completion);
        }
    }
};

// ============================================================================
// builder
// ============================================================================

upload_engine::builder::builder() = default;

auto upload_engine::builder::with_api_base(std::string api_base) -> builder& {
    config_.api_base = std::move(api_base);
    return *this;
}

auto upload_engine::builder::with_batch_size(std::size_t size) -> builder& {
    config_.batch_size = size;
    return *this;
}

auto upload_engine::builder::with_concurrency_hint(std::size_t hint) -> builder& {
    config_.concurrency_hint = hint;
    return *this;
}

auto upload_engine::builder::with_request_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.request_timeout = timeout;
    return *this;
}

auto upload_engine::builder::with_inter_chunk_pause(std::chrono::milliseconds pause) -> builder& {
    config_.inter_chunk_pause = pause;
    return *this;
}

auto upload_engine::builder::with_progress_channel_capacity(std::size_t capacity) -> builder& {
    config_.progress_channel_capacity = capacity;
    return *this;
}

auto upload_engine::builder::with_queue_on_timeout(bool enable) -> builder& {
    config_.queue_on_timeout = enable;
    return *this;
}

auto upload_engine::builder::with_worker_count(std::size_t count) -> builder& {
    config_.worker_count = count;
    return *this;
}

auto upload_engine::builder::with_retry_queue(bool enable) -> builder& {
    config_.retry_queue_enabled = enable;
    return *this;
}

auto upload_engine::builder::with_retry_queue_directory(std::filesystem::path directory)
    -> builder& {
    config_.retry_queue.directory = std::move(directory);
    return *this;
}

auto upload_engine::builder::with_retry_queue_config(retry_queue_config config) -> builder& {
    config_.retry_queue = std::move(config);
    return *this;
}

auto upload_engine::builder::with_transport(std::shared_ptr<http_transport_interface> transport)
    -> builder& {
    transport_ = std::move(transport);
    return *this;
}

auto upload_engine::builder::with_destination_client(
    std::shared_ptr<destination_client_interface> client) -> builder& {
    destinations_ = std::move(client);
    return *this;
}

auto upload_engine::builder::with_content_source(std::shared_ptr<file_content_source> source)
    -> builder& {
    content_ = std::move(source);
    return *this;
}

auto upload_engine::builder::with_worker_pool(std::shared_ptr<adapters::upload_worker_pool> pool)
    -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto upload_engine::builder::build() -> result<upload_engine> {
    if (!destinations_ && config_.api_base.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "API base URL is required without a destination client"}};
    }
    if (config_.request_timeout.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
            "Request timeout must be positive"}};
    }
    if (config_.inter_chunk_pause.count() < 0) {
        return unexpected{error{error_code::invalid_configuration,
            "Inter-chunk pause cannot be negative"}};
    }
    if (config_.progress_channel_capacity == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "Progress channel capacity must be at least 1"}};
    }
    if (config_.retry_queue_enabled &&
        (config_.retry_queue.max_retries == 0 || config_.retry_queue.directory.empty())) {
        return unexpected{error{error_code::invalid_configuration,
            "Retry queue needs a directory and at least one retry"}};
    }

    auto transport = transport_
        ? transport_
        : std::make_shared<network_http_transport>(config_.request_timeout);
    auto destinations = destinations_
        ? destinations_
        : std::make_shared<http_destination_client>(config_.api_base, transport);
    auto content = content_ ? content_ : std::make_shared<disk_content_source>();
    auto pool = pool_ ? pool_ : adapters::worker_pool_factory::create(config_.worker_count);
    if (!pool) {
        return unexpected{error{error_code::internal_error, "Cannot create worker pool"}};
    }

    return upload_engine{std::move(config_), std::move(transport), std::move(destinations),
                         std::move(content), std::move(pool)};
}

// ============================================================================
// upload_engine
// ============================================================================

upload_engine::upload_engine(upload_engine_config config,
                             std::shared_ptr<http_transport_interface> transport,
                             std::shared_ptr<destination_client_interface> destinations,
                             std::shared_ptr<file_content_source> content,
                             std::shared_ptr<adapters::upload_worker_pool> pool)
    : impl_(std::make_unique<impl>(std::move(config), std::move(transport),
                                   std::move(destinations), std::move(content), std::move(pool))) {
    get_logger().initialize();
}

upload_engine::~upload_engine() = default;

upload_engine::upload_engine(upload_engine&&) noexcept = default;
auto upload_engine::operator=(upload_engine&&) noexcept -> upload_engine& = default;

auto upload_engine::run_upload(const std::vector<file_descriptor>& files,
                               const std::string& credential,
                               std::size_t batch_size) -> result<upload_completion> {
    return impl_->run(files, credential, batch_size);
}

auto upload_engine::run_upload_async(std::vector<file_descriptor> files,
                                     std::string credential,
                                     std::size_t batch_size)
    -> std::future<result<upload_completion>> {
    auto* state = impl_.get();
    return std::async(std::launch::async,
                      [state, files = std::move(files), credential = std::move(credential),
                       batch_size]() { return state->run(files, credential, batch_size); });
}

void upload_engine::cancel() {
    impl_->cancel();
}

auto upload_engine::is_running() const -> bool {
    return impl_->running.load();
}

auto upload_engine::session_id() const -> std::string {
    std::lock_guard lock(impl_->state_mutex);
    return impl_->session_id;
}

auto upload_engine::progress() const -> std::shared_ptr<progress_channel> {
    return impl_->channel;
}

void upload_engine::on_progress(progress_reporter::callback callback) {
    impl_->reporter.set_callback(std::move(callback));
}

void upload_engine::on_complete(complete_callback callback) {
    std::lock_guard lock(impl_->state_mutex);
    impl_->on_complete = std::move(callback);
}

auto upload_engine::queue() -> bulk_upload::retry_queue* {
    return impl_->queue.get();
}

auto upload_engine::config() const -> const upload_engine_config& {
    return impl_->config;
}

}  // namespace kcenon::bulk_upload
