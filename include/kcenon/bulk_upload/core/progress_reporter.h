/**
 * @file progress_reporter.h
 * @brief Throttled, monotonic progress emission and its delivery channel
 */

#ifndef KCENON_BULK_UPLOAD_CORE_PROGRESS_REPORTER_H
#define KCENON_BULK_UPLOAD_CORE_PROGRESS_REPORTER_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "upload_types.h"

namespace kcenon::bulk_upload {

/**
 * @brief Bounded progress event queue between the engine and its consumer
 *
 * push() never blocks: when the queue is full the oldest event is dropped.
 * Upload tasks therefore never wait on a slow consumer.
 *
 * @code
 * auto channel = engine.progress();
 * while (auto event = channel->pop_for(std::chrono::milliseconds(200))) {
 *     render(*event);
 *     if (is_terminal(event->kind)) break;
 * }
 * @endcode
 */
class progress_channel {
public:
    static constexpr std::size_t default_capacity = 256;

    explicit progress_channel(std::size_t capacity = default_capacity);

    progress_channel(const progress_channel&) = delete;
    progress_channel& operator=(const progress_channel&) = delete;

    /**
     * @brief Enqueue an event, dropping the oldest if full
     * @return false if the channel is closed
     */
    auto push(progress_event event) -> bool;

    [[nodiscard]] auto try_pop() -> std::optional<progress_event>;

    /**
     * @brief Wait up to @p timeout for an event
     * @return std::nullopt on timeout or when closed and drained
     */
    [[nodiscard]] auto pop_for(std::chrono::milliseconds timeout)
        -> std::optional<progress_event>;

    /**
     * @brief Close the channel and wake waiting consumers
     */
    void close();

    [[nodiscard]] auto is_closed() const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }

    /**
     * @brief Number of events discarded because the queue was full
     */
    [[nodiscard]] auto dropped_count() const -> uint64_t;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<progress_event> events_;
    uint64_t dropped_ = 0;
    bool closed_ = false;
};

/**
 * @brief Rate-limited, monotonic progress emitter for one run at a time
 *
 * An event is emitted only if the percent advanced by at least
 * min_delta points or min_interval elapsed since the last emission.
 * Reported percent is clamped to never fall below the last emitted value.
 * Terminal events bypass throttling.
 *
 * Thread-safe; concurrent upload tasks report through one instance.
 * Throttle state is guarded by one mutex. The channel is fed under that
 * mutex so it sees events in emission order; the callback runs after the
 * mutex is released and may call back into the reporter.
 */
class progress_reporter {
public:
    using callback = std::function<void(const progress_event&)>;

    static constexpr std::chrono::milliseconds default_min_interval{100};
    static constexpr double default_min_delta = 1.0;

    explicit progress_reporter(std::chrono::milliseconds min_interval = default_min_interval,
                               double min_delta = default_min_delta);

    void attach_channel(std::shared_ptr<progress_channel> channel);
    void set_callback(callback cb);

    /**
     * @brief Forget throttle state and start a new run
     */
    void reset(std::string session_id);

    /**
     * @brief Report progress
     * @return true if an event was emitted
     */
    auto report(double percent,
                std::string message,
                uint64_t completed_files = 0,
                uint64_t total_files = 0) -> bool;

    /**
     * @brief Emit a terminal event regardless of throttling
     *
     * Only the first terminal event of a run is emitted; afterwards both
     * report() and report_terminal() return false until reset().
     */
    auto report_terminal(progress_event_kind kind,
                         std::string message,
                         uint64_t completed_files,
                         uint64_t total_files) -> bool;

    /**
     * @brief report_terminal() only if the current session is @p session_id
     */
    auto report_terminal_for(const std::string& session_id,
                             progress_event_kind kind,
                             std::string message,
                             uint64_t completed_files,
                             uint64_t total_files) -> bool;

    [[nodiscard]] auto is_finished() const -> bool;
    [[nodiscard]] auto last_percent() const -> double;
    [[nodiscard]] auto session_id() const -> std::string;
    [[nodiscard]] auto emitted_count() const -> uint64_t;

private:
    auto emit_terminal(const std::string* expected_session,
                       progress_event_kind kind,
                       std::string message,
                       uint64_t completed_files,
                       uint64_t total_files) -> bool;

    /// Push to the channel under mutex_; returns the callback to run unlocked
    auto publish_locked(const progress_event& event) -> callback;

    const std::chrono::milliseconds min_interval_;
    const double min_delta_;

    mutable std::mutex mutex_;
    std::shared_ptr<progress_channel> channel_;
    callback callback_;
    std::string session_id_;
    double last_sent_ = 0.0;
    std::optional<std::chrono::steady_clock::time_point> last_time_;
    uint64_t emitted_ = 0;
    bool finished_ = false;
};

}  // namespace kcenon::bulk_upload

#endif  // KCENON_BULK_UPLOAD_CORE_PROGRESS_REPORTER_H
