/**
 * @file progress_reporter.cpp
 * @brief Progress reporter and channel implementation
 */

#include "kcenon/bulk_upload/core/progress_reporter.h"

#include <algorithm>

#include "kcenon/bulk_upload/core/logging.h"

namespace kcenon::bulk_upload {

// ============================================================================
// progress_channel
// ============================================================================

progress_channel::progress_channel(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

auto progress_channel::push(progress_event event) -> bool {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (events_.size() >= capacity_) {
            events_.pop_front();
            ++dropped_;
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
    return true;
}

auto progress_channel::try_pop() -> std::optional<progress_event> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

auto progress_channel::pop_for(std::chrono::milliseconds timeout)
    -> std::optional<progress_event> {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void progress_channel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

auto progress_channel::is_closed() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

auto progress_channel::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

auto progress_channel::dropped_count() const -> uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

// ============================================================================
// progress_reporter
// ============================================================================

progress_reporter::progress_reporter(std::chrono::milliseconds min_interval, double min_delta)
    : min_interval_(min_interval), min_delta_(min_delta) {}

void progress_reporter::attach_channel(std::shared_ptr<progress_channel> channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    channel_ = std::move(channel);
}

void progress_reporter::set_callback(callback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(cb);
}

void progress_reporter::reset(std::string session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_id_ = std::move(session_id);
    last_sent_ = 0.0;
    last_time_.reset();
    emitted_ = 0;
    finished_ = false;
}

auto progress_reporter::report(double percent,
                               std::string message,
                               uint64_t completed_files,
                               uint64_t total_files) -> bool {
    progress_event event;
    callback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) {
            return false;
        }

        const double clamped = std::clamp(std::max(percent, last_sent_), 0.0, 100.0);
        const auto now = std::chrono::steady_clock::now();

        if (last_time_) {
            const bool small_step = clamped - last_sent_ < min_delta_;
            const bool too_soon = now - *last_time_ < min_interval_;
            if (small_step && too_soon) {
                return false;
            }
        }

        last_sent_ = clamped;
        last_time_ = now;

        event.kind = progress_event_kind::progress;
        event.percent = clamped;
        event.message = std::move(message);
        event.completed_files = completed_files;
        event.total_files = total_files;
        event.session_id = session_id_;
        cb = publish_locked(event);
    }

    // The callback may re-enter the reporter (e.g. cancel from a UI handler)
    if (cb) {
        cb(event);
    }
    return true;
}

auto progress_reporter::report_terminal(progress_event_kind kind,
                                        std::string message,
                                        uint64_t completed_files,
                                        uint64_t total_files) -> bool {
    return emit_terminal(nullptr, kind, std::move(message), completed_files, total_files);
}

auto progress_reporter::report_terminal_for(const std::string& session_id,
                                            progress_event_kind kind,
                                            std::string message,
                                            uint64_t completed_files,
                                            uint64_t total_files) -> bool {
    return emit_terminal(&session_id, kind, std::move(message), completed_files, total_files);
}

auto progress_reporter::emit_terminal(const std::string* expected_session,
                                      progress_event_kind kind,
                                      std::string message,
                                      uint64_t completed_files,
                                      uint64_t total_files) -> bool {
    progress_event event;
    callback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_ || (expected_session && *expected_session != session_id_)) {
            return false;
        }
        finished_ = true;

        event.kind = kind;
        event.percent = kind == progress_event_kind::completed ? 100.0 : last_sent_;
        event.message = std::move(message);
        event.completed_files = completed_files;
        event.total_files = total_files;
        event.session_id = session_id_;

        last_sent_ = event.percent;
        last_time_ = std::chrono::steady_clock::now();
        cb = publish_locked(event);
    }

    if (cb) {
        cb(event);
    }
    return true;
}

auto progress_reporter::publish_locked(const progress_event& event) -> callback {
    ++emitted_;
    if (channel_ && !channel_->push(event)) {
        BU_LOG_DEBUG(log_category::progress, "Progress channel closed, event discarded");
    }
    return callback_;
}

auto progress_reporter::is_finished() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

auto progress_reporter::last_percent() const -> double {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_sent_;
}

auto progress_reporter::session_id() const -> std::string {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_id_;
}

auto progress_reporter::emitted_count() const -> uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return emitted_;
}

}  // namespace kcenon::bulk_upload
