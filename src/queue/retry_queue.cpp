/**
 * @file retry_queue.cpp
 * @brief Durable retry queue implementation
 */

#include "kcenon/bulk_upload/queue/retry_queue.h"

#include <algorithm>
#include <fstream>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <sstream>

#include <nlohmann/json.hpp>

#include "kcenon/bulk_upload/core/encoding.h"
#include "kcenon/bulk_upload/core/logging.h"

namespace kcenon::bulk_upload {

namespace {

using ordered_json = nlohmann::ordered_json;

constexpr const char* record_extension = ".json";
constexpr const char* temp_extension = ".tmp";
constexpr const char* corrupt_extension = ".corrupt";

auto to_millis(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

auto from_millis(int64_t ms) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds{ms})};
}

auto corrupt(const std::string& what) -> unexpected {
    return unexpected{error{error_code::queue_entry_corrupt, "Corrupt queue record: " + what}};
}

}  // namespace

// ============================================================================
// Record codec
// ============================================================================

namespace retry_queue_codec {

auto encode(const retry_queue_entry& entry) -> std::string {
    const auto& req = entry.request;

    ordered_json headers = ordered_json::object();
    for (const auto& [name, value] : req.headers) {
        headers[name] = value;
    }

    ordered_json fields = ordered_json::array();
    for (const auto& [name, value] : req.fields) {
        fields.push_back(ordered_json::array({name, value}));
    }

    ordered_json record;
    record["schema_version"] = schema_version;
    record["id"] = entry.id;
    record["enqueued_at_ms"] = to_millis(entry.enqueued_at);
    record["retry_count"] = entry.retry_count;
    record["file_name"] = req.file_name;
    record["relative_path"] = req.relative_path;
    record["request"] = {
        {"url", req.url},
        {"method", req.method},
        {"headers", std::move(headers)},
        {"boundary", req.boundary},
        {"fields", std::move(fields)},
        {"file", {
            {"field_name", req.file.field_name},
            {"filename", req.file.filename},
            {"content_type", req.file.content_type},
            {"data", encoding::base64_encode(req.file.data)},
        }},
    };
    return record.dump(2);
}

auto decode(const std::string& text) -> result<retry_queue_entry> {
    auto record = ordered_json::parse(text, nullptr, false);
    if (record.is_discarded() || !record.is_object()) {
        return corrupt("not a JSON object");
    }

    auto version = record.find("schema_version");
    if (version == record.end() || !version->is_number_unsigned()) {
        return corrupt("missing schema_version");
    }
    if (version->get<uint32_t>() > schema_version) {
        return unexpected{error{error_code::queue_schema_unsupported,
            "Unsupported queue record schema " + std::to_string(version->get<uint32_t>())}};
    }

    try {
        retry_queue_entry entry;
        entry.schema_version = version->get<uint32_t>();
        entry.id = record.at("id").get<std::string>();
        entry.enqueued_at = from_millis(record.at("enqueued_at_ms").get<int64_t>());
        entry.retry_count = record.at("retry_count").get<uint32_t>();

        auto& req = entry.request;
        req.file_name = record.at("file_name").get<std::string>();
        req.relative_path = record.value("relative_path", std::string{});

        const auto& request = record.at("request");
        req.url = request.at("url").get<std::string>();
        req.method = request.at("method").get<std::string>();
        req.boundary = request.at("boundary").get<std::string>();
        for (const auto& header : request.at("headers").items()) {
            req.headers[header.key()] = header.value().get<std::string>();
        }
        for (const auto& pair : request.at("fields")) {
            req.fields.emplace_back(pair.at(0).get<std::string>(), pair.at(1).get<std::string>());
        }

        const auto& file = request.at("file");
        req.file.field_name = file.at("field_name").get<std::string>();
        req.file.filename = file.at("filename").get<std::string>();
        req.file.content_type = file.at("content_type").get<std::string>();
        auto data = encoding::base64_decode(file.at("data").get<std::string>());
        if (!data) {
            return corrupt("file data is not base64");
        }
        req.file.data = std::move(*data);

        if (entry.id.empty() || req.url.empty()) {
            return corrupt("empty id or url");
        }
        return entry;
    } catch (const ordered_json::exception& e) {
        return corrupt(e.what());
    }
}

}  // namespace retry_queue_codec

// ============================================================================
// retry_queue::impl
// ============================================================================

class retry_queue::impl {
public:
    impl(retry_queue_config config, std::shared_ptr<http_transport_interface> transport)
        : config_(std::move(config)), transport_(std::move(transport)) {
        std::error_code ec;
        std::filesystem::create_directories(config_.directory, ec);
        if (ec) {
            BU_LOG_ERROR(log_category::retry_queue,
                         "Cannot create queue directory " + config_.directory.string() + ": " +
                             ec.message());
            return;
        }
        auto loaded = load_all();
        if (!loaded) {
            BU_LOG_ERROR(log_category::retry_queue, loaded.error().message);
        }
    }

    auto enqueue(request_snapshot request) -> result<std::string> {
        retry_queue_entry entry;
        entry.schema_version = retry_queue_codec::schema_version;
        entry.id = encoding::generate_uuid();
        entry.enqueued_at = std::chrono::system_clock::now();
        entry.retry_count = 0;
        entry.request = std::move(request);

        {
            std::unique_lock lock(mutex_);
            auto written = write_record(entry);
            if (!written) {
                return unexpected{written.error()};
            }
            cache_[entry.id] = entry;
        }

        upload_log_context ctx;
        ctx.file_name = entry.request.file_name;
        ctx.entry_id = entry.id;
        BU_LOG_INFO_CTX(log_category::retry_queue, "Upload queued for retry", ctx);

        notify({retry_queue_event_kind::enqueued, entry.id, entry.request.file_name, 0, {}});
        return entry.id;
    }

    auto replay_pending() -> result<replay_report> {
        replay_report report;

        std::unique_lock replay_lock(replay_mutex_, std::try_to_lock);
        if (!replay_lock.owns_lock()) {
            report.skipped = true;
            return report;
        }

        if (!transport_) {
            return unexpected{error{error_code::not_initialized, "Retry queue has no transport"}};
        }

        for (const auto& id : pending_ids()) {
            auto entry = lookup(id);
            if (!entry) {
                continue;  // removed while the pass was running
            }
            ++report.attempted;

            upload_log_context ctx;
            ctx.file_name = entry->request.file_name;
            ctx.entry_id = id;
            ctx.retry_count = entry->retry_count;

            auto response = transport_->send(entry->request.to_request());
            if (response && response.value().is_success()) {
                auto erased = erase_record(id);
                if (!erased) {
                    return unexpected{erased.error()};
                }
                if (!erased.value()) {
                    continue;  // removed while the request was in flight
                }
                ++report.succeeded;
                BU_LOG_INFO_CTX(log_category::retry_queue, "Queued upload replayed", ctx);
                notify({retry_queue_event_kind::replay_succeeded, id, entry->request.file_name,
                        entry->retry_count, {}});
                continue;
            }

            std::string reason = response
                ? "Upload failed: " + std::to_string(response.value().status_code)
                : response.error().message;
            ctx.error_message = reason;

            entry->retry_count += 1;
            ctx.retry_count = entry->retry_count;
            if (entry->retry_count >= config_.max_retries) {
                auto erased = erase_record(id);
                if (!erased) {
                    return unexpected{erased.error()};
                }
                if (!erased.value()) {
                    continue;
                }
                ++report.exhausted;
                BU_LOG_WARN_CTX(log_category::retry_queue, "Queued upload discarded", ctx);
                notify({retry_queue_event_kind::exhausted, id, entry->request.file_name,
                        entry->retry_count, reason});
                continue;
            }

            auto updated = update_record(*entry);
            if (!updated) {
                return unexpected{updated.error()};
            }
            if (!updated.value()) {
                continue;
            }
            ++report.retried;
            BU_LOG_DEBUG_CTX(log_category::retry_queue, "Queued upload replay failed", ctx);
            notify({retry_queue_event_kind::replay_failed, id, entry->request.file_name,
                    entry->retry_count, reason});
        }

        BU_LOG_DEBUG(log_category::retry_queue,
                     "Replay pass: " + std::to_string(report.attempted) + " attempted, " +
                         std::to_string(report.succeeded) + " succeeded");
        return report;
    }

    auto status() -> result<retry_queue_status> {
        retry_queue_status out;
        if (config_.replay_on_status) {
            auto report = replay_pending();
            if (!report) {
                return unexpected{report.error()};
            }
            out.replay = report.value();
        }
        out.entries = entries();
        out.pending = out.entries.size();
        return out;
    }

    auto pending_count() const -> std::size_t {
        std::shared_lock lock(mutex_);
        return cache_.size();
    }

    auto entries() const -> std::vector<retry_queue_entry> {
        std::vector<retry_queue_entry> out;
        {
            std::shared_lock lock(mutex_);
            out.reserve(cache_.size());
            for (const auto& [id, entry] : cache_) {
                out.push_back(entry);
            }
        }
        sort_by_age(out);
        return out;
    }

    auto get(const std::string& id) const -> result<retry_queue_entry> {
        auto entry = lookup(id);
        if (!entry) {
            return unexpected{error{error_code::queue_entry_not_found,
                "Queue entry not found: " + id}};
        }
        return *entry;
    }

    auto remove(const std::string& id) -> result<void> {
        auto erased = erase_record(id);
        if (!erased) {
            return unexpected{erased.error()};
        }
        if (!erased.value()) {
            return unexpected{error{error_code::queue_entry_not_found,
                "Queue entry not found: " + id}};
        }
        return {};
    }

    auto load_all() -> result<std::size_t> {
        std::unique_lock lock(mutex_);
        cache_.clear();

        std::error_code ec;
        std::filesystem::directory_iterator it(config_.directory, ec);
        if (ec) {
            return unexpected{error{error_code::queue_storage_error,
                "Cannot list queue directory: " + ec.message()}};
        }

        for (const auto& dir_entry : it) {
            const auto& path = dir_entry.path();
            if (!dir_entry.is_regular_file(ec) || path.extension() != record_extension) {
                continue;
            }

            std::ifstream in(path, std::ios::binary);
            std::stringstream buffer;
            buffer << in.rdbuf();

            auto decoded = retry_queue_codec::decode(buffer.str());
            if (decoded) {
                cache_[decoded.value().id] = std::move(decoded.value());
                continue;
            }

            if (decoded.error().code == error_code::queue_schema_unsupported) {
                BU_LOG_WARN(log_category::retry_queue,
                            "Skipping " + path.filename().string() + ": " +
                                decoded.error().message);
                continue;
            }

            auto quarantined = path;
            quarantined += corrupt_extension;
            std::filesystem::rename(path, quarantined, ec);
            BU_LOG_WARN(log_category::retry_queue,
                        "Quarantined " + path.filename().string() + ": " +
                            decoded.error().message);
        }

        BU_LOG_DEBUG(log_category::retry_queue,
                     "Loaded " + std::to_string(cache_.size()) + " queue record(s)");
        return cache_.size();
    }

    void add_listener(event_callback callback) {
        std::lock_guard lock(listener_mutex_);
        listeners_.push_back(std::move(callback));
    }

    auto config() const -> const retry_queue_config& { return config_; }

private:
    auto record_path(const std::string& id) const -> std::filesystem::path {
        return config_.directory / (id + record_extension);
    }

    // Caller holds mutex_ exclusively
    auto write_record(const retry_queue_entry& entry) -> result<void> {
        const auto target = record_path(entry.id);
        auto temp = target;
        temp += temp_extension;

        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out) {
                return unexpected{error{error_code::queue_storage_error,
                    "Cannot open queue record for writing: " + temp.string()}};
            }
            out << retry_queue_codec::encode(entry);
            out.flush();
            if (!out) {
                return unexpected{error{error_code::queue_storage_error,
                    "Cannot write queue record: " + temp.string()}};
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp, target, ec);
        if (ec) {
            std::filesystem::remove(temp, ec);
            return unexpected{error{error_code::queue_storage_error,
                "Cannot commit queue record: " + target.string()}};
        }
        BU_LOG_TRACE(log_category::retry_queue, "Wrote queue record " + entry.id);
        return {};
    }

    // Returns false without writing when the entry no longer exists
    auto update_record(const retry_queue_entry& entry) -> result<bool> {
        std::unique_lock lock(mutex_);
        auto it = cache_.find(entry.id);
        if (it == cache_.end()) {
            return false;
        }
        auto written = write_record(entry);
        if (!written) {
            return unexpected{written.error()};
        }
        it->second = entry;
        return true;
    }

    // Returns false when the entry was already gone
    auto erase_record(const std::string& id) -> result<bool> {
        std::unique_lock lock(mutex_);
        auto it = cache_.find(id);
        if (it == cache_.end()) {
            return false;
        }
        std::error_code ec;
        std::filesystem::remove(record_path(id), ec);
        if (ec) {
            return unexpected{error{error_code::queue_storage_error,
                "Cannot remove queue record " + id + ": " + ec.message()}};
        }
        cache_.erase(it);
        return true;
    }

    auto lookup(const std::string& id) const -> std::optional<retry_queue_entry> {
        std::shared_lock lock(mutex_);
        auto it = cache_.find(id);
        if (it == cache_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    auto pending_ids() const -> std::vector<std::string> {
        auto snapshot = entries();
        std::vector<std::string> ids;
        ids.reserve(snapshot.size());
        for (const auto& entry : snapshot) {
            ids.push_back(entry.id);
        }
        return ids;
    }

    static void sort_by_age(std::vector<retry_queue_entry>& entries) {
        std::sort(entries.begin(), entries.end(),
                  [](const retry_queue_entry& a, const retry_queue_entry& b) {
                      if (a.enqueued_at != b.enqueued_at) {
                          return a.enqueued_at < b.enqueued_at;
                      }
                      return a.id < b.id;
                  });
    }

    void notify(const retry_queue_event& event) {
        std::vector<event_callback> listeners;
        {
            std::lock_guard lock(listener_mutex_);
            listeners = listeners_;
        }
        for (const auto& listener : listeners) {
            listener(event);
        }
    }

    retry_queue_config config_;
    std::shared_ptr<http_transport_interface> transport_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, retry_queue_entry> cache_;

    std::mutex replay_mutex_;

    std::mutex listener_mutex_;
    std::vector<event_callback> listeners_;
};

// ============================================================================
// retry_queue
// ============================================================================

retry_queue::retry_queue(retry_queue_config config,
                         std::shared_ptr<http_transport_interface> transport)
    : impl_(std::make_unique<impl>(std::move(config), std::move(transport))) {}

retry_queue::~retry_queue() = default;

retry_queue::retry_queue(retry_queue&&) noexcept = default;
auto retry_queue::operator=(retry_queue&&) noexcept -> retry_queue& = default;

auto retry_queue::enqueue(request_snapshot request) -> result<std::string> {
    return impl_->enqueue(std::move(request));
}

auto retry_queue::replay_pending() -> result<replay_report> {
    return impl_->replay_pending();
}

auto retry_queue::on_connectivity_restored() -> result<replay_report> {
    BU_LOG_INFO(log_category::retry_queue, "Connectivity restored, replaying queue");
    return impl_->replay_pending();
}

auto retry_queue::retry_now() -> result<replay_report> {
    return impl_->replay_pending();
}

auto retry_queue::status() -> result<retry_queue_status> {
    return impl_->status();
}

auto retry_queue::pending_count() const -> std::size_t {
    return impl_->pending_count();
}

auto retry_queue::entries() const -> std::vector<retry_queue_entry> {
    return impl_->entries();
}

auto retry_queue::get(const std::string& id) const -> result<retry_queue_entry> {
    return impl_->get(id);
}

auto retry_queue::remove(const std::string& id) -> result<void> {
    return impl_->remove(id);
}

auto retry_queue::reload() -> result<std::size_t> {
    return impl_->load_all();
}

void retry_queue::on_event(event_callback callback) {
    impl_->add_listener(std::move(callback));
}

auto retry_queue::config() const -> const retry_queue_config& {
    return impl_->config();
}

}  // namespace kcenon::bulk_upload
