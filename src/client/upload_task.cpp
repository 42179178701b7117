/**
 * @file upload_task.cpp
 * @brief Single-file upload implementation
 */

#include "kcenon/bulk_upload/client/upload_task.h"

#include <chrono>
#include <filesystem>
#include <fstream>

#include "kcenon/bulk_upload/core/logging.h"
#include "kcenon/bulk_upload/transport/multipart_form.h"

namespace kcenon::bulk_upload {

// ============================================================================
// disk_content_source
// ============================================================================

auto disk_content_source::read(const file_descriptor& file) -> result<std::vector<uint8_t>> {
    if (file.source_path.empty()) {
        return unexpected{error{error_code::invalid_file_path,
            "No source path for " + file.name}};
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file.source_path, ec)) {
        return unexpected{error{error_code::file_not_found,
            "File not found: " + file.source_path.string()}};
    }

    std::ifstream in(file.source_path, std::ios::binary);
    if (!in) {
        return unexpected{error{error_code::file_read_error,
            "Failed to open file: " + file.source_path.string()}};
    }

    auto size = std::filesystem::file_size(file.source_path, ec);
    if (ec) {
        return unexpected{error{error_code::file_read_error,
            "Failed to stat file: " + file.source_path.string()}};
    }

    std::vector<uint8_t> data(static_cast<std::size_t>(size));
    if (size > 0 &&
        !in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size))) {
        return unexpected{error{error_code::file_read_error,
            "Failed to read file: " + file.source_path.string()}};
    }
    return data;
}

// ============================================================================
// upload_task
// ============================================================================

upload_task::upload_task(std::shared_ptr<http_transport_interface> transport,
                         std::shared_ptr<file_content_source> content)
    : transport_(std::move(transport)), content_(std::move(content)) {}

auto upload_task::cancelled_at(upload_checkpoint checkpoint,
                               const file_descriptor& file,
                               const cancellation_token& token) const -> bool {
    if (checkpoint_hook_) {
        checkpoint_hook_(checkpoint, file);
    }
    return token.is_cancelled();
}

auto upload_task::upload(const file_descriptor& file,
                         const signed_destination& destination,
                         const cancellation_token& token) const -> upload_result {
    if (cancelled_at(upload_checkpoint::before_start, file, token)) {
        return upload_result::cancelled_for(file);
    }

    if (on_start_) {
        on_start_(file);
    }

    upload_log_context ctx;
    ctx.file_name = file.name;
    ctx.relative_path = file.relative_path;
    ctx.size_bytes = file.size_bytes;

    if (!content_ || !transport_) {
        return upload_result::failed(file, upload_failure_kind::transport_error,
                                     "Upload task not configured");
    }

    auto bytes = content_->read(file);
    if (!bytes) {
        ctx.error_message = bytes.error().message;
        BU_LOG_WARN_CTX(log_category::task, "Cannot read file for upload", ctx);
        return upload_result::failed(file, upload_failure_kind::file_read, bytes.error().message);
    }

    multipart_form form;
    for (const auto& [name, value] : destination.form_fields) {
        form.add_field(name, value);
    }
    form.set_file(file.name, file.mime_type, std::move(bytes.value()));

    if (cancelled_at(upload_checkpoint::after_destination, file, token)) {
        return upload_result::cancelled_for(file);
    }

    http_request request;
    request.method = "POST";
    request.url = destination.url;
    request.headers["Content-Type"] = form.content_type();
    request.body = form.encode();

    const auto started = std::chrono::steady_clock::now();
    auto response = transport_->send(request);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    const bool cancelled_after = cancelled_at(upload_checkpoint::after_upload, file, token);

    if (!response) {
        if (cancelled_after) {
            return upload_result::cancelled_for(file);
        }
        auto kind = classify_transport_error(response.error().code);
        auto failed = upload_result::failed(file, kind, response.error().message);

        ctx.error_message = response.error().message;
        BU_LOG_WARN_CTX(log_category::task, "Upload got no response", ctx);

        if (is_connectivity_loss(kind) && on_connectivity_loss_) {
            on_connectivity_loss_(failed, request_snapshot::capture(destination.url, form, file));
        }
        return failed;
    }

    const int status = response.value().status_code;
    if (!response.value().is_success()) {
        auto failed = upload_result::failed(file, upload_failure_kind::rejected,
                                            "Upload failed: " + std::to_string(status));
        failed.http_status = status;
        ctx.http_status = status;
        BU_LOG_WARN_CTX(log_category::task, "Upload rejected", ctx);
        return failed;
    }

    upload_result done;
    done.file_name = file.name;
    done.relative_path = file.relative_path;
    done.size_bytes = file.size_bytes;
    done.success = true;
    done.http_status = status;
    done.media_record_id = destination.media_record_id;
    done.storage_key = destination.storage_key;

    if (cancelled_after) {
        return done;
    }

    const double seconds = std::chrono::duration<double>(elapsed).count();
    done.elapsed_seconds = seconds;
    if (seconds > 0.0) {
        done.throughput_mbps = static_cast<double>(file.size_bytes) / bytes_per_mb / seconds;
    }

    ctx.duration_ms = static_cast<uint64_t>(seconds * 1000.0);
    ctx.throughput_mbps = done.throughput_mbps;
    BU_LOG_DEBUG_CTX(log_category::task, "Upload completed", ctx);
    return done;
}

}  // namespace kcenon::bulk_upload
