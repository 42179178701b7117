/**
 * @file upload_task.h
 * @brief Upload of one file to its signed destination
 */

#ifndef KCENON_BULK_UPLOAD_CLIENT_UPLOAD_TASK_H
#define KCENON_BULK_UPLOAD_CLIENT_UPLOAD_TASK_H

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "../core/cancellation_token.h"
#include "../core/types.h"
#include "../core/upload_types.h"
#include "../queue/request_snapshot.h"
#include "../transport/http_transport.h"

namespace kcenon::bulk_upload {

/**
 * @brief Supplies the bytes of a file descriptor
 */
class file_content_source {
public:
    virtual ~file_content_source() = default;

    virtual auto read(const file_descriptor& file) -> result<std::vector<uint8_t>> = 0;
};

/**
 * @brief Reads file bytes from file_descriptor::source_path
 */
class disk_content_source : public file_content_source {
public:
    auto read(const file_descriptor& file) -> result<std::vector<uint8_t>> override;
};

/**
 * @brief Points at which an upload task observes cancellation
 */
enum class upload_checkpoint {
    before_start,
    after_destination,
    after_upload,
};

/**
 * @brief Uploads one file as a multipart POST
 *
 * The task never retries. Failures are classified into
 * upload_failure_kind so the caller can decide whether to queue them.
 *
 * Cancellation is observed at three checkpoints:
 * - before_start: nothing has happened yet; reports "cancelled".
 * - after_destination: bytes are loaded, nothing sent; reports "cancelled".
 * - after_upload: the request already completed. A response received is
 *   reported as-is so the server-side record can be reconciled; a request
 *   that got no response is reported "cancelled" and not handed on for
 *   retry.
 *
 * Safe to call upload() concurrently from several workers.
 */
class upload_task {
public:
    /// Called once per file when it passes before_start
    using start_callback = std::function<void(const file_descriptor&)>;

    /// Called when a request got no response, with a snapshot to resend it
    using connectivity_loss_callback =
        std::function<void(const upload_result&, const request_snapshot&)>;

    /// Test hook called at each checkpoint before it is evaluated
    using checkpoint_hook = std::function<void(upload_checkpoint, const file_descriptor&)>;

    upload_task(std::shared_ptr<http_transport_interface> transport,
                std::shared_ptr<file_content_source> content);

    void on_start(start_callback cb) { on_start_ = std::move(cb); }
    void on_connectivity_loss(connectivity_loss_callback cb) {
        on_connectivity_loss_ = std::move(cb);
    }
    void set_checkpoint_hook(checkpoint_hook hook) { checkpoint_hook_ = std::move(hook); }

    [[nodiscard]] auto upload(const file_descriptor& file,
                              const signed_destination& destination,
                              const cancellation_token& token) const -> upload_result;

private:
    [[nodiscard]] auto cancelled_at(upload_checkpoint checkpoint,
                                    const file_descriptor& file,
                                    const cancellation_token& token) const -> bool;

    std::shared_ptr<http_transport_interface> transport_;
    std::shared_ptr<file_content_source> content_;
    start_callback on_start_;
    connectivity_loss_callback on_connectivity_loss_;
    checkpoint_hook checkpoint_hook_;
};

}  // namespace kcenon::bulk_upload

#endif  // KCENON_BULK_UPLOAD_CLIENT_UPLOAD_TASK_H
