/**
 * @file bulk_upload.h
 * @brief Main header for the bulk_upload library
 * @version 0.1.0
 *
 * @code
 * #include <kcenon/bulk_upload/bulk_upload.h>
 *
 * using namespace kcenon::bulk_upload;
 *
 * auto engine = upload_engine::builder()
 *     .with_api_base("https://api.example.com")
 *     .build();
 * auto completion = engine.value().run_upload(files, token);
 * @endcode
 */

#ifndef KCENON_BULK_UPLOAD_BULK_UPLOAD_H
#define KCENON_BULK_UPLOAD_BULK_UPLOAD_H

#include <string>

// Core
#include "kcenon/bulk_upload/core/types.h"
#include "kcenon/bulk_upload/core/upload_types.h"
#include "kcenon/bulk_upload/core/cancellation_token.h"
#include "kcenon/bulk_upload/core/concurrency_controller.h"
#include "kcenon/bulk_upload/core/device_profile.h"
#include "kcenon/bulk_upload/core/progress_reporter.h"

// Transport
#include "kcenon/bulk_upload/transport/http_transport.h"
#include "kcenon/bulk_upload/transport/multipart_form.h"

// Retry queue
#include "kcenon/bulk_upload/queue/request_snapshot.h"
#include "kcenon/bulk_upload/queue/retry_queue.h"

// Client
#include "kcenon/bulk_upload/client/destination_client.h"
#include "kcenon/bulk_upload/client/upload_task.h"
#include "kcenon/bulk_upload/client/batch_scheduler.h"
#include "kcenon/bulk_upload/client/upload_engine.h"

// Adapters
#include "kcenon/bulk_upload/adapters/worker_pool.h"

namespace kcenon::bulk_upload {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::bulk_upload

#endif  // KCENON_BULK_UPLOAD_BULK_UPLOAD_H
