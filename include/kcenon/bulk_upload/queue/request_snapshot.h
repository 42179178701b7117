/**
 * @file request_snapshot.h
 * @brief Self-contained copy of an upload request
 */

#ifndef KCENON_BULK_UPLOAD_QUEUE_REQUEST_SNAPSHOT_H
#define KCENON_BULK_UPLOAD_QUEUE_REQUEST_SNAPSHOT_H

#include <map>
#include <string>

#include "../core/upload_types.h"
#include "../transport/http_transport.h"
#include "../transport/multipart_form.h"

namespace kcenon::bulk_upload {

/**
 * @brief Everything needed to resend an upload without the original objects
 *
 * The multipart body is kept structured (boundary, ordered fields, file
 * part) rather than as encoded bytes so it can be persisted and rebuilt
 * byte-for-byte after a restart.
 */
struct request_snapshot {
    std::string url;
    std::string method = "POST";
    std::map<std::string, std::string> headers;
    std::string boundary;
    form_field_list fields;
    multipart_file_part file;

    std::string file_name;
    std::string relative_path;

    /**
     * @brief Capture a snapshot of a built upload form
     */
    [[nodiscard]] static auto capture(const std::string& url,
                                      const multipart_form& form,
                                      const file_descriptor& source) -> request_snapshot;

    /**
     * @brief Rebuild the HTTP request
     */
    [[nodiscard]] auto to_request() const -> http_request;
};

}  // namespace kcenon::bulk_upload

#endif  // KCENON_BULK_UPLOAD_QUEUE_REQUEST_SNAPSHOT_H
