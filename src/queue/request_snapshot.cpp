/**
 * @file request_snapshot.cpp
 * @brief Upload request snapshot capture and rebuild
 */

#include "kcenon/bulk_upload/queue/request_snapshot.h"

namespace kcenon::bulk_upload {

auto request_snapshot::capture(const std::string& url,
                               const multipart_form& form,
                               const file_descriptor& source) -> request_snapshot {
    request_snapshot snapshot;
    snapshot.url = url;
    snapshot.method = "POST";
    snapshot.headers["Content-Type"] = form.content_type();
    snapshot.boundary = form.boundary();
    snapshot.fields = form.fields();
    if (form.file()) {
        snapshot.file = *form.file();
    }
    snapshot.file_name = source.name;
    snapshot.relative_path = source.relative_path;
    return snapshot;
}

auto request_snapshot::to_request() const -> http_request {
    multipart_form form(boundary);
    for (const auto& [name, value] : fields) {
        form.add_field(name, value);
    }
    form.set_file(file);

    http_request request;
    request.method = method;
    request.url = url;
    request.headers = headers;
    request.headers["Content-Type"] = form.content_type();
    request.body = form.encode();
    return request;
}

}  // namespace kcenon::bulk_upload
