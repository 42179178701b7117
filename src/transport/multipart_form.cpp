/**
 * @file multipart_form.cpp
 * @brief multipart/form-data body builder implementation
 */

#include "kcenon/bulk_upload/transport/multipart_form.h"

#include <string_view>

#include "kcenon/bulk_upload/core/encoding.h"

namespace kcenon::bulk_upload {

namespace {

constexpr std::string_view crlf = "\r\n";

void append(std::vector<uint8_t>& out, std::string_view text) {
    out.insert(out.end(), text.begin(), text.end());
}

// Quotes inside a disposition parameter would end it early
auto quote_param(const std::string& value) -> std::string {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '"') {
            out += "%22";
        } else if (c == '\r' || c == '\n') {
            out += ' ';
        } else {
            out += c;
        }
    }
    return out;
}

}  // namespace

multipart_form::multipart_form() : boundary_(generate_boundary()) {}

multipart_form::multipart_form(std::string boundary) : boundary_(std::move(boundary)) {
    if (boundary_.empty()) {
        boundary_ = generate_boundary();
    }
}

void multipart_form::add_field(std::string name, std::string value) {
    fields_.emplace_back(std::move(name), std::move(value));
}

void multipart_form::set_file(std::string filename,
                              std::string content_type,
                              std::vector<uint8_t> data,
                              std::string field_name) {
    multipart_file_part part;
    part.field_name = std::move(field_name);
    part.filename = std::move(filename);
    if (!content_type.empty()) {
        part.content_type = std::move(content_type);
    }
    part.data = std::move(data);
    file_ = std::move(part);
}

void multipart_form::set_file(multipart_file_part part) { file_ = std::move(part); }

auto multipart_form::content_type() const -> std::string {
    return "multipart/form-data; boundary=" + boundary_;
}

auto multipart_form::encode() const -> std::vector<uint8_t> {
    std::vector<uint8_t> out;
    std::size_t estimate = 64;
    for (const auto& [name, value] : fields_) {
        estimate += boundary_.size() + name.size() + value.size() + 64;
    }
    if (file_) {
        estimate += boundary_.size() + file_->filename.size() + file_->data.size() + 128;
    }
    out.reserve(estimate);

    for (const auto& [name, value] : fields_) {
        append(out, "--");
        append(out, boundary_);
        append(out, crlf);
        append(out, "Content-Disposition: form-data; name=\"");
        append(out, quote_param(name));
        append(out, "\"");
        append(out, crlf);
        append(out, crlf);
        append(out, value);
        append(out, crlf);
    }

    if (file_) {
        append(out, "--");
        append(out, boundary_);
        append(out, crlf);
        append(out, "Content-Disposition: form-data; name=\"");
        append(out, quote_param(file_->field_name));
        append(out, "\"; filename=\"");
        append(out, quote_param(file_->filename));
        append(out, "\"");
        append(out, crlf);
        append(out, "Content-Type: ");
        append(out, file_->content_type);
        append(out, crlf);
        append(out, crlf);
        out.insert(out.end(), file_->data.begin(), file_->data.end());
        append(out, crlf);
    }

    append(out, "--");
    append(out, boundary_);
    append(out, "--");
    append(out, crlf);
    return out;
}

auto multipart_form::generate_boundary() -> std::string {
    return "----BulkUploadBoundary" + encoding::generate_random_hex(12);
}

}  // namespace kcenon::bulk_upload
