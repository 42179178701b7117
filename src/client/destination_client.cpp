/**
 * @file destination_client.cpp
 * @brief Bulk signed-destination client implementation
 */

#include "kcenon/bulk_upload/client/destination_client.h"

#include <nlohmann/json.hpp>

#include "kcenon/bulk_upload/core/logging.h"

namespace kcenon::bulk_upload {

namespace {

using ordered_json = nlohmann::ordered_json;

auto scalar_to_string(const ordered_json& value) -> std::string {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return {};
    }
    return value.dump();
}

auto member_string(const ordered_json& object, const char* key) -> std::string {
    auto it = object.find(key);
    return it == object.end() ? std::string{} : scalar_to_string(*it);
}

}  // namespace

// ============================================================================
// Wire format
// ============================================================================

namespace destination_wire {

auto encode_request(std::span<const file_descriptor> files) -> std::string {
    ordered_json entries = ordered_json::array();
    for (const auto& file : files) {
        entries.push_back({
            {"filename", file.name},
            {"fileType", file.mime_type},
            {"fileSize", file.size_bytes},
            {"relativePath", file.relative_path},
        });
    }
    ordered_json body;
    body["files"] = std::move(entries);
    return body.dump();
}

auto decode_response(const std::string& body) -> result<std::vector<signed_destination>> {
    auto parsed = ordered_json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return unexpected{error{error_code::invalid_destination_response,
            "Destination response is not a JSON object"}};
    }

    auto urls = parsed.find("presigned_urls");
    if (urls == parsed.end() || !urls->is_array()) {
        return unexpected{error{error_code::invalid_destination_response,
            "Destination response has no presigned_urls array"}};
    }

    std::vector<signed_destination> destinations;
    destinations.reserve(urls->size());

    for (const auto& item : *urls) {
        if (!item.is_object()) {
            return unexpected{error{error_code::invalid_destination_response,
                "Destination entry is not an object"}};
        }

        signed_destination dest;
        dest.url = member_string(item, "url");
        if (dest.url.empty()) {
            return unexpected{error{error_code::invalid_destination_response,
                "Destination entry has no url"}};
        }

        if (auto fields = item.find("fields"); fields != item.end() && fields->is_object()) {
            for (const auto& [key, value] : fields->items()) {
                dest.form_fields.emplace_back(key, scalar_to_string(value));
            }
        }
        dest.media_record_id = member_string(item, "media_file_id");
        dest.storage_key = member_string(item, "s3_key");

        destinations.push_back(std::move(dest));
    }

    return destinations;
}

}  // namespace destination_wire

// ============================================================================
// http_destination_client
// ============================================================================

http_destination_client::http_destination_client(
    std::string api_base, std::shared_ptr<http_transport_interface> transport)
    : endpoint_(endpoint_for(api_base)), transport_(std::move(transport)) {}

auto http_destination_client::endpoint_for(const std::string& api_base) -> std::string {
    std::string base = api_base;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/media-files/get_presigned_urls/";
}

auto http_destination_client::request_destinations(std::span<const file_descriptor> files,
                                                   const std::string& credential)
    -> result<std::vector<signed_destination>> {
    if (!transport_) {
        return unexpected{error{error_code::not_initialized, "No HTTP transport configured"}};
    }

    http_request request;
    request.method = "POST";
    request.url = endpoint_;
    request.headers["Content-Type"] = "application/json";
    request.headers["Authorization"] = "Bearer " + credential;
    auto body = destination_wire::encode_request(files);
    request.body.assign(body.begin(), body.end());

    upload_log_context ctx;
    ctx.total_files = files.size();
    ctx.url = endpoint_;

    auto response = transport_->send(request);
    if (!response) {
        ctx.error_message = response.error().message;
        BU_LOG_WARN_CTX(log_category::destination, "Bulk destination request failed", ctx);
        return unexpected{error{error_code::destination_issuance_failed,
            "Bulk destination request failed: " + response.error().message}};
    }

    if (!response.value().is_success()) {
        ctx.http_status = response.value().status_code;
        BU_LOG_WARN_CTX(log_category::destination, "Bulk destination request rejected", ctx);
        return unexpected{error{error_code::destination_issuance_failed,
            "Bulk destination request failed: " +
                std::to_string(response.value().status_code)}};
    }

    auto decoded = destination_wire::decode_response(response.value().get_body_string());
    if (!decoded) {
        ctx.error_message = decoded.error().message;
        BU_LOG_WARN_CTX(log_category::destination, "Bulk destination response malformed", ctx);
        return decoded;
    }

    if (decoded.value().size() != files.size()) {
        ctx.completed_files = decoded.value().size();
        BU_LOG_WARN_CTX(log_category::destination,
                        "Destination count differs from requested file count", ctx);
    } else {
        BU_LOG_DEBUG_CTX(log_category::destination, "Destinations issued", ctx);
    }
    return decoded;
}

}  // namespace kcenon::bulk_upload
