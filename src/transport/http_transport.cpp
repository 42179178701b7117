/**
 * @file http_transport.cpp
 * @brief HTTP transport implementation over network_system
 * @version 0.1.0
 */

#include "kcenon/bulk_upload/transport/http_transport.h"

#include <string>

#include "kcenon/bulk_upload/config/feature_flags.h"
#include "kcenon/bulk_upload/core/logging.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::bulk_upload {

auto classify_transport_error(error_code code) -> upload_failure_kind {
    switch (code) {
        case error_code::connection_timeout:
            return upload_failure_kind::timeout;
        case error_code::connection_refused:
            return upload_failure_kind::connection_refused;
        case error_code::connection_lost:
        case error_code::connection_failed:
            return upload_failure_kind::connection_lost;
        default:
            return upload_failure_kind::transport_error;
    }
}

auto classify_network_error(int code, bool deadline_passed) -> error_code {
    switch (code) {
        case network_error_codes::connection_refused:
            return error_code::connection_refused;
        case network_error_codes::connection_timeout:
            return error_code::connection_timeout;
        case network_error_codes::connection_failed:
        case network_error_codes::connection_closed:
        case network_error_codes::send_failed:
        case network_error_codes::receive_failed:
            return error_code::connection_lost;
        default:
            return deadline_passed ? error_code::connection_timeout : error_code::request_failed;
    }
}

// ============================================================================
// Implementation
// ============================================================================

struct network_http_transport::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    std::chrono::milliseconds timeout;
    bool available = false;

    explicit impl(std::chrono::milliseconds t) : timeout(t) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(const kcenon::network::internal::http_response& resp)
        -> http_response {
        http_response result;
        result.status_code = resp.status_code;
        result.headers = resp.headers;
        result.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return result;
    }
#endif

    auto no_response_error(const http_request& request,
                           int client_code,
                           const std::string& client_message,
                           std::chrono::steady_clock::time_point started) const -> error {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        const auto code = classify_network_error(client_code, elapsed >= timeout);

        upload_log_context ctx;
        ctx.url = mask_url_queries(request.url);
        ctx.duration_ms = static_cast<uint64_t>(elapsed.count());
        ctx.error_message = client_message;
        BU_LOG_DEBUG_CTX(log_category::transport, "Request failed without response", ctx);

        if (code == error_code::connection_timeout) {
            return error{code, "No response within " + std::to_string(timeout.count()) + " ms"};
        }
        return error{code, "HTTP " + request.method + " request failed: " + client_message};
    }
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

network_http_transport::network_http_transport(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_transport::~network_http_transport() = default;

network_http_transport::network_http_transport(network_http_transport&&) noexcept = default;
auto network_http_transport::operator=(network_http_transport&&) noexcept
    -> network_http_transport& = default;

auto network_http_transport::timeout() const -> std::chrono::milliseconds {
    return impl_->timeout;
}

auto network_http_transport::is_available() const -> bool { return impl_->available; }

// ============================================================================
// Send
// ============================================================================

auto network_http_transport::send(const http_request& request) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::not_initialized, "HTTP client not initialized"}};
    }

    const auto started = std::chrono::steady_clock::now();

    if (request.method == "POST") {
        auto response = impl_->client->post(request.url, request.body, request.headers);
        if (response.is_err()) {
            return unexpected{impl_->no_response_error(request, response.error().code,
                                                       response.error().message, started)};
        }
        return impl_->convert_response(response.value());
    }

    if (request.method == "PUT") {
        std::string body(request.body.begin(), request.body.end());
        auto response = impl_->client->put(request.url, body, request.headers);
        if (response.is_err()) {
            return unexpected{impl_->no_response_error(request, response.error().code,
                                                       response.error().message, started)};
        }
        return impl_->convert_response(response.value());
    }

    if (request.method == "GET") {
        auto response = impl_->client->get(request.url, {}, request.headers);
        if (response.is_err()) {
            return unexpected{impl_->no_response_error(request, response.error().code,
                                                       response.error().message, started)};
        }
        return impl_->convert_response(response.value());
    }

    return unexpected{error{error_code::invalid_configuration,
        "Unsupported HTTP method: " + request.method}};
#else
    (void)request;
    return unexpected{error{error_code::transport_unavailable,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

}  // namespace kcenon::bulk_upload
