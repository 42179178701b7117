/**
 * @file http_transport.h
 * @brief HTTP transport boundary for destination and upload requests
 * @version 0.1.0
 *
 * The transport classifies every failure into an error_code at the point
 * where it happens: a request either yields an http_response (any status)
 * or an error whose code says why no response was obtained.
 */

#ifndef KCENON_BULK_UPLOAD_TRANSPORT_HTTP_TRANSPORT_H
#define KCENON_BULK_UPLOAD_TRANSPORT_HTTP_TRANSPORT_H

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "../core/types.h"
#include "../core/upload_types.h"

namespace kcenon::bulk_upload {

/**
 * @brief An outgoing HTTP request
 */
struct http_request {
    std::string method = "POST";
    std::string url;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;
};

/**
 * @brief A received HTTP response
 */
struct http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    [[nodiscard]] auto is_success() const -> bool {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }
};

/**
 * @brief Map a transport error code to an upload failure kind
 *
 * connection_timeout maps to timeout, connection_refused to
 * connection_refused, connection_lost and connection_failed to
 * connection_lost. Anything else, request_failed included, is a local
 * transport_error.
 */
[[nodiscard]] auto classify_transport_error(error_code code) -> upload_failure_kind;

/**
 * @brief network_system error codes the transport distinguishes
 */
namespace network_error_codes {
inline constexpr int connection_failed = -600;
inline constexpr int connection_refused = -601;
inline constexpr int connection_timeout = -602;
inline constexpr int connection_closed = -603;
inline constexpr int send_failed = -640;
inline constexpr int receive_failed = -641;
}  // namespace network_error_codes

/**
 * @brief Map an HTTP client error code to a transport error_code
 * @param code Error code reported by network_system's http_client
 * @param deadline_passed Whether the request timeout had elapsed
 *
 * Refused and timed-out connections keep their meaning. A connection that
 * could not be established or broke mid-request is connection_lost. Any
 * other code (bad URL, TLS, protocol) is request_failed, which is a local
 * failure and never retried from the queue, unless the deadline passed.
 */
[[nodiscard]] auto classify_network_error(int code, bool deadline_passed) -> error_code;

/**
 * @brief Interface for sending HTTP requests
 *
 * Implementations must be safe to call from several upload tasks at once.
 * On failure they return one of connection_timeout, connection_refused,
 * connection_lost or connection_failed when no response was obtained.
 */
class http_transport_interface {
public:
    virtual ~http_transport_interface() = default;

    /**
     * @brief Send a request and wait for its response
     */
    virtual auto send(const http_request& request) -> result<http_response> = 0;
};

/**
 * @brief HTTP transport backed by network_system's http_client
 *
 * Every request is bounded by the configured timeout. Failures are
 * classified from the client's error code by classify_network_error().
 *
 * When built without network_system every send() fails with
 * transport_unavailable.
 */
class network_http_transport : public http_transport_interface {
public:
    static constexpr std::chrono::milliseconds default_timeout{30000};

    explicit network_http_transport(std::chrono::milliseconds timeout = default_timeout);
    ~network_http_transport() override;

    network_http_transport(const network_http_transport&) = delete;
    auto operator=(const network_http_transport&) -> network_http_transport& = delete;
    network_http_transport(network_http_transport&&) noexcept;
    auto operator=(network_http_transport&&) noexcept -> network_http_transport&;

    auto send(const http_request& request) -> result<http_response> override;

    [[nodiscard]] auto timeout() const -> std::chrono::milliseconds;

    [[nodiscard]] auto is_available() const -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::bulk_upload

#endif  // KCENON_BULK_UPLOAD_TRANSPORT_HTTP_TRANSPORT_H
