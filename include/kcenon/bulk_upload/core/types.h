/**
 * @file types.h
 * @brief Core error and result types for bulk_upload
 */

#ifndef KCENON_BULK_UPLOAD_CORE_TYPES_H
#define KCENON_BULK_UPLOAD_CORE_TYPES_H

#include <optional>
#include <string>
#include <utility>

namespace kcenon::bulk_upload {

/**
 * @brief Error codes for bulk upload operations
 */
enum class error_code {
    success = 0,

    // File errors (-100 to -119)
    file_not_found = -100,
    file_read_error = -101,
    invalid_file_path = -102,

    // Configuration errors (-140 to -159)
    invalid_configuration = -140,
    invalid_batch_size = -141,

    // Network errors (-160 to -179)
    connection_failed = -160,
    connection_timeout = -161,
    connection_refused = -162,
    connection_lost = -163,
    transport_unavailable = -164,
    request_failed = -165,

    // Upload errors (-180 to -199)
    missing_credential = -180,
    destination_issuance_failed = -181,
    invalid_destination_response = -182,
    upload_rejected = -183,
    cancelled = -184,

    // Retry queue errors (-200 to -219)
    queue_storage_error = -200,
    queue_entry_not_found = -201,
    queue_schema_unsupported = -202,
    queue_entry_corrupt = -203,

    // Internal errors (-220 to -239)
    internal_error = -220,
    not_initialized = -221,
    already_running = -222,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::invalid_file_path:
            return "invalid file path";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_batch_size:
            return "invalid batch size";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_refused:
            return "connection refused";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::transport_unavailable:
            return "transport unavailable";
        case error_code::request_failed:
            return "request failed";
        case error_code::missing_credential:
            return "missing credential";
        case error_code::destination_issuance_failed:
            return "destination issuance failed";
        case error_code::invalid_destination_response:
            return "invalid destination response";
        case error_code::upload_rejected:
            return "upload rejected";
        case error_code::cancelled:
            return "cancelled";
        case error_code::queue_storage_error:
            return "queue storage error";
        case error_code::queue_entry_not_found:
            return "queue entry not found";
        case error_code::queue_schema_unsupported:
            return "queue schema unsupported";
        case error_code::queue_entry_corrupt:
            return "queue entry corrupt";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::already_running:
            return "already running";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check whether an error code means no response was obtained
 *
 * These are the transport-level failures where the request never produced
 * an HTTP status, as opposed to a server-side rejection.
 */
[[nodiscard]] constexpr auto is_network_error(error_code code) -> bool {
    switch (code) {
        case error_code::connection_failed:
        case error_code::connection_timeout:
        case error_code::connection_refused:
        case error_code::connection_lost:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::bulk_upload

#endif  // KCENON_BULK_UPLOAD_CORE_TYPES_H
