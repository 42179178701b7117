// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "../config/feature_flags.h"

#if BULK_UPLOAD_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::bulk_upload {

/**
 * @brief Log categories for the bulk upload engine
 */
struct log_category {
    static constexpr std::string_view engine = "bulk_upload.engine";
    static constexpr std::string_view scheduler = "bulk_upload.scheduler";
    static constexpr std::string_view task = "bulk_upload.task";
    static constexpr std::string_view progress = "bulk_upload.progress";
    static constexpr std::string_view retry_queue = "bulk_upload.retry_queue";
    static constexpr std::string_view destination = "bulk_upload.destination";
    static constexpr std::string_view transport = "bulk_upload.transport";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

[[nodiscard]] inline auto escape_json(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Configuration for sensitive information masking
 *
 * Signed destination URLs carry their authorization in the query string and
 * the destination request carries a bearer credential. Both are secrets for
 * as long as they are valid.
 */
struct masking_config {
    bool mask_url_queries = false;
    bool mask_credentials = false;
    bool mask_paths = false;
    std::string replacement = "***";

    static masking_config all_masked() {
        return {true, true, true, "***"};
    }

    static masking_config none() {
        return {false, false, false, "***"};
    }
};

/**
 * @brief Masks signed-URL query strings, bearer credentials and local paths
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string result = input;
        if (config_.mask_credentials) {
            static const std::regex bearer_pattern(R"((Bearer\s+)[A-Za-z0-9._~+/=-]+)");
            result = std::regex_replace(result, bearer_pattern, "$1" + config_.replacement);
        }
        if (config_.mask_url_queries) {
            static const std::regex query_pattern(R"((https?://[^\s?"]+)\?[^\s"]*)");
            result = std::regex_replace(result, query_pattern, "$1?" + config_.replacement);
        }
        return result;
    }

    /**
     * @brief Mask a local path down to its last component
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }
        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }
        return config_.replacement + "/" + path.substr(last_sep + 1);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }

    void set_config(masking_config config) { config_ = std::move(config); }

private:
    masking_config config_;
};

/**
 * @brief Replace the query string of a URL with "***"
 *
 * Applied to signed destination URLs before they reach any log record,
 * independent of the logger's masking_config.
 */
[[nodiscard]] inline auto mask_url_queries(const std::string& url) -> std::string {
    const auto query = url.find('?');
    if (query == std::string::npos) {
        return url;
    }
    return url.substr(0, query) + "?***";
}

/**
 * @brief Structured log context for upload operations
 */
struct upload_log_context {
    std::string session_id;
    std::string file_name;
    std::optional<std::string> relative_path;
    std::optional<uint64_t> size_bytes;
    std::optional<uint64_t> batch_index;
    std::optional<uint64_t> chunk_index;
    std::optional<uint64_t> completed_files;
    std::optional<uint64_t> total_files;
    std::optional<uint64_t> concurrency;
    std::optional<double> percent;
    std::optional<double> throughput_mbps;
    std::optional<uint64_t> duration_ms;
    std::optional<int> http_status;
    std::optional<std::string> entry_id;
    std::optional<uint64_t> retry_count;
    std::optional<std::string> url;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_string = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };
        auto add_double = [&](const char* name, double value) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2) << "\"" << name << "\":" << value;
            first = false;
        };
        auto masked = [&](const std::string& value) {
            return masker ? masker->mask(value) : value;
        };

        if (!session_id.empty()) add_string("session_id", session_id);
        if (!file_name.empty()) add_string("file_name", file_name);
        if (relative_path) {
            add_string("relative_path", masker ? masker->mask_path(*relative_path) : *relative_path);
        }
        if (size_bytes) add_uint("size_bytes", *size_bytes);
        if (batch_index) add_uint("batch_index", *batch_index);
        if (chunk_index) add_uint("chunk_index", *chunk_index);
        if (completed_files) add_uint("completed_files", *completed_files);
        if (total_files) add_uint("total_files", *total_files);
        if (concurrency) add_uint("concurrency", *concurrency);
        if (percent) add_double("percent", *percent);
        if (throughput_mbps) add_double("throughput_mbps", *throughput_mbps);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (http_status) add_uint("http_status", static_cast<uint64_t>(*http_status));
        if (entry_id) add_string("entry_id", *entry_id);
        if (retry_count) add_uint("retry_count", *retry_count);
        if (url) add_string("url", masked(*url));
        if (error_message) add_string("error_message", masked(*error_message));

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Human readable line
    json    ///< One JSON object per line
};

class bulk_upload_logger;

bulk_upload_logger& get_logger();

/**
 * @brief Logging facade for the upload engine
 *
 * Routes to logger_system when it is linked in, otherwise to stderr.
 * A callback can be installed to capture records (tests use this).
 */
class bulk_upload_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const upload_log_context*)>;

    bulk_upload_logger() = default;
    ~bulk_upload_logger() = default;

    bulk_upload_logger(const bulk_upload_logger&) = delete;
    bulk_upload_logger& operator=(const bulk_upload_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. The engine builder calls it.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if BULK_UPLOAD_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if BULK_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if BULK_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    void enable_masking(bool enable = true) {
        set_masking_config(enable ? masking_config::all_masked() : masking_config::none());
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const upload_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        std::string line_text = format == log_output_format::json
            ? format_json(level, category, message, context, masker)
            : format_text(category, message, context, masker);

#if BULK_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), line_text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), line_text);
            }
            return;
        }
#endif
        if (format == log_output_format::text) {
            line_text = get_timestamp() + " [" + std::string(log_level_to_string(level)) + "] " +
                        line_text;
        }
        output_to_stderr(line_text);
    }

    void flush() {
#if BULK_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static auto format_text(std::string_view category,
                            std::string_view message,
                            const upload_log_context* context,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }
        return oss.str();
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const upload_log_context* context,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << get_iso8601_timestamp() << "\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\"" << detail::escape_json(masker.mask(std::string(message))) << "\"";
        if (context) {
            auto ctx_json = context->to_json_with_masking(&masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }
        oss << "}";
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

#if BULK_UPLOAD_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

inline bulk_upload_logger& get_logger() {
    static bulk_upload_logger instance;
    return instance;
}

#define BU_LOG(level, category, message) \
    kcenon::bulk_upload::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define BU_LOG_CTX(level, category, message, context) \
    kcenon::bulk_upload::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define BU_LOG_TRACE(category, message) \
    BU_LOG(kcenon::bulk_upload::log_level::trace, category, message)

#define BU_LOG_DEBUG(category, message) \
    BU_LOG(kcenon::bulk_upload::log_level::debug, category, message)

#define BU_LOG_INFO(category, message) \
    BU_LOG(kcenon::bulk_upload::log_level::info, category, message)

#define BU_LOG_WARN(category, message) \
    BU_LOG(kcenon::bulk_upload::log_level::warn, category, message)

#define BU_LOG_ERROR(category, message) \
    BU_LOG(kcenon::bulk_upload::log_level::error, category, message)

#define BU_LOG_DEBUG_CTX(category, message, ctx) \
    BU_LOG_CTX(kcenon::bulk_upload::log_level::debug, category, message, ctx)

#define BU_LOG_INFO_CTX(category, message, ctx) \
    BU_LOG_CTX(kcenon::bulk_upload::log_level::info, category, message, ctx)

#define BU_LOG_WARN_CTX(category, message, ctx) \
    BU_LOG_CTX(kcenon::bulk_upload::log_level::warn, category, message, ctx)

#define BU_LOG_ERROR_CTX(category, message, ctx) \
    BU_LOG_CTX(kcenon::bulk_upload::log_level::error, category, message, ctx)

} // namespace kcenon::bulk_upload
