/**
 * @file benchmark_helpers.h
 * @brief Loopback endpoints and data generators for benchmarks
 */

#ifndef KCENON_BULK_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_BULK_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/bulk_upload/bulk_upload.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace kcenon::bulk_upload::benchmark {

/**
 * @brief Transport accepting every request after an optional fixed delay
 */
class loopback_transport : public http_transport_interface {
public:
    explicit loopback_transport(std::chrono::microseconds latency = std::chrono::microseconds(0));

    auto send(const http_request& request) -> result<http_response> override;

    [[nodiscard]] auto bytes_sent() const -> uint64_t { return bytes_sent_.load(); }

private:
    std::chrono::microseconds latency_;
    std::atomic<uint64_t> bytes_sent_{0};
};

/**
 * @brief Destination client issuing one synthetic destination per file
 */
class loopback_destination_client : public destination_client_interface {
public:
    auto request_destinations(std::span<const file_descriptor> files,
                              const std::string& credential)
        -> result<std::vector<signed_destination>> override;
};

/**
 * @brief Content source returning a shared payload of fixed size
 */
class payload_source : public file_content_source {
public:
    explicit payload_source(std::size_t payload_bytes);

    auto read(const file_descriptor& file) -> result<std::vector<uint8_t>> override;

private:
    std::vector<uint8_t> payload_;
};

/**
 * @brief Generate descriptors for @p count files of @p size_bytes each
 */
auto generate_files(std::size_t count, uint64_t size_bytes) -> std::vector<file_descriptor>;

/**
 * @brief Format bytes as human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Format throughput as human-readable string
 */
auto format_throughput(double bytes_per_second) -> std::string;

namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
constexpr std::size_t GB = 1024 * MB;

constexpr std::size_t photo = 2 * MB;
constexpr std::size_t raw_photo = 25 * MB;
constexpr std::size_t video = 200 * MB;
}  // namespace sizes

}  // namespace kcenon::bulk_upload::benchmark

#endif  // KCENON_BULK_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
