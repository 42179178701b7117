/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "benchmark_helpers.h"

#include <iomanip>
#include <sstream>
#include <thread>

namespace kcenon::bulk_upload::benchmark {

loopback_transport::loopback_transport(std::chrono::microseconds latency)
    : latency_(latency) {}

auto loopback_transport::send(const http_request& request) -> result<http_response> {
    if (latency_.count() > 0) {
        std::this_thread::sleep_for(latency_);
    }
    bytes_sent_.fetch_add(request.body.size(), std::memory_order_relaxed);

    http_response response;
    response.status_code = 204;
    return response;
}

auto loopback_destination_client::request_destinations(std::span<const file_descriptor> files,
                                                       const std::string& /*credential*/)
    -> result<std::vector<signed_destination>> {
    std::vector<signed_destination> out;
    out.reserve(files.size());
    for (std::size_t i = 0; i < files.size(); ++i) {
        signed_destination dest;
        dest.url = "http://127.0.0.1/bucket";
        dest.form_fields = {{"key", "uploads/" + files[i].name}};
        dest.media_record_id = std::to_string(i);
        dest.storage_key = "uploads/" + files[i].name;
        out.push_back(std::move(dest));
    }
    return out;
}

payload_source::payload_source(std::size_t payload_bytes) : payload_(payload_bytes, 0xa5) {}

auto payload_source::read(const file_descriptor& /*file*/) -> result<std::vector<uint8_t>> {
    return payload_;
}

auto generate_files(std::size_t count, uint64_t size_bytes) -> std::vector<file_descriptor> {
    std::vector<file_descriptor> files;
    files.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        file_descriptor file;
        file.name = "IMG_" + std::to_string(i) + ".jpg";
        file.size_bytes = size_bytes;
        file.mime_type = "image/jpeg";
        file.relative_path = "camera/" + file.name;
        files.push_back(std::move(file));
    }
    return files;
}

auto format_bytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= sizes::GB) {
        oss << static_cast<double>(bytes) / sizes::GB << " GB";
    } else if (bytes >= sizes::MB) {
        oss << static_cast<double>(bytes) / sizes::MB << " MB";
    } else if (bytes >= sizes::KB) {
        oss << static_cast<double>(bytes) / sizes::KB << " KB";
    } else {
        oss << bytes << " B";
    }

    return oss.str();
}

auto format_throughput(double bytes_per_second) -> std::string {
    return format_bytes(static_cast<uint64_t>(bytes_per_second)) + "/s";
}

}  // namespace kcenon::bulk_upload::benchmark
