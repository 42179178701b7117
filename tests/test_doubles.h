/**
 * @file test_doubles.h
 * @brief In-memory transports, destination clients and pools for tests
 */

#ifndef KCENON_BULK_UPLOAD_TEST_DOUBLES_H
#define KCENON_BULK_UPLOAD_TEST_DOUBLES_H

#include <gtest/gtest.h>

#include <kcenon/bulk_upload/bulk_upload.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::bulk_upload::test {

/**
 * @brief Transport answering from a handler; 204 by default
 */
class fake_transport : public http_transport_interface {
public:
    using handler = std::function<result<http_response>(const http_request&)>;

    fake_transport() = default;
    explicit fake_transport(handler h) : handler_(std::move(h)) {}

    void set_handler(handler h) {
        std::lock_guard lock(mutex_);
        handler_ = std::move(h);
    }

    auto send(const http_request& request) -> result<http_response> override {
        handler h;
        {
            std::lock_guard lock(mutex_);
            requests_.push_back(request);
            h = handler_;
        }
        ++calls_;
        if (h) {
            return h(request);
        }
        http_response response;
        response.status_code = 204;
        return response;
    }

    [[nodiscard]] auto calls() const -> std::size_t { return calls_.load(); }

    [[nodiscard]] auto requests() const -> std::vector<http_request> {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    static auto status(int code) -> handler {
        return [code](const http_request&) -> result<http_response> {
            http_response response;
            response.status_code = code;
            return response;
        };
    }

    static auto failure(error_code code) -> handler {
        return [code](const http_request&) -> result<http_response> {
            return unexpected{error{code, to_string(code)}};
        };
    }

private:
    mutable std::mutex mutex_;
    handler handler_;
    std::vector<http_request> requests_;
    std::atomic<std::size_t> calls_{0};
};

/**
 * @brief Destination client issuing synthetic destinations
 */
class fake_destination_client : public destination_client_interface {
public:
    auto request_destinations(std::span<const file_descriptor> files,
                              const std::string& credential)
        -> result<std::vector<signed_destination>> override {
        std::lock_guard lock(mutex_);
        batch_sizes_.push_back(files.size());
        credentials_.push_back(credential);

        if (fail_with_) {
            return unexpected{error{error_code::destination_issuance_failed, *fail_with_}};
        }

        std::size_t count = files.size();
        if (short_by_ > 0) {
            count = short_by_ >= count ? 0 : count - short_by_;
        }

        std::vector<signed_destination> out;
        out.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            signed_destination dest;
            dest.url = "https://storage.test/bucket";
            dest.form_fields = {{"key", "uploads/" + files[i].name}, {"policy", "p"}};
            dest.media_record_id = std::to_string(next_id_++);
            dest.storage_key = "uploads/" + files[i].name;
            out.push_back(std::move(dest));
        }
        return out;
    }

    void fail_with(std::string reason) {
        std::lock_guard lock(mutex_);
        fail_with_ = std::move(reason);
    }

    /// Issue @p missing fewer destinations than requested
    void short_by(std::size_t missing) {
        std::lock_guard lock(mutex_);
        short_by_ = missing;
    }

    [[nodiscard]] auto batch_sizes() const -> std::vector<std::size_t> {
        std::lock_guard lock(mutex_);
        return batch_sizes_;
    }

    [[nodiscard]] auto credentials() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return credentials_;
    }

private:
    mutable std::mutex mutex_;
    std::optional<std::string> fail_with_;
    std::size_t short_by_ = 0;
    uint64_t next_id_ = 1;
    std::vector<std::size_t> batch_sizes_;
    std::vector<std::string> credentials_;
};

/**
 * @brief Content source serving a small payload regardless of declared size
 *
 * The declared file_descriptor::size_bytes drives scheduling and stats, so
 * large scenarios run without allocating the full byte count.
 */
class memory_content_source : public file_content_source {
public:
    explicit memory_content_source(std::size_t payload_bytes = 16)
        : payload_(payload_bytes, 0x5a) {}

    auto read(const file_descriptor& file) -> result<std::vector<uint8_t>> override {
        if (file.name == unreadable_) {
            return unexpected{error{error_code::file_read_error, "Cannot read " + file.name}};
        }
        return payload_;
    }

    void make_unreadable(std::string name) { unreadable_ = std::move(name); }

private:
    std::vector<uint8_t> payload_;
    std::string unreadable_;
};

/**
 * @brief Runs every task on the submitting thread
 */
class inline_worker_pool : public adapters::upload_worker_pool {
public:
    std::future<void> submit(std::function<void()> task) override {
        std::promise<void> done;
        try {
            task();
            done.set_value();
        } catch (...) {
            done.set_exception(std::current_exception());
        }
        return done.get_future();
    }

    [[nodiscard]] size_t worker_count() const override { return 1; }
    [[nodiscard]] bool is_running() const override { return true; }
    [[nodiscard]] size_t pending_tasks() const override { return 0; }
};

inline auto make_files(std::size_t count, uint64_t size_bytes, const std::string& prefix = "file")
    -> std::vector<file_descriptor> {
    std::vector<file_descriptor> files;
    files.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        file_descriptor file;
        file.name = prefix + "_" + std::to_string(i) + ".jpg";
        file.size_bytes = size_bytes;
        file.mime_type = "image/jpeg";
        file.relative_path = "album/" + file.name;
        files.push_back(std::move(file));
    }
    return files;
}

/**
 * @brief Fixture owning a unique temporary directory
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("bulk_upload_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path test_dir_;
};

}  // namespace kcenon::bulk_upload::test

#endif  // KCENON_BULK_UPLOAD_TEST_DOUBLES_H
