/**
 * @file test_retry_queue.cpp
 * @brief Unit tests for the durable retry queue
 */

#include <gtest/gtest.h>

#include "test_doubles.h"

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace kcenon::bulk_upload::test {

class RetryQueueTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        config_.directory = test_dir_ / "queue";
        transport_ = std::make_shared<fake_transport>();
    }

    static auto make_snapshot(const std::string& name) -> request_snapshot {
        multipart_form form;
        form.add_field("key", "uploads/" + name);
        form.set_file(name, "image/jpeg", {0x01, 0x02, 0xff});
        file_descriptor file{name, 3, "image/jpeg", "album/" + name, {}};
        return request_snapshot::capture("https://s3.test/bucket", form, file);
    }

    auto record_files(const std::string& extension) const -> std::size_t {
        std::size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(config_.directory)) {
            if (entry.path().extension() == extension) {
                ++count;
            }
        }
        return count;
    }

    retry_queue_config config_;
    std::shared_ptr<fake_transport> transport_;
};

// ============================================================================
// Codec Tests
// ============================================================================

TEST_F(RetryQueueTest, CodecPreservesRequest) {
    retry_queue_entry entry;
    entry.schema_version = retry_queue_codec::schema_version;
    entry.id = "abc";
    entry.enqueued_at = std::chrono::system_clock::now();
    entry.retry_count = 2;
    entry.request = make_snapshot("a.jpg");

    auto decoded = retry_queue_codec::decode(retry_queue_codec::encode(entry));
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(decoded.value().id, "abc");
    EXPECT_EQ(decoded.value().retry_count, 2u);
    EXPECT_EQ(decoded.value().request.file_name, "a.jpg");
    EXPECT_EQ(decoded.value().request.relative_path, "album/a.jpg");
    EXPECT_EQ(decoded.value().request.to_request().body, entry.request.to_request().body);
}

TEST_F(RetryQueueTest, CodecRejectsNewerSchema) {
    auto decoded = retry_queue_codec::decode(R"({"schema_version": 99, "id": "x"})");
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code, error_code::queue_schema_unsupported);
}

TEST_F(RetryQueueTest, CodecRejectsCorruptRecords) {
    EXPECT_EQ(retry_queue_codec::decode("{not json").error().code,
              error_code::queue_entry_corrupt);
    EXPECT_EQ(retry_queue_codec::decode(R"({"id": "x"})").error().code,
              error_code::queue_entry_corrupt);
    EXPECT_EQ(retry_queue_codec::decode(R"({"schema_version": 1, "id": "x"})").error().code,
              error_code::queue_entry_corrupt);
}

// ============================================================================
// Enqueue / persistence Tests
// ============================================================================

TEST_F(RetryQueueTest, EnqueuePersistsOneRecordPerEntry) {
    retry_queue queue(config_, transport_);
    auto first = queue.enqueue(make_snapshot("a.jpg"));
    auto second = queue.enqueue(make_snapshot("b.jpg"));
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_NE(first.value(), second.value());

    EXPECT_EQ(queue.pending_count(), 2u);
    EXPECT_EQ(record_files(".json"), 2u);
    EXPECT_EQ(record_files(".tmp"), 0u);

    auto entry = queue.get(first.value());
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry.value().schema_version, retry_queue_codec::schema_version);
    EXPECT_EQ(entry.value().retry_count, 0u);
}

TEST_F(RetryQueueTest, EntriesSurviveRestart) {
    std::string id;
    {
        retry_queue queue(config_, transport_);
        auto entry = queue.enqueue(make_snapshot("a.jpg"));
        ASSERT_TRUE(entry);
        id = entry.value();
    }

    retry_queue reopened(config_, transport_);
    EXPECT_EQ(reopened.pending_count(), 1u);
    auto entry = reopened.get(id);
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry.value().request.file_name, "a.jpg");
}

TEST_F(RetryQueueTest, PendingCountHasNoSideEffects) {
    retry_queue queue(config_, transport_);
    ASSERT_TRUE(queue.enqueue(make_snapshot("a.jpg")));
    EXPECT_EQ(queue.pending_count(), 1u);
    EXPECT_EQ(queue.pending_count(), 1u);
    EXPECT_EQ(transport_->calls(), 0u);
}

TEST_F(RetryQueueTest, RemoveAndMissingEntries) {
    retry_queue queue(config_, transport_);
    auto id = queue.enqueue(make_snapshot("a.jpg"));
    ASSERT_TRUE(id);

    EXPECT_TRUE(queue.remove(id.value()));
    EXPECT_EQ(queue.pending_count(), 0u);
    EXPECT_EQ(record_files(".json"), 0u);

    EXPECT_EQ(queue.remove(id.value()).error().code, error_code::queue_entry_not_found);
    EXPECT_EQ(queue.get("nope").error().code, error_code::queue_entry_not_found);
}

TEST_F(RetryQueueTest, NewerSchemaRecordIsSkippedAndKept) {
    std::filesystem::create_directories(config_.directory);
    {
        std::ofstream out(config_.directory / "future.json");
        out << R"({"schema_version": 7, "id": "future"})";
    }

    retry_queue queue(config_, transport_);
    EXPECT_EQ(queue.pending_count(), 0u);
    EXPECT_TRUE(std::filesystem::exists(config_.directory / "future.json"));
}

TEST_F(RetryQueueTest, CorruptRecordIsQuarantined) {
    std::filesystem::create_directories(config_.directory);
    {
        std::ofstream out(config_.directory / "broken.json");
        out << "{ truncated";
    }

    retry_queue queue(config_, transport_);
    EXPECT_EQ(queue.pending_count(), 0u);
    EXPECT_FALSE(std::filesystem::exists(config_.directory / "broken.json"));
    EXPECT_TRUE(std::filesystem::exists(config_.directory / "broken.json.corrupt"));
}

TEST_F(RetryQueueTest, EnqueueFailsWhenDirectoryIsUnusable) {
    auto blocker = test_dir_ / "blocker";
    {
        std::ofstream out(blocker);
        out << "file";
    }
    config_.directory = blocker / "queue";

    retry_queue queue(config_, transport_);
    auto id = queue.enqueue(make_snapshot("a.jpg"));
    ASSERT_FALSE(id);
    EXPECT_EQ(id.error().code, error_code::queue_storage_error);
    EXPECT_EQ(queue.pending_count(), 0u);
}

// ============================================================================
// Replay Tests
// ============================================================================

TEST_F(RetryQueueTest, SuccessfulReplayRemovesEntry) {
    retry_queue queue(config_, transport_);
    ASSERT_TRUE(queue.enqueue(make_snapshot("a.jpg")));

    std::vector<retry_queue_event> events;
    queue.on_event([&events](const retry_queue_event& e) { events.push_back(e); });

    auto report = queue.on_connectivity_restored();
    ASSERT_TRUE(report);
    EXPECT_EQ(report.value().attempted, 1u);
    EXPECT_EQ(report.value().succeeded, 1u);
    EXPECT_EQ(queue.pending_count(), 0u);
    EXPECT_EQ(record_files(".json"), 0u);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, retry_queue_event_kind::replay_succeeded);
    EXPECT_EQ(events[0].file_name, "a.jpg");
}

TEST_F(RetryQueueTest, ReplaySendsIdenticalRequest) {
    auto snapshot = make_snapshot("a.jpg");
    auto expected = snapshot.to_request();

    retry_queue queue(config_, transport_);
    ASSERT_TRUE(queue.enqueue(snapshot));
    ASSERT_TRUE(queue.retry_now());

    auto requests = transport_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url, expected.url);
    EXPECT_EQ(requests[0].headers.at("Content-Type"), expected.headers.at("Content-Type"));
    EXPECT_EQ(requests[0].body, expected.body);
}

TEST_F(RetryQueueTest, ThreeFailedReplaysDiscardEntry) {
    transport_->set_handler(fake_transport::failure(error_code::connection_lost));
    retry_queue queue(config_, transport_);
    auto id = queue.enqueue(make_snapshot("a.jpg"));
    ASSERT_TRUE(id);

    std::vector<retry_queue_event_kind> kinds;
    queue.on_event([&kinds](const retry_queue_event& e) { kinds.push_back(e.kind); });

    for (uint32_t attempt = 1; attempt <= 2; ++attempt) {
        auto report = queue.retry_now();
        ASSERT_TRUE(report);
        EXPECT_EQ(report.value().retried, 1u);
        EXPECT_EQ(queue.get(id.value()).value().retry_count, attempt);
    }

    auto last = queue.retry_now();
    ASSERT_TRUE(last);
    EXPECT_EQ(last.value().exhausted, 1u);
    EXPECT_EQ(queue.pending_count(), 0u);
    EXPECT_EQ(record_files(".json"), 0u);
    EXPECT_EQ(transport_->calls(), 3u);

    EXPECT_EQ(kinds, (std::vector<retry_queue_event_kind>{retry_queue_event_kind::replay_failed,
                                                         retry_queue_event_kind::replay_failed,
                                                         retry_queue_event_kind::exhausted}));
}

TEST_F(RetryQueueTest, SucceedsOnSecondReplay) {
    transport_->set_handler(fake_transport::status(503));
    retry_queue queue(config_, transport_);
    auto id = queue.enqueue(make_snapshot("a.jpg"));
    ASSERT_TRUE(id);

    auto first = queue.retry_now();
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value().retried, 1u);
    EXPECT_EQ(queue.pending_count(), 1u);

    transport_->set_handler(nullptr);
    auto second = queue.retry_now();
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value().succeeded, 1u);
    EXPECT_EQ(queue.pending_count(), 0u);
}

TEST_F(RetryQueueTest, RetryCountSurvivesRestart) {
    transport_->set_handler(fake_transport::failure(error_code::connection_refused));
    std::string id;
    {
        retry_queue queue(config_, transport_);
        auto entry = queue.enqueue(make_snapshot("a.jpg"));
        ASSERT_TRUE(entry);
        id = entry.value();
        ASSERT_TRUE(queue.retry_now());
    }

    retry_queue reopened(config_, transport_);
    ASSERT_EQ(reopened.get(id).value().retry_count, 1u);
}

TEST_F(RetryQueueTest, StatusReplaysFirstWhenConfigured) {
    retry_queue queue(config_, transport_);
    ASSERT_TRUE(queue.enqueue(make_snapshot("a.jpg")));

    auto status = queue.status();
    ASSERT_TRUE(status);
    ASSERT_TRUE(status.value().replay.has_value());
    EXPECT_EQ(status.value().replay->succeeded, 1u);
    EXPECT_EQ(status.value().pending, 0u);
}

TEST_F(RetryQueueTest, StatusWithoutReplayOnlyReports) {
    config_.replay_on_status = false;
    retry_queue queue(config_, transport_);
    ASSERT_TRUE(queue.enqueue(make_snapshot("a.jpg")));
    ASSERT_TRUE(queue.enqueue(make_snapshot("b.jpg")));

    auto status = queue.status();
    ASSERT_TRUE(status);
    EXPECT_FALSE(status.value().replay.has_value());
    EXPECT_EQ(status.value().pending, 2u);
    ASSERT_EQ(status.value().entries.size(), 2u);
    EXPECT_EQ(transport_->calls(), 0u);
}

TEST_F(RetryQueueTest, ConcurrentReplayPassIsSkipped) {
    std::promise<void> entered;
    std::promise<void> release;
    auto released = release.get_future().share();
    std::atomic<bool> first{true};
    transport_->set_handler([&](const http_request&) -> result<http_response> {
        if (first.exchange(false)) {
            entered.set_value();
            released.wait();
        }
        http_response response;
        response.status_code = 204;
        return response;
    });

    retry_queue queue(config_, transport_);
    ASSERT_TRUE(queue.enqueue(make_snapshot("a.jpg")));

    auto running = std::async(std::launch::async, [&queue] { return queue.retry_now(); });
    entered.get_future().wait();

    auto skipped = queue.retry_now();
    ASSERT_TRUE(skipped);
    EXPECT_TRUE(skipped.value().skipped);
    EXPECT_EQ(skipped.value().attempted, 0u);

    // Enqueue is not blocked by the running pass
    ASSERT_TRUE(queue.enqueue(make_snapshot("b.jpg")));

    release.set_value();
    auto report = running.get();
    ASSERT_TRUE(report);
    EXPECT_EQ(report.value().succeeded, 1u);
    EXPECT_EQ(queue.pending_count(), 1u);
}

TEST_F(RetryQueueTest, EntryRemovedDuringFailedReplayStaysRemoved) {
    retry_queue queue(config_, transport_);
    auto id = queue.enqueue(make_snapshot("a.jpg"));
    ASSERT_TRUE(id);

    std::vector<retry_queue_event_kind> kinds;
    queue.on_event([&kinds](const retry_queue_event& e) { kinds.push_back(e.kind); });

    transport_->set_handler([&](const http_request&) -> result<http_response> {
        EXPECT_TRUE(queue.remove(id.value()));
        return unexpected{error{error_code::connection_lost, "connection lost"}};
    });

    auto report = queue.replay_pending();
    ASSERT_TRUE(report);
    EXPECT_EQ(report.value().attempted, 1u);
    EXPECT_EQ(report.value().retried, 0u);
    EXPECT_EQ(queue.pending_count(), 0u);
    EXPECT_EQ(record_files(".json"), 0u);
    EXPECT_TRUE(kinds.empty());

    // Nothing comes back on the next pass or after a restart
    auto again = queue.replay_pending();
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value().attempted, 0u);
    EXPECT_EQ(transport_->calls(), 1u);

    retry_queue reopened(config_, transport_);
    EXPECT_EQ(reopened.pending_count(), 0u);
}

TEST_F(RetryQueueTest, EntryRemovedDuringSuccessfulReplayIsNotCounted) {
    retry_queue queue(config_, transport_);
    auto id = queue.enqueue(make_snapshot("a.jpg"));
    ASSERT_TRUE(id);

    transport_->set_handler([&](const http_request&) -> result<http_response> {
        EXPECT_TRUE(queue.remove(id.value()));
        http_response response;
        response.status_code = 204;
        return response;
    });

    auto report = queue.replay_pending();
    ASSERT_TRUE(report);
    EXPECT_EQ(report.value().succeeded, 0u);
    EXPECT_EQ(queue.pending_count(), 0u);

    auto removed_twice = queue.remove(id.value());
    ASSERT_FALSE(removed_twice);
    EXPECT_EQ(removed_twice.error().code, error_code::queue_entry_not_found);
}

TEST_F(RetryQueueTest, ReloadPicksUpRecordsWrittenElsewhere) {
    retry_queue writer(config_, transport_);
    retry_queue reader(config_, transport_);
    ASSERT_TRUE(writer.enqueue(make_snapshot("a.jpg")));

    EXPECT_EQ(reader.pending_count(), 0u);
    auto loaded = reader.reload();
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.value(), 1u);
    EXPECT_EQ(reader.pending_count(), 1u);
}

}  // namespace kcenon::bulk_upload::test
