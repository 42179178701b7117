/**
 * @file test_batch_scheduler.cpp
 * @brief Unit tests for batch and chunk scheduling
 */

#include <gtest/gtest.h>

#include "test_doubles.h"

#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

namespace kcenon::bulk_upload::test {

class BatchSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<fake_transport>();
        destinations_ = std::make_shared<fake_destination_client>();
        task_ = std::make_shared<upload_task>(transport_, std::make_shared<memory_content_source>());
        channel_ = std::make_shared<progress_channel>(4096);
        reporter_.attach_channel(channel_);
        reporter_.reset("session");
    }

    auto make_scheduler(scheduler_config config,
                        std::shared_ptr<adapters::upload_worker_pool> pool = nullptr)
        -> batch_scheduler {
        config.inter_chunk_pause = std::chrono::milliseconds(0);
        if (!pool) {
            pool = std::make_shared<inline_worker_pool>();
        }
        return batch_scheduler(config, destinations_, pool, task_);
    }

    auto drain() -> std::vector<progress_event> {
        std::vector<progress_event> events;
        while (auto e = channel_->try_pop()) {
            events.push_back(*e);
        }
        return events;
    }

    std::shared_ptr<fake_transport> transport_;
    std::shared_ptr<fake_destination_client> destinations_;
    std::shared_ptr<upload_task> task_;
    std::shared_ptr<progress_channel> channel_;
    progress_reporter reporter_{std::chrono::milliseconds(0), 0.0};
    cancellation_token token_;
};

// ============================================================================
// partition Tests
// ============================================================================

TEST(BatchPartitionTest, SplitsIntoConsecutiveRanges) {
    auto ranges = batch_scheduler::partition(1200, 1000);
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0], (index_range{0, 1000}));
    EXPECT_EQ(ranges[1], (index_range{1000, 1200}));
}

TEST(BatchPartitionTest, ExactMultipleAndEdgeCases) {
    EXPECT_EQ(batch_scheduler::partition(48, 24).size(), 2u);
    EXPECT_TRUE(batch_scheduler::partition(0, 24).empty());
    EXPECT_TRUE(batch_scheduler::partition(10, 0).empty());
    EXPECT_EQ(batch_scheduler::partition(5, 24).front(), (index_range{0, 5}));
}

// ============================================================================
// run Tests
// ============================================================================

TEST_F(BatchSchedulerTest, EmptyInputProducesEmptyReport) {
    auto scheduler = make_scheduler({});
    auto report = scheduler.run({}, "tok", token_, reporter_);
    EXPECT_TRUE(report.results.empty());
    EXPECT_EQ(report.batch_count, 0u);
    EXPECT_TRUE(destinations_->batch_sizes().empty());
}

TEST_F(BatchSchedulerTest, OneDestinationRequestPerBatch) {
    scheduler_config config;
    config.batch_size = 1000;
    auto scheduler = make_scheduler(config);

    auto files = make_files(1200, 2 * 1024 * 1024);
    auto report = scheduler.run(files, "tok", token_, reporter_);

    EXPECT_EQ(report.batch_count, 2u);
    EXPECT_EQ(destinations_->batch_sizes(), (std::vector<std::size_t>{1000, 200}));
    EXPECT_EQ(report.batch_concurrency, (std::vector<std::size_t>{24, 24}));
    ASSERT_EQ(report.results.size(), 1200u);
    EXPECT_EQ(report.stats.total_files, 1200u);
    EXPECT_EQ(report.stats.success_count, 1200u);
    EXPECT_EQ(transport_->calls(), 1200u);
    EXPECT_FALSE(report.cancelled);
}

TEST_F(BatchSchedulerTest, ResultsKeepInputOrder) {
    scheduler_config config;
    config.batch_size = 7;
    auto scheduler = make_scheduler(config, std::make_shared<adapters::async_worker_pool>(8));

    auto files = make_files(30, 1024);
    auto report = scheduler.run(files, "tok", token_, reporter_);

    ASSERT_EQ(report.results.size(), files.size());
    for (std::size_t i = 0; i < files.size(); ++i) {
        EXPECT_EQ(report.results[i].file_name, files[i].name);
    }
}

TEST_F(BatchSchedulerTest, MissingCredentialFailsEveryFile) {
    scheduler_config config;
    config.batch_size = 2;
    auto scheduler = make_scheduler(config);

    auto files = make_files(5, 1024);
    auto report = scheduler.run(files, "", token_, reporter_);

    ASSERT_EQ(report.results.size(), 5u);
    for (const auto& r : report.results) {
        EXPECT_FALSE(r.success);
        EXPECT_EQ(r.failure, upload_failure_kind::missing_credential);
        EXPECT_EQ(*r.error, "missing credential");
    }
    EXPECT_TRUE(destinations_->batch_sizes().empty());
    EXPECT_EQ(transport_->calls(), 0u);
}

TEST_F(BatchSchedulerTest, DestinationFailureFailsWholeBatchOnce) {
    destinations_->fail_with("Bulk destination request failed: 500");
    scheduler_config config;
    config.batch_size = 3;
    auto scheduler = make_scheduler(config);

    auto files = make_files(6, 1024);
    auto report = scheduler.run(files, "tok", token_, reporter_);

    ASSERT_EQ(report.results.size(), 6u);
    for (const auto& r : report.results) {
        EXPECT_EQ(r.failure, upload_failure_kind::destination_issuance);
        EXPECT_EQ(*r.error, "Bulk destination request failed: 500");
    }
    EXPECT_EQ(destinations_->batch_sizes().size(), 2u);
    EXPECT_EQ(transport_->calls(), 0u);
}

TEST_F(BatchSchedulerTest, ShortBulkResponseFailsUnmappedTail) {
    destinations_->short_by(2);
    auto scheduler = make_scheduler({});

    auto files = make_files(5, 1024);
    auto report = scheduler.run(files, "tok", token_, reporter_);

    ASSERT_EQ(report.results.size(), 5u);
    EXPECT_TRUE(report.results[0].success);
    EXPECT_TRUE(report.results[2].success);
    EXPECT_FALSE(report.results[3].success);
    EXPECT_EQ(report.results[3].failure, upload_failure_kind::destination_issuance);
    EXPECT_EQ(report.results[4].file_name, "file_4.jpg");
    EXPECT_EQ(transport_->calls(), 3u);
}

TEST_F(BatchSchedulerTest, ConcurrencyFollowsFileSizesAndHint) {
    scheduler_config config;
    config.batch_size = 4;
    auto scheduler = make_scheduler(config);

    auto files = make_files(4, 100ULL * 1024 * 1024);
    auto small = make_files(4, 1024, "small");
    files.insert(files.end(), small.begin(), small.end());

    auto report = scheduler.run(files, "tok", token_, reporter_);
    EXPECT_EQ(report.batch_concurrency, (std::vector<std::size_t>{6, 24}));

    config.concurrency_hint = 2;
    auto hinted = make_scheduler(config);
    auto capped = hinted.run(files, "tok", token_, reporter_);
    EXPECT_EQ(capped.batch_concurrency, (std::vector<std::size_t>{2, 2}));
}

TEST_F(BatchSchedulerTest, ProgressStaysWithinUploadPhaseAndNeverDecreases) {
    scheduler_config config;
    config.batch_size = 50;
    config.concurrency_hint = 10;
    auto scheduler = make_scheduler(config);

    auto files = make_files(100, 1024);
    (void)scheduler.run(files, "tok", token_, reporter_);

    auto events = drain();
    ASSERT_FALSE(events.empty());
    double last = 0.0;
    std::size_t chunk_events = 0;
    for (const auto& e : events) {
        EXPECT_EQ(e.kind, progress_event_kind::progress);
        EXPECT_GE(e.percent, last);
        EXPECT_LE(e.percent, 90.0);
        EXPECT_EQ(e.session_id, "session");
        last = e.percent;
        if (e.message.rfind("Processed ", 0) == 0) {
            ++chunk_events;
        }
    }
    EXPECT_EQ(chunk_events, 10u);
    EXPECT_DOUBLE_EQ(last, 90.0);
    EXPECT_EQ(events.back().message, "Processed 100 of 100 files");
}

TEST_F(BatchSchedulerTest, ResultsCallbackSeesEveryChunk) {
    scheduler_config config;
    config.concurrency_hint = 4;
    auto scheduler = make_scheduler(config);

    std::vector<std::string> seen;
    scheduler.on_results([&seen](std::span<const upload_result> results) {
        for (const auto& r : results) {
            seen.push_back(r.file_name);
        }
    });

    auto files = make_files(10, 1024);
    (void)scheduler.run(files, "tok", token_, reporter_);
    ASSERT_EQ(seen.size(), 10u);
    EXPECT_EQ(seen.front(), "file_0.jpg");
    EXPECT_EQ(seen.back(), "file_9.jpg");
}

TEST_F(BatchSchedulerTest, CancellationStopsRemainingFiles) {
    std::atomic<int> sent{0};
    transport_->set_handler([this, &sent](const http_request&) -> result<http_response> {
        if (++sent == 3) {
            token_.cancel();
        }
        http_response response;
        response.status_code = 204;
        return response;
    });

    scheduler_config config;
    config.concurrency_hint = 1;
    auto scheduler = make_scheduler(config);

    auto files = make_files(10, 1024);
    auto report = scheduler.run(files, "tok", token_, reporter_);

    EXPECT_TRUE(report.cancelled);
    ASSERT_EQ(report.results.size(), 10u);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_TRUE(report.results[i].success) << i;
    }
    for (std::size_t i = 3; i < 10; ++i) {
        EXPECT_TRUE(report.results[i].is_cancelled()) << i;
    }
    EXPECT_EQ(transport_->calls(), 3u);
}

TEST_F(BatchSchedulerTest, CancelledBeforeRunCancelsEverything) {
    token_.cancel();
    auto scheduler = make_scheduler({});
    auto files = make_files(4, 1024);
    auto report = scheduler.run(files, "tok", token_, reporter_);

    ASSERT_EQ(report.results.size(), 4u);
    for (const auto& r : report.results) {
        EXPECT_TRUE(r.is_cancelled());
    }
    EXPECT_TRUE(destinations_->batch_sizes().empty());
}

TEST_F(BatchSchedulerTest, ThrowingTaskBecomesFailedResult) {
    transport_->set_handler([](const http_request&) -> result<http_response> {
        throw std::runtime_error("socket exploded");
    });
    auto scheduler = make_scheduler({});

    auto files = make_files(2, 1024);
    auto report = scheduler.run(files, "tok", token_, reporter_);

    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].failure, upload_failure_kind::transport_error);
    EXPECT_EQ(*report.results[0].error, "socket exploded");
}

}  // namespace kcenon::bulk_upload::test
