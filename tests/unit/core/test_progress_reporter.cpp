/**
 * @file test_progress_reporter.cpp
 * @brief Unit tests for progress throttling and the bounded progress channel
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_upload/core/progress_reporter.h>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace kcenon::bulk_upload::test {

using namespace std::chrono_literals;

// ============================================================================
// progress_channel Tests
// ============================================================================

TEST(ProgressChannelTest, DeliversInOrder) {
    progress_channel channel(8);
    for (int i = 0; i < 3; ++i) {
        progress_event e;
        e.percent = i * 10.0;
        EXPECT_TRUE(channel.push(e));
    }
    EXPECT_EQ(channel.size(), 3u);
    EXPECT_DOUBLE_EQ(channel.try_pop()->percent, 0.0);
    EXPECT_DOUBLE_EQ(channel.try_pop()->percent, 10.0);
    EXPECT_DOUBLE_EQ(channel.try_pop()->percent, 20.0);
    EXPECT_FALSE(channel.try_pop().has_value());
}

TEST(ProgressChannelTest, DropsOldestWhenFull) {
    progress_channel channel(2);
    for (int i = 1; i <= 5; ++i) {
        progress_event e;
        e.percent = i;
        channel.push(e);
    }
    EXPECT_EQ(channel.size(), 2u);
    EXPECT_EQ(channel.dropped_count(), 3u);
    EXPECT_DOUBLE_EQ(channel.try_pop()->percent, 4.0);
    EXPECT_DOUBLE_EQ(channel.try_pop()->percent, 5.0);
}

TEST(ProgressChannelTest, ClosedChannelRejectsPush) {
    progress_channel channel;
    EXPECT_EQ(channel.capacity(), progress_channel::default_capacity);
    channel.close();
    EXPECT_TRUE(channel.is_closed());
    EXPECT_FALSE(channel.push(progress_event{}));
}

TEST(ProgressChannelTest, PopForTimesOutWhenEmpty) {
    progress_channel channel;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.pop_for(20ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 15ms);
}

TEST(ProgressChannelTest, PopForWakesOnPush) {
    progress_channel channel;
    std::thread producer([&channel] {
        std::this_thread::sleep_for(10ms);
        progress_event e;
        e.message = "hello";
        channel.push(e);
    });
    auto event = channel.pop_for(2000ms);
    producer.join();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->message, "hello");
}

// ============================================================================
// progress_reporter Tests
// ============================================================================

class ProgressReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        channel_ = std::make_shared<progress_channel>(64);
    }

    auto drain() -> std::vector<progress_event> {
        std::vector<progress_event> events;
        while (auto e = channel_->try_pop()) {
            events.push_back(*e);
        }
        return events;
    }

    std::shared_ptr<progress_channel> channel_;
};

TEST_F(ProgressReporterTest, FirstReportIsAlwaysEmitted) {
    progress_reporter reporter(1h, 1.0);
    reporter.attach_channel(channel_);
    reporter.reset("session-1");

    EXPECT_TRUE(reporter.report(0.2, "starting"));
    auto events = drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].session_id, "session-1");
    EXPECT_EQ(events[0].kind, progress_event_kind::progress);
}

TEST_F(ProgressReporterTest, SmallStepsWithinIntervalAreDropped) {
    progress_reporter reporter(1h, 1.0);
    reporter.attach_channel(channel_);
    reporter.reset("s");

    EXPECT_TRUE(reporter.report(10.0, "a"));
    EXPECT_FALSE(reporter.report(10.5, "b"));
    EXPECT_TRUE(reporter.report(11.0, "c"));
    EXPECT_EQ(reporter.emitted_count(), 2u);
}

TEST_F(ProgressReporterTest, IntervalAloneAllowsSmallSteps) {
    progress_reporter reporter(0ms, 1.0);
    reporter.reset("s");
    EXPECT_TRUE(reporter.report(10.0, "a"));
    EXPECT_TRUE(reporter.report(10.1, "b"));
}

TEST_F(ProgressReporterTest, PercentNeverDecreases) {
    progress_reporter reporter(0ms, 0.0);
    reporter.attach_channel(channel_);
    reporter.reset("s");

    reporter.report(50.0, "half");
    reporter.report(30.0, "regress");
    reporter.report(120.0, "overshoot");

    auto events = drain();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_DOUBLE_EQ(events[0].percent, 50.0);
    EXPECT_DOUBLE_EQ(events[1].percent, 50.0);
    EXPECT_DOUBLE_EQ(events[2].percent, 100.0);
}

TEST_F(ProgressReporterTest, CallbackAndChannelBothReceive) {
    progress_reporter reporter(0ms, 0.0);
    reporter.attach_channel(channel_);
    std::vector<double> seen;
    reporter.set_callback([&seen](const progress_event& e) { seen.push_back(e.percent); });
    reporter.reset("s");

    reporter.report(5.0, "x", 1, 10);
    EXPECT_EQ(seen.size(), 1u);
    EXPECT_EQ(drain().size(), 1u);
}

TEST_F(ProgressReporterTest, CompletedTerminalIsHundredPercent) {
    progress_reporter reporter(1h, 1.0);
    reporter.attach_channel(channel_);
    reporter.reset("s");

    reporter.report(90.0, "uploading");
    EXPECT_TRUE(reporter.report_terminal(progress_event_kind::completed, "done", 10, 10));

    auto events = drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].kind, progress_event_kind::completed);
    EXPECT_DOUBLE_EQ(events[1].percent, 100.0);
    EXPECT_EQ(events[1].completed_files, 10u);
}

TEST_F(ProgressReporterTest, CancelledTerminalKeepsLastPercent) {
    progress_reporter reporter(0ms, 0.0);
    reporter.attach_channel(channel_);
    reporter.reset("s");

    reporter.report(42.0, "uploading");
    reporter.report_terminal(progress_event_kind::cancelled, "cancelled", 4, 10);

    auto events = drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_DOUBLE_EQ(events[1].percent, 42.0);
}

TEST_F(ProgressReporterTest, NothingAfterTerminalUntilReset) {
    progress_reporter reporter(0ms, 0.0);
    reporter.attach_channel(channel_);
    reporter.reset("s");

    EXPECT_TRUE(reporter.report_terminal(progress_event_kind::cancelled, "stop", 0, 5));
    EXPECT_TRUE(reporter.is_finished());
    EXPECT_FALSE(reporter.report(80.0, "late"));
    EXPECT_FALSE(reporter.report_terminal(progress_event_kind::completed, "late", 5, 5));
    EXPECT_EQ(drain().size(), 1u);

    reporter.reset("next");
    EXPECT_FALSE(reporter.is_finished());
    EXPECT_TRUE(reporter.report(1.0, "again"));
    EXPECT_EQ(reporter.session_id(), "next");
}

TEST_F(ProgressReporterTest, CallbackMayReenterReporter) {
    progress_reporter reporter(0ms, 0.0);
    reporter.attach_channel(channel_);
    reporter.reset("s");

    std::vector<progress_event_kind> seen;
    reporter.set_callback([&reporter, &seen](const progress_event& e) {
        seen.push_back(e.kind);
        if (e.kind == progress_event_kind::progress) {
            reporter.report_terminal(progress_event_kind::cancelled, "stop", 1, 4);
        }
    });

    EXPECT_TRUE(reporter.report(25.0, "first", 1, 4));
    EXPECT_TRUE(reporter.is_finished());
    EXPECT_EQ(seen, (std::vector<progress_event_kind>{progress_event_kind::progress,
                                                      progress_event_kind::cancelled}));

    auto events = drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].kind, progress_event_kind::cancelled);
    EXPECT_DOUBLE_EQ(events[1].percent, 25.0);
}

TEST_F(ProgressReporterTest, SessionScopedTerminalIgnoresOtherSessions) {
    progress_reporter reporter(0ms, 0.0);
    reporter.attach_channel(channel_);
    reporter.reset("old");
    reporter.reset("new");

    EXPECT_FALSE(reporter.report_terminal_for("old", progress_event_kind::cancelled, "late", 0, 1));
    EXPECT_FALSE(reporter.is_finished());
    EXPECT_TRUE(reporter.report_terminal_for("new", progress_event_kind::cancelled, "now", 0, 1));
    EXPECT_TRUE(reporter.is_finished());

    auto events = drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].session_id, "new");
}

}  // namespace kcenon::bulk_upload::test
