#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

#include "progress_tracker.hpp"

using namespace std::chrono_literals;
using sifinder::FileOutcome;
using sifinder::ProgressInfo;
using sifinder::ProgressTracker;

TEST(ProgressTrackerTests, CountsEachOutcome) {
    ProgressTracker tracker(5);
    tracker.record(FileOutcome::Hashed);
    tracker.record(FileOutcome::Hashed);
    tracker.record(FileOutcome::Unchanged);
    tracker.record(FileOutcome::Failed);

    const auto info = tracker.getProgress();
    EXPECT_EQ(info.total, 5u);
    EXPECT_EQ(info.hashed, 2u);
    EXPECT_EQ(info.unchanged, 1u);
    EXPECT_EQ(info.failed, 1u);
    EXPECT_EQ(info.processed, 4u);
    EXPECT_EQ(info.percentComplete(), 80u);
}

TEST(ProgressTrackerTests, EmptyWorkIsComplete) {
    ProgressInfo info;
    EXPECT_FLOAT_EQ(info.fraction(), 1.0f);
    EXPECT_EQ(info.percentComplete(), 100u);
}

TEST(ProgressTrackerTests, CallbackIsRateLimited) {
    std::vector<ProgressInfo> seen;
    ProgressTracker tracker(1000, [&](const ProgressInfo& info) { seen.push_back(info); }, 10s);

    for (int i = 0; i < 1000; ++i) tracker.record(FileOutcome::Hashed);

    // interval never elapsed
    EXPECT_TRUE(seen.empty());
}

TEST(ProgressTrackerTests, ZeroIntervalReportsEveryFile) {
    std::vector<size_t> processed;
    ProgressTracker tracker(3, [&](const ProgressInfo& info) { processed.push_back(info.processed); }, 0ms);

    tracker.record(FileOutcome::Hashed);
    tracker.record(FileOutcome::Failed);
    tracker.record(FileOutcome::Unchanged);

    EXPECT_EQ(processed, (std::vector<size_t>{ 1, 2, 3 }));
}

TEST(ProgressTrackerTests, ForceUpdateAlwaysReports) {
    int calls = 0;
    ProgressInfo last;
    ProgressTracker tracker(2, [&](const ProgressInfo& info) { ++calls; last = info; }, 10s);

    tracker.record(FileOutcome::Hashed);
    tracker.record(FileOutcome::Hashed);
    tracker.forceUpdate();

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(last.processed, 2u);
    EXPECT_EQ(last.percentComplete(), 100u);
}

TEST(ProgressTrackerTests, ForceUpdateWithoutCallbackIsHarmless) {
    ProgressTracker tracker(1);
    tracker.record(FileOutcome::Hashed);
    EXPECT_NO_THROW(tracker.forceUpdate());
}

TEST(ProgressTrackerTests, ConcurrentRecordsAreAllCounted) {
    ProgressTracker tracker(4000, [](const ProgressInfo&) {}, 0ms);

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 1000; ++i) tracker.record(FileOutcome::Hashed);
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(tracker.getProgress().hashed, 4000u);
}
