/**
 * test_stats_aggregator.cpp
 */

#include <gtest/gtest.h>

#include "core/downloader/StatsAggregator.hpp"
#include "TestSupport.hpp"

namespace surge::test {

class StatsAggregatorTest : public ::testing::Test {
protected:
    std::string submit(const std::string& name) {
        return registry.create("http://files.example.test/" + name, name, "/downloads");
    }

    void complete(const std::string& id, uint64_t size) {
        registry.mutate(id, [size](DownloadTask& task) {
            task.status = DownloadStatus::Completed;
            task.sizeBytes = size;
            task.downloadedBytes = size;
            task.startedAt = task.createdAt;
            return true;
        });
    }

    void downloading(const std::string& id, uint64_t done, uint64_t size, double speed) {
        registry.mutate(id, [=](DownloadTask& task) {
            task.status = DownloadStatus::Downloading;
            task.sizeBytes = size;
            task.downloadedBytes = done;
            task.speedBytesPerSecond = speed;
            return true;
        });
    }

    TaskRegistry registry{std::make_shared<InMemoryTaskStore>()};
    StatsAggregator stats{registry};
};

TEST_F(StatsAggregatorTest, EmptyRegistry) {
    auto current = stats.current();
    EXPECT_EQ(current.total, 0u);
    EXPECT_DOUBLE_EQ(current.totalProgress, 0.0);
    EXPECT_DOUBLE_EQ(stats.analytics().successRate, 0.0);
    EXPECT_TRUE(stats.history().empty());
}

TEST_F(StatsAggregatorTest, CountsFollowEveryMutation) {
    std::string a = submit("a");
    std::string b = submit("b");
    std::string c = submit("c");
    std::string d = submit("d");

    downloading(a, 250, 1000, 100.0);
    downloading(b, 750, 1000, 300.0);
    registry.mutate(c, [](DownloadTask& task) {
        task.status = DownloadStatus::Error;
        task.error = "HTTP 404";
        return true;
    });

    auto current = stats.current();
    EXPECT_EQ(current.total, 4u);
    EXPECT_EQ(current.downloading, 2u);
    EXPECT_EQ(current.pending, 1u);
    EXPECT_EQ(current.error, 1u);
    EXPECT_EQ(current.totalSize, 2000u);
    EXPECT_EQ(current.downloadedSize, 1000u);
    EXPECT_DOUBLE_EQ(current.totalSpeed, 400.0);
    EXPECT_DOUBLE_EQ(current.totalProgress, 0.5);

    registry.remove(d);
    EXPECT_EQ(stats.current().total, 3u);
    EXPECT_EQ(stats.current().pending, 0u);
}

TEST_F(StatsAggregatorTest, ProgressIgnoresTasksThatAreNotDownloading) {
    std::string a = submit("a");
    complete(a, 500);
    std::string b = submit("b");
    registry.mutate(b, [](DownloadTask& task) {
        task.status = DownloadStatus::Paused;
        task.sizeBytes = 100;
        task.downloadedBytes = 10;
        return true;
    });

    EXPECT_DOUBLE_EQ(stats.current().totalProgress, 0.0);
    EXPECT_DOUBLE_EQ(stats.current().totalSpeed, 0.0);
}

TEST_F(StatsAggregatorTest, SubscribersReceiveEachRecomputation) {
    std::vector<size_t> totals;
    auto subscription = stats.subscribe([&totals](const DownloadStats& s) {
        totals.push_back(s.total);
    });

    std::string a = submit("a");
    submit("b");
    registry.remove(a);

    EXPECT_EQ(totals, (std::vector<size_t>{1, 2, 1}));

    EXPECT_TRUE(stats.unsubscribe(subscription));
    submit("c");
    EXPECT_EQ(totals.size(), 3u);
}

TEST_F(StatsAggregatorTest, CompletionsFeedHistoryNewestFirst) {
    std::string a = submit("a");
    std::string b = submit("b");
    complete(a, 100);
    complete(b, 300);

    // A later update of an already completed task is not a new completion
    registry.mutate(a, [](DownloadTask& task) {
        task.metadata["seen"] = true;
        return true;
    });

    auto entries = stats.history();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].id, b);
    EXPECT_EQ(entries[0].size, 300u);
    EXPECT_EQ(entries[0].filename, "b");
    EXPECT_EQ(entries[1].id, a);

    auto analytics = stats.analytics();
    EXPECT_EQ(analytics.totalDownloads, 2u);
    EXPECT_EQ(analytics.totalBytes, 400u);
    EXPECT_EQ(analytics.lastDownloadDate, entries[0].completedAt);
    EXPECT_DOUBLE_EQ(analytics.successRate, 1.0);
}

TEST_F(StatsAggregatorTest, SuccessRateCountsErrors) {
    std::string a = submit("a");
    std::string b = submit("b");
    std::string c = submit("c");
    std::string d = submit("d");
    complete(a, 10);
    complete(b, 10);
    complete(c, 10);
    registry.mutate(d, [](DownloadTask& task) {
        task.status = DownloadStatus::Error;
        return true;
    });

    EXPECT_DOUBLE_EQ(stats.analytics().successRate, 0.75);
}

TEST_F(StatsAggregatorTest, PeakSpeedIsTheHighestObserved) {
    std::string a = submit("a");
    downloading(a, 10, 1000, 2500.0);
    downloading(a, 20, 1000, 800.0);

    EXPECT_DOUBLE_EQ(stats.analytics().peakSpeed, 2500.0);
}

TEST_F(StatsAggregatorTest, HistoryIsBounded) {
    for (size_t i = 0; i < StatsAggregator::kMaxHistory + 5; ++i) {
        complete(submit("f" + std::to_string(i)), 1);
    }

    auto entries = stats.history();
    EXPECT_EQ(entries.size(), StatsAggregator::kMaxHistory);
    EXPECT_EQ(entries.front().filename, "f" + std::to_string(StatsAggregator::kMaxHistory + 4));
    EXPECT_EQ(stats.analytics().totalDownloads, StatsAggregator::kMaxHistory + 5);
}

TEST_F(StatsAggregatorTest, RestoredCompletionsAreNotCountedAgain) {
    auto stored = makeStoredTask("old", DownloadStatus::Completed, "/downloads/old.bin");
    registry.restore({stored});
    registry.mutate("old", [](DownloadTask& task) {
        task.metadata["touched"] = true;
        return true;
    });

    EXPECT_TRUE(stats.history().empty());
    EXPECT_EQ(stats.current().completed, 1u);
}

TEST(StatsJsonTest, SerializesCamelCaseFields) {
    DownloadStats s;
    s.total = 3;
    s.totalProgress = 0.25;
    json j = s;
    EXPECT_EQ(j.at("total").get<size_t>(), 3u);
    EXPECT_DOUBLE_EQ(j.at("totalProgress").get<double>(), 0.25);

    DownloadAnalytics a;
    a.successRate = 0.5;
    json k = a;
    EXPECT_DOUBLE_EQ(k.at("successRate").get<double>(), 0.5);
}

} // namespace surge::test
