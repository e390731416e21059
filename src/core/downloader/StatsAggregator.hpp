#pragma once

/**
 * StatsAggregator.hpp
 *
 * Derived views over the registry: live stats, completion history and
 * cumulative analytics.
 */

#include "DownloadTask.hpp"
#include "TaskRegistry.hpp"
#include "../EventChannel.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace surge::core::downloader {

/**
 * Aggregate view of the task set. Derived, never stored.
 */
struct DownloadStats {
    size_t total{0};
    size_t pending{0};
    size_t downloading{0};
    size_t paused{0};
    size_t completed{0};
    size_t error{0};
    size_t canceled{0};

    uint64_t totalSize{0};
    uint64_t downloadedSize{0};
    double totalSpeed{0.0};      // sum over downloading tasks
    double totalProgress{0.0};   // mean progressFraction over downloading tasks
};

struct DownloadHistoryEntry {
    std::string id;
    std::string filename;
    std::string url;
    int64_t completedAt{0};
    uint64_t size{0};
    int64_t durationMs{0};
    double averageSpeed{0.0};
};

struct DownloadAnalytics {
    uint64_t totalDownloads{0};
    uint64_t totalBytes{0};
    double averageSpeed{0.0};
    double successRate{0.0};     // completed / (completed + error) in the registry
    int64_t lastDownloadDate{0};
    double peakSpeed{0.0};
};

void to_json(json& j, const DownloadStats& stats);
void to_json(json& j, const DownloadHistoryEntry& entry);
void to_json(json& j, const DownloadAnalytics& analytics);

using StatsCallback = std::function<void(const DownloadStats&)>;

/**
 * StatsAggregator - recomputes stats on every registry event
 *
 * Stats subscribers are called from inside the registry event, so they see
 * stats in mutation order.
 */
class StatsAggregator {
public:
    static constexpr size_t kMaxHistory = 100;

    explicit StatsAggregator(TaskRegistry& registry);
    ~StatsAggregator();

    StatsAggregator(const StatsAggregator&) = delete;
    StatsAggregator& operator=(const StatsAggregator&) = delete;

    /**
     * Pure derivation used for every recomputation
     */
    static DownloadStats compute(const std::vector<DownloadTask>& tasks);

    DownloadStats current() const;
    DownloadAnalytics analytics() const;

    /**
     * Most recent completions, newest first
     */
    std::vector<DownloadHistoryEntry> history() const;

    SubscriptionPtr subscribe(StatsCallback callback);
    bool unsubscribe(const SubscriptionPtr& subscription);

private:
    void onTaskEvent(const TaskEvent& event);
    void recordCompletion(const DownloadTask& task);

private:
    TaskRegistry& m_registry;
    SubscriptionPtr m_registrySubscription;

    mutable std::mutex m_mutex;
    DownloadStats m_stats;
    std::deque<DownloadHistoryEntry> m_history;
    std::unordered_set<std::string> m_completedIds;

    uint64_t m_totalDownloads{0};
    uint64_t m_totalBytes{0};
    double m_speedSum{0.0};
    double m_peakSpeed{0.0};
    int64_t m_lastDownloadDate{0};

    EventChannel<DownloadStats> m_channel;
};

} // namespace surge::core::downloader
