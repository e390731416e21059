/**
 * StatsAggregator.cpp
 */

#include "StatsAggregator.hpp"

#include <algorithm>

namespace surge::core::downloader {

void to_json(json& j, const DownloadStats& stats) {
    j = json{
        {"total", stats.total},
        {"pending", stats.pending},
        {"downloading", stats.downloading},
        {"paused", stats.paused},
        {"completed", stats.completed},
        {"error", stats.error},
        {"canceled", stats.canceled},
        {"totalSize", stats.totalSize},
        {"downloadedSize", stats.downloadedSize},
        {"totalSpeed", stats.totalSpeed},
        {"totalProgress", stats.totalProgress}
    };
}

void to_json(json& j, const DownloadHistoryEntry& entry) {
    j = json{
        {"id", entry.id},
        {"filename", entry.filename},
        {"url", entry.url},
        {"completedAt", entry.completedAt},
        {"size", entry.size},
        {"durationMs", entry.durationMs},
        {"averageSpeed", entry.averageSpeed}
    };
}

void to_json(json& j, const DownloadAnalytics& analytics) {
    j = json{
        {"totalDownloads", analytics.totalDownloads},
        {"totalBytes", analytics.totalBytes},
        {"averageSpeed", analytics.averageSpeed},
        {"successRate", analytics.successRate},
        {"lastDownloadDate", analytics.lastDownloadDate},
        {"peakSpeed", analytics.peakSpeed}
    };
}

StatsAggregator::StatsAggregator(TaskRegistry& registry)
    : m_registry(registry) {
    m_stats = compute(m_registry.list());
    m_registrySubscription = m_registry.subscribe([this](const TaskEvent& event) {
        onTaskEvent(event);
    });
}

StatsAggregator::~StatsAggregator() {
    m_registry.unsubscribe(m_registrySubscription);
}

DownloadStats StatsAggregator::compute(const std::vector<DownloadTask>& tasks) {
    DownloadStats stats;
    double progressSum = 0.0;

    for (const auto& task : tasks) {
        ++stats.total;
        stats.totalSize += task.sizeBytes;
        stats.downloadedSize += task.downloadedBytes;

        switch (task.status) {
            case DownloadStatus::Pending:     ++stats.pending; break;
            case DownloadStatus::Paused:      ++stats.paused; break;
            case DownloadStatus::Completed:   ++stats.completed; break;
            case DownloadStatus::Error:       ++stats.error; break;
            case DownloadStatus::Canceled:    ++stats.canceled; break;
            case DownloadStatus::Downloading:
                ++stats.downloading;
                stats.totalSpeed += task.speedBytesPerSecond;
                progressSum += task.progressFraction;
                break;
        }
    }

    stats.totalProgress = stats.downloading > 0
        ? progressSum / static_cast<double>(stats.downloading)
        : 0.0;

    return stats;
}

DownloadStats StatsAggregator::current() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

DownloadAnalytics StatsAggregator::analytics() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    DownloadAnalytics result;
    result.totalDownloads = m_totalDownloads;
    result.totalBytes = m_totalBytes;
    result.averageSpeed = m_totalDownloads > 0
        ? m_speedSum / static_cast<double>(m_totalDownloads)
        : 0.0;
    result.lastDownloadDate = m_lastDownloadDate;
    result.peakSpeed = m_peakSpeed;

    size_t settled = m_stats.completed + m_stats.error;
    result.successRate = settled > 0
        ? static_cast<double>(m_stats.completed) / static_cast<double>(settled)
        : 0.0;

    return result;
}

std::vector<DownloadHistoryEntry> StatsAggregator::history() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<DownloadHistoryEntry>(m_history.begin(), m_history.end());
}

SubscriptionPtr StatsAggregator::subscribe(StatsCallback callback) {
    return m_channel.subscribe(std::move(callback));
}

bool StatsAggregator::unsubscribe(const SubscriptionPtr& subscription) {
    return m_channel.unsubscribe(subscription);
}

void StatsAggregator::onTaskEvent(const TaskEvent& event) {
    DownloadStats snapshot = compute(m_registry.list());

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats = snapshot;

        switch (event.kind) {
            case TaskEvent::Kind::Created:
                if (event.task.status == DownloadStatus::Completed) {
                    m_completedIds.insert(event.id);
                }
                break;
            case TaskEvent::Kind::Updated:
                m_peakSpeed = std::max(m_peakSpeed, event.task.speedBytesPerSecond);
                if (event.task.status == DownloadStatus::Completed &&
                    m_completedIds.insert(event.id).second) {
                    recordCompletion(event.task);
                }
                break;
            case TaskEvent::Kind::Removed:
                m_completedIds.erase(event.id);
                break;
        }
    }

    m_channel.publish(snapshot);
}

void StatsAggregator::recordCompletion(const DownloadTask& task) {
    DownloadHistoryEntry entry;
    entry.id = task.id;
    entry.filename = task.filename;
    entry.url = task.url;
    entry.completedAt = task.updatedAt;
    entry.size = task.sizeBytes;
    entry.durationMs = task.startedAt > 0 ? std::max<int64_t>(0, task.updatedAt - task.startedAt) : 0;
    entry.averageSpeed = entry.durationMs > 0
        ? static_cast<double>(entry.size) * 1000.0 / static_cast<double>(entry.durationMs)
        : 0.0;

    m_history.push_front(entry);
    while (m_history.size() > kMaxHistory) {
        m_history.pop_back();
    }

    ++m_totalDownloads;
    m_totalBytes += entry.size;
    m_speedSum += entry.averageSpeed;
    m_lastDownloadDate = entry.completedAt;
}

} // namespace surge::core::downloader
