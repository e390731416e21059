#pragma once

/**
 * DownloadManager.hpp
 *
 * Download task orchestrator. Accepts requests, runs them under a
 * concurrency cap, tracks progress, retries failures, persists the task set
 * across restarts and reacts to connectivity changes.
 */

#include "DownloadErrors.hpp"
#include "DownloadSettings.hpp"
#include "DownloadTask.hpp"
#include "NetworkMonitor.hpp"
#include "Scheduler.hpp"
#include "StatsAggregator.hpp"
#include "TaskRegistry.hpp"
#include "TaskStore.hpp"
#include "TransferExecutor.hpp"
#include "Transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace surge::core::downloader {

/**
 * DownloadManager - the orchestrator facade
 *
 * Features:
 * - Priority admission under maxConcurrentDownloads
 * - Pause/resume keeping the byte cursor
 * - Automatic retry after retryDelay, bounded by retryAttempts
 * - Crash-recoverable task set through an injected TaskStore
 * - Bulk pause/resume on connectivity loss and restore
 * - Push subscriptions for task changes and aggregate stats
 *
 * Commands are best-effort: a command against an incompatible state is a
 * logged no-op that returns false. Only submit() throws (ValidationError).
 *
 * Subscriber callbacks run synchronously inside the mutation that caused
 * them. They may read (get, list, stats) but must not issue commands.
 */
class DownloadManager {
public:
    /**
     * Constructor
     * @param settings Initial settings
     * @param store Task persistence
     * @param transport Byte source for transfers
     * @param monitor Connectivity source (nullptr = always online)
     */
    DownloadManager(DownloadSettings settings,
                    std::shared_ptr<TaskStore> store,
                    std::shared_ptr<Transport> transport,
                    std::shared_ptr<NetworkMonitor> monitor = nullptr);

    /**
     * Destructor - shuts down if still running
     */
    ~DownloadManager();

    // Disable copy
    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    /**
     * Load the persisted task set and run the first admission pass.
     * Tasks that were downloading come back paused.
     */
    void initialize();

    /**
     * Pause running transfers (reason Shutdown) and flush the store.
     * The instance cannot be restarted afterwards.
     */
    void shutdown();

    bool isInitialized() const { return m_initialized.load(); }

    /**
     * Submit a download
     * @param url Source url
     * @param filename Destination file name
     * @param options Priority, metadata, destination override, checksum
     * @return Task ID
     * @throws ValidationError for a bad url or filename, or a file type
     *         outside allowedFileTypes
     */
    std::string submit(const std::string& url,
                       const std::string& filename,
                       const DownloadOptions& options = {});

    /**
     * Pause a downloading task, or park a pending one
     */
    bool pause(const std::string& taskId);

    /**
     * Re-queue a paused task; it keeps its cursor
     */
    bool resume(const std::string& taskId);

    /**
     * Abort and delete a task, discarding its partial file.
     * Completed tasks are left alone (see clearCompleted()).
     */
    bool cancel(const std::string& taskId);

    /**
     * Re-queue a failed task from byte zero
     */
    bool retry(const std::string& taskId);

    size_t pauseAll();
    size_t resumeAll();
    size_t cancelAll();

    /**
     * Remove completed records. Downloaded files are kept.
     */
    size_t clearCompleted();

    std::optional<DownloadTask> get(const std::string& taskId) const;
    std::vector<DownloadTask> list(const TaskFilter& filter = nullptr) const;

    /**
     * Pending tasks in the order they will be admitted
     */
    std::vector<DownloadTask> pendingQueue() const;

    DownloadStats stats() const;
    DownloadAnalytics analytics() const;
    std::vector<DownloadHistoryEntry> history() const;

    SubscriptionPtr subscribeTasks(TaskEventCallback callback);
    SubscriptionPtr subscribeStats(StatsCallback callback);

    /**
     * Stop delivery for a handle from either subscribe call. Idempotent.
     */
    bool unsubscribe(const SubscriptionPtr& subscription);

    /**
     * Apply a partial settings update. Running transfers keep the settings
     * they started with.
     */
    void updateSettings(const DownloadSettingsPatch& patch);
    DownloadSettings settings() const;

    bool isOnline() const { return m_scheduler.isOnline(); }

private:
    void onTransferFinished(const std::string& taskId, TransferEnd end);
    void onConnectivityChanged(bool connected);

    bool requeuePaused(const std::string& taskId, std::optional<PauseReason> onlyReason);
    bool requeueFailed(const std::string& taskId, bool automatic);

    void scheduleRetry(const std::string& taskId, std::chrono::milliseconds delay);
    void cancelRetry(const std::string& taskId);
    void retryLoop();
    void stopRetryThread();

    std::string resolveDirectory(const DownloadOptions& options, const DownloadSettings& settings) const;

private:
    mutable std::mutex m_settingsMutex;
    DownloadSettings m_settings;

    std::shared_ptr<TaskStore> m_store;
    std::shared_ptr<NetworkMonitor> m_monitor;

    TaskRegistry m_registry;
    TransferExecutor m_executor;
    Scheduler m_scheduler;
    StatsAggregator m_stats;

    std::mutex m_lifecycleMutex;
    std::atomic<bool> m_initialized{false};
    bool m_shutDown{false};

    // Automatic retry timers
    std::mutex m_retryMutex;
    std::condition_variable m_retryCondition;
    std::multimap<std::chrono::steady_clock::time_point, std::string> m_retryQueue;
    std::thread m_retryThread;
    bool m_retryStop{false};
};

} // namespace surge::core::downloader
