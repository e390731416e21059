/**
 * DownloadManager.cpp
 *
 * Implementation of the download task orchestrator.
 */

#include "DownloadManager.hpp"
#include "../Logger.hpp"
#include "../../utils/PathUtils.hpp"

#include <filesystem>
#include <stdexcept>

namespace surge::core::downloader {

namespace {

void discardPartialFile(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        Logger::instance().warn("Could not remove partial file {}: {}", path, ec.message());
    }
}

} // namespace

DownloadManager::DownloadManager(DownloadSettings settings,
                                 std::shared_ptr<TaskStore> store,
                                 std::shared_ptr<Transport> transport,
                                 std::shared_ptr<NetworkMonitor> monitor)
    : m_settings(std::move(settings))
    , m_store(std::move(store))
    , m_monitor(monitor ? std::move(monitor) : std::make_shared<NetworkMonitor>())
    , m_registry(m_store)
    , m_executor(m_registry, std::move(transport), [this] { return this->settings(); })
    , m_scheduler(m_registry, m_executor, [this] { return this->settings().maxConcurrentDownloads; })
    , m_stats(m_registry) {

    if (!m_store) {
        throw std::invalid_argument("DownloadManager requires a task store");
    }
}

DownloadManager::~DownloadManager() {
    shutdown();
}

void DownloadManager::initialize() {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    if (m_initialized || m_shutDown) return;

    Logger::instance().info("Initializing DownloadManager");

    std::vector<DownloadTask> stored;
    try {
        stored = m_store->loadAll();
    } catch (const PersistenceError& e) {
        Logger::instance().error("Could not load persisted tasks, starting empty: {}", e.what());
    }

    m_registry.restore(TaskStore::rehydrate(std::move(stored)));

    // Persist the rehydrated state so a second crash never sees "downloading"
    try {
        m_store->saveAll(m_registry.list());
    } catch (const PersistenceError& e) {
        Logger::instance().warn("Could not persist rehydrated tasks: {}", e.what());
    }

    m_executor.setFinishedCallback([this](const std::string& taskId, TransferEnd end) {
        onTransferFinished(taskId, end);
    });

    m_monitor->setHandler([this](bool connected) {
        onConnectivityChanged(connected);
    });
    m_scheduler.setOnline(m_monitor->isConnected());

    {
        std::lock_guard<std::mutex> retryLock(m_retryMutex);
        m_retryStop = false;
    }
    m_retryThread = std::thread([this] { retryLoop(); });

    m_initialized = true;

    DownloadSettings current = settings();
    if (current.resumeOnStartup) {
        auto interrupted = m_registry.list([](const DownloadTask& task) {
            return task.status == DownloadStatus::Paused && task.pauseReason == PauseReason::Shutdown;
        });
        for (const auto& task : interrupted) {
            requeuePaused(task.id, PauseReason::Shutdown);
        }
        if (!interrupted.empty()) {
            Logger::instance().info("Resuming {} download(s) interrupted by shutdown", interrupted.size());
        }
    }

    m_scheduler.admit();

    Logger::instance().info("DownloadManager initialized ({} task(s), max concurrent: {})",
                            m_registry.count(), current.maxConcurrentDownloads);
}

void DownloadManager::shutdown() {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    if (!m_initialized) return;

    Logger::instance().info("Shutting down DownloadManager");

    m_initialized = false;
    m_shutDown = true;
    m_monitor->setHandler(nullptr);
    m_scheduler.setHalted(true);
    stopRetryThread();

    m_executor.shutdown();
    m_executor.setFinishedCallback(nullptr);

    try {
        m_store->flush();
    } catch (const PersistenceError& e) {
        Logger::instance().error("Could not flush task store: {}", e.what());
    }
}

std::string DownloadManager::submit(const std::string& url,
                                    const std::string& filename,
                                    const DownloadOptions& options) {
    if (!m_initialized) {
        initialize();
    }

    DownloadSettings current = settings();
    if (!current.isFileTypeAllowed(filename)) {
        throw ValidationError("File type not allowed: " + filename);
    }

    std::string taskId = m_registry.create(url, filename, resolveDirectory(options, current), options);

    Logger::instance().info("Queued download {} ({}, priority {})", taskId, url, toString(options.priority));

    m_scheduler.admit();
    return taskId;
}

std::string DownloadManager::resolveDirectory(const DownloadOptions& options,
                                              const DownloadSettings& settings) const {
    if (!options.directory.empty()) {
        return options.directory;
    }
    if (!settings.downloadLocation.empty()) {
        return settings.downloadLocation;
    }
    return utils::PathUtils::getDownloadsPath().string();
}

bool DownloadManager::pause(const std::string& taskId) {
    if (m_executor.pause(taskId, PauseReason::User)) {
        return true;
    }

    bool parked = m_registry.mutate(taskId, [](DownloadTask& task) {
        if (task.status != DownloadStatus::Pending) {
            return false;
        }
        task.status = DownloadStatus::Paused;
        task.pauseReason = PauseReason::User;
        return true;
    });
    if (parked) {
        Logger::instance().info("Paused queued download {}", taskId);
        return true;
    }

    // Admitted between the two checks
    if (m_executor.pause(taskId, PauseReason::User)) {
        return true;
    }

    Logger::instance().debug("Ignoring pause of {}: not pending or downloading", taskId);
    return false;
}

bool DownloadManager::resume(const std::string& taskId) {
    if (!requeuePaused(taskId, std::nullopt)) {
        Logger::instance().debug("Ignoring resume of {}: not paused", taskId);
        return false;
    }

    m_scheduler.admit();
    return true;
}

bool DownloadManager::requeuePaused(const std::string& taskId, std::optional<PauseReason> onlyReason) {
    bool requeued = m_registry.mutate(taskId, [onlyReason](DownloadTask& task) {
        if (task.status != DownloadStatus::Paused) {
            return false;
        }
        if (onlyReason && task.pauseReason != *onlyReason) {
            return false;
        }
        task.status = DownloadStatus::Pending;
        task.pauseReason = PauseReason::None;
        task.speedBytesPerSecond = 0.0;
        return true;
    });

    if (requeued) {
        Logger::instance().info("Resuming download {}", taskId);
    }
    return requeued;
}

bool DownloadManager::cancel(const std::string& taskId) {
    // The task can change state under us; re-evaluate a few times
    for (int attempt = 0; attempt < 3; ++attempt) {
        auto task = m_registry.get(taskId);
        if (!task) {
            Logger::instance().debug("Ignoring cancel of {}: unknown task", taskId);
            return false;
        }

        if (task->isTerminal()) {
            Logger::instance().debug("Ignoring cancel of {}: already {}", taskId, toString(task->status));
            return false;
        }

        if (task->status == DownloadStatus::Downloading) {
            if (m_executor.abort(taskId)) {
                cancelRetry(taskId);
                return true;
            }
            continue;
        }

        auto removed = m_registry.removeIf(taskId, [](const DownloadTask& t) {
            return t.status == DownloadStatus::Pending ||
                   t.status == DownloadStatus::Paused ||
                   t.status == DownloadStatus::Error;
        });

        if (removed) {
            cancelRetry(taskId);
            // A retried task is pending with a zero cursor but may still have bytes on disk
            discardPartialFile(removed->destinationPath);
            Logger::instance().info("Canceled download {}", taskId);
            return true;
        }
    }

    Logger::instance().warn("Could not cancel {}: state kept changing", taskId);
    return false;
}

bool DownloadManager::retry(const std::string& taskId) {
    if (!requeueFailed(taskId, false)) {
        Logger::instance().debug("Ignoring retry of {}: not in error", taskId);
        return false;
    }
    return true;
}

bool DownloadManager::requeueFailed(const std::string& taskId, bool automatic) {
    int64_t now = nowMillis();

    bool requeued = m_registry.mutate(taskId, [now](DownloadTask& task) {
        if (task.status != DownloadStatus::Error) {
            return false;
        }
        task.status = DownloadStatus::Pending;
        task.pauseReason = PauseReason::None;
        task.downloadedBytes = 0;
        task.speedBytesPerSecond = 0.0;
        task.error.reset();
        task.retryCount += 1;
        task.lastRetryTime = now;
        return true;
    });

    if (!requeued) {
        return false;
    }

    if (!automatic) {
        cancelRetry(taskId);
    }

    Logger::instance().info("{} download {}", automatic ? "Auto-retrying" : "Retrying", taskId);
    m_scheduler.admit();
    return true;
}

size_t DownloadManager::pauseAll() {
    if (!m_initialized) return 0;

    m_scheduler.setHalted(true);

    size_t paused = 0;
    auto tasks = m_registry.list([](const DownloadTask& task) {
        return task.status == DownloadStatus::Pending || task.status == DownloadStatus::Downloading;
    });
    for (const auto& task : tasks) {
        if (pause(task.id)) {
            ++paused;
        }
    }

    m_scheduler.setHalted(false);
    m_scheduler.admit();

    Logger::instance().info("Paused {} download(s)", paused);
    return paused;
}

size_t DownloadManager::resumeAll() {
    size_t resumed = 0;
    auto tasks = m_registry.list([](const DownloadTask& task) {
        return task.status == DownloadStatus::Paused;
    });
    for (const auto& task : tasks) {
        if (requeuePaused(task.id, std::nullopt)) {
            ++resumed;
        }
    }

    m_scheduler.admit();
    return resumed;
}

size_t DownloadManager::cancelAll() {
    if (!m_initialized) return 0;

    m_scheduler.setHalted(true);

    size_t canceled = 0;
    auto tasks = m_registry.list([](const DownloadTask& task) {
        return !task.isTerminal();
    });
    for (const auto& task : tasks) {
        if (cancel(task.id)) {
            ++canceled;
        }
    }

    m_scheduler.setHalted(false);
    m_scheduler.admit();

    Logger::instance().info("Canceled {} download(s)", canceled);
    return canceled;
}

size_t DownloadManager::clearCompleted() {
    size_t cleared = 0;
    auto tasks = m_registry.list([](const DownloadTask& task) {
        return task.status == DownloadStatus::Completed;
    });
    for (const auto& task : tasks) {
        auto removed = m_registry.removeIf(task.id, [](const DownloadTask& t) {
            return t.status == DownloadStatus::Completed;
        });
        if (removed) {
            ++cleared;
        }
    }

    if (cleared > 0) {
        Logger::instance().info("Cleared {} completed download(s)", cleared);
    }
    return cleared;
}

std::optional<DownloadTask> DownloadManager::get(const std::string& taskId) const {
    return m_registry.get(taskId);
}

std::vector<DownloadTask> DownloadManager::list(const TaskFilter& filter) const {
    return m_registry.list(filter);
}

std::vector<DownloadTask> DownloadManager::pendingQueue() const {
    return m_scheduler.pendingQueue();
}

DownloadStats DownloadManager::stats() const {
    return m_stats.current();
}

DownloadAnalytics DownloadManager::analytics() const {
    return m_stats.analytics();
}

std::vector<DownloadHistoryEntry> DownloadManager::history() const {
    return m_stats.history();
}

SubscriptionPtr DownloadManager::subscribeTasks(TaskEventCallback callback) {
    return m_registry.subscribe(std::move(callback));
}

SubscriptionPtr DownloadManager::subscribeStats(StatsCallback callback) {
    return m_stats.subscribe(std::move(callback));
}

bool DownloadManager::unsubscribe(const SubscriptionPtr& subscription) {
    if (m_registry.unsubscribe(subscription)) {
        return true;
    }
    return m_stats.unsubscribe(subscription);
}

void DownloadManager::updateSettings(const DownloadSettingsPatch& patch) {
    uint32_t cap = 0;
    {
        std::lock_guard<std::mutex> lock(m_settingsMutex);
        applyPatch(m_settings, patch);
        cap = m_settings.maxConcurrentDownloads;
    }

    Logger::instance().info("Download settings updated (max concurrent: {})", cap);

    if (m_initialized) {
        m_scheduler.admit();
    }
}

DownloadSettings DownloadManager::settings() const {
    std::lock_guard<std::mutex> lock(m_settingsMutex);
    return m_settings;
}

void DownloadManager::onTransferFinished(const std::string& taskId, TransferEnd end) {
    if (end == TransferEnd::Failed) {
        DownloadSettings current = settings();
        auto task = m_registry.get(taskId);

        if (task && task->status == DownloadStatus::Error) {
            if (task->retryCount + 1 < current.retryAttempts) {
                Logger::instance().info("Download {} will retry in {} ms (attempt {} of {})",
                                        taskId, current.retryDelay, task->retryCount + 2, current.retryAttempts);
                scheduleRetry(taskId, std::chrono::milliseconds(current.retryDelay));
            } else {
                Logger::instance().warn("Download {} failed after {} attempt(s): {}",
                                        taskId, task->retryCount + 1, task->error.value_or("unknown error"));
            }
        }
    }

    m_scheduler.admit();
}

void DownloadManager::onConnectivityChanged(bool connected) {
    if (!connected) {
        m_scheduler.setOnline(false);

        auto active = m_executor.activeIds();
        size_t paused = 0;
        for (const auto& id : active) {
            if (m_executor.pause(id, PauseReason::Connectivity)) {
                ++paused;
            } else {
                Logger::instance().warn("Could not pause {} on connectivity loss", id);
            }
        }

        Logger::instance().info("Connectivity lost: paused {} of {} active download(s)", paused, active.size());
        return;
    }

    m_scheduler.setOnline(true);

    if (settings().autoResumeOnConnectivityRestore) {
        auto interrupted = m_registry.list([](const DownloadTask& task) {
            return task.status == DownloadStatus::Paused && task.pauseReason == PauseReason::Connectivity;
        });

        size_t resumed = 0;
        for (const auto& task : interrupted) {
            if (requeuePaused(task.id, PauseReason::Connectivity)) {
                ++resumed;
            } else {
                Logger::instance().warn("Could not resume {} after connectivity restore", task.id);
            }
        }
        Logger::instance().info("Connectivity restored: resumed {} download(s)", resumed);
    }

    m_scheduler.admit();
}

void DownloadManager::scheduleRetry(const std::string& taskId, std::chrono::milliseconds delay) {
    {
        std::lock_guard<std::mutex> lock(m_retryMutex);
        m_retryQueue.emplace(std::chrono::steady_clock::now() + delay, taskId);
    }
    m_retryCondition.notify_all();
}

void DownloadManager::cancelRetry(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(m_retryMutex);
    for (auto it = m_retryQueue.begin(); it != m_retryQueue.end();) {
        if (it->second == taskId) {
            it = m_retryQueue.erase(it);
        } else {
            ++it;
        }
    }
}

void DownloadManager::retryLoop() {
    std::unique_lock<std::mutex> lock(m_retryMutex);

    while (!m_retryStop) {
        if (m_retryQueue.empty()) {
            m_retryCondition.wait(lock, [this] {
                return m_retryStop || !m_retryQueue.empty();
            });
            continue;
        }

        auto due = m_retryQueue.begin()->first;
        if (std::chrono::steady_clock::now() < due) {
            m_retryCondition.wait_until(lock, due);
            continue;
        }

        std::string taskId = m_retryQueue.begin()->second;
        m_retryQueue.erase(m_retryQueue.begin());

        lock.unlock();
        if (!requeueFailed(taskId, true)) {
            Logger::instance().debug("Skipping auto-retry of {}: no longer in error", taskId);
        }
        lock.lock();
    }
}

void DownloadManager::stopRetryThread() {
    {
        std::lock_guard<std::mutex> lock(m_retryMutex);
        m_retryStop = true;
        m_retryQueue.clear();
    }
    m_retryCondition.notify_all();

    if (m_retryThread.joinable()) {
        m_retryThread.join();
    }
}

} // namespace surge::core::downloader
