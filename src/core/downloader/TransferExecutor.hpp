#pragma once

/**
 * TransferExecutor.hpp
 *
 * Drives the byte transfer of admitted tasks.
 */

#include "DownloadSettings.hpp"
#include "DownloadTask.hpp"
#include "TaskRegistry.hpp"
#include "Transport.hpp"
#include "../ThreadPool.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace surge::core::downloader {

/**
 * How a transfer left the downloading state
 */
enum class TransferEnd {
    Completed,
    Failed,
    Paused,
    Canceled
};

const char* toString(TransferEnd end);

/**
 * TransferExecutor - one transfer per active task, run on the thread pool
 *
 * The handle map is the active set: a task id has a handle exactly while its
 * record is in downloading. Handles are inserted before the record enters
 * downloading and erased after it leaves, under the same lock.
 *
 * Only the executor moves a record out of downloading. pause() and abort()
 * ask the worker to stop and wait for its acknowledgement, so they must not
 * be called from a registry subscriber.
 */
class TransferExecutor {
public:
    using SettingsProvider = std::function<DownloadSettings()>;
    using FinishedCallback = std::function<void(const std::string& taskId, TransferEnd end)>;

    TransferExecutor(TaskRegistry& registry,
                     std::shared_ptr<Transport> transport,
                     SettingsProvider settings);
    ~TransferExecutor();

    TransferExecutor(const TransferExecutor&) = delete;
    TransferExecutor& operator=(const TransferExecutor&) = delete;

    /**
     * Admit a pending task and begin streaming
     * @return false (logged, nothing changed) if the task is not pending,
     *         already active, or the executor is shutting down
     */
    bool start(const std::string& taskId);

    /**
     * Stop a running transfer, keeping its cursor
     * @return true if the task ended up paused
     */
    bool pause(const std::string& taskId, PauseReason reason);

    /**
     * Abort a running transfer, discard its output and delete its record.
     * Returns once the worker has acknowledged and the record is gone.
     * @return false if the task was not active
     */
    bool abort(const std::string& taskId);

    bool isActive(const std::string& taskId) const;
    size_t activeCount() const;
    std::vector<std::string> activeIds() const;

    /**
     * Refuse new starts and pause every running transfer with reason Shutdown
     */
    void shutdown();

    /**
     * Called on the worker thread after a transfer has left downloading and
     * its handle is released. No executor or registry lock is held.
     */
    void setFinishedCallback(FinishedCallback callback);

private:
    enum class StopRequest {
        None,
        Pause,
        Cancel
    };

    struct Handle {
        std::string taskId;
        DownloadSettings settings;
        std::atomic<StopRequest> stop{StopRequest::None};
        PauseReason pauseReason{PauseReason::User};
        std::promise<void> done;
        std::shared_future<void> finished;
    };

    using HandlePtr = std::shared_ptr<Handle>;

    struct RunResult {
        TransferEnd end{TransferEnd::Failed};
        std::string error;
        uint64_t bytes{0};
        uint64_t total{0};
    };

    class FileSink;

    void run(const HandlePtr& handle);
    RunResult transfer(const HandlePtr& handle, const DownloadTask& task);
    void finish(const HandlePtr& handle, RunResult result);
    std::shared_future<void> requestStop(const std::string& taskId, StopRequest request, PauseReason reason);

    static uint64_t reconcileCursor(const DownloadTask& task);

private:
    TaskRegistry& m_registry;
    std::shared_ptr<Transport> m_transport;
    SettingsProvider m_settings;

    mutable std::recursive_mutex m_mutex;
    std::unordered_map<std::string, HandlePtr> m_handles;
    bool m_shuttingDown{false};

    std::mutex m_callbackMutex;
    FinishedCallback m_onFinished;

    ThreadPool m_pool{1};
};

} // namespace surge::core::downloader
