#pragma once

/**
 * Scheduler.hpp
 *
 * Admission control: which pending tasks run, under the concurrency cap.
 */

#include "DownloadTask.hpp"
#include "TaskRegistry.hpp"
#include "TransferExecutor.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <vector>

namespace surge::core::downloader {

/**
 * Scheduler - priority admission bounded by maxConcurrentDownloads
 *
 * Order: priority (high, normal, low), then createdAt, then submission
 * sequence. The cap is counted on the executor's active set. admit() is a
 * single pass and safe to call redundantly; passes are serialized, and
 * only a pass starts transfers, so concurrent completions can only free
 * slots under it.
 */
class Scheduler {
public:
    using CapProvider = std::function<uint32_t()>;

    Scheduler(TaskRegistry& registry, TransferExecutor& executor, CapProvider cap);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * Run one admission pass
     * @return Number of tasks started
     */
    size_t admit();

    /**
     * Admission is suspended while offline. Waits for a pass in progress,
     * so no transfer starts after setOnline(false) returns.
     */
    void setOnline(bool online);
    bool isOnline() const { return m_online.load(); }

    /**
     * Suspend admission (bulk operations, shutdown). Waits like setOnline().
     */
    void setHalted(bool halted);
    bool isHalted() const { return m_halted.load(); }

    /**
     * Pending tasks in admission order
     */
    std::vector<DownloadTask> pendingQueue() const;

    /**
     * Strict weak ordering used for admission
     */
    static bool comesBefore(const DownloadTask& a, const DownloadTask& b);

private:
    TaskRegistry& m_registry;
    TransferExecutor& m_executor;
    CapProvider m_cap;

    std::mutex m_admitMutex;
    std::atomic<bool> m_online{true};
    std::atomic<bool> m_halted{false};
};

} // namespace surge::core::downloader
