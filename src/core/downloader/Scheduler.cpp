/**
 * Scheduler.cpp
 */

#include "Scheduler.hpp"
#include "../Logger.hpp"

#include <algorithm>

namespace surge::core::downloader {

Scheduler::Scheduler(TaskRegistry& registry, TransferExecutor& executor, CapProvider cap)
    : m_registry(registry)
    , m_executor(executor)
    , m_cap(std::move(cap)) {
}

void Scheduler::setOnline(bool online) {
    std::lock_guard<std::mutex> lock(m_admitMutex);
    m_online.store(online);
}

void Scheduler::setHalted(bool halted) {
    std::lock_guard<std::mutex> lock(m_admitMutex);
    m_halted.store(halted);
}

bool Scheduler::comesBefore(const DownloadTask& a, const DownloadTask& b) {
    if (a.priority != b.priority) {
        return static_cast<int>(a.priority) < static_cast<int>(b.priority);
    }
    if (a.createdAt != b.createdAt) {
        return a.createdAt < b.createdAt;
    }
    return a.sequence < b.sequence;
}

std::vector<DownloadTask> Scheduler::pendingQueue() const {
    auto pending = m_registry.list([](const DownloadTask& task) {
        return task.status == DownloadStatus::Pending;
    });
    std::stable_sort(pending.begin(), pending.end(), comesBefore);
    return pending;
}

size_t Scheduler::admit() {
    std::lock_guard<std::mutex> lock(m_admitMutex);

    if (m_halted.load() || !m_online.load()) {
        return 0;
    }

    size_t cap = std::max<uint32_t>(1, m_cap ? m_cap() : 1);
    size_t active = m_executor.activeCount();
    if (active >= cap) {
        return 0;
    }

    size_t started = 0;
    size_t slots = cap - active;

    for (const auto& task : pendingQueue()) {
        if (started >= slots) {
            break;
        }
        // A task that left pending since the snapshot is skipped
        if (m_executor.start(task.id)) {
            ++started;
        }
    }

    if (started > 0) {
        Logger::instance().debug("Admitted {} task(s), {} of {} slot(s) in use",
                                 started, active + started, cap);
    }
    return started;
}

} // namespace surge::core::downloader
