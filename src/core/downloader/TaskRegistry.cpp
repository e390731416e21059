/**
 * TaskRegistry.cpp
 */

#include "TaskRegistry.hpp"
#include "DownloadErrors.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <filesystem>

namespace surge::core::downloader {

namespace {

bool comesEarlier(const DownloadTask& a, const DownloadTask& b) {
    if (a.createdAt != b.createdAt) {
        return a.createdAt < b.createdAt;
    }
    return a.sequence < b.sequence;
}

} // namespace

TaskRegistry::TaskRegistry(std::shared_ptr<TaskStore> store)
    : m_store(std::move(store)) {
}

void TaskRegistry::validateUrl(const std::string& url) {
    if (utils::StringUtils::isBlank(url)) {
        throw ValidationError("URL is empty");
    }
    if (!utils::StringUtils::isValidUtf8(url)) {
        throw ValidationError("URL is not valid UTF-8");
    }
    if (!utils::StringUtils::isUrl(url)) {
        throw ValidationError("Malformed or unsupported URL: " + url);
    }
}

void TaskRegistry::validateFilename(const std::string& filename) {
    if (filename.empty()) {
        throw ValidationError("Filename is empty");
    }
    if (!utils::StringUtils::isValidUtf8(filename)) {
        throw ValidationError("Filename is not valid UTF-8");
    }
    if (filename == "." || filename == "..") {
        throw ValidationError("Invalid filename: " + filename);
    }

    static const std::string reserved = "<>:\"/\\|?*";
    for (char c : filename) {
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
            throw ValidationError("Filename contains control characters");
        }
        if (reserved.find(c) != std::string::npos) {
            throw ValidationError("Filename contains reserved character '" + std::string(1, c) + "': " + filename);
        }
    }
}

std::string TaskRegistry::create(const std::string& url,
                                 const std::string& filename,
                                 const std::string& directory,
                                 const DownloadOptions& options) {
    validateUrl(url);
    validateFilename(filename);

    DownloadTask task;
    task.url = url;
    task.filename = filename;
    task.destinationPath = (std::filesystem::path(directory) / filename).string();
    task.priority = options.priority;
    task.metadata = options.metadata.is_null() ? json::object() : options.metadata;
    task.expectedChecksum = options.expectedChecksum;
    task.sizeBytes = options.expectedSize;
    task.status = DownloadStatus::Pending;
    task.createdAt = nowMillis();
    task.updatedAt = task.createdAt;

    // Metadata and checksum must survive the JSON round trip to the store
    try {
        json record = task;
        record.dump();
    } catch (const json::exception& e) {
        throw ValidationError(std::string("Task cannot be stored: ") + e.what());
    }

    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    do {
        task.id = utils::StringUtils::generateUUID();
    } while (m_tasks.count(task.id) > 0);

    task.sequence = m_nextSequence++;
    m_tasks.emplace(task.id, task);

    Logger::instance().debug("Created task {} ({} -> {})", task.id, url, task.destinationPath);

    persist(task);
    emit(TaskEvent::Kind::Created, task);
    return task.id;
}

std::optional<DownloadTask> TaskRegistry::get(const std::string& taskId) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    auto it = m_tasks.find(taskId);
    if (it == m_tasks.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TaskRegistry::mutate(const std::string& taskId, const TaskPatch& patch) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    auto it = m_tasks.find(taskId);
    if (it == m_tasks.end()) {
        return false;
    }

    const DownloadTask& current = it->second;
    DownloadTask updated = current;
    if (!patch(updated)) {
        return false;
    }

    updated.id = current.id;
    updated.sequence = current.sequence;
    updated.createdAt = current.createdAt;
    updated.retryCount = std::max(updated.retryCount, current.retryCount);
    updated.recomputeProgress();
    updated.updatedAt = nowMillis();

    it->second = updated;

    persist(updated);
    emit(TaskEvent::Kind::Updated, updated);
    return true;
}

bool TaskRegistry::remove(const std::string& taskId) {
    return removeIf(taskId, nullptr).has_value();
}

std::optional<DownloadTask> TaskRegistry::removeIf(const std::string& taskId, const TaskFilter& predicate) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    auto it = m_tasks.find(taskId);
    if (it == m_tasks.end()) {
        return std::nullopt;
    }
    if (predicate && !predicate(it->second)) {
        return std::nullopt;
    }

    DownloadTask removed = std::move(it->second);
    m_tasks.erase(it);

    Logger::instance().debug("Removed task {}", taskId);

    persistRemoval(taskId);
    emit(TaskEvent::Kind::Removed, removed);
    return removed;
}

std::vector<DownloadTask> TaskRegistry::list(const TaskFilter& filter) const {
    std::vector<DownloadTask> result;

    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        result.reserve(m_tasks.size());
        for (const auto& [id, task] : m_tasks) {
            if (!filter || filter(task)) {
                result.push_back(task);
            }
        }
    }

    std::sort(result.begin(), result.end(), comesEarlier);
    return result;
}

size_t TaskRegistry::count() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_tasks.size();
}

void TaskRegistry::restore(const std::vector<DownloadTask>& tasks) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    for (const auto& task : tasks) {
        if (task.id.empty()) {
            Logger::instance().warn("Skipping restored task without id ({})", task.url);
            continue;
        }

        DownloadTask restored = task;
        if (restored.sequence == 0) {
            restored.sequence = m_nextSequence;
        }
        m_nextSequence = std::max(m_nextSequence, restored.sequence + 1);

        m_tasks[restored.id] = restored;
        emit(TaskEvent::Kind::Created, restored);
    }

    Logger::instance().info("Restored {} task(s)", tasks.size());
}

SubscriptionPtr TaskRegistry::subscribe(TaskEventCallback callback) {
    return m_events.subscribe(std::move(callback));
}

bool TaskRegistry::unsubscribe(const SubscriptionPtr& subscription) {
    return m_events.unsubscribe(subscription);
}

void TaskRegistry::emit(TaskEvent::Kind kind, const DownloadTask& task) {
    m_events.publish(TaskEvent{kind, task.id, task});
}

void TaskRegistry::persist(const DownloadTask& task) {
    if (!m_store) {
        return;
    }
    try {
        m_store->save(task);
    } catch (const PersistenceError& e) {
        Logger::instance().warn("Could not persist task {}: {}", task.id, e.what());
    }
}

void TaskRegistry::persistRemoval(const std::string& taskId) {
    if (!m_store) {
        return;
    }
    try {
        m_store->remove(taskId);
    } catch (const PersistenceError& e) {
        Logger::instance().warn("Could not persist removal of task {}: {}", taskId, e.what());
    }
}

} // namespace surge::core::downloader
