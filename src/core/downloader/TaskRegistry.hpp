#pragma once

/**
 * TaskRegistry.hpp
 *
 * In-memory authoritative map of task id to task record.
 */

#include "DownloadTask.hpp"
#include "TaskStore.hpp"
#include "../EventChannel.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace surge::core::downloader {

/**
 * Change notification emitted on every registry mutation
 */
struct TaskEvent {
    enum class Kind {
        Created,
        Updated,
        Removed
    };

    Kind kind;
    std::string id;
    DownloadTask task;  // state after the mutation (last state for Removed)
};

/**
 * Partial update applied to a copy of the record.
 * Returning false rejects the update and nothing is applied.
 */
using TaskPatch = std::function<bool(DownloadTask&)>;
using TaskFilter = std::function<bool(const DownloadTask&)>;
using TaskEventCallback = std::function<void(const TaskEvent&)>;

/**
 * TaskRegistry - single-writer boundary for task records
 *
 * Every mutation is serialized by one lock that also covers subscriber
 * delivery, so events reach subscribers synchronously and in mutation order.
 * Subscribers may read the registry from their callback but must not issue
 * commands that wait on a transfer.
 */
class TaskRegistry {
public:
    explicit TaskRegistry(std::shared_ptr<TaskStore> store);

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    /**
     * Create a pending task
     * @param url Source url (http or https)
     * @param filename Bare file name, no separators or reserved characters
     * @param directory Destination directory
     * @param options Request options
     * @return New task id
     * @throws ValidationError for a malformed url or filename
     */
    std::string create(const std::string& url,
                       const std::string& filename,
                       const std::string& directory,
                       const DownloadOptions& options = {});

    std::optional<DownloadTask> get(const std::string& taskId) const;

    /**
     * Apply a patch to one record
     *
     * id, sequence and createdAt cannot be changed, retryCount never goes
     * down, progressFraction is recomputed and updatedAt bumped.
     * @return false if the task is unknown or the patch rejected it
     */
    bool mutate(const std::string& taskId, const TaskPatch& patch);

    bool remove(const std::string& taskId);

    /**
     * Remove a record only if `predicate` accepts its current state
     * @return The removed record
     */
    std::optional<DownloadTask> removeIf(const std::string& taskId, const TaskFilter& predicate);

    /**
     * Snapshot of the matching records ordered by createdAt, then submission
     */
    std::vector<DownloadTask> list(const TaskFilter& filter = nullptr) const;

    size_t count() const;

    /**
     * Bulk-load records from the store without writing them back
     */
    void restore(const std::vector<DownloadTask>& tasks);

    SubscriptionPtr subscribe(TaskEventCallback callback);
    bool unsubscribe(const SubscriptionPtr& subscription);

    static void validateUrl(const std::string& url);
    static void validateFilename(const std::string& filename);

private:
    void emit(TaskEvent::Kind kind, const DownloadTask& task);
    void persist(const DownloadTask& task);
    void persistRemoval(const std::string& taskId);

private:
    std::shared_ptr<TaskStore> m_store;

    mutable std::recursive_mutex m_mutex;
    std::unordered_map<std::string, DownloadTask> m_tasks;
    uint64_t m_nextSequence{1};

    EventChannel<TaskEvent> m_events;
};

} // namespace surge::core::downloader
