#pragma once

/**
 * TaskStore.hpp
 *
 * Durable persistence of the task set, keyed by task id.
 *
 * Durability is best-effort: implementations throw PersistenceError and the
 * registry logs it without rolling back the in-memory mutation.
 */

#include "DownloadTask.hpp"
#include "../ThreadPool.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace surge::core::downloader {

/**
 * TaskStore - abstract persistence interface
 */
class TaskStore {
public:
    virtual ~TaskStore() = default;

    /**
     * Load every persisted task
     * @throws PersistenceError on read or parse failure
     */
    virtual std::vector<DownloadTask> loadAll() = 0;

    /**
     * Replace the persisted set with `tasks`
     */
    virtual void saveAll(const std::vector<DownloadTask>& tasks) = 0;

    virtual void save(const DownloadTask& task) = 0;
    virtual void remove(const std::string& taskId) = 0;

    /**
     * Apply a batch of upserts and removals. The default applies them one by one.
     */
    virtual void commit(const std::vector<DownloadTask>& upserts,
                        const std::vector<std::string>& removals);

    /**
     * Block until every accepted write has reached durable storage
     */
    virtual void flush() {}

    /**
     * Map a persisted snapshot onto its restart state: a live transfer cannot
     * survive the process, so downloading tasks come back paused (reason
     * Shutdown) with no speed.
     */
    static std::vector<DownloadTask> rehydrate(std::vector<DownloadTask> tasks);
};

/**
 * JsonFileTaskStore - the whole task set in one JSON document
 *
 * Layout:
 *   { "namespace": "surge.downloads", "version": 1, "tasks": { "<id>": {...} } }
 *
 * Every write rewrites the document through a temp file and a rename so a
 * crash never leaves a torn file behind.
 */
class JsonFileTaskStore : public TaskStore {
public:
    static constexpr const char* kNamespace = "surge.downloads";
    static constexpr int kVersion = 1;

    explicit JsonFileTaskStore(std::filesystem::path path);

    std::vector<DownloadTask> loadAll() override;
    void saveAll(const std::vector<DownloadTask>& tasks) override;
    void save(const DownloadTask& task) override;
    void remove(const std::string& taskId) override;
    void commit(const std::vector<DownloadTask>& upserts,
                const std::vector<std::string>& removals) override;

    const std::filesystem::path& path() const { return m_path; }

private:
    void ensureLoaded();
    json readDocument() const;
    void writeDocument(const json& tasks);

private:
    std::filesystem::path m_path;
    std::mutex m_mutex;
    json m_tasks = json::object();
    bool m_loaded{false};
};

/**
 * AsyncTaskStore - moves writes of another store off the caller's thread
 *
 * Pending writes are coalesced per task id (last write wins) and drained in
 * order by a single worker, so the inner store never sees writes reordered.
 */
class AsyncTaskStore : public TaskStore {
public:
    explicit AsyncTaskStore(std::shared_ptr<TaskStore> inner);
    ~AsyncTaskStore() override;

    AsyncTaskStore(const AsyncTaskStore&) = delete;
    AsyncTaskStore& operator=(const AsyncTaskStore&) = delete;

    std::vector<DownloadTask> loadAll() override;
    void saveAll(const std::vector<DownloadTask>& tasks) override;
    void save(const DownloadTask& task) override;
    void remove(const std::string& taskId) override;
    void flush() override;

private:
    void enqueue(const std::string& taskId, std::optional<DownloadTask> task);
    void drain(uint64_t generation);

private:
    std::shared_ptr<TaskStore> m_inner;
    std::mutex m_mutex;
    std::map<std::string, std::optional<DownloadTask>> m_pending; // nullopt = removal
    bool m_drainScheduled{false};
    uint64_t m_generation{0};
    ThreadPool m_worker{1};
};

} // namespace surge::core::downloader
