/**
 * TaskStore.cpp
 *
 * JSON file persistence and the asynchronous write-behind decorator.
 */

#include "TaskStore.hpp"
#include "DownloadErrors.hpp"
#include "../Logger.hpp"

#include <fstream>

namespace surge::core::downloader {

namespace fs = std::filesystem;

void TaskStore::commit(const std::vector<DownloadTask>& upserts,
                       const std::vector<std::string>& removals) {
    for (const auto& task : upserts) {
        save(task);
    }
    for (const auto& id : removals) {
        remove(id);
    }
}

std::vector<DownloadTask> TaskStore::rehydrate(std::vector<DownloadTask> tasks) {
    for (auto& task : tasks) {
        if (task.status == DownloadStatus::Downloading) {
            task.status = DownloadStatus::Paused;
            task.pauseReason = PauseReason::Shutdown;
        }
        task.speedBytesPerSecond = 0.0;
        task.recomputeProgress();
    }
    return tasks;
}

// ============================================================================
// JsonFileTaskStore
// ============================================================================

JsonFileTaskStore::JsonFileTaskStore(fs::path path)
    : m_path(std::move(path)) {
}

std::vector<DownloadTask> JsonFileTaskStore::loadAll() {
    std::lock_guard<std::mutex> lock(m_mutex);

    json document = readDocument();
    m_tasks = document.value("tasks", json::object());
    m_loaded = true;

    std::vector<DownloadTask> tasks;
    tasks.reserve(m_tasks.size());

    for (auto it = m_tasks.begin(); it != m_tasks.end(); ++it) {
        try {
            tasks.push_back(it.value().get<DownloadTask>());
        } catch (const json::exception& e) {
            Logger::instance().warn("Skipping unreadable task record {}: {}", it.key(), e.what());
        }
    }

    Logger::instance().debug("Loaded {} task(s) from {}", tasks.size(), m_path.string());
    return tasks;
}

void JsonFileTaskStore::saveAll(const std::vector<DownloadTask>& tasks) {
    std::lock_guard<std::mutex> lock(m_mutex);

    json staged = json::object();
    for (const auto& task : tasks) {
        staged[task.id] = task;
    }
    writeDocument(staged);

    m_tasks = std::move(staged);
    m_loaded = true;
}

void JsonFileTaskStore::save(const DownloadTask& task) {
    commit({task}, {});
}

void JsonFileTaskStore::remove(const std::string& taskId) {
    commit({}, {taskId});
}

void JsonFileTaskStore::commit(const std::vector<DownloadTask>& upserts,
                               const std::vector<std::string>& removals) {
    std::lock_guard<std::mutex> lock(m_mutex);

    ensureLoaded();

    // The cached set only changes once the write has succeeded
    json staged = m_tasks;
    for (const auto& task : upserts) {
        staged[task.id] = task;
    }
    for (const auto& id : removals) {
        staged.erase(id);
    }
    writeDocument(staged);

    m_tasks = std::move(staged);
}

void JsonFileTaskStore::ensureLoaded() {
    if (m_loaded) {
        return;
    }
    m_tasks = readDocument().value("tasks", json::object());
    m_loaded = true;
}

json JsonFileTaskStore::readDocument() const {
    std::error_code ec;
    if (!fs::exists(m_path, ec)) {
        return json{{"namespace", kNamespace}, {"version", kVersion}, {"tasks", json::object()}};
    }

    std::ifstream file(m_path);
    if (!file.is_open()) {
        throw PersistenceError("Cannot open task store: " + m_path.string());
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw PersistenceError("Corrupt task store " + m_path.string() + ": " + e.what());
    }

    if (!document.is_object() || !document.contains("namespace") ||
        document["namespace"] != kNamespace) {
        throw PersistenceError("Unrecognized task store document: " + m_path.string());
    }

    int version = 0;
    if (document.contains("version") && document["version"].is_number_integer()) {
        version = document["version"].get<int>();
    }
    if (version > kVersion) {
        throw PersistenceError("Task store version " + std::to_string(version) + " is newer than supported");
    }

    return document;
}

void JsonFileTaskStore::writeDocument(const json& tasks) {
    json document = {
        {"namespace", kNamespace},
        {"version", kVersion},
        {"tasks", tasks}
    };

    std::string content;
    try {
        content = document.dump(2);
    } catch (const json::exception& e) {
        throw PersistenceError("Cannot serialize task store: " + std::string(e.what()));
    }

    std::error_code ec;
    if (m_path.has_parent_path()) {
        fs::create_directories(m_path.parent_path(), ec);
        if (ec) {
            throw PersistenceError("Cannot create " + m_path.parent_path().string() + ": " + ec.message());
        }
    }

    fs::path tempPath = m_path;
    tempPath += ".tmp";

    {
        std::ofstream file(tempPath, std::ios::trunc);
        if (!file.is_open()) {
            throw PersistenceError("Cannot write task store: " + tempPath.string());
        }
        file << content;
        file.flush();
        if (!file) {
            throw PersistenceError("Short write to task store: " + tempPath.string());
        }
    }

    fs::rename(tempPath, m_path, ec);
    if (ec) {
        fs::remove(tempPath, ec);
        throw PersistenceError("Cannot replace task store " + m_path.string());
    }
}

// ============================================================================
// AsyncTaskStore
// ============================================================================

AsyncTaskStore::AsyncTaskStore(std::shared_ptr<TaskStore> inner)
    : m_inner(std::move(inner)) {
}

AsyncTaskStore::~AsyncTaskStore() {
    flush();
}

std::vector<DownloadTask> AsyncTaskStore::loadAll() {
    flush();
    return m_inner->loadAll();
}

void AsyncTaskStore::saveAll(const std::vector<DownloadTask>& tasks) {
    std::lock_guard<std::mutex> lock(m_mutex);

    // Drains submitted before this point belong to the replaced snapshot
    m_pending.clear();
    ++m_generation;
    m_drainScheduled = false;

    m_worker.submit([this, tasks] {
        try {
            m_inner->saveAll(tasks);
        } catch (const PersistenceError& e) {
            Logger::instance().error("Task store write failed: {}", e.what());
        } catch (const std::exception& e) {
            Logger::instance().error("Unexpected task store failure: {}", e.what());
        }
    });
}

void AsyncTaskStore::save(const DownloadTask& task) {
    enqueue(task.id, task);
}

void AsyncTaskStore::remove(const std::string& taskId) {
    enqueue(taskId, std::nullopt);
}

void AsyncTaskStore::flush() {
    m_worker.waitAll();
    m_inner->flush();
}

void AsyncTaskStore::enqueue(const std::string& taskId, std::optional<DownloadTask> task) {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_pending[taskId] = std::move(task);
    if (m_drainScheduled) {
        return;
    }

    m_drainScheduled = true;
    m_worker.submit([this, generation = m_generation] { drain(generation); });
}

void AsyncTaskStore::drain(uint64_t generation) {
    std::map<std::string, std::optional<DownloadTask>> batch;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation != m_generation) {
            return;
        }
        batch.swap(m_pending);
        m_drainScheduled = false;
    }

    if (batch.empty()) {
        return;
    }

    std::vector<DownloadTask> upserts;
    std::vector<std::string> removals;
    for (auto& [id, task] : batch) {
        if (task) {
            upserts.push_back(std::move(*task));
        } else {
            removals.push_back(id);
        }
    }

    try {
        m_inner->commit(upserts, removals);
    } catch (const PersistenceError& e) {
        Logger::instance().error("Task store write failed ({} upsert(s), {} removal(s)): {}",
                                 upserts.size(), removals.size(), e.what());
    } catch (const std::exception& e) {
        Logger::instance().error("Unexpected task store failure: {}", e.what());
    }
}

} // namespace surge::core::downloader
