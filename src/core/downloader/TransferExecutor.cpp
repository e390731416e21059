/**
 * TransferExecutor.cpp
 *
 * Transfer state machine:
 *   pending -> downloading -> {completed, error, paused, canceled}
 */

#include "TransferExecutor.hpp"
#include "DownloadErrors.hpp"
#include "../Logger.hpp"
#include "../../utils/HashUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace surge::core::downloader {

namespace fs = std::filesystem;

namespace {

void discardFile(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        Logger::instance().warn("Could not remove partial file {}: {}", path, ec.message());
    }
}

} // namespace

const char* toString(TransferEnd end) {
    switch (end) {
        case TransferEnd::Completed: return "completed";
        case TransferEnd::Failed:    return "failed";
        case TransferEnd::Paused:    return "paused";
        case TransferEnd::Canceled:  return "canceled";
    }
    return "unknown";
}

// ============================================================================
// FileSink - writes received bytes to the destination file
// ============================================================================

class TransferExecutor::FileSink : public TransferSink {
public:
    FileSink(TaskRegistry& registry, HandlePtr handle, const DownloadTask& task)
        : m_registry(registry)
        , m_handle(std::move(handle))
        , m_path(task.destinationPath)
        , m_offset(task.downloadedBytes)
        , m_bytes(task.downloadedBytes)
        , m_total(task.sizeBytes) {

        open(m_offset > 0);

        m_lastReportAt = std::chrono::steady_clock::now();
        m_lastSampleAt = m_lastReportAt;
        m_lastSampleBytes = m_bytes;
    }

    bool onResponse(uint64_t totalSize, bool resumed) override {
        if (m_offset > 0 && !resumed) {
            Logger::instance().info("Server ignored range request for {}, restarting from zero", m_handle->taskId);
            m_file.close();
            open(false);
            m_bytes = 0;
            m_lastSampleBytes = 0;
        }

        if (totalSize > 0) {
            if (m_bytes > 0 && m_total > 0 && totalSize != m_total) {
                return fail("Remote size changed from " + std::to_string(m_total) +
                            " to " + std::to_string(totalSize) + " bytes");
            }
            if (m_handle->settings.exceedsMaxSize(totalSize)) {
                return fail("File size " + utils::StringUtils::formatBytes(totalSize) +
                            " exceeds the limit of " +
                            utils::StringUtils::formatBytes(m_handle->settings.maxFileSize));
            }
            m_total = totalSize;
        }

        if (m_total > 0 && m_bytes > m_total) {
            return fail("Resume offset is past the end of the resource");
        }

        report(true);
        return true;
    }

    bool onData(const char* data, size_t length) override {
        if (isStopRequested()) {
            return false;
        }

        uint64_t next = m_bytes + length;

        if (m_total > 0 && next > m_total) {
            return fail("Received more data than the announced " + std::to_string(m_total) + " bytes");
        }
        if (m_handle->settings.exceedsMaxSize(next)) {
            return fail("Download exceeds the limit of " +
                        utils::StringUtils::formatBytes(m_handle->settings.maxFileSize));
        }

        m_file.write(data, static_cast<std::streamsize>(length));
        if (!m_file) {
            return fail("Write to " + m_path + " failed");
        }

        m_bytes = next;
        report(false);
        return true;
    }

    bool isStopRequested() const override {
        return m_handle->stop.load() != StopRequest::None;
    }

    void close() {
        if (!m_file.is_open()) {
            return;
        }
        m_file.flush();
        bool ok = static_cast<bool>(m_file);
        m_file.close();
        if (!ok && !m_failed) {
            fail("Flushing " + m_path + " failed");
        }
    }

    uint64_t offset() const { return m_bytes; }
    uint64_t bytes() const { return m_bytes; }
    uint64_t total() const { return m_total; }
    bool failed() const { return m_failed; }
    const std::string& error() const { return m_error; }

private:
    void open(bool append) {
        auto mode = std::ios::binary | std::ios::out | (append ? std::ios::app : std::ios::trunc);
        m_file.open(m_path, mode);
        if (!m_file.is_open()) {
            throw TransferError("Cannot open " + m_path + " for writing");
        }
    }

    bool fail(std::string message) {
        if (!m_failed) {
            m_failed = true;
            m_error = std::move(message);
        }
        return false;
    }

    void report(bool force) {
        auto now = std::chrono::steady_clock::now();
        auto sinceReport = std::chrono::duration_cast<std::chrono::milliseconds>(now - m_lastReportAt).count();
        if (!force && sinceReport < static_cast<long long>(m_handle->settings.progressInterval)) {
            return;
        }

        double elapsed = std::chrono::duration<double>(now - m_lastSampleAt).count();
        double speed = 0.0;
        if (elapsed > 0.0 && m_bytes >= m_lastSampleBytes) {
            speed = static_cast<double>(m_bytes - m_lastSampleBytes) / elapsed;
        }

        m_lastReportAt = now;
        m_lastSampleAt = now;
        m_lastSampleBytes = m_bytes;

        uint64_t bytes = m_bytes;
        uint64_t total = m_total;
        m_registry.mutate(m_handle->taskId, [bytes, total, speed, force](DownloadTask& task) {
            if (task.status != DownloadStatus::Downloading) {
                return false;
            }
            task.downloadedBytes = bytes;
            if (total > 0) {
                task.sizeBytes = total;
            }
            if (!force) {
                task.speedBytesPerSecond = speed;
            }
            return true;
        });
    }

private:
    TaskRegistry& m_registry;
    HandlePtr m_handle;
    std::string m_path;
    std::ofstream m_file;

    uint64_t m_offset;
    uint64_t m_bytes;
    uint64_t m_total;

    bool m_failed{false};
    std::string m_error;

    std::chrono::steady_clock::time_point m_lastReportAt;
    std::chrono::steady_clock::time_point m_lastSampleAt;
    uint64_t m_lastSampleBytes{0};
};

// ============================================================================
// TransferExecutor
// ============================================================================

TransferExecutor::TransferExecutor(TaskRegistry& registry,
                                   std::shared_ptr<Transport> transport,
                                   SettingsProvider settings)
    : m_registry(registry)
    , m_transport(std::move(transport))
    , m_settings(std::move(settings)) {

    if (!m_transport) {
        throw std::invalid_argument("TransferExecutor requires a transport");
    }
}

TransferExecutor::~TransferExecutor() {
    shutdown();
}

void TransferExecutor::setFinishedCallback(FinishedCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_onFinished = std::move(callback);
}

bool TransferExecutor::start(const std::string& taskId) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (m_shuttingDown) {
        Logger::instance().debug("Not starting {}: executor is shutting down", taskId);
        return false;
    }
    if (m_handles.count(taskId) > 0) {
        Logger::instance().debug("Not starting {}: transfer already running", taskId);
        return false;
    }

    auto handle = std::make_shared<Handle>();
    handle->taskId = taskId;
    handle->settings = m_settings ? m_settings() : DownloadSettings{};
    handle->finished = handle->done.get_future().share();

    // The handle joins the active set before the record enters downloading
    m_handles.emplace(taskId, handle);

    bool admitted = m_registry.mutate(taskId, [](DownloadTask& task) {
        if (task.status != DownloadStatus::Pending) {
            return false;
        }
        task.downloadedBytes = reconcileCursor(task);
        task.status = DownloadStatus::Downloading;
        task.pauseReason = PauseReason::None;
        task.error.reset();
        task.speedBytesPerSecond = 0.0;
        task.startedAt = nowMillis();
        return true;
    });

    if (!admitted) {
        m_handles.erase(taskId);
        Logger::instance().debug("Not starting {}: task is missing or not pending", taskId);
        return false;
    }

    m_pool.grow(m_handles.size() + 1);

    try {
        m_pool.submit([this, handle] { run(handle); });
    } catch (const std::runtime_error& e) {
        Logger::instance().error("Cannot schedule transfer {}: {}", taskId, e.what());
        finish(handle, RunResult{TransferEnd::Failed, e.what(), 0, 0});
        return false;
    }

    Logger::instance().info("Started download {}", taskId);
    return true;
}

uint64_t TransferExecutor::reconcileCursor(const DownloadTask& task) {
    uint64_t cursor = task.downloadedBytes;
    if (cursor == 0) {
        return 0;
    }

    std::error_code ec;
    uint64_t onDisk = fs::file_size(task.destinationPath, ec);
    if (ec) {
        Logger::instance().warn("Partial file {} is gone, restarting {} from zero", task.destinationPath, task.id);
        return 0;
    }

    if (onDisk < cursor) {
        Logger::instance().warn("Partial file {} holds {} of {} bytes, resuming from its end",
                                task.destinationPath, onDisk, cursor);
        return onDisk;
    }

    if (onDisk > cursor) {
        fs::resize_file(task.destinationPath, cursor, ec);
        if (ec) {
            Logger::instance().warn("Cannot truncate {}: {}, restarting from zero", task.destinationPath, ec.message());
            return 0;
        }
    }

    return cursor;
}

bool TransferExecutor::pause(const std::string& taskId, PauseReason reason) {
    auto finished = requestStop(taskId, StopRequest::Pause, reason);
    if (!finished.valid()) {
        return false;
    }

    finished.wait();

    auto task = m_registry.get(taskId);
    return task && task->status == DownloadStatus::Paused;
}

bool TransferExecutor::abort(const std::string& taskId) {
    auto finished = requestStop(taskId, StopRequest::Cancel, PauseReason::None);
    if (!finished.valid()) {
        return false;
    }

    finished.wait();
    return !m_registry.get(taskId).has_value();
}

std::shared_future<void> TransferExecutor::requestStop(const std::string& taskId,
                                                       StopRequest request,
                                                       PauseReason reason) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    auto it = m_handles.find(taskId);
    if (it == m_handles.end()) {
        return {};
    }

    auto& handle = it->second;
    if (request == StopRequest::Cancel) {
        handle->stop.store(StopRequest::Cancel);
    } else if (handle->stop.load() == StopRequest::None) {
        handle->pauseReason = reason;
        handle->stop.store(StopRequest::Pause);
    }

    return handle->finished;
}

bool TransferExecutor::isActive(const std::string& taskId) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_handles.count(taskId) > 0;
}

size_t TransferExecutor::activeCount() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_handles.size();
}

std::vector<std::string> TransferExecutor::activeIds() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    std::vector<std::string> ids;
    ids.reserve(m_handles.size());
    for (const auto& [id, handle] : m_handles) {
        ids.push_back(id);
    }
    return ids;
}

void TransferExecutor::shutdown() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        if (m_shuttingDown && m_handles.empty()) {
            return;
        }
        m_shuttingDown = true;
        for (const auto& [id, handle] : m_handles) {
            ids.push_back(id);
        }
    }

    if (!ids.empty()) {
        Logger::instance().info("Pausing {} running transfer(s) for shutdown", ids.size());
    }

    for (const auto& id : ids) {
        pause(id, PauseReason::Shutdown);
    }

    m_pool.waitAll();
}

void TransferExecutor::run(const HandlePtr& handle) {
    RunResult result;

    auto task = m_registry.get(handle->taskId);
    if (!task) {
        result.error = "Task record disappeared";
        finish(handle, std::move(result));
        return;
    }

    result.bytes = task->downloadedBytes;

    try {
        result = transfer(handle, *task);
    } catch (const TransferError& e) {
        result.end = TransferEnd::Failed;
        result.error = e.what();
    } catch (const fs::filesystem_error& e) {
        result.end = TransferEnd::Failed;
        result.error = e.what();
    } catch (const std::exception& e) {
        result.end = TransferEnd::Failed;
        result.error = std::string("Unexpected error: ") + e.what();
    }

    finish(handle, std::move(result));
}

TransferExecutor::RunResult TransferExecutor::transfer(const HandlePtr& handle, const DownloadTask& task) {
    const DownloadSettings& settings = handle->settings;

    fs::path destination(task.destinationPath);
    if (destination.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(destination.parent_path(), ec);
        if (ec) {
            throw TransferError("Cannot create " + destination.parent_path().string() + ": " + ec.message());
        }
    }

    if (task.sizeBytes > 0 && settings.exceedsMaxSize(task.sizeBytes)) {
        throw TransferError("File size " + utils::StringUtils::formatBytes(task.sizeBytes) +
                            " exceeds the limit of " + utils::StringUtils::formatBytes(settings.maxFileSize));
    }

    FileSink sink(m_registry, handle, task);

    TransferRequest request;
    request.url = task.url;
    request.offset = sink.offset();
    request.connectTimeout = settings.connectTimeout;
    request.stallTimeout = settings.stallTimeout;

    Logger::instance().debug("Fetching {} from offset {}", task.url, request.offset);

    TransferOutcome outcome = m_transport->fetch(request, sink);
    sink.close();

    RunResult result;
    result.bytes = sink.bytes();
    result.total = sink.total();

    StopRequest stop = handle->stop.load();

    if (stop == StopRequest::Cancel) {
        result.end = TransferEnd::Canceled;
    } else if (sink.failed()) {
        result.end = TransferEnd::Failed;
        result.error = sink.error();
    } else if (outcome.result == TransferResult::Completed) {
        if (result.total > 0 && result.bytes != result.total) {
            result.end = TransferEnd::Failed;
            result.error = "Incomplete transfer: received " + std::to_string(result.bytes) +
                           " of " + std::to_string(result.total) + " bytes";
        } else {
            result.end = TransferEnd::Completed;
        }
    } else if (stop == StopRequest::Pause) {
        result.end = TransferEnd::Paused;
    } else if (outcome.result == TransferResult::Failed) {
        result.end = TransferEnd::Failed;
        result.error = outcome.error.empty() ? "Transfer failed" : outcome.error;
    } else {
        result.end = TransferEnd::Failed;
        result.error = "Transfer aborted";
    }

    return result;
}

void TransferExecutor::finish(const HandlePtr& handle, RunResult result) {
    const std::string& taskId = handle->taskId;
    auto task = m_registry.get(taskId);
    std::string destination = task ? task->destinationPath : std::string{};

    if (result.end == TransferEnd::Completed && task &&
        handle->settings.verifyChecksums && !task->expectedChecksum.empty()) {
        if (!utils::HashUtils::verifySha256(destination, task->expectedChecksum)) {
            discardFile(destination);
            result.end = TransferEnd::Failed;
            result.error = "Checksum mismatch";
            result.bytes = 0;
        }
    }

    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);

        if (handle->stop.load() == StopRequest::Cancel) {
            result.end = TransferEnd::Canceled;
        }

        uint64_t bytes = result.bytes;
        uint64_t total = result.total;

        switch (result.end) {
            case TransferEnd::Completed:
                m_registry.mutate(taskId, [bytes, total](DownloadTask& t) {
                    if (t.status != DownloadStatus::Downloading) return false;
                    t.status = DownloadStatus::Completed;
                    t.downloadedBytes = bytes;
                    t.sizeBytes = total > 0 ? total : bytes;
                    t.speedBytesPerSecond = 0.0;
                    t.error.reset();
                    return true;
                });
                break;

            case TransferEnd::Failed: {
                std::string message = result.error;
                bool discarded = (bytes == 0);
                m_registry.mutate(taskId, [&message, discarded](DownloadTask& t) {
                    if (t.status != DownloadStatus::Downloading) return false;
                    t.status = DownloadStatus::Error;
                    t.error = message;
                    t.speedBytesPerSecond = 0.0;
                    if (discarded) {
                        t.downloadedBytes = 0;
                    }
                    return true;
                });
                break;
            }

            case TransferEnd::Paused: {
                PauseReason reason = handle->pauseReason;
                m_registry.mutate(taskId, [bytes, reason](DownloadTask& t) {
                    if (t.status != DownloadStatus::Downloading) return false;
                    t.status = DownloadStatus::Paused;
                    t.pauseReason = reason;
                    t.downloadedBytes = bytes;
                    t.speedBytesPerSecond = 0.0;
                    return true;
                });
                break;
            }

            case TransferEnd::Canceled:
                if (!destination.empty()) {
                    discardFile(destination);
                }
                m_registry.remove(taskId);
                break;
        }

        m_handles.erase(taskId);
    }

    handle->done.set_value();

    switch (result.end) {
        case TransferEnd::Completed:
            Logger::instance().info("Completed download {} ({})", taskId, utils::StringUtils::formatBytes(result.bytes));
            break;
        case TransferEnd::Failed:
            Logger::instance().error("Download {} failed: {}", taskId, result.error);
            break;
        case TransferEnd::Paused:
            Logger::instance().info("Paused download {} at {} bytes ({})", taskId, result.bytes,
                                    toString(handle->pauseReason));
            break;
        case TransferEnd::Canceled:
            Logger::instance().info("Canceled download {}", taskId);
            break;
    }

    FinishedCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        callback = m_onFinished;
    }

    if (callback) {
        try {
            callback(taskId, result.end);
        } catch (const std::exception& e) {
            Logger::instance().error("Transfer finish handler for {} threw: {}", taskId, e.what());
        }
    }
}

} // namespace surge::core::downloader
