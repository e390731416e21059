#pragma once

/**
 * DownloadTask.hpp
 *
 * The unit of work tracked by the orchestrator, plus the request options
 * accepted at submission.
 */

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace surge::core::downloader {

using json = nlohmann::json;

/**
 * Download task status
 */
enum class DownloadStatus {
    Pending,
    Downloading,
    Paused,
    Completed,
    Error,
    Canceled
};

/**
 * Admission priority. Declaration order is admission order.
 */
enum class DownloadPriority {
    High,
    Normal,
    Low
};

/**
 * Why a task sits in Paused
 */
enum class PauseReason {
    None,
    User,
    Connectivity,
    Shutdown
};

NLOHMANN_JSON_SERIALIZE_ENUM(DownloadStatus, {
    {DownloadStatus::Pending, "pending"},
    {DownloadStatus::Downloading, "downloading"},
    {DownloadStatus::Paused, "paused"},
    {DownloadStatus::Completed, "completed"},
    {DownloadStatus::Error, "error"},
    {DownloadStatus::Canceled, "canceled"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(DownloadPriority, {
    {DownloadPriority::High, "high"},
    {DownloadPriority::Normal, "normal"},
    {DownloadPriority::Low, "low"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(PauseReason, {
    {PauseReason::None, "none"},
    {PauseReason::User, "user"},
    {PauseReason::Connectivity, "connectivity"},
    {PauseReason::Shutdown, "shutdown"},
})

const char* toString(DownloadStatus status);
const char* toString(DownloadPriority priority);
const char* toString(PauseReason reason);

/**
 * Parse a priority name ("high", "normal", "low")
 * @return std::nullopt for unknown names
 */
std::optional<DownloadPriority> priorityFromString(const std::string& name);

/**
 * Milliseconds since the Unix epoch
 */
int64_t nowMillis();

/**
 * Per-request options accepted by submit()
 */
struct DownloadOptions {
    DownloadPriority priority{DownloadPriority::Normal};

    // Opaque key/value bag carried on the task
    json metadata = json::object();

    // Destination directory (empty = settings download location)
    std::string directory;

    // Expected SHA-256 (hex), verified on completion when non-empty
    std::string expectedChecksum;

    // Expected size in bytes (0 = unknown)
    uint64_t expectedSize{0};
};

/**
 * DownloadTask - one requested file download and its tracked state
 *
 * Records are values. The registry owns the authoritative copy; everything
 * else works on snapshots. The live transfer handle is owned by the transfer
 * executor and is never part of the record.
 */
struct DownloadTask {
    // Identity
    std::string id;
    uint64_t sequence{0};  // submission order, tie-break inside a createdAt

    // Request data
    std::string url;
    std::string filename;
    std::string destinationPath;
    DownloadPriority priority{DownloadPriority::Normal};
    json metadata = json::object();
    std::string expectedChecksum;

    // Execution state
    DownloadStatus status{DownloadStatus::Pending};
    PauseReason pauseReason{PauseReason::None};

    // Progress (sizeBytes == 0 means unknown)
    uint64_t sizeBytes{0};
    uint64_t downloadedBytes{0};
    double progressFraction{0.0};
    double speedBytesPerSecond{0.0};

    // Failure data
    std::optional<std::string> error;
    uint32_t retryCount{0};
    int64_t lastRetryTime{0};

    // Timestamps (ms since epoch)
    int64_t createdAt{0};
    int64_t startedAt{0};
    int64_t updatedAt{0};

    bool isTerminal() const {
        return status == DownloadStatus::Completed || status == DownloadStatus::Canceled;
    }

    bool isActive() const {
        return status == DownloadStatus::Downloading;
    }

    /**
     * Recompute progressFraction from the byte counters
     */
    void recomputeProgress();
};

void to_json(json& j, const DownloadTask& task);
void from_json(const json& j, DownloadTask& task);

} // namespace surge::core::downloader
