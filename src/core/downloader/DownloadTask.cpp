/**
 * DownloadTask.cpp
 *
 * Task record helpers and JSON mapping.
 */

#include "DownloadTask.hpp"

#include <algorithm>

namespace surge::core::downloader {

const char* toString(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::Pending:     return "pending";
        case DownloadStatus::Downloading: return "downloading";
        case DownloadStatus::Paused:      return "paused";
        case DownloadStatus::Completed:   return "completed";
        case DownloadStatus::Error:       return "error";
        case DownloadStatus::Canceled:    return "canceled";
    }
    return "unknown";
}

const char* toString(DownloadPriority priority) {
    switch (priority) {
        case DownloadPriority::High:   return "high";
        case DownloadPriority::Normal: return "normal";
        case DownloadPriority::Low:    return "low";
    }
    return "unknown";
}

const char* toString(PauseReason reason) {
    switch (reason) {
        case PauseReason::None:         return "none";
        case PauseReason::User:         return "user";
        case PauseReason::Connectivity: return "connectivity";
        case PauseReason::Shutdown:     return "shutdown";
    }
    return "unknown";
}

std::optional<DownloadPriority> priorityFromString(const std::string& name) {
    if (name == "high") return DownloadPriority::High;
    if (name == "normal") return DownloadPriority::Normal;
    if (name == "low") return DownloadPriority::Low;
    return std::nullopt;
}

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void DownloadTask::recomputeProgress() {
    if (status == DownloadStatus::Completed) {
        progressFraction = 1.0;
    } else if (sizeBytes > 0) {
        progressFraction = std::min(1.0,
            static_cast<double>(downloadedBytes) / static_cast<double>(sizeBytes));
    } else {
        progressFraction = 0.0;
    }
}

void to_json(json& j, const DownloadTask& task) {
    j = json{
        {"id", task.id},
        {"sequence", task.sequence},
        {"url", task.url},
        {"filename", task.filename},
        {"destinationPath", task.destinationPath},
        {"priority", task.priority},
        {"metadata", task.metadata},
        {"expectedChecksum", task.expectedChecksum},
        {"status", task.status},
        {"pauseReason", task.pauseReason},
        {"sizeBytes", task.sizeBytes},
        {"downloadedBytes", task.downloadedBytes},
        {"progress", task.progressFraction},
        {"speed", task.speedBytesPerSecond},
        {"error", task.error ? json(*task.error) : json(nullptr)},
        {"retryCount", task.retryCount},
        {"lastRetryTime", task.lastRetryTime},
        {"createdAt", task.createdAt},
        {"startedAt", task.startedAt},
        {"updatedAt", task.updatedAt}
    };
}

void from_json(const json& j, DownloadTask& task) {
    j.at("id").get_to(task.id);
    j.at("url").get_to(task.url);
    j.at("filename").get_to(task.filename);
    j.at("destinationPath").get_to(task.destinationPath);
    j.at("status").get_to(task.status);

    task.sequence = j.value("sequence", uint64_t{0});
    task.priority = j.value("priority", DownloadPriority::Normal);
    task.metadata = j.value("metadata", json::object());
    task.expectedChecksum = j.value("expectedChecksum", std::string{});
    task.pauseReason = j.value("pauseReason", PauseReason::None);
    task.sizeBytes = j.value("sizeBytes", uint64_t{0});
    task.downloadedBytes = j.value("downloadedBytes", uint64_t{0});
    task.progressFraction = j.value("progress", 0.0);
    task.speedBytesPerSecond = j.value("speed", 0.0);
    task.retryCount = j.value("retryCount", uint32_t{0});
    task.lastRetryTime = j.value("lastRetryTime", int64_t{0});
    task.createdAt = j.value("createdAt", int64_t{0});
    task.startedAt = j.value("startedAt", int64_t{0});
    task.updatedAt = j.value("updatedAt", int64_t{0});

    auto error = j.find("error");
    if (error != j.end() && error->is_string()) {
        task.error = error->get<std::string>();
    } else {
        task.error.reset();
    }
}

} // namespace surge::core::downloader
