#pragma once

/**
 * DownloadSettings.hpp
 *
 * Live-reloadable orchestrator configuration.
 */

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace surge::core {
class Config;
}

namespace surge::core::downloader {

using json = nlohmann::json;

/**
 * DownloadSettings - plain value snapshot of the downloads.* configuration
 *
 * Readers take a copy per decision; changes never reach transfers that are
 * already running.
 */
struct DownloadSettings {
    uint32_t maxConcurrentDownloads{3};
    bool autoResumeOnConnectivityRestore{true};
    bool resumeOnStartup{false};
    uint32_t retryAttempts{3};
    uint32_t retryDelay{1000};              // ms
    std::string downloadLocation;           // empty = ~/Downloads
    std::vector<std::string> allowedFileTypes{"*"};
    uint64_t maxFileSize{1024ULL * 1024 * 1024}; // 0 = unlimited
    bool verifyChecksums{true};
    uint32_t connectTimeout{10000};         // ms
    uint32_t stallTimeout{30000};           // ms
    uint32_t progressInterval{200};         // ms between progress updates

    /**
     * Build from the downloads.* keys of a Config
     */
    static DownloadSettings fromConfig(const Config& config);

    /**
     * Check a filename against allowedFileTypes
     * "*" allows anything; otherwise the lower-cased extension (without
     * the dot) must be listed.
     */
    bool isFileTypeAllowed(const std::string& filename) const;

    bool exceedsMaxSize(uint64_t bytes) const {
        return maxFileSize > 0 && bytes > maxFileSize;
    }
};

/**
 * Partial settings update. Unset fields keep their current value.
 */
struct DownloadSettingsPatch {
    std::optional<uint32_t> maxConcurrentDownloads;
    std::optional<bool> autoResumeOnConnectivityRestore;
    std::optional<bool> resumeOnStartup;
    std::optional<uint32_t> retryAttempts;
    std::optional<uint32_t> retryDelay;
    std::optional<std::string> downloadLocation;
    std::optional<std::vector<std::string>> allowedFileTypes;
    std::optional<uint64_t> maxFileSize;
    std::optional<bool> verifyChecksums;
    std::optional<uint32_t> connectTimeout;
    std::optional<uint32_t> stallTimeout;
    std::optional<uint32_t> progressInterval;
};

void applyPatch(DownloadSettings& settings, const DownloadSettingsPatch& patch);

void to_json(json& j, const DownloadSettings& settings);
void from_json(const json& j, DownloadSettings& settings);

} // namespace surge::core::downloader
