/**
 * DownloadSettings.cpp
 */

#include "DownloadSettings.hpp"
#include "../Config.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>

namespace surge::core::downloader {

DownloadSettings DownloadSettings::fromConfig(const Config& config) {
    DownloadSettings defaults;
    DownloadSettings settings;

    settings.maxConcurrentDownloads = config.get<uint32_t>("downloads.maxConcurrent", defaults.maxConcurrentDownloads);
    settings.autoResumeOnConnectivityRestore = config.get<bool>("downloads.autoResume", defaults.autoResumeOnConnectivityRestore);
    settings.resumeOnStartup = config.get<bool>("downloads.resumeOnStartup", defaults.resumeOnStartup);
    settings.retryAttempts = config.get<uint32_t>("downloads.retryAttempts", defaults.retryAttempts);
    settings.retryDelay = config.get<uint32_t>("downloads.retryDelay", defaults.retryDelay);
    settings.downloadLocation = config.get<std::string>("downloads.location", defaults.downloadLocation);
    settings.allowedFileTypes = config.get<std::vector<std::string>>("downloads.allowedFileTypes", defaults.allowedFileTypes);
    settings.maxFileSize = config.get<uint64_t>("downloads.maxFileSize", defaults.maxFileSize);
    settings.verifyChecksums = config.get<bool>("downloads.verifyChecksums", defaults.verifyChecksums);
    settings.connectTimeout = config.get<uint32_t>("downloads.connectTimeout", defaults.connectTimeout);
    settings.stallTimeout = config.get<uint32_t>("downloads.stallTimeout", defaults.stallTimeout);
    settings.progressInterval = config.get<uint32_t>("downloads.progressInterval", defaults.progressInterval);

    return settings;
}

bool DownloadSettings::isFileTypeAllowed(const std::string& filename) const {
    if (allowedFileTypes.empty()) {
        return true;
    }

    std::string extension = utils::StringUtils::fileExtension(filename);

    return std::any_of(allowedFileTypes.begin(), allowedFileTypes.end(),
        [&extension](const std::string& allowed) {
            if (allowed == "*") {
                return true;
            }
            std::string normalized = utils::StringUtils::toLower(allowed);
            if (!normalized.empty() && normalized.front() == '.') {
                normalized.erase(0, 1);
            }
            return !extension.empty() && normalized == extension;
        });
}

void applyPatch(DownloadSettings& settings, const DownloadSettingsPatch& patch) {
    if (patch.maxConcurrentDownloads) settings.maxConcurrentDownloads = *patch.maxConcurrentDownloads;
    if (patch.autoResumeOnConnectivityRestore) settings.autoResumeOnConnectivityRestore = *patch.autoResumeOnConnectivityRestore;
    if (patch.resumeOnStartup) settings.resumeOnStartup = *patch.resumeOnStartup;
    if (patch.retryAttempts) settings.retryAttempts = *patch.retryAttempts;
    if (patch.retryDelay) settings.retryDelay = *patch.retryDelay;
    if (patch.downloadLocation) settings.downloadLocation = *patch.downloadLocation;
    if (patch.allowedFileTypes) settings.allowedFileTypes = *patch.allowedFileTypes;
    if (patch.maxFileSize) settings.maxFileSize = *patch.maxFileSize;
    if (patch.verifyChecksums) settings.verifyChecksums = *patch.verifyChecksums;
    if (patch.connectTimeout) settings.connectTimeout = *patch.connectTimeout;
    if (patch.stallTimeout) settings.stallTimeout = *patch.stallTimeout;
    if (patch.progressInterval) settings.progressInterval = *patch.progressInterval;
}

void to_json(json& j, const DownloadSettings& settings) {
    j = json{
        {"maxConcurrent", settings.maxConcurrentDownloads},
        {"autoResume", settings.autoResumeOnConnectivityRestore},
        {"resumeOnStartup", settings.resumeOnStartup},
        {"retryAttempts", settings.retryAttempts},
        {"retryDelay", settings.retryDelay},
        {"location", settings.downloadLocation},
        {"allowedFileTypes", settings.allowedFileTypes},
        {"maxFileSize", settings.maxFileSize},
        {"verifyChecksums", settings.verifyChecksums},
        {"connectTimeout", settings.connectTimeout},
        {"stallTimeout", settings.stallTimeout},
        {"progressInterval", settings.progressInterval}
    };
}

void from_json(const json& j, DownloadSettings& settings) {
    DownloadSettings defaults;
    settings.maxConcurrentDownloads = j.value("maxConcurrent", defaults.maxConcurrentDownloads);
    settings.autoResumeOnConnectivityRestore = j.value("autoResume", defaults.autoResumeOnConnectivityRestore);
    settings.resumeOnStartup = j.value("resumeOnStartup", defaults.resumeOnStartup);
    settings.retryAttempts = j.value("retryAttempts", defaults.retryAttempts);
    settings.retryDelay = j.value("retryDelay", defaults.retryDelay);
    settings.downloadLocation = j.value("location", defaults.downloadLocation);
    settings.allowedFileTypes = j.value("allowedFileTypes", defaults.allowedFileTypes);
    settings.maxFileSize = j.value("maxFileSize", defaults.maxFileSize);
    settings.verifyChecksums = j.value("verifyChecksums", defaults.verifyChecksums);
    settings.connectTimeout = j.value("connectTimeout", defaults.connectTimeout);
    settings.stallTimeout = j.value("stallTimeout", defaults.stallTimeout);
    settings.progressInterval = j.value("progressInterval", defaults.progressInterval);
}

} // namespace surge::core::downloader
