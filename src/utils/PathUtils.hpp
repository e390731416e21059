#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace surge::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getAppDataPath() {
        if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
            return fs::path(xdg);
        }
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / ".local" / "share" : fs::current_path();
    }

    static fs::path getSurgePath() {
        return getAppDataPath() / "surge";
    }

    static fs::path getConfigPath() {
        return getSurgePath() / "config.json";
    }

    static fs::path getTaskStorePath() {
        return getSurgePath() / "tasks.json";
    }

    static fs::path getLogsPath() {
        return getSurgePath() / "logs";
    }

    static fs::path getDownloadsPath() {
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / "Downloads" : fs::current_path();
    }
};

} // namespace surge::utils
