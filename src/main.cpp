/**
 * surged - Surge download daemon
 *
 * Main entry point. Loads configuration, restores the persisted task set,
 * queues the downloads given on the command line and renders progress until
 * every task has settled.
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "core/downloader/DownloadManager.hpp"
#include "core/downloader/HttpTransport.hpp"
#include "utils/PathUtils.hpp"
#include "utils/StringUtils.hpp"

namespace fs = std::filesystem;

using namespace surge::core;
using namespace surge::core::downloader;
using surge::utils::PathUtils;
using surge::utils::StringUtils;

namespace {

std::atomic<bool> g_stopRequested{false};

/**
 * Signal handler for graceful shutdown
 */
void signalHandler(int) {
    g_stopRequested.store(true);
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

struct CommandLine {
    std::string configPath;
    std::string directory;
    int maxConcurrent{0};
    bool noAutoResume{false};
    bool resumeOnStartup{false};
    bool debug{false};
    std::vector<std::pair<std::string, std::string>> downloads;
};

void printUsage(const char* program) {
    std::cout << "surged - download daemon\n"
              << "\nUsage: " << program << " [options] [URL FILE ...]\n"
              << "\nOptions:\n"
              << "  -c, --config PATH    Configuration file\n"
              << "  -d, --dir DIR        Download directory\n"
              << "  -j, --jobs N         Maximum concurrent downloads\n"
              << "      --no-auto-resume Do not resume after connectivity returns\n"
              << "      --resume         Resume downloads interrupted by the last shutdown\n"
              << "      --debug          Debug logging\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << std::endl;
}

/**
 * @return exit code to stop with, or -1 to continue
 */
int parseCommandLine(int argc, char* argv[], CommandLine& cli) {
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        auto value = [&](const char* name) -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << std::endl;
                return {};
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << "surged v1.0.0" << std::endl;
            return 0;
        } else if (arg == "-c" || arg == "--config") {
            cli.configPath = value("--config");
            if (cli.configPath.empty()) return 2;
        } else if (arg == "-d" || arg == "--dir") {
            cli.directory = value("--dir");
            if (cli.directory.empty()) return 2;
        } else if (arg == "-j" || arg == "--jobs") {
            std::string jobs = value("--jobs");
            try {
                cli.maxConcurrent = std::stoi(jobs);
            } catch (const std::exception&) {
                cli.maxConcurrent = 0;
            }
            if (cli.maxConcurrent <= 0) {
                std::cerr << "--jobs expects a positive number" << std::endl;
                return 2;
            }
        } else if (arg == "--no-auto-resume") {
            cli.noAutoResume = true;
        } else if (arg == "--resume") {
            cli.resumeOnStartup = true;
        } else if (arg == "--debug") {
            cli.debug = true;
        } else if (StringUtils::startsWith(arg, "-") && arg.size() > 1) {
            std::cerr << "Unknown option: " << arg << std::endl;
            return 2;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() % 2 != 0) {
        std::cerr << "Expected URL FILE pairs" << std::endl;
        return 2;
    }
    for (size_t i = 0; i < positional.size(); i += 2) {
        cli.downloads.emplace_back(positional[i], positional[i + 1]);
    }
    return -1;
}

/**
 * Load configuration, creating a default file on first run
 */
bool loadConfiguration(const CommandLine& cli) {
    auto& config = Config::instance();

    try {
        fs::path configPath = cli.configPath.empty() ? PathUtils::getConfigPath() : fs::path(cli.configPath);

        if (fs::exists(configPath)) {
            if (!config.load(configPath.string())) {
                std::cerr << "Cannot parse configuration " << configPath.string() << std::endl;
                return false;
            }
        } else if (cli.configPath.empty()) {
            config.setDefaults();
            if (!config.save(configPath.string())) {
                std::cerr << "Cannot write default configuration to " << configPath.string() << std::endl;
            }
        } else {
            std::cerr << "Configuration not found: " << configPath.string() << std::endl;
            return false;
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return false;
    }

    if (!cli.directory.empty()) {
        config.set("downloads.location", fs::absolute(cli.directory).string());
    }
    if (cli.maxConcurrent > 0) {
        config.set("downloads.maxConcurrent", cli.maxConcurrent);
    }
    if (cli.noAutoResume) {
        config.set("downloads.autoResume", false);
    }
    if (cli.resumeOnStartup) {
        config.set("downloads.resumeOnStartup", true);
    }
    return true;
}

bool isSettled(const DownloadTask& task, const DownloadSettings& settings) {
    switch (task.status) {
        case DownloadStatus::Pending:
        case DownloadStatus::Downloading:
            return false;
        case DownloadStatus::Error:
            // Waiting for an automatic retry
            return task.retryCount + 1 >= settings.retryAttempts;
        case DownloadStatus::Paused:
            return !(task.pauseReason == PauseReason::Connectivity &&
                     settings.autoResumeOnConnectivityRestore);
        default:
            return true;
    }
}

void renderPanel(const DownloadManager& manager) {
    auto stats = manager.stats();

    std::cout << fmt::format("-- {} downloading, {} pending, {} done, {} failed, {} --",
                             stats.downloading, stats.pending, stats.completed, stats.error,
                             StringUtils::formatSpeed(stats.totalSpeed))
              << '\n';

    for (const auto& task : manager.list()) {
        std::string size = task.sizeBytes > 0 ? StringUtils::formatBytes(task.sizeBytes) : "?";
        std::cout << fmt::format("  {:<11} {:>7} {:>10} / {:<10} {:>12}  {}",
                                 toString(task.status),
                                 StringUtils::formatPercentage(task.progressFraction),
                                 StringUtils::formatBytes(task.downloadedBytes),
                                 size,
                                 task.isActive() ? StringUtils::formatSpeed(task.speedBytesPerSecond) : "",
                                 StringUtils::truncate(task.filename, 40));
        if (task.error) {
            std::cout << "  (" << *task.error << ")";
        }
        std::cout << '\n';
    }
    std::cout << std::flush;
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    CommandLine cli;
    int parsed = parseCommandLine(argc, argv, cli);
    if (parsed >= 0) {
        return parsed;
    }

    if (!loadConfiguration(cli)) {
        return 1;
    }

    auto& config = Config::instance();

    // Initialize logger
    LogLevel level = cli.debug
        ? LogLevel::Debug
        : Logger::levelFromString(config.get<std::string>("logging.level", "info"));
    std::string logDir = config.get<std::string>("logging.directory", "");
    Logger::instance().initialize(level, logDir.empty() ? PathUtils::getLogsPath().string() : logDir, false);

    auto& logger = Logger::instance();
    logger.info("surged v1.0.0 starting...");

    setupSignalHandlers();

    int exitCode = 0;

    try {
        DownloadSettings settings = DownloadSettings::fromConfig(config);

        std::string storePath = config.get<std::string>("storage.path", "");
        auto store = std::make_shared<AsyncTaskStore>(std::make_shared<JsonFileTaskStore>(
            storePath.empty() ? PathUtils::getTaskStorePath() : fs::path(storePath)));

        auto probe = std::make_shared<InterfaceConnectivityProbe>();
        auto monitor = std::make_shared<NetworkMonitor>(probe, probe->isConnected());

        DownloadManager manager(settings, store, std::make_shared<HttpTransport>(), monitor);
        manager.initialize();

        monitor->start(std::chrono::milliseconds(config.get<int>("network.pollInterval", 2000)));

        for (const auto& [url, filename] : cli.downloads) {
            try {
                std::string id = manager.submit(url, filename);
                std::cout << "queued " << filename << " (" << id << ")" << std::endl;
            } catch (const ValidationError& e) {
                std::cerr << "rejected " << url << ": " << e.what() << std::endl;
                logger.error("Rejected {}: {}", url, e.what());
                exitCode = 2;
            }
        }

        auto lastRender = std::chrono::steady_clock::now() - std::chrono::seconds(1);

        while (!g_stopRequested.load()) {
            DownloadSettings current = manager.settings();
            auto tasks = manager.list();

            bool settled = std::all_of(tasks.begin(), tasks.end(), [&current](const DownloadTask& task) {
                return isSettled(task, current);
            });

            auto now = std::chrono::steady_clock::now();
            if (settled || now - lastRender >= std::chrono::seconds(1)) {
                renderPanel(manager);
                lastRender = now;
            }

            if (settled) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        if (g_stopRequested.load()) {
            logger.info("Stop requested, shutting down gracefully...");
            std::cout << "stopping, unfinished downloads are kept for the next run" << std::endl;
        }

        monitor->stop();
        manager.shutdown();

        auto failed = manager.list([](const DownloadTask& task) {
            return task.status == DownloadStatus::Error;
        });
        if (!failed.empty() && exitCode == 0) {
            exitCode = 1;
        }

        auto analytics = manager.analytics();
        logger.info("Session finished: {} completed download(s), {} total, {} failed",
                    analytics.totalDownloads, StringUtils::formatBytes(analytics.totalBytes), failed.size());

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        std::cerr << "fatal: " << e.what() << std::endl;
        exitCode = 1;
    }

    Logger::instance().flush();
    return exitCode;
}
