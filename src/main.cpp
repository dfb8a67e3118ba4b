#include "backup_api.hpp"
#include "fs_util.hpp"
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <pthread.h>
#include <stdexcept>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " [--config <path>] backup <sourceDir> [--storage <type>]\n"
              << "  " << program << " [--config <path>] restore <backupPath> <targetDir> [--storage <type>]\n"
              << "  " << program << " [--config <path>] share <file> <storageType> [--hours <n>]\n"
              << "  " << program << " [--config <path>] watch\n"
              << "\nThe encryption password is read from RESTORE_PASSWORD or prompted for." << std::endl;
}

std::unique_ptr<PasswordProvider> makePasswordProvider() {
    if (std::getenv("RESTORE_PASSWORD")) {
        return std::make_unique<EnvironmentPasswordProvider>();
    }
    return std::make_unique<TerminalPasswordProvider>();
}

BackupConfig loadConfig(const std::string& configFile) {
    if (!configFile.empty()) {
        return BackupConfig(configFile);
    }
    std::string defaultFile = BackupConfig::defaultConfigPath();
    std::error_code ec;
    if (fs::exists(defaultFile, ec)) {
        return BackupConfig(defaultFile);
    }
    std::cout << "No configuration found at " << defaultFile << ", using defaults." << std::endl;
    return BackupConfig();
}

int reportFailure(Logger& logger, const std::string& operation, const BackupError& error) {
    logger.error(operation + " failed: " + error.describe());
    return 1;
}

/**
 * @brief Runs watch mode until SIGINT or SIGTERM.
 *
 * The signals are blocked in every thread and consumed by one sigwait thread, which stops
 * watch mode. SIGUSR1 releases that thread when watch mode ends for another reason.
 */
int runWatch(BackupApi& api) {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    std::thread signalThread([&api, signals] {
        int received = 0;
        if (sigwait(&signals, &received) == 0 && received != SIGUSR1) {
            api.logger().info("Received shutdown signal, stopping watch mode");
            api.stopWatch();
        }
    });

    auto started = api.startWatch();
    if (!started) {
        pthread_kill(signalThread.native_handle(), SIGUSR1);
        signalThread.join();
        return reportFailure(api.logger(), "Watch mode", started.error());
    }
    std::cout << "Watch mode started. Press Ctrl+C to stop. Check " << api.config().logFile << " for logs."
              << std::endl;
    api.waitForWatch();
    pthread_kill(signalThread.native_handle(), SIGUSR1);
    signalThread.join();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile;
    std::optional<std::string> storageOverride;
    std::optional<std::string> hoursText;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--storage" && i + 1 < argc) {
            storageOverride = argv[++i];
        } else if (arg == "--hours" && i + 1 < argc) {
            hoursText = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        printUsage(argv[0]);
        return 1;
    }
    const std::string& command = positional[0];

    try {
        BackupApi api(loadConfig(configFile), makePasswordProvider());
        Logger& logger = api.logger();

        if (command == "backup" && positional.size() == 2) {
            auto record = api.backupDirectory(positional[1], storageOverride);
            if (!record) {
                return reportFailure(logger, "Backup", record.error());
            }
            if (!*record) {
                std::cout << "No changes since the last backup, nothing uploaded" << std::endl;
            } else {
                std::cout << "Backup completed successfully: " << (*record)->remotePath << " ("
                          << (*record)->storageType << ", " << backupTypeName((*record)->type) << ")" << std::endl;
            }
        } else if (command == "restore" && positional.size() == 3) {
            auto restored = api.restoreFromBackup(positional[1], positional[2], storageOverride);
            if (!restored) {
                return reportFailure(logger, "Restore", restored.error());
            }
            std::cout << "Restore completed successfully: " << restored->files << " files, "
                      << formatBytes(restored->bytes) << std::endl;
        } else if (command == "share" && positional.size() == 3) {
            long hours = 24;
            if (hoursText) {
                std::size_t consumed = 0;
                hours = std::stol(*hoursText, &consumed);
                if (consumed != hoursText->size() || hours <= 0) {
                    throw std::invalid_argument("--hours must be a positive whole number");
                }
            }
            auto link = api.shareFile(positional[1], positional[2], std::chrono::hours(hours));
            if (!link) {
                return reportFailure(logger, "Share", link.error());
            }
            std::cout << link->url << std::endl;
            std::cout << "Expires: " << isoUtcTimestamp(link->expiresAt) << std::endl;
        } else if (command == "watch" && positional.size() == 1) {
            return runWatch(api);
        } else {
            printUsage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
