#include "backup_api.hpp"
#include <utility>

namespace {

std::unique_ptr<Logger> loggerFor(const BackupConfig& config, std::unique_ptr<Logger> logger) {
    if (logger) {
        return logger;
    }
    LogLevel level = Logger::parseLevel(config.logLevel).value_or(LogLevel::Info);
    return std::make_unique<Logger>(config.logFile, config.errorLogFile, level);
}

std::unique_ptr<PasswordProvider> providerOrEmpty(std::unique_ptr<PasswordProvider> passwords) {
    if (passwords) {
        return passwords;
    }
    return std::make_unique<StaticPasswordProvider>(std::nullopt);
}

} // namespace

BackupApi::BackupApi(BackupConfig config, std::unique_ptr<PasswordProvider> passwords, std::unique_ptr<Logger> logger)
    : config_(std::move(config)),
      logger_(loggerFor(config_, std::move(logger))),
      passwords_(providerOrEmpty(std::move(passwords))),
      registry_(StorageRegistry::withDefaults(*logger_)),
      state_(config_.stateFile, *logger_),
      backupEngine_(config_, registry_, state_, *passwords_, *logger_),
      restoreEngine_(config_, registry_, state_, *passwords_, *logger_),
      shareIssuer_(config_, registry_, *logger_) {
    state_.load();
}

BackupApi::~BackupApi() {
    stopWatch();
}

Result<std::optional<BackupRecord>> BackupApi::backupDirectory(const std::string& sourcePath,
                                                               const std::optional<std::string>& storageOverride) {
    return backupEngine_.backupDirectory(sourcePath, storageOverride);
}

Result<RestoreResult> BackupApi::restoreFromBackup(const std::string& backupPath, const std::string& targetDir,
                                                   const std::optional<std::string>& storageOverride) {
    return restoreEngine_.restoreFromBackup(backupPath, targetDir, storageOverride);
}

Result<ShareLink> BackupApi::shareFile(const std::string& localPath, const std::string& storageType,
                                       std::chrono::seconds expiration) {
    return shareIssuer_.shareFile(localPath, storageType, expiration);
}

Result<void> BackupApi::startWatch() {
    return startWatch(std::make_unique<InotifyChangeMonitor>(config_.selectionRules(), *logger_));
}

Result<void> BackupApi::startWatch(std::unique_ptr<ChangeMonitor> monitor) {
    std::lock_guard<std::mutex> lock(watchMutex_);
    if (watcher_ && watcher_->running()) {
        return makeError(ErrorKind::Configuration, "Watch mode is already running");
    }
    if (config_.watchDirectories.empty()) {
        return makeError(ErrorKind::Configuration, "No watchDirectories configured");
    }

    BackupFunction backup = [this](const std::string& sourcePath, const std::optional<std::string>& storageOverride,
                                   const std::atomic<bool>* cancel) {
        return backupEngine_.backupDirectory(sourcePath, storageOverride, cancel);
    };
    watcher_ = std::make_shared<WatchOrchestrator>(config_.watchDirectories, std::move(backup), state_,
                                                   std::move(monitor), config_.watch, *logger_);
    auto started = watcher_->start();
    if (!started) {
        watcher_.reset();
        return started;
    }
    return {};
}

void BackupApi::stopWatch() {
    std::shared_ptr<WatchOrchestrator> watcher = this->watcher();
    if (watcher) {
        watcher->stop();
    }
}

void BackupApi::waitForWatch() {
    std::shared_ptr<WatchOrchestrator> watcher = this->watcher();
    if (watcher) {
        watcher->wait();
    }
}

std::shared_ptr<WatchOrchestrator> BackupApi::watcher() {
    std::lock_guard<std::mutex> lock(watchMutex_);
    return watcher_;
}
