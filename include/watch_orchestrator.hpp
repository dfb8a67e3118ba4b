/**
 * @file watch_orchestrator.hpp
 * @brief Debounced, per directory serialized backups driven by filesystem changes.
 *
 * Each watched directory runs its own state machine, Idle -> PendingChange -> BackingUp ->
 * Idle, on two threads: the state machine thread owns the debounce timer, and the executor
 * thread runs backups one at a time. They talk over channels; the executor posts every
 * completion back to the state machine. A change arriving during a backup sets a single
 * pending flag which yields exactly one follow-up cycle.
 */

#ifndef WATCH_ORCHESTRATOR_HPP
#define WATCH_ORCHESTRATOR_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "backup_config.hpp"
#include "channel.hpp"
#include "change_monitor.hpp"
#include "state_store.hpp"

class Logger;

/**
 * @brief Lifecycle state of one watched directory.
 */
enum class WatchState {
    Idle,           ///< No change seen since the last backup.
    PendingChange,  ///< Waiting for the debounce period to pass quietly.
    BackingUp       ///< A backup is running.
};

const char* watchStateName(WatchState state);

/**
 * @brief Runs one backup. Bound to BackupEngine::backupDirectory in production.
 */
using BackupFunction = std::function<Result<std::optional<BackupRecord>>(const std::string& sourcePath,
                                                                         const std::optional<std::string>& storageOverride,
                                                                         const std::atomic<bool>* cancel)>;

class WatchOrchestrator {
public:
    /**
     * @param targets Directories to watch, each with its optional storage override.
     * @param backup Backup runner.
     * @param state Consulted at startup to decide on initial backups.
     * @param monitor Change source; may be null when changes only arrive through notifyChange().
     * @param settings Debounce period and startup reconciliation flag.
     */
    WatchOrchestrator(std::vector<BackupTarget> targets, BackupFunction backup, const StateStore& state,
                      std::unique_ptr<ChangeMonitor> monitor, WatchSettings settings, Logger& logger);
    ~WatchOrchestrator();

    WatchOrchestrator(const WatchOrchestrator&) = delete;
    WatchOrchestrator& operator=(const WatchOrchestrator&) = delete;

    /**
     * @brief Starts every path's threads, schedules initial backups and starts the monitor.
     *
     * @return Result<void> InvalidArgument when already started, or the monitor's error.
     */
    Result<void> start();

    /**
     * @brief Reports a change at or below a watched directory.
     *
     * The deepest watched directory containing the path receives the change. Ignored after
     * stop() and for paths outside every watched directory.
     */
    void notifyChange(const std::string& path);

    /**
     * @brief Cancels in-flight backups, stops the monitor and joins every thread. Idempotent,
     * callable from any thread.
     */
    void stop();

    /**
     * @brief Blocks until stop() has finished.
     */
    void wait();

    bool running() const { return running_; }

    /**
     * @brief Current state of a watched directory, std::nullopt if it is not watched.
     */
    std::optional<WatchState> state(const std::string& path) const;

    std::size_t completedBackups() const { return completed_; }
    std::size_t failedBackups() const { return failed_; }

private:
    enum class Event {
        Change,     ///< Filesystem change, debounced.
        Initial,    ///< Startup reconciliation, starts a backup at once.
        Finished    ///< The executor completed a backup.
    };

    struct PathWorker {
        BackupTarget target;
        Channel<Event> events;                      ///< State machine inbox.
        Channel<bool> jobs;                         ///< Executor inbox, one value per backup.
        std::atomic<WatchState> state{WatchState::Idle};
        std::thread machine;
        std::thread executor;
    };

    void transition(PathWorker& worker, WatchState next);
    void runStateMachine(PathWorker& worker);
    void runExecutor(PathWorker& worker);
    bool needsInitialBackup(const std::string& path) const;
    PathWorker* findWorker(const std::string& path) const;

    BackupFunction backup_;
    const StateStore& state_;
    std::unique_ptr<ChangeMonitor> monitor_;
    WatchSettings settings_;
    Logger& logger_;
    std::vector<std::unique_ptr<PathWorker>> workers_;
    std::atomic<bool> cancel_{false};       ///< Handed to every running backup.
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> completed_{0};
    std::atomic<std::size_t> failed_{0};

    std::mutex lifecycleMutex_;
    std::condition_variable stoppedCond_;
    bool started_ = false;
    bool stopping_ = false;
    bool stopped_ = false;
};

#endif // WATCH_ORCHESTRATOR_HPP
