#include "watch_orchestrator.hpp"
#include "fs_util.hpp"
#include "logger.hpp"
#include <exception>
#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

const char* watchStateName(WatchState state) {
    switch (state) {
        case WatchState::Idle: return "Idle";
        case WatchState::PendingChange: return "PendingChange";
        case WatchState::BackingUp: return "BackingUp";
    }
    return "Unknown";
}

WatchOrchestrator::WatchOrchestrator(std::vector<BackupTarget> targets, BackupFunction backup, const StateStore& state,
                                     std::unique_ptr<ChangeMonitor> monitor, WatchSettings settings, Logger& logger)
    : backup_(std::move(backup)),
      state_(state),
      monitor_(std::move(monitor)),
      settings_(settings),
      logger_(logger) {
    for (auto& target : targets) {
        target.path = normalizeSourcePath(target.path);
        if (findWorker(target.path)) {
            logger_.warning("Directory listed twice in watchDirectories: " + target.path);
            continue;
        }
        auto worker = std::make_unique<PathWorker>();
        worker->target = std::move(target);
        workers_.push_back(std::move(worker));
    }
}

WatchOrchestrator::~WatchOrchestrator() {
    stop();
}

Result<void> WatchOrchestrator::start() {
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (started_ || stopping_) {
            return makeError(ErrorKind::InvalidArgument, "Watch mode has already been started");
        }
        started_ = true;
    }
    logger_.info("Starting file watcher service...");
    running_ = true;

    std::vector<std::string> roots;
    for (auto& worker : workers_) {
        worker->machine = std::thread(&WatchOrchestrator::runStateMachine, this, std::ref(*worker));
        worker->executor = std::thread(&WatchOrchestrator::runExecutor, this, std::ref(*worker));
        roots.push_back(worker->target.path);

        std::string storageInfo = worker->target.storageType ? " (using " + *worker->target.storageType + " storage)"
                                                             : " (using global storage)";
        logger_.info("Watch target: " + worker->target.path + storageInfo);

        if (settings_.initialBackup && needsInitialBackup(worker->target.path)) {
            logger_.info("Scheduling initial backup for " + worker->target.path);
            worker->events.send(Event::Initial);
        }
    }

    if (monitor_) {
        auto monitored = monitor_->start(roots, [this](const std::string& root) { notifyChange(root); });
        if (!monitored) {
            stop();
            return std::unexpected(monitored.error());
        }
    }
    logger_.info("File watcher service started.");
    return {};
}

bool WatchOrchestrator::needsInitialBackup(const std::string& path) const {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        logger_.warning("Directory not found, skipping initial backup: " + path);
        return false;
    }
    auto last = state_.latest(path);
    if (!last) {
        return true;
    }
    auto newest = newestWriteTime(path);
    return newest && toSystemTime(*newest) > last->timestamp;
}

WatchOrchestrator::PathWorker* WatchOrchestrator::findWorker(const std::string& path) const {
    PathWorker* best = nullptr;
    for (const auto& worker : workers_) {
        const std::string& root = worker->target.path;
        bool within = path == root ||
                      (path.size() > root.size() && path.compare(0, root.size(), root) == 0 &&
                       (root == "/" || path[root.size()] == '/'));
        if (within && (!best || root.size() > best->target.path.size())) {
            best = worker.get();
        }
    }
    return best;
}

void WatchOrchestrator::notifyChange(const std::string& path) {
    if (!running_) {
        return;
    }
    PathWorker* worker = findWorker(normalizeSourcePath(path));
    if (!worker) {
        logger_.debug("Change outside watched directories ignored: " + path);
        return;
    }
    worker->events.send(Event::Change);
}

std::optional<WatchState> WatchOrchestrator::state(const std::string& path) const {
    std::string key = normalizeSourcePath(path);
    for (const auto& worker : workers_) {
        if (worker->target.path == key) {
            return worker->state.load();
        }
    }
    return std::nullopt;
}

void WatchOrchestrator::transition(PathWorker& worker, WatchState next) {
    WatchState previous = worker.state.exchange(next);
    if (previous != next) {
        logger_.debug(worker.target.path + ": " + watchStateName(previous) + " -> " + watchStateName(next));
    }
}

void WatchOrchestrator::runStateMachine(PathWorker& worker) {
    const std::string& path = worker.target.path;
    bool pending = false;
    auto deadline = std::chrono::steady_clock::now();

    auto beginBackup = [&] {
        transition(worker, WatchState::BackingUp);
        worker.jobs.send(true);
    };
    auto beginDebounce = [&] {
        transition(worker, WatchState::PendingChange);
        deadline = std::chrono::steady_clock::now() + settings_.debounce;
    };

    while (true) {
        Event event = Event::Change;
        ChannelStatus status;
        if (worker.state == WatchState::PendingChange) {
            status = worker.events.receiveUntil(event, deadline);
        } else {
            auto next = worker.events.receive();
            status = next ? ChannelStatus::Value : ChannelStatus::Closed;
            if (next) {
                event = *next;
            }
        }

        if (status == ChannelStatus::Closed) {
            break;
        }
        if (status == ChannelStatus::Timeout) {
            logger_.debug("Quiet period elapsed for " + path);
            beginBackup();
            continue;
        }

        switch (event) {
            case Event::Change:
                if (worker.state == WatchState::Idle) {
                    logger_.debug("Change detected under " + path + ", waiting for it to settle");
                    beginDebounce();
                } else if (worker.state == WatchState::PendingChange) {
                    deadline = std::chrono::steady_clock::now() + settings_.debounce;
                } else {
                    pending = true;
                }
                break;
            case Event::Initial:
                if (worker.state == WatchState::Idle) {
                    beginBackup();
                } else if (worker.state == WatchState::BackingUp) {
                    pending = true;
                }
                break;
            case Event::Finished:
                if (pending) {
                    pending = false;
                    logger_.debug("Changes arrived during the backup of " + path + ", scheduling another");
                    beginDebounce();
                } else {
                    transition(worker, WatchState::Idle);
                }
                break;
        }
    }
}

void WatchOrchestrator::runExecutor(PathWorker& worker) {
    const std::string& path = worker.target.path;
    while (worker.jobs.receive()) {
        if (cancel_) {
            break;
        }
        logger_.info("Initiating backup for " + path);
        try {
            auto result = backup_(path, worker.target.storageType, &cancel_);
            if (result) {
                ++completed_;
                if (!*result) {
                    logger_.info("No changes to back up for " + path);
                }
            } else if (result.error().kind == ErrorKind::Cancelled) {
                logger_.info("Backup of " + path + " cancelled");
            } else {
                ++failed_;
                logger_.error("Error during scheduled backup for " + path + ": " + result.error().describe());
            }
        } catch (const std::exception& e) {
            ++failed_;
            logger_.error("Error during scheduled backup for " + path + ": " + e.what());
        }
        worker.events.send(Event::Finished);
    }
}

void WatchOrchestrator::stop() {
    {
        std::unique_lock<std::mutex> lock(lifecycleMutex_);
        if (stopping_) {
            stoppedCond_.wait(lock, [this] { return stopped_; });
            return;
        }
        stopping_ = true;
    }

    bool wasRunning = running_.exchange(false);
    cancel_ = true;
    if (monitor_) {
        monitor_->stop();
    }
    for (auto& worker : workers_) {
        worker->events.close();
        worker->jobs.close();
    }
    for (auto& worker : workers_) {
        if (worker->machine.joinable()) {
            worker->machine.join();
        }
        if (worker->executor.joinable()) {
            worker->executor.join();
        }
        worker->state = WatchState::Idle;
    }
    if (wasRunning) {
        logger_.info("File watcher service stopped.");
    }

    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        stopped_ = true;
    }
    stoppedCond_.notify_all();
}

void WatchOrchestrator::wait() {
    std::unique_lock<std::mutex> lock(lifecycleMutex_);
    stoppedCond_.wait(lock, [this] { return stopped_; });
}
