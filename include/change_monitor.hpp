/**
 * @file change_monitor.hpp
 * @brief Filesystem change sources for watch mode.
 *
 * A ChangeMonitor reports which watched root saw a change. It does not debounce; the
 * WatchOrchestrator owns all timing.
 */

#ifndef CHANGE_MONITOR_HPP
#define CHANGE_MONITOR_HPP

#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <thread>
#include <vector>
#include "backup_error.hpp"
#include "file_selector.hpp"

class Logger;

/**
 * @brief Receives the watched root under which a change happened.
 */
using ChangeCallback = std::function<void(const std::string& root)>;

/**
 * @brief Abstract change source.
 */
class ChangeMonitor {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~ChangeMonitor() = default;

    /**
     * @brief Starts watching the given roots. The callback runs on the monitor's own thread.
     *
     * @return Result<void> Io error when the platform facility is unavailable.
     */
    virtual Result<void> start(const std::vector<std::string>& roots, ChangeCallback onChange) = 0;

    /**
     * @brief Stops watching. No callback runs after this returns. Idempotent.
     */
    virtual void stop() = 0;
};

/**
 * @brief Recursive inotify watcher.
 *
 * Every directory below each root gets its own watch; directories created or moved in
 * later are added as they appear. Files rejected by the selection rules do not trigger.
 */
class InotifyChangeMonitor : public ChangeMonitor {
public:
    InotifyChangeMonitor(FileSelectionRules rules, Logger& logger);
    ~InotifyChangeMonitor() override;

    InotifyChangeMonitor(const InotifyChangeMonitor&) = delete;
    InotifyChangeMonitor& operator=(const InotifyChangeMonitor&) = delete;

    Result<void> start(const std::vector<std::string>& roots, ChangeCallback onChange) override;
    void stop() override;

private:
    struct Watch {
        std::filesystem::path directory;    ///< Watched directory.
        std::string root;                   ///< Configured root it belongs to.
    };

    void run();
    void addTree(const std::filesystem::path& directory, const std::string& root);
    void addWatch(const std::filesystem::path& directory, const std::string& root);
    bool relevant(const std::filesystem::path& path, bool isDirectory) const;

    FileSelector selector_;
    Logger& logger_;
    ChangeCallback onChange_;
    int fd_ = -1;
    std::map<int, Watch> watches_;      ///< Keyed by watch descriptor, touched by the monitor thread only after start.
    std::atomic<bool> running_{false};
    std::thread thread_;
};

#endif // CHANGE_MONITOR_HPP
