#include "change_monitor.hpp"
#include "logger.hpp"
#include <sys/inotify.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstring>
#include <set>
#include <utility>

namespace fs = std::filesystem;

namespace {

constexpr std::uint32_t kWatchMask = IN_CREATE | IN_CLOSE_WRITE | IN_MODIFY | IN_DELETE | IN_MOVED_FROM |
                                     IN_MOVED_TO | IN_ATTRIB | IN_DELETE_SELF | IN_ONLYDIR;
constexpr int kPollTimeoutMs = 250;
constexpr std::size_t kEventBufferSize = 64 * (sizeof(struct inotify_event) + NAME_MAX + 1);

} // namespace

InotifyChangeMonitor::InotifyChangeMonitor(FileSelectionRules rules, Logger& logger)
    : selector_(std::move(rules), logger), logger_(logger) {}

InotifyChangeMonitor::~InotifyChangeMonitor() {
    stop();
}

Result<void> InotifyChangeMonitor::start(const std::vector<std::string>& roots, ChangeCallback onChange) {
    if (running_) {
        return makeError(ErrorKind::InvalidArgument, "Change monitor is already running");
    }
    fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd_ < 0) {
        return makeError(ErrorKind::Io, std::string("Unable to initialize inotify: ") + std::strerror(errno));
    }
    onChange_ = std::move(onChange);
    for (const auto& root : roots) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            logger_.warning("Directory not found, cannot watch: " + root);
            continue;
        }
        addTree(root, root);
        logger_.info("Watching directory: " + root);
    }
    running_ = true;
    thread_ = std::thread(&InotifyChangeMonitor::run, this);
    return {};
}

void InotifyChangeMonitor::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
    watches_.clear();
}

void InotifyChangeMonitor::addTree(const fs::path& directory, const std::string& root) {
    addWatch(directory, root);
    std::error_code ec;
    fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        logger_.warning("Cannot scan " + directory.string() + ": " + ec.message());
        return;
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            logger_.warning("Cannot scan below " + directory.string() + ": " + ec.message());
            break;
        }
        std::error_code typeEc;
        if (it->is_symlink(typeEc) || !it->is_directory(typeEc)) {
            continue;
        }
        if (!selector_.includeDirectory(it->path())) {
            it.disable_recursion_pending();
            continue;
        }
        addWatch(it->path(), root);
    }
}

void InotifyChangeMonitor::addWatch(const fs::path& directory, const std::string& root) {
    int wd = inotify_add_watch(fd_, directory.c_str(), kWatchMask);
    if (wd < 0) {
        if (errno == ENOSPC) {
            logger_.warning("inotify watch limit reached, not watching " + directory.string() +
                            " (raise fs.inotify.max_user_watches)");
        } else {
            logger_.warning("Cannot watch " + directory.string() + ": " + std::strerror(errno));
        }
        return;
    }
    // Nested roots share descriptors; the deepest root owns the directory.
    auto existing = watches_.find(wd);
    if (existing != watches_.end() && existing->second.root.size() > root.size()) {
        return;
    }
    watches_[wd] = Watch{directory, root};
}

bool InotifyChangeMonitor::relevant(const fs::path& path, bool isDirectory) const {
    if (isDirectory) {
        return selector_.includeDirectory(path);
    }
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return selector_.includeFile(path, ec ? 0 : size);
}

void InotifyChangeMonitor::run() {
    alignas(struct inotify_event) char buffer[kEventBufferSize];
    while (running_) {
        pollfd pfd{fd_, POLLIN, 0};
        int ready = poll(&pfd, 1, kPollTimeoutMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            logger_.error(std::string("inotify poll failed: ") + std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        std::set<std::string> changedRoots;
        while (true) {
            ssize_t length = read(fd_, buffer, sizeof(buffer));
            if (length <= 0) {
                if (length < 0 && errno != EAGAIN && errno != EINTR) {
                    logger_.error(std::string("inotify read failed: ") + std::strerror(errno));
                }
                break;
            }
            for (char* ptr = buffer; ptr < buffer + length;) {
                const auto* event = reinterpret_cast<const struct inotify_event*>(ptr);
                ptr += sizeof(struct inotify_event) + event->len;

                if (event->mask & IN_Q_OVERFLOW) {
                    logger_.warning("inotify queue overflow, treating every root as changed");
                    for (const auto& [wd, watch] : watches_) {
                        changedRoots.insert(watch.root);
                    }
                    continue;
                }
                auto found = watches_.find(event->wd);
                if (found == watches_.end()) {
                    continue;
                }
                Watch watch = found->second;
                if (event->mask & IN_IGNORED) {
                    watches_.erase(found);
                    continue;
                }
                if (event->mask & IN_DELETE_SELF) {
                    if (watch.directory == fs::path(watch.root)) {
                        logger_.warning("Watched directory was removed: " + watch.root);
                    }
                    continue;
                }

                fs::path path = event->len > 0 ? watch.directory / event->name : watch.directory;
                bool isDirectory = (event->mask & IN_ISDIR) != 0;
                if (!relevant(path, isDirectory)) {
                    continue;
                }
                if (isDirectory && (event->mask & (IN_CREATE | IN_MOVED_TO))) {
                    addTree(path, watch.root);
                }
                logger_.debug("File change detected: " + path.string());
                changedRoots.insert(watch.root);
            }
        }

        for (const auto& root : changedRoots) {
            if (!running_) {
                break;
            }
            onChange_(root);
        }
    }
}
