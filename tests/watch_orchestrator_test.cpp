#include <gtest/gtest.h>
#include <condition_variable>
#include "backup_api.hpp"
#include "channel.hpp"
#include "watch_orchestrator.hpp"
#include "test_support.hpp"

using testsupport::waitFor;
using testsupport::writeFile;

namespace {

/**
 * @brief Scriptable backup runner recording every call.
 */
class FakeBackups {
public:
    BackupFunction function() {
        return [this](const std::string& sourcePath, const std::optional<std::string>& storageOverride,
                      const std::atomic<bool>* cancel) -> Result<std::optional<BackupRecord>> {
            std::unique_lock<std::mutex> lock(mutex_);
            calls_.push_back(sourcePath);
            overrides_.push_back(storageOverride.value_or(""));
            ++running_;
            cond_.notify_all();
            cond_.wait(lock, [&] { return !blocked_ || (cancel && cancel->load()); });
            --running_;
            if (cancel && cancel->load()) {
                return makeError(ErrorKind::Cancelled, "cancelled");
            }
            if (sourcePath == failing_) {
                return makeError(ErrorKind::Transfer, "Injected backup failure");
            }
            if (sourcePath == unchanged_) {
                return std::optional<BackupRecord>();
            }
            BackupRecord record;
            record.sourcePath = sourcePath;
            record.timestamp = std::chrono::system_clock::now();
            return record;
        };
    }

    void block() {
        std::lock_guard<std::mutex> lock(mutex_);
        blocked_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            blocked_ = false;
        }
        cond_.notify_all();
    }

    // Wakes runners blocked on the gate so they can observe cancellation.
    void poke() { cond_.notify_all(); }

    void failFor(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ = path;
    }

    void unchangedFor(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        unchanged_ = path;
    }

    std::vector<std::string> calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::vector<std::string> overrides() {
        std::lock_guard<std::mutex> lock(mutex_);
        return overrides_;
    }

    int running() {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cond_;
    std::vector<std::string> calls_;
    std::vector<std::string> overrides_;
    std::string failing_;
    std::string unchanged_;
    bool blocked_ = false;
    int running_ = 0;
};

WatchSettings fastSettings(bool initialBackup = false) {
    WatchSettings settings;
    settings.debounce = std::chrono::milliseconds(100);
    settings.initialBackup = initialBackup;
    return settings;
}

} // namespace

TEST(ChannelTest, DeliversInOrderAndDrainsAfterClose) {
    Channel<int> channel;
    EXPECT_TRUE(channel.send(1));
    EXPECT_TRUE(channel.send(2));
    channel.close();
    EXPECT_FALSE(channel.send(3));
    EXPECT_EQ(channel.receive(), std::optional<int>(1));
    EXPECT_EQ(channel.receive(), std::optional<int>(2));
    EXPECT_FALSE(channel.receive().has_value());
    EXPECT_TRUE(channel.closed());
}

TEST(ChannelTest, TimedReceive) {
    Channel<int> channel;
    int value = 0;
    EXPECT_EQ(channel.receiveUntil(value, std::chrono::steady_clock::now() + std::chrono::milliseconds(20)),
              ChannelStatus::Timeout);
    channel.send(7);
    EXPECT_EQ(channel.receiveUntil(value, std::chrono::steady_clock::now() + std::chrono::seconds(1)), ChannelStatus::Value);
    EXPECT_EQ(value, 7);
    channel.close();
    EXPECT_EQ(channel.receiveUntil(value, std::chrono::steady_clock::now() + std::chrono::seconds(1)), ChannelStatus::Closed);
}

class WatchOrchestratorTest : public testsupport::ScratchTest {
protected:
    void SetUp() override {
        ScratchTest::SetUp();
        std::filesystem::create_directories(path("a"));
        std::filesystem::create_directories(path("b"));
        state_ = std::make_unique<StateStore>(path("state.json").string(), *logger_);
        state_->load();
    }

    std::unique_ptr<WatchOrchestrator> makeWatcher(std::vector<BackupTarget> targets, WatchSettings settings) {
        return std::make_unique<WatchOrchestrator>(std::move(targets), backups_.function(), *state_, nullptr, settings,
                                                   *logger_);
    }

    std::string dir(const std::string& name) const { return path(name).string(); }

    FakeBackups backups_;
    std::unique_ptr<StateStore> state_;
};

TEST_F(WatchOrchestratorTest, BurstOfChangesYieldsOneBackup) {
    auto watcher = makeWatcher({{dir("a"), std::nullopt}}, fastSettings());
    ASSERT_TRUE(watcher->start().has_value());
    for (int i = 0; i < 5; ++i) {
        watcher->notifyChange(dir("a") + "/file" + std::to_string(i));
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(waitFor([&] { return watcher->completedBackups() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(backups_.calls().size(), 1u);
    EXPECT_EQ(watcher->state(dir("a")), std::optional<WatchState>(WatchState::Idle));
    watcher->stop();
}

TEST_F(WatchOrchestratorTest, ChangesDuringBackupYieldExactlyOneFollowUp) {
    auto watcher = makeWatcher({{dir("a"), std::nullopt}}, fastSettings());
    ASSERT_TRUE(watcher->start().has_value());
    backups_.block();
    watcher->notifyChange(dir("a"));
    ASSERT_TRUE(waitFor([&] { return backups_.running() == 1; }));
    EXPECT_EQ(watcher->state(dir("a")), std::optional<WatchState>(WatchState::BackingUp));

    for (int i = 0; i < 3; ++i) {
        watcher->notifyChange(dir("a") + "/during" + std::to_string(i));
    }
    backups_.release();
    ASSERT_TRUE(waitFor([&] { return watcher->completedBackups() == 2; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(backups_.calls().size(), 2u);
    watcher->stop();
}

TEST_F(WatchOrchestratorTest, FailureInOnePathDoesNotAffectAnother) {
    backups_.failFor(dir("a"));
    auto watcher = makeWatcher({{dir("a"), std::nullopt}, {dir("b"), std::string("s3")}}, fastSettings());
    ASSERT_TRUE(watcher->start().has_value());
    watcher->notifyChange(dir("a") + "/x");
    watcher->notifyChange(dir("b") + "/y");
    ASSERT_TRUE(waitFor([&] { return watcher->completedBackups() == 1 && watcher->failedBackups() == 1; }));

    watcher->notifyChange(dir("b") + "/z");
    ASSERT_TRUE(waitFor([&] { return watcher->completedBackups() == 2; }));
    EXPECT_EQ(watcher->state(dir("a")), std::optional<WatchState>(WatchState::Idle));
    watcher->stop();

    auto overrides = backups_.overrides();
    auto calls = backups_.calls();
    for (std::size_t i = 0; i < calls.size(); ++i) {
        EXPECT_EQ(overrides[i], calls[i] == dir("b") ? "s3" : "");
    }
}

TEST_F(WatchOrchestratorTest, ChangeGoesToDeepestWatchedDirectory) {
    std::filesystem::create_directories(path("a/inner"));
    auto watcher = makeWatcher({{dir("a"), std::nullopt}, {dir("a/inner"), std::nullopt}}, fastSettings());
    ASSERT_TRUE(watcher->start().has_value());
    watcher->notifyChange(dir("a/inner") + "/deep/file.txt");
    watcher->notifyChange(path("unwatched/file.txt").string());
    ASSERT_TRUE(waitFor([&] { return watcher->completedBackups() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(backups_.calls(), std::vector<std::string>{dir("a/inner")});
    watcher->stop();
}

TEST_F(WatchOrchestratorTest, InitialBackupOnlyWhereStateIsBehind) {
    std::filesystem::create_directories(path("c"));
    writeFile(path("a/file.txt"), "never backed up");
    writeFile(path("b/file.txt"), "backed up already");
    BackupRecord upToDate;
    upToDate.remotePath = "backups/b/latest.tar.gz";
    upToDate.timestamp = std::chrono::system_clock::now() + std::chrono::hours(1);
    ASSERT_TRUE(state_->record(dir("b"), upToDate).has_value());

    WatchSettings settings = fastSettings(true);
    settings.debounce = std::chrono::seconds(30);
    auto watcher = makeWatcher({{dir("a"), std::nullopt}, {dir("b"), std::nullopt}, {dir("missing"), std::nullopt}},
                               settings);
    ASSERT_TRUE(watcher->start().has_value());
    ASSERT_TRUE(waitFor([&] { return watcher->completedBackups() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(backups_.calls(), std::vector<std::string>{dir("a")});
    watcher->stop();
}

TEST_F(WatchOrchestratorTest, StopCancelsRunningBackup) {
    backups_.block();
    auto watcher = makeWatcher({{dir("a"), std::nullopt}}, fastSettings());
    ASSERT_TRUE(watcher->start().has_value());
    EXPECT_TRUE(watcher->running());
    watcher->notifyChange(dir("a"));
    ASSERT_TRUE(waitFor([&] { return backups_.running() == 1; }));

    std::thread poker([&] {
        while (backups_.running() > 0) {
            backups_.poke();
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    });
    watcher->stop();
    poker.join();

    EXPECT_FALSE(watcher->running());
    EXPECT_EQ(watcher->completedBackups(), 0u);
    EXPECT_EQ(watcher->failedBackups(), 0u);
    EXPECT_EQ(watcher->state(dir("a")), std::optional<WatchState>(WatchState::Idle));

    watcher->notifyChange(dir("a"));
    watcher->stop();
    watcher->wait();
    EXPECT_EQ(backups_.calls().size(), 1u);
}

TEST_F(WatchOrchestratorTest, StartTwiceIsRejected) {
    auto watcher = makeWatcher({{dir("a"), std::nullopt}}, fastSettings());
    ASSERT_TRUE(watcher->start().has_value());
    auto again = watcher->start();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().kind, ErrorKind::InvalidArgument);
    watcher->stop();
}

TEST_F(WatchOrchestratorTest, StateTransitionsAreLogged) {
    Logger logger(path("watch.log").string(), "", LogLevel::Debug);
    logger.setConsoleOutput(false);
    WatchOrchestrator watcher({BackupTarget{dir("a"), std::nullopt}}, backups_.function(), *state_, nullptr,
                              fastSettings(), logger);
    ASSERT_TRUE(watcher.start().has_value());
    watcher.notifyChange(dir("a"));
    ASSERT_TRUE(waitFor([&] { return watcher.completedBackups() == 1; }));
    ASSERT_TRUE(waitFor([&] { return watcher.state(dir("a")) == WatchState::Idle; }));
    watcher.stop();

    std::string log = testsupport::readFile(path("watch.log"));
    EXPECT_NE(log.find(dir("a") + ": Idle -> PendingChange"), std::string::npos) << log;
    EXPECT_NE(log.find(dir("a") + ": PendingChange -> BackingUp"), std::string::npos) << log;
    EXPECT_NE(log.find(dir("a") + ": BackingUp -> Idle"), std::string::npos) << log;
    EXPECT_STREQ(watchStateName(WatchState::PendingChange), "PendingChange");
}

TEST_F(WatchOrchestratorTest, SkippedBackupCountsAsCompleted) {
    backups_.unchangedFor(dir("a"));
    auto watcher = makeWatcher({{dir("a"), std::nullopt}}, fastSettings());
    ASSERT_TRUE(watcher->start().has_value());
    watcher->notifyChange(dir("a"));
    ASSERT_TRUE(waitFor([&] { return watcher->completedBackups() == 1; }));
    EXPECT_EQ(watcher->failedBackups(), 0u);
    watcher->stop();
}

class WatchApiTest : public testsupport::ScratchTest {
protected:
    void SetUp() override {
        ScratchTest::SetUp();
        std::filesystem::create_directories(path("docs"));
        config_.stateFile = path("state.json").string();
        config_.storageSources["local"] = {{"path", path("store").string()}};
        config_.watchDirectories = {BackupTarget{path("docs").string(), std::nullopt}};
        config_.watch = fastSettings();
    }

    std::size_t storedArchives() {
        std::size_t count = 0;
        std::error_code ec;
        for (auto it = std::filesystem::recursive_directory_iterator(path("store/backups"), ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file()) {
                ++count;
            }
        }
        return count;
    }

    BackupConfig config_;
};

TEST_F(WatchApiTest, ChangeProducesArchiveAndRecord) {
    config_.watch.debounce = std::chrono::milliseconds(500);
    BackupApi api(config_, nullptr, testsupport::quietLogger());
    ASSERT_TRUE(api.startWatch(nullptr).has_value());
    ASSERT_NE(api.watcher(), nullptr);

    // One creation and two modifications inside a single quiet period.
    writeFile(path("docs/new.txt"), "first draft");
    api.watcher()->notifyChange(path("docs/new.txt").string());
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    writeFile(path("docs/new.txt"), "second draft");
    api.watcher()->notifyChange(path("docs/new.txt").string());
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    writeFile(path("docs/new.txt"), "final text");
    auto modified = toSystemTime(std::filesystem::last_write_time(path("docs/new.txt")));
    api.watcher()->notifyChange(path("docs/new.txt").string());

    ASSERT_TRUE(waitFor([&] { return api.state().latest(path("docs").string()).has_value(); }));
    ASSERT_TRUE(waitFor([&] { return api.watcher()->state(path("docs").string()) == WatchState::Idle; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(700));
    EXPECT_EQ(api.watcher()->completedBackups(), 1u);
    EXPECT_EQ(storedArchives(), 1u);
    EXPECT_EQ(api.state().history(path("docs").string()).size(), 1u);

    auto record = api.state().latest(path("docs").string());
    EXPECT_GE(record->timestamp, modified);
    EXPECT_EQ(record->fileCount, 1u);
    auto restored = api.restoreFromBackup(record->remotePath, path("restored").string());
    ASSERT_TRUE(restored.has_value()) << restored.error().describe();
    EXPECT_EQ(testsupport::readFile(path("restored/new.txt")), "final text");

    auto again = api.startWatch(nullptr);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().kind, ErrorKind::Configuration);

    api.stopWatch();
    api.waitForWatch();
    EXPECT_FALSE(api.watcher()->running());
}

TEST_F(WatchApiTest, RestartWhileAnotherThreadWaitsOnTheOldWatcher) {
    BackupApi api(config_, nullptr, testsupport::quietLogger());
    ASSERT_TRUE(api.startWatch(nullptr).has_value());
    std::weak_ptr<WatchOrchestrator> first = api.watcher();

    std::thread waiter([&] { api.waitForWatch(); });
    api.stopWatch();
    ASSERT_TRUE(api.startWatch(nullptr).has_value());
    auto second = api.watcher();
    EXPECT_NE(second, first.lock());
    EXPECT_TRUE(second->running());

    api.stopWatch();
    waiter.join();
    EXPECT_FALSE(second->running());
}

TEST_F(WatchApiTest, NothingToWatchIsConfigurationError) {
    config_.watchDirectories.clear();
    BackupApi api(config_, nullptr, testsupport::quietLogger());
    auto started = api.startWatch(nullptr);
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().kind, ErrorKind::Configuration);
    api.stopWatch();
    api.waitForWatch();
}

TEST_F(WatchApiTest, InotifyMonitorTriggersBackup) {
    BackupApi api(config_, nullptr, testsupport::quietLogger());
    auto started = api.startWatch();
    if (!started) {
        GTEST_SKIP() << "inotify unavailable: " << started.error().describe();
    }
    std::filesystem::create_directories(path("docs/sub"));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    writeFile(path("docs/sub/watched.txt"), "seen by inotify");
    ASSERT_TRUE(waitFor([&] { return api.watcher()->completedBackups() >= 1; }, std::chrono::seconds(10)));
    api.stopWatch();
    EXPECT_GE(storedArchives(), 1u);
}
