#include <gtest/gtest.h>
#include <algorithm>
#include "change_monitor.hpp"
#include "test_support.hpp"

using testsupport::waitFor;
using testsupport::writeFile;

class ChangeMonitorTest : public testsupport::ScratchTest {
protected:
    void SetUp() override {
        ScratchTest::SetUp();
        std::filesystem::create_directories(path("outer/inner"));
        std::filesystem::create_directories(path("outer/other"));
        monitor_ = std::make_unique<InotifyChangeMonitor>(FileSelectionRules{}, *logger_);
    }

    void TearDown() override {
        if (monitor_) {
            monitor_->stop();
        }
        ScratchTest::TearDown();
    }

    void startOn(const std::vector<std::string>& roots) {
        auto started = monitor_->start(roots, [this](const std::string& root) {
            std::lock_guard<std::mutex> lock(mutex_);
            reported_.push_back(root);
        });
        if (!started) {
            GTEST_SKIP() << "inotify unavailable: " << started.error().describe();
        }
    }

    bool reported(const std::string& root) {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::find(reported_.begin(), reported_.end(), root) != reported_.end();
    }

    std::unique_ptr<InotifyChangeMonitor> monitor_;
    std::mutex mutex_;
    std::vector<std::string> reported_;
};

TEST_F(ChangeMonitorTest, NestedRootListedFirstKeepsItsChanges) {
    std::string outer = path("outer").string();
    std::string inner = path("outer/inner").string();
    startOn({inner, outer});
    if (IsSkipped()) {
        return;
    }
    writeFile(path("outer/inner/f.txt"), "inner change");
    EXPECT_TRUE(waitFor([&] { return reported(inner); }));

    writeFile(path("outer/g.txt"), "outer change");
    EXPECT_TRUE(waitFor([&] { return reported(outer); }));
}

TEST_F(ChangeMonitorTest, NestedRootListedLastKeepsItsChanges) {
    std::string outer = path("outer").string();
    std::string inner = path("outer/inner").string();
    startOn({outer, inner});
    if (IsSkipped()) {
        return;
    }
    writeFile(path("outer/inner/f.txt"), "inner change");
    EXPECT_TRUE(waitFor([&] { return reported(inner); }));
}

TEST_F(ChangeMonitorTest, SiblingDirectoryReportsOuterRoot) {
    std::string outer = path("outer").string();
    std::string inner = path("outer/inner").string();
    startOn({inner, outer});
    if (IsSkipped()) {
        return;
    }
    writeFile(path("outer/other/h.txt"), "sibling change");
    ASSERT_TRUE(waitFor([&] { return reported(outer); }));
    EXPECT_FALSE(reported(inner));
}
