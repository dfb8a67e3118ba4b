#include <gtest/gtest.h>
#include "retention.hpp"
#include "storage_registry.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono;

const system_clock::time_point kNow = system_clock::time_point(seconds(1700000000));

BackupRecord recordAgedDays(const std::string& remotePath, int days) {
    BackupRecord record;
    record.remotePath = remotePath;
    record.timestamp = kNow - hours(24) * days;
    record.storageType = "fake";
    return record;
}

std::vector<std::string> remotePaths(const std::vector<BackupRecord>& records) {
    std::vector<std::string> result;
    for (const auto& record : records) {
        result.push_back(record.remotePath);
    }
    return result;
}

} // namespace

TEST(SelectExpiredBackupsTest, KeepsNewestCountAndRecentOnes) {
    RetentionSettings settings;
    settings.keepLast = 2;
    settings.maxAgeDays = 10;
    std::vector<BackupRecord> history = {recordAgedDays("d40", 40), recordAgedDays("d1", 1), recordAgedDays("d20", 20),
                                         recordAgedDays("d5", 5), recordAgedDays("d30", 30)};
    EXPECT_EQ(remotePaths(selectExpiredBackups(history, settings, kNow)), (std::vector<std::string>{"d20", "d30", "d40"}));
}

TEST(SelectExpiredBackupsTest, AgeLimitDisabledKeepsOnlyCount) {
    RetentionSettings settings;
    settings.keepLast = 1;
    settings.maxAgeDays = 0;
    std::vector<BackupRecord> history = {recordAgedDays("d2", 2), recordAgedDays("d1", 1), recordAgedDays("d3", 3)};
    EXPECT_EQ(remotePaths(selectExpiredBackups(history, settings, kNow)), (std::vector<std::string>{"d2", "d3"}));
}

TEST(SelectExpiredBackupsTest, NewestIsAlwaysKept) {
    RetentionSettings settings;
    settings.keepLast = 0;
    settings.maxAgeDays = 1;
    std::vector<BackupRecord> history = {recordAgedDays("d100", 100), recordAgedDays("d200", 200)};
    EXPECT_EQ(remotePaths(selectExpiredBackups(history, settings, kNow)), std::vector<std::string>{"d200"});
    EXPECT_TRUE(selectExpiredBackups({recordAgedDays("only", 500)}, settings, kNow).empty());
}

class RetentionPolicyTest : public testsupport::ScratchTest {
protected:
    void SetUp() override {
        ScratchTest::SetUp();
        store_ = std::make_shared<testsupport::FakeStore>();
        registry_.registerBackend("fake", [store = store_] {
            return std::make_unique<testsupport::FakeStorage>("fake", store);
        });
        config_.globalStorageType = "fake";
        config_.retention.enabled = true;
        config_.retention.keepLast = 2;
        config_.retention.maxAgeDays = 0;
        state_ = std::make_unique<StateStore>(path("state.json").string(), *logger_);
        state_->load();
        auto now = system_clock::now();
        for (int i = 0; i < 4; ++i) {
            BackupRecord record;
            record.remotePath = "docs/" + std::to_string(i);
            record.timestamp = now - hours(i + 1);
            record.storageType = "fake";
            ASSERT_TRUE(state_->record("/data/docs", record).has_value());
            store_->objects[record.remotePath] = "archive";
        }
    }

    std::shared_ptr<testsupport::FakeStore> store_;
    StorageRegistry registry_;
    BackupConfig config_;
    std::unique_ptr<StateStore> state_;
};

TEST_F(RetentionPolicyTest, DeletesExpiredObjectsAndPrunesState) {
    RetentionPolicy policy(config_, registry_, *state_, *logger_);
    EXPECT_EQ(policy.apply("/data/docs"), 2u);
    EXPECT_TRUE(store_->contains("docs/0"));
    EXPECT_TRUE(store_->contains("docs/1"));
    EXPECT_FALSE(store_->contains("docs/2"));
    EXPECT_FALSE(store_->contains("docs/3"));
    EXPECT_EQ(state_->history("/data/docs").size(), 2u);
    EXPECT_EQ(store_->released, store_->opened);
}

TEST_F(RetentionPolicyTest, MissingObjectIsDroppedFromState) {
    store_->objects.erase("docs/3");
    RetentionPolicy policy(config_, registry_, *state_, *logger_);
    EXPECT_EQ(policy.apply("/data/docs"), 2u);
    EXPECT_EQ(store_->removes, 1);
}

TEST_F(RetentionPolicyTest, FailedDeleteKeepsRecord) {
    store_->failRemove = true;
    RetentionPolicy policy(config_, registry_, *state_, *logger_);
    EXPECT_EQ(policy.apply("/data/docs"), 0u);
    EXPECT_EQ(state_->history("/data/docs").size(), 4u);
}

TEST_F(RetentionPolicyTest, DisabledPolicyDoesNothing) {
    config_.retention.enabled = false;
    RetentionPolicy policy(config_, registry_, *state_, *logger_);
    EXPECT_EQ(policy.apply("/data/docs"), 0u);
    EXPECT_EQ(store_->opened, 0);
}
