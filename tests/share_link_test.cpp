#include <gtest/gtest.h>
#include "backup_api.hpp"
#include "test_support.hpp"

class ShareLinkTest : public testsupport::ScratchTest {
protected:
    void SetUp() override {
        ScratchTest::SetUp();
        testsupport::writeFile(path("report.pdf"), "pdf bytes");
        BackupConfig config;
        config.stateFile = path("state.json").string();
        config.storageSources["local"] = {{"path", path("store").string()}};
        api_ = std::make_unique<BackupApi>(config, nullptr, testsupport::quietLogger());
        store_ = std::make_shared<testsupport::FakeStore>();
        api_->registry().registerBackend("dropbox", [store = store_] {
            return std::make_unique<testsupport::FakeStorage>("dropbox", store);
        });
    }

    std::unique_ptr<BackupApi> api_;
    std::shared_ptr<testsupport::FakeStore> store_;
};

TEST_F(ShareLinkTest, UploadsUnderRandomPrefixAndReturnsLink) {
    auto before = std::chrono::system_clock::now();
    auto link = api_->shareFile(path("report.pdf").string(), "Dropbox", std::chrono::hours(24));
    ASSERT_TRUE(link.has_value()) << link.error().describe();

    ASSERT_EQ(link->remotePath.size(), std::string("shared/").size() + 32 + std::string("/report.pdf").size());
    EXPECT_EQ(link->remotePath.rfind("shared/", 0), 0u);
    EXPECT_EQ(link->remotePath.substr(39), "/report.pdf");
    EXPECT_TRUE(store_->contains(link->remotePath));
    EXPECT_EQ(link->url, "https://fake.example/" + link->remotePath + "?expires=86400");
    EXPECT_GE(link->expiresAt, before + std::chrono::hours(24));

    auto second = api_->shareFile(path("report.pdf").string(), "dropbox", std::chrono::hours(1));
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(second->remotePath, link->remotePath);
}

TEST_F(ShareLinkTest, UnsupportedBackendUploadsNothing) {
    store_->sharing = false;
    auto link = api_->shareFile(path("report.pdf").string(), "dropbox", std::chrono::hours(24));
    ASSERT_FALSE(link.has_value());
    EXPECT_EQ(link.error().kind, ErrorKind::UnsupportedOperation);
    EXPECT_EQ(store_->uploads, 0);
    EXPECT_EQ(store_->shareRequests, 0);
}

TEST_F(ShareLinkTest, LocalStorageCannotShare) {
    auto link = api_->shareFile(path("report.pdf").string(), "local", std::chrono::hours(24));
    ASSERT_FALSE(link.has_value());
    EXPECT_EQ(link.error().kind, ErrorKind::UnsupportedOperation);
    EXPECT_FALSE(std::filesystem::exists(path("store/shared")));
}

TEST_F(ShareLinkTest, LinkFailureRemovesUpload) {
    store_->failShareLink = true;
    auto link = api_->shareFile(path("report.pdf").string(), "dropbox", std::chrono::hours(24));
    ASSERT_FALSE(link.has_value());
    EXPECT_EQ(link.error().kind, ErrorKind::Transfer);
    EXPECT_EQ(store_->uploads, 1);
    EXPECT_EQ(store_->removes, 1);
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(ShareLinkTest, FailedCleanupStillReportsLinkError) {
    store_->failShareLink = true;
    store_->failRemove = true;
    auto link = api_->shareFile(path("report.pdf").string(), "dropbox", std::chrono::hours(24));
    ASSERT_FALSE(link.has_value());
    EXPECT_EQ(link.error().kind, ErrorKind::Transfer);
    EXPECT_EQ(link.error().message, "Injected share link failure");
    EXPECT_EQ(store_->removes, 1);
}

TEST_F(ShareLinkTest, MissingFileAndBadExpiration) {
    auto missing = api_->shareFile(path("nope.pdf").string(), "dropbox", std::chrono::hours(24));
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);

    auto expired = api_->shareFile(path("report.pdf").string(), "dropbox", std::chrono::seconds(0));
    ASSERT_FALSE(expired.has_value());
    EXPECT_EQ(expired.error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(store_->uploads, 0);
}
