#include <gtest/gtest.h>
#include <stdexcept>
#include "backup_config.hpp"
#include "test_support.hpp"

namespace {

Json::Value parse(const std::string& text) {
    Json::Value root;
    Json::Reader reader;
    EXPECT_TRUE(reader.parse(text, root));
    return root;
}

} // namespace

TEST(BackupConfigTest, DefaultsForEmptyDocument) {
    BackupConfig config = BackupConfig::fromJson(parse("{}"));
    EXPECT_TRUE(config.watchDirectories.empty());
    EXPECT_EQ(config.globalStorageType, "local");
    EXPECT_EQ(config.backupType, BackupType::Full);
    EXPECT_EQ(config.archiveFormat, ArchiveFormat::Tar);
    EXPECT_TRUE(config.compress);
    EXPECT_FALSE(config.encryption.enabled);
    EXPECT_FALSE(config.retention.enabled);
    EXPECT_EQ(config.watch.debounce, std::chrono::milliseconds(10000));
    EXPECT_TRUE(config.watch.initialBackup);
    EXPECT_EQ(config.maxFileSizeMB, 100u);
    EXPECT_FALSE(config.storageOptions("local").empty());
}

TEST(BackupConfigTest, ParsesWatchDirectoriesAndStorage) {
    BackupConfig config = BackupConfig::fromJson(parse(R"({
        "watchDirectories": ["/data/docs/", {"path": "/data/pics", "storageType": "GDrive"}, {"path": ""}],
        "globalStorageType": "S3",
        "storageSources": {
            "S3": {"options": {"bucketName": "b", "region": "eu-west-1"}},
            "local": {"path": "/srv/backups"}
        },
        "watch": {"debounceSeconds": 2.5, "initialBackup": false},
        "retention": {"enabled": true, "keepLastPerDirectory": 0, "maxAgeDays": -3},
        "archiveFormat": "ZIP",
        "excludedPatterns": ["*.bak"]
    })"));

    ASSERT_EQ(config.watchDirectories.size(), 2u);
    EXPECT_EQ(config.watchDirectories[0].path, "/data/docs");
    EXPECT_FALSE(config.watchDirectories[0].storageType.has_value());
    EXPECT_EQ(config.watchDirectories[1].storageType, std::optional<std::string>("gdrive"));
    EXPECT_EQ(config.globalStorageType, "s3");
    EXPECT_EQ(config.storageOptions("s3").at("bucketName"), "b");
    EXPECT_EQ(config.storageOptions("LOCAL").at("path"), "/srv/backups");
    EXPECT_TRUE(config.storageOptions("azure").empty());
    EXPECT_EQ(config.watch.debounce, std::chrono::milliseconds(2500));
    EXPECT_FALSE(config.watch.initialBackup);
    EXPECT_EQ(config.retention.keepLast, 1);
    EXPECT_EQ(config.retention.maxAgeDays, 0);
    EXPECT_EQ(config.archiveFormat, ArchiveFormat::Zip);
    EXPECT_EQ(config.selectionRules().excludedPatterns, std::vector<std::string>{"*.bak"});
}

TEST(BackupConfigTest, ResolveStorageTypePrecedence) {
    BackupConfig config = BackupConfig::fromJson(parse(R"({
        "watchDirectories": ["/data/docs", {"path": "/data/pics", "storageType": "gdrive"}],
        "globalStorageType": "s3"
    })"));
    EXPECT_EQ(config.resolveStorageType("/data/docs", std::nullopt), "s3");
    EXPECT_EQ(config.resolveStorageType("/data/pics/", std::nullopt), "gdrive");
    EXPECT_EQ(config.resolveStorageType("/data/pics", std::optional<std::string>("Dropbox")), "dropbox");
    EXPECT_EQ(config.resolveStorageType("/elsewhere", std::nullopt), "s3");
}

TEST(BackupConfigTest, GlobalStorageDefaultsToFirstConfiguredSource) {
    BackupConfig config = BackupConfig::fromJson(parse(R"({"storageSources": {"sftp": {"options": {"host": "h"}}}})"));
    EXPECT_EQ(config.globalStorageType, "sftp");
}

TEST(BackupConfigTest, ComponentStorageFallsBack) {
    BackupConfig config = BackupConfig::fromJson(parse(R"({
        "globalStorageType": "local",
        "systemBackup": {"storageType": "s3", "programsStorageType": "azure"}
    })"));
    EXPECT_EQ(config.componentStorage("programs"), "azure");
    EXPECT_EQ(config.componentStorage("environment"), "s3");
    EXPECT_EQ(BackupConfig::fromJson(parse("{}")).componentStorage("settings"), "local");
}

TEST(BackupConfigTest, ParsesBackupType) {
    EXPECT_EQ(BackupConfig::fromJson(parse(R"({"backupType": "Incremental"})")).backupType, BackupType::Incremental);
    EXPECT_EQ(BackupConfig::fromJson(parse(R"({"backupType": "differential"})")).backupType, BackupType::Differential);
    EXPECT_EQ(BackupConfig::fromJson(parse(R"({"backupType": "FULL"})")).backupType, BackupType::Full);
}

TEST(BackupConfigTest, InvalidValuesThrow) {
    EXPECT_THROW(BackupConfig::fromJson(parse(R"({"backupType": "weekly"})")), std::runtime_error);
    EXPECT_THROW(BackupConfig::fromJson(parse(R"({"archiveFormat": "rar"})")), std::runtime_error);
    EXPECT_THROW(BackupConfig::fromJson(parse(R"({"logLevel": "chatty"})")), std::runtime_error);
    EXPECT_THROW(BackupConfig::fromJson(parse(R"({"watch": {"debounceSeconds": -1}})")), std::runtime_error);
    EXPECT_THROW(BackupConfig::fromJson(parse("[1, 2]")), std::runtime_error);
}

class BackupConfigFileTest : public testsupport::ScratchTest {};

TEST_F(BackupConfigFileTest, LoadsFromFile) {
    testsupport::writeFile(path("config.json"), R"({"globalStorageType": "b2", "stateFile": "/tmp/s.json"})");
    BackupConfig config(path("config.json").string());
    EXPECT_EQ(config.globalStorageType, "b2");
    EXPECT_EQ(config.stateFile, "/tmp/s.json");
}

TEST_F(BackupConfigFileTest, BrokenFileThrows) {
    testsupport::writeFile(path("config.json"), "{ nope");
    EXPECT_THROW(BackupConfig(path("config.json").string()), std::runtime_error);
    EXPECT_THROW(BackupConfig(path("missing.json").string()), std::runtime_error);
}
