#include <gtest/gtest.h>
#include <archive.h>
#include <archive_entry.h>
#include "archive.hpp"
#include "file_selector.hpp"
#include "test_support.hpp"

using testsupport::readFile;
using testsupport::writeFile;

class ArchiveTest : public testsupport::ScratchTest {
protected:
    void SetUp() override {
        ScratchTest::SetUp();
        writeFile(path("src/a/one.txt"), "one");
        writeFile(path("src/a/b/two.txt"), std::string(20000, 'z'));
        writeFile(path("src/three.tmp"), "scratch");
        writeFile(path("src/.hidden"), "secret");
        rules_.excludedPatterns = {"*.tmp"};
        selector_ = std::make_unique<FileSelector>(rules_, *logger_);
    }

    // Writes a tar holding the given entry names, bypassing the archiver's own checks.
    void writeRawTar(const std::filesystem::path& file, const std::vector<std::string>& names) {
        struct archive* writer = archive_write_new();
        archive_write_set_format_pax_restricted(writer);
        ASSERT_EQ(archive_write_open_filename(writer, file.c_str()), ARCHIVE_OK);
        for (const auto& name : names) {
            struct archive_entry* entry = archive_entry_new();
            archive_entry_set_pathname(entry, name.c_str());
            archive_entry_set_filetype(entry, AE_IFREG);
            archive_entry_set_perm(entry, 0644);
            archive_entry_set_size(entry, 4);
            archive_write_header(writer, entry);
            archive_write_data(writer, "evil", 4);
            archive_entry_free(entry);
        }
        archive_write_close(writer);
        archive_write_free(writer);
    }

    FileSelectionRules rules_;
    std::unique_ptr<FileSelector> selector_;
};

TEST_F(ArchiveTest, TarRoundTripPreservesRelativePaths) {
    DirectoryArchiver archiver(ArchiveFormat::Tar, *selector_, *logger_);
    auto created = archiver.create(path("src"), path("out.tar"));
    ASSERT_TRUE(created.has_value()) << created.error().describe();
    EXPECT_EQ(created->files, 2u);
    EXPECT_EQ(created->directories, 2u);
    EXPECT_EQ(created->bytes, 3u + 20000u);

    auto verified = DirectoryArchiver::verify(path("out.tar"));
    ASSERT_TRUE(verified.has_value());
    EXPECT_EQ(verified->files, 2u);

    ArchiveExtractor extractor(*logger_);
    auto extracted = extractor.extract(path("out.tar"), path("restored"));
    ASSERT_TRUE(extracted.has_value()) << extracted.error().describe();
    EXPECT_EQ(extracted->files, 2u);
    EXPECT_EQ(readFile(path("restored/a/one.txt")), "one");
    EXPECT_EQ(readFile(path("restored/a/b/two.txt")), std::string(20000, 'z'));
    EXPECT_FALSE(std::filesystem::exists(path("restored/three.tmp")));
    EXPECT_FALSE(std::filesystem::exists(path("restored/.hidden")));
}

TEST_F(ArchiveTest, ChangedSinceKeepsNewerFilesAndAllDirectories) {
    auto now = std::chrono::system_clock::now();
    std::filesystem::last_write_time(path("src/a/one.txt"), std::filesystem::file_time_type::clock::now() + std::chrono::hours(1));

    DirectoryArchiver archiver(ArchiveFormat::Tar, *selector_, *logger_);
    archiver.setChangedSince(now + std::chrono::minutes(30));
    auto created = archiver.create(path("src"), path("out.tar"));
    ASSERT_TRUE(created.has_value()) << created.error().describe();
    EXPECT_EQ(created->files, 1u);
    EXPECT_EQ(created->directories, 2u);

    ArchiveExtractor extractor(*logger_);
    ASSERT_TRUE(extractor.extract(path("out.tar"), path("restored")).has_value());
    EXPECT_EQ(readFile(path("restored/a/one.txt")), "one");
    EXPECT_FALSE(std::filesystem::exists(path("restored/a/b/two.txt")));
    EXPECT_TRUE(std::filesystem::is_directory(path("restored/a/b")));

    archiver.setChangedSince(std::nullopt);
    auto everything = archiver.create(path("src"), path("all.tar"));
    ASSERT_TRUE(everything.has_value());
    EXPECT_EQ(everything->files, 2u);
}

TEST_F(ArchiveTest, ZipRoundTrip) {
    DirectoryArchiver archiver(ArchiveFormat::Zip, *selector_, *logger_);
    ASSERT_TRUE(archiver.create(path("src"), path("out.zip")).has_value());
    ArchiveExtractor extractor(*logger_);
    auto extracted = extractor.extract(path("out.zip"), path("restored"));
    ASSERT_TRUE(extracted.has_value()) << extracted.error().describe();
    EXPECT_EQ(readFile(path("restored/a/b/two.txt")), std::string(20000, 'z'));
}

TEST_F(ArchiveTest, ExtractOverwritesExistingFiles) {
    DirectoryArchiver archiver(ArchiveFormat::Tar, *selector_, *logger_);
    ASSERT_TRUE(archiver.create(path("src"), path("out.tar")).has_value());
    writeFile(path("restored/a/one.txt"), "stale content");
    ArchiveExtractor extractor(*logger_);
    ASSERT_TRUE(extractor.extract(path("out.tar"), path("restored")).has_value());
    EXPECT_EQ(readFile(path("restored/a/one.txt")), "one");
}

TEST_F(ArchiveTest, UnsafeEntryRefusesWholeArchive) {
    writeRawTar(path("evil.tar"), {"fine.txt", "../escaped.txt"});
    ArchiveExtractor extractor(*logger_);
    auto extracted = extractor.extract(path("evil.tar"), path("restored"));
    ASSERT_FALSE(extracted.has_value());
    EXPECT_EQ(extracted.error().kind, ErrorKind::Format);
    EXPECT_FALSE(std::filesystem::exists(path("escaped.txt")));
    EXPECT_FALSE(std::filesystem::exists(path("restored/fine.txt")));
}

TEST_F(ArchiveTest, AbsoluteEntryIsRefused) {
    writeRawTar(path("abs.tar"), {"/tmp/restore-absolute-entry.txt"});
    ArchiveExtractor extractor(*logger_);
    auto extracted = extractor.extract(path("abs.tar"), path("restored"));
    ASSERT_FALSE(extracted.has_value());
    EXPECT_EQ(extracted.error().kind, ErrorKind::Format);
}

TEST(ArchiveEntryNameTest, SafeNames) {
    EXPECT_TRUE(ArchiveExtractor::isSafeEntryName("a.txt"));
    EXPECT_TRUE(ArchiveExtractor::isSafeEntryName("dir/sub/a.txt"));
    EXPECT_TRUE(ArchiveExtractor::isSafeEntryName("dir/..hidden/a"));
    EXPECT_FALSE(ArchiveExtractor::isSafeEntryName(""));
    EXPECT_FALSE(ArchiveExtractor::isSafeEntryName("/etc/passwd"));
    EXPECT_FALSE(ArchiveExtractor::isSafeEntryName("../a"));
    EXPECT_FALSE(ArchiveExtractor::isSafeEntryName("a/../../b"));
    EXPECT_FALSE(ArchiveExtractor::isSafeEntryName("a\\..\\b"));
    EXPECT_FALSE(ArchiveExtractor::isSafeEntryName("C:/windows"));
}

TEST_F(ArchiveTest, VerifyRejectsGarbage) {
    writeFile(path("junk.tar"), "this is not an archive at all\n");
    auto verified = DirectoryArchiver::verify(path("junk.tar"));
    ASSERT_FALSE(verified.has_value());
    EXPECT_EQ(verified.error().kind, ErrorKind::Format);
}

TEST_F(ArchiveTest, CancelledBeforeFirstEntry) {
    std::atomic<bool> cancel{true};
    DirectoryArchiver archiver(ArchiveFormat::Tar, *selector_, *logger_);
    auto created = archiver.create(path("src"), path("out.tar"), &cancel);
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().kind, ErrorKind::Cancelled);
}

TEST_F(ArchiveTest, MissingSourceIsNotFound) {
    DirectoryArchiver archiver(ArchiveFormat::Tar, *selector_, *logger_);
    auto created = archiver.create(path("nope"), path("out.tar"));
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().kind, ErrorKind::NotFound);
}

TEST(ArchiveFormatTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(parseArchiveFormat("TAR"), std::optional<ArchiveFormat>(ArchiveFormat::Tar));
    EXPECT_EQ(parseArchiveFormat("zip"), std::optional<ArchiveFormat>(ArchiveFormat::Zip));
    EXPECT_FALSE(parseArchiveFormat("rar").has_value());
    EXPECT_EQ(archiveExtension(ArchiveFormat::Zip), "zip");
}
