#include <gtest/gtest.h>
#include "compression.hpp"
#include "test_support.hpp"

using testsupport::readFile;
using testsupport::writeFile;

class CompressionTest : public testsupport::ScratchTest {};

TEST_F(CompressionTest, GzipRoundTrip) {
    std::string content;
    for (int i = 0; i < 5000; ++i) {
        content += "line " + std::to_string(i) + "\n";
    }
    writeFile(path("in.txt"), content);

    ASSERT_TRUE(gzipFile(path("in.txt").string(), path("in.txt.gz").string()).has_value());
    EXPECT_LT(std::filesystem::file_size(path("in.txt.gz")), content.size());
    std::string gz = readFile(path("in.txt.gz"));
    ASSERT_GE(gz.size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>(gz[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>(gz[1]), 0x8b);

    ASSERT_TRUE(gunzipFile(path("in.txt.gz").string(), path("out.txt").string()).has_value());
    EXPECT_EQ(readFile(path("out.txt")), content);
}

TEST_F(CompressionTest, PlainFileIsNotAcceptedAsGzip) {
    writeFile(path("plain.txt"), "this was never compressed");
    auto result = gunzipFile(path("plain.txt").string(), path("out.txt").string());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Format);
    EXPECT_FALSE(std::filesystem::exists(path("out.txt")));
}

TEST_F(CompressionTest, MissingInputIsIoError) {
    auto result = gzipFile(path("missing.txt").string(), path("out.gz").string());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Io);
}
