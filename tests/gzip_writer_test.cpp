#include "compress.h"
#include "gzip_writer.h"
#include "test_utils.h"

class GzipWriterTest : public TempDirTest {};

TEST_F(GzipWriterTest, WritesSingleMemberGzip) {
    {
        GzipWriter writer(path("out.gz").string(), 9);
        writer.write("hello ", 6);
        writer.write("", 0);
        writer.write("world", 5);
        writer.finish();
    }

    std::string raw = readFile(path("out.gz"));
    ASSERT_GE(raw.size(), 18u);
    EXPECT_EQ(static_cast<unsigned char>(raw[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>(raw[1]), 0x8b);
    EXPECT_EQ(raw[2], 8);
    // ISIZE trailer, little-endian
    EXPECT_EQ(static_cast<unsigned char>(raw[raw.size() - 4]), 11);
    EXPECT_EQ(gunzip(path("out.gz")), "hello world");
}

TEST_F(GzipWriterTest, DestructorClosesUnfinishedStream) {
    {
        GzipWriter writer(path("out.gz").string(), 6);
        writer.write("abandoned", 9);
    }
    EXPECT_EQ(gunzip(path("out.gz")), "abandoned");
}

TEST_F(GzipWriterTest, WriteAfterFinishThrows) {
    GzipWriter writer(path("out.gz").string(), 1);
    writer.finish();
    EXPECT_NO_THROW(writer.finish());
    EXPECT_THROW(writer.write("x", 1), CompressionError);
}

TEST_F(GzipWriterTest, WriteToFullDeviceThrows) {
    if (!fs::exists("/dev/full")) GTEST_SKIP() << "/dev/full not available";
    std::string data = randomBytes(1 << 20);

    GzipWriter writer("/dev/full", 6);
    try {
        writer.write(data.data(), data.size());
        FAIL() << "expected CompressionError";
    } catch (const CompressionError &ex) {
        EXPECT_EQ(ex.kind(), CompressionError::Kind::IoError);
        EXPECT_NE(std::string(ex.what()).find("Failed to write '/dev/full'"), std::string::npos);
    }
}

TEST_F(GzipWriterTest, FinishOnFullDeviceThrows) {
    if (!fs::exists("/dev/full")) GTEST_SKIP() << "/dev/full not available";

    GzipWriter writer("/dev/full", 6);
    writer.write("short", 5);
    try {
        writer.finish();
        FAIL() << "expected CompressionError";
    } catch (const CompressionError &ex) {
        EXPECT_EQ(ex.kind(), CompressionError::Kind::IoError);
        EXPECT_NE(std::string(ex.what()).find("Failed to finalize '/dev/full'"), std::string::npos);
    }
    EXPECT_NO_THROW(writer.finish());
}

TEST_F(GzipWriterTest, OpenFailureIsIoError) {
    try {
        GzipWriter writer((testDir_ / "absent" / "out.gz").string(), 6);
        FAIL() << "expected CompressionError";
    } catch (const CompressionError &ex) {
        EXPECT_EQ(ex.kind(), CompressionError::Kind::IoError);
    }
}
