#include "app.h"
#include "compress.h"
#include "test_utils.h"

#include <sstream>

class AppTest : public TempDirTest {
protected:
    int run(std::vector<std::string> args, bool interactive = false) {
        args.push_back("--log-file");
        args.push_back(path("app.log").string());
        out_.str("");
        err_.str("");
        return runApp(args, out_, err_, false, interactive);
    }

    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(AppTest, SuccessPrintsSummary) {
    writeFile(path("input.txt"), repeatedText(50000));

    EXPECT_EQ(run({"-q", path("input.txt").string(), path("out.gz").string()}), 0);

    std::string out = out_.str();
    EXPECT_NE(out.find("File Compression Utility"), std::string::npos);
    EXPECT_NE(out.find("Compression Summary:"), std::string::npos);
    EXPECT_NE(out.find("Source file size: 0.05 MB"), std::string::npos);
    EXPECT_NE(out.find("Compression ratio: "), std::string::npos);
    EXPECT_NE(out.find("Time elapsed: "), std::string::npos);
    EXPECT_NE(out.find("Compression completed successfully!"), std::string::npos);
    EXPECT_EQ(out.find("\033["), std::string::npos);
    EXPECT_TRUE(err_.str().empty());
    EXPECT_EQ(gunzip(path("out.gz")), readFile(path("input.txt")));
}

TEST_F(AppTest, MissingSourceExitsWithOne) {
    std::string source = path("nope.txt").string();

    EXPECT_EQ(run({source, path("out.gz").string()}), 1);

    EXPECT_NE(err_.str().find("Error: Source file '" + source + "' does not exist"), std::string::npos);
    EXPECT_EQ(out_.str().find("Compression Summary:"), std::string::npos);
    EXPECT_FALSE(fs::exists(path("out.gz")));
}

TEST_F(AppTest, UnwritableTargetExitsWithOne) {
    writeFile(path("input.txt"), "data");

    EXPECT_EQ(run({path("input.txt").string(), (testDir_ / "no" / "such" / "out.gz").string()}), 1);

    EXPECT_NE(err_.str().find("Error: IO error: "), std::string::npos);
}

TEST_F(AppTest, DiskFullExitsWithOne) {
    if (!fs::exists("/dev/full")) GTEST_SKIP() << "/dev/full not available";
    writeFile(path("random.bin"), randomBytes(3 * 1000 * 1000));

    EXPECT_EQ(run({"-q", path("random.bin").string(), "/dev/full"}), 1);

    EXPECT_NE(err_.str().find("Error: IO error: "), std::string::npos);
    EXPECT_EQ(out_.str().find("Compression Summary:"), std::string::npos);
    EXPECT_NE(readFile(path("app.log")).find("Compression failed: "), std::string::npos);
}

TEST_F(AppTest, UnknownCompressionLevelUsesDefault) {
    writeFile(path("input.txt"), repeatedText(400000));
    compressFile(path("input.txt").string(), path("default.gz").string(), CompressionLevel::Default);
    compressFile(path("input.txt").string(), path("fast.gz").string(), CompressionLevel::Fast);

    EXPECT_EQ(run({"-q", "-c", "fastest", path("input.txt").string(), path("typo.gz").string()}), 0);

    EXPECT_EQ(readFile(path("typo.gz")), readFile(path("default.gz")));
    EXPECT_NE(readFile(path("typo.gz")), readFile(path("fast.gz")));
    EXPECT_NE(readFile(path("app.log")).find("Unknown compression level 'fastest'"), std::string::npos);
}

TEST_F(AppTest, InteractiveRunDrawsProgressBar) {
    writeFile(path("input.txt"), repeatedText(kChunkSize + 100));

    EXPECT_EQ(run({path("input.txt").string(), path("out.gz").string()}, true), 0);

    std::string err = err_.str();
    EXPECT_NE(err.find("1.00 MiB/1.00 MiB"), std::string::npos);
    EXPECT_NE(err.find("Compression complete"), std::string::npos);
}

TEST_F(AppTest, QuietRunDrawsNoProgressBar) {
    writeFile(path("input.txt"), repeatedText(1000));

    EXPECT_EQ(run({"--quiet", path("input.txt").string(), path("out.gz").string()}, true), 0);

    EXPECT_TRUE(err_.str().empty());
}

TEST_F(AppTest, UsageErrorExitsWithOne) {
    EXPECT_EQ(run({"only-one-arg"}), 1);
    EXPECT_NE(err_.str().find("Usage:"), std::string::npos);
}

TEST_F(AppTest, HelpExitsWithZero) {
    EXPECT_EQ(run({"--help"}), 0);
    EXPECT_NE(out_.str().find("Usage:"), std::string::npos);
}

TEST_F(AppTest, LogRecordsCompression) {
    writeFile(path("input.txt"), "log me");

    EXPECT_EQ(run({"-q", path("input.txt").string(), path("out.gz").string()}), 0);

    std::string log = readFile(path("app.log"));
    EXPECT_NE(log.find("Compressed file: " + path("input.txt").string()), std::string::npos);
}
