#include <gtest/gtest.h>

#include <ConfigManager.hpp>
#include <filesystem>
#include <upload/UploaderOptions.hpp>

#include "GetCommandLine.hpp"

using MediaUpload::ConfigManager;
using MediaUpload::UploaderOptions;

namespace {

absl::StatusOr<UploaderOptions> fromArgs(const FakeCommandLine& line) {
    const ConfigManager config(
        line.get(),
        std::filesystem::path(testing::TempDir()) / "no_such_config.ini");
    return UploaderOptions::fromConfig(config);
}

}  // namespace

TEST(UploaderOptionsTest, DefaultsEnableAdaptiveChunking) {
    FakeCommandLine line{};
    auto options = fromArgs(line);
    ASSERT_TRUE(options.ok()) << options.status();
    EXPECT_DOUBLE_EQ(options->chunking.initialSizeKB, 2048);
    EXPECT_DOUBLE_EQ(options->chunking.minSizeKB, 1024);
    EXPECT_DOUBLE_EQ(options->chunking.maxSizeKB, 102400);
    EXPECT_DOUBLE_EQ(options->chunking.targetSecondsPerChunk, 5.0);
    EXPECT_TRUE(options->chunking.adaptive);
    EXPECT_EQ(options->requestTimeout, std::chrono::seconds(30));
    EXPECT_EQ(options->chunkRetry.maxAttempts, 5);
    EXPECT_EQ(options->finalizePoll.maxAttempts, 5);
}

TEST(UploaderOptionsTest, ReadsEveryValue) {
    FakeCommandLine line{"--CHUNK_SIZE_KB=4096",      "--MIN_CHUNK_SIZE_KB=512",
                         "--MAX_CHUNK_SIZE_KB=8192",  "--TARGET_UPLOAD_TIME=2.5",
                         "--ADAPTIVE_CHUNKING=false", "--REQUEST_TIMEOUT=10"};
    auto options = fromArgs(line);
    ASSERT_TRUE(options.ok()) << options.status();
    EXPECT_DOUBLE_EQ(options->chunking.initialSizeKB, 4096);
    EXPECT_DOUBLE_EQ(options->chunking.minSizeKB, 512);
    EXPECT_DOUBLE_EQ(options->chunking.maxSizeKB, 8192);
    EXPECT_DOUBLE_EQ(options->chunking.targetSecondsPerChunk, 2.5);
    EXPECT_FALSE(options->chunking.adaptive);
    EXPECT_EQ(options->requestTimeout, std::chrono::seconds(10));
}

TEST(UploaderOptionsTest, RejectsNonNumericValues) {
    FakeCommandLine line{"--CHUNK_SIZE_KB=big"};
    auto options = fromArgs(line);
    ASSERT_FALSE(options.ok());
    EXPECT_EQ(options.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(options.status().message(),
              "CHUNK_SIZE_KB: 'big' is not an integer");
}

TEST(UploaderOptionsTest, RejectsZeroChunkSize) {
    FakeCommandLine line{"--CHUNK_SIZE_KB=0"};
    EXPECT_EQ(fromArgs(line).status().code(),
              absl::StatusCode::kInvalidArgument);
}

TEST(UploaderOptionsTest, RejectsInvertedBounds) {
    FakeCommandLine line{"--MIN_CHUNK_SIZE_KB=4096", "--MAX_CHUNK_SIZE_KB=1024"};
    EXPECT_FALSE(fromArgs(line).ok());
}

TEST(UploaderOptionsTest, RejectsNonPositiveTargetTime) {
    FakeCommandLine line{"--TARGET_UPLOAD_TIME=0"};
    EXPECT_FALSE(fromArgs(line).ok());
}

TEST(UploaderOptionsTest, ValidateAcceptsDefaults) {
    EXPECT_TRUE(UploaderOptions{}.validate().ok());
}
