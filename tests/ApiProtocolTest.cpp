#include <gtest/gtest.h>

#include <transport/ApiProtocol.hpp>
#include <vector>

namespace Api = MediaUpload::Api;
using MediaUpload::ChunkPlan;
using MediaUpload::TokenStatus;
using MediaUpload::UploadError;

TEST(ApiProtocolTest, ActionUrlIgnoresTrailingSlash) {
    EXPECT_EQ(Api::actionUrl("https://www.kaltura.com", Api::kActionUpload),
              "https://www.kaltura.com/api_v3/service/uploadtoken/action/upload");
    EXPECT_EQ(Api::actionUrl("https://host//", Api::kActionGet),
              "https://host/api_v3/service/uploadtoken/action/get");
}

TEST(ApiProtocolTest, ChunkFieldsForFirstChunk) {
    const ChunkPlan plan{.offset = 0, .isFinal = false, .isResume = false};
    EXPECT_EQ(Api::chunkFields(plan),
              (std::vector<Api::FormField>{{"resume", "0"},
                                           {"resumeAt", "0"},
                                           {"finalChunk", "0"}}));
    EXPECT_EQ(Api::chunkFileName(0), "chunk_0");
}

TEST(ApiProtocolTest, ChunkFieldsForFinalResumedChunk) {
    const ChunkPlan plan{.offset = 4194304, .isFinal = true, .isResume = true};
    EXPECT_EQ(Api::chunkFields(plan),
              (std::vector<Api::FormField>{{"resume", "1"},
                                           {"resumeAt", "4194304"},
                                           {"finalChunk", "1"}}));
    EXPECT_EQ(Api::chunkFileName(4194304), "chunk_4194304");
}

TEST(ApiProtocolTest, CreateTokenFields) {
    const auto fields = Api::createTokenFields("clip.mp4", 5242880);
    ASSERT_EQ(fields.size(), 3U);
    EXPECT_EQ(fields[0], (Api::FormField{"uploadToken[objectType]",
                                         "KalturaUploadToken"}));
    EXPECT_EQ(fields[1], (Api::FormField{"uploadToken[fileName]", "clip.mp4"}));
    EXPECT_EQ(fields[2], (Api::FormField{"uploadToken[fileSize]", "5242880"}));
}

TEST(ApiProtocolTest, HttpStatusClassification) {
    for (long code : {408L, 429L, 500L, 502L, 503L}) {
        EXPECT_TRUE(Api::classifyHttpStatus(code, "").retryable()) << code;
    }
    for (long code : {400L, 401L, 403L, 404L, 413L}) {
        const auto error = Api::classifyHttpStatus(code, "nope");
        EXPECT_EQ(error.kind, UploadError::Kind::Protocol) << code;
    }
    EXPECT_EQ(Api::classifyHttpStatus(403, "").cause.code(),
              absl::StatusCode::kPermissionDenied);
    EXPECT_EQ(Api::classifyHttpStatus(404, "").cause.code(),
              absl::StatusCode::kNotFound);
}

TEST(ApiProtocolTest, ParsesTokenHandle) {
    auto json = Api::parseResponse(
        R"({"objectType":"KalturaUploadToken","id":"0_abc","status":0})");
    ASSERT_TRUE(json.has_value()) << json.error();
    auto handle = Api::parseTokenHandle(*json);
    ASSERT_TRUE(handle.has_value()) << handle.error();
    EXPECT_EQ(handle->id, "0_abc");
    EXPECT_EQ(handle->status, TokenStatus::Pending);
}

TEST(ApiProtocolTest, TokenWithoutIdIsProtocolError) {
    auto json = Api::parseResponse(R"({"objectType":"KalturaUploadToken"})");
    ASSERT_TRUE(json.has_value());
    auto handle = Api::parseTokenHandle(*json);
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().kind, UploadError::Kind::Protocol);
}

TEST(ApiProtocolTest, ParsesTokenStatusWithFloatSize) {
    auto json = Api::parseResponse(
        R"({"id":"0_abc","status":2,"uploadedFileSize":5242880.0})");
    ASSERT_TRUE(json.has_value());
    auto status = Api::parseTokenStatus(*json);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->status, TokenStatus::Full);
    EXPECT_EQ(status->uploadedBytes, 5242880U);
}

TEST(ApiProtocolTest, ParsesTokenStatusFromStrings) {
    auto json =
        Api::parseResponse(R"({"status":"1","uploadedFileSize":"1024"})");
    ASSERT_TRUE(json.has_value());
    auto status = Api::parseTokenStatus(*json);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->status, TokenStatus::Partial);
    EXPECT_EQ(status->uploadedBytes, 1024U);
}

TEST(ApiProtocolTest, UnknownStatusCodes) {
    EXPECT_EQ(Api::toTokenStatus(3), TokenStatus::Unknown);
    EXPECT_EQ(Api::toTokenStatus(5), TokenStatus::Unknown);
    EXPECT_EQ(Api::toTokenStatus(-1), TokenStatus::Unknown);
}

TEST(ApiProtocolTest, ApiExceptionIsProtocolError) {
    auto json = Api::parseResponse(
        R"({"objectType":"KalturaAPIException","code":"INVALID_KS",)"
        R"("message":"Invalid KS"})");
    ASSERT_FALSE(json.has_value());
    EXPECT_EQ(json.error().kind, UploadError::Kind::Protocol);
    EXPECT_EQ(json.error().cause.message(), "INVALID_KS: Invalid KS");
}

TEST(ApiProtocolTest, MalformedJsonIsProtocolError) {
    auto json = Api::parseResponse("<html>502 Bad Gateway</html>");
    ASSERT_FALSE(json.has_value());
    EXPECT_EQ(json.error().kind, UploadError::Kind::Protocol);
}

TEST(ApiProtocolTest, EmptyBodyIsNull) {
    auto json = Api::parseResponse("  \n");
    ASSERT_TRUE(json.has_value());
    EXPECT_TRUE(json->isNull());
}
