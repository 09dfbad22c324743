#include <gtest/gtest.h>

#include "cli/SelectionParser.hpp"
#include "core/ingest/ImmichClient.hpp"
#include "core/source/DriveClient.hpp"
#include "utils/StringUtils.hpp"

using takeout::core::ingest::ImmichClient;
using takeout::core::ingest::UploadStatus;
using takeout::core::source::DriveClient;
using takeout::core::source::RangeStatus;
using takeout::utils::StringUtils;

// -- Content-Range --

TEST(DriveClientTest, ParsesSatisfiedRange) {
    auto range = DriveClient::parseContentRange("bytes 1024-4095/4096");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->start, 1024);
    EXPECT_EQ(range->end, 4095);
    EXPECT_EQ(range->total, 4096);
}

TEST(DriveClientTest, ParsesUnsatisfiedRange) {
    auto range = DriveClient::parseContentRange("bytes */4096");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->start, -1);
    EXPECT_EQ(range->total, 4096);
}

TEST(DriveClientTest, UnknownTotalLength) {
    auto range = DriveClient::parseContentRange("bytes 0-99/*");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->start, 0);
    EXPECT_EQ(range->total, -1);
}

TEST(DriveClientTest, RejectsMalformedRange) {
    EXPECT_FALSE(DriveClient::parseContentRange("").has_value());
    EXPECT_FALSE(DriveClient::parseContentRange("items 0-1/2").has_value());
    EXPECT_FALSE(DriveClient::parseContentRange("bytes 0-1").has_value());
    EXPECT_FALSE(DriveClient::parseContentRange("bytes x-y/z").has_value());
}

TEST(DriveClientTest, ClassifiesStatusCodes) {
    EXPECT_EQ(DriveClient::classify(200), RangeStatus::Full);
    EXPECT_EQ(DriveClient::classify(206), RangeStatus::Partial);
    EXPECT_EQ(DriveClient::classify(204), RangeStatus::Other);
    EXPECT_EQ(DriveClient::classify(416), RangeStatus::Other);
    EXPECT_EQ(DriveClient::classify(500), RangeStatus::Other);
}

// -- Upload responses --

TEST(ImmichClientTest, CreatedAsset) {
    auto result = ImmichClient::interpretResponse(201, R"({"id":"abc","status":"created"})");
    EXPECT_EQ(result.status, UploadStatus::Created);
    EXPECT_TRUE(result.isSuccess());
}

TEST(ImmichClientTest, DuplicateByStatusField) {
    auto result = ImmichClient::interpretResponse(200, R"({"id":"abc","status":"duplicate"})");
    EXPECT_EQ(result.status, UploadStatus::Duplicate);
    EXPECT_TRUE(result.isSuccess());
}

TEST(ImmichClientTest, DuplicateByMessageOnErrorStatus) {
    auto result = ImmichClient::interpretResponse(409, R"({"message":"Duplicate asset"})");
    EXPECT_EQ(result.status, UploadStatus::Duplicate);
    EXPECT_TRUE(result.isSuccess());
}

TEST(ImmichClientTest, ServerErrorIsFailure) {
    auto result = ImmichClient::interpretResponse(500, R"({"message":"Internal server error"})");
    EXPECT_EQ(result.status, UploadStatus::Failed);
    EXPECT_FALSE(result.isSuccess());
    EXPECT_EQ(result.message, "HTTP 500: Internal server error");
}

TEST(ImmichClientTest, NonJsonBody) {
    auto result = ImmichClient::interpretResponse(502, "<html>Bad Gateway</html>");
    EXPECT_EQ(result.status, UploadStatus::Failed);
    EXPECT_EQ(result.message, "HTTP 502");

    EXPECT_EQ(ImmichClient::interpretResponse(201, "").status, UploadStatus::Created);
}

// -- Selection prompts --

TEST(SelectionParserTest, All) {
    auto selection = takeout::cli::parseSelection(" ALL ", 3);
    ASSERT_TRUE(selection.has_value());
    EXPECT_EQ(*selection, (std::vector<size_t>{0, 1, 2}));
}

TEST(SelectionParserTest, NumbersInInputOrder) {
    auto selection = takeout::cli::parseSelection("3, 1,3", 4);
    ASSERT_TRUE(selection.has_value());
    EXPECT_EQ(*selection, (std::vector<size_t>{2, 0}));
}

TEST(SelectionParserTest, RejectsInvalid) {
    EXPECT_FALSE(takeout::cli::parseSelection("", 3).has_value());
    EXPECT_FALSE(takeout::cli::parseSelection("0", 3).has_value());
    EXPECT_FALSE(takeout::cli::parseSelection("4", 3).has_value());
    EXPECT_FALSE(takeout::cli::parseSelection("1,two", 3).has_value());
    EXPECT_FALSE(takeout::cli::parseSelection(",,", 3).has_value());
    EXPECT_FALSE(takeout::cli::parseSelection("all", 0).has_value());
}

TEST(SelectionParserTest, Confirmation) {
    EXPECT_TRUE(takeout::cli::parseConfirmation(""));
    EXPECT_TRUE(takeout::cli::parseConfirmation("y"));
    EXPECT_TRUE(takeout::cli::parseConfirmation(" Yes "));
    EXPECT_FALSE(takeout::cli::parseConfirmation("n"));
    EXPECT_FALSE(takeout::cli::parseConfirmation("nope"));
}

// -- String helpers --

TEST(StringUtilsTest, Iso8601RoundTrip) {
    auto parsed = StringUtils::parseIso8601("2024-03-01T12:30:45Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(StringUtils::toIso8601(*parsed), "2024-03-01T12:30:45Z");
}

TEST(StringUtilsTest, Iso8601Offsets) {
    auto utc = StringUtils::parseIso8601("2024-03-01T10:30:45Z");
    auto offset = StringUtils::parseIso8601("2024-03-01T12:30:45.250+02:00");
    ASSERT_TRUE(utc.has_value());
    ASSERT_TRUE(offset.has_value());
    EXPECT_EQ(*utc, *offset);
    EXPECT_FALSE(StringUtils::parseIso8601("yesterday").has_value());
}

TEST(StringUtilsTest, SanitizeFileName) {
    EXPECT_EQ(StringUtils::sanitizeFileName("takeout-001.zip"), "takeout-001.zip");
    EXPECT_EQ(StringUtils::sanitizeFileName("../etc/passwd"), ".._etc_passwd");
    EXPECT_EQ(StringUtils::sanitizeFileName("a:b*c?.zip"), "a_b_c_.zip");
    EXPECT_EQ(StringUtils::sanitizeFileName(".."), "unnamed");
    EXPECT_EQ(StringUtils::sanitizeFileName(""), "unnamed");
}

TEST(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::formatBytes(512), "512 B");
    EXPECT_EQ(StringUtils::formatBytes(1536), "1.5 KB");
}

TEST(StringUtilsTest, SanitizeUtf8) {
    EXPECT_EQ(StringUtils::sanitizeUtf8("plain.jpg"), "plain.jpg");
    EXPECT_EQ(StringUtils::sanitizeUtf8("\xE6\x97\xA5\xF0\x9F\x93\xB7"), "\xE6\x97\xA5\xF0\x9F\x93\xB7");
    EXPECT_EQ(StringUtils::sanitizeUtf8("a\xffb"), "a\xEF\xBF\xBD" "b");
    // Overlong slash, encoded surrogate, truncated sequence
    EXPECT_EQ(StringUtils::sanitizeUtf8("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(StringUtils::sanitizeUtf8("\xED\xA0\x80"), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(StringUtils::sanitizeUtf8("x\xE6\x97"), "x\xEF\xBF\xBD\xEF\xBF\xBD");
}
