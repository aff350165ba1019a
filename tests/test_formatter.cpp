/**
 * @file test_formatter.cpp
 * @brief Unit tests for DateFormatter and the Uri transform (GoogleTest)
 */

#include <gtest/gtest.h>
#include "unbox/Decode.hpp"
#include "unbox/Formatter.hpp"
#include "unbox/Uri.hpp"

#include <chrono>
#include <optional>
#include <string>

using namespace unbox;

// ============================================================================
// DateFormatter
// ============================================================================

TEST(DateFormatterTest, DefaultPattern) {
    DateFormatter formatter;
    EXPECT_EQ(formatter.pattern(), "%Y-%m-%dT%H:%M:%S");

    auto time = formatter.format("2017-03-14T15:09:26");
    ASSERT_TRUE(time.has_value());
    EXPECT_EQ(format_time(*time), "2017-03-14T15:09:26");
}

TEST(DateFormatterTest, ParsesAsUtc) {
    DateFormatter formatter("%Y-%m-%d");

    auto epoch = formatter.format("1970-01-01");
    ASSERT_TRUE(epoch.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*epoch), 0);

    auto day = formatter.format("1970-01-02");
    ASSERT_TRUE(day.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*day), 86400);
}

TEST(DateFormatterTest, RejectsMismatchingText) {
    DateFormatter formatter("%Y-%m-%d");
    EXPECT_FALSE(formatter.format("14/03/2017").has_value());
    EXPECT_FALSE(formatter.format("").has_value());
    EXPECT_FALSE(formatter.format("not a date").has_value());
}

TEST(DateFormatterTest, RejectsTrailingInput) {
    DateFormatter formatter("%Y-%m-%d");
    EXPECT_FALSE(formatter.format("2017-03-14 and more").has_value());
}

TEST(DateFormatterTest, FormatTimePattern) {
    DateFormatter formatter("%Y-%m-%d");
    auto time = formatter.format("2020-02-29");
    ASSERT_TRUE(time.has_value());
    EXPECT_EQ(format_time(*time, "%d.%m.%Y"), "29.02.2020");
}

TEST(DateFormatterTest, OnlyStringsAreFormatted) {
    DateFormatter formatter("%Y");
    EXPECT_TRUE(apply_formatter(formatter, Value("2020")).has_value());
    EXPECT_FALSE(apply_formatter(formatter, Value(2020)).has_value());
}

TEST(DateFormatterTest, FieldErrorNamesTheValue) {
    Value tree = {{"born", "yesterday"}};
    DateFormatter formatter("%Y-%m-%d");

    auto result = decode_custom<std::string>(tree, [&formatter](Unboxer& unboxer) -> std::optional<std::string> {
        return format_time(unboxer.required_formatted("born", formatter));
    });
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().path(), "born");
    EXPECT_EQ(result.error().path_error()->kind(), PathError::Kind::InvalidValue);
    EXPECT_EQ(result.error().path_error()->value(), "yesterday");
}

// ============================================================================
// Uri
// ============================================================================

TEST(UriTest, ParsesComponents) {
    auto uri = Uri::parse("https://github.com/user/repo?tab=readme#install");
    ASSERT_TRUE(uri.has_value());
    EXPECT_EQ(uri->scheme(), "https");
    EXPECT_EQ(uri->authority(), "github.com");
    EXPECT_EQ(uri->path(), "/user/repo");
    EXPECT_EQ(uri->query(), "tab=readme");
    EXPECT_EQ(uri->fragment(), "install");
    EXPECT_TRUE(uri->is_absolute());
}

TEST(UriTest, RelativeReference) {
    auto uri = Uri::parse("/relative/path");
    ASSERT_TRUE(uri.has_value());
    EXPECT_FALSE(uri->is_absolute());
    EXPECT_EQ(uri->path(), "/relative/path");
}

TEST(UriTest, PercentEscapes) {
    EXPECT_TRUE(Uri::parse("http://example.com/a%20b").has_value());
    EXPECT_FALSE(Uri::parse("http://example.com/a%2").has_value());
    EXPECT_FALSE(Uri::parse("http://example.com/a%zz").has_value());
}

TEST(UriTest, RejectsInvalidText) {
    EXPECT_FALSE(Uri::parse("").has_value());
    EXPECT_FALSE(Uri::parse("Clearly not a URL!").has_value());
    EXPECT_FALSE(Uri::parse("http://exa mple.com").has_value());
    EXPECT_FALSE(Uri::parse("1http://example.com").has_value());
}

TEST(UriTest, ComparesByText) {
    EXPECT_EQ(*Uri::parse("a:b"), *Uri::parse("a:b"));
    EXPECT_NE(*Uri::parse("a:b"), *Uri::parse("a:c"));
    EXPECT_TRUE(*Uri::parse("a:b") < *Uri::parse("a:c"));
}

TEST(UriTest, DecodedFromField) {
    Value tree = {{"home", "https://example.com"}, {"broken", "Clearly not a URL!"}, {"number", 5}};

    auto home = decode_at<Uri>(tree, "home");
    ASSERT_TRUE(home.ok());
    EXPECT_EQ(home.value().authority(), "example.com");

    auto broken = decode_at<Uri>(tree, "broken");
    ASSERT_FALSE(broken.ok());
    EXPECT_EQ(broken.error().path_error()->kind(), PathError::Kind::InvalidValue);

    EXPECT_FALSE(decode_at<Uri>(tree, "number").ok());
}
