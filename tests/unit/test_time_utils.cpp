/**
 * @file test_time_utils.cpp
 * @brief Unit tests for timestamp formatting and naming helpers.
 */

#include "core/time_utils.hpp"

#include <gtest/gtest.h>
#include <regex>
#include <set>

using namespace diagnostics_engine;

namespace {

// 2024-03-05T07:08:09.045Z
Timestamp sample_time() {
    using namespace std::chrono;
    return sys_days{year{2024} / March / 5} + hours{7} + minutes{8} + seconds{9} + milliseconds{45};
}

}  // namespace

TEST(TimeFormatTest, FileTimestamp) {
    EXPECT_EQ(format_file_timestamp(sample_time()), "2024-03-05_07.08.09.045Z");
}

TEST(TimeFormatTest, Iso8601) {
    EXPECT_EQ(format_iso8601(sample_time()), "2024-03-05T07:08:09.045Z");
}

TEST(TimeFormatTest, ManifestTimestamp) {
    EXPECT_EQ(format_manifest_timestamp(sample_time()), "2024-03-05 07:08:09.045+0000");
}

TEST(TimeFormatTest, ParseIso8601) {
    auto parsed = parse_iso8601("2024-03-05T07:08:09.045Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, sample_time());

    auto whole = parse_iso8601("2024-03-05T07:08:09Z");
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(*whole, sample_time() - Millis{45});

    EXPECT_FALSE(parse_iso8601("2024-03-05 07:08:09").has_value());
    EXPECT_FALSE(parse_iso8601("yesterday").has_value());
    EXPECT_FALSE(parse_iso8601("2024-03-05T07:08:09.Z").has_value());
}

TEST(TimeSpanTest, Formats) {
    EXPECT_EQ(format_time_span(Millis{850}), "850 ms");
    EXPECT_EQ(format_time_span(Millis{1200}), "1.2 sec");
    EXPECT_EQ(format_time_span(Millis{42'000}), "42 sec");
    EXPECT_EQ(format_time_span(Millis{184'000}), "3 min 4 sec");
    EXPECT_EQ(format_time_span(Millis{2 * 3'600'000 + 5 * 60'000}), "2 hr 5 min");
    EXPECT_EQ(format_time_span(Millis{27 * 3'600'000LL}), "1 day 3 hr");
    EXPECT_EQ(format_time_span(Millis{50 * 3'600'000LL}), "2 days 2 hr");
    EXPECT_EQ(format_time_span(Millis{-5}), "0 ms");
}

TEST(FileTimeTest, RoundTrip) {
    auto ts = std::chrono::time_point_cast<Millis>(std::chrono::system_clock::now());
    EXPECT_EQ(std::chrono::time_point_cast<Millis>(to_timestamp(to_file_time(ts))), ts);
}

TEST(IdentifierTest, RandomAlphanumeric) {
    auto text = random_alphanumeric(16);
    EXPECT_EQ(text.size(), 16u);
    EXPECT_TRUE(std::regex_match(text, std::regex{"[A-Za-z0-9]{16}"}));
}

TEST(IdentifierTest, UuidFormatAndUniqueness) {
    const std::regex pattern{"[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}"};
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto id = generate_uuid();
        EXPECT_TRUE(std::regex_match(id, pattern)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(IdentifierTest, ProcessId) {
    EXPECT_FALSE(process_id().empty());
    EXPECT_TRUE(std::regex_match(process_id(), std::regex{"[0-9]+"}));
}

TEST(PrefixLinesTest, PrefixesEveryLine) {
    EXPECT_EQ(prefix_lines("  ", "a\nb"), "  a\n  b");
    EXPECT_EQ(prefix_lines("  ", "a\nb\n"), "  a\n  b\n");
    EXPECT_EQ(prefix_lines("> ", "a\r\nb"), "> a\r\n> b");
    EXPECT_EQ(prefix_lines("  ", ""), "  ");
}
