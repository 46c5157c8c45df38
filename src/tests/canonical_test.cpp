#include <gtest/gtest.h>
#include <stdexcept>
#include "record/canonical.hpp"

using namespace farmtrace::record;

TEST(CanonicalTest, JoinFieldsUsesDelimiter) {
  EXPECT_EQ(join_fields({"did:farmer:1", "wheat", "x"}), "did:farmer:1-wheat-x");
  EXPECT_EQ(join_fields({"only"}), "only");
  // Delimiters inside fields are not escaped
  EXPECT_EQ(join_fields({"a-b", "c"}), "a-b-c");
}

TEST(CanonicalTest, FormatNumber) {
  EXPECT_EQ(format_number(100.0), "100");
  EXPECT_EQ(format_number(12.5), "12.5");
  EXPECT_EQ(format_number(0.1), "0.1");
  EXPECT_EQ(format_number(-73.85), "-73.85");
}

TEST(CanonicalTest, FormatNumberDebug) {
  EXPECT_EQ(format_number_debug(22.0), "22.0");
  EXPECT_EQ(format_number_debug(22.5), "22.5");
  EXPECT_EQ(format_number_debug(0.0), "0.0");
  EXPECT_EQ(format_number_debug(1e16), "1e16");
  EXPECT_EQ(format_number_debug(0.00001), "1e-5");
}

TEST(CanonicalTest, FormatOptionalDebug) {
  EXPECT_EQ(format_optional_debug(22.0), "Some(22.0)");
  EXPECT_EQ(format_optional_debug(std::nullopt), "None");
}

TEST(CanonicalTest, TimestampDisplayAndRfc3339) {
  Timestamp ts = parse_timestamp_rfc3339("2024-05-01T10:20:30Z");
  EXPECT_EQ(format_timestamp_display(ts), "2024-05-01 10:20:30 UTC");
  EXPECT_EQ(format_timestamp_rfc3339(ts), "2024-05-01T10:20:30Z");
}

TEST(CanonicalTest, FractionalSecondsUseShortestExactWidth) {
  EXPECT_EQ(format_timestamp_rfc3339(parse_timestamp_rfc3339("2024-05-01T10:20:30.5Z")),
            "2024-05-01T10:20:30.500Z");
  EXPECT_EQ(format_timestamp_rfc3339(parse_timestamp_rfc3339("2024-05-01T10:20:30.123456Z")),
            "2024-05-01T10:20:30.123456Z");
  EXPECT_EQ(format_timestamp_display(parse_timestamp_rfc3339("2024-05-01T10:20:30.123456789Z")),
            "2024-05-01 10:20:30.123456789 UTC");
}

TEST(CanonicalTest, ParseOffsetsNormalizeToUtc) {
  EXPECT_EQ(parse_timestamp_rfc3339("2024-05-01T15:50:30+05:30"),
            parse_timestamp_rfc3339("2024-05-01T10:20:30Z"));
  EXPECT_EQ(parse_timestamp_rfc3339("2024-05-01 10:20:30Z"),
            parse_timestamp_rfc3339("2024-05-01T10:20:30Z"));
}

TEST(CanonicalTest, ParseRejectsMalformed) {
  EXPECT_THROW(parse_timestamp_rfc3339("2024-05-01"), std::invalid_argument);
  EXPECT_THROW(parse_timestamp_rfc3339("2024-13-01T10:20:30Z"), std::invalid_argument);
  EXPECT_THROW(parse_timestamp_rfc3339("2024-05-01T10:20:30"), std::invalid_argument);
  EXPECT_THROW(parse_timestamp_rfc3339("2024-05-01T10:20:30Zjunk"), std::invalid_argument);
}
