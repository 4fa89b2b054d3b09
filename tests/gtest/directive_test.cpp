/**
 * @file directive_test.cpp
 * @brief Directive codec: parsing, normalization and canonical output
 */

#include <gtest/gtest.h>
#include "directive.hpp"

using namespace canfuzz;

// ============================================================================
// Canonical form
// ============================================================================

TEST(DirectiveCodecTest, ParseCanonicalLine) {
  Directive d;
  ASSERT_TRUE(DirectiveCodec::parse("123#FFFFFFFF\n", d));
  EXPECT_EQ(d.arbitration_id, "123");
  EXPECT_EQ(d.payload, "FFFFFFFF");
}

TEST(DirectiveCodecTest, FormatIsExact) {
  Directive d{"123", "FFFFFFFF"};
  EXPECT_EQ(DirectiveCodec::format(d), "123#FFFFFFFF\n");
  EXPECT_EQ(DirectiveCodec::to_text(d), "123#FFFFFFFF");
}

TEST(DirectiveCodecTest, FormatOfParseIsIdentityForCanonicalLines) {
  const char* lines[] = {"123#FFFFFFFF\n", "7DF#0210030000000000\n", "000#\n", "7FF#00\n"};
  for (const char* line : lines) {
    Directive d;
    ASSERT_TRUE(DirectiveCodec::parse(line, d)) << line;
    EXPECT_EQ(DirectiveCodec::format(d), line);
  }
}

TEST(DirectiveCodecTest, EmptyPayloadIsAllowed) {
  Directive d;
  ASSERT_TRUE(DirectiveCodec::parse("7E0#", d));
  EXPECT_TRUE(d.payload.empty());
}

TEST(DirectiveCodecTest, CarriageReturnIsStripped) {
  Directive d;
  ASSERT_TRUE(DirectiveCodec::parse("7E0#1001\r\n", d));
  EXPECT_EQ(d.payload, "1001");
}

TEST(DirectiveCodecTest, SplitsOnFirstDelimiter) {
  Directive d;
  ParseError err = ParseError::None;
  EXPECT_FALSE(DirectiveCodec::parse("123#AB#CD", d, &err));
  EXPECT_EQ(err, ParseError::InvalidPayload);
}

// ============================================================================
// Lenient input
// ============================================================================

TEST(DirectiveCodecTest, LowerCaseIsNormalized) {
  Directive d;
  ASSERT_TRUE(DirectiveCodec::parse("7df#02ab", d));
  EXPECT_EQ(d.arbitration_id, "7DF");
  EXPECT_EQ(d.payload, "02AB");
}

TEST(DirectiveCodecTest, ShortIdIsPadded) {
  Directive d;
  ASSERT_TRUE(DirectiveCodec::parse("7#00", d));
  EXPECT_EQ(d.arbitration_id, "007");
}

TEST(DirectiveCodecTest, HexPrefixedByteTokens) {
  Directive d;
  ASSERT_TRUE(DirectiveCodec::parse("0x123#0xFF 0xFF 0x1 0xFF", d));
  EXPECT_EQ(d.arbitration_id, "123");
  EXPECT_EQ(d.payload, "FFFF01FF");
}

// ============================================================================
// Rejections
// ============================================================================

TEST(DirectiveCodecTest, MissingDelimiter) {
  Directive d{"001", "00"};
  ParseError err = ParseError::None;
  EXPECT_FALSE(DirectiveCodec::parse("123FFFF", d, &err));
  EXPECT_EQ(err, ParseError::MissingDelimiter);
  // Output untouched on failure
  EXPECT_EQ(d.arbitration_id, "001");
}

TEST(DirectiveCodecTest, IdTooLong) {
  Directive d;
  ParseError err = ParseError::None;
  EXPECT_FALSE(DirectiveCodec::parse("1234#FF", d, &err));
  EXPECT_EQ(err, ParseError::InvalidId);
}

TEST(DirectiveCodecTest, EmptyId) {
  Directive d;
  ParseError err = ParseError::None;
  EXPECT_FALSE(DirectiveCodec::parse("#FF", d, &err));
  EXPECT_EQ(err, ParseError::InvalidId);
}

TEST(DirectiveCodecTest, IdAbove11Bits) {
  Directive d;
  ParseError err = ParseError::None;
  EXPECT_FALSE(DirectiveCodec::parse("800#FF", d, &err));
  EXPECT_EQ(err, ParseError::IdOutOfRange);
}

TEST(DirectiveCodecTest, OddPayload) {
  Directive d;
  ParseError err = ParseError::None;
  EXPECT_FALSE(DirectiveCodec::parse("123#FFF", d, &err));
  EXPECT_EQ(err, ParseError::OddPayloadLength);
}

TEST(DirectiveCodecTest, PayloadOverEightBytes) {
  Directive d;
  ParseError err = ParseError::None;
  EXPECT_FALSE(DirectiveCodec::parse("123#000000000000000000", d, &err));
  EXPECT_EQ(err, ParseError::PayloadTooLong);
}

TEST(DirectiveCodecTest, NonHexPayload) {
  Directive d;
  ParseError err = ParseError::None;
  EXPECT_FALSE(DirectiveCodec::parse("123#GG", d, &err));
  EXPECT_EQ(err, ParseError::InvalidPayload);
}

TEST(DirectiveCodecTest, ErrorTextIsReadable) {
  EXPECT_STREQ(to_string(ParseError::IdOutOfRange), "arbitration id exceeds 0x7FF");
  EXPECT_STREQ(to_string(ParseError::None), "ok");
}

// ============================================================================
// Byte conversion
// ============================================================================

TEST(DirectiveCodecTest, ArbitrationIdValue) {
  EXPECT_EQ(DirectiveCodec::arbitration_id(Directive{"7DF", ""}), 0x7DFu);
  EXPECT_EQ(DirectiveCodec::arbitration_id(Directive{"001", ""}), 0x001u);
}

TEST(DirectiveCodecTest, PayloadBytes) {
  const auto bytes = DirectiveCodec::payload_bytes(Directive{"7E0", "021001"});
  ASSERT_EQ(bytes.size(), 3u);
  EXPECT_EQ(bytes[0], 0x02);
  EXPECT_EQ(bytes[1], 0x10);
  EXPECT_EQ(bytes[2], 0x01);
  EXPECT_EQ(DirectiveCodec::bytes_to_hex(bytes), "021001");
}
