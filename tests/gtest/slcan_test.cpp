/**
 * @file slcan_test.cpp
 * @brief SLCAN (Lawicel) command building and frame parsing
 */

#include <gtest/gtest.h>
#include "can_slcan.hpp"

using namespace canfuzz;
using namespace canfuzz::slcan;

// ============================================================================
// CANFrame
// ============================================================================

TEST(CANFrameTest, FromBytesStandardFrame) {
  CANFrame f;
  ASSERT_TRUE(CANFrame::fromBytes(0x7DF, {0x02, 0x10, 0x03}, f));
  EXPECT_EQ(f.getIdentifier(), 0x7DFu);
  EXPECT_EQ(f.dlc, 3);
  EXPECT_EQ(f.payload(), (std::vector<uint8_t>{0x02, 0x10, 0x03}));
  EXPECT_FALSE(f.isExtended());
  EXPECT_FALSE(f.isRTR());
}

TEST(CANFrameTest, FromBytesRejectsOutOfRange) {
  CANFrame f;
  EXPECT_FALSE(CANFrame::fromBytes(0x800, {0x00}, f));
  EXPECT_FALSE(CANFrame::fromBytes(0x123, std::vector<uint8_t>(9, 0), f));
}

TEST(CANFrameTest, ToString) {
  CANFrame f;
  ASSERT_TRUE(CANFrame::fromBytes(0x7E8, {0x02, 0x50, 0x01}, f));
  EXPECT_EQ(to_string(f), "ID: 0x7E8 DLC: 3 Data: 02 50 01");

  CANFrame empty;
  ASSERT_TRUE(CANFrame::fromBytes(0x001, {}, empty));
  EXPECT_EQ(to_string(empty), "ID: 0x001 DLC: 0 Data:");
}

// ============================================================================
// CommandBuilder
// ============================================================================

TEST(SLCANCommandTest, SetupAndChannelCommands) {
  EXPECT_EQ(CommandBuilder::setupBitrate(500000), "S6\r");
  EXPECT_EQ(CommandBuilder::setupBitrate(1000000), "S8\r");
  EXPECT_EQ(CommandBuilder::openChannel(), "O\r");
  EXPECT_EQ(CommandBuilder::closeChannel(), "C\r");
  EXPECT_EQ(CommandBuilder::enableTimestamp(true), "Z\r");
  EXPECT_EQ(CommandBuilder::enableTimestamp(false), "z\r");
}

TEST(SLCANCommandTest, SupportedBitrates) {
  EXPECT_TRUE(CommandBuilder::isSupportedBitrate(250000));
  EXPECT_TRUE(CommandBuilder::isSupportedBitrate(10000));
  EXPECT_FALSE(CommandBuilder::isSupportedBitrate(333333));
}

TEST(SLCANCommandTest, TransmitStandardFrame) {
  CANFrame f;
  ASSERT_TRUE(CANFrame::fromBytes(0x123, {0xFF, 0xFF, 0xFF, 0xFF}, f));
  EXPECT_EQ(CommandBuilder::transmitFrame(f), "t1234FFFFFFFF\r");
}

TEST(SLCANCommandTest, TransmitZeroLengthFrame) {
  CANFrame f;
  ASSERT_TRUE(CANFrame::fromBytes(0x00A, {}, f));
  EXPECT_EQ(CommandBuilder::transmitFrame(f), "t00A0\r");
}

TEST(SLCANCommandTest, TransmitOnlyClassicalDataFrames) {
  CANFrame rtr;
  ASSERT_TRUE(CANFrame::fromBytes(0x123, {0x00, 0x00}, rtr));
  rtr.setRTR(true);
  EXPECT_EQ(CommandBuilder::transmitFrame(rtr), "");

  CANFrame extended;
  ASSERT_TRUE(FrameParser::parseFrame("T18DAF1101AB", extended));
  EXPECT_EQ(CommandBuilder::transmitFrame(extended), "");

  CANFrame error;
  ASSERT_TRUE(FrameParser::parseFrame("F00000008", error));
  EXPECT_EQ(CommandBuilder::transmitFrame(error), "");
}

TEST(SLCANCommandTest, TransmitRejectsFramesThatDoNotFit) {
  const uint8_t data[9] = {};
  EXPECT_EQ(CommandBuilder::transmitStandardFrame(0x800, data, 1), "");
  EXPECT_EQ(CommandBuilder::transmitStandardFrame(0x123, data, 9), "");
}

TEST(SLCANCommandTest, AcceptanceFilter) {
  EXPECT_EQ(CommandBuilder::setAcceptanceFilter(0x7E8, 0x7FF), "M000007E8\rm000007FF\r");
}

// ============================================================================
// FrameParser
// ============================================================================

TEST(SLCANParserTest, StandardDataFrame) {
  CANFrame f;
  ASSERT_TRUE(FrameParser::parseFrame("t7E83025001", f));
  EXPECT_EQ(f.getIdentifier(), 0x7E8u);
  EXPECT_EQ(f.dlc, 3);
  EXPECT_EQ(f.data[0], 0x02);
  EXPECT_EQ(f.data[2], 0x01);
  EXPECT_EQ(f.timestamp_us, 0u);
}

TEST(SLCANParserTest, TimestampSuffix) {
  CANFrame f;
  ASSERT_TRUE(FrameParser::parseFrame("t7E81AA1234", f));
  EXPECT_EQ(f.data[0], 0xAA);
  EXPECT_EQ(f.timestamp_us, 0x1234u * 1000);
}

TEST(SLCANParserTest, ExtendedFrame) {
  CANFrame f;
  ASSERT_TRUE(FrameParser::parseFrame("T18DAF1102AABB", f));
  EXPECT_TRUE(f.isExtended());
  EXPECT_EQ(f.getIdentifier(), 0x18DAF110u);
  EXPECT_EQ(f.dlc, 2);
}

TEST(SLCANParserTest, RemoteFrame) {
  CANFrame f;
  ASSERT_TRUE(FrameParser::parseFrame("r1238", f));
  EXPECT_TRUE(f.isRTR());
  EXPECT_EQ(f.dlc, 8);
}

TEST(SLCANParserTest, RejectsMalformedFrames) {
  CANFrame f;
  EXPECT_FALSE(FrameParser::parseFrame("", f));
  EXPECT_FALSE(FrameParser::parseFrame("x123", f));
  EXPECT_FALSE(FrameParser::parseFrame("t12", f));
  EXPECT_FALSE(FrameParser::parseFrame("t1239", f));       // DLC above 8
  EXPECT_FALSE(FrameParser::parseFrame("t1232AA", f));     // short data
  EXPECT_FALSE(FrameParser::parseFrame("t1231AABB", f));   // trailing junk
  EXPECT_FALSE(FrameParser::parseFrame("t8001AA", f));     // id above 0x7FF
  EXPECT_FALSE(FrameParser::parseFrame("t1231GG", f));
}

TEST(SLCANParserTest, ErrorFrame) {
  CANFrame f;
  CANErrorType type = CANErrorType::NO_ERROR;
  ASSERT_TRUE(FrameParser::parseErrorFrame("F00000008", f, type));
  EXPECT_TRUE(f.isError());
  EXPECT_EQ(type, CANErrorType::ACK_ERROR);

  CANFrame viaParse;
  ASSERT_TRUE(FrameParser::parseFrame("F00000020", viaParse));
  EXPECT_TRUE(viaParse.isError());
  EXPECT_NE(to_string(viaParse).find("[ERROR]"), std::string::npos);
}
