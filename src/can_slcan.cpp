#include "can_slcan.hpp"
#include <sstream>
#include <iomanip>
#include <cctype>
#include <algorithm>

namespace canfuzz {

// ============================================================================
// CANFrame helpers
// ============================================================================

bool CANFrame::fromBytes(uint32_t id, const std::vector<uint8_t>& bytes, CANFrame& frame) {
    if (id > CAN_SFF_MASK || bytes.size() > CAN_MAX_DLEN) {
        return false;
    }

    frame = CANFrame();
    frame.id = id;
    frame.dlc = static_cast<uint8_t>(bytes.size());
    std::copy(bytes.begin(), bytes.end(), frame.data.begin());
    return true;
}

std::string to_string(const CANFrame& frame) {
    std::ostringstream oss;
    oss << "ID: 0x" << std::hex << std::uppercase
        << std::setw(frame.isExtended() ? 8 : 3) << std::setfill('0') << frame.getIdentifier()
        << std::dec << " DLC: " << static_cast<int>(frame.dlc);

    if (frame.isError()) {
        oss << " [ERROR]";
        return oss.str();
    }
    if (frame.isRTR()) {
        oss << " [RTR]";
        return oss.str();
    }

    oss << " Data:";
    for (uint8_t i = 0; i < frame.dlc && i < CAN_MAX_DLEN; ++i) {
        oss << ' ' << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
            << static_cast<int>(frame.data[i]);
    }
    return oss.str();
}

// ============================================================================
// SLCAN CommandBuilder Implementation
// ============================================================================

namespace slcan {

bool CommandBuilder::isSupportedBitrate(uint32_t bitrate) {
    switch (bitrate) {
        case CAN_BITRATE_10K:
        case CAN_BITRATE_20K:
        case CAN_BITRATE_50K:
        case CAN_BITRATE_100K:
        case CAN_BITRATE_125K:
        case CAN_BITRATE_250K:
        case CAN_BITRATE_500K:
        case CAN_BITRATE_800K:
        case CAN_BITRATE_1M:
            return true;
        default:
            return false;
    }
}

char CommandBuilder::bitrateToCode(uint32_t bitrate) {
    switch (bitrate) {
        case CAN_BITRATE_10K:  return BITRATE_10K;
        case CAN_BITRATE_20K:  return BITRATE_20K;
        case CAN_BITRATE_50K:  return BITRATE_50K;
        case CAN_BITRATE_100K: return BITRATE_100K;
        case CAN_BITRATE_125K: return BITRATE_125K;
        case CAN_BITRATE_250K: return BITRATE_250K;
        case CAN_BITRATE_500K: return BITRATE_500K;
        case CAN_BITRATE_800K: return BITRATE_800K;
        case CAN_BITRATE_1M:   return BITRATE_1M;
        default:               return BITRATE_500K;
    }
}

std::string CommandBuilder::uint8ToHex(uint8_t value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
        << static_cast<int>(value);
    return oss.str();
}

std::string CommandBuilder::setupBitrate(uint32_t bitrate) {
    std::string cmd;
    cmd += CMD_SETUP_STD_BITRATE;
    cmd += bitrateToCode(bitrate);
    cmd += RESP_OK;
    return cmd;
}

std::string CommandBuilder::openChannel() {
    return std::string(1, CMD_OPEN) + RESP_OK;
}

std::string CommandBuilder::closeChannel() {
    return std::string(1, CMD_CLOSE) + RESP_OK;
}

std::string CommandBuilder::transmitFrame(const CANFrame& frame) {
    // Directives only describe 11-bit data frames
    if (frame.isRTR() || frame.isExtended() || frame.isError()) {
        return "";
    }
    return transmitStandardFrame(frame.getIdentifier(), frame.data.data(), frame.dlc);
}

std::string CommandBuilder::transmitStandardFrame(uint32_t id, const uint8_t* data, uint8_t len) {
    if (id > CAN_SFF_MASK || len > CAN_MAX_DLEN) {
        return "";
    }

    // tiiildd..\r
    std::ostringstream oss;
    oss << CMD_TRANSMIT_STD
        << std::hex << std::uppercase << std::setw(3) << std::setfill('0') << id
        << std::dec << static_cast<int>(len);
    for (uint8_t i = 0; i < len; ++i) {
        oss << uint8ToHex(data[i]);
    }
    oss << RESP_OK;
    return oss.str();
}

std::string CommandBuilder::enableTimestamp(bool enable) {
    std::string cmd;
    cmd += enable ? CMD_TIMESTAMP_ON : CMD_TIMESTAMP_OFF;
    cmd += RESP_OK;
    return cmd;
}

std::string CommandBuilder::setAcceptanceFilter(uint32_t code, uint32_t mask) {
    std::ostringstream oss;
    oss << CMD_SET_ACR
        << std::hex << std::uppercase << std::setw(8) << std::setfill('0') << code
        << RESP_OK
        << CMD_SET_AMR
        << std::setw(8) << std::setfill('0') << mask
        << RESP_OK;
    return oss.str();
}

// ============================================================================
// SLCAN FrameParser Implementation
// ============================================================================

uint8_t FrameParser::hexCharToByte(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return 0;
}

bool FrameParser::parseHex(const std::string& text, size_t pos, size_t digits, uint32_t& value) {
    if (pos + digits > text.size()) return false;
    value = 0;
    for (size_t i = pos; i < pos + digits; ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(text[i]))) return false;
        value = (value << 4) | hexCharToByte(text[i]);
    }
    return true;
}

bool FrameParser::isDataFrame(const std::string& slcanStr) {
    if (slcanStr.empty()) return false;

    char type = slcanStr[0];
    return (type == CMD_TRANSMIT_STD || type == CMD_TRANSMIT_EXT ||
            type == CMD_TRANSMIT_STD_RTR || type == CMD_TRANSMIT_EXT_RTR);
}

// Layout: <type><id: 3|8 hex><len: 1 digit><data: 2*len hex>[<timestamp: 4 hex>]
// RTR frames carry no data bytes.
bool FrameParser::parseDataFrame(const std::string& slcanStr, size_t idDigits, CANFrame& frame) {
    const bool isRTR = (slcanStr[0] == CMD_TRANSMIT_STD_RTR || slcanStr[0] == CMD_TRANSMIT_EXT_RTR);
    const bool extended = (idDigits == 8);

    uint32_t id = 0;
    if (!parseHex(slcanStr, 1, idDigits, id)) return false;
    if (id > (extended ? CAN_EFF_MASK : CAN_SFF_MASK)) return false;

    const size_t lenPos = 1 + idDigits;
    if (lenPos >= slcanStr.size() || !std::isdigit(static_cast<unsigned char>(slcanStr[lenPos]))) {
        return false;
    }
    const uint8_t len = static_cast<uint8_t>(slcanStr[lenPos] - '0');
    if (len > CAN_MAX_DLEN) return false;

    const size_t dataPos = lenPos + 1;
    const size_t dataDigits = isRTR ? 0 : len * 2u;
    const size_t end = dataPos + dataDigits;
    if (slcanStr.size() != end && slcanStr.size() != end + 4) return false;

    CANFrame parsed;
    parsed.id = id;
    parsed.dlc = len;
    parsed.setExtended(extended);
    parsed.setRTR(isRTR);

    for (uint8_t i = 0; i < len && !isRTR; ++i) {
        uint32_t byte = 0;
        if (!parseHex(slcanStr, dataPos + i * 2u, 2, byte)) return false;
        parsed.data[i] = static_cast<uint8_t>(byte);
    }

    if (slcanStr.size() == end + 4) {
        uint32_t timestamp_ms = 0;
        if (!parseHex(slcanStr, end, 4, timestamp_ms)) return false;
        parsed.timestamp_us = static_cast<uint64_t>(timestamp_ms) * 1000;
    }

    frame = parsed;
    return true;
}

bool FrameParser::parseFrame(const std::string& slcanStr, CANFrame& frame) {
    if (slcanStr.empty()) return false;

    const char type = slcanStr[0];
    if (type == FRAME_ERROR) {
        CANErrorType errorType;
        return parseErrorFrame(slcanStr, frame, errorType);
    }

    if (!isDataFrame(slcanStr)) return false;

    if (type == CMD_TRANSMIT_STD || type == CMD_TRANSMIT_STD_RTR) {
        return parseDataFrame(slcanStr, 3, frame);
    }
    return parseDataFrame(slcanStr, 8, frame);
}

bool FrameParser::parseErrorFrame(const std::string& slcanStr, CANFrame& frame, CANErrorType& errorType) {
    if (slcanStr.size() < 9 || slcanStr[0] != FRAME_ERROR) return false;

    uint32_t errorCode = 0;
    if (!parseHex(slcanStr, 1, 8, errorCode)) return false;

    frame = CANFrame();
    frame.id = errorCode;
    frame.flags = CAN_ERR_FLAG;

    // Error code layout is adapter specific; this is the common bit assignment
    if (errorCode & 0x0001) errorType = CANErrorType::BIT_ERROR;
    else if (errorCode & 0x0002) errorType = CANErrorType::STUFF_ERROR;
    else if (errorCode & 0x0004) errorType = CANErrorType::FORM_ERROR;
    else if (errorCode & 0x0008) errorType = CANErrorType::ACK_ERROR;
    else if (errorCode & 0x0010) errorType = CANErrorType::CRC_ERROR;
    else if (errorCode & 0x0020) errorType = CANErrorType::BUS_OFF;
    else if (errorCode & 0x0040) errorType = CANErrorType::ERROR_PASSIVE;
    else errorType = CANErrorType::NO_ERROR;

    return true;
}

} // namespace slcan

} // namespace canfuzz
