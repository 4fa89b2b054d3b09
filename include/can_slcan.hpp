#ifndef CANFUZZ_CAN_SLCAN_HPP
#define CANFUZZ_CAN_SLCAN_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace canfuzz {

// ============================================================================
// CAN Protocol Constants (ISO 11898)
// ============================================================================

constexpr uint32_t CAN_MAX_DLEN = 8;           // Classical CAN payload limit
constexpr uint32_t CAN_SFF_MASK = 0x000007FFU; // Standard ID mask (11 bits)
constexpr uint32_t CAN_EFF_MASK = 0x1FFFFFFFU; // Extended ID mask (29 bits)

constexpr uint32_t CAN_EFF_FLAG = 0x80000000U; // Extended Frame Format flag (id field)
constexpr uint8_t CAN_RTR_FLAG = 0x01;          // Remote Transmission Request (flags field)
constexpr uint8_t CAN_ERR_FLAG = 0x02;          // Error frame (flags field)

constexpr uint32_t CAN_BITRATE_1M = 1000000;
constexpr uint32_t CAN_BITRATE_800K = 800000;
constexpr uint32_t CAN_BITRATE_500K = 500000;
constexpr uint32_t CAN_BITRATE_250K = 250000;
constexpr uint32_t CAN_BITRATE_125K = 125000;
constexpr uint32_t CAN_BITRATE_100K = 100000;
constexpr uint32_t CAN_BITRATE_50K = 50000;
constexpr uint32_t CAN_BITRATE_20K = 20000;
constexpr uint32_t CAN_BITRATE_10K = 10000;

enum class CANErrorType : uint8_t {
    NO_ERROR = 0,
    BIT_ERROR = 1,
    STUFF_ERROR = 2,
    FORM_ERROR = 3,
    ACK_ERROR = 4,
    CRC_ERROR = 5,
    BUS_OFF = 6,
    ERROR_PASSIVE = 7
};

// ============================================================================
// CAN Frame (Classical CAN)
// ============================================================================

struct CANFrame {
    uint32_t id;                              // CAN identifier (11 or 29 bit) + EFF flag
    uint8_t dlc;                              // Data Length Code (0-8)
    uint8_t flags;                            // RTR / ERR
    std::array<uint8_t, CAN_MAX_DLEN> data;   // Payload
    uint64_t timestamp_us;                    // Adapter timestamp, 0 if not reported

    CANFrame() : id(0), dlc(0), flags(0), data{}, timestamp_us(0) {}

    // Standard data frame; false if the id or payload does not fit
    static bool fromBytes(uint32_t id, const std::vector<uint8_t>& bytes, CANFrame& frame);

    bool isExtended() const { return (id & CAN_EFF_FLAG) != 0; }
    bool isRTR() const { return (flags & CAN_RTR_FLAG) != 0; }
    bool isError() const { return (flags & CAN_ERR_FLAG) != 0; }
    uint32_t getIdentifier() const { return id & (isExtended() ? CAN_EFF_MASK : CAN_SFF_MASK); }

    std::vector<uint8_t> payload() const { return std::vector<uint8_t>(data.begin(), data.begin() + dlc); }

    void setExtended(bool extended) {
        if (extended) {
            id |= CAN_EFF_FLAG;
        } else {
            id &= ~CAN_EFF_FLAG;
        }
    }

    void setRTR(bool rtr) {
        if (rtr) {
            flags |= CAN_RTR_FLAG;
        } else {
            flags &= ~CAN_RTR_FLAG;
        }
    }
};

// "ID: 0x7E8 DLC: 3 Data: 02 50 01"
std::string to_string(const CANFrame& frame);

// ============================================================================
// SLCAN Protocol (Serial Line CAN - Lawicel Protocol)
// ============================================================================

namespace slcan {

constexpr char CMD_SETUP_STD_BITRATE = 'S';
constexpr char CMD_OPEN = 'O';
constexpr char CMD_CLOSE = 'C';
constexpr char CMD_TRANSMIT_STD = 't';
constexpr char CMD_TRANSMIT_EXT = 'T';
constexpr char CMD_TRANSMIT_STD_RTR = 'r';
constexpr char CMD_TRANSMIT_EXT_RTR = 'R';
constexpr char CMD_SET_ACR = 'M';
constexpr char CMD_SET_AMR = 'm';
constexpr char CMD_TIMESTAMP_ON = 'Z';
constexpr char CMD_TIMESTAMP_OFF = 'z';

constexpr char RESP_OK = '\r';     // Command success / terminator
constexpr char RESP_ERROR = '\x07'; // Command error (bell)

constexpr char FRAME_ERROR = 'F';   // Error/status frame (Fxxxxxxxx)

constexpr char BITRATE_10K = '0';
constexpr char BITRATE_20K = '1';
constexpr char BITRATE_50K = '2';
constexpr char BITRATE_100K = '3';
constexpr char BITRATE_125K = '4';
constexpr char BITRATE_250K = '5';
constexpr char BITRATE_500K = '6';
constexpr char BITRATE_800K = '7';
constexpr char BITRATE_1M = '8';

// Every command string is terminated with RESP_OK ('\r').
// Transmit builders return "" for anything but a classical 11-bit data frame.
class CommandBuilder {
public:
    static std::string setupBitrate(uint32_t bitrate);
    static std::string openChannel();
    static std::string closeChannel();

    static std::string transmitFrame(const CANFrame& frame);
    static std::string transmitStandardFrame(uint32_t id, const uint8_t* data, uint8_t len);

    static std::string enableTimestamp(bool enable);
    static std::string setAcceptanceFilter(uint32_t code, uint32_t mask);

    static bool isSupportedBitrate(uint32_t bitrate);

private:
    static char bitrateToCode(uint32_t bitrate);
    static std::string uint8ToHex(uint8_t value);
};

class FrameParser {
public:
    // Parse a received SLCAN line (without the trailing '\r') into a frame
    static bool parseFrame(const std::string& slcanStr, CANFrame& frame);

    // Fxxxxxxxx status report
    static bool parseErrorFrame(const std::string& slcanStr, CANFrame& frame, CANErrorType& errorType);

private:
    static bool isDataFrame(const std::string& slcanStr);
    static bool parseDataFrame(const std::string& slcanStr, size_t idDigits, CANFrame& frame);
    static bool parseHex(const std::string& text, size_t pos, size_t digits, uint32_t& value);
    static uint8_t hexCharToByte(char c);
};

} // namespace slcan

} // namespace canfuzz

#endif // CANFUZZ_CAN_SLCAN_HPP
