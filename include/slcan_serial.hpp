#ifndef CANFUZZ_SLCAN_SERIAL_HPP
#define CANFUZZ_SLCAN_SERIAL_HPP

#include "can_driver.hpp"
#include "can_slcan.hpp"
#include <termios.h>
#include <sys/types.h>
#include <string>
#include <chrono>
#include <deque>
#include <mutex>

namespace canfuzz {
namespace slcan {

/// SLCAN serial driver implementing ICanDriver
/// Manages serial port, SLCAN protocol initialization, and frame TX/RX
class SerialDriver : public ICanDriver {
public:
  SerialDriver() = default;
  ~SerialDriver() override;

  // Non-copyable
  SerialDriver(const SerialDriver&) = delete;
  SerialDriver& operator=(const SerialDriver&) = delete;

  /// Open serial port and initialize SLCAN
  /// @param device Path like "/dev/ttyUSB0" or "/dev/ttyACM0"
  /// @param bitrate CAN bitrate (e.g. 500000, 250000)
  /// @param filter_id Optional ID filter (0 = accept all)
  /// @param filter_mask Optional ID mask (0 = accept all)
  bool open(const std::string& device, uint32_t bitrate,
            uint32_t filter_id = 0, uint32_t filter_mask = 0);

  /// Close channel and serial port
  void close();

  bool is_open() const { return fd_ >= 0; }

  // ICanDriver interface
  bool send(const CANFrame& f) override;
  bool recv(CANFrame& f, std::chrono::microseconds timeout) override;

  struct Statistics {
    uint64_t frames_sent = 0;
    uint64_t frames_received = 0;
    uint64_t error_frames = 0;
    uint64_t parse_errors = 0;
    uint64_t tx_failures = 0;
  };

  const Statistics& stats() const { return stats_; }

private:
  bool open_serial(const std::string& device);
  void close_serial();
  bool write_command(const std::string& cmd, std::chrono::microseconds timeout);
  bool read_until_cr(std::string& line, std::chrono::microseconds timeout);
  ssize_t read_raw(uint8_t* buf, size_t maxlen, std::chrono::microseconds timeout);

  bool init_slcan(uint32_t bitrate, uint32_t filter_id, uint32_t filter_mask);

  bool await_ack(std::chrono::microseconds timeout);
  void buffer_line(const std::string& line);
  bool pop_buffered(CANFrame& f);

  int fd_{-1};
  struct termios orig_termios_{};
  bool termios_saved_{false};

  // Partial line carried across reads that time out mid-frame
  std::string line_buf_;

  // Frames that arrived while waiting for a command acknowledgement
  std::deque<CANFrame> rx_queue_;
  std::mutex rx_mutex_;

  Statistics stats_{};
};

} // namespace slcan
} // namespace canfuzz

#endif // CANFUZZ_SLCAN_SERIAL_HPP
