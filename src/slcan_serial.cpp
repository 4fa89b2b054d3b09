#include "slcan_serial.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/select.h>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace canfuzz {
namespace slcan {

namespace {

bool is_ack(const std::string& line) {
  // Bare CR for setup commands, 'z' / 'Z' after t / T transmit
  return line.empty() || line == "z" || line == "Z";
}

bool is_bell(const std::string& line) {
  return line.size() == 1 && line[0] == RESP_ERROR;
}

} // namespace

SerialDriver::~SerialDriver() {
  close();
}

void SerialDriver::close() {
  if (fd_ >= 0) {
    // Best effort: the adapter may already be gone
    if (!write_command(CommandBuilder::closeChannel(), std::chrono::milliseconds(100))) {
      std::cerr << "SLCAN close command not acknowledged\n";
    }
    close_serial();
  }
}

bool SerialDriver::open(const std::string& device, uint32_t bitrate,
                        uint32_t filter_id, uint32_t filter_mask) {
  if (!CommandBuilder::isSupportedBitrate(bitrate)) {
    std::cerr << "Unsupported SLCAN bitrate " << bitrate << "\n";
    return false;
  }
  if (!open_serial(device)) return false;
  if (!init_slcan(bitrate, filter_id, filter_mask)) {
    close_serial();
    return false;
  }
  return true;
}

bool SerialDriver::open_serial(const std::string& device) {
  fd_ = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    std::cerr << "Failed to open " << device << ": " << strerror(errno) << "\n";
    return false;
  }

  if (tcgetattr(fd_, &orig_termios_) < 0) {
    std::cerr << "tcgetattr failed: " << strerror(errno) << "\n";
    ::close(fd_); fd_ = -1;
    return false;
  }
  termios_saved_ = true;

  // Raw mode: 8N1, no parity, no flow control
  struct termios tio = orig_termios_;
  cfmakeraw(&tio);
  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~(PARENB | CSTOPB | CSIZE);
  tio.c_cflag |= CS8;
  tio.c_iflag &= ~(IXON | IXOFF | IXANY);
  tio.c_oflag &= ~OPOST;
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;

  // Most SLCAN adapters use 115200 baud by default
  cfsetispeed(&tio, B115200);
  cfsetospeed(&tio, B115200);

  if (tcsetattr(fd_, TCSANOW, &tio) < 0) {
    std::cerr << "tcsetattr failed: " << strerror(errno) << "\n";
    close_serial();
    return false;
  }

  tcflush(fd_, TCIOFLUSH);
  line_buf_.clear();
  return true;
}

void SerialDriver::close_serial() {
  if (fd_ >= 0) {
    if (termios_saved_) {
      tcsetattr(fd_, TCSANOW, &orig_termios_);
    }
    ::close(fd_);
    fd_ = -1;
    termios_saved_ = false;
  }
}

ssize_t SerialDriver::read_raw(uint8_t* buf, size_t maxlen, std::chrono::microseconds timeout) {
  if (fd_ < 0) return -1;

  fd_set rfds;
  struct timeval tv;
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000000);
  tv.tv_usec = static_cast<suseconds_t>(timeout.count() % 1000000);

  FD_ZERO(&rfds);
  FD_SET(fd_, &rfds);

  int ret = select(fd_ + 1, &rfds, nullptr, nullptr, &tv);
  if (ret < 0 && errno == EINTR) return 0; // signal; caller re-checks its deadline
  if (ret <= 0) return ret;

  ssize_t n = ::read(fd_, buf, maxlen);
  if (n < 0 && (errno == EAGAIN || errno == EINTR)) return 0;
  return n;
}

// Returns one CR-terminated line (possibly empty, i.e. a bare acknowledgement).
// A bell byte is returned as a one-character line.
bool SerialDriver::read_until_cr(std::string& line, std::chrono::microseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  uint8_t ch;

  for (;;) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return false;
    auto remain = std::chrono::duration_cast<std::chrono::microseconds>(deadline - now);

    ssize_t n = read_raw(&ch, 1, remain);
    if (n < 0) return false;
    if (n == 0) continue;

    if (ch == '\n') continue;
    if (ch == '\r') {
      line = line_buf_;
      line_buf_.clear();
      return true;
    }
    if (ch == static_cast<uint8_t>(RESP_ERROR)) {
      line_buf_.clear();
      line.assign(1, RESP_ERROR);
      return true;
    }
    line_buf_.push_back(static_cast<char>(ch));
    if (line_buf_.size() > 128) { // sanity limit
      line_buf_.clear();
      stats_.parse_errors++;
    }
  }
}

void SerialDriver::buffer_line(const std::string& line) {
  CANFrame f;
  if (!FrameParser::parseFrame(line, f)) {
    stats_.parse_errors++;
    return;
  }
  if (f.isError()) stats_.error_frames++;
  else stats_.frames_received++;

  std::lock_guard<std::mutex> lock(rx_mutex_);
  rx_queue_.push_back(f);
}

bool SerialDriver::pop_buffered(CANFrame& f) {
  std::lock_guard<std::mutex> lock(rx_mutex_);
  if (rx_queue_.empty()) return false;
  f = rx_queue_.front();
  rx_queue_.pop_front();
  return true;
}

bool SerialDriver::await_ack(std::chrono::microseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  std::string line;

  for (;;) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return false;
    auto remain = std::chrono::duration_cast<std::chrono::microseconds>(deadline - now);

    if (!read_until_cr(line, remain)) return false;
    if (is_bell(line)) return false;
    if (is_ack(line)) return true;
    // Bus traffic interleaved with the acknowledgement
    buffer_line(line);
  }
}

bool SerialDriver::write_command(const std::string& cmd, std::chrono::microseconds timeout) {
  if (fd_ < 0) return false;
  ssize_t n = ::write(fd_, cmd.data(), cmd.size());
  if (n != static_cast<ssize_t>(cmd.size())) return false;
  return await_ack(timeout);
}

bool SerialDriver::init_slcan(uint32_t bitrate, uint32_t filter_id, uint32_t filter_mask) {
  // 1) Close channel in case it was left open; an error bell is expected when it was not
  if (!write_command(CommandBuilder::closeChannel(), std::chrono::milliseconds(100))) {
    line_buf_.clear();
  }

  // 2) Set bitrate
  if (!write_command(CommandBuilder::setupBitrate(bitrate), std::chrono::milliseconds(500))) {
    std::cerr << "Failed to set bitrate\n";
    return false;
  }

  // 3) Acceptance filter (both registers are acknowledged)
  if (filter_mask != 0) {
    const std::string filter_cmd = CommandBuilder::setAcceptanceFilter(filter_id, filter_mask);
    const size_t split = filter_cmd.find(RESP_OK) + 1;
    if (!write_command(filter_cmd.substr(0, split), std::chrono::milliseconds(500)) ||
        !write_command(filter_cmd.substr(split), std::chrono::milliseconds(500))) {
      std::cerr << "Failed to set acceptance filter\n";
      return false;
    }
  }

  // 4) Timestamps (optional; not every adapter supports them)
  if (!write_command(CommandBuilder::enableTimestamp(true), std::chrono::milliseconds(200))) {
    std::cerr << "Adapter rejected timestamp setting, continuing without\n";
  }

  // 5) Open channel
  if (!write_command(CommandBuilder::openChannel(), std::chrono::milliseconds(500))) {
    std::cerr << "Failed to open SLCAN channel\n";
    return false;
  }

  return true;
}

bool SerialDriver::send(const CANFrame& f) {
  if (fd_ < 0) return false;

  const std::string slcan_cmd = CommandBuilder::transmitFrame(f);
  if (slcan_cmd.empty() || !write_command(slcan_cmd, std::chrono::milliseconds(100))) {
    stats_.tx_failures++;
    return false;
  }
  stats_.frames_sent++;
  return true;
}

bool SerialDriver::recv(CANFrame& f, std::chrono::microseconds timeout) {
  if (pop_buffered(f)) return true;
  if (fd_ < 0) return false;

  auto deadline = std::chrono::steady_clock::now() + timeout;
  std::string line;
  for (;;) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return false;
    auto remain = std::chrono::duration_cast<std::chrono::microseconds>(deadline - now);

    if (!read_until_cr(line, remain)) return false;
    if (is_ack(line) || is_bell(line)) continue;
    buffer_line(line);
    if (pop_buffered(f)) return true;
  }
}

} // namespace slcan
} // namespace canfuzz
