#include "transport.hpp"
#include <iostream>
#include <memory>
#include <utility>

namespace canfuzz {

class BusTransport::BusSession : public Session {
public:
  BusSession(BusTransport& owner, uint32_t arbitration_id)
      : owner_(owner), arbitration_id_(arbitration_id) {
    owner_.session_open_ = true;
    owner_.sessions_opened_++;
  }

  ~BusSession() override {
    on_response_ = nullptr;
    owner_.session_open_ = false;
  }

  BusSession(const BusSession&) = delete;
  BusSession& operator=(const BusSession&) = delete;

  uint32_t arbitration_id() const override { return arbitration_id_; }

  bool send(const std::vector<uint8_t>& data) override {
    CANFrame f;
    if (!CANFrame::fromBytes(arbitration_id_, data, f)) {
      std::cerr << "Frame does not fit classical CAN (id 0x" << std::hex << arbitration_id_
                << std::dec << ", " << data.size() << " bytes)\n";
      return false;
    }
    return owner_.drv_.send(f);
  }

  bool send_with_callback(const std::vector<uint8_t>& data, FrameCallback on_response) override {
    on_response_ = std::move(on_response);
    return send(data);
  }

  size_t observe(std::chrono::microseconds window) override {
    size_t delivered = 0;
    const auto deadline = std::chrono::steady_clock::now() + window;

    for (;;) {
      const auto now = std::chrono::steady_clock::now();
      if (now >= deadline) break;
      const auto remain = std::chrono::duration_cast<std::chrono::microseconds>(deadline - now);

      CANFrame f;
      if (!owner_.drv_.recv(f, remain)) continue;
      if (on_response_) {
        on_response_(f);
        ++delivered;
      }
    }
    return delivered;
  }

private:
  BusTransport& owner_;
  uint32_t arbitration_id_;
  FrameCallback on_response_;
};

ScopedSession BusTransport::open_session(uint32_t arbitration_id) {
  if (session_open_) {
    std::cerr << "Session already open, refusing id 0x" << std::hex << arbitration_id << std::dec << "\n";
    return nullptr;
  }
  if (arbitration_id > CAN_SFF_MASK) {
    std::cerr << "Arbitration id 0x" << std::hex << arbitration_id << std::dec
              << " outside the 11-bit range\n";
    return nullptr;
  }
  return std::make_unique<BusSession>(*this, arbitration_id);
}

} // namespace canfuzz
