#ifndef CANFUZZ_TRANSPORT_HPP
#define CANFUZZ_TRANSPORT_HPP

/**
 * @file transport.hpp
 * @brief Bus access for the dispatch loop
 *
 * The dispatch loop never touches the CAN driver directly. For each directive
 * it opens a session bound to one arbitration id, sends the payload, keeps the
 * session open for a short observation window and lets it go:
 *
 *   {
 *     ScopedSession s = transport.open_session(0x123);
 *     s->send_with_callback(bytes, on_response);
 *     s->observe(std::chrono::microseconds(100));
 *   } // session released here, also when unwinding
 *
 * Replies arriving after the window closes are not reported.
 */

#include "can_driver.hpp"
#include "can_slcan.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace canfuzz {

using FrameCallback = std::function<void(const CANFrame&)>;

class Session {
public:
  virtual ~Session() = default;

  virtual uint32_t arbitration_id() const = 0;

  /// Send without registering a response callback
  virtual bool send(const std::vector<uint8_t>& data) = 0;

  /// Send and deliver every frame observed while the session is open
  virtual bool send_with_callback(const std::vector<uint8_t>& data, FrameCallback on_response) = 0;

  /// Keep the session open for `window`, dispatching received frames.
  /// Returns the number of frames delivered to the callback.
  virtual size_t observe(std::chrono::microseconds window) = 0;
};

/// Released (destroyed) on every exit path of the owning scope
using ScopedSession = std::unique_ptr<Session>;

class Transport {
public:
  virtual ~Transport() = default;

  /// nullptr if no session can be opened for this id
  virtual ScopedSession open_session(uint32_t arbitration_id) = 0;
};

/// Transport over a CAN driver (SLCAN adapter, test double, ...).
/// One session at a time; a second open_session() while one is live fails.
class BusTransport : public Transport {
public:
  explicit BusTransport(ICanDriver& drv) : drv_(drv) {}

  ScopedSession open_session(uint32_t arbitration_id) override;

  bool session_open() const { return session_open_; }
  uint64_t sessions_opened() const { return sessions_opened_; }

private:
  class BusSession;

  ICanDriver& drv_;
  bool session_open_{false};
  uint64_t sessions_opened_{0};
};

} // namespace canfuzz

#endif // CANFUZZ_TRANSPORT_HPP
