#ifndef CANFUZZ_CAN_DRIVER_HPP
#define CANFUZZ_CAN_DRIVER_HPP

#include "can_slcan.hpp"
#include <chrono>

namespace canfuzz {

// Abstract CAN driver (user must provide an implementation, e.g. SLCAN over serial)
class ICanDriver {
public:
  virtual ~ICanDriver() = default;
  virtual bool send(const CANFrame& f) = 0;
  // Wait at most `timeout` for one frame; false on timeout or I/O error
  virtual bool recv(CANFrame& f, std::chrono::microseconds timeout) = 0;
};

} // namespace canfuzz

#endif // CANFUZZ_CAN_DRIVER_HPP
