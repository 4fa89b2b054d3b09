#ifndef CANFUZZ_DISPATCHER_HPP
#define CANFUZZ_DISPATCHER_HPP

/**
 * @file dispatcher.hpp
 * @brief Generate -> send -> observe -> log -> persist loop
 *
 * One iteration:
 *   1. generator.next()            Exhausted ends the run normally
 *   2. open a session for the id   released when the iteration ends
 *   3. send payload + callback     callback gets a ResponseContext copy
 *   4. observe for the window      replies after the window are dropped
 *   5. BoundedLog::record          no-op at capacity 0
 *   6. CorpusWriter::append        only when a corpus is attached
 *
 * The cancellation token is checked before every iteration; there is no
 * mid-send cancellation.
 */

#include "can_slcan.hpp"
#include "corpus.hpp"
#include "directive.hpp"
#include "directive_log.hpp"
#include "generators.hpp"
#include "transport.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace canfuzz {

class CancellationToken {
public:
  void cancel() { cancelled_.store(true); }
  bool is_cancelled() const { return cancelled_.load(); }
  void reset() { cancelled_.store(false); }

private:
  std::atomic<bool> cancelled_{false};
};

/// Snapshot of the directive a response belongs to, taken at send time
struct ResponseContext {
  std::string directive; ///< "<id>#<payload>"
  uint64_t sequence{0};  ///< 1-based iteration number
};

using ResponseHandler = std::function<void(const ResponseContext&, const CANFrame&)>;

struct DispatchConfig {
  /// How long a session stays open after sending; 0 sends without a callback
  std::chrono::microseconds observation_window{100};
};

enum class RunStatus : uint8_t {
  Completed,          ///< Bounded generator exhausted
  Cancelled,          ///< Token fired between iterations
  InvalidDirective,   ///< Generator produced malformed data
  TransportFailure,   ///< Session could not be opened or send failed
  CorpusWriteFailure  ///< Output corpus could not be appended
};

const char* to_string(RunStatus status);

/// Process exit status for a finished run: 0 for completion and Ctrl+C,
/// 1 when the run failed.
int exit_code(RunStatus status);

struct RunReport {
  RunStatus status{RunStatus::Completed};
  uint64_t sent{0};
  uint64_t responses{0};
  std::string error;
};

class Dispatcher {
public:
  Dispatcher(Transport& transport, BoundedLog& log, DispatchConfig config = {});

  /// Also persist every sent directive (nullptr detaches)
  void set_corpus(CorpusWriter* corpus) { corpus_ = corpus; }

  /// Replace the default handler (print_response)
  void set_response_handler(ResponseHandler handler) { handler_ = std::move(handler); }

  RunReport run(Generator& generator, const CancellationToken& cancel);

  /// Send one directive and observe replies. False on transport failure.
  bool dispatch(const Directive& directive, uint64_t& responses, std::string& error);

  uint64_t sequence() const { return sequence_; }

  /// "Directive: 123#FF Received Message: ID: 0x7E8 DLC: ..." on stdout
  static void print_response(const ResponseContext& ctx, const CANFrame& frame);

private:
  Transport& transport_;
  BoundedLog& log_;
  CorpusWriter* corpus_{nullptr};
  DispatchConfig config_;
  ResponseHandler handler_;
  uint64_t sequence_{0};
};

} // namespace canfuzz

#endif // CANFUZZ_DISPATCHER_HPP
