#include "dispatcher.hpp"
#include <iostream>

namespace canfuzz {

const char* to_string(RunStatus status) {
  switch (status) {
  case RunStatus::Completed: return "completed";
  case RunStatus::Cancelled: return "cancelled";
  case RunStatus::InvalidDirective: return "invalid directive";
  case RunStatus::TransportFailure: return "transport failure";
  case RunStatus::CorpusWriteFailure: return "corpus write failure";
  }
  return "unknown";
}

int exit_code(RunStatus status) {
  switch (status) {
  case RunStatus::Completed:
  case RunStatus::Cancelled:
    return 0;
  case RunStatus::InvalidDirective:
  case RunStatus::TransportFailure:
  case RunStatus::CorpusWriteFailure:
    return 1;
  }
  return 1;
}

Dispatcher::Dispatcher(Transport& transport, BoundedLog& log, DispatchConfig config)
    : transport_(transport), log_(log), config_(config), handler_(&Dispatcher::print_response) {}

void Dispatcher::print_response(const ResponseContext& ctx, const CANFrame& frame) {
  std::cout << "Directive: " << ctx.directive << " Received Message: " << to_string(frame) << "\n";
}

bool Dispatcher::dispatch(const Directive& directive, uint64_t& responses, std::string& error) {
  const uint32_t id = DirectiveCodec::arbitration_id(directive);
  const std::vector<uint8_t> data = DirectiveCodec::payload_bytes(directive);

  ScopedSession session = transport_.open_session(id);
  if (!session) {
    error = "cannot open session for " + DirectiveCodec::to_text(directive);
    return false;
  }

  if (config_.observation_window.count() == 0) {
    if (!session->send(data)) {
      error = "send failed for " + DirectiveCodec::to_text(directive);
      return false;
    }
    return true;
  }

  // The callback owns its own copy of the context, so a late frame can never
  // observe the next iteration's directive.
  ResponseContext ctx{DirectiveCodec::to_text(directive), sequence_};
  ResponseHandler handler = handler_;
  FrameCallback on_response = [ctx, handler](const CANFrame& frame) {
    if (handler) handler(ctx, frame);
  };

  if (!session->send_with_callback(data, std::move(on_response))) {
    error = "send failed for " + ctx.directive;
    return false;
  }
  responses += session->observe(config_.observation_window);
  return true;
}

RunReport Dispatcher::run(Generator& generator, const CancellationToken& cancel) {
  RunReport report;
  Directive directive;

  for (;;) {
    if (cancel.is_cancelled()) {
      report.status = RunStatus::Cancelled;
      return report;
    }

    const NextStatus st = generator.next(directive);
    if (st == NextStatus::Exhausted) {
      report.status = RunStatus::Completed;
      return report;
    }
    if (st == NextStatus::InvalidDirective) {
      report.status = RunStatus::InvalidDirective;
      report.error = generator.last_error();
      return report;
    }

    // Generators emit canonical text; anything else is rejected before the bus
    Directive checked;
    ParseError perr = ParseError::None;
    if (!DirectiveCodec::parse(DirectiveCodec::to_text(directive), checked, &perr)) {
      report.status = RunStatus::InvalidDirective;
      report.error = std::string(generator.name()) + " produced \"" +
                     DirectiveCodec::to_text(directive) + "\": " + to_string(perr);
      return report;
    }

    ++sequence_;
    if (!dispatch(checked, report.responses, report.error)) {
      report.status = RunStatus::TransportFailure;
      return report;
    }
    ++report.sent;

    log_.record(DirectiveCodec::to_text(checked));

    if (corpus_ && !corpus_->append(checked)) {
      report.status = RunStatus::CorpusWriteFailure;
      report.error = "cannot append to " + corpus_->path();
      return report;
    }
  }
}

} // namespace canfuzz
