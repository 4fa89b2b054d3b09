#include "corpus.hpp"
#include "directive_log.hpp"
#include "dispatcher.hpp"
#include "fuzz_config.hpp"
#include "slcan_serial.hpp"
#include "transport.hpp"
#include <signal.h>
#include <iostream>
#include <random>

// Directive fuzzer for an SLCAN adapter:
// - generate directives with the selected strategy
// - send each one and print replies seen within the observation window
// - keep the last --log directives and print them on exit
// - Ctrl+C stops after the current directive

using namespace canfuzz;

namespace {

CancellationToken g_cancel;

void on_sigint(int) {
  g_cancel.cancel();
}

void install_sigint_handler() {
  struct sigaction sa {};
  sa.sa_handler = on_sigint;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0; // no SA_RESTART: a blocking select() returns early
  sigaction(SIGINT, &sa, nullptr);
}

void print_log(const BoundedLog& log) {
  if (!log.enabled() || log.empty()) return;
  std::cout << "Last " << log.size() << " directive(s) sent:\n";
  for (const auto& entry : log.entries()) {
    std::cout << "  " << entry << "\n";
  }
}

} // namespace

int main(int argc, char* argv[]) {
  FuzzConfig cfg;
  const ArgResult args = parse_arguments(argc, argv, cfg);
  if (!args.ok()) {
    if (!args.message.empty()) std::cerr << "Error: " << args.message << "\n\n";
    std::cout << usage(argv[0]);
    return 0;
  }

  install_sigint_handler();

  const uint32_t seed = cfg.seed ? *cfg.seed : std::random_device{}();

  if (cfg.generate && cfg.algorithm == Algorithm::Linear) {
    std::unique_ptr<Generator> source = make_corpus_generator(cfg, seed);
    if (!generate_corpus(*cfg.input_file, cfg.generate_amount, *source)) {
      return 1;
    }
    if (g_cancel.is_cancelled()) {
      std::cout << "Terminated by user\n";
      return 0;
    }
    std::cout << "Generated " << cfg.generate_amount << " directives in " << *cfg.input_file << "\n";
  }

  std::string error;
  std::unique_ptr<Generator> generator = make_generator(cfg, seed, error);
  if (!generator) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  slcan::SerialDriver driver;
  if (!driver.open(cfg.device, cfg.bitrate)) {
    if (g_cancel.is_cancelled()) {
      std::cout << "Terminated by user\n";
      return 0;
    }
    std::cerr << "Failed to open SLCAN device " << cfg.device << "\n";
    return 1;
  }
  std::cout << "SLCAN opened on " << cfg.device << " at " << cfg.bitrate << " bit/s\n";

  CorpusWriter corpus;
  if (cfg.output_file && !corpus.open(*cfg.output_file)) {
    return 1;
  }

  BusTransport transport(driver);
  BoundedLog log(cfg.log_depth);

  DispatchConfig dc;
  dc.observation_window = cfg.observation_window;
  Dispatcher dispatcher(transport, log, dc);
  if (corpus.is_open()) dispatcher.set_corpus(&corpus);

  std::cout << "Fuzzing with " << generator->name() << " (seed " << seed << ")\n";

  // A Ctrl+C during setup is picked up by run() before the first send
  const RunReport report = dispatcher.run(*generator, g_cancel);

  std::cout << "Sent " << report.sent << " directive(s), " << report.responses
            << " response(s), " << to_string(report.status) << "\n";
  print_log(log);

  const auto& st = driver.stats();
  std::cout << "Frames sent: " << st.frames_sent << "  received: " << st.frames_received
            << "  errors: " << st.error_frames << "  parse errors: " << st.parse_errors << "\n";

  if (report.status == RunStatus::Cancelled) {
    std::cout << "Terminated by user\n";
  } else if (report.status != RunStatus::Completed) {
    std::cerr << "Error: " << report.error << "\n";
  }
  return exit_code(report.status);
}
