/**
 * @file dispatcher_test.cpp
 * @brief Generate -> send -> observe -> log -> persist loop
 */

#include <gtest/gtest.h>
#include "dispatcher.hpp"
#include "mock_can_driver.hpp"
#include <cstdio>
#include <fstream>

using namespace canfuzz;

namespace {

// Transport that never grants a session
class RefusingTransport : public Transport {
public:
  ScopedSession open_session(uint32_t) override { return nullptr; }
};

RingBruteForceGenerator small_ring(const std::string& payload = "FC") {
  RingBruteForceConfig cfg;
  cfg.id = "123";
  cfg.initial_payload = payload;
  return RingBruteForceGenerator(cfg);
}

} // namespace

class DispatcherTest : public ::testing::Test {
protected:
  DispatcherTest() : dispatcher_(transport_, log_, window(1000)) {
    dispatcher_.set_response_handler([this](const ResponseContext& ctx, const CANFrame& f) {
      responses_.push_back(ctx);
      frames_.push_back(f);
    });
  }

  static DispatchConfig window(long us) {
    DispatchConfig dc;
    dc.observation_window = std::chrono::microseconds(us);
    return dc;
  }

  MockCanDriver driver_;
  BusTransport transport_{driver_};
  BoundedLog log_{3};
  Dispatcher dispatcher_;
  CancellationToken cancel_;
  std::vector<ResponseContext> responses_;
  std::vector<CANFrame> frames_;
};

TEST_F(DispatcherTest, BoundedGeneratorRunsToCompletion) {
  auto gen = small_ring();
  const RunReport report = dispatcher_.run(gen, cancel_);

  EXPECT_EQ(report.status, RunStatus::Completed);
  EXPECT_EQ(report.sent, 4u);
  ASSERT_EQ(driver_.sent().size(), 4u);
  EXPECT_EQ(driver_.sent()[0].getIdentifier(), 0x123u);
  EXPECT_EQ(driver_.sent()[0].data[0], 0xFC);
  EXPECT_EQ(driver_.sent()[3].data[0], 0xFF);
}

TEST_F(DispatcherTest, OneSessionPerDirectiveAndAllReleased) {
  auto gen = small_ring();
  const RunReport report = dispatcher_.run(gen, cancel_);
  EXPECT_EQ(transport_.sessions_opened(), report.sent);
  EXPECT_FALSE(transport_.session_open());
}

TEST_F(DispatcherTest, LogKeepsLastDirectives) {
  auto gen = small_ring();
  dispatcher_.run(gen, cancel_);
  EXPECT_EQ(log_.entries(), (std::vector<std::string>{"123#FD", "123#FE", "123#FF"}));
  EXPECT_EQ(log_.recorded(), 4u);
}

TEST_F(DispatcherTest, ResponsesCarryTheirOwnDirective) {
  driver_.set_auto_reply(MockCanDriver::make_frame(0x7E8, {0x01, 0x7F}));
  auto gen = small_ring("FE");
  const RunReport report = dispatcher_.run(gen, cancel_);

  EXPECT_EQ(report.responses, 2u);
  ASSERT_EQ(responses_.size(), 2u);
  EXPECT_EQ(responses_[0].directive, "123#FE");
  EXPECT_EQ(responses_[0].sequence, 1u);
  EXPECT_EQ(responses_[1].directive, "123#FF");
  EXPECT_EQ(responses_[1].sequence, 2u);
  EXPECT_EQ(frames_[0].getIdentifier(), 0x7E8u);
}

TEST_F(DispatcherTest, ZeroWindowSendsWithoutObserving) {
  Dispatcher plain(transport_, log_, window(0));
  int calls = 0;
  plain.set_response_handler([&calls](const ResponseContext&, const CANFrame&) { ++calls; });
  driver_.set_auto_reply(MockCanDriver::make_frame(0x7E8, {0x00}));

  auto gen = small_ring();
  const RunReport report = plain.run(gen, cancel_);
  EXPECT_EQ(report.status, RunStatus::Completed);
  EXPECT_EQ(report.sent, 4u);
  EXPECT_EQ(report.responses, 0u);
  EXPECT_EQ(calls, 0);
}

TEST_F(DispatcherTest, CancelledBeforeStartSendsNothing) {
  RandomGenerator gen(RandomConfig{}, 1);
  cancel_.cancel();
  const RunReport report = dispatcher_.run(gen, cancel_);
  EXPECT_EQ(report.status, RunStatus::Cancelled);
  EXPECT_EQ(report.sent, 0u);
  EXPECT_TRUE(driver_.sent().empty());
}

TEST_F(DispatcherTest, CancelBeforeRunOpensNoSession) {
  const std::string path = ::testing::TempDir() + "dispatch_cancelled.txt";
  std::remove(path.c_str());
  CorpusWriter corpus;
  ASSERT_TRUE(corpus.open(path));
  dispatcher_.set_corpus(&corpus);

  cancel_.cancel();
  auto gen = small_ring();
  const RunReport report = dispatcher_.run(gen, cancel_);
  EXPECT_EQ(report.status, RunStatus::Cancelled);
  EXPECT_EQ(exit_code(report.status), 0);
  EXPECT_EQ(transport_.sessions_opened(), 0u);
  EXPECT_EQ(corpus.written(), 0u);
  EXPECT_TRUE(log_.empty());
  std::remove(path.c_str());
}

TEST_F(DispatcherTest, CancellationStopsUnboundedGeneratorBetweenIterations) {
  driver_.set_auto_reply(MockCanDriver::make_frame(0x7E8, {0x00}));
  dispatcher_.set_response_handler([this](const ResponseContext& ctx, const CANFrame&) {
    if (ctx.sequence == 3) cancel_.cancel();
  });

  RandomGenerator gen(RandomConfig{}, 1);
  const RunReport report = dispatcher_.run(gen, cancel_);
  EXPECT_EQ(report.status, RunStatus::Cancelled);
  EXPECT_EQ(report.sent, 3u);
  EXPECT_EQ(log_.recorded(), 3u);
  EXPECT_FALSE(transport_.session_open());
}

TEST_F(DispatcherTest, MalformedCorpusLineFailsFast) {
  const std::string path = ::testing::TempDir() + "dispatch_bad.txt";
  {
    std::ofstream out(path);
    out << "123#01\n123#0\n123#02\n";
  }
  LinearReplayGenerator gen(path);
  ASSERT_TRUE(gen.open());

  const RunReport report = dispatcher_.run(gen, cancel_);
  EXPECT_EQ(report.status, RunStatus::InvalidDirective);
  EXPECT_EQ(report.sent, 1u);
  EXPECT_NE(report.error.find(":2:"), std::string::npos) << report.error;
  std::remove(path.c_str());
}

TEST_F(DispatcherTest, NonCanonicalGeneratorOutputIsRejected) {
  RandomConfig cfg;
  cfg.static_id = "FFF";
  cfg.static_payload = "00";
  RandomGenerator gen(cfg, 1);

  const RunReport report = dispatcher_.run(gen, cancel_);
  EXPECT_EQ(report.status, RunStatus::InvalidDirective);
  EXPECT_EQ(report.sent, 0u);
  EXPECT_TRUE(driver_.sent().empty());
}

TEST_F(DispatcherTest, SendFailureIsTransportFailure) {
  driver_.set_fail_next(true);
  auto gen = small_ring();
  const RunReport report = dispatcher_.run(gen, cancel_);
  EXPECT_EQ(report.status, RunStatus::TransportFailure);
  EXPECT_EQ(report.sent, 0u);
  EXPECT_FALSE(report.error.empty());
  EXPECT_TRUE(log_.empty());
}

TEST_F(DispatcherTest, RefusedSessionIsTransportFailure) {
  RefusingTransport refusing;
  Dispatcher d(refusing, log_, window(100));
  auto gen = small_ring();
  const RunReport report = d.run(gen, cancel_);
  EXPECT_EQ(report.status, RunStatus::TransportFailure);
  EXPECT_EQ(report.sent, 0u);
}

TEST_F(DispatcherTest, CorpusReceivesEverySentDirective) {
  const std::string path = ::testing::TempDir() + "dispatch_out.txt";
  std::remove(path.c_str());
  CorpusWriter corpus;
  ASSERT_TRUE(corpus.open(path));
  dispatcher_.set_corpus(&corpus);

  auto gen = small_ring();
  const RunReport report = dispatcher_.run(gen, cancel_);
  EXPECT_EQ(report.status, RunStatus::Completed);
  EXPECT_EQ(corpus.written(), 4u);
  corpus.close();

  std::ifstream in(path);
  std::string line;
  std::vector<std::string> lines;
  while (std::getline(in, line)) lines.push_back(line);
  EXPECT_EQ(lines, (std::vector<std::string>{"123#FC", "123#FD", "123#FE", "123#FF"}));
  std::remove(path.c_str());
}

TEST_F(DispatcherTest, ClosedCorpusIsCorpusWriteFailure) {
  CorpusWriter corpus;
  dispatcher_.set_corpus(&corpus);

  auto gen = small_ring();
  const RunReport report = dispatcher_.run(gen, cancel_);
  EXPECT_EQ(report.status, RunStatus::CorpusWriteFailure);
  EXPECT_EQ(report.sent, 1u);
}

TEST(RunStatusTest, Names) {
  EXPECT_STREQ(to_string(RunStatus::Completed), "completed");
  EXPECT_STREQ(to_string(RunStatus::Cancelled), "cancelled");
  EXPECT_STREQ(to_string(RunStatus::TransportFailure), "transport failure");
}

TEST(RunStatusTest, ExitCodes) {
  EXPECT_EQ(exit_code(RunStatus::Completed), 0);
  EXPECT_EQ(exit_code(RunStatus::Cancelled), 0);
  EXPECT_EQ(exit_code(RunStatus::InvalidDirective), 1);
  EXPECT_EQ(exit_code(RunStatus::TransportFailure), 1);
  EXPECT_EQ(exit_code(RunStatus::CorpusWriteFailure), 1);
}

TEST(CancellationTokenTest, CancelAndReset) {
  CancellationToken t;
  EXPECT_FALSE(t.is_cancelled());
  t.cancel();
  EXPECT_TRUE(t.is_cancelled());
  t.reset();
  EXPECT_FALSE(t.is_cancelled());
}

TEST(PrintResponseTest, ResponseLineFormat) {
  testing::internal::CaptureStdout();
  Dispatcher::print_response(ResponseContext{"7E0#021001", 1},
                             MockCanDriver::make_frame(0x7E8, {0x02, 0x50, 0x01}));
  EXPECT_EQ(testing::internal::GetCapturedStdout(),
            "Directive: 7E0#021001 Received Message: ID: 0x7E8 DLC: 3 Data: 02 50 01\n");
}
