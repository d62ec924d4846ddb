// =============================================================================
// ingest_gateway_test.cpp
// =============================================================================
// Unit tests for arena::IngestGateway message handling.
//
// Validates:
//   - Valid messages are decoded and forwarded to the sink
//   - Malformed JSON, unknown types and bad enum values are rejected and
//     counted without reaching the sink
//   - Replay mode advances the simulation clock before forwarding
//
// Design: handleMessage() is driven directly. The SUB socket connects to a
// port nobody binds; ZeroMQ connects lazily, so no peer is needed.
// =============================================================================

#include "arena/gateway/ingest_gateway.hpp"
#include "arena/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace {
constexpr const char* kUnboundEndpoint = "tcp://127.0.0.1:59555";
}

class IngestGatewayTest : public ::testing::Test {
 protected:
  std::vector<arena::Event> received;

  arena::IngestGateway::EventSink sink() {
    return [this](arena::Event e) { received.push_back(std::move(e)); };
  }
};

// -----------------------------------------------------------------------------
// 1. A valid message is forwarded once and counted.
// -----------------------------------------------------------------------------
TEST_F(IngestGatewayTest, ForwardsValidMessage) {
  arena::IngestGateway gateway(sink(), kUnboundEndpoint);

  EXPECT_TRUE(gateway.handleMessage(
      R"({"type": "score_recorded", "agent_id": "a", "composite_score": 0.7})"));

  ASSERT_EQ(received.size(), 1u);
  const auto* e = std::get_if<arena::ScoreRecordedEvent>(&received[0]);
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->agent_id, "a");
  EXPECT_EQ(gateway.acceptedCount(), 1u);
  EXPECT_EQ(gateway.rejectedCount(), 0u);
}

// -----------------------------------------------------------------------------
// 2. Bad messages are rejected and never reach the sink.
// -----------------------------------------------------------------------------
TEST_F(IngestGatewayTest, RejectsMalformedMessages) {
  arena::IngestGateway gateway(sink(), kUnboundEndpoint);

  EXPECT_FALSE(gateway.handleMessage("not json at all"));
  EXPECT_FALSE(gateway.handleMessage(R"({"type": "teleport"})"));
  EXPECT_FALSE(gateway.handleMessage(R"({"type": "market_return"})"));
  EXPECT_FALSE(gateway.handleMessage(R"({"type": "round_completed",
      "round_id": "r", "timestamp_ms": 0,
      "decisions": [{"agent_id": "a", "action": "yolo"}]})"));

  EXPECT_TRUE(received.empty());
  EXPECT_EQ(gateway.acceptedCount(), 0u);
  EXPECT_EQ(gateway.rejectedCount(), 4u);

  // The gateway keeps accepting after rejections.
  EXPECT_TRUE(gateway.handleMessage(
      R"({"type": "market_return", "return_percent": 0.4})"));
  EXPECT_EQ(received.size(), 1u);
}

// -----------------------------------------------------------------------------
// 3. Replay mode: the clock follows message timestamps.
// Why: windows computed while handling the event must see replayed time.
// -----------------------------------------------------------------------------
TEST_F(IngestGatewayTest, ReplayClockFollowsTimestamps) {
  arena::SimulationTimeProvider replay_clock{0};
  std::int64_t clock_at_sink = -1;
  arena::IngestGateway gateway(
      [&](arena::Event) { clock_at_sink = replay_clock.now_ms(); },
      kUnboundEndpoint, &replay_clock);

  EXPECT_TRUE(gateway.handleMessage(R"({"type": "round_completed",
      "round_id": "r-1", "timestamp_ms": 1700000000000, "decisions": []})"));
  EXPECT_EQ(replay_clock.now_ms(), 1'700'000'000'000);
  EXPECT_EQ(clock_at_sink, 1'700'000'000'000);

  // Messages without a timestamp leave the clock alone.
  EXPECT_TRUE(gateway.handleMessage(
      R"({"type": "market_return", "return_percent": 1.0})"));
  EXPECT_EQ(replay_clock.now_ms(), 1'700'000'000'000);
}

// -----------------------------------------------------------------------------
// 4. Without a replay clock, timestamps are ignored.
// -----------------------------------------------------------------------------
TEST_F(IngestGatewayTest, LiveModeIgnoresTimestamps) {
  arena::IngestGateway gateway(sink(), kUnboundEndpoint);
  EXPECT_TRUE(gateway.handleMessage(R"({"type": "round_completed",
      "round_id": "r-1", "timestamp_ms": 5, "decisions": []})"));
  ASSERT_EQ(received.size(), 1u);
  EXPECT_NE(std::get_if<arena::RoundCompletedEvent>(&received[0]), nullptr);
}
