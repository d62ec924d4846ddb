#pragma once

#include "arena/events/event.hpp"
#include "arena/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace arena {

// -----------------------------------------------------------------------------
// IngestGateway - ZeroMQ SUB bridge for Orchestrator messages
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON messages from the Orchestrator's PUB socket, decodes
//         each into an ingest Event and hands it to the event sink.
//
// @details
// Every message is one JSON object with a "type" discriminator (see
// json_codec.hpp for the full list). For example:
//
//   {"type": "score_recorded", "agent_id": "claude-trader",
//    "composite_score": 0.82, "coherence": 0.9, "hallucination_detected":
//    false, "discipline_passed": true, "calibration": 0.7, "pnl": 1.4,
//    "is_win": true}
//
// Malformed messages (bad JSON, missing keys, unknown type or action) are
// logged to stderr and skipped; the loop keeps running.
//
// Replay mode:
//   When constructed with a SimulationTimeProvider, a message carrying a
//   top-level "timestamp_ms" advances that clock BEFORE the event is
//   handed on, so windows and timestamps computed while processing it see
//   the replayed time.
//
// Thread model:
//   run() blocks the calling thread. stop() may be called from any thread
//   (including a signal handler); the loop notices within kRecvTimeoutMs
//   thanks to ZMQ_RCVTIMEO.
//
// Ownership:
//   Owns the zmq context and socket. Holds a copy of the sink and an
//   optional non-owning clock pointer.
// -----------------------------------------------------------------------------
class IngestGateway {
 public:
  using EventSink = std::function<void(Event)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  event_sink   Receives each decoded event, typically bound to
  //                      BenchmarkEngine::pushEvent().
  // @param  endpoint     Orchestrator PUB endpoint to connect to.
  // @param  replay_clock Optional clock to advance from message timestamps.
  // -------------------------------------------------------------------------
  explicit IngestGateway(EventSink event_sink,
                         const std::string& endpoint = "tcp://127.0.0.1:5555",
                         SimulationTimeProvider* replay_clock = nullptr);

  ~IngestGateway() = default;

  IngestGateway(const IngestGateway&) = delete;
  IngestGateway& operator=(const IngestGateway&) = delete;
  IngestGateway(IngestGateway&&) = delete;
  IngestGateway& operator=(IngestGateway&&) = delete;

  // Blocking receive loop. Returns after stop().
  void run();

  void stop();

  // -------------------------------------------------------------------------
  // handleMessage(payload)
  // -------------------------------------------------------------------------
  // @brief  Decodes one raw message and forwards it to the sink.
  //
  // @return true if an event was forwarded, false if the message was
  //         rejected (already logged).
  //
  // Thread-safety: Called from run(); exposed for tests.
  // -------------------------------------------------------------------------
  bool handleMessage(const std::string& payload);

  std::uint64_t acceptedCount() const { return accepted_.load(); }
  std::uint64_t rejectedCount() const { return rejected_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  EventSink event_sink_;
  SimulationTimeProvider* replay_clock_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> accepted_{0};
  std::atomic<std::uint64_t> rejected_{0};
};

}  // namespace arena
