// -----------------------------------------------------------------------------
// agent_arena_server - single executable entry point.
//
// Startup sequence:
//   1) Load the EngineConfig (optional JSON file given as argv[1]).
//   2) Create the wall clock and the BenchmarkEngine, then start it. This
//      spawns the ingest loop thread and the IPC thread (commands on
//      :5556, telemetry on :5557 by default).
//   3) Subscribe logging callbacks to the ingest bus for round and alert
//      telemetry.
//   4) Create an IngestGateway subscribed to the Orchestrator feed. Every
//      decoded message is pushed into the engine's ingest loop.
//   5) Run the gateway's recv loop on the main thread until Ctrl-C.
//   6) Shut down cleanly.
//
// Thread layout:
//   main thread     -> IngestGateway::run() (ZMQ recv loop)
//   ingest thread   -> every component write
//   ipc thread      -> command queries, telemetry PUB
// -----------------------------------------------------------------------------

#include "arena/config/engine_config.hpp"
#include "arena/engine/benchmark_engine.hpp"
#include "arena/events/event_types.hpp"
#include "arena/gateway/ingest_gateway.hpp"
#include "arena/risk/i_portfolio_store.hpp"
#include "arena/time/live_time_provider.hpp"

#include <csignal>
#include <iostream>
#include <memory>

// -----------------------------------------------------------------------------
// Raw pointer to the stack-local gateway so the SIGINT handler can unblock
// the recv loop. Set once before the handler is installed.
// -----------------------------------------------------------------------------
static arena::IngestGateway* g_gateway_ptr = nullptr;

// -----------------------------------------------------------------------------
// sigint_handler
// -----------------------------------------------------------------------------
// Sets the gateway's atomic stop flag. run() notices within its
// ZMQ_RCVTIMEO window (100 ms) and returns, after which main() stops the
// engine.
// -----------------------------------------------------------------------------
static void sigint_handler(int /*signum*/) {
  if (g_gateway_ptr != nullptr) {
    g_gateway_ptr->stop();
  }
}

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  arena::EngineConfig config;
  if (argc > 1) {
    try {
      config = arena::loadEngineConfig(argv[1]);
    } catch (const arena::ConfigError& e) {
      std::cerr << "[main] " << e.what() << "\n";
      return 1;
    }
  }

  // -------------------------------------------------------------------------
  // 2) Clock and engine.
  // -------------------------------------------------------------------------
  arena::LiveTimeProvider clock;

  std::unique_ptr<arena::BenchmarkEngine> engine;
  try {
    engine = std::make_unique<arena::BenchmarkEngine>(clock, config);
  } catch (const arena::StorageError& e) {
    std::cerr << "[main] portfolio snapshot: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 3) Logging callbacks (run on the ingest thread).
  // -------------------------------------------------------------------------
  engine->ingestEventBus().subscribe<arena::RoundAnalyzedEvent>(
      [](const arena::RoundAnalyzedEvent& e) {
        std::cout << "[Analytics] round=" << e.analytics.round_id
                  << " active=" << e.analytics.participation.active_agents
                  << " quality=" << e.analytics.quality.round_quality_score
                  << "\n";
      });

  engine->start();

  // -------------------------------------------------------------------------
  // 4) Ingest gateway. The sink only enqueues; all writes happen on the
  //    ingest thread.
  // -------------------------------------------------------------------------
  arena::IngestGateway gateway(
      [&engine](arena::Event event) { engine->pushEvent(std::move(event)); },
      config.ingest_endpoint);

  // -------------------------------------------------------------------------
  // 5) SIGINT -> gateway.stop(), then block on the recv loop.
  // -------------------------------------------------------------------------
  g_gateway_ptr = &gateway;
  std::signal(SIGINT, sigint_handler);

  std::cout << "[main] IngestGateway connected to " << config.ingest_endpoint
            << "\n"
            << "[main] Commands on " << config.command_endpoint
            << ", telemetry on " << config.telemetry_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  gateway.run();

  // -------------------------------------------------------------------------
  // 6) Clean shutdown: drains the ingest loop and joins every thread.
  // -------------------------------------------------------------------------
  std::cout << "[main] Gateway exited. Stopping engine...\n";
  engine->stop();

  g_gateway_ptr = nullptr;

  return 0;
}
