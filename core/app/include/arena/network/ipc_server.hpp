#pragma once

#include "arena/concurrent/thread_safe_queue.hpp"
#include "arena/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace arena {

// -----------------------------------------------------------------------------
// IpcServer - query and telemetry sockets for dashboards
// -----------------------------------------------------------------------------
//
// @brief  Runs one thread serving two ZeroMQ sockets:
//
//   1. REP (queries, default tcp://127.0.0.1:5556)
//      Each request is handed to the command handler (bound to
//      BenchmarkEngine::executeCommand()) and its JSON answer is sent back.
//      ZMQ_RCVTIMEO keeps the loop from blocking on an idle socket. A
//      handler exception still produces an error reply.
//
//   2. PUB (telemetry, default tcp://127.0.0.1:5557)
//      RoundAnalyzedEvent and RegressionAlertEvent pushed from the ingest
//      loop are drained from a ThreadSafeQueue and published as two frames:
//
//        [ "round_analyzed" | "regression_alert" ] [ JSON payload ]
//
//      so a dashboard can subscribe to one topic only. Sends never block;
//      a message refused at the high-water mark is counted as dropped.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The command handler runs on the IPC thread and must only use the
//   components' thread-safe query APIs.
//
// Ownership:
//   Owned by BenchmarkEngine via std::unique_ptr. Owns the zmq context,
//   both sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string query_endpoint = "tcp://127.0.0.1:5556",
                     std::string telemetry_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Binds both sockets and spawns the worker. No-op when already running.
  //
  // Side-effects: zmq::error_t escapes if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Joins the worker after a final telemetry drain. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  std::uint64_t commandsServed() const { return commands_served_.load(); }
  std::uint64_t telemetryPublished() const {
    return telemetry_published_.load();
  }
  std::uint64_t telemetryDropped() const { return telemetry_dropped_.load(); }

 private:
  static constexpr int kQueryTimeoutMs = 50;
  static constexpr int kTelemetryHighWaterMark = 10000;

  void serve();
  void publishPendingTelemetry();
  void answerOneQuery();

  CommandHandler command_handler_;
  std::string query_endpoint_;
  std::string telemetry_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> query_socket_;
  std::unique_ptr<zmq::socket_t> telemetry_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> commands_served_{0};
  std::atomic<std::uint64_t> telemetry_published_{0};
  std::atomic<std::uint64_t> telemetry_dropped_{0};
};

}  // namespace arena
