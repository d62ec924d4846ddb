#pragma once

#include "arena/concurrent/thread_safe_queue.hpp"
#include "arena/eventbus/event_bus.hpp"
#include "arena/events/event.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>

namespace arena {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Owns one worker thread that drains a ThreadSafeQueue<Event> and publishes
// each event on its EventBus. Producers call push() from any thread; every
// subscriber runs on the loop thread, so handlers are serialized.
//
// The BenchmarkEngine uses one loop as the single writer for ingest traffic
// (rounds, scores, health snapshots, forecasts, price resolutions).
//
// Thread model: start() and stop() from the owning thread; push() and
// eventBus() from any thread.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;

  // Joins the worker.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Spawns the worker. A second call while running is a no-op.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Publishes whatever is still queued, then joins the worker. Idempotent;
  // start() may be called again afterwards.
  // -------------------------------------------------------------------------
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  // Events pushed but not yet dispatched.
  std::size_t pending() const { return queue_.size(); }

  // Events dispatched since construction, across restarts.
  std::uint64_t dispatched() const { return dispatched_.load(); }

  // Events whose handlers threw std::exception (logged, then skipped).
  std::uint64_t failed() const { return failed_.load(); }

 private:
  void run();
  void dispatch(const Event& event);

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dispatched_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace arena
