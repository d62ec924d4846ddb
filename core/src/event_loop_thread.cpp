#include "arena/concurrent/event_loop_thread.hpp"
#include <chrono>
#include <exception>
#include <iostream>

namespace arena {

namespace {

// Idle wait before re-checking running_ when the queue is empty.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  stop_cv_.notify_all();
  thread_.join();

  // Ingest events are state changes; do not drop the ones already accepted.
  while (auto event = queue_.try_pop()) {
    dispatch(*event);
  }
}

// A throwing handler costs that one event, not the loop thread.
void EventLoopThread::dispatch(const Event& event) {
  try {
    bus_.publish(event);
  } catch (const std::exception& e) {
    failed_.fetch_add(1, std::memory_order_relaxed);
    std::cerr << "[EventLoop] handler failed (event index " << event.index()
              << "): " << e.what() << "\n";
  }
  dispatched_.fetch_add(1, std::memory_order_relaxed);
}

// -----------------------------------------------------------------------------
// run() - worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.try_pop();
    if (event) {
      dispatch(*event);
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }
}

}  // namespace arena
