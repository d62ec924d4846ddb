#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace arena {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded multi-producer / multi-consumer FIFO used at the
// engine's thread boundaries.
//
// Where it is used:
//   - EventLoopThread: the ingest gateway thread pushes decoded Orchestrator
//     messages; the ingest loop thread pops and dispatches them.
//   - IpcServer: the ingest loop pushes telemetry (round summaries,
//     regression alerts); the IPC thread drains and publishes them.
//
// Thread model: All methods are thread-safe. pop() blocks until an item is
// available; try_pop() never blocks.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // Appends one item and wakes one blocked consumer. The notify happens
  // after the lock is released.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // pop() - blocking
  // -------------------------------------------------------------------------
  // Waits (predicate-guarded against spurious wakeups) until the queue is
  // non-empty, then removes and returns the front item.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });

    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop() - non-blocking
  // -------------------------------------------------------------------------
  // Returns the front item, or std::nullopt if the queue is empty.
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  // Snapshot of the current depth; may be stale by the time it is read.
  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
};

}  // namespace arena
