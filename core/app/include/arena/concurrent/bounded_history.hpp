#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <utility>
#include <vector>

namespace arena {

// -----------------------------------------------------------------------------
// BoundedHistory<T> - fixed-capacity FIFO history buffer
// -----------------------------------------------------------------------------
//
// @brief  Append-only sequence that silently evicts its oldest element once
//         the capacity is exceeded.
//
// @details
// Every rolling history in the engine (round analytics, rating metric
// series, portfolio value points, health snapshots, regression alerts,
// forecasts) is one of these. push() never blocks and never fails on
// capacity; it returns the evicted element so owners that keep a secondary
// index (e.g. roundId -> analytics) can drop the matching entry.
//
// Elements are kept in insertion order: front() is the oldest, back() the
// newest.
//
// Thread model:
//   NOT thread-safe. Owners guard it with their own mutex.
//
// Ownership:
//   Value type. Copyable so that readers can take snapshots.
// -----------------------------------------------------------------------------
template <typename T>
class BoundedHistory {
 public:
  using const_iterator = typename std::deque<T>::const_iterator;
  using iterator = typename std::deque<T>::iterator;

  explicit BoundedHistory(std::size_t capacity) : capacity_(capacity) {}

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // @brief  Appends value; evicts the oldest element when over capacity.
  //
  // @return The evicted element, or std::nullopt if nothing was evicted.
  // -------------------------------------------------------------------------
  std::optional<T> push(T value) {
    items_.push_back(std::move(value));
    if (items_.size() <= capacity_) {
      return std::nullopt;
    }
    T evicted = std::move(items_.front());
    items_.pop_front();
    return evicted;
  }

  // Returns up to n of the newest elements, oldest first.
  std::vector<T> tail(std::size_t n) const {
    const std::size_t count = n < items_.size() ? n : items_.size();
    return std::vector<T>(items_.end() - static_cast<std::ptrdiff_t>(count),
                          items_.end());
  }

  std::vector<T> toVector() const {
    return std::vector<T>(items_.begin(), items_.end());
  }

  void clear() { items_.clear(); }

  std::size_t size() const { return items_.size(); }
  std::size_t capacity() const { return capacity_; }
  bool empty() const { return items_.empty(); }

  const T& front() const { return items_.front(); }
  const T& back() const { return items_.back(); }
  T& back() { return items_.back(); }
  const T& operator[](std::size_t i) const { return items_[i]; }
  T& operator[](std::size_t i) { return items_[i]; }

  const_iterator begin() const { return items_.begin(); }
  const_iterator end() const { return items_.end(); }
  iterator begin() { return items_.begin(); }
  iterator end() { return items_.end(); }

 private:
  std::size_t capacity_;
  std::deque<T> items_;
};

}  // namespace arena
