// Repository: CutLog
// Component: Event Channel
// Purpose: Bounded, non-blocking queue for one device event stream
// Copyright (c) 2026 CutLog

#ifndef CUTLOG_RUNTIME_EVENT_CHANNEL_HPP_
#define CUTLOG_RUNTIME_EVENT_CHANNEL_HPP_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace cutlog::runtime {

// Many producers, one consumer (the session sequencer). TryPush never
// blocks: a full channel rejects the event and counts the overflow.
// After Close() every push is rejected as kClosed.
template <typename T>
class EventChannel {
 public:
  enum class PushResult {
    kAccepted,
    kFull,
    kClosed,
  };

  explicit EventChannel(size_t capacity) : capacity_(capacity) {}

  EventChannel(const EventChannel&) = delete;
  EventChannel& operator=(const EventChannel&) = delete;

  PushResult TryPush(T item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return PushResult::kClosed;
    }
    if (items_.size() >= capacity_) {
      ++overflow_total_;
      return PushResult::kFull;
    }
    items_.push_back(std::move(item));
    return PushResult::kAccepted;
  }

  // Moves every queued item to the back of *out, in push order.
  size_t DrainTo(std::vector<T>* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t n = items_.size();
    for (auto& item : items_) {
      out->push_back(std::move(item));
    }
    items_.clear();
    return n;
  }

  void Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  uint64_t overflow_total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return overflow_total_;
  }

  size_t capacity() const { return capacity_; }

 private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<T> items_;
  bool closed_ = false;
  uint64_t overflow_total_ = 0;
};

}  // namespace cutlog::runtime

#endif  // CUTLOG_RUNTIME_EVENT_CHANNEL_HPP_
