#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace execsim {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded FIFO handing items across a thread boundary.
//
// In execsim it carries execution reports from the timer thread (where the
// gateway emits them) to the IPC thread (which serializes them to JSON and
// publishes them on the PUB socket). The producer never waits on socket
// I/O; the consumer drains in batches between command polls.
//
// Thread model: Multiple producers and consumers. All methods are
// thread-safe. pop() blocks; try_pop() and drain() never do.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Non-copyable, non-movable: owns a mutex and a condition variable.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // Appends one item and wakes one blocked pop(). The notify happens after
  // the lock is released so the woken thread can take the mutex at once.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // pop(): blocking
  // -------------------------------------------------------------------------
  // Waits until an item is available. The predicate form of wait() handles
  // spurious wakeups.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Returns the front item, or std::nullopt immediately if empty.
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // drain()
  // -------------------------------------------------------------------------
  // Removes every queued item in FIFO order under a single lock
  // acquisition. The IPC thread uses this so a burst of reports costs one
  // lock instead of one per report.
  // -------------------------------------------------------------------------
  std::vector<T> drain() {
    std::lock_guard lock(mutex_);
    std::vector<T> out;
    out.reserve(queue_.size());
    for (auto& item : queue_) {
      out.push_back(std::move(item));
    }
    queue_.clear();
    return out;
  }

  // Snapshot only: another thread may change the queue right after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
};

}  // namespace execsim
