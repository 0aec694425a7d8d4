#include "execsim/concurrent/timer_thread.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace execsim {

// -----------------------------------------------------------------------------
// Destructor
// -----------------------------------------------------------------------------
// The worker references queue_ and the sync primitives, so it must be joined
// before they are destroyed.
// -----------------------------------------------------------------------------
TimerThread::~TimerThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TimerThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TimerThread::stop() {
  if (thread_.joinable()) {
    {
      // Store under the lock so the worker cannot miss the wakeup between
      // evaluating its wait predicate and blocking.
      std::lock_guard lock(mutex_);
      running_.store(false);
    }
    wake_cv_.notify_all();
    thread_.join();
  }

  std::lock_guard lock(mutex_);
  queue_.clear();
  index_.clear();
}

// -----------------------------------------------------------------------------
// schedule()
// -----------------------------------------------------------------------------
IScheduler::TimerId TimerThread::schedule(std::int64_t delay_ms,
                                          Callback callback) {
  const auto due = SteadyClock::now() +
                   std::chrono::milliseconds(std::max<std::int64_t>(0, delay_ms));
  const TimerId id = ids_.next();

  {
    std::lock_guard lock(mutex_);
    queue_.emplace(Key{due, id}, std::move(callback));
    index_.emplace(id, due);
  }
  // The new timer may be earlier than the one the worker is sleeping on.
  wake_cv_.notify_all();
  return id;
}

// -----------------------------------------------------------------------------
// cancel()
// -----------------------------------------------------------------------------
bool TimerThread::cancel(TimerId id) {
  std::lock_guard lock(mutex_);
  auto it = index_.find(id);
  if (it == index_.end()) {
    return false;
  }
  queue_.erase(Key{it->second, id});
  index_.erase(it);
  return true;
}

std::size_t TimerThread::pendingCount() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void TimerThread::run() {
  std::unique_lock lock(mutex_);

  while (running_.load()) {
    if (queue_.empty()) {
      wake_cv_.wait(lock, [this] { return !running_.load() || !queue_.empty(); });
      continue;
    }

    auto head = queue_.begin();
    const auto due = head->first.first;
    if (SteadyClock::now() < due) {
      // Woken early by schedule(), cancel() races or stop(); the loop
      // re-evaluates the head either way.
      wake_cv_.wait_until(lock, due);
      continue;
    }

    Callback callback = std::move(head->second);
    index_.erase(head->first.second);
    queue_.erase(head);

    // Run unlocked so the callback can schedule() / cancel().
    lock.unlock();
    try {
      callback();
    } catch (const std::exception& e) {
      std::cerr << "[TimerThread] ERROR: timer callback threw: " << e.what()
                << "\n";
    }
    lock.lock();
  }
}

}  // namespace execsim
