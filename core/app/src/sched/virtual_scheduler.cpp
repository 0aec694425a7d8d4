#include "execsim/sched/virtual_scheduler.hpp"

#include <algorithm>
#include <limits>

namespace execsim {

VirtualScheduler::VirtualScheduler(SimulationTimeProvider& clock)
    : clock_(clock) {}

// -----------------------------------------------------------------------------
// schedule(): insert into the due-time ordered queue
// -----------------------------------------------------------------------------
IScheduler::TimerId VirtualScheduler::schedule(std::int64_t delay_ms,
                                               Callback callback) {
  const std::int64_t due = clock_.now_ms() + std::max<std::int64_t>(0, delay_ms);
  const TimerId id = ids_.next();

  std::lock_guard lock(mutex_);
  queue_.emplace(Key{due, id}, std::move(callback));
  index_.emplace(id, due);
  return id;
}

// -----------------------------------------------------------------------------
// cancel(): remove a pending timer
// -----------------------------------------------------------------------------
bool VirtualScheduler::cancel(TimerId id) {
  std::lock_guard lock(mutex_);
  auto it = index_.find(id);
  if (it == index_.end()) {
    return false;
  }
  queue_.erase(Key{it->second, id});
  index_.erase(it);
  return true;
}

// -----------------------------------------------------------------------------
// popDue(): take the head of the queue under the lock
// -----------------------------------------------------------------------------
bool VirtualScheduler::popDue(std::int64_t limit_ms, Key& key,
                              Callback& callback) {
  std::lock_guard lock(mutex_);
  if (queue_.empty()) {
    return false;
  }
  auto head = queue_.begin();
  if (head->first.first > limit_ms) {
    return false;
  }
  key = head->first;
  callback = std::move(head->second);
  index_.erase(key.second);
  queue_.erase(head);
  return true;
}

// -----------------------------------------------------------------------------
// advanceTo(): fire due timers one at a time, lock released around each
// -----------------------------------------------------------------------------
std::size_t VirtualScheduler::advanceTo(std::int64_t target_ms) {
  std::size_t executed = 0;
  Key key;
  Callback callback;

  while (popDue(target_ms, key, callback)) {
    if (key.first > clock_.now_ms()) {
      clock_.advance_time(key.first);
    }
    callback();
    ++executed;
  }

  if (target_ms > clock_.now_ms()) {
    clock_.advance_time(target_ms);
  }
  return executed;
}

std::size_t VirtualScheduler::advanceBy(std::int64_t delta_ms) {
  return advanceTo(clock_.now_ms() + std::max<std::int64_t>(0, delta_ms));
}

std::size_t VirtualScheduler::runAll() {
  std::size_t executed = 0;
  Key key;
  Callback callback;

  while (popDue(std::numeric_limits<std::int64_t>::max(), key, callback)) {
    if (key.first > clock_.now_ms()) {
      clock_.advance_time(key.first);
    }
    callback();
    ++executed;
  }
  return executed;
}

std::size_t VirtualScheduler::pendingCount() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

}  // namespace execsim
