#pragma once

#include "execsim/concurrent/sequence_generator.hpp"
#include "execsim/sched/i_scheduler.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace execsim {

// -----------------------------------------------------------------------------
// TimerThread: real-time IScheduler backed by one worker thread
// -----------------------------------------------------------------------------
// Responsibility: Owns a single worker thread that sleeps until the earliest
// pending timer is due, then runs its callback. All callbacks run on that
// thread, one at a time, so every slice fire and cancel acknowledgement of
// the gateway is serialized on it.
//
// Reports for one order leave the gateway in the order it decided them,
// since the report sink is called on this thread outside the gateway mutex.
//
// Due times are measured on std::chrono::steady_clock so wall-clock
// adjustments never fire timers early or late.
//
// Thread model: start() and stop() from the owning thread (BrokerEngine).
// schedule() and cancel() from any thread, including from inside a
// callback. Timers scheduled while stopped are kept and fire after start().
// -----------------------------------------------------------------------------
class TimerThread final : public IScheduler {
 public:
  TimerThread() = default;

  // Joins the worker. Pending timers are discarded.
  ~TimerThread() override;

  // Non-copyable and non-movable: owns a thread and sync primitives.
  TimerThread(const TimerThread&) = delete;
  TimerThread& operator=(const TimerThread&) = delete;
  TimerThread(TimerThread&&) = delete;
  TimerThread& operator=(TimerThread&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // What: Spawns the worker thread. Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // What: Signals the worker, wakes it, joins it, and discards every pending
  // timer. A callback that is already running completes before stop()
  // returns. Idempotent. Must run before the gateway the callbacks point
  // into is destroyed.
  // -------------------------------------------------------------------------
  void stop();

  TimerId schedule(std::int64_t delay_ms, Callback callback) override;
  bool cancel(TimerId id) override;

  std::size_t pendingCount() const;

 private:
  using SteadyClock = std::chrono::steady_clock;
  using Key = std::pair<SteadyClock::time_point, TimerId>;

  // Worker loop: wait for the head timer, pop it, run it unlocked.
  void run();

  SequenceGenerator ids_;

  mutable std::mutex mutex_;          // Protects queue_ and index_
  std::condition_variable wake_cv_;   // Signalled on schedule() and stop()
  std::map<Key, Callback> queue_;
  std::unordered_map<TimerId, SteadyClock::time_point> index_;

  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace execsim
