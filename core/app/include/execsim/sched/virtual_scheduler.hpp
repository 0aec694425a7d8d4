#pragma once

#include "execsim/concurrent/sequence_generator.hpp"
#include "execsim/sched/i_scheduler.hpp"
#include "execsim/time/simulation_time_provider.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace execsim {

// -----------------------------------------------------------------------------
// VirtualScheduler: manually advanced IScheduler over virtual time
// -----------------------------------------------------------------------------
//
// @brief  Keeps scheduled callbacks in a due-time ordered queue and runs
//         them only when the owner advances virtual time.
//
// @details
// Time is read from and written to a SimulationTimeProvider. A timer
// scheduled with delay d at virtual time t is due at t + d. advanceTo(T)
// repeatedly takes the earliest due timer with due <= T, moves the clock to
// its due time, and runs it; finally the clock is moved to T. Because the
// clock is advanced before each callback, every report emitted from inside a
// callback carries exactly the virtual fire time.
//
// Ordering: (due time, schedule order). Two timers due at the same instant
// run in the order they were scheduled, which makes slice interleavings in
// tests exactly reproducible.
//
// Callbacks scheduled from inside a running callback with due <= T run in
// the same advanceTo() call.
//
// Thread model:
//   schedule() and cancel() may be called from any thread. advanceTo() /
//   advanceBy() / runAll() must be called from one thread at a time, and
//   not from inside a callback. Callbacks run on the advancing thread with
//   no internal lock held.
//
// Ownership:
//   Holds a reference to the SimulationTimeProvider; the clock must outlive
//   the scheduler.
// -----------------------------------------------------------------------------
class VirtualScheduler final : public IScheduler {
 public:
  explicit VirtualScheduler(SimulationTimeProvider& clock);

  VirtualScheduler(const VirtualScheduler&) = delete;
  VirtualScheduler& operator=(const VirtualScheduler&) = delete;

  TimerId schedule(std::int64_t delay_ms, Callback callback) override;
  bool cancel(TimerId id) override;

  // -------------------------------------------------------------------------
  // advanceTo(target_ms)
  // -------------------------------------------------------------------------
  // @brief  Runs every timer due at or before target_ms, then leaves the
  //         clock at target_ms (never moves it backwards).
  // @return Number of callbacks executed.
  // -------------------------------------------------------------------------
  std::size_t advanceTo(std::int64_t target_ms);

  // Convenience: advanceTo(now + delta_ms).
  std::size_t advanceBy(std::int64_t delta_ms);

  // -------------------------------------------------------------------------
  // runAll()
  // -------------------------------------------------------------------------
  // @brief  Runs timers until none are pending, advancing the clock to each
  //         due time in turn.
  // @return Number of callbacks executed.
  // -------------------------------------------------------------------------
  std::size_t runAll();

  std::size_t pendingCount() const;

 private:
  // (due_ms, id): ids increase with schedule order, so the map's ordering
  // is exactly "earliest due first, then first scheduled first".
  using Key = std::pair<std::int64_t, TimerId>;

  // Pops the earliest timer if it is due at or before limit_ms.
  bool popDue(std::int64_t limit_ms, Key& key, Callback& callback);

  SimulationTimeProvider& clock_;
  SequenceGenerator ids_;

  mutable std::mutex mutex_;                     // Protects queue_ and index_
  std::map<Key, Callback> queue_;
  std::unordered_map<TimerId, std::int64_t> index_;  // id → due_ms
};

}  // namespace execsim
