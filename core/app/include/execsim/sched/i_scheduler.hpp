#pragma once

#include <cstdint>
#include <functional>

namespace execsim {

// -----------------------------------------------------------------------------
// IScheduler: delayed-callback abstraction
// -----------------------------------------------------------------------------
//
// @brief  Runs a callback once after a delay and lets the caller revoke it
//         before it runs.
//
// @details
// The gateway models venue latency by scheduling every fill slice and every
// cancel acknowledgement through this interface instead of sleeping or
// calling real timers. Two implementations exist:
//
//   VirtualScheduler: nothing runs until the owner calls advanceBy() or
//                      advanceTo(). Deterministic; used by tests and by
//                      backtest harnesses that replay virtual time.
//   TimerThread     : a worker thread that fires callbacks in real time.
//
// Callback execution contract (both implementations):
//   - Callbacks run serially: never two at once for one scheduler.
//   - Callbacks run WITHOUT any scheduler lock held, so a callback may call
//     schedule() and cancel() on the same scheduler.
//   - A callback due at the same time as another runs after the one
//     scheduled earlier.
//
// Thread-safety: schedule() and cancel() are safe from any thread.
// -----------------------------------------------------------------------------
class IScheduler {
 public:
  // Opaque handle. 0 is never a valid handle.
  using TimerId = std::uint64_t;
  using Callback = std::function<void()>;

  virtual ~IScheduler() = default;

  // -------------------------------------------------------------------------
  // schedule(delay_ms, callback)
  // -------------------------------------------------------------------------
  // @brief  Arranges for callback to run once, delay_ms from now.
  //         Negative delays are treated as zero.
  // @return Handle accepted by cancel().
  // -------------------------------------------------------------------------
  virtual TimerId schedule(std::int64_t delay_ms, Callback callback) = 0;

  // -------------------------------------------------------------------------
  // cancel(id)
  // -------------------------------------------------------------------------
  // @brief  Revokes a pending callback.
  // @return true if the callback was pending and will now never run; false
  //         if it already ran, is running right now, or the id is unknown.
  // -------------------------------------------------------------------------
  virtual bool cancel(TimerId id) = 0;
};

}  // namespace execsim
