#pragma once

#include "execsim/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace execsim {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever was last written by
//         advance_time().
//
// @details
// VirtualScheduler owns the writer side: before running a due timer it
// advances this clock to the timer's due time, so every report emitted from
// that callback carries the virtual fire time. Tests can also set the clock
// directly to place a submission inside or outside market hours.
//
// Internal storage is a std::atomic<int64_t>: the clock is read far more
// often than it is written, and readers may sit on other threads than the
// writer. seq_cst load/store gives the needed visibility without a mutex.
//
// Thread model:
//   advance_time(): single writer (VirtualScheduler or the test body).
//   now_ms()      : any number of concurrent readers.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  start_ms  Initial clock value. 0 means "epoch start"; callers
  //                   that gate on market hours should pass a meaningful
  //                   session time instead.
  // -------------------------------------------------------------------------
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock. Monotonicity is the caller's responsibility;
  //         VirtualScheduler only ever moves forward.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_;
};

}  // namespace execsim
