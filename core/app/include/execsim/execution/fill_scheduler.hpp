#pragma once

#include "execsim/domain/broker_options.hpp"
#include "execsim/random/i_random_source.hpp"
#include "execsim/sched/i_scheduler.hpp"

#include <cstdint>
#include <functional>
#include <vector>

namespace execsim {

// -----------------------------------------------------------------------------
// FillScheduler: slicing and latency model
// -----------------------------------------------------------------------------
//
// @brief  Splits an accepted order's remaining quantity into slices and
//         schedules one delayed fire event per slice.
//
// @details
// Slice count:
//   partial_fill off → 1 slice.
//   partial_fill on  → uniformInt(min_slices, max_slices).
//
// Slice sizing (exact quantity conservation):
//   Each non-final slice takes uniform(min_slice_fraction,
//   max_slice_fraction) of the CURRENT leftover, but never less than
//   min_slice_qty. The final slice takes whatever is left. If carving a
//   slice would leave less than min_slice_qty, splitting stops and the
//   final slice takes the rest, so small orders get fewer slices and no
//   slice is ever zero-sized. Σ slices == remaining.
//
// Timing:
//   delay = max(0, venue_latency_ms + uniform(-jitter, +jitter)), drawn
//   independently per slice. Fire order is therefore NOT slice order; the
//   gateway derives terminal status from the remaining quantity, never from
//   which slice fired.
//
// The scheduler does not execute anything itself. It hands each slice's
// quantity back to the gateway through the SliceHandler when the timer
// fires.
//
// Thread model:
//   Called by MockExecutionGateway under its mutex. Holds references to the
//   random source and the scheduler; both must outlive it.
// -----------------------------------------------------------------------------
class FillScheduler {
 public:
  // Invoked on the scheduler's callback thread with the slice's quantity.
  using SliceHandler = std::function<void(double slice_quantity)>;

  struct SlicePlan {
    double quantity{0.0};
    std::int64_t delay_ms{0};
  };

  FillScheduler(const domain::BrokerOptions& options, IRandomSource& random,
                IScheduler& scheduler);

  // -------------------------------------------------------------------------
  // sliceCount()
  // -------------------------------------------------------------------------
  // @brief  Draws the number of slices for one order (1 if partial fills
  //         are disabled).
  // -------------------------------------------------------------------------
  int sliceCount();

  // -------------------------------------------------------------------------
  // splitQuantity(remaining, slices)
  // -------------------------------------------------------------------------
  // @brief  Splits remaining into at most `slices` positive parts summing to
  //         remaining. See class comment for the sizing rule.
  // -------------------------------------------------------------------------
  std::vector<double> splitQuantity(double remaining, int slices);

  // Draws one slice delay.
  std::int64_t sliceDelay();

  // -------------------------------------------------------------------------
  // plan(remaining)
  // -------------------------------------------------------------------------
  // @brief  sliceCount() + splitQuantity() + one sliceDelay() per slice.
  // -------------------------------------------------------------------------
  std::vector<SlicePlan> plan(double remaining);

  // -------------------------------------------------------------------------
  // scheduleSlices(remaining, on_fire)
  // -------------------------------------------------------------------------
  // @brief  Plans the slices and schedules one timer per slice. Each timer
  //         calls on_fire(slice_quantity).
  //
  // @return The timer handles, in slice order. The caller stores them in
  //         the live order state so cleanup can revoke the ones that have
  //         not fired yet.
  // -------------------------------------------------------------------------
  std::vector<IScheduler::TimerId> scheduleSlices(double remaining,
                                                  const SliceHandler& on_fire);

 private:
  const domain::BrokerOptions options_;
  IRandomSource& random_;
  IScheduler& scheduler_;
};

}  // namespace execsim
