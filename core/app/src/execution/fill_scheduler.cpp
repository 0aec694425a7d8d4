#include "execsim/execution/fill_scheduler.hpp"

#include <algorithm>
#include <cmath>

namespace execsim {

FillScheduler::FillScheduler(const domain::BrokerOptions& options,
                             IRandomSource& random, IScheduler& scheduler)
    : options_(options.normalized()), random_(random), scheduler_(scheduler) {}

// -----------------------------------------------------------------------------
// sliceCount()
// -----------------------------------------------------------------------------
int FillScheduler::sliceCount() {
  if (!options_.partial_fill) {
    return 1;
  }
  return std::max(1, random_.uniformInt(options_.min_slices,
                                        options_.max_slices));
}

// -----------------------------------------------------------------------------
// splitQuantity(): fractions of the current leftover, final slice takes rest
// -----------------------------------------------------------------------------
std::vector<double> FillScheduler::splitQuantity(double remaining, int slices) {
  std::vector<double> parts;
  parts.reserve(static_cast<std::size_t>(std::max(1, slices)));

  double leftover = remaining;
  for (int i = 0; i < slices - 1; ++i) {
    const double fraction = random_.uniform(options_.min_slice_fraction,
                                            options_.max_slice_fraction);
    const double part = std::max(options_.min_slice_qty, fraction * leftover);

    // Carving this part would leave a sliver (or nothing) for the final
    // slice: stop splitting and let the final slice take it all.
    if (part >= leftover || leftover - part < options_.min_slice_qty) {
      break;
    }

    parts.push_back(part);
    leftover -= part;
  }

  parts.push_back(leftover);
  return parts;
}

// -----------------------------------------------------------------------------
// sliceDelay(): base latency ± jitter, floored at zero
// -----------------------------------------------------------------------------
std::int64_t FillScheduler::sliceDelay() {
  double delay = static_cast<double>(options_.venue_latency_ms);
  if (options_.latency_jitter_ms > 0) {
    const auto jitter = static_cast<double>(options_.latency_jitter_ms);
    delay += random_.uniform(-jitter, jitter);
  }
  return std::max<std::int64_t>(0, std::llround(delay));
}

// -----------------------------------------------------------------------------
// plan()
// -----------------------------------------------------------------------------
std::vector<FillScheduler::SlicePlan> FillScheduler::plan(double remaining) {
  const std::vector<double> quantities =
      splitQuantity(remaining, sliceCount());

  std::vector<SlicePlan> slices;
  slices.reserve(quantities.size());
  for (double qty : quantities) {
    slices.push_back(SlicePlan{qty, sliceDelay()});
  }
  return slices;
}

// -----------------------------------------------------------------------------
// scheduleSlices(): one timer per planned slice
// -----------------------------------------------------------------------------
std::vector<IScheduler::TimerId> FillScheduler::scheduleSlices(
    double remaining, const SliceHandler& on_fire) {
  std::vector<IScheduler::TimerId> timers;
  for (const SlicePlan& slice : plan(remaining)) {
    const double qty = slice.quantity;
    timers.push_back(scheduler_.schedule(
        slice.delay_ms, [on_fire, qty] { on_fire(qty); }));
  }
  return timers;
}

}  // namespace execsim
