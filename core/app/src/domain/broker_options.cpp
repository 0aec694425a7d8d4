#include "execsim/domain/broker_options.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace execsim {
namespace domain {

namespace {

// Slice fractions must leave something for the next slice and must carve
// something off, so both ends of (0, 1) are excluded.
constexpr double kMinFraction = 0.001;
constexpr double kMaxFraction = 0.999;

double clampFraction(double value, double fallback) {
  if (!std::isfinite(value)) {
    return fallback;
  }
  return std::clamp(value, kMinFraction, kMaxFraction);
}

}  // namespace

// -----------------------------------------------------------------------------
// normalized(): clamp every knob into its legal range
// -----------------------------------------------------------------------------
BrokerOptions BrokerOptions::normalized() const {
  BrokerOptions out = *this;

  out.reject_rate = std::isfinite(reject_rate)
                        ? std::clamp(reject_rate, 0.0, kMaxRejectRate)
                        : 0.0;

  out.venue_latency_ms = std::max<std::int64_t>(0, venue_latency_ms);
  out.latency_jitter_ms = std::max<std::int64_t>(0, latency_jitter_ms);
  out.cancel_latency_ms = std::max<std::int64_t>(0, cancel_latency_ms);

  out.min_slices = std::max(1, min_slices);
  out.max_slices = std::max(out.min_slices, max_slices);

  out.min_slice_fraction = clampFraction(min_slice_fraction, 0.10);
  out.max_slice_fraction = clampFraction(max_slice_fraction, 0.35);
  if (out.min_slice_fraction > out.max_slice_fraction) {
    std::swap(out.min_slice_fraction, out.max_slice_fraction);
  }

  out.min_slice_qty = std::isfinite(min_slice_qty)
                          ? std::max(0.0, min_slice_qty)
                          : 0.0;

  if (!std::isfinite(fee_bps)) {
    out.fee_bps = 0.0;
  }
  if (!std::isfinite(slippage_bps)) {
    out.slippage_bps = 0.0;
  }

  return out;
}

}  // namespace domain
}  // namespace execsim
