#pragma once

#include <cstdint>

namespace execsim {
namespace domain {

// -----------------------------------------------------------------------------
// BrokerOptions: tuning knobs of the simulated venue
// -----------------------------------------------------------------------------
//
// @brief  Latency, slicing, rejection and cost parameters for
//         MockExecutionGateway. Every field has a default, so a
//         default-constructed BrokerOptions is a valid configuration.
//
// @details
// The struct is passed by value to the gateway constructor, which stores
// normalized() so that out-of-range values from a config file cannot break
// the fill model (e.g. a reject rate of 0.9 becomes 0.25).
//
// Basis points: 1 bps = 0.01 %. slippage_bps = 2 moves a 100.00 buy to
// 100.02 before fees.
//
// Thread model:
//   Plain data with value semantics. Copied into components at construction
//   and never mutated afterwards.
// -----------------------------------------------------------------------------
struct BrokerOptions {
  /// Base delay between acceptance and each slice execution.
  std::int64_t venue_latency_ms{180};

  /// Each slice delay is venue_latency_ms + uniform(-jitter, +jitter),
  /// floored at zero.
  std::int64_t latency_jitter_ms{120};

  /// When false every order executes as a single slice.
  bool partial_fill{true};

  /// Inclusive range the slice count is drawn from when partial_fill is on.
  int min_slices{2};
  int max_slices{5};

  /// Each non-final slice takes a fraction of the current leftover drawn
  /// uniformly from [min_slice_fraction, max_slice_fraction].
  double min_slice_fraction{0.10};
  double max_slice_fraction{0.35};

  /// Smallest non-final slice. Orders too small to split further get fewer
  /// slices instead of zero-sized ones.
  double min_slice_qty{0.01};

  /// Probability of an immediate risk/venue reject. Clamped to
  /// [0, kMaxRejectRate].
  double reject_rate{0.01};

  /// Delay before a cancel request is honoured.
  std::int64_t cancel_latency_ms{80};

  /// Fee baked into the execution price (buy pays up, sell receives less).
  double fee_bps{1.0};

  /// Market impact applied against the taker.
  double slippage_bps{2.0};

  /// When true and a market clock is supplied, orders submitted while the
  /// market is closed are rejected immediately.
  bool respect_market_hours{false};

  static constexpr double kMaxRejectRate = 0.25;

  // -------------------------------------------------------------------------
  // normalized()
  // -------------------------------------------------------------------------
  // @brief  Returns a copy with every field clamped into its legal range.
  //
  // @details
  //   - reject_rate              → [0, kMaxRejectRate] (NaN → 0)
  //   - latencies and jitter     → >= 0
  //   - min_slices               → >= 1, max_slices → >= min_slices
  //   - slice fractions          → (0, 1), min <= max (swapped if needed)
  //   - min_slice_qty            → >= 0
  //
  // Side-effects: None.
  // -------------------------------------------------------------------------
  BrokerOptions normalized() const;
};

}  // namespace domain
}  // namespace execsim
