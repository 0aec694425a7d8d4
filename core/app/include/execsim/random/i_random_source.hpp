#pragma once

namespace execsim {

// -----------------------------------------------------------------------------
// IRandomSource: injectable randomness
// -----------------------------------------------------------------------------
//
// @brief  Every random decision of the fill model (reject draw, slice count,
//         slice fractions, latency jitter) goes through this interface so
//         tests can script the exact sequence of draws.
//
// @details
// Draw order inside MockExecutionGateway::submit() for one order:
//   1. uniform(0, 1)                  reject draw, only if reject_rate > 0
//   2. uniformInt(min, max)           slice count, only if partial_fill
//   3. uniform(min_frac, max_frac)    once per non-final slice
//   4. uniform(-jitter, +jitter)      once per slice, only if jitter > 0
//
// Thread-safety: Implementations must be safe to call from any thread.
// -----------------------------------------------------------------------------
class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  // Uniform real in [lo, hi). Returns lo when lo >= hi.
  virtual double uniform(double lo, double hi) = 0;

  // Uniform integer in [lo, hi] (inclusive). Returns lo when lo >= hi.
  virtual int uniformInt(int lo, int hi) = 0;
};

}  // namespace execsim
