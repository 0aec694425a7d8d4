#pragma once

#include <cstdint>

namespace execsim {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "current time" away from std::chrono::system_clock so
//         report timestamps and market-hours checks can follow either the
//         wall clock or a virtual clock.
//
// @details
// The gateway never calls system_clock directly. It stamps reports and asks
// the market calendar about "now" through this interface:
//   - LiveTimeProvider       → wall-clock time (the execsim binary).
//   - SimulationTimeProvider → a value advanced by VirtualScheduler (tests,
//                              backtest harnesses).
//
// Time is epoch milliseconds as int64_t, the unit report timestamps carry
// on the wire and the unit every configured delay uses.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from any thread
//   (submit() callers and the timer thread read it simultaneously).
//
// Ownership:
//   Components hold a const reference. The provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace execsim
