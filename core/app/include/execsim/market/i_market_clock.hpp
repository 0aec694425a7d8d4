#pragma once

#include <cstdint>

namespace execsim {

// -----------------------------------------------------------------------------
// IMarketClock: trading calendar
// -----------------------------------------------------------------------------
//
// @brief  Answers whether the market is open at a given instant.
//
// @details
// Consulted once per submit(), and only when BrokerOptions::
// respect_market_hours is set. The gateway passes ITimeProvider::now_ms(),
// so under a SimulationTimeProvider the calendar follows virtual time.
//
// Thread-safety: isOpen() must be safe to call concurrently.
// -----------------------------------------------------------------------------
class IMarketClock {
 public:
  virtual ~IMarketClock() = default;

  virtual bool isOpen(std::int64_t epoch_ms) const = 0;
};

}  // namespace execsim
