#pragma once

#include <string>

namespace execsim {

// -----------------------------------------------------------------------------
// IPriceOracle: last tradable price lookup
// -----------------------------------------------------------------------------
//
// @brief  Read-only price source consulted once per slice fire.
//
// @details
// lastPrice() returns the last tradable price (> 0) for a symbol. Any
// non-positive or non-finite value means "no price": the gateway rejects
// the order rather than filling at a made-up price.
//
// Thread-safety contract:
//   Slices of different orders may fire while submit() callers or a price
//   feed update prices, so implementations must tolerate concurrent reads
//   alongside writes.
// -----------------------------------------------------------------------------
class IPriceOracle {
 public:
  virtual ~IPriceOracle() = default;

  virtual double lastPrice(const std::string& symbol) const = 0;
};

}  // namespace execsim
