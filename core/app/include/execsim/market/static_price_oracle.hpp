#pragma once

#include "execsim/market/i_price_oracle.hpp"

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace execsim {

// -----------------------------------------------------------------------------
// StaticPriceOracle: in-memory symbol → price table
// -----------------------------------------------------------------------------
//
// @brief  IPriceOracle backed by a hash map that callers update explicitly:
//         seeded from the config file, refreshed by PriceFeed ticks or the
//         "set_price" IPC command, or set directly in tests.
//
// @details
// Unknown symbols return 0.0 (no price).
//
// Thread model:
//   std::shared_mutex: many slice fires read concurrently (shared_lock),
//   updates take an exclusive lock. Reads vastly outnumber writes.
// -----------------------------------------------------------------------------
class StaticPriceOracle final : public IPriceOracle {
 public:
  StaticPriceOracle() = default;

  double lastPrice(const std::string& symbol) const override;

  // -------------------------------------------------------------------------
  // setPrice(symbol, price)
  // -------------------------------------------------------------------------
  // @brief  Stores a price. Non-positive or non-finite prices are stored as
  //         given; lastPrice() then reports them and the gateway treats the
  //         symbol as unpriced. This lets tests and feeds model a halted
  //         instrument.
  // -------------------------------------------------------------------------
  void setPrice(const std::string& symbol, double price);

  // Removes the symbol. Returns true if it was present.
  bool erase(const std::string& symbol);

  std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, double> prices_;
};

}  // namespace execsim
