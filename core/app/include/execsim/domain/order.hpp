#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace execsim {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Responsibility: The caller-assigned client order id. Every submission,
// cancellation and execution report is keyed by it.
// Chosen by the client, so not necessarily numeric.
// -----------------------------------------------------------------------------
using OrderId = std::string;

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// sideSign(side)
// -----------------------------------------------------------------------------
// @brief  +1 for Buy, -1 for Sell. Used to push slippage and fees against
//         the taker: buyers pay up, sellers receive less.
// -----------------------------------------------------------------------------
inline double sideSign(Side side) { return side == Side::Buy ? 1.0 : -1.0; }

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: The immutable order intent handed to an execution gateway.
//
// @details
// Created by the caller and passed by const reference to submit(). The
// gateway copies it into its live order state; the caller's copy is never
// mutated. Quantities are doubles so fractional lots (crypto, FX) are
// representable.
//
// limit_price is empty for a market order. When present, no fill may be
// reported at a price worse than the limit (above it for Buy, below it for
// Sell).
//
// Thread-safety: Plain value type. Safe to copy between threads.
// -----------------------------------------------------------------------------
struct Order {
  OrderId client_order_id;              // Caller-assigned unique id
  std::string symbol;                   // Instrument (e.g. "AAPL")
  Side side{Side::Buy};                 // Buy or Sell
  double quantity{0.0};                 // Requested size, must be > 0
  std::optional<double> limit_price;    // Empty for market orders
  std::int64_t timestamp_ms{0};         // Submission time, epoch ms
};

}  // namespace domain
}  // namespace execsim
