#pragma once

#include "execsim/domain/order.hpp"

#include <optional>

namespace execsim {

// -----------------------------------------------------------------------------
// Fill pricing: slippage, limit and fee model
// -----------------------------------------------------------------------------
//
// @brief  Stateless functions that turn a market price into the price a
//         slice is reported at.
//
// @details
// Pipeline for one slice:
//
//   market ──slippage──> slipped ──limit clamp──> ──fee──> ──limit clamp──> px
//
//   1. Slippage moves the price against the taker:
//        slipped = market · (1 + sign · slippage_bps / 10'000)
//   2. Limit: if the market itself is through the limit (BUY market above
//      limit, SELL market below limit) the slice is not fillable at all.
//      Otherwise slippage may only push the price up to the limit.
//   3. Fee is baked into the price:
//        px = slipped · (1 + sign · fee_bps / 10'000)
//      and, with a limit, clamped again so no report ever crosses it.
//   4. Floored at kMinFillPrice. A BUY limit below the floor can never be
//      filled, so that slice is not fillable either.
//
// sign is +1 for Buy, -1 for Sell.
//
// Thread-safety: Pure functions; safe from any thread.
// -----------------------------------------------------------------------------

inline constexpr double kBpsDivisor = 10'000.0;
inline constexpr double kMinFillPrice = 0.0001;

// market · (1 + sign · bps / 10'000)
double applySlippage(domain::Side side, double market_price,
                     double slippage_bps);

// price · (1 + sign · bps / 10'000)
double applyFee(domain::Side side, double price, double fee_bps);

// True when the market price does not already violate the limit.
bool isMarketable(domain::Side side, double market_price, double limit_price);

// Moves price back onto the limit if it is on the wrong side of it.
double clampToLimit(domain::Side side, double price, double limit_price);

// -----------------------------------------------------------------------------
// executionPrice(...)
// -----------------------------------------------------------------------------
// @brief  Full pipeline above.
// @return The fee-inclusive fill price, or std::nullopt when the order has a
//         limit that the market price (or the price floor) cannot satisfy.
// -----------------------------------------------------------------------------
std::optional<double> executionPrice(domain::Side side, double market_price,
                                     const std::optional<double>& limit_price,
                                     double slippage_bps, double fee_bps);

}  // namespace execsim
