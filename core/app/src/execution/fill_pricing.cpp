#include "execsim/execution/fill_pricing.hpp"

#include <algorithm>

namespace execsim {

double applySlippage(domain::Side side, double market_price,
                     double slippage_bps) {
  return market_price +
         market_price * (slippage_bps / kBpsDivisor) * domain::sideSign(side);
}

double applyFee(domain::Side side, double price, double fee_bps) {
  return price + price * (fee_bps / kBpsDivisor) * domain::sideSign(side);
}

bool isMarketable(domain::Side side, double market_price, double limit_price) {
  return side == domain::Side::Buy ? market_price <= limit_price
                                   : market_price >= limit_price;
}

double clampToLimit(domain::Side side, double price, double limit_price) {
  return side == domain::Side::Buy ? std::min(price, limit_price)
                                   : std::max(price, limit_price);
}

// -----------------------------------------------------------------------------
// executionPrice(): slippage → limit → fee → limit → floor
// -----------------------------------------------------------------------------
std::optional<double> executionPrice(domain::Side side, double market_price,
                                     const std::optional<double>& limit_price,
                                     double slippage_bps, double fee_bps) {
  if (limit_price && !isMarketable(side, market_price, *limit_price)) {
    return std::nullopt;
  }

  double px = applySlippage(side, market_price, slippage_bps);
  if (limit_price) {
    px = clampToLimit(side, px, *limit_price);
  }

  px = applyFee(side, px, fee_bps);
  if (limit_price) {
    px = clampToLimit(side, px, *limit_price);
  }

  px = std::max(kMinFillPrice, px);
  if (limit_price && !isMarketable(side, px, *limit_price)) {
    return std::nullopt;
  }
  return px;
}

}  // namespace execsim
