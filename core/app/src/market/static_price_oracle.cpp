#include "execsim/market/static_price_oracle.hpp"

#include <mutex>

namespace execsim {

double StaticPriceOracle::lastPrice(const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = prices_.find(symbol);
  return (it != prices_.end()) ? it->second : 0.0;
}

void StaticPriceOracle::setPrice(const std::string& symbol, double price) {
  std::unique_lock lock(mutex_);
  prices_[symbol] = price;
}

bool StaticPriceOracle::erase(const std::string& symbol) {
  std::unique_lock lock(mutex_);
  return prices_.erase(symbol) > 0;
}

std::size_t StaticPriceOracle::size() const {
  std::shared_lock lock(mutex_);
  return prices_.size();
}

}  // namespace execsim
