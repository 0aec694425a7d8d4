#include "execsim/execution/dedup_gateway.hpp"

namespace execsim {

DedupGateway::DedupGateway(IExecutionGateway& inner) : inner_(inner) {}

// -----------------------------------------------------------------------------
// submit(): claim the id, forward, release the claim if the inner call throws
// -----------------------------------------------------------------------------
void DedupGateway::submit(const domain::Order& order) {
  {
    std::lock_guard lock(mutex_);
    if (!seen_.insert(order.client_order_id).second) {
      return;
    }
  }

  try {
    inner_.submit(order);
  } catch (...) {
    std::lock_guard lock(mutex_);
    seen_.erase(order.client_order_id);
    throw;
  }
}

void DedupGateway::cancel(const domain::OrderId& client_order_id) {
  inner_.cancel(client_order_id);
}

std::size_t DedupGateway::forwardedCount() const {
  std::lock_guard lock(mutex_);
  return seen_.size();
}

}  // namespace execsim
