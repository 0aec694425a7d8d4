#include "execsim/execution/order_registry.hpp"

#include <utility>

namespace execsim {

bool OrderRegistry::markSeen(const domain::OrderId& id) {
  return seen_.insert(id).second;
}

bool OrderRegistry::wasSeen(const domain::OrderId& id) const {
  return seen_.count(id) > 0;
}

LiveOrder& OrderRegistry::insert(LiveOrder live) {
  domain::OrderId id = live.order.client_order_id;
  auto it = inflight_.emplace(std::move(id), std::move(live)).first;
  return it->second;
}

LiveOrder* OrderRegistry::find(const domain::OrderId& id) {
  auto it = inflight_.find(id);
  return (it != inflight_.end()) ? &it->second : nullptr;
}

// -----------------------------------------------------------------------------
// cleanup(): revoke pending timers, then drop the entry
// -----------------------------------------------------------------------------
bool OrderRegistry::cleanup(const domain::OrderId& id, IScheduler& scheduler) {
  auto it = inflight_.find(id);
  if (it == inflight_.end()) {
    return false;
  }

  for (IScheduler::TimerId timer : it->second.timers) {
    scheduler.cancel(timer);
  }
  inflight_.erase(it);
  return true;
}

std::size_t OrderRegistry::cleanupAll(IScheduler& scheduler) {
  const std::size_t removed = inflight_.size();
  for (auto& [id, live] : inflight_) {
    for (IScheduler::TimerId timer : live.timers) {
      scheduler.cancel(timer);
    }
  }
  inflight_.clear();
  return removed;
}

}  // namespace execsim
