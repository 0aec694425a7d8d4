#pragma once

#include "execsim/domain/order.hpp"
#include "execsim/execution/i_execution_gateway.hpp"

#include <cstddef>
#include <mutex>
#include <unordered_set>

namespace execsim {

// -----------------------------------------------------------------------------
// DedupGateway: idempotent-submit decorator for any IExecutionGateway
// -----------------------------------------------------------------------------
//
// @brief  Drops a submit() whose client_order_id was already forwarded, then
//         delegates everything else to the wrapped gateway.
//
// @details
// Intended for venue adapters that do not deduplicate on their own (a real
// broker connection, a replay harness). MockExecutionGateway already
// deduplicates internally; wrapping it is harmless.
//
// If the inner submit() throws (validation failure), the id is forgotten
// again so the caller can fix the order and resubmit under the same id.
//
// cancel() is passed through unchanged.
//
// Thread-safety: submit() and cancel() may be called from any thread. The
//                seen-set is guarded by mutex_; the inner gateway is called
//                without it held.
//
// Ownership: Holds a reference to the inner gateway, which must outlive
//            the decorator.
// -----------------------------------------------------------------------------
class DedupGateway final : public IExecutionGateway {
 public:
  explicit DedupGateway(IExecutionGateway& inner);

  void submit(const domain::Order& order) override;
  void cancel(const domain::OrderId& client_order_id) override;

  // Number of distinct ids forwarded so far.
  std::size_t forwardedCount() const;

 private:
  IExecutionGateway& inner_;

  mutable std::mutex mutex_;
  std::unordered_set<domain::OrderId> seen_;
};

}  // namespace execsim
