#pragma once

#include "execsim/domain/order.hpp"
#include "execsim/sched/i_scheduler.hpp"

#include <cstddef>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace execsim {

// -----------------------------------------------------------------------------
// LiveOrder: mutable state of one accepted, non-terminal order
// -----------------------------------------------------------------------------
//
// @details
// Invariants while the order is live:
//   remaining + filled == order.quantity
//   notional == Σ(fill_price · fill_qty) over every fill so far
//
// timers holds every handle scheduled for the order (slices and the cancel
// acknowledgement). Handles that already fired stay in the list; cancelling
// them during cleanup is a harmless no-op.
// -----------------------------------------------------------------------------
struct LiveOrder {
  domain::Order order;
  double remaining{0.0};
  double notional{0.0};     // Σ price·qty, numerator of the VWAP
  double filled{0.0};
  bool cancelled{false};
  std::vector<IScheduler::TimerId> timers;

  // VWAP of all fills so far, 0 while nothing has filled.
  double avgPrice() const { return filled > 0.0 ? notional / filled : 0.0; }
};

// -----------------------------------------------------------------------------
// OrderRegistry: idempotency set and inflight order map
// -----------------------------------------------------------------------------
//
// @brief  Remembers every client order id ever accepted, and holds the
//         LiveOrder of every order that has not reached a terminal state.
//
// @details
// seen-set: an id is added once gating starts for it and never removed for
//   the lifetime of the registry, so a resubmitted id is recognised even
//   after the original order finished.
//
// inflight map: an entry exists only between acceptance and the terminal
//   report. cleanup() is the single removal path; it revokes every pending
//   timer of the order before erasing it, so no slice can fire for an order
//   that already emitted its terminal report.
//
// Thread model:
//   NOT internally synchronized. MockExecutionGateway owns the registry and
//   serializes every call under its own mutex.
// -----------------------------------------------------------------------------
class OrderRegistry {
 public:
  // -------------------------------------------------------------------------
  // markSeen(id)
  // -------------------------------------------------------------------------
  // @return true the first time an id is marked, false for a duplicate.
  // -------------------------------------------------------------------------
  bool markSeen(const domain::OrderId& id);

  bool wasSeen(const domain::OrderId& id) const;

  // -------------------------------------------------------------------------
  // insert(live)
  // -------------------------------------------------------------------------
  // @brief  Registers a newly accepted order. Replaces nothing: inserting
  //         an id that is already inflight returns the existing entry.
  // @return Reference to the stored entry, valid until cleanup() of the id.
  // -------------------------------------------------------------------------
  LiveOrder& insert(LiveOrder live);

  // Returns nullptr when the id is not inflight.
  LiveOrder* find(const domain::OrderId& id);

  // -------------------------------------------------------------------------
  // cleanup(id, scheduler)
  // -------------------------------------------------------------------------
  // @brief  Cancels every timer of the order and removes it from the
  //         inflight map.
  // @return true if the order was inflight; false (no-op) otherwise, so
  //         repeated calls are safe.
  // -------------------------------------------------------------------------
  bool cleanup(const domain::OrderId& id, IScheduler& scheduler);

  // Cleans up every inflight order. Returns how many were removed.
  std::size_t cleanupAll(IScheduler& scheduler);

  std::size_t inflightCount() const { return inflight_.size(); }
  std::size_t seenCount() const { return seen_.size(); }

 private:
  std::unordered_set<domain::OrderId> seen_;
  std::unordered_map<domain::OrderId, LiveOrder> inflight_;
};

}  // namespace execsim
