#pragma once

#include "execsim/domain/order.hpp"

namespace execsim {

// -----------------------------------------------------------------------------
// IExecutionGateway: order entry contract
// -----------------------------------------------------------------------------
//
// @brief  The two operations a strategy or client uses to trade: submit an
//         order, cancel an order. Outcomes are reported asynchronously
//         through the ReportSink the implementation was constructed with.
//
// @details
// Every implementation (MockExecutionGateway, a real venue adapter, or a
// decorator such as DedupGateway) must honour the same contract:
//
//   submit(order)
//     - Non-blocking. Fills, rejects and cancels arrive later via the sink
//       (an implementation may emit an immediate REJECTED from inside
//       submit() when the order fails gating).
//     - Re-submitting an already accepted client_order_id is a silent
//       no-op.
//     - Programmer errors (empty id, non-positive quantity) throw
//       std::invalid_argument instead of producing a report.
//
//   cancel(client_order_id)
//     - Non-blocking, best effort. Unknown or already terminal ids are a
//       silent no-op. Fills that happened before the cancel takes effect
//       are not retracted.
//
//   Reports
//     - Exactly one terminal report (FILLED, REJECTED or CANCELLED) per
//       accepted id, and nothing after it. ExecReportGuard enforces this at
//       the sink boundary for implementations that cannot guarantee it.
//
// Thread-safety: Implementations must accept calls from any thread.
//
// Ownership:
//   BrokerEngine owns the concrete gateway (and optional decorators) and
//   hands out IExecutionGateway& to callers.
// -----------------------------------------------------------------------------
class IExecutionGateway {
 public:
  virtual ~IExecutionGateway() = default;

  virtual void submit(const domain::Order& order) = 0;

  virtual void cancel(const domain::OrderId& client_order_id) = 0;
};

}  // namespace execsim
