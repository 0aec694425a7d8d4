#pragma once

#include "execsim/domain/exec_status.hpp"
#include "execsim/domain/order.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace execsim {
namespace domain {

// -----------------------------------------------------------------------------
// ExecReport
// -----------------------------------------------------------------------------
//
// @brief  Immutable description of one state transition of an order.
//
// @details
// Orders describe intent; execution reports describe outcome. An order
// produces zero or more PARTIAL reports followed by exactly one terminal
// report (FILLED, REJECTED or CANCELLED).
//
// Field semantics:
//   filled_quantity  quantity executed by THIS report (0 for rejects and
//                    cancels).
//   last_price       execution price of this report's fill, fee included.
//                    0 when filled_quantity is 0.
//   avg_price        cumulative VWAP over every fill of the order so far:
//                    Σ(price·qty) / Σ(qty). 0 while nothing has filled.
//   cum_quantity     cumulative filled quantity after this report.
//   leaves_quantity  quantity still working after this report; 0 on every
//                    terminal report.
//   sequence_id      gateway-wide monotonic report counter.
//
// Reports for one order may arrive out of slice order (each slice carries
// independent latency jitter), so consumers must rebuild state from
// cum_quantity / avg_price and never from arrival order.
//
// Thread-safety: Plain value type. Safe to copy between threads.
// -----------------------------------------------------------------------------
struct ExecReport {
  OrderId client_order_id;
  std::string symbol;
  Side side{Side::Buy};
  double filled_quantity{0.0};
  double last_price{0.0};
  double avg_price{0.0};
  double cum_quantity{0.0};
  double leaves_quantity{0.0};
  ExecStatus status{ExecStatus::Partial};
  std::string reason;            // Set on REJECTED / CANCELLED
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

// Consumer of execution reports (journal, IPC publisher, strategy adapter).
// Invoked once per transition; no batching.
using ReportSink = std::function<void(const ExecReport&)>;

}  // namespace domain
}  // namespace execsim
