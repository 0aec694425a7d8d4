#pragma once

namespace execsim {
namespace domain {

// -----------------------------------------------------------------------------
// ExecStatus: outcome carried by an execution report
// -----------------------------------------------------------------------------
//
// @brief  The status a gateway attaches to each execution report.
//
// @details
// Per order id the reports follow this state machine:
//
//   NEW ──> REJECTED                       (gating / probabilistic reject)
//    │
//    └──> ACCEPTED ──> PARTIAL* ──> FILLED
//                         │    └──> CANCELLED
//                         └───────> REJECTED (missing price, unfillable limit)
//
// ACCEPTED is internal (no report is emitted for it). Filled, Rejected and
// Cancelled are terminal and mutually exclusive: once one is emitted for an
// id, nothing else is ever emitted for that id.
// -----------------------------------------------------------------------------
enum class ExecStatus {
  Partial,    // A slice executed, quantity still open
  Filled,     // Remaining quantity reached zero: terminal
  Rejected,   // Business-level rejection: terminal
  Cancelled,  // Cancellation honoured: terminal
};

// -----------------------------------------------------------------------------
// isTerminal(status)
// -----------------------------------------------------------------------------
inline bool isTerminal(ExecStatus status) {
  return status != ExecStatus::Partial;
}

// -----------------------------------------------------------------------------
// toString(status)
// -----------------------------------------------------------------------------
// @brief  Upper-case wire name used in logs and JSON ("PARTIAL", "FILLED",
//         "REJECTED", "CANCELLED").
// -----------------------------------------------------------------------------
inline const char* toString(ExecStatus status) {
  switch (status) {
    case ExecStatus::Partial:   return "PARTIAL";
    case ExecStatus::Filled:    return "FILLED";
    case ExecStatus::Rejected:  return "REJECTED";
    case ExecStatus::Cancelled: return "CANCELLED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace execsim
