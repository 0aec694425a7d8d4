#pragma once

#include "execsim/domain/exec_report.hpp"
#include "execsim/domain/exec_status.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace execsim {

// -----------------------------------------------------------------------------
// ExecReportGuard: per-order report state machine at the sink boundary
// -----------------------------------------------------------------------------
//
// @brief  Sits between an execution gateway and its consumers and forwards
//         only reports that form a legal sequence for their order id.
//
// @details
// The guard tracks the last status forwarded for every order id:
//
//   1. First report for an id → forwarded, id becomes known.
//   2. Later report → validated with isLegalTransition(). Illegal ones are
//      logged to std::cerr and dropped; the order keeps its current state.
//   3. Terminal report → id moves from the active map to the finished set.
//      Every later report for that id is dropped.
//
// The finished set is never pruned, so a very late duplicate (a venue
// replaying its journal) is still caught.
//
// Thread model:
//   onReport() may be called concurrently from any thread (TimerThread
//   worker, submit() callers for immediate rejects). State is guarded by
//   mutex_. The downstream sink is invoked after the mutex is released, so
//   reports for different ids can interleave downstream; per-id ordering is
//   preserved whenever the gateway itself emits them in order.
//
// Ownership:
//   Owned by BrokerEngine. Holds a copy of the downstream sink.
// -----------------------------------------------------------------------------
class ExecReportGuard {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  downstream  Receives every report that passes validation. May be
  //                     empty (reports are then only validated and counted).
  // -------------------------------------------------------------------------
  explicit ExecReportGuard(domain::ReportSink downstream);

  ExecReportGuard(const ExecReportGuard&) = delete;
  ExecReportGuard& operator=(const ExecReportGuard&) = delete;
  ExecReportGuard(ExecReportGuard&&) = delete;
  ExecReportGuard& operator=(ExecReportGuard&&) = delete;

  // -------------------------------------------------------------------------
  // onReport(report)
  // -------------------------------------------------------------------------
  // @return true if the report was forwarded, false if it was dropped.
  //
  // Side-effects: Updates per-id state, invokes the downstream sink.
  // -------------------------------------------------------------------------
  bool onReport(const domain::ExecReport& report);

  // -------------------------------------------------------------------------
  // asSink()
  // -------------------------------------------------------------------------
  // @brief  Wraps onReport() as a ReportSink suitable for passing to a
  //         gateway constructor. The guard must outlive the returned sink.
  // -------------------------------------------------------------------------
  domain::ReportSink asSink();

  // -------------------------------------------------------------------------
  // isLegalTransition(current, next)
  // -------------------------------------------------------------------------
  // @param  current  Last forwarded status, or std::nullopt if none yet.
  // @param  next     Status of the incoming report.
  //
  // @details
  // Legal transitions:
  //   (none)    → PARTIAL, FILLED, REJECTED, CANCELLED
  //   PARTIAL   → PARTIAL, FILLED, REJECTED, CANCELLED
  //   FILLED    → (none: terminal)
  //   REJECTED  → (none: terminal)
  //   CANCELLED → (none: terminal)
  //
  // Pure function, no side effects.
  // -------------------------------------------------------------------------
  static bool isLegalTransition(std::optional<domain::ExecStatus> current,
                                domain::ExecStatus next);

  std::uint64_t droppedCount() const;
  std::size_t activeCount() const;

 private:
  domain::ReportSink downstream_;

  mutable std::mutex mutex_;
  std::unordered_map<domain::OrderId, domain::ExecStatus> active_;
  std::unordered_set<domain::OrderId> finished_;
  std::uint64_t dropped_{0};
};

}  // namespace execsim
