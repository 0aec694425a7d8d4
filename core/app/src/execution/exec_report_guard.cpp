#include "execsim/execution/exec_report_guard.hpp"

#include <iostream>
#include <utility>

namespace execsim {

ExecReportGuard::ExecReportGuard(domain::ReportSink downstream)
    : downstream_(std::move(downstream)) {}

// -----------------------------------------------------------------------------
// isLegalTransition: validate the report state machine
// -----------------------------------------------------------------------------
bool ExecReportGuard::isLegalTransition(
    std::optional<domain::ExecStatus> current, domain::ExecStatus next) {
  using S = domain::ExecStatus;

  if (!current.has_value()) {
    return true;
  }

  switch (*current) {
    case S::Partial:
      return next == S::Partial ||
             next == S::Filled ||
             next == S::Rejected ||
             next == S::Cancelled;

    case S::Filled:
    case S::Rejected:
    case S::Cancelled:
      return false;
  }

  return false;
}

// -----------------------------------------------------------------------------
// onReport: validate, record, forward
// -----------------------------------------------------------------------------
bool ExecReportGuard::onReport(const domain::ExecReport& report) {
  {
    std::lock_guard lock(mutex_);

    if (finished_.count(report.client_order_id) > 0) {
      ++dropped_;
      std::cerr << "[ExecReportGuard] WARNING: report after terminal state for "
                   "client_order_id=" << report.client_order_id
                << " status=" << domain::toString(report.status)
                << ". Dropping.\n";
      return false;
    }

    std::optional<domain::ExecStatus> current;
    auto it = active_.find(report.client_order_id);
    if (it != active_.end()) {
      current = it->second;
    }

    if (!isLegalTransition(current, report.status)) {
      ++dropped_;
      std::cerr << "[ExecReportGuard] WARNING: illegal transition for "
                   "client_order_id=" << report.client_order_id << " from "
                << domain::toString(*current) << " to "
                << domain::toString(report.status) << ". Dropping.\n";
      return false;
    }

    if (domain::isTerminal(report.status)) {
      if (it != active_.end()) {
        active_.erase(it);
      }
      finished_.insert(report.client_order_id);
    } else if (it != active_.end()) {
      it->second = report.status;
    } else {
      active_.emplace(report.client_order_id, report.status);
    }
  }

  if (downstream_) {
    downstream_(report);
  }
  return true;
}

domain::ReportSink ExecReportGuard::asSink() {
  return [this](const domain::ExecReport& report) { onReport(report); };
}

std::uint64_t ExecReportGuard::droppedCount() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

std::size_t ExecReportGuard::activeCount() const {
  std::lock_guard lock(mutex_);
  return active_.size();
}

}  // namespace execsim
