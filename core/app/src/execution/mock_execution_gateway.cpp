#include "execsim/execution/mock_execution_gateway.hpp"
#include "execsim/execution/fill_pricing.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace execsim {

namespace {

// A residual smaller than this fraction of the order size is folded into
// the executing slice, so floating-point dust from slice splitting can never
// leave an order stuck one ulp short of FILLED.
constexpr double kQuantityEpsilon = 1e-9;

bool isValidPrice(double price) { return std::isfinite(price) && price > 0.0; }

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
MockExecutionGateway::MockExecutionGateway(IScheduler& scheduler,
                                           IRandomSource& random,
                                           const ITimeProvider& time_provider,
                                           const IPriceOracle& oracle,
                                           domain::ReportSink sink,
                                           const domain::BrokerOptions& options,
                                           const IMarketClock* market_clock)
    : scheduler_(scheduler),
      random_(random),
      time_provider_(time_provider),
      oracle_(oracle),
      market_clock_(market_clock),
      sink_(std::move(sink)),
      options_(options.normalized()),
      fill_scheduler_(options_, random_, scheduler_) {}

// -----------------------------------------------------------------------------
// Destructor: revoke every pending timer
// -----------------------------------------------------------------------------
MockExecutionGateway::~MockExecutionGateway() {
  std::lock_guard lock(mutex_);
  registry_.cleanupAll(scheduler_);
}

// -----------------------------------------------------------------------------
// validate(): programmer errors, not business rejects
// -----------------------------------------------------------------------------
void MockExecutionGateway::validate(const domain::Order& order) {
  if (order.client_order_id.empty()) {
    throw std::invalid_argument("order rejected by validation: empty client_order_id");
  }
  if (order.symbol.empty()) {
    throw std::invalid_argument("order " + order.client_order_id +
                                ": empty symbol");
  }
  if (!std::isfinite(order.quantity) || order.quantity <= 0.0) {
    throw std::invalid_argument("order " + order.client_order_id +
                                ": quantity must be positive");
  }
  if (order.limit_price && !isValidPrice(*order.limit_price)) {
    throw std::invalid_argument("order " + order.client_order_id +
                                ": limit price must be positive");
  }
}

// -----------------------------------------------------------------------------
// submit(): dedup → validate → gate → accept and schedule slices
// -----------------------------------------------------------------------------
void MockExecutionGateway::submit(const domain::Order& order) {
  std::optional<domain::ExecReport> immediate;

  {
    std::lock_guard lock(mutex_);

    if (registry_.wasSeen(order.client_order_id)) {
      return;
    }
    validate(order);
    registry_.markSeen(order.client_order_id);

    // --- Gate 1: market hours ------------------------------------------------
    if (options_.respect_market_hours && market_clock_ != nullptr &&
        !market_clock_->isOpen(time_provider_.now_ms())) {
      immediate = makeImmediateReject(order, "market closed");
    }

    // --- Gate 2: probabilistic venue/risk reject ------------------------------
    if (!immediate && options_.reject_rate > 0.0 &&
        random_.uniform(0.0, 1.0) < options_.reject_rate) {
      immediate = makeImmediateReject(order, "rejected by venue risk check");
    }

    // --- Accept ---------------------------------------------------------------
    if (!immediate) {
      LiveOrder live;
      live.order = order;
      live.remaining = order.quantity;
      LiveOrder& stored = registry_.insert(std::move(live));

      // Timers cannot fire before we return: their callbacks need mutex_.
      const domain::OrderId id = order.client_order_id;
      stored.timers = fill_scheduler_.scheduleSlices(
          order.quantity, [this, id](double qty) { onSliceFire(id, qty); });
    }
  }

  if (immediate) {
    emit(*immediate);
  }
}

// -----------------------------------------------------------------------------
// cancel(): flag now, acknowledge after cancel_latency_ms
// -----------------------------------------------------------------------------
void MockExecutionGateway::cancel(const domain::OrderId& client_order_id) {
  std::lock_guard lock(mutex_);

  LiveOrder* live = registry_.find(client_order_id);
  if (live == nullptr || live->cancelled) {
    return;
  }

  live->cancelled = true;
  const domain::OrderId id = client_order_id;
  live->timers.push_back(scheduler_.schedule(
      options_.cancel_latency_ms, [this, id] { onCancelFire(id); }));
}

// -----------------------------------------------------------------------------
// onSliceFire(): scheduled per slice
// -----------------------------------------------------------------------------
void MockExecutionGateway::onSliceFire(const domain::OrderId& id,
                                       double slice_quantity) {
  std::optional<domain::ExecReport> report;

  {
    std::lock_guard lock(mutex_);
    LiveOrder* live = registry_.find(id);
    if (live == nullptr || live->cancelled || live->remaining <= 0.0) {
      return;
    }
    report = executeSlice(*live, slice_quantity);
    if (report && domain::isTerminal(report->status)) {
      registry_.cleanup(id, scheduler_);
    }
  }

  if (report) {
    emit(*report);
  }
}

// -----------------------------------------------------------------------------
// executeSlice(): price checks, quantity update, report
// -----------------------------------------------------------------------------
std::optional<domain::ExecReport> MockExecutionGateway::executeSlice(
    LiveOrder& live, double slice_quantity) {
  const domain::Order& order = live.order;

  const double market = oracle_.lastPrice(order.symbol);
  if (!isValidPrice(market)) {
    std::cerr << "[MockExecutionGateway] WARNING: no tradable price for symbol="
              << order.symbol << ", rejecting order "
              << order.client_order_id << "\n";
    return makeReport(live, 0.0, 0.0, domain::ExecStatus::Rejected,
                      "no tradable price for " + order.symbol);
  }

  const std::optional<double> price =
      executionPrice(order.side, market, order.limit_price,
                     options_.slippage_bps, options_.fee_bps);
  if (!price) {
    return makeReport(live, 0.0, 0.0, domain::ExecStatus::Rejected,
                      "limit price not marketable");
  }

  double executed = std::min(live.remaining, slice_quantity);
  if (live.remaining - executed <= kQuantityEpsilon * std::max(1.0, order.quantity)) {
    executed = live.remaining;
  }

  live.remaining = (executed == live.remaining) ? 0.0
                                                : live.remaining - executed;
  live.filled += executed;
  live.notional += *price * executed;

  const domain::ExecStatus status = (live.remaining == 0.0)
                                        ? domain::ExecStatus::Filled
                                        : domain::ExecStatus::Partial;
  return makeReport(live, executed, *price, status, {});
}

// -----------------------------------------------------------------------------
// onCancelFire(): acknowledgement of an earlier cancel()
// -----------------------------------------------------------------------------
void MockExecutionGateway::onCancelFire(const domain::OrderId& id) {
  std::optional<domain::ExecReport> report;

  {
    std::lock_guard lock(mutex_);
    LiveOrder* live = registry_.find(id);
    if (live == nullptr) {
      return;
    }
    report = makeReport(*live, 0.0, 0.0, domain::ExecStatus::Cancelled,
                        "cancelled by request");
    registry_.cleanup(id, scheduler_);
  }

  emit(*report);
}

// -----------------------------------------------------------------------------
// makeReport(): snapshot of the live order after this transition
// -----------------------------------------------------------------------------
domain::ExecReport MockExecutionGateway::makeReport(const LiveOrder& live,
                                                    double quantity,
                                                    double price,
                                                    domain::ExecStatus status,
                                                    std::string reason) {
  domain::ExecReport report;
  report.client_order_id = live.order.client_order_id;
  report.symbol = live.order.symbol;
  report.side = live.order.side;
  report.filled_quantity = quantity;
  report.last_price = quantity > 0.0 ? price : 0.0;
  report.avg_price = live.avgPrice();
  report.cum_quantity = live.filled;
  report.leaves_quantity = domain::isTerminal(status) ? 0.0 : live.remaining;
  report.status = status;
  report.reason = std::move(reason);
  report.timestamp_ms = time_provider_.now_ms();
  report.sequence_id = report_seq_.next();
  return report;
}

domain::ExecReport MockExecutionGateway::makeImmediateReject(
    const domain::Order& order, std::string reason) {
  domain::ExecReport report;
  report.client_order_id = order.client_order_id;
  report.symbol = order.symbol;
  report.side = order.side;
  report.status = domain::ExecStatus::Rejected;
  report.reason = std::move(reason);
  report.timestamp_ms = time_provider_.now_ms();
  report.sequence_id = report_seq_.next();
  return report;
}

void MockExecutionGateway::emit(const domain::ExecReport& report) {
  if (sink_) {
    sink_(report);
  }
}

std::size_t MockExecutionGateway::inflightCount() const {
  std::lock_guard lock(mutex_);
  return registry_.inflightCount();
}

std::size_t MockExecutionGateway::seenCount() const {
  std::lock_guard lock(mutex_);
  return registry_.seenCount();
}

}  // namespace execsim
