#pragma once

#include "execsim/concurrent/sequence_generator.hpp"
#include "execsim/domain/broker_options.hpp"
#include "execsim/domain/exec_report.hpp"
#include "execsim/domain/order.hpp"
#include "execsim/execution/fill_scheduler.hpp"
#include "execsim/execution/i_execution_gateway.hpp"
#include "execsim/execution/order_registry.hpp"
#include "execsim/market/i_market_clock.hpp"
#include "execsim/market/i_price_oracle.hpp"
#include "execsim/random/i_random_source.hpp"
#include "execsim/sched/i_scheduler.hpp"
#include "execsim/time/i_time_provider.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

namespace execsim {

// -----------------------------------------------------------------------------
// MockExecutionGateway: simulated venue with latency, slicing and rejects
// -----------------------------------------------------------------------------
//
// @brief  Accepts orders and cancels and produces realistic execution
//         reports: partial fills at slipped, fee-adjusted prices, immediate
//         and late rejects, and delayed cancel acknowledgements.
//
// @details
// Flow of submit(order):
//
//   duplicate id ───────────────────────────────> no-op
//   empty id / qty <= 0 ────────────────────────> throws std::invalid_argument
//   market closed (gating on) ──────────────────> REJECTED, immediately
//   random draw < reject_rate ──────────────────> REJECTED, immediately
//   otherwise ─> LiveOrder registered ─> FillScheduler schedules N slices
//
// Each slice fire (on the scheduler's callback thread):
//   - skipped if the order is gone, cancelled, or has nothing remaining;
//   - no valid oracle price            → REJECTED, cleanup;
//   - limit not satisfiable by market  → REJECTED, cleanup;
//   - otherwise executes min(remaining, slice) at executionPrice(), updates
//     the VWAP accumulators and reports PARTIAL, or FILLED when remaining
//     hits exactly zero (then cleanup).
//
// cancel(id) marks the order cancelled (pending slices self-skip from now
// on) and schedules the acknowledgement after cancel_latency_ms, which
// cleans up and reports CANCELLED with filled_quantity 0.
//
// Terminal status is decided only by the remaining quantity, never by which
// slice fired: slices carry independent jitter and fire out of order.
//
// Thread model:
//   submit() and cancel() may be called from any thread. Scheduled
//   callbacks run on the scheduler's thread (TimerThread worker, or the
//   thread driving VirtualScheduler). Every access to the registry happens
//   under mutex_. The report sink is invoked with mutex_ released, so a sink
//   may call back into submit()/cancel().
//
// Ownership:
//   Holds references to the scheduler, random source, time provider, price
//   oracle and (optional) market clock; all must outlive the gateway. The
//   scheduler must not run callbacks concurrently with the destructor:
//   stop a TimerThread before destroying the gateway.
// -----------------------------------------------------------------------------
class MockExecutionGateway final : public IExecutionGateway {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  scheduler      Delivers slice fires and cancel acknowledgements.
  // @param  random         Reject draw, slice count/size and jitter.
  // @param  time_provider  Report timestamps and market-hours checks.
  // @param  oracle         Last tradable price per symbol.
  // @param  sink           Receives every ExecReport.
  // @param  options        Stored normalized (reject rate clamped, etc.).
  // @param  market_clock   Optional. Gating only happens when this is
  //                        non-null AND options.respect_market_hours is set.
  // -------------------------------------------------------------------------
  MockExecutionGateway(IScheduler& scheduler, IRandomSource& random,
                       const ITimeProvider& time_provider,
                       const IPriceOracle& oracle, domain::ReportSink sink,
                       const domain::BrokerOptions& options = {},
                       const IMarketClock* market_clock = nullptr);

  // -------------------------------------------------------------------------
  // Destructor
  // -------------------------------------------------------------------------
  // @brief  Revokes every pending timer of every inflight order so no
  //         callback fires into a destroyed gateway. No reports are emitted.
  // -------------------------------------------------------------------------
  ~MockExecutionGateway() override;

  MockExecutionGateway(const MockExecutionGateway&) = delete;
  MockExecutionGateway& operator=(const MockExecutionGateway&) = delete;
  MockExecutionGateway(MockExecutionGateway&&) = delete;
  MockExecutionGateway& operator=(MockExecutionGateway&&) = delete;

  // -------------------------------------------------------------------------
  // submit(order)
  // -------------------------------------------------------------------------
  // @throws std::invalid_argument for an empty client_order_id or symbol, or
  //         a non-positive / non-finite quantity or limit. The id is not
  //         marked seen in that case.
  //
  // Side-effects: May invoke the sink once (immediate REJECTED) before
  //               returning; otherwise schedules slice timers.
  // -------------------------------------------------------------------------
  void submit(const domain::Order& order) override;

  // -------------------------------------------------------------------------
  // cancel(client_order_id)
  // -------------------------------------------------------------------------
  // No-op for unknown, finished or already cancelling orders.
  // -------------------------------------------------------------------------
  void cancel(const domain::OrderId& client_order_id) override;

  std::size_t inflightCount() const;
  std::size_t seenCount() const;

  const domain::BrokerOptions& options() const { return options_; }

 private:
  // Validates a submission; throws std::invalid_argument.
  static void validate(const domain::Order& order);

  // Scheduled callbacks.
  void onSliceFire(const domain::OrderId& id, double slice_quantity);
  void onCancelFire(const domain::OrderId& id);

  // Decides the outcome of one slice. Called with mutex_ held. Returns the
  // report to emit, if any.
  std::optional<domain::ExecReport> executeSlice(LiveOrder& live,
                                                 double slice_quantity);

  // Report builders. Called with mutex_ held.
  domain::ExecReport makeReport(const LiveOrder& live, double quantity,
                                double price, domain::ExecStatus status,
                                std::string reason);
  domain::ExecReport makeImmediateReject(const domain::Order& order,
                                         std::string reason);

  void emit(const domain::ExecReport& report);

  IScheduler& scheduler_;
  IRandomSource& random_;
  const ITimeProvider& time_provider_;
  const IPriceOracle& oracle_;
  const IMarketClock* market_clock_;
  domain::ReportSink sink_;
  const domain::BrokerOptions options_;

  FillScheduler fill_scheduler_;
  SequenceGenerator report_seq_;

  mutable std::mutex mutex_;   // Serializes every registry_ access
  OrderRegistry registry_;
};

}  // namespace execsim
