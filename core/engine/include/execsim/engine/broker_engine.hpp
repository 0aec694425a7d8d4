#pragma once

#include "execsim/concurrent/timer_thread.hpp"
#include "execsim/config/app_config.hpp"
#include "execsim/domain/exec_report.hpp"
#include "execsim/execution/dedup_gateway.hpp"
#include "execsim/execution/exec_report_guard.hpp"
#include "execsim/execution/i_execution_gateway.hpp"
#include "execsim/execution/mock_execution_gateway.hpp"
#include "execsim/market/session_market_clock.hpp"
#include "execsim/market/static_price_oracle.hpp"
#include "execsim/network/ipc_server.hpp"
#include "execsim/network/price_feed.hpp"
#include "execsim/random/seeded_random_source.hpp"
#include "execsim/time/live_time_provider.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace execsim {

// -----------------------------------------------------------------------------
// BrokerEngine
// -----------------------------------------------------------------------------
//
// @brief  Central orchestrator of the simulated broker: owns the clock,
//         timer thread, random source, price oracle, market calendar,
//         execution gateway, report guard and the network threads.
//
// @details
// Provides a clean lifecycle API (start/stop) so that main() and tests can
// run a broker without manually wiring internals.
//
// Thread layout:
//
//   timer thread       → slice fires and cancel acknowledgements (gateway
//                        callbacks), report guard, listeners
//   ipc thread         → REP commands (executeCommand) and PUB reports
//   price feed thread  → ZMQ SUB ticks into the price oracle
//
//   main thread        → engine.start(), wait for shutdown, engine.stop()
//
// Report path (wired in start()):
//
//   MockExecutionGateway ─sink─> ExecReportGuard ─> listeners (in order)
//                                                └> IpcServer::pushReport
//
// Ownership:
//   BrokerEngine
//    ├── config_          (AppConfig, value member, immutable)
//    ├── time_provider_   (LiveTimeProvider, value member)
//    ├── random_          (SeededRandomSource, value member)
//    ├── oracle_          (StaticPriceOracle, value member)
//    ├── market_clock_    (unique_ptr<SessionMarketClock>, optional)
//    ├── timer_thread_    (TimerThread, value member)
//    ├── listeners_       (vector<ReportSink>)
//    ├── ipc_server_      (unique_ptr<IpcServer>, optional)
//    ├── guard_           (unique_ptr<ExecReportGuard>)
//    ├── gateway_         (unique_ptr<MockExecutionGateway>)
//    ├── dedup_           (unique_ptr<DedupGateway>, optional)
//    └── price_feed_      (unique_ptr<PriceFeed>, optional)
//
// Components are heap-allocated so stop() controls destruction order: the
// timer thread is stopped before the gateway it calls back into is
// destroyed, and the IPC thread is joined before the components that
// executeCommand() touches go away.
// -----------------------------------------------------------------------------
class BrokerEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  config  Broker options, seed, calendar, initial prices and
  //                 endpoints. Empty endpoints disable the IPC server or
  //                 the price feed (unit tests pass "").
  //
  // @details
  // Seeds the oracle with config.prices and builds the market calendar when
  // config.market_hours is set. No threads are spawned and no sockets are
  // opened. Call start() to bring the engine to a running state.
  // -------------------------------------------------------------------------
  explicit BrokerEngine(AppConfig config = {});

  // Destructor calls stop() for RAII safety.
  ~BrokerEngine();

  BrokerEngine(const BrokerEngine&) = delete;
  BrokerEngine& operator=(const BrokerEngine&) = delete;
  BrokerEngine(BrokerEngine&&) = delete;
  BrokerEngine& operator=(BrokerEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Brings the engine to a running state.
  //
  // @details
  // Startup sequence:
  //   1. Create the IpcServer object (not yet started) so the report path
  //      can reference it from the first report on.
  //   2. Create ExecReportGuard, MockExecutionGateway and the optional
  //      DedupGateway.
  //   3. Start the timer thread (slices can fire from here on).
  //   4. Start the IpcServer (commands can arrive from here on).
  //   5. Start the PriceFeed LAST.
  //
  // Idempotent. If a socket cannot be bound, everything started so far is
  // torn down again and the zmq::error_t propagates.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Shuts down all threads and destroys the per-run components.
  //
  // @details
  // Shutdown sequence:
  //   1. Stop the PriceFeed (no more price updates).
  //   2. Stop the IpcServer (no more commands; queued reports published).
  //   3. Stop the timer thread (pending slices and cancels are discarded).
  //   4. Destroy dedup wrapper, gateway and guard.
  //
  // Orders still in flight are dropped without a terminal report. After
  // stop(), start() may be called again with a fresh gateway.
  // Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // -------------------------------------------------------------------------
  // addReportListener(listener)
  // -------------------------------------------------------------------------
  //
  // @brief  Registers a consumer of every report that passes the guard.
  //
  // Call before start(). Listeners run on the thread that emitted the report
  // (timer thread, or the submit() caller for immediate rejects).
  // -------------------------------------------------------------------------
  void addReportListener(domain::ReportSink listener);

  // -------------------------------------------------------------------------
  // gateway()
  // -------------------------------------------------------------------------
  //
  // @brief  Order entry point: the DedupGateway when config.dedup is set,
  //         otherwise the MockExecutionGateway itself.
  //
  // @throws std::logic_error if the engine is not running.
  // -------------------------------------------------------------------------
  IExecutionGateway& gateway();

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Processes one JSON command from the IPC server and returns a
  //         JSON response.
  //
  // @details
  // Supported commands:
  //   {"cmd":"ping"}                         → {"status":"ok","response":"PONG"}
  //   {"cmd":"submit","order":{...}}         → {"status":"ok"} or error
  //   {"cmd":"cancel","client_order_id":id}  → {"status":"ok"}
  //   {"cmd":"set_price","symbol":s,"price":p} → {"status":"ok"} or error
  //   {"cmd":"status"}                       → running, inflight, seen,
  //                                            dropped_reports, seed
  //   anything else                          → {"status":"error",...}
  //
  // Errors never escape: malformed JSON, bad orders and calls while stopped
  // all produce {"status":"error","response":<message>}.
  //
  // Thread-safety: Safe to call from any thread while running; called on
  //                the IPC thread in production.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  StaticPriceOracle& oracle() { return oracle_; }
  const AppConfig& config() const { return config_; }
  bool isRunning() const { return running_.load(); }

 private:
  // Fans a guarded report out to listeners and the IPC publisher.
  void dispatch(const domain::ExecReport& report);

  // Stops threads and destroys per-run components in dependency order.
  void teardown();

  const AppConfig config_;

  LiveTimeProvider time_provider_;
  SeededRandomSource random_;
  StaticPriceOracle oracle_;
  std::unique_ptr<SessionMarketClock> market_clock_;

  TimerThread timer_thread_;

  std::vector<domain::ReportSink> listeners_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<ExecReportGuard> guard_;
  std::unique_ptr<MockExecutionGateway> gateway_;
  std::unique_ptr<DedupGateway> dedup_;
  std::unique_ptr<PriceFeed> price_feed_;

  std::atomic<bool> running_{false};
};

}  // namespace execsim
