// -----------------------------------------------------------------------------
// execsim: single executable entry point.
//
//   1) Load the JSON config named by argv[1] (defaults when absent).
//   2) Create the BrokerEngine and subscribe a logging listener that prints
//      every execution report.
//   3) Start the engine: timer thread, IPC server (commands + report PUB)
//      and the optional price feed.
//   4) Block until SIGINT / SIGTERM, then shut down cleanly.
//
// Orders arrive over the IPC command socket, e.g. with a REQ client:
//   {"cmd":"submit","order":{"client_order_id":"c1","symbol":"AAPL",
//                            "side":"BUY","quantity":100}}
// -----------------------------------------------------------------------------

#include "execsim/codec/json_codec.hpp"
#include "execsim/config/app_config.hpp"
#include "execsim/engine/broker_engine.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag for the signal handler. The only global in the program; the
// handler performs a single lock-free atomic store.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void shutdown_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  execsim::AppConfig config;
  if (argc > 1) {
    try {
      config = execsim::loadAppConfig(argv[1]);
    } catch (const execsim::ConfigError& e) {
      std::cerr << "[main] ERROR: " << e.what() << "\n";
      return 1;
    }
    std::cout << "[main] config loaded from " << argv[1] << "\n";
  } else {
    std::cout << "[main] no config file given, using defaults.\n";
  }

  // -------------------------------------------------------------------------
  // 2) Engine and report logging. The listener runs on the timer thread (or
  // on the IPC thread for immediate rejects).
  // -------------------------------------------------------------------------
  execsim::BrokerEngine engine(config);

  engine.addReportListener([](const execsim::domain::ExecReport& r) {
    std::cout << "[ExecReport] seq=" << r.sequence_id
              << " id=" << r.client_order_id << " symbol=" << r.symbol
              << " side=" << execsim::domain::sideToString(r.side)
              << " status=" << execsim::domain::toString(r.status)
              << " qty=" << r.filled_quantity << " px=" << r.last_price
              << " cum=" << r.cum_quantity << " avg_px=" << r.avg_price
              << " leaves=" << r.leaves_quantity;
    if (!r.reason.empty()) {
      std::cout << " reason=\"" << r.reason << "\"";
    }
    std::cout << "\n";
  });

  // -------------------------------------------------------------------------
  // 3) Start. A bind failure (port in use) is fatal.
  // -------------------------------------------------------------------------
  try {
    engine.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] ERROR: cannot open sockets: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  std::cout << "[main] broker running. Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 4) Wait for a shutdown signal, then stop the engine (joins all threads).
  // -------------------------------------------------------------------------
  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] shutdown requested. Stopping engine...\n";
  engine.stop();

  return 0;
}
