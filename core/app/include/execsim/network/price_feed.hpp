#pragma once

#include "execsim/market/static_price_oracle.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace execsim {

// -----------------------------------------------------------------------------
// PriceFeed: ZeroMQ SUB listener that keeps the price oracle current
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON price ticks on a SUB socket and writes each one into
//         the StaticPriceOracle the execution gateway reads from.
//
// @details
// Expected JSON format from the publisher:
//   {
//     "symbol":       "AAPL",          // instrument identifier
//     "price":        150.25,          // last/mid price, must be > 0
//     "timestamp_ms": 1700000000000    // optional, epoch milliseconds
//   }
//
// Malformed ticks (bad JSON, missing key, wrong type, non-positive price)
// are logged to std::cerr and skipped; they never stop the recv loop.
//
// Shutdown safety (ZMQ_RCVTIMEO):
//   The SUB socket has a receive timeout so recv() returns periodically
//   even when no ticks arrive, letting the loop observe stop().
//
// Thread model:
//   start() and stop() from the owning thread (BrokerEngine). The recv loop
//   runs on a dedicated thread. applyTick() is public so ticks can be fed
//   without a socket; it only touches the oracle, which is internally
//   synchronized.
//
// Ownership:
//   Owned by BrokerEngine via std::unique_ptr. Holds a reference to the
//   StaticPriceOracle, which must outlive it. Owns the ZMQ context, socket
//   and thread.
// -----------------------------------------------------------------------------
class PriceFeed {
 public:
  PriceFeed(StaticPriceOracle& oracle,
            std::string endpoint = "tcp://127.0.0.1:5555");

  // Calls stop().
  ~PriceFeed();

  PriceFeed(const PriceFeed&) = delete;
  PriceFeed& operator=(const PriceFeed&) = delete;
  PriceFeed(PriceFeed&&) = delete;
  PriceFeed& operator=(PriceFeed&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Creates the SUB socket, connects, subscribes to everything and
  //         spawns the recv thread. Idempotent.
  // @throws zmq::error_t for a malformed endpoint.
  // -------------------------------------------------------------------------
  void start();

  // Requests the recv loop to exit and joins it. Idempotent.
  void stop();

  // -------------------------------------------------------------------------
  // applyTick(payload)
  // -------------------------------------------------------------------------
  // @brief  Decodes one JSON tick and updates the oracle.
  // @return true if the oracle was updated, false if the tick was rejected
  //         (the reason is logged).
  // -------------------------------------------------------------------------
  bool applyTick(const std::string& payload);

  std::uint64_t appliedCount() const { return applied_.load(); }
  std::uint64_t rejectedCount() const { return rejected_.load(); }

 private:
  // Receive timeout. Controls how often the loop checks running_.
  static constexpr int kRecvTimeoutMs = 100;

  void run();

  StaticPriceOracle& oracle_;
  std::string endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> applied_{0};
  std::atomic<std::uint64_t> rejected_{0};
};

}  // namespace execsim
