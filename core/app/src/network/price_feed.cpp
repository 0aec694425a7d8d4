#include "execsim/network/price_feed.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <iostream>
#include <utility>

namespace execsim {

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
PriceFeed::PriceFeed(StaticPriceOracle& oracle, std::string endpoint)
    : oracle_(oracle), endpoint_(std::move(endpoint)) {}

PriceFeed::~PriceFeed() { stop(); }

// -----------------------------------------------------------------------------
// start(): create SUB socket and spawn recv thread
// -----------------------------------------------------------------------------
void PriceFeed::start() {
  if (thread_.joinable()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::sub);

  // Empty prefix: accept every symbol the publisher sends.
  socket_->set(zmq::sockopt::subscribe, "");
  socket_->set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->connect(endpoint_);

  running_.store(true);
  thread_ = std::thread([this] {
    std::cout << "[PriceFeed] listening on " << endpoint_ << "\n";
    run();
    std::cout << "[PriceFeed] recv loop exited.\n";
  });
}

// -----------------------------------------------------------------------------
// stop(): signal the recv loop and join
// -----------------------------------------------------------------------------
void PriceFeed::stop() {
  running_.store(false);

  if (thread_.joinable()) {
    thread_.join();
  }

  socket_.reset();
  context_.reset();
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop on the feed thread
// -----------------------------------------------------------------------------
void PriceFeed::run() {
  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;

    try {
      result = socket_->recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }

    if (!result.has_value()) {
      // Timeout: loop back and re-check running_.
      continue;
    }

    applyTick(msg.to_string());
  }
}

// -----------------------------------------------------------------------------
// applyTick(): decode one JSON tick into the oracle
// -----------------------------------------------------------------------------
bool PriceFeed::applyTick(const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);

    std::string symbol = json.at("symbol").get<std::string>();
    double price = json.at("price").get<double>();

    if (symbol.empty() || !std::isfinite(price) || price <= 0.0) {
      ++rejected_;
      std::cerr << "[PriceFeed] WARNING: ignoring tick with invalid symbol "
                   "or price: " << payload << "\n";
      return false;
    }

    oracle_.setPrice(symbol, price);
    ++applied_;
    return true;
  } catch (const nlohmann::json::exception& e) {
    ++rejected_;
    std::cerr << "[PriceFeed] JSON parse error: " << e.what()
              << " payload: " << payload << "\n";
    return false;
  }
}

}  // namespace execsim
