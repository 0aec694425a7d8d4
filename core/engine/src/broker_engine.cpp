#include "execsim/engine/broker_engine.hpp"
#include "execsim/codec/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace execsim {

namespace {

std::string errorResponse(const std::string& message) {
  nlohmann::json response;
  response["status"] = "error";
  response["response"] = message;
  return response.dump();
}

std::string okResponse() {
  nlohmann::json response;
  response["status"] = "ok";
  return response.dump();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
BrokerEngine::BrokerEngine(AppConfig config)
    : config_(std::move(config)), random_(config_.seed) {
  for (const auto& [symbol, price] : config_.prices) {
    oracle_.setPrice(symbol, price);
  }

  if (config_.market_hours) {
    market_clock_ = std::make_unique<SessionMarketClock>(
        config_.market_hours->open_minute, config_.market_hours->close_minute,
        config_.market_hours->utc_offset_minutes);
  }
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
BrokerEngine::~BrokerEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void BrokerEngine::start() {
  if (running_) {
    return;
  }

  try {
    // ---  1) IPC server object first: dispatch() may reference it ----------
    if (!config_.ipc_cmd_endpoint.empty() && !config_.ipc_pub_endpoint.empty()) {
      ipc_server_ = std::make_unique<IpcServer>(
          [this](const std::string& cmd) { return executeCommand(cmd); },
          config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
    }

    // ---  2) Report guard, gateway, optional dedup wrapper ----------------
    guard_ = std::make_unique<ExecReportGuard>(
        [this](const domain::ExecReport& r) { dispatch(r); });

    gateway_ = std::make_unique<MockExecutionGateway>(
        timer_thread_, random_, time_provider_, oracle_, guard_->asSink(),
        config_.broker, market_clock_.get());

    if (config_.dedup) {
      dedup_ = std::make_unique<DedupGateway>(*gateway_);
    }

    // ---  3) Timer thread: slices may fire from here on -------------------
    timer_thread_.start();

    // ---  4) IPC server: commands may arrive from here on -----------------
    if (ipc_server_) {
      ipc_server_->start();
    }

    // ---  5) Price feed LAST ----------------------------------------------
    if (!config_.price_feed_endpoint.empty()) {
      price_feed_ =
          std::make_unique<PriceFeed>(oracle_, config_.price_feed_endpoint);
      price_feed_->start();
    }
  } catch (...) {
    teardown();
    throw;
  }

  running_ = true;

  std::cout << "[BrokerEngine] started. seed=" << random_.seed()
            << " reject_rate=" << gateway_->options().reject_rate
            << " market_hours="
            << (market_clock_ && config_.broker.respect_market_hours ? "on"
                                                                     : "off")
            << (ipc_server_ ? ", ipc" : "")
            << (price_feed_ ? ", price_feed" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void BrokerEngine::stop() {
  if (!running_) {
    return;
  }

  const std::size_t inflight = gateway_->inflightCount();
  teardown();
  running_ = false;

  std::cout << "[BrokerEngine] stopped. " << inflight
            << " in-flight order(s) dropped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// teardown(): reverse dependency order
// -----------------------------------------------------------------------------
void BrokerEngine::teardown() {
  // ---  1) No more price updates --------------------------------------------
  price_feed_.reset();

  // ---  2) No more commands (joins the IPC thread) --------------------------
  if (ipc_server_) {
    ipc_server_->stop();
  }

  // ---  3) No more gateway callbacks (joins the timer thread) ---------------
  timer_thread_.stop();

  // ---  4) Per-run components -----------------------------------------------
  dedup_.reset();
  gateway_.reset();
  guard_.reset();
  ipc_server_.reset();
}

// -----------------------------------------------------------------------------
// addReportListener()
// -----------------------------------------------------------------------------
void BrokerEngine::addReportListener(domain::ReportSink listener) {
  listeners_.push_back(std::move(listener));
}

// -----------------------------------------------------------------------------
// dispatch(): guarded report → listeners → IPC
// -----------------------------------------------------------------------------
void BrokerEngine::dispatch(const domain::ExecReport& report) {
  for (const auto& listener : listeners_) {
    listener(report);
  }
  if (ipc_server_) {
    ipc_server_->pushReport(report);
  }
}

// -----------------------------------------------------------------------------
// gateway()
// -----------------------------------------------------------------------------
IExecutionGateway& BrokerEngine::gateway() {
  if (!gateway_) {
    throw std::logic_error("BrokerEngine::gateway() called while stopped");
  }
  if (dedup_) {
    return *dedup_;
  }
  return *gateway_;
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string BrokerEngine::executeCommand(const std::string& request) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(request);
  } catch (const nlohmann::json::parse_error& e) {
    return errorResponse(std::string("malformed JSON: ") + e.what());
  }

  if (!j.is_object() || !j.contains("cmd") || !j["cmd"].is_string()) {
    return errorResponse("request must be an object with a string 'cmd'");
  }

  const std::string cmd = j["cmd"].get<std::string>();

  if (cmd == "ping") {
    nlohmann::json response;
    response["status"] = "ok";
    response["response"] = "PONG";
    return response.dump();
  }

  if (!gateway_) {
    return errorResponse("engine not running");
  }

  try {
    if (cmd == "submit") {
      domain::Order order = j.at("order").get<domain::Order>();
      if (order.timestamp_ms == 0) {
        order.timestamp_ms = time_provider_.now_ms();
      }
      gateway().submit(order);
      return okResponse();
    }

    if (cmd == "cancel") {
      gateway().cancel(j.at("client_order_id").get<std::string>());
      return okResponse();
    }

    if (cmd == "set_price") {
      const std::string symbol = j.at("symbol").get<std::string>();
      const double price = j.at("price").get<double>();
      if (symbol.empty() || !std::isfinite(price) || price <= 0.0) {
        return errorResponse("set_price needs a symbol and a positive price");
      }
      oracle_.setPrice(symbol, price);
      return okResponse();
    }

    if (cmd == "status") {
      nlohmann::json response;
      response["status"] = "ok";
      response["running"] = running_.load();
      response["inflight"] = gateway_->inflightCount();
      response["seen"] = gateway_->seenCount();
      response["dropped_reports"] = guard_->droppedCount();
      response["seed"] = random_.seed();
      response["symbols"] = oracle_.size();
      return response.dump();
    }
  } catch (const nlohmann::json::exception& e) {
    return errorResponse(std::string("bad request: ") + e.what());
  } catch (const std::invalid_argument& e) {
    return errorResponse(e.what());
  }

  return errorResponse("Unknown command: " + cmd);
}

}  // namespace execsim
