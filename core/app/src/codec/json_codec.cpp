#include "execsim/codec/json_codec.hpp"

#include <stdexcept>

namespace execsim {
namespace domain {

namespace {

// Reads j[key] into out when the key is present; leaves out untouched
// otherwise. Wrong types still throw json::type_error.
template <typename T>
void readOptional(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    out = it->template get<T>();
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Side / ExecStatus names
// -----------------------------------------------------------------------------
const char* sideToString(Side side) {
  switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

Side sideFromString(const std::string& text) {
  if (text == "BUY") {
    return Side::Buy;
  }
  if (text == "SELL") {
    return Side::Sell;
  }
  throw std::invalid_argument("unknown side: " + text);
}

ExecStatus statusFromString(const std::string& text) {
  if (text == "PARTIAL")   return ExecStatus::Partial;
  if (text == "FILLED")    return ExecStatus::Filled;
  if (text == "REJECTED")  return ExecStatus::Rejected;
  if (text == "CANCELLED") return ExecStatus::Cancelled;
  throw std::invalid_argument("unknown execution status: " + text);
}

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Order& order) {
  j = nlohmann::json{
      {"client_order_id", order.client_order_id},
      {"symbol", order.symbol},
      {"side", sideToString(order.side)},
      {"quantity", order.quantity},
      {"timestamp_ms", order.timestamp_ms},
  };
  if (order.limit_price) {
    j["limit_price"] = *order.limit_price;
  } else {
    j["limit_price"] = nullptr;
  }
}

void from_json(const nlohmann::json& j, Order& order) {
  order.client_order_id = j.at("client_order_id").get<std::string>();
  order.symbol = j.at("symbol").get<std::string>();
  order.side = sideFromString(j.at("side").get<std::string>());
  order.quantity = j.at("quantity").get<double>();

  order.limit_price.reset();
  auto limit = j.find("limit_price");
  if (limit != j.end() && !limit->is_null()) {
    order.limit_price = limit->get<double>();
  }

  order.timestamp_ms = 0;
  readOptional(j, "timestamp_ms", order.timestamp_ms);
}

// -----------------------------------------------------------------------------
// ExecReport
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const ExecReport& report) {
  j = nlohmann::json{
      {"client_order_id", report.client_order_id},
      {"symbol", report.symbol},
      {"side", sideToString(report.side)},
      {"status", toString(report.status)},
      {"filled_quantity", report.filled_quantity},
      {"last_price", report.last_price},
      {"avg_price", report.avg_price},
      {"cum_quantity", report.cum_quantity},
      {"leaves_quantity", report.leaves_quantity},
      {"reason", report.reason},
      {"timestamp_ms", report.timestamp_ms},
      {"sequence_id", report.sequence_id},
  };
}

void from_json(const nlohmann::json& j, ExecReport& report) {
  report.client_order_id = j.at("client_order_id").get<std::string>();
  report.status = statusFromString(j.at("status").get<std::string>());
  report.filled_quantity = j.at("filled_quantity").get<double>();
  report.avg_price = j.at("avg_price").get<double>();
  report.timestamp_ms = j.at("timestamp_ms").get<std::int64_t>();

  readOptional(j, "symbol", report.symbol);
  if (auto side = j.find("side"); side != j.end() && !side->is_null()) {
    report.side = sideFromString(side->get<std::string>());
  }
  readOptional(j, "last_price", report.last_price);
  readOptional(j, "cum_quantity", report.cum_quantity);
  readOptional(j, "leaves_quantity", report.leaves_quantity);
  readOptional(j, "reason", report.reason);
  readOptional(j, "sequence_id", report.sequence_id);
}

// -----------------------------------------------------------------------------
// BrokerOptions
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const BrokerOptions& options) {
  j = nlohmann::json{
      {"venue_latency_ms", options.venue_latency_ms},
      {"latency_jitter_ms", options.latency_jitter_ms},
      {"partial_fill", options.partial_fill},
      {"min_slices", options.min_slices},
      {"max_slices", options.max_slices},
      {"min_slice_fraction", options.min_slice_fraction},
      {"max_slice_fraction", options.max_slice_fraction},
      {"min_slice_qty", options.min_slice_qty},
      {"reject_rate", options.reject_rate},
      {"cancel_latency_ms", options.cancel_latency_ms},
      {"fee_bps", options.fee_bps},
      {"slippage_bps", options.slippage_bps},
      {"respect_market_hours", options.respect_market_hours},
  };
}

void from_json(const nlohmann::json& j, BrokerOptions& options) {
  if (!j.is_object()) {
    throw std::invalid_argument("broker options must be a JSON object");
  }
  readOptional(j, "venue_latency_ms", options.venue_latency_ms);
  readOptional(j, "latency_jitter_ms", options.latency_jitter_ms);
  readOptional(j, "partial_fill", options.partial_fill);
  readOptional(j, "min_slices", options.min_slices);
  readOptional(j, "max_slices", options.max_slices);
  readOptional(j, "min_slice_fraction", options.min_slice_fraction);
  readOptional(j, "max_slice_fraction", options.max_slice_fraction);
  readOptional(j, "min_slice_qty", options.min_slice_qty);
  readOptional(j, "reject_rate", options.reject_rate);
  readOptional(j, "cancel_latency_ms", options.cancel_latency_ms);
  readOptional(j, "fee_bps", options.fee_bps);
  readOptional(j, "slippage_bps", options.slippage_bps);
  readOptional(j, "respect_market_hours", options.respect_market_hours);
}

}  // namespace domain
}  // namespace execsim
