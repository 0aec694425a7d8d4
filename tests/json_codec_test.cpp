// =============================================================================
// json_codec_test.cpp
// =============================================================================
// Unit tests for the nlohmann::json hooks of the domain types.
//
// Validates:
//   - Wire names for Side and ExecStatus
//   - Order decoding: market vs limit, optional timestamp, bad input
//   - ExecReport encoding carries every field the IPC publisher sends
//   - BrokerOptions decoding keeps defaults for absent keys
// =============================================================================

#include "execsim/codec/json_codec.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using nlohmann::json;
using execsim::domain::BrokerOptions;
using execsim::domain::ExecReport;
using execsim::domain::ExecStatus;
using execsim::domain::Order;
using execsim::domain::Side;

// -----------------------------------------------------------------------------
// 1. Enum names are upper-case and case-sensitive.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, EnumWireNames) {
  EXPECT_STREQ(execsim::domain::sideToString(Side::Sell), "SELL");
  EXPECT_EQ(execsim::domain::sideFromString("BUY"), Side::Buy);
  EXPECT_THROW(execsim::domain::sideFromString("buy"), std::invalid_argument);

  EXPECT_EQ(execsim::domain::statusFromString("CANCELLED"),
            ExecStatus::Cancelled);
  EXPECT_THROW(execsim::domain::statusFromString("NEW"),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 2. A minimal market order: no limit, timestamp defaults to 0.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, DecodeMarketOrder) {
  const json j = json::parse(
      R"({"client_order_id":"c1","symbol":"AAPL","side":"SELL","quantity":25})");

  const Order o = j.get<Order>();

  EXPECT_EQ(o.client_order_id, "c1");
  EXPECT_EQ(o.symbol, "AAPL");
  EXPECT_EQ(o.side, Side::Sell);
  EXPECT_DOUBLE_EQ(o.quantity, 25.0);
  EXPECT_FALSE(o.limit_price.has_value());
  EXPECT_EQ(o.timestamp_ms, 0);
}

// -----------------------------------------------------------------------------
// 3. Limit price and timestamp are read when present; null limit means
//    market order.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, DecodeLimitOrder) {
  json j = {{"client_order_id", "c2"}, {"symbol", "MSFT"},
            {"side", "BUY"},           {"quantity", 1.5},
            {"limit_price", 410.25},   {"timestamp_ms", 1700000000123}};

  Order o = j.get<Order>();
  ASSERT_TRUE(o.limit_price.has_value());
  EXPECT_DOUBLE_EQ(*o.limit_price, 410.25);
  EXPECT_EQ(o.timestamp_ms, 1700000000123);

  j["limit_price"] = nullptr;
  EXPECT_FALSE(j.get<Order>().limit_price.has_value());
}

// -----------------------------------------------------------------------------
// 4. Missing required keys and wrong types surface as json exceptions; an
//    unknown side as std::invalid_argument.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, DecodeOrderErrors) {
  EXPECT_THROW(json::parse(R"({"symbol":"AAPL","side":"BUY","quantity":1})")
                   .get<Order>(),
               json::exception);
  EXPECT_THROW(json::parse(R"({"client_order_id":"c","symbol":"AAPL",
                               "side":"BUY","quantity":"ten"})")
                   .get<Order>(),
               json::exception);
  EXPECT_THROW(json::parse(R"({"client_order_id":"c","symbol":"AAPL",
                               "side":"HOLD","quantity":1})")
                   .get<Order>(),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 5. An encoded report carries every field with its wire name.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, EncodeReport) {
  ExecReport r;
  r.client_order_id = "c1";
  r.symbol = "AAPL";
  r.side = Side::Buy;
  r.status = ExecStatus::Partial;
  r.filled_quantity = 40.0;
  r.last_price = 100.03;
  r.avg_price = 100.02;
  r.cum_quantity = 60.0;
  r.leaves_quantity = 40.0;
  r.timestamp_ms = 1234;
  r.sequence_id = 7;

  const json j = r;

  EXPECT_EQ(j.at("status"), "PARTIAL");
  EXPECT_EQ(j.at("side"), "BUY");
  EXPECT_DOUBLE_EQ(j.at("filled_quantity").get<double>(), 40.0);
  EXPECT_DOUBLE_EQ(j.at("avg_price").get<double>(), 100.02);
  EXPECT_DOUBLE_EQ(j.at("leaves_quantity").get<double>(), 40.0);
  EXPECT_EQ(j.at("sequence_id").get<std::uint64_t>(), 7u);
  EXPECT_EQ(j.at("reason"), "");

  const ExecReport back = j.get<ExecReport>();
  EXPECT_EQ(back.client_order_id, "c1");
  EXPECT_EQ(back.status, ExecStatus::Partial);
  EXPECT_DOUBLE_EQ(back.cum_quantity, 60.0);
}

// -----------------------------------------------------------------------------
// 6. A report needs only its core fields; the rest default.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, DecodeMinimalReport) {
  const json j = json::parse(R"({"client_order_id":"x","status":"REJECTED",
      "filled_quantity":0,"avg_price":0,"timestamp_ms":5})");

  const ExecReport r = j.get<ExecReport>();

  EXPECT_EQ(r.status, ExecStatus::Rejected);
  EXPECT_TRUE(r.symbol.empty());
  EXPECT_EQ(r.sequence_id, 0u);
}

// -----------------------------------------------------------------------------
// 7. BrokerOptions: present keys override, absent keys keep defaults,
//    a non-object is refused.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, DecodeBrokerOptions) {
  const BrokerOptions defaults;
  const BrokerOptions o = json::parse(
      R"({"venue_latency_ms":50,"partial_fill":false,"reject_rate":0.1})")
                              .get<BrokerOptions>();

  EXPECT_EQ(o.venue_latency_ms, 50);
  EXPECT_FALSE(o.partial_fill);
  EXPECT_DOUBLE_EQ(o.reject_rate, 0.1);
  EXPECT_EQ(o.latency_jitter_ms, defaults.latency_jitter_ms);
  EXPECT_DOUBLE_EQ(o.fee_bps, defaults.fee_bps);

  EXPECT_THROW(json::parse("[1,2]").get<BrokerOptions>(),
               std::invalid_argument);
}
