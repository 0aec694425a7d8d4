#pragma once

#include "execsim/domain/broker_options.hpp"
#include "execsim/domain/exec_report.hpp"
#include "execsim/domain/exec_status.hpp"
#include "execsim/domain/order.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace execsim {
namespace domain {

// -----------------------------------------------------------------------------
// JSON codec for the domain types
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json adl_serializer hooks, so that domain values can be
//         written as `json j = report;` and read as `j.get<Order>()`.
//
// @details
// Wire names:
//   Side        "BUY" | "SELL"
//   ExecStatus  "PARTIAL" | "FILLED" | "REJECTED" | "CANCELLED"
//
// Order:
//   {"client_order_id": str, "symbol": str, "side": "BUY"|"SELL",
//    "quantity": num, "limit_price": num|null (optional),
//    "timestamp_ms": int (optional, 0 if absent)}
//
// BrokerOptions: every field optional; absent keys keep their defaults.
// Field names are the C++ member names.
//
// Errors: from_json throws nlohmann::json::exception (type_error,
// out_of_range) for a missing required key or a wrong type, and
// std::invalid_argument for an unknown side/status string. Callers at I/O
// boundaries catch both.
// -----------------------------------------------------------------------------

const char* sideToString(Side side);

// @throws std::invalid_argument for anything other than "BUY"/"SELL"
//         (case-sensitive).
Side sideFromString(const std::string& text);

// @throws std::invalid_argument for an unknown status name.
ExecStatus statusFromString(const std::string& text);

void to_json(nlohmann::json& j, const Order& order);
void from_json(const nlohmann::json& j, Order& order);

void to_json(nlohmann::json& j, const ExecReport& report);
void from_json(const nlohmann::json& j, ExecReport& report);

void to_json(nlohmann::json& j, const BrokerOptions& options);
void from_json(const nlohmann::json& j, BrokerOptions& options);

}  // namespace domain
}  // namespace execsim
