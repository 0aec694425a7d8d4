#pragma once

#include "execsim/domain/broker_options.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace execsim {

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// Thrown for an unreadable config file, malformed JSON, a wrong value type
// or an out-of-range market session. main() reports it and exits non-zero.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// MarketHoursConfig
// -----------------------------------------------------------------------------
// Weekday trading session, already converted to minutes after local
// midnight. Validated at load time (open < close, both within the day).
// -----------------------------------------------------------------------------
struct MarketHoursConfig {
  int open_minute{9 * 60 + 30};
  int close_minute{16 * 60};
  int utc_offset_minutes{0};
};

// -----------------------------------------------------------------------------
// AppConfig: everything the execsim binary reads from its JSON file
// -----------------------------------------------------------------------------
//
// @details
// File layout (every key optional, unknown keys ignored):
//
//   {
//     "broker":   { ...BrokerOptions fields... },
//     "seed": 42,                  // 0 or absent = seed from random_device
//     "dedup": true,               // wrap the gateway in DedupGateway
//     "market_hours": { "open": "09:30", "close": "16:00",
//                       "utc_offset_minutes": -300 },
//     "prices": { "AAPL": 190.5 },
//     "ipc": { "cmd_endpoint": "tcp://127.0.0.1:5556",
//              "pub_endpoint": "tcp://127.0.0.1:5557" },
//     "price_feed_endpoint": "tcp://127.0.0.1:5555"
//   }
//
// An empty endpoint string disables the corresponding component.
// market_hours only builds the session calendar; orders are gated by it
// only when broker.respect_market_hours is also true.
// -----------------------------------------------------------------------------
struct AppConfig {
  domain::BrokerOptions broker;
  std::uint64_t seed{0};
  bool dedup{false};
  std::optional<MarketHoursConfig> market_hours;
  std::map<std::string, double> prices;

  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
  std::string price_feed_endpoint{"tcp://127.0.0.1:5555"};
};

// -----------------------------------------------------------------------------
// parseAppConfig(j)
// -----------------------------------------------------------------------------
// @brief  Builds an AppConfig from an already parsed JSON document.
// @throws ConfigError on a wrong type, a non-positive seed price or an
//         invalid market session.
// -----------------------------------------------------------------------------
AppConfig parseAppConfig(const nlohmann::json& j);

// -----------------------------------------------------------------------------
// loadAppConfig(path)
// -----------------------------------------------------------------------------
// @brief  Reads and parses the JSON file at path.
// @throws ConfigError if the file cannot be opened or is not valid JSON, or
//         for anything parseAppConfig() rejects.
// -----------------------------------------------------------------------------
AppConfig loadAppConfig(const std::string& path);

}  // namespace execsim
