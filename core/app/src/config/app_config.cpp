#include "execsim/config/app_config.hpp"
#include "execsim/codec/json_codec.hpp"
#include "execsim/market/session_market_clock.hpp"

#include <cmath>
#include <fstream>

namespace execsim {

namespace {

MarketHoursConfig parseMarketHours(const nlohmann::json& j) {
  MarketHoursConfig hours;
  if (auto it = j.find("open"); it != j.end()) {
    hours.open_minute = SessionMarketClock::parseClockTime(it->get<std::string>());
  }
  if (auto it = j.find("close"); it != j.end()) {
    hours.close_minute = SessionMarketClock::parseClockTime(it->get<std::string>());
  }
  hours.utc_offset_minutes = j.value("utc_offset_minutes", 0);

  // Fail at load time, not at start().
  SessionMarketClock::validateSession(hours.open_minute, hours.close_minute);
  return hours;
}

}  // namespace

// -----------------------------------------------------------------------------
// parseAppConfig(): JSON document → AppConfig
// -----------------------------------------------------------------------------
AppConfig parseAppConfig(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("config root must be a JSON object");
  }

  AppConfig config;

  try {
    if (auto it = j.find("broker"); it != j.end()) {
      config.broker = it->get<domain::BrokerOptions>();
    }

    config.seed = j.value("seed", std::uint64_t{0});
    config.dedup = j.value("dedup", false);

    if (auto it = j.find("market_hours"); it != j.end() && !it->is_null()) {
      config.market_hours = parseMarketHours(*it);
    }

    if (auto it = j.find("prices"); it != j.end()) {
      for (const auto& [symbol, value] : it->items()) {
        const double price = value.get<double>();
        if (!std::isfinite(price) || price <= 0.0) {
          throw ConfigError("price for " + symbol + " must be positive");
        }
        config.prices[symbol] = price;
      }
    }

    if (auto it = j.find("ipc"); it != j.end()) {
      config.ipc_cmd_endpoint =
          it->value("cmd_endpoint", config.ipc_cmd_endpoint);
      config.ipc_pub_endpoint =
          it->value("pub_endpoint", config.ipc_pub_endpoint);
    }

    config.price_feed_endpoint =
        j.value("price_feed_endpoint", config.price_feed_endpoint);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid config value: ") + e.what());
  } catch (const std::invalid_argument& e) {
    throw ConfigError(std::string("invalid config value: ") + e.what());
  }

  return config;
}

// -----------------------------------------------------------------------------
// loadAppConfig(): file → JSON → AppConfig
// -----------------------------------------------------------------------------
AppConfig loadAppConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file: " + path);
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("config file " + path + " is not valid JSON: " +
                      e.what());
  }

  return parseAppConfig(j);
}

}  // namespace execsim
