#include "execsim/market/session_market_clock.hpp"

#include <cctype>
#include <stdexcept>

namespace execsim {

namespace {

constexpr std::int64_t kMsPerMinute = 60 * 1000;
constexpr std::int64_t kMsPerDay = 24 * 60 * kMsPerMinute;

// Floor division: epoch values before 1970 must still land on the correct
// day, which plain '/' (truncation toward zero) gets wrong.
std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

}  // namespace

SessionMarketClock::SessionMarketClock(int open_minute, int close_minute,
                                       int utc_offset_minutes)
    : open_minute_(open_minute),
      close_minute_(close_minute),
      utc_offset_minutes_(utc_offset_minutes) {
  validateSession(open_minute, close_minute);
}

// -----------------------------------------------------------------------------
// validateSession(): [0, 1440] bounds, open strictly before close
// -----------------------------------------------------------------------------
void SessionMarketClock::validateSession(int open_minute, int close_minute) {
  if (open_minute < 0 || open_minute > kMinutesPerDay || close_minute < 0 ||
      close_minute > kMinutesPerDay) {
    throw std::invalid_argument(
        "SessionMarketClock: session bounds must be within [0, 1440] minutes");
  }
  if (open_minute >= close_minute) {
    throw std::invalid_argument(
        "SessionMarketClock: open must be strictly before close");
  }
}

// -----------------------------------------------------------------------------
// isOpen(): weekday and minute-of-day check in local time
// -----------------------------------------------------------------------------
bool SessionMarketClock::isOpen(std::int64_t epoch_ms) const {
  const std::int64_t local_ms =
      epoch_ms + static_cast<std::int64_t>(utc_offset_minutes_) * kMsPerMinute;
  const std::int64_t day = floorDiv(local_ms, kMsPerDay);
  const std::int64_t minute = (local_ms - day * kMsPerDay) / kMsPerMinute;

  // 1970-01-01 was a Thursday. 0 = Sunday ... 6 = Saturday.
  std::int64_t weekday = (day + 4) % 7;
  if (weekday < 0) {
    weekday += 7;
  }
  if (weekday == 0 || weekday == 6) {
    return false;
  }

  return minute >= open_minute_ && minute < close_minute_;
}

// -----------------------------------------------------------------------------
// parseClockTime(): "HH:MM" → minutes after midnight
// -----------------------------------------------------------------------------
int SessionMarketClock::parseClockTime(const std::string& text) {
  const auto colon = text.find(':');
  if (colon == std::string::npos || colon == 0 || colon > 2 ||
      text.size() - colon - 1 != 2) {
    throw std::invalid_argument("invalid clock time '" + text +
                                "', expected HH:MM");
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i != colon && !std::isdigit(static_cast<unsigned char>(text[i]))) {
      throw std::invalid_argument("invalid clock time '" + text +
                                  "', expected HH:MM");
    }
  }

  const int hours = std::stoi(text.substr(0, colon));
  const int minutes = std::stoi(text.substr(colon + 1));
  const int total = hours * 60 + minutes;
  if (minutes > 59 || total > kMinutesPerDay) {
    throw std::invalid_argument("clock time out of range: '" + text + "'");
  }
  return total;
}

}  // namespace execsim
