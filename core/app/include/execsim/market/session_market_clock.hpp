#pragma once

#include "execsim/market/i_market_clock.hpp"

#include <string>

namespace execsim {

// -----------------------------------------------------------------------------
// SessionMarketClock: weekday session calendar
// -----------------------------------------------------------------------------
//
// @brief  Open Monday–Friday during [open, close) local time, closed on
//         weekends. Local time is UTC shifted by a fixed offset.
//
// @details
// Session bounds are minutes after local midnight, e.g. 09:30 → 570 and
// 16:00 → 960. A fixed offset keeps the calendar free of a timezone
// database; a caller that needs DST switches passes the offset in force for
// the simulated period. Exchange holidays are not modelled.
//
// Thread model:
//   Immutable after construction; isOpen() is safe from any thread.
// -----------------------------------------------------------------------------
class SessionMarketClock final : public IMarketClock {
 public:
  static constexpr int kMinutesPerDay = 24 * 60;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  open_minute         Session open, minutes after local midnight.
  // @param  close_minute        Session close (exclusive).
  // @param  utc_offset_minutes  Local time minus UTC (New York winter: -300).
  //
  // @throws std::invalid_argument if the bounds are outside [0, 1440] or
  //         open_minute >= close_minute.
  // -------------------------------------------------------------------------
  SessionMarketClock(int open_minute, int close_minute,
                     int utc_offset_minutes = 0);

  bool isOpen(std::int64_t epoch_ms) const override;

  // -------------------------------------------------------------------------
  // parseClockTime("HH:MM")
  // -------------------------------------------------------------------------
  // @brief  Converts "09:30" into 570. Accepts "24:00" as end of day.
  // @throws std::invalid_argument on malformed input.
  // -------------------------------------------------------------------------
  static int parseClockTime(const std::string& text);

  // Throws std::invalid_argument under the same conditions as the
  // constructor. Lets configuration be checked before a clock is built.
  static void validateSession(int open_minute, int close_minute);

  int openMinute() const { return open_minute_; }
  int closeMinute() const { return close_minute_; }
  int utcOffsetMinutes() const { return utc_offset_minutes_; }

 private:
  int open_minute_;
  int close_minute_;
  int utc_offset_minutes_;
};

}  // namespace execsim
