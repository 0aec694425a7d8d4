// =============================================================================
// session_market_clock_test.cpp
// =============================================================================
// Unit tests for execsim::SessionMarketClock.
//
// Reference dates (UTC):
//   2024-01-08 00:00  Monday    1704672000000
//   2024-01-06 00:00  Saturday  1704499200000
// =============================================================================

#include "execsim/market/session_market_clock.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using execsim::SessionMarketClock;

namespace {

constexpr std::int64_t kMinuteMs = 60'000;
constexpr std::int64_t kMonday = 1'704'672'000'000;
constexpr std::int64_t kSaturday = 1'704'499'200'000;

std::int64_t at(std::int64_t day_start, int hh, int mm) {
  return day_start + (hh * 60 + mm) * kMinuteMs;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Weekday session is [open, close).
// -----------------------------------------------------------------------------
TEST(SessionMarketClockTest, WeekdaySessionBounds) {
  SessionMarketClock clock(570, 960);

  EXPECT_FALSE(clock.isOpen(at(kMonday, 9, 29)));
  EXPECT_TRUE(clock.isOpen(at(kMonday, 9, 30)));
  EXPECT_TRUE(clock.isOpen(at(kMonday, 15, 59)));
  EXPECT_FALSE(clock.isOpen(at(kMonday, 16, 0)));
}

// -----------------------------------------------------------------------------
// 2. Weekends are closed all day.
// -----------------------------------------------------------------------------
TEST(SessionMarketClockTest, WeekendClosed) {
  SessionMarketClock clock(0, 1440);

  EXPECT_FALSE(clock.isOpen(at(kSaturday, 12, 0)));
  EXPECT_FALSE(clock.isOpen(at(kSaturday + 86'400'000, 12, 0)));  // Sunday
  EXPECT_TRUE(clock.isOpen(at(kMonday, 0, 0)));
}

// -----------------------------------------------------------------------------
// 3. The offset shifts the session: 09:30 New York winter is 14:30 UTC.
// -----------------------------------------------------------------------------
TEST(SessionMarketClockTest, UtcOffset) {
  SessionMarketClock ny(570, 960, -300);

  EXPECT_FALSE(ny.isOpen(at(kMonday, 9, 30)));
  EXPECT_TRUE(ny.isOpen(at(kMonday, 14, 30)));
  EXPECT_TRUE(ny.isOpen(at(kMonday, 20, 59)));
  EXPECT_FALSE(ny.isOpen(at(kMonday, 21, 0)));
}

// -----------------------------------------------------------------------------
// 4. Invalid bounds are rejected at construction and by validateSession().
// -----------------------------------------------------------------------------
TEST(SessionMarketClockTest, InvalidBoundsThrow) {
  EXPECT_THROW(SessionMarketClock(960, 570), std::invalid_argument);
  EXPECT_THROW(SessionMarketClock(600, 600), std::invalid_argument);
  EXPECT_THROW(SessionMarketClock(-1, 600), std::invalid_argument);
  EXPECT_THROW(SessionMarketClock(0, 1441), std::invalid_argument);

  EXPECT_THROW(SessionMarketClock::validateSession(960, 570),
               std::invalid_argument);
  EXPECT_THROW(SessionMarketClock::validateSession(0, 1441),
               std::invalid_argument);
  EXPECT_NO_THROW(SessionMarketClock::validateSession(0, 1440));
  EXPECT_NO_THROW(SessionMarketClock::validateSession(570, 960));
}

// -----------------------------------------------------------------------------
// 5. parseClockTime().
// -----------------------------------------------------------------------------
TEST(SessionMarketClockTest, ParseClockTime) {
  EXPECT_EQ(SessionMarketClock::parseClockTime("09:30"), 570);
  EXPECT_EQ(SessionMarketClock::parseClockTime("9:30"), 570);
  EXPECT_EQ(SessionMarketClock::parseClockTime("16:00"), 960);
  EXPECT_EQ(SessionMarketClock::parseClockTime("24:00"), 1440);

  for (const char* bad : {"", "0930", "9:3", "ab:cd", "12:60", "24:01",
                          "123:00", ":30"}) {
    EXPECT_THROW(SessionMarketClock::parseClockTime(bad),
                 std::invalid_argument)
        << bad;
  }
}
