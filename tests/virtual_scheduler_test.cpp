// =============================================================================
// virtual_scheduler_test.cpp
// =============================================================================
// Unit tests for execsim::VirtualScheduler.
//
// Validates:
//   - Nothing runs until virtual time is advanced
//   - (due time, schedule order) execution order
//   - The clock reads the fire time inside each callback
//   - cancel() semantics
//   - Callbacks may schedule more work that runs in the same advance
// =============================================================================

#include "execsim/sched/virtual_scheduler.hpp"
#include "execsim/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

class VirtualSchedulerTest : public ::testing::Test {
 protected:
  execsim::SimulationTimeProvider clock{1000};
  execsim::VirtualScheduler scheduler{clock};
  std::vector<std::string> log;
};

// -----------------------------------------------------------------------------
// 1. Scheduling does not run anything and does not move the clock.
// -----------------------------------------------------------------------------
TEST_F(VirtualSchedulerTest, NothingRunsUntilAdvanced) {
  scheduler.schedule(0, [this] { log.push_back("a"); });

  EXPECT_TRUE(log.empty());
  EXPECT_EQ(scheduler.pendingCount(), 1u);
  EXPECT_EQ(clock.now_ms(), 1000);

  EXPECT_EQ(scheduler.advanceBy(0), 1u);
  EXPECT_EQ(log.size(), 1u);
}

// -----------------------------------------------------------------------------
// 2. Earliest due first; equal due times in schedule order.
// -----------------------------------------------------------------------------
TEST_F(VirtualSchedulerTest, RunsInDueThenScheduleOrder) {
  scheduler.schedule(30, [this] { log.push_back("late"); });
  scheduler.schedule(10, [this] { log.push_back("first"); });
  scheduler.schedule(10, [this] { log.push_back("second"); });

  EXPECT_EQ(scheduler.runAll(), 3u);
  EXPECT_EQ(log, (std::vector<std::string>{"first", "second", "late"}));
}

// -----------------------------------------------------------------------------
// 3. advanceTo() runs only timers due at or before the target and leaves
//    the clock at the target.
// -----------------------------------------------------------------------------
TEST_F(VirtualSchedulerTest, AdvanceToStopsAtTarget) {
  scheduler.schedule(50, [this] { log.push_back("a"); });
  scheduler.schedule(100, [this] { log.push_back("b"); });

  EXPECT_EQ(scheduler.advanceTo(1099), 1u);
  EXPECT_EQ(clock.now_ms(), 1099);
  EXPECT_EQ(scheduler.pendingCount(), 1u);

  EXPECT_EQ(scheduler.advanceTo(1100), 1u);
  EXPECT_EQ(log, (std::vector<std::string>{"a", "b"}));
}

// -----------------------------------------------------------------------------
// 4. Inside a callback the clock reads exactly its due time.
// -----------------------------------------------------------------------------
TEST_F(VirtualSchedulerTest, ClockReadsFireTimeInCallback) {
  std::vector<std::int64_t> seen;
  scheduler.schedule(60, [&] { seen.push_back(clock.now_ms()); });
  scheduler.schedule(300, [&] { seen.push_back(clock.now_ms()); });

  scheduler.advanceBy(1000);

  EXPECT_EQ(seen, (std::vector<std::int64_t>{1060, 1300}));
  EXPECT_EQ(clock.now_ms(), 2000);
}

// -----------------------------------------------------------------------------
// 5. cancel() revokes a pending timer once; unknown and fired ids → false.
// -----------------------------------------------------------------------------
TEST_F(VirtualSchedulerTest, CancelSemantics) {
  auto keep = scheduler.schedule(10, [this] { log.push_back("keep"); });
  auto drop = scheduler.schedule(10, [this] { log.push_back("drop"); });

  EXPECT_TRUE(scheduler.cancel(drop));
  EXPECT_FALSE(scheduler.cancel(drop));
  EXPECT_FALSE(scheduler.cancel(9999));

  scheduler.runAll();
  EXPECT_EQ(log, (std::vector<std::string>{"keep"}));
  EXPECT_FALSE(scheduler.cancel(keep));
}

// -----------------------------------------------------------------------------
// 6. A callback may schedule (and cancel) on the same scheduler; follow-up
//    work due within the window runs in the same advance.
// -----------------------------------------------------------------------------
TEST_F(VirtualSchedulerTest, CallbacksCanScheduleMoreWork) {
  execsim::IScheduler::TimerId victim =
      scheduler.schedule(40, [this] { log.push_back("victim"); });

  scheduler.schedule(10, [&] {
    log.push_back("parent");
    scheduler.cancel(victim);
    scheduler.schedule(5, [this] { log.push_back("child"); });
  });

  EXPECT_EQ(scheduler.advanceBy(100), 2u);
  EXPECT_EQ(log, (std::vector<std::string>{"parent", "child"}));
}

// -----------------------------------------------------------------------------
// 7. Negative delays are due immediately; time never moves backwards.
// -----------------------------------------------------------------------------
TEST_F(VirtualSchedulerTest, NegativeDelayAndBackwardsTarget) {
  scheduler.schedule(-50, [this] { log.push_back("now"); });

  // A target in the past neither runs the timer nor rewinds the clock.
  EXPECT_EQ(scheduler.advanceTo(500), 0u);
  EXPECT_EQ(clock.now_ms(), 1000);

  EXPECT_EQ(scheduler.advanceBy(0), 1u);
  EXPECT_EQ(log.size(), 1u);
}
