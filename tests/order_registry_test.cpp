// =============================================================================
// order_registry_test.cpp
// =============================================================================
// Unit tests for execsim::OrderRegistry.
//
// Validates:
//   - The seen-set recognises duplicates and outlives cleanup
//   - insert() / find() on the inflight map
//   - cleanup() revokes the order's pending timers and is repeat-safe
//   - cleanupAll() empties the map and revokes everything
// =============================================================================

#include "execsim/execution/order_registry.hpp"
#include "execsim/sched/virtual_scheduler.hpp"
#include "execsim/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

using execsim::LiveOrder;
using execsim::OrderRegistry;

namespace {

LiveOrder makeLive(const std::string& id, double qty) {
  LiveOrder live;
  live.order.client_order_id = id;
  live.order.symbol = "AAPL";
  live.order.quantity = qty;
  live.remaining = qty;
  return live;
}

}  // namespace

class OrderRegistryTest : public ::testing::Test {
 protected:
  execsim::SimulationTimeProvider clock{0};
  execsim::VirtualScheduler scheduler{clock};
  OrderRegistry registry;
  int fired{0};

  execsim::IScheduler::TimerId arm(std::int64_t delay_ms) {
    return scheduler.schedule(delay_ms, [this] { ++fired; });
  }
};

// -----------------------------------------------------------------------------
// 1. markSeen() is true once per id.
// -----------------------------------------------------------------------------
TEST_F(OrderRegistryTest, MarkSeenDetectsDuplicates) {
  EXPECT_FALSE(registry.wasSeen("a"));
  EXPECT_TRUE(registry.markSeen("a"));
  EXPECT_FALSE(registry.markSeen("a"));
  EXPECT_TRUE(registry.wasSeen("a"));
  EXPECT_EQ(registry.seenCount(), 1u);
}

// -----------------------------------------------------------------------------
// 2. insert() stores the order; find() returns a mutable pointer to it.
// -----------------------------------------------------------------------------
TEST_F(OrderRegistryTest, InsertAndFind) {
  EXPECT_EQ(registry.find("a"), nullptr);

  registry.insert(makeLive("a", 100.0));
  LiveOrder* live = registry.find("a");
  ASSERT_NE(live, nullptr);
  EXPECT_DOUBLE_EQ(live->remaining, 100.0);

  live->remaining = 60.0;
  EXPECT_DOUBLE_EQ(registry.find("a")->remaining, 60.0);
  EXPECT_EQ(registry.inflightCount(), 1u);
}

// -----------------------------------------------------------------------------
// 3. Inserting an id already inflight keeps the existing entry.
// -----------------------------------------------------------------------------
TEST_F(OrderRegistryTest, InsertDoesNotReplace) {
  registry.insert(makeLive("a", 100.0));
  LiveOrder& again = registry.insert(makeLive("a", 5.0));

  EXPECT_DOUBLE_EQ(again.order.quantity, 100.0);
  EXPECT_EQ(registry.inflightCount(), 1u);
}

// -----------------------------------------------------------------------------
// 4. cleanup() revokes pending timers of that order only and removes it;
//    a second cleanup is a no-op. The id stays seen.
// -----------------------------------------------------------------------------
TEST_F(OrderRegistryTest, CleanupRevokesTimers) {
  registry.markSeen("a");
  LiveOrder& a = registry.insert(makeLive("a", 10.0));
  a.timers.push_back(arm(100));
  a.timers.push_back(arm(200));

  LiveOrder& b = registry.insert(makeLive("b", 10.0));
  b.timers.push_back(arm(150));

  EXPECT_TRUE(registry.cleanup("a", scheduler));
  EXPECT_FALSE(registry.cleanup("a", scheduler));

  EXPECT_EQ(registry.find("a"), nullptr);
  EXPECT_TRUE(registry.wasSeen("a"));
  EXPECT_EQ(scheduler.pendingCount(), 1u);

  scheduler.runAll();
  EXPECT_EQ(fired, 1);
}

// -----------------------------------------------------------------------------
// 5. Timers that already fired are harmless during cleanup.
// -----------------------------------------------------------------------------
TEST_F(OrderRegistryTest, CleanupAfterPartialFire) {
  LiveOrder& a = registry.insert(makeLive("a", 10.0));
  a.timers.push_back(arm(10));
  a.timers.push_back(arm(500));

  scheduler.advanceTo(10);
  EXPECT_EQ(fired, 1);

  EXPECT_TRUE(registry.cleanup("a", scheduler));
  EXPECT_EQ(scheduler.pendingCount(), 0u);
}

// -----------------------------------------------------------------------------
// 6. cleanupAll() empties the inflight map.
// -----------------------------------------------------------------------------
TEST_F(OrderRegistryTest, CleanupAll) {
  registry.insert(makeLive("a", 1.0)).timers.push_back(arm(10));
  registry.insert(makeLive("b", 1.0)).timers.push_back(arm(20));

  EXPECT_EQ(registry.cleanupAll(scheduler), 2u);
  EXPECT_EQ(registry.inflightCount(), 0u);
  EXPECT_EQ(scheduler.runAll(), 0u);
}

// -----------------------------------------------------------------------------
// 7. avgPrice() is the VWAP of the accumulated fills, 0 before any.
// -----------------------------------------------------------------------------
TEST(LiveOrderTest, AvgPriceIsVwap) {
  LiveOrder live;
  EXPECT_DOUBLE_EQ(live.avgPrice(), 0.0);

  live.filled = 30.0;
  live.notional = 10.0 * 100.0 + 20.0 * 103.0;
  EXPECT_DOUBLE_EQ(live.avgPrice(), 102.0);
}
