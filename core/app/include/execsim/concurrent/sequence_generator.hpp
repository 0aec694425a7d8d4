#pragma once

#include <atomic>
#include <cstdint>

namespace execsim {

// -----------------------------------------------------------------------------
// SequenceGenerator: thread-safe, monotonically increasing counter
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique uint64 values starting at 1. Value 0 is reserved
//         as the "unset" sentinel (e.g. an ExecReport that was never
//         stamped, or an invalid TimerId).
//
// @details
// Used for two independent sequences:
//   - timer handles in VirtualScheduler and TimerThread,
//   - ExecReport::sequence_id in MockExecutionGateway.
//
// fetch_add with memory_order_relaxed: the only requirement is uniqueness,
// there is no ordering relationship with other memory.
//
// Ownership:
//   A value member of its owner. Not a singleton; two gateways produce two
//   independent report sequences.
// -----------------------------------------------------------------------------
class SequenceGenerator {
 public:
  SequenceGenerator() = default;

  // Non-copyable, non-movable: a copied generator would hand out duplicates.
  SequenceGenerator(const SequenceGenerator&) = delete;
  SequenceGenerator& operator=(const SequenceGenerator&) = delete;
  SequenceGenerator(SequenceGenerator&&) = delete;
  SequenceGenerator& operator=(SequenceGenerator&&) = delete;

  // Thread-safety: Safe to call concurrently from any thread.
  std::uint64_t next() {
    return next_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_{1};
};

}  // namespace execsim
