#pragma once

#include "execsim/random/i_random_source.hpp"

#include <cstdint>
#include <mutex>
#include <random>

namespace execsim {

// -----------------------------------------------------------------------------
// SeededRandomSource: mt19937_64 behind a mutex
// -----------------------------------------------------------------------------
//
// @brief  Production IRandomSource. A non-zero seed makes a whole simulator
//         run reproducible; seed 0 draws the seed from std::random_device.
//
// Thread model:
//   submit() callers and the timer thread both draw from it, so the engine
//   state is guarded by a mutex.
// -----------------------------------------------------------------------------
class SeededRandomSource final : public IRandomSource {
 public:
  explicit SeededRandomSource(std::uint64_t seed = 0);

  double uniform(double lo, double hi) override;
  int uniformInt(int lo, int hi) override;

  // Seed actually in use (the random_device draw when constructed with 0).
  std::uint64_t seed() const { return seed_; }

 private:
  std::uint64_t seed_;
  std::mutex mutex_;
  std::mt19937_64 engine_;
};

}  // namespace execsim
