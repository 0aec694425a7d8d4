#include "execsim/random/seeded_random_source.hpp"

namespace execsim {

namespace {

std::uint64_t resolveSeed(std::uint64_t seed) {
  if (seed != 0) {
    return seed;
  }
  std::random_device device;
  return (static_cast<std::uint64_t>(device()) << 32) ^ device();
}

}  // namespace

SeededRandomSource::SeededRandomSource(std::uint64_t seed)
    : seed_(resolveSeed(seed)), engine_(seed_) {}

double SeededRandomSource::uniform(double lo, double hi) {
  if (!(lo < hi)) {
    return lo;
  }
  std::uniform_real_distribution<double> dist(lo, hi);
  std::lock_guard lock(mutex_);
  return dist(engine_);
}

int SeededRandomSource::uniformInt(int lo, int hi) {
  if (lo >= hi) {
    return lo;
  }
  std::uniform_int_distribution<int> dist(lo, hi);
  std::lock_guard lock(mutex_);
  return dist(engine_);
}

}  // namespace execsim
