#include "mrngen/random_source.hpp"

#include <chrono>

namespace mrngen {

uint32_t LcgRandom::next31() {
  state_ = state_ * 6364136223846793005ull + 1;
  return static_cast<uint32_t>(state_ >> 33);
}

uint32_t LcgRandom::uniform(uint32_t bound) {
  if (bound <= 1) return 0;
  // largest multiple of bound that fits in 31 bits; draws above it are rejected
  const uint32_t range = 0x80000000u;
  const uint32_t limit = range - (range % bound);
  uint32_t v;
  do {
    v = next31();
  } while (v >= limit);
  return v % bound;
}

uint64_t LcgRandom::clock_seed() {
  return static_cast<uint64_t>(
      std::chrono::high_resolution_clock::now().time_since_epoch().count());
}

} // namespace mrngen
