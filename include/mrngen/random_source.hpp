#pragma once
/**
 * @file random_source.hpp
 * @brief Randomness handle threaded through the field composer.
 *
 * The composer never owns or seeds a generator. Callers pass an `IRandomSource&`
 * so one process keeps a single unbroken sequence across all N generations,
 * and tests can swap in a fixed sequence.
 *
 * Contract:
 *  - uniform(bound) returns a value in [0, bound); bound is always >= 1.
 *  - Calls are never reseeded between generations; the sequence only advances.
 */

#include <cstddef>
#include <cstdint>

namespace mrngen {

class IRandomSource {
public:
  virtual ~IRandomSource() = default;
  virtual uint32_t uniform(uint32_t bound) = 0;
};

/**
 * @brief 64-bit LCG (Knuth MMIX constants), the same generator the CLI has
 *        always used for short random identifiers.
 *
 * Output is the upper 31 bits of the state, reduced by rejection sampling so
 * every value in [0, bound) is equally likely.
 */
class LcgRandom : public IRandomSource {
public:
  explicit LcgRandom(uint64_t seed) : state_(seed) {}

  uint32_t uniform(uint32_t bound) override;

  /// Seed derived from the high resolution clock.
  static uint64_t clock_seed();

  uint64_t state() const { return state_; }

private:
  uint32_t next31();

  uint64_t state_;
};

} // namespace mrngen
