/**
 * @file backoff.hpp
 * @brief Capped exponential backoff with positive jitter.
 *
 * @details
 * Delay n (0-based) is `min(base_n * (1 + u * jitter), max)` with
 * `base_n = min(min * 2^n, max)` and `u` uniform in [0,1).
 *
 * Because jitter only adds and stays below 100% of the base, delay n is always
 * smaller than base_{n+1}, so the sequence never decreases before reaching the
 * cap and then stays at the cap. `reset()` goes back to `min` (called after an
 * authenticated connection).
 */
#ifndef PUSHWIRE_BACKOFF_HPP
#define PUSHWIRE_BACKOFF_HPP

#include <cstdint>
#include <random>

namespace pushwire {

class Backoff {
public:
  static constexpr uint32_t MIN_MS_DEFAULT = 1000;
  static constexpr uint32_t MAX_MS_DEFAULT = 300000;
  static constexpr double   JITTER_DEFAULT = 0.2;

  Backoff(uint32_t min_ms = MIN_MS_DEFAULT, uint32_t max_ms = MAX_MS_DEFAULT,
          double jitter = JITTER_DEFAULT, uint32_t seed = std::random_device{}());

  /// Delay before the next attempt; advances the internal attempt counter.
  uint32_t next_delay_ms();

  void reset() { attempt_ = 0; }

  uint32_t attempts() const { return attempt_; }
  uint32_t min_ms() const { return min_ms_; }
  uint32_t max_ms() const { return max_ms_; }

private:
  uint32_t     min_ms_;
  uint32_t     max_ms_;
  double       jitter_;
  uint32_t     attempt_{0};
  std::mt19937 rng_;
};

} // namespace pushwire

#endif // PUSHWIRE_BACKOFF_HPP
