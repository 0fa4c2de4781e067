#include "pushwire/backoff.hpp"

#include <algorithm>

namespace pushwire {

Backoff::Backoff(uint32_t min_ms, uint32_t max_ms, double jitter, uint32_t seed)
: min_ms_(min_ms == 0 ? 1 : min_ms),
  max_ms_(std::max(max_ms, min_ms == 0 ? 1u : min_ms)),
  jitter_(std::clamp(jitter, 0.0, 0.99)),   // < 1 keeps the sequence non-decreasing
  rng_(seed) {}

uint32_t Backoff::next_delay_ms() {
  // Double from min, saturating at max; 64-bit so the shift cannot overflow.
  uint64_t base = min_ms_;
  for (uint32_t i = 0; i < attempt_ && base < max_ms_; ++i) base *= 2;
  if (base > max_ms_) base = max_ms_;

  std::uniform_real_distribution<double> unit(0.0, 1.0);
  const double jittered = static_cast<double>(base) * (1.0 + unit(rng_) * jitter_);

  ++attempt_;
  const double capped = std::min(jittered, static_cast<double>(max_ms_));
  return static_cast<uint32_t>(capped);
}

} // namespace pushwire
