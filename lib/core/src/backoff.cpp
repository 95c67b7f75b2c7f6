#include <core/backoff.hpp>

#include <algorithm>
#include <cmath>

namespace nostr_pool::core {

backoff::backoff(backoff_policy policy, std::uint32_t seed) : policy_(policy), rng_(seed)
{
  policy_.multiplier = std::max(policy_.multiplier, 1.0);
  policy_.jitter = std::clamp(policy_.jitter, 0.0, 1.0);
  if (policy_.max < policy_.initial) { policy_.max = policy_.initial; }
}

auto backoff::next_delay() -> std::chrono::milliseconds
{
  // Cap the exponent so the power cannot overflow before the clamp.
  static constexpr std::uint32_t max_exponent = 32;
  const auto exponent = std::min(attempt_, max_exponent);
  ++attempt_;

  const auto initial_ms = static_cast<double>(policy_.initial.count());
  const auto max_ms = static_cast<double>(policy_.max.count());
  const double base = std::min(initial_ms * std::pow(policy_.multiplier, exponent), max_ms);

  double delay = base;
  if (policy_.jitter > 0.0 and base > 0.0) {
    std::uniform_real_distribution<double> spread(-policy_.jitter, policy_.jitter);
    delay = base * (1.0 + spread(rng_));
  }

  return std::chrono::milliseconds(static_cast<std::int64_t>(std::clamp(delay, 0.0, max_ms)));
}

}// namespace nostr_pool::core
