#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace nostr_pool::core {

/**
 * @brief Shape of a reconnect delay curve.
 *
 * delay(n) = min(initial * multiplier^n, max), then spread by +/- jitter
 * (a fraction of the delay) and clamped to [0, max].
 */
struct backoff_policy
{
  std::chrono::milliseconds initial{ std::chrono::seconds(1) };///< Delay after the first failure
  std::chrono::milliseconds max{ std::chrono::seconds(60) };///< Upper bound for any delay
  double multiplier{ 2.0 };///< Growth factor per consecutive failure
  double jitter{ 0.2 };///< Relative spread in [0, 1]
};

/**
 * @brief Exponential backoff with jitter and cap.
 *
 * Not thread-safe; each connection owns one.
 */
class backoff
{
public:
  explicit backoff(backoff_policy policy, std::uint32_t seed = std::random_device{}());

  /**
   * @brief Returns the next delay and advances the attempt counter.
   */
  [[nodiscard]] auto next_delay() -> std::chrono::milliseconds;

  /// Returns the curve to its initial delay.
  auto reset() -> void { attempt_ = 0; }

  [[nodiscard]] auto attempts() const -> std::uint32_t { return attempt_; }
  [[nodiscard]] auto policy() const -> const backoff_policy & { return policy_; }

private:
  backoff_policy policy_;
  std::uint32_t attempt_{ 0 };
  std::mt19937 rng_;
};

}// namespace nostr_pool::core
