/**
 * @file retry_policy.hpp
 * @brief Exponential backoff with jitter for retryable dispatch rejections.
 *
 * delay(attempt) = min(max, base * multiplier^attempt) * (1 + U[0, jitter))
 *
 * Capacity rejections are retried without a count limit (the router bounds
 * them by the queue SLA); max_retries applies to infrastructure rejections.
 */

#ifndef CRUCIBLE_RETRY_POLICY_HPP_
#define CRUCIBLE_RETRY_POLICY_HPP_

#include "crucible/vocabulary.hpp"

#include <cmath>
#include <cstdint>
#include <cstring>
#include <random>

namespace crucible {

struct RetryPolicy {
  uint32_t base_ms = 2000;
  uint32_t max_ms = 300000;
  double multiplier = 2.0;
  double jitter = 0.25;  ///< Upper bound of the random extra fraction.
  uint32_t max_retries = 5;

  static RetryPolicy Default() noexcept { return RetryPolicy{}; }

  static RetryPolicy Aggressive() noexcept {
    return RetryPolicy{1000, 600000, 1.5, 0.25, 10};
  }

  static RetryPolicy Conservative() noexcept {
    return RetryPolicy{5000, 60000, 2.0, 0.0, 3};
  }

  /// @brief Capped exponential delay without jitter.
  uint32_t BaseDelayMs(uint32_t attempt) const noexcept {
    const double mult = (multiplier < 1.0) ? 1.0 : multiplier;
    double delay = static_cast<double>(base_ms) *
                   std::pow(mult, static_cast<double>(attempt));
    if (!(delay < static_cast<double>(max_ms))) delay = max_ms;
    return static_cast<uint32_t>(delay);
  }

  /**
   * @brief Delay before retry number @p attempt (0-based), jitter included.
   */
  template <typename Rng>
  uint32_t NextDelayMs(uint32_t attempt, Rng& rng) const {
    const uint32_t base = BaseDelayMs(attempt);
    if (jitter <= 0.0) return base;
    std::uniform_real_distribution<double> dist(0.0, jitter);
    return static_cast<uint32_t>(static_cast<double>(base) *
                                 (1.0 + dist(rng)));
  }
};

/// @brief "default", "aggressive" or "conservative".
inline optional<RetryPolicy> RetryPolicyByName(const char* name) noexcept {
  if (name == nullptr) return {};
  if (std::strcmp(name, "default") == 0) return RetryPolicy::Default();
  if (std::strcmp(name, "aggressive") == 0) return RetryPolicy::Aggressive();
  if (std::strcmp(name, "conservative") == 0) {
    return RetryPolicy::Conservative();
  }
  return {};
}

}  // namespace crucible

#endif  // CRUCIBLE_RETRY_POLICY_HPP_
