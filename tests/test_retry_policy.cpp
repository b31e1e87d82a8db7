/**
 * @file test_retry_policy.cpp
 * @brief Tests for retry_policy.hpp
 */

#include "crucible/retry_policy.hpp"

#include <catch2/catch_test_macros.hpp>

#include <random>

TEST_CASE("BaseDelayMs grows exponentially up to the cap", "[retry]") {
  crucible::RetryPolicy p;
  p.base_ms = 100;
  p.max_ms = 1000;
  p.multiplier = 2.0;
  REQUIRE(p.BaseDelayMs(0) == 100U);
  REQUIRE(p.BaseDelayMs(1) == 200U);
  REQUIRE(p.BaseDelayMs(3) == 800U);
  REQUIRE(p.BaseDelayMs(4) == 1000U);
  REQUIRE(p.BaseDelayMs(60) == 1000U);
}

TEST_CASE("Multiplier below one is treated as constant backoff", "[retry]") {
  crucible::RetryPolicy p;
  p.base_ms = 50;
  p.multiplier = 0.5;
  REQUIRE(p.BaseDelayMs(5) == 50U);
}

TEST_CASE("Jitter stays within bounds", "[retry]") {
  crucible::RetryPolicy p;
  p.base_ms = 1000;
  p.max_ms = 100000;
  p.jitter = 0.25;
  std::mt19937 rng(7);
  for (uint32_t i = 0; i < 200; ++i) {
    const uint32_t d = p.NextDelayMs(0, rng);
    REQUIRE(d >= 1000U);
    REQUIRE(d <= 1250U);
  }
}

TEST_CASE("Zero jitter is deterministic", "[retry]") {
  auto p = crucible::RetryPolicy::Conservative();
  std::mt19937 rng(1);
  REQUIRE(p.NextDelayMs(1, rng) == 10000U);
}

TEST_CASE("RetryPolicyByName", "[retry]") {
  REQUIRE(crucible::RetryPolicyByName("aggressive").value().max_retries == 10U);
  REQUIRE(crucible::RetryPolicyByName("conservative").value().max_retries ==
          3U);
  REQUIRE(crucible::RetryPolicyByName("default").value().base_ms == 2000U);
  REQUIRE(!crucible::RetryPolicyByName("reckless").has_value());
  REQUIRE(!crucible::RetryPolicyByName(nullptr).has_value());
}
