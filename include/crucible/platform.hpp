/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, assertion macros and monotonic
 *        clock helpers shared by all crucible modules.
 */

#ifndef CRUCIBLE_PLATFORM_HPP_
#define CRUCIBLE_PLATFORM_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace crucible {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define CRUCIBLE_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define CRUCIBLE_PLATFORM_MACOS 1
#endif

#if defined(CRUCIBLE_PLATFORM_LINUX) || defined(CRUCIBLE_PLATFORM_MACOS)
#define CRUCIBLE_HAS_NETWORK 1
#else
#define CRUCIBLE_HAS_NETWORK 0
#endif

// ============================================================================
// Cache Line Size
// ============================================================================

static constexpr size_t kCacheLineSize = 64;

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define CRUCIBLE_LIKELY(x) __builtin_expect(!!(x), 1)
#define CRUCIBLE_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define CRUCIBLE_LIKELY(x) (x)
#define CRUCIBLE_UNLIKELY(x) (x)
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "CRUCIBLE_ASSERT failed: %s at %s:%d\n", cond,
                     file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define CRUCIBLE_ASSERT(cond) ((void)0)
#else
#define CRUCIBLE_ASSERT(cond) \
  ((cond) ? ((void)0)         \
          : ::crucible::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Monotonic Clock
// ============================================================================

/** @brief Monotonic time in microseconds (steady_clock). */
inline uint64_t SteadyNowUs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

/** @brief Monotonic time in nanoseconds (steady_clock). */
inline uint64_t SteadyNowNs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

/** @brief Wall-clock time in milliseconds since the Unix epoch. */
inline uint64_t WallNowMs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace crucible

#endif  // CRUCIBLE_PLATFORM_HPP_
