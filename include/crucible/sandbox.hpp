/**
 * @file sandbox.hpp
 * @brief Execution sandbox provider capability interface.
 *
 * The dispatcher is written once against SandboxProvider. Backends (local
 * process, container runtime, cluster job scheduler) implement the five
 * operations below and report unit progress through UnitSignal callbacks.
 *
 * Two independent channels report how a unit ended:
 *   - kCompletionStatus: backend-native verdict (job succeeded / failed)
 *   - kExitCode: the process exit code or terminating signal
 * They are not synchronized and either may arrive first, or not at all.
 */

#ifndef CRUCIBLE_SANDBOX_HPP_
#define CRUCIBLE_SANDBOX_HPP_

#include "crucible/evaluation.hpp"
#include "crucible/vocabulary.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace crucible {

// ============================================================================
// Error / Mode Enums
// ============================================================================

enum class ProviderError : uint8_t {
  kUnavailable = 0,  ///< Backend unreachable (transient).
  kInvalidSpec,      ///< Spec cannot be executed by this backend.
  kSpawnFailed,      ///< Unit creation attempted and failed.
  kUnitNotFound,
  kNotYetAvailable,  ///< Logs not produced / not shipped yet.
  kAlreadyExited,
};

inline const char* ProviderErrorName(ProviderError e) noexcept {
  switch (e) {
    case ProviderError::kUnavailable:
      return "provider unavailable";
    case ProviderError::kInvalidSpec:
      return "invalid unit spec";
    case ProviderError::kSpawnFailed:
      return "unit creation failed";
    case ProviderError::kUnitNotFound:
      return "unit not found";
    case ProviderError::kNotYetAvailable:
      return "not yet available";
    case ProviderError::kAlreadyExited:
      return "unit already exited";
  }
  return "unknown";
}

enum class TerminateMode : uint8_t {
  kGraceful = 0,  ///< Cooperative stop request (SIGTERM or equivalent).
  kForce,         ///< Immediate kill.
};

// ============================================================================
// Unit Spec / Handle
// ============================================================================

/// @brief Everything a backend needs to create one execution unit.
struct UnitSpec {
  std::string evaluation_id;
  std::string code;
  std::string language;
  std::string image;
  ResourceRequirements resources;  ///< Defaults already applied.
  RiskLevel risk = RiskLevel::kHigh;
};

/// @brief Opaque reference to a created unit.
struct UnitHandle {
  std::string unit_id;
  std::string output_ref;  ///< Where the unit's output ends up.
};

// ============================================================================
// UnitSignal
// ============================================================================

enum class UnitSignalKind : uint8_t {
  kStarted = 0,
  kCompletionStatus,
  kExitCode,
  kWatchLost,  ///< Observation stream dropped; the unit may still be alive.
};

inline const char* UnitSignalKindName(UnitSignalKind kind) noexcept {
  switch (kind) {
    case UnitSignalKind::kStarted:
      return "started";
    case UnitSignalKind::kCompletionStatus:
      return "completion_status";
    case UnitSignalKind::kExitCode:
      return "exit_code";
    case UnitSignalKind::kWatchLost:
      return "watch_lost";
  }
  return "unknown";
}

/**
 * @brief One lifecycle observation from a backend.
 *
 * Fields beyond unit_id and kind are meaningful only for the matching kind:
 * succeeded / oom_killed for kCompletionStatus, exit_code / term_signal for
 * kExitCode.
 */
struct UnitSignal {
  std::string unit_id;
  UnitSignalKind kind = UnitSignalKind::kStarted;
  bool succeeded = false;
  bool oom_killed = false;
  int32_t exit_code = -1;
  int32_t term_signal = 0;
  std::string detail;
};

/// @brief Signal sink. May be invoked from any backend thread.
using UnitSignalFn = std::function<void(const UnitSignal&)>;

// ============================================================================
// SandboxProvider
// ============================================================================

/**
 * @brief Capability interface over an isolation backend.
 *
 * Implementations must be thread-safe. Callbacks passed to Watch() must not
 * be invoked while the implementation holds a lock the caller could need
 * from inside the callback (e.g. for Terminate()).
 */
class SandboxProvider {
 public:
  virtual ~SandboxProvider() = default;

  /// @brief Backend name for logs ("local", "fake", ...).
  virtual const char* Name() const noexcept = 0;

  /** @brief Create and start a unit. Does not wait for it to run. */
  virtual expected<UnitHandle, ProviderError> CreateUnit(
      const UnitSpec& spec) = 0;

  /**
   * @brief Subscribe to lifecycle signals of a unit.
   *
   * Calling Watch() again on the same unit replaces the previous sink; this
   * is how a dropped stream is re-established. Signals already delivered
   * may be replayed.
   */
  virtual expected<void, ProviderError> Watch(const UnitHandle& handle,
                                              UnitSignalFn fn) = 0;

  virtual expected<void, ProviderError> Terminate(const UnitHandle& handle,
                                                  TerminateMode mode) = 0;

  /**
   * @brief Best-effort output retrieval.
   * @return kNotYetAvailable if the backend has nothing yet. That is not a
   *         failure of the evaluation.
   */
  virtual expected<std::string, ProviderError> FetchLogs(
      const UnitHandle& handle) = 0;

  /** @brief Forget a finished unit. Output stays at output_ref. */
  virtual void Cleanup(const UnitHandle& handle) = 0;
};

}  // namespace crucible

#endif  // CRUCIBLE_SANDBOX_HPP_
