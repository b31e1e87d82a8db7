/**
 * @file evaluation.hpp
 * @brief Evaluation data model: lifecycle status, requests, exit outcome and
 *        lifecycle events.
 *
 * Status values form a monotonic lattice:
 *   queued(0) < provisioning(1) < running(2) < {completed, failed, timeout,
 *   cancelled}(3)
 * Terminal states are absorbing.
 */

#ifndef CRUCIBLE_EVALUATION_HPP_
#define CRUCIBLE_EVALUATION_HPP_

#include "crucible/platform.hpp"
#include "crucible/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace crucible {

// ============================================================================
// EvaluationStatus
// ============================================================================

enum class EvaluationStatus : uint8_t {
  kQueued = 0,
  kProvisioning,
  kRunning,
  kCompleted,
  kFailed,
  kTimeout,
  kCancelled,
};

static constexpr uint32_t kEvaluationStatusCount = 7U;

inline const char* StatusName(EvaluationStatus status) noexcept {
  switch (status) {
    case EvaluationStatus::kQueued:
      return "queued";
    case EvaluationStatus::kProvisioning:
      return "provisioning";
    case EvaluationStatus::kRunning:
      return "running";
    case EvaluationStatus::kCompleted:
      return "completed";
    case EvaluationStatus::kFailed:
      return "failed";
    case EvaluationStatus::kTimeout:
      return "timeout";
    case EvaluationStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

inline optional<EvaluationStatus> ParseStatus(const char* name) noexcept {
  if (name == nullptr) return {};
  for (uint32_t i = 0; i < kEvaluationStatusCount; ++i) {
    auto s = static_cast<EvaluationStatus>(i);
    if (std::strcmp(name, StatusName(s)) == 0) return s;
  }
  return {};
}

inline bool IsTerminal(EvaluationStatus status) noexcept {
  return status == EvaluationStatus::kCompleted ||
         status == EvaluationStatus::kFailed ||
         status == EvaluationStatus::kTimeout ||
         status == EvaluationStatus::kCancelled;
}

/// @brief Position in the lifecycle lattice. All terminal states share rank 3.
inline uint8_t StatusRank(EvaluationStatus status) noexcept {
  switch (status) {
    case EvaluationStatus::kQueued:
      return 0U;
    case EvaluationStatus::kProvisioning:
      return 1U;
    case EvaluationStatus::kRunning:
      return 2U;
    default:
      return 3U;
  }
}

/// @brief Event bus topic for a status, e.g. "evaluation:completed".
inline std::string StatusTopic(EvaluationStatus status) {
  return std::string("evaluation:") + StatusName(status);
}

// ============================================================================
// Risk Level
// ============================================================================

/**
 * @brief Declared risk of the submitted code.
 *
 * Drives the grace window after a stop request: trusted code may flush state
 * for longer, untrusted code is killed quickly.
 */
enum class RiskLevel : uint8_t {
  kLow = 0,
  kMedium,
  kHigh,
};

inline const char* RiskLevelName(RiskLevel risk) noexcept {
  switch (risk) {
    case RiskLevel::kLow:
      return "low";
    case RiskLevel::kMedium:
      return "medium";
    case RiskLevel::kHigh:
      return "high";
  }
  return "high";
}

inline optional<RiskLevel> ParseRiskLevel(const char* name) noexcept {
  if (name == nullptr) return {};
  if (std::strcmp(name, "low") == 0 || std::strcmp(name, "trusted") == 0) {
    return RiskLevel::kLow;
  }
  if (std::strcmp(name, "medium") == 0 || std::strcmp(name, "standard") == 0) {
    return RiskLevel::kMedium;
  }
  if (std::strcmp(name, "high") == 0 || std::strcmp(name, "untrusted") == 0) {
    return RiskLevel::kHigh;
  }
  return {};
}

// ============================================================================
// Termination Reason
// ============================================================================

enum class TerminationReason : uint8_t {
  kNone = 0,
  kSuccess,
  kNonZeroExit,
  kOutOfMemory,
  kKilledBySignal,
  kDeadlineExceeded,
  kCancelledByUser,
  kInfrastructure,
  kQueueSlaExceeded,
  kRejected,
};

inline const char* TerminationReasonName(TerminationReason reason) noexcept {
  switch (reason) {
    case TerminationReason::kNone:
      return "";
    case TerminationReason::kSuccess:
      return "success";
    case TerminationReason::kNonZeroExit:
      return "non_zero_exit";
    case TerminationReason::kOutOfMemory:
      return "out_of_memory";
    case TerminationReason::kKilledBySignal:
      return "killed_by_signal";
    case TerminationReason::kDeadlineExceeded:
      return "deadline_exceeded";
    case TerminationReason::kCancelledByUser:
      return "cancelled_by_user";
    case TerminationReason::kInfrastructure:
      return "infrastructure";
    case TerminationReason::kQueueSlaExceeded:
      return "queue_sla_exceeded";
    case TerminationReason::kRejected:
      return "rejected";
  }
  return "";
}

// ============================================================================
// ExitInfo
// ============================================================================

enum class ExitCodeState : uint8_t {
  kUnknown = 0,  ///< Unit finished but no trustworthy exit code was observed.
  kKnown,
};

/**
 * @brief Exit outcome of an execution unit.
 *
 * code_state == kUnknown is a first-class outcome: the terminal status was
 * decided from the unit-native completion status and exit_code is not valid.
 */
struct ExitInfo {
  ExitCodeState code_state = ExitCodeState::kUnknown;
  int32_t exit_code = -1;
  int32_t term_signal = 0;  ///< Non-zero if the unit was killed by a signal.

  bool Known() const noexcept { return code_state == ExitCodeState::kKnown; }

  static ExitInfo FromCode(int32_t code) noexcept {
    ExitInfo e;
    e.code_state = ExitCodeState::kKnown;
    e.exit_code = code;
    return e;
  }
};

/**
 * @brief Human-readable meaning of a process exit code.
 *
 * Follows shell and container conventions (124 timeout, 137 SIGKILL/OOM, ...).
 */
inline std::string DescribeExitCode(int32_t code) {
  switch (code) {
    case 0:
      return "success";
    case 1:
      return "general error";
    case 2:
      return "misuse of shell builtin";
    case 124:
      return "timed out";
    case 125:
      return "container failed to run";
    case 126:
      return "command cannot execute";
    case 127:
      return "command not found";
    case 130:
      return "interrupted (SIGINT)";
    case 137:
      return "killed (SIGKILL or out of memory)";
    case 139:
      return "segmentation fault";
    case 143:
      return "terminated (SIGTERM)";
    default:
      break;
  }
  char buf[48];
  (void)std::snprintf(buf, sizeof(buf), "exited with code %d", code);
  return buf;
}

// ============================================================================
// Resource Requirements / Request
// ============================================================================

struct ResourceRequirements {
  uint32_t memory_mb = 0;
  uint32_t cpu_millicores = 0;
  uint32_t timeout_s = 0;
};

/**
 * @brief A submitted evaluation, as accepted by the router and dispatcher.
 */
struct EvaluationRequest {
  std::string id;
  std::string code;
  std::string language = "python";
  std::string image;  ///< Optional runtime image hint for container backends.
  ResourceRequirements resources;
  int32_t priority = 250;
  RiskLevel risk = RiskLevel::kHigh;
};

// ============================================================================
// LifecycleEvent
// ============================================================================

/**
 * @brief Where an event came from.
 *
 * kSignal events are raw observations from job supervision and feed the
 * state machine. kCommitted events are emitted by the state machine after a
 * transition was accepted; result storage and live subscribers consume
 * those.
 */
enum class EventOrigin : uint8_t {
  kSignal = 0,
  kCommitted,
};

/**
 * @brief Immutable fact about an evaluation's progress.
 */
struct LifecycleEvent {
  std::string evaluation_id;
  EvaluationStatus type = EvaluationStatus::kQueued;
  EventOrigin origin = EventOrigin::kSignal;
  uint64_t timestamp_us = 0;
  uint64_t sequence_hint = 0;  ///< Best-effort ordering only.
  ExitInfo exit;
  TerminationReason reason = TerminationReason::kNone;
  std::string detail;
  std::string output_ref;
  std::string unit_ref;
  int32_t priority = 0;  ///< Carried on provisioning/queued signals.
};

// ============================================================================
// EvaluationSnapshot
// ============================================================================

struct TransitionRecord {
  EvaluationStatus status;
  uint64_t at_us;
};

/**
 * @brief Copy of an evaluation's lifecycle record at one point in time.
 */
struct EvaluationSnapshot {
  std::string id;
  EvaluationStatus status = EvaluationStatus::kQueued;
  int32_t priority = 0;
  uint64_t created_us = 0;
  uint64_t started_us = 0;    ///< 0 until running.
  uint64_t completed_us = 0;  ///< 0 until terminal.
  uint64_t version = 0;       ///< Incremented on every accepted transition.
  ExitInfo exit;
  TerminationReason reason = TerminationReason::kNone;
  std::string detail;
  std::string output_ref;
  std::string unit_ref;
  std::vector<TransitionRecord> history;
};

}  // namespace crucible

#endif  // CRUCIBLE_EVALUATION_HPP_
