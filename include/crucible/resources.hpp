/**
 * @file resources.hpp
 * @brief Resource string parsing, request validation against node limits,
 *        and priority normalization.
 *
 * Memory strings: "512Mi", "1Gi", "1024Ki", "1Ti" or a plain byte count.
 * CPU strings:    "100m" (millicores), "0.5" or "2" (cores).
 */

#ifndef CRUCIBLE_RESOURCES_HPP_
#define CRUCIBLE_RESOURCES_HPP_

#include "crucible/evaluation.hpp"
#include "crucible/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace crucible {

// ============================================================================
// Resource Parsing
// ============================================================================

enum class ResourceParseError : uint8_t {
  kEmpty = 0,
  kMalformed,
  kOutOfRange,
};

namespace detail {

inline bool EndsWith(const char* s, size_t len, const char* suffix) noexcept {
  const size_t n = std::strlen(suffix);
  return len >= n && std::memcmp(s + len - n, suffix, n) == 0;
}

/// @brief Parse a non-negative decimal number occupying exactly [s, s+len).
inline bool ParseNumber(const char* s, size_t len, double& out) noexcept {
  if (len == 0 || len > 63) return false;
  char buf[64];
  std::memcpy(buf, s, len);
  buf[len] = '\0';
  char* end = nullptr;
  errno = 0;
  double v = std::strtod(buf, &end);
  if (end != buf + len || errno != 0 || v < 0.0) return false;
  out = v;
  return true;
}

}  // namespace detail

/**
 * @brief Convert a memory quantity to megabytes (MiB).
 */
inline expected<uint32_t, ResourceParseError> ParseMemoryMb(const char* text) {
  using R = expected<uint32_t, ResourceParseError>;
  if (text == nullptr || text[0] == '\0') {
    return R::error(ResourceParseError::kEmpty);
  }
  const size_t len = std::strlen(text);
  double value = 0.0;
  double mb = 0.0;
  if (detail::EndsWith(text, len, "Ti")) {
    if (!detail::ParseNumber(text, len - 2, value)) {
      return R::error(ResourceParseError::kMalformed);
    }
    mb = value * 1024.0 * 1024.0;
  } else if (detail::EndsWith(text, len, "Gi")) {
    if (!detail::ParseNumber(text, len - 2, value)) {
      return R::error(ResourceParseError::kMalformed);
    }
    mb = value * 1024.0;
  } else if (detail::EndsWith(text, len, "Mi")) {
    if (!detail::ParseNumber(text, len - 2, value)) {
      return R::error(ResourceParseError::kMalformed);
    }
    mb = value;
  } else if (detail::EndsWith(text, len, "Ki")) {
    if (!detail::ParseNumber(text, len - 2, value)) {
      return R::error(ResourceParseError::kMalformed);
    }
    mb = value / 1024.0;
  } else {
    if (!detail::ParseNumber(text, len, value)) {
      return R::error(ResourceParseError::kMalformed);
    }
    mb = value / 1024.0 / 1024.0;
  }
  if (mb > static_cast<double>(UINT32_MAX)) {
    return R::error(ResourceParseError::kOutOfRange);
  }
  return R::success(static_cast<uint32_t>(mb));
}

/**
 * @brief Convert a CPU quantity to millicores.
 */
inline expected<uint32_t, ResourceParseError> ParseCpuMillicores(
    const char* text) {
  using R = expected<uint32_t, ResourceParseError>;
  if (text == nullptr || text[0] == '\0') {
    return R::error(ResourceParseError::kEmpty);
  }
  const size_t len = std::strlen(text);
  double value = 0.0;
  double millis = 0.0;
  if (detail::EndsWith(text, len, "m")) {
    if (!detail::ParseNumber(text, len - 1, value)) {
      return R::error(ResourceParseError::kMalformed);
    }
    millis = value;
  } else {
    if (!detail::ParseNumber(text, len, value)) {
      return R::error(ResourceParseError::kMalformed);
    }
    millis = value * 1000.0;
  }
  if (millis > static_cast<double>(UINT32_MAX)) {
    return R::error(ResourceParseError::kOutOfRange);
  }
  return R::success(static_cast<uint32_t>(millis));
}

// ============================================================================
// Node Limits and Request Validation
// ============================================================================

/**
 * @brief Absolute per-evaluation limits (the largest node that exists) plus
 *        defaults for omitted fields.
 */
struct NodeLimits {
  uint32_t max_memory_mb = 512;
  uint32_t max_cpu_millicores = 500;
  uint32_t max_timeout_s = 600;
  uint32_t max_code_bytes = 1024U * 1024U;
  uint32_t default_memory_mb = 128;
  uint32_t default_cpu_millicores = 100;
  uint32_t default_timeout_s = 300;
};

enum class ValidationFailure : uint8_t {
  kMissingId = 0,
  kInvalidId,
  kEmptyCode,
  kCodeTooLarge,
  kMemoryExceedsNode,
  kCpuExceedsNode,
  kTimeoutExceedsLimit,
  kUnsupportedLanguage,
};

inline const char* ValidationFailureName(ValidationFailure f) noexcept {
  switch (f) {
    case ValidationFailure::kMissingId:
      return "evaluation id is required";
    case ValidationFailure::kInvalidId:
      return "evaluation id contains invalid characters";
    case ValidationFailure::kEmptyCode:
      return "code is empty";
    case ValidationFailure::kCodeTooLarge:
      return "code exceeds maximum payload size";
    case ValidationFailure::kMemoryExceedsNode:
      return "memory request exceeds largest available node";
    case ValidationFailure::kCpuExceedsNode:
      return "cpu request exceeds largest available node";
    case ValidationFailure::kTimeoutExceedsLimit:
      return "timeout exceeds maximum allowed";
    case ValidationFailure::kUnsupportedLanguage:
      return "unsupported language";
  }
  return "invalid request";
}

/// @brief Evaluation ids become file and topic names: [A-Za-z0-9_.-], <= 128.
inline bool IsValidEvaluationId(const std::string& id) noexcept {
  if (id.empty() || id.size() > 128U) return false;
  if (id == "." || id == "..") return false;
  for (char c : id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
    if (!ok) return false;
  }
  return true;
}

/// @brief Interpreters every sandbox backend can run.
inline bool IsSupportedLanguage(const std::string& language) noexcept {
  return language == "python" || language == "python3" || language == "sh" ||
         language == "shell" || language == "bash";
}

/**
 * @brief Fill omitted resource fields with defaults.
 */
inline void ApplyResourceDefaults(ResourceRequirements& res,
                                  const NodeLimits& limits) noexcept {
  if (res.memory_mb == 0) res.memory_mb = limits.default_memory_mb;
  if (res.cpu_millicores == 0) res.cpu_millicores = limits.default_cpu_millicores;
  if (res.timeout_s == 0) res.timeout_s = limits.default_timeout_s;
}

/**
 * @brief Check a request against absolute limits.
 *
 * A failure here is permanent: no amount of waiting makes the request
 * admissible, so callers must never retry it.
 */
inline expected<void, ValidationFailure> ValidateRequest(
    const EvaluationRequest& req, const NodeLimits& limits) {
  using R = expected<void, ValidationFailure>;
  if (req.id.empty()) return R::error(ValidationFailure::kMissingId);
  if (!IsValidEvaluationId(req.id)) {
    return R::error(ValidationFailure::kInvalidId);
  }
  if (req.code.empty()) return R::error(ValidationFailure::kEmptyCode);
  if (!IsSupportedLanguage(req.language)) {
    return R::error(ValidationFailure::kUnsupportedLanguage);
  }
  if (req.code.size() > limits.max_code_bytes) {
    return R::error(ValidationFailure::kCodeTooLarge);
  }
  if (req.resources.memory_mb > limits.max_memory_mb) {
    return R::error(ValidationFailure::kMemoryExceedsNode);
  }
  if (req.resources.cpu_millicores > limits.max_cpu_millicores) {
    return R::error(ValidationFailure::kCpuExceedsNode);
  }
  if (req.resources.timeout_s > limits.max_timeout_s) {
    return R::error(ValidationFailure::kTimeoutExceedsLimit);
  }
  return R::success();
}

// ============================================================================
// Priority
// ============================================================================

/// @brief Map legacy -1/0/1 priorities to 150/250/350; others pass through.
inline int32_t NormalizePriority(int32_t priority) noexcept {
  switch (priority) {
    case -1:
      return 150;
    case 0:
      return 250;
    case 1:
      return 350;
    default:
      return priority;
  }
}

inline const char* PriorityClassName(int32_t priority) noexcept {
  if (priority >= 2000) return "critical-priority";
  if (priority >= 1000) return "high-priority-evaluation";
  if (priority >= 500) return "normal-priority-evaluation";
  if (priority >= 400) return "test-infrastructure-priority";
  if (priority >= 350) return "test-high-priority-evaluation";
  if (priority >= 250) return "test-normal-priority-evaluation";
  if (priority >= 150) return "test-low-priority-evaluation";
  return "low-priority-evaluation";
}

/// @brief Queue lane used for statistics and routing diagnostics.
inline const char* PriorityLane(int32_t priority) noexcept {
  if (priority >= 1000) return "high_priority";
  if (priority >= 250) return "evaluation";
  return "low_priority";
}

}  // namespace crucible

#endif  // CRUCIBLE_RESOURCES_HPP_
