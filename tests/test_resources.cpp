/**
 * @file test_resources.cpp
 * @brief Tests for resources.hpp
 */

#include "crucible/resources.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <string>

using crucible::ResourceParseError;
using crucible::ValidationFailure;

// ============================================================================
// Quantity parsing
// ============================================================================

TEST_CASE("ParseMemoryMb binary suffixes", "[resources]") {
  REQUIRE(crucible::ParseMemoryMb("128Mi").value() == 128U);
  REQUIRE(crucible::ParseMemoryMb("2Gi").value() == 2048U);
  REQUIRE(crucible::ParseMemoryMb("1.5Gi").value() == 1536U);
  REQUIRE(crucible::ParseMemoryMb("2048Ki").value() == 2U);
  REQUIRE(crucible::ParseMemoryMb("1Ti").value() == 1024U * 1024U);
}

TEST_CASE("ParseMemoryMb plain number is bytes", "[resources]") {
  REQUIRE(crucible::ParseMemoryMb("134217728").value() == 128U);
  REQUIRE(crucible::ParseMemoryMb("1000").value() == 0U);
}

TEST_CASE("ParseMemoryMb errors", "[resources]") {
  REQUIRE(crucible::ParseMemoryMb("").get_error() == ResourceParseError::kEmpty);
  REQUIRE(crucible::ParseMemoryMb(nullptr).get_error() ==
          ResourceParseError::kEmpty);
  REQUIRE(crucible::ParseMemoryMb("lots").get_error() ==
          ResourceParseError::kMalformed);
  REQUIRE(crucible::ParseMemoryMb("Mi").get_error() ==
          ResourceParseError::kMalformed);
  REQUIRE(crucible::ParseMemoryMb("-5Mi").get_error() ==
          ResourceParseError::kMalformed);
  REQUIRE(crucible::ParseMemoryMb("99999999Ti").get_error() ==
          ResourceParseError::kOutOfRange);
}

TEST_CASE("ParseCpuMillicores", "[resources]") {
  REQUIRE(crucible::ParseCpuMillicores("500m").value() == 500U);
  REQUIRE(crucible::ParseCpuMillicores("2").value() == 2000U);
  REQUIRE(crucible::ParseCpuMillicores("0.25").value() == 250U);
  REQUIRE(crucible::ParseCpuMillicores("m").get_error() ==
          ResourceParseError::kMalformed);
  REQUIRE(crucible::ParseCpuMillicores("two").get_error() ==
          ResourceParseError::kMalformed);
}

// ============================================================================
// Validation
// ============================================================================

namespace {

crucible::EvaluationRequest MakeRequest() {
  crucible::EvaluationRequest req;
  req.id = "eval-1";
  req.code = "print(1)";
  req.resources.memory_mb = 128;
  req.resources.cpu_millicores = 100;
  req.resources.timeout_s = 30;
  return req;
}

}  // namespace

TEST_CASE("ValidateRequest accepts a well-formed request", "[resources]") {
  crucible::NodeLimits limits;
  REQUIRE(crucible::ValidateRequest(MakeRequest(), limits).has_value());
}

TEST_CASE("ValidateRequest rejects impossible requests", "[resources]") {
  crucible::NodeLimits limits;

  auto req = MakeRequest();
  req.id.clear();
  REQUIRE(crucible::ValidateRequest(req, limits).get_error() ==
          ValidationFailure::kMissingId);

  req = MakeRequest();
  req.id = "../etc/passwd";
  REQUIRE(crucible::ValidateRequest(req, limits).get_error() ==
          ValidationFailure::kInvalidId);

  req = MakeRequest();
  req.code.clear();
  REQUIRE(crucible::ValidateRequest(req, limits).get_error() ==
          ValidationFailure::kEmptyCode);

  req = MakeRequest();
  req.language = "cobol";
  REQUIRE(crucible::ValidateRequest(req, limits).get_error() ==
          ValidationFailure::kUnsupportedLanguage);

  req = MakeRequest();
  req.code.assign(limits.max_code_bytes + 1U, 'x');
  REQUIRE(crucible::ValidateRequest(req, limits).get_error() ==
          ValidationFailure::kCodeTooLarge);

  req = MakeRequest();
  req.resources.memory_mb = limits.max_memory_mb + 1U;
  REQUIRE(crucible::ValidateRequest(req, limits).get_error() ==
          ValidationFailure::kMemoryExceedsNode);

  req = MakeRequest();
  req.resources.cpu_millicores = limits.max_cpu_millicores + 1U;
  REQUIRE(crucible::ValidateRequest(req, limits).get_error() ==
          ValidationFailure::kCpuExceedsNode);

  req = MakeRequest();
  req.resources.timeout_s = limits.max_timeout_s + 1U;
  REQUIRE(crucible::ValidateRequest(req, limits).get_error() ==
          ValidationFailure::kTimeoutExceedsLimit);
}

TEST_CASE("Limits are inclusive", "[resources]") {
  crucible::NodeLimits limits;
  auto req = MakeRequest();
  req.resources.memory_mb = limits.max_memory_mb;
  req.resources.cpu_millicores = limits.max_cpu_millicores;
  req.resources.timeout_s = limits.max_timeout_s;
  REQUIRE(crucible::ValidateRequest(req, limits).has_value());
}

TEST_CASE("IsValidEvaluationId", "[resources]") {
  REQUIRE(crucible::IsValidEvaluationId("abc-123_x.y"));
  REQUIRE(!crucible::IsValidEvaluationId(".."));
  REQUIRE(!crucible::IsValidEvaluationId("a b"));
  REQUIRE(!crucible::IsValidEvaluationId("a/b"));
  REQUIRE(!crucible::IsValidEvaluationId(std::string(129, 'a')));
  REQUIRE(crucible::IsValidEvaluationId(std::string(128, 'a')));
}

TEST_CASE("ApplyResourceDefaults fills only zero fields", "[resources]") {
  crucible::NodeLimits limits;
  crucible::ResourceRequirements res;
  res.memory_mb = 64;
  crucible::ApplyResourceDefaults(res, limits);
  REQUIRE(res.memory_mb == 64U);
  REQUIRE(res.cpu_millicores == limits.default_cpu_millicores);
  REQUIRE(res.timeout_s == limits.default_timeout_s);
}

// ============================================================================
// Priority
// ============================================================================

TEST_CASE("NormalizePriority maps legacy values", "[resources][priority]") {
  REQUIRE(crucible::NormalizePriority(-1) == 150);
  REQUIRE(crucible::NormalizePriority(0) == 250);
  REQUIRE(crucible::NormalizePriority(1) == 350);
  REQUIRE(crucible::NormalizePriority(1000) == 1000);
}

TEST_CASE("Priority classes and lanes", "[resources][priority]") {
  REQUIRE(std::strcmp(crucible::PriorityClassName(2000), "critical-priority") ==
          0);
  REQUIRE(std::strcmp(crucible::PriorityClassName(250),
                      "test-normal-priority-evaluation") == 0);
  REQUIRE(std::strcmp(crucible::PriorityClassName(10),
                      "low-priority-evaluation") == 0);
  REQUIRE(std::strcmp(crucible::PriorityLane(1500), "high_priority") == 0);
  REQUIRE(std::strcmp(crucible::PriorityLane(250), "evaluation") == 0);
  REQUIRE(std::strcmp(crucible::PriorityLane(150), "low_priority") == 0);
}
