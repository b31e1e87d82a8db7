/**
 * @file api.hpp
 * @brief Dispatcher HTTP API: request decoding, routing and JSON responses.
 *
 * Routes:
 *   POST   /execute             direct dispatch: 202 | 429 (retryable) | 400
 *   POST   /evaluations         enqueue through the task router: 202
 *   DELETE /evaluations/{id}    cancel (queued or in flight)
 *   GET    /status/{id}         lifecycle state, history, exit outcome
 *   GET    /logs/{id}           best-effort output; "not yet available" is 200
 *   GET    /health
 *   GET    /capacity
 *   GET    /running             claimed slots and their owners
 *   GET    /dead-letters        evaluations the router gave up on
 *
 * Bodies are parsed with exceptions disabled (parse(..., nullptr, false)),
 * and all field access is type-checked, so malformed input is always a 400.
 */

#ifndef CRUCIBLE_API_HPP_
#define CRUCIBLE_API_HPP_

#include "crucible/capacity_manager.hpp"
#include "crucible/dispatcher.hpp"
#include "crucible/evaluation.hpp"
#include "crucible/http_server.hpp"
#include "crucible/log.hpp"
#include "crucible/resources.hpp"
#include "crucible/state_machine.hpp"
#include "crucible/task_router.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <string>
#include <utility>

namespace crucible {

// ============================================================================
// Request Decoding
// ============================================================================

enum class RequestError : uint8_t {
  kMalformedJson = 0,
  kNotAnObject,
  kBadId,
  kBadCode,
  kBadLanguage,
  kBadTimeout,
  kBadMemory,
  kBadCpu,
  kBadPriority,
  kBadRisk,
  kBadImage,
};

inline const char* RequestErrorName(RequestError e) noexcept {
  switch (e) {
    case RequestError::kMalformedJson:
      return "body is not valid JSON";
    case RequestError::kNotAnObject:
      return "body must be a JSON object";
    case RequestError::kBadId:
      return "eval_id must be a string";
    case RequestError::kBadCode:
      return "code must be a string";
    case RequestError::kBadLanguage:
      return "language must be a string";
    case RequestError::kBadTimeout:
      return "timeout must be a positive integer";
    case RequestError::kBadMemory:
      return "memory_limit must be a quantity like 512Mi or a number of MB";
    case RequestError::kBadCpu:
      return "cpu_limit must be a quantity like 500m or a number of millicores";
    case RequestError::kBadPriority:
      return "priority must be an integer";
    case RequestError::kBadRisk:
      return "risk_level must be low, medium or high";
    case RequestError::kBadImage:
      return "executor_image must be a string";
  }
  return "invalid request";
}

namespace detail {

inline const nlohmann::json* FindField(const nlohmann::json& obj,
                                       const char* a, const char* b = nullptr,
                                       const char* c = nullptr) {
  for (const char* key : {a, b, c}) {
    if (key == nullptr) continue;
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null()) return &*it;
  }
  return nullptr;
}

/// Numbers are MB; strings are quantities ("512Mi", "1Gi").
inline bool DecodeMemory(const nlohmann::json& v, uint32_t& out) {
  if (v.is_number_unsigned()) {
    if (v.get<uint64_t>() > UINT32_MAX) return false;
    out = static_cast<uint32_t>(v.get<uint64_t>());
    return true;
  }
  if (v.is_string()) {
    auto r = ParseMemoryMb(v.get_ref<const std::string&>().c_str());
    if (!r) return false;
    out = r.value();
    return true;
  }
  return false;
}

/// Numbers are millicores; strings are quantities ("500m", "0.5", "2").
inline bool DecodeCpu(const nlohmann::json& v, uint32_t& out) {
  if (v.is_number_unsigned()) {
    if (v.get<uint64_t>() > UINT32_MAX) return false;
    out = static_cast<uint32_t>(v.get<uint64_t>());
    return true;
  }
  if (v.is_string()) {
    auto r = ParseCpuMillicores(v.get_ref<const std::string&>().c_str());
    if (!r) return false;
    out = r.value();
    return true;
  }
  return false;
}

}  // namespace detail

/**
 * @brief Decode an evaluation request body.
 *
 * Only the shape is checked here; limits are enforced by ValidateRequest().
 * Omitted resources stay 0 and receive node defaults later.
 */
inline expected<EvaluationRequest, RequestError> DecodeEvaluationRequest(
    const std::string& body) {
  using R = expected<EvaluationRequest, RequestError>;
  const nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded()) return R::error(RequestError::kMalformedJson);
  if (!j.is_object()) return R::error(RequestError::kNotAnObject);

  EvaluationRequest req;
  if (const auto* v = detail::FindField(j, "eval_id", "evaluation_id", "id")) {
    if (!v->is_string()) return R::error(RequestError::kBadId);
    req.id = v->get<std::string>();
  }
  if (const auto* v = detail::FindField(j, "code")) {
    if (!v->is_string()) return R::error(RequestError::kBadCode);
    req.code = v->get<std::string>();
  }
  if (const auto* v = detail::FindField(j, "language")) {
    if (!v->is_string()) return R::error(RequestError::kBadLanguage);
    req.language = v->get<std::string>();
  }
  if (const auto* v = detail::FindField(j, "executor_image", "image")) {
    if (!v->is_string()) return R::error(RequestError::kBadImage);
    req.image = v->get<std::string>();
  }

  const nlohmann::json* res = detail::FindField(j, "resources");
  const nlohmann::json& src = (res != nullptr && res->is_object()) ? *res : j;

  if (const auto* v = detail::FindField(src, "timeout", "timeout_seconds",
                                        "timeout_s")) {
    if (!v->is_number_unsigned() || v->get<uint64_t>() == 0 ||
        v->get<uint64_t>() > UINT32_MAX) {
      return R::error(RequestError::kBadTimeout);
    }
    req.resources.timeout_s = static_cast<uint32_t>(v->get<uint64_t>());
  }
  if (const auto* v = detail::FindField(src, "memory_limit", "memory_mb",
                                        "memory")) {
    if (!detail::DecodeMemory(*v, req.resources.memory_mb)) {
      return R::error(RequestError::kBadMemory);
    }
  }
  if (const auto* v = detail::FindField(src, "cpu_limit", "cpu_millicores",
                                        "cpu")) {
    if (!detail::DecodeCpu(*v, req.resources.cpu_millicores)) {
      return R::error(RequestError::kBadCpu);
    }
  }

  if (const auto* v = detail::FindField(j, "priority")) {
    if (!v->is_number_integer()) return R::error(RequestError::kBadPriority);
    const int64_t p = v->get<int64_t>();
    if (p < INT32_MIN || p > INT32_MAX) {
      return R::error(RequestError::kBadPriority);
    }
    req.priority = NormalizePriority(static_cast<int32_t>(p));
  }

  if (const auto* v = detail::FindField(j, "risk_level", "risk")) {
    if (!v->is_string()) return R::error(RequestError::kBadRisk);
    auto risk = ParseRiskLevel(v->get_ref<const std::string&>().c_str());
    if (!risk.has_value()) return R::error(RequestError::kBadRisk);
    req.risk = risk.value();
  }
  return R::success(std::move(req));
}

// ============================================================================
// Response Encoding
// ============================================================================

inline nlohmann::json ExitToJson(const ExitInfo& exit) {
  nlohmann::json j;
  j["exit_code_known"] = exit.Known();
  if (exit.Known()) {
    j["exit_code"] = exit.exit_code;
    j["description"] = DescribeExitCode(exit.exit_code);
  } else {
    j["exit_code"] = nullptr;
    j["description"] = "exit code unknown";
  }
  if (exit.term_signal != 0) j["signal"] = exit.term_signal;
  return j;
}

inline nlohmann::json SnapshotToJson(const EvaluationSnapshot& s) {
  nlohmann::json j;
  j["evaluation_id"] = s.id;
  j["status"] = StatusName(s.status);
  j["terminal"] = IsTerminal(s.status);
  j["priority"] = s.priority;
  j["priority_class"] = PriorityClassName(s.priority);
  j["version"] = s.version;
  j["created_us"] = s.created_us;
  j["started_us"] = (s.started_us != 0) ? nlohmann::json(s.started_us)
                                         : nlohmann::json(nullptr);
  j["completed_us"] = (s.completed_us != 0) ? nlohmann::json(s.completed_us)
                                             : nlohmann::json(nullptr);
  if (!s.unit_ref.empty()) j["unit_ref"] = s.unit_ref;
  if (!s.output_ref.empty()) j["output_ref"] = s.output_ref;

  nlohmann::json history = nlohmann::json::array();
  for (const TransitionRecord& t : s.history) {
    history.push_back({{"status", StatusName(t.status)}, {"at_us", t.at_us}});
  }
  j["history"] = std::move(history);

  if (IsTerminal(s.status)) {
    nlohmann::json outcome = ExitToJson(s.exit);
    outcome["reason"] = TerminationReasonName(s.reason);
    outcome["detail"] = s.detail;
    j["outcome"] = std::move(outcome);
  }
  return j;
}

inline HttpResponse JsonResponse(int32_t status, const nlohmann::json& body) {
  HttpResponse rsp;
  rsp.status = status;
  // Logs and details carry bytes printed by untrusted code.
  rsp.body = body.dump(-1, ' ', false,
                       nlohmann::json::error_handler_t::replace);
  return rsp;
}

inline HttpResponse ErrorResponse(int32_t status, const char* error,
                                  const char* detail, bool retryable = false) {
  nlohmann::json j;
  j["error"] = error;
  j["detail"] = detail;
  j["retryable"] = retryable;
  return JsonResponse(status, j);
}

// ============================================================================
// DispatcherApi
// ============================================================================

/**
 * @brief Routes HTTP requests to the orchestration core.
 *
 * Holds references only; every component must outlive the API object.
 */
class DispatcherApi final {
 public:
  DispatcherApi(Dispatcher& dispatcher, TaskRouter& router,
                StateMachine& lifecycle, CapacityManager& capacity)
      : dispatcher_(dispatcher),
        router_(router),
        lifecycle_(lifecycle),
        capacity_(capacity) {}

  DispatcherApi(const DispatcherApi&) = delete;
  DispatcherApi& operator=(const DispatcherApi&) = delete;

  HttpResponse Handle(const HttpRequest& req) {
    const std::string& p = req.path;
    if (p == "/execute") {
      return (req.method == "POST") ? Execute(req.body) : NotAllowed();
    }
    if (p == "/evaluations") {
      return (req.method == "POST") ? Enqueue(req.body) : NotAllowed();
    }
    if (p == "/health") {
      return (req.method == "GET") ? Health() : NotAllowed();
    }
    if (p == "/capacity") {
      return (req.method == "GET") ? Capacity() : NotAllowed();
    }
    if (p == "/running") {
      return (req.method == "GET") ? Running() : NotAllowed();
    }
    if (p == "/dead-letters") {
      return (req.method == "GET") ? DeadLetters() : NotAllowed();
    }

    std::string id;
    if (MatchPrefix(p, "/status/", id)) {
      return (req.method == "GET") ? Status(id) : NotAllowed();
    }
    if (MatchPrefix(p, "/logs/", id)) {
      return (req.method == "GET") ? Logs(id, TailLines(req.query))
                                   : NotAllowed();
    }
    if (MatchPrefix(p, "/evaluations/", id)) {
      if (req.method == "DELETE") return Cancel(id);
      if (req.method == "GET") return Status(id);
      return NotAllowed();
    }
    return ErrorResponse(404, "not_found", "no such route");
  }

  /**
   * @brief POST /execute. Synchronous admission; never waits for the unit.
   */
  HttpResponse Execute(const std::string& body) {
    auto decoded = DecodeEvaluationRequest(body);
    if (!decoded) {
      return ErrorResponse(400, "invalid_request",
                           RequestErrorName(decoded.get_error()));
    }
    auto r = dispatcher_.Execute(decoded.value());
    if (!r) {
      const Rejection& rej = r.get_error();
      switch (rej.kind) {
        case DispatchError::kCapacityExceeded:
          return ErrorResponse(429, DispatchErrorName(rej.kind), rej.reason,
                               true);
        case DispatchError::kInfrastructure:
          return ErrorResponse(503, DispatchErrorName(rej.kind), rej.reason,
                               true);
        case DispatchError::kDuplicate:
          return ErrorResponse(409, DispatchErrorName(rej.kind), rej.reason);
        default:
          return ErrorResponse(400, DispatchErrorName(rej.kind), rej.reason);
      }
    }
    const Accepted& acc = r.value();
    nlohmann::json j;
    j["eval_id"] = acc.evaluation_id;
    j["unit_ref"] = acc.unit_ref;
    j["output_ref"] = acc.output_ref;
    j["status"] = StatusName(EvaluationStatus::kProvisioning);
    return JsonResponse(202, j);
  }

  /** @brief POST /evaluations. Queued work is reported as "queued". */
  HttpResponse Enqueue(const std::string& body) {
    auto decoded = DecodeEvaluationRequest(body);
    if (!decoded) {
      return ErrorResponse(400, "invalid_request",
                           RequestErrorName(decoded.get_error()));
    }
    const std::string id = decoded.value().id;
    auto r = router_.Submit(decoded.value());
    if (!r) {
      const RouterRejection& rej = r.get_error();
      switch (rej.kind) {
        case RouterError::kDuplicate:
          return ErrorResponse(409, RouterErrorName(rej.kind), rej.reason);
        case RouterError::kShuttingDown:
          return ErrorResponse(503, RouterErrorName(rej.kind), rej.reason,
                               true);
        default:
          return ErrorResponse(400, RouterErrorName(rej.kind), rej.reason);
      }
    }
    nlohmann::json j;
    j["eval_id"] = id;
    j["status"] = StatusName(EvaluationStatus::kQueued);
    j["queue_depth"] = router_.QueueDepth();
    return JsonResponse(202, j);
  }

  /** @brief DELETE /evaluations/{id}. */
  HttpResponse Cancel(const std::string& id) {
    auto r = router_.Cancel(id);
    if (!r) {
      if (r.get_error() == RouterError::kNotFound) {
        return ErrorResponse(404, "not_found", "unknown evaluation");
      }
      nlohmann::json j;
      j["eval_id"] = id;
      j["cancelled"] = false;
      auto status = lifecycle_.StatusOf(id);
      if (status.has_value()) j["status"] = StatusName(status.value());
      j["detail"] = "evaluation already reached a terminal state";
      return JsonResponse(409, j);
    }
    nlohmann::json j;
    j["eval_id"] = id;
    j["cancelled"] = true;
    j["stage"] = (r.value() == CancelOutcome::kRemovedFromQueue) ? "queued"
                                                                  : "in_flight";
    return JsonResponse(200, j);
  }

  /**
   * @brief GET /status/{id}.
   *
   * A unit that was just admitted through /execute may not be committed to
   * the lifecycle registry yet; it is reported as provisioning.
   */
  HttpResponse Status(const std::string& id) {
    auto snap = lifecycle_.Get(id);
    if (snap.has_value()) return JsonResponse(200, SnapshotToJson(snap.value()));
    if (dispatcher_.IsActive(id)) {
      nlohmann::json j;
      j["evaluation_id"] = id;
      j["status"] = StatusName(EvaluationStatus::kProvisioning);
      j["terminal"] = false;
      return JsonResponse(200, j);
    }
    return ErrorResponse(404, "not_found", "unknown evaluation");
  }

  /**
   * @brief GET /logs/{id}[?tail_lines=N].
   *
   * "Not yet available" is a successful response with available=false, so
   * clients never mistake a lagging log pipeline for a failed evaluation.
   */
  HttpResponse Logs(const std::string& id, uint32_t tail_lines = 0) {
    auto logs = dispatcher_.FetchLogs(id);
    nlohmann::json j;
    j["eval_id"] = id;
    auto status = lifecycle_.StatusOf(id);
    if (status.has_value()) j["status"] = StatusName(status.value());

    if (logs) {
      j["available"] = true;
      j["logs"] = (tail_lines == 0U) ? logs.value()
                                     : TailOf(logs.value(), tail_lines);
      return JsonResponse(200, j);
    }
    switch (logs.get_error()) {
      case ProviderError::kNotYetAvailable:
        j["available"] = false;
        j["message"] = "logs not yet available";
        return JsonResponse(200, j);
      case ProviderError::kUnitNotFound:
        if (status.has_value()) {
          // Known but never dispatched (queued, cancelled in queue, ...).
          j["available"] = false;
          j["message"] = "evaluation has no execution unit";
          return JsonResponse(200, j);
        }
        return ErrorResponse(404, "not_found", "unknown evaluation");
      default:
        return ErrorResponse(503, "logs_unavailable",
                             ProviderErrorName(logs.get_error()), true);
    }
  }

  HttpResponse Health() {
    nlohmann::json j;
    j["status"] = "healthy";
    j["active_units"] = dispatcher_.ActiveCount();
    j["queue_depth"] = router_.QueueDepth();
    return JsonResponse(200, j);
  }

  HttpResponse Capacity() {
    const CapacitySnapshot s = capacity_.Snapshot();
    const DispatcherStatistics d = dispatcher_.GetStatistics();
    const RouterStatistics r = router_.GetStatistics();
    nlohmann::json j;
    j["slots"] = {{"total", s.total_slots}, {"free", s.free_slots}};
    j["memory_mb"] = {{"total", s.total_memory_mb},
                      {"free", s.free_memory_mb}};
    j["cpu_millicores"] = {{"total", s.total_cpu_millicores},
                           {"free", s.free_cpu_millicores}};
    j["claims"] = s.claims;
    j["rejections"] = s.rejections;
    j["releases"] = s.releases;
    j["double_releases"] = s.double_releases;
    j["dispatcher"] = {{"accepted", d.accepted},
                       {"completed", d.completed},
                       {"failed", d.failed},
                       {"timeouts", d.timeouts},
                       {"cancelled", d.cancelled},
                       {"exit_code_unknown", d.exit_code_unknown},
                       {"duplicate_signals", d.duplicate_signals}};
    j["router"] = {{"queue_depth", r.queue_depth},
                   {"retries", r.retries},
                   {"dead_lettered", r.dead_lettered}};
    return JsonResponse(200, j);
  }

  /** @brief GET /running. One entry per claimed slot. */
  HttpResponse Running() {
    const uint64_t now = SteadyNowUs();
    nlohmann::json units = nlohmann::json::array();
    for (const ActiveClaim& c : capacity_.ActiveClaims()) {
      nlohmann::json u;
      u["eval_id"] = c.evaluation_id;
      u["slot"] = c.handle.index;
      u["memory_mb"] = c.memory_mb;
      u["cpu_millicores"] = c.cpu_millicores;
      u["claimed_at_us"] = c.claimed_at_us;
      u["running_ms"] =
          (now > c.claimed_at_us) ? (now - c.claimed_at_us) / 1000U : 0U;
      auto status = lifecycle_.StatusOf(c.evaluation_id);
      if (status.has_value()) u["status"] = StatusName(status.value());
      units.push_back(std::move(u));
    }
    nlohmann::json j;
    j["count"] = units.size();
    j["running"] = std::move(units);
    return JsonResponse(200, j);
  }

  /** @brief GET /dead-letters. Evaluations the router gave up on. */
  HttpResponse DeadLetters() {
    nlohmann::json entries = nlohmann::json::array();
    for (const DeadLetter& d : router_.DeadLetters()) {
      nlohmann::json e;
      e["eval_id"] = d.evaluation_id;
      e["attempts"] = d.attempts;
      e["reason"] = TerminationReasonName(d.reason);
      e["detail"] = d.detail;
      e["submitted_us"] = d.submitted_us;
      e["dead_us"] = d.dead_us;
      entries.push_back(std::move(e));
    }
    nlohmann::json j;
    j["count"] = entries.size();
    j["dead_letters"] = std::move(entries);
    return JsonResponse(200, j);
  }

 private:
  static HttpResponse NotAllowed() {
    return ErrorResponse(405, "method_not_allowed", "method not allowed");
  }

  static bool MatchPrefix(const std::string& path, const char* prefix,
                          std::string& rest) {
    const std::string pre(prefix);
    if (path.size() <= pre.size() || path.compare(0, pre.size(), pre) != 0) {
      return false;
    }
    rest = path.substr(pre.size());
    return rest.find('/') == std::string::npos;
  }

  static uint32_t TailLines(const std::string& query) {
    const std::string key = "tail_lines=";
    size_t pos = 0;
    while (pos < query.size()) {
      size_t amp = query.find('&', pos);
      if (amp == std::string::npos) amp = query.size();
      if (query.compare(pos, key.size(), key) == 0) {
        const std::string v = query.substr(pos + key.size(),
                                           amp - pos - key.size());
        char* end = nullptr;
        const unsigned long n = std::strtoul(v.c_str(), &end, 10);
        if (end != v.c_str() && *end == '\0' && n <= UINT32_MAX) {
          return static_cast<uint32_t>(n);
        }
        return 0U;
      }
      pos = amp + 1;
    }
    return 0U;
  }

  static std::string TailOf(const std::string& text, uint32_t lines) {
    size_t end = text.size();
    if (end > 0 && text[end - 1] == '\n') --end;
    size_t pos = end;
    uint32_t seen = 0;
    while (pos > 0) {
      if (text[pos - 1] == '\n' && ++seen == lines) break;
      --pos;
    }
    return text.substr(pos);
  }

  Dispatcher& dispatcher_;
  TaskRouter& router_;
  StateMachine& lifecycle_;
  CapacityManager& capacity_;
};

}  // namespace crucible

#endif  // CRUCIBLE_API_HPP_
