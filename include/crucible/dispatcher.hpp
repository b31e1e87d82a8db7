/**
 * @file dispatcher.hpp
 * @brief Capacity-aware dispatcher: admits evaluations, creates sandboxed
 *        execution units and supervises them to exactly one terminal
 *        outcome.
 *
 * Execute() is synchronous and never waits for the unit to finish:
 *
 *   validate -> TryClaim slot -> CreateUnit -> publish provisioning -> Watch
 *
 * Supervision is driven by two inputs:
 *   - UnitSignals from the provider (started, completion status, exit code,
 *     watch lost), delivered on provider threads
 *   - Tick(), called periodically from a TimerScheduler: deadlines, grace
 *     escalation, exit-code join window, watch re-establishment
 *
 * Per unit, a terminal guard (atomic exchange) lets exactly one of natural
 * completion, deadline, cancel or infrastructure failure publish the
 * terminal signal. The slot is released exactly once, after the unit is
 * known to be gone (or after forced termination could not be confirmed).
 *
 * The provider is never called while the unit table or a unit record is
 * locked, so a provider may deliver signals synchronously.
 */

#ifndef CRUCIBLE_DISPATCHER_HPP_
#define CRUCIBLE_DISPATCHER_HPP_

#include "crucible/capacity_manager.hpp"
#include "crucible/evaluation.hpp"
#include "crucible/event_bus.hpp"
#include "crucible/log.hpp"
#include "crucible/resources.hpp"
#include "crucible/sandbox.hpp"
#include "crucible/timer.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace crucible {

// ============================================================================
// Configuration
// ============================================================================

struct DispatcherConfig {
  NodeLimits limits;
  uint32_t tick_ms = 50;
  uint32_t grace_low_risk_ms = 10000;
  uint32_t grace_medium_risk_ms = 3000;
  uint32_t grace_high_risk_ms = 1000;
  uint32_t exit_code_join_ms = 2000;
  uint32_t force_kill_confirm_ms = 2000;
  uint32_t watch_retry_base_ms = 200;
  uint32_t watch_retry_max_ms = 5000;
  uint32_t watch_retry_budget_ms = 30000;

  /// @brief Grace window after a stop request; shorter for riskier code.
  uint32_t GraceMs(RiskLevel risk) const noexcept {
    switch (risk) {
      case RiskLevel::kLow:
        return grace_low_risk_ms;
      case RiskLevel::kMedium:
        return grace_medium_risk_ms;
      case RiskLevel::kHigh:
        return grace_high_risk_ms;
    }
    return grace_high_risk_ms;
  }
};

// ============================================================================
// Results
// ============================================================================

enum class DispatchError : uint8_t {
  kValidation = 0,   ///< Impossible or malformed request. Never retried.
  kCapacityExceeded, ///< Possible but not now. Retryable.
  kInfrastructure,   ///< Provider failed to create the unit. Retryable.
  kDuplicate,        ///< Evaluation id already dispatched.
  kNotFound,
  kAlreadyTerminal,
};

inline const char* DispatchErrorName(DispatchError e) noexcept {
  switch (e) {
    case DispatchError::kValidation:
      return "validation";
    case DispatchError::kCapacityExceeded:
      return "capacity_exceeded";
    case DispatchError::kInfrastructure:
      return "infrastructure";
    case DispatchError::kDuplicate:
      return "duplicate";
    case DispatchError::kNotFound:
      return "not_found";
    case DispatchError::kAlreadyTerminal:
      return "already_terminal";
  }
  return "unknown";
}

struct Accepted {
  std::string evaluation_id;
  std::string unit_ref;
  std::string output_ref;
};

/// @brief Synchronous rejection. reason points to static storage.
struct Rejection {
  DispatchError kind;
  bool retryable;
  const char* reason;
};

struct DispatcherStatistics {
  uint64_t accepted;
  uint64_t rejected_validation;
  uint64_t rejected_capacity;
  uint64_t rejected_infrastructure;
  uint64_t completed;
  uint64_t failed;
  uint64_t timeouts;
  uint64_t cancelled;
  uint64_t infrastructure_failures;
  uint64_t exit_code_unknown;
  uint64_t duplicate_signals;
  uint64_t watch_retries;
  uint64_t forced_kills;
  uint64_t unconfirmed_kills;
  uint64_t slot_releases;
};

// ============================================================================
// Dispatcher
// ============================================================================

class Dispatcher final {
 public:
  Dispatcher(const DispatcherConfig& cfg, CapacityManager& capacity,
             SandboxProvider& provider, EventBus& bus)
      : cfg_(cfg),
        capacity_(capacity),
        provider_(provider),
        bus_(bus),
        gate_(std::make_shared<SignalGate>()) {}

  ~Dispatcher() { Shutdown(); }

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  // --------------------------------------------------------------------------
  // Supervision clock
  // --------------------------------------------------------------------------

  /** @brief Register Tick() as a periodic task on @p timer. */
  expected<void, TimerError> Start(TimerScheduler& timer) {
    if (timer_ != nullptr) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    auto id = timer.Add(cfg_.tick_ms, &Dispatcher::TickThunk, this);
    if (!id) return expected<void, TimerError>::error(id.get_error());
    timer_ = &timer;
    tick_task_ = id.value();
    return expected<void, TimerError>::success();
  }

  /** @brief Unregister from the timer and wait for a running Tick(). */
  void Stop() {
    if (timer_ != nullptr) {
      (void)timer_->Remove(tick_task_);
      timer_ = nullptr;
    }
    std::lock_guard<std::mutex> wait_tick(tick_mutex_);
  }

  /**
   * @brief Stop supervision, detach from provider callbacks and force-kill
   *        every live unit. No lifecycle events are published.
   */
  void Shutdown() {
    Stop();
    gate_->lock.lock();
    gate_->open = false;
    gate_->lock.unlock();

    std::vector<std::shared_ptr<Unit>> live;
    {
      std::lock_guard<std::mutex> lock(units_mutex_);
      for (auto& kv : active_) live.push_back(kv.second);
      active_.clear();
    }
    for (auto& unit : live) {
      (void)provider_.Terminate(unit->handle, TerminateMode::kForce);
      provider_.Cleanup(unit->handle);
      if (!unit->slot_released.exchange(true, std::memory_order_acq_rel)) {
        (void)capacity_.Release(unit->slot);
      }
    }
    if (!live.empty()) {
      CRUCIBLE_LOG_WARN("Dispatch", "shutdown killed %zu live unit(s)",
                        live.size());
    }
  }

  // --------------------------------------------------------------------------
  // Admission
  // --------------------------------------------------------------------------

  /**
   * @brief Admit one evaluation.
   *
   * Validation failures (including requests larger than the whole pool)
   * are non-retryable. Capacity exhaustion and unit creation failures are
   * retryable.
   */
  expected<Accepted, Rejection> Execute(const EvaluationRequest& request) {
    using R = expected<Accepted, Rejection>;
    EvaluationRequest req = request;
    ApplyResourceDefaults(req.resources, cfg_.limits);

    auto valid = ValidateRequest(req, cfg_.limits);
    if (!valid) {
      rejected_validation_.fetch_add(1, std::memory_order_relaxed);
      const char* why = ValidationFailureName(valid.get_error());
      CRUCIBLE_LOG_INFO("Dispatch", "%s rejected: %s", req.id.c_str(), why);
      return R::error(Rejection{DispatchError::kValidation, false, why});
    }

    if (IsKnown(req.id)) {
      return R::error(Rejection{DispatchError::kDuplicate, false,
                                "evaluation already dispatched"});
    }

    auto claim = capacity_.TryClaim(req.id, req.resources);
    if (!claim) {
      switch (claim.get_error()) {
        case CapacityError::kCapacityExceeded:
          rejected_capacity_.fetch_add(1, std::memory_order_relaxed);
          CRUCIBLE_LOG_DEBUG("Dispatch", "%s: capacity exceeded",
                             req.id.c_str());
          return R::error(Rejection{DispatchError::kCapacityExceeded, true,
                                    "capacity exceeded"});
        case CapacityError::kExceedsTotal:
          rejected_validation_.fetch_add(1, std::memory_order_relaxed);
          return R::error(Rejection{DispatchError::kValidation, false,
                                    "request exceeds total pool capacity"});
        case CapacityError::kDuplicateEvaluation:
          return R::error(Rejection{DispatchError::kDuplicate, false,
                                    "evaluation already dispatched"});
      }
    }
    const SlotHandle slot = claim.value();

    UnitSpec spec;
    spec.evaluation_id = req.id;
    spec.code = req.code;
    spec.language = req.language;
    spec.image = req.image;
    spec.resources = req.resources;
    spec.risk = req.risk;

    auto created = provider_.CreateUnit(spec);
    if (!created) {
      (void)capacity_.Release(slot);
      const ProviderError pe = created.get_error();
      CRUCIBLE_LOG_WARN("Dispatch", "%s: %s create failed: %s", req.id.c_str(),
                        provider_.Name(), ProviderErrorName(pe));
      if (pe == ProviderError::kInvalidSpec) {
        rejected_validation_.fetch_add(1, std::memory_order_relaxed);
        return R::error(Rejection{DispatchError::kValidation, false,
                                  "sandbox cannot run this request"});
      }
      rejected_infrastructure_.fetch_add(1, std::memory_order_relaxed);
      return R::error(Rejection{DispatchError::kInfrastructure, true,
                                ProviderErrorName(pe)});
    }

    auto unit = std::make_shared<Unit>();
    unit->evaluation_id = req.id;
    unit->handle = created.value();
    unit->slot = slot;
    unit->priority = req.priority;
    unit->grace_ms = cfg_.GraceMs(req.risk);
    unit->timeout_s = req.resources.timeout_s;
    unit->created_us = SteadyNowUs();
    unit->deadline_us =
        unit->created_us + static_cast<uint64_t>(req.resources.timeout_s) *
                               1000000ULL;
    {
      std::lock_guard<std::mutex> lock(units_mutex_);
      active_[req.id] = unit;
      handles_[req.id] = unit->handle;
    }
    accepted_.fetch_add(1, std::memory_order_relaxed);

    // Authoritative early signal, before any watch report.
    LifecycleEvent prov = MakeSignal(*unit, EvaluationStatus::kProvisioning);
    prov.priority = req.priority;
    bus_.PublishReliable(std::move(prov));

    CRUCIBLE_LOG_INFO("Dispatch", "%s -> unit %s (slot %u, %s risk, grace %ums)",
                      req.id.c_str(), unit->handle.unit_id.c_str(), slot.index,
                      RiskLevelName(req.risk), unit->grace_ms);

    auto watched = provider_.Watch(unit->handle, MakeSink(req.id));
    if (!watched) {
      CRUCIBLE_LOG_WARN("Dispatch", "%s: initial watch failed (%s), retrying",
                        req.id.c_str(), ProviderErrorName(watched.get_error()));
      std::lock_guard<std::mutex> lock(unit->mutex);
      MarkWatchLost(*unit, SteadyNowUs());
    }

    return R::success(
        Accepted{req.id, unit->handle.unit_id, unit->handle.output_ref});
  }

  // --------------------------------------------------------------------------
  // Cancellation
  // --------------------------------------------------------------------------

  /**
   * @brief Cancel an in-flight evaluation.
   *
   * If the unit already settled (naturally or by deadline) this is a no-op
   * returning kAlreadyTerminal.
   */
  expected<void, DispatchError> Cancel(const std::string& evaluation_id) {
    std::shared_ptr<Unit> unit = FindActive(evaluation_id);
    if (!unit) {
      return expected<void, DispatchError>::error(
          IsKnown(evaluation_id) ? DispatchError::kAlreadyTerminal
                                 : DispatchError::kNotFound);
    }
    if (!ClaimTerminal(*unit)) {
      return expected<void, DispatchError>::error(
          DispatchError::kAlreadyTerminal);
    }
    LifecycleEvent ev = MakeSignal(*unit, EvaluationStatus::kCancelled);
    ev.reason = TerminationReason::kCancelledByUser;
    ev.detail = "cancelled by user";
    bus_.PublishReliable(std::move(ev));
    cancelled_.fetch_add(1, std::memory_order_relaxed);
    CRUCIBLE_LOG_INFO("Dispatch", "%s cancelled", evaluation_id.c_str());

    if (MarkPublished(*unit)) {
      ReleaseUnit(unit);
    } else {
      BeginStop(unit);
    }
    return expected<void, DispatchError>::success();
  }

  // --------------------------------------------------------------------------
  // Supervision tick
  // --------------------------------------------------------------------------

  static void TickThunk(void* ctx) { static_cast<Dispatcher*>(ctx)->Tick(); }

  /**
   * @brief One supervision pass over all live units.
   */
  void Tick() {
    std::lock_guard<std::mutex> tick_lock(tick_mutex_);
    std::vector<std::shared_ptr<Unit>> live;
    {
      std::lock_guard<std::mutex> lock(units_mutex_);
      live.reserve(active_.size());
      for (auto& kv : active_) live.push_back(kv.second);
    }

    const uint64_t now = SteadyNowUs();
    for (auto& unit : live) {
      TickAction action = TickAction::kNone;
      {
        std::lock_guard<std::mutex> lock(unit->mutex);
        action = NextAction(*unit, now);
      }
      switch (action) {
        case TickAction::kNone:
          break;
        case TickAction::kDeadline:
          OnDeadline(unit);
          break;
        case TickAction::kForceKill:
          ForceKill(unit);
          break;
        case TickAction::kGiveUp:
          unconfirmed_kills_.fetch_add(1, std::memory_order_relaxed);
          CRUCIBLE_LOG_ERROR("Dispatch",
                             "%s: unit %s did not confirm exit after "
                             "SIGKILL, releasing slot",
                             unit->evaluation_id.c_str(),
                             unit->handle.unit_id.c_str());
          ReleaseUnit(unit);
          break;
        case TickAction::kJoinExpired:
          FinalizeNatural(unit);
          break;
        case TickAction::kRetryWatch:
          RetryWatch(unit);
          break;
        case TickAction::kWatchBudgetSpent:
          FailInfrastructure(unit);
          break;
      }
    }
  }

  // --------------------------------------------------------------------------
  // Query
  // --------------------------------------------------------------------------

  /**
   * @brief Best-effort output of a dispatched evaluation.
   * @return kUnitNotFound for ids never dispatched, kNotYetAvailable when the
   *         backend has nothing yet.
   */
  expected<std::string, ProviderError> FetchLogs(
      const std::string& evaluation_id) {
    UnitHandle handle;
    {
      std::lock_guard<std::mutex> lock(units_mutex_);
      auto it = handles_.find(evaluation_id);
      if (it == handles_.end()) {
        return expected<std::string, ProviderError>::error(
            ProviderError::kUnitNotFound);
      }
      handle = it->second;
    }
    return provider_.FetchLogs(handle);
  }

  bool IsActive(const std::string& evaluation_id) const {
    std::lock_guard<std::mutex> lock(units_mutex_);
    return active_.find(evaluation_id) != active_.end();
  }

  uint32_t ActiveCount() const {
    std::lock_guard<std::mutex> lock(units_mutex_);
    return static_cast<uint32_t>(active_.size());
  }

  const DispatcherConfig& Config() const noexcept { return cfg_; }

  /// @brief Totals of the capacity pool this dispatcher admits against.
  CapacityLimits PoolLimits() const noexcept { return capacity_.Limits(); }

  DispatcherStatistics GetStatistics() const noexcept {
    DispatcherStatistics s;
    s.accepted = accepted_.load(std::memory_order_relaxed);
    s.rejected_validation = rejected_validation_.load(std::memory_order_relaxed);
    s.rejected_capacity = rejected_capacity_.load(std::memory_order_relaxed);
    s.rejected_infrastructure =
        rejected_infrastructure_.load(std::memory_order_relaxed);
    s.completed = completed_.load(std::memory_order_relaxed);
    s.failed = failed_.load(std::memory_order_relaxed);
    s.timeouts = timeouts_.load(std::memory_order_relaxed);
    s.cancelled = cancelled_.load(std::memory_order_relaxed);
    s.infrastructure_failures =
        infrastructure_failures_.load(std::memory_order_relaxed);
    s.exit_code_unknown = exit_code_unknown_.load(std::memory_order_relaxed);
    s.duplicate_signals = duplicate_signals_.load(std::memory_order_relaxed);
    s.watch_retries = watch_retries_.load(std::memory_order_relaxed);
    s.forced_kills = forced_kills_.load(std::memory_order_relaxed);
    s.unconfirmed_kills = unconfirmed_kills_.load(std::memory_order_relaxed);
    s.slot_releases = slot_releases_.load(std::memory_order_relaxed);
    return s;
  }

 private:
  enum class Phase : uint8_t {
    kRunning = 0,
    kStopping,  ///< Graceful stop sent, waiting for grace to elapse.
    kForced,    ///< Kill sent, waiting for exit confirmation.
  };

  enum class TickAction : uint8_t {
    kNone = 0,
    kDeadline,
    kForceKill,
    kGiveUp,
    kJoinExpired,
    kRetryWatch,
    kWatchBudgetSpent,
  };

  /// Supervision record of one unit. Fields below mutex are guarded by it.
  struct Unit {
    std::string evaluation_id;
    UnitHandle handle;
    SlotHandle slot;
    int32_t priority = 0;
    uint32_t grace_ms = 0;
    uint32_t timeout_s = 0;
    uint64_t created_us = 0;
    uint64_t deadline_us = 0;
    std::atomic<bool> terminal_claimed{false};
    std::atomic<bool> slot_released{false};

    std::mutex mutex;
    bool terminal_published = false;  ///< Winner's terminal event is out.
    Phase phase = Phase::kRunning;
    uint64_t phase_deadline_us = 0;
    bool started_reported = false;
    bool exited = false;
    bool completion_seen = false;
    bool native_succeeded = false;
    bool oom_killed = false;
    std::string native_detail;
    bool exit_seen = false;
    ExitInfo exit;
    uint64_t first_outcome_us = 0;
    bool watch_lost = false;
    uint64_t watch_lost_since_us = 0;
    uint64_t next_watch_retry_us = 0;
    uint32_t watch_attempt = 0;
  };

  /// Closed on shutdown so late provider callbacks never reach a dead
  /// dispatcher.
  struct SignalGate {
    detail::SharedSpinLock lock;
    bool open = true;
  };

  /// Terminal verdict computed from the observed channels.
  struct Verdict {
    EvaluationStatus status;
    TerminationReason reason;
    ExitInfo exit;
    std::string detail;
  };

  // ------------------------------------------------------------------------
  // Signal intake
  // ------------------------------------------------------------------------

  UnitSignalFn MakeSink(const std::string& evaluation_id) {
    std::shared_ptr<SignalGate> gate = gate_;
    Dispatcher* self = this;
    return [gate, self, evaluation_id](const UnitSignal& sig) {
      gate->lock.lock_shared();
      if (gate->open) self->OnSignal(evaluation_id, sig);
      gate->lock.unlock_shared();
    };
  }

  void OnSignal(const std::string& evaluation_id, const UnitSignal& sig) {
    std::shared_ptr<Unit> unit = FindActive(evaluation_id);
    if (!unit) {
      duplicate_signals_.fetch_add(1, std::memory_order_relaxed);
      CRUCIBLE_LOG_DEBUG("Dispatch", "%s: %s signal after settlement ignored",
                         evaluation_id.c_str(), UnitSignalKindName(sig.kind));
      return;
    }

    const uint64_t now = SteadyNowUs();
    bool publish_running = false;
    bool both_channels = false;
    bool gone = false;
    {
      std::lock_guard<std::mutex> lock(unit->mutex);
      switch (sig.kind) {
        case UnitSignalKind::kStarted:
          if (unit->started_reported) {
            duplicate_signals_.fetch_add(1, std::memory_order_relaxed);
          } else {
            unit->started_reported = true;
            publish_running = !unit->exited;
          }
          break;
        case UnitSignalKind::kCompletionStatus:
          if (unit->completion_seen) {
            duplicate_signals_.fetch_add(1, std::memory_order_relaxed);
            if (unit->native_succeeded != sig.succeeded) {
              CRUCIBLE_LOG_WARN("Dispatch",
                                "%s: conflicting completion status (%s after "
                                "%s) discarded",
                                evaluation_id.c_str(),
                                sig.succeeded ? "success" : "failure",
                                unit->native_succeeded ? "success" : "failure");
            }
          } else {
            unit->completion_seen = true;
            unit->native_succeeded = sig.succeeded;
            unit->oom_killed = sig.oom_killed;
            unit->native_detail = sig.detail;
            if (unit->first_outcome_us == 0) unit->first_outcome_us = now;
          }
          break;
        case UnitSignalKind::kExitCode:
          if (unit->exit_seen) {
            duplicate_signals_.fetch_add(1, std::memory_order_relaxed);
            if (unit->exit.exit_code != sig.exit_code) {
              CRUCIBLE_LOG_WARN("Dispatch",
                                "%s: conflicting exit code %d after %d "
                                "discarded",
                                evaluation_id.c_str(), sig.exit_code,
                                unit->exit.exit_code);
            }
          } else {
            unit->exit_seen = true;
            unit->exit = ExitInfo::FromCode(sig.exit_code);
            unit->exit.term_signal = sig.term_signal;
            if (unit->first_outcome_us == 0) unit->first_outcome_us = now;
          }
          break;
        case UnitSignalKind::kWatchLost:
          if (!unit->exited && !unit->watch_lost) {
            CRUCIBLE_LOG_WARN("Dispatch", "%s: watch stream lost (%s)",
                              evaluation_id.c_str(), sig.detail.c_str());
            MarkWatchLost(*unit, now);
          }
          break;
      }
      if (sig.kind != UnitSignalKind::kWatchLost) {
        // Any signal proves the stream is alive again.
        unit->watch_lost = false;
      }
      unit->exited = unit->completion_seen || unit->exit_seen;
      both_channels = unit->completion_seen && unit->exit_seen;
      gone = unit->exited;
    }

    if (publish_running &&
        !unit->terminal_claimed.load(std::memory_order_acquire)) {
      bus_.PublishReliable(MakeSignal(*unit, EvaluationStatus::kRunning));
    }
    if (both_channels) {
      FinalizeNatural(unit);
    } else if (gone && unit->terminal_claimed.load(std::memory_order_acquire)) {
      // Settled by deadline/cancel; the unit is now confirmed gone.
      ReleaseIfSettled(unit);
    }
  }

  // ------------------------------------------------------------------------
  // Terminal decisions
  // ------------------------------------------------------------------------

  bool ClaimTerminal(Unit& unit) noexcept {
    return !unit.terminal_claimed.exchange(true, std::memory_order_acq_rel);
  }

  /**
   * Winner side, after its terminal event is on the bus.
   * @return true if the unit is already gone and the caller frees the slot.
   */
  bool MarkPublished(Unit& unit) {
    std::lock_guard<std::mutex> lock(unit.mutex);
    unit.terminal_published = true;
    return unit.exited;
  }

  /// Loser side: free the slot only after the winner's terminal event is out.
  /// Otherwise the winner's MarkPublished() sees the unit gone and frees it.
  void ReleaseIfSettled(const std::shared_ptr<Unit>& unit) {
    bool ready = false;
    {
      std::lock_guard<std::mutex> lock(unit->mutex);
      ready = unit->terminal_published && unit->exited;
    }
    if (ready) ReleaseUnit(unit);
  }

  /**
   * Decide from the native completion status when present; the exit code
   * is reported as observed and never inferred from the status.
   */
  static Verdict Decide(const Unit& u) {
    Verdict v;
    v.exit = u.exit_seen ? u.exit : ExitInfo{};
    bool ok = false;
    if (u.completion_seen) {
      ok = u.native_succeeded;
    } else {
      ok = u.exit.exit_code == 0 && u.exit.term_signal == 0;
    }
    v.status = ok ? EvaluationStatus::kCompleted : EvaluationStatus::kFailed;

    if (ok) {
      v.reason = TerminationReason::kSuccess;
    } else if (u.oom_killed) {
      v.reason = TerminationReason::kOutOfMemory;
    } else if (u.exit_seen && u.exit.term_signal != 0) {
      v.reason = TerminationReason::kKilledBySignal;
    } else if (u.exit_seen) {
      v.reason = TerminationReason::kNonZeroExit;
    } else {
      v.reason = TerminationReason::kNone;
    }

    if (u.exit_seen) {
      v.detail = DescribeExitCode(u.exit.exit_code);
    } else {
      v.detail = "exit code unknown";
      if (!u.native_detail.empty()) v.detail += ": " + u.native_detail;
    }
    return v;
  }

  void FinalizeNatural(const std::shared_ptr<Unit>& unit) {
    if (!ClaimTerminal(*unit)) {
      ReleaseIfSettled(unit);
      return;
    }
    Verdict v;
    {
      std::lock_guard<std::mutex> lock(unit->mutex);
      v = Decide(*unit);
    }
    if (!v.exit.Known()) {
      exit_code_unknown_.fetch_add(1, std::memory_order_relaxed);
    }
    if (v.status == EvaluationStatus::kCompleted) {
      completed_.fetch_add(1, std::memory_order_relaxed);
    } else {
      failed_.fetch_add(1, std::memory_order_relaxed);
    }
    LifecycleEvent ev = MakeSignal(*unit, v.status);
    ev.reason = v.reason;
    ev.exit = v.exit;
    ev.detail = v.detail;
    bus_.PublishReliable(std::move(ev));
    CRUCIBLE_LOG_INFO("Dispatch", "%s %s (%s)", unit->evaluation_id.c_str(),
                      StatusName(v.status), v.detail.c_str());
    (void)MarkPublished(*unit);
    ReleaseUnit(unit);
  }

  void OnDeadline(const std::shared_ptr<Unit>& unit) {
    if (ClaimTerminal(*unit)) {
      LifecycleEvent ev = MakeSignal(*unit, EvaluationStatus::kTimeout);
      ev.reason = TerminationReason::kDeadlineExceeded;
      ev.detail = "exceeded timeout of " + std::to_string(unit->timeout_s) + "s";
      bus_.PublishReliable(std::move(ev));
      timeouts_.fetch_add(1, std::memory_order_relaxed);
      CRUCIBLE_LOG_WARN("Dispatch", "%s timed out after %us, stopping unit",
                        unit->evaluation_id.c_str(), unit->timeout_s);
      if (MarkPublished(*unit)) {
        // Exited while the timeout was being published.
        ReleaseUnit(unit);
        return;
      }
    }
    BeginStop(unit);
  }

  void FailInfrastructure(const std::shared_ptr<Unit>& unit) {
    if (ClaimTerminal(*unit)) {
      LifecycleEvent ev = MakeSignal(*unit, EvaluationStatus::kFailed);
      ev.reason = TerminationReason::kInfrastructure;
      ev.detail = "watch stream lost for more than " +
                  std::to_string(cfg_.watch_retry_budget_ms) + "ms";
      bus_.PublishReliable(std::move(ev));
      infrastructure_failures_.fetch_add(1, std::memory_order_relaxed);
      failed_.fetch_add(1, std::memory_order_relaxed);
      CRUCIBLE_LOG_ERROR("Dispatch", "%s failed: unit %s unobservable",
                         unit->evaluation_id.c_str(),
                         unit->handle.unit_id.c_str());
      (void)MarkPublished(*unit);
    }
    // The unit cannot be observed any more: kill it blind and free the slot.
    (void)provider_.Terminate(unit->handle, TerminateMode::kForce);
    ReleaseUnit(unit);
  }

  // ------------------------------------------------------------------------
  // Stop escalation
  // ------------------------------------------------------------------------

  void BeginStop(const std::shared_ptr<Unit>& unit) {
    {
      std::lock_guard<std::mutex> lock(unit->mutex);
      if (unit->phase != Phase::kRunning) return;
      unit->phase = Phase::kStopping;
      unit->phase_deadline_us =
          SteadyNowUs() + static_cast<uint64_t>(unit->grace_ms) * 1000ULL;
    }
    if (unit->grace_ms == 0U) {
      ForceKill(unit);
      return;
    }
    auto r = provider_.Terminate(unit->handle, TerminateMode::kGraceful);
    if (!r && r.get_error() != ProviderError::kAlreadyExited) {
      CRUCIBLE_LOG_WARN("Dispatch", "%s: graceful stop failed: %s",
                        unit->evaluation_id.c_str(),
                        ProviderErrorName(r.get_error()));
    }
  }

  void ForceKill(const std::shared_ptr<Unit>& unit) {
    {
      std::lock_guard<std::mutex> lock(unit->mutex);
      if (unit->phase == Phase::kForced) return;
      unit->phase = Phase::kForced;
      unit->phase_deadline_us =
          SteadyNowUs() +
          static_cast<uint64_t>(cfg_.force_kill_confirm_ms) * 1000ULL;
    }
    forced_kills_.fetch_add(1, std::memory_order_relaxed);
    auto r = provider_.Terminate(unit->handle, TerminateMode::kForce);
    if (!r && r.get_error() != ProviderError::kAlreadyExited) {
      CRUCIBLE_LOG_WARN("Dispatch", "%s: force kill failed: %s",
                        unit->evaluation_id.c_str(),
                        ProviderErrorName(r.get_error()));
    }
    CRUCIBLE_LOG_INFO("Dispatch", "%s: grace expired, unit %s killed",
                      unit->evaluation_id.c_str(),
                      unit->handle.unit_id.c_str());
  }

  // ------------------------------------------------------------------------
  // Watch recovery
  // ------------------------------------------------------------------------

  void MarkWatchLost(Unit& unit, uint64_t now) {
    unit.watch_lost = true;
    unit.watch_lost_since_us = now;
    unit.watch_attempt = 0;
    unit.next_watch_retry_us =
        now + static_cast<uint64_t>(cfg_.watch_retry_base_ms) * 1000ULL;
  }

  uint64_t WatchBackoffMs(uint32_t attempt) const noexcept {
    uint64_t delay = cfg_.watch_retry_base_ms;
    for (uint32_t i = 0; i < attempt && delay < cfg_.watch_retry_max_ms; ++i) {
      delay *= 2U;
    }
    return (delay > cfg_.watch_retry_max_ms) ? cfg_.watch_retry_max_ms : delay;
  }

  void RetryWatch(const std::shared_ptr<Unit>& unit) {
    watch_retries_.fetch_add(1, std::memory_order_relaxed);
    auto r = provider_.Watch(unit->handle, MakeSink(unit->evaluation_id));
    std::lock_guard<std::mutex> lock(unit->mutex);
    if (r) {
      CRUCIBLE_LOG_INFO("Dispatch", "%s: watch re-established",
                        unit->evaluation_id.c_str());
      unit->watch_lost = false;
      unit->watch_attempt = 0;
      return;
    }
    ++unit->watch_attempt;
    unit->next_watch_retry_us =
        SteadyNowUs() + WatchBackoffMs(unit->watch_attempt) * 1000ULL;
    CRUCIBLE_LOG_WARN("Dispatch", "%s: watch retry %u failed: %s",
                      unit->evaluation_id.c_str(), unit->watch_attempt,
                      ProviderErrorName(r.get_error()));
  }

  /// Caller holds unit.mutex.
  TickAction NextAction(const Unit& unit, uint64_t now) const {
    const bool settled = unit.terminal_claimed.load(std::memory_order_acquire);
    if (settled && unit.exited) return TickAction::kNone;
    if (unit.phase == Phase::kForced) {
      return (now >= unit.phase_deadline_us) ? TickAction::kGiveUp
                                             : TickAction::kNone;
    }
    if (unit.phase == Phase::kStopping) {
      return (now >= unit.phase_deadline_us) ? TickAction::kForceKill
                                             : TickAction::kNone;
    }
    if (!settled && unit.exited && unit.first_outcome_us != 0 &&
        now >= unit.first_outcome_us +
                   static_cast<uint64_t>(cfg_.exit_code_join_ms) * 1000ULL) {
      return TickAction::kJoinExpired;
    }
    if (!settled && !unit.exited && now >= unit.deadline_us) {
      return TickAction::kDeadline;
    }
    if (unit.watch_lost && !unit.exited) {
      if (now >= unit.watch_lost_since_us +
                     static_cast<uint64_t>(cfg_.watch_retry_budget_ms) *
                         1000ULL) {
        return TickAction::kWatchBudgetSpent;
      }
      if (now >= unit.next_watch_retry_us) return TickAction::kRetryWatch;
    }
    return TickAction::kNone;
  }

  // ------------------------------------------------------------------------
  // Slot release
  // ------------------------------------------------------------------------

  void ReleaseUnit(const std::shared_ptr<Unit>& unit) {
    if (unit->slot_released.exchange(true, std::memory_order_acq_rel)) return;
    (void)capacity_.Release(unit->slot);
    slot_releases_.fetch_add(1, std::memory_order_relaxed);
    {
      std::lock_guard<std::mutex> lock(units_mutex_);
      auto it = active_.find(unit->evaluation_id);
      if (it != active_.end() && it->second == unit) active_.erase(it);
    }
    provider_.Cleanup(unit->handle);
    CRUCIBLE_LOG_DEBUG("Dispatch", "%s: slot %u released",
                       unit->evaluation_id.c_str(), unit->slot.index);
  }

  // ------------------------------------------------------------------------
  // Helpers
  // ------------------------------------------------------------------------

  LifecycleEvent MakeSignal(const Unit& unit, EvaluationStatus status) const {
    LifecycleEvent ev;
    ev.evaluation_id = unit.evaluation_id;
    ev.type = status;
    ev.origin = EventOrigin::kSignal;
    ev.timestamp_us = SteadyNowUs();
    ev.unit_ref = unit.handle.unit_id;
    ev.output_ref = unit.handle.output_ref;
    ev.priority = unit.priority;
    return ev;
  }

  std::shared_ptr<Unit> FindActive(const std::string& evaluation_id) const {
    std::lock_guard<std::mutex> lock(units_mutex_);
    auto it = active_.find(evaluation_id);
    return (it == active_.end()) ? nullptr : it->second;
  }

  bool IsKnown(const std::string& evaluation_id) const {
    std::lock_guard<std::mutex> lock(units_mutex_);
    return handles_.find(evaluation_id) != handles_.end();
  }

  const DispatcherConfig cfg_;
  CapacityManager& capacity_;
  SandboxProvider& provider_;
  EventBus& bus_;
  std::shared_ptr<SignalGate> gate_;

  TimerScheduler* timer_ = nullptr;
  TimerTaskId tick_task_{0};
  std::mutex tick_mutex_;

  mutable std::mutex units_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Unit>> active_;
  std::unordered_map<std::string, UnitHandle> handles_;  ///< Never erased.

  std::atomic<uint64_t> accepted_{0};
  std::atomic<uint64_t> rejected_validation_{0};
  std::atomic<uint64_t> rejected_capacity_{0};
  std::atomic<uint64_t> rejected_infrastructure_{0};
  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> timeouts_{0};
  std::atomic<uint64_t> cancelled_{0};
  std::atomic<uint64_t> infrastructure_failures_{0};
  std::atomic<uint64_t> exit_code_unknown_{0};
  std::atomic<uint64_t> duplicate_signals_{0};
  std::atomic<uint64_t> watch_retries_{0};
  std::atomic<uint64_t> forced_kills_{0};
  std::atomic<uint64_t> unconfirmed_kills_{0};
  std::atomic<uint64_t> slot_releases_{0};
};

}  // namespace crucible

#endif  // CRUCIBLE_DISPATCHER_HPP_
