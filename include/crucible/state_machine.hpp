/**
 * @file state_machine.hpp
 * @brief Evaluation lifecycle state machine and per-evaluation registry.
 *
 * Hierarchy (built on crucible::Hsm):
 *
 *   Active                      Terminal (absorbing)
 *   +-- Queued                  +-- Completed
 *   +-- Provisioning            +-- Failed
 *   +-- Running                 +-- Timeout
 *                               +-- Cancelled
 *
 * The statuses form a monotonic lattice. An event moves an evaluation only
 * to a strictly higher rank, so a fast job whose "completed" signal
 * overtakes its "provisioning" signal lands in Completed and the late
 * "provisioning" is rejected. An event for the current non-terminal status
 * is an idempotent duplicate. Once Terminal is entered, every further event
 * is discarded: the first terminal event wins.
 *
 * Each evaluation is guarded by its own mutex; different evaluations never
 * share a lock beyond a brief shard lookup.
 */

#ifndef CRUCIBLE_STATE_MACHINE_HPP_
#define CRUCIBLE_STATE_MACHINE_HPP_

#include "crucible/evaluation.hpp"
#include "crucible/event_bus.hpp"
#include "crucible/hsm.hpp"
#include "crucible/log.hpp"
#include "crucible/platform.hpp"
#include "crucible/vocabulary.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#ifndef CRUCIBLE_LIFECYCLE_SHARDS
#define CRUCIBLE_LIFECYCLE_SHARDS 16U
#endif

namespace crucible {

// ============================================================================
// Outcomes
// ============================================================================

enum class TransitionOutcome : uint8_t {
  kApplied = 0,
  kDuplicate,          ///< Same non-terminal status again; no-op.
  kInvalidTransition,  ///< Backward move; rejected.
  kAlreadyTerminal,    ///< Evaluation already settled; discarded.
  kUnknownEvaluation,  ///< No record and the event cannot create one.
};

inline const char* TransitionOutcomeName(TransitionOutcome o) noexcept {
  switch (o) {
    case TransitionOutcome::kApplied:
      return "applied";
    case TransitionOutcome::kDuplicate:
      return "duplicate";
    case TransitionOutcome::kInvalidTransition:
      return "invalid_transition";
    case TransitionOutcome::kAlreadyTerminal:
      return "already_terminal";
    case TransitionOutcome::kUnknownEvaluation:
      return "unknown_evaluation";
  }
  return "unknown";
}

enum class LifecycleError : uint8_t {
  kAlreadyExists = 0,
  kInvalidId,
};

struct LifecycleStatistics {
  uint64_t registered;
  uint64_t applied;
  uint64_t duplicates;
  uint64_t invalid_transitions;
  uint64_t late_terminal;
  uint64_t unknown;
};

// ============================================================================
// Lifecycle HSM
// ============================================================================

namespace detail {

struct LifecycleContext;

static constexpr uint32_t kLifecycleMaxStates = 9U;
using LifecycleTable = StateTable<LifecycleContext, kLifecycleMaxStates>;
using LifecycleHsm = Hsm<LifecycleContext, kLifecycleMaxStates>;

/// Per-evaluation HSM context: the record plus the event being applied.
struct LifecycleContext {
  LifecycleHsm* sm = nullptr;
  EvaluationSnapshot data;
  const LifecycleEvent* event = nullptr;
  TransitionOutcome outcome = TransitionOutcome::kApplied;
};

struct LifecycleStates {
  int32_t active = -1;
  int32_t terminal = -1;
  int32_t by_status[kEvaluationStatusCount] = {-1, -1, -1, -1, -1, -1, -1};
};

struct LifecycleGraph {
  LifecycleTable table;
  LifecycleStates states;
};

inline LifecycleGraph& Graph() noexcept;

inline HandlerResult ActiveHandler(LifecycleContext& ctx,
                                   const HsmEvent& ev) noexcept {
  const auto target = static_cast<EvaluationStatus>(ev.id);
  const EvaluationStatus current = ctx.data.status;
  if (target == current) {
    ctx.outcome = TransitionOutcome::kDuplicate;
    return HandlerResult::kHandled;
  }
  if (StatusRank(target) > StatusRank(current)) {
    ctx.outcome = TransitionOutcome::kApplied;
    return ctx.sm->RequestTransition(
        Graph().states.by_status[static_cast<uint32_t>(target)]);
  }
  ctx.outcome = TransitionOutcome::kInvalidTransition;
  return HandlerResult::kHandled;
}

inline HandlerResult TerminalHandler(LifecycleContext& ctx,
                                     const HsmEvent&) noexcept {
  ctx.outcome = TransitionOutcome::kAlreadyTerminal;
  return HandlerResult::kHandled;
}

template <EvaluationStatus S>
void EnterStatus(LifecycleContext& ctx) noexcept {
  EvaluationSnapshot& d = ctx.data;
  const uint64_t now = (ctx.event != nullptr && ctx.event->timestamp_us != 0)
                           ? ctx.event->timestamp_us
                           : SteadyNowUs();
  d.status = S;
  ++d.version;
  d.history.push_back(TransitionRecord{S, now});
  if (ctx.event == nullptr) return;
  if (!ctx.event->unit_ref.empty()) d.unit_ref = ctx.event->unit_ref;
  if (!ctx.event->output_ref.empty()) d.output_ref = ctx.event->output_ref;
  if (S == EvaluationStatus::kRunning) d.started_us = now;
}

inline void EnterTerminal(LifecycleContext& ctx) noexcept {
  EvaluationSnapshot& d = ctx.data;
  if (ctx.event == nullptr) return;
  d.completed_us = (ctx.event->timestamp_us != 0) ? ctx.event->timestamp_us
                                                  : SteadyNowUs();
  d.exit = ctx.event->exit;
  d.reason = ctx.event->reason;
  d.detail = ctx.event->detail;
}

inline bool BuildGraph(LifecycleGraph& g) noexcept {
  auto& t = g.table;
  auto& s = g.states;
  s.active = t.AddState({"Active", -1, ActiveHandler, nullptr, nullptr});
  s.terminal =
      t.AddState({"Terminal", -1, TerminalHandler, EnterTerminal, nullptr});
  auto idx = [](EvaluationStatus st) { return static_cast<uint32_t>(st); };
  s.by_status[idx(EvaluationStatus::kQueued)] =
      t.AddState({"Queued", s.active, nullptr,
                  EnterStatus<EvaluationStatus::kQueued>, nullptr});
  s.by_status[idx(EvaluationStatus::kProvisioning)] =
      t.AddState({"Provisioning", s.active, nullptr,
                  EnterStatus<EvaluationStatus::kProvisioning>, nullptr});
  s.by_status[idx(EvaluationStatus::kRunning)] =
      t.AddState({"Running", s.active, nullptr,
                  EnterStatus<EvaluationStatus::kRunning>, nullptr});
  s.by_status[idx(EvaluationStatus::kCompleted)] =
      t.AddState({"Completed", s.terminal, nullptr,
                  EnterStatus<EvaluationStatus::kCompleted>, nullptr});
  s.by_status[idx(EvaluationStatus::kFailed)] =
      t.AddState({"Failed", s.terminal, nullptr,
                  EnterStatus<EvaluationStatus::kFailed>, nullptr});
  s.by_status[idx(EvaluationStatus::kTimeout)] =
      t.AddState({"Timeout", s.terminal, nullptr,
                  EnterStatus<EvaluationStatus::kTimeout>, nullptr});
  s.by_status[idx(EvaluationStatus::kCancelled)] =
      t.AddState({"Cancelled", s.terminal, nullptr,
                  EnterStatus<EvaluationStatus::kCancelled>, nullptr});
  return t.StateCount() == kLifecycleMaxStates;
}

/// Shared lifecycle graph, built once on first use.
inline LifecycleGraph& Graph() noexcept {
  static LifecycleGraph graph;
  static const bool built = BuildGraph(graph);
  CRUCIBLE_ASSERT(built);
  (void)built;
  return graph;
}

}  // namespace detail

// ============================================================================
// StateMachine
// ============================================================================

/**
 * @brief Sole writer of evaluation status.
 *
 * Raw supervision signals arrive through the event bus (AttachToBus) or
 * directly through Apply(). Every accepted transition is republished on the
 * bus as a committed event carrying the record version as sequence_hint.
 */
class StateMachine final {
 public:
  explicit StateMachine(EventBus& bus) : bus_(bus) {}

  ~StateMachine() { DetachFromBus(); }

  StateMachine(const StateMachine&) = delete;
  StateMachine& operator=(const StateMachine&) = delete;

  /** @brief Consume raw signals from the bus. */
  void AttachToBus() {
    if (subscription_.IsValid()) return;
    subscription_ = bus_.Subscribe(
        TopicFilter::Signals(),
        [this](const LifecycleEvent& ev) { (void)Apply(ev); });
  }

  void DetachFromBus() {
    if (subscription_.IsValid()) {
      (void)bus_.Unsubscribe(subscription_);
      subscription_ = SubscriptionHandle::Invalid();
    }
  }

  /**
   * @brief Create the record for a newly submitted evaluation in Queued.
   */
  expected<void, LifecycleError> Register(const std::string& id,
                                          int32_t priority) {
    if (id.empty()) {
      return expected<void, LifecycleError>::error(LifecycleError::kInvalidId);
    }
    LifecycleEvent committed;
    {
      Shard& shard = ShardFor(id);
      std::lock_guard<std::mutex> lock(shard.mutex);
      if (shard.records.find(id) != shard.records.end()) {
        return expected<void, LifecycleError>::error(
            LifecycleError::kAlreadyExists);
      }
      auto rec = CreateRecord(id, priority, nullptr);
      committed = MakeCommitted(rec->ctx.data, nullptr);
      shard.records.emplace(id, std::move(rec));
    }
    registered_.fetch_add(1, std::memory_order_relaxed);
    CRUCIBLE_LOG_DEBUG("Lifecycle", "%s registered (priority %d)", id.c_str(),
                       priority);
    bus_.PublishReliable(std::move(committed));
    return expected<void, LifecycleError>::success();
  }

  /**
   * @brief Apply one lifecycle signal.
   *
   * Signals for unknown evaluations create the record when they are
   * queued/provisioning (work admitted without prior registration); any
   * other status for an unknown id is discarded.
   */
  TransitionOutcome Apply(const LifecycleEvent& event) {
    Record* rec = Lookup(event.evaluation_id);
    if (rec == nullptr) {
      if (event.type != EvaluationStatus::kQueued &&
          event.type != EvaluationStatus::kProvisioning) {
        unknown_.fetch_add(1, std::memory_order_relaxed);
        CRUCIBLE_LOG_WARN("Lifecycle", "%s event for unknown evaluation %s",
                          StatusName(event.type),
                          event.evaluation_id.c_str());
        return TransitionOutcome::kUnknownEvaluation;
      }
      bool created = false;
      rec = LookupOrCreate(event.evaluation_id, event.priority, created);
      if (created) {
        LifecycleEvent queued;
        {
          std::lock_guard<std::mutex> lock(rec->mutex);
          queued = MakeCommitted(rec->ctx.data, nullptr);
        }
        bus_.PublishReliable(std::move(queued));
        if (event.type == EvaluationStatus::kQueued) {
          applied_.fetch_add(1, std::memory_order_relaxed);
          return TransitionOutcome::kApplied;
        }
      }
    }

    TransitionOutcome outcome;
    EvaluationStatus from;
    LifecycleEvent committed;
    {
      std::lock_guard<std::mutex> lock(rec->mutex);
      from = rec->ctx.data.status;
      rec->ctx.event = &event;
      rec->ctx.outcome = TransitionOutcome::kApplied;
      (void)rec->sm.Dispatch(
          HsmEvent{static_cast<uint32_t>(event.type), &event});
      rec->ctx.event = nullptr;
      outcome = rec->ctx.outcome;
      if (outcome == TransitionOutcome::kApplied) {
        committed = MakeCommitted(rec->ctx.data, &event);
      }
    }

    switch (outcome) {
      case TransitionOutcome::kApplied:
        applied_.fetch_add(1, std::memory_order_relaxed);
        CRUCIBLE_LOG_DEBUG("Lifecycle", "%s %s -> %s",
                           event.evaluation_id.c_str(), StatusName(from),
                           StatusName(event.type));
        bus_.PublishReliable(std::move(committed));
        break;
      case TransitionOutcome::kDuplicate:
        duplicates_.fetch_add(1, std::memory_order_relaxed);
        break;
      case TransitionOutcome::kInvalidTransition:
        invalid_.fetch_add(1, std::memory_order_relaxed);
        CRUCIBLE_LOG_WARN("Lifecycle", "invalid transition %s: %s -> %s",
                          event.evaluation_id.c_str(), StatusName(from),
                          StatusName(event.type));
        break;
      case TransitionOutcome::kAlreadyTerminal:
        late_terminal_.fetch_add(1, std::memory_order_relaxed);
        CRUCIBLE_LOG_WARN("Lifecycle",
                          "%s already %s, discarding late %s event",
                          event.evaluation_id.c_str(), StatusName(from),
                          StatusName(event.type));
        break;
      case TransitionOutcome::kUnknownEvaluation:
        break;
    }
    return outcome;
  }

  /**
   * @brief Settle a non-terminal evaluation as cancelled.
   */
  TransitionOutcome Cancel(const std::string& id, const std::string& detail) {
    LifecycleEvent ev;
    ev.evaluation_id = id;
    ev.type = EvaluationStatus::kCancelled;
    ev.reason = TerminationReason::kCancelledByUser;
    ev.detail = detail;
    ev.timestamp_us = SteadyNowUs();
    return Apply(ev);
  }

  // --------------------------------------------------------------------------
  // Query
  // --------------------------------------------------------------------------

  optional<EvaluationSnapshot> Get(const std::string& id) const {
    Record* rec = Lookup(id);
    if (rec == nullptr) return {};
    std::lock_guard<std::mutex> lock(rec->mutex);
    return rec->ctx.data;
  }

  optional<EvaluationStatus> StatusOf(const std::string& id) const {
    Record* rec = Lookup(id);
    if (rec == nullptr) return {};
    std::lock_guard<std::mutex> lock(rec->mutex);
    return rec->ctx.data.status;
  }

  bool IsTerminalNow(const std::string& id) const {
    auto s = StatusOf(id);
    return s.has_value() && IsTerminal(s.value());
  }

  /// @brief Number of tracked evaluations per status.
  std::vector<uint32_t> CountByStatus() const {
    std::vector<uint32_t> counts(kEvaluationStatusCount, 0U);
    for (const Shard& shard : shards_) {
      std::lock_guard<std::mutex> lock(shard.mutex);
      for (const auto& kv : shard.records) {
        std::lock_guard<std::mutex> rlock(kv.second->mutex);
        ++counts[static_cast<uint32_t>(kv.second->ctx.data.status)];
      }
    }
    return counts;
  }

  LifecycleStatistics GetStatistics() const noexcept {
    return LifecycleStatistics{
        registered_.load(std::memory_order_relaxed),
        applied_.load(std::memory_order_relaxed),
        duplicates_.load(std::memory_order_relaxed),
        invalid_.load(std::memory_order_relaxed),
        late_terminal_.load(std::memory_order_relaxed),
        unknown_.load(std::memory_order_relaxed)};
  }

 private:
  struct Record {
    explicit Record(const detail::LifecycleTable& table) : sm(table, ctx) {
      ctx.sm = &sm;
    }
    mutable std::mutex mutex;
    detail::LifecycleContext ctx;
    detail::LifecycleHsm sm;
  };

  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::unique_ptr<Record>> records;
  };

  static std::unique_ptr<Record> CreateRecord(const std::string& id,
                                              int32_t priority,
                                              const LifecycleEvent* ev) {
    detail::LifecycleGraph& g = detail::Graph();
    std::unique_ptr<Record> rec(new Record(g.table));
    rec->ctx.data.id = id;
    rec->ctx.data.priority = priority;
    rec->ctx.data.created_us = SteadyNowUs();
    rec->ctx.event = ev;
    rec->sm.Start(
        g.states.by_status[static_cast<uint32_t>(EvaluationStatus::kQueued)]);
    rec->ctx.event = nullptr;
    return rec;
  }

  static LifecycleEvent MakeCommitted(const EvaluationSnapshot& d,
                                      const LifecycleEvent* source) {
    LifecycleEvent ev;
    ev.evaluation_id = d.id;
    ev.type = d.status;
    ev.origin = EventOrigin::kCommitted;
    ev.timestamp_us = d.history.empty() ? SteadyNowUs() : d.history.back().at_us;
    ev.sequence_hint = d.version;
    ev.exit = d.exit;
    ev.reason = d.reason;
    ev.detail = (source != nullptr) ? source->detail : d.detail;
    ev.output_ref = d.output_ref;
    ev.unit_ref = d.unit_ref;
    ev.priority = d.priority;
    return ev;
  }

  Shard& ShardFor(const std::string& id) const noexcept {
    return shards_[Fnv1a32(id.c_str()) % CRUCIBLE_LIFECYCLE_SHARDS];
  }

  /// Records are never erased, so the pointer stays valid after unlock.
  Record* Lookup(const std::string& id) const {
    Shard& shard = ShardFor(id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.records.find(id);
    return (it == shard.records.end()) ? nullptr : it->second.get();
  }

  Record* LookupOrCreate(const std::string& id, int32_t priority,
                         bool& created) {
    Shard& shard = ShardFor(id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.records.find(id);
    created = false;
    if (it != shard.records.end()) return it->second.get();
    created = true;
    auto rec = CreateRecord(id, priority, nullptr);
    Record* raw = rec.get();
    shard.records.emplace(id, std::move(rec));
    registered_.fetch_add(1, std::memory_order_relaxed);
    return raw;
  }

  EventBus& bus_;
  SubscriptionHandle subscription_ = SubscriptionHandle::Invalid();
  mutable Shard shards_[CRUCIBLE_LIFECYCLE_SHARDS];

  std::atomic<uint64_t> registered_{0};
  std::atomic<uint64_t> applied_{0};
  std::atomic<uint64_t> duplicates_{0};
  std::atomic<uint64_t> invalid_{0};
  std::atomic<uint64_t> late_terminal_{0};
  std::atomic<uint64_t> unknown_{0};
};

}  // namespace crucible

#endif  // CRUCIBLE_STATE_MACHINE_HPP_
