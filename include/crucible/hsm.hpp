/**
 * @file hsm.hpp
 * @brief Header-only hierarchical state machine (HSM) engine.
 *
 * The state graph (StateTable) is built once and shared; each machine
 * instance (Hsm) only carries its current state and a context reference, so
 * thousands of concurrently tracked objects can each own a machine cheaply.
 *
 * - Function pointers (not std::function) for handlers and actions
 * - LCA-based hierarchical transitions with correct entry/exit ordering
 * - Events bubble from the current state to its ancestors until handled
 */

#ifndef CRUCIBLE_HSM_HPP_
#define CRUCIBLE_HSM_HPP_

#include "crucible/platform.hpp"

#ifndef CRUCIBLE_HSM_MAX_DEPTH
#define CRUCIBLE_HSM_MAX_DEPTH 16
#endif

namespace crucible {

// ============================================================================
// Event
// ============================================================================

/**
 * @brief Event passed to state handlers: numeric id plus optional payload.
 */
struct HsmEvent {
  uint32_t id;
  const void* data;  ///< Optional payload, nullptr if unused.
};

// ============================================================================
// HandlerResult
// ============================================================================

enum class HandlerResult : uint8_t {
  kHandled,    ///< Event consumed by this state.
  kUnhandled,  ///< Bubble up to parent.
  kTransition  ///< Transition requested via Hsm::RequestTransition().
};

/// @brief What Dispatch() did with an event.
enum class DispatchOutcome : uint8_t {
  kHandled = 0,    ///< Consumed without a state change.
  kTransitioned,   ///< A state change was executed.
  kUnhandled,      ///< No state in the hierarchy accepted the event.
};

template <typename Context, uint32_t MaxStates>
class Hsm;

// ============================================================================
// StateConfig
// ============================================================================

/**
 * @brief Declarative description of one state.
 *
 * parent_index establishes the hierarchy (-1 means root).
 */
template <typename Context>
struct StateConfig {
  using HandlerFn = HandlerResult (*)(Context& ctx, const HsmEvent& event);
  using EntryFn = void (*)(Context& ctx);
  using ExitFn = void (*)(Context& ctx);

  const char* name;      ///< Static lifetime.
  int32_t parent_index;  ///< -1 for root.
  HandlerFn handler;     ///< nullptr: every event bubbles up.
  EntryFn on_entry;      ///< nullptr if none.
  ExitFn on_exit;        ///< nullptr if none.
};

// ============================================================================
// StateTable
// ============================================================================

/**
 * @brief Immutable-after-build state graph shared by many Hsm instances.
 */
template <typename Context, uint32_t MaxStates = 16>
class StateTable final {
 public:
  static constexpr int32_t kNoState = -1;

  StateTable() noexcept : state_count_(0) {}

  StateTable(const StateTable&) = delete;
  StateTable& operator=(const StateTable&) = delete;

  /**
   * @brief Add a state.
   * @return Index of the new state, or kNoState if the table is full.
   */
  int32_t AddState(const StateConfig<Context>& config) noexcept {
    if (state_count_ >= MaxStates) {
      return kNoState;
    }
    CRUCIBLE_ASSERT(config.parent_index < static_cast<int32_t>(state_count_));
    int32_t index = static_cast<int32_t>(state_count_);
    states_[state_count_] = config;
    ++state_count_;
    return index;
  }

  const StateConfig<Context>& At(int32_t index) const noexcept {
    CRUCIBLE_ASSERT(index >= 0 &&
                    static_cast<uint32_t>(index) < state_count_);
    return states_[static_cast<uint32_t>(index)];
  }

  const char* Name(int32_t index) const noexcept {
    return (index < 0) ? "" : At(index).name;
  }

  int32_t Parent(int32_t index) const noexcept {
    return At(index).parent_index;
  }

  uint32_t StateCount() const noexcept { return state_count_; }

  /// @brief True if @p state equals @p ancestor or is nested inside it.
  bool IsDescendant(int32_t state, int32_t ancestor) const noexcept {
    int32_t s = state;
    while (s >= 0) {
      if (s == ancestor) return true;
      s = Parent(s);
    }
    return false;
  }

  /** @brief Depth of a state (1 for a root state, 0 for kNoState). */
  int32_t Depth(int32_t index) const noexcept {
    int32_t depth = 0;
    int32_t s = index;
    while (s >= 0) {
      ++depth;
      s = Parent(s);
    }
    return depth;
  }

  /**
   * @brief Lowest common ancestor of two states, or kNoState if they are in
   *        independent root trees.
   */
  int32_t FindLCA(int32_t s1, int32_t s2) const noexcept {
    int32_t d1 = Depth(s1);
    int32_t d2 = Depth(s2);
    int32_t p1 = s1;
    int32_t p2 = s2;
    while (d1 > d2) {
      p1 = Parent(p1);
      --d1;
    }
    while (d2 > d1) {
      p2 = Parent(p2);
      --d2;
    }
    while (p1 != p2) {
      p1 = (p1 >= 0) ? Parent(p1) : kNoState;
      p2 = (p2 >= 0) ? Parent(p2) : kNoState;
    }
    return p1;
  }

 private:
  uint32_t state_count_;
  StateConfig<Context> states_[MaxStates];
};

// ============================================================================
// Hsm
// ============================================================================

/**
 * @brief One running machine over a shared StateTable.
 *
 * @tparam Context   User context type (must outlive the machine).
 * @tparam MaxStates Capacity of the StateTable this machine runs on.
 *
 * @code
 *   static StateTable<Ctx, 8> table;   // built once
 *   Ctx ctx{};
 *   Hsm<Ctx, 8> sm(table, ctx);
 *   sm.Start(initial);
 *   sm.Dispatch({kEvtGo, nullptr});
 * @endcode
 *
 * Not thread-safe: callers serialize Dispatch() per instance.
 */
template <typename Context, uint32_t MaxStates = 16>
class Hsm final {
 public:
  using Table = StateTable<Context, MaxStates>;
  static constexpr int32_t kNoState = Table::kNoState;

  Hsm(const Table& table, Context& ctx) noexcept
      : table_(table),
        ctx_(ctx),
        current_state_(kNoState),
        pending_target_(kNoState) {}

  Hsm(const Hsm&) = delete;
  Hsm& operator=(const Hsm&) = delete;

  /**
   * @brief Enter @p initial and all of its ancestors, running on_entry
   *        actions top-down.
   */
  void Start(int32_t initial) noexcept {
    CRUCIBLE_ASSERT(current_state_ == kNoState);
    CRUCIBLE_ASSERT(initial >= 0 &&
                    static_cast<uint32_t>(initial) < table_.StateCount());
    current_state_ = initial;
    int32_t path[CRUCIBLE_HSM_MAX_DEPTH];
    uint32_t len = 0;
    BuildPath(initial, kNoState, path, len);
    for (uint32_t i = len; i > 0; --i) {
      const auto& sc = table_.At(path[i - 1]);
      if (sc.on_entry != nullptr) sc.on_entry(ctx_);
    }
  }

  /**
   * @brief Offer @p event to the current state, bubbling to ancestors on
   *        kUnhandled. A kTransition result executes the LCA transition
   *        after the handler returns.
   */
  DispatchOutcome Dispatch(const HsmEvent& event) noexcept {
    CRUCIBLE_ASSERT(current_state_ >= 0);
    int32_t state = current_state_;
    while (state >= 0) {
      const auto& sc = table_.At(state);
      if (sc.handler != nullptr) {
        HandlerResult result = sc.handler(ctx_, event);
        if (result == HandlerResult::kHandled) {
          return DispatchOutcome::kHandled;
        }
        if (result == HandlerResult::kTransition) {
          CRUCIBLE_ASSERT(pending_target_ >= 0);
          int32_t target = pending_target_;
          pending_target_ = kNoState;
          TransitionTo(target);
          return DispatchOutcome::kTransitioned;
        }
      }
      state = sc.parent_index;
    }
    return DispatchOutcome::kUnhandled;
  }

  /**
   * @brief Request a transition from inside a handler. Return the result of
   *        this call from the handler.
   */
  HandlerResult RequestTransition(int32_t target) noexcept {
    pending_target_ = target;
    return HandlerResult::kTransition;
  }

  int32_t CurrentState() const noexcept { return current_state_; }

  const char* CurrentStateName() const noexcept {
    return table_.Name(current_state_);
  }

  /// @brief True if the current state is @p state_index or nested inside it.
  bool IsInState(int32_t state_index) const noexcept {
    return table_.IsDescendant(current_state_, state_index);
  }

  bool IsStarted() const noexcept { return current_state_ != kNoState; }

 private:
  void TransitionTo(int32_t target) noexcept {
    const int32_t source = current_state_;
    if (source == target) {
      const auto& sc = table_.At(source);
      if (sc.on_exit != nullptr) sc.on_exit(ctx_);
      if (sc.on_entry != nullptr) sc.on_entry(ctx_);
      return;
    }

    const int32_t lca = table_.FindLCA(source, target);

    int32_t exit_path[CRUCIBLE_HSM_MAX_DEPTH];
    uint32_t exit_len = 0;
    BuildPath(source, lca, exit_path, exit_len);
    for (uint32_t i = 0; i < exit_len; ++i) {
      const auto& sc = table_.At(exit_path[i]);
      if (sc.on_exit != nullptr) sc.on_exit(ctx_);
    }

    // The new state is visible to entry actions.
    current_state_ = target;

    int32_t entry_path[CRUCIBLE_HSM_MAX_DEPTH];
    uint32_t entry_len = 0;
    BuildPath(target, lca, entry_path, entry_len);
    for (uint32_t i = entry_len; i > 0; --i) {
      const auto& sc = table_.At(entry_path[i - 1]);
      if (sc.on_entry != nullptr) sc.on_entry(ctx_);
    }
  }

  /// Path from @p from up to (not including) @p stop, stored bottom-up.
  void BuildPath(int32_t from, int32_t stop, int32_t* path,
                 uint32_t& len) const noexcept {
    len = 0;
    int32_t s = from;
    while (s >= 0 && s != stop) {
      CRUCIBLE_ASSERT(len < CRUCIBLE_HSM_MAX_DEPTH);
      path[len] = s;
      ++len;
      s = table_.Parent(s);
    }
  }

  const Table& table_;
  Context& ctx_;
  int32_t current_state_;
  int32_t pending_target_;
};

}  // namespace crucible

#endif  // CRUCIBLE_HSM_HPP_
