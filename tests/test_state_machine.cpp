/**
 * @file test_state_machine.cpp
 * @brief Tests for state_machine.hpp (evaluation lifecycle lattice)
 */

#include "crucible/state_machine.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using crucible::EvaluationStatus;
using crucible::EventOrigin;
using crucible::LifecycleEvent;
using crucible::TerminationReason;
using crucible::TransitionOutcome;

namespace {

LifecycleEvent Sig(const std::string& id, EvaluationStatus type) {
  LifecycleEvent ev;
  ev.evaluation_id = id;
  ev.type = type;
  ev.origin = EventOrigin::kSignal;
  return ev;
}

struct Recorder {
  std::vector<LifecycleEvent> events;
  explicit Recorder(crucible::EventBus& bus) {
    bus.Subscribe(crucible::TopicFilter::Global(),
                  [this](const LifecycleEvent& ev) { events.push_back(ev); });
  }
};

}  // namespace

// ============================================================================
// Registration
// ============================================================================

TEST_CASE("Register creates a queued record", "[state_machine]") {
  crucible::EventBus bus;
  Recorder rec(bus);
  crucible::StateMachine sm(bus);

  REQUIRE(sm.Register("e1", 300).has_value());
  auto snap = sm.Get("e1");
  REQUIRE(snap.has_value());
  REQUIRE(snap.value().status == EvaluationStatus::kQueued);
  REQUIRE(snap.value().priority == 300);
  REQUIRE(snap.value().version == 1U);
  REQUIRE(snap.value().history.size() == 1U);

  bus.Drain();
  REQUIRE(rec.events.size() == 1U);
  REQUIRE(rec.events[0].type == EvaluationStatus::kQueued);
  REQUIRE(rec.events[0].origin == EventOrigin::kCommitted);
}

TEST_CASE("Register rejects duplicates and empty ids", "[state_machine]") {
  crucible::EventBus bus;
  crucible::StateMachine sm(bus);
  REQUIRE(sm.Register("e1", 0).has_value());
  REQUIRE(sm.Register("e1", 0).get_error() ==
          crucible::LifecycleError::kAlreadyExists);
  REQUIRE(sm.Register("", 0).get_error() ==
          crucible::LifecycleError::kInvalidId);
}

// ============================================================================
// Lattice
// ============================================================================

TEST_CASE("Forward transitions are applied in order", "[state_machine]") {
  crucible::EventBus bus;
  Recorder rec(bus);
  crucible::StateMachine sm(bus);
  sm.Register("e1", 250);

  auto prov = Sig("e1", EvaluationStatus::kProvisioning);
  prov.unit_ref = "unit-7";
  prov.output_ref = "file:///tmp/out";
  REQUIRE(sm.Apply(prov) == TransitionOutcome::kApplied);
  REQUIRE(sm.Apply(Sig("e1", EvaluationStatus::kRunning)) ==
          TransitionOutcome::kApplied);

  auto done = Sig("e1", EvaluationStatus::kCompleted);
  done.exit = crucible::ExitInfo::FromCode(0);
  done.reason = TerminationReason::kSuccess;
  REQUIRE(sm.Apply(done) == TransitionOutcome::kApplied);

  auto snap = sm.Get("e1").value();
  REQUIRE(snap.status == EvaluationStatus::kCompleted);
  REQUIRE(snap.version == 4U);
  REQUIRE(snap.unit_ref == "unit-7");
  REQUIRE(snap.output_ref == "file:///tmp/out");
  REQUIRE(snap.exit.Known());
  REQUIRE(snap.exit.exit_code == 0);
  REQUIRE(snap.reason == TerminationReason::kSuccess);
  REQUIRE(snap.started_us > 0U);
  REQUIRE(snap.completed_us >= snap.started_us);
  REQUIRE(snap.history.size() == 4U);

  bus.Drain();
  REQUIRE(rec.events.size() == 4U);
  REQUIRE(rec.events.back().sequence_hint == 4U);
  REQUIRE(rec.events.back().output_ref == "file:///tmp/out");
  REQUIRE(sm.IsTerminalNow("e1"));
}

TEST_CASE("Same status twice is an idempotent duplicate", "[state_machine]") {
  crucible::EventBus bus;
  crucible::StateMachine sm(bus);
  sm.Register("e1", 0);
  REQUIRE(sm.Apply(Sig("e1", EvaluationStatus::kRunning)) ==
          TransitionOutcome::kApplied);
  REQUIRE(sm.Apply(Sig("e1", EvaluationStatus::kRunning)) ==
          TransitionOutcome::kDuplicate);
  REQUIRE(sm.Get("e1").value().version == 2U);
  REQUIRE(sm.GetStatistics().duplicates == 1U);
}

TEST_CASE("Backward transition is rejected", "[state_machine]") {
  crucible::EventBus bus;
  crucible::StateMachine sm(bus);
  sm.Register("e1", 0);
  sm.Apply(Sig("e1", EvaluationStatus::kRunning));
  REQUIRE(sm.Apply(Sig("e1", EvaluationStatus::kProvisioning)) ==
          TransitionOutcome::kInvalidTransition);
  REQUIRE(sm.StatusOf("e1").value() == EvaluationStatus::kRunning);
}

TEST_CASE("Fast job: completed overtakes provisioning", "[state_machine]") {
  crucible::EventBus bus;
  crucible::StateMachine sm(bus);
  sm.Register("fast", 0);

  auto done = Sig("fast", EvaluationStatus::kCompleted);
  done.exit = crucible::ExitInfo::FromCode(0);
  REQUIRE(sm.Apply(done) == TransitionOutcome::kApplied);
  REQUIRE(sm.Apply(Sig("fast", EvaluationStatus::kProvisioning)) ==
          TransitionOutcome::kAlreadyTerminal);
  REQUIRE(sm.Apply(Sig("fast", EvaluationStatus::kRunning)) ==
          TransitionOutcome::kAlreadyTerminal);
  REQUIRE(sm.StatusOf("fast").value() == EvaluationStatus::kCompleted);
}

TEST_CASE("First terminal event wins", "[state_machine]") {
  crucible::EventBus bus;
  Recorder rec(bus);
  crucible::StateMachine sm(bus);
  sm.Register("e1", 0);
  sm.Apply(Sig("e1", EvaluationStatus::kRunning));

  auto timeout = Sig("e1", EvaluationStatus::kTimeout);
  timeout.reason = TerminationReason::kDeadlineExceeded;
  REQUIRE(sm.Apply(timeout) == TransitionOutcome::kApplied);

  auto late = Sig("e1", EvaluationStatus::kCompleted);
  late.exit = crucible::ExitInfo::FromCode(0);
  REQUIRE(sm.Apply(late) == TransitionOutcome::kAlreadyTerminal);
  REQUIRE(sm.Apply(Sig("e1", EvaluationStatus::kTimeout)) ==
          TransitionOutcome::kAlreadyTerminal);

  auto snap = sm.Get("e1").value();
  REQUIRE(snap.status == EvaluationStatus::kTimeout);
  REQUIRE(snap.reason == TerminationReason::kDeadlineExceeded);
  REQUIRE(!snap.exit.Known());
  REQUIRE(sm.GetStatistics().late_terminal == 2U);

  bus.Drain();
  int terminal_events = 0;
  for (const auto& ev : rec.events) {
    if (crucible::IsTerminal(ev.type)) ++terminal_events;
  }
  REQUIRE(terminal_events == 1);
}

TEST_CASE("Cancel settles a queued evaluation", "[state_machine]") {
  crucible::EventBus bus;
  crucible::StateMachine sm(bus);
  sm.Register("e1", 0);
  REQUIRE(sm.Cancel("e1", "user request") == TransitionOutcome::kApplied);
  auto snap = sm.Get("e1").value();
  REQUIRE(snap.status == EvaluationStatus::kCancelled);
  REQUIRE(snap.reason == TerminationReason::kCancelledByUser);
  REQUIRE(snap.detail == "user request");
  REQUIRE(sm.Cancel("e1", "again") == TransitionOutcome::kAlreadyTerminal);
}

// ============================================================================
// Unknown evaluations
// ============================================================================

TEST_CASE("Provisioning signal creates an unknown record", "[state_machine]") {
  crucible::EventBus bus;
  Recorder rec(bus);
  crucible::StateMachine sm(bus);

  auto prov = Sig("direct", EvaluationStatus::kProvisioning);
  prov.priority = 500;
  REQUIRE(sm.Apply(prov) == TransitionOutcome::kApplied);
  auto snap = sm.Get("direct").value();
  REQUIRE(snap.status == EvaluationStatus::kProvisioning);
  REQUIRE(snap.priority == 500);

  bus.Drain();
  REQUIRE(rec.events.size() == 2U);
  REQUIRE(rec.events[0].type == EvaluationStatus::kQueued);
  REQUIRE(rec.events[1].type == EvaluationStatus::kProvisioning);
}

TEST_CASE("Terminal signal for unknown id is discarded", "[state_machine]") {
  crucible::EventBus bus;
  crucible::StateMachine sm(bus);
  REQUIRE(sm.Apply(Sig("ghost", EvaluationStatus::kCompleted)) ==
          TransitionOutcome::kUnknownEvaluation);
  REQUIRE(!sm.Get("ghost").has_value());
  REQUIRE(sm.GetStatistics().unknown == 1U);
}

// ============================================================================
// Bus integration
// ============================================================================

TEST_CASE("Signals on the bus drive the machine", "[state_machine]") {
  crucible::EventBus bus;
  Recorder rec(bus);
  crucible::StateMachine sm(bus);
  sm.AttachToBus();

  bus.PublishReliable(Sig("b1", EvaluationStatus::kProvisioning));
  bus.PublishReliable(Sig("b1", EvaluationStatus::kRunning));
  auto fail = Sig("b1", EvaluationStatus::kFailed);
  fail.reason = TerminationReason::kNonZeroExit;
  fail.exit = crucible::ExitInfo::FromCode(3);
  bus.PublishReliable(fail);
  REQUIRE(bus.Flush());

  REQUIRE(sm.StatusOf("b1").value() == EvaluationStatus::kFailed);
  REQUIRE(rec.events.size() == 4U);
  REQUIRE(rec.events.back().exit.exit_code == 3);

  sm.DetachFromBus();
  bus.PublishReliable(Sig("b2", EvaluationStatus::kProvisioning));
  bus.Drain();
  REQUIRE(!sm.Get("b2").has_value());
}

TEST_CASE("Concurrent racing signals settle exactly once",
          "[state_machine][stress]") {
  crucible::EventBus bus(1U << 14);
  std::atomic<int> terminal{0};
  bus.Subscribe(crucible::TopicFilter::Global(),
                [&terminal](const LifecycleEvent& ev) {
                  if (crucible::IsTerminal(ev.type)) ++terminal;
                });
  crucible::StateMachine sm(bus);
  REQUIRE(bus.Start().has_value());

  constexpr int kEvals = 64;
  for (int i = 0; i < kEvals; ++i) sm.Register("c" + std::to_string(i), 0);

  const EvaluationStatus kinds[] = {
      EvaluationStatus::kProvisioning, EvaluationStatus::kRunning,
      EvaluationStatus::kCompleted, EvaluationStatus::kTimeout,
      EvaluationStatus::kCancelled};
  std::vector<std::thread> threads;
  for (int t = 0; t < 5; ++t) {
    threads.emplace_back([&sm, &kinds, t] {
      for (int i = 0; i < kEvals; ++i) {
        (void)sm.Apply(Sig("c" + std::to_string(i), kinds[t]));
      }
    });
  }
  for (auto& th : threads) th.join();
  REQUIRE(bus.Flush());
  bus.Stop();

  REQUIRE(terminal.load() == kEvals);
  auto counts = sm.CountByStatus();
  uint32_t settled = 0;
  for (uint32_t s = 0; s < crucible::kEvaluationStatusCount; ++s) {
    if (crucible::IsTerminal(static_cast<EvaluationStatus>(s))) {
      settled += counts[s];
    }
  }
  REQUIRE(settled == static_cast<uint32_t>(kEvals));
}
