/**
 * @file test_task_router.cpp
 * @brief Tests for task_router.hpp
 */

#include "crucible/task_router.hpp"
#include "fake_sandbox.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>

using crucible::CancelOutcome;
using crucible::EvaluationStatus;
using crucible::RouterError;
using crucible::TerminationReason;
using crucible_test::FakeSandbox;

namespace {

bool WaitUntil(const std::function<bool()>& pred, uint32_t timeout_ms = 3000) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return pred();
}

crucible::RouterConfig FastRouter(uint32_t workers = 1) {
  crucible::RouterConfig cfg;
  cfg.workers = workers;
  cfg.retry.base_ms = 5;
  cfg.retry.max_ms = 20;
  cfg.retry.jitter = 0.0;
  cfg.retry.max_retries = 2;
  cfg.queue_sla_s = 60;
  return cfg;
}

/// Router over a fake-backed dispatcher with a live bus.
struct RouterRig {
  explicit RouterRig(const crucible::RouterConfig& rcfg = FastRouter(),
                     uint32_t slots = 4)
      : bus(1024),
        lifecycle(bus),
        capacity(crucible::CapacityLimits{slots, 2048, 4000}),
        dispatcher(crucible::DispatcherConfig{}, capacity, sandbox, bus),
        router(rcfg, dispatcher, lifecycle) {
    lifecycle.AttachToBus();
    (void)bus.Start();
  }

  ~RouterRig() {
    router.Shutdown();
    dispatcher.Shutdown();
    bus.Stop();
  }

  bool StatusIs(const std::string& id, EvaluationStatus s) {
    return WaitUntil([&] {
      auto st = lifecycle.StatusOf(id);
      return st.has_value() && st.value() == s;
    });
  }

  void Finish(const std::string& id) {
    sandbox.Complete(id, true);
    sandbox.Exit(id, 0);
  }

  crucible::EventBus bus;
  crucible::StateMachine lifecycle;
  crucible::CapacityManager capacity;
  FakeSandbox sandbox;
  crucible::Dispatcher dispatcher;
  crucible::TaskRouter router;
};

crucible::EvaluationRequest Request(const std::string& id,
                                   int32_t priority = 250) {
  crucible::EvaluationRequest req;
  req.id = id;
  req.code = "echo hi";
  req.language = "sh";
  req.priority = priority;
  req.resources.memory_mb = 128;
  req.resources.cpu_millicores = 100;
  req.resources.timeout_s = 30;
  return req;
}

}  // namespace

// ============================================================================
// Queue ordering (no workers)
// ============================================================================

TEST_CASE("TaskRouter orders by priority then FIFO", "[task_router]") {
  RouterRig rig;
  REQUIRE(rig.router.Submit(Request("low", 100)).has_value());
  REQUIRE(rig.router.Submit(Request("mid-1", 250)).has_value());
  REQUIRE(rig.router.Submit(Request("high", 900)).has_value());
  REQUIRE(rig.router.Submit(Request("mid-2", 250)).has_value());
  REQUIRE(rig.router.Submit(Request("legacy-high", 1)).has_value());  // 350

  auto ids = rig.router.QueuedIds();
  REQUIRE(ids.size() == 5U);
  REQUIRE(ids[0] == "high");
  REQUIRE(ids[1] == "legacy-high");
  REQUIRE(ids[2] == "mid-1");
  REQUIRE(ids[3] == "mid-2");
  REQUIRE(ids[4] == "low");
  REQUIRE(rig.router.QueueDepth() == 5U);
  REQUIRE(rig.StatusIs("mid-1", EvaluationStatus::kQueued));
}

TEST_CASE("TaskRouter rejects invalid and duplicate submissions",
          "[task_router]") {
  RouterRig rig;
  auto bad = Request("bad id!");
  auto r = rig.router.Submit(bad);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind == RouterError::kValidation);

  auto empty = Request("empty");
  empty.code.clear();
  REQUIRE(rig.router.Submit(empty).get_error().kind ==
          RouterError::kValidation);
  REQUIRE(!rig.lifecycle.StatusOf("empty").has_value());

  REQUIRE(rig.router.Submit(Request("once")).has_value());
  REQUIRE(rig.router.Submit(Request("once")).get_error().kind ==
          RouterError::kDuplicate);
  REQUIRE(rig.router.QueueDepth() == 1U);
  REQUIRE(rig.router.GetStatistics().rejected == 3U);
}

TEST_CASE("TaskRouter rejects requests larger than the pool",
          "[task_router]") {
  // Node limits (512 MB) allow what a 256 MB pool can never hold.
  RouterRig rig;
  crucible::CapacityManager small(crucible::CapacityLimits{4, 256, 4000});
  crucible::Dispatcher dispatcher(crucible::DispatcherConfig{}, small,
                                  rig.sandbox, rig.bus);
  crucible::TaskRouter router(FastRouter(), dispatcher, rig.lifecycle);

  auto req = Request("too-big");
  req.resources.memory_mb = 400;
  auto r = router.Submit(req);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind == RouterError::kValidation);
  REQUIRE(router.QueueDepth() == 0U);
  REQUIRE(!rig.lifecycle.StatusOf("too-big").has_value());

  req.resources.memory_mb = 200;
  req.id = "fits";
  REQUIRE(router.Submit(req).has_value());
  REQUIRE(router.QueueDepth() == 1U);
  router.Shutdown();
}

TEST_CASE("TaskRouter cancels a queued evaluation", "[task_router]") {
  RouterRig rig;
  REQUIRE(rig.router.Submit(Request("q1")).has_value());
  auto c = rig.router.Cancel("q1");
  REQUIRE(c.has_value());
  REQUIRE(c.value() == CancelOutcome::kRemovedFromQueue);
  REQUIRE(!rig.router.IsQueued("q1"));
  REQUIRE(rig.StatusIs("q1", EvaluationStatus::kCancelled));
  REQUIRE(rig.sandbox.CreatedCount() == 0U);

  REQUIRE(rig.router.Cancel("q1").get_error() == RouterError::kAlreadyTerminal);
  REQUIRE(rig.router.Cancel("ghost").get_error() == RouterError::kNotFound);
}

// ============================================================================
// Dispatching
// ============================================================================

TEST_CASE("TaskRouter dispatches in priority order", "[task_router]") {
  RouterRig rig(FastRouter(1), 1);
  REQUIRE(rig.router.Submit(Request("first", 100)).has_value());
  REQUIRE(rig.router.Submit(Request("second", 500)).has_value());
  rig.router.Start();

  REQUIRE(WaitUntil([&] { return rig.sandbox.HasUnit("second"); }));
  REQUIRE(!rig.sandbox.HasUnit("first"));
  REQUIRE(rig.StatusIs("second", EvaluationStatus::kProvisioning));

  rig.sandbox.Started("second");
  REQUIRE(rig.StatusIs("second", EvaluationStatus::kRunning));
  rig.Finish("second");
  REQUIRE(rig.StatusIs("second", EvaluationStatus::kCompleted));

  // The freed slot goes to the evaluation that was retrying on capacity.
  REQUIRE(WaitUntil([&] { return rig.sandbox.HasUnit("first"); }));
  REQUIRE(rig.router.GetStatistics().retries >= 1U);
  rig.Finish("first");
  REQUIRE(rig.StatusIs("first", EvaluationStatus::kCompleted));
  REQUIRE(rig.router.GetStatistics().dispatched == 2U);
}

TEST_CASE("TaskRouter keeps capacity-blocked work queued", "[task_router]") {
  RouterRig rig(FastRouter(2), 1);
  rig.router.Start();
  REQUIRE(rig.router.Submit(Request("holder")).has_value());
  REQUIRE(WaitUntil([&] { return rig.sandbox.HasUnit("holder"); }));
  REQUIRE(rig.router.Submit(Request("waiter")).has_value());

  REQUIRE(WaitUntil(
      [&] { return rig.router.GetStatistics().retries >= 2U; }));
  REQUIRE(rig.lifecycle.StatusOf("waiter").value() == EvaluationStatus::kQueued);
  REQUIRE(rig.router.DeadLetters().empty());

  // The freed slot goes to the waiter on its next retry.
  rig.Finish("holder");
  REQUIRE(rig.StatusIs("holder", EvaluationStatus::kCompleted));
  REQUIRE(WaitUntil([&] { return rig.sandbox.HasUnit("waiter"); }));
  REQUIRE(rig.StatusIs("waiter", EvaluationStatus::kProvisioning));
}

TEST_CASE("TaskRouter retries keep arrival order within a priority",
          "[task_router]") {
  RouterRig rig(FastRouter(1), 1);
  rig.router.Start();
  REQUIRE(rig.router.Submit(Request("holder")).has_value());
  REQUIRE(WaitUntil([&] { return rig.sandbox.HasUnit("holder"); }));
  REQUIRE(rig.router.Submit(Request("first")).has_value());
  REQUIRE(rig.router.Submit(Request("second")).has_value());

  // Both bounce off the full pool; "first" must stay ahead every time.
  uint32_t both_queued = 0;
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(300);
  while (std::chrono::steady_clock::now() < deadline) {
    auto ids = rig.router.QueuedIds();
    if (ids.size() == 2U) {
      ++both_queued;
      REQUIRE(ids[0] == "first");
      REQUIRE(ids[1] == "second");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  REQUIRE(both_queued > 0U);
  REQUIRE(rig.router.GetStatistics().retries >= 4U);
}

TEST_CASE("TaskRouter cancels an in-flight evaluation", "[task_router]") {
  RouterRig rig;
  rig.router.Start();
  REQUIRE(rig.router.Submit(Request("flight")).has_value());
  REQUIRE(WaitUntil([&] { return rig.dispatcher.IsActive("flight"); }));

  auto c = rig.router.Cancel("flight");
  REQUIRE(c.has_value());
  REQUIRE(c.value() == CancelOutcome::kForwarded);
  REQUIRE(rig.StatusIs("flight", EvaluationStatus::kCancelled));
  REQUIRE(rig.sandbox.GracefulStops("flight") == 1U);
  REQUIRE(rig.router.Cancel("flight").get_error() ==
          RouterError::kAlreadyTerminal);
}

TEST_CASE("TaskRouter cancel of a queued retry beats dispatch",
          "[task_router]") {
  RouterRig rig(FastRouter(1), 1);
  rig.router.Start();
  REQUIRE(rig.router.Submit(Request("hog")).has_value());
  REQUIRE(WaitUntil([&] { return rig.sandbox.HasUnit("hog"); }));
  REQUIRE(rig.router.Submit(Request("blocked")).has_value());
  REQUIRE(WaitUntil([&] { return rig.router.GetStatistics().retries >= 1U; }));

  REQUIRE(rig.router.Cancel("blocked").has_value());
  REQUIRE(rig.StatusIs("blocked", EvaluationStatus::kCancelled));
  rig.Finish("hog");
  REQUIRE(rig.StatusIs("hog", EvaluationStatus::kCompleted));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE(!rig.sandbox.HasUnit("blocked"));
}

// ============================================================================
// Dead letters
// ============================================================================

TEST_CASE("TaskRouter dead-letters after infrastructure retries",
          "[task_router]") {
  RouterRig rig;
  rig.sandbox.FailNextCreates(100, crucible::ProviderError::kUnavailable);
  rig.router.Start();
  REQUIRE(rig.router.Submit(Request("flaky")).has_value());

  REQUIRE(rig.StatusIs("flaky", EvaluationStatus::kFailed));
  auto dead = rig.router.DeadLetters();
  REQUIRE(dead.size() == 1U);
  REQUIRE(dead[0].evaluation_id == "flaky");
  REQUIRE(dead[0].attempts == 3U);
  REQUIRE(dead[0].reason == TerminationReason::kInfrastructure);
  REQUIRE(rig.lifecycle.Get("flaky").value().reason ==
          TerminationReason::kInfrastructure);
  REQUIRE(rig.capacity.FreeSlots() == 4U);
}

TEST_CASE("TaskRouter dead-letters permanent dispatcher rejections",
          "[task_router]") {
  RouterRig rig;
  rig.sandbox.FailNextCreates(1, crucible::ProviderError::kInvalidSpec);
  rig.router.Start();
  REQUIRE(rig.router.Submit(Request("nope")).has_value());

  REQUIRE(rig.StatusIs("nope", EvaluationStatus::kFailed));
  auto dead = rig.router.DeadLetters();
  REQUIRE(dead.size() == 1U);
  REQUIRE(dead[0].attempts == 1U);
  REQUIRE(dead[0].reason == TerminationReason::kRejected);
}

TEST_CASE("TaskRouter enforces the queue SLA", "[task_router]") {
  crucible::RouterConfig cfg = FastRouter(1);
  cfg.queue_sla_s = 1;
  RouterRig rig(cfg, 1);
  rig.router.Start();
  REQUIRE(rig.router.Submit(Request("busy")).has_value());
  REQUIRE(WaitUntil([&] { return rig.sandbox.HasUnit("busy"); }));
  REQUIRE(rig.router.Submit(Request("starved")).has_value());

  REQUIRE(WaitUntil(
      [&] {
        auto st = rig.lifecycle.StatusOf("starved");
        return st.has_value() && st.value() == EvaluationStatus::kFailed;
      },
      5000));
  auto snap = rig.lifecycle.Get("starved").value();
  REQUIRE(snap.reason == TerminationReason::kQueueSlaExceeded);
  REQUIRE(rig.router.DeadLetters().size() == 1U);
  REQUIRE(rig.router.DeadLetters()[0].detail.find("queue SLA exceeded") == 0U);
  REQUIRE(rig.lifecycle.StatusOf("busy").value() ==
          EvaluationStatus::kProvisioning);
}

TEST_CASE("TaskRouter refuses work while shutting down", "[task_router]") {
  RouterRig rig;
  rig.router.Start();
  rig.router.Shutdown();
  auto r = rig.router.Submit(Request("late"));
  REQUIRE(r.get_error().kind == RouterError::kShuttingDown);
}
