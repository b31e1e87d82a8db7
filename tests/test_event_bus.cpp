/**
 * @file test_event_bus.cpp
 * @brief Tests for event_bus.hpp (lock-free MPSC lifecycle event bus)
 */

#include "crucible/event_bus.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using crucible::EvaluationStatus;
using crucible::EventOrigin;
using crucible::LifecycleEvent;
using crucible::TopicFilter;

namespace {

LifecycleEvent Committed(const std::string& id, EvaluationStatus type) {
  LifecycleEvent ev;
  ev.evaluation_id = id;
  ev.type = type;
  ev.origin = EventOrigin::kCommitted;
  return ev;
}

LifecycleEvent Signal(const std::string& id, EvaluationStatus type) {
  LifecycleEvent ev = Committed(id, type);
  ev.origin = EventOrigin::kSignal;
  return ev;
}

}  // namespace

TEST_CASE("EventBus manual publish and drain", "[event_bus]") {
  crucible::EventBus bus(64);
  int received = 0;
  auto h = bus.Subscribe(TopicFilter::Global(),
                         [&received](const LifecycleEvent&) { ++received; });
  REQUIRE(h.IsValid());

  REQUIRE(bus.Publish(Committed("a", EvaluationStatus::kRunning),
                      crucible::MessagePriority::kHigh)
              .has_value());
  REQUIRE(bus.Depth() == 1U);
  REQUIRE(bus.Drain() == 1U);
  REQUIRE(received == 1);
  REQUIRE(bus.Depth() == 0U);
}

TEST_CASE("Topic filters separate signals from committed events",
          "[event_bus]") {
  crucible::EventBus bus(64);
  std::vector<std::string> signals;
  std::vector<std::string> global;
  std::vector<std::string> completed;
  std::vector<std::string> for_b;

  bus.Subscribe(TopicFilter::Signals(), [&](const LifecycleEvent& ev) {
    signals.push_back(ev.evaluation_id);
  });
  bus.Subscribe(TopicFilter::Global(), [&](const LifecycleEvent& ev) {
    global.push_back(ev.evaluation_id);
  });
  bus.Subscribe(TopicFilter::Status(EvaluationStatus::kCompleted),
                [&](const LifecycleEvent& ev) {
                  completed.push_back(ev.evaluation_id);
                });
  bus.Subscribe(TopicFilter::Evaluation("b"), [&](const LifecycleEvent& ev) {
    for_b.push_back(crucible::StatusName(ev.type));
  });

  bus.PublishReliable(Signal("a", EvaluationStatus::kRunning));
  bus.PublishReliable(Committed("a", EvaluationStatus::kCompleted));
  bus.PublishReliable(Committed("b", EvaluationStatus::kRunning));
  bus.PublishReliable(Committed("b", EvaluationStatus::kFailed));
  REQUIRE(bus.Flush());

  REQUIRE(signals == std::vector<std::string>{"a"});
  REQUIRE(global == std::vector<std::string>{"a", "b", "b"});
  REQUIRE(completed == std::vector<std::string>{"a"});
  REQUIRE(for_b == std::vector<std::string>{"running", "failed"});
}

TEST_CASE("Publish stamps timestamp and sequence", "[event_bus]") {
  crucible::EventBus bus(64);
  std::vector<uint64_t> seqs;
  bus.Subscribe(TopicFilter::Global(), [&](const LifecycleEvent& ev) {
    REQUIRE(ev.timestamp_us > 0U);
    seqs.push_back(ev.sequence_hint);
  });
  bus.PublishReliable(Committed("x", EvaluationStatus::kQueued));
  bus.PublishReliable(Committed("x", EvaluationStatus::kProvisioning));
  bus.Drain();
  REQUIRE(seqs.size() == 2U);
  REQUIRE(seqs[0] < seqs[1]);
}

TEST_CASE("Admission control rejects low priority first", "[event_bus]") {
  crucible::EventBus bus(16);  // low 9, medium 12, high 15
  for (int i = 0; i < 9; ++i) {
    REQUIRE(bus.Publish(Committed("p", EvaluationStatus::kRunning),
                        crucible::MessagePriority::kLow)
                .has_value());
  }
  auto low = bus.Publish(Committed("p", EvaluationStatus::kRunning),
                         crucible::MessagePriority::kLow);
  REQUIRE(!low.has_value());
  REQUIRE(low.get_error() == crucible::BusError::kQueueFull);
  REQUIRE(bus.Publish(Committed("p", EvaluationStatus::kRunning),
                      crucible::MessagePriority::kHigh)
              .has_value());
  REQUIRE(bus.GetStatistics().rejected == 1U);
}

TEST_CASE("PublishReliable delivers inline when ring is full and idle",
          "[event_bus]") {
  crucible::EventBus bus(16);
  int received = 0;
  bus.Subscribe(TopicFilter::Global(),
                [&received](const LifecycleEvent&) { ++received; });
  for (int i = 0; i < 20; ++i) {
    bus.PublishReliable(Committed("r", EvaluationStatus::kRunning));
  }
  REQUIRE(bus.GetStatistics().delivered_inline == 5U);
  bus.Drain();
  REQUIRE(received == 20);
}

TEST_CASE("Unsubscribe stops delivery", "[event_bus]") {
  crucible::EventBus bus(64);
  int received = 0;
  auto h = bus.Subscribe(TopicFilter::Global(),
                         [&received](const LifecycleEvent&) { ++received; });
  REQUIRE(bus.SubscriptionCount() == 1U);
  REQUIRE(bus.Unsubscribe(h));
  REQUIRE(!bus.Unsubscribe(h));
  REQUIRE(!bus.Unsubscribe(crucible::SubscriptionHandle::Invalid()));
  bus.PublishReliable(Committed("u", EvaluationStatus::kRunning));
  bus.Drain();
  REQUIRE(received == 0);
  REQUIRE(bus.SubscriptionCount() == 0U);
}

TEST_CASE("Callbacks may publish follow-up events", "[event_bus]") {
  crucible::EventBus bus(64);
  std::atomic<int> committed{0};
  bus.Subscribe(TopicFilter::Signals(), [&bus](const LifecycleEvent& ev) {
    LifecycleEvent c = ev;
    c.origin = EventOrigin::kCommitted;
    c.sequence_hint = 0;
    bus.PublishReliable(c);
  });
  bus.Subscribe(TopicFilter::Global(),
                [&committed](const LifecycleEvent&) { ++committed; });

  REQUIRE(bus.Start().has_value());
  for (int i = 0; i < 50; ++i) {
    bus.PublishReliable(Signal("s" + std::to_string(i),
                               EvaluationStatus::kProvisioning));
  }
  REQUIRE(bus.Flush());
  REQUIRE(committed.load() == 50);
  bus.Stop();
}

TEST_CASE("Multiple producers with consumer thread", "[event_bus]") {
  crucible::EventBus bus(1024);
  std::atomic<int> received{0};
  bus.Subscribe(TopicFilter::Global(),
                [&received](const LifecycleEvent&) { ++received; });
  REQUIRE(bus.Start().has_value());
  REQUIRE(bus.Start().get_error() == crucible::BusError::kAlreadyRunning);

  std::vector<std::thread> producers;
  for (int t = 0; t < 4; ++t) {
    producers.emplace_back([&bus, t] {
      for (int i = 0; i < 500; ++i) {
        bus.PublishReliable(Committed("p" + std::to_string(t),
                                      EvaluationStatus::kRunning));
      }
    });
  }
  for (auto& p : producers) p.join();
  REQUIRE(bus.Flush());
  REQUIRE(received.load() == 2000);
  bus.Stop();
  REQUIRE(!bus.IsRunning());
}

TEST_CASE("ParseTopic", "[event_bus]") {
  auto g = crucible::ParseTopic("*");
  REQUIRE(g.has_value());
  REQUIRE(g.value().kind == TopicFilter::Kind::kGlobal);

  auto s = crucible::ParseTopic("evaluation:timeout");
  REQUIRE(s.has_value());
  REQUIRE(s.value().kind == TopicFilter::Kind::kStatus);
  REQUIRE(s.value().status == EvaluationStatus::kTimeout);

  auto e = crucible::ParseTopic("evaluation/eval-9");
  REQUIRE(e.has_value());
  REQUIRE(e.value().evaluation_id == "eval-9");
  REQUIRE(crucible::EvaluationTopic("eval-9") == "evaluation/eval-9");

  REQUIRE(!crucible::ParseTopic("evaluation:done").has_value());
  REQUIRE(!crucible::ParseTopic("evaluation/").has_value());
  REQUIRE(!crucible::ParseTopic("other").has_value());
}
