/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file task_router.hpp
 * @brief Priority task router: orders pending evaluations, feeds the
 *        dispatcher from a worker pool and retries transient rejections.
 *
 * Architecture:
 *   Submit() -- validate (sync) --> register queued --> priority queue
 *                                                          |
 *                                      Worker[0..N-1] pop highest eligible
 *                                                          |
 *                                              Dispatcher::Execute()
 *                                    accepted | retryable | permanent
 *                                        done | backoff   | dead letter
 *
 * - Higher priority first; FIFO within equal priority
 * - Capacity rejections retry with exponential backoff + jitter, unbounded
 *   in count but bounded by the queue SLA
 * - Infrastructure rejections additionally stop after RetryPolicy::
 *   max_retries
 * - Workers never wait on unit completion
 */

#ifndef CRUCIBLE_TASK_ROUTER_HPP_
#define CRUCIBLE_TASK_ROUTER_HPP_

#include "crucible/dispatcher.hpp"
#include "crucible/event_bus.hpp"
#include "crucible/log.hpp"
#include "crucible/resources.hpp"
#include "crucible/retry_policy.hpp"
#include "crucible/state_machine.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace crucible {

// ============================================================================
// Configuration / Results
// ============================================================================

struct RouterConfig {
  uint32_t workers = 4;
  RetryPolicy retry;
  uint32_t queue_sla_s = 3600;
  NodeLimits limits;  ///< Must match the dispatcher's limits.
};

enum class RouterError : uint8_t {
  kValidation = 0,
  kDuplicate,
  kNotFound,
  kAlreadyTerminal,
  kShuttingDown,
};

inline const char* RouterErrorName(RouterError e) noexcept {
  switch (e) {
    case RouterError::kValidation:
      return "validation";
    case RouterError::kDuplicate:
      return "duplicate";
    case RouterError::kNotFound:
      return "not_found";
    case RouterError::kAlreadyTerminal:
      return "already_terminal";
    case RouterError::kShuttingDown:
      return "shutting_down";
  }
  return "unknown";
}

/// @brief Submit() failure. reason points to static storage.
struct RouterRejection {
  RouterError kind;
  const char* reason;
};

enum class CancelOutcome : uint8_t {
  kRemovedFromQueue = 0,  ///< Never reached the dispatcher.
  kForwarded,             ///< In flight; the dispatcher settles the race.
};

/// @brief An evaluation the router gave up on.
struct DeadLetter {
  std::string evaluation_id;
  uint32_t attempts;
  TerminationReason reason;
  std::string detail;
  uint64_t submitted_us;
  uint64_t dead_us;
};

struct RouterStatistics {
  uint64_t submitted;
  uint64_t rejected;
  uint64_t dispatched;
  uint64_t retries;
  uint64_t cancelled_in_queue;
  uint64_t cancelled_in_flight;
  uint64_t dead_lettered;
  uint32_t queue_depth;
};

// ============================================================================
// TaskRouter
// ============================================================================

class TaskRouter final {
 public:
  TaskRouter(const RouterConfig& cfg, Dispatcher& dispatcher,
             StateMachine& lifecycle)
      : cfg_(cfg), dispatcher_(dispatcher), lifecycle_(lifecycle) {
    if (cfg_.workers == 0U) cfg_.workers = 1U;
  }

  ~TaskRouter() { Shutdown(); }

  TaskRouter(const TaskRouter&) = delete;
  TaskRouter& operator=(const TaskRouter&) = delete;

  // ======================== Lifecycle ========================

  void Start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) return;
    shutdown_.store(false, std::memory_order_release);
    for (uint32_t i = 0U; i < cfg_.workers; ++i) {
      threads_.emplace_back(&TaskRouter::WorkerLoop, this, i);
    }
    CRUCIBLE_LOG_INFO("Router", "started %u worker(s), SLA %us", cfg_.workers,
                      cfg_.queue_sla_s);
  }

  /**
   * @brief Stop workers. Queued evaluations stay queued (not cancelled).
   */
  void Shutdown() {
    if (!running_.load(std::memory_order_acquire)) return;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      shutdown_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
    for (auto& t : threads_) {
      if (t.joinable()) t.join();
    }
    threads_.clear();
    running_.store(false, std::memory_order_release);
  }

  // ======================== Submission ========================

  /**
   * @brief Validate synchronously and enqueue.
   *
   * Invalid requests are rejected here and never enter the queue.
   */
  expected<void, RouterRejection> Submit(const EvaluationRequest& request) {
    using R = expected<void, RouterRejection>;
    if (shutdown_.load(std::memory_order_acquire)) {
      return R::error(
          RouterRejection{RouterError::kShuttingDown, "router is stopping"});
    }
    EvaluationRequest req = request;
    req.priority = NormalizePriority(req.priority);
    ApplyResourceDefaults(req.resources, cfg_.limits);

    auto valid = ValidateRequest(req, cfg_.limits);
    if (!valid) {
      rejected_.fetch_add(1, std::memory_order_relaxed);
      const char* why = ValidationFailureName(valid.get_error());
      CRUCIBLE_LOG_INFO("Router", "%s rejected: %s", req.id.c_str(), why);
      return R::error(RouterRejection{RouterError::kValidation, why});
    }
    // Larger than the whole pool: never admissible, never queued.
    const CapacityLimits pool = dispatcher_.PoolLimits();
    if (pool.slots == 0U || req.resources.memory_mb > pool.memory_mb ||
        req.resources.cpu_millicores > pool.cpu_millicores) {
      rejected_.fetch_add(1, std::memory_order_relaxed);
      CRUCIBLE_LOG_INFO("Router", "%s rejected: exceeds capacity pool",
                        req.id.c_str());
      return R::error(RouterRejection{RouterError::kValidation,
                                      "request exceeds the capacity pool"});
    }

    auto reg = lifecycle_.Register(req.id, req.priority);
    if (!reg) {
      rejected_.fetch_add(1, std::memory_order_relaxed);
      return R::error(RouterRejection{RouterError::kDuplicate,
                                      "evaluation id already submitted"});
    }

    const uint64_t now = SteadyNowUs();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const Key key{-static_cast<int64_t>(req.priority), next_seq_++};
      Pending p;
      p.submitted_us = now;
      p.not_before_us = 0;
      p.seq = key.seq;
      p.request = std::move(req);
      index_[p.request.id] = key;
      ++enqueue_seq_;
      CRUCIBLE_LOG_DEBUG("Router", "%s queued (%s, lane %s)",
                         p.request.id.c_str(),
                         PriorityClassName(p.request.priority),
                         PriorityLane(p.request.priority));
      queue_.emplace(key, std::move(p));
    }
    submitted_.fetch_add(1, std::memory_order_relaxed);
    cv_.notify_one();
    return R::success();
  }

  // ======================== Cancellation ========================

  /**
   * @brief Cancel a queued or in-flight evaluation.
   *
   * A queued evaluation is removed and settled as cancelled without the
   * dispatcher being involved. Anything already handed to the dispatcher
   * is forwarded there.
   */
  expected<CancelOutcome, RouterError> Cancel(const std::string& id) {
    using R = expected<CancelOutcome, RouterError>;
    bool removed = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = index_.find(id);
      if (it != index_.end()) {
        queue_.erase(it->second);
        index_.erase(it);
        removed = true;
      } else if (dispatching_.count(id) != 0U) {
        // A worker is inside Execute(); it acts on this flag afterwards.
        cancel_requested_.insert(id);
        cancelled_in_flight_.fetch_add(1, std::memory_order_relaxed);
        return R::success(CancelOutcome::kForwarded);
      }
    }
    if (removed) {
      (void)lifecycle_.Cancel(id, "cancelled while queued");
      cancelled_in_queue_.fetch_add(1, std::memory_order_relaxed);
      CRUCIBLE_LOG_INFO("Router", "%s cancelled while queued", id.c_str());
      return R::success(CancelOutcome::kRemovedFromQueue);
    }

    auto fwd = dispatcher_.Cancel(id);
    if (fwd) {
      cancelled_in_flight_.fetch_add(1, std::memory_order_relaxed);
      return R::success(CancelOutcome::kForwarded);
    }
    if (fwd.get_error() == DispatchError::kAlreadyTerminal ||
        lifecycle_.IsTerminalNow(id)) {
      return R::error(RouterError::kAlreadyTerminal);
    }
    return R::error(RouterError::kNotFound);
  }

  // ======================== Query ========================

  uint32_t QueueDepth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(queue_.size());
  }

  bool IsQueued(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.find(id) != index_.end();
  }

  /// @brief Queued ids in dequeue order (eligibility ignored).
  std::vector<std::string> QueuedIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(queue_.size());
    for (const auto& kv : queue_) ids.push_back(kv.second.request.id);
    return ids;
  }

  std::vector<DeadLetter> DeadLetters() const {
    std::lock_guard<std::mutex> lock(dead_mutex_);
    return dead_letters_;
  }

  RouterStatistics GetStatistics() const {
    RouterStatistics s;
    s.submitted = submitted_.load(std::memory_order_relaxed);
    s.rejected = rejected_.load(std::memory_order_relaxed);
    s.dispatched = dispatched_.load(std::memory_order_relaxed);
    s.retries = retries_.load(std::memory_order_relaxed);
    s.cancelled_in_queue = cancelled_in_queue_.load(std::memory_order_relaxed);
    s.cancelled_in_flight =
        cancelled_in_flight_.load(std::memory_order_relaxed);
    s.dead_lettered = dead_lettered_.load(std::memory_order_relaxed);
    s.queue_depth = QueueDepth();
    return s;
  }

 private:
  /// Ordering key: negated priority (so higher first), then submission seq.
  struct Key {
    int64_t neg_priority;
    uint64_t seq;
    bool operator<(const Key& o) const noexcept {
      return (neg_priority != o.neg_priority) ? neg_priority < o.neg_priority
                                              : seq < o.seq;
    }
  };

  struct Pending {
    EvaluationRequest request;
    uint64_t submitted_us = 0;
    uint64_t not_before_us = 0;
    uint64_t seq = 0;             ///< Arrival order; kept across retries.
    uint32_t attempts = 0;        ///< Execute() calls so far.
    uint32_t infra_attempts = 0;  ///< Infrastructure rejections so far.
  };

  /// Pop the highest-priority entry whose backoff has elapsed.
  /// Caller holds mutex_. Sets @p wait_us to the earliest not_before.
  bool PopEligible(uint64_t now, Pending& out, uint64_t& wait_us) {
    wait_us = UINT64_MAX;
    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
      if (it->second.not_before_us <= now) {
        out = std::move(it->second);
        index_.erase(out.request.id);
        queue_.erase(it);
        dispatching_.insert(out.request.id);
        return true;
      }
      const uint64_t w = it->second.not_before_us - now;
      if (w < wait_us) wait_us = w;
    }
    return false;
  }

  void Requeue(Pending&& p) {
    const std::string id = p.request.id;
    bool cancelled = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      dispatching_.erase(id);
      cancelled = (cancel_requested_.erase(id) != 0U);
      if (!cancelled) {
        const Key key{-static_cast<int64_t>(p.request.priority), p.seq};
        index_[id] = key;
        ++enqueue_seq_;
        queue_.emplace(key, std::move(p));
      }
    }
    if (cancelled) {
      (void)lifecycle_.Cancel(id, "cancelled while queued");
      return;
    }
    cv_.notify_one();
  }

  void FinishDispatching(const std::string& id, bool& cancel_requested) {
    std::lock_guard<std::mutex> lock(mutex_);
    dispatching_.erase(id);
    cancel_requested = (cancel_requested_.erase(id) != 0U);
  }

  void DeadLetterEvaluation(const Pending& p, TerminationReason reason,
                            const std::string& detail) {
    DeadLetter dl{p.request.id, p.attempts, reason, detail, p.submitted_us,
                  SteadyNowUs()};
    {
      std::lock_guard<std::mutex> lock(dead_mutex_);
      dead_letters_.push_back(dl);
    }
    dead_lettered_.fetch_add(1, std::memory_order_relaxed);
    CRUCIBLE_LOG_WARN("Router", "%s dead-lettered after %u attempt(s): %s",
                      p.request.id.c_str(), p.attempts, detail.c_str());

    LifecycleEvent ev;
    ev.evaluation_id = p.request.id;
    ev.type = EvaluationStatus::kFailed;
    ev.reason = reason;
    ev.detail = detail;
    ev.timestamp_us = dl.dead_us;
    (void)lifecycle_.Apply(ev);
  }

  void HandleRejection(Pending&& p, const Rejection& rej, std::mt19937& rng) {
    bool cancel_requested = false;
    if (!rej.retryable) {
      FinishDispatching(p.request.id, cancel_requested);
      if (cancel_requested) {
        (void)lifecycle_.Cancel(p.request.id, "cancelled while queued");
        return;
      }
      DeadLetterEvaluation(p, TerminationReason::kRejected, rej.reason);
      return;
    }

    const uint64_t now = SteadyNowUs();
    const uint64_t sla_us = static_cast<uint64_t>(cfg_.queue_sla_s) * 1000000ULL;
    if (now - p.submitted_us >= sla_us) {
      FinishDispatching(p.request.id, cancel_requested);
      if (cancel_requested) {
        (void)lifecycle_.Cancel(p.request.id, "cancelled while queued");
        return;
      }
      DeadLetterEvaluation(p, TerminationReason::kQueueSlaExceeded,
                           std::string("queue SLA exceeded, last rejection: ") +
                               rej.reason);
      return;
    }
    if (rej.kind == DispatchError::kInfrastructure &&
        ++p.infra_attempts > cfg_.retry.max_retries) {
      FinishDispatching(p.request.id, cancel_requested);
      if (cancel_requested) {
        (void)lifecycle_.Cancel(p.request.id, "cancelled while queued");
        return;
      }
      DeadLetterEvaluation(p, TerminationReason::kInfrastructure,
                           std::string("sandbox unavailable: ") + rej.reason);
      return;
    }

    uint64_t delay_ms = cfg_.retry.NextDelayMs(p.attempts - 1U, rng);
    const uint64_t remaining_ms = (sla_us - (now - p.submitted_us)) / 1000ULL;
    if (delay_ms > remaining_ms) delay_ms = remaining_ms;
    p.not_before_us = now + delay_ms * 1000ULL;
    retries_.fetch_add(1, std::memory_order_relaxed);
    CRUCIBLE_LOG_DEBUG("Router", "%s %s, retry %u in %llums",
                       p.request.id.c_str(), rej.reason, p.attempts,
                       static_cast<unsigned long long>(delay_ms));
    Requeue(std::move(p));
  }

  void WorkerLoop(uint32_t worker_id) {
    std::mt19937 rng(std::random_device{}() + worker_id);
    detail::AdaptiveBackoff backoff;

    while (!shutdown_.load(std::memory_order_acquire)) {
      Pending p;
      bool got = false;
      uint64_t wait_us = UINT64_MAX;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        got = PopEligible(SteadyNowUs(), p, wait_us);
      }

      if (!got) {
        // Empty queue: spin briefly before the condition variable.
        if (wait_us == UINT64_MAX && backoff.InSpinPhase()) {
          backoff.Wait();
          continue;
        }
        uint64_t wait_ms = (wait_us == UINT64_MAX) ? 10U : wait_us / 1000ULL;
        if (wait_ms < 1U) wait_ms = 1U;
        if (wait_ms > 10U) wait_ms = 10U;
        std::unique_lock<std::mutex> lk(mutex_);
        const uint64_t seen = enqueue_seq_;
        cv_.wait_for(lk, std::chrono::milliseconds(wait_ms), [this, seen] {
          return shutdown_.load(std::memory_order_acquire) ||
                 enqueue_seq_ != seen;
        });
        backoff.Reset();
        continue;
      }
      backoff.Reset();

      ++p.attempts;
      auto result = dispatcher_.Execute(p.request);
      if (result) {
        dispatched_.fetch_add(1, std::memory_order_relaxed);
        bool cancel_requested = false;
        FinishDispatching(p.request.id, cancel_requested);
        if (cancel_requested) (void)dispatcher_.Cancel(p.request.id);
        continue;
      }
      HandleRejection(std::move(p), result.get_error(), rng);
    }
  }

  RouterConfig cfg_;
  Dispatcher& dispatcher_;
  StateMachine& lifecycle_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<Key, Pending> queue_;
  std::unordered_map<std::string, Key> index_;
  std::unordered_set<std::string> dispatching_;
  std::unordered_set<std::string> cancel_requested_;
  uint64_t next_seq_ = 0;
  uint64_t enqueue_seq_ = 0;  ///< Bumped on every insert, wakes idle workers.

  mutable std::mutex dead_mutex_;
  std::vector<DeadLetter> dead_letters_;

  std::vector<std::thread> threads_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_{false};

  std::atomic<uint64_t> submitted_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> dispatched_{0};
  std::atomic<uint64_t> retries_{0};
  std::atomic<uint64_t> cancelled_in_queue_{0};
  std::atomic<uint64_t> cancelled_in_flight_{0};
  std::atomic<uint64_t> dead_lettered_{0};
};

}  // namespace crucible

#endif  // CRUCIBLE_TASK_ROUTER_HPP_
