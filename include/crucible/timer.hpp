/**
 * @file timer.hpp
 * @brief Header-only periodic and one-shot timer scheduler.
 *
 * A background thread fires registered callbacks at their deadlines using
 * std::chrono::steady_clock. Callbacks run on the scheduler thread outside
 * the slot lock, so a callback may Add() or Remove() tasks.
 *
 * All public methods are thread-safe.
 */

#ifndef CRUCIBLE_TIMER_HPP_
#define CRUCIBLE_TIMER_HPP_

#include "crucible/platform.hpp"
#include "crucible/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace crucible {

/**
 * @brief Callback invoked by the scheduler.
 *
 * @param ctx User-supplied opaque context pointer (may be nullptr).
 */
using TimerTaskFn = void (*)(void* ctx);

// ============================================================================
// TimerScheduler
// ============================================================================

/**
 * @brief Fixed-capacity timer scheduler driven by one background thread.
 *
 * @code
 *   crucible::TimerScheduler sched(8);
 *   sched.Add(50, &Dispatcher::TickThunk, &dispatcher);
 *   sched.Start();
 *   ...
 *   sched.Stop();
 * @endcode
 */
class TimerScheduler final {
 public:
  explicit TimerScheduler(uint32_t max_tasks = 16)
      : slots_(new TaskSlot[max_tasks]), max_tasks_(max_tasks) {}

  ~TimerScheduler() { Stop(); }

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;

  // --------------------------------------------------------------------------
  // Task Management
  // --------------------------------------------------------------------------

  /**
   * @brief Register a periodic task firing every @p period_ms.
   * @return kInvalidPeriod if period_ms == 0, kSlotsFull if no slot is free.
   */
  expected<TimerTaskId, TimerError> Add(uint32_t period_ms, TimerTaskFn fn,
                                        void* ctx = nullptr) {
    return AddTask(period_ms, fn, ctx, false);
  }

  /**
   * @brief Register a task that fires once after @p delay_ms and then frees
   *        its slot.
   */
  expected<TimerTaskId, TimerError> AddOneShot(uint32_t delay_ms,
                                               TimerTaskFn fn,
                                               void* ctx = nullptr) {
    return AddTask(delay_ms, fn, ctx, true);
  }

  /**
   * @brief Remove a task. After return the callback is not running and is
   *        not invoked again. Called from inside a callback, an invocation
   *        in progress is not waited for.
   */
  expected<void, TimerError> Remove(TimerTaskId task_id) {
    bool found = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (uint32_t i = 0U; i < max_tasks_; ++i) {
        if (slots_[i].active && slots_[i].id == task_id.value()) {
          slots_[i].active = false;
          found = true;
          break;
        }
      }
    }
    if (!found) {
      return expected<void, TimerError>::error(TimerError::kNotRunning);
    }
    if (std::this_thread::get_id() != worker_id_.load()) {
      std::lock_guard<std::mutex> wait_fire(fire_mutex_);
    }
    return expected<void, TimerError>::success();
  }

  // --------------------------------------------------------------------------
  // Scheduler Lifecycle
  // --------------------------------------------------------------------------

  expected<void, TimerError> Start() {
    bool expected_running = false;
    if (!running_.compare_exchange_strong(expected_running, true,
                                          std::memory_order_acq_rel)) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    worker_ = std::thread(&TimerScheduler::ScheduleLoop, this);
    return expected<void, TimerError>::success();
  }

  /** @brief Stop and join the scheduler thread. Safe if not running. */
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
      worker_.join();
    }
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  uint32_t TaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0U;
    for (uint32_t i = 0U; i < max_tasks_; ++i) {
      if (slots_[i].active) ++count;
    }
    return count;
  }

  uint64_t FiredCount() const noexcept {
    return fired_.load(std::memory_order_relaxed);
  }

 private:
  struct TaskSlot {
    TimerTaskFn fn = nullptr;
    void* ctx = nullptr;
    uint64_t period_ns = 0;
    uint64_t next_fire_ns = 0;
    uint32_t id = 0;
    bool one_shot = false;
    bool active = false;
  };

  struct DueTask {
    uint32_t index;
    uint32_t id;
  };

  expected<TimerTaskId, TimerError> AddTask(uint32_t period_ms, TimerTaskFn fn,
                                            void* ctx, bool one_shot) {
    if (period_ms == 0U || fn == nullptr) {
      return expected<TimerTaskId, TimerError>::error(
          TimerError::kInvalidPeriod);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t i = 0U; i < max_tasks_; ++i) {
      TaskSlot& slot = slots_[i];
      if (!slot.active) {
        slot.fn = fn;
        slot.ctx = ctx;
        slot.period_ns = static_cast<uint64_t>(period_ms) * 1000000ULL;
        slot.next_fire_ns = SteadyNowNs() + slot.period_ns;
        slot.id = next_id_++;
        slot.one_shot = one_shot;
        slot.active = true;
        cv_.notify_all();
        return expected<TimerTaskId, TimerError>::success(TimerTaskId(slot.id));
      }
    }
    return expected<TimerTaskId, TimerError>::error(TimerError::kSlotsFull);
  }

  /**
   * Collect due tasks under the lock and advance their deadlines (skipping
   * missed periods). Each one is fired unlocked after re-checking that it
   * was not removed meanwhile. Sleeps for half the shortest remaining
   * deadline, clamped to [1ms, 10ms].
   */
  void ScheduleLoop() {
    worker_id_.store(std::this_thread::get_id());
    std::vector<DueTask> due;
    due.reserve(max_tasks_);
    while (running_.load(std::memory_order_acquire)) {
      uint64_t min_remaining = UINT64_MAX;
      due.clear();
      {
        std::lock_guard<std::mutex> lock(mutex_);
        const uint64_t now = SteadyNowNs();
        for (uint32_t i = 0U; i < max_tasks_; ++i) {
          TaskSlot& slot = slots_[i];
          if (!slot.active) continue;
          if (now >= slot.next_fire_ns) {
            due.push_back(DueTask{i, slot.id});
            if (slot.one_shot) continue;
            slot.next_fire_ns += slot.period_ns;
            while (slot.next_fire_ns <= now) {
              slot.next_fire_ns += slot.period_ns;
            }
          }
          const uint64_t remaining = slot.next_fire_ns - now;
          if (remaining < min_remaining) min_remaining = remaining;
        }
      }

      for (const DueTask& task : due) {
        std::lock_guard<std::mutex> firing(fire_mutex_);
        TimerTaskFn fn = nullptr;
        void* ctx = nullptr;
        {
          std::lock_guard<std::mutex> lock(mutex_);
          TaskSlot& slot = slots_[task.index];
          if (!slot.active || slot.id != task.id) continue;
          fn = slot.fn;
          ctx = slot.ctx;
          if (slot.one_shot) slot.active = false;
        }
        fn(ctx);
        fired_.fetch_add(1, std::memory_order_relaxed);
      }

      uint64_t sleep_ns =
          (min_remaining == UINT64_MAX) ? 10000000ULL : (min_remaining / 2);
      if (sleep_ns < 1000000ULL) sleep_ns = 1000000ULL;
      if (sleep_ns > 10000000ULL) sleep_ns = 10000000ULL;

      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait_for(lock, std::chrono::nanoseconds(sleep_ns), [this] {
        return !running_.load(std::memory_order_acquire);
      });
    }
  }

  std::unique_ptr<TaskSlot[]> slots_;
  const uint32_t max_tasks_;
  uint32_t next_id_ = 1;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> fired_{0};
  std::thread worker_;
  std::atomic<std::thread::id> worker_id_{};
  mutable std::mutex mutex_;
  std::mutex fire_mutex_;  ///< Held while a callback runs.
  std::condition_variable cv_;
};

}  // namespace crucible

#endif  // CRUCIBLE_TIMER_HPP_
