/**
 * @file event_bus.hpp
 * @brief Lock-free MPSC lifecycle event bus with topic filtering and
 *        priority-based admission control.
 *
 * Producers (dispatcher supervision, state machine) publish LifecycleEvents
 * into a pre-allocated ring; a single consumer drains the ring and delivers
 * each event to every matching subscription.
 *
 * Subscriptions filter by:
 *   - Signals()         raw supervision signals (consumed by the state machine)
 *   - Global()          every committed lifecycle event (platform-wide feed)
 *   - Status(s)         committed events of one type ("evaluation:completed")
 *   - Evaluation(id)    committed events for one evaluation
 *
 * Delivery is at-least-once and ordering across producers is best-effort;
 * consumers must be idempotent. PublishReliable() never drops: it backs off
 * while the ring is full, and delivers inline when called on the consumer
 * thread itself.
 *
 * Callbacks run on the consumer thread while a shared lock over the
 * subscription table is held. They must not Subscribe() or Unsubscribe().
 */

#ifndef CRUCIBLE_EVENT_BUS_HPP_
#define CRUCIBLE_EVENT_BUS_HPP_

#include "crucible/evaluation.hpp"
#include "crucible/log.hpp"
#include "crucible/platform.hpp"
#include "crucible/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#ifndef CRUCIBLE_BUS_MAX_SUBSCRIPTIONS
#define CRUCIBLE_BUS_MAX_SUBSCRIPTIONS 256U
#endif

#ifndef CRUCIBLE_BUS_BATCH_SIZE
#define CRUCIBLE_BUS_BATCH_SIZE 256U
#endif

namespace crucible {

// ============================================================================
// FNV-1a Hash Function
// ============================================================================

/**
 * @brief FNV-1a 32-bit hash of a null-terminated string (0 for nullptr).
 */
constexpr uint32_t Fnv1a32(const char* str) noexcept {
  if (str == nullptr) return 0;
  uint32_t hash = 2166136261u;
  while (*str) {
    hash ^= static_cast<uint32_t>(static_cast<uint8_t>(*str++));
    hash *= 16777619u;
  }
  return hash;
}

// ============================================================================
// Spin Primitives
// ============================================================================

namespace detail {

inline void CpuRelax() noexcept {
#if defined(__x86_64__) || defined(__i386__)
  __builtin_ia32_pause();
#elif defined(__aarch64__) || defined(__arm__)
  asm volatile("yield" ::: "memory");
#else
  std::this_thread::yield();
#endif
}

/**
 * @brief Reader-writer spin lock.
 *
 * state_ >= 0 : number of active readers (0 = unlocked)
 * state_ == -1: writer holds the lock
 *
 * Readers never wait for a queued writer, so a reader may re-enter.
 */
class SharedSpinLock {
 public:
  SharedSpinLock() noexcept = default;

  void lock_shared() noexcept {
    uint32_t backoff = 1;
    for (;;) {
      int32_t state = state_.load(std::memory_order_relaxed);
      if (state >= 0 &&
          state_.compare_exchange_weak(state, state + 1,
                                       std::memory_order_acquire,
                                       std::memory_order_relaxed)) {
        return;
      }
      Backoff(backoff);
    }
  }

  void unlock_shared() noexcept {
    state_.fetch_sub(1, std::memory_order_release);
  }

  void lock() noexcept {
    uint32_t backoff = 1;
    for (;;) {
      int32_t expected = 0;
      if (state_.compare_exchange_weak(expected, kWriterActive,
                                       std::memory_order_acquire,
                                       std::memory_order_relaxed)) {
        return;
      }
      Backoff(backoff);
    }
  }

  void unlock() noexcept { state_.store(0, std::memory_order_release); }

 private:
  static constexpr int32_t kWriterActive = -1;
  static constexpr uint32_t kMaxBackoff = 1024;

  static void Backoff(uint32_t& backoff) noexcept {
    for (uint32_t i = 0; i < backoff; ++i) {
      CpuRelax();
    }
    if (backoff < kMaxBackoff) {
      backoff <<= 1;
    } else {
      std::this_thread::yield();
    }
  }

  std::atomic<int32_t> state_{0};
};

/**
 * @brief Three-phase backoff for busy-wait loops: spin, yield, then sleep
 *        50us.
 */
class AdaptiveBackoff {
 public:
  void Reset() noexcept { spin_count_ = 0U; }

  void Wait() noexcept {
    if (spin_count_ < kSpinLimit) {
      const uint32_t iters = 1U << spin_count_;
      for (uint32_t i = 0U; i < iters; ++i) {
        CpuRelax();
      }
      ++spin_count_;
    } else if (spin_count_ < kSpinLimit + kYieldLimit) {
      std::this_thread::yield();
      ++spin_count_;
    } else {
      std::this_thread::sleep_for(std::chrono::microseconds(50));
    }
  }

  bool InSpinPhase() const noexcept { return spin_count_ < kSpinLimit; }

 private:
  static constexpr uint32_t kSpinLimit = 6U;
  static constexpr uint32_t kYieldLimit = 4U;

  uint32_t spin_count_ = 0U;
};

}  // namespace detail

// ============================================================================
// Message Priority
// ============================================================================

enum class MessagePriority : uint8_t {
  kLow = 0,     ///< Rejected when queue >= 60% full
  kMedium = 1,  ///< Rejected when queue >= 80% full
  kHigh = 2     ///< Rejected when queue >= 99% full
};

enum class BusError : uint8_t {
  kQueueFull = 0,
  kSubscriptionsFull,
  kNotRunning,
  kAlreadyRunning,
};

// ============================================================================
// TopicFilter
// ============================================================================

/**
 * @brief Selects which events a subscription receives.
 */
struct TopicFilter {
  enum class Kind : uint8_t {
    kSignals = 0,  ///< Raw supervision signals (origin kSignal).
    kGlobal,       ///< All committed events.
    kStatus,       ///< Committed events of one status.
    kEvaluation,   ///< Committed events for one evaluation id.
  };

  Kind kind = Kind::kGlobal;
  EvaluationStatus status = EvaluationStatus::kQueued;
  std::string evaluation_id;
  uint32_t id_hash = 0;

  static TopicFilter Signals() {
    TopicFilter f;
    f.kind = Kind::kSignals;
    return f;
  }

  static TopicFilter Global() { return TopicFilter{}; }

  static TopicFilter Status(EvaluationStatus s) {
    TopicFilter f;
    f.kind = Kind::kStatus;
    f.status = s;
    return f;
  }

  static TopicFilter Evaluation(const std::string& id) {
    TopicFilter f;
    f.kind = Kind::kEvaluation;
    f.evaluation_id = id;
    f.id_hash = Fnv1a32(id.c_str());
    return f;
  }

  bool Matches(const LifecycleEvent& ev, uint32_t ev_id_hash) const noexcept {
    switch (kind) {
      case Kind::kSignals:
        return ev.origin == EventOrigin::kSignal;
      case Kind::kGlobal:
        return ev.origin == EventOrigin::kCommitted;
      case Kind::kStatus:
        return ev.origin == EventOrigin::kCommitted && ev.type == status;
      case Kind::kEvaluation:
        return ev.origin == EventOrigin::kCommitted && ev_id_hash == id_hash &&
               ev.evaluation_id == evaluation_id;
    }
    return false;
  }
};

/**
 * @brief Parse a channel name: "*", "signals", "evaluation:<status>" or
 *        "evaluation/<id>".
 */
inline optional<TopicFilter> ParseTopic(const char* name) {
  if (name == nullptr) return {};
  if (std::strcmp(name, "*") == 0) return TopicFilter::Global();
  if (std::strcmp(name, "signals") == 0) return TopicFilter::Signals();
  static constexpr char kStatusPrefix[] = "evaluation:";
  static constexpr char kIdPrefix[] = "evaluation/";
  const size_t plen = sizeof(kStatusPrefix) - 1;
  if (std::strncmp(name, kStatusPrefix, plen) == 0) {
    auto s = ParseStatus(name + plen);
    if (!s.has_value()) return {};
    return TopicFilter::Status(s.value());
  }
  if (std::strncmp(name, kIdPrefix, plen) == 0 && name[plen] != '\0') {
    return TopicFilter::Evaluation(std::string(name + plen));
  }
  return {};
}

/// @brief Per-evaluation topic name, e.g. "evaluation/eval-42".
inline std::string EvaluationTopic(const std::string& evaluation_id) {
  return "evaluation/" + evaluation_id;
}

// ============================================================================
// Subscription Handle / Statistics
// ============================================================================

struct SubscriptionHandle {
  uint32_t slot;
  uint32_t callback_id;

  bool IsValid() const noexcept { return callback_id != UINT32_MAX; }

  static SubscriptionHandle Invalid() noexcept { return {0, UINT32_MAX}; }
};

struct alignas(kCacheLineSize) BusStatistics {
  std::atomic<uint64_t> published{0};
  std::atomic<uint64_t> rejected{0};
  std::atomic<uint64_t> processed{0};
  std::atomic<uint64_t> delivered_inline{0};
  std::atomic<uint64_t> reliable_retries{0};
  std::atomic<uint64_t> admission_rechecks{0};

  void Reset() noexcept {
    published.store(0, std::memory_order_relaxed);
    rejected.store(0, std::memory_order_relaxed);
    processed.store(0, std::memory_order_relaxed);
    delivered_inline.store(0, std::memory_order_relaxed);
    reliable_retries.store(0, std::memory_order_relaxed);
    admission_rechecks.store(0, std::memory_order_relaxed);
  }
};

struct BusStatisticsSnapshot {
  uint64_t published;
  uint64_t rejected;
  uint64_t processed;
  uint64_t delivered_inline;
  uint64_t reliable_retries;
  uint64_t admission_rechecks;
};

// ============================================================================
// EventBus
// ============================================================================

/**
 * @brief Multi-producer single-consumer lifecycle event bus.
 *
 * Owned explicitly by the composition root and passed by reference to
 * publishers and subscribers.
 */
class EventBus final {
 public:
  using Callback = std::function<void(const LifecycleEvent&)>;

  /**
   * @param queue_depth Ring capacity, rounded up to a power of two (>= 16).
   */
  explicit EventBus(uint32_t queue_depth = 4096U)
      : depth_(RoundUpPow2(queue_depth)),
        mask_(depth_ - 1U),
        low_threshold_((depth_ * 60U) / 100U),
        medium_threshold_((depth_ * 80U) / 100U),
        high_threshold_((depth_ * 99U) / 100U),
        ring_(new RingNode[depth_]),
        producer_pos_(0),
        consumer_pos_(0),
        next_seq_(1),
        next_callback_id_(1) {
    for (uint32_t i = 0; i < depth_; ++i) {
      ring_[i].sequence.store(i, std::memory_order_relaxed);
    }
  }

  ~EventBus() { Stop(); }

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // ======================== Publish API ========================

  /**
   * @brief Enqueue an event subject to admission control.
   *
   * timestamp_us and sequence_hint are stamped here when left at zero.
   */
  expected<void, BusError> Publish(LifecycleEvent event,
                                   MessagePriority priority) {
    Stamp(event);
    if (!TryEnqueue(event, priority)) {
      stats_.rejected.fetch_add(1, std::memory_order_relaxed);
      CRUCIBLE_LOG_WARN("Bus", "rejected %s event for %s (depth %u/%u)",
                        StatusName(event.type), event.evaluation_id.c_str(),
                        Depth(), depth_);
      return expected<void, BusError>::error(BusError::kQueueFull);
    }
    return expected<void, BusError>::success();
  }

  /**
   * @brief Enqueue an event that must not be lost.
   *
   * Backs off while the ring is full. On the consumer thread, or when no
   * consumer is running, a full ring is bypassed by delivering inline.
   */
  void PublishReliable(LifecycleEvent event) {
    Stamp(event);
    detail::AdaptiveBackoff backoff;
    for (;;) {
      if (TryEnqueue(event, MessagePriority::kHigh)) return;
      if (IsConsumerThread() || !running_.load(std::memory_order_acquire)) {
        stats_.delivered_inline.fetch_add(1, std::memory_order_relaxed);
        Deliver(event);
        return;
      }
      stats_.reliable_retries.fetch_add(1, std::memory_order_relaxed);
      backoff.Wait();
    }
  }

  // ======================== Subscribe API ========================

  SubscriptionHandle Subscribe(TopicFilter filter, Callback callback) {
    callback_lock_.lock();
    for (uint32_t i = 0; i < CRUCIBLE_BUS_MAX_SUBSCRIPTIONS; ++i) {
      CallbackEntry& entry = callbacks_[i];
      if (!entry.active) {
        entry.id = next_callback_id_++;
        entry.filter = std::move(filter);
        entry.callback = std::move(callback);
        entry.active = true;
        ++subscription_count_;
        SubscriptionHandle handle{i, entry.id};
        callback_lock_.unlock();
        return handle;
      }
    }
    callback_lock_.unlock();
    CRUCIBLE_LOG_ERROR("Bus", "subscription table full (%u)",
                       CRUCIBLE_BUS_MAX_SUBSCRIPTIONS);
    return SubscriptionHandle::Invalid();
  }

  bool Unsubscribe(const SubscriptionHandle& handle) {
    if (!handle.IsValid() || handle.slot >= CRUCIBLE_BUS_MAX_SUBSCRIPTIONS) {
      return false;
    }
    Callback old;
    {
      callback_lock_.lock();
      CallbackEntry& entry = callbacks_[handle.slot];
      if (entry.active && entry.id == handle.callback_id) {
        entry.active = false;
        old = std::move(entry.callback);
        entry.callback = nullptr;
        entry.filter = TopicFilter{};
        --subscription_count_;
      }
      callback_lock_.unlock();
    }
    // Destroyed outside the lock.
    return static_cast<bool>(old);
  }

  uint32_t SubscriptionCount() const noexcept {
    callback_lock_.lock_shared();
    uint32_t n = subscription_count_;
    callback_lock_.unlock_shared();
    return n;
  }

  // ======================== Processing API ========================

  /**
   * @brief Deliver up to CRUCIBLE_BUS_BATCH_SIZE pending events.
   *
   * Single consumer only: either the thread started by Start(), or the
   * caller when the bus is driven manually.
   */
  uint32_t ProcessBatch() {
    uint32_t processed = 0;
    uint32_t cons_pos = consumer_pos_.load(std::memory_order_relaxed);

    for (uint32_t i = 0; i < CRUCIBLE_BUS_BATCH_SIZE; ++i) {
      RingNode& node = ring_[cons_pos & mask_];
      const uint32_t seq = node.sequence.load(std::memory_order_acquire);
      if (seq != cons_pos + 1U) break;

      LifecycleEvent event = std::move(node.event);
      node.sequence.store(cons_pos + depth_, std::memory_order_release);
      ++cons_pos;
      consumer_pos_.store(cons_pos, std::memory_order_release);
      ++processed;

      Deliver(event);
      delivered_pos_.store(cons_pos, std::memory_order_release);
      stats_.processed.fetch_add(1, std::memory_order_relaxed);
    }
    return processed;
  }

  /// @brief Process until the ring is empty (manual mode only).
  uint32_t Drain() {
    uint32_t total = 0;
    uint32_t n = 0;
    while ((n = ProcessBatch()) > 0) total += n;
    return total;
  }

  /**
   * @brief Start the consumer thread.
   */
  expected<void, BusError> Start() {
    bool expected_running = false;
    if (!running_.compare_exchange_strong(expected_running, true)) {
      return expected<void, BusError>::error(BusError::kAlreadyRunning);
    }
    stop_requested_.store(false, std::memory_order_release);
    consumer_ = std::thread([this] { ConsumerLoop(); });
    return expected<void, BusError>::success();
  }

  /**
   * @brief Stop the consumer thread after a final drain.
   */
  void Stop() {
    if (!running_.load(std::memory_order_acquire)) return;
    stop_requested_.store(true, std::memory_order_release);
    if (consumer_.joinable()) consumer_.join();
    running_.store(false, std::memory_order_release);
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  /**
   * @brief Wait until the bus is idle: every enqueued event, including those
   *        published by callbacks while draining, has been delivered.
   * @return false on timeout.
   */
  bool Flush(uint32_t timeout_ms = 5000U) {
    const uint64_t deadline = SteadyNowUs() + uint64_t{timeout_ms} * 1000U;
    for (;;) {
      if (!running_.load(std::memory_order_acquire)) {
        Drain();
      }
      const uint32_t prod = producer_pos_.load(std::memory_order_acquire);
      if (delivered_pos_.load(std::memory_order_acquire) == prod) return true;
      if (SteadyNowUs() >= deadline) return false;
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }

  // ======================== Query API ========================

  uint32_t Depth() const noexcept {
    uint32_t prod = producer_pos_.load(std::memory_order_acquire);
    uint32_t cons = consumer_pos_.load(std::memory_order_acquire);
    return prod - cons;
  }

  uint32_t Capacity() const noexcept { return depth_; }

  BusStatisticsSnapshot GetStatistics() const noexcept {
    return BusStatisticsSnapshot{
        stats_.published.load(std::memory_order_relaxed),
        stats_.rejected.load(std::memory_order_relaxed),
        stats_.processed.load(std::memory_order_relaxed),
        stats_.delivered_inline.load(std::memory_order_relaxed),
        stats_.reliable_retries.load(std::memory_order_relaxed),
        stats_.admission_rechecks.load(std::memory_order_relaxed)};
  }

 private:
  struct alignas(kCacheLineSize) RingNode {
    std::atomic<uint32_t> sequence{0};
    LifecycleEvent event;
  };

  struct CallbackEntry {
    uint32_t id = 0;
    bool active = false;
    TopicFilter filter;
    Callback callback;
  };

  static uint32_t RoundUpPow2(uint32_t v) noexcept {
    uint32_t p = 16U;
    while (p < v && p < (1U << 30)) p <<= 1;
    return p;
  }

  uint32_t ThresholdFor(MessagePriority priority) const noexcept {
    switch (priority) {
      case MessagePriority::kHigh:
        return high_threshold_;
      case MessagePriority::kMedium:
        return medium_threshold_;
      case MessagePriority::kLow:
      default:
        return low_threshold_;
    }
  }

  void Stamp(LifecycleEvent& event) noexcept {
    if (event.timestamp_us == 0) event.timestamp_us = SteadyNowUs();
    if (event.sequence_hint == 0) {
      event.sequence_hint = next_seq_.fetch_add(1, std::memory_order_relaxed);
    }
  }

  bool IsConsumerThread() const noexcept {
    return consumer_id_.load(std::memory_order_acquire) ==
           std::this_thread::get_id();
  }

  /// Moves @p event into the ring on success; leaves it intact on failure.
  bool TryEnqueue(LifecycleEvent& event, MessagePriority priority) {
    const uint32_t threshold = ThresholdFor(priority);
    uint32_t prod = producer_pos_.load(std::memory_order_relaxed);
    if (prod - consumer_pos_.load(std::memory_order_acquire) >= threshold) {
      stats_.admission_rechecks.fetch_add(1, std::memory_order_relaxed);
      return false;
    }

    RingNode* target = nullptr;
    do {
      prod = producer_pos_.load(std::memory_order_relaxed);
      target = &ring_[prod & mask_];
      if (target->sequence.load(std::memory_order_acquire) != prod) {
        return false;
      }
    } while (!producer_pos_.compare_exchange_weak(
        prod, prod + 1U, std::memory_order_acq_rel,
        std::memory_order_relaxed));

    target->event = std::move(event);
    target->sequence.store(prod + 1U, std::memory_order_release);
    stats_.published.fetch_add(1, std::memory_order_relaxed);
    return true;
  }

  void Deliver(const LifecycleEvent& event) {
    const uint32_t id_hash = Fnv1a32(event.evaluation_id.c_str());
    callback_lock_.lock_shared();
    if (subscription_count_ > 0) {
      for (uint32_t i = 0; i < CRUCIBLE_BUS_MAX_SUBSCRIPTIONS; ++i) {
        const CallbackEntry& entry = callbacks_[i];
        if (entry.active && entry.filter.Matches(event, id_hash)) {
          entry.callback(event);
        }
      }
    }
    callback_lock_.unlock_shared();
  }

  void ConsumerLoop() {
    consumer_id_.store(std::this_thread::get_id(), std::memory_order_release);
    detail::AdaptiveBackoff backoff;
    while (!stop_requested_.load(std::memory_order_acquire)) {
      if (ProcessBatch() > 0U) {
        backoff.Reset();
      } else {
        backoff.Wait();
      }
    }
    Drain();
    consumer_id_.store(std::thread::id(), std::memory_order_release);
  }

  const uint32_t depth_;
  const uint32_t mask_;
  const uint32_t low_threshold_;
  const uint32_t medium_threshold_;
  const uint32_t high_threshold_;

  std::unique_ptr<RingNode[]> ring_;

  alignas(kCacheLineSize) std::atomic<uint32_t> producer_pos_;
  alignas(kCacheLineSize) std::atomic<uint32_t> consumer_pos_;
  std::atomic<uint32_t> delivered_pos_{0};
  alignas(kCacheLineSize) std::atomic<uint64_t> next_seq_;

  CallbackEntry callbacks_[CRUCIBLE_BUS_MAX_SUBSCRIPTIONS];
  uint32_t next_callback_id_;
  uint32_t subscription_count_ = 0;
  mutable detail::SharedSpinLock callback_lock_;

  BusStatistics stats_;

  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<std::thread::id> consumer_id_{};
  std::thread consumer_;
};

}  // namespace crucible

#endif  // CRUCIBLE_EVENT_BUS_HPP_
