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
 * @file capacity_manager.hpp
 * @brief Lock-free bounded execution capacity: atomic claim and idempotent
 *        release of execution slots.
 *
 * Admission state is one packed 64-bit word:
 *
 *   [63..48] free slots   [47..24] free memory (MB)   [23..0] free cpu (m)
 *
 * TryClaim() checks and decrements all three budgets with a single
 * compare-and-swap, so no caller can observe "free" and act on it later.
 * Release() returns them with a single fetch_add.
 *
 * Each slot record carries a generation-tagged state word. A handle is
 * (index, generation); releasing flips claimed(gen) -> free(gen + 1) with a
 * CAS, so a second release of the same handle fails that CAS and becomes a
 * counted no-op.
 *
 * The evaluation -> slot table is the explicit record of which evaluations
 * are currently executing.
 */

#ifndef CRUCIBLE_CAPACITY_MANAGER_HPP_
#define CRUCIBLE_CAPACITY_MANAGER_HPP_

#include "crucible/evaluation.hpp"
#include "crucible/log.hpp"
#include "crucible/platform.hpp"
#include "crucible/vocabulary.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace crucible {

// ============================================================================
// Error codes / results
// ============================================================================

enum class CapacityError : uint8_t {
  kCapacityExceeded = 0,  ///< Retryable: budgets are currently exhausted.
  kExceedsTotal,          ///< Not retryable: larger than the whole pool.
  kDuplicateEvaluation,   ///< The evaluation already holds a slot.
};

enum class ReleaseResult : uint8_t {
  kReleased = 0,
  kAlreadyReleased,
};

// ============================================================================
// CapacityLimits
// ============================================================================

struct CapacityLimits {
  uint32_t slots = 4;
  uint32_t memory_mb = 2048;
  uint32_t cpu_millicores = 4000;
};

// ============================================================================
// SlotHandle
// ============================================================================

struct SlotHandle {
  uint32_t index;
  uint32_t generation;

  bool IsValid() const noexcept { return index != UINT32_MAX; }

  static SlotHandle Invalid() noexcept { return {UINT32_MAX, 0}; }

  bool operator==(const SlotHandle& o) const noexcept {
    return index == o.index && generation == o.generation;
  }
  bool operator!=(const SlotHandle& o) const noexcept { return !(*this == o); }
};

// ============================================================================
// Snapshot / statistics
// ============================================================================

struct CapacitySnapshot {
  uint32_t total_slots;
  uint32_t free_slots;
  uint32_t total_memory_mb;
  uint32_t free_memory_mb;
  uint32_t total_cpu_millicores;
  uint32_t free_cpu_millicores;
  uint64_t claims;
  uint64_t rejections;
  uint64_t releases;
  uint64_t double_releases;
};

struct ActiveClaim {
  std::string evaluation_id;
  SlotHandle handle;
  uint32_t memory_mb;
  uint32_t cpu_millicores;
  uint64_t claimed_at_us;
};

// ============================================================================
// Packed admission word
// ============================================================================

namespace detail {

static constexpr uint32_t kSlotBits = 16U;
static constexpr uint32_t kMemBits = 24U;
static constexpr uint32_t kCpuBits = 24U;
static constexpr uint64_t kMaxPackedSlots = (1ULL << kSlotBits) - 1U;
static constexpr uint64_t kMaxPackedMem = (1ULL << kMemBits) - 1U;
static constexpr uint64_t kMaxPackedCpu = (1ULL << kCpuBits) - 1U;

constexpr uint64_t PackCapacity(uint64_t slots, uint64_t mem,
                                uint64_t cpu) noexcept {
  return (slots << (kMemBits + kCpuBits)) | (mem << kCpuBits) | cpu;
}

constexpr uint32_t PackedSlots(uint64_t w) noexcept {
  return static_cast<uint32_t>(w >> (kMemBits + kCpuBits));
}

constexpr uint32_t PackedMem(uint64_t w) noexcept {
  return static_cast<uint32_t>((w >> kCpuBits) & kMaxPackedMem);
}

constexpr uint32_t PackedCpu(uint64_t w) noexcept {
  return static_cast<uint32_t>(w & kMaxPackedCpu);
}

static constexpr uint32_t kInvalidSlot = UINT32_MAX;

}  // namespace detail

// ============================================================================
// CapacityManager
// ============================================================================

class CapacityManager final {
 public:
  /**
   * @param limits Pool size. Values wider than the packed fields are
   *        clamped (65535 slots, 16M MB, 16M millicores).
   */
  explicit CapacityManager(const CapacityLimits& limits)
      : total_slots_(Clamp(limits.slots, detail::kMaxPackedSlots)),
        total_mem_(Clamp(limits.memory_mb, detail::kMaxPackedMem)),
        total_cpu_(Clamp(limits.cpu_millicores, detail::kMaxPackedCpu)),
        records_(new SlotRecord[total_slots_ > 0 ? total_slots_ : 1U]) {
    if (total_slots_ != limits.slots || total_mem_ != limits.memory_mb ||
        total_cpu_ != limits.cpu_millicores) {
      CRUCIBLE_LOG_WARN("Capacity",
                        "limits clamped to slots=%u memory=%uMB cpu=%um",
                        total_slots_, total_mem_, total_cpu_);
    }
    for (uint32_t i = 0; i < total_slots_; ++i) {
      records_[i].next_free.store(
          (i + 1U < total_slots_) ? (i + 1U) : detail::kInvalidSlot,
          std::memory_order_relaxed);
    }
    free_head_.store(MakeHead(0U, total_slots_ > 0 ? 0U : detail::kInvalidSlot),
                     std::memory_order_relaxed);
    word_.store(detail::PackCapacity(total_slots_, total_mem_, total_cpu_),
                std::memory_order_relaxed);
  }

  CapacityManager(const CapacityManager&) = delete;
  CapacityManager& operator=(const CapacityManager&) = delete;

  /**
   * @brief Atomically claim one slot plus the requested memory and CPU.
   *
   * The availability check and the decrement are one CAS on the packed
   * admission word.
   */
  expected<SlotHandle, CapacityError> TryClaim(
      const std::string& evaluation_id, const ResourceRequirements& req) {
    using R = expected<SlotHandle, CapacityError>;
    if (req.memory_mb > total_mem_ || req.cpu_millicores > total_cpu_ ||
        total_slots_ == 0) {
      return R::error(CapacityError::kExceedsTotal);
    }

    const uint64_t need =
        detail::PackCapacity(1U, req.memory_mb, req.cpu_millicores);
    uint64_t cur = word_.load(std::memory_order_acquire);
    for (;;) {
      if (detail::PackedSlots(cur) < 1U ||
          detail::PackedMem(cur) < req.memory_mb ||
          detail::PackedCpu(cur) < req.cpu_millicores) {
        rejections_.fetch_add(1, std::memory_order_relaxed);
        return R::error(CapacityError::kCapacityExceeded);
      }
      // No field can borrow: each was checked above.
      if (word_.compare_exchange_weak(cur, cur - need,
                                      std::memory_order_acq_rel,
                                      std::memory_order_acquire)) {
        break;
      }
    }

    const uint32_t index = PopFree();
    SlotRecord& rec = records_[index];
    rec.memory_mb = req.memory_mb;
    rec.cpu_millicores = req.cpu_millicores;
    rec.claimed_at_us = SteadyNowUs();
    rec.evaluation_id = evaluation_id;
    const uint32_t gen = static_cast<uint32_t>(
        rec.state.load(std::memory_order_relaxed) >> 1);
    rec.state.store((uint64_t{gen} << 1) | 1U, std::memory_order_release);
    const SlotHandle handle{index, gen};

    bool duplicate = false;
    {
      std::lock_guard<std::mutex> lock(owners_mutex_);
      duplicate = !owners_.emplace(evaluation_id, handle).second;
    }
    if (duplicate) {
      // Give the budget back; the existing owner entry is left untouched.
      (void)Release(handle);
      CRUCIBLE_LOG_WARN("Capacity", "%s already holds a slot",
                        evaluation_id.c_str());
      return R::error(CapacityError::kDuplicateEvaluation);
    }
    claims_.fetch_add(1, std::memory_order_relaxed);
    return R::success(handle);
  }

  /**
   * @brief Return a claimed slot. Exactly one release per claim takes
   *        effect; any further release is a counted no-op.
   */
  ReleaseResult Release(const SlotHandle& handle) {
    if (!handle.IsValid() || handle.index >= total_slots_) {
      double_releases_.fetch_add(1, std::memory_order_relaxed);
      CRUCIBLE_LOG_WARN("Capacity", "release of invalid handle %u",
                        handle.index);
      return ReleaseResult::kAlreadyReleased;
    }
    SlotRecord& rec = records_[handle.index];
    uint64_t expected_state = (uint64_t{handle.generation} << 1) | 1U;
    const uint64_t released_state = uint64_t{handle.generation + 1U} << 1;
    if (!rec.state.compare_exchange_strong(expected_state, released_state,
                                           std::memory_order_acq_rel,
                                           std::memory_order_acquire)) {
      double_releases_.fetch_add(1, std::memory_order_relaxed);
      CRUCIBLE_LOG_WARN("Capacity", "double release of slot %u gen %u",
                        handle.index, handle.generation);
      return ReleaseResult::kAlreadyReleased;
    }

    // This thread now exclusively owns the record until it is pushed.
    const std::string evaluation_id = std::move(rec.evaluation_id);
    rec.evaluation_id.clear();
    const uint64_t give_back =
        detail::PackCapacity(1U, rec.memory_mb, rec.cpu_millicores);
    {
      std::lock_guard<std::mutex> lock(owners_mutex_);
      auto it = owners_.find(evaluation_id);
      if (it != owners_.end() && it->second == handle) owners_.erase(it);
    }
    // Record first, budget second: a claimer that wins the budget CAS is
    // guaranteed to find a record.
    PushFree(handle.index);
    word_.fetch_add(give_back, std::memory_order_acq_rel);
    releases_.fetch_add(1, std::memory_order_relaxed);
    return ReleaseResult::kReleased;
  }

  // --------------------------------------------------------------------------
  // Query
  // --------------------------------------------------------------------------

  bool IsClaimed(const SlotHandle& handle) const noexcept {
    if (!handle.IsValid() || handle.index >= total_slots_) return false;
    return records_[handle.index].state.load(std::memory_order_acquire) ==
           ((uint64_t{handle.generation} << 1) | 1U);
  }

  optional<SlotHandle> Find(const std::string& evaluation_id) const {
    std::lock_guard<std::mutex> lock(owners_mutex_);
    auto it = owners_.find(evaluation_id);
    if (it == owners_.end()) return {};
    return it->second;
  }

  /// @brief Evaluations currently holding a slot.
  std::vector<ActiveClaim> ActiveClaims() const {
    std::vector<ActiveClaim> out;
    std::lock_guard<std::mutex> lock(owners_mutex_);
    out.reserve(owners_.size());
    for (const auto& kv : owners_) {
      const SlotRecord& rec = records_[kv.second.index];
      out.push_back(ActiveClaim{kv.first, kv.second, rec.memory_mb,
                                rec.cpu_millicores, rec.claimed_at_us});
    }
    return out;
  }

  uint32_t FreeSlots() const noexcept {
    return detail::PackedSlots(word_.load(std::memory_order_acquire));
  }

  uint32_t ActiveCount() const noexcept { return total_slots_ - FreeSlots(); }

  uint64_t DoubleReleaseCount() const noexcept {
    return double_releases_.load(std::memory_order_relaxed);
  }

  CapacitySnapshot Snapshot() const noexcept {
    const uint64_t w = word_.load(std::memory_order_acquire);
    return CapacitySnapshot{total_slots_,
                            detail::PackedSlots(w),
                            total_mem_,
                            detail::PackedMem(w),
                            total_cpu_,
                            detail::PackedCpu(w),
                            claims_.load(std::memory_order_relaxed),
                            rejections_.load(std::memory_order_relaxed),
                            releases_.load(std::memory_order_relaxed),
                            double_releases_.load(std::memory_order_relaxed)};
  }

  CapacityLimits Limits() const noexcept {
    return CapacityLimits{total_slots_, total_mem_, total_cpu_};
  }

 private:
  struct alignas(kCacheLineSize) SlotRecord {
    std::atomic<uint64_t> state{0};  ///< generation << 1 | claimed
    std::atomic<uint32_t> next_free{detail::kInvalidSlot};
    uint32_t memory_mb = 0;
    uint32_t cpu_millicores = 0;
    uint64_t claimed_at_us = 0;
    std::string evaluation_id;  ///< Owner-only access.
  };

  static uint32_t Clamp(uint32_t v, uint64_t max) noexcept {
    return (uint64_t{v} > max) ? static_cast<uint32_t>(max) : v;
  }

  // Free-list head: [63..32] ABA tag, [31..0] index.
  static uint64_t MakeHead(uint32_t tag, uint32_t index) noexcept {
    return (uint64_t{tag} << 32) | index;
  }

  uint32_t PopFree() noexcept {
    uint64_t head = free_head_.load(std::memory_order_acquire);
    for (;;) {
      const uint32_t index = static_cast<uint32_t>(head);
      if (CRUCIBLE_UNLIKELY(index == detail::kInvalidSlot)) {
        // A releaser is between PushFree and the budget fetch_add.
        std::this_thread::yield();
        head = free_head_.load(std::memory_order_acquire);
        continue;
      }
      const uint32_t next =
          records_[index].next_free.load(std::memory_order_relaxed);
      const uint64_t desired =
          MakeHead(static_cast<uint32_t>(head >> 32) + 1U, next);
      if (free_head_.compare_exchange_weak(head, desired,
                                           std::memory_order_acq_rel,
                                           std::memory_order_acquire)) {
        return index;
      }
    }
  }

  void PushFree(uint32_t index) noexcept {
    uint64_t head = free_head_.load(std::memory_order_acquire);
    for (;;) {
      records_[index].next_free.store(static_cast<uint32_t>(head),
                                      std::memory_order_relaxed);
      const uint64_t desired =
          MakeHead(static_cast<uint32_t>(head >> 32) + 1U, index);
      if (free_head_.compare_exchange_weak(head, desired,
                                           std::memory_order_acq_rel,
                                           std::memory_order_acquire)) {
        return;
      }
    }
  }

  const uint32_t total_slots_;
  const uint32_t total_mem_;
  const uint32_t total_cpu_;
  std::unique_ptr<SlotRecord[]> records_;

  alignas(kCacheLineSize) std::atomic<uint64_t> word_{0};
  alignas(kCacheLineSize) std::atomic<uint64_t> free_head_{0};

  alignas(kCacheLineSize) std::atomic<uint64_t> claims_{0};
  std::atomic<uint64_t> rejections_{0};
  std::atomic<uint64_t> releases_{0};
  std::atomic<uint64_t> double_releases_{0};

  mutable std::mutex owners_mutex_;
  std::unordered_map<std::string, SlotHandle> owners_;
};

}  // namespace crucible

#endif  // CRUCIBLE_CAPACITY_MANAGER_HPP_
