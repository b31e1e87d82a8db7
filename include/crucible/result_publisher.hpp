/**
 * @file result_publisher.hpp
 * @brief Persists each evaluation's final outcome exactly once.
 *
 * The publisher consumes committed terminal events from the event bus (so
 * it only ever sees outcomes the state machine accepted), de-duplicates by
 * evaluation id and hands them to a write-only ResultStore. A failing store
 * is retried with bounded backoff from Tick(); the bus consumer thread is
 * never blocked on storage.
 */

#ifndef CRUCIBLE_RESULT_PUBLISHER_HPP_
#define CRUCIBLE_RESULT_PUBLISHER_HPP_

#include "crucible/evaluation.hpp"
#include "crucible/event_bus.hpp"
#include "crucible/log.hpp"
#include "crucible/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace crucible {

// ============================================================================
// ResultStore
// ============================================================================

enum class StoreError : uint8_t {
  kUnavailable = 0,
  kIoError,
};

/// @brief Final outcome of one evaluation as handed to storage.
struct ResultRecord {
  std::string evaluation_id;
  EvaluationStatus status = EvaluationStatus::kFailed;
  std::string output_ref;
  ExitInfo exit;
  TerminationReason reason = TerminationReason::kNone;
  std::string detail;
  uint64_t completed_us = 0;
  uint64_t version = 0;
};

/**
 * @brief Write-only storage collaborator. The core never reads it back.
 */
class ResultStore {
 public:
  virtual ~ResultStore() = default;
  virtual expected<void, StoreError> Persist(const ResultRecord& record) = 0;
};

inline nlohmann::json ResultToJson(const ResultRecord& r) {
  nlohmann::json j;
  j["evaluation_id"] = r.evaluation_id;
  j["status"] = StatusName(r.status);
  j["output_ref"] = r.output_ref;
  j["exit_code_known"] = r.exit.Known();
  if (r.exit.Known()) {
    j["exit_code"] = r.exit.exit_code;
  } else {
    j["exit_code"] = nullptr;
  }
  if (r.exit.term_signal != 0) j["signal"] = r.exit.term_signal;
  j["reason"] = TerminationReasonName(r.reason);
  j["detail"] = r.detail;
  j["completed_us"] = r.completed_us;
  j["persisted_at_ms"] = WallNowMs();
  return j;
}

/**
 * @brief Appends one JSON object per line to a file.
 */
class JsonLinesResultStore final : public ResultStore {
 public:
  explicit JsonLinesResultStore(std::string path) : path_(std::move(path)) {}

  ~JsonLinesResultStore() override {
    if (fp_ != nullptr) (void)std::fclose(fp_);
  }

  JsonLinesResultStore(const JsonLinesResultStore&) = delete;
  JsonLinesResultStore& operator=(const JsonLinesResultStore&) = delete;

  expected<void, StoreError> Persist(const ResultRecord& record) override {
    const std::string line =
        ResultToJson(record).dump(-1, ' ', false,
                                  nlohmann::json::error_handler_t::replace) +
        "\n";
    std::lock_guard<std::mutex> lock(mutex_);
    if (fp_ == nullptr) {
      fp_ = std::fopen(path_.c_str(), "abe");
      if (fp_ == nullptr) {
        return expected<void, StoreError>::error(StoreError::kUnavailable);
      }
    }
    if (std::fwrite(line.data(), 1, line.size(), fp_) != line.size() ||
        std::fflush(fp_) != 0) {
      (void)std::fclose(fp_);
      fp_ = nullptr;
      return expected<void, StoreError>::error(StoreError::kIoError);
    }
    return expected<void, StoreError>::success();
  }

  const std::string& Path() const noexcept { return path_; }

 private:
  std::string path_;
  std::FILE* fp_ = nullptr;
  std::mutex mutex_;
};

// ============================================================================
// ResultPublisher
// ============================================================================

struct PublisherConfig {
  uint32_t max_attempts = 5;
  uint32_t retry_base_ms = 100;
  uint32_t retry_max_ms = 5000;
};

struct PublisherStatistics {
  uint64_t persisted;
  uint64_t duplicates;
  uint64_t retries;
  uint64_t abandoned;
  uint32_t pending;
};

class ResultPublisher final {
 public:
  ResultPublisher(EventBus& bus, ResultStore& store,
                  const PublisherConfig& cfg = PublisherConfig{})
      : bus_(bus), store_(store), cfg_(cfg) {
    if (cfg_.max_attempts == 0U) cfg_.max_attempts = 1U;
  }

  ~ResultPublisher() { Detach(); }

  ResultPublisher(const ResultPublisher&) = delete;
  ResultPublisher& operator=(const ResultPublisher&) = delete;

  /** @brief Subscribe to committed events. */
  void Attach() {
    if (subscription_.IsValid()) return;
    subscription_ = bus_.Subscribe(
        TopicFilter::Global(),
        [this](const LifecycleEvent& ev) { OnCommitted(ev); });
  }

  void Detach() {
    if (subscription_.IsValid()) {
      (void)bus_.Unsubscribe(subscription_);
      subscription_ = SubscriptionHandle::Invalid();
    }
  }

  /**
   * @brief Handle one committed event. Non-terminal events are ignored.
   */
  void OnCommitted(const LifecycleEvent& ev) {
    if (!IsTerminal(ev.type)) return;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!seen_.insert(ev.evaluation_id).second) {
        duplicates_.fetch_add(1, std::memory_order_relaxed);
        CRUCIBLE_LOG_DEBUG("Publisher", "%s already published, skipping",
                           ev.evaluation_id.c_str());
        return;
      }
    }

    ResultRecord rec;
    rec.evaluation_id = ev.evaluation_id;
    rec.status = ev.type;
    rec.output_ref = ev.output_ref;
    rec.exit = ev.exit;
    rec.reason = ev.reason;
    rec.detail = ev.detail;
    rec.completed_us = ev.timestamp_us;
    rec.version = ev.sequence_hint;

    auto r = store_.Persist(rec);
    if (r) {
      persisted_.fetch_add(1, std::memory_order_relaxed);
      CRUCIBLE_LOG_DEBUG("Publisher", "%s persisted as %s",
                         rec.evaluation_id.c_str(), StatusName(rec.status));
      return;
    }
    CRUCIBLE_LOG_WARN("Publisher", "persist of %s failed (%u), will retry",
                      rec.evaluation_id.c_str(),
                      static_cast<unsigned>(r.get_error()));
    std::lock_guard<std::mutex> lock(mutex_);
    retry_.push_back(Retry{std::move(rec), 1U, SteadyNowUs() + DelayUs(1U)});
  }

  static void TickThunk(void* ctx) {
    static_cast<ResultPublisher*>(ctx)->RetryPending();
  }

  /**
   * @brief Retry due failed persists. Gives up after max_attempts.
   * @return Number of records persisted in this pass.
   */
  uint32_t RetryPending() {
    std::vector<Retry> due;
    const uint64_t now = SteadyNowUs();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (size_t i = 0; i < retry_.size();) {
        if (retry_[i].next_us <= now) {
          due.push_back(std::move(retry_[i]));
          retry_[i] = std::move(retry_.back());
          retry_.pop_back();
        } else {
          ++i;
        }
      }
    }

    uint32_t ok = 0;
    std::vector<Retry> again;
    for (Retry& r : due) {
      retries_.fetch_add(1, std::memory_order_relaxed);
      ++r.attempts;
      if (store_.Persist(r.record)) {
        persisted_.fetch_add(1, std::memory_order_relaxed);
        ++ok;
        continue;
      }
      if (r.attempts >= cfg_.max_attempts) {
        abandoned_.fetch_add(1, std::memory_order_relaxed);
        CRUCIBLE_LOG_ERROR("Publisher",
                           "giving up on %s after %u attempts",
                           r.record.evaluation_id.c_str(), r.attempts);
        continue;
      }
      r.next_us = now + DelayUs(r.attempts);
      again.push_back(std::move(r));
    }
    if (!again.empty()) {
      std::lock_guard<std::mutex> lock(mutex_);
      for (Retry& r : again) retry_.push_back(std::move(r));
    }
    return ok;
  }

  PublisherStatistics GetStatistics() const {
    PublisherStatistics s;
    s.persisted = persisted_.load(std::memory_order_relaxed);
    s.duplicates = duplicates_.load(std::memory_order_relaxed);
    s.retries = retries_.load(std::memory_order_relaxed);
    s.abandoned = abandoned_.load(std::memory_order_relaxed);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      s.pending = static_cast<uint32_t>(retry_.size());
    }
    return s;
  }

 private:
  struct Retry {
    ResultRecord record;
    uint32_t attempts;
    uint64_t next_us;
  };

  uint64_t DelayUs(uint32_t attempts) const noexcept {
    uint64_t ms = cfg_.retry_base_ms;
    for (uint32_t i = 1U; i < attempts && ms < cfg_.retry_max_ms; ++i) ms *= 2U;
    if (ms > cfg_.retry_max_ms) ms = cfg_.retry_max_ms;
    return ms * 1000ULL;
  }

  EventBus& bus_;
  ResultStore& store_;
  PublisherConfig cfg_;
  SubscriptionHandle subscription_ = SubscriptionHandle::Invalid();

  mutable std::mutex mutex_;
  std::unordered_set<std::string> seen_;
  std::vector<Retry> retry_;

  std::atomic<uint64_t> persisted_{0};
  std::atomic<uint64_t> duplicates_{0};
  std::atomic<uint64_t> retries_{0};
  std::atomic<uint64_t> abandoned_{0};
};

}  // namespace crucible

#endif  // CRUCIBLE_RESULT_PUBLISHER_HPP_
