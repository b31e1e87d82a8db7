/**
 * @file shutdown.hpp
 * @brief Graceful shutdown for the dispatcher daemon (POSIX).
 *
 * SIGINT/SIGTERM are installed with sigaction(2); the handler only writes a
 * byte to a self-pipe, which wakes WaitForShutdown(). Registered callbacks
 * then run in LIFO order on the waiting thread, so components are stopped in
 * the reverse order they were started.
 */

#ifndef CRUCIBLE_SHUTDOWN_HPP_
#define CRUCIBLE_SHUTDOWN_HPP_

#include "crucible/platform.hpp"
#include "crucible/vocabulary.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>

#include <fcntl.h>
#include <unistd.h>

namespace crucible {

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated
};

/// @brief Cleanup callback. @p signo is 0 for a manual Quit().
using ShutdownFn = void (*)(int signo, void* ctx);

class ShutdownManager;

namespace detail {

/// Exactly one ShutdownManager may exist per process.
inline ShutdownManager*& GetShutdownInstance() {
  static ShutdownManager* ptr = nullptr;
  return ptr;
}

}  // namespace detail

/**
 * @brief Signal-driven shutdown coordinator.
 *
 * @code
 *   crucible::ShutdownManager mgr;
 *   mgr.Register(&StopServer, &server);
 *   mgr.Register(&StopRouter, &router);   // runs first
 *   mgr.InstallSignalHandlers();
 *   mgr.WaitForShutdown();
 * @endcode
 */
class ShutdownManager final {
 public:
  explicit ShutdownManager(uint32_t max_callbacks = 16) noexcept
      : callback_count_(0),
        max_callbacks_((max_callbacks <= kMaxCallbacks) ? max_callbacks
                                                        : kMaxCallbacks),
        shutdown_flag_(false),
        valid_(false) {
    pipe_fd_[0] = -1;
    pipe_fd_[1] = -1;

    if (detail::GetShutdownInstance() != nullptr) {
      return;
    }
    // Close-on-exec: sandboxed children must never reach the write end.
    if (::pipe2(pipe_fd_, O_CLOEXEC) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    detail::GetShutdownInstance() = this;
    valid_ = true;
  }

  ~ShutdownManager() {
    if (detail::GetShutdownInstance() == this) {
      detail::GetShutdownInstance() = nullptr;
    }
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;
  ShutdownManager(ShutdownManager&&) = delete;
  ShutdownManager& operator=(ShutdownManager&&) = delete;

  /** @brief False if another instance already existed or pipe(2) failed. */
  bool IsValid() const noexcept { return valid_; }

  expected<void, ShutdownError> Register(ShutdownFn fn,
                                         void* ctx = nullptr) noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    if (fn == nullptr || callback_count_ >= max_callbacks_) {
      return expected<void, ShutdownError>::error(ShutdownError::kCallbacksFull);
    }
    callbacks_[callback_count_] = Callback{fn, ctx};
    ++callback_count_;
    return expected<void, ShutdownError>::success();
  }

  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    if (pipe_fd_[1] < 0) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kPipeCreationFailed);
    }

    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    if (::sigaction(SIGINT, &sa, nullptr) != 0 ||
        ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kSignalInstallFailed);
    }
    // A client hanging up mid-response must not kill the daemon.
    (void)::signal(SIGPIPE, SIG_IGN);
    return expected<void, ShutdownError>::success();
  }

  /** @brief Trigger shutdown from code. Only the first call has effect. */
  void Quit(int signo = 0) noexcept {
    bool expected_val = false;
    if (shutdown_flag_.compare_exchange_strong(expected_val, true)) {
      signo_.store(signo, std::memory_order_relaxed);
      Wake();
    }
  }

  /**
   * @brief Block until a signal or Quit(), then run callbacks LIFO.
   */
  void WaitForShutdown() noexcept {
    if (pipe_fd_[0] >= 0 && !shutdown_flag_.load()) {
      uint8_t buf = 0;
      while (::read(pipe_fd_[0], &buf, 1) < 0 && errno == EINTR) {
      }
    }

    const int signo = signo_.load(std::memory_order_relaxed);
    for (uint32_t i = callback_count_; i > 0U; --i) {
      const Callback& cb = callbacks_[i - 1U];
      if (cb.fn != nullptr) cb.fn(signo, cb.ctx);
    }
  }

  bool IsShutdownRequested() const noexcept { return shutdown_flag_.load(); }

  int Signal() const noexcept { return signo_.load(std::memory_order_relaxed); }

 private:
  static constexpr uint32_t kMaxCallbacks = 16;

  struct Callback {
    ShutdownFn fn;
    void* ctx;
  };

  void Wake() noexcept {
    if (pipe_fd_[1] >= 0) {
      const uint8_t byte = 1;
      (void)::write(pipe_fd_[1], &byte, 1);
    }
  }

  // Async-signal-safe: atomic stores and write(2) only.
  static void SignalHandler(int signo) {
    ShutdownManager* self = detail::GetShutdownInstance();
    if (self != nullptr) {
      self->shutdown_flag_.store(true);
      self->signo_.store(signo, std::memory_order_relaxed);
      self->Wake();
    }
  }

  Callback callbacks_[kMaxCallbacks] = {};
  uint32_t callback_count_;
  uint32_t max_callbacks_;
  std::atomic<bool> shutdown_flag_;
  int pipe_fd_[2];
  std::atomic<int> signo_{0};
  bool valid_;
};

}  // namespace crucible

#endif  // CRUCIBLE_SHUTDOWN_HPP_
