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
 * @file process.hpp
 * @brief POSIX subprocess control for sandboxed execution units.
 *
 * Header-only, C++17. Linux/macOS (fork, setsid, setrlimit, waitpid).
 *
 * Features:
 *   - Spawn into a new session so the whole process group can be signalled
 *   - RLIMIT_AS / RLIMIT_CPU applied in the child before exec
 *   - stdout+stderr redirected to a file
 *   - Descriptors above stderr closed before exec
 *   - Non-blocking reap (TryWait) for a single shared reaper thread
 */

#ifndef CRUCIBLE_PROCESS_HPP_
#define CRUCIBLE_PROCESS_HPP_

#include "crucible/platform.hpp"
#include "crucible/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

namespace crucible {

// ============================================================================
// ProcessError
// ============================================================================

enum class ProcessError : uint8_t {
  kInvalidArgs = 0,
  kOutputOpenFailed,
  kForkFailed,
  kSignalFailed,
  kNotStarted,
};

namespace detail {

/// @brief Sleep for @p ms milliseconds (nanosleep, not deprecated usleep).
inline void SleepMs(uint32_t ms) {
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(ms / 1000U);
  ts.tv_nsec = static_cast<long>(ms % 1000U) * 1000000L;  // NOLINT
  nanosleep(&ts, nullptr);
}

/// @brief Set both soft and hard limit; 0 leaves the resource untouched.
inline void ApplyLimit(int resource, uint64_t soft, uint64_t hard) {
  if (soft == 0U) return;
  struct rlimit rl;
  rl.rlim_cur = static_cast<rlim_t>(soft);
  rl.rlim_max = static_cast<rlim_t>(hard);
  (void)setrlimit(resource, &rl);
}

/**
 * @brief Close every descriptor above stderr. Child side of fork only.
 *
 * Only async-signal-safe calls: close_range(2) where the kernel has it,
 * otherwise a close() sweep up to the descriptor limit.
 */
inline void CloseInheritedFds() {
#if defined(SYS_close_range)
  if (syscall(SYS_close_range, 3U, ~0U, 0U) == 0) return;
#endif
  long max_fd = sysconf(_SC_OPEN_MAX);
  if (max_fd < 0 || max_fd > 65536) max_fd = 65536;
  for (int fd = 3; fd < static_cast<int>(max_fd); ++fd) {
    (void)close(fd);
  }
}

}  // namespace detail

/**
 * @brief Check if a process is alive (exists and can receive signals).
 */
inline bool IsProcessAlive(pid_t pid) { return pid > 0 && kill(pid, 0) == 0; }

// ============================================================================
// Subprocess
// ============================================================================

/// @brief Subprocess configuration.
struct SubprocessConfig {
  const char* const* argv = nullptr;  ///< NULL-terminated argument array
  const char* working_dir = nullptr;  ///< chdir before exec (nullptr = inherit)
  const char* output_path = nullptr;  ///< stdout+stderr file (nullptr = inherit)
  uint64_t memory_limit_bytes = 0;    ///< RLIMIT_AS, 0 = unlimited
  uint32_t cpu_limit_s = 0;           ///< RLIMIT_CPU soft limit, 0 = unlimited
};

/// @brief Reap result.
struct WaitResult {
  bool running = true;   ///< Child not reaped yet (TryWait / timed-out Wait)
  bool exited = false;   ///< true if child exited normally
  int exit_code = -1;    ///< Exit code (valid if exited==true)
  bool signaled = false; ///< true if child was killed by signal
  int term_signal = 0;   ///< Signal number (valid if signaled==true)
};

/**
 * @brief Child process running in its own session / process group.
 *
 * RAII: the destructor kills the group and reaps the child if it was never
 * reaped.
 *
 * @code
 *   const char* argv[] = {"sh", "main.sh", nullptr};
 *   crucible::SubprocessConfig cfg;
 *   cfg.argv = argv;
 *   cfg.output_path = "/tmp/crucible/e1/output.log";
 *   cfg.memory_limit_bytes = 128ULL << 20;
 *
 *   crucible::Subprocess proc;
 *   if (proc.Start(cfg)) {
 *     auto wr = proc.Wait(5000);
 *   }
 * @endcode
 */
class Subprocess {
 public:
  Subprocess() noexcept : pid_(-1) {}

  ~Subprocess() {
    if (pid_ > 0) {
      (void)kill(-pid_, SIGKILL);
      int status;
      (void)waitpid(pid_, &status, 0);
    }
  }

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  Subprocess(Subprocess&& other) noexcept : pid_(other.pid_) {
    other.pid_ = -1;
  }

  /**
   * @brief Spawn the child.
   * @return kInvalidArgs, kOutputOpenFailed or kForkFailed on error.
   */
  expected<void, ProcessError> Start(const SubprocessConfig& cfg) {
    if (pid_ > 0 || cfg.argv == nullptr || cfg.argv[0] == nullptr) {
      return expected<void, ProcessError>::error(ProcessError::kInvalidArgs);
    }

    int out_fd = -1;
    if (cfg.output_path != nullptr) {
      out_fd = open(cfg.output_path,  // NOLINT
                    O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
      if (out_fd < 0) {
        return expected<void, ProcessError>::error(
            ProcessError::kOutputOpenFailed);
      }
    }

    pid_t child = fork();
    if (child < 0) {
      if (out_fd >= 0) close(out_fd);  // NOLINT
      return expected<void, ProcessError>::error(ProcessError::kForkFailed);
    }

    if (child == 0) {
      // -- Child: only async-signal-safe calls until exec --
      setsid();

      struct sigaction sa_dfl;
      std::memset(&sa_dfl, 0, sizeof(sa_dfl));
      sa_dfl.sa_handler = SIG_DFL;
      for (int sig = 1; sig < 32; ++sig) {
        sigaction(sig, &sa_dfl, nullptr);
      }

      if (cfg.working_dir != nullptr && chdir(cfg.working_dir) != 0) {
        _exit(126);
      }

      if (out_fd >= 0) {
        dup2(out_fd, STDOUT_FILENO);
        dup2(out_fd, STDERR_FILENO);
      }
      int null_fd = open("/dev/null", O_RDONLY);  // NOLINT
      if (null_fd >= 0) dup2(null_fd, STDIN_FILENO);
      detail::CloseInheritedFds();

      detail::ApplyLimit(RLIMIT_AS, cfg.memory_limit_bytes,
                         cfg.memory_limit_bytes);
      detail::ApplyLimit(RLIMIT_CPU, cfg.cpu_limit_s, cfg.cpu_limit_s + 1U);

      execvp(cfg.argv[0], const_cast<char* const*>(cfg.argv));
      _exit(127);
    }

    // -- Parent --
    if (out_fd >= 0) close(out_fd);  // NOLINT
    pid_ = child;
    return expected<void, ProcessError>::success();
  }

  /**
   * @brief Non-blocking reap.
   * @return running == true if the child has not exited yet.
   */
  WaitResult TryWait() {
    WaitResult wr;
    if (pid_ <= 0) {
      wr.running = false;
      return wr;
    }
    int status = 0;
    pid_t w = waitpid(pid_, &status, WNOHANG);
    if (w == pid_) {
      FillWaitResult(status, wr);
      pid_ = -1;
    } else if (w < 0 && errno == ECHILD) {
      // Reaped elsewhere; exit status is lost.
      wr.running = false;
      pid_ = -1;
    }
    return wr;
  }

  /**
   * @brief Wait for the child to exit.
   * @param timeout_ms 0 waits forever.
   */
  WaitResult Wait(uint32_t timeout_ms = 0) {
    if (timeout_ms == 0U) {
      WaitResult wr;
      if (pid_ <= 0) {
        wr.running = false;
        return wr;
      }
      int status = 0;
      if (waitpid(pid_, &status, 0) == pid_) {
        FillWaitResult(status, wr);
        pid_ = -1;
      }
      return wr;
    }

    constexpr uint32_t kPollIntervalMs = 5;
    uint32_t elapsed = 0;
    for (;;) {
      WaitResult wr = TryWait();
      if (!wr.running || elapsed >= timeout_ms) return wr;
      detail::SleepMs(kPollIntervalMs);
      elapsed += kPollIntervalMs;
    }
  }

  /** @brief Signal the whole process group of the child. */
  expected<void, ProcessError> SignalGroup(int signo) {
    if (pid_ <= 0) {
      return expected<void, ProcessError>::error(ProcessError::kNotStarted);
    }
    if (kill(-pid_, signo) != 0 && kill(pid_, signo) != 0) {
      return expected<void, ProcessError>::error(ProcessError::kSignalFailed);
    }
    return expected<void, ProcessError>::success();
  }

  /// @brief Child PID (-1 if not started or already reaped).
  pid_t GetPid() const noexcept { return pid_; }

  bool IsRunning() const { return pid_ > 0 && IsProcessAlive(pid_); }

 private:
  static void FillWaitResult(int status, WaitResult& wr) {
    wr.running = false;
    if (WIFEXITED(status)) {
      wr.exited = true;
      wr.exit_code = WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
      wr.signaled = true;
      wr.term_signal = WTERMSIG(status);
    }
  }

  pid_t pid_;
};

}  // namespace crucible

#endif  // CRUCIBLE_PROCESS_HPP_
