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
 * @file local_sandbox.hpp
 * @brief Local-process sandbox backend.
 *
 * Each unit is one interpreter process running in its own session with
 * RLIMIT_AS / RLIMIT_CPU derived from the evaluation's resource
 * requirements. Layout per unit:
 *
 *   <work_dir>/<evaluation_id>/main.<ext>     submitted code
 *   <work_dir>/<evaluation_id>/output.log     stdout+stderr (output_ref)
 *
 * A single reaper thread polls waitpid(WNOHANG) over all live units; there
 * are no per-unit threads. Signal sinks are invoked from the reaper thread
 * (exit) or from the Watch() caller (started, replay) without internal locks
 * held.
 */

#ifndef CRUCIBLE_LOCAL_SANDBOX_HPP_
#define CRUCIBLE_LOCAL_SANDBOX_HPP_

#include "crucible/log.hpp"
#include "crucible/process.hpp"
#include "crucible/sandbox.hpp"

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <sys/stat.h>

namespace crucible {

struct LocalSandboxConfig {
  std::string work_dir = "/tmp/crucible";
  std::string python = "python3";
  std::string shell = "sh";
  uint32_t reap_interval_ms = 10;
};

namespace detail {

/// @brief mkdir -p. Returns false if any component cannot be created.
inline bool MakeDirs(const std::string& path) {
  if (path.empty()) return false;
  std::string partial;
  partial.reserve(path.size());
  for (size_t i = 0; i < path.size(); ++i) {
    partial.push_back(path[i]);
    if ((path[i] == '/' && i > 0) || i + 1 == path.size()) {
      if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
        return false;
      }
    }
  }
  return true;
}

inline bool WriteWholeFile(const std::string& path, const std::string& data) {
  std::FILE* fp = std::fopen(path.c_str(), "wbe");
  if (fp == nullptr) return false;
  const size_t written = std::fwrite(data.data(), 1, data.size(), fp);
  const bool ok = (written == data.size());
  return (std::fclose(fp) == 0) && ok;
}

}  // namespace detail

// ============================================================================
// LocalSandbox
// ============================================================================

class LocalSandbox final : public SandboxProvider {
 public:
  explicit LocalSandbox(const LocalSandboxConfig& cfg = LocalSandboxConfig{})
      : cfg_(cfg) {
    if (cfg_.reap_interval_ms == 0U) cfg_.reap_interval_ms = 1U;
    running_.store(true, std::memory_order_release);
    reaper_ = std::thread(&LocalSandbox::ReapLoop, this);
  }

  ~LocalSandbox() override {
    running_.store(false, std::memory_order_release);
    if (reaper_.joinable()) reaper_.join();
    // Remaining Subprocess destructors kill and reap their groups.
  }

  LocalSandbox(const LocalSandbox&) = delete;
  LocalSandbox& operator=(const LocalSandbox&) = delete;

  const char* Name() const noexcept override { return "local"; }

  expected<UnitHandle, ProviderError> CreateUnit(const UnitSpec& spec) override {
    std::string interpreter;
    const char* ext = nullptr;
    if (spec.language == "python" || spec.language == "python3") {
      interpreter = cfg_.python;
      ext = "py";
    } else if (spec.language == "sh" || spec.language == "shell" ||
               spec.language == "bash") {
      interpreter = cfg_.shell;
      ext = "sh";
    } else {
      CRUCIBLE_LOG_WARN("Sandbox", "unsupported language '%s' for %s",
                        spec.language.c_str(), spec.evaluation_id.c_str());
      return expected<UnitHandle, ProviderError>::error(
          ProviderError::kInvalidSpec);
    }

    const std::string dir = cfg_.work_dir + "/" + spec.evaluation_id;
    if (!detail::MakeDirs(dir)) {
      CRUCIBLE_LOG_ERROR("Sandbox", "cannot create %s (errno=%d)", dir.c_str(),
                         errno);
      return expected<UnitHandle, ProviderError>::error(
          ProviderError::kSpawnFailed);
    }
    const std::string script = dir + "/main." + ext;
    if (!detail::WriteWholeFile(script, spec.code)) {
      CRUCIBLE_LOG_ERROR("Sandbox", "cannot write %s", script.c_str());
      return expected<UnitHandle, ProviderError>::error(
          ProviderError::kSpawnFailed);
    }

    auto unit = std::unique_ptr<Unit>(new Unit());
    unit->handle.unit_id = std::string("local-") + spec.evaluation_id + "-" +
                           std::to_string(next_unit_.fetch_add(1U) + 1U);
    unit->handle.output_ref = dir + "/output.log";

    const char* argv[] = {interpreter.c_str(), script.c_str(), nullptr};
    SubprocessConfig pc;
    pc.argv = argv;
    pc.working_dir = dir.c_str();
    pc.output_path = unit->handle.output_ref.c_str();
    pc.memory_limit_bytes =
        static_cast<uint64_t>(spec.resources.memory_mb) * 1024ULL * 1024ULL;
    // RLIMIT_CPU trails the wall-clock deadline enforced by the dispatcher.
    pc.cpu_limit_s =
        (spec.resources.timeout_s > 0U) ? spec.resources.timeout_s + 1U : 0U;

    auto started = unit->proc.Start(pc);
    if (!started) {
      CRUCIBLE_LOG_ERROR("Sandbox", "spawn failed for %s (error=%u)",
                         spec.evaluation_id.c_str(),
                         static_cast<unsigned>(started.get_error()));
      return expected<UnitHandle, ProviderError>::error(
          ProviderError::kSpawnFailed);
    }

    CRUCIBLE_LOG_INFO("Sandbox", "unit %s pid=%d mem=%uMB timeout=%us",
                      unit->handle.unit_id.c_str(),
                      static_cast<int>(unit->proc.GetPid()),
                      spec.resources.memory_mb, spec.resources.timeout_s);

    UnitHandle handle = unit->handle;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      units_[handle.unit_id] = std::move(unit);
    }
    return expected<UnitHandle, ProviderError>::success(std::move(handle));
  }

  expected<void, ProviderError> Watch(const UnitHandle& handle,
                                      UnitSignalFn fn) override {
    std::vector<UnitSignal> replay;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = units_.find(handle.unit_id);
      if (it == units_.end()) {
        return expected<void, ProviderError>::error(
            ProviderError::kUnitNotFound);
      }
      Unit& unit = *it->second;
      unit.sink = fn;
      replay.push_back(MakeStarted(unit));
      if (unit.exited) {
        AppendExitSignals(unit, replay);
        unit.exit_reported = true;
      }
    }
    for (const UnitSignal& sig : replay) fn(sig);
    return expected<void, ProviderError>::success();
  }

  expected<void, ProviderError> Terminate(const UnitHandle& handle,
                                          TerminateMode mode) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = units_.find(handle.unit_id);
    if (it == units_.end()) {
      return expected<void, ProviderError>::error(ProviderError::kUnitNotFound);
    }
    Unit& unit = *it->second;
    if (unit.exited) {
      return expected<void, ProviderError>::error(
          ProviderError::kAlreadyExited);
    }
    const int signo = (mode == TerminateMode::kForce) ? SIGKILL : SIGTERM;
    auto r = unit.proc.SignalGroup(signo);
    if (!r) {
      return expected<void, ProviderError>::error(
          ProviderError::kAlreadyExited);
    }
    CRUCIBLE_LOG_DEBUG("Sandbox", "unit %s sent %s", handle.unit_id.c_str(),
                       (signo == SIGKILL) ? "SIGKILL" : "SIGTERM");
    return expected<void, ProviderError>::success();
  }

  expected<std::string, ProviderError> FetchLogs(
      const UnitHandle& handle) override {
    bool known = false;
    bool exited = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = units_.find(handle.unit_id);
      if (it != units_.end()) {
        known = true;
        exited = it->second->exited;
      }
    }
    std::string data;
    std::FILE* fp = std::fopen(handle.output_ref.c_str(), "rbe");
    if (fp == nullptr) {
      return expected<std::string, ProviderError>::error(
          known ? ProviderError::kNotYetAvailable
                : ProviderError::kUnitNotFound);
    }
    char buf[4096];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), fp)) > 0) {
      data.append(buf, n);
    }
    (void)std::fclose(fp);
    if (data.empty() && known && !exited) {
      return expected<std::string, ProviderError>::error(
          ProviderError::kNotYetAvailable);
    }
    return expected<std::string, ProviderError>::success(std::move(data));
  }

  void Cleanup(const UnitHandle& handle) override {
    std::unique_ptr<Unit> doomed;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = units_.find(handle.unit_id);
      if (it == units_.end()) return;
      doomed = std::move(it->second);
      units_.erase(it);
    }
    // Destroyed unlocked: a live Subprocess is killed and reaped here.
  }

  uint32_t LiveUnits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t n = 0;
    for (const auto& kv : units_) {
      if (!kv.second->exited) ++n;
    }
    return n;
  }

 private:
  struct Unit {
    UnitHandle handle;
    Subprocess proc;
    UnitSignalFn sink;
    WaitResult result;
    bool exited = false;
    bool exit_reported = false;
  };

  struct Pending {
    UnitSignalFn sink;
    std::vector<UnitSignal> signals;
  };

  static UnitSignal MakeStarted(const Unit& unit) {
    UnitSignal sig;
    sig.unit_id = unit.handle.unit_id;
    sig.kind = UnitSignalKind::kStarted;
    return sig;
  }

  static void AppendExitSignals(const Unit& unit,
                                std::vector<UnitSignal>& out) {
    const WaitResult& wr = unit.result;

    UnitSignal status;
    status.unit_id = unit.handle.unit_id;
    status.kind = UnitSignalKind::kCompletionStatus;
    status.succeeded = wr.exited && wr.exit_code == 0;
    status.detail = wr.signaled ? "terminated by signal" : "process exited";
    out.push_back(status);

    if (!wr.exited && !wr.signaled) {
      return;  // Status lost (reaped elsewhere): exit code stays unknown.
    }
    UnitSignal code;
    code.unit_id = unit.handle.unit_id;
    code.kind = UnitSignalKind::kExitCode;
    code.exit_code = wr.exited ? wr.exit_code : 128 + wr.term_signal;
    code.term_signal = wr.signaled ? wr.term_signal : 0;
    out.push_back(code);
  }

  void ReapLoop() {
    std::vector<Pending> pending;
    while (running_.load(std::memory_order_acquire)) {
      pending.clear();
      {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& kv : units_) {
          Unit& unit = *kv.second;
          if (unit.exited) continue;
          WaitResult wr = unit.proc.TryWait();
          if (wr.running) continue;
          unit.exited = true;
          unit.result = wr;
          CRUCIBLE_LOG_DEBUG("Sandbox", "unit %s reaped (exit=%d signal=%d)",
                             unit.handle.unit_id.c_str(), wr.exit_code,
                             wr.term_signal);
          if (unit.sink) {
            Pending p;
            p.sink = unit.sink;
            AppendExitSignals(unit, p.signals);
            unit.exit_reported = true;
            pending.push_back(std::move(p));
          }
        }
      }
      for (const Pending& p : pending) {
        for (const UnitSignal& sig : p.signals) p.sink(sig);
      }
      detail::SleepMs(cfg_.reap_interval_ms);
    }
  }

  LocalSandboxConfig cfg_;
  std::atomic<bool> running_{false};
  std::atomic<uint32_t> next_unit_{0};
  std::thread reaper_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::unique_ptr<Unit>> units_;
};

}  // namespace crucible

#endif  // CRUCIBLE_LOCAL_SANDBOX_HPP_
