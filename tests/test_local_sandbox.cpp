/**
 * @file test_local_sandbox.cpp
 * @brief Tests for local_sandbox.hpp
 */

#include "crucible/local_sandbox.hpp"
#include "crucible/shutdown.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <mutex>
#include <string>
#include <sstream>
#include <vector>

#include <unistd.h>

namespace {

/// Thread-safe signal recorder for the reaper thread.
struct SignalLog {
  std::mutex mutex;
  std::condition_variable cv;
  std::vector<crucible::UnitSignal> signals;

  crucible::UnitSignalFn Sink() {
    return [this](const crucible::UnitSignal& sig) {
      std::lock_guard<std::mutex> lock(mutex);
      signals.push_back(sig);
      cv.notify_all();
    };
  }

  bool WaitFor(crucible::UnitSignalKind kind, uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&] {
      for (const auto& s : signals) {
        if (s.kind == kind) return true;
      }
      return false;
    });
  }

  crucible::UnitSignal Find(crucible::UnitSignalKind kind) {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& s : signals) {
      if (s.kind == kind) return s;
    }
    return crucible::UnitSignal{};
  }
};

crucible::LocalSandboxConfig TestConfig() {
  crucible::LocalSandboxConfig cfg;
  cfg.work_dir = "/tmp/crucible_test_sandbox";
  cfg.reap_interval_ms = 5;
  return cfg;
}

crucible::UnitSpec ShellSpec(const std::string& id, const std::string& code,
                             uint32_t timeout_s = 10) {
  crucible::UnitSpec spec;
  spec.evaluation_id = id;
  spec.code = code;
  spec.language = "sh";
  spec.resources.memory_mb = 256;
  spec.resources.cpu_millicores = 500;
  spec.resources.timeout_s = timeout_s;
  return spec;
}

}  // namespace

TEST_CASE("LocalSandbox runs a script to completion", "[local_sandbox]") {
  crucible::LocalSandbox sandbox(TestConfig());
  auto h = sandbox.CreateUnit(ShellSpec("ls-ok", "echo hello-sandbox\nexit 0\n"));
  REQUIRE(h.has_value());
  REQUIRE(h.value().unit_id.find("ls-ok") != std::string::npos);

  SignalLog log;
  REQUIRE(sandbox.Watch(h.value(), log.Sink()).has_value());
  REQUIRE(log.WaitFor(crucible::UnitSignalKind::kExitCode, 5000));

  auto status = log.Find(crucible::UnitSignalKind::kCompletionStatus);
  REQUIRE(status.succeeded);
  auto code = log.Find(crucible::UnitSignalKind::kExitCode);
  REQUIRE(code.exit_code == 0);
  REQUIRE(code.term_signal == 0);

  auto logs = sandbox.FetchLogs(h.value());
  REQUIRE(logs.has_value());
  REQUIRE(logs.value().find("hello-sandbox") != std::string::npos);
  REQUIRE(sandbox.LiveUnits() == 0U);
  sandbox.Cleanup(h.value());
}

TEST_CASE("LocalSandbox reports a non-zero exit", "[local_sandbox]") {
  crucible::LocalSandbox sandbox(TestConfig());
  auto h = sandbox.CreateUnit(ShellSpec("ls-fail", "exit 7\n"));
  REQUIRE(h.has_value());

  SignalLog log;
  REQUIRE(sandbox.Watch(h.value(), log.Sink()).has_value());
  REQUIRE(log.WaitFor(crucible::UnitSignalKind::kExitCode, 5000));
  REQUIRE(!log.Find(crucible::UnitSignalKind::kCompletionStatus).succeeded);
  REQUIRE(log.Find(crucible::UnitSignalKind::kExitCode).exit_code == 7);
  sandbox.Cleanup(h.value());
}

TEST_CASE("LocalSandbox graceful terminate yields 143", "[local_sandbox]") {
  crucible::LocalSandbox sandbox(TestConfig());
  auto h = sandbox.CreateUnit(ShellSpec("ls-sleep", "sleep 10\n", 2));
  REQUIRE(h.has_value());

  SignalLog log;
  REQUIRE(sandbox.Watch(h.value(), log.Sink()).has_value());
  REQUIRE(log.WaitFor(crucible::UnitSignalKind::kStarted, 1000));
  REQUIRE(sandbox.LiveUnits() == 1U);

  REQUIRE(sandbox.Terminate(h.value(), crucible::TerminateMode::kGraceful)
              .has_value());
  REQUIRE(log.WaitFor(crucible::UnitSignalKind::kExitCode, 5000));
  auto code = log.Find(crucible::UnitSignalKind::kExitCode);
  REQUIRE(code.exit_code == 143);
  REQUIRE(code.term_signal == 15);

  auto again = sandbox.Terminate(h.value(), crucible::TerminateMode::kForce);
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error() == crucible::ProviderError::kAlreadyExited);
  sandbox.Cleanup(h.value());
}

TEST_CASE("LocalSandbox replays exit to a late watcher", "[local_sandbox]") {
  crucible::LocalSandbox sandbox(TestConfig());
  auto h = sandbox.CreateUnit(ShellSpec("ls-late", "exit 0\n"));
  REQUIRE(h.has_value());

  for (int i = 0; i < 400 && sandbox.LiveUnits() != 0U; ++i) {
    crucible::detail::SleepMs(5);
  }
  REQUIRE(sandbox.LiveUnits() == 0U);

  SignalLog log;
  REQUIRE(sandbox.Watch(h.value(), log.Sink()).has_value());
  // Replay runs on the Watch() caller.
  REQUIRE(log.Find(crucible::UnitSignalKind::kStarted).kind ==
          crucible::UnitSignalKind::kStarted);
  REQUIRE(log.WaitFor(crucible::UnitSignalKind::kExitCode, 100));
  sandbox.Cleanup(h.value());
}

TEST_CASE("LocalSandbox rejects unsupported languages", "[local_sandbox]") {
  crucible::LocalSandbox sandbox(TestConfig());
  auto spec = ShellSpec("ls-ruby", "puts 1");
  spec.language = "ruby";
  auto h = sandbox.CreateUnit(spec);
  REQUIRE(!h.has_value());
  REQUIRE(h.get_error() == crucible::ProviderError::kInvalidSpec);
}

TEST_CASE("LocalSandbox unknown units", "[local_sandbox]") {
  crucible::LocalSandbox sandbox(TestConfig());
  crucible::UnitHandle ghost;
  ghost.unit_id = "local-ghost-1";
  ghost.output_ref = "/nonexistent/output.log";

  REQUIRE(sandbox.Watch(ghost, [](const crucible::UnitSignal&) {})
              .get_error() == crucible::ProviderError::kUnitNotFound);
  REQUIRE(sandbox.Terminate(ghost, crucible::TerminateMode::kForce)
              .get_error() == crucible::ProviderError::kUnitNotFound);
  REQUIRE(sandbox.FetchLogs(ghost).get_error() ==
          crucible::ProviderError::kUnitNotFound);
  sandbox.Cleanup(ghost);  // no-op
}

TEST_CASE("LocalSandbox cleanup kills a live unit", "[local_sandbox]") {
  crucible::LocalSandbox sandbox(TestConfig());
  auto h = sandbox.CreateUnit(ShellSpec("ls-cleanup", "sleep 30\n"));
  REQUIRE(h.has_value());
  REQUIRE(sandbox.LiveUnits() == 1U);
  sandbox.Cleanup(h.value());
  REQUIRE(sandbox.LiveUnits() == 0U);
}

TEST_CASE("LocalSandbox children inherit only stdio", "[local_sandbox]") {
  // A live self-pipe and a plain pipe opened without close-on-exec.
  crucible::ShutdownManager shutdown;
  REQUIRE(shutdown.IsValid());
  int leaky[2];
  REQUIRE(::pipe(leaky) == 0);

  crucible::LocalSandbox sandbox(TestConfig());
  // ls runs as a child, so it lists the shell's descriptors, not its own.
  auto h = sandbox.CreateUnit(ShellSpec("ls-fds", "ls /proc/$$/fd\n"));
  REQUIRE(h.has_value());
  SignalLog log;
  REQUIRE(sandbox.Watch(h.value(), log.Sink()).has_value());
  REQUIRE(log.WaitFor(crucible::UnitSignalKind::kExitCode, 5000));
  REQUIRE(log.Find(crucible::UnitSignalKind::kExitCode).exit_code == 0);

  auto logs = sandbox.FetchLogs(h.value());
  REQUIRE(logs.has_value());
  std::istringstream in(logs.value());
  std::vector<int> fds;
  int fd = 0;
  while (in >> fd) fds.push_back(fd);

  REQUIRE(fds.size() >= 3U);
  for (int n : fds) {
    // 0-2 are stdio; the shell keeps its script open at 10 or above.
    REQUIRE((n <= 2 || n >= 10));
    REQUIRE(n != leaky[0]);
    REQUIRE(n != leaky[1]);
  }
  sandbox.Cleanup(h.value());
  ::close(leaky[0]);
  ::close(leaky[1]);
}
