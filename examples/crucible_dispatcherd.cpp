/**
 * @file crucible_dispatcherd.cpp
 * @brief Evaluation dispatcher daemon: HTTP API over a local process sandbox.
 *
 * Usage:
 *   crucible_dispatcherd [config.json] [section.key=value ...]
 *
 * Examples:
 *   crucible_dispatcherd
 *   crucible_dispatcherd crucible.json api.port=9090 log.level=debug
 *
 * Stops on SIGINT/SIGTERM. Shutdown runs in reverse start order: stop
 * accepting HTTP, stop the router, stop timers, terminate live units,
 * drain the event bus.
 */

#include "crucible/api.hpp"
#include "crucible/config.hpp"
#include "crucible/local_sandbox.hpp"
#include "crucible/log.hpp"
#include "crucible/result_publisher.hpp"
#include "crucible/settings.hpp"
#include "crucible/shutdown.hpp"
#include "crucible/timer.hpp"

#include <cstdio>
#include <cstring>

namespace {

constexpr uint32_t kBusCapacity = 4096U;
constexpr uint32_t kPublisherRetryMs = 500U;

void StopServer(int /*signo*/, void* ctx) {
  static_cast<crucible::HttpServer*>(ctx)->Stop();
}

void StopRouter(int /*signo*/, void* ctx) {
  static_cast<crucible::TaskRouter*>(ctx)->Shutdown();
}

void StopTimer(int /*signo*/, void* ctx) {
  static_cast<crucible::TimerScheduler*>(ctx)->Stop();
}

void StopDispatcher(int /*signo*/, void* ctx) {
  static_cast<crucible::Dispatcher*>(ctx)->Shutdown();
}

void StopBus(int /*signo*/, void* ctx) {
  auto* bus = static_cast<crucible::EventBus*>(ctx);
  if (!bus->Flush(2000U)) {
    CRUCIBLE_LOG_WARN("Daemon", "event bus did not drain before shutdown");
  }
  bus->Stop();
}

void PrintUsage(const char* prog) {
  std::printf("Usage: %s [config.json] [section.key=value ...]\n", prog);
}

}  // namespace

int main(int argc, char* argv[]) {
  crucible::log::Init();

  // -- Configuration ---------------------------------------------------------
  crucible::MultiConfig cfg;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
      PrintUsage(argv[0]);
      return 0;
    }
    if (std::strchr(argv[i], '=') != nullptr) {
      if (!cfg.ApplyOverride(argv[i]).has_value()) {
        CRUCIBLE_LOG_ERROR("Daemon", "bad override \"%s\"", argv[i]);
        return 1;
      }
      continue;
    }
    auto loaded = cfg.LoadFile(argv[i]);
    if (!loaded.has_value()) {
      CRUCIBLE_LOG_ERROR("Daemon", "cannot load config %s (error %u)", argv[i],
                         static_cast<unsigned>(loaded.get_error()));
      return 1;
    }
    CRUCIBLE_LOG_INFO("Daemon", "loaded %s (%u entries)", argv[i],
                      cfg.EntryCount());
  }

  const crucible::Settings settings = crucible::LoadSettings(cfg);
  crucible::log::SetLevel(settings.log_level);

  // -- Core ------------------------------------------------------------------
  crucible::EventBus bus(kBusCapacity);
  crucible::StateMachine lifecycle(bus);
  crucible::JsonLinesResultStore store(settings.results_path);
  crucible::ResultPublisher publisher(bus, store, settings.publisher);
  crucible::CapacityManager capacity(settings.capacity);
  crucible::LocalSandbox sandbox(settings.sandbox);
  crucible::Dispatcher dispatcher(settings.dispatcher, capacity, sandbox, bus);
  crucible::TaskRouter router(settings.router, dispatcher, lifecycle);
  crucible::DispatcherApi api(dispatcher, router, lifecycle, capacity);
  crucible::TimerScheduler timer(8);

  crucible::HttpServerConfig http_cfg;
  http_cfg.bind = settings.api.bind;
  http_cfg.port = settings.api.port;
  crucible::HttpServer server(http_cfg, [&api](const crucible::HttpRequest& req) {
    return api.Handle(req);
  });

  crucible::ShutdownManager shutdown;
  if (!shutdown.IsValid() || !shutdown.InstallSignalHandlers().has_value()) {
    CRUCIBLE_LOG_ERROR("Daemon", "cannot install signal handlers");
    return 1;
  }

  // -- Start (callbacks run LIFO, so register in start order) ---------------
  lifecycle.AttachToBus();
  publisher.Attach();
  if (!bus.Start().has_value()) {
    CRUCIBLE_LOG_ERROR("Daemon", "event bus failed to start");
    return 1;
  }
  (void)shutdown.Register(&StopBus, &bus);
  (void)shutdown.Register(&StopDispatcher, &dispatcher);

  if (!dispatcher.Start(timer).has_value() ||
      !timer.Add(kPublisherRetryMs, &crucible::ResultPublisher::TickThunk,
                 &publisher)
           .has_value() ||
      !timer.Start().has_value()) {
    CRUCIBLE_LOG_ERROR("Daemon", "timer scheduler failed to start");
    shutdown.Quit();
    shutdown.WaitForShutdown();
    return 1;
  }
  (void)shutdown.Register(&StopTimer, &timer);

  router.Start();
  (void)shutdown.Register(&StopRouter, &router);

  auto listening = server.Start();
  if (!listening.has_value()) {
    CRUCIBLE_LOG_ERROR("Daemon", "cannot listen on %s:%u (error %u)",
                       http_cfg.bind.c_str(), http_cfg.port,
                       static_cast<unsigned>(listening.get_error()));
    shutdown.Quit();
    shutdown.WaitForShutdown();
    return 1;
  }
  (void)shutdown.Register(&StopServer, &server);

  CRUCIBLE_LOG_INFO("Daemon",
                    "listening on %s:%u, %u slots, %u workers, backend=%s",
                    http_cfg.bind.c_str(), server.Port(),
                    settings.capacity.slots, settings.router.workers,
                    settings.sandbox_backend.c_str());

  shutdown.WaitForShutdown();

  const crucible::DispatcherStatistics stats = dispatcher.GetStatistics();
  CRUCIBLE_LOG_INFO("Daemon",
                    "stopped (signal %d): accepted=%lu completed=%lu "
                    "failed=%lu timeouts=%lu cancelled=%lu",
                    shutdown.Signal(), static_cast<unsigned long>(stats.accepted),
                    static_cast<unsigned long>(stats.completed),
                    static_cast<unsigned long>(stats.failed),
                    static_cast<unsigned long>(stats.timeouts),
                    static_cast<unsigned long>(stats.cancelled));
  crucible::log::Shutdown();
  return 0;
}
