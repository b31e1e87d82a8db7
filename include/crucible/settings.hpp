/**
 * @file settings.hpp
 * @brief Typed platform settings loaded from a ConfigStore.
 *
 * Every key has a default; a present but malformed or out-of-range value
 * falls back to that default with a WARN log, so a bad config file never
 * prevents the daemon from starting with sane limits.
 *
 * Sections: capacity, limits, dispatcher, router, sandbox, api, results, log.
 */

#ifndef CRUCIBLE_SETTINGS_HPP_
#define CRUCIBLE_SETTINGS_HPP_

#include "crucible/capacity_manager.hpp"
#include "crucible/config.hpp"
#include "crucible/dispatcher.hpp"
#include "crucible/local_sandbox.hpp"
#include "crucible/log.hpp"
#include "crucible/resources.hpp"
#include "crucible/result_publisher.hpp"
#include "crucible/retry_policy.hpp"
#include "crucible/task_router.hpp"

#include <cstdint>
#include <string>

namespace crucible {

struct ApiSettings {
  std::string bind = "127.0.0.1";
  uint16_t port = 8081;
};

struct Settings {
  CapacityLimits capacity;
  NodeLimits limits;
  DispatcherConfig dispatcher;
  RouterConfig router;
  std::string sandbox_backend = "local";
  LocalSandboxConfig sandbox;
  ApiSettings api;
  std::string results_path = "results.jsonl";
  PublisherConfig publisher;
  log::Level log_level = log::Level::kInfo;
};

namespace detail {

/// Unsigned value; zero accepted only when @p allow_zero.
inline uint32_t SettingUint(const ConfigStore& cfg, const char* section,
                            const char* key, uint32_t def,
                            bool allow_zero = false) {
  if (!cfg.HasKey(section, key)) return def;
  auto v = cfg.FindUint(section, key);
  if (!v.has_value() || (!allow_zero && v.value() == 0U)) {
    CRUCIBLE_LOG_WARN("Config", "invalid %s.%s=\"%s\", using %u", section, key,
                      cfg.GetString(section, key), def);
    return def;
  }
  return static_cast<uint32_t>(v.value());
}

inline double SettingDouble(const ConfigStore& cfg, const char* section,
                            const char* key, double def, double min,
                            double max) {
  if (!cfg.HasKey(section, key)) return def;
  auto v = cfg.FindDouble(section, key);
  if (!v.has_value() || v.value() < min || v.value() > max) {
    CRUCIBLE_LOG_WARN("Config", "invalid %s.%s=\"%s\", using %g", section, key,
                      cfg.GetString(section, key), def);
    return def;
  }
  return v.value();
}

}  // namespace detail

/**
 * @brief Build typed settings from a loaded config store.
 */
inline Settings LoadSettings(const ConfigStore& cfg) {
  using detail::SettingDouble;
  using detail::SettingUint;
  Settings s;

  // --- capacity ---
  s.capacity.slots = SettingUint(cfg, "capacity", "slots", s.capacity.slots);
  s.capacity.memory_mb =
      SettingUint(cfg, "capacity", "memory_mb", s.capacity.memory_mb);
  s.capacity.cpu_millicores =
      SettingUint(cfg, "capacity", "cpu_millicores", s.capacity.cpu_millicores);

  // --- limits ---
  NodeLimits& l = s.limits;
  l.max_memory_mb = SettingUint(cfg, "limits", "max_memory_mb", l.max_memory_mb);
  l.max_cpu_millicores =
      SettingUint(cfg, "limits", "max_cpu_millicores", l.max_cpu_millicores);
  l.max_timeout_s = SettingUint(cfg, "limits", "max_timeout_s", l.max_timeout_s);
  l.max_code_bytes =
      SettingUint(cfg, "limits", "max_code_bytes", l.max_code_bytes);
  l.default_timeout_s =
      SettingUint(cfg, "limits", "default_timeout_s", l.default_timeout_s);
  l.default_memory_mb =
      SettingUint(cfg, "limits", "default_memory_mb", l.default_memory_mb);
  l.default_cpu_millicores = SettingUint(cfg, "limits", "default_cpu_millicores",
                                         l.default_cpu_millicores);
  // Per-request limits never exceed the pool totals.
  if (l.max_memory_mb > s.capacity.memory_mb) {
    CRUCIBLE_LOG_WARN("Config",
                      "limits.max_memory_mb %u > capacity.memory_mb %u, clamped",
                      l.max_memory_mb, s.capacity.memory_mb);
    l.max_memory_mb = s.capacity.memory_mb;
  }
  if (l.max_cpu_millicores > s.capacity.cpu_millicores) {
    CRUCIBLE_LOG_WARN(
        "Config",
        "limits.max_cpu_millicores %u > capacity.cpu_millicores %u, clamped",
        l.max_cpu_millicores, s.capacity.cpu_millicores);
    l.max_cpu_millicores = s.capacity.cpu_millicores;
  }
  if (l.default_timeout_s > l.max_timeout_s) {
    CRUCIBLE_LOG_WARN("Config", "limits.default_timeout_s %u > max %u, clamped",
                      l.default_timeout_s, l.max_timeout_s);
    l.default_timeout_s = l.max_timeout_s;
  }
  if (l.default_memory_mb > l.max_memory_mb) {
    CRUCIBLE_LOG_WARN("Config", "limits.default_memory_mb %u > max %u, clamped",
                      l.default_memory_mb, l.max_memory_mb);
    l.default_memory_mb = l.max_memory_mb;
  }
  if (l.default_cpu_millicores > l.max_cpu_millicores) {
    CRUCIBLE_LOG_WARN("Config",
                      "limits.default_cpu_millicores %u > max %u, clamped",
                      l.default_cpu_millicores, l.max_cpu_millicores);
    l.default_cpu_millicores = l.max_cpu_millicores;
  }

  // --- dispatcher ---
  DispatcherConfig& d = s.dispatcher;
  d.limits = l;
  d.tick_ms = SettingUint(cfg, "dispatcher", "tick_ms", d.tick_ms);
  d.grace_low_risk_ms = SettingUint(cfg, "dispatcher", "grace_low_risk_ms",
                                    d.grace_low_risk_ms, true);
  d.grace_medium_risk_ms = SettingUint(cfg, "dispatcher", "grace_medium_risk_ms",
                                       d.grace_medium_risk_ms, true);
  d.grace_high_risk_ms = SettingUint(cfg, "dispatcher", "grace_high_risk_ms",
                                     d.grace_high_risk_ms, true);
  d.exit_code_join_ms = SettingUint(cfg, "dispatcher", "exit_code_join_ms",
                                    d.exit_code_join_ms, true);
  d.force_kill_confirm_ms = SettingUint(
      cfg, "dispatcher", "force_kill_confirm_ms", d.force_kill_confirm_ms);
  d.watch_retry_base_ms = SettingUint(cfg, "dispatcher", "watch_retry_base_ms",
                                      d.watch_retry_base_ms);
  d.watch_retry_max_ms = SettingUint(cfg, "dispatcher", "watch_retry_max_ms",
                                     d.watch_retry_max_ms);
  d.watch_retry_budget_ms = SettingUint(
      cfg, "dispatcher", "watch_retry_budget_ms", d.watch_retry_budget_ms);

  // --- router ---
  RouterConfig& r = s.router;
  r.limits = l;
  r.workers = SettingUint(cfg, "router", "workers", r.workers);
  if (cfg.HasKey("router", "retry_policy")) {
    const char* name = cfg.GetString("router", "retry_policy");
    auto preset = RetryPolicyByName(name);
    if (preset.has_value()) {
      r.retry = preset.value();
    } else {
      CRUCIBLE_LOG_WARN("Config", "unknown router.retry_policy \"%s\"", name);
    }
  }
  r.retry.base_ms = SettingUint(cfg, "router", "retry_base_ms", r.retry.base_ms);
  r.retry.max_ms = SettingUint(cfg, "router", "retry_max_ms", r.retry.max_ms);
  r.retry.multiplier = SettingDouble(cfg, "router", "retry_multiplier",
                                     r.retry.multiplier, 1.0, 10.0);
  r.retry.jitter =
      SettingDouble(cfg, "router", "retry_jitter", r.retry.jitter, 0.0, 1.0);
  r.retry.max_retries =
      SettingUint(cfg, "router", "max_retries", r.retry.max_retries, true);
  r.queue_sla_s = SettingUint(cfg, "router", "queue_sla_s", r.queue_sla_s);

  // --- sandbox ---
  s.sandbox_backend = cfg.GetString("sandbox", "backend", "local");
  if (s.sandbox_backend != "local") {
    CRUCIBLE_LOG_WARN("Config", "unsupported sandbox.backend \"%s\", using local",
                      s.sandbox_backend.c_str());
    s.sandbox_backend = "local";
  }
  s.sandbox.work_dir =
      cfg.GetString("sandbox", "work_dir", s.sandbox.work_dir.c_str());
  s.sandbox.python = cfg.GetString("sandbox", "python", s.sandbox.python.c_str());
  s.sandbox.shell = cfg.GetString("sandbox", "shell", s.sandbox.shell.c_str());

  // --- api ---
  s.api.bind = cfg.GetString("api", "bind", s.api.bind.c_str());
  if (cfg.HasKey("api", "port")) {
    const uint16_t port = cfg.GetPort("api", "port", 0);
    if (port == 0U) {
      CRUCIBLE_LOG_WARN("Config", "invalid api.port \"%s\", using %u",
                        cfg.GetString("api", "port"), s.api.port);
    } else {
      s.api.port = port;
    }
  }

  // --- results ---
  s.results_path = cfg.GetString("results", "path", s.results_path.c_str());
  s.publisher.max_attempts =
      SettingUint(cfg, "results", "max_attempts", s.publisher.max_attempts);

  // --- log ---
  if (cfg.HasKey("log", "level")) {
    s.log_level = log::ParseLevel(cfg.GetString("log", "level"), s.log_level);
  }
  return s;
}

}  // namespace crucible

#endif  // CRUCIBLE_SETTINGS_HPP_
