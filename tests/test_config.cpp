/**
 * @file test_config.cpp
 * @brief Tests for config.hpp - flat store, overrides and file formats.
 */

#include "crucible/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstring>

#include <sys/stat.h>

namespace {

void WriteFile(const char* path, const char* text) {
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fputs(text, f);
  std::fclose(f);
}

}  // namespace

// ============================================================================
// ConfigStore (format independent)
// ============================================================================

TEST_CASE("ConfigStore Set and typed getters", "[config]") {
  crucible::ConfigStore store;
  store.Set("capacity", "slots", "8");
  store.Set("router", "retry_jitter", "0.25");
  store.Set("api", "port", "70000");
  store.Set("log", "color", "on");

  REQUIRE(store.GetInt("capacity", "slots", 0) == 8);
  REQUIRE(store.GetUint("capacity", "slots", 0) == 8U);
  REQUIRE(store.GetDouble("router", "retry_jitter") > 0.24);
  REQUIRE(store.GetPort("api", "port") == 65535);
  REQUIRE(store.GetBool("log", "color"));
  REQUIRE(store.EntryCount() == 4U);
}

TEST_CASE("ConfigStore defaults for missing keys", "[config]") {
  crucible::ConfigStore store;
  REQUIRE(std::strcmp(store.GetString("x", "y", "default"), "default") == 0);
  REQUIRE(store.GetInt("x", "y", 42) == 42);
  REQUIRE(store.GetBool("x", "y", true));
  REQUIRE(!store.FindInt("x", "y").has_value());
  REQUIRE(!store.FindUint("x", "y").has_value());
  REQUIRE(!store.FindDouble("x", "y").has_value());
  REQUIRE(!store.FindBool("x", "y").has_value());
  REQUIRE(!store.HasKey("x", "y"));
}

TEST_CASE("ConfigStore rejects malformed numbers", "[config]") {
  crucible::ConfigStore store;
  store.Set("limits", "max_memory_mb", "512MB");
  store.Set("limits", "max_timeout_s", "-5");
  store.Set("limits", "max_code_bytes", "");
  store.Set("limits", "huge", "99999999999");
  store.Set("router", "retry_multiplier", "2x");

  REQUIRE(!store.FindInt("limits", "max_memory_mb").has_value());
  REQUIRE(store.FindInt("limits", "max_timeout_s").value() == -5);
  REQUIRE(!store.FindUint("limits", "max_timeout_s").has_value());
  REQUIRE(store.GetUint("limits", "max_timeout_s", 600) == 600U);
  REQUIRE(!store.FindUint("limits", "max_code_bytes").has_value());
  REQUIRE(!store.FindInt("limits", "huge").has_value());
  REQUIRE(!store.FindUint("limits", "huge").has_value());
  REQUIRE(!store.FindDouble("router", "retry_multiplier").has_value());
  REQUIRE(store.HasKey("limits", "max_timeout_s"));
}

TEST_CASE("ConfigStore booleans must be recognised words", "[config]") {
  crucible::ConfigStore store;
  store.Set("log", "a", "YES");
  store.Set("log", "b", "off");
  store.Set("log", "c", "maybe");
  REQUIRE(store.FindBool("log", "a").value());
  REQUIRE(!store.FindBool("log", "b").value());
  REQUIRE(!store.FindBool("log", "c").has_value());
  REQUIRE(store.GetBool("log", "c", true));
}

TEST_CASE("ConfigStore keys are case insensitive", "[config]") {
  crucible::ConfigStore store;
  store.Set("Dispatcher", "Tick_MS", "50");
  REQUIRE(store.GetInt("dispatcher", "tick_ms", 0) == 50);
  store.Set("DISPATCHER", "tick_ms", "75");
  REQUIRE(store.EntryCount() == 1U);
  REQUIRE(store.GetInt("Dispatcher", "TICK_MS", 0) == 75);
}

TEST_CASE("ApplyOverride replaces or adds entries", "[config]") {
  crucible::ConfigStore store;
  store.Set("capacity", "slots", "4");

  REQUIRE(store.ApplyOverride("capacity.slots=16").has_value());
  REQUIRE(store.GetInt("capacity", "slots", 0) == 16);

  REQUIRE(store.ApplyOverride("api.bind=0.0.0.0").has_value());
  REQUIRE(std::strcmp(store.GetString("api", "bind"), "0.0.0.0") == 0);

  REQUIRE(store.ApplyOverride("results.path=").has_value());
  REQUIRE(store.HasKey("results", "path"));
  REQUIRE(std::strcmp(store.GetString("results", "path", "x"), "") == 0);

  // Only the first '.' splits; the value keeps its own dots and '='.
  REQUIRE(store.ApplyOverride("sandbox.work_dir=/tmp/a.b=c").has_value());
  REQUIRE(std::strcmp(store.GetString("sandbox", "work_dir"), "/tmp/a.b=c") ==
          0);
}

TEST_CASE("ApplyOverride rejects malformed text", "[config]") {
  crucible::ConfigStore store;
  REQUIRE(store.ApplyOverride("no_equals").get_error() ==
          crucible::ConfigError::kParseError);
  REQUIRE(store.ApplyOverride("nodot=1").get_error() ==
          crucible::ConfigError::kParseError);
  REQUIRE(store.ApplyOverride(".key=1").get_error() ==
          crucible::ConfigError::kParseError);
  REQUIRE(store.ApplyOverride("section.=1").get_error() ==
          crucible::ConfigError::kParseError);
  REQUIRE(store.ApplyOverride("key=a.b").get_error() ==
          crucible::ConfigError::kParseError);
  REQUIRE(store.ApplyOverride(nullptr).get_error() ==
          crucible::ConfigError::kParseError);
  REQUIRE(store.EntryCount() == 0U);
}

// ============================================================================
// INI
// ============================================================================

#ifdef CRUCIBLE_CONFIG_INI_ENABLED

using IniCfg = crucible::Config<crucible::IniBackend>;

TEST_CASE("INI sections and keys", "[config][ini]") {
  IniCfg cfg;
  auto result = cfg.LoadText(
      "[capacity]\n"
      "slots = 6\n"
      "[api]\n"
      "bind = 0.0.0.0\n",
      crucible::ConfigFormat::kIni);
  REQUIRE(result.has_value());
  REQUIRE(cfg.GetInt("capacity", "slots", 0) == 6);
  REQUIRE(std::strcmp(cfg.GetString("api", "bind"), "0.0.0.0") == 0);
}

TEST_CASE("INI LoadFile by .conf extension", "[config][ini]") {
  const char* path = "/tmp/__crucible_test_config__.conf";
  WriteFile(path, "[router]\nworkers = 3\n");
  IniCfg cfg;
  REQUIRE(cfg.LoadFile(path).has_value());
  REQUIRE(cfg.GetInt("router", "workers", 0) == 3);
  std::remove(path);
}

#endif  // CRUCIBLE_CONFIG_INI_ENABLED

// ============================================================================
// JSON
// ============================================================================

#ifdef CRUCIBLE_CONFIG_JSON_ENABLED

using JsonCfg = crucible::Config<crucible::JsonBackend>;

TEST_CASE("JSON sections become config sections", "[config][json]") {
  JsonCfg cfg;
  auto result = cfg.LoadText(R"({
    "capacity": {"slots": 12, "memory_mb": 8192},
    "sandbox": {"backend": "local"}
  })",
                             crucible::ConfigFormat::kJson);
  REQUIRE(result.has_value());
  REQUIRE(cfg.GetInt("capacity", "slots", 0) == 12);
  REQUIRE(cfg.FindUint("capacity", "memory_mb").value() == 8192U);
  REQUIRE(std::strcmp(cfg.GetString("sandbox", "backend"), "local") == 0);
}

TEST_CASE("JSON top-level scalars use the empty section", "[config][json]") {
  JsonCfg cfg;
  REQUIRE(cfg.LoadText(R"({"name": "test", "count": 42})",
                       crucible::ConfigFormat::kJson)
              .has_value());
  REQUIRE(std::strcmp(cfg.GetString("", "name"), "test") == 0);
  REQUIRE(cfg.GetInt("", "count", 0) == 42);
}

TEST_CASE("JSON booleans, floats and nested values", "[config][json]") {
  JsonCfg cfg;
  REQUIRE(cfg.LoadText(R"({
    "router": {"retry_jitter": 0.5, "strict": true, "tags": [1, 2]}
  })",
                       crucible::ConfigFormat::kJson)
              .has_value());
  REQUIRE(cfg.FindDouble("router", "retry_jitter").value() == 0.5);
  REQUIRE(cfg.GetBool("router", "strict"));
  REQUIRE(std::strcmp(cfg.GetString("router", "tags"), "[1,2]") == 0);
}

TEST_CASE("JSON parse errors", "[config][json]") {
  JsonCfg cfg;
  REQUIRE(cfg.LoadText("{ invalid json ]", crucible::ConfigFormat::kJson)
              .get_error() == crucible::ConfigError::kParseError);
  REQUIRE(cfg.LoadText("[1, 2, 3]", crucible::ConfigFormat::kJson)
              .get_error() == crucible::ConfigError::kParseError);
  REQUIRE(cfg.EntryCount() == 0U);
}

TEST_CASE("JSON-only config refuses other formats", "[config][json]") {
  JsonCfg cfg;
  REQUIRE(cfg.LoadText("a: 1\n", crucible::ConfigFormat::kYaml).get_error() ==
          crucible::ConfigError::kFormatNotSupported);
}

TEST_CASE("JSON LoadFile then override", "[config][json]") {
  const char* path = "/tmp/__crucible_test_config__.json";
  WriteFile(path, R"({"api": {"port": 9090, "bind": "127.0.0.1"}})");

  JsonCfg cfg;
  REQUIRE(cfg.LoadFile(path).has_value());
  REQUIRE(cfg.GetPort("api", "port") == 9090);
  REQUIRE(cfg.ApplyOverride("api.port=9191").has_value());
  REQUIRE(cfg.GetPort("api", "port") == 9191);
  std::remove(path);
}

TEST_CASE("JSON LoadFile missing file", "[config][json]") {
  JsonCfg cfg;
  REQUIRE(cfg.LoadFile("/tmp/__crucible_nonexistent__.json").get_error() ==
          crucible::ConfigError::kFileNotFound);
}

TEST_CASE("MultiConfig picks the format from the extension", "[config][multi]") {
  const char* path = "/tmp/__crucible.multi__.JSON";
  WriteFile(path, R"({"log": {"level": "warn"}})");

  crucible::MultiConfig cfg;
  REQUIRE(cfg.LoadFile(path).has_value());
  REQUIRE(std::strcmp(cfg.GetString("log", "level"), "warn") == 0);
  std::remove(path);
}

TEST_CASE("MultiConfig reads extension-less files as JSON", "[config][multi]") {
  const char* path = "/tmp/__crucible.d/crucible_config";
  (void)::mkdir("/tmp/__crucible.d", 0755);
  WriteFile(path, R"({"router": {"workers": 5}})");

  crucible::MultiConfig cfg;
  REQUIRE(cfg.LoadFile(path).has_value());
  REQUIRE(cfg.GetInt("router", "workers", 0) == 5);
  std::remove(path);
  std::remove("/tmp/__crucible.d");
}

TEST_CASE("Later loads replace earlier values", "[config][multi]") {
  crucible::MultiConfig cfg;
  REQUIRE(cfg.LoadText(R"({"capacity": {"slots": 4, "memory_mb": 1024}})",
                       crucible::ConfigFormat::kJson)
              .has_value());
  REQUIRE(cfg.LoadText(R"({"capacity": {"slots": 9}})",
                       crucible::ConfigFormat::kJson)
              .has_value());
  REQUIRE(cfg.GetInt("capacity", "slots", 0) == 9);
  REQUIRE(cfg.GetInt("capacity", "memory_mb", 0) == 1024);
  REQUIRE(cfg.EntryCount() == 2U);
}

#endif  // CRUCIBLE_CONFIG_JSON_ENABLED

// ============================================================================
// YAML
// ============================================================================

#ifdef CRUCIBLE_CONFIG_YAML_ENABLED

using YamlCfg = crucible::Config<crucible::YamlBackend>;

TEST_CASE("YAML mappings become config sections", "[config][yaml]") {
  YamlCfg cfg;
  auto result = cfg.LoadText(
      "dispatcher:\n"
      "  tick_ms: 25\n"
      "  grace_high_risk_ms: 500\n"
      "results:\n"
      "  path: out.jsonl\n",
      crucible::ConfigFormat::kYaml);
  REQUIRE(result.has_value());
  REQUIRE(cfg.GetInt("dispatcher", "tick_ms", 0) == 25);
  REQUIRE(cfg.GetInt("dispatcher", "grace_high_risk_ms", 0) == 500);
  REQUIRE(std::strcmp(cfg.GetString("results", "path"), "out.jsonl") == 0);
}

TEST_CASE("YAML scalar root is a parse error", "[config][yaml]") {
  YamlCfg cfg;
  REQUIRE(cfg.LoadText("just text\n", crucible::ConfigFormat::kYaml)
              .get_error() == crucible::ConfigError::kParseError);
}

#endif  // CRUCIBLE_CONFIG_YAML_ENABLED

// ============================================================================
// Format tags
// ============================================================================

TEST_CASE("Format tags match their extensions", "[config][tag]") {
  REQUIRE(crucible::IniBackend::MatchesExtension("ini"));
  REQUIRE(crucible::IniBackend::MatchesExtension("CONF"));
  REQUIRE(crucible::JsonBackend::MatchesExtension("json"));
  REQUIRE(!crucible::JsonBackend::MatchesExtension("yaml"));
  REQUIRE(crucible::YamlBackend::MatchesExtension("yml"));
}
