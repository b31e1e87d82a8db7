/**
 * @file config.hpp
 * @brief Platform configuration: one flat store fed by JSON, YAML or INI
 *        files and "section.key=value" command-line overrides.
 *
 * Each file format is a tag type (JsonBackend, YamlBackend, IniBackend) with
 * a ConfigParser<Tag> specialization; Config<Tags...> picks the parser from
 * the file extension at load time. Formats are CMake opt-in:
 *   - JSON : nlohmann/json  (CRUCIBLE_CONFIG_JSON_ENABLED, always on)
 *   - YAML : fkYAML         (CRUCIBLE_CONFIG_YAML_ENABLED)
 *   - INI  : inih           (CRUCIBLE_CONFIG_INI_ENABLED)
 *
 * Documents are two levels deep: {"router": {"workers": 8}} is section
 * "router", key "workers". Top-level scalars land in section "". Section and
 * key lookups ignore case. Later loads and overrides replace earlier values.
 *
 * @code
 *   crucible::MultiConfig cfg;
 *   cfg.LoadFile("crucible.yaml");
 *   cfg.ApplyOverride("api.port=9090");
 *   auto workers = cfg.FindUint("router", "workers");
 * @endcode
 */

#ifndef CRUCIBLE_CONFIG_HPP_
#define CRUCIBLE_CONFIG_HPP_

#include "crucible/platform.hpp"
#include "crucible/vocabulary.hpp"

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <map>
#include <string>
#include <tuple>
#include <utility>

#ifdef CRUCIBLE_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef CRUCIBLE_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef CRUCIBLE_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#ifndef CRUCIBLE_CONFIG_MAX_FILE_SIZE
#define CRUCIBLE_CONFIG_MAX_FILE_SIZE 65536U
#endif

namespace crucible {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline std::string Lowered(std::string s) {
  for (char& c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

/// Extension of the last path component, lowercased; empty if none.
inline std::string FileExtension(const std::string& path) {
  const size_t slash = path.rfind('/');
  const size_t dot = path.rfind('.');
  if (dot == std::string::npos ||
      (slash != std::string::npos && dot < slash)) {
    return {};
  }
  return Lowered(path.substr(dot + 1));
}

}  // namespace detail

// ============================================================================
// Format tags
// ============================================================================

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const std::string& ext) {
    return detail::Lowered(ext) == "json";
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const std::string& ext) {
    const std::string e = detail::Lowered(ext);
    return e == "yaml" || e == "yml";
  }
};

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const std::string& ext) {
    const std::string e = detail::Lowered(ext);
    return e == "ini" || e == "conf";
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

/**
 * @brief Case-insensitive (section, key) -> text map with typed readers.
 *
 * Find* readers return an empty optional for a missing key and for a value
 * that does not parse completely; Get* readers substitute a default in both
 * cases.
 */
class ConfigStore {
 public:
  void Set(const std::string& section, const std::string& key,
           std::string value) {
    entries_[Slot(section, key)] = std::move(value);
  }

  /**
   * @brief Apply one "section.key=value" override. The value may be empty.
   * @return kParseError if '=' is missing or either name is empty.
   */
  expected<void, ConfigError> ApplyOverride(const char* text) {
    if (text == nullptr) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    const std::string s(text);
    const size_t eq = s.find('=');
    const size_t dot = s.find('.');
    if (eq == std::string::npos || dot == std::string::npos || dot == 0 ||
        dot + 1 >= eq) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    Set(s.substr(0, dot), s.substr(dot + 1, eq - dot - 1), s.substr(eq + 1));
    return expected<void, ConfigError>::success();
  }

  bool HasKey(const char* section, const char* key) const {
    return Raw(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

  // --- strict readers ---

  optional<int32_t> FindInt(const char* section, const char* key) const {
    optional<int64_t> v = FindInteger(section, key);
    if (!v.has_value() || v.value() < INT32_MIN || v.value() > INT32_MAX) {
      return {};
    }
    return optional<int32_t>{static_cast<int32_t>(v.value())};
  }

  optional<uint32_t> FindUint(const char* section, const char* key) const {
    optional<int64_t> v = FindInteger(section, key);
    if (!v.has_value() || v.value() < 0 || v.value() > UINT32_MAX) return {};
    return optional<uint32_t>{static_cast<uint32_t>(v.value())};
  }

  optional<double> FindDouble(const char* section, const char* key) const {
    const std::string* raw = Raw(section, key);
    if (raw == nullptr || raw->empty()) return {};
    char* end = nullptr;
    const double v = std::strtod(raw->c_str(), &end);
    if (*end != '\0') return {};
    return optional<double>{v};
  }

  /// Accepts true/false, yes/no, on/off and 1/0.
  optional<bool> FindBool(const char* section, const char* key) const {
    const std::string* raw = Raw(section, key);
    if (raw == nullptr) return {};
    const std::string v = detail::Lowered(*raw);
    if (v == "true" || v == "yes" || v == "on" || v == "1") {
      return optional<bool>{true};
    }
    if (v == "false" || v == "no" || v == "off" || v == "0") {
      return optional<bool>{false};
    }
    return {};
  }

  // --- readers with defaults ---

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const std::string* raw = Raw(section, key);
    return (raw != nullptr) ? raw->c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    return FindInt(section, key).value_or(default_val);
  }

  uint32_t GetUint(const char* section, const char* key,
                   uint32_t default_val = 0) const {
    return FindUint(section, key).value_or(default_val);
  }

  double GetDouble(const char* section, const char* key,
                   double default_val = 0.0) const {
    return FindDouble(section, key).value_or(default_val);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    return FindBool(section, key).value_or(default_val);
  }

  /// Saturates to [0, 65535]; non-numeric text yields the default.
  uint16_t GetPort(const char* section, const char* key,
                   uint16_t default_val = 0) const {
    optional<int64_t> v = FindInteger(section, key);
    if (!v.has_value()) return default_val;
    if (v.value() < 0) return 0;
    if (v.value() > 65535) return 65535;
    return static_cast<uint16_t>(v.value());
  }

 protected:
  /// Whole file into @p out; kBufferFull above CRUCIBLE_CONFIG_MAX_FILE_SIZE.
  static expected<void, ConfigError> ReadFile(const char* path,
                                              std::string& out) {
    FILE* f = std::fopen(path, "rbe");
    if (f == nullptr) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    out.clear();
    char buf[4096];
    size_t n;
    bool too_big = false;
    while (!too_big && (n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
      out.append(buf, n);
      too_big = out.size() > CRUCIBLE_CONFIG_MAX_FILE_SIZE;
    }
    std::fclose(f);
    if (too_big) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  using SlotKey = std::pair<std::string, std::string>;

  static SlotKey Slot(const std::string& section, const std::string& key) {
    return {detail::Lowered(section), detail::Lowered(key)};
  }

  const std::string* Raw(const char* section, const char* key) const {
    CRUCIBLE_ASSERT(section != nullptr && key != nullptr);
    auto it = entries_.find(Slot(section, key));
    return (it != entries_.end()) ? &it->second : nullptr;
  }

  optional<int64_t> FindInteger(const char* section, const char* key) const {
    const std::string* raw = Raw(section, key);
    if (raw == nullptr || raw->empty()) return {};
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(raw->c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE) return {};
    return optional<int64_t>{static_cast<int64_t>(v)};
  }

  std::map<SlotKey, std::string> entries_;
};

// ============================================================================
// ConfigParser<Tag>
// ============================================================================

/// Formats compiled out report kFormatNotSupported.
template <typename Tag>
struct ConfigParser {
  static expected<void, ConfigError> Parse(ConfigStore&, const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef CRUCIBLE_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store,
                                           const std::string& text) {
    const nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (const auto& top : doc.items()) {
      if (!top.value().is_object()) {
        store.Set("", top.key(), Text(top.value()));
        continue;
      }
      for (const auto& entry : top.value().items()) {
        store.Set(top.key(), entry.key(), Text(entry.value()));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  // Strings unquoted; numbers, booleans and nested values as JSON text.
  static std::string Text(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    return v.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  }
};
#endif

#ifdef CRUCIBLE_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store,
                                           const std::string& text) {
    fkyaml::node root;
    try {
      root = fkyaml::node::deserialize(text);
    } catch (const std::exception&) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      const std::string section = it.key().get_value<std::string>();
      const fkyaml::node& value = *it;
      if (!value.is_mapping()) {
        store.Set("", section, Text(value));
        continue;
      }
      for (auto kit = value.begin(); kit != value.end(); ++kit) {
        store.Set(section, kit.key().get_value<std::string>(), Text(*kit));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  // Sequences and nested mappings are not settings; they read as "".
  static std::string Text(const fkyaml::node& v) {
    if (v.is_string()) return v.get_value<std::string>();
    if (v.is_boolean()) return v.get_value<bool>() ? "true" : "false";
    if (v.is_integer()) return std::to_string(v.get_value<int64_t>());
    if (v.is_float_number()) {
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%.17g", v.get_value<double>());
      return buf;
    }
    return {};
  }
};
#endif

#ifdef CRUCIBLE_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store,
                                           const std::string& text) {
    if (ini_parse_string(text.c_str(), &OnEntry, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int OnEntry(void* user, const char* section, const char* name,
                     const char* value) {
    static_cast<ConfigStore*>(user)->Set(section ? section : "",
                                         name ? name : "", value ? value : "");
    return 1;
  }
};
#endif

// ============================================================================
// Config<Tags...>
// ============================================================================

/**
 * @brief ConfigStore that can load the formats named by @p Tags.
 *
 * kAuto resolves from the file extension; an unknown or missing extension
 * uses the first tag.
 */
template <typename... Tags>
class Config final : public ConfigStore {
  static_assert(sizeof...(Tags) > 0, "Config needs at least one format");

 public:
  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    CRUCIBLE_ASSERT(path != nullptr);
    std::string text;
    auto read = ReadFile(path, text);
    if (!read.has_value()) return read;
    if (format == ConfigFormat::kAuto) format = FormatFor(path);
    return LoadText(text, format);
  }

  expected<void, ConfigError> LoadText(const std::string& text,
                                       ConfigFormat format) {
    if (format == ConfigFormat::kAuto) format = kDefaultFormat;
    expected<void, ConfigError> result =
        expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
    (void)((Tags::kFormat == format
                ? (result = ConfigParser<Tags>::Parse(*this, text), true)
                : false) ||
           ...);
    return result;
  }

 private:
  static constexpr ConfigFormat kDefaultFormat =
      std::tuple_element<0, std::tuple<Tags...>>::type::kFormat;

  static ConfigFormat FormatFor(const std::string& path) {
    const std::string ext = detail::FileExtension(path);
    ConfigFormat found = kDefaultFormat;
    if (!ext.empty()) {
      (void)((Tags::MatchesExtension(ext) ? (found = Tags::kFormat, true)
                                          : false) ||
             ...);
    }
    return found;
  }
};

/// Every compiled-in format; JSON first so extension-less files parse as JSON.
using MultiConfig = Config<JsonBackend
#ifdef CRUCIBLE_CONFIG_YAML_ENABLED
                           ,
                           YamlBackend
#endif
#ifdef CRUCIBLE_CONFIG_INI_ENABLED
                           ,
                           IniBackend
#endif
                           >;

}  // namespace crucible

#endif  // CRUCIBLE_CONFIG_HPP_
