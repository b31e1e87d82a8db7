/**
 * @file log.hpp
 * @brief Synchronous printf-style logger with category tags.
 *
 * Output format:
 *   [2026-01-02 10:11:12.345] [INFO] [Dispatch] message (file.hpp:42)
 *
 * Two gates filter messages:
 *   - CRUCIBLE_LOG_MIN_LEVEL: compile-time floor (0=DEBUG .. 4=FATAL)
 *   - log::SetLevel(): runtime threshold
 *
 * The sink is stderr unless Init() was given a file path. Writes are
 * serialized by a mutex so lines from concurrent threads never interleave.
 */

#ifndef CRUCIBLE_LOG_HPP_
#define CRUCIBLE_LOG_HPP_

#include "crucible/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>

#ifndef CRUCIBLE_LOG_MIN_LEVEL
#define CRUCIBLE_LOG_MIN_LEVEL 0
#endif

#ifndef CRUCIBLE_LOG_LINE_MAX
#define CRUCIBLE_LOG_LINE_MAX 1024U
#endif

namespace crucible {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

inline Level DefaultLevel() noexcept {
#ifdef NDEBUG
  return Level::kInfo;
#else
  return Level::kDebug;
#endif
}

inline std::atomic<Level>& LogLevelRef() noexcept {
  static std::atomic<Level> level{DefaultLevel()};
  return level;
}

struct LogState {
  std::mutex mutex;
  FILE* sink = nullptr;  ///< nullptr means stderr
  bool initialized = false;

  static LogState& Instance() noexcept {
    static LogState state;
    return state;
  }
};

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "OFF";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "";
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/') base = p + 1;
  }
  return base;
}

inline void FormatWallclock(char* buf, size_t size) noexcept {
  const uint64_t now_ms = WallNowMs();
  const time_t sec = static_cast<time_t>(now_ms / 1000U);
  struct tm tm_buf;
  localtime_r(&sec, &tm_buf);
  const size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf + n, size - n, ".%03u",
                      static_cast<unsigned>(now_ms % 1000U));
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

/**
 * @brief Initialize the logger.
 * @param path Optional log file path; nullptr keeps stderr.
 * @return false if the file could not be opened (stderr stays active).
 */
inline bool Init(const char* path = nullptr) noexcept {
  auto& st = detail::LogState::Instance();
  std::lock_guard<std::mutex> lock(st.mutex);
  bool ok = true;
  if (path != nullptr && path[0] != '\0') {
    FILE* f = std::fopen(path, "ae");
    if (f != nullptr) {
      if (st.sink != nullptr) std::fclose(st.sink);
      st.sink = f;
    } else {
      ok = false;
    }
  }
  st.initialized = true;
  return ok;
}

/** @brief Flush and close the file sink (if any). */
inline void Shutdown() noexcept {
  auto& st = detail::LogState::Instance();
  std::lock_guard<std::mutex> lock(st.mutex);
  if (st.sink != nullptr) {
    std::fclose(st.sink);
    st.sink = nullptr;
  }
  st.initialized = false;
}

inline bool IsInitialized() noexcept {
  auto& st = detail::LogState::Instance();
  std::lock_guard<std::mutex> lock(st.mutex);
  return st.initialized;
}

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/**
 * @brief Parse "debug"/"info"/"warn"/"error"/"off" (case-insensitive).
 * @return Parsed level, or @p fallback for unrecognized text.
 */
inline Level ParseLevel(const char* text, Level fallback) noexcept {
  if (text == nullptr) return fallback;
  char lower[8] = {};
  size_t i = 0;
  for (; i < sizeof(lower) - 1 && text[i] != '\0'; ++i) {
    char c = text[i];
    lower[i] = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
  }
  if (text[i] != '\0') return fallback;
  if (std::strcmp(lower, "debug") == 0) return Level::kDebug;
  if (std::strcmp(lower, "info") == 0) return Level::kInfo;
  if (std::strcmp(lower, "warn") == 0) return Level::kWarn;
  if (std::strcmp(lower, "error") == 0) return Level::kError;
  if (std::strcmp(lower, "off") == 0) return Level::kOff;
  return fallback;
}

// ============================================================================
// Write Path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) <
      static_cast<uint8_t>(detail::LogLevelRef().load(
          std::memory_order_relaxed))) {
    return;
  }

  char msg[CRUCIBLE_LOG_LINE_MAX];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  char ts[40];
  detail::FormatWallclock(ts, sizeof(ts));

  auto& st = detail::LogState::Instance();
  std::lock_guard<std::mutex> lock(st.mutex);
  FILE* out = (st.sink != nullptr) ? st.sink : stderr;
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(out, "[%s] [%s] [%s] %s\n", ts, detail::LevelTag(level),
                     category, msg);
#else
  (void)std::fprintf(out, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif
  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(out);
  }
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace crucible

// ============================================================================
// Macros
// ============================================================================

#define CRUCIBLE_LOG_DEBUG(cat, fmt, ...)                                   \
  do {                                                                      \
    if (CRUCIBLE_LOG_MIN_LEVEL <= 0) {                                      \
      ::crucible::log::LogWrite(::crucible::log::Level::kDebug, cat,        \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                       \
  } while (0)

#define CRUCIBLE_LOG_INFO(cat, fmt, ...)                                    \
  do {                                                                      \
    if (CRUCIBLE_LOG_MIN_LEVEL <= 1) {                                      \
      ::crucible::log::LogWrite(::crucible::log::Level::kInfo, cat,         \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                       \
  } while (0)

#define CRUCIBLE_LOG_WARN(cat, fmt, ...)                                    \
  do {                                                                      \
    if (CRUCIBLE_LOG_MIN_LEVEL <= 2) {                                      \
      ::crucible::log::LogWrite(::crucible::log::Level::kWarn, cat,         \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                       \
  } while (0)

#define CRUCIBLE_LOG_ERROR(cat, fmt, ...)                                   \
  do {                                                                      \
    if (CRUCIBLE_LOG_MIN_LEVEL <= 3) {                                      \
      ::crucible::log::LogWrite(::crucible::log::Level::kError, cat,        \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                       \
  } while (0)

#define CRUCIBLE_LOG_FATAL(cat, fmt, ...)                                   \
  do {                                                                      \
    ::crucible::log::LogWrite(::crucible::log::Level::kFatal, cat,          \
                              __FILE__, __LINE__, fmt, ##__VA_ARGS__);      \
    std::abort();                                                           \
  } while (0)

#endif  // CRUCIBLE_LOG_HPP_
