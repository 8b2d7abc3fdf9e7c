/**
 * @file log.hpp
 * @brief Synchronous leveled logging to stderr.
 *
 * Output format:
 *   [2026-10-19 12:00:00.123] [WARN] [Parser] line 3: missing separator (ini.hpp:210)
 *
 * The source location suffix is omitted in NDEBUG builds.
 *
 * Compile-time configuration:
 *   TINI_LOG_MIN_LEVEL -- drop macros below this level at compile time
 *                         (0=DEBUG, 1=INFO, 2=WARN, 3=ERROR, 4=FATAL, 5=OFF)
 *
 * Runtime configuration:
 *   tini::log::SetLevel(tini::log::Level::kWarn);
 */

#ifndef TINI_LOG_HPP_
#define TINI_LOG_HPP_

#include "tini/platform.hpp"

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#if defined(TINI_PLATFORM_LINUX) || defined(TINI_PLATFORM_MACOS)
#include <sys/time.h>
#endif

#ifndef TINI_LOG_MIN_LEVEL
#define TINI_LOG_MIN_LEVEL 0
#endif

namespace tini {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

inline Level& LogLevelRef() noexcept {
#ifdef NDEBUG
  static Level level = Level::kInfo;
#else
  static Level level = Level::kDebug;
#endif
  return level;
}

inline bool& InitializedRef() noexcept {
  static bool initialized = false;
  return initialized;
}

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
    case Level::kOff:
      return "OFF";
  }
  return "?";
}

inline const char* Basename(const char* path) noexcept {
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
#if defined(TINI_PLATFORM_LINUX) || defined(TINI_PLATFORM_MACOS)
  struct timeval tv;
  gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  time_t sec = tv.tv_sec;
  localtime_r(&sec, &tm_buf);
  size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf + n, size - n, ".%03d",
                      static_cast<int>(tv.tv_usec / 1000));
#else
  std::time_t now = std::time(nullptr);
  (void)std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", std::localtime(&now));
#endif
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

inline void SetLevel(Level level) noexcept { detail::LogLevelRef() = level; }

inline Level GetLevel() noexcept { return detail::LogLevelRef(); }

/// Marks the logger ready. Logging also works without it.
inline void Init() noexcept { detail::InitializedRef() = true; }

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef() = false;
}

inline bool IsInitialized() noexcept { return detail::InitializedRef(); }

// ============================================================================
// Write
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) <
      static_cast<uint8_t>(detail::LogLevelRef())) {
    return;
  }

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  char ts[64];
  detail::FormatTimestamp(ts, sizeof(ts));

#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif

  if (level >= Level::kError) {
    (void)std::fflush(stderr);
  }
}

TINI_PRINTF_FMT(5, 6)
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace tini

// ============================================================================
// Macros
// ============================================================================

#define TINI_LOG_DEBUG(cat, fmt, ...)                                   \
  do {                                                                  \
    if (TINI_LOG_MIN_LEVEL <= 0) {                                      \
      ::tini::log::LogWrite(::tini::log::Level::kDebug, cat, __FILE__,  \
                            __LINE__, fmt, ##__VA_ARGS__);              \
    }                                                                   \
  } while (0)

#define TINI_LOG_INFO(cat, fmt, ...)                                    \
  do {                                                                  \
    if (TINI_LOG_MIN_LEVEL <= 1) {                                      \
      ::tini::log::LogWrite(::tini::log::Level::kInfo, cat, __FILE__,   \
                            __LINE__, fmt, ##__VA_ARGS__);              \
    }                                                                   \
  } while (0)

#define TINI_LOG_WARN(cat, fmt, ...)                                    \
  do {                                                                  \
    if (TINI_LOG_MIN_LEVEL <= 2) {                                      \
      ::tini::log::LogWrite(::tini::log::Level::kWarn, cat, __FILE__,   \
                            __LINE__, fmt, ##__VA_ARGS__);              \
    }                                                                   \
  } while (0)

#define TINI_LOG_ERROR(cat, fmt, ...)                                   \
  do {                                                                  \
    if (TINI_LOG_MIN_LEVEL <= 3) {                                      \
      ::tini::log::LogWrite(::tini::log::Level::kError, cat, __FILE__,  \
                            __LINE__, fmt, ##__VA_ARGS__);              \
    }                                                                   \
  } while (0)

#define TINI_LOG_FATAL(cat, fmt, ...)                                   \
  do {                                                                  \
    ::tini::log::LogWrite(::tini::log::Level::kFatal, cat, __FILE__,    \
                          __LINE__, fmt, ##__VA_ARGS__);                \
    std::abort();                                                       \
  } while (0)

#endif  // TINI_LOG_HPP_
