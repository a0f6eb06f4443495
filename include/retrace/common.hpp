#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file common.hpp
 * @brief Logging macros, log level control and the clock shared by all stores
 *
 * Debug logging compiles to nothing unless RETRACE_DEBUG is defined.
 * Info/warn logging is filtered at runtime:
 *
 *   retrace::set_log_level(retrace::LogLevel::Warn);
 *
 * or via the RETRACE_LOG_LEVEL environment variable (debug|info|warn|off),
 * read once on first use.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>

namespace retrace {

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Off = 3 };

namespace detail {

inline LogLevel parse_log_level(const char* s, LogLevel fallback) {
  if (!s || !*s) return fallback;
  if (std::strcmp(s, "debug") == 0) return LogLevel::Debug;
  if (std::strcmp(s, "info") == 0) return LogLevel::Info;
  if (std::strcmp(s, "warn") == 0) return LogLevel::Warn;
  if (std::strcmp(s, "off") == 0) return LogLevel::Off;
  return fallback;
}

inline std::atomic<int>& log_level_ref() {
  static std::atomic<int> level{static_cast<int>(
      parse_log_level(std::getenv("RETRACE_LOG_LEVEL"), LogLevel::Warn))};
  return level;
}

}  // namespace detail

inline void set_log_level(LogLevel level) {
  detail::log_level_ref().store(static_cast<int>(level), std::memory_order_relaxed);
}

inline LogLevel log_level() {
  return static_cast<LogLevel>(detail::log_level_ref().load(std::memory_order_relaxed));
}

inline bool log_enabled(LogLevel level) {
  return static_cast<int>(level) >= detail::log_level_ref().load(std::memory_order_relaxed);
}

/**
 * Milliseconds since the Unix epoch
 *
 * All created_at / updated_at / last_visited fields use this clock.
 */
inline int64_t now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

}  // namespace retrace

#define RETRACE_LOG_AT(level, tag, ...)                   \
  do {                                                   \
    if (::retrace::log_enabled(level)) {                  \
      std::fprintf(stderr, "%s ", tag);                  \
      std::fprintf(stderr, __VA_ARGS__);                 \
      std::fputc('\n', stderr);                          \
    }                                                    \
  } while (0)

#define RETRACE_LOG_INFO(...) RETRACE_LOG_AT(::retrace::LogLevel::Info, "[retrace:info]", __VA_ARGS__)
#define RETRACE_LOG_WARN(...) RETRACE_LOG_AT(::retrace::LogLevel::Warn, "[retrace:warn]", __VA_ARGS__)

#ifdef RETRACE_DEBUG
#define RETRACE_LOG_DEBUG(...) RETRACE_LOG_AT(::retrace::LogLevel::Debug, "[retrace:debug]", __VA_ARGS__)
#else
#define RETRACE_LOG_DEBUG(...) ((void)0)
#endif
