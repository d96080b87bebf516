#pragma once
#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <functional>
#include <string>
#include <utility>

#include "sv/core/config.hpp"

namespace sv::log {

using config::LogLevel;

inline const char* level_tag(LogLevel lv) {
  switch (lv) {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Debug: return "DEBUG";
    default:              return "OFF";
  }
}

// Optional capture hook (tests). When unset, lines go to stderr.
using Sink = std::function<void(LogLevel, const std::string&)>;
inline Sink& _sink() { static Sink s; return s; }
inline void set_sink(Sink s) { _sink() = std::move(s); }

inline bool enabled(LogLevel lv) {
  return lv != LogLevel::Off
      && static_cast<int>(lv) <= static_cast<int>(config::log_level());
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 2, 3)))
#endif
inline void write(LogLevel lv, const char* fmt, ...) {
  if (!enabled(lv)) return;
  char buf[512];
  std::string line;
  va_list ap;
  va_start(ap, fmt);
  va_list again;
  va_copy(again, ap);
  const int n = std::vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  if (n < 0) {
    line = "(log format error)";
  } else if (static_cast<std::size_t>(n) < sizeof(buf)) {
    line.assign(buf, static_cast<std::size_t>(n));
  } else {
    // long line (high-rank shapes): format again at full size
    line.resize(static_cast<std::size_t>(n) + 1);
    (void)std::vsnprintf(&line[0], line.size(), fmt, again);
    line.resize(static_cast<std::size_t>(n));
  }
  va_end(again);
  if (auto& s = _sink()) {
    s(lv, line);
    return;
  }
  std::fprintf(stderr, "[SV][%s] %s\n", level_tag(lv), line.c_str());
  std::fflush(stderr);
}

// Captures log lines for the lifetime of the guard.
struct ScopedSink {
  Sink prev;
  explicit ScopedSink(Sink s) : prev(std::move(_sink())) { _sink() = std::move(s); }
  ~ScopedSink() { _sink() = std::move(prev); }
  ScopedSink(const ScopedSink&) = delete;
  ScopedSink& operator=(const ScopedSink&) = delete;
};

} // namespace sv::log

#define SV_LOG_ERROR(...) ::sv::log::write(::sv::config::LogLevel::Error, __VA_ARGS__)
#define SV_LOG_WARN(...)  ::sv::log::write(::sv::config::LogLevel::Warn,  __VA_ARGS__)
#define SV_LOG_INFO(...)  ::sv::log::write(::sv::config::LogLevel::Info,  __VA_ARGS__)
#define SV_LOG_DEBUG(...) do { if (::sv::log::enabled(::sv::config::LogLevel::Debug)) \
                                 ::sv::log::write(::sv::config::LogLevel::Debug, __VA_ARGS__); } while (0)
