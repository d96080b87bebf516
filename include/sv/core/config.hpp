#pragma once
#include <atomic>
#include <cstdlib>
#include <cctype>
#include <cstring>

namespace sv::config {

// ---------- Log level ----------
// Env: SV_LOG_LEVEL=off|error|warn|info|debug (or 0..4). Default: warn.
enum class LogLevel : int { Off = 0, Error = 1, Warn = 2, Info = 3, Debug = 4 };

inline bool _ieq(const char* a, const char* b) {
  for (; *a && *b; ++a, ++b)
    if (std::tolower(static_cast<unsigned char>(*a)) != *b) return false;
  return *a == *b;
}

inline LogLevel _parse_level(const char* s, LogLevel def) {
  if (!s || !*s) return def;
  if (_ieq(s, "off")   || !std::strcmp(s, "0")) return LogLevel::Off;
  if (_ieq(s, "error") || !std::strcmp(s, "1")) return LogLevel::Error;
  if (_ieq(s, "warn")  || !std::strcmp(s, "2")) return LogLevel::Warn;
  if (_ieq(s, "info")  || !std::strcmp(s, "3")) return LogLevel::Info;
  if (_ieq(s, "debug") || !std::strcmp(s, "4")) return LogLevel::Debug;
  return def;
}

inline std::atomic<int>& _log_level() {
  static std::atomic<int> v{ static_cast<int>(_parse_level(std::getenv("SV_LOG_LEVEL"), LogLevel::Warn)) };
  return v;
}
inline LogLevel log_level() {
  return static_cast<LogLevel>(_log_level().load(std::memory_order_relaxed));
}
inline void set_log_level(LogLevel lv) {
  _log_level().store(static_cast<int>(lv), std::memory_order_relaxed);
}

// ---------- Warn-on-write for broadcast_arrays views ----------
// Env: SV_WARN_ON_WRITE=0|1 (default 1)
inline bool _env_bool(const char* name, bool def=false) {
  if (const char* s = std::getenv(name)) {
    if (!std::strcmp(s,"1") || !std::strcmp(s,"true") || !std::strcmp(s,"TRUE")) return true;
    if (!std::strcmp(s,"0") || !std::strcmp(s,"false")|| !std::strcmp(s,"FALSE")) return false;
  }
  return def;
}
inline std::atomic<bool>& _warn_on_write() {
  static std::atomic<bool> v{ _env_bool("SV_WARN_ON_WRITE", true) };
  return v;
}
inline bool warn_on_write_enabled() {
  return _warn_on_write().load(std::memory_order_relaxed);
}
inline void set_warn_on_write(bool on) {
  _warn_on_write().store(on, std::memory_order_relaxed);
}

// Re-read the environment (mainly for tests).
inline void reload() {
  set_log_level(_parse_level(std::getenv("SV_LOG_LEVEL"), LogLevel::Warn));
  set_warn_on_write(_env_bool("SV_WARN_ON_WRITE", true));
}

// Scoped override, restores the previous values on exit.
struct ScopedConfig {
  LogLevel level;
  bool warn;
  ScopedConfig() : level(log_level()), warn(warn_on_write_enabled()) {}
  ~ScopedConfig() { set_log_level(level); set_warn_on_write(warn); }
  ScopedConfig(const ScopedConfig&) = delete;
  ScopedConfig& operator=(const ScopedConfig&) = delete;
};

} // namespace sv::config
