#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string_view>

namespace vinfer::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error };

inline std::atomic<Level> g_level{Level::Info};
inline std::mutex g_mu;

inline const char* level_str(Level l) {
  switch (l) {
    case Level::Trace: return "TRACE";
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    default: return "ERROR";
  }
}

inline void set_level(Level l) { g_level.store(l, std::memory_order_relaxed); }

/// Parse "trace" | "debug" | "info" | "warn" | "error".
inline std::optional<Level> parse_level(std::string_view s) {
  if (s == "trace") return Level::Trace;
  if (s == "debug") return Level::Debug;
  if (s == "info") return Level::Info;
  if (s == "warn" || s == "warning") return Level::Warn;
  if (s == "error") return Level::Error;
  return std::nullopt;
}

template <typename... A>
inline void write(Level l, const char* file, int line, const A&... a) {
  if (l < g_level.load(std::memory_order_relaxed)) return;
  std::ostringstream os;
  (void)std::initializer_list<int>{(os << a, 0)...};
  const auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

  struct tm tm_buf;
  localtime_r(&t, &tm_buf);

  std::lock_guard<std::mutex> lk(g_mu);
  std::cerr << "[" << level_str(l) << "] " << std::put_time(&tm_buf, "%F %T") << " " << file
            << ":" << line << " | " << os.str() << "\n";
}

}  // namespace vinfer::log

#define VINFER_LOGT(...) ::vinfer::log::write(::vinfer::log::Level::Trace, __FILE__, __LINE__, __VA_ARGS__)
#define VINFER_LOGD(...) ::vinfer::log::write(::vinfer::log::Level::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define VINFER_LOGI(...) ::vinfer::log::write(::vinfer::log::Level::Info, __FILE__, __LINE__, __VA_ARGS__)
#define VINFER_LOGW(...) ::vinfer::log::write(::vinfer::log::Level::Warn, __FILE__, __LINE__, __VA_ARGS__)
#define VINFER_LOGE(...) ::vinfer::log::write(::vinfer::log::Level::Error, __FILE__, __LINE__, __VA_ARGS__)
