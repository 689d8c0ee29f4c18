/*
===========================================================
Fragment 4.0.03 — Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
===========================================================
*/

#include "engine/core/logging.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace aeroforge {

static std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
static std::mutex g_log_mu;

const char* log_level_name(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "INFO";
  }
}

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

std::optional<LogLevel> parse_log_level(std::string_view s) noexcept {
  if (s == "debug") return LogLevel::DEBUG;
  if (s == "info")  return LogLevel::INFO;
  if (s == "warn")  return LogLevel::WARN;
  if (s == "error") return LogLevel::ERROR;
  return std::nullopt;
}

static std::string utc_timestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  std::time_t tt = clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  try {
    const int cur = g_level.load(std::memory_order_relaxed);
    if (static_cast<int>(lvl) < cur) return;

    std::lock_guard<std::mutex> lk(g_log_mu);

    std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
    out << "[" << utc_timestamp() << "]"
        << "[" << log_level_name(lvl) << "] "
        << msg << "\n";
    out.flush();
  } catch (const std::exception&) {
    // Logging must never throw; a failed write is dropped.
  }
}

} // namespace aeroforge
