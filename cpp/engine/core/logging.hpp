#pragma once
/*
===========================================================
Fragment 4.0.03 — Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Minimal logging used by the range engine, MC driver and CLI.
  - Centralizes stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation); the MC
    evaluation loop may run under OpenMP.
  - WARN/ERROR go to stderr, DEBUG/INFO to stdout.
===========================================================
*/

#include <optional>
#include <string>
#include <string_view>

namespace aeroforge {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

// "debug" | "info" | "warn" | "error" (case-sensitive). nullopt if unknown.
std::optional<LogLevel> parse_log_level(std::string_view s) noexcept;

const char* log_level_name(LogLevel lvl) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

inline void log_debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
inline void log_info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
inline void log_warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
inline void log_error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }

} // namespace aeroforge
