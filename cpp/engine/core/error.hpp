/*
===============================================================================
Fragment 4.0.01 — Error System (ErrorCode + Exception + Require Macro)
File: error.hpp
===============================================================================
*/

#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <utility>

namespace aeroforge {

// Stable error codes for CLI exit mapping + downstream tooling.
// Keep these values stable once public.
enum class ErrorCode : std::uint16_t {
  Ok = 0,

  // Input / config / data
  InvalidInput = 10,
  InvalidConfig = 14,
  UnknownField = 15,

  // IO / parse
  IOError = 40,
  ParseError = 41
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::Ok:               return "Ok";
    case ErrorCode::InvalidInput:     return "InvalidInput";
    case ErrorCode::InvalidConfig:    return "InvalidConfig";
    case ErrorCode::UnknownField:     return "UnknownField";
    case ErrorCode::IOError:          return "IOError";
    case ErrorCode::ParseError:       return "ParseError";
    default:                          return "Unknown";
  }
}

struct ErrorSite final {
  const char* file = "";
  const char* func = "";
  int line = 0;
};

// Exception type used by AEROFORGE_REQUIRE / fail().
class AeroforgeError final : public std::exception {
public:
  AeroforgeError(ErrorCode c, std::string msg, ErrorSite site = {})
      : code_(c), msg_(msg.empty() ? std::string{"<empty error message>"} : std::move(msg)), site_(site) {}

  AeroforgeError(ErrorCode c, const char* msg, ErrorSite site = {})
      : code_(c),
        msg_(msg && msg[0] ? std::string{msg} : std::string{"<empty error message>"}),
        site_(site) {}

  const char* what() const noexcept override { return msg_.c_str(); }
  ErrorCode code() const noexcept { return code_; }
  const ErrorSite& where() const noexcept { return site_; }

  // Configuration-class errors abort a run before any sampling.
  bool is_config_error() const noexcept {
    return code_ == ErrorCode::InvalidConfig || code_ == ErrorCode::UnknownField ||
           code_ == ErrorCode::ParseError;
  }

private:
  ErrorCode code_;
  std::string msg_;
  ErrorSite site_;
};

// Helper to throw with site info.
[[noreturn]] inline void fail(ErrorCode code, const std::string& msg, ErrorSite site) {
  throw AeroforgeError(code, msg.empty() ? std::string{"AeroforgeError"} : msg, site);
}

} // namespace aeroforge

// Site macro
#define AEROFORGE_SITE ::aeroforge::ErrorSite{__FILE__, __func__, __LINE__}

// Require macro (non-negotiable hard fail for invalid states).
#define AEROFORGE_REQUIRE(cond, code, msg)     \
  do {                                         \
    if (!(cond)) {                             \
      ::aeroforge::fail((code), (msg), AEROFORGE_SITE); \
    }                                          \
  } while (0)
