#pragma once

#include "TermColor.hpp"

#include <cstdint>
#include <fmt/core.h>
#include <memory>
#include <rs/result.hpp>
#include <spdlog/logger.h>
#include <string>
#include <string_view>
#include <utility>

namespace nodesel {

enum class DiagLevel : std::uint8_t {
  Off = 0,
  Error = 1,
  Warn = 2,
  Info = 3,
  Verbose = 4,
  VeryVerbose = 5,
};

// All diagnostics go through the default spdlog logger, which prints bare
// messages on stderr. Header and color decoration is done here.
class Diag {
public:
  static void setLevel(DiagLevel level) noexcept;
  static DiagLevel level() noexcept;

  // Reads NODESEL_LOG (error, warn, info, debug, trace) if set.
  static void initFromEnv() noexcept;

  static std::shared_ptr<spdlog::logger> logger() noexcept;

  static bool isVerbose() noexcept { return level() >= DiagLevel::Verbose; }

  template <typename... Args>
  static void error(fmt::format_string<Args...> fmt, Args&&... args) noexcept {
    logger()->error("{}{}", bold(red("Error: ")),
                    fmt::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void warn(fmt::format_string<Args...> fmt, Args&&... args) noexcept {
    logger()->warn("{}{}", bold(yellow("Warning: ")),
                   fmt::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void info(const std::string_view header,
                   fmt::format_string<Args...> fmt, Args&&... args) noexcept {
    logger()->info("{} {}", bold(green(fmt::format("{:>12}", header))),
                   fmt::format(fmt, std::forward<Args>(args)...));
  }

  // Same as info, but only shown when the verbosity is raised.
  template <typename... Args>
  static void verbose(const std::string_view header,
                      fmt::format_string<Args...> fmt,
                      Args&&... args) noexcept {
    logger()->debug("{} {}", bold(cyan(fmt::format("{:>12}", header))),
                    fmt::format(fmt, std::forward<Args>(args)...));
  }
};

// Warning that becomes an error when warnings are treated as errors.
template <typename... Args>
rs::Result<void> warnOrError(const bool warnError,
                             fmt::format_string<Args...> fmt, Args&&... args) {
  std::string msg = fmt::format(fmt, std::forward<Args>(args)...);
  if (warnError) {
    return rs::Err(rs::anyhow(std::move(msg)));
  }
  Diag::warn("{}", msg);
  return rs::Ok();
}

} // namespace nodesel
