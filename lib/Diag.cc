#include "Diag.hpp"

#include <cstdlib>
#include <memory>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>
#include <string_view>

namespace nodesel {

static spdlog::level::level_enum toSpdlogLevel(const DiagLevel level) noexcept {
  switch (level) {
  case DiagLevel::Off:
    return spdlog::level::off;
  case DiagLevel::Error:
    return spdlog::level::err;
  case DiagLevel::Warn:
    return spdlog::level::warn;
  case DiagLevel::Info:
    return spdlog::level::info;
  case DiagLevel::Verbose:
    return spdlog::level::debug;
  case DiagLevel::VeryVerbose:
    return spdlog::level::trace;
  }
  return spdlog::level::info;
}

static DiagLevel fromSpdlogLevel(const spdlog::level::level_enum level) noexcept {
  switch (level) {
  case spdlog::level::off:
  case spdlog::level::critical:
    return DiagLevel::Off;
  case spdlog::level::err:
    return DiagLevel::Error;
  case spdlog::level::warn:
    return DiagLevel::Warn;
  case spdlog::level::info:
    return DiagLevel::Info;
  case spdlog::level::debug:
    return DiagLevel::Verbose;
  case spdlog::level::trace:
  default:
    return DiagLevel::VeryVerbose;
  }
}

std::shared_ptr<spdlog::logger> Diag::logger() noexcept {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    auto logger = spdlog::stderr_logger_mt("nodesel");
    logger->set_pattern("%v");
    logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(logger);
    return logger;
  }();
  return instance;
}

void Diag::setLevel(const DiagLevel level) noexcept {
  logger()->set_level(toSpdlogLevel(level));
}

DiagLevel Diag::level() noexcept { return fromSpdlogLevel(logger()->level()); }

void Diag::initFromEnv() noexcept {
  // NOLINTNEXTLINE(concurrency-mt-unsafe)
  const char* env = std::getenv("NODESEL_LOG");
  if (env == nullptr) {
    return;
  }

  const std::string_view value = env;
  if (value == "error") {
    setLevel(DiagLevel::Error);
  } else if (value == "warn") {
    setLevel(DiagLevel::Warn);
  } else if (value == "info") {
    setLevel(DiagLevel::Info);
  } else if (value == "debug") {
    setLevel(DiagLevel::Verbose);
  } else if (value == "trace") {
    setLevel(DiagLevel::VeryVerbose);
  } else if (value == "off") {
    setLevel(DiagLevel::Off);
  }
}

} // namespace nodesel
