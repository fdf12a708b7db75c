#include "Version.hpp"

#include "Cli.hpp"
#include "Diag.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <print>
#include <rs/result.hpp>
#include <spdlog/version.h>
#include <string_view>
#include <tbb/version.h>
#include <toml.hpp>

#ifndef NODESEL_PKG_VERSION
#  error "NODESEL_PKG_VERSION is not defined"
#endif

namespace nodesel {

static rs::Result<void> versionMain(CliArgsView args) noexcept;

const Subcmd VERSION_CMD = //
    Subcmd{ "version" }
        .setShort("V")
        .setDesc("Show version information")
        .setMainFn(versionMain);

static constexpr std::string_view compilerVersion() noexcept {
#if defined(__clang__)
  return "clang " __clang_version__;
#elif defined(__GNUC__)
  return "gcc " __VERSION__;
#else
  return "unknown";
#endif
}

static rs::Result<void> versionMain(const CliArgsView args) noexcept {
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const auto control =
        rs_try(Cli::handleGlobalOpts(itr, args.end(), "version"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else {
      return VERSION_CMD.noSuchArg(*itr);
    }
  }

  std::println("nodesel {}", NODESEL_PKG_VERSION);
  if (Diag::isVerbose()) {
    std::println("compiler: {}", compilerVersion());
    std::println("fmt: {}.{}.{}", FMT_VERSION / 10000, FMT_VERSION / 100 % 100,
                 FMT_VERSION % 100);
    std::println("spdlog: {}.{}.{}", SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR,
                 SPDLOG_VER_PATCH);
    std::println("tbb: {}", TBB_VERSION_STRING);
    std::println("nlohmann_json: {}.{}.{}", NLOHMANN_JSON_VERSION_MAJOR,
                 NLOHMANN_JSON_VERSION_MINOR, NLOHMANN_JSON_VERSION_PATCH);
    std::println("toml11: {}.{}.{}", TOML11_VERSION_MAJOR,
                 TOML11_VERSION_MINOR, TOML11_VERSION_PATCH);
  }
  return rs::Ok();
}

} // namespace nodesel
