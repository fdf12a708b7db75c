#include "Driver.hpp"

#include "Cli.hpp"
#include "Cmd/Help.hpp"
#include "Cmd/Ls.hpp"
#include "Cmd/Version.hpp"
#include "Diag.hpp"

#include <cstddef>
#include <exception>
#include <rs/result.hpp>
#include <span>
#include <string_view>

namespace nodesel {

const Cli& getCli() noexcept {
  static const Cli cli = [] {
    Cli cli("Select nodes from a dbt-style manifest");
    cli.addOpt(Opt{ "--verbose" }
                   .setShort("-v")
                   .setDesc("Use verbose output (-vv very verbose output)"))
        .addOpt(Opt{ "-vv" }.setDesc("Use very verbose output"))
        .addOpt(Opt{ "--quiet" }.setShort("-q").setDesc(
            "Do not print nodesel log messages"))
        .addOpt(Opt{ "--color" }
                    .setDesc("Coloring: auto, always, never")
                    .setPlaceholder("<WHEN>"))
        .addOpt(Opt{ "--help" }.setShort("-h").setDesc("Print help"))
        .addOpt(Opt{ "--version" }
                    .setShort("-V")
                    .setDesc("Print version info and exit"))
        .addSubcmd(HELP_CMD)
        .addSubcmd(LS_CMD)
        .addSubcmd(VERSION_CMD);
    return cli;
  }();
  return cli;
}

static rs::Result<void> runImpl(const CliArgsView args) {
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const auto control = rs_try(Cli::handleGlobalOpts(itr, args.end()));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    }

    const std::string_view arg = *itr;
    const CliArgsView rest(itr + 1, args.end());
    if (matchesAny(arg, { "-V", "--version" })) {
      return getCli().exec("version", rest);
    }
    return getCli().exec(arg, rest);
  }

  return getCli().printHelp({});
}

rs::Result<void, void> run(int argc, char* argv[]) noexcept {
  Diag::initFromEnv();

  try {
    const std::size_t numArgs = argc > 0 ? static_cast<std::size_t>(argc - 1) : 0;
    const CliArgsView args(argv + 1, numArgs);
    const auto result = runImpl(args);
    if (result.is_err()) {
      Diag::error("{}", result.unwrap_err()->what());
      return rs::Err();
    }
  } catch (const std::exception& e) {
    Diag::error("{}", e.what());
    return rs::Err();
  }
  return rs::Ok();
}

} // namespace nodesel
