#include "Cli.hpp"

#include "Diag.hpp"
#include "TermColor.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <fmt/format.h>
#include <print>
#include <string>
#include <string_view>
#include <utility>

namespace nodesel {

static constexpr std::size_t MIN_LEFT_WIDTH = 24;

bool matchesAny(const std::string_view arg,
                const std::initializer_list<std::string_view> names) noexcept {
  return std::ranges::find(names, arg) != names.end();
}

Opt& Opt::setShort(const std::string_view shortName) noexcept {
  this->shortName = shortName;
  return *this;
}

Opt& Opt::setDesc(const std::string_view desc) noexcept {
  this->desc = desc;
  return *this;
}

Opt& Opt::setPlaceholder(const std::string_view placeholder) noexcept {
  this->placeholder = placeholder;
  return *this;
}

Opt& Opt::setDefault(const std::string_view defaultVal) noexcept {
  this->defaultVal = defaultVal;
  return *this;
}

std::string Opt::leftColumn() const {
  std::string column;
  if (shortName.empty()) {
    column = fmt::format("    {}", name);
  } else {
    column = fmt::format("{}, {}", shortName, name);
  }
  if (!placeholder.empty()) {
    column += fmt::format(" {}", placeholder);
  }
  return column;
}

std::string Opt::rightColumn() const {
  if (defaultVal.empty()) {
    return std::string(desc);
  }
  return fmt::format("{} [default: {}]", desc, defaultVal);
}

Arg& Arg::setDesc(const std::string_view desc) noexcept {
  this->desc = desc;
  return *this;
}

Arg& Arg::setRequired(const bool required) noexcept {
  this->required = required;
  return *this;
}

std::string Arg::usage() const {
  if (required) {
    return fmt::format("<{}>", name);
  }
  return fmt::format("[{}]", name);
}

Subcmd& Subcmd::setShort(const std::string_view shortName) noexcept {
  this->shortName = shortName;
  return *this;
}

Subcmd& Subcmd::setDesc(const std::string_view desc) noexcept {
  this->desc = desc;
  return *this;
}

Subcmd& Subcmd::addOpt(Opt opt) {
  opts.push_back(std::move(opt));
  return *this;
}

Subcmd& Subcmd::setArg(Arg arg) {
  this->arg = std::move(arg);
  return *this;
}

Subcmd& Subcmd::setMainFn(MainFn mainFn) {
  this->mainFn = std::move(mainFn);
  return *this;
}

rs::Result<void> Subcmd::run(const CliArgsView args) const {
  rs_ensure(mainFn != nullptr, "`{}` has no entry point", name);
  return mainFn(args);
}

rs::Result<void> Subcmd::noSuchArg(const std::string_view arg) const {
  rs_bail("unexpected argument `{}` for `nodesel {}`\n\n"
          "For more information, try `nodesel help {}`",
          arg, name, name);
}

rs::Result<void> Subcmd::missingOptArgumentFor(const std::string_view arg) {
  rs_bail("missing argument for `{}`", arg);
}

static std::size_t leftWidth(const std::vector<Opt>& opts,
                             const std::vector<Opt>& globalOpts) {
  std::size_t width = MIN_LEFT_WIDTH;
  for (const auto* list : { &opts, &globalOpts }) {
    for (const Opt& opt : *list) {
      width = std::max(width, opt.leftColumn().size() + 2);
    }
  }
  return width;
}

static void printOpts(const std::vector<Opt>& opts, const std::size_t width) {
  for (const Opt& opt : opts) {
    std::println("  {}{}", cyan(fmt::format("{:<{}}", opt.leftColumn(), width)),
                 opt.rightColumn());
  }
}

void Subcmd::printHelp() const {
  const std::vector<Opt>& globalOpts = getCli().globalOpts();
  const std::size_t width = leftWidth(opts, globalOpts);

  std::println("{}\n", desc);
  std::println("{} nodesel {} [OPTIONS]{}", bold(green("Usage:")), name,
               arg ? " " + arg->usage() : "");
  std::println("");
  std::println("{}", bold(green("Options:")));
  printOpts(globalOpts, width);
  printOpts(opts, width);
  if (arg && !arg->getDesc().empty()) {
    std::println("");
    std::println("{}", bold(green("Arguments:")));
    std::println("  {}{}", cyan(fmt::format("{:<{}}", arg->usage(), width)),
                 arg->getDesc());
  }
}

Cli& Cli::addOpt(Opt opt) {
  opts.push_back(std::move(opt));
  return *this;
}

Cli& Cli::addSubcmd(const Subcmd& subcmd) {
  subcmds.emplace(subcmd.getName(), &subcmd);
  if (!subcmd.getShort().empty()) {
    subcmds.emplace(subcmd.getShort(), &subcmd);
  }
  return *this;
}

const Subcmd* Cli::findSubcmd(const std::string_view name) const noexcept {
  const auto itr = subcmds.find(name);
  return itr == subcmds.end() ? nullptr : itr->second;
}

rs::Result<void> Cli::exec(const std::string_view subcmd,
                           const CliArgsView args) const {
  const Subcmd* cmd = findSubcmd(subcmd);
  rs_ensure(cmd != nullptr,
            "no such command: `{}`\n\n"
            "Run `nodesel help` for a list of commands",
            subcmd);
  return cmd->run(args);
}

void Cli::printAllHelp() const {
  const std::size_t width = leftWidth({}, opts);

  std::println("{}\n", desc);
  std::println("{} nodesel [OPTIONS] [COMMAND]", bold(green("Usage:")));
  std::println("");
  std::println("{}", bold(green("Options:")));
  printOpts(opts, width);
  std::println("");
  std::println("{}", bold(green("Commands:")));
  for (const auto& [name, subcmd] : subcmds) {
    if (name != subcmd->getName()) {
      continue;
    }
    std::string left(name);
    if (!subcmd->getShort().empty()) {
      left += fmt::format(", {}", subcmd->getShort());
    }
    std::println("  {}{}", cyan(fmt::format("{:<{}}", left, width)),
                 subcmd->getDesc());
  }
  std::println("");
  std::println("See `nodesel help <command>` for more information on a "
               "specific command.");
}

rs::Result<void> Cli::printHelp(const CliArgsView args) const {
  if (args.empty()) {
    printAllHelp();
    return rs::Ok();
  }

  const std::string_view name = args.front();
  const Subcmd* cmd = findSubcmd(name);
  rs_ensure(cmd != nullptr,
            "no such command: `{}`\n\n"
            "Run `nodesel help` for a list of commands",
            name);
  cmd->printHelp();
  return rs::Ok();
}

rs::Result<Cli::ControlFlow>
Cli::handleGlobalOpts(std::span<const char* const>::iterator& itr,
                      const std::span<const char* const>::iterator end,
                      const std::string_view subcmd) {
  const std::string_view arg = *itr;

  if (matchesAny(arg, { "-h", "--help" })) {
    if (subcmd.empty()) {
      getCli().printAllHelp();
    } else {
      const std::string name(subcmd);
      const std::array<const char*, 1> helpArgs = { name.c_str() };
      rs_try(getCli().printHelp(helpArgs));
    }
    return rs::Ok(Return);
  } else if (matchesAny(arg, { "-v", "--verbose" })) {
    Diag::setLevel(DiagLevel::Verbose);
    return rs::Ok(Continue);
  } else if (arg == "-vv") {
    Diag::setLevel(DiagLevel::VeryVerbose);
    return rs::Ok(Continue);
  } else if (matchesAny(arg, { "-q", "--quiet" })) {
    Diag::setLevel(DiagLevel::Error);
    return rs::Ok(Continue);
  } else if (arg == "--color") {
    rs_ensure(itr + 1 < end, "missing argument for `--color`");
    rs_try(setColorMode(*++itr));
    return rs::Ok(Continue);
  }
  return rs::Ok(Fallthrough);
}

} // namespace nodesel
