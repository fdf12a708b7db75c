#pragma once

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <rs/result.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nodesel {

using CliArgsView = std::span<const char* const>;

bool matchesAny(std::string_view arg,
                std::initializer_list<std::string_view> names) noexcept;

class Opt {
public:
  explicit Opt(std::string_view name) noexcept : name(name) {}

  Opt& setShort(std::string_view shortName) noexcept;
  Opt& setDesc(std::string_view desc) noexcept;
  Opt& setPlaceholder(std::string_view placeholder) noexcept;
  Opt& setDefault(std::string_view defaultVal) noexcept;

  std::string leftColumn() const;
  std::string rightColumn() const;

private:
  std::string_view name;
  std::string_view shortName;
  std::string_view desc;
  std::string_view placeholder;
  std::string_view defaultVal;
};

class Arg {
public:
  explicit Arg(std::string_view name) noexcept : name(name) {}

  Arg& setDesc(std::string_view desc) noexcept;
  Arg& setRequired(bool required) noexcept;

  std::string usage() const;
  std::string_view getDesc() const noexcept { return desc; }

private:
  std::string_view name;
  std::string_view desc;
  bool required = true;
};

class Subcmd {
public:
  using MainFn = std::function<rs::Result<void>(CliArgsView)>;

  explicit Subcmd(std::string_view name) noexcept : name(name) {}

  Subcmd& setShort(std::string_view shortName) noexcept;
  Subcmd& setDesc(std::string_view desc) noexcept;
  Subcmd& addOpt(Opt opt);
  Subcmd& setArg(Arg arg);
  Subcmd& setMainFn(MainFn mainFn);

  std::string_view getName() const noexcept { return name; }
  std::string_view getShort() const noexcept { return shortName; }
  std::string_view getDesc() const noexcept { return desc; }

  rs::Result<void> run(CliArgsView args) const;
  rs::Result<void> noSuchArg(std::string_view arg) const;
  static rs::Result<void> missingOptArgumentFor(std::string_view arg);
  void printHelp() const;

private:
  std::string_view name;
  std::string_view shortName;
  std::string_view desc;
  std::vector<Opt> opts;
  std::optional<Arg> arg;
  MainFn mainFn;
};

class Cli {
public:
  enum ControlFlow : std::uint8_t {
    Return,
    Continue,
    Fallthrough,
  };

  explicit Cli(std::string_view desc) noexcept : desc(desc) {}

  Cli& addOpt(Opt opt);
  Cli& addSubcmd(const Subcmd& subcmd);

  rs::Result<void> exec(std::string_view subcmd, CliArgsView args) const;
  rs::Result<void> printHelp(CliArgsView args) const;

  // Handles -v, -vv, -q, --color and -h. `subcmd` is empty at the top
  // level.
  static rs::Result<ControlFlow>
  handleGlobalOpts(std::span<const char* const>::iterator& itr,
                   std::span<const char* const>::iterator end,
                   std::string_view subcmd = "");

  const std::vector<Opt>& globalOpts() const noexcept { return opts; }

private:
  const Subcmd* findSubcmd(std::string_view name) const noexcept;
  void printAllHelp() const;

  std::string_view desc;
  std::vector<Opt> opts;
  std::map<std::string_view, const Subcmd*> subcmds;
};

const Cli& getCli() noexcept;

} // namespace nodesel
