#include "helpers.hpp"

#include <boost/ut.hpp>
#include <string>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "nodesel help"_test = [] {
    const auto result = tests::runNodesel({ "help" });
    expect(result.success()) << result.err;
    expect(result.out.contains("Usage: nodesel [OPTIONS] [COMMAND]"));
    expect(result.out.contains("Commands:"));
    expect(result.out.contains("  ls "));
    expect(result.out.contains("  version, V "));
    expect(result.err.empty());
  };

  "nodesel without arguments prints help"_test = [] {
    const auto result = tests::runNodesel({});
    expect(result.success()) << result.err;
    expect(result.out == tests::runNodesel({ "--help" }).out);
  };

  "nodesel help ls"_test = [] {
    const auto result = tests::runNodesel({ "help", "ls" });
    expect(result.success()) << result.err;
    expect(result.out.starts_with(
        "List the selected nodes in execution order\n"));
    expect(result.out.contains("Usage: nodesel ls [OPTIONS]"));
    expect(result.out.contains("-s, --select <SPEC>"));
    expect(result.out.contains("--output <FORMAT>"));
    expect(result.out.contains("[default: id]"));
  };

  "nodesel ls --help"_test = [] {
    const auto viaFlag = tests::runNodesel({ "ls", "--help" });
    const auto viaHelp = tests::runNodesel({ "help", "ls" });
    expect(viaFlag.success()) << viaFlag.err;
    expect(viaFlag.out == viaHelp.out);
  };

  "nodesel help unknown command"_test = [] {
    const auto result = tests::runNodesel({ "help", "deploy" });
    expect(!result.success());
    expect(result.err.starts_with("Error: no such command: `deploy`"));
  };

  "nodesel unknown command"_test = [] {
    const auto result = tests::runNodesel({ "deploy" });
    expect(!result.success());
    expect(result.err.contains("Run `nodesel help` for a list of commands"));
  };
}
