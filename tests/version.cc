#include "helpers.hpp"

#include <boost/ut.hpp>
#include <string>

#ifndef NODESEL_PKG_VERSION
#  error "NODESEL_PKG_VERSION is not defined"
#endif

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "nodesel version"_test = [] {
    const auto result = tests::runNodesel({ "version" });
    expect(result.success()) << result.err;
    expect(result.out == std::string("nodesel ") + NODESEL_PKG_VERSION + "\n");
    expect(result.err.empty());
  };

  "nodesel -V"_test = [] {
    const auto result = tests::runNodesel({ "-V" });
    expect(result.success()) << result.err;
    expect(result.out == std::string("nodesel ") + NODESEL_PKG_VERSION + "\n");
  };

  "nodesel -v version lists dependency versions"_test = [] {
    const auto result = tests::runNodesel({ "-v", "version" });
    expect(result.success()) << result.err;
    expect(result.out.starts_with(std::string("nodesel ") +
                                  NODESEL_PKG_VERSION + "\n"));
    expect(result.out.contains("compiler: "));
    expect(result.out.contains("spdlog: "));
    expect(result.out.contains("toml11: "));
  };

  "nodesel version rejects arguments"_test = [] {
    const auto result = tests::runNodesel({ "version", "--bogus" });
    expect(!result.success());
    expect(result.out.empty());
    expect(result.err.contains("unexpected argument `--bogus` for "
                               "`nodesel version`"));
  };
}
