#include "helpers.hpp"

#include <boost/ut.hpp>
#include <string>
#include <string_view>

static constexpr std::string_view SHOP_CONFIG = R"(
[selection]
warn-error = true

[selectors.staging]
select = ["path:models/staging"]

[selectors.finance]
select = ["tag:finance"]
exclude = ["resource_type:test"]

[selectors.finance_tests]
select = ["orders"]
greedy = true
)";

static tests::TempDir makeConfiguredProject() {
  tests::TempDir project = tests::makeShopProject();
  tests::writeFile(project / "nodesel.toml", std::string(SHOP_CONFIG));
  return project;
}

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "nodesel ls --selector"_test = [] {
    const tests::TempDir project = makeConfiguredProject();
    const auto result =
        tests::runNodesel({ "ls", "--selector", "staging" }, project.path);
    expect(result.success()) << result.err;
    expect(result.out == "model.shop.stg_customers\n"
                         "model.shop.stg_orders\n")
        << result.out;
  };

  "nodesel ls --selector with an exclusion"_test = [] {
    const tests::TempDir project = makeConfiguredProject();
    const auto result =
        tests::runNodesel({ "ls", "--selector", "finance" }, project.path);
    expect(result.success()) << result.err;
    expect(result.out == "model.shop.orders\n") << result.out;
    expect(!result.err.contains("Some tests were excluded")) << result.err;
  };

  "nodesel ls --selector honors its greedy setting"_test = [] {
    const tests::TempDir project = makeConfiguredProject();
    const auto result = tests::runNodesel(
        { "ls", "--selector", "finance_tests" }, project.path);
    expect(result.success()) << result.err;
    expect(result.out == "model.shop.orders\n"
                         "test.shop.not_null_orders_id\n"
                         "test.shop.relationships_orders_customers\n")
        << result.out;
  };

  "nodesel ls with warn-error fails on unmatched criteria"_test = [] {
    const tests::TempDir project = makeConfiguredProject();
    const auto result =
        tests::runNodesel({ "ls", "-s", "tag:nothing" }, project.path);
    expect(!result.success());
    expect(result.out.empty());
    expect(result.err.starts_with("Error: The selection criterion "
                                  "'tag:nothing' does not match any nodes"))
        << result.err;
  };

  "nodesel ls --config"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const tests::TempDir configDir;
    tests::writeFile(configDir / "custom.toml", std::string(SHOP_CONFIG));
    const auto result = tests::runNodesel(
        { "ls", "--config", (configDir / "custom.toml").string(), "--selector",
          "staging" },
        project.path);
    expect(result.success()) << result.err;
    expect(result.out == "model.shop.stg_customers\n"
                         "model.shop.stg_orders\n")
        << result.out;
  };

  "nodesel ls with an undefined selector"_test = [] {
    const tests::TempDir project = makeConfiguredProject();
    const auto result =
        tests::runNodesel({ "ls", "--selector", "nightly" }, project.path);
    expect(!result.success());
    expect(result.err.starts_with(
        "Error: selector `nightly` is not defined in nodesel.toml "
        "(defined: [finance, finance_tests, staging])"))
        << result.err;
  };

  "nodesel ls --selector cannot be mixed with --select"_test = [] {
    const tests::TempDir project = makeConfiguredProject();
    const auto result = tests::runNodesel(
        { "ls", "--selector", "staging", "-s", "orders" }, project.path);
    expect(!result.success());
    expect(result.err.contains("`--selector` cannot be combined with "
                               "`--select` or `--exclude`"))
        << result.err;
  };

  "nodesel ls with a malformed config"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    tests::writeFile(project / "nodesel.toml", "[selection]\ngreedy = 1\n");
    const auto result = tests::runNodesel({ "ls" }, project.path);
    expect(!result.success());
    expect(result.out.empty());
    expect(result.err.starts_with("Error: ")) << result.err;
  };
}
