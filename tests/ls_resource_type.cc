#include "helpers.hpp"

#include <boost/ut.hpp>
#include <string>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "nodesel ls --resource-type source"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto result =
        tests::runNodesel({ "ls", "--resource-type", "source" }, project.path);
    expect(result.success()) << result.err;
    expect(result.out == "source.shop.raw.customers\n"
                         "source.shop.raw.orders\n")
        << result.out;
  };

  "nodesel ls with several resource types"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto result = tests::runNodesel({ "ls", "-s", "+orders",
                                            "--resource-type", "model",
                                            "--resource-type", "seed" },
                                          project.path);
    expect(result.success()) << result.err;
    expect(result.out == "model.shop.stg_customers\n"
                         "model.shop.stg_orders\n"
                         "model.shop.orders\n")
        << result.out;
  };

  "nodesel ls filters after test expansion"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto result = tests::runNodesel(
        { "ls", "-s", "orders", "--greedy", "--resource-type", "test" },
        project.path);
    expect(result.success()) << result.err;
    expect(result.out == "test.shop.not_null_orders_id\n"
                         "test.shop.relationships_orders_customers\n")
        << result.out;
  };

  "nodesel ls resource_type method"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto result = tests::runNodesel(
        { "ls", "-s", "resource_type:exposure" }, project.path);
    expect(result.success()) << result.err;
    expect(result.out == "exposure.shop.revenue_dashboard\n") << result.out;
  };

  "nodesel ls rejects unknown resource types"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto result =
        tests::runNodesel({ "ls", "--resource-type", "macro" }, project.path);
    expect(!result.success());
    expect(result.out.empty());
    expect(result.err.starts_with("Error: invalid resource type `macro`"))
        << result.err;
  };
}
