#include "helpers.hpp"

#include <boost/ut.hpp>
#include <string>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "nodesel ls --exclude removes tests of excluded nodes"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto result = tests::runNodesel(
        { "ls", "-s", "+orders", "--exclude", "stg_customers" }, project.path);
    expect(result.success()) << result.err;

    // Excluding stg_customers also excludes the relationships test, and
    // source.shop.raw.customers keeps its ordering edge to orders.
    expect(result.out == "source.shop.raw.customers\n"
                         "source.shop.raw.orders\n"
                         "model.shop.stg_orders\n"
                         "model.shop.orders\n"
                         "test.shop.not_null_orders_id\n")
        << result.out;
    expect(!result.err.contains("Some tests were excluded"));
    expect(result.err.contains("    Selected 5 node(s)\n"));
  };

  "nodesel ls --exclude with the default selection"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto result = tests::runNodesel(
        { "ls", "--exclude", "resource_type:test", "--exclude", "source:*" },
        project.path);
    expect(result.success()) << result.err;
    expect(result.out == "model.shop.stg_customers\n"
                         "model.shop.stg_orders\n"
                         "seed.shop.country_codes\n"
                         "model.shop.orders\n"
                         "exposure.shop.revenue_dashboard\n")
        << result.out;
  };

  "nodesel ls --exclude matching nothing is silent"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto result = tests::runNodesel(
        { "ls", "-s", "orders", "--exclude", "tag:nothing" }, project.path);
    expect(result.success()) << result.err;
    expect(result.out == "model.shop.orders\n"
                         "test.shop.not_null_orders_id\n")
        << result.out;
    expect(!result.err.contains("does not match any nodes")) << result.err;
  };

  "nodesel ls --exclude everything"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto result = tests::runNodesel(
        { "ls", "-s", "+orders", "--exclude", "+orders" }, project.path);
    expect(result.success()) << result.err;
    expect(result.out.empty()) << result.out;
    expect(result.err.contains("    Selected 0 node(s)\n"));
  };
}
