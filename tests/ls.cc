#include "helpers.hpp"

#include <boost/ut.hpp>
#include <string>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "nodesel ls selects everything by default"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto result = tests::runNodesel({ "ls" }, project.path);
    expect(result.success()) << result.err;

    // The disabled model is never listed; ties within a generation are
    // broken by unique id.
    const std::string expected = "seed.shop.country_codes\n"
                                 "source.shop.raw.customers\n"
                                 "source.shop.raw.orders\n"
                                 "model.shop.stg_customers\n"
                                 "model.shop.stg_orders\n"
                                 "model.shop.orders\n"
                                 "exposure.shop.revenue_dashboard\n"
                                 "test.shop.not_null_orders_id\n"
                                 "test.shop.relationships_orders_customers\n";
    expect(result.out == expected) << result.out;
    expect(result.err == "    Selected 9 node(s)\n") << result.err;
  };

  "nodesel ls default selection without exposures or sources"_test = [] {
    const tests::TempDir project;
    tests::writeFile(project / "manifest.json", R"({
  "nodes": {
    "model.solo.only": {
      "resource_type": "model",
      "name": "only",
      "fqn": ["solo", "only"],
      "package_name": "solo",
      "path": "models/only.sql"
    }
  }
}
)");
    tests::writeFile(project / "nodesel.toml",
                     "[selection]\nwarn-error = true\n");
    const auto result = tests::runNodesel({ "ls" }, project.path);
    expect(result.success()) << result.err;
    expect(result.out == "model.solo.only\n") << result.out;
    expect(!result.err.contains("does not match any nodes")) << result.err;
    expect(result.err == "    Selected 1 node(s)\n") << result.err;
  };

  "nodesel ls leaves out tests with unselected parents"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto result =
        tests::runNodesel({ "ls", "--select", "orders" }, project.path);
    expect(result.success()) << result.err;
    expect(result.out == "model.shop.orders\n"
                         "test.shop.not_null_orders_id\n")
        << result.out;
    expect(result.err.contains(
        "Some tests were excluded because at least one parent is missing:\n"
        "  - relationships_orders_customers\n"
        "Use the --greedy flag to include them\n"))
        << result.err;
    expect(result.err.contains("    Selected 2 node(s)\n"));
  };

  "nodesel ls --greedy"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto result = tests::runNodesel({ "ls", "-s", "orders", "--greedy" },
                                          project.path);
    expect(result.success()) << result.err;
    expect(result.out == "model.shop.orders\n"
                         "test.shop.not_null_orders_id\n"
                         "test.shop.relationships_orders_customers\n")
        << result.out;
    expect(!result.err.contains("Some tests were excluded"));
  };

  "nodesel ls with parents"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto result = tests::runNodesel({ "ls", "-s", "+orders" },
                                          project.path);
    expect(result.success()) << result.err;
    expect(result.out == "source.shop.raw.customers\n"
                         "source.shop.raw.orders\n"
                         "model.shop.stg_customers\n"
                         "model.shop.stg_orders\n"
                         "model.shop.orders\n"
                         "test.shop.not_null_orders_id\n"
                         "test.shop.relationships_orders_customers\n")
        << result.out;
  };

  "nodesel ls prints names"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto result = tests::runNodesel(
        { "ls", "-s", "tag:nightly", "--output", "name" }, project.path);
    expect(result.success()) << result.err;
    expect(result.out == "orders\nstg_orders\n") << result.out;
  };

  "nodesel ls union and intersection"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto result = tests::runNodesel(
        { "ls", "-s", "resource_type:seed path:models/staging,tag:nightly" },
        project.path);
    expect(result.success()) << result.err;
    expect(result.out == "model.shop.stg_orders\n"
                         "seed.shop.country_codes\n")
        << result.out;
  };

  "nodesel ls warns about criteria that match nothing"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto result =
        tests::runNodesel({ "ls", "-s", "tag:nothing" }, project.path);
    expect(result.success()) << result.err;
    expect(result.out.empty());
    expect(result.err.contains("Warning: The selection criterion "
                               "'tag:nothing' does not match any nodes"))
        << result.err;
    expect(result.err.contains("    Selected 0 node(s)\n"));
  };

  "nodesel ls warns about unknown methods"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto result =
        tests::runNodesel({ "ls", "-s", "colour:red" }, project.path);
    expect(result.success()) << result.err;
    expect(result.out.empty());
    expect(result.err.contains("Warning: The 'colour' selector specified in "
                               "colour:red is invalid."))
        << result.err;
  };

  "nodesel ls rejects malformed specs"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto result =
        tests::runNodesel({ "ls", "-s", "@+orders" }, project.path);
    expect(!result.success());
    expect(result.out.empty());
    expect(result.err.starts_with("Error: invalid selector spec `@+orders`"))
        << result.err;
  };

  "nodesel ls rejects unknown output formats"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto result =
        tests::runNodesel({ "ls", "--output", "yaml" }, project.path);
    expect(!result.success());
    expect(result.err.contains("invalid output format `yaml`"));
  };

  "nodesel ls --manifest"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const tests::TempDir elsewhere;
    const auto result = tests::runNodesel(
        { "ls", "--manifest", (project / "manifest.json").string(), "-s",
          "country_codes" },
        elsewhere.path);
    expect(result.success()) << result.err;
    expect(result.out == "seed.shop.country_codes\n") << result.out;
  };

  "nodesel ls finds the manifest in a parent directory"_test = [] {
    const tests::TempDir project = tests::makeShopProject();
    const auto nested = project / "models" / "staging";
    tests::fs::create_directories(nested);
    const auto result =
        tests::runNodesel({ "ls", "-s", "stg_orders" }, nested);
    expect(result.success()) << result.err;
    expect(result.out == "model.shop.stg_orders\n") << result.out;
  };

  "nodesel ls without a manifest"_test = [] {
    const tests::TempDir empty;
    const auto result = tests::runNodesel({ "ls" }, empty.path);
    expect(!result.success());
    expect(result.out.empty());
    expect(result.err.starts_with("Error: "));
  };
}
