#include "Config.hpp"

#include "Selector/SpecParser.hpp"
#include "TermColor.hpp"

#include <cstddef>
#include <exception>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <toml.hpp>
#include <utility>
#include <vector>

namespace nodesel {

// toml::find that reports failures as a Result, without toml11's own
// `[error]` prefix and trailing newline.
template <typename T, typename... U>
static rs::Result<T> tryFind(const toml::value& v, const U&... u) noexcept {
  using std::string_view_literals::operator""sv;

  if (shouldColorStderr()) {
    toml::color::enable();
  } else {
    toml::color::disable();
  }

  try {
    return rs::Ok(toml::find<T>(v, u...));
  } catch (const std::exception& e) {
    std::string what = e.what();

    static constexpr std::size_t errorPrefixSize = "[error] "sv.size();
    static constexpr std::size_t colorErrorPrefixSize =
        "\033[31m\033[01m[error]\033[00m "sv.size();

    if (shouldColorStderr()) {
      what = what.substr(colorErrorPrefixSize);
    } else {
      what = what.substr(errorPrefixSize);
    }

    if (!what.empty() && what.back() == '\n') {
      what.pop_back();
    }
    return rs::Err(rs::anyhow(what));
  }
}

template <typename T>
static rs::Result<T> findOrDefault(const toml::value& table,
                                   const std::string& key) noexcept {
  if (!table.contains(key)) {
    return rs::Ok(T{});
  }
  return tryFind<T>(table, key);
}

static rs::Result<SelectionConfig>
parseSelection(const toml::value& val) noexcept {
  SelectionConfig selection;
  if (!val.contains("selection")) {
    spdlog::debug("[selection] not found, using defaults");
    return rs::Ok(selection);
  }

  const toml::value& table = val.at("selection");
  rs_ensure(table.is_table(), "[selection] must be a table");

  selection.greedy = rs_try(findOrDefault<bool>(table, "greedy"));
  selection.warnError = rs_try(findOrDefault<bool>(table, "warn-error"));
  const auto kinds = rs_try(
      findOrDefault<std::vector<std::string>>(table, "resource-types"));
  for (const std::string& kind : kinds) {
    selection.resourceTypes.push_back(rs_try(parseResourceKind(kind)));
  }
  return rs::Ok(selection);
}

static rs::Result<NamedSelector> parseNamedSelector(const std::string& name,
                                                    const toml::value& val) {
  rs_ensure(val.is_table(), "[selectors.{}] must be a table", name);

  NamedSelector selector;
  selector.name = name;
  selector.select =
      rs_try(findOrDefault<std::vector<std::string>>(val, "select"));
  selector.exclude =
      rs_try(findOrDefault<std::vector<std::string>>(val, "exclude"));
  if (val.contains("greedy")) {
    selector.greedy = rs_try(tryFind<bool>(val, "greedy"));
  }
  return rs::Ok(std::move(selector));
}

static rs::Result<std::map<std::string, NamedSelector, std::less<>>>
parseSelectors(const toml::value& val) noexcept {
  std::map<std::string, NamedSelector, std::less<>> selectors;
  if (!val.contains("selectors")) {
    return rs::Ok(std::move(selectors));
  }

  const auto table = rs_try(tryFind<toml::table>(val, "selectors"));
  for (const auto& [name, definition] : table) {
    selectors.emplace(name, rs_try(parseNamedSelector(name, definition)));
  }
  return rs::Ok(std::move(selectors));
}

rs::Result<Config> Config::tryParse(fs::path path,
                                    const bool findParents) noexcept {
  if (findParents) {
    path = rs_try(findPath(path.parent_path()));
  }
  rs_ensure(fs::exists(path), "{} does not exist", path.string());

  toml::value data;
  try {
    data = toml::parse(path);
  } catch (const std::exception& e) {
    rs_bail("failed to parse {}: {}", path.string(), e.what());
  }
  return tryFromToml(data, std::move(path));
}

rs::Result<Config> Config::tryFromToml(const toml::value& data,
                                       fs::path path) noexcept {
  Config config;
  config.path = std::move(path);
  config.selection = rs_try(parseSelection(data));
  config.selectors = rs_try(parseSelectors(data));
  return rs::Ok(std::move(config));
}

rs::Result<fs::path> Config::findPath(fs::path candidateDir) noexcept {
  const fs::path origCandDir = candidateDir;
  while (true) {
    const fs::path configPath = candidateDir / FILE_NAME;
    spdlog::trace("Finding config: {}", configPath.string());
    if (fs::exists(configPath)) {
      return rs::Ok(configPath);
    }

    const fs::path parentPath = candidateDir.parent_path();
    if (candidateDir.has_parent_path()
        && parentPath != candidateDir.root_directory()) {
      candidateDir = parentPath;
    } else {
      break;
    }
  }

  rs_bail("{} not found in `{}` and its parents", FILE_NAME,
          origCandDir.string());
}

rs::Result<SelectionSpec>
Config::selectorSpec(const std::string_view name) const noexcept {
  const auto itr = selectors.find(name);
  if (itr == selectors.end()) {
    std::vector<std::string_view> names;
    for (const auto& [known, selector] : selectors) {
      names.push_back(known);
    }
    rs_bail("selector `{}` is not defined in {} (defined: [{}])", name,
            FILE_NAME, fmt::join(names, ", "));
  }

  const NamedSelector& selector = itr->second;
  return parseDifference(selector.select, selector.exclude,
                         selector.greedy.value_or(selection.greedy));
}

} // namespace nodesel

#ifdef NODESEL_TEST

#  include <fstream>
#  include <rs/tests.hpp>
#  include <toml11/fwd/literal_fwd.hpp>
#  include <variant>

namespace tests {

// NOLINTBEGIN
using namespace nodesel;
using namespace toml::literals::toml_literals;
// NOLINTEND

static void testEmptyConfig() {
  const toml::value val = toml::table{};
  const Config config = Config::tryFromToml(val).unwrap();
  assertFalse(config.selection.greedy);
  assertFalse(config.selection.warnError);
  assertTrue(config.selection.resourceTypes.empty());
  assertTrue(config.selectors.empty());

  pass();
}

static void testSelection() {
  const toml::value val = R"(
    [selection]
    greedy = true
    resource-types = ["model", "seed"]
    warn-error = true
  )"_toml;

  const Config config = Config::tryFromToml(val).unwrap();
  assertTrue(config.selection.greedy);
  assertTrue(config.selection.warnError);
  assertEq(config.selection.resourceTypes.size(), 2UL);
  assertTrue(config.selection.resourceTypes[0] == ResourceKind::Model);
  assertTrue(config.selection.resourceTypes[1] == ResourceKind::Seed);

  pass();
}

static void testInvalidResourceType() {
  const toml::value val = R"(
    [selection]
    resource-types = ["model", "macro"]
  )"_toml;

  assertEq(Config::tryFromToml(val).unwrap_err()->what(),
           "invalid resource type `macro`");

  pass();
}

static void testSelectors() {
  const toml::value val = R"(
    [selection]
    greedy = true

    [selectors.nightly]
    select = ["tag:nightly", "source:raw+"]
    exclude = ["tag:slow"]

    [selectors.marts]
    select = ["models/marts"]
    greedy = false
  )"_toml;

  const Config config = Config::tryFromToml(val).unwrap();
  assertEq(config.selectors.size(), 2UL);

  const NamedSelector& nightly = config.selectors.at("nightly");
  assertEq(nightly.select,
           std::vector<std::string>{ "tag:nightly", "source:raw+" });
  assertEq(nightly.exclude, std::vector<std::string>{ "tag:slow" });
  assertFalse(nightly.greedy.has_value());
  assertFalse(config.selectors.at("marts").greedy.value());

  const SelectionSpec spec = config.selectorSpec("nightly").unwrap();
  assertEq(spec.raw(), "tag:nightly source:raw+ --exclude tag:slow");

  // The selection default applies unless the selector overrides it.
  const auto& diff = std::get<SelectionComposite>(spec.get());
  const auto& included = std::get<SelectionComposite>(
      diff.components[0].get());
  const auto& leaf = std::get<SelectionComposite>(
      included.components[0].get());
  assertTrue(std::get<SelectionCriteria>(leaf.components[0].get()).greedy);

  const SelectionSpec marts = config.selectorSpec("marts").unwrap();
  const auto& martsDiff = std::get<SelectionComposite>(marts.get());
  const auto& martsIncluded = std::get<SelectionComposite>(
      martsDiff.components[0].get());
  const auto& martsLeaf = std::get<SelectionComposite>(
      martsIncluded.components[0].get());
  const auto& martsCriteria =
      std::get<SelectionCriteria>(martsLeaf.components[0].get());
  assertFalse(martsCriteria.greedy);
  assertEq(martsCriteria.method, "path");

  assertEq(config.selectorSpec("weekly").unwrap_err()->what(),
           "selector `weekly` is not defined in nodesel.toml (defined: "
           "[marts, nightly])");

  pass();
}

static void testMalformedSelector() {
  {
    const toml::value val = R"(
      [selectors]
      nightly = "tag:nightly"
    )"_toml;
    assertEq(Config::tryFromToml(val).unwrap_err()->what(),
             "[selectors.nightly] must be a table");
  }
  {
    const toml::value val = R"(
      [selectors.nightly]
      select = "tag:nightly"
    )"_toml;
    assertTrue(Config::tryFromToml(val).is_err());
  }

  pass();
}

static void testFindPath() {
  const fs::path root = fs::temp_directory_path() / "nodesel-config-test";
  const fs::path nested = root / "models" / "staging";
  fs::create_directories(nested);
  std::ofstream(root / "nodesel.toml") << "[selection]\ngreedy = true\n";

  assertEq(Config::findPath(nested).unwrap(), root / "nodesel.toml");
  const Config config = Config::tryParse(nested / "nodesel.toml").unwrap();
  assertEq(config.path, root / "nodesel.toml");
  assertTrue(config.selection.greedy);

  assertEq(Config::tryParse(nested / "nodesel.toml", /*findParents=*/false)
               .unwrap_err()
               ->what(),
           fmt::format("{} does not exist",
                       (nested / "nodesel.toml").string()));

  fs::remove_all(root);

  pass();
}

} // namespace tests

int main() {
  tests::testEmptyConfig();
  tests::testSelection();
  tests::testInvalidResourceType();
  tests::testSelectors();
  tests::testMalformedSelector();
  tests::testFindPath();
}

#endif
