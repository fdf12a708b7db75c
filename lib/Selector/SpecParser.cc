#include "Selector/SpecParser.hpp"

#include <charconv>
#include <cstddef>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <optional>
#include <regex>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace nodesel {

static constexpr char INTERSECTION_DELIMITER = ',';

static bool isProbablyPath(const std::string_view value) {
  if (value.find('/') != std::string_view::npos
      || value.find('\\') != std::string_view::npos) {
    return true;
  }
  for (const std::string_view ext : { ".sql", ".py", ".csv" }) {
    if (value.ends_with(ext)) {
      return true;
    }
  }
  return false;
}

static rs::Result<std::optional<std::size_t>>
parseDepth(const std::string_view digits, const std::string_view raw) {
  if (digits.empty()) {
    return rs::Ok(std::optional<std::size_t>());
  }
  std::size_t depth = 0;
  const auto [ptr, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), depth);
  rs_ensure(ec == std::errc() && ptr == digits.data() + digits.size(),
            "invalid depth `{}` in `{}`", digits, raw);
  return rs::Ok(std::optional<std::size_t>(depth));
}

rs::Result<SelectionCriteria> parseCriteria(const std::string_view raw,
                                            const bool greedy) noexcept {
  static const std::regex pattern(
      R"(^(@)?((\d*)\+)?(([\w.]+):)?(.*?)(\+(\d*))?$)");

  const std::string rawStr(raw);
  std::smatch match;
  rs_ensure(std::regex_match(rawStr, match, pattern),
            "invalid selector spec `{}`", raw);

  SelectionCriteria criteria;
  criteria.raw = rawStr;
  criteria.greedy = greedy;
  criteria.childrensParents = match[1].matched;
  criteria.parents = match[2].matched;
  criteria.parentsDepth = rs_try(parseDepth(match[3].str(), raw));
  criteria.children = match[7].matched;
  criteria.childrenDepth = rs_try(parseDepth(match[8].str(), raw));
  criteria.value = match[6].str();

  rs_ensure(!criteria.value.empty(), "selector spec `{}` has no value", raw);
  rs_ensure(!(criteria.childrensParents && criteria.parents),
            "invalid selector spec `{}`: `@` and `+` cannot both prefix a "
            "value",
            raw);

  if (match[5].matched) {
    const std::string methodPath = match[5].str();
    const std::size_t dot = methodPath.find('.');
    criteria.method = methodPath.substr(0, dot);
    if (dot != std::string::npos) {
      criteria.methodArguments.emplace("key", methodPath.substr(dot + 1));
    }
  } else if (isProbablyPath(criteria.value)) {
    criteria.method = "path";
  } else {
    criteria.method = "fqn";
  }

  spdlog::trace("Parsed `{}` as method={} value={}", raw, criteria.method,
                criteria.value);
  return rs::Ok(std::move(criteria));
}

static std::vector<std::string>
splitRawSpecs(const std::vector<std::string>& components) {
  std::vector<std::string> rawSpecs;
  for (const std::string& component : components) {
    std::string current;
    for (const char c : component) {
      if (c == ' ' || c == '\t' || c == '\n') {
        if (!current.empty()) {
          rawSpecs.push_back(std::move(current));
          current.clear();
        }
      } else {
        current.push_back(c);
      }
    }
    if (!current.empty()) {
      rawSpecs.push_back(std::move(current));
    }
  }
  return rawSpecs;
}

rs::Result<SelectionSpec> parseUnion(const std::vector<std::string>& components,
                                     const bool expectExists,
                                     const bool greedy) noexcept {
  std::vector<SelectionSpec> unionComponents;
  for (const std::string& rawSpec : splitRawSpecs(components)) {
    std::vector<SelectionSpec> intersectionComponents;
    std::size_t start = 0;
    while (true) {
      const std::size_t pos = rawSpec.find(INTERSECTION_DELIMITER, start);
      const std::string_view part =
          std::string_view(rawSpec).substr(start, pos == std::string::npos
                                                      ? std::string::npos
                                                      : pos - start);
      intersectionComponents.emplace_back(rs_try(parseCriteria(part, greedy)));
      if (pos == std::string::npos) {
        break;
      }
      start = pos + 1;
    }
    unionComponents.push_back(SelectionSpec::intersectionOf(
        std::move(intersectionComponents), expectExists, rawSpec));
  }

  return rs::Ok(SelectionSpec::unionOf(std::move(unionComponents),
                                       /*expectExists=*/false,
                                       fmt::format("{}", fmt::join(components,
                                                                   " "))));
}

rs::Result<SelectionSpec>
parseDifference(const std::vector<std::string>& include,
                const std::vector<std::string>& exclude,
                const bool greedy) noexcept {
  const std::vector<std::string>& includes =
      include.empty() ? DEFAULT_INCLUDES : include;

  // Only criteria the user wrote warn when they match nothing.
  SelectionSpec included =
      rs_try(parseUnion(includes, /*expectExists=*/!include.empty(), greedy));
  SelectionSpec excluded =
      rs_try(parseUnion(exclude, /*expectExists=*/false, /*greedy=*/true));

  std::string raw = included.raw();
  if (!exclude.empty()) {
    raw += fmt::format(" --exclude {}", excluded.raw());
  }
  return rs::Ok(SelectionSpec::differenceOf(
      { std::move(included), std::move(excluded) }, /*expectExists=*/false,
      std::move(raw)));
}

} // namespace nodesel

#ifdef NODESEL_TEST

#  include <rs/tests.hpp>
#  include <variant>

namespace tests {

using namespace nodesel; // NOLINT(build/namespaces,google-build-using-namespace)

static void testParseBareValue() {
  const SelectionCriteria criteria = parseCriteria("orders", false).unwrap();
  assertEq(criteria.method, "fqn");
  assertEq(criteria.value, "orders");
  assertEq(criteria.raw, "orders");
  assertFalse(criteria.parents);
  assertFalse(criteria.children);
  assertFalse(criteria.childrensParents);
  assertFalse(criteria.greedy);
  assertTrue(criteria.methodArguments.empty());

  pass();
}

static void testParseMethod() {
  const SelectionCriteria tag = parseCriteria("tag:nightly", true).unwrap();
  assertEq(tag.method, "tag");
  assertEq(tag.value, "nightly");
  assertTrue(tag.greedy);

  const SelectionCriteria config =
      parseCriteria("config.materialized:view", false).unwrap();
  assertEq(config.method, "config");
  assertEq(config.value, "view");
  assertEq(config.methodArguments.at("key"), "materialized");

  const SelectionCriteria source =
      parseCriteria("source:shop.raw.orders", false).unwrap();
  assertEq(source.method, "source");
  assertEq(source.value, "shop.raw.orders");

  pass();
}

static void testParsePathDefault() {
  assertEq(parseCriteria("models/staging", false).unwrap().method, "path");
  assertEq(parseCriteria("orders.sql", false).unwrap().method, "path");
  assertEq(parseCriteria("shop.staging", false).unwrap().method, "fqn");

  pass();
}

static void testParseModifiers() {
  {
    const SelectionCriteria criteria = parseCriteria("+orders", false).unwrap();
    assertTrue(criteria.parents);
    assertFalse(criteria.parentsDepth.has_value());
    assertFalse(criteria.children);
    assertEq(criteria.value, "orders");
  }
  {
    const SelectionCriteria criteria =
        parseCriteria("2+tag:nightly+3", false).unwrap();
    assertTrue(criteria.parents);
    assertEq(criteria.parentsDepth.value(), 2UL);
    assertTrue(criteria.children);
    assertEq(criteria.childrenDepth.value(), 3UL);
    assertEq(criteria.method, "tag");
    assertEq(criteria.value, "nightly");
  }
  {
    const SelectionCriteria criteria = parseCriteria("orders+", false).unwrap();
    assertTrue(criteria.children);
    assertFalse(criteria.childrenDepth.has_value());
  }
  {
    const SelectionCriteria criteria = parseCriteria("@orders", false).unwrap();
    assertTrue(criteria.childrensParents);
    assertFalse(criteria.parents);
  }

  pass();
}

static void testParseErrors() {
  assertEq(parseCriteria("@+orders", false).unwrap_err()->what(),
           "invalid selector spec `@+orders`: `@` and `+` cannot both prefix "
           "a value");
  assertEq(parseCriteria("+", false).unwrap_err()->what(),
           "selector spec `+` has no value");
  assertEq(parseCriteria("tag:", false).unwrap_err()->what(),
           "selector spec `tag:` has no value");

  pass();
}

static void testParseUnion() {
  const SelectionSpec spec =
      parseUnion({ "tag:a,tag:b orders", "+stg" }, true, false).unwrap();
  const auto& unionSpec = std::get<SelectionComposite>(spec.get());
  assertTrue(unionSpec.op == SetOperation::Union);
  assertFalse(unionSpec.expectExists);
  assertEq(spec.raw(), "tag:a,tag:b orders +stg");
  assertEq(unionSpec.components.size(), 3UL);

  const auto& first =
      std::get<SelectionComposite>(unionSpec.components[0].get());
  assertTrue(first.op == SetOperation::Intersection);
  assertTrue(first.expectExists);
  assertEq(first.raw, "tag:a,tag:b");
  assertEq(first.components.size(), 2UL);
  assertEq(std::get<SelectionCriteria>(first.components[1].get()).value, "b");

  const auto& third =
      std::get<SelectionComposite>(unionSpec.components[2].get());
  assertTrue(std::get<SelectionCriteria>(third.components[0].get()).parents);

  pass();
}

static void testParseDifference() {
  const SelectionSpec spec =
      parseDifference({ "tag:nightly" }, { "orders" }, false).unwrap();
  const auto& diff = std::get<SelectionComposite>(spec.get());
  assertTrue(diff.op == SetOperation::Difference);
  assertEq(spec.raw(), "tag:nightly --exclude orders");
  assertEq(diff.components.size(), 2UL);

  // Inclusions follow the greedy flag, exclusions are always greedy.
  const auto& included = std::get<SelectionComposite>(
      diff.components[0].get());
  const auto& includedLeaf = std::get<SelectionComposite>(
      included.components[0].get());
  assertFalse(
      std::get<SelectionCriteria>(includedLeaf.components[0].get()).greedy);
  assertTrue(includedLeaf.expectExists);

  const auto& excluded = std::get<SelectionComposite>(
      diff.components[1].get());
  const auto& excludedLeaf = std::get<SelectionComposite>(
      excluded.components[0].get());
  assertTrue(
      std::get<SelectionCriteria>(excludedLeaf.components[0].get()).greedy);
  assertFalse(excludedLeaf.expectExists);

  pass();
}

static void testParseDifferenceDefaults() {
  const SelectionSpec spec = parseDifference({}, {}, false).unwrap();
  assertEq(spec.raw(), "fqn:* source:* exposure:*");
  const auto& diff = std::get<SelectionComposite>(spec.get());
  const auto& excluded = std::get<SelectionComposite>(
      diff.components[1].get());
  assertTrue(excluded.components.empty());

  const auto& included = std::get<SelectionComposite>(
      diff.components[0].get());
  assertEq(included.components.size(), 3UL);
  for (const auto& component : included.components) {
    assertFalse(component.expectExists());
  }

  const SelectionSpec explicitSpec =
      parseDifference({ "fqn:*" }, {}, false).unwrap();
  const auto& explicitDiff =
      std::get<SelectionComposite>(explicitSpec.get());
  const auto& explicitIncluded = std::get<SelectionComposite>(
      explicitDiff.components[0].get());
  assertTrue(explicitIncluded.components[0].expectExists());

  pass();
}

} // namespace tests

int main() {
  tests::testParseBareValue();
  tests::testParseMethod();
  tests::testParsePathDefault();
  tests::testParseModifiers();
  tests::testParseErrors();
  tests::testParseUnion();
  tests::testParseDifference();
  tests::testParseDifferenceDefaults();
}

#endif
