#include "Selector/SelectorSpec.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace nodesel {

std::string_view toString(const SetOperation op) noexcept {
  switch (op) {
  case SetOperation::Union:
    return "union";
  case SetOperation::Intersection:
    return "intersection";
  case SetOperation::Difference:
    return "difference";
  }
  __builtin_unreachable();
}

NodeSet combine(const SetOperation op, const std::vector<NodeSet>& sets) {
  if (sets.empty()) {
    return {};
  }

  NodeSet result = sets.front();
  for (auto itr = sets.begin() + 1; itr != sets.end(); ++itr) {
    switch (op) {
    case SetOperation::Union:
      result.insert(itr->begin(), itr->end());
      break;
    case SetOperation::Intersection:
      std::erase_if(result,
                    [&](const NodeId& id) { return !itr->contains(id); });
      break;
    case SetOperation::Difference:
      for (const NodeId& id : *itr) {
        result.erase(id);
      }
      break;
    }
  }
  return result;
}

static SelectionSpec makeComposite(const SetOperation op,
                                   std::vector<SelectionSpec> components,
                                   const bool expectExists, std::string raw) {
  return SelectionComposite{ .op = op,
                             .components = std::move(components),
                             .expectExists = expectExists,
                             .raw = std::move(raw) };
}

SelectionSpec SelectionSpec::unionOf(std::vector<SelectionSpec> components,
                                     const bool expectExists,
                                     std::string raw) {
  return makeComposite(SetOperation::Union, std::move(components),
                       expectExists, std::move(raw));
}

SelectionSpec
SelectionSpec::intersectionOf(std::vector<SelectionSpec> components,
                              const bool expectExists, std::string raw) {
  return makeComposite(SetOperation::Intersection, std::move(components),
                       expectExists, std::move(raw));
}

SelectionSpec SelectionSpec::differenceOf(std::vector<SelectionSpec> components,
                                          const bool expectExists,
                                          std::string raw) {
  return makeComposite(SetOperation::Difference, std::move(components),
                       expectExists, std::move(raw));
}

const std::string& SelectionSpec::raw() const noexcept {
  return std::visit([](const auto& n) -> const std::string& { return n.raw; },
                    node);
}

bool SelectionSpec::expectExists() const noexcept {
  return std::visit([](const auto& n) { return n.expectExists; }, node);
}

} // namespace nodesel

#ifdef NODESEL_TEST

#  include <fmt/ranges.h>
#  include <rs/tests.hpp>

namespace tests {

using namespace nodesel; // NOLINT(build/namespaces,google-build-using-namespace)

static void testCombineUnion() {
  assertEq(combine(SetOperation::Union, { { "a", "b" }, { "b", "c" }, {} }),
           NodeSet{ "a", "b", "c" });
  assertTrue(combine(SetOperation::Union, {}).empty());

  pass();
}

static void testCombineIntersection() {
  assertEq(combine(SetOperation::Intersection,
                   { { "a", "b", "c" }, { "b", "c" }, { "c", "d" } }),
           NodeSet{ "c" });
  assertEq(combine(SetOperation::Intersection, { { "a", "b" } }),
           NodeSet{ "a", "b" });

  pass();
}

static void testCombineDifference() {
  assertEq(combine(SetOperation::Difference,
                   { { "a", "b", "c", "d" }, { "b" }, { "d", "e" } }),
           NodeSet{ "a", "c" });
  // Only the first set contributes members.
  assertTrue(combine(SetOperation::Difference, { {}, { "a" } }).empty());

  pass();
}

static void testSpecAccessors() {
  const SelectionSpec leaf =
      SelectionCriteria{ .raw = "tag:nightly", .method = "tag", .value = "nightly" };
  assertTrue(leaf.isCriteria());
  assertEq(leaf.raw(), "tag:nightly");
  assertFalse(leaf.expectExists());

  const SelectionSpec tree = SelectionSpec::differenceOf(
      { SelectionSpec::unionOf({ leaf }, true, "tag:nightly"), leaf }, false,
      "tag:nightly --exclude tag:nightly");
  assertFalse(tree.isCriteria());
  assertFalse(tree.expectExists());
  assertEq(fmt::format("{}", tree), "tag:nightly --exclude tag:nightly");

  const auto& composite = std::get<SelectionComposite>(tree.get());
  assertTrue(composite.op == SetOperation::Difference);
  assertEq(composite.components.size(), 2UL);
  assertTrue(composite.components.front().expectExists());

  pass();
}

} // namespace tests

int main() {
  tests::testCombineUnion();
  tests::testCombineIntersection();
  tests::testCombineDifference();
  tests::testSpecAccessors();
}

#endif
