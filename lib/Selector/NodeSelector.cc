#include "Selector/NodeSelector.hpp"

#include "Diag.hpp"

#include <algorithm>
#include <cstddef>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace nodesel {

NodeMatcher matchAll() {
  return [](const GraphMember&) { return true; };
}

NodeMatcher resourceTypeMatcher(std::unordered_set<ResourceKind> kinds) {
  return [kinds = std::move(kinds)](const GraphMember& member) {
    return kinds.contains(resourceKind(member));
  };
}

NodeSelector::NodeSelector(const Graph& fullGraph, Graph graph,
                           const Manifest& manifest, NodeMatcher matcher,
                           SelectorOptions options)
    : fullGraph(fullGraph), graph_(std::move(graph)), manifest(manifest),
      methods(manifest), matcher(std::move(matcher)), options(options) {}

rs::Result<NodeSelector> NodeSelector::create(const Graph& fullGraph,
                                              const Manifest& manifest,
                                              NodeMatcher matcher,
                                              SelectorOptions options) noexcept {
  NodeSet members;
  for (const NodeId& id : fullGraph.nodes()) {
    const GraphMember* member = manifest.find(id);
    rs_ensure(member != nullptr, "Node {} not found in the manifest!", id);
    if (isEnabled(*member) && !isEmpty(*member)) {
      members.insert(id);
    }
  }
  spdlog::debug("{} of {} graph nodes are selectable", members.size(),
                fullGraph.size());

  return rs::Ok(NodeSelector(fullGraph, fullGraph.subgraph(members), manifest,
                             std::move(matcher), options));
}

rs::Result<const GraphMember*> NodeSelector::lookup(const NodeId& id) const {
  const GraphMember* member = manifest.find(id);
  rs_ensure(member != nullptr, "Node {} not found in the manifest!", id);
  return rs::Ok(member);
}

rs::Result<bool> NodeSelector::parentsSelected(const NodeId& id,
                                               const NodeSet& selected) const {
  const GraphMember* member = rs_try(lookup(id));
  return rs::Ok(std::ranges::all_of(
      dependsOn(*member),
      [&](const NodeId& parent) { return selected.contains(parent); }));
}

rs::Result<NodeSet>
NodeSelector::selectIncluded(const NodeSet& included,
                             const SelectionCriteria& criteria) const {
  const SelectorMethod method =
      rs_try(methods.getMethod(criteria.method, criteria.methodArguments));
  return method(included, criteria.value);
}

NodeSet
NodeSelector::collectSpecifiedNeighbors(const SelectionCriteria& criteria,
                                        const NodeSet& selected) const {
  NodeSet additional;
  if (criteria.childrensParents) {
    additional.merge(graph_.selectChildrensParents(selected));
  }
  if (criteria.parents) {
    additional.merge(graph_.selectParents(selected, criteria.parentsDepth));
  }
  if (criteria.children) {
    additional.merge(graph_.selectChildren(selected, criteria.childrenDepth));
  }
  return additional;
}

rs::Result<SelectionSets>
NodeSelector::getNodesFromCriteria(const SelectionCriteria& criteria) const {
  const auto methodNames = selectorMethodNames();
  if (std::ranges::find(methodNames, std::string_view(criteria.method)) == methodNames.end()) {
    Diag::warn("The '{}' selector specified in {} is invalid. Must be one of "
               "[{}]",
               criteria.method, criteria.raw, fmt::join(methodNames, ", "));
    return rs::Ok(SelectionSets{});
  }

  NodeSet collected = rs_try(selectIncluded(graph_.nodes(), criteria));
  collected.merge(collectSpecifiedNeighbors(criteria, collected));
  spdlog::trace("`{}` collected {} node(s)", criteria.raw, collected.size());
  return expandSelection(collected, criteria.greedy);
}

rs::Result<SelectionSets>
NodeSelector::expandSelection(const NodeSet& selected,
                              const bool greedy) const {
  SelectionSets sets{ .direct = selected, .indirect = {} };
  for (const NodeId& id : graph_.selectSuccessors(selected)) {
    const GraphMember* member = rs_try(lookup(id));
    if (!canSelectIndirectly(*member)) {
      continue;
    }
    if (greedy || rs_try(parentsSelected(id, selected))) {
      sets.direct.insert(id);
    } else {
      sets.indirect.insert(id);
    }
  }
  return rs::Ok(std::move(sets));
}

rs::Result<NodeSet>
NodeSelector::incorporateIndirectNodes(const NodeSet& direct,
                                       const NodeSet& indirect) const {
  NodeSet selected = direct;
  for (const NodeId& id : indirect) {
    const GraphMember* member = rs_try(lookup(id));
    if (!std::holds_alternative<ManifestNode>(*member)) {
      continue;
    }
    if (rs_try(parentsSelected(id, selected))) {
      selected.insert(id);
    }
  }
  return rs::Ok(std::move(selected));
}

rs::Result<void>
NodeSelector::alertNonExistence(const SelectionSpec& spec,
                                const NodeSet& direct) const {
  if (!spec.expectExists() || !direct.empty()) {
    return rs::Ok();
  }
  return warnOrError(options.warnError,
                     "The selection criterion '{}' does not match any nodes",
                     spec.raw());
}

rs::Result<SelectionSets>
NodeSelector::selectNodesRecursively(const SelectionSpec& spec) const {
  rs::Result<SelectionSets> evaluated = std::visit(
      Overloaded{
          [&](const SelectionCriteria& criteria) -> rs::Result<SelectionSets> {
            return getNodesFromCriteria(criteria);
          },
          [&](const SelectionComposite& composite)
              -> rs::Result<SelectionSets> {
            std::vector<NodeSet> directSets;
            std::vector<NodeSet> indirectSets;
            for (const SelectionSpec& component : composite.components) {
              SelectionSets bundle = rs_try(selectNodesRecursively(component));
              NodeSet reachable = bundle.direct;
              reachable.insert(bundle.indirect.begin(), bundle.indirect.end());
              directSets.push_back(std::move(bundle.direct));
              indirectSets.push_back(std::move(reachable));
            }

            const NodeSet initialDirect = combine(composite.op, directSets);
            NodeSet indirect = combine(composite.op, indirectSets);
            NodeSet direct =
                rs_try(incorporateIndirectNodes(initialDirect, indirect));
            spdlog::trace("{} of {} component(s) selected {} node(s)",
                          toString(composite.op), composite.components.size(),
                          direct.size());
            return rs::Ok(SelectionSets{ .direct = std::move(direct),
                                         .indirect = std::move(indirect) });
          },
      },
      spec.get());

  SelectionSets sets = rs_try(std::move(evaluated));
  rs_try(alertNonExistence(spec, sets.direct));
  return rs::Ok(std::move(sets));
}

rs::Result<SelectionSets>
NodeSelector::selectNodes(const SelectionSpec& spec) const {
  SelectionSets sets = rs_try(selectNodesRecursively(spec));
  std::erase_if(sets.indirect,
                [&](const NodeId& id) { return sets.direct.contains(id); });
  return rs::Ok(std::move(sets));
}

rs::Result<NodeSet>
NodeSelector::filterSelection(const NodeSet& selected) const {
  NodeSet filtered;
  for (const NodeId& id : selected) {
    const GraphMember* member = rs_try(lookup(id));
    if (matcher(*member)) {
      filtered.insert(id);
    }
  }
  return rs::Ok(std::move(filtered));
}

rs::Result<void> NodeSelector::alertUnusedNodes(const NodeSet& unused) const {
  std::vector<std::string> names;
  names.reserve(unused.size());
  for (const NodeId& id : unused) {
    names.push_back(memberName(*rs_try(lookup(id))));
  }
  std::ranges::sort(names);

  static constexpr std::size_t SUMMARY_LEN = 3;
  const std::string debugMsg =
      fmt::format("Some tests were excluded because at least one parent is "
                  "missing:\n  - {}\nUse the --greedy flag to include them",
                  fmt::join(names, "\n  - "));
  if (names.size() <= SUMMARY_LEN + 1) {
    Diag::logger()->info("{}", debugMsg);
  } else {
    Diag::logger()->info(
        "Some tests were excluded because at least one parent is missing:\n"
        "  - {}\n  - and {} more\nUse the --greedy flag to include them",
        fmt::join(names.begin(), names.begin() + SUMMARY_LEN, "\n  - "),
        names.size() - SUMMARY_LEN);
  }
  Diag::logger()->debug("{}", debugMsg);
  return rs::Ok();
}

rs::Result<NodeSet> NodeSelector::getSelected(const SelectionSpec& spec) const {
  const SelectionSets sets = rs_try(selectNodes(spec));
  NodeSet filtered = rs_try(filterSelection(sets.direct));

  if (!sets.indirect.empty()) {
    const NodeSet unused = rs_try(filterSelection(sets.indirect));
    if (!unused.empty()) {
      rs_try(alertUnusedNodes(unused));
    }
  }
  return rs::Ok(std::move(filtered));
}

rs::Result<std::unique_ptr<GraphQueue>>
NodeSelector::getGraphQueue(const SelectionSpec& spec) const {
  NodeSet selected = rs_try(getSelected(spec));
  Graph subset = fullGraph.getSubsetGraph(selected);
  return GraphQueue::create(std::move(subset), std::move(selected));
}

} // namespace nodesel

#ifdef NODESEL_TEST

#  include "Selector/SpecParser.hpp"

#  include <optional>
#  include <rs/tests.hpp>
#  include <spdlog/sinks/ostream_sink.h>
#  include <sstream>

namespace tests {

using namespace nodesel; // NOLINT(build/namespaces,google-build-using-namespace)

// Collects everything Diag prints while alive.
class LogCapture {
public:
  LogCapture() : sink(std::make_shared<spdlog::sinks::ostream_sink_mt>(out)) {
    sink->set_pattern("%v");
    Diag::logger()->sinks().push_back(sink);
  }
  ~LogCapture() { std::erase(Diag::logger()->sinks(), sink); }

  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  std::string str() const { return out.str(); }

private:
  std::ostringstream out;
  std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink;
};

static ManifestNode model(std::string name, std::vector<NodeId> deps = {}) {
  return ManifestNode{
    .uniqueId = "model.proj." + name,
    .resourceKind = ResourceKind::Model,
    .name = name,
    .fqn = { "proj", name },
    .packageName = "proj",
    .path = "models/" + name + ".sql",
    .dependsOn = std::move(deps),
  };
}

static ManifestNode test(std::string name, std::vector<NodeId> deps) {
  return ManifestNode{
    .uniqueId = "test.proj." + name,
    .resourceKind = ResourceKind::Test,
    .name = name,
    .fqn = { "proj", name },
    .packageName = "proj",
    .path = "models/schema.yml",
    .dependsOn = std::move(deps),
  };
}

// source.proj.raw -> model_a -> model_b, and t1 tests both models.
struct Fixture {
  Manifest manifest;
  Graph graph;

  Fixture() {
    std::ignore = manifest.add(SourceDefinition{
        .uniqueId = "source.proj.raw",
        .name = "raw",
        .sourceName = "raw",
        .fqn = { "proj", "raw", "raw" },
        .packageName = "proj",
    });
    std::ignore = manifest.add(model("model_a", { "source.proj.raw" }));
    std::ignore = manifest.add(model("model_b", { "model.proj.model_a" }));
    std::ignore = manifest.add(
        test("t1", { "model.proj.model_a", "model.proj.model_b" }));

    ManifestNode disabled = model("disabled", { "model.proj.model_a" });
    disabled.enabled = false;
    std::ignore = manifest.add(std::move(disabled));
    ManifestNode ephemeral = model("ephemeral");
    ephemeral.empty = true;
    std::ignore = manifest.add(std::move(ephemeral));

    graph = Graph::fromManifest(manifest).unwrap();
  }

  NodeSelector selector(NodeMatcher matcher = matchAll(),
                        SelectorOptions options = {}) const {
    return NodeSelector::create(graph, manifest, std::move(matcher), options)
        .unwrap();
  }
};

static SelectionCriteria fqn(std::string value, bool greedy = false) {
  return SelectionCriteria{
    .raw = value, .method = "fqn", .value = value, .greedy = greedy
  };
}

static void testMemberGraph() {
  const Fixture fixture;
  const NodeSelector selector = fixture.selector();
  assertEq(selector.graph().nodes(),
           NodeSet{ "source.proj.raw", "model.proj.model_a",
                    "model.proj.model_b", "test.proj.t1" });
  // The full graph is left alone.
  assertEq(fixture.graph.size(), 6UL);

  Graph unknown = fixture.graph;
  unknown.addNode("model.proj.ghost");
  assertEq(NodeSelector::create(unknown, fixture.manifest)
               .unwrap_err()
               ->what(),
           "Node model.proj.ghost not found in the manifest!");

  pass();
}

static void testPartialParentsStayIndirect() {
  const Fixture fixture;
  const NodeSelector selector = fixture.selector();
  const SelectionSets sets = selector.selectNodes(fqn("model_a")).unwrap();
  assertEq(sets.direct, NodeSet{ "model.proj.model_a" });
  assertEq(sets.indirect, NodeSet{ "test.proj.t1" });

  pass();
}

static void testUnionPromotesTests() {
  const Fixture fixture;
  const NodeSelector selector = fixture.selector();
  const LogCapture log;
  Diag::setLevel(DiagLevel::VeryVerbose);
  const SelectionSets sets =
      selector
          .selectNodes(SelectionSpec::unionOf({ fqn("model_a"), fqn("model_b") }))
          .unwrap();
  Diag::setLevel(DiagLevel::Info);
  assertEq(sets.direct, NodeSet{ "model.proj.model_a", "model.proj.model_b",
                                 "test.proj.t1" });
  assertTrue(sets.indirect.empty());
  assertTrue(log.str().contains("union of 2 component(s) selected 3 node(s)"));

  pass();
}

static void testGreedyPromotesTests() {
  const Fixture fixture;
  const NodeSelector selector = fixture.selector();
  const SelectionSets sets =
      selector.selectNodes(fqn("model_a", /*greedy=*/true)).unwrap();
  assertEq(sets.direct, NodeSet{ "model.proj.model_a", "test.proj.t1" });
  assertTrue(sets.indirect.empty());

  pass();
}

static void testNoMatchWarns() {
  const Fixture fixture;
  const SelectionSpec spec = SelectionSpec::unionOf({
      SelectionSpec::intersectionOf({ fqn("nothing_here") }, true,
                                    "nothing_here"),
  });

  {
    const NodeSelector selector = fixture.selector();
    const LogCapture capture;
    const auto selected = selector.getSelected(spec);
    assertTrue(selected.is_ok());
    assertTrue(selected.unwrap().empty());
    assertTrue(capture.str().find("The selection criterion 'nothing_here' does "
                                  "not match any nodes")
               != std::string::npos);
  }
  {
    const NodeSelector selector =
        fixture.selector(matchAll(), SelectorOptions{ .warnError = true });
    assertEq(selector.getSelected(spec).unwrap_err()->what(),
             "The selection criterion 'nothing_here' does not match any nodes");
  }

  pass();
}

static void testResourceTypeFilter() {
  const Fixture fixture;
  const NodeSelector selector =
      fixture.selector(resourceTypeMatcher({ ResourceKind::Source }));

  SelectionCriteria criteria = fqn("model_a");
  criteria.parents = true;
  assertEq(selector.selectNodes(criteria).unwrap().direct,
           NodeSet{ "source.proj.raw", "model.proj.model_a" });
  assertEq(selector.getSelected(criteria).unwrap(),
           NodeSet{ "source.proj.raw" });

  pass();
}

static void testUnknownMethodSelectsNothing() {
  const Fixture fixture;
  const NodeSelector selector = fixture.selector();
  const LogCapture capture;
  const SelectionCriteria criteria{
    .raw = "state:modified", .method = "state", .value = "modified"
  };
  const SelectionSets sets = selector.getNodesFromCriteria(criteria).unwrap();
  assertTrue(sets.direct.empty());
  assertTrue(sets.indirect.empty());
  assertTrue(capture.str().find(
                 "The 'state' selector specified in state:modified is "
                 "invalid. Must be one of [fqn, tag, path, package, config, "
                 "resource_type, source, exposure]")
             != std::string::npos);

  pass();
}

static void testNeighbors() {
  const Fixture fixture;
  const NodeSelector selector = fixture.selector();

  SelectionCriteria children = fqn("raw");
  children.method = "source";
  children.children = true;
  children.childrenDepth = 1;
  assertEq(selector.getSelected(children).unwrap(),
           NodeSet{ "source.proj.raw", "model.proj.model_a" });

  SelectionCriteria childrensParents = fqn("model_a");
  childrensParents.childrensParents = true;
  assertEq(selector.getSelected(childrensParents).unwrap(),
           NodeSet{ "source.proj.raw", "model.proj.model_a",
                    "model.proj.model_b", "test.proj.t1" });

  pass();
}

static void testClosureIsIdempotent() {
  const Fixture fixture;
  const NodeSelector selector = fixture.selector();
  const NodeSet direct = { "model.proj.model_a", "model.proj.model_b" };
  const NodeSet indirect = { "test.proj.t1", "source.proj.raw" };

  const NodeSet once =
      selector.incorporateIndirectNodes(direct, indirect).unwrap();
  assertEq(once, NodeSet{ "model.proj.model_a", "model.proj.model_b",
                          "test.proj.t1" });
  assertEq(selector.incorporateIndirectNodes(once, indirect).unwrap(), once);

  pass();
}

static void testIndirectIsDisjointFromDirect() {
  const Fixture fixture;
  const NodeSelector selector = fixture.selector();
  const SelectionSpec spec =
      parseDifference({ "model_a", "tag:none,model_b" }, {}, false).unwrap();
  const SelectionSets sets = selector.selectNodes(spec).unwrap();
  for (const NodeId& id : sets.indirect) {
    assertFalse(sets.direct.contains(id));
  }

  pass();
}

static void testGreedyIsSuperset() {
  const Fixture fixture;
  const NodeSelector selector = fixture.selector();
  for (const std::string_view raw : { "model_a", "model_b", "+model_b" }) {
    const NodeSet lazy =
        selector.getSelected(parseCriteria(raw, false).unwrap()).unwrap();
    const NodeSet greedy =
        selector.getSelected(parseCriteria(raw, true).unwrap()).unwrap();
    for (const NodeId& id : lazy) {
      assertTrue(greedy.contains(id));
    }
  }

  pass();
}

static void testDifferenceLeavesNoOrphanTests() {
  const Fixture fixture;
  const NodeSelector selector = fixture.selector();
  const SelectionSpec spec =
      parseDifference({ "fqn:*" }, { "model_b" }, false).unwrap();
  assertEq(selector.getSelected(spec).unwrap(),
           NodeSet{ "model.proj.model_a" });

  pass();
}

static void testFilterIsIdempotent() {
  const Fixture fixture;
  const NodeSelector selector = fixture.selector(
      resourceTypeMatcher({ ResourceKind::Model, ResourceKind::Test }));
  const NodeSet all = selector.graph().nodes();
  const NodeSet once = selector.filterSelection(all).unwrap();
  assertEq(once, NodeSet{ "model.proj.model_a", "model.proj.model_b",
                          "test.proj.t1" });
  assertEq(selector.filterSelection(once).unwrap(), once);

  assertEq(selector.filterSelection({ "model.proj.ghost" }).unwrap_err()->what(),
           "Node model.proj.ghost not found in the manifest!");

  pass();
}

static void testUnusedTestsAlert() {
  Manifest manifest;
  std::ignore = manifest.add(model("model_a"));
  std::ignore = manifest.add(model("model_b"));
  for (const std::string_view name : { "t1", "t2", "t3", "t4", "t5" }) {
    std::ignore = manifest.add(test(
        std::string(name), { "model.proj.model_a", "model.proj.model_b" }));
  }
  const Graph graph = Graph::fromManifest(manifest).unwrap();
  const NodeSelector selector =
      NodeSelector::create(graph, manifest).unwrap();

  const LogCapture capture;
  assertEq(selector.getSelected(fqn("model_a")).unwrap(),
           NodeSet{ "model.proj.model_a" });
  assertTrue(capture.str().find(
                 "Some tests were excluded because at least one parent is "
                 "missing:\n  - t1\n  - t2\n  - t3\n  - and 2 more\n"
                 "Use the --greedy flag to include them")
             != std::string::npos);

  pass();
}

static void testGraphQueue() {
  const Fixture fixture;
  const NodeSelector selector = fixture.selector();
  const SelectionSpec spec = SelectionSpec::unionOf(
      { SelectionCriteria{ .raw = "source:raw",
                           .method = "source",
                           .value = "raw" },
        fqn("model_b") });

  const auto queue = selector.getGraphQueue(spec).unwrap();
  assertEq(queue->size(), 2UL);
  // model_a was dropped, but model_b still waits for the source.
  assertEq(queue->graph().parentsOf("model.proj.model_b"),
           NodeSet{ "source.proj.raw" });

  const std::optional<NodeId> first = queue->get();
  assertEq(first.value(), "source.proj.raw");
  assertFalse(queue->get().has_value());
  assertTrue(queue->markDone("source.proj.raw").is_ok());
  assertEq(queue->get().value(), "model.proj.model_b");

  pass();
}

} // namespace tests

int main() {
  nodesel::setColorMode(nodesel::ColorMode::Never);

  tests::testMemberGraph();
  tests::testPartialParentsStayIndirect();
  tests::testUnionPromotesTests();
  tests::testGreedyPromotesTests();
  tests::testNoMatchWarns();
  tests::testResourceTypeFilter();
  tests::testUnknownMethodSelectsNothing();
  tests::testNeighbors();
  tests::testClosureIsIdempotent();
  tests::testIndirectIsDisjointFromDirect();
  tests::testGreedyIsSuperset();
  tests::testDifferenceLeavesNoOrphanTests();
  tests::testFilterIsIdempotent();
  tests::testUnusedTestsAlert();
  tests::testGraphQueue();
}

#endif
