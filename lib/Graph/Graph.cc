#include "Graph/Graph.hpp"

#include <algorithm>
#include <cstddef>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace nodesel {

rs::Result<Graph> Graph::fromManifest(const Manifest& manifest) noexcept {
  Graph graph;
  for (const auto& [id, member] : manifest.members()) {
    graph.addNode(id);
    for (const NodeId& parent : dependsOn(member)) {
      rs_ensure(manifest.contains(parent),
                "`{}` depends on `{}`, which is not in the manifest", id,
                parent);
      graph.addEdge(parent, id);
    }
  }
  spdlog::trace("Built graph with {} nodes", graph.size());
  return rs::Ok(std::move(graph));
}

void Graph::addNode(const NodeId& id) { adjacency.try_emplace(id); }

void Graph::addEdge(const NodeId& parent, const NodeId& child) {
  adjacency[parent].children.insert(child);
  adjacency[child].parents.insert(parent);
}

NodeSet Graph::nodes() const {
  NodeSet ids;
  ids.reserve(adjacency.size());
  for (const auto& [id, adj] : adjacency) {
    ids.insert(id);
  }
  return ids;
}

const NodeSet& Graph::parentsOf(const NodeId& id) const {
  return adjacency.at(id).parents;
}

const NodeSet& Graph::childrenOf(const NodeId& id) const {
  return adjacency.at(id).children;
}

Graph Graph::subgraph(const NodeSet& ids) const {
  Graph sub;
  for (const NodeId& id : ids) {
    const auto itr = adjacency.find(id);
    if (itr == adjacency.end()) {
      continue;
    }
    sub.addNode(id);
    for (const NodeId& child : itr->second.children) {
      if (ids.contains(child)) {
        sub.addEdge(id, child);
      }
    }
  }
  return sub;
}

NodeSet Graph::traverse(const NodeId& start,
                        const std::optional<std::size_t> maxDepth,
                        const bool forward) const {
  NodeSet visited;
  if (!adjacency.contains(start)) {
    return visited;
  }

  std::vector<NodeId> frontier{ start };
  std::size_t depth = 0;
  while (!frontier.empty() && (!maxDepth.has_value() || depth < *maxDepth)) {
    std::vector<NodeId> next;
    for (const NodeId& id : frontier) {
      const Adjacency& adj = adjacency.at(id);
      for (const NodeId& neighbor : forward ? adj.children : adj.parents) {
        if (visited.insert(neighbor).second) {
          next.push_back(neighbor);
        }
      }
    }
    frontier = std::move(next);
    ++depth;
  }
  return visited;
}

NodeSet Graph::ancestors(const NodeId& id,
                         const std::optional<std::size_t> maxDepth) const {
  return traverse(id, maxDepth, /*forward=*/false);
}

NodeSet Graph::descendants(const NodeId& id,
                           const std::optional<std::size_t> maxDepth) const {
  return traverse(id, maxDepth, /*forward=*/true);
}

NodeSet Graph::selectParents(const NodeSet& selected,
                             const std::optional<std::size_t> maxDepth) const {
  NodeSet parents;
  for (const NodeId& id : selected) {
    parents.merge(ancestors(id, maxDepth));
  }
  return parents;
}

NodeSet Graph::selectChildren(const NodeSet& selected,
                              const std::optional<std::size_t> maxDepth) const {
  NodeSet children;
  for (const NodeId& id : selected) {
    children.merge(descendants(id, maxDepth));
  }
  return children;
}

NodeSet Graph::selectChildrensParents(const NodeSet& selected) const {
  NodeSet ancestorsFor = selectChildren(selected);
  ancestorsFor.insert(selected.begin(), selected.end());

  NodeSet result = selectParents(ancestorsFor);
  result.merge(ancestorsFor);
  return result;
}

NodeSet Graph::selectSuccessors(const NodeSet& selected) const {
  NodeSet successors;
  for (const NodeId& id : selected) {
    const auto itr = adjacency.find(id);
    if (itr == adjacency.end()) {
      continue;
    }
    successors.insert(itr->second.children.begin(),
                      itr->second.children.end());
  }
  return successors;
}

void Graph::removeNode(const NodeId& id) {
  const auto itr = adjacency.find(id);
  if (itr == adjacency.end()) {
    return;
  }
  for (const NodeId& parent : itr->second.parents) {
    adjacency.at(parent).children.erase(id);
  }
  for (const NodeId& child : itr->second.children) {
    adjacency.at(child).parents.erase(id);
  }
  adjacency.erase(itr);
}

Graph Graph::getSubsetGraph(const NodeSet& selected) const {
  Graph subset = *this;

  std::vector<NodeId> toRemove;
  for (const auto& [id, adj] : adjacency) {
    if (!selected.contains(id)) {
      toRemove.push_back(id);
    }
  }

  for (const NodeId& id : toRemove) {
    const Adjacency adj = subset.adjacency.at(id);
    for (const NodeId& parent : adj.parents) {
      for (const NodeId& child : adj.children) {
        if (parent != child) {
          subset.addEdge(parent, child);
        }
      }
    }
    subset.removeNode(id);
  }
  return subset;
}

rs::Result<std::vector<std::vector<NodeId>>>
Graph::topologicalGenerations() const noexcept {
  std::unordered_map<NodeId, std::size_t> inDegree;
  std::vector<NodeId> current;
  for (const auto& [id, adj] : adjacency) {
    inDegree.emplace(id, adj.parents.size());
    if (adj.parents.empty()) {
      current.push_back(id);
    }
  }

  std::vector<std::vector<NodeId>> generations;
  std::size_t visited = 0;
  while (!current.empty()) {
    std::ranges::sort(current);
    std::vector<NodeId> next;
    for (const NodeId& id : current) {
      for (const NodeId& child : adjacency.at(id).children) {
        if (--inDegree.at(child) == 0) {
          next.push_back(child);
        }
      }
    }
    visited += current.size();
    generations.push_back(std::move(current));
    current = std::move(next);
  }

  if (visited != adjacency.size()) {
    std::vector<NodeId> cyclic;
    for (const auto& [id, degree] : inDegree) {
      if (degree > 0) {
        cyclic.push_back(id);
      }
    }
    std::ranges::sort(cyclic);
    rs_bail("found a cycle involving: {}", fmt::join(cyclic, ", "));
  }
  return rs::Ok(std::move(generations));
}

} // namespace nodesel

#ifdef NODESEL_TEST

#  include <rs/tests.hpp>

namespace tests {

using namespace nodesel; // NOLINT(build/namespaces,google-build-using-namespace)

// a -> b -> c -> d, plus x -> c and b -> t
static Graph makeChain() {
  Graph graph;
  graph.addEdge("a", "b");
  graph.addEdge("b", "c");
  graph.addEdge("c", "d");
  graph.addEdge("x", "c");
  graph.addEdge("b", "t");
  graph.addNode("lonely");
  return graph;
}

static void testFromManifest() {
  Manifest manifest;
  assertTrue(
      manifest.add(SourceDefinition{ .uniqueId = "source.raw", .name = "raw" })
          .is_ok());
  assertTrue(manifest
                 .add(ManifestNode{ .uniqueId = "model.a",
                                    .name = "a",
                                    .dependsOn = { "source.raw" } })
                 .is_ok());
  const Graph graph = Graph::fromManifest(manifest).unwrap();
  assertEq(graph.size(), 2UL);
  assertTrue(graph.childrenOf("source.raw").contains("model.a"));
  assertTrue(graph.parentsOf("model.a").contains("source.raw"));

  assertTrue(manifest
                 .add(ManifestNode{ .uniqueId = "model.b",
                                    .name = "b",
                                    .dependsOn = { "model.missing" } })
                 .is_ok());
  assertEq(Graph::fromManifest(manifest).unwrap_err()->what(),
           "`model.b` depends on `model.missing`, which is not in the "
           "manifest");

  pass();
}

static void testSubgraph() {
  const Graph graph = makeChain();
  const Graph sub = graph.subgraph({ "a", "b", "d", "unknown" });
  assertEq(sub.size(), 3UL);
  assertTrue(sub.childrenOf("a").contains("b"));
  assertTrue(sub.childrenOf("b").empty());
  assertTrue(sub.parentsOf("d").empty());

  // The original graph is left alone.
  assertEq(graph.size(), 7UL);
  assertTrue(graph.childrenOf("b").contains("c"));

  pass();
}

static void testSelectParents() {
  const Graph graph = makeChain();
  assertEq(graph.selectParents({ "d" }), NodeSet{ "a", "b", "c", "x" });
  assertEq(graph.selectParents({ "d" }, 1), NodeSet{ "c" });
  assertEq(graph.selectParents({ "d" }, 2), NodeSet{ "b", "c", "x" });
  assertTrue(graph.selectParents({ "d" }, 0).empty());
  assertTrue(graph.selectParents({ "a" }).empty());

  pass();
}

static void testSelectChildren() {
  const Graph graph = makeChain();
  assertEq(graph.selectChildren({ "a" }), NodeSet{ "b", "c", "d", "t" });
  assertEq(graph.selectChildren({ "a" }, 1), NodeSet{ "b" });
  assertEq(graph.selectChildren({ "a", "x" }, 1), NodeSet{ "b", "c" });
  assertTrue(graph.selectChildren({ "lonely" }).empty());

  pass();
}

static void testSelectChildrensParents() {
  const Graph graph = makeChain();
  // t hangs off b but is not upstream of x's descendants.
  assertEq(graph.selectChildrensParents({ "x" }),
           NodeSet{ "a", "b", "c", "d", "x" });
  assertEq(graph.selectChildrensParents({ "t" }), NodeSet{ "a", "b", "t" });

  pass();
}

static void testSelectSuccessors() {
  const Graph graph = makeChain();
  assertEq(graph.selectSuccessors({ "b" }), NodeSet{ "c", "t" });
  assertEq(graph.selectSuccessors({ "a", "c" }), NodeSet{ "b", "d" });
  assertTrue(graph.selectSuccessors({ "unknown" }).empty());

  pass();
}

static void testGetSubsetGraph() {
  const Graph graph = makeChain();
  const Graph subset = graph.getSubsetGraph({ "a", "d", "t" });
  assertEq(subset.size(), 3UL);
  // b and c were dropped; a still runs before d and t.
  assertEq(subset.childrenOf("a"), NodeSet{ "d", "t" });
  assertEq(subset.parentsOf("d"), NodeSet{ "a" });
  assertTrue(subset.childrenOf("t").empty());

  pass();
}

static void testTopologicalGenerations() {
  const Graph graph = makeChain();
  const auto generations = graph.topologicalGenerations().unwrap();
  assertEq(generations.size(), 4UL);
  assertEq(generations[0], std::vector<NodeId>{ "a", "lonely", "x" });
  assertEq(generations[1], std::vector<NodeId>{ "b" });
  assertEq(generations[2], std::vector<NodeId>{ "c", "t" });
  assertEq(generations[3], std::vector<NodeId>{ "d" });

  Graph cyclic;
  cyclic.addEdge("p", "q");
  cyclic.addEdge("q", "p");
  cyclic.addNode("r");
  assertEq(cyclic.topologicalGenerations().unwrap_err()->what(),
           "found a cycle involving: p, q");

  pass();
}

} // namespace tests

int main() {
  tests::testFromManifest();
  tests::testSubgraph();
  tests::testSelectParents();
  tests::testSelectChildren();
  tests::testSelectChildrensParents();
  tests::testSelectSuccessors();
  tests::testGetSubsetGraph();
  tests::testTopologicalGenerations();
}

#endif
