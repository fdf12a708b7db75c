#pragma once

#include "Manifest.hpp"

#include <cstddef>
#include <optional>
#include <rs/result.hpp>
#include <unordered_map>
#include <vector>

namespace nodesel {

// Directed dependency graph over node ids. Edges point from a parent to the
// nodes that depend on it. Selection only reads from a graph; the mutating
// members are used while building one.
class Graph {
public:
  Graph() = default;

  static rs::Result<Graph> fromManifest(const Manifest& manifest) noexcept;

  void addNode(const NodeId& id);
  void addEdge(const NodeId& parent, const NodeId& child);

  NodeSet nodes() const;
  std::size_t size() const noexcept { return adjacency.size(); }
  bool contains(const NodeId& id) const noexcept {
    return adjacency.contains(id);
  }

  const NodeSet& parentsOf(const NodeId& id) const;
  const NodeSet& childrenOf(const NodeId& id) const;

  // Graph induced by `ids`: exactly those nodes and the edges among them.
  Graph subgraph(const NodeSet& ids) const;

  // Nodes reachable backwards from `id` in at most `maxDepth` hops.
  NodeSet ancestors(const NodeId& id,
                    std::optional<std::size_t> maxDepth = std::nullopt) const;
  // Nodes reachable forwards from `id` in at most `maxDepth` hops.
  NodeSet descendants(const NodeId& id,
                      std::optional<std::size_t> maxDepth = std::nullopt) const;

  NodeSet selectParents(const NodeSet& selected,
                        std::optional<std::size_t> maxDepth = std::nullopt) const;
  NodeSet
  selectChildren(const NodeSet& selected,
                 std::optional<std::size_t> maxDepth = std::nullopt) const;
  // The `@` relation: everything downstream of `selected` (and `selected`
  // itself) together with all of their ancestors.
  NodeSet selectChildrensParents(const NodeSet& selected) const;
  // Direct children of `selected`.
  NodeSet selectSuccessors(const NodeSet& selected) const;

  // Keeps only `selected`, but when a dropped node sat between two kept
  // nodes the kept nodes get a direct edge so their ordering survives.
  Graph getSubsetGraph(const NodeSet& selected) const;

  // Nodes grouped by topological level; level 0 has no parents. Fails on a
  // cycle.
  rs::Result<std::vector<std::vector<NodeId>>>
  topologicalGenerations() const noexcept;

private:
  struct Adjacency {
    NodeSet parents;
    NodeSet children;
  };

  NodeSet traverse(const NodeId& start, std::optional<std::size_t> maxDepth,
                   bool forward) const;
  void removeNode(const NodeId& id);

  std::unordered_map<NodeId, Adjacency> adjacency;
};

} // namespace nodesel
