#pragma once

#include "Graph/Graph.hpp"
#include "Graph/GraphQueue.hpp"
#include "Manifest.hpp"
#include "Selector/SelectorMethods.hpp"
#include "Selector/SelectorSpec.hpp"

#include <functional>
#include <memory>
#include <rs/result.hpp>
#include <unordered_set>
#include <vector>

namespace nodesel {

// Decides whether a selected member survives the final filtering step.
using NodeMatcher = std::function<bool(const GraphMember&)>;

NodeMatcher matchAll();
// Matches members whose resource kind is one of `kinds`.
NodeMatcher resourceTypeMatcher(std::unordered_set<ResourceKind> kinds);

struct SelectionSets {
  NodeSet direct;
  NodeSet indirect;
};

struct SelectorOptions {
  // Turns "does not match any nodes" warnings into errors.
  bool warnError = false;
};

// Resolves a SelectionSpec against the graph. The selector works on the
// subgraph of enabled, non-empty members; `fullGraph` and `manifest` must
// outlive it.
class NodeSelector {
public:
  static rs::Result<NodeSelector> create(const Graph& fullGraph,
                                         const Manifest& manifest,
                                         NodeMatcher matcher = matchAll(),
                                         SelectorOptions options = {}) noexcept;

  const Graph& graph() const noexcept { return graph_; }

  rs::Result<NodeSet> selectIncluded(const NodeSet& included,
                                     const SelectionCriteria& criteria) const;

  // Matches the criterion, applies its `+` and `@` modifiers and expands the
  // result to the tests hanging off it. An unknown method selects nothing.
  rs::Result<SelectionSets>
  getNodesFromCriteria(const SelectionCriteria& criteria) const;

  NodeSet collectSpecifiedNeighbors(const SelectionCriteria& criteria,
                                    const NodeSet& selected) const;

  // Tests that depend on `selected` are selected directly when all of their
  // parents are selected (or when `greedy`), and indirectly otherwise.
  rs::Result<SelectionSets> expandSelection(const NodeSet& selected,
                                            bool greedy) const;

  // Promotes the indirect nodes whose parents are all in `direct`.
  rs::Result<NodeSet> incorporateIndirectNodes(const NodeSet& direct,
                                               const NodeSet& indirect) const;

  rs::Result<SelectionSets>
  selectNodesRecursively(const SelectionSpec& spec) const;

  // Unfiltered selection. `indirect` holds only nodes not in `direct`.
  rs::Result<SelectionSets> selectNodes(const SelectionSpec& spec) const;

  rs::Result<NodeSet> filterSelection(const NodeSet& selected) const;

  rs::Result<NodeSet> getSelected(const SelectionSpec& spec) const;

  rs::Result<std::unique_ptr<GraphQueue>>
  getGraphQueue(const SelectionSpec& spec) const;

private:
  NodeSelector(const Graph& fullGraph, Graph graph, const Manifest& manifest,
               NodeMatcher matcher, SelectorOptions options);

  rs::Result<const GraphMember*> lookup(const NodeId& id) const;
  rs::Result<bool> parentsSelected(const NodeId& id,
                                   const NodeSet& selected) const;
  rs::Result<void> alertNonExistence(const SelectionSpec& spec,
                                     const NodeSet& direct) const;
  rs::Result<void> alertUnusedNodes(const NodeSet& unused) const;

  const Graph& fullGraph;
  Graph graph_;
  const Manifest& manifest;
  MethodManager methods;
  NodeMatcher matcher;
  SelectorOptions options;
};

} // namespace nodesel
