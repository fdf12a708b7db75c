#pragma once

#include "Graph/Graph.hpp"
#include "Manifest.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <queue>
#include <rs/result.hpp>
#include <tbb/spin_mutex.h>
#include <unordered_map>
#include <utility>
#include <vector>

namespace nodesel {

// Hands out selected nodes once all of their parents in the graph are done.
// Workers may call get() and markDone() concurrently.
class GraphQueue {
  struct Passkey {
    explicit Passkey() = default;
  };

public:
  static rs::Result<std::unique_ptr<GraphQueue>> create(Graph graph,
                                                        NodeSet selected);

  // Only create() can pass a Passkey.
  GraphQueue(Passkey, Graph graph, NodeSet selected,
             std::unordered_map<NodeId, std::size_t> scores);

  GraphQueue(const GraphQueue&) = delete;
  GraphQueue& operator=(const GraphQueue&) = delete;

  // Next ready node, lowest topological level first. Returns std::nullopt
  // when nothing is ready right now.
  std::optional<NodeId> get();
  rs::Result<void> markDone(const NodeId& id);

  // Nodes that are not done yet, including the ones handed out.
  std::size_t size() const;
  bool empty() const { return size() == 0; }

  const Graph& graph() const noexcept { return graph_; }
  const NodeSet& selected() const noexcept { return selected_; }

private:
  using Entry = std::pair<std::size_t, NodeId>;

  void pushReady(const NodeId& id);

  const Graph graph_;
  const NodeSet selected_;
  const std::unordered_map<NodeId, std::size_t> scores;

  mutable tbb::spin_mutex mtx;
  std::priority_queue<Entry, std::vector<Entry>, std::greater<>> ready;
  std::unordered_map<NodeId, std::size_t> pendingParents;
  NodeSet inProgress;
  std::size_t remaining = 0;
};

} // namespace nodesel
