#include "Graph/GraphQueue.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <unordered_map>
#include <utility>
#include <vector>

namespace nodesel {

rs::Result<std::unique_ptr<GraphQueue>> GraphQueue::create(Graph graph,
                                                           NodeSet selected) {
  for (const NodeId& id : graph.nodes()) {
    rs_ensure(selected.contains(id),
              "graph queue node `{}` is not part of the selection", id);
  }

  std::unordered_map<NodeId, std::size_t> scores;
  const auto generations = rs_try(graph.topologicalGenerations());
  for (std::size_t level = 0; level < generations.size(); ++level) {
    for (const NodeId& id : generations[level]) {
      scores.emplace(id, level);
    }
  }

  return rs::Ok(std::make_unique<GraphQueue>(Passkey{}, std::move(graph),
                                             std::move(selected),
                                             std::move(scores)));
}

GraphQueue::GraphQueue(Passkey, Graph graph, NodeSet selected,
                       std::unordered_map<NodeId, std::size_t> scores)
    : graph_(std::move(graph)), selected_(std::move(selected)),
      scores(std::move(scores)), remaining(graph_.size()) {
  for (const NodeId& id : graph_.nodes()) {
    const std::size_t numParents = graph_.parentsOf(id).size();
    if (numParents == 0) {
      pushReady(id);
    } else {
      pendingParents.emplace(id, numParents);
    }
  }
}

void GraphQueue::pushReady(const NodeId& id) {
  ready.emplace(scores.at(id), id);
}

std::optional<NodeId> GraphQueue::get() {
  const tbb::spin_mutex::scoped_lock lock(mtx);
  if (ready.empty()) {
    return std::nullopt;
  }
  NodeId id = ready.top().second;
  ready.pop();
  inProgress.insert(id);
  spdlog::trace("Dequeued {}", id);
  return id;
}

rs::Result<void> GraphQueue::markDone(const NodeId& id) {
  const tbb::spin_mutex::scoped_lock lock(mtx);
  rs_ensure(inProgress.erase(id) == 1, "`{}` was not taken from the queue",
            id);

  for (const NodeId& child : graph_.childrenOf(id)) {
    auto& pending = pendingParents.at(child);
    if (--pending == 0) {
      pendingParents.erase(child);
      pushReady(child);
    }
  }
  --remaining;
  return rs::Ok();
}

std::size_t GraphQueue::size() const {
  const tbb::spin_mutex::scoped_lock lock(mtx);
  return remaining;
}

} // namespace nodesel

#ifdef NODESEL_TEST

#  include <fmt/ranges.h>
#  include <rs/tests.hpp>
#  include <tbb/concurrent_vector.h>
#  include <tbb/parallel_for.h>

namespace tests {

using namespace nodesel; // NOLINT(build/namespaces,google-build-using-namespace)

static std::unique_ptr<GraphQueue> makeQueue() {
  // a -> b -> d, a -> c -> d, e
  Graph graph;
  graph.addEdge("a", "b");
  graph.addEdge("a", "c");
  graph.addEdge("b", "d");
  graph.addEdge("c", "d");
  graph.addNode("e");
  return GraphQueue::create(graph, graph.nodes()).unwrap();
}

static void testDrainInOrder() {
  auto queue = makeQueue();
  assertEq(queue->size(), 5UL);

  std::vector<NodeId> order;
  while (!queue->empty()) {
    const std::optional<NodeId> id = queue->get();
    assertTrue(id.has_value());
    order.push_back(*id);
    assertTrue(queue->markDone(*id).is_ok());
  }
  assertEq(order, std::vector<NodeId>{ "a", "e", "b", "c", "d" });

  pass();
}

static void testBlockedUntilParentsDone() {
  auto queue = makeQueue();
  assertEq(queue->get().value(), "a");
  assertEq(queue->get().value(), "e");
  // b and c wait on a.
  assertFalse(queue->get().has_value());

  assertTrue(queue->markDone("a").is_ok());
  assertEq(queue->get().value(), "b");
  assertEq(queue->get().value(), "c");
  assertTrue(queue->markDone("b").is_ok());
  // d still waits on c.
  assertFalse(queue->get().has_value());
  assertTrue(queue->markDone("c").is_ok());
  assertEq(queue->get().value(), "d");
  assertEq(queue->size(), 2UL);

  pass();
}

static void testMarkDoneTwice() {
  auto queue = makeQueue();
  const NodeId id = queue->get().value();
  assertTrue(queue->markDone(id).is_ok());
  assertEq(queue->markDone(id).unwrap_err()->what(),
           "`a` was not taken from the queue");

  pass();
}

static void testCreateErrors() {
  Graph graph;
  graph.addEdge("a", "b");
  assertEq(GraphQueue::create(graph, { "a" }).unwrap_err()->what(),
           "graph queue node `b` is not part of the selection");

  graph.addEdge("b", "a");
  assertEq(GraphQueue::create(graph, { "a", "b" }).unwrap_err()->what(),
           "found a cycle involving: a, b");

  pass();
}

static void testConcurrentWorkers() {
  Graph graph;
  for (int i = 0; i < 64; ++i) {
    graph.addEdge("root", fmt::format("leaf{}", i));
  }
  auto queue = GraphQueue::create(graph, graph.nodes()).unwrap();
  const NodeId root = queue->get().value();
  assertTrue(queue->markDone(root).is_ok());

  tbb::concurrent_vector<NodeId> done;
  tbb::parallel_for(0, 64, [&](int) {
    const std::optional<NodeId> id = queue->get();
    if (id.has_value() && queue->markDone(*id).is_ok()) {
      done.push_back(*id);
    }
  });

  assertEq(done.size(), 64UL);
  assertTrue(queue->empty());

  pass();
}

} // namespace tests

int main() {
  tests::testDrainInOrder();
  tests::testBlockedUntilParentsDone();
  tests::testMarkDoneTwice();
  tests::testCreateErrors();
  tests::testConcurrentWorkers();
}

#endif
