// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// Topologically sorted traversal of the nodes of a directed graph whose nodes
// are the dense integers 0..num_nodes-1, and extraction of a cycle when the
// graph is not a DAG.
//
// AdjacencyLists is any type that lets you iterate over the successors of a
// node with the [] operator and has a size(), for example
// std::vector<std::vector<int>>. An arc a -> b means "a comes before b".
//
// EXAMPLES:
//   std::vector<std::vector<int>> adj = {{..}, {..}, ..};
//   ASSIGN_OR_RETURN(std::vector<int> topo_order, StableTopologicalSort(adj));
//
// or, to report a cycle to the user:
//   ASSIGN_OR_RETURN(std::vector<int> cycle, FindCycleInGraph(adj));

#ifndef GANTT_SOLVER_GRAPH_TOPOLOGICALSORTER_H_
#define GANTT_SOLVER_GRAPH_TOPOLOGICALSORTER_H_

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <queue>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"

namespace gantt_solver {
namespace graph {

// Returns the lexicographically minimal topological order of the nodes: among
// the nodes whose predecessors were all output, the smallest index always
// comes first. The result is thus deterministic and only depends on the
// numbering of the nodes.
//
// ERRORS: returns InvalidArgumentError if the input is broken (negative or
// out-of-bounds integers) or if the graph is cyclic. In the latter case, the
// error message will contain "cycle". Self-arcs are cycles.
template <class AdjacencyLists>
absl::StatusOr<std::vector<int>> StableTopologicalSort(
    const AdjacencyLists& adj);

// Finds a cycle in the directed graph given as argument.
// The returned cycle is a list of nodes that form a cycle, eg. {1, 4, 3}
// if the cycle 1->4->3->1 exists.
// If the graph is acyclic, returns an empty vector.
template <class AdjacencyLists>
absl::StatusOr<std::vector<int>> FindCycleInGraph(const AdjacencyLists& adj);

// Implementations.

template <class AdjacencyLists>
absl::StatusOr<std::vector<int>> StableTopologicalSort(
    const AdjacencyLists& adj) {
  const size_t num_nodes = adj.size();
  if (num_nodes > std::numeric_limits<int>::max()) {
    return absl::InvalidArgumentError("More than kint32max nodes");
  }
  std::vector<int> indegree(num_nodes, 0);
  for (int from = 0; from < static_cast<int>(num_nodes); ++from) {
    for (const int head : adj[from]) {
      // We cast to unsigned int to test "head < 0 || head >= num_nodes" with a
      // single test.
      if (static_cast<uint32_t>(head) >= num_nodes) {
        return absl::InvalidArgumentError(
            absl::StrFormat("Invalid arc in adj[%d]: %d (num_nodes=%d)", from,
                            head, num_nodes));
      }
      ++indegree[head];
    }
  }

  // We use greater<int> so that the lowest elements gets popped first.
  std::priority_queue<int, std::vector<int>, std::greater<int>>
      nodes_with_zero_indegree;
  for (int i = 0; i < static_cast<int>(num_nodes); ++i) {
    if (indegree[i] == 0) nodes_with_zero_indegree.push(i);
  }
  std::vector<int> topo_order;
  topo_order.reserve(num_nodes);
  while (!nodes_with_zero_indegree.empty()) {
    const int from = nodes_with_zero_indegree.top();
    nodes_with_zero_indegree.pop();
    topo_order.push_back(from);
    for (const int head : adj[from]) {
      if (--indegree[head] == 0) nodes_with_zero_indegree.push(head);
    }
  }
  if (topo_order.size() < num_nodes) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "The graph has a cycle: %d nodes out of %d could not be ordered",
        num_nodes - topo_order.size(), num_nodes));
  }
  return topo_order;
}

template <class AdjacencyLists>
absl::StatusOr<std::vector<int>> FindCycleInGraph(const AdjacencyLists& adj) {
  const size_t num_nodes = adj.size();
  if (num_nodes > std::numeric_limits<int>::max()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Too many nodes: adj.size()=%d", adj.size()));
  }

  // Iterative DFS. A node is kOnStack while it is on the current DFS path, and
  // kDone once all its descendants were explored without finding a cycle.
  enum NodeState : char { kUnvisited, kOnStack, kDone };
  std::vector<NodeState> state(num_nodes, kUnvisited);
  std::vector<int> parent(num_nodes, -1);
  // Pairs (node, index of the next successor to explore).
  std::vector<std::pair<int, size_t>> stack;
  for (int root = 0; root < static_cast<int>(num_nodes); ++root) {
    if (state[root] != kUnvisited) continue;
    state[root] = kOnStack;
    stack.push_back({root, 0});
    while (!stack.empty()) {
      const int node = stack.back().first;
      const size_t next = stack.back().second;
      if (next == adj[node].size()) {
        state[node] = kDone;
        stack.pop_back();
        continue;
      }
      ++stack.back().second;
      const int head = adj[node][next];
      if (static_cast<size_t>(head) >= num_nodes) {
        return absl::InvalidArgumentError(
            absl::StrFormat("Invalid arc in adj[%d]: %d", node, head));
      }
      if (state[head] == kOnStack) {
        // Walk back from node to head along the DFS path.
        std::vector<int> cycle;
        for (int n = node; n != head; n = parent[n]) cycle.push_back(n);
        cycle.push_back(head);
        std::reverse(cycle.begin(), cycle.end());
        return cycle;
      }
      if (state[head] == kUnvisited) {
        state[head] = kOnStack;
        parent[head] = node;
        stack.push_back({head, 0});
      }
    }
  }
  return std::vector<int>{};
}

}  // namespace graph
}  // namespace gantt_solver

#endif  // GANTT_SOLVER_GRAPH_TOPOLOGICALSORTER_H_
