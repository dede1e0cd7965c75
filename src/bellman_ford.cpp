#include "path.hpp"
#include "pathfinder.hpp"
#include <chrono>
#include <deque>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace {

// Every node that can appear in a relaxation: adjacency keys, every edge
// target (destination-only nodes included) and both endpoints.
std::vector<NodeID> relaxableNodes(const Graph &graph, NodeID start,
                                   NodeID goal) {
  std::set<NodeID> ids;
  for (const auto &entry : graph.GetAdjacency()) {
    ids.insert(entry.first);
    for (const auto &edge : entry.second)
      ids.insert(edge.to);
  }
  ids.insert(start);
  ids.insert(goal);
  return std::vector<NodeID>(ids.begin(), ids.end());
}

// Breadth-first search from every source at once.
bool canReachGoal(const Graph &graph, const std::set<NodeID> &sources,
                  NodeID goal) {
  std::unordered_set<NodeID> visited;
  std::deque<NodeID> queue(sources.begin(), sources.end());

  while (!queue.empty()) {
    NodeID u = queue.front();
    queue.pop_front();
    if (!visited.insert(u).second)
      continue;
    if (u == goal)
      return true;
    for (const auto &edge : graph.OutgoingEdges(u)) {
      if (!visited.count(edge.to))
        queue.push_back(edge.to);
    }
  }
  return false;
}

} // namespace

RunResult Pathfinder::BellmanFord(const Graph &graph, NodeID start,
                                  NodeID goal, WeightFn weight) {
  auto t0 = std::chrono::steady_clock::now();

  RunResult result;
  result.algorithm = Algorithm::BellmanFord;

  const std::vector<NodeID> nodes = relaxableNodes(graph, start, goal);
  const std::int64_t maxPasses = static_cast<std::int64_t>(nodes.size()) - 1;

  std::unordered_map<NodeID, Weight> dist;
  for (NodeID id : nodes)
    dist[id] = INF;
  dist[start] = 0.0;
  PredecessorMap parent;

  // --- Relaxation Passes ---
  bool converged = false;
  for (std::int64_t pass = 0; pass < maxPasses; ++pass) {
    result.explored_or_iterations++;
    bool anyRelaxed = false;
    for (NodeID u : nodes) {
      Weight du = dist[u];
      if (du == INF)
        continue;
      for (const auto &edge : graph.OutgoingEdges(u)) {
        result.edges_scanned++;
        Weight candidate = du + weight(edge);
        if (candidate < dist[edge.to]) {
          dist[edge.to] = candidate;
          parent[edge.to] = u;
          anyRelaxed = true;
          result.relaxations_done++;
        }
      }
    }
    if (!anyRelaxed) {
      converged = true;
      break;
    }
  }

  // --- Negative Cycle Detection ---
  // Only needed when every pass still relaxed something.
  if (!converged) {
    std::set<NodeID> affected;
    for (NodeID u : nodes) {
      Weight du = dist[u];
      if (du == INF)
        continue;
      for (const auto &edge : graph.OutgoingEdges(u)) {
        result.edges_scanned++;
        if (du + weight(edge) < dist[edge.to])
          affected.insert(edge.to);
      }
    }
    if (!affected.empty()) {
      result.negative_cycle = true;
      result.goal_affected_by_neg_cycle = canReachGoal(graph, affected, goal);
    }
  }

  if (start == goal) {
    // The empty route costs nothing even when start lies on a negative cycle.
    result.path = {start};
    result.total = 0.0;
  } else if (dist[goal] != INF) {
    // A predecessor chain broken by a negative cycle yields no path.
    result.path = reconstructPath(parent, start, goal);
    result.total = result.path.empty() ? INF : dist[goal];
  } else {
    result.total = INF;
  }

  result.runtime_sec =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - t0)
          .count();
  return result;
}
