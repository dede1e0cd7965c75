#include "pathfinder.hpp"
#include "errors.hpp"
#include "path.hpp"
#include <chrono>
#include <functional>
#include <queue>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace {

// --- Search State ---
// Ties on the key go to the smaller node id so runs are reproducible.
struct State {
  Weight key; // g for Dijkstra, g + h for A*
  NodeID u;
  Weight g_score;

  bool operator>(const State &other) const {
    if (key != other.key)
      return key > other.key;
    return u > other.u;
  }
};

double elapsedSeconds(std::chrono::steady_clock::time_point t0) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0)
      .count();
}

Weight scoreOf(const std::unordered_map<NodeID, Weight> &g, NodeID u) {
  auto it = g.find(u);
  return it == g.end() ? INF : it->second;
}

// Shared body of Dijkstra and A*; a zero heuristic gives plain Dijkstra.
template <typename Heuristic>
RunResult bestFirstSearch(Algorithm algorithm, const Graph &graph,
                          NodeID start, NodeID goal, WeightFn weight,
                          Heuristic &&heuristic) {
  auto t0 = std::chrono::steady_clock::now();

  RunResult result;
  result.algorithm = algorithm;

  std::unordered_map<NodeID, Weight> g;
  std::unordered_set<NodeID> closed;
  PredecessorMap parent;
  std::priority_queue<State, std::vector<State>, std::greater<State>> pq;

  g[start] = 0;
  pq.push({heuristic(start), start, 0});

  while (!pq.empty()) {
    State top = pq.top();
    pq.pop();
    result.explored_or_iterations++;

    if (closed.count(top.u))
      continue;
    // Stale entry: a cheaper path was recorded after this push.
    if (top.g_score > scoreOf(g, top.u))
      continue;

    closed.insert(top.u);

    if (top.u == goal) {
      result.path = reconstructPath(parent, start, goal);
      result.total = result.path.empty() ? INF : top.g_score;
      result.runtime_sec = elapsedSeconds(t0);
      return result;
    }

    for (const auto &edge : graph.OutgoingEdges(top.u)) {
      result.edges_scanned++;
      if (closed.count(edge.to))
        continue;

      Weight newG = top.g_score + weight(edge);
      if (newG < scoreOf(g, edge.to)) {
        g[edge.to] = newG;
        parent[edge.to] = top.u;
        result.relaxations_done++;
        pq.push({newG + heuristic(edge.to), edge.to, newG});
      }
    }
  }

  // Queue exhausted without settling the goal.
  result.total = INF;
  result.runtime_sec = elapsedSeconds(t0);
  return result;
}

} // namespace

RunResult Pathfinder::Dijkstra(const Graph &graph, NodeID start, NodeID goal,
                               WeightFn weight) {
  return bestFirstSearch(Algorithm::Dijkstra, graph, start, goal, weight,
                         [](NodeID) { return 0.0; });
}

RunResult Pathfinder::AStar(const Graph &graph, NodeID start, NodeID goal,
                            WeightDimension dimension,
                            const HeuristicOptions &options) {
  WeightFn weight = weightAccessor(dimension);
  HeuristicProvider heuristic(graph.GetNodes(), goal, dimension, options);
  return bestFirstSearch(Algorithm::AStar, graph, start, goal, weight,
                         [&heuristic](NodeID u) { return heuristic(u); });
}

RunResult Pathfinder::Run(Algorithm algorithm, const Graph &graph,
                          NodeID start, NodeID goal, WeightDimension dimension,
                          const HeuristicOptions &options) {
  switch (algorithm) {
  case Algorithm::AStar:
    return AStar(graph, start, goal, dimension, options);
  case Algorithm::Dijkstra:
    return Dijkstra(graph, start, goal, weightAccessor(dimension));
  case Algorithm::BellmanFord:
    return BellmanFord(graph, start, goal, weightAccessor(dimension));
  }
  throw InvalidParameter("unrecognized algorithm " +
                         std::to_string(static_cast<int>(algorithm)));
}

std::vector<RunResult> Pathfinder::RunAll(const Graph &graph, NodeID start,
                                          NodeID goal,
                                          WeightDimension dimension,
                                          const HeuristicOptions &options) {
  NodeID startId = resolveId(start, graph.GetNodes());
  NodeID goalId = resolveId(goal, graph.GetNodes());
  // Fail on a bad dimension before any engine runs.
  weightAccessor(dimension);

  std::vector<RunResult> results;
  for (Algorithm algorithm :
       {Algorithm::AStar, Algorithm::Dijkstra, Algorithm::BellmanFord}) {
    results.push_back(
        Run(algorithm, graph, startId, goalId, dimension, options));
  }
  return results;
}

std::vector<RunResult> Pathfinder::RunAll(const Graph &graph,
                                          const std::string &start,
                                          const std::string &goal,
                                          WeightDimension dimension,
                                          const HeuristicOptions &options) {
  NodeID startId = resolveQuery(start, graph.GetNodes());
  NodeID goalId = resolveQuery(goal, graph.GetNodes());
  return RunAll(graph, startId, goalId, dimension, options);
}
