#ifndef PATHFINDER_HPP
#define PATHFINDER_HPP

#include "graph.hpp"
#include "heuristics.hpp"
#include <string>
#include <vector>

// Single-source, single-target shortest path engines. Every call owns its
// working state and only reads the graph, so concurrent calls on one
// graph are safe.
class Pathfinder {
public:
  // Lazy-deletion Dijkstra. Weights must be non-negative.
  static RunResult Dijkstra(const Graph &graph, NodeID start, NodeID goal,
                            WeightFn weight);

  // Dijkstra ordered by g + h, with h chosen by the weight dimension.
  // Throws InvalidParameter before searching if the dimension is unknown or
  // the time heuristic gets max_kmh <= 0.
  static RunResult AStar(const Graph &graph, NodeID start, NodeID goal,
                         WeightDimension dimension,
                         const HeuristicOptions &options = HeuristicOptions());

  // Tolerates negative weights; reports negative cycles in-band.
  static RunResult BellmanFord(const Graph &graph, NodeID start, NodeID goal,
                               WeightFn weight);

  static RunResult Run(Algorithm algorithm, const Graph &graph, NodeID start,
                       NodeID goal, WeightDimension dimension,
                       const HeuristicOptions &options = HeuristicOptions());

  // Resolves both endpoints (NotFound on failure), then runs A*, Dijkstra
  // and Bellman-Ford in that order against the same graph.
  static std::vector<RunResult>
  RunAll(const Graph &graph, NodeID start, NodeID goal,
         WeightDimension dimension,
         const HeuristicOptions &options = HeuristicOptions());
  static std::vector<RunResult>
  RunAll(const Graph &graph, const std::string &start,
         const std::string &goal, WeightDimension dimension,
         const HeuristicOptions &options = HeuristicOptions());
};

#endif // PATHFINDER_HPP
