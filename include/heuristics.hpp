#ifndef HEURISTICS_HPP
#define HEURISTICS_HPP

#include "types.hpp"
#include <cstddef>
#include <unordered_map>

struct HeuristicOptions {
  double max_kmh = DEFAULT_MAX_KMH; // time heuristic only, must be > 0
};

// Admissible A* lower bound towards a fixed goal.
//   Distance: geodesic km between node and goal.
//   Time:     geodesic km / max_kmh, in minutes.
// Values are memoized per node for the lifetime of the provider, which is
// owned by a single search. Nodes without coordinates estimate 0.
class HeuristicProvider {
public:
  // Throws InvalidParameter for an unknown dimension or max_kmh <= 0.
  HeuristicProvider(const NodeMap &nodes, NodeID goal,
                    WeightDimension dimension,
                    const HeuristicOptions &options = HeuristicOptions());

  double operator()(NodeID node);

  std::size_t CachedCount() const { return cache_.size(); }

private:
  double estimate(NodeID node) const;

  const NodeMap &nodes_;
  WeightDimension dimension_;
  double kmPerMin_ = 0.0;
  bool hasGoal_ = false;
  double goalLat_ = 0.0;
  double goalLon_ = 0.0;
  std::unordered_map<NodeID, double> cache_;
};

// Geodesic distance between two known nodes; throws NotFound otherwise.
double nodeDistanceKm(NodeID a, NodeID b, const NodeMap &nodes);

#endif // HEURISTICS_HPP
