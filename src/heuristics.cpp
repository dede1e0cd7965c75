#include "heuristics.hpp"
#include "errors.hpp"
#include "geodesic.hpp"
#include <string>

HeuristicProvider::HeuristicProvider(const NodeMap &nodes, NodeID goal,
                                     WeightDimension dimension,
                                     const HeuristicOptions &options)
    : nodes_(nodes), dimension_(dimension) {
  switch (dimension) {
  case WeightDimension::Distance:
    break;
  case WeightDimension::Time:
    if (!(options.max_kmh > 0))
      throw InvalidParameter("max_kmh must be > 0 (got " +
                             std::to_string(options.max_kmh) + ")");
    kmPerMin_ = options.max_kmh / 60.0;
    break;
  default:
    throw InvalidParameter("weight dimension must be distance_km or "
                           "travel_time_min");
  }

  auto it = nodes_.find(goal);
  if (it != nodes_.end()) {
    hasGoal_ = true;
    goalLat_ = it->second.lat;
    goalLon_ = it->second.lon;
  }
}

double HeuristicProvider::operator()(NodeID node) {
  auto it = cache_.find(node);
  if (it != cache_.end())
    return it->second;
  double h = estimate(node);
  cache_.emplace(node, h);
  return h;
}

double HeuristicProvider::estimate(NodeID node) const {
  if (!hasGoal_)
    return 0.0;
  auto it = nodes_.find(node);
  if (it == nodes_.end())
    return 0.0;

  double km = geodesicKm(it->second.lat, it->second.lon, goalLat_, goalLon_);
  if (dimension_ == WeightDimension::Time)
    return km / kmPerMin_;
  return km;
}

double nodeDistanceKm(NodeID a, NodeID b, const NodeMap &nodes) {
  auto ia = nodes.find(a);
  auto ib = nodes.find(b);
  if (ia == nodes.end())
    throw NotFound("City id " + std::to_string(a) + " not found.");
  if (ib == nodes.end())
    throw NotFound("City id " + std::to_string(b) + " not found.");
  return geodesicKm(ia->second.lat, ia->second.lon, ib->second.lat,
                    ib->second.lon);
}
