#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

// --- Core Type Aliases ---
using NodeID = int;
using Weight = double;

// --- Constants ---
const double INF = std::numeric_limits<double>::infinity();
const double PI = 3.14159265358979323846;

// WGS84 ellipsoid
const double WGS84_A = 6378137.0;               // semi-major axis (m)
const double WGS84_F = 1.0 / 298.257223563;     // flattening
const double WGS84_B = (1.0 - WGS84_F) * WGS84_A; // semi-minor axis (m)
const double R_EARTH_MEAN = 6371008.8;          // mean radius (m)

// A* time heuristic: fastest effective road speed assumed
const double DEFAULT_MAX_KMH = 70.0;

// --- Weight Dimensions ---
enum class WeightDimension { Distance, Time };

// --- Algorithms ---
enum class Algorithm { AStar, Dijkstra, BellmanFord };

inline std::string algorithmToString(Algorithm algorithm) {
  switch (algorithm) {
  case Algorithm::AStar:
    return "A*";
  case Algorithm::Dijkstra:
    return "Dijkstra";
  case Algorithm::BellmanFord:
    return "Bellman-Ford";
  }
  return "unknown";
}

// --- Graph Structures ---
struct Edge {
  NodeID to;
  Weight distance_km;
  Weight travel_time_min;
};

struct Node {
  NodeID id;
  std::string name;
  double lat;
  double lon;
};

// Ordered maps keep every traversal deterministic.
using NodeMap = std::map<NodeID, Node>;
using AdjacencyMap = std::map<NodeID, std::vector<Edge>>;

// --- Output Structures ---
struct RunResult {
  Algorithm algorithm = Algorithm::Dijkstra;
  std::vector<NodeID> path; // empty if unreachable
  double total = INF;
  double runtime_sec = 0.0;
  // Pops for A*/Dijkstra, relaxation passes for Bellman-Ford.
  std::int64_t explored_or_iterations = 0;
  std::int64_t relaxations_done = 0;
  std::int64_t edges_scanned = 0;
  bool negative_cycle = false;
  bool goal_affected_by_neg_cycle = false;

  bool found() const { return !path.empty(); }
};

#endif // TYPES_HPP
