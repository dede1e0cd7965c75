// tests/test_graphs.hpp
#ifndef TEST_GRAPHS_HPP
#define TEST_GRAPHS_HPP

#include "geodesic.hpp"
#include "graph.hpp"

#include <random>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace testing_graphs {

struct CityRow {
  NodeID id;
  std::string name;
  double lat;
  double lon;
};

struct EdgeRow {
  NodeID u;
  NodeID v;
  double distance_km;
  double travel_time_min;
};

inline CsvTable cityTable(const std::vector<CityRow> &rows) {
  CsvTable table;
  table.source = "cities";
  table.header = {"id", "name_en", "latitude", "longitude"};
  for (const auto &r : rows) {
    table.rows.push_back({std::to_string(r.id), r.name, std::to_string(r.lat),
                          std::to_string(r.lon)});
  }
  return table;
}

inline CsvTable edgeTable(const std::vector<EdgeRow> &rows) {
  CsvTable table;
  table.source = "edges";
  table.header = {"source_id", "target_id", "distance_km", "travel_time_min"};
  for (const auto &r : rows) {
    table.rows.push_back({std::to_string(r.u), std::to_string(r.v),
                          std::to_string(r.distance_km),
                          std::to_string(r.travel_time_min)});
  }
  return table;
}

// Directed graph straight from node/edge lists, no construction policy.
inline Graph directedGraph(const std::vector<CityRow> &cities,
                           const std::vector<EdgeRow> &edges) {
  NodeMap nodes;
  for (const auto &c : cities)
    nodes[c.id] = Node{c.id, c.name, c.lat, c.lon};
  AdjacencyMap adjacency;
  for (const auto &e : edges)
    adjacency[e.u].push_back({e.v, e.distance_km, e.travel_time_min});
  return Graph(std::move(nodes), std::move(adjacency));
}

// Nodes 1:(0,0), 2:(0,1), 3:(0,2); roads 1-2 and 2-3, both (1.0 km, 2.0 min).
inline Graph lineGraph() {
  GraphOptions options;
  options.symmetrize = true;
  return Graph::Build(cityTable({{1, "A", 0.0, 0.0},
                                 {2, "B", 0.0, 1.0},
                                 {3, "C", 0.0, 2.0}}),
                      edgeTable({{1, 2, 1.0, 2.0}, {2, 3, 1.0, 2.0}}),
                      options);
}

// Random cities around Sri Lanka joined by roads at least as long as the
// geodesic between their ends and no faster than 70 km/h, so both A*
// heuristics stay admissible and consistent. Node 0 is left isolated.
inline Graph randomRoadNetwork(unsigned seed, int cityCount, int extraRoads,
                               bool symmetrize) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<double> latDist(6.0, 9.8);
  std::uniform_real_distribution<double> lonDist(79.7, 81.9);
  std::uniform_real_distribution<double> detour(1.01, 1.6);
  std::uniform_real_distribution<double> speed(25.0, 70.0);
  std::uniform_int_distribution<int> pick(1, cityCount - 1);

  std::vector<CityRow> cities;
  for (int i = 0; i < cityCount; ++i)
    cities.push_back({i, "City" + std::to_string(i), latDist(rng), lonDist(rng)});

  auto road = [&](int u, int v) {
    double km = geodesicKm(cities[u].lat, cities[u].lon, cities[v].lat,
                           cities[v].lon) *
                detour(rng);
    double minutes = km / speed(rng) * 60.0;
    return EdgeRow{u, v, km, minutes};
  };

  std::vector<EdgeRow> edges;
  // Chain keeps 1..n-1 connected.
  for (int i = 2; i < cityCount; ++i)
    edges.push_back(road(i - 1, i));
  for (int k = 0; k < extraRoads; ++k) {
    int u = pick(rng);
    int v = pick(rng);
    if (u != v)
      edges.push_back(road(u, v));
  }

  GraphOptions options;
  options.symmetrize = symmetrize;
  return Graph::Build(cityTable(cities), edgeTable(edges), options);
}

// Sum of the chosen weight along consecutive path hops; -1 if a hop has no
// edge.
inline double pathWeight(const Graph &graph, const std::vector<NodeID> &path,
                         WeightFn weight) {
  double total = 0.0;
  for (size_t i = 1; i < path.size(); ++i) {
    const Edge *best = nullptr;
    for (const auto &edge : graph.OutgoingEdges(path[i - 1])) {
      if (edge.to == path[i] && (!best || weight(edge) < weight(*best)))
        best = &edge;
    }
    if (!best)
      return -1.0;
    total += weight(*best);
  }
  return total;
}

} // namespace testing_graphs

#endif // TEST_GRAPHS_HPP
