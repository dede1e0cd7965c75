#ifndef GRAPH_HPP
#define GRAPH_HPP

#include "csv.hpp"
#include "types.hpp"
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// --- Construction Options ---
struct GraphOptions {
  bool symmetrize = true;      // insert every kept edge in both directions
  bool drop_self_loops = true;
  bool keep_best_edge = true;  // collapse duplicate (source, target) pairs
};

struct GraphBuildStats {
  std::size_t cities = 0;
  std::size_t edge_rows = 0;
  std::size_t dropped_unknown_endpoint = 0;
  std::size_t dropped_self_loop = 0;
  std::size_t collapsed_duplicates = 0;
  std::size_t directed_edges = 0;
};

// --- Weight Accessors ---
using WeightFn = double (*)(const Edge &);

// Throws InvalidParameter for a value outside the enum.
WeightFn weightAccessor(WeightDimension dimension);

// "distance_km" | "travel_time_min"; throws InvalidParameter otherwise.
WeightDimension weightDimensionFromKey(const std::string &key);
std::string weightDimensionKey(WeightDimension dimension);

// Immutable road network: city nodes plus per-source outgoing edges.
// Safe to share across threads once built.
class Graph {
public:
  Graph() = default;
  Graph(NodeMap nodes, AdjacencyMap adjacency);

  // Required columns: cities {id, name_en, latitude, longitude},
  // edges {source_id, target_id, distance_km, travel_time_min}.
  // Edges with unknown endpoints are dropped silently.
  static Graph Build(const CsvTable &cityRows, const CsvTable &edgeRows,
                     const GraphOptions &options = GraphOptions(),
                     GraphBuildStats *stats = nullptr);

  const Node *GetNode(NodeID id) const;
  const NodeMap &GetNodes() const { return nodes_; }
  const AdjacencyMap &GetAdjacency() const { return adjacency_; }

  // Empty for ids with no outgoing edges.
  const std::vector<Edge> &OutgoingEdges(NodeID id) const;

  std::size_t NodeCount() const { return nodes_.size(); }
  std::size_t EdgeCount() const { return edgeCount_; }

private:
  NodeMap nodes_;
  AdjacencyMap adjacency_;
  std::size_t edgeCount_ = 0;
};

Graph buildGraph(const CsvTable &cityRows, const CsvTable &edgeRows,
                 const GraphOptions &options = GraphOptions());

// Reads <folderPath>/cities.csv and <folderPath>/edges.csv.
Graph loadGraph(const std::string &folderPath,
                const GraphOptions &options = GraphOptions());

// --- Identifier Resolution (throw NotFound) ---
NodeID resolveId(NodeID id, const NodeMap &nodes);
NodeID resolveId(const std::string &name, const NodeMap &nodes);
// All-digit queries are ids, anything else is an exact city name.
NodeID resolveQuery(const std::string &query, const NodeMap &nodes);

// --- City Listing ---
std::vector<std::pair<NodeID, std::string>> cityList(const NodeMap &nodes);
std::string cityLabel(NodeID id, const NodeMap &nodes);

// --- Path Totals ---
struct PathTotals {
  double distance_km = 0.0;
  double travel_time_min = 0.0;
};

// Sums both weight fields along a path. A hop without a forward edge falls
// back to the reverse edge; hops with neither contribute nothing.
PathTotals pathTotals(const std::vector<NodeID> &path,
                      const AdjacencyMap &adjacency);

#endif // GRAPH_HPP
