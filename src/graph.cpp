#include "graph.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <tuple>

namespace {
const char *const CITY_COLUMNS[] = {"id", "name_en", "latitude", "longitude"};
const char *const EDGE_COLUMNS[] = {"source_id", "target_id", "distance_km",
                              "travel_time_min"};

double edgeDistance(const Edge &edge) { return edge.distance_km; }
double edgeTime(const Edge &edge) { return edge.travel_time_min; }

// Column indices for the required fields, in the order they were requested.
template <size_t N>
std::vector<int> requireColumns(const CsvTable &table,
                                const char *const (&names)[N]) {
  std::vector<int> indices;
  std::string missing;
  for (const char *name : names) {
    int idx = table.columnIndex(name);
    if (idx < 0)
      missing += (missing.empty() ? "" : ", ") + std::string(name);
    indices.push_back(idx);
  }
  if (!missing.empty())
    throw DataIntegrityError(table.source + ": missing required column(s): " +
                             missing);
  return indices;
}

const std::string &field(const CsvTable &table, size_t row, int col,
                         const char *name) {
  const auto &cols = table.rows[row];
  if (col >= (int)cols.size())
    throw DataIntegrityError(table.source + " row " + std::to_string(row + 1) +
                             ": missing value for " + name);
  return cols[col];
}

int parseInt(const CsvTable &table, size_t row, int col, const char *name) {
  const std::string &value = field(table, row, col, name);
  try {
    size_t pos = 0;
    int parsed = std::stoi(value, &pos);
    if (pos == value.size())
      return parsed;
  } catch (const std::invalid_argument &) {
    // reported below
  } catch (const std::out_of_range &) {
    // reported below
  }
  throw DataIntegrityError(table.source + " row " + std::to_string(row + 1) +
                           ": invalid " + name + " '" + value + "'");
}

double parseDouble(const CsvTable &table, size_t row, int col,
                   const char *name) {
  const std::string &value = field(table, row, col, name);
  try {
    size_t pos = 0;
    double parsed = std::stod(value, &pos);
    // stod accepts "nan" and "inf"; neither is a usable weight or coordinate.
    if (pos == value.size() && std::isfinite(parsed))
      return parsed;
  } catch (const std::invalid_argument &) {
    // reported below
  } catch (const std::out_of_range &) {
    // reported below
  }
  throw DataIntegrityError(table.source + " row " + std::to_string(row + 1) +
                           ": invalid " + name + " '" + value + "'");
}

struct EdgeRow {
  NodeID u;
  NodeID v;
  double distance_km;
  double travel_time_min;
};

const Edge *findEdge(const AdjacencyMap &adjacency, NodeID from, NodeID to) {
  auto it = adjacency.find(from);
  if (it == adjacency.end())
    return nullptr;
  for (const auto &edge : it->second) {
    if (edge.to == to)
      return &edge;
  }
  return nullptr;
}
} // namespace

// --- Weight Accessors ---

WeightFn weightAccessor(WeightDimension dimension) {
  switch (dimension) {
  case WeightDimension::Distance:
    return &edgeDistance;
  case WeightDimension::Time:
    return &edgeTime;
  }
  throw InvalidParameter("unrecognized weight dimension " +
                         std::to_string(static_cast<int>(dimension)));
}

WeightDimension weightDimensionFromKey(const std::string &key) {
  if (key == "distance_km")
    return WeightDimension::Distance;
  if (key == "travel_time_min")
    return WeightDimension::Time;
  throw InvalidParameter("Invalid weight '" + key +
                         "'. Choose one of: distance_km, travel_time_min");
}

std::string weightDimensionKey(WeightDimension dimension) {
  switch (dimension) {
  case WeightDimension::Distance:
    return "distance_km";
  case WeightDimension::Time:
    return "travel_time_min";
  }
  throw InvalidParameter("unrecognized weight dimension " +
                         std::to_string(static_cast<int>(dimension)));
}

// --- Graph Method Implementations ---

Graph::Graph(NodeMap nodes, AdjacencyMap adjacency)
    : nodes_(std::move(nodes)), adjacency_(std::move(adjacency)) {
  for (const auto &entry : adjacency_)
    edgeCount_ += entry.second.size();
}

Graph Graph::Build(const CsvTable &cityRows, const CsvTable &edgeRows,
                   const GraphOptions &options, GraphBuildStats *stats) {
  auto cityCols = requireColumns(cityRows, CITY_COLUMNS);
  auto edgeCols = requireColumns(edgeRows, EDGE_COLUMNS);

  GraphBuildStats local;
  NodeMap nodes;
  for (size_t r = 0; r < cityRows.rows.size(); ++r) {
    Node node;
    node.id = parseInt(cityRows, r, cityCols[0], "id");
    node.name = field(cityRows, r, cityCols[1], "name_en");
    node.lat = parseDouble(cityRows, r, cityCols[2], "latitude");
    node.lon = parseDouble(cityRows, r, cityCols[3], "longitude");
    nodes[node.id] = node;
  }
  local.cities = nodes.size();

  // Kept rows in first-seen order of their (source, target) pair.
  std::vector<EdgeRow> kept;
  std::map<std::pair<NodeID, NodeID>, size_t> pairIndex;

  for (size_t r = 0; r < edgeRows.rows.size(); ++r) {
    EdgeRow row;
    row.u = parseInt(edgeRows, r, edgeCols[0], "source_id");
    row.v = parseInt(edgeRows, r, edgeCols[1], "target_id");
    row.distance_km = parseDouble(edgeRows, r, edgeCols[2], "distance_km");
    row.travel_time_min =
        parseDouble(edgeRows, r, edgeCols[3], "travel_time_min");
    local.edge_rows++;

    if (!nodes.count(row.u) || !nodes.count(row.v)) {
      local.dropped_unknown_endpoint++;
      continue;
    }
    if (options.drop_self_loops && row.u == row.v) {
      local.dropped_self_loop++;
      continue;
    }
    if (!options.keep_best_edge) {
      kept.push_back(row);
      continue;
    }

    auto key = std::make_pair(row.u, row.v);
    auto it = pairIndex.find(key);
    if (it == pairIndex.end()) {
      pairIndex[key] = kept.size();
      kept.push_back(row);
      continue;
    }
    local.collapsed_duplicates++;
    EdgeRow &best = kept[it->second];
    if (std::tie(row.distance_km, row.travel_time_min) <
        std::tie(best.distance_km, best.travel_time_min)) {
      best.distance_km = row.distance_km;
      best.travel_time_min = row.travel_time_min;
    }
  }

  AdjacencyMap adjacency;
  for (const auto &row : kept) {
    adjacency[row.u].push_back({row.v, row.distance_km, row.travel_time_min});
    local.directed_edges++;
    if (options.symmetrize) {
      adjacency[row.v].push_back(
          {row.u, row.distance_km, row.travel_time_min});
      local.directed_edges++;
    }
  }

  if (stats)
    *stats = local;
  return Graph(std::move(nodes), std::move(adjacency));
}

const Node *Graph::GetNode(NodeID id) const {
  auto it = nodes_.find(id);
  if (it == nodes_.end())
    return nullptr;
  return &it->second;
}

const std::vector<Edge> &Graph::OutgoingEdges(NodeID id) const {
  static const std::vector<Edge> noEdges;
  auto it = adjacency_.find(id);
  if (it == adjacency_.end())
    return noEdges;
  return it->second;
}

Graph buildGraph(const CsvTable &cityRows, const CsvTable &edgeRows,
                 const GraphOptions &options) {
  return Graph::Build(cityRows, edgeRows, options);
}

// --- CSV Loading ---

Graph loadGraph(const std::string &folderPath, const GraphOptions &options) {
  std::cout << "[Graph] Loading road network from " << folderPath << "..."
            << std::endl;

  CsvTable cities = readCsvTable(folderPath + "/cities.csv");
  CsvTable edges = readCsvTable(folderPath + "/edges.csv");

  GraphBuildStats stats;
  Graph graph = Graph::Build(cities, edges, options, &stats);

  std::cout << "[Graph] Loaded " << stats.cities << " cities." << std::endl;
  std::cout << "[Graph] Read " << stats.edge_rows << " edge rows ("
            << stats.dropped_unknown_endpoint << " unknown endpoint, "
            << stats.dropped_self_loop << " self loops, "
            << stats.collapsed_duplicates << " duplicates collapsed)."
            << std::endl;
  std::cout << "[Graph] Created " << stats.directed_edges << " directed edges"
            << (options.symmetrize ? " (two-way roads)." : ".") << std::endl;
  return graph;
}

// --- Identifier Resolution ---

NodeID resolveId(NodeID id, const NodeMap &nodes) {
  if (nodes.count(id))
    return id;
  throw NotFound("City id " + std::to_string(id) + " not found.");
}

NodeID resolveId(const std::string &name, const NodeMap &nodes) {
  for (const auto &entry : nodes) {
    if (entry.second.name == name)
      return entry.first;
  }
  throw NotFound("City name '" + name + "' not found.");
}

NodeID resolveQuery(const std::string &query, const NodeMap &nodes) {
  bool numeric = !query.empty() && query.size() < 10 &&
                 std::all_of(query.begin(), query.end(), [](char c) {
                   return std::isdigit(static_cast<unsigned char>(c)) != 0;
                 });
  if (numeric)
    return resolveId(std::stoi(query), nodes);
  return resolveId(query, nodes);
}

// --- City Listing ---

std::vector<std::pair<NodeID, std::string>> cityList(const NodeMap &nodes) {
  std::vector<std::pair<NodeID, std::string>> list;
  for (const auto &entry : nodes)
    list.emplace_back(entry.first, entry.second.name);

  auto lower = [](std::string s) {
    for (auto &c : s)
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
  };
  std::stable_sort(list.begin(), list.end(),
                   [&](const std::pair<NodeID, std::string> &a,
                       const std::pair<NodeID, std::string> &b) {
                     return lower(a.second) < lower(b.second);
                   });
  return list;
}

std::string cityLabel(NodeID id, const NodeMap &nodes) {
  auto it = nodes.find(id);
  if (it == nodes.end())
    return "<unknown:" + std::to_string(id) + ">";
  return it->second.name + " (" + std::to_string(id) + ")";
}

// --- Path Totals ---

PathTotals pathTotals(const std::vector<NodeID> &path,
                      const AdjacencyMap &adjacency) {
  PathTotals totals;
  for (size_t i = 1; i < path.size(); ++i) {
    const Edge *edge = findEdge(adjacency, path[i - 1], path[i]);
    if (!edge)
      edge = findEdge(adjacency, path[i], path[i - 1]);
    if (!edge)
      continue;
    totals.distance_km += edge->distance_km;
    totals.travel_time_min += edge->travel_time_min;
  }
  return totals;
}
