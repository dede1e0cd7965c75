#ifndef RESULT_PROTO_HPP
#define RESULT_PROTO_HPP

#include "graph.hpp"
#include "roadpath.pb.h"
#include <string>
#include <vector>

// Copies run results into the exchange message consumed by presentation
// layers. Stops carry names and coordinates looked up in the graph.
void fillRunReport(const Graph &graph, NodeID start, NodeID goal,
                   WeightDimension dimension,
                   const std::vector<RunResult> &results,
                   roadpath::RunReport *report);

// Throws RoadPathError if the message cannot be printed.
std::string reportToJson(const roadpath::RunReport &report);

// "Dijkstra: 2.000 km, 3 stops, explored 3, 0.004 ms" or
// "Dijkstra: No path found".
std::string formatSummary(const RunResult &result, WeightDimension dimension);

#endif // RESULT_PROTO_HPP
