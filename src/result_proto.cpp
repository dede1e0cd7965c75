#include "result_proto.hpp"
#include "errors.hpp"
#include <google/protobuf/stubs/common.h>
#include <google/protobuf/util/json_util.h>
#include <iomanip>
#include <sstream>

namespace {
void fillStop(const Graph &graph, NodeID id, roadpath::Stop *stop) {
  stop->set_id(id);
  const Node *node = graph.GetNode(id);
  if (!node) {
    stop->set_name(cityLabel(id, graph.GetNodes()));
    return;
  }
  stop->set_name(node->name);
  stop->mutable_location()->set_latitude(node->lat);
  stop->mutable_location()->set_longitude(node->lon);
}

std::string unitOf(WeightDimension dimension) {
  return dimension == WeightDimension::Time ? "min" : "km";
}
} // namespace

void fillRunReport(const Graph &graph, NodeID start, NodeID goal,
                   WeightDimension dimension,
                   const std::vector<RunResult> &results,
                   roadpath::RunReport *report) {
  auto *query = report->mutable_query();
  fillStop(graph, start, query->mutable_start());
  fillStop(graph, goal, query->mutable_goal());
  query->set_weight_key(weightDimensionKey(dimension));

  for (const auto &r : results) {
    auto *run = report->add_runs();
    run->set_algorithm(algorithmToString(r.algorithm));
    run->set_runtime_sec(r.runtime_sec);
    run->set_explored_or_iterations(r.explored_or_iterations);
    run->set_relaxations_done(r.relaxations_done);
    run->set_edges_scanned(r.edges_scanned);
    run->set_negative_cycle(r.negative_cycle);
    run->set_goal_affected_by_neg_cycle(r.goal_affected_by_neg_cycle);

    bool found = r.found();
    run->set_found(found);
    if (!found) {
      run->set_total(0.0);
      continue;
    }

    run->set_total(r.total);
    for (NodeID id : r.path)
      fillStop(graph, id, run->add_path());

    PathTotals totals = pathTotals(r.path, graph.GetAdjacency());
    run->set_total_distance_km(totals.distance_km);
    run->set_total_time_min(totals.travel_time_min);
  }
}

std::string reportToJson(const roadpath::RunReport &report) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
#if GOOGLE_PROTOBUF_VERSION >= 5026000
  options.always_print_fields_with_no_presence = true;
#else
  options.always_print_primitive_fields = true;
#endif
  options.preserve_proto_field_names = true;

  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(report, &json, options);
  if (!status.ok())
    throw RoadPathError("cannot print run report: " + status.ToString());
  return json;
}

std::string formatSummary(const RunResult &result, WeightDimension dimension) {
  std::ostringstream out;
  out << algorithmToString(result.algorithm) << ": ";
  if (!result.found()) {
    out << "No path found";
  } else {
    out << std::fixed << std::setprecision(3) << result.total << " "
        << unitOf(dimension) << ", " << result.path.size() << " stops";
  }
  out << ", " << (result.algorithm == Algorithm::BellmanFord ? "iterations "
                                                               : "explored ")
      << result.explored_or_iterations << ", " << std::fixed
      << std::setprecision(3) << result.runtime_sec * 1000.0 << " ms";
  if (result.negative_cycle) {
    out << " [negative cycle"
        << (result.goal_affected_by_neg_cycle ? ", goal affected]" : "]");
  }
  return out.str();
}
