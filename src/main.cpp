#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

#include "errors.hpp"
#include "graph.hpp"
#include "pathfinder.hpp"
#include "result_proto.hpp"

namespace {
std::string envOr(const char *name, const std::string &fallback) {
  if (const char *env_p = std::getenv(name))
    return env_p;
  return fallback;
}

double parseMaxKmh(const std::string &value) {
  try {
    size_t pos = 0;
    double kmh = std::stod(value, &pos);
    if (pos == value.size())
      return kmh;
  } catch (const std::invalid_argument &) {
    // reported below
  } catch (const std::out_of_range &) {
    // reported below
  }
  throw InvalidParameter("ROADPATH_MAX_KMH is not a number: '" + value + "'");
}

void printUsage(const char *argv0) {
  std::cerr << "Usage: " << argv0
            << " <start> <goal> [distance_km|travel_time_min]" << std::endl;
  std::cerr << "  <start>/<goal> are city ids or exact city names." << std::endl;
  std::cerr << "Environment: ROADPATH_DATA (default: data), ROADPATH_MAX_KMH "
               "(default: 70), ROADPATH_DIRECTED=1 for one-way roads."
            << std::endl;
}

void RunQuery(const std::string &start, const std::string &goal,
              const std::string &weightKey) {
  std::string dataPath = envOr("ROADPATH_DATA", "data");

  GraphOptions options;
  options.symmetrize = envOr("ROADPATH_DIRECTED", "0") != "1";

  HeuristicOptions heuristic;
  heuristic.max_kmh =
      parseMaxKmh(envOr("ROADPATH_MAX_KMH", std::to_string(DEFAULT_MAX_KMH)));

  WeightDimension dimension = weightDimensionFromKey(weightKey);

  // Load graph once so every algorithm sees the same snapshot
  Graph graph = loadGraph(dataPath, options);

  NodeID startId = resolveQuery(start, graph.GetNodes());
  NodeID goalId = resolveQuery(goal, graph.GetNodes());
  std::cout << "[Runner] " << cityLabel(startId, graph.GetNodes()) << " -> "
            << cityLabel(goalId, graph.GetNodes()) << " by " << weightKey
            << std::endl;

  auto results =
      Pathfinder::RunAll(graph, startId, goalId, dimension, heuristic);

  std::cout << "\n=== Shortest Path Results ===" << std::endl;
  for (const auto &r : results)
    std::cout << formatSummary(r, dimension) << std::endl;

  roadpath::RunReport report;
  fillRunReport(graph, startId, goalId, dimension, results, &report);

  std::string outPath = dataPath + "/output.json";
  std::ofstream outfile(outPath);
  if (!outfile.is_open())
    throw DataIntegrityError("cannot write " + outPath);
  outfile << reportToJson(report);
  std::cout << "\nResults written to " << outPath << std::endl;
}
} // namespace

int main(int argc, char **argv) {
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  if (argc < 3 || argc > 4) {
    printUsage(argv[0]);
    return 2;
  }

  try {
    RunQuery(argv[1], argv[2], argc == 4 ? argv[3] : "distance_km");
  } catch (const RoadPathError &e) {
    std::cerr << "[Error] " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "[Error] unexpected: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
