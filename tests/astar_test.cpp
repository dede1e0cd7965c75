// tests/astar_test.cpp
#include "errors.hpp"
#include "geodesic.hpp"
#include "pathfinder.hpp"
#include "test_graphs.hpp"

#include <gtest/gtest.h>
#include <vector>

namespace {

using testing_graphs::CityRow;
using testing_graphs::EdgeRow;

// Start 0 with a road east to the goal 1 and five short spurs to the west.
// Every spur is cheaper to reach than the goal but points away from it.
Graph spurGraph() {
  std::vector<CityRow> cities{{0, "Start", 7.0, 80.0}, {1, "Goal", 7.0, 80.5}};
  std::vector<EdgeRow> edges{{0, 1, 60.0, 60.0}};
  for (int i = 0; i < 5; ++i) {
    NodeID id = 10 + i;
    double lon = 79.9 - 0.01 * i;
    cities.push_back({id, "Spur" + std::to_string(i), 7.0, lon});
    double km = geodesicKm(7.0, 80.0, 7.0, lon) * 1.05;
    edges.push_back({0, id, km, km});
  }
  return testing_graphs::directedGraph(cities, edges);
}

TEST(AStarTest, LineGraphByDistance) {
  Graph graph = testing_graphs::lineGraph();
  RunResult r = Pathfinder::AStar(graph, 1, 3, WeightDimension::Distance);
  EXPECT_EQ(r.algorithm, Algorithm::AStar);
  EXPECT_EQ(r.path, std::vector<NodeID>({1, 2, 3}));
  EXPECT_DOUBLE_EQ(r.total, 2.0);
  EXPECT_FALSE(r.negative_cycle);
  EXPECT_FALSE(r.goal_affected_by_neg_cycle);
}

TEST(AStarTest, LineGraphByTime) {
  Graph graph = testing_graphs::lineGraph();
  RunResult r = Pathfinder::AStar(graph, 1, 3, WeightDimension::Time);
  EXPECT_EQ(r.path, std::vector<NodeID>({1, 2, 3}));
  EXPECT_DOUBLE_EQ(r.total, 4.0);
}

TEST(AStarTest, StartEqualsGoal) {
  Graph graph = testing_graphs::lineGraph();
  RunResult r = Pathfinder::AStar(graph, 3, 3, WeightDimension::Distance);
  EXPECT_EQ(r.path, std::vector<NodeID>({3}));
  EXPECT_DOUBLE_EQ(r.total, 0.0);
}

TEST(AStarTest, UnreachableGoal) {
  Graph graph = testing_graphs::directedGraph(
      {{1, "A", 0, 0}, {2, "B", 0, 1}, {3, "C", 0, 2}}, {{1, 2, 200.0, 200.0}});
  RunResult r = Pathfinder::AStar(graph, 1, 3, WeightDimension::Distance);
  EXPECT_TRUE(r.path.empty());
  EXPECT_EQ(r.total, INF);
}

TEST(AStarTest, HeuristicPrunesSpursDijkstraVisits) {
  Graph graph = spurGraph();
  RunResult astar = Pathfinder::AStar(graph, 0, 1, WeightDimension::Distance);
  RunResult dijkstra = Pathfinder::Dijkstra(
      graph, 0, 1, weightAccessor(WeightDimension::Distance));

  EXPECT_EQ(astar.path, std::vector<NodeID>({0, 1}));
  EXPECT_DOUBLE_EQ(astar.total, dijkstra.total);
  EXPECT_EQ(astar.explored_or_iterations, 2);
  EXPECT_EQ(dijkstra.explored_or_iterations, 7);
  EXPECT_EQ(astar.edges_scanned, dijkstra.edges_scanned);
}

TEST(AStarTest, TimeHeuristicRejectsNonPositiveSpeed) {
  Graph graph = testing_graphs::lineGraph();
  HeuristicOptions options;
  options.max_kmh = 0.0;
  EXPECT_THROW(Pathfinder::AStar(graph, 1, 3, WeightDimension::Time, options),
               InvalidParameter);
}

TEST(AStarTest, UnknownDimensionFailsBeforeSearching) {
  Graph graph = testing_graphs::lineGraph();
  EXPECT_THROW(
      Pathfinder::AStar(graph, 1, 3, static_cast<WeightDimension>(3)),
      InvalidParameter);
}

TEST(AStarTest, AgreesWithDijkstraOnTimeWeights) {
  Graph graph = testing_graphs::randomRoadNetwork(7, 40, 80, true);
  WeightFn time = weightAccessor(WeightDimension::Time);
  for (NodeID goal = 1; goal < 40; goal += 3) {
    RunResult a = Pathfinder::AStar(graph, 1, goal, WeightDimension::Time);
    RunResult d = Pathfinder::Dijkstra(graph, 1, goal, time);
    ASSERT_EQ(a.found(), d.found()) << "goal " << goal;
    EXPECT_NEAR(a.total, d.total, 1e-9) << "goal " << goal;
  }
}

} // namespace
