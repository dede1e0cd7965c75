// tests/heuristics_test.cpp
#include "errors.hpp"
#include "geodesic.hpp"
#include "heuristics.hpp"
#include "test_graphs.hpp"

#include <gtest/gtest.h>

namespace {

class HeuristicProviderTest : public ::testing::Test {
protected:
  Graph graph_ = testing_graphs::lineGraph();
};

TEST_F(HeuristicProviderTest, DistanceIsGeodesicToGoal) {
  HeuristicProvider h(graph_.GetNodes(), 3, WeightDimension::Distance);
  EXPECT_DOUBLE_EQ(h(3), 0.0);
  EXPECT_NEAR(h(2), 111.3195, 1e-3);
  EXPECT_NEAR(h(1), geodesicKm(0.0, 0.0, 0.0, 2.0), 1e-9);
}

TEST_F(HeuristicProviderTest, TimeDividesByMaxSpeed) {
  HeuristicOptions options;
  options.max_kmh = 60.0;
  HeuristicProvider h(graph_.GetNodes(), 3, WeightDimension::Time, options);
  // 60 km/h is one kilometer per minute.
  EXPECT_NEAR(h(2), geodesicKm(0.0, 1.0, 0.0, 2.0), 1e-9);
}

TEST_F(HeuristicProviderTest, TimeUsesSeventyKmhByDefault) {
  HeuristicProvider h(graph_.GetNodes(), 3, WeightDimension::Time);
  EXPECT_NEAR(h(2), geodesicKm(0.0, 1.0, 0.0, 2.0) / (70.0 / 60.0), 1e-9);
}

TEST_F(HeuristicProviderTest, RejectsNonPositiveMaxSpeed) {
  HeuristicOptions options;
  options.max_kmh = 0.0;
  EXPECT_THROW(
      HeuristicProvider(graph_.GetNodes(), 3, WeightDimension::Time, options),
      InvalidParameter);
  options.max_kmh = -10.0;
  EXPECT_THROW(
      HeuristicProvider(graph_.GetNodes(), 3, WeightDimension::Time, options),
      InvalidParameter);
}

TEST_F(HeuristicProviderTest, MaxSpeedIgnoredForDistance) {
  HeuristicOptions options;
  options.max_kmh = 0.0;
  EXPECT_NO_THROW(HeuristicProvider(graph_.GetNodes(), 3,
                                    WeightDimension::Distance, options));
}

TEST_F(HeuristicProviderTest, RejectsUnknownDimension) {
  EXPECT_THROW(HeuristicProvider(graph_.GetNodes(), 3,
                                 static_cast<WeightDimension>(5)),
               InvalidParameter);
}

TEST_F(HeuristicProviderTest, MemoizesEachNodeOnce) {
  HeuristicProvider h(graph_.GetNodes(), 3, WeightDimension::Distance);
  double first = h(1);
  EXPECT_EQ(h.CachedCount(), 1u);
  EXPECT_EQ(h(1), first);
  EXPECT_EQ(h.CachedCount(), 1u);
  h(2);
  EXPECT_EQ(h.CachedCount(), 2u);
}

TEST_F(HeuristicProviderTest, UnknownNodesEstimateZero) {
  HeuristicProvider h(graph_.GetNodes(), 3, WeightDimension::Distance);
  EXPECT_DOUBLE_EQ(h(99), 0.0);
  HeuristicProvider noGoal(graph_.GetNodes(), 99, WeightDimension::Distance);
  EXPECT_DOUBLE_EQ(noGoal(1), 0.0);
}

TEST_F(HeuristicProviderTest, NodeDistanceBetweenCities) {
  EXPECT_NEAR(nodeDistanceKm(1, 2, graph_.GetNodes()), 111.3195, 1e-3);
  EXPECT_THROW(nodeDistanceKm(1, 9, graph_.GetNodes()), NotFound);
}

} // namespace
