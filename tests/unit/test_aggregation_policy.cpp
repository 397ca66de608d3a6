#include <gtest/gtest.h>

#include "solvload/core/AggregationPolicy.hpp"
#include "solvload/core/Errors.hpp"

using solvload::AggregationPolicy;

TEST(AggregationPolicyTest, ParsesNamesAndAlias) {
  EXPECT_EQ(solvload::parse_aggregation_policy("sum"), AggregationPolicy::Sum);
  EXPECT_EQ(solvload::parse_aggregation_policy("add"), AggregationPolicy::Sum);
  EXPECT_EQ(solvload::parse_aggregation_policy("MAX"), AggregationPolicy::Max);
  EXPECT_EQ(solvload::parse_aggregation_policy("avg"), AggregationPolicy::Avg);
}

TEST(AggregationPolicyTest, UnknownNameThrows) {
  EXPECT_THROW(solvload::parse_aggregation_policy("median"), solvload::UnknownAggregationPolicy);
  EXPECT_THROW(solvload::parse_aggregation_policy(""), solvload::UnknownAggregationPolicy);
}

TEST(AggregationPolicyTest, NamesRoundTrip) {
  for (auto p : {AggregationPolicy::Sum, AggregationPolicy::Max, AggregationPolicy::Avg}) {
    EXPECT_EQ(solvload::parse_aggregation_policy(solvload::aggregation_policy_name(p)), p);
  }
}

TEST(AggregationPolicyTest, CombineFunctions) {
  double cell = 1.0;
  solvload::SumCombine::apply(cell, 2.5);
  EXPECT_DOUBLE_EQ(cell, 3.5);

  cell = 0.0;
  solvload::MaxCombine::apply(cell, -2.0);
  EXPECT_DOUBLE_EQ(cell, 0.0);
  solvload::MaxCombine::apply(cell, 4.0);
  EXPECT_DOUBLE_EQ(cell, 4.0);
}
