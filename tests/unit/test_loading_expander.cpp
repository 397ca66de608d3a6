#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "solvload/alg/IndexTranslator.hpp"
#include "solvload/alg/LoadingExpander.hpp"
#include "solvload/core/Errors.hpp"

using solvload::alg::IndexTranslator;
using solvload::alg::LoadingExpander;

TEST(LoadingExpanderTest, PruningScenarioExpandsWithZeros) {
  const std::vector<std::int64_t> pruned = {1};
  IndexTranslator tr(2, 2, pruned);
  LoadingExpander ex(tr);

  const std::vector<double> loading = {1.0, 2.0, 3.0};
  const auto dense = ex.expand(loading);
  ASSERT_EQ(dense.rows(), 2u);
  ASSERT_EQ(dense.cols(), 2u);
  EXPECT_DOUBLE_EQ(dense(0, 0), 1.0);
  EXPECT_DOUBLE_EQ(dense(0, 1), 0.0);
  EXPECT_DOUBLE_EQ(dense(1, 0), 2.0);
  EXPECT_DOUBLE_EQ(dense(1, 1), 3.0);
}

TEST(LoadingExpanderTest, CompactInvertsExpand) {
  const std::vector<std::int64_t> pruned = {0, 3, 7, 8};
  IndexTranslator tr(3, 3, pruned);
  LoadingExpander ex(tr);

  const std::vector<double> loading = {-0.5, 0.25, 1e-9, 3.0, -7.75};
  ASSERT_EQ(loading.size(), tr.kept_count());
  EXPECT_EQ(ex.compact(ex.expand(loading)), loading);
}

TEST(LoadingExpanderTest, WrongLengthIsDimensionMismatch) {
  const std::vector<std::int64_t> pruned = {1};
  IndexTranslator tr(2, 2, pruned);
  LoadingExpander ex(tr);

  const std::vector<double> too_long = {1.0, 2.0, 3.0, 4.0};
  EXPECT_THROW(ex.expand(too_long), solvload::DimensionMismatch);
  const std::vector<double> too_short = {1.0};
  EXPECT_THROW(ex.expand(too_short), solvload::DimensionMismatch);
}

TEST(LoadingExpanderTest, AllPrunedGivesZeroMatrix) {
  const std::vector<std::int64_t> pruned = {0, 1, 2, 3, 4, 5};
  IndexTranslator tr(2, 3, pruned);
  LoadingExpander ex(tr);

  const auto dense = ex.expand(std::vector<double>{});
  for (double v : dense.data()) EXPECT_EQ(v, 0.0);
}

TEST(LoadingExpanderTest, CompactRejectsWrongShape) {
  IndexTranslator tr(2, 2, {});
  LoadingExpander ex(tr);
  EXPECT_THROW(ex.compact(solvload::FieldArray(2, 3)), solvload::DimensionMismatch);
}
