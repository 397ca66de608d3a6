#include <gtest/gtest.h>

#include <cstdint>
#include <set>
#include <vector>

#include "solvload/alg/IndexTranslator.hpp"
#include "solvload/core/Errors.hpp"

using solvload::alg::IndexTranslator;

TEST(IndexTranslatorTest, NoPruningIsIdentityInRowMajorOrder) {
  IndexTranslator tr(3, 4, {});
  EXPECT_EQ(tr.kept_count(), 12u);
  for (std::size_t s = 0; s < 3; ++s) {
    for (std::size_t h = 0; h < 4; ++h) {
      EXPECT_EQ(tr.to_pruned(s, h), static_cast<std::int64_t>(s * 4 + h));
      EXPECT_EQ(tr.absolute_index(s, h), s * 4 + h);
    }
  }
}

TEST(IndexTranslatorTest, PruningScenario) {
  const std::vector<std::int64_t> pruned = {1};
  IndexTranslator tr(2, 2, pruned);
  EXPECT_EQ(tr.kept_count(), 3u);
  EXPECT_EQ(tr.to_pruned(0, 0), 0);
  EXPECT_EQ(tr.to_pruned(0, 1), IndexTranslator::kPruned);
  EXPECT_EQ(tr.to_pruned(1, 0), 1);
  EXPECT_EQ(tr.to_pruned(1, 1), 2);
  EXPECT_EQ(tr.to_dense(0), IndexTranslator::DensePair(0, 0));
  EXPECT_EQ(tr.to_dense(1), IndexTranslator::DensePair(1, 0));
  EXPECT_EQ(tr.to_dense(2), IndexTranslator::DensePair(1, 1));
}

TEST(IndexTranslatorTest, MappingsAreInversesForManyPrunedSets) {
  const std::size_t n_solute = 5;
  const std::size_t n_shells = 3;
  const std::size_t n_abs = n_solute * n_shells;

  // A spread of subsets of the 15 features, starting with the empty set.
  for (std::uint32_t mask = 0; mask < (1u << n_abs); mask += 4099) {
    std::vector<std::int64_t> pruned;
    for (std::size_t a = 0; a < n_abs; ++a) {
      if (mask & (1u << a)) pruned.push_back(static_cast<std::int64_t>(a));
    }
    IndexTranslator tr(n_solute, n_shells, pruned);
    ASSERT_EQ(tr.kept_count(), n_abs - pruned.size());

    const std::set<std::int64_t> pset(pruned.begin(), pruned.end());
    for (std::size_t s = 0; s < n_solute; ++s) {
      for (std::size_t h = 0; h < n_shells; ++h) {
        const std::int64_t p = tr.to_pruned(s, h);
        const bool removed = pset.count(static_cast<std::int64_t>(tr.absolute_index(s, h))) > 0;
        EXPECT_EQ(p == IndexTranslator::kPruned, removed);
        if (!removed) {
          EXPECT_EQ(tr.to_dense(static_cast<std::size_t>(p)), IndexTranslator::DensePair(s, h));
        }
      }
    }
  }
}

TEST(IndexTranslatorTest, PrunedIndicesFollowRowMajorOrder) {
  const std::vector<std::int64_t> pruned = {0, 4};
  IndexTranslator tr(2, 3, pruned);
  std::vector<std::size_t> abs_of_pruned;
  for (std::size_t p = 0; p < tr.kept_count(); ++p) {
    const auto [s, h] = tr.to_dense(p);
    abs_of_pruned.push_back(tr.absolute_index(s, h));
  }
  EXPECT_EQ(abs_of_pruned, (std::vector<std::size_t>{1, 2, 3, 5}));
}

TEST(IndexTranslatorTest, DuplicatePrunedIndicesCountOnce) {
  const std::vector<std::int64_t> pruned = {2, 2, 2};
  IndexTranslator tr(1, 4, pruned);
  EXPECT_EQ(tr.kept_count(), 3u);
}

TEST(IndexTranslatorTest, PruneEverything) {
  const std::vector<std::int64_t> pruned = {0, 1, 2, 3};
  IndexTranslator tr(2, 2, pruned);
  EXPECT_EQ(tr.kept_count(), 0u);
  EXPECT_TRUE(tr.is_pruned(1, 1));
  EXPECT_THROW(tr.to_dense(0), solvload::IndexOutOfRange);
}

TEST(IndexTranslatorTest, RejectsOutOfRangeIndices) {
  const std::vector<std::int64_t> too_big = {4};
  EXPECT_THROW(IndexTranslator(2, 2, too_big), solvload::IndexOutOfRange);
  const std::vector<std::int64_t> negative = {-1};
  EXPECT_THROW(IndexTranslator(2, 2, negative), solvload::IndexOutOfRange);

  IndexTranslator tr(2, 2, {});
  EXPECT_THROW(tr.to_pruned(2, 0), solvload::IndexOutOfRange);
  EXPECT_THROW(tr.to_pruned(0, 2), solvload::IndexOutOfRange);
}

TEST(IndexTranslatorTest, OverflowingDimensionsRejected) {
  const std::size_t n_solute = std::size_t{1} << 33;
  const std::size_t n_shells = std::size_t{1} << 31;
  EXPECT_THROW(IndexTranslator(n_solute, n_shells, {}), solvload::DimensionMismatch);
  EXPECT_THROW(IndexTranslator(SIZE_MAX, 2, {}), solvload::DimensionMismatch);
}
