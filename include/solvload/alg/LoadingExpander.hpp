#pragma once

#include <span>
#include <vector>

#include "solvload/alg/IndexTranslator.hpp"
#include "solvload/core/FieldArray.hpp"

namespace solvload::alg {

// Expands a 1-D loading vector (indexed in pruned space) into the dense
// (n_solute x n_shells) loading matrix, with 0.0 at pruned features.
class LoadingExpander {
public:
  explicit LoadingExpander(const IndexTranslator& tr) : tr_(tr) {}

  // Throws DimensionMismatch if loading.size() != kept_count().
  FieldArray expand(std::span<const double> loading) const;

  // Inverse of expand(): drop pruned entries, return a kept_count() vector.
  // Throws DimensionMismatch if the matrix shape is not (n_solute, n_shells).
  std::vector<double> compact(const FieldArray& dense) const;

private:
  const IndexTranslator& tr_;
};

} // namespace solvload::alg
