#include "solvload/alg/LoadingExpander.hpp"

#include <string>

#include "solvload/core/Errors.hpp"

namespace solvload::alg {

FieldArray LoadingExpander::expand(std::span<const double> loading) const {
  if (loading.size() != tr_.kept_count()) {
    throw DimensionMismatch("loading vector has " + std::to_string(loading.size()) +
                            " entries but the pruned index set leaves " + std::to_string(tr_.kept_count()) +
                            " of " + std::to_string(tr_.n_features()) + " features");
  }

  FieldArray dense(tr_.n_solute(), tr_.n_shells(), 0.0);
  for (std::size_t ute = 0; ute < tr_.n_solute(); ++ute) {
    for (std::size_t sh = 0; sh < tr_.n_shells(); ++sh) {
      const std::int64_t p = tr_.to_pruned(ute, sh);
      if (p == IndexTranslator::kPruned) continue;
      dense(ute, sh) = loading[static_cast<std::size_t>(p)];
    }
  }
  return dense;
}

std::vector<double> LoadingExpander::compact(const FieldArray& dense) const {
  if (dense.rows() != tr_.n_solute() || dense.cols() != tr_.n_shells()) {
    throw DimensionMismatch("loading matrix shape (" + std::to_string(dense.rows()) + "," +
                            std::to_string(dense.cols()) + ") != (" + std::to_string(tr_.n_solute()) + "," +
                            std::to_string(tr_.n_shells()) + ")");
  }

  std::vector<double> out;
  out.reserve(tr_.kept_count());
  for (std::size_t p = 0; p < tr_.kept_count(); ++p) {
    const auto [ute, sh] = tr_.to_dense(p);
    out.push_back(dense(ute, sh));
  }
  return out;
}

} // namespace solvload::alg
