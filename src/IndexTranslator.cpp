#include "solvload/alg/IndexTranslator.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include "solvload/core/Errors.hpp"

namespace solvload::alg {

IndexTranslator::IndexTranslator(std::size_t n_solute, std::size_t n_shells,
                                 std::span<const std::int64_t> pruned)
    : n_solute_(n_solute), n_shells_(n_shells) {
  if (n_shells_ != 0 && n_solute_ > SIZE_MAX / n_shells_) {
    throw DimensionMismatch("n_solute*n_shells overflows size_t (n_solute=" + std::to_string(n_solute_) +
                            " n_shells=" + std::to_string(n_shells_) + ")");
  }
  const std::size_t n_abs = n_solute_ * n_shells_;

  std::vector<unsigned char> removed(n_abs, 0);
  for (const std::int64_t a : pruned) {
    if (a < 0 || static_cast<std::size_t>(a) >= n_abs) {
      throw IndexOutOfRange("pruned index " + std::to_string(a) + " outside [0," + std::to_string(n_abs) +
                            ") for n_solute=" + std::to_string(n_solute_) + " n_shells=" + std::to_string(n_shells_));
    }
    removed[static_cast<std::size_t>(a)] = 1;
  }

  to_pruned_.assign(n_abs, kPruned);
  to_dense_.reserve(n_abs);

  std::size_t kept = 0;
  for (std::size_t ute = 0; ute < n_solute_; ++ute) {
    for (std::size_t sh = 0; sh < n_shells_; ++sh) {
      const std::size_t absi = absolute_index(ute, sh, n_shells_);
      if (removed[absi]) continue;
      to_pruned_[absi] = static_cast<std::int64_t>(kept);
      to_dense_.emplace_back(ute, sh);
      ++kept;
    }
  }
}

std::size_t IndexTranslator::absolute_index(std::size_t solute, std::size_t shell) const {
  if (solute >= n_solute_ || shell >= n_shells_) {
    throw IndexOutOfRange("(solute=" + std::to_string(solute) + ", shell=" + std::to_string(shell) +
                          ") outside (" + std::to_string(n_solute_) + "," + std::to_string(n_shells_) + ")");
  }
  return absolute_index(solute, shell, n_shells_);
}

std::int64_t IndexTranslator::to_pruned(std::size_t solute, std::size_t shell) const {
  return to_pruned_[absolute_index(solute, shell)];
}

IndexTranslator::DensePair IndexTranslator::to_dense(std::size_t pruned_index) const {
  if (pruned_index >= to_dense_.size()) {
    throw IndexOutOfRange("pruned index " + std::to_string(pruned_index) + " >= kept_count " +
                          std::to_string(to_dense_.size()));
  }
  return to_dense_[pruned_index];
}

} // namespace solvload::alg
