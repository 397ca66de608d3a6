#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace solvload::alg {

// Mapping between the pruned 1-D feature index and the dense (solute, shell)
// pair.
//
// Enumeration order (the contract with whoever produced the pruned set and the
// loading vector): row-major, solute-major then shell-minor, i.e.
//   absolute = solute * n_shells + shell
// Kept features receive pruned indices 0..kept_count-1 in that same order.
class IndexTranslator {
public:
  static constexpr std::int64_t kPruned = -1;

  using DensePair = std::pair<std::size_t, std::size_t>; // (solute, shell)

  // `pruned` holds absolute indices; duplicates are ignored. Throws
  // IndexOutOfRange if any index is >= n_solute * n_shells.
  IndexTranslator(std::size_t n_solute, std::size_t n_shells,
                  std::span<const std::int64_t> pruned);

  std::size_t n_solute() const { return n_solute_; }
  std::size_t n_shells() const { return n_shells_; }
  std::size_t n_features() const { return n_solute_ * n_shells_; }
  std::size_t kept_count() const { return to_dense_.size(); }

  // The row-major enumeration, exposed so callers never re-derive it.
  static std::size_t absolute_index(std::size_t solute, std::size_t shell, std::size_t n_shells) {
    return solute * n_shells + shell;
  }
  std::size_t absolute_index(std::size_t solute, std::size_t shell) const;

  // Pruned index of (solute, shell), or kPruned.
  std::int64_t to_pruned(std::size_t solute, std::size_t shell) const;
  bool is_pruned(std::size_t solute, std::size_t shell) const { return to_pruned(solute, shell) == kPruned; }

  // (solute, shell) of a kept feature.
  DensePair to_dense(std::size_t pruned_index) const;

private:
  std::size_t n_solute_ = 0;
  std::size_t n_shells_ = 0;
  std::vector<DensePair> to_dense_;     // [pruned]
  std::vector<std::int64_t> to_pruned_; // [absolute]
};

} // namespace solvload::alg
