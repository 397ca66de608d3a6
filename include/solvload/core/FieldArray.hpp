#pragma once

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace solvload {

// Dense row-major (n_rows x n_cols) array of doubles.
//
// Used for the (frame x atom) output field, the per-cell counts of the avg
// policy, and the (solute x shell) loading matrix.
class FieldArray {
public:
  FieldArray() = default;

  FieldArray(std::size_t n_rows, std::size_t n_cols, double fill = 0.0)
      : n_rows_(n_rows), n_cols_(n_cols), data_(checked_size_(n_rows, n_cols), fill) {}

  std::size_t rows() const { return n_rows_; }
  std::size_t cols() const { return n_cols_; }
  std::size_t size() const { return data_.size(); }

  double& operator()(std::size_t r, std::size_t c) { return data_[r * n_cols_ + c]; }
  double operator()(std::size_t r, std::size_t c) const { return data_[r * n_cols_ + c]; }

  std::span<const double> row(std::size_t r) const {
    return std::span<const double>(data_.data() + r * n_cols_, n_cols_);
  }

  std::vector<double>& data() { return data_; }
  const std::vector<double>& data() const { return data_; }

private:
  static std::size_t checked_size_(std::size_t n_rows, std::size_t n_cols) {
    if (n_cols != 0 && n_rows > std::vector<double>().max_size() / n_cols) {
      throw std::runtime_error("FieldArray: shape (" + std::to_string(n_rows) + "," + std::to_string(n_cols) +
                               ") too large");
    }
    return n_rows * n_cols;
  }

  std::size_t n_rows_ = 0;
  std::size_t n_cols_ = 0;
  std::vector<double> data_;
};

} // namespace solvload
