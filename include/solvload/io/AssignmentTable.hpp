#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace solvload {

// One assignment event: in `frame`, solvent atom `solvent` (local index into
// the solvent-index map) sits in shell `shell` of solute site `solute`.
struct AssignmentRow {
  std::int32_t frame = 0;
  std::int32_t solvent = 0;
  std::int32_t solute = 0;
  std::int32_t shell = 0;

  bool operator==(const AssignmentRow&) const = default;
};

static_assert(sizeof(AssignmentRow) == 4 * sizeof(std::int32_t), "AssignmentRow must be 4 packed int32");

// Read-only table accessed by row ranges only; implementations may be far
// larger than memory.
class IAssignmentTable {
public:
  virtual ~IAssignmentTable() = default;

  virtual std::uint64_t row_count() const = 0;

  // Replace `out` with rows [start, end). end is clamped to row_count();
  // start > row_count() is an error.
  virtual void read(std::uint64_t start, std::uint64_t end, std::vector<AssignmentRow>& out) = 0;
};

class InMemoryAssignmentTable final : public IAssignmentTable {
public:
  InMemoryAssignmentTable() = default;
  explicit InMemoryAssignmentTable(std::vector<AssignmentRow> rows) : rows_(std::move(rows)) {}

  std::uint64_t row_count() const override { return static_cast<std::uint64_t>(rows_.size()); }

  void read(std::uint64_t start, std::uint64_t end, std::vector<AssignmentRow>& out) override {
    const std::uint64_t n = row_count();
    if (start > n) {
      throw std::runtime_error("InMemoryAssignmentTable: start row " + std::to_string(start) +
                               " beyond row count " + std::to_string(n));
    }
    if (end > n) end = n;
    if (end < start) end = start;
    out.assign(rows_.begin() + static_cast<std::ptrdiff_t>(start), rows_.begin() + static_cast<std::ptrdiff_t>(end));
    ++reads_;
  }

  // Number of read() calls served; used to check chunk accounting.
  std::size_t reads() const { return reads_; }

private:
  std::vector<AssignmentRow> rows_;
  std::size_t reads_ = 0;
};

} // namespace solvload
