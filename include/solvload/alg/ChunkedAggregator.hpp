#pragma once

#include <csignal>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <utility>
#include <vector>

#include "solvload/core/AggregationPolicy.hpp"
#include "solvload/core/FieldArray.hpp"
#include "solvload/io/AssignmentTable.hpp"

namespace solvload::alg {

struct AggregateOptions {
  std::uint64_t chunk_size = 1000000;
  AggregationPolicy policy = AggregationPolicy::Sum;

  // Starting value of every cell under AggregationPolicy::Max. May be -inf;
  // cells still at -inf after the scan (never touched) are written as 0.
  double max_floor = 0.0;

  // Only frames with frame % stride == 0 are folded, into row frame / stride.
  // The output has n_frames / stride rows.
  std::size_t stride = 1;

  // >1 splits every chunk across OpenMP threads with private partial arrays
  // (ignored without OpenMP).
  int threads = 1;
};

struct ChunkProgress {
  std::uint64_t chunk_index = 0; // 0-based, just finished
  std::uint64_t n_chunks = 0;
  std::uint64_t rows_done = 0;
  std::uint64_t rows_total = 0;
};

struct AggregateStats {
  std::uint64_t chunks_read = 0;
  std::uint64_t rows_read = 0;
  std::uint64_t rows_folded = 0;
  std::uint64_t rows_skipped_stride = 0;
  int threads_used = 1;
};

struct AggregateResult {
  FieldArray field; // (n_frames / stride) x n_atoms
  AggregateStats stats;
};

// Streams an assignment table in fixed-size row ranges and folds every row's
// loading into a dense (frame x atom) field.
//
// Per row (frame, solvent, solute, shell):
//   atom  = solvent_index_map[solvent]
//   value = loading2d(solute, shell)
//   combine value into field(frame / stride, atom) per policy
//
// Any index outside the allocated arrays throws IndexOutOfRange and no field
// is returned. Peak memory is one chunk of rows plus the output (and count
// array for avg), times the thread count when threads > 1.
class ChunkedAggregator {
public:
  // Throws std::runtime_error for chunk_size == 0, stride == 0 or threads < 1.
  // The map and matrix are referenced, not copied; they must outlive run().
  ChunkedAggregator(std::span<const std::int64_t> solvent_index_map,
                    const FieldArray& loading2d,
                    std::size_t n_frames,
                    std::size_t n_atoms,
                    AggregateOptions opt = {});

  // Checked before every chunk read; non-zero -> run() throws Cancelled.
  void set_stop_flag(const volatile std::sig_atomic_t* flag) { stop_flag_ = flag; }

  void set_progress_callback(std::function<void(const ChunkProgress&)> cb) { progress_ = std::move(cb); }

  std::size_t n_rows() const { return n_frames_ / opt_.stride; }

  // ceil(rows / chunk_size); an exact multiple gives no trailing empty chunk.
  static std::uint64_t chunk_count(std::uint64_t rows, std::uint64_t chunk_size);

  AggregateResult run(IAssignmentTable& table) const;

private:
  std::span<const std::int64_t> map_;
  const FieldArray& loading_;
  std::size_t n_frames_ = 0;
  std::size_t n_atoms_ = 0;
  AggregateOptions opt_;
  const volatile std::sig_atomic_t* stop_flag_ = nullptr;
  std::function<void(const ChunkProgress&)> progress_;

  // Flat output offset for a row, or -1 if the frame is skipped by the stride.
  // Throws IndexOutOfRange; `row_index` is the row's position in the table.
  std::int64_t cell_of_(const AssignmentRow& r, std::uint64_t row_index) const;
  bool in_range_(const AssignmentRow& r) const;
  // Throws the IndexOutOfRange describing why `r` is not in range.
  void raise_out_of_range_(const AssignmentRow& r, std::uint64_t row_index) const;

  template <class Combine>
  void fold_(std::span<const AssignmentRow> rows, std::uint64_t first_row,
             double* out, double* count, AggregateStats& st) const;

  template <class Combine>
  void fold_parallel_(std::span<const AssignmentRow> rows, std::uint64_t first_row,
                      std::vector<FieldArray>& outs, std::vector<FieldArray>& counts,
                      AggregateStats& st) const;

  void dispatch_(std::span<const AssignmentRow> rows, std::uint64_t first_row,
                 std::vector<FieldArray>& outs, std::vector<FieldArray>& counts,
                 AggregateStats& st) const;

  void merge_partials_(std::vector<FieldArray>& outs, std::vector<FieldArray>& counts) const;
  void finalize_(FieldArray& out, const FieldArray* count) const;
};

} // namespace solvload::alg
