#include "solvload/alg/ChunkedAggregator.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#if SOLVLOAD_HAS_OPENMP
#include <omp.h>
#endif

#include "solvload/core/Errors.hpp"

namespace solvload::alg {

namespace {

std::string row_str(const AssignmentRow& r, std::uint64_t row_index) {
  return "row " + std::to_string(row_index) + " (frame=" + std::to_string(r.frame) +
         ", solvent=" + std::to_string(r.solvent) + ", solute=" + std::to_string(r.solute) +
         ", shell=" + std::to_string(r.shell) + ")";
}

} // namespace

ChunkedAggregator::ChunkedAggregator(std::span<const std::int64_t> solvent_index_map,
                                     const FieldArray& loading2d,
                                     std::size_t n_frames,
                                     std::size_t n_atoms,
                                     AggregateOptions opt)
    : map_(solvent_index_map), loading_(loading2d), n_frames_(n_frames), n_atoms_(n_atoms), opt_(opt) {
  if (opt_.chunk_size == 0) throw std::runtime_error("ChunkedAggregator: chunk_size must be > 0");
  if (opt_.stride == 0) throw std::runtime_error("ChunkedAggregator: stride must be > 0");
  if (opt_.threads < 1) throw std::runtime_error("ChunkedAggregator: threads must be >= 1");
  if (std::isnan(opt_.max_floor) || opt_.max_floor == std::numeric_limits<double>::infinity()) {
    throw std::runtime_error("ChunkedAggregator: max_floor must be finite or -inf");
  }
}

std::uint64_t ChunkedAggregator::chunk_count(std::uint64_t rows, std::uint64_t chunk_size) {
  if (chunk_size == 0) throw std::runtime_error("ChunkedAggregator: chunk_size must be > 0");
  return rows / chunk_size + ((rows % chunk_size) ? 1u : 0u);
}

bool ChunkedAggregator::in_range_(const AssignmentRow& r) const {
  if (r.frame < 0 || static_cast<std::size_t>(r.frame) >= n_frames_) return false;
  if (r.solvent < 0 || static_cast<std::size_t>(r.solvent) >= map_.size()) return false;
  const std::int64_t atom = map_[static_cast<std::size_t>(r.solvent)];
  if (atom < 0 || static_cast<std::uint64_t>(atom) >= n_atoms_) return false;
  if (r.solute < 0 || static_cast<std::size_t>(r.solute) >= loading_.rows()) return false;
  if (r.shell < 0 || static_cast<std::size_t>(r.shell) >= loading_.cols()) return false;
  return true;
}

void ChunkedAggregator::raise_out_of_range_(const AssignmentRow& r, std::uint64_t row_index) const {
  if (r.frame < 0 || static_cast<std::size_t>(r.frame) >= n_frames_) {
    throw IndexOutOfRange(row_str(r, row_index) + ": frame outside [0," + std::to_string(n_frames_) + ")");
  }
  if (r.solvent < 0 || static_cast<std::size_t>(r.solvent) >= map_.size()) {
    throw IndexOutOfRange(row_str(r, row_index) + ": solvent index outside solvent map of size " +
                          std::to_string(map_.size()));
  }
  const std::int64_t atom = map_[static_cast<std::size_t>(r.solvent)];
  if (atom < 0 || static_cast<std::uint64_t>(atom) >= n_atoms_) {
    throw IndexOutOfRange(row_str(r, row_index) + ": maps to atom " + std::to_string(atom) + " outside [0," +
                          std::to_string(n_atoms_) + ")");
  }
  throw IndexOutOfRange(row_str(r, row_index) + ": (solute, shell) outside loading matrix (" +
                        std::to_string(loading_.rows()) + "," + std::to_string(loading_.cols()) + ")");
}

std::int64_t ChunkedAggregator::cell_of_(const AssignmentRow& r, std::uint64_t row_index) const {
  if (!in_range_(r)) raise_out_of_range_(r, row_index);

  const std::size_t frame = static_cast<std::size_t>(r.frame);
  if (frame % opt_.stride != 0) return -1;
  const std::size_t out_row = frame / opt_.stride;
  if (out_row >= n_rows()) return -1;

  const std::size_t atom = static_cast<std::size_t>(map_[static_cast<std::size_t>(r.solvent)]);
  return static_cast<std::int64_t>(out_row * n_atoms_ + atom);
}

template <class Combine>
void ChunkedAggregator::fold_(std::span<const AssignmentRow> rows, std::uint64_t first_row,
                              double* out, double* count, AggregateStats& st) const {
  for (std::size_t i = 0; i < rows.size(); ++i) {
    const AssignmentRow& r = rows[i];
    const std::int64_t cell = cell_of_(r, first_row + i);
    if (cell < 0) {
      ++st.rows_skipped_stride;
      continue;
    }
    const double value = loading_(static_cast<std::size_t>(r.solute), static_cast<std::size_t>(r.shell));
    Combine::apply(out[cell], value);
    if (count) count[cell] += 1.0;
    ++st.rows_folded;
  }
}

template <class Combine>
void ChunkedAggregator::fold_parallel_(std::span<const AssignmentRow> rows, std::uint64_t first_row,
                                       std::vector<FieldArray>& outs, std::vector<FieldArray>& counts,
                                       AggregateStats& st) const {
#if SOLVLOAD_HAS_OPENMP
  const std::int64_t n = static_cast<std::int64_t>(rows.size());
  const bool with_count = !counts.empty();
  std::int64_t first_bad = n;
  std::uint64_t folded = 0;
  std::uint64_t skipped = 0;

  // Exceptions must not cross the parallel region: validate without throwing,
  // then rethrow for the first offending row below.
  #pragma omp parallel num_threads(static_cast<int>(outs.size())) reduction(+:folded, skipped) reduction(min:first_bad)
  {
    const std::size_t tid = static_cast<std::size_t>(omp_get_thread_num());
    double* out = outs[tid].data().data();
    double* count = with_count ? counts[tid].data().data() : nullptr;

    #pragma omp for schedule(static)
    for (std::int64_t i = 0; i < n; ++i) {
      const AssignmentRow& r = rows[static_cast<std::size_t>(i)];
      if (!in_range_(r)) {
        first_bad = std::min(first_bad, i);
        continue;
      }
      const std::size_t frame = static_cast<std::size_t>(r.frame);
      const std::size_t out_row = frame / opt_.stride;
      if (frame % opt_.stride != 0 || out_row >= n_rows()) {
        ++skipped;
        continue;
      }
      const std::size_t cell = out_row * n_atoms_ + static_cast<std::size_t>(map_[static_cast<std::size_t>(r.solvent)]);
      const double value = loading_(static_cast<std::size_t>(r.solute), static_cast<std::size_t>(r.shell));
      Combine::apply(out[cell], value);
      if (count) count[cell] += 1.0;
      ++folded;
    }
  }

  if (first_bad < n) {
    raise_out_of_range_(rows[static_cast<std::size_t>(first_bad)], first_row + static_cast<std::uint64_t>(first_bad));
  }
  st.rows_folded += folded;
  st.rows_skipped_stride += skipped;
#else
  fold_<Combine>(rows, first_row, outs[0].data().data(), counts.empty() ? nullptr : counts[0].data().data(), st);
#endif
}

void ChunkedAggregator::dispatch_(std::span<const AssignmentRow> rows, std::uint64_t first_row,
                                  std::vector<FieldArray>& outs, std::vector<FieldArray>& counts,
                                  AggregateStats& st) const {
  const bool parallel = outs.size() > 1;
  double* out = outs[0].data().data();
  double* count = counts.empty() ? nullptr : counts[0].data().data();

  switch (opt_.policy) {
    case AggregationPolicy::Sum:
      if (parallel) fold_parallel_<SumCombine>(rows, first_row, outs, counts, st);
      else fold_<SumCombine>(rows, first_row, out, nullptr, st);
      return;
    case AggregationPolicy::Max:
      if (parallel) fold_parallel_<MaxCombine>(rows, first_row, outs, counts, st);
      else fold_<MaxCombine>(rows, first_row, out, nullptr, st);
      return;
    case AggregationPolicy::Avg:
      if (parallel) fold_parallel_<AvgCombine>(rows, first_row, outs, counts, st);
      else fold_<AvgCombine>(rows, first_row, out, count, st);
      return;
  }
  throw UnknownAggregationPolicy(std::to_string(static_cast<int>(opt_.policy)));
}

void ChunkedAggregator::merge_partials_(std::vector<FieldArray>& outs, std::vector<FieldArray>& counts) const {
  std::vector<double>& total = outs[0].data();
  for (std::size_t t = 1; t < outs.size(); ++t) {
    const std::vector<double>& part = outs[t].data();
    switch (opt_.policy) {
      case AggregationPolicy::Sum:
        for (std::size_t i = 0; i < total.size(); ++i) SumCombine::apply(total[i], part[i]);
        break;
      case AggregationPolicy::Max:
        for (std::size_t i = 0; i < total.size(); ++i) MaxCombine::apply(total[i], part[i]);
        break;
      case AggregationPolicy::Avg:
        for (std::size_t i = 0; i < total.size(); ++i) AvgCombine::apply(total[i], part[i]);
        break;
    }
    outs[t] = FieldArray{};
  }
  for (std::size_t t = 1; t < counts.size(); ++t) {
    std::vector<double>& ctotal = counts[0].data();
    const std::vector<double>& cpart = counts[t].data();
    for (std::size_t i = 0; i < ctotal.size(); ++i) ctotal[i] += cpart[i];
    counts[t] = FieldArray{};
  }
}

void ChunkedAggregator::finalize_(FieldArray& out, const FieldArray* count) const {
  std::vector<double>& v = out.data();
  if (opt_.policy == AggregationPolicy::Avg) {
    const std::vector<double>& c = count->data();
    for (std::size_t i = 0; i < v.size(); ++i) {
      v[i] = (c[i] > 0.0) ? v[i] / c[i] : 0.0;
    }
  } else if (opt_.policy == AggregationPolicy::Max && std::isinf(opt_.max_floor)) {
    for (double& x : v) {
      if (x == -std::numeric_limits<double>::infinity()) x = 0.0;
    }
  }
}

AggregateResult ChunkedAggregator::run(IAssignmentTable& table) const {
  int threads = 1;
#if SOLVLOAD_HAS_OPENMP
  threads = opt_.threads;
#endif

  const double init = (opt_.policy == AggregationPolicy::Max) ? opt_.max_floor : 0.0;
  const std::size_t nr = n_rows();

  std::vector<FieldArray> outs;
  std::vector<FieldArray> counts;
  outs.reserve(static_cast<std::size_t>(threads));
  for (int t = 0; t < threads; ++t) {
    outs.emplace_back(nr, n_atoms_, init);
    if (opt_.policy == AggregationPolicy::Avg) counts.emplace_back(nr, n_atoms_, 0.0);
  }

  AggregateResult res;
  res.stats.threads_used = threads;

  const std::uint64_t m = table.row_count();
  const std::uint64_t n_chunks = chunk_count(m, opt_.chunk_size);

  std::vector<AssignmentRow> chunk;
  for (std::uint64_t ci = 0; ci < n_chunks; ++ci) {
    if (stop_flag_ && *stop_flag_) {
      throw Cancelled("stopped before chunk " + std::to_string(ci) + " of " + std::to_string(n_chunks));
    }

    const std::uint64_t start = ci * opt_.chunk_size;
    const std::uint64_t end = std::min(m, start + opt_.chunk_size);
    table.read(start, end, chunk);
    if (chunk.size() != end - start) {
      throw std::runtime_error("ChunkedAggregator: table returned " + std::to_string(chunk.size()) +
                               " rows for range [" + std::to_string(start) + "," + std::to_string(end) + ")");
    }

    dispatch_(chunk, start, outs, counts, res.stats);
    ++res.stats.chunks_read;
    res.stats.rows_read += chunk.size();

    if (progress_) {
      progress_(ChunkProgress{ci, n_chunks, res.stats.rows_read, m});
    }
  }
  chunk.clear();
  chunk.shrink_to_fit();

  merge_partials_(outs, counts);
  finalize_(outs[0], counts.empty() ? nullptr : &counts[0]);
  res.field = std::move(outs[0]);
  return res;
}

} // namespace solvload::alg
