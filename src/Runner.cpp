#include "solvload/app/Runner.hpp"

#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "solvload/alg/ChunkedAggregator.hpp"
#include "solvload/alg/IndexTranslator.hpp"
#include "solvload/alg/LoadingExpander.hpp"
#include "solvload/core/AggregationPolicy.hpp"
#include "solvload/io/AssignmentFile.hpp"
#include "solvload/io/VectorFiles.hpp"
#include "solvload/output/FieldWriter.hpp"
#include "solvload/util/Timer.hpp"

namespace fs = std::filesystem;

namespace {
static volatile std::sig_atomic_t g_stop = 0;
static void handle_signal(int) { g_stop = 1; }

struct InputSpec {
  fs::path assignments;
  fs::path solvent_indices;
  fs::path pruned_indices; // empty = nothing pruned
  fs::path loading;
  std::size_t n_frames = 0;
  std::size_t n_atoms = 0;
  std::size_t n_solute = 0;
  std::size_t n_shells = 0;
};

struct OutputSpec {
  fs::path base;
  std::size_t stride = 1;
  std::string traj;
  std::string top;
  std::string user_threshold = "1";
};

std::size_t require_positive(const solvload::IniConfig& cfg, const std::string& section, const std::string& key) {
  const std::size_t v = cfg.get_size(section, key);
  if (v == 0) throw std::runtime_error(section + "." + key + " must be > 0");
  return v;
}

fs::path with_suffix(const fs::path& base, const char* ext) {
  fs::path p = base;
  p += ext;
  return p;
}

} // namespace

namespace solvload {

Runner::Runner(const IniConfig& cfg, RunOverrides ov) : cfg_(cfg), ov_(ov) {}

int Runner::run() {
  return run_impl_(false);
}

int Runner::validate_config() {
  return run_impl_(true);
}

int Runner::run_impl_(bool validate_only) {
  WallTimer total_timer;

  cfg_.require_known_sections({"input", "aggregate", "output", "general"});
  cfg_.require_known_keys("input", {"assignments", "solvent_indices", "pruned_indices", "loading",
                                    "n_frames", "n_atoms", "n_solute", "n_shells"});
  cfg_.require_known_keys("aggregate", {"policy", "chunk_size", "max_floor", "threads"});
  cfg_.require_known_keys("output", {"base", "stride", "traj", "top", "user_threshold"});
  cfg_.require_known_keys("general", {"profile", "verbose"});

  // --- Inputs ---
  InputSpec in;
  in.assignments = cfg_.get_path("input", "assignments");
  in.solvent_indices = cfg_.get_path("input", "solvent_indices");
  in.pruned_indices = cfg_.get_path("input", "pruned_indices", std::optional<std::string>(""));
  in.loading = cfg_.get_path("input", "loading");
  in.n_frames = require_positive(cfg_, "input", "n_frames");
  in.n_atoms = require_positive(cfg_, "input", "n_atoms");
  in.n_solute = require_positive(cfg_, "input", "n_solute");
  in.n_shells = require_positive(cfg_, "input", "n_shells");

  // --- Aggregation ---
  alg::AggregateOptions opt;
  opt.policy = parse_aggregation_policy(cfg_.get_string("aggregate", "policy", std::optional<std::string>("sum")));
  opt.chunk_size = cfg_.get_size("aggregate", "chunk_size", std::optional<std::size_t>(1000000));
  opt.max_floor = cfg_.get_double("aggregate", "max_floor", std::optional<double>(0.0));
  const std::int64_t threads_cfg = cfg_.get_int64("aggregate", "threads", std::optional<std::int64_t>(1));
  if (!ov_.threads && (threads_cfg < 1 || threads_cfg > std::numeric_limits<int>::max())) {
    throw std::runtime_error("aggregate.threads must be in [1," + std::to_string(std::numeric_limits<int>::max()) +
                             "], got " + std::to_string(threads_cfg));
  }
  opt.threads = ov_.threads ? *ov_.threads : static_cast<int>(threads_cfg);

  // --- Output ---
  OutputSpec out;
  out.base = cfg_.get_path("output", "base", std::optional<std::string>("trj"));
  out.stride = cfg_.get_size("output", "stride", std::optional<std::size_t>(1));
  out.traj = cfg_.get_string("output", "traj", std::optional<std::string>(""));
  out.top = cfg_.get_string("output", "top", std::optional<std::string>(""));
  out.user_threshold = cfg_.get_string("output", "user_threshold", std::optional<std::string>("1"));
  opt.stride = out.stride;

  const bool print_profile = cfg_.get_bool("general", "profile", std::optional<bool>(true));
  const bool verbose = cfg_.get_bool("general", "verbose", std::optional<bool>(false));

  if (out.traj.empty() != out.top.empty()) {
    std::cerr << "[SOLVLOAD] warning: output.traj and output.top must both be set to write a VMD script; "
              << "skipping script\n";
  }
#if !SOLVLOAD_HAS_OPENMP
  if (opt.threads > 1) {
    std::cerr << "[SOLVLOAD] warning: built without OpenMP; threads=" << opt.threads << " ignored\n";
  }
#endif

  // --- Load inputs and build the loading matrix ---
  WallTimer load_timer;
  const std::vector<std::int64_t> solvent_ind = read_index_file(in.solvent_indices);
  std::vector<std::int64_t> pruned;
  if (!in.pruned_indices.empty()) pruned = read_index_file(in.pruned_indices);
  const std::vector<double> loading = read_real_file(in.loading);

  const alg::IndexTranslator translator(in.n_solute, in.n_shells, pruned);
  const alg::LoadingExpander expander(translator);
  const FieldArray loading2d = expander.expand(loading);

  AssignmentFileReader table(in.assignments);
  const double load_seconds = load_timer.elapsed_seconds();

  // Constructing the aggregator validates the options before any chunk is read.
  alg::ChunkedAggregator agg(solvent_ind, loading2d, in.n_frames, in.n_atoms, opt);

  const fs::path dat_path = with_suffix(out.base, ".dat");
  const fs::path tcl_path = with_suffix(out.base, ".tcl");
  const bool want_script = !out.traj.empty() && !out.top.empty();

  if (validate_only) {
    std::cerr << "[SOLVLOAD] validation OK (assignment table not scanned)\n"
              << "         assignments=" << in.assignments.string() << " rows=" << table.row_count()
              << " chunks=" << alg::ChunkedAggregator::chunk_count(table.row_count(), opt.chunk_size) << "\n"
              << "         features=" << translator.n_features() << " kept=" << translator.kept_count()
              << " pruned=" << (translator.n_features() - translator.kept_count()) << "\n"
              << "         policy=" << aggregation_policy_name(opt.policy) << " field=" << agg.n_rows() << "x"
              << in.n_atoms << "\n"
              << "         would write: " << dat_path.string();
    if (want_script) std::cerr << ", " << tcl_path.string();
    std::cerr << "\n";
    return 0;
  }

  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);
  agg.set_stop_flag(&g_stop);
  agg.set_progress_callback([verbose](const alg::ChunkProgress& p) {
    const bool last = (p.chunk_index + 1 == p.n_chunks);
    if (!verbose && !last && (p.chunk_index % 10) != 0) return;
    std::cerr << "[SOLVLOAD] chunk " << (p.chunk_index + 1) << " / " << p.n_chunks
              << " (rows " << p.rows_done << " / " << p.rows_total << ")\n";
  });

  double aggregate_seconds = 0.0;
  alg::AggregateResult res;
  {
    ScopedTimer t(&aggregate_seconds);
    res = agg.run(table);
  }

  double write_seconds = 0.0;
  {
    ScopedTimer t(&write_seconds);
    if (dat_path.has_parent_path()) fs::create_directories(dat_path.parent_path());
    output::write_field_text(dat_path, res.field);

    if (want_script) {
      output::VmdScriptParams sp;
      sp.traj_fn = out.traj;
      sp.top_fn = out.top;
      sp.step = out.stride;
      sp.dat_fn = dat_path.filename().string();
      sp.user_threshold = out.user_threshold;
      output::write_vmd_script(tcl_path, sp);
    }
  }

  std::cerr << "[SOLVLOAD] wrote " << dat_path.string() << " (" << res.field.rows() << " frames x "
            << res.field.cols() << " atoms)\n";
  if (want_script) std::cerr << "[SOLVLOAD] wrote " << tcl_path.string() << "\n";

  if (print_profile) {
    const auto& st = res.stats;
    std::cerr << "[SOLVLOAD] profiling\n";
    std::cerr << "  wall_seconds: " << std::setprecision(6) << total_timer.elapsed_seconds() << "\n";
    std::cerr << "  load_seconds: " << load_seconds << "\n";
    std::cerr << "  aggregate_seconds: " << aggregate_seconds << "\n";
    std::cerr << "  write_seconds: " << write_seconds << "\n";
    std::cerr << "  policy: " << aggregation_policy_name(opt.policy) << " threads: " << st.threads_used << "\n";
    std::cerr << "  chunks: " << st.chunks_read << " rows_read: " << st.rows_read
              << " rows_folded: " << st.rows_folded << " rows_skipped_stride: " << st.rows_skipped_stride << "\n";
  }

  return 0;
}

} // namespace solvload
