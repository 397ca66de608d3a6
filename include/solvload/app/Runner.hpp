#pragma once

#include <filesystem>
#include <optional>

#include "solvload/config/IniConfig.hpp"

namespace solvload {

// Command-line overrides applied on top of the config file.
struct RunOverrides {
  std::optional<int> threads;
};

// Runner: main() only handles the CLI, then calls Runner(cfg).run().
//
// Pipeline: read inputs -> translate pruned indices -> expand loading ->
// stream assignments into the field -> write <base>.dat (+ <base>.tcl).
class Runner {
public:
  explicit Runner(const IniConfig& cfg, RunOverrides ov = {});

  // Execute the run. Returns 0 on success; errors are thrown.
  int run();

  // Load and cross-check every input (including the loading vector against
  // the pruned set) without scanning the assignment table or writing output.
  int validate_config();

private:
  const IniConfig& cfg_;
  RunOverrides ov_;

  int run_impl_(bool validate_only);
};

} // namespace solvload
