#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <ostream>
#include <string>

#include "solvload/core/FieldArray.hpp"

namespace solvload::output {

// Per-atom field as text: one line per output row (frame), every value
// followed by a single space, then '\n'. Values use the shortest decimal
// representation that round-trips to the same double.
void write_field(std::ostream& os, const FieldArray& field);

// Atomic (temp + rename) file variant of write_field().
void write_field_text(const std::filesystem::path& path, const FieldArray& field);

struct VmdScriptParams {
  std::string traj_fn;
  std::string top_fn;
  std::size_t step = 1;
  std::string dat_fn;            // basename of the field file
  std::string user_threshold = "1";
};

// TCL template with {traj_fn} {top_fn} {step} {dat_fn} {user_threshold}.
extern const char* const kVmdScriptTemplate;

// Replace every {name} whose name is a key of `vars`; other braces are left
// untouched (TCL uses them heavily).
std::string render_template(const std::string& tmpl, const std::map<std::string, std::string>& vars);

std::string render_vmd_script(const VmdScriptParams& p);

void write_vmd_script(const std::filesystem::path& path, const VmdScriptParams& p);

} // namespace solvload::output
