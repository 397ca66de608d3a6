#include "solvload/output/FieldWriter.hpp"

#include <charconv>
#include <stdexcept>
#include <system_error>

#include "solvload/util/AtomicFile.hpp"

namespace solvload::output {

const char* const kVmdScriptTemplate = R"TCL(
# Load in molecule
set mol [mol new {traj_fn} step {step} waitfor all]
mol addfile {top_fn} waitfor all

# Open data file
set sel [atomselect $mol all]
set nf [molinfo $mol get numframes]
set fp [open {dat_fn} r]
set line ""

# Each line of the data file corresponds to a frame
for {set i 0} {$i < $nf} {incr i} {
  gets $fp line
  $sel frame $i
  $sel set user $line
}

close $fp
$sel delete

# For convenience, set up representations as well

mol delrep 0 top

mol representation NewCartoon 0.3 10.0 4.1 0
mol color ColorID 4
mol selection {protein}
mol addrep top
mol smoothrep top 0 5


mol representation CPK 1.0 0.2 10.0 10.0
mol color User
mol selection {user > {user_threshold}}
mol addrep top
mol selupdate 1 top 1
mol colupdate 1 top 1
)TCL";

void write_field(std::ostream& os, const FieldArray& field) {
  char buf[64];
  std::string line;
  for (std::size_t r = 0; r < field.rows(); ++r) {
    line.clear();
    for (const double v : field.row(r)) {
      const auto res = std::to_chars(buf, buf + sizeof(buf), v);
      if (res.ec != std::errc{}) throw std::runtime_error("write_field: float formatting failed");
      line.append(buf, res.ptr);
      line.push_back(' ');
    }
    line.push_back('\n');
    os.write(line.data(), static_cast<std::streamsize>(line.size()));
    if (!os) throw std::runtime_error("write_field: write failed at row " + std::to_string(r));
  }
}

void write_field_text(const std::filesystem::path& path, const FieldArray& field) {
  util::atomic_write_text(path, [&](std::ostream& os) { write_field(os, field); });
}

std::string render_template(const std::string& tmpl, const std::map<std::string, std::string>& vars) {
  std::string out;
  out.reserve(tmpl.size() + 256);
  std::size_t i = 0;
  while (i < tmpl.size()) {
    if (tmpl[i] == '{') {
      const std::size_t close = tmpl.find('}', i + 1);
      if (close != std::string::npos) {
        auto it = vars.find(tmpl.substr(i + 1, close - i - 1));
        if (it != vars.end()) {
          out += it->second;
          i = close + 1;
          continue;
        }
      }
    }
    out.push_back(tmpl[i]);
    ++i;
  }
  return out;
}

std::string render_vmd_script(const VmdScriptParams& p) {
  if (p.step == 0) throw std::runtime_error("render_vmd_script: step must be > 0");
  return render_template(kVmdScriptTemplate, {
      {"traj_fn", p.traj_fn},
      {"top_fn", p.top_fn},
      {"step", std::to_string(p.step)},
      {"dat_fn", p.dat_fn},
      {"user_threshold", p.user_threshold},
  });
}

void write_vmd_script(const std::filesystem::path& path, const VmdScriptParams& p) {
  const std::string script = render_vmd_script(p);
  util::atomic_write_text(path, [&](std::ostream& os) { os << script; });
}

} // namespace solvload::output
