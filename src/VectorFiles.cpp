#include "solvload/io/VectorFiles.hpp"

#include <cmath>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include "solvload/io/AssignmentFile.hpp"
#include "solvload/util/Parse.hpp"

namespace solvload {

namespace fs = std::filesystem;

namespace {

std::string slurp(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw std::runtime_error("failed to open file: " + path.string());
  std::string s((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  if (ifs.bad()) throw std::runtime_error("failed while reading file: " + path.string());
  return s;
}

} // namespace

std::vector<std::int64_t> parse_index_list(std::string_view text, const std::string& what) {
  std::vector<std::int64_t> out;
  const char* p = text.data();
  const char* end = p + text.size();
  std::string_view tok;
  while (next_token(p, end, tok)) {
    std::int64_t v = 0;
    if (!parse_int(tok, v)) {
      throw std::runtime_error(what + ": failed to parse integer '" + std::string(tok) + "' at item " +
                               std::to_string(out.size()));
    }
    if (v < 0) {
      throw std::runtime_error(what + ": negative index " + std::to_string(v) + " at item " + std::to_string(out.size()));
    }
    out.push_back(v);
  }
  return out;
}

std::vector<std::int64_t> read_index_file(const fs::path& path) {
  return parse_index_list(slurp(path), path.string());
}

std::vector<double> parse_real_list(std::string_view text, const std::string& what) {
  std::vector<double> out;
  const char* p = text.data();
  const char* end = p + text.size();
  std::string_view tok;
  while (next_token(p, end, tok)) {
    double v = 0.0;
    if (!parse_double(tok, v) || !std::isfinite(v)) {
      throw std::runtime_error(what + ": failed to parse finite real '" + std::string(tok) + "' at item " +
                               std::to_string(out.size()));
    }
    out.push_back(v);
  }
  return out;
}

std::vector<double> read_real_file(const fs::path& path) {
  return parse_real_list(slurp(path), path.string());
}

std::uint64_t pack_assignment_text(const fs::path& in_txt, const fs::path& out_assn) {
  std::ifstream ifs(in_txt);
  if (!ifs) throw std::runtime_error("failed to open file: " + in_txt.string());

  AssignmentFileWriter writer(out_assn);
  std::vector<AssignmentRow> buf;
  buf.reserve(1 << 16);

  std::string line;
  std::size_t lineno = 0;
  while (std::getline(ifs, line)) {
    ++lineno;
    const char* p = line.data();
    const char* end = p + line.size();
    std::string_view tok;
    std::int32_t cols[4] = {0, 0, 0, 0};
    int n = 0;
    while (next_token(p, end, tok)) {
      if (n >= 4) {
        throw std::runtime_error(in_txt.string() + ": more than 4 columns at line " + std::to_string(lineno));
      }
      if (!parse_int(tok, cols[n]) || cols[n] < 0) {
        throw std::runtime_error(in_txt.string() + ": bad index '" + std::string(tok) + "' at line " +
                                 std::to_string(lineno));
      }
      ++n;
    }
    if (n == 0) continue;
    if (n != 4) {
      throw std::runtime_error(in_txt.string() + ": expected 4 columns (frame solvent solute shell) at line " +
                               std::to_string(lineno));
    }
    buf.push_back(AssignmentRow{cols[0], cols[1], cols[2], cols[3]});
    if (buf.size() == buf.capacity()) {
      writer.append(buf);
      buf.clear();
    }
  }
  if (ifs.bad()) throw std::runtime_error("failed while reading file: " + in_txt.string());

  writer.append(buf);
  writer.close();
  return writer.rows_written();
}

} // namespace solvload
