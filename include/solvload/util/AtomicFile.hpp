#pragma once

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace solvload::util {
namespace fs = std::filesystem;

inline fs::path make_tmp_path(const fs::path& out_path) {
  fs::path tmp = out_path;
  tmp += ".tmp";
  return tmp;
}

// Rename a finished temporary over the target. A failed or cancelled run
// therefore never leaves a truncated output file behind the real name.
inline void atomic_rename_over(const fs::path& tmp_path, const fs::path& out_path) {
  std::error_code ec;
  fs::rename(tmp_path, out_path, ec);
  if (!ec) return;

  // Some filesystems refuse to rename over an existing path.
  fs::remove(out_path, ec);
  ec.clear();
  fs::rename(tmp_path, out_path, ec);
  if (ec) {
    throw std::runtime_error("atomic rename failed: '" + tmp_path.string() + "' -> '" + out_path.string() + "' (" + ec.message() + ")");
  }
}

// Write through `fn` into <out_path>.tmp, then rename over out_path. If `fn`
// throws, the temp file is removed and the exception propagates.
template <typename WriteFn>
inline void atomic_write_text(const fs::path& out_path, WriteFn&& fn) {
  const fs::path tmp = make_tmp_path(out_path);
  {
    std::ofstream ofs(tmp, std::ios::out | std::ios::trunc);
    if (!ofs) throw std::runtime_error("failed to open temp file for atomic write: " + tmp.string());
    try {
      fn(ofs);
    } catch (...) {
      ofs.close();
      std::error_code ec;
      fs::remove(tmp, ec);
      throw;
    }
    ofs.flush();
    if (!ofs) throw std::runtime_error("failed while writing temp file: " + tmp.string());
  }
  atomic_rename_over(tmp, out_path);
}

} // namespace solvload::util
