#include "solvload/io/AssignmentFile.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <system_error>

#include "solvload/util/AtomicFile.hpp"
#include "solvload/util/BinaryIO.hpp"

namespace solvload {

namespace fs = std::filesystem;

namespace {

inline std::runtime_error die(const fs::path& path, const std::string& msg) {
  return std::runtime_error("AssignmentFile[" + path.string() + "]: " + msg);
}

constexpr std::uint64_t kRowBytes = sizeof(AssignmentRow);

} // namespace

AssignmentFileReader::AssignmentFileReader(const fs::path& path)
    : path_(path), ifs_(path, std::ios::binary) {
  if (!ifs_) {
    throw die(path_, "failed to open file");
  }

  util::require_magic(ifs_, kAssignmentMagic, "AssignmentFile[" + path_.string() + "]");
  util::BinaryReader r(ifs_);
  const std::uint32_t ver = r.read_u32();
  if (ver != kAssignmentVersion) {
    throw die(path_, "unsupported version " + std::to_string(ver));
  }
  rows_ = r.read_u64();

  std::error_code ec;
  const std::uintmax_t size = fs::file_size(path_, ec);
  if (ec) throw die(path_, "cannot stat file (" + ec.message() + ")");
  if (rows_ > (UINT64_MAX - kAssignmentHeaderBytes) / kRowBytes) {
    throw die(path_, "row count " + std::to_string(rows_) + " in header is not representable (corrupt header?)");
  }
  const std::uint64_t expect = kAssignmentHeaderBytes + rows_ * kRowBytes;
  if (static_cast<std::uint64_t>(size) != expect) {
    throw die(path_, "size " + std::to_string(size) + " bytes does not match " + std::to_string(rows_) +
                     " rows (expected " + std::to_string(expect) + " bytes; truncated?)");
  }
}

void AssignmentFileReader::read(std::uint64_t start, std::uint64_t end, std::vector<AssignmentRow>& out) {
  if (start > rows_) {
    throw die(path_, "start row " + std::to_string(start) + " beyond row count " + std::to_string(rows_));
  }
  if (end > rows_) end = rows_;
  if (end < start) end = start;

  const std::uint64_t n = end - start;
  out.resize(static_cast<std::size_t>(n));
  if (n == 0) return;

  ifs_.clear();
  ifs_.seekg(static_cast<std::streamoff>(kAssignmentHeaderBytes + start * kRowBytes), std::ios::beg);
  if (!ifs_) throw die(path_, "seek to row " + std::to_string(start) + " failed");

  util::BinaryReader r(ifs_);
  r.read_array(out.data(), out.size());
}

AssignmentFileWriter::AssignmentFileWriter(const fs::path& path)
    : path_(path), tmp_path_(util::make_tmp_path(path)), ofs_(tmp_path_, std::ios::binary | std::ios::trunc) {
  if (!ofs_) {
    throw die(path_, "failed to open temp file for writing: " + tmp_path_.string());
  }
  util::write_magic(ofs_, kAssignmentMagic);
  util::BinaryWriter w(ofs_);
  w.write_u32(kAssignmentVersion);
  w.write_u64(0); // patched by close()
}

AssignmentFileWriter::~AssignmentFileWriter() {
  if (closed_) return;
  ofs_.close();
  std::error_code ec;
  fs::remove(tmp_path_, ec);
}

void AssignmentFileWriter::append(const AssignmentRow& row) {
  if (closed_) throw die(path_, "append after close");
  util::BinaryWriter w(ofs_);
  w.write_pod(row);
  ++rows_;
}

void AssignmentFileWriter::append(const std::vector<AssignmentRow>& rows) {
  if (closed_) throw die(path_, "append after close");
  util::BinaryWriter w(ofs_);
  w.write_array(rows.data(), rows.size());
  rows_ += rows.size();
}

void AssignmentFileWriter::close() {
  if (closed_) return;
  ofs_.seekp(static_cast<std::streamoff>(8 + 4), std::ios::beg);
  if (!ofs_) throw die(path_, "seek to header failed");
  util::BinaryWriter w(ofs_);
  w.write_u64(rows_);
  ofs_.flush();
  if (!ofs_) throw die(path_, "failed while finishing " + tmp_path_.string());
  ofs_.close();
  util::atomic_rename_over(tmp_path_, path_);
  closed_ = true;
}

} // namespace solvload
