#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "solvload/io/AssignmentTable.hpp"

namespace solvload {

// Binary assignment store (.assn).
//
// Layout (host endian):
//   char[8]  "SOLVASSN"
//   u32      version (=1)
//   u64      row count M
//   M x {i32 frame, i32 solvent, i32 solute, i32 shell}
inline constexpr const char* kAssignmentMagic = "SOLVASSN";
inline constexpr std::uint32_t kAssignmentVersion = 1;
inline constexpr std::uint64_t kAssignmentHeaderBytes = 8 + 4 + 8;

class AssignmentFileReader final : public IAssignmentTable {
public:
  // Validates header and that the file size matches the declared row count.
  explicit AssignmentFileReader(const std::filesystem::path& path);

  std::uint64_t row_count() const override { return rows_; }

  void read(std::uint64_t start, std::uint64_t end, std::vector<AssignmentRow>& out) override;

private:
  std::filesystem::path path_;
  std::ifstream ifs_;
  std::uint64_t rows_ = 0;
};

// Streams rows into a new .assn file. The row count in the header is patched
// by close(); a writer destroyed without close() leaves no file behind.
class AssignmentFileWriter {
public:
  explicit AssignmentFileWriter(const std::filesystem::path& path);
  ~AssignmentFileWriter();

  AssignmentFileWriter(const AssignmentFileWriter&) = delete;
  AssignmentFileWriter& operator=(const AssignmentFileWriter&) = delete;

  void append(const AssignmentRow& row);
  void append(const std::vector<AssignmentRow>& rows);

  std::uint64_t rows_written() const { return rows_; }

  void close();

private:
  std::filesystem::path path_;
  std::filesystem::path tmp_path_;
  std::ofstream ofs_;
  std::uint64_t rows_ = 0;
  bool closed_ = false;
};

} // namespace solvload
