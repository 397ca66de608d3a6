#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace solvload {

// Plain-text inputs: whitespace-separated values, '#' comments.

// Non-negative integers (solvent-index map, pruned index set).
// `what` names the input in error messages.
std::vector<std::int64_t> parse_index_list(std::string_view text, const std::string& what);
std::vector<std::int64_t> read_index_file(const std::filesystem::path& path);

// Finite reals (loading vector).
std::vector<double> parse_real_list(std::string_view text, const std::string& what);
std::vector<double> read_real_file(const std::filesystem::path& path);

// Convert a text assignment table (4 integers per line:
// frame solvent solute shell) into the binary .assn format. Returns the number
// of rows written.
std::uint64_t pack_assignment_text(const std::filesystem::path& in_txt,
                                   const std::filesystem::path& out_assn);

} // namespace solvload
