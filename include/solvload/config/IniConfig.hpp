#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "solvload/util/Parse.hpp"

namespace solvload {

// Run configuration in INI form:
// - Sections: [name]
// - Key: key = value
// - Comments: lines starting with '#' or ';', and trailing " #" / " ;" comments
// - Values: raw strings; surrounding quotes (single/double) are stripped.
class IniConfig {
public:
  explicit IniConfig(const std::filesystem::path& file) : file_(file) {
    std::ifstream ifs(file_);
    if (!ifs) {
      throw std::runtime_error(err_prefix_() + "failed to open config");
    }
    parse_(ifs);
  }

  // In-memory config (tests, embedding). Relative paths resolve against
  // `base_dir`.
  static IniConfig from_string(const std::string& text, const std::filesystem::path& base_dir = ".") {
    IniConfig cfg;
    cfg.file_ = base_dir / "<string>";
    std::istringstream iss(text);
    cfg.parse_(iss);
    return cfg;
  }

  std::filesystem::path base_dir() const { return file_.parent_path(); }

  bool has_key(const std::string& section, const std::string& key) const {
    auto it = data_.find(section);
    if (it == data_.end()) return false;
    return it->second.find(key) != it->second.end();
  }

  std::string get_string(const std::string& section, const std::string& key,
                         const std::optional<std::string>& def = std::nullopt) const {
    if (auto v = get_raw_(section, key)) {
      return *v;
    }
    if (def) return *def;
    throw std::runtime_error(err_prefix_() + "missing required key '" + key + "' in section [" + section + "]");
  }

  // Relative paths are resolved against the config file's directory.
  std::filesystem::path get_path(const std::string& section, const std::string& key,
                                 const std::optional<std::string>& def = std::nullopt) const {
    std::filesystem::path p(get_string(section, key, def));
    if (p.empty() || p.is_absolute()) return p;
    return (base_dir() / p).lexically_normal();
  }

  std::int64_t get_int64(const std::string& section, const std::string& key,
                         const std::optional<std::int64_t>& def = std::nullopt) const {
    if (!has_key(section, key) && def) return *def;
    const std::string s = get_string(section, key);
    std::int64_t v = 0;
    if (!parse_int(s, v)) {
      throw std::runtime_error(err_prefix_() + "failed to parse int64 for " + section + "." + key + " from value: '" + s + "'");
    }
    return v;
  }

  std::size_t get_size(const std::string& section, const std::string& key,
                       const std::optional<std::size_t>& def = std::nullopt) const {
    if (!has_key(section, key) && def) return *def;
    const std::string s = get_string(section, key);
    std::uint64_t v = 0;
    if (!parse_int(s, v)) {
      throw std::runtime_error(err_prefix_() + "failed to parse size for " + section + "." + key + " from value: '" + s + "'");
    }
    return static_cast<std::size_t>(v);
  }

  // Accepts "inf" / "-inf".
  double get_double(const std::string& section, const std::string& key,
                    const std::optional<double>& def = std::nullopt) const {
    if (!has_key(section, key) && def) return *def;
    const std::string s = get_string(section, key);
    double v = 0.0;
    if (!parse_double(s, v)) {
      throw std::runtime_error(err_prefix_() + "failed to parse double for " + section + "." + key + " from value: '" + s + "'");
    }
    return v;
  }

  bool get_bool(const std::string& section, const std::string& key,
                const std::optional<bool>& def = std::nullopt) const {
    if (!has_key(section, key) && def) return *def;
    auto s = get_string(section, key);
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    throw std::runtime_error(err_prefix_() + "failed to parse bool for " + section + "." + key + " from value: '" + s + "'");
  }

  // Fail on keys not in `known` (typos would otherwise fall back to defaults).
  void require_known_keys(const std::string& section, std::initializer_list<std::string_view> known) const {
    auto it = data_.find(section);
    if (it == data_.end()) return;
    std::vector<std::string> keys;
    for (const auto& kv : it->second) keys.push_back(kv.first);
    std::sort(keys.begin(), keys.end());
    for (const auto& k : keys) {
      if (std::find(known.begin(), known.end(), std::string_view(k)) == known.end()) {
        throw std::runtime_error(err_prefix_() + "unknown key '" + k + "' in section [" + section + "]");
      }
    }
  }

  // Fail on sections not in `known`.
  void require_known_sections(std::initializer_list<std::string_view> known) const {
    for (const auto& kv : data_) {
      if (std::find(known.begin(), known.end(), std::string_view(kv.first)) == known.end()) {
        throw std::runtime_error(err_prefix_() + "unknown section [" + kv.first + "]");
      }
    }
  }

private:
  std::filesystem::path file_;
  std::unordered_map<std::string, std::unordered_map<std::string, std::string>> data_;

  IniConfig() = default;

  static std::string trim_(std::string s) {
    auto ws = [](unsigned char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; };
    std::size_t b = 0;
    while (b < s.size() && ws(static_cast<unsigned char>(s[b]))) ++b;
    std::size_t e = s.size();
    while (e > b && ws(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
  }

  static std::string strip_quotes_(std::string s) {
    if (s.size() >= 2) {
      const char a = s.front();
      const char b = s.back();
      if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
        return s.substr(1, s.size() - 2);
      }
    }
    return s;
  }

  // "value   # note" -> "value". A quoted value keeps its '#'.
  static std::string strip_inline_comment_(const std::string& s) {
    if (!s.empty() && (s.front() == '"' || s.front() == '\'')) {
      const std::size_t close = s.find(s.front(), 1);
      if (close != std::string::npos) return s.substr(0, close + 1);
      return s;
    }
    for (std::size_t i = 1; i < s.size(); ++i) {
      if ((s[i] == '#' || s[i] == ';') && (s[i - 1] == ' ' || s[i - 1] == '\t')) {
        return s.substr(0, i);
      }
    }
    return s;
  }

  std::string err_prefix_() const {
    return std::string("IniConfig[") + file_.string() + "]: ";
  }

  std::optional<std::string> get_raw_(const std::string& section, const std::string& key) const {
    auto it = data_.find(section);
    if (it == data_.end()) return std::nullopt;
    auto it2 = it->second.find(key);
    if (it2 == it->second.end()) return std::nullopt;
    return it2->second;
  }

  void parse_(std::istream& is) {
    std::string section;
    std::string line;
    std::size_t lineno = 0;

    while (std::getline(is, line)) {
      ++lineno;
      std::string s = trim_(line);
      if (s.empty()) continue;
      if (s[0] == '#' || s[0] == ';') continue;

      if (s.front() == '[' && s.back() == ']') {
        section = trim_(s.substr(1, s.size() - 2));
        if (section.empty()) {
          throw std::runtime_error(err_prefix_() + "empty section header at line " + std::to_string(lineno));
        }
        (void)data_[section];
        continue;
      }

      auto eq = s.find('=');
      if (eq == std::string::npos) {
        throw std::runtime_error(err_prefix_() + "expected key=value at line " + std::to_string(lineno) + ": " + s);
      }

      std::string key = trim_(s.substr(0, eq));
      std::string val = trim_(strip_inline_comment_(trim_(s.substr(eq + 1))));
      if (key.empty()) {
        throw std::runtime_error(err_prefix_() + "empty key at line " + std::to_string(lineno));
      }
      if (section.empty()) {
        throw std::runtime_error(err_prefix_() + "key outside any section at line " + std::to_string(lineno) + ": " + key);
      }
      if (has_key(section, key)) {
        throw std::runtime_error(err_prefix_() + "duplicate key '" + key + "' in section [" + section + "] at line " +
                                 std::to_string(lineno));
      }

      data_[section][key] = strip_quotes_(val);
    }
  }
};

} // namespace solvload
