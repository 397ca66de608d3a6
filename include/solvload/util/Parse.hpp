#pragma once

#include <charconv>
#include <cstddef>
#include <limits>
#include <string_view>
#include <system_error>

namespace solvload {

inline bool is_ws(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Next whitespace-delimited token in [p, end). '#' starts a comment running to
// end of line. Returns false when the input is exhausted.
inline bool next_token(const char*& p, const char* end, std::string_view& tok) {
  while (p < end) {
    if (is_ws(*p)) {
      ++p;
    } else if (*p == '#') {
      while (p < end && *p != '\n') ++p;
    } else {
      break;
    }
  }
  if (p >= end) {
    tok = std::string_view{};
    return false;
  }
  const char* start = p;
  while (p < end && !is_ws(*p) && *p != '#') ++p;
  tok = std::string_view(start, static_cast<std::size_t>(p - start));
  return true;
}

template <typename IntT>
inline bool parse_int(std::string_view tok, IntT& value) {
  const char* b = tok.data();
  const char* e = tok.data() + tok.size();
  auto res = std::from_chars(b, e, value);
  return res.ec == std::errc{} && res.ptr == e;
}

// Accepts everything from_chars does plus "inf"/"-inf" spellings that numpy
// and python write.
inline bool parse_double(std::string_view tok, double& value) {
  if (tok == "inf" || tok == "+inf" || tok == "Infinity") {
    value = std::numeric_limits<double>::infinity();
    return true;
  }
  if (tok == "-inf" || tok == "-Infinity") {
    value = -std::numeric_limits<double>::infinity();
    return true;
  }
  if (!tok.empty() && tok.front() == '+') tok.remove_prefix(1);
  const char* b = tok.data();
  const char* e = tok.data() + tok.size();
  auto res = std::from_chars(b, e, value);
  return res.ec == std::errc{} && res.ptr == e;
}

} // namespace solvload
