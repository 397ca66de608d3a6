#pragma once

#include <algorithm>
#include <cctype>
#include <string>

#include "solvload/core/Errors.hpp"

namespace solvload {

// How repeated assignments to the same (frame, atom) cell combine.
//
// Sum: cell += value
// Max: cell = max(cell, value), starting from a configurable floor
// Avg: cell += value, count += 1; cells are divided by count at the end
enum class AggregationPolicy {
  Sum = 0,
  Max = 1,
  Avg = 2,
};

// "add" is accepted as an alias of "sum".
inline AggregationPolicy parse_aggregation_policy(std::string s) {
  for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
  if (s == "sum" || s == "add") return AggregationPolicy::Sum;
  if (s == "max") return AggregationPolicy::Max;
  if (s == "avg") return AggregationPolicy::Avg;
  throw UnknownAggregationPolicy(s);
}

inline std::string aggregation_policy_name(AggregationPolicy p) {
  switch (p) {
    case AggregationPolicy::Sum: return "sum";
    case AggregationPolicy::Max: return "max";
    case AggregationPolicy::Avg: return "avg";
  }
  return "sum";
}

// Combine functions. These are also used to merge per-thread partial arrays,
// so a partial cell is combined into the total exactly like a single value.
struct SumCombine {
  static void apply(double& cell, double value) { cell += value; }
};

struct MaxCombine {
  static void apply(double& cell, double value) { cell = std::max(cell, value); }
};

// Avg accumulates like Sum; the division happens once after the last chunk.
struct AvgCombine {
  static void apply(double& cell, double value) { cell += value; }
};

} // namespace solvload
