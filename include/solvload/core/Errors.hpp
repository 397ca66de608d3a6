#pragma once

#include <stdexcept>
#include <string>

namespace solvload {

// Error taxonomy. Everything derives from std::runtime_error so callers that
// only care about "the run failed" can catch that, while tests and the CLI can
// distinguish the conditions.

// Loading-vector length (or matrix shape) disagrees with the pruned index set.
class DimensionMismatch : public std::runtime_error {
public:
  explicit DimensionMismatch(const std::string& msg)
      : std::runtime_error("DimensionMismatch: " + msg) {}
};

// An index (frame, atom, solvent-local, solute, shell, pruned) outside the
// allocated arrays. Always fatal: clipping would silently corrupt the field.
class IndexOutOfRange : public std::runtime_error {
public:
  explicit IndexOutOfRange(const std::string& msg)
      : std::runtime_error("IndexOutOfRange: " + msg) {}
};

class UnknownAggregationPolicy : public std::runtime_error {
public:
  explicit UnknownAggregationPolicy(const std::string& name)
      : std::runtime_error("UnknownAggregationPolicy: '" + name + "' (use sum|max|avg)") {}
};

// Stop flag observed between chunks.
class Cancelled : public std::runtime_error {
public:
  explicit Cancelled(const std::string& msg)
      : std::runtime_error("Cancelled: " + msg) {}
};

} // namespace solvload
