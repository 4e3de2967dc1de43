#pragma once
#include <stdexcept>
#include <string>

namespace rxs {

// Malformed pattern tree, reported by Regex::compile / validate
struct PatternError : std::invalid_argument {
  explicit PatternError(const std::string& what) : std::invalid_argument("pattern error: " + what) {}
};

// The trace handed to the builder contradicts the shape (engine/builder defect)
struct InternalError : std::logic_error {
  explicit InternalError(const std::string& what) : std::logic_error("internal error: " + what) {}
};

// No such named capture, position out of range, or wrong accessor for the slot
struct CaptureLookupError : std::out_of_range {
  explicit CaptureLookupError(const std::string& what) : std::out_of_range(what) {}
};

} // namespace rxs
