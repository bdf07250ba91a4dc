#pragma once

#include <stdexcept>
#include <string>

namespace qtopo {

// Raised when an object would violate one of its construction invariants, or when
// two inputs that must agree (shapes, durations, schedules) do not.
class CompilationError : public std::runtime_error {
 public:
  explicit CompilationError(const std::string& what) : std::runtime_error(what) {}
};

// Raised for configurations that are well-formed but not supported yet.
class NotImplementedError : public std::logic_error {
 public:
  explicit NotImplementedError(const std::string& what) : std::logic_error(what) {}
};

// Raised when a qubit, record or per-k annotation is missing from a lookup table.
class LookupError : public std::out_of_range {
 public:
  explicit LookupError(const std::string& what) : std::out_of_range(what) {}
};

}  // namespace qtopo
