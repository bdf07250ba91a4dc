#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "qtopo/core/geometry/position.h"

namespace qtopo {

// Exact rational number with a positive denominator, always stored reduced. Arithmetic
// that leaves the 64-bit range throws CompilationError.
class Fraction {
 public:
  Fraction(std::int64_t numerator = 0, std::int64_t denominator = 1);

  std::int64_t numerator() const noexcept { return numerator_; }
  std::int64_t denominator() const noexcept { return denominator_; }

  bool is_integer() const noexcept { return denominator_ == 1; }
  // Throws CompilationError if the value is not an integer.
  std::int64_t to_integer() const;
  double to_double() const noexcept { return static_cast<double>(numerator_) / static_cast<double>(denominator_); }

  Fraction operator+(const Fraction& other) const;
  Fraction operator-(const Fraction& other) const;
  Fraction operator*(const Fraction& other) const;
  Fraction operator/(const Fraction& other) const;
  Fraction operator-() const;

  bool operator==(const Fraction& other) const noexcept {
    return numerator_ == other.numerator_ && denominator_ == other.denominator_;
  }
  bool operator!=(const Fraction& other) const noexcept { return !(*this == other); }
  bool operator<(const Fraction& other) const;
  bool operator>(const Fraction& other) const { return other < *this; }
  bool operator<=(const Fraction& other) const { return !(other < *this); }
  bool operator>=(const Fraction& other) const { return !(*this < other); }

  std::string str() const;

 private:
  std::int64_t numerator_;
  std::int64_t denominator_;
};

// f(k) = slope * k + offset, the scaling law of every size and duration in a computation.
class LinearFunction {
 public:
  LinearFunction(Fraction slope = 0, Fraction offset = 0)
      : slope_(slope), offset_(offset) {}

  const Fraction& slope() const noexcept { return slope_; }
  const Fraction& offset() const noexcept { return offset_; }

  Fraction operator()(std::int64_t k) const { return slope_ * Fraction(k) + offset_; }
  // Throws CompilationError if f(k) is not an integer.
  std::int64_t integer_eval(std::int64_t k) const;

  LinearFunction operator+(const LinearFunction& other) const {
    return {slope_ + other.slope_, offset_ + other.offset_};
  }
  LinearFunction operator-(const LinearFunction& other) const {
    return {slope_ - other.slope_, offset_ - other.offset_};
  }
  LinearFunction operator*(const Fraction& factor) const { return {slope_ * factor, offset_ * factor}; }
  LinearFunction operator-() const { return {-slope_, -offset_}; }

  // f / div, failing with CompilationError unless both coefficients stay integral.
  LinearFunction exact_integer_div(std::int64_t div) const;

  bool is_constant() const noexcept { return slope_.numerator() == 0; }
  bool is_scalable() const noexcept { return !is_constant(); }

  bool operator==(const LinearFunction& other) const noexcept {
    return slope_ == other.slope_ && offset_ == other.offset_;
  }
  bool operator!=(const LinearFunction& other) const noexcept { return !(*this == other); }
  // Lexicographic on (slope, offset); only meant for ordered containers.
  bool operator<(const LinearFunction& other) const;

  std::string str() const;

 private:
  Fraction slope_;
  Fraction offset_;
};

LinearFunction operator*(const Fraction& factor, const LinearFunction& f);

// Product of two linear functions, at least one of which must be constant.
LinearFunction safe_mul(const LinearFunction& a, const LinearFunction& b);

// Function that is >= every other one for all k >= 1. Throws CompilationError when the
// maximum changes with k or when the input is empty.
LinearFunction unambiguous_max_on_positives(const std::vector<LinearFunction>& functions);

// Sum of a schedule of durations.
LinearFunction sum(const std::vector<LinearFunction>& functions);

struct LinearFunctionHash {
  std::size_t operator()(const LinearFunction& f) const noexcept;
};

// Pair of linear functions describing a 2D size in plaquettes or qubits.
struct Scalable2D {
  LinearFunction x;
  LinearFunction y;

  Shape2D to_shape_2d(std::int64_t k) const { return {x.integer_eval(k), y.integer_eval(k)}; }

  Scalable2D operator+(const Scalable2D& other) const { return {x + other.x, y + other.y}; }
  Scalable2D operator-(const Scalable2D& other) const { return {x - other.x, y - other.y}; }
  bool operator==(const Scalable2D& other) const noexcept { return x == other.x && y == other.y; }
  bool operator!=(const Scalable2D& other) const noexcept { return !(*this == other); }
  std::string str() const { return "(" + x.str() + ", " + y.str() + ")"; }
};

using ScalableShape2D = Scalable2D;

}  // namespace qtopo
