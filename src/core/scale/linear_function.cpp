#include "qtopo/core/scale/linear_function.h"

#include <functional>
#include <limits>
#include <numeric>
#include <stdexcept>

#include "qtopo/core/utils/errors.h"

namespace qtopo {

namespace {

std::int64_t checked_add(std::int64_t a, std::int64_t b) {
  std::int64_t result = 0;
  if (__builtin_add_overflow(a, b, &result)) {
    throw CompilationError("Overflow computing " + std::to_string(a) + " + " + std::to_string(b));
  }
  return result;
}

std::int64_t checked_mul(std::int64_t a, std::int64_t b) {
  std::int64_t result = 0;
  if (__builtin_mul_overflow(a, b, &result)) {
    throw CompilationError("Overflow computing " + std::to_string(a) + " * " + std::to_string(b));
  }
  return result;
}

std::int64_t checked_neg(std::int64_t a) {
  if (a == std::numeric_limits<std::int64_t>::min()) {
    throw CompilationError("Overflow negating " + std::to_string(a));
  }
  return -a;
}

}  // namespace

Fraction::Fraction(std::int64_t numerator, std::int64_t denominator) {
  if (denominator == 0) {
    throw std::invalid_argument("Fraction with a zero denominator");
  }
  if (denominator < 0) {
    numerator = checked_neg(numerator);
    denominator = checked_neg(denominator);
  }
  if (numerator == std::numeric_limits<std::int64_t>::min()) {
    throw CompilationError("Fraction numerator " + std::to_string(numerator) + " is out of range");
  }
  const std::int64_t divisor = std::gcd(numerator, denominator);
  numerator_ = divisor == 0 ? 0 : numerator / divisor;
  denominator_ = divisor == 0 ? 1 : denominator / divisor;
}

std::int64_t Fraction::to_integer() const {
  if (!is_integer()) {
    throw CompilationError("Expected an integer, got " + str());
  }
  return numerator_;
}

Fraction Fraction::operator+(const Fraction& other) const {
  const std::int64_t g = std::gcd(denominator_, other.denominator_);
  const std::int64_t common = checked_mul(denominator_ / g, other.denominator_);
  return Fraction(checked_add(checked_mul(numerator_, common / denominator_),
                              checked_mul(other.numerator_, common / other.denominator_)),
                  common);
}

Fraction Fraction::operator-(const Fraction& other) const { return *this + (-other); }

Fraction Fraction::operator-() const { return Fraction(checked_neg(numerator_), denominator_); }

Fraction Fraction::operator*(const Fraction& other) const {
  // Cross-reduce first to keep intermediate products small.
  const std::int64_t g1 = std::gcd(numerator_, other.denominator_);
  const std::int64_t g2 = std::gcd(other.numerator_, denominator_);
  const std::int64_t a = g1 == 0 ? numerator_ : numerator_ / g1;
  const std::int64_t d = g1 == 0 ? other.denominator_ : other.denominator_ / g1;
  const std::int64_t c = g2 == 0 ? other.numerator_ : other.numerator_ / g2;
  const std::int64_t b = g2 == 0 ? denominator_ : denominator_ / g2;
  return Fraction(checked_mul(a, c), checked_mul(b, d));
}

Fraction Fraction::operator/(const Fraction& other) const {
  if (other.numerator_ == 0) {
    throw std::invalid_argument("Division by zero");
  }
  return *this * Fraction(other.denominator_, other.numerator_);
}

bool Fraction::operator<(const Fraction& other) const {
  // Denominators are positive, so cross products order the values without overflow.
  return static_cast<__int128>(numerator_) * other.denominator_ <
         static_cast<__int128>(other.numerator_) * denominator_;
}

std::string Fraction::str() const {
  if (is_integer()) {
    return std::to_string(numerator_);
  }
  return std::to_string(numerator_) + "/" + std::to_string(denominator_);
}

std::int64_t LinearFunction::integer_eval(std::int64_t k) const {
  const Fraction value = (*this)(k);
  if (!value.is_integer()) {
    throw CompilationError("Evaluating " + str() + " at k=" + std::to_string(k) +
                           " does not give an integer");
  }
  return value.numerator();
}

LinearFunction LinearFunction::exact_integer_div(std::int64_t div) const {
  if (div == 0) {
    throw CompilationError("Cannot divide " + str() + " by zero");
  }
  const Fraction slope = slope_ / Fraction(div);
  const Fraction offset = offset_ / Fraction(div);
  if (!slope.is_integer() || !offset.is_integer()) {
    throw CompilationError("Cannot divide " + str() + " by " + std::to_string(div) +
                           " exactly: the result would have non-integer coefficients");
  }
  return {slope, offset};
}

bool LinearFunction::operator<(const LinearFunction& other) const {
  if (slope_ != other.slope_) {
    return slope_ < other.slope_;
  }
  return offset_ < other.offset_;
}

std::string LinearFunction::str() const {
  if (is_constant()) {
    return offset_.str();
  }
  std::string out = slope_.str() + "*k";
  if (offset_ < Fraction(0)) {
    out += " - " + (-offset_).str();
  } else if (offset_ != Fraction(0)) {
    out += " + " + offset_.str();
  }
  return out;
}

LinearFunction operator*(const Fraction& factor, const LinearFunction& f) { return f * factor; }

LinearFunction safe_mul(const LinearFunction& a, const LinearFunction& b) {
  if (a.is_constant()) {
    return b * a.offset();
  }
  if (b.is_constant()) {
    return a * b.offset();
  }
  throw CompilationError("Multiplying " + a.str() + " by " + b.str() +
                         " would not give a linear function");
}

LinearFunction unambiguous_max_on_positives(const std::vector<LinearFunction>& functions) {
  if (functions.empty()) {
    throw CompilationError("Cannot take the maximum of an empty list of functions");
  }
  // On k >= 1, f >= g everywhere iff f(1) >= g(1) and slope(f) >= slope(g).
  const LinearFunction* best = &functions.front();
  for (const LinearFunction& f : functions) {
    if (f(1) >= (*best)(1) && f.slope() >= best->slope()) {
      best = &f;
    }
  }
  for (const LinearFunction& f : functions) {
    if (f(1) > (*best)(1) || f.slope() > best->slope()) {
      throw CompilationError("No unambiguous maximum on positive integers: " + f.str() + " and " +
                             best->str() + " cross");
    }
  }
  return *best;
}

LinearFunction sum(const std::vector<LinearFunction>& functions) {
  LinearFunction total;
  for (const LinearFunction& f : functions) {
    total = total + f;
  }
  return total;
}

std::size_t LinearFunctionHash::operator()(const LinearFunction& f) const noexcept {
  std::size_t seed = std::hash<std::int64_t>{}(f.slope().numerator());
  auto mix = [&seed](std::int64_t v) {
    seed ^= std::hash<std::int64_t>{}(v) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
  };
  mix(f.slope().denominator());
  mix(f.offset().numerator());
  mix(f.offset().denominator());
  return seed;
}

}  // namespace qtopo
