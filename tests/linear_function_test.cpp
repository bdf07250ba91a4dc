#include "qtopo/core/scale/linear_function.h"
#include "qtopo/core/utils/errors.h"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

template <typename Fn>
bool throws_compilation_error(Fn&& fn) {
  try {
    fn();
  } catch (const qtopo::CompilationError&) {
    return true;
  }
  return false;
}

}  // namespace

int main() {
  using namespace qtopo;

  const LinearFunction f(2, 3);
  const LinearFunction g(-1, 5);
  for (std::int64_t k = 0; k < 6; ++k) {
    expect((f + g)(k) == f(k) + g(k), "(f + g)(k) must equal f(k) + g(k)");
    expect((f - g)(k) == f(k) - g(k), "(f - g)(k) must equal f(k) - g(k)");
  }
  expect(f.integer_eval(2) == 7, "2k + 3 at k = 2 must be 7");

  const LinearFunction even(4, 6);
  const LinearFunction halved = even.exact_integer_div(2);
  expect(halved == LinearFunction(2, 3), "(4k + 6) / 2 must be 2k + 3");
  expect(halved * Fraction(2) == even, "Exact division must round trip");
  expect(throws_compilation_error([&] { f.exact_integer_div(2); }), "(2k + 3) / 2 must fail");

  expect(LinearFunction(0, 4).is_constant(), "Zero slope is constant");
  expect(!f.is_constant(), "Non-zero slope is not constant");
  expect(LinearFunction(Fraction(1, 2), 0).is_scalable(), "Fractional slope is scalable");

  expect(safe_mul(LinearFunction(0, 3), f) == LinearFunction(6, 9), "3 * (2k + 3) must be 6k + 9");
  expect(throws_compilation_error([&] { safe_mul(f, f); }), "Product of two scalable functions must fail");

  expect(unambiguous_max_on_positives({LinearFunction(0, 1), LinearFunction(1, 2)}) == LinearFunction(1, 2),
         "k + 2 dominates 1 on positive k");
  expect(throws_compilation_error([] {
           unambiguous_max_on_positives({LinearFunction(0, 3), LinearFunction(1, 0)});
         }),
         "3 and k cross on positive k");

  expect(sum({LinearFunction(0, 1), LinearFunction(2, -1), LinearFunction(0, 1)}) == LinearFunction(2, 1),
         "Schedule 1 + (2k - 1) + 1 must last 2k + 1");

  // Results outside the 64-bit range are rejected instead of wrapping around.
  const std::int64_t big = std::int64_t{1} << 62;
  const std::int64_t max = std::numeric_limits<std::int64_t>::max();
  expect(throws_compilation_error([&] { LinearFunction(big, 0) + LinearFunction(big, 0); }),
         "2^62 k + 2^62 k overflows");
  expect(throws_compilation_error([&] { LinearFunction(0, big) * Fraction(4); }), "4 * 2^62 overflows");
  expect(throws_compilation_error([&] { LinearFunction(big, 0).integer_eval(4); }), "2^62 * 4 overflows");
  expect(throws_compilation_error([&] { Fraction(1, max) + Fraction(1, max - 1); }),
         "Common denominator overflows");
  expect(LinearFunction(big - 1, 0) + LinearFunction(big, 0) == LinearFunction(max, 0),
         "Sums up to the largest value stay exact");
  expect(Fraction(-1) < Fraction(max), "-1 < INT64_MAX");
  expect(!(Fraction(max) < Fraction(-1)), "INT64_MAX is not below -1");
  expect(Fraction(-max) < Fraction(max), "-INT64_MAX < INT64_MAX");
  expect(Fraction(1, 3) < Fraction(1, 2), "1/3 < 1/2");
  return 0;
}
