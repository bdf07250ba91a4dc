#pragma once

#include <string>

namespace qtopo {

enum class Basis {
  kX = 0,
  kY,
  kZ,
};

enum class Orientation {
  kHorizontal = 0,
  kVertical,
};

// X <-> Z. Y has no CSS partner and is rejected.
Basis flipped(Basis basis);
Orientation flipped(Orientation orientation) noexcept;

char to_lower_char(Basis basis) noexcept;
char to_upper_char(Basis basis) noexcept;
Basis basis_from_char(char c);

}  // namespace qtopo
