#include "qtopo/core/utils/enums.h"

#include <stdexcept>

namespace qtopo {

Basis flipped(Basis basis) {
  switch (basis) {
    case Basis::kX:
      return Basis::kZ;
    case Basis::kZ:
      return Basis::kX;
    case Basis::kY:
      break;
  }
  throw std::invalid_argument("Cannot flip the Y basis");
}

Orientation flipped(Orientation orientation) noexcept {
  return orientation == Orientation::kHorizontal ? Orientation::kVertical : Orientation::kHorizontal;
}

char to_lower_char(Basis basis) noexcept {
  switch (basis) {
    case Basis::kX:
      return 'x';
    case Basis::kY:
      return 'y';
    case Basis::kZ:
      return 'z';
  }
  return '?';
}

char to_upper_char(Basis basis) noexcept {
  return static_cast<char>(to_lower_char(basis) - 'a' + 'A');
}

Basis basis_from_char(char c) {
  switch (c) {
    case 'x':
    case 'X':
      return Basis::kX;
    case 'y':
    case 'Y':
      return Basis::kY;
    case 'z':
    case 'Z':
      return Basis::kZ;
    default:
      break;
  }
  throw std::invalid_argument(std::string("Invalid basis character: '") + c + "'");
}

}  // namespace qtopo
