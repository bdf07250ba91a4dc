#include "qtopo/core/geometry/position.h"

#include <stdexcept>

namespace qtopo {

std::string Position2D::str() const {
  return "(" + std::to_string(x) + ", " + std::to_string(y) + ")";
}

char to_char(Direction3D direction) noexcept {
  switch (direction) {
    case Direction3D::kX:
      return 'X';
    case Direction3D::kY:
      return 'Y';
    case Direction3D::kZ:
      return 'Z';
  }
  return '?';
}

Coordinate Position3D::coordinate(Direction3D direction) const noexcept {
  switch (direction) {
    case Direction3D::kX:
      return x;
    case Direction3D::kY:
      return y;
    case Direction3D::kZ:
      return z;
  }
  return 0;
}

Position3D Position3D::shifted_in(Direction3D direction, Coordinate amount) const noexcept {
  switch (direction) {
    case Direction3D::kX:
      return shifted(amount, 0, 0);
    case Direction3D::kY:
      return shifted(0, amount, 0);
    case Direction3D::kZ:
      return shifted(0, 0, amount);
  }
  return *this;
}

bool Position3D::is_neighbour(const Position3D& other) const noexcept {
  const Coordinate dx = x > other.x ? x - other.x : other.x - x;
  const Coordinate dy = y > other.y ? y - other.y : other.y - y;
  const Coordinate dz = z > other.z ? z - other.z : other.z - z;
  return dx + dy + dz == 1;
}

std::string Position3D::str() const {
  return "(" + std::to_string(x) + ", " + std::to_string(y) + ", " + std::to_string(z) + ")";
}

Direction3D direction_between(const Position3D& u, const Position3D& v) {
  if (!u.is_neighbour(v)) {
    throw std::invalid_argument("Positions " + u.str() + " and " + v.str() + " are not neighbours");
  }
  if (u.x != v.x) {
    return Direction3D::kX;
  }
  if (u.y != v.y) {
    return Direction3D::kY;
  }
  return Direction3D::kZ;
}

Coordinate floor_div(Coordinate numerator, Coordinate denominator) noexcept {
  Coordinate quotient = numerator / denominator;
  if ((numerator % denominator != 0) && ((numerator < 0) != (denominator < 0))) {
    --quotient;
  }
  return quotient;
}

}  // namespace qtopo
