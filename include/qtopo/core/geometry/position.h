#pragma once

#include <cstdint>
#include <string>
#include <tuple>

namespace qtopo {

using Coordinate = std::int64_t;

// Representable block coordinates satisfy |c| < kMaxBlockCoordinate so that the doubled
// layout encoding always fits in a Coordinate.
inline constexpr Coordinate kMaxBlockCoordinate = Coordinate{1} << 62;

struct Shift2D {
  Coordinate x = 0;
  Coordinate y = 0;

  Shift2D operator+(const Shift2D& other) const noexcept { return {x + other.x, y + other.y}; }
  Shift2D operator*(Coordinate factor) const noexcept { return {x * factor, y * factor}; }
  bool operator==(const Shift2D& other) const noexcept { return x == other.x && y == other.y; }
  bool operator!=(const Shift2D& other) const noexcept { return !(*this == other); }
};

// Width (x) and height (y) of a rectangular region.
struct Shape2D {
  Coordinate x = 0;
  Coordinate y = 0;

  bool operator==(const Shape2D& other) const noexcept { return x == other.x && y == other.y; }
  bool operator!=(const Shape2D& other) const noexcept { return !(*this == other); }
};

struct Position2D {
  Coordinate x = 0;
  Coordinate y = 0;

  Position2D operator+(const Shift2D& shift) const noexcept { return {x + shift.x, y + shift.y}; }
  Shift2D operator-(const Position2D& other) const noexcept { return {x - other.x, y - other.y}; }
  bool operator==(const Position2D& other) const noexcept { return x == other.x && y == other.y; }
  bool operator!=(const Position2D& other) const noexcept { return !(*this == other); }
  bool operator<(const Position2D& other) const noexcept {
    return std::tie(x, y) < std::tie(other.x, other.y);
  }
  std::string str() const;
};

using BlockPosition2D = Position2D;
using PlaquettePosition2D = Position2D;

enum class Direction3D {
  kX = 0,
  kY,
  kZ,
};

struct SignedDirection3D {
  Direction3D direction = Direction3D::kX;
  bool towards_positive = true;

  SignedDirection3D operator-() const noexcept { return {direction, !towards_positive}; }
  bool operator==(const SignedDirection3D& other) const noexcept {
    return direction == other.direction && towards_positive == other.towards_positive;
  }
};

char to_char(Direction3D direction) noexcept;

struct Position3D {
  Coordinate x = 0;
  Coordinate y = 0;
  Coordinate z = 0;

  Position2D as_2d() const noexcept { return {x, y}; }
  Coordinate coordinate(Direction3D direction) const noexcept;
  Position3D shifted(Coordinate dx, Coordinate dy, Coordinate dz) const noexcept {
    return {x + dx, y + dy, z + dz};
  }
  Position3D shifted_in(Direction3D direction, Coordinate amount) const noexcept;

  // Manhattan distance of exactly one.
  bool is_neighbour(const Position3D& other) const noexcept;

  bool operator==(const Position3D& other) const noexcept {
    return x == other.x && y == other.y && z == other.z;
  }
  bool operator!=(const Position3D& other) const noexcept { return !(*this == other); }
  bool operator<(const Position3D& other) const noexcept {
    return std::tie(x, y, z) < std::tie(other.x, other.y, other.z);
  }
  std::string str() const;
};

using BlockPosition3D = Position3D;

// Direction of the edge between two neighbouring positions. Throws std::invalid_argument
// if the positions are not neighbours.
Direction3D direction_between(const Position3D& u, const Position3D& v);

// Floor division, also for negative numerators.
Coordinate floor_div(Coordinate numerator, Coordinate denominator) noexcept;

}  // namespace qtopo
