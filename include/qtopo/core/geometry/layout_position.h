#pragma once

#include <string>
#include <tuple>

#include "qtopo/core/geometry/position.h"

namespace qtopo {

// Doubled-coordinate position of a cube (both coordinates even) or a spatial pipe (exactly
// one odd coordinate, along the pipe direction) on the 2D layout grid.
class LayoutPosition2D {
 public:
  static LayoutPosition2D from_block_position(const BlockPosition2D& position);
  static LayoutPosition2D from_pipe_position(const BlockPosition2D& u, const BlockPosition2D& v);

  Coordinate x() const noexcept { return x_; }
  Coordinate y() const noexcept { return y_; }

  bool is_cube() const noexcept { return x_ % 2 == 0 && y_ % 2 == 0; }
  bool is_pipe() const noexcept { return !is_cube(); }

  // Position of the cube containing (or preceding, for pipes) this layout position.
  BlockPosition2D to_block_position() const noexcept { return {floor_div(x_, 2), floor_div(y_, 2)}; }

  bool operator==(const LayoutPosition2D& other) const noexcept {
    return x_ == other.x_ && y_ == other.y_;
  }
  bool operator!=(const LayoutPosition2D& other) const noexcept { return !(*this == other); }
  bool operator<(const LayoutPosition2D& other) const noexcept {
    return std::tie(x_, y_) < std::tie(other.x_, other.y_);
  }
  std::string str() const;

 private:
  LayoutPosition2D(Coordinate x, Coordinate y) noexcept : x_(x), y_(y) {}

  Coordinate x_;
  Coordinate y_;
};

// LayoutPosition2D plus the block depth. z is never doubled: temporal pipes are not
// stored on the layout.
class LayoutPosition3D {
 public:
  static LayoutPosition3D from_block_position(const BlockPosition3D& position);
  // Throws std::invalid_argument for temporal pipes or non-neighbouring positions.
  static LayoutPosition3D from_pipe_position(const BlockPosition3D& u, const BlockPosition3D& v);

  const LayoutPosition2D& as_2d() const noexcept { return xy_; }
  Coordinate z() const noexcept { return z_; }

  bool operator==(const LayoutPosition3D& other) const noexcept {
    return xy_ == other.xy_ && z_ == other.z_;
  }
  bool operator<(const LayoutPosition3D& other) const noexcept {
    if (z_ != other.z_) {
      return z_ < other.z_;
    }
    return xy_ < other.xy_;
  }
  std::string str() const;

 private:
  LayoutPosition3D(LayoutPosition2D xy, Coordinate z) noexcept : xy_(xy), z_(z) {}

  LayoutPosition2D xy_;
  Coordinate z_;
};

}  // namespace qtopo
