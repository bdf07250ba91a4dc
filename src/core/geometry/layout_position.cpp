#include "qtopo/core/geometry/layout_position.h"

#include <stdexcept>

namespace qtopo {

LayoutPosition2D LayoutPosition2D::from_block_position(const BlockPosition2D& position) {
  return LayoutPosition2D(2 * position.x, 2 * position.y);
}

LayoutPosition2D LayoutPosition2D::from_pipe_position(const BlockPosition2D& u,
                                                      const BlockPosition2D& v) {
  const Coordinate dx = v.x - u.x;
  const Coordinate dy = v.y - u.y;
  const bool one_step = (dx == 0 && (dy == 1 || dy == -1)) || (dy == 0 && (dx == 1 || dx == -1));
  if (!one_step) {
    throw std::invalid_argument("Pipe endpoints " + u.str() + " and " + v.str() +
                                " are not spatial neighbours");
  }
  // Always encode from the smaller endpoint so that (u, v) and (v, u) agree.
  const BlockPosition2D& low = (u < v) ? u : v;
  return LayoutPosition2D(2 * low.x + (dx != 0 ? 1 : 0), 2 * low.y + (dy != 0 ? 1 : 0));
}

std::string LayoutPosition2D::str() const {
  return "Layout(" + std::to_string(x_) + ", " + std::to_string(y_) + ")";
}

LayoutPosition3D LayoutPosition3D::from_block_position(const BlockPosition3D& position) {
  return LayoutPosition3D(LayoutPosition2D::from_block_position(position.as_2d()), position.z);
}

LayoutPosition3D LayoutPosition3D::from_pipe_position(const BlockPosition3D& u,
                                                      const BlockPosition3D& v) {
  if (u.z != v.z) {
    throw std::invalid_argument("Temporal pipes have no layout position");
  }
  return LayoutPosition3D(LayoutPosition2D::from_pipe_position(u.as_2d(), v.as_2d()), u.z);
}

std::string LayoutPosition3D::str() const {
  return "Layout(" + std::to_string(xy_.x()) + ", " + std::to_string(xy_.y()) + ", " +
         std::to_string(z_) + ")";
}

}  // namespace qtopo
