#include "qtopo/core/conventions/specs.h"

#include <stdexcept>

namespace qtopo {

SpatialArms SpatialArms::of(const BlockGraph& graph, const BlockPosition3D& position) {
  SpatialArms arms;
  for (const Pipe& pipe : graph.pipes_at(position)) {
    const bool towards_positive = pipe.u().position == position;
    switch (pipe.direction()) {
      case Direction3D::kX:
        (towards_positive ? arms.right : arms.left) = true;
        break;
      case Direction3D::kY:
        (towards_positive ? arms.down : arms.up) = true;
        break;
      case Direction3D::kZ:
        break;
    }
  }
  return arms;
}

std::string SpatialArms::str() const {
  std::string result;
  auto append = [&result](bool present, const char* name) {
    if (present) {
      result += result.empty() ? std::string(name) : std::string("|") + name;
    }
  };
  append(up, "UP");
  append(right, "RIGHT");
  append(down, "DOWN");
  append(left, "LEFT");
  return result.empty() ? "NONE" : result;
}

CubeSpec CubeSpec::of(const BlockGraph& graph, const BlockPosition3D& position) {
  const Cube& cube = graph.get_cube(position);
  CubeSpec spec{cube.kind, {}};
  if (spec.is_spatial()) {
    spec.arms = SpatialArms::of(graph, position);
  }
  return spec;
}

PipeSpec PipeSpec::of(const BlockGraph& graph, const Pipe& pipe) {
  return {pipe.kind(), CubeSpec::of(graph, pipe.u().position), CubeSpec::of(graph, pipe.v().position)};
}

SpatialArms PipeSpec::arms() const {
  if (kind.is_temporal()) {
    throw std::invalid_argument("Temporal pipe " + kind.str() + " is not the arm of a spatial cube");
  }
  const bool along_x = kind.direction() == Direction3D::kX;
  SpatialArms arms;
  if (u.is_spatial()) {
    (along_x ? arms.right : arms.down) = true;
  }
  if (v.is_spatial()) {
    (along_x ? arms.left : arms.up) = true;
  }
  return arms;
}

}  // namespace qtopo
