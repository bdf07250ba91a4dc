#pragma once

#include <functional>
#include <string>

#include "qtopo/core/blocks/block.h"
#include "qtopo/core/computation/block_graph.h"
#include "qtopo/core/scale/linear_function.h"

namespace qtopo {

// Spatial pipes leaving a cube within its own time slice. y grows downwards, so UP is
// the neighbour at y - 1.
struct SpatialArms {
  bool up = false;
  bool right = false;
  bool down = false;
  bool left = false;

  // Arms of the cube at `position` in `graph`. Temporal pipes are ignored.
  static SpatialArms of(const BlockGraph& graph, const BlockPosition3D& position);

  bool empty() const noexcept { return !up && !right && !down && !left; }
  // Two opposite arms: the spatial cube is a straight corridor.
  bool is_straight() const noexcept { return (left && right) || (up && down); }
  std::string str() const;

  bool operator==(const SpatialArms& other) const noexcept {
    return up == other.up && right == other.right && down == other.down && left == other.left;
  }
  bool operator!=(const SpatialArms& other) const noexcept { return !(*this == other); }
};

// What a convention needs to know to build the block of a cube.
struct CubeSpec {
  ZXCube kind;
  // Only filled for spatial cubes.
  SpatialArms arms;

  static CubeSpec of(const BlockGraph& graph, const BlockPosition3D& position);
  bool is_spatial() const noexcept { return kind.is_spatial(); }
};

// Pipe kind together with the specs of the two cubes it joins.
struct PipeSpec {
  PipeKind kind;
  CubeSpec u;
  CubeSpec v;

  static PipeSpec of(const BlockGraph& graph, const Pipe& pipe);
  bool touches_spatial_cube() const noexcept { return u.is_spatial() || v.is_spatial(); }
  // Arms this pipe implements for the spatial cubes it touches: RIGHT or DOWN for u,
  // LEFT or UP for v. Throws std::invalid_argument for temporal pipes.
  SpatialArms arms() const;
};

// Blocks are built from a spec and the number of memory rounds between the first and
// the last layer of a block.
using CubeBuilder = std::function<Block(const CubeSpec& spec, const LinearFunction& repetitions)>;
using PipeBuilder = std::function<Block(const PipeSpec& spec, const LinearFunction& repetitions)>;

struct CompilationConvention {
  std::string name;
  CubeBuilder cube_builder;
  PipeBuilder pipe_builder;
};

}  // namespace qtopo
