#pragma once

#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "qtopo/core/blocks/block.h"
#include "qtopo/core/blocks/layers.h"
#include "qtopo/core/geometry/layout_position.h"
#include "qtopo/core/geometry/position.h"
#include "qtopo/core/scale/linear_function.h"
#include "qtopo/core/tree/tree.h"

namespace qtopo {

// Blocks of a computation placed on the 3D lattice. Adding a junction trims the facing
// borders of the two cubes it joins before the junction itself is stored, so a shared
// boundary is never claimed twice.
class TopologicalComputationGraph {
 public:
  // `scalable_qubit_shape` is the qubit shape every cube must have.
  explicit TopologicalComputationGraph(Scalable2D scalable_qubit_shape);

  const Scalable2D& scalable_qubit_shape() const noexcept { return qubit_shape_; }
  const std::map<LayoutPosition3D, Block>& blocks() const noexcept { return blocks_; }

  // Throws CompilationError if `block` is not a cube of the expected shape, if the
  // position is taken or if a coordinate is out of the representable range.
  void add_cube(const BlockPosition3D& position, Block block);

  // Throws CompilationError if `block` is not a pipe, if the positions are not
  // neighbours in ascending order, if a cube is missing or if the junction exists.
  void add_junction(const BlockPosition3D& source, const BlockPosition3D& sink, const Block& block);

  // Throws LookupError when no cube sits at `position`.
  const Block& cube_at(const BlockPosition3D& position) const;
  bool has_junction(const BlockPosition3D& source, const BlockPosition3D& sink) const;

  // Throws CompilationError on an empty graph.
  Coordinate min_z() const;
  Coordinate max_z() const;

  // Merged layer stack of every block at depth z; empty when no block sits there.
  std::vector<Layer> layout_layers(Coordinate z) const;

  // Throws CompilationError on an empty graph.
  LayerTree to_layer_tree() const;

 private:
  Scalable2D qubit_shape_;
  std::map<LayoutPosition3D, Block> blocks_;
  std::set<std::pair<BlockPosition3D, BlockPosition3D>> temporal_junctions_;
  std::optional<Coordinate> min_z_;
  std::optional<Coordinate> max_z_;
};

}  // namespace qtopo
