#include "qtopo/core/graph/topological_graph.h"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <utility>

#include "qtopo/core/blocks/merge.h"
#include "qtopo/core/utils/errors.h"

namespace qtopo {

namespace {

void check_representable(const BlockPosition3D& position) {
  for (Coordinate c : {position.x, position.y, position.z}) {
    if (c >= kMaxBlockCoordinate || c <= -kMaxBlockCoordinate) {
      throw CompilationError("Position " + position.str() + " is outside the representable range");
    }
  }
}

}  // namespace

TopologicalComputationGraph::TopologicalComputationGraph(Scalable2D scalable_qubit_shape)
    : qubit_shape_(std::move(scalable_qubit_shape)) {}

void TopologicalComputationGraph::add_cube(const BlockPosition3D& position, Block block) {
  check_representable(position);
  if (!block.is_cube()) {
    throw CompilationError("Block added at " + position.str() + " is not a cube");
  }
  if (block.scalable_shape() != qubit_shape_) {
    throw CompilationError("Cube at " + position.str() + " has shape " + block.scalable_shape().str() +
                           " instead of " + qubit_shape_.str());
  }
  const LayoutPosition3D key = LayoutPosition3D::from_block_position(position);
  if (blocks_.count(key) != 0) {
    throw CompilationError("A cube already exists at " + position.str());
  }
  blocks_.emplace(key, std::move(block));
  min_z_ = min_z_ ? std::min(*min_z_, position.z) : position.z;
  max_z_ = max_z_ ? std::max(*max_z_, position.z) : position.z;
}

void TopologicalComputationGraph::add_junction(const BlockPosition3D& source, const BlockPosition3D& sink,
                                               const Block& block) {
  // Validation: nothing is modified before every check passed.
  if (!block.is_pipe()) {
    throw CompilationError("Junction between " + source.str() + " and " + sink.str() + " is not a pipe");
  }
  if (!source.is_neighbour(sink) || !(source < sink)) {
    throw CompilationError("Junction ends " + source.str() + " and " + sink.str() +
                           " must be neighbours in ascending order");
  }
  const LayoutPosition3D source_key = LayoutPosition3D::from_block_position(source);
  const LayoutPosition3D sink_key = LayoutPosition3D::from_block_position(sink);
  const auto source_it = blocks_.find(source_key);
  const auto sink_it = blocks_.find(sink_key);
  if (source_it == blocks_.end() || sink_it == blocks_.end()) {
    throw CompilationError("Junction between " + source.str() + " and " + sink.str() + " needs both cubes");
  }
  if (has_junction(source, sink)) {
    throw CompilationError("A junction already exists between " + source.str() + " and " + sink.str());
  }

  const Direction3D direction = direction_between(source, sink);
  if (direction == Direction3D::kZ) {
    if (block.scalable_shape() != qubit_shape_) {
      throw CompilationError("Temporal junction has shape " + block.scalable_shape().str() + " instead of " +
                             qubit_shape_.str());
    }
    // Layers keep their time order: the pipe's bottom layer ends the source cube and its
    // top layer starts the sink cube.
    std::optional<Block> new_source = source_it->second.with_temporal_borders_replaced(
        {{TemporalBlockBorder::kZPositive, block.get_temporal_border(TemporalBlockBorder::kZNegative)}});
    std::optional<Block> new_sink = sink_it->second.with_temporal_borders_replaced(
        {{TemporalBlockBorder::kZNegative, block.get_temporal_border(TemporalBlockBorder::kZPositive)}});
    if (!new_source || !new_sink) {
      throw CompilationError("Temporal junction between " + source.str() + " and " + sink.str() +
                             " removed a whole cube");
    }
    source_it->second = std::move(*new_source);
    sink_it->second = std::move(*new_sink);
    temporal_junctions_.emplace(source, sink);
    return;
  }

  // Trim the facing borders of both cubes, then insert the junction.
  const SignedDirection3D towards_sink{direction, true};
  Block trimmed_source =
      source_it->second.with_spatial_borders_trimmed({spatial_border_from_signed_direction(towards_sink)});
  Block trimmed_sink = sink_it->second.with_spatial_borders_trimmed({spatial_border_from_signed_direction(-towards_sink)});
  source_it->second = std::move(trimmed_source);
  sink_it->second = std::move(trimmed_sink);
  blocks_.emplace(LayoutPosition3D::from_pipe_position(source, sink), block);
}

const Block& TopologicalComputationGraph::cube_at(const BlockPosition3D& position) const {
  const auto it = blocks_.find(LayoutPosition3D::from_block_position(position));
  if (it == blocks_.end()) {
    throw LookupError("No cube at " + position.str());
  }
  return it->second;
}

bool TopologicalComputationGraph::has_junction(const BlockPosition3D& source, const BlockPosition3D& sink) const {
  if (direction_between(source, sink) == Direction3D::kZ) {
    return temporal_junctions_.count({source, sink}) != 0;
  }
  return blocks_.count(LayoutPosition3D::from_pipe_position(source, sink)) != 0;
}

Coordinate TopologicalComputationGraph::min_z() const {
  if (!min_z_) {
    throw CompilationError("An empty graph has no depth");
  }
  return *min_z_;
}

Coordinate TopologicalComputationGraph::max_z() const {
  if (!max_z_) {
    throw CompilationError("An empty graph has no depth");
  }
  return *max_z_;
}

std::vector<Layer> TopologicalComputationGraph::layout_layers(Coordinate z) const {
  std::map<LayoutPosition2D, Block> at_depth;
  for (const auto& [position, block] : blocks_) {
    if (position.z() == z) {
      at_depth.emplace(position.as_2d(), block);
    }
  }
  return merge_parallel_block_layers(at_depth, qubit_shape_);
}

LayerTree TopologicalComputationGraph::to_layer_tree() const {
  std::vector<Layer> depths;
  std::vector<Coordinate> coordinates;
  for (Coordinate z = min_z(); z <= max_z(); ++z) {
    std::vector<Layer> layers = layout_layers(z);
    if (layers.empty()) {
      continue;
    }
    depths.push_back(SequencedLayers(std::move(layers)));
    coordinates.push_back(z);
  }
  return LayerTree(SequencedLayers(std::move(depths)), std::move(coordinates));
}

}  // namespace qtopo
