#include "qtopo/core/blocks/block.h"

#include <utility>

#include "qtopo/core/utils/errors.h"

namespace qtopo {

Block::Block(std::vector<Layer> layers) : sequence_(std::move(layers)) {}

BlockDimensions Block::dimensions() const {
  const Scalable2D shape = scalable_shape();
  return {shape.x, shape.y, scalable_timesteps()};
}

bool Block::is_cube() const {
  const BlockDimensions dims = dimensions();
  return dims.x.is_scalable() && dims.y.is_scalable() && dims.z.is_scalable();
}

bool Block::is_pipe() const {
  const BlockDimensions dims = dimensions();
  const int constant = static_cast<int>(dims.x.is_constant()) + static_cast<int>(dims.y.is_constant()) +
                       static_cast<int>(dims.z.is_constant());
  return constant == 1;
}

bool Block::is_temporal_pipe() const { return is_pipe() && scalable_timesteps().is_constant(); }

Block Block::with_spatial_borders_trimmed(const std::set<SpatialBlockBorder>& borders) const {
  std::vector<Layer> trimmed;
  trimmed.reserve(layers().size());
  for (const Layer& layer : layers()) {
    trimmed.push_back(layer.with_spatial_borders_trimmed(borders));
  }
  return Block(std::move(trimmed));
}

std::optional<Block> Block::with_temporal_borders_replaced(const BorderReplacements& replacements) const {
  std::optional<Layer> replaced = Layer(sequence_).with_temporal_borders_replaced(replacements);
  if (!replaced) {
    return std::nullopt;
  }
  return Block(replaced->as<SequencedLayers>());
}

Layer Block::get_temporal_border(TemporalBlockBorder border) const {
  const Layer& layer = border == TemporalBlockBorder::kZNegative ? layers().front() : layers().back();
  if (layer.is_composed()) {
    throw CompilationError("The " + to_string(border) + " border of the block is not an atomic layer");
  }
  return layer;
}

}  // namespace qtopo
