#pragma once

#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "qtopo/core/blocks/enums.h"
#include "qtopo/core/blocks/layers.h"
#include "qtopo/core/scale/linear_function.h"

namespace qtopo {

// Scalable sizes of a block along x, y (qubits) and z (timesteps).
struct BlockDimensions {
  LinearFunction x;
  LinearFunction y;
  LinearFunction z;
};

// Sequence of layers implementing one cube or pipe of a computation.
class Block {
 public:
  // Throws CompilationError if `layers` is empty or mixes spatial shapes.
  explicit Block(std::vector<Layer> layers);

  const std::vector<Layer>& layers() const noexcept { return sequence_.layer_sequence(); }
  const SequencedLayers& as_sequenced_layers() const noexcept { return sequence_; }

  Scalable2D scalable_shape() const { return sequence_.scalable_shape(); }
  LinearFunction scalable_timesteps() const { return sequence_.scalable_timesteps(); }
  BlockDimensions dimensions() const;

  // Cubes scale along the three dimensions; pipes have exactly one constant dimension.
  bool is_cube() const;
  bool is_pipe() const;
  bool is_temporal_pipe() const;

  Block with_spatial_borders_trimmed(const std::set<SpatialBlockBorder>& borders) const;
  // std::nullopt when every layer was removed.
  std::optional<Block> with_temporal_borders_replaced(const BorderReplacements& replacements) const;

  // Layer at the bottom or top of the block. Throws CompilationError if that layer is composed.
  Layer get_temporal_border(TemporalBlockBorder border) const;

  bool operator==(const Block& other) const { return sequence_ == other.sequence_; }

 private:
  explicit Block(SequencedLayers sequence) : sequence_(std::move(sequence)) {}

  SequencedLayers sequence_;
};

}  // namespace qtopo
