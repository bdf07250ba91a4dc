#pragma once

#include <map>
#include <vector>

#include "qtopo/core/blocks/block.h"
#include "qtopo/core/blocks/layers.h"
#include "qtopo/core/geometry/layout_position.h"
#include "qtopo/core/scale/linear_function.h"

namespace qtopo {

// Merges blocks running at the same depth into one list of layers covering the whole
// layout. Atomic layers become LayoutLayers; composed layers are merged recursively.
// Throws CompilationError if the blocks do not last the same number of timesteps and
// NotImplementedError when their layer structures cannot be aligned.
std::vector<Layer> merge_parallel_block_layers(const std::map<LayoutPosition2D, Block>& blocks,
                                               const Scalable2D& element_shape);

// Merges layers sharing one schedule position. Exposed for testing.
Layer merge_parallel_layers(const std::map<LayoutPosition2D, Layer>& layers, const Scalable2D& element_shape);

}  // namespace qtopo
