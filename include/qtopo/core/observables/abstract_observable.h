#pragma once

#include <vector>

#include "qtopo/core/computation/block_graph.h"
#include "qtopo/core/geometry/position.h"

namespace qtopo {

// Blocks contributing to one logical observable: data readouts on the top face of
// cubes and pipes, and stabilizer measurements at the bottom of the cubes joined by
// spatial pipes.
struct AbstractObservable {
  std::vector<Cube> top_readout_cubes;
  std::vector<Pipe> top_readout_pipes;
  std::vector<Pipe> bottom_stabilizer_pipes;

  // Parts located at depth z; pipes are located at the depth of their head.
  AbstractObservable slice_at_z(Coordinate z) const;
  AbstractObservable shifted_by(Coordinate dx, Coordinate dy, Coordinate dz) const;
  bool empty() const noexcept {
    return top_readout_cubes.empty() && top_readout_pipes.empty() && bottom_stabilizer_pipes.empty();
  }
};

}  // namespace qtopo
