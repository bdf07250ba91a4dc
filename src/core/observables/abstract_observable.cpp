#include "qtopo/core/observables/abstract_observable.h"

namespace qtopo {

namespace {

Cube shifted_cube(const Cube& cube, Coordinate dx, Coordinate dy, Coordinate dz) {
  return Cube{cube.position.shifted(dx, dy, dz), cube.kind, cube.label};
}

Pipe shifted_pipe(const Pipe& pipe, Coordinate dx, Coordinate dy, Coordinate dz) {
  return Pipe(shifted_cube(pipe.u(), dx, dy, dz), shifted_cube(pipe.v(), dx, dy, dz), pipe.kind());
}

}  // namespace

AbstractObservable AbstractObservable::slice_at_z(Coordinate z) const {
  AbstractObservable slice;
  for (const Cube& cube : top_readout_cubes) {
    if (cube.position.z == z) {
      slice.top_readout_cubes.push_back(cube);
    }
  }
  for (const Pipe& pipe : top_readout_pipes) {
    if (pipe.u().position.z == z) {
      slice.top_readout_pipes.push_back(pipe);
    }
  }
  for (const Pipe& pipe : bottom_stabilizer_pipes) {
    if (pipe.u().position.z == z) {
      slice.bottom_stabilizer_pipes.push_back(pipe);
    }
  }
  return slice;
}

AbstractObservable AbstractObservable::shifted_by(Coordinate dx, Coordinate dy, Coordinate dz) const {
  AbstractObservable shifted;
  for (const Cube& cube : top_readout_cubes) {
    shifted.top_readout_cubes.push_back(shifted_cube(cube, dx, dy, dz));
  }
  for (const Pipe& pipe : top_readout_pipes) {
    shifted.top_readout_pipes.push_back(shifted_pipe(pipe, dx, dy, dz));
  }
  for (const Pipe& pipe : bottom_stabilizer_pipes) {
    shifted.bottom_stabilizer_pipes.push_back(shifted_pipe(pipe, dx, dy, dz));
  }
  return shifted;
}

}  // namespace qtopo
