#include "qtopo/core/observables/builder.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "qtopo/core/utils/errors.h"

namespace qtopo {

namespace {

Orientation observable_orientation(const ZXCube& kind) {
  return kind.y() == kind.z() ? Orientation::kVertical : Orientation::kHorizontal;
}

Coordinate round_or_fail(double value) {
  const double rounded = std::round(value);
  if (std::abs(rounded - value) > 1e-9) {
    throw CompilationError("Expected an integer coordinate, got " + std::to_string(value));
  }
  return static_cast<Coordinate>(rounded);
}

Direction3D other_spatial_direction(Direction3D direction) {
  return direction == Direction3D::kX ? Direction3D::kY : Direction3D::kX;
}

}  // namespace

std::vector<LocalCoordinates> cube_top_readout_qubits(const Shape2D& shape, Orientation orientation) {
  std::vector<LocalCoordinates> qubits;
  if (orientation == Orientation::kHorizontal) {
    for (Coordinate x = 1; x < shape.x; ++x) {
      qubits.push_back({static_cast<double>(x), static_cast<double>(shape.y / 2)});
    }
  } else {
    for (Coordinate y = 1; y < shape.y; ++y) {
      qubits.push_back({static_cast<double>(shape.x / 2), static_cast<double>(y)});
    }
  }
  return qubits;
}

std::vector<LocalCoordinates> pipe_top_readout_qubits(const Shape2D& shape, Direction3D direction) {
  switch (direction) {
    case Direction3D::kX:
      return {{static_cast<double>(shape.x), static_cast<double>(shape.y / 2)}};
    case Direction3D::kY:
      return {{static_cast<double>(shape.x / 2), static_cast<double>(shape.y)}};
    case Direction3D::kZ:
      break;
  }
  throw std::invalid_argument("Temporal pipes have no top readout qubits");
}

std::vector<LocalCoordinates> cube_bottom_stabilizer_qubits(const Shape2D& shape,
                                                            const SignedDirection3D& connect_to,
                                                            Basis stabilizer_basis) {
  // Computed for a pipe towards +X, then rotated around the centre of the block.
  const Coordinate parity = stabilizer_basis == Basis::kZ ? 0 : 1;
  std::vector<LocalCoordinates> stabilizers;
  for (Coordinate i = shape.x / 2; i < shape.x; ++i) {
    for (Coordinate j = 0; j < shape.y; ++j) {
      if ((i + j) % 2 != parity) {
        continue;
      }
      double x = static_cast<double>(i) + 0.5;
      double y = static_cast<double>(j) + 0.5;
      // Mirror along the middle line to keep the checkerboard parity after rotation.
      if (connect_to.direction == Direction3D::kY) {
        y = static_cast<double>(shape.y) - y;
      }
      stabilizers.push_back({x, y});
    }
  }
  double a = 1.0;
  double b = 0.0;
  if (connect_to.direction == Direction3D::kX && !connect_to.towards_positive) {
    a = -1.0;
  } else if (connect_to.direction == Direction3D::kY) {
    a = 0.0;
    b = connect_to.towards_positive ? 1.0 : -1.0;
  }
  const double cx = static_cast<double>(shape.x / 2);
  const double cy = static_cast<double>(shape.y / 2);
  for (LocalCoordinates& stabilizer : stabilizers) {
    const double dx = stabilizer.x - cx;
    const double dy = stabilizer.y - cy;
    stabilizer = {cx + a * dx - b * dy, cy + b * dx + a * dy};
  }
  return stabilizers;
}

ObservableBuilder default_observable_builder() {
  return {cube_top_readout_qubits, pipe_top_readout_qubits, cube_bottom_stabilizer_qubits};
}

GridQubit local_to_grid_qubit(const LayoutTemplate& layout, const LocalCoordinates& local,
                              const BlockPosition3D& block_position, std::int64_t k) {
  const Shape2D shape = layout.element_shape(k);
  const Shift2D& increments = layout.element_layout().begin()->second->increments();
  const Coordinate width = shape.x * increments.x;
  const Coordinate height = shape.y * increments.y;
  return {block_position.x * width + round_or_fail((local.x - 0.5) * static_cast<double>(increments.x)),
          block_position.y * height + round_or_fail((local.y - 0.5) * static_cast<double>(increments.y))};
}

std::set<GridQubit> compute_observable_qubits(std::int64_t k, const AbstractObservable& slice,
                                              const LayoutTemplate& layout, const ObservableBuilder& builder,
                                              ObservableComponent component) {
  const Shape2D shape = layout.element_shape(k);
  std::set<GridQubit> qubits;
  auto collect = [&](const BlockPosition3D& position, const std::vector<LocalCoordinates>& locals) {
    for (const LocalCoordinates& local : locals) {
      qubits.insert(local_to_grid_qubit(layout, local, position, k));
    }
  };
  if (component == ObservableComponent::kBottomStabilizers) {
    for (const Pipe& pipe : slice.bottom_stabilizer_pipes) {
      for (const Cube* cube : {&pipe.u(), &pipe.v()}) {
        if (cube->kind.is_spatial()) {
          throw NotImplementedError("Observables through spatial cubes are not supported");
        }
        const Basis basis = cube->kind.get_basis_along(other_spatial_direction(pipe.direction()));
        const SignedDirection3D connect_to{pipe.direction(), cube == &pipe.u()};
        collect(cube->position, builder.cube_bottom_stabilizers(shape, connect_to, basis));
      }
    }
    return qubits;
  }
  for (const Pipe& pipe : slice.top_readout_pipes) {
    collect(pipe.u().position, builder.pipe_top_readouts(shape, pipe.direction()));
  }
  for (const Cube& cube : slice.top_readout_cubes) {
    collect(cube.position, builder.cube_top_readouts(shape, observable_orientation(cube.kind)));
  }
  return qubits;
}

ObservableAnnotation observable_with_measurement_records(const std::set<GridQubit>& qubits,
                                                         const MeasurementRecordsMap& records,
                                                         std::size_t observable_index) {
  ObservableAnnotation annotation;
  annotation.observable_index = observable_index;
  for (const GridQubit& qubit : qubits) {
    if (records.contains(qubit)) {
      annotation.measurement_offsets.push_back(records.last_offset(qubit));
    }
  }
  std::sort(annotation.measurement_offsets.begin(), annotation.measurement_offsets.end());
  return annotation;
}

std::vector<AbstractObservable> find_memory_observables(const BlockGraph& graph) {
  std::vector<AbstractObservable> observables;
  for (const BlockGraph& component : graph.connected_components()) {
    std::vector<Pipe> spatial;
    bool has_temporal = false;
    for (const Pipe& pipe : component.pipes()) {
      if (pipe.kind().is_spatial()) {
        spatial.push_back(pipe);
      } else {
        has_temporal = true;
      }
    }
    const std::vector<Cube> cubes = component.cubes();
    AbstractObservable observable;
    if (std::any_of(cubes.begin(), cubes.end(), [](const Cube& cube) { return cube.kind.is_spatial(); })) {
      throw NotImplementedError("Cannot find observables for components holding a spatial cube");
    }
    if (spatial.empty()) {
      const auto top = std::max_element(cubes.begin(), cubes.end(), [](const Cube& lhs, const Cube& rhs) {
        return lhs.position.z < rhs.position.z;
      });
      observable.top_readout_cubes.push_back(*top);
      observables.push_back(std::move(observable));
      continue;
    }
    if (has_temporal) {
      throw NotImplementedError("Cannot find observables for components mixing temporal and spatial pipes");
    }
    const Orientation orientation = observable_orientation(cubes.front().kind);
    const Direction3D line = orientation == Orientation::kHorizontal ? Direction3D::kX : Direction3D::kY;
    for (const Cube& cube : cubes) {
      if (cube.kind.is_spatial() || observable_orientation(cube.kind) != orientation) {
        throw NotImplementedError("Cannot find observables for cubes of mixed orientations");
      }
    }
    for (const Pipe& pipe : spatial) {
      if (pipe.direction() != line) {
        throw NotImplementedError("Cannot find observables for pipes across the observable orientation");
      }
    }
    observable.top_readout_cubes = cubes;
    observable.top_readout_pipes = spatial;
    observables.push_back(std::move(observable));
  }
  return observables;
}

}  // namespace qtopo
