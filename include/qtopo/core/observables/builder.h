#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <set>
#include <vector>

#include "qtopo/core/circuit/measurement_map.h"
#include "qtopo/core/circuit/qubit_map.h"
#include "qtopo/core/computation/block_graph.h"
#include "qtopo/core/observables/abstract_observable.h"
#include "qtopo/core/templates/layout_template.h"
#include "qtopo/core/tree/annotations.h"
#include "qtopo/core/utils/enums.h"

namespace qtopo {

// Coordinates inside one block, in plaquettes: data qubits sit on integers and
// syndrome qubits on half-integers, (0, 0) being the top-left corner of the block.
struct LocalCoordinates {
  double x = 0.0;
  double y = 0.0;
};

enum class ObservableComponent {
  kBottomStabilizers = 0,
  kTopReadouts,
};

// Data qubits on the middle line of the top face of a cube.
std::vector<LocalCoordinates> cube_top_readout_qubits(const Shape2D& shape, Orientation orientation);
// The junction data qubit of a spatial pipe, in the frame of the pipe head.
std::vector<LocalCoordinates> pipe_top_readout_qubits(const Shape2D& shape, Direction3D direction);
// Half of the bottom stabilizers of `stabilizer_basis`, on the side facing `connect_to`.
std::vector<LocalCoordinates> cube_bottom_stabilizer_qubits(const Shape2D& shape,
                                                            const SignedDirection3D& connect_to,
                                                            Basis stabilizer_basis);

// Qubit computations used to realise abstract observables; replaceable per convention.
struct ObservableBuilder {
  std::function<std::vector<LocalCoordinates>(const Shape2D&, Orientation)> cube_top_readouts;
  std::function<std::vector<LocalCoordinates>(const Shape2D&, Direction3D)> pipe_top_readouts;
  std::function<std::vector<LocalCoordinates>(const Shape2D&, const SignedDirection3D&, Basis)>
      cube_bottom_stabilizers;
};

ObservableBuilder default_observable_builder();

// Global qubit of `local` inside the block at `block_position`. Throws CompilationError
// if the coordinates do not land on a qubit.
GridQubit local_to_grid_qubit(const LayoutTemplate& layout, const LocalCoordinates& local,
                              const BlockPosition3D& block_position, std::int64_t k);

// Qubits whose last measurement in the layer enters the observable.
std::set<GridQubit> compute_observable_qubits(std::int64_t k, const AbstractObservable& slice,
                                              const LayoutTemplate& layout, const ObservableBuilder& builder,
                                              ObservableComponent component);

// Qubits never measured in `records` are skipped.
ObservableAnnotation observable_with_measurement_records(const std::set<GridQubit>& qubits,
                                                         const MeasurementRecordsMap& records,
                                                         std::size_t observable_index);

// One observable per connected component of a memory-like graph. Throws
// NotImplementedError for components that are neither a temporal column nor a single
// straight line of spatial pipes along the observable orientation, and for components
// holding a spatial cube.
std::vector<AbstractObservable> find_memory_observables(const BlockGraph& graph);

}  // namespace qtopo
