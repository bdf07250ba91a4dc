#pragma once

#include <cstdint>
#include <vector>

#include "qtopo/core/blocks/layers.h"
#include "qtopo/core/circuit/qubit_map.h"
#include "qtopo/core/detectors/database.h"
#include "qtopo/core/detectors/detector_computer.h"
#include "qtopo/core/geometry/position.h"
#include "qtopo/core/observables/abstract_observable.h"
#include "qtopo/core/observables/builder.h"
#include "qtopo/core/tree/node.h"

namespace stim {
struct Circuit;
}

namespace qtopo {

// Whole computation as a tree of layout layers. The root is a sequence with one child
// per non-empty depth; `depths[i]` is the block z of the i-th child.
class LayerTree {
 public:
  // Throws CompilationError if the number of depths does not match the root children.
  LayerTree(const SequencedLayers& root, std::vector<Coordinate> depths);

  const LayerNode& root() const noexcept { return root_; }
  const std::vector<Coordinate>& depths() const noexcept { return depths_; }

  // Stores the circuit of every leaf for k.
  void annotate_circuits(std::int64_t k);
  // Needs annotate_circuits(k). A null computer uses PlaquetteDetectorComputer.
  void annotate_detectors(std::int64_t k, std::int64_t manhattan_radius = 2, DetectorDatabase* database = nullptr,
                          const DetectorComputer* computer = nullptr);
  // Needs annotate_circuits(k). Observable i gets index i.
  void annotate_observables(std::int64_t k, const std::vector<AbstractObservable>& observables,
                            const ObservableBuilder& builder = default_observable_builder());

  // Union of the qubits of every leaf circuit for k.
  QubitMap global_qubit_map(std::int64_t k) const;

  // Throws LookupError if the circuits were not annotated for k.
  stim::Circuit generate_circuit(std::int64_t k, bool include_qubit_coords = true) const;

 private:
  LayerNode root_;
  std::vector<Coordinate> depths_;
};

}  // namespace qtopo
