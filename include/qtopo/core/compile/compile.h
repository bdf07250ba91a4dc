#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "stim/circuit/circuit.h"

#include "qtopo/core/computation/block_graph.h"
#include "qtopo/core/conventions/css.h"
#include "qtopo/core/conventions/fixed_boundary.h"
#include "qtopo/core/detectors/database.h"
#include "qtopo/core/noise/noise_model.h"
#include "qtopo/core/observables/abstract_observable.h"
#include "qtopo/core/scale/linear_function.h"
#include "qtopo/core/tree/tree.h"

namespace qtopo {

struct CompileOptions {
  std::int64_t manhattan_radius = 2;
  // Memory rounds between the first and last layer of every block.
  LinearFunction block_repetitions = LinearFunction(2, -1);
  bool include_qubit_coords = true;
  // Moves the graph so that its lowest cube sits at z = 0.
  bool shift_to_zero_z = true;
};

// Layer tree of a block graph, ready to be turned into circuits for any k.
class CompiledGraph {
 public:
  CompiledGraph(LayerTree tree, std::vector<AbstractObservable> observables, CompileOptions options);

  const LayerTree& layer_tree() const noexcept { return tree_; }
  const std::vector<AbstractObservable>& observables() const noexcept { return observables_; }
  const CompileOptions& options() const noexcept { return options_; }

  // Annotates circuits, detectors and observables for k, then builds the circuit.
  // Throws std::invalid_argument for k < 1.
  stim::Circuit generate_stim_circuit(std::int64_t k, const std::optional<NoiseModel>& noise_model = std::nullopt);

  // Relative detectors cached across calls.
  const DetectorDatabase& detector_database() const noexcept { return database_; }

 private:
  LayerTree tree_;
  std::vector<AbstractObservable> observables_;
  CompileOptions options_;
  DetectorDatabase database_;
};

// "css" or "fixed_boundary". Throws std::invalid_argument for other names.
CompilationConvention convention_by_name(const std::string& name);

// Builds one block per cube and pipe of `graph` with `convention`, cubes first. When
// `observables` is std::nullopt they are searched with find_memory_observables;
// observables given by the caller use the coordinates of `graph`. Throws
// CompilationError on an empty graph.
CompiledGraph compile_block_graph(const BlockGraph& graph, const CompilationConvention& convention = css_convention(),
                                  std::optional<std::vector<AbstractObservable>> observables = std::nullopt,
                                  const CompileOptions& options = {});

}  // namespace qtopo
