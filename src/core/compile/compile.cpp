#include "qtopo/core/compile/compile.h"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "qtopo/core/graph/topological_graph.h"
#include "qtopo/core/observables/builder.h"
#include "qtopo/core/utils/errors.h"

namespace qtopo {

CompiledGraph::CompiledGraph(LayerTree tree, std::vector<AbstractObservable> observables, CompileOptions options)
    : tree_(std::move(tree)), observables_(std::move(observables)), options_(std::move(options)) {}

stim::Circuit CompiledGraph::generate_stim_circuit(std::int64_t k, const std::optional<NoiseModel>& noise_model) {
  if (k < 1) {
    throw std::invalid_argument("k must be >= 1");
  }
  tree_.annotate_circuits(k);
  tree_.annotate_detectors(k, options_.manhattan_radius, &database_);
  tree_.annotate_observables(k, observables_);
  stim::Circuit circuit = tree_.generate_circuit(k, options_.include_qubit_coords);
  if (noise_model) {
    return noise_model->noisy_circuit(circuit);
  }
  return circuit;
}

CompilationConvention convention_by_name(const std::string& name) {
  if (name == "css") {
    return css_convention();
  }
  if (name == "fixed_boundary") {
    return fixed_boundary_convention();
  }
  throw std::invalid_argument("Unknown convention '" + name + "'; expected css or fixed_boundary");
}

CompiledGraph compile_block_graph(const BlockGraph& graph, const CompilationConvention& convention,
                                  std::optional<std::vector<AbstractObservable>> observables,
                                  const CompileOptions& options) {
  if (graph.empty()) {
    throw CompilationError("Cannot compile an empty block graph");
  }
  const Coordinate dz = options.shift_to_zero_z ? -graph.min_z() : 0;
  const BlockGraph shifted = graph.shifted_by(0, 0, dz);
  const std::vector<Cube> cubes = shifted.cubes();

  std::optional<TopologicalComputationGraph> topological_graph;
  for (const Cube& cube : cubes) {
    Block block = convention.cube_builder(CubeSpec::of(shifted, cube.position), options.block_repetitions);
    if (!topological_graph) {
      topological_graph.emplace(block.scalable_shape());
    }
    topological_graph->add_cube(cube.position, std::move(block));
  }
  for (const Pipe& pipe : shifted.pipes()) {
    topological_graph->add_junction(pipe.u().position, pipe.v().position,
                                    convention.pipe_builder(PipeSpec::of(shifted, pipe), options.block_repetitions));
  }

  std::vector<AbstractObservable> found;
  if (observables) {
    for (const AbstractObservable& observable : *observables) {
      found.push_back(observable.shifted_by(0, 0, dz));
    }
  } else {
    found = find_memory_observables(shifted);
  }
  if (found.empty()) {
    std::cerr << "Warning: no observable found for block graph '" << graph.name()
              << "'; the circuit will not contain any OBSERVABLE_INCLUDE\n";
  }
  return CompiledGraph(topological_graph->to_layer_tree(), std::move(found), options);
}

}  // namespace qtopo
