#include "qtopo/core/compile/compile.h"
#include "qtopo/core/blocks/block.h"
#include "qtopo/core/blocks/layers.h"
#include "qtopo/core/computation/block_graph.h"
#include "qtopo/core/conventions/css.h"
#include "qtopo/core/conventions/fixed_boundary.h"
#include "qtopo/core/conventions/specs.h"
#include "qtopo/core/observables/abstract_observable.h"
#include "qtopo/core/noise/noise_model.h"
#include "qtopo/core/utils/errors.h"
#include "stim/circuit/circuit.h"
#include "stim/simulators/error_analyzer.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace qtopo;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

std::uint64_t distance_of(std::int64_t k) { return static_cast<std::uint64_t>(2 * k + 1); }

std::uint64_t stabilizers(std::uint64_t d) { return d * d - 1; }

// stim refuses to build an error model for a detector that is not deterministic.
bool all_detectors_deterministic(const stim::Circuit& circuit) {
  try {
    stim::ErrorAnalyzer::circuit_to_detector_error_model(circuit, false, true, false, 0.0, false, false);
  } catch (const std::invalid_argument&) {
    return false;
  }
  return true;
}

}  // namespace

int main() {
  const ZXCube zxz = ZXCube::from_string("ZXZ");

  // One memory cube: d rounds of d^2 - 1 stabilizers, half of them checked at initialisation.
  BlockGraph single("single");
  single.add_cube({0, 0, 0}, zxz);
  CompiledGraph single_compiled = compile_block_graph(single);
  const stim::Circuit cube_k2 = single_compiled.generate_stim_circuit(2);
  expect(cube_k2.count_observables() == 1, "A memory cube has one observable");
  expect(cube_k2.count_detectors() == stabilizers(5) * 5, "A d = 5 memory cube has (d^2 - 1) * d detectors");
  const stim::Circuit cube_k1 = single_compiled.generate_stim_circuit(1);
  expect(cube_k1.count_qubits() == 17, "A d = 3 patch uses 9 data and 8 syndrome qubits");
  expect(cube_k1.count_detectors() == stabilizers(3) * 3, "A d = 3 memory cube has (d^2 - 1) * d detectors");
  expect(single_compiled.generate_stim_circuit(1) == cube_k1, "Generating twice gives the same circuit");
  expect(single_compiled.detector_database().hits() > 0, "Relative detectors are reused");

  const NoiseModel noise = NoiseModel::uniform_depolarizing(1e-3);
  expect(compute_graphlike_distance(single_compiled.generate_stim_circuit(1, noise)) == distance_of(1),
         "A d = 3 memory cube has distance 3");

  // Two cubes joined in time: the readout and initialisation in between disappear.
  BlockGraph column("column");
  column.add_cube({0, 0, 0}, zxz);
  column.add_cube({0, 0, 1}, zxz);
  column.add_pipe({0, 0, 0}, {0, 0, 1});
  CompiledGraph column_compiled = compile_block_graph(column);
  const stim::Circuit column_k1 = column_compiled.generate_stim_circuit(1, noise);
  expect(column_k1.count_observables() == 1, "A column has one observable");
  expect(column_k1.count_detectors() == stabilizers(3) * 2 * 3, "Two stacked cubes have (d^2 - 1) * 2d detectors");
  expect(compute_graphlike_distance(column_k1) == distance_of(1), "Two stacked d = 3 cubes have distance 3");

  // The lowest cube is moved to z = 0 before compiling.
  BlockGraph raised("raised");
  raised.add_cube({0, 0, 7}, zxz);
  CompiledGraph raised_compiled = compile_block_graph(raised);
  expect(raised_compiled.layer_tree().depths() == std::vector<Coordinate>({0}), "Depths start at 0");
  expect(raised_compiled.generate_stim_circuit(1).count_detectors() == stabilizers(3) * 3,
         "Shifted cube compiles like an unshifted one");

  // Two cubes joined in space form one wider patch.
  BlockGraph line("line");
  line.add_cube({0, 0, 0}, zxz);
  line.add_cube({1, 0, 0}, zxz);
  line.add_pipe({0, 0, 0}, {1, 0, 0});
  CompiledGraph line_compiled = compile_block_graph(line);
  const stim::Circuit line_k1 = line_compiled.generate_stim_circuit(1);
  expect(line_k1.count_observables() == 1, "A line of cubes has one observable");
  expect(line_k1.count_detectors() > cube_k1.count_detectors(), "The joined patch holds more detectors");

  CompileOptions options;
  options.include_qubit_coords = false;
  CompiledGraph bare = compile_block_graph(single, css_convention(), std::nullopt, options);
  const stim::Circuit bare_k1 = bare.generate_stim_circuit(1);
  expect(bare_k1.str().find("QUBIT_COORDS") == std::string::npos, "Qubit coordinates can be omitted");

  // A cube whose middle readout rounds run k - 1 times: at k = 1 the final readout
  // compares against the initialisation, as if the skipped rounds were never there.
  const CompilationConvention skipped_rounds{
      "skipped_rounds",
      [](const CubeSpec& spec, const LinearFunction& repetitions) {
        const Block memory = build_css_cube(spec, repetitions);
        const std::vector<Layer>& layers = memory.layers();
        return Block({layers.front(), RepeatedLayer(layers.back(), LinearFunction(1, -1)), layers.back()});
      },
      build_css_pipe};
  CompiledGraph skipped = compile_block_graph(single, skipped_rounds);
  expect(skipped.generate_stim_circuit(1).count_detectors() == stabilizers(3) * 2,
         "Rounds repeated zero times do not hide the initialisation from the readout");

  bool rejected = false;
  try {
    single_compiled.generate_stim_circuit(0);
  } catch (const std::invalid_argument&) {
    rejected = true;
  }
  expect(rejected, "k = 0 must be rejected");

  rejected = false;
  try {
    compile_block_graph(BlockGraph("empty"));
  } catch (const CompilationError&) {
    rejected = true;
  }
  expect(rejected, "An empty graph cannot be compiled");

  // Transversal Hadamard between two stacked cubes: the stabilizers measured before the
  // H gates are compared with the flipped ones measured after them.
  BlockGraph hadamard("hadamard");
  hadamard.add_cube({0, 0, 0}, zxz);
  hadamard.add_cube({0, 0, 1}, ZXCube::from_string("XZX"));
  hadamard.add_pipe({0, 0, 0}, {0, 0, 1});
  expect(hadamard.pipes().front().kind().has_hadamard(), "ZXZ below XZX needs a Hadamard pipe");
  rejected = false;
  try {
    compile_block_graph(hadamard);
  } catch (const NotImplementedError&) {
    rejected = true;
  }
  expect(rejected, "Hadamard pipes are not supported by the CSS convention");

  const CompilationConvention fixed_boundary = convention_by_name("fixed_boundary");
  CompiledGraph fixed_column = compile_block_graph(column, fixed_boundary);
  const stim::Circuit fixed_column_k1 = fixed_column.generate_stim_circuit(1, noise);
  expect(fixed_column_k1.count_detectors() == stabilizers(3) * 2 * 3,
         "The fixed-boundary column has as many detectors as the CSS one");
  expect(compute_graphlike_distance(fixed_column_k1) == distance_of(1), "The fixed-boundary column has distance 3");

  CompiledGraph hadamard_compiled = compile_block_graph(hadamard, fixed_boundary);
  const stim::Circuit hadamard_k1 = hadamard_compiled.generate_stim_circuit(1, noise);
  expect(hadamard_k1.count_observables() == 1, "The Hadamard column has one observable");
  expect(hadamard_k1.count_detectors() == stabilizers(3) * 2 * 3,
         "Every round across the Hadamard keeps its round-to-round detectors");
  expect(hadamard_k1.str().find("H ") != std::string::npos, "The Hadamard layer applies H gates");
  expect(compute_graphlike_distance(hadamard_k1) == distance_of(1), "The Hadamard column has distance 3");

  rejected = false;
  try {
    convention_by_name("diagonal");
  } catch (const std::invalid_argument&) {
    rejected = true;
  }
  expect(rejected, "Unknown convention names are rejected");

  // Stability experiment: one cube whose four spatial boundaries measure Z stabilizers,
  // with data qubits initialised and measured in X. Its two outer corners are closed by
  // 3-body plaquettes, leaving 8 stabilizers on 7 data qubits. Only the 2 X stabilizers
  // are checked at initialisation and readout.
  BlockGraph stability("stability");
  stability.add_cube({0, 0, 0}, ZXCube::from_string("ZZX"));
  rejected = false;
  try {
    compile_block_graph(stability);
  } catch (const NotImplementedError&) {
    rejected = true;
  }
  expect(rejected, "Memory observables are not searched through spatial cubes");
  CompiledGraph stability_compiled = compile_block_graph(stability, css_convention(), std::vector<AbstractObservable>{});
  const stim::Circuit stability_k1 = stability_compiled.generate_stim_circuit(1, noise);
  expect(stability_k1.count_qubits() == 15, "The stability patch uses 7 data and 8 syndrome qubits");
  expect(stability_k1.count_detectors() == 2 + 8 + 8 + 2, "The stability patch checks every round");
  expect(all_detectors_deterministic(stability_k1), "Stability detectors are deterministic");

  // A spatial cube with a single arm towards a regular cube: one 7 x 3 patch with a
  // missing corner, 20 stabilizers among which 7 X ones.
  BlockGraph arm("arm");
  arm.add_cube({0, 0, 0}, ZXCube::from_string("ZZX"));
  arm.add_cube({1, 0, 0}, ZXCube::from_string("XZX"));
  arm.add_pipe({0, 0, 0}, {1, 0, 0});
  CompiledGraph arm_compiled = compile_block_graph(arm, css_convention(), std::vector<AbstractObservable>{});
  const stim::Circuit arm_k1 = arm_compiled.generate_stim_circuit(1, noise);
  expect(arm_k1.count_detectors() == 7 + 2 * 20 + 7, "The arm joins both patches into one");
  expect(all_detectors_deterministic(arm_k1), "Detectors across the arm are deterministic");
  expect(all_detectors_deterministic(arm_compiled.generate_stim_circuit(2, noise)),
         "Detectors across the arm stay deterministic for larger k");

  rejected = false;
  try {
    compile_block_graph(stability, fixed_boundary, std::vector<AbstractObservable>{});
  } catch (const NotImplementedError&) {
    rejected = true;
  }
  expect(rejected, "Spatial cubes are not supported by the fixed-boundary convention");
  return 0;
}
