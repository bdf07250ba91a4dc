#include "qtopo/core/noise/noise_model.h"
#include "stim/circuit/circuit.h"
#include "stim/gates/gates.h"

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

std::vector<std::string> gate_names(const stim::Circuit& circuit) {
  std::vector<std::string> names;
  for (const stim::CircuitInstruction& op : circuit.operations) {
    names.emplace_back(stim::GATE_DATA[op.gate_type].name);
  }
  return names;
}

}  // namespace

int main() {
  const NoiseStrengths defaults;
  expect(defaults.after_single_qubit_gate == 0.0 && defaults.after_two_qubit_gate == 0.0 &&
             defaults.after_reset_flip == 0.0 && defaults.before_measure_flip == 0.0,
         "Default noise is zero");
  const NoiseModel uniform = NoiseModel::uniform_depolarizing(0.25);
  expect(uniform.strengths().before_measure_flip == 0.25 && uniform.strengths().after_two_qubit_gate == 0.25,
         "Uniform depolarizing sets every channel");
  bool rejected = false;
  try {
    NoiseStrengths strengths;
    strengths.after_reset_flip = 1.5;
    const NoiseModel invalid(strengths);
  } catch (const std::invalid_argument&) {
    rejected = true;
  }
  expect(rejected, "Probabilities above 1 are rejected");
  rejected = false;
  try {
    NoiseModel::uniform_depolarizing(-0.1);
  } catch (const std::invalid_argument&) {
    rejected = true;
  }
  expect(rejected, "Negative probabilities are rejected");

  const NoiseModel model = NoiseModel::uniform_depolarizing(0.01);
  const stim::Circuit noisy = model.noisy_circuit(stim::Circuit(
      "R 0 1\n"
      "RX 2\n"
      "TICK\n"
      "H 0\n"
      "CX 0 1\n"
      "MX 2\n"
      "M 0\n"
      "DETECTOR rec[-1]\n"
      "REPEAT 3 {\n"
      "    H 1\n"
      "}\n"));
  const std::vector<std::string> expected = {
      "R", "X_ERROR", "RX", "Z_ERROR", "TICK", "H", "DEPOLARIZE1", "CX", "DEPOLARIZE2",
      "Z_ERROR", "MX", "X_ERROR", "M", "DETECTOR", "REPEAT",
  };
  expect(gate_names(noisy) == expected, "Noise is inserted around every operation");
  expect(noisy.blocks.size() == 1, "REPEAT body is rewritten once");
  expect(gate_names(noisy.blocks.front()) == std::vector<std::string>({"H", "DEPOLARIZE1"}),
         "Noise is inserted inside REPEAT blocks");
  expect(noisy.count_detectors() == 1, "Annotations are copied");

  const NoiseModel silent{NoiseStrengths()};
  expect(silent.noisy_circuit(stim::Circuit("R 0\nM 0\n")) == stim::Circuit("R 0\nM 0\n"),
         "Zero probabilities add nothing");
  NoiseStrengths measure_only;
  measure_only.before_measure_flip = 0.02;
  expect(gate_names(NoiseModel(measure_only).noisy_circuit(stim::Circuit("R 0\nH 0\nM 0\n"))) ==
             std::vector<std::string>({"R", "H", "X_ERROR", "M"}),
         "Each strength drives its own channel");

  rejected = false;
  try {
    compute_graphlike_distance(stim::Circuit("R 0\nX_ERROR(0.1) 0\nM 0\nDETECTOR rec[-1]\n"));
  } catch (const std::invalid_argument&) {
    rejected = true;
  }
  expect(rejected, "Distance needs an observable");

  // Three-qubit repetition code: the smallest undetected logical flip needs three errors.
  const stim::Circuit repetition(
      "R 0 1 2\n"
      "X_ERROR(0.1) 0 1 2\n"
      "M 0 1 2\n"
      "DETECTOR rec[-3] rec[-2]\n"
      "DETECTOR rec[-2] rec[-1]\n"
      "OBSERVABLE_INCLUDE(0) rec[-1]\n");
  expect(compute_graphlike_distance(repetition) == 3, "Three-qubit repetition code has distance 3");
  return 0;
}
