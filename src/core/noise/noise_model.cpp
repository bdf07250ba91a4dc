#include "qtopo/core/noise/noise_model.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "stim/circuit/gate_target.h"
#include "stim/dem/detector_error_model.h"
#include "stim/gates/gates.h"
#include "stim/search/graphlike/algo.h"
#include "stim/simulators/error_analyzer.h"

namespace qtopo {
namespace {

void append_noise(stim::Circuit* circuit, const char* name, const std::vector<uint32_t>& targets, double prob) {
  if (prob == 0.0 || targets.empty()) {
    return;
  }
  circuit->safe_append_ua(name, targets, prob);
}

std::vector<uint32_t> qubit_targets(const stim::CircuitInstruction& instruction) {
  std::vector<uint32_t> targets;
  targets.reserve(instruction.targets.size());
  for (const stim::GateTarget& target : instruction.targets) {
    if (target.is_qubit_target()) {
      targets.push_back(target.qubit_value());
    }
  }
  return targets;
}

// X-basis resets and measurements are flipped by Z errors, the others by X errors.
const char* flip_error_for(const stim::Gate& gate) {
  const std::string name(gate.name);
  return name.back() == 'X' ? "Z_ERROR" : "X_ERROR";
}

void check_strength(const char* channel, double p) {
  if (!(p >= 0.0 && p <= 1.0)) {
    throw std::invalid_argument(std::string("Noise strength '") + channel + "' must lie in [0, 1], got " +
                                std::to_string(p));
  }
}

}  // namespace

NoiseModel::NoiseModel(NoiseStrengths strengths) : strengths_(strengths) {
  check_strength("after_single_qubit_gate", strengths_.after_single_qubit_gate);
  check_strength("after_two_qubit_gate", strengths_.after_two_qubit_gate);
  check_strength("after_reset_flip", strengths_.after_reset_flip);
  check_strength("before_measure_flip", strengths_.before_measure_flip);
}

NoiseModel NoiseModel::uniform_depolarizing(double p) {
  return NoiseModel(NoiseStrengths{p, p, p, p});
}

stim::Circuit NoiseModel::noisy_circuit(const stim::Circuit& circuit) const {
  stim::Circuit noisy;
  for (const stim::CircuitInstruction& instruction : circuit.operations) {
    if (instruction.gate_type == stim::GateType::REPEAT) {
      noisy += noisy_circuit(instruction.repeat_block_body(circuit)) * instruction.repeat_block_rep_count();
      continue;
    }
    const stim::Gate& gate = stim::GATE_DATA[instruction.gate_type];
    const bool measures = (gate.flags & stim::GATE_PRODUCES_RESULTS) != 0;
    // Measurements are flagged noisy because they accept a flip probability.
    if ((!measures && (gate.flags & stim::GATE_IS_NOISY)) || (gate.flags & stim::GATE_HAS_NO_EFFECT_ON_QUBITS)) {
      noisy.safe_append(instruction);
      continue;
    }
    const std::vector<uint32_t> targets = qubit_targets(instruction);
    const bool resets = (gate.flags & stim::GATE_IS_RESET) != 0;
    if (measures) {
      append_noise(&noisy, flip_error_for(gate), targets, strengths_.before_measure_flip);
    }
    noisy.safe_append(instruction);
    if (resets) {
      append_noise(&noisy, flip_error_for(gate), targets, strengths_.after_reset_flip);
    } else if (gate.flags & stim::GATE_TARGETS_PAIRS) {
      append_noise(&noisy, "DEPOLARIZE2", targets, strengths_.after_two_qubit_gate);
    } else if (!measures && (gate.flags & stim::GATE_IS_UNITARY) && (gate.flags & stim::GATE_IS_SINGLE_QUBIT_GATE)) {
      append_noise(&noisy, "DEPOLARIZE1", targets, strengths_.after_single_qubit_gate);
    }
  }
  return noisy;
}

std::size_t compute_graphlike_distance(const stim::Circuit& circuit) {
  if (circuit.count_observables() == 0) {
    throw std::invalid_argument("Cannot compute a distance without logical observable");
  }
  const stim::DetectorErrorModel dem =
      stim::ErrorAnalyzer::circuit_to_detector_error_model(circuit, true, true, false, 0.0, false, false);
  const stim::DetectorErrorModel logical_error = stim::shortest_graphlike_undetectable_logical_error(dem, false);
  std::size_t distance = 0;
  for (const stim::DemInstruction& instruction : logical_error.instructions) {
    if (instruction.type == stim::DemInstructionType::DEM_ERROR) {
      ++distance;
    }
  }
  return distance;
}

}  // namespace qtopo
