#pragma once

#include <cstddef>

#include "stim/circuit/circuit.h"

namespace qtopo {

// Probabilities of the channels inserted by NoiseModel. All default to 0.
struct NoiseStrengths {
  double after_single_qubit_gate = 0.0;
  double after_two_qubit_gate = 0.0;
  double after_reset_flip = 0.0;
  double before_measure_flip = 0.0;
};

// Circuit-level noise inserted around the operations of a noiseless circuit:
// - DEPOLARIZE1 after single-qubit unitaries, DEPOLARIZE2 after two-qubit gates;
// - a basis flip (X_ERROR, or Z_ERROR for X-basis operations) after resets and
//   before measurements.
// REPEAT blocks are rewritten recursively. Channels with probability 0 are skipped.
class NoiseModel {
 public:
  // Throws std::invalid_argument if a strength lies outside [0, 1].
  explicit NoiseModel(NoiseStrengths strengths);

  // Same probability p on every channel.
  static NoiseModel uniform_depolarizing(double p);

  const NoiseStrengths& strengths() const noexcept { return strengths_; }

  stim::Circuit noisy_circuit(const stim::Circuit& circuit) const;

 private:
  NoiseStrengths strengths_;
};

// Number of error mechanisms in the smallest graphlike undetectable logical error of
// the (noisy) circuit. Throws std::invalid_argument if the circuit has no observable.
std::size_t compute_graphlike_distance(const stim::Circuit& circuit);

}  // namespace qtopo
