#pragma once

#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <vector>

#include "stim/circuit/circuit.h"
#include "qtopo/core/circuit/qubit_map.h"
#include "qtopo/core/geometry/position.h"

namespace qtopo {

// A circuit split into moments, each tagged with a strictly increasing schedule value.
// Targets inside the moments index into the qubit map of the circuit.
class ScheduledCircuit {
 public:
  ScheduledCircuit() = default;
  ScheduledCircuit(std::vector<stim::Circuit> moments, std::vector<int> schedule, QubitMap qubit_map);

  // Splits `circuit` on TICK instructions; the i-th moment gets schedule value i.
  static ScheduledCircuit from_circuit(const stim::Circuit& circuit, QubitMap qubit_map);

  const std::vector<stim::Circuit>& moments() const noexcept { return moments_; }
  const std::vector<int>& schedule() const noexcept { return schedule_; }
  const QubitMap& qubit_map() const noexcept { return qubit_map_; }

  std::size_t num_moments() const noexcept { return moments_.size(); }
  bool empty() const noexcept { return moments_.empty(); }

  // Same circuit acting on qubits translated by `shift`.
  ScheduledCircuit shifted(const Shift2D& shift) const;

  // Flat circuit with one TICK between consecutive moments. Targets are remapped to
  // `target_map`, which must contain every qubit of this circuit.
  stim::Circuit get_circuit(const QubitMap& target_map, bool include_qubit_coords = false) const;
  stim::Circuit get_circuit(bool include_qubit_coords = true) const;

 private:
  std::vector<stim::Circuit> moments_;
  std::vector<int> schedule_;
  QubitMap qubit_map_;
};

// Copy of `circuit` with every qubit target index passed through `mapping`. Record
// targets and target flags are preserved. REPEAT blocks are remapped recursively.
stim::Circuit remap_qubit_targets(const stim::Circuit& circuit,
                                  const std::function<uint32_t(uint32_t)>& mapping);

// Merges circuits that run in parallel on disjoint or overlapping qubits. Instructions
// named in `mergeable_instructions` are deduplicated per moment with sorted targets;
// the others are appended in input order. The resulting qubit map holds the union of
// all input qubits in GridQubit order.
ScheduledCircuit merge_scheduled_circuits(const std::vector<ScheduledCircuit>& circuits,
                                          const std::set<std::string>& mergeable_instructions);

}  // namespace qtopo
