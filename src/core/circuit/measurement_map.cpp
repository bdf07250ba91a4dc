#include "qtopo/core/circuit/measurement_map.h"

#include "stim/circuit/circuit.h"
#include "qtopo/core/utils/errors.h"

namespace qtopo {

MeasurementRecordsMap::MeasurementRecordsMap(const stim::Circuit& circuit, const QubitMap& qubit_map) {
  std::vector<GridQubit> measured;
  for (const stim::CircuitInstruction& op : circuit.operations) {
    if (op.gate_type == stim::GateType::REPEAT) {
      throw NotImplementedError("Measurement records of REPEAT blocks are not supported");
    }
    if ((stim::GATE_DATA[op.gate_type].flags & stim::GATE_PRODUCES_RESULTS) == 0) {
      continue;
    }
    for (const stim::GateTarget& t : op.targets) {
      if (t.is_combiner()) {
        throw NotImplementedError("Measurement records of Pauli product measurements are not supported");
      }
      measured.push_back(qubit_map.qubit_at(t.qubit_value()));
    }
  }
  num_measurements_ = measured.size();
  const auto total = static_cast<std::int64_t>(measured.size());
  for (std::int64_t i = 0; i < total; ++i) {
    records_[measured[static_cast<std::size_t>(i)]].push_back(i - total);
  }
}

const std::vector<std::int64_t>& MeasurementRecordsMap::offsets(const GridQubit& qubit) const {
  const auto it = records_.find(qubit);
  if (it == records_.end()) {
    throw LookupError("Qubit " + qubit.str() + " is never measured");
  }
  return it->second;
}

}  // namespace qtopo
