#include "qtopo/core/circuit/measurement_map.h"
#include "qtopo/core/circuit/qubit_map.h"
#include "qtopo/core/circuit/scheduled_circuit.h"
#include "qtopo/core/utils/errors.h"
#include "stim/circuit/circuit.h"

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

}  // namespace

int main() {
  using namespace qtopo;

  const QubitMap map = QubitMap::from_qubits({{2, 0}, {0, 0}, {1, 1}});
  expect(map.index_of({0, 0}) == 0, "Qubits are indexed in sorted order");
  expect(map.qubit_at(2) == GridQubit{2, 0}, "Index lookup returns the qubit");
  bool missing = false;
  try {
    map.index_of({5, 5});
  } catch (const LookupError&) {
    missing = true;
  }
  expect(missing, "Unknown qubit must raise LookupError");

  const ScheduledCircuit first =
      ScheduledCircuit::from_circuit(stim::Circuit("R 0 1\nTICK\nCX 0 1\nTICK\nM 0"), QubitMap::from_qubits({{0, 0}, {1, 0}}));
  expect(first.schedule() == std::vector<int>({0, 1, 2}), "TICKs split moments");
  const ScheduledCircuit second =
      ScheduledCircuit::from_circuit(stim::Circuit("R 0 1\nTICK\nCX 1 0\nTICK\nM 1"), QubitMap::from_qubits({{1, 0}, {2, 0}}));

  const ScheduledCircuit merged = merge_scheduled_circuits({first, second}, {"R", "M"});
  expect(merged.qubit_map().size() == 3, "Merged map holds the union of qubits");
  const stim::Circuit flat = merged.get_circuit(false);
  expect(flat.count_qubits() == 3, "Merged circuit acts on three qubits");
  // (1, 0) is reset by both inputs but only once after merging.
  expect(merged.moments().front().count_qubits() == 3, "Resets are deduplicated");
  std::size_t resets = 0;
  for (const auto& op : merged.moments().front().operations) {
    resets += op.targets.size();
  }
  expect(resets == 3, "Three distinct qubits are reset");
  expect(flat.count_measurements() == 2, "Two measurements survive the merge");

  const ScheduledCircuit shifted = first.shifted({4, 4});
  expect(shifted.qubit_map().contains({4, 4}), "Shift moves every qubit");

  const QubitMap records_map = QubitMap::from_qubits({{0, 0}, {1, 0}});
  const MeasurementRecordsMap records(stim::Circuit("M 0 1\nTICK\nM 0"), records_map);
  expect(records.num_measurements() == 3, "Three measurements are recorded");
  expect(records.offsets({0, 0}) == std::vector<std::int64_t>({-3, -1}), "Offsets count from the end");
  expect(records.last_offset({1, 0}) == -2, "Last record of (1, 0) is -2");
  return 0;
}
