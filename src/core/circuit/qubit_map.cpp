#include "qtopo/core/circuit/qubit_map.h"

#include <algorithm>

#include "stim/circuit/circuit.h"
#include "qtopo/core/utils/errors.h"

namespace qtopo {

std::string GridQubit::str() const {
  return "Q(" + std::to_string(x) + ", " + std::to_string(y) + ")";
}

QubitMap::QubitMap(std::map<std::size_t, GridQubit> index_to_qubit)
    : index_to_qubit_(std::move(index_to_qubit)) {
  for (const auto& [index, qubit] : index_to_qubit_) {
    if (!qubit_to_index_.emplace(qubit, index).second) {
      throw CompilationError("Qubit " + qubit.str() + " is mapped to more than one index");
    }
  }
}

QubitMap QubitMap::from_qubits(std::vector<GridQubit> qubits) {
  std::sort(qubits.begin(), qubits.end());
  qubits.erase(std::unique(qubits.begin(), qubits.end()), qubits.end());
  std::map<std::size_t, GridQubit> mapping;
  for (std::size_t i = 0; i < qubits.size(); ++i) {
    mapping.emplace(i, qubits[i]);
  }
  return QubitMap(std::move(mapping));
}

bool QubitMap::contains(const GridQubit& qubit) const {
  return qubit_to_index_.count(qubit) != 0;
}

std::size_t QubitMap::index_of(const GridQubit& qubit) const {
  const auto it = qubit_to_index_.find(qubit);
  if (it == qubit_to_index_.end()) {
    throw LookupError("Qubit " + qubit.str() + " is not in the qubit map");
  }
  return it->second;
}

const GridQubit& QubitMap::qubit_at(std::size_t index) const {
  const auto it = index_to_qubit_.find(index);
  if (it == index_to_qubit_.end()) {
    throw LookupError("Index " + std::to_string(index) + " is not in the qubit map");
  }
  return it->second;
}

std::vector<GridQubit> QubitMap::qubits() const {
  std::vector<GridQubit> out;
  out.reserve(index_to_qubit_.size());
  for (const auto& entry : index_to_qubit_) {
    out.push_back(entry.second);
  }
  return out;
}

QubitMap QubitMap::with_mapped_qubits(const std::function<GridQubit(const GridQubit&)>& mapping) const {
  std::map<std::size_t, GridQubit> mapped;
  for (const auto& [index, qubit] : index_to_qubit_) {
    mapped.emplace(index, mapping(qubit));
  }
  return QubitMap(std::move(mapped));
}

void QubitMap::append_qubit_coords(stim::Circuit* circuit) const {
  for (const auto& [index, qubit] : index_to_qubit_) {
    circuit->safe_append_u("QUBIT_COORDS", {static_cast<uint32_t>(index)},
                           {static_cast<double>(qubit.x), static_cast<double>(qubit.y)});
  }
}

}  // namespace qtopo
