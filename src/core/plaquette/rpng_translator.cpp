#include "qtopo/core/plaquette/rpng_translator.h"

#include <algorithm>
#include <array>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "stim/circuit/circuit.h"

namespace qtopo {
namespace {

const char* reset_name(ExtendedBasis basis) {
  switch (basis) {
    case ExtendedBasis::kX:
      return "RX";
    case ExtendedBasis::kY:
      return "RY";
    case ExtendedBasis::kZ:
      return "R";
    case ExtendedBasis::kH:
      return "H";
  }
  return "R";
}

const char* measurement_name(ExtendedBasis basis) {
  switch (basis) {
    case ExtendedBasis::kX:
      return "MX";
    case ExtendedBasis::kY:
      return "MY";
    case ExtendedBasis::kZ:
      return "M";
    case ExtendedBasis::kH:
      return "H";
  }
  return "M";
}

// Emits one instruction per basis in X, Y, Z, H order.
void append_grouped(stim::Circuit* moment, const std::map<ExtendedBasis, std::vector<uint32_t>>& groups,
                    const char* (*name_of)(ExtendedBasis)) {
  for (const auto& [basis, targets] : groups) {
    if (!targets.empty()) {
      moment->safe_append_u(name_of(basis), targets);
    }
  }
}

}  // namespace

Plaquette DefaultRpngTranslator::translate(const RpngDescription& description) const {
  if (description.is_empty()) {
    return Plaquette::empty();
  }
  const PlaquetteQubits square = PlaquetteQubits::square();
  const std::array<Rpng, 4>& corners = description.corners();

  PlaquetteQubits qubits;
  std::array<int, 4> corner_qubit{-1, -1, -1, -1};
  for (std::size_t i = 0; i < corners.size(); ++i) {
    if (!corners[i].is_unused()) {
      qubits.data.push_back(square.data[i]);
    }
  }
  qubits.syndrome = square.syndrome;
  const QubitMap qubit_map = QubitMap::from_qubits(qubits.all());
  for (std::size_t i = 0; i < corners.size(); ++i) {
    if (!corners[i].is_unused()) {
      corner_qubit[i] = static_cast<int>(qubit_map.index_of(square.data[i]));
    }
  }
  const auto ancilla = static_cast<uint32_t>(qubit_map.index_of(square.syndrome.front()));

  std::map<ExtendedBasis, std::vector<uint32_t>> resets;
  std::map<ExtendedBasis, std::vector<uint32_t>> measurements;
  resets[description.ancilla().reset].push_back(ancilla);
  measurements[description.ancilla().measurement].push_back(ancilla);
  std::map<int, stim::Circuit> gates;
  for (std::size_t i = 0; i < corners.size(); ++i) {
    const Rpng& corner = corners[i];
    if (corner.is_unused()) {
      continue;
    }
    const auto data = static_cast<uint32_t>(corner_qubit[i]);
    if (corner.reset) {
      resets[*corner.reset].push_back(data);
    }
    if (corner.measurement) {
      measurements[*corner.measurement].push_back(data);
    }
    if (corner.pauli) {
      const std::string gate = std::string("C") + to_upper_char(*corner.pauli);
      gates[*corner.schedule].safe_append_u(gate, {ancilla, data});
    }
  }
  for (auto* groups : {&resets, &measurements}) {
    for (auto& entry : *groups) {
      std::sort(entry.second.begin(), entry.second.end());
    }
  }

  std::vector<stim::Circuit> moments;
  std::vector<int> schedule;
  stim::Circuit reset_moment;
  append_grouped(&reset_moment, resets, reset_name);
  moments.push_back(std::move(reset_moment));
  schedule.push_back(0);
  for (auto& [time, moment] : gates) {
    moments.push_back(std::move(moment));
    schedule.push_back(time);
  }
  stim::Circuit measurement_moment;
  append_grouped(&measurement_moment, measurements, measurement_name);
  moments.push_back(std::move(measurement_moment));
  schedule.push_back(kMeasurementSchedule);

  return Plaquette(description.str(), std::move(qubits),
                   ScheduledCircuit(std::move(moments), std::move(schedule), qubit_map),
                   default_mergeable_instructions(), description);
}

}  // namespace qtopo
