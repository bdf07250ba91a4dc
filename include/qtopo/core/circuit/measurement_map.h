#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "qtopo/core/circuit/qubit_map.h"

namespace stim {
struct Circuit;
}

namespace qtopo {

// For each measured qubit, the (negative) record offsets of its measurements relative to
// the end of the circuit, in chronological order.
class MeasurementRecordsMap {
 public:
  MeasurementRecordsMap() = default;
  // Throws NotImplementedError on REPEAT blocks and LookupError when a measured index
  // is missing from `qubit_map`.
  MeasurementRecordsMap(const stim::Circuit& circuit, const QubitMap& qubit_map);

  bool contains(const GridQubit& qubit) const { return records_.count(qubit) != 0; }
  const std::vector<std::int64_t>& offsets(const GridQubit& qubit) const;
  std::int64_t last_offset(const GridQubit& qubit) const { return offsets(qubit).back(); }

  std::size_t num_measurements() const noexcept { return num_measurements_; }
  const std::map<GridQubit, std::vector<std::int64_t>>& records() const noexcept { return records_; }

 private:
  std::map<GridQubit, std::vector<std::int64_t>> records_;
  std::size_t num_measurements_ = 0;
};

}  // namespace qtopo
