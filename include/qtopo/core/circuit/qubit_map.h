#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <tuple>
#include <vector>

#include "qtopo/core/geometry/position.h"

namespace stim {
struct Circuit;
}

namespace qtopo {

// Qubit on the physical 2D grid.
struct GridQubit {
  Coordinate x = 0;
  Coordinate y = 0;

  GridQubit operator+(const Shift2D& shift) const noexcept { return {x + shift.x, y + shift.y}; }
  Shift2D operator-(const GridQubit& other) const noexcept { return {x - other.x, y - other.y}; }
  bool operator==(const GridQubit& other) const noexcept { return x == other.x && y == other.y; }
  bool operator!=(const GridQubit& other) const noexcept { return !(*this == other); }
  bool operator<(const GridQubit& other) const noexcept {
    return std::tie(x, y) < std::tie(other.x, other.y);
  }
  std::string str() const;
};

// Bijection between dense circuit indices and grid qubits.
class QubitMap {
 public:
  QubitMap() = default;
  // Throws CompilationError if two indices share a qubit.
  explicit QubitMap(std::map<std::size_t, GridQubit> index_to_qubit);

  // Indices assigned 0..n-1 following the GridQubit order; duplicates are merged.
  static QubitMap from_qubits(std::vector<GridQubit> qubits);

  const std::map<std::size_t, GridQubit>& index_to_qubit() const noexcept { return index_to_qubit_; }
  std::size_t size() const noexcept { return index_to_qubit_.size(); }
  bool empty() const noexcept { return index_to_qubit_.empty(); }

  bool contains(const GridQubit& qubit) const;
  // Throws LookupError when absent.
  std::size_t index_of(const GridQubit& qubit) const;
  const GridQubit& qubit_at(std::size_t index) const;

  std::vector<GridQubit> qubits() const;

  QubitMap with_mapped_qubits(const std::function<GridQubit(const GridQubit&)>& mapping) const;

  // One QUBIT_COORDS instruction per qubit, in index order.
  void append_qubit_coords(stim::Circuit* circuit) const;

  bool operator==(const QubitMap& other) const { return index_to_qubit_ == other.index_to_qubit_; }

 private:
  std::map<std::size_t, GridQubit> index_to_qubit_;
  std::map<GridQubit, std::size_t> qubit_to_index_;
};

}  // namespace qtopo
