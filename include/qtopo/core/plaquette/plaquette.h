#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "qtopo/core/circuit/qubit_map.h"
#include "qtopo/core/circuit/scheduled_circuit.h"
#include "qtopo/core/plaquette/rpng.h"

namespace qtopo {

// Qubits of a plaquette relative to its syndrome qubit at (0, 0).
struct PlaquetteQubits {
  std::vector<GridQubit> data;
  std::vector<GridQubit> syndrome;

  // Data corners TL (-1, -1), TR (1, -1), BL (-1, 1), BR (1, 1) around one syndrome qubit.
  static PlaquetteQubits square();
  std::vector<GridQubit> all() const;
};

// Names of the instructions that may be deduplicated when plaquettes are merged.
const std::set<std::string>& default_mergeable_instructions();

class Plaquette {
 public:
  Plaquette(std::string name, PlaquetteQubits qubits, ScheduledCircuit circuit,
            std::set<std::string> mergeable_instructions = default_mergeable_instructions(),
            std::optional<RpngDescription> description = std::nullopt);

  static Plaquette empty();

  const std::string& name() const noexcept { return name_; }
  const PlaquetteQubits& qubits() const noexcept { return qubits_; }
  const ScheduledCircuit& circuit() const noexcept { return circuit_; }
  const std::set<std::string>& mergeable_instructions() const noexcept { return mergeable_instructions_; }
  // Set for plaquettes built from an RPNG description; used to infer detectors.
  const std::optional<RpngDescription>& description() const noexcept { return description_; }

  bool is_empty() const noexcept { return circuit_.empty(); }

  // Plaquettes are identified by name.
  bool operator==(const Plaquette& other) const noexcept { return name_ == other.name_; }
  bool operator!=(const Plaquette& other) const noexcept { return !(*this == other); }

 private:
  std::string name_;
  PlaquetteQubits qubits_;
  ScheduledCircuit circuit_;
  std::set<std::string> mergeable_instructions_;
  std::optional<RpngDescription> description_;
};

// Template index -> plaquette, with a fallback for indices without an entry.
class Plaquettes {
 public:
  Plaquettes();
  explicit Plaquettes(std::map<std::size_t, Plaquette> collection);
  Plaquettes(std::map<std::size_t, Plaquette> collection, Plaquette default_plaquette);

  const Plaquette& operator[](std::size_t index) const;
  bool contains(std::size_t index) const { return collection_.count(index) != 0; }

  const std::map<std::size_t, Plaquette>& collection() const noexcept { return collection_; }
  const Plaquette& default_plaquette() const noexcept { return default_plaquette_; }

  Plaquettes without_plaquettes(const std::set<std::size_t>& indices) const;
  Plaquettes with_updated_plaquettes(const std::map<std::size_t, Plaquette>& updates) const;

  bool operator==(const Plaquettes& other) const;
  bool operator!=(const Plaquettes& other) const { return !(*this == other); }

 private:
  std::map<std::size_t, Plaquette> collection_;
  Plaquette default_plaquette_;
};

}  // namespace qtopo
