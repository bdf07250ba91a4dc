#include "qtopo/core/plaquette/plaquette.h"

#include <utility>

namespace qtopo {

PlaquetteQubits PlaquetteQubits::square() {
  return PlaquetteQubits{{{-1, -1}, {1, -1}, {-1, 1}, {1, 1}}, {{0, 0}}};
}

std::vector<GridQubit> PlaquetteQubits::all() const {
  std::vector<GridQubit> out = data;
  out.insert(out.end(), syndrome.begin(), syndrome.end());
  return out;
}

const std::set<std::string>& default_mergeable_instructions() {
  static const std::set<std::string> kMergeable = {"H", "M", "MX", "MY", "R", "RX", "RY"};
  return kMergeable;
}

Plaquette::Plaquette(std::string name, PlaquetteQubits qubits, ScheduledCircuit circuit,
                     std::set<std::string> mergeable_instructions,
                     std::optional<RpngDescription> description)
    : name_(std::move(name)),
      qubits_(std::move(qubits)),
      circuit_(std::move(circuit)),
      mergeable_instructions_(std::move(mergeable_instructions)),
      description_(std::move(description)) {}

Plaquette Plaquette::empty() {
  return Plaquette("empty", PlaquetteQubits{}, ScheduledCircuit{});
}

Plaquettes::Plaquettes() : default_plaquette_(Plaquette::empty()) {}

Plaquettes::Plaquettes(std::map<std::size_t, Plaquette> collection)
    : collection_(std::move(collection)), default_plaquette_(Plaquette::empty()) {}

Plaquettes::Plaquettes(std::map<std::size_t, Plaquette> collection, Plaquette default_plaquette)
    : collection_(std::move(collection)), default_plaquette_(std::move(default_plaquette)) {}

const Plaquette& Plaquettes::operator[](std::size_t index) const {
  const auto it = collection_.find(index);
  return it == collection_.end() ? default_plaquette_ : it->second;
}

Plaquettes Plaquettes::without_plaquettes(const std::set<std::size_t>& indices) const {
  std::map<std::size_t, Plaquette> kept;
  for (const auto& [index, plaquette] : collection_) {
    if (indices.count(index) == 0) {
      kept.emplace(index, plaquette);
    }
  }
  return Plaquettes(std::move(kept), default_plaquette_);
}

Plaquettes Plaquettes::with_updated_plaquettes(const std::map<std::size_t, Plaquette>& updates) const {
  std::map<std::size_t, Plaquette> updated = collection_;
  for (const auto& [index, plaquette] : updates) {
    updated.insert_or_assign(index, plaquette);
  }
  return Plaquettes(std::move(updated), default_plaquette_);
}

bool Plaquettes::operator==(const Plaquettes& other) const {
  return collection_ == other.collection_ && default_plaquette_ == other.default_plaquette_;
}

}  // namespace qtopo
