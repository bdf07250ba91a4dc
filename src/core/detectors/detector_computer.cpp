#include "qtopo/core/detectors/detector_computer.h"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "qtopo/core/utils/enums.h"

namespace qtopo {

namespace {

constexpr std::array<Shift2D, 4> kCornerShifts = {{{-1, -1}, {1, -1}, {-1, 1}, {1, 1}}};

using PlaquetteIndex = std::map<GridQubit, const PlacedPlaquette*>;

PlaquetteIndex index_plaquettes(const std::vector<PlacedPlaquette>& plaquettes) {
  PlaquetteIndex index;
  for (const PlacedPlaquette& placed : plaquettes) {
    index.emplace(placed.origin, &placed);
  }
  return index;
}

// Plaquettes whose syndrome qubit lies within `reach` (Manhattan) of `center`.
std::vector<const PlacedPlaquette*> window(const PlaquetteIndex& index, const GridQubit& center,
                                           std::int64_t reach) {
  std::vector<const PlacedPlaquette*> found;
  for (std::int64_t dy = -reach; dy <= reach; ++dy) {
    for (std::int64_t dx = -reach; dx <= reach; ++dx) {
      if (std::llabs(dx) + std::llabs(dy) > reach) {
        continue;
      }
      const auto it = index.find(center + Shift2D{dx, dy});
      if (it != index.end()) {
        found.push_back(it->second);
      }
    }
  }
  return found;
}

// Basis of the stabilizer measured by `plaquette`, if it measures a CSS stabilizer.
std::optional<Basis> stabilizer_basis(const Plaquette& plaquette) {
  const auto& description = plaquette.description();
  if (!description || description->ancilla().measurement != ExtendedBasis::kX) {
    return std::nullopt;
  }
  std::optional<Basis> basis;
  for (const Rpng& corner : description->corners()) {
    if (!corner.pauli) {
      continue;
    }
    if (basis && *basis != *corner.pauli) {
      return std::nullopt;
    }
    basis = corner.pauli;
  }
  if (!basis || *basis == Basis::kY) {
    return std::nullopt;
  }
  return basis;
}

std::vector<Shift2D> support(const Plaquette& plaquette) {
  std::vector<Shift2D> shifts;
  const auto& corners = plaquette.description()->corners();
  for (std::size_t i = 0; i < corners.size(); ++i) {
    if (corners[i].pauli) {
      shifts.push_back(kCornerShifts[i]);
    }
  }
  return shifts;
}

// Reset (or measurement) bases applied to `qubit` by the plaquettes of `plaquettes`.
std::vector<ExtendedBasis> corner_operations(const std::vector<const PlacedPlaquette*>& plaquettes,
                                             const GridQubit& qubit, bool resets) {
  std::vector<ExtendedBasis> operations;
  for (const PlacedPlaquette* placed : plaquettes) {
    const auto& description = placed->plaquette.description();
    if (!description) {
      continue;
    }
    for (std::size_t i = 0; i < kCornerShifts.size(); ++i) {
      if (placed->origin + kCornerShifts[i] != qubit) {
        continue;
      }
      const Rpng& corner = description->corners()[i];
      const std::optional<ExtendedBasis>& operation = resets ? corner.reset : corner.measurement;
      if (operation) {
        operations.push_back(*operation);
      }
    }
  }
  return operations;
}

// True when every operation is a bare Hadamard, i.e. the data qubit changed basis
// without being measured.
bool only_hadamards(const std::vector<ExtendedBasis>& operations) {
  return !operations.empty() && std::all_of(operations.begin(), operations.end(),
                                            [](ExtendedBasis b) { return b == ExtendedBasis::kH; });
}

bool all_in_basis(const std::vector<ExtendedBasis>& operations, Basis basis) {
  const ExtendedBasis expected = basis == Basis::kX ? ExtendedBasis::kX : ExtendedBasis::kZ;
  return !operations.empty() &&
         std::all_of(operations.begin(), operations.end(), [expected](ExtendedBasis b) { return b == expected; });
}

std::string signature(const std::vector<const PlacedPlaquette*>& current,
                      const std::vector<const PlacedPlaquette*>& previous, const GridQubit& center) {
  std::string result;
  auto append = [&](const std::vector<const PlacedPlaquette*>& plaquettes) {
    for (const PlacedPlaquette* placed : plaquettes) {
      const Shift2D shift = placed->origin - center;
      result += std::to_string(shift.x) + "," + std::to_string(shift.y) + ":" + placed->plaquette.name() + ";";
    }
  };
  append(current);
  result += "|";
  append(previous);
  return result;
}

std::vector<RelativeDetector> relative_detectors(const PlacedPlaquette& placed,
                                                 const std::vector<const PlacedPlaquette*>& current,
                                                 const std::vector<const PlacedPlaquette*>& previous,
                                                 bool has_previous) {
  std::vector<RelativeDetector> detectors;
  const std::optional<Basis> basis = stabilizer_basis(placed.plaquette);
  if (!basis) {
    return detectors;
  }
  const std::vector<Shift2D> shifts = support(placed.plaquette);
  const GridQubit& center = placed.origin;

  bool round_to_round = false;
  if (has_previous) {
    for (const PlacedPlaquette* before : previous) {
      if (before->origin != center || support(before->plaquette) != shifts) {
        continue;
      }
      const std::optional<Basis> before_basis = stabilizer_basis(before->plaquette);
      if (!before_basis) {
        continue;
      }
      // A stabilizer measured in the other basis before a transversal Hadamard maps onto
      // the current one.
      const bool through_hadamard = *before_basis == flipped(*basis);
      if (*before_basis != *basis && !through_hadamard) {
        continue;
      }
      round_to_round = std::all_of(shifts.begin(), shifts.end(), [&](const Shift2D& shift) {
        const std::vector<ExtendedBasis> measured = corner_operations(previous, center + shift, false);
        const bool unmeasured = through_hadamard ? only_hadamards(measured) : measured.empty();
        return unmeasured && corner_operations(current, center + shift, true).empty();
      });
    }
  }
  const RelativeMeasurement syndrome{{0, 0}, false};
  if (round_to_round) {
    detectors.push_back({{syndrome, {{0, 0}, true}}});
  } else if (std::all_of(shifts.begin(), shifts.end(), [&](const Shift2D& shift) {
               return all_in_basis(corner_operations(current, center + shift, true), *basis);
             })) {
    detectors.push_back({{syndrome}});
  }
  if (std::all_of(shifts.begin(), shifts.end(), [&](const Shift2D& shift) {
        return all_in_basis(corner_operations(current, center + shift, false), *basis);
      })) {
    RelativeDetector readout{{syndrome}};
    for (const Shift2D& shift : shifts) {
      readout.measurements.push_back({shift, false});
    }
    detectors.push_back(std::move(readout));
  }
  return detectors;
}

}  // namespace

std::vector<DetectorAnnotation> PlaquetteDetectorComputer::compute(const DetectorLayerView* previous,
                                                                   const DetectorLayerView& current,
                                                                   std::int64_t manhattan_radius,
                                                                   DetectorDatabase* database) const {
  if (manhattan_radius < 1) {
    throw std::invalid_argument("The Manhattan radius must be at least 1");
  }
  const std::int64_t reach = 2 * manhattan_radius;
  const PlaquetteIndex current_index = index_plaquettes(current.plaquettes);
  const PlaquetteIndex previous_index =
      previous != nullptr ? index_plaquettes(previous->plaquettes) : PlaquetteIndex{};
  const auto current_size = static_cast<std::int64_t>(current.measurements.num_measurements());

  std::vector<DetectorAnnotation> annotations;
  for (const PlacedPlaquette& placed : current.plaquettes) {
    const std::vector<const PlacedPlaquette*> around = window(current_index, placed.origin, reach);
    const std::vector<const PlacedPlaquette*> before = window(previous_index, placed.origin, reach);

    std::vector<RelativeDetector> detectors;
    const std::string key = signature(around, before, placed.origin) + (previous != nullptr ? "" : "#");
    const std::vector<RelativeDetector>* cached = database != nullptr ? database->find(key) : nullptr;
    if (cached != nullptr) {
      detectors = *cached;
    } else {
      detectors = relative_detectors(placed, around, before, previous != nullptr);
      if (database != nullptr) {
        database->add(key, detectors);
      }
    }

    for (const RelativeDetector& detector : detectors) {
      DetectorAnnotation annotation;
      annotation.x = static_cast<double>(placed.origin.x);
      annotation.y = static_cast<double>(placed.origin.y);
      for (const RelativeMeasurement& measurement : detector.measurements) {
        const GridQubit qubit = placed.origin + measurement.offset;
        if (measurement.previous) {
          annotation.measurement_offsets.push_back(previous->measurements.last_offset(qubit) - current_size);
        } else {
          annotation.measurement_offsets.push_back(current.measurements.last_offset(qubit));
        }
      }
      std::sort(annotation.measurement_offsets.begin(), annotation.measurement_offsets.end());
      annotations.push_back(std::move(annotation));
    }
  }
  return annotations;
}

}  // namespace qtopo
