#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "qtopo/core/circuit/scheduled_circuit.h"

namespace qtopo {

// DETECTOR over record offsets relative to the end of the annotated leaf.
struct DetectorAnnotation {
  std::vector<std::int64_t> measurement_offsets;
  double x = 0.0;
  double y = 0.0;
  double t = 0.0;

  bool operator==(const DetectorAnnotation& other) const {
    return measurement_offsets == other.measurement_offsets && x == other.x && y == other.y && t == other.t;
  }
};

// OBSERVABLE_INCLUDE over record offsets relative to the end of the annotated leaf.
struct ObservableAnnotation {
  std::size_t observable_index = 0;
  std::vector<std::int64_t> measurement_offsets;
};

// Everything attached to one leaf for one value of k.
struct LayerNodeAnnotations {
  std::optional<ScheduledCircuit> circuit;
  std::vector<DetectorAnnotation> detectors;
  std::vector<ObservableAnnotation> observables;
};

}  // namespace qtopo
