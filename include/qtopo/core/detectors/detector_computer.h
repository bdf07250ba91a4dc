#pragma once

#include <cstdint>
#include <vector>

#include "qtopo/core/blocks/layers.h"
#include "qtopo/core/circuit/measurement_map.h"
#include "qtopo/core/detectors/database.h"
#include "qtopo/core/tree/annotations.h"

namespace qtopo {

// What a detector computation needs to know about one leaf.
struct DetectorLayerView {
  // Empty for leaves made of raw circuits.
  std::vector<PlacedPlaquette> plaquettes;
  MeasurementRecordsMap measurements;
};

class DetectorComputer {
 public:
  virtual ~DetectorComputer() = default;

  // Detectors closing at the end of `current`. `previous` is the leaf executed just
  // before, or nullptr at the start of the circuit.
  virtual std::vector<DetectorAnnotation> compute(const DetectorLayerView* previous,
                                                  const DetectorLayerView& current, std::int64_t manhattan_radius,
                                                  DetectorDatabase* database) const = 0;
};

// Infers detectors from the RPNG descriptions of the plaquettes: round-to-round
// comparisons, initialization detectors and data readout detectors.
class PlaquetteDetectorComputer final : public DetectorComputer {
 public:
  std::vector<DetectorAnnotation> compute(const DetectorLayerView* previous, const DetectorLayerView& current,
                                          std::int64_t manhattan_radius,
                                          DetectorDatabase* database) const override;
};

}  // namespace qtopo
