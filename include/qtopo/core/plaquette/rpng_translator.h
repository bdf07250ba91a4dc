#pragma once

#include "qtopo/core/plaquette/plaquette.h"
#include "qtopo/core/plaquette/rpng.h"

namespace qtopo {

// Moment of the ancilla (and data) measurements in translated plaquettes.
inline constexpr int kMeasurementSchedule = 6;

class RpngTranslator {
 public:
  virtual ~RpngTranslator() = default;
  virtual Plaquette translate(const RpngDescription& description) const = 0;
};

// Translates a description on the square plaquette qubits:
// - moment 0: ancilla and data resets, grouped by basis in X, Y, Z order, then H;
// - moment n: C<p> from the ancilla to each corner scheduled at n;
// - moment 6: ancilla and data measurements, grouped the same way.
// Data qubits without any operation are dropped. An empty description gives the
// empty plaquette.
class DefaultRpngTranslator final : public RpngTranslator {
 public:
  Plaquette translate(const RpngDescription& description) const override;
};

}  // namespace qtopo
