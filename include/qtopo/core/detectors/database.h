#pragma once

#include <cstddef>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "qtopo/core/geometry/position.h"

namespace qtopo {

// Measurement of the qubit at `offset` from a syndrome qubit, in the current layer or
// in the previous one.
struct RelativeMeasurement {
  Shift2D offset;
  bool previous = false;

  bool operator==(const RelativeMeasurement& other) const noexcept {
    return offset == other.offset && previous == other.previous;
  }
  bool operator<(const RelativeMeasurement& other) const noexcept {
    return std::tie(previous, offset.x, offset.y) < std::tie(other.previous, other.offset.x, other.offset.y);
  }
};

// Detector expressed relative to the syndrome qubit of the plaquette that owns it.
struct RelativeDetector {
  std::vector<RelativeMeasurement> measurements;

  bool operator==(const RelativeDetector& other) const { return measurements == other.measurements; }
};

// Cache of relative detectors keyed by the signature of the plaquettes around one
// syndrome qubit. Identical neighbourhoods always produce identical detectors.
class DetectorDatabase {
 public:
  // nullptr when the signature was never stored.
  const std::vector<RelativeDetector>* find(const std::string& signature) const;
  void add(const std::string& signature, std::vector<RelativeDetector> detectors);

  std::size_t size() const noexcept { return entries_.size(); }
  std::size_t hits() const noexcept { return hits_; }
  void clear();

 private:
  std::unordered_map<std::string, std::vector<RelativeDetector>> entries_;
  mutable std::size_t hits_ = 0;
};

}  // namespace qtopo
