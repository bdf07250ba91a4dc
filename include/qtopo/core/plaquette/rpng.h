#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

#include "qtopo/core/utils/enums.h"

namespace qtopo {

// Basis of a reset or a measurement, with H standing for a bare Hadamard gate.
enum class ExtendedBasis {
  kX = 0,
  kY,
  kZ,
  kH,
};

std::optional<Basis> to_basis(ExtendedBasis basis) noexcept;
ExtendedBasis to_extended_basis(Basis basis) noexcept;

// One data-qubit corner of a plaquette: reset basis (r), Pauli of the two-qubit gate
// with the ancilla (p), the moment of that gate (n) and the measurement basis (g).
// "-" marks an absent field, e.g. "-z3-" or "zx1-".
struct Rpng {
  std::optional<ExtendedBasis> reset;
  std::optional<Basis> pauli;
  std::optional<int> schedule;
  std::optional<ExtendedBasis> measurement;

  // Throws std::invalid_argument on malformed input.
  static Rpng from_string(std::string_view rpng);

  bool is_unused() const noexcept { return !reset && !pauli && !measurement; }
  std::string str() const;

  bool operator==(const Rpng& other) const noexcept {
    return reset == other.reset && pauli == other.pauli && schedule == other.schedule &&
           measurement == other.measurement;
  }
};

// Ancilla reset and measurement bases.
struct RgCode {
  ExtendedBasis reset = ExtendedBasis::kX;
  ExtendedBasis measurement = ExtendedBasis::kX;

  static RgCode from_string(std::string_view rg);
  std::string str() const;

  bool operator==(const RgCode& other) const noexcept {
    return reset == other.reset && measurement == other.measurement;
  }
};

// Corners are ordered top-left, top-right, bottom-left, bottom-right.
class RpngDescription {
 public:
  explicit RpngDescription(std::array<Rpng, 4> corners, RgCode ancilla = {});

  // Accepts "-z1- -z2- -z3- -z4-" or, with an explicit ancilla code, "zz -z1- -z2- -z3- -z4-".
  static RpngDescription from_string(std::string_view description);
  static RpngDescription empty();

  const std::array<Rpng, 4>& corners() const noexcept { return corners_; }
  const RgCode& ancilla() const noexcept { return ancilla_; }

  bool is_empty() const noexcept;
  std::string str() const;

  bool operator==(const RpngDescription& other) const noexcept {
    return corners_ == other.corners_ && ancilla_ == other.ancilla_;
  }

 private:
  std::array<Rpng, 4> corners_;
  RgCode ancilla_;
};

}  // namespace qtopo
