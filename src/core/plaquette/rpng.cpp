#include "qtopo/core/plaquette/rpng.h"

#include <sstream>
#include <stdexcept>
#include <vector>

namespace qtopo {
namespace {

// Ancilla measurements happen at moment 6, so two-qubit gates use moments 1 to 5.
constexpr int kMaxGateSchedule = 5;

std::optional<ExtendedBasis> parse_extended(char c) {
  switch (c) {
    case '-':
      return std::nullopt;
    case 'x':
      return ExtendedBasis::kX;
    case 'y':
      return ExtendedBasis::kY;
    case 'z':
      return ExtendedBasis::kZ;
    case 'h':
      return ExtendedBasis::kH;
    default:
      break;
  }
  throw std::invalid_argument(std::string("Invalid reset/measurement basis '") + c + "'");
}

char extended_char(const std::optional<ExtendedBasis>& basis) {
  if (!basis) {
    return '-';
  }
  switch (*basis) {
    case ExtendedBasis::kX:
      return 'x';
    case ExtendedBasis::kY:
      return 'y';
    case ExtendedBasis::kZ:
      return 'z';
    case ExtendedBasis::kH:
      return 'h';
  }
  return '-';
}

}  // namespace

std::optional<Basis> to_basis(ExtendedBasis basis) noexcept {
  switch (basis) {
    case ExtendedBasis::kX:
      return Basis::kX;
    case ExtendedBasis::kY:
      return Basis::kY;
    case ExtendedBasis::kZ:
      return Basis::kZ;
    case ExtendedBasis::kH:
      break;
  }
  return std::nullopt;
}

ExtendedBasis to_extended_basis(Basis basis) noexcept {
  switch (basis) {
    case Basis::kX:
      return ExtendedBasis::kX;
    case Basis::kY:
      return ExtendedBasis::kY;
    case Basis::kZ:
      break;
  }
  return ExtendedBasis::kZ;
}

Rpng Rpng::from_string(std::string_view rpng) {
  if (rpng.size() != 4) {
    throw std::invalid_argument("RPNG values are 4 characters long, got '" + std::string(rpng) + "'");
  }
  Rpng out;
  out.reset = parse_extended(rpng[0]);
  if (rpng[1] != '-') {
    if (rpng[1] != 'x' && rpng[1] != 'y' && rpng[1] != 'z') {
      throw std::invalid_argument("Invalid Pauli in RPNG '" + std::string(rpng) + "'");
    }
    out.pauli = basis_from_char(rpng[1]);
  }
  if (rpng[2] != '-') {
    if (rpng[2] < '0' || rpng[2] > '9') {
      throw std::invalid_argument("Invalid schedule in RPNG '" + std::string(rpng) + "'");
    }
    out.schedule = rpng[2] - '0';
  }
  out.measurement = parse_extended(rpng[3]);
  if (out.pauli.has_value() != out.schedule.has_value()) {
    throw std::invalid_argument("RPNG '" + std::string(rpng) + "' needs both a Pauli and a schedule, or neither");
  }
  if (out.schedule && (*out.schedule < 1 || *out.schedule > kMaxGateSchedule)) {
    throw std::invalid_argument("RPNG '" + std::string(rpng) + "' has a schedule outside [1, 5]");
  }
  return out;
}

std::string Rpng::str() const {
  std::string out(4, '-');
  out[0] = extended_char(reset);
  if (pauli) {
    out[1] = to_lower_char(*pauli);
  }
  if (schedule) {
    out[2] = static_cast<char>('0' + *schedule);
  }
  out[3] = extended_char(measurement);
  return out;
}

RgCode RgCode::from_string(std::string_view rg) {
  if (rg.size() != 2) {
    throw std::invalid_argument("Ancilla codes are 2 characters long, got '" + std::string(rg) + "'");
  }
  const std::optional<ExtendedBasis> r = parse_extended(rg[0]);
  const std::optional<ExtendedBasis> g = parse_extended(rg[1]);
  if (!r || !g) {
    throw std::invalid_argument("Ancilla codes cannot omit the reset or the measurement");
  }
  return RgCode{*r, *g};
}

std::string RgCode::str() const {
  return std::string{extended_char(reset), extended_char(measurement)};
}

RpngDescription::RpngDescription(std::array<Rpng, 4> corners, RgCode ancilla)
    : corners_(corners), ancilla_(ancilla) {
  for (std::size_t i = 0; i < corners_.size(); ++i) {
    for (std::size_t j = i + 1; j < corners_.size(); ++j) {
      if (corners_[i].schedule && corners_[i].schedule == corners_[j].schedule) {
        throw std::invalid_argument("Two corners share the schedule " + std::to_string(*corners_[i].schedule));
      }
    }
  }
}

RpngDescription RpngDescription::from_string(std::string_view description) {
  std::istringstream stream{std::string(description)};
  std::vector<std::string> parts;
  std::string part;
  while (stream >> part) {
    parts.push_back(part);
  }
  RgCode ancilla;
  std::size_t first = 0;
  if (parts.size() == 5) {
    ancilla = RgCode::from_string(parts[0]);
    first = 1;
  } else if (parts.size() != 4) {
    throw std::invalid_argument("Expected 4 RPNG values, got '" + std::string(description) + "'");
  }
  std::array<Rpng, 4> corners;
  for (std::size_t i = 0; i < 4; ++i) {
    corners[i] = Rpng::from_string(parts[first + i]);
  }
  return RpngDescription(corners, ancilla);
}

RpngDescription RpngDescription::empty() {
  return RpngDescription(std::array<Rpng, 4>{});
}

bool RpngDescription::is_empty() const noexcept {
  for (const Rpng& corner : corners_) {
    if (!corner.is_unused()) {
      return false;
    }
  }
  return true;
}

std::string RpngDescription::str() const {
  std::string out = ancilla_.str();
  for (const Rpng& corner : corners_) {
    out += " " + corner.str();
  }
  return out;
}

}  // namespace qtopo
