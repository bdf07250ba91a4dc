#include "qtopo/core/templates/template.h"

#include <stdexcept>

namespace qtopo {

std::string to_string(TemplateBorder border) {
  switch (border) {
    case TemplateBorder::kTop:
      return "TOP";
    case TemplateBorder::kBottom:
      return "BOTTOM";
    case TemplateBorder::kLeft:
      return "LEFT";
    case TemplateBorder::kRight:
      return "RIGHT";
  }
  return "?";
}

std::map<std::size_t, std::size_t> BorderIndices::to(const BorderIndices& other) const {
  if (indices_.size() != other.indices_.size()) {
    throw std::invalid_argument("Cannot pair borders of different lengths");
  }
  std::map<std::size_t, std::size_t> out;
  for (std::size_t i = 0; i < indices_.size(); ++i) {
    out[indices_[i]] = other.indices_[i];
  }
  return out;
}

IndexGrid RectangularTemplate::instantiate(std::int64_t k, const std::vector<std::size_t>& plaquette_indices) const {
  if (k < 1) {
    throw std::invalid_argument("Templates are instantiated for k >= 1, got k=" + std::to_string(k));
  }
  if (plaquette_indices.size() != expected_plaquettes_number()) {
    throw std::invalid_argument(name() + " expects " + std::to_string(expected_plaquettes_number()) +
                                " plaquette indices, got " + std::to_string(plaquette_indices.size()));
  }
  return do_instantiate(k, plaquette_indices);
}

IndexGrid RectangularTemplate::instantiate(std::int64_t k) const {
  std::vector<std::size_t> indices(expected_plaquettes_number());
  for (std::size_t i = 0; i < indices.size(); ++i) {
    indices[i] = i + 1;
  }
  return instantiate(k, indices);
}

}  // namespace qtopo
