#include "qtopo/core/conventions/descriptions.h"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "qtopo/core/blocks/layers.h"
#include "qtopo/core/plaquette/rpng_translator.h"

namespace qtopo {

const CornerSchedule& hook_schedule(Orientation hook) noexcept {
  return hook == Orientation::kVertical ? kVerticalHookSchedule : kHorizontalHookSchedule;
}

CornerMask corner_mask(std::initializer_list<std::size_t> indices) {
  CornerMask mask = {false, false, false, false};
  for (std::size_t index : indices) {
    if (index >= mask.size()) {
      throw std::out_of_range("Plaquette corners are numbered 0 to 3, got " + std::to_string(index));
    }
    mask[index] = true;
  }
  return mask;
}

CornerMask two_body_corners(TwoBodySide side) noexcept {
  switch (side) {
    case TwoBodySide::kUp:
      return {false, false, true, true};
    case TwoBodySide::kDown:
      return {true, true, false, false};
    case TwoBodySide::kLeft:
      return {false, true, false, true};
    case TwoBodySide::kRight:
      break;
  }
  return {true, false, true, false};
}

std::optional<ExtendedBasis> to_extended(const std::optional<Basis>& basis) noexcept {
  if (!basis) {
    return std::nullopt;
  }
  return to_extended_basis(*basis);
}

RpngDescription stabilizer_description(Basis basis, const CornerSchedule& schedule, const CornerMask& used,
                                       const std::optional<ExtendedBasis>& reset,
                                       const std::optional<ExtendedBasis>& measurement, const CornerMask& touched) {
  std::array<Rpng, 4> corners;
  for (std::size_t i = 0; i < corners.size(); ++i) {
    if (!used[i]) {
      continue;
    }
    corners[i].pauli = basis;
    corners[i].schedule = schedule[i];
    if (touched[i]) {
      corners[i].reset = reset;
      corners[i].measurement = measurement;
    }
  }
  return RpngDescription(corners);
}

RpngDescription bulk_description(Basis basis, Orientation hook, const std::optional<ExtendedBasis>& reset,
                                 const std::optional<ExtendedBasis>& measurement, const CornerMask& touched) {
  return stabilizer_description(basis, hook_schedule(hook), kAllCorners, reset, measurement, touched);
}

RpngDescription two_body_description(Basis basis, TwoBodySide side, const CornerSchedule& schedule,
                                     const std::optional<ExtendedBasis>& reset,
                                     const std::optional<ExtendedBasis>& measurement) {
  return stabilizer_description(basis, schedule, two_body_corners(side), reset, measurement);
}

Plaquettes to_plaquettes(const RpngDescriptions& descriptions) {
  const DefaultRpngTranslator translator;
  std::map<std::size_t, Plaquette> collection;
  for (const auto& [index, description] : descriptions) {
    collection.emplace(index, translator.translate(description));
  }
  return Plaquettes(std::move(collection));
}

Block memory_block(const std::shared_ptr<const RectangularTemplate>& layer_template, Basis data_basis,
                   const LinearFunction& repetitions, const LayerDescriptions& descriptions) {
  std::vector<Layer> layers;
  layers.push_back(PlaquetteLayer(layer_template, to_plaquettes(descriptions(data_basis, std::nullopt))));
  layers.push_back(
      RepeatedLayer(PlaquetteLayer(layer_template, to_plaquettes(descriptions(std::nullopt, std::nullopt))),
                    repetitions));
  layers.push_back(PlaquetteLayer(layer_template, to_plaquettes(descriptions(std::nullopt, data_basis))));
  return Block(std::move(layers));
}

}  // namespace qtopo
