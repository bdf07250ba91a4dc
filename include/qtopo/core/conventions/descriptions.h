#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>

#include "qtopo/core/blocks/block.h"
#include "qtopo/core/plaquette/plaquette.h"
#include "qtopo/core/plaquette/rpng.h"
#include "qtopo/core/scale/linear_function.h"
#include "qtopo/core/templates/template.h"
#include "qtopo/core/utils/enums.h"

namespace qtopo {

// Template index -> description; indices without an entry hold the empty plaquette.
using RpngDescriptions = std::map<std::size_t, RpngDescription>;

// Moment of the two-qubit gate of each corner, ordered as in RpngDescription.
using CornerSchedule = std::array<int, 4>;
using CornerMask = std::array<bool, 4>;

// A hook error of the vertical schedule spreads along a vertical line of data qubits.
constexpr CornerSchedule kVerticalHookSchedule = {1, 4, 3, 5};
constexpr CornerSchedule kHorizontalHookSchedule = {1, 2, 3, 5};
constexpr CornerMask kAllCorners = {true, true, true, true};

const CornerSchedule& hook_schedule(Orientation hook) noexcept;
CornerMask corner_mask(std::initializer_list<std::size_t> indices);

// Rounded side of a 2-body plaquette. kDown keeps the two top corners and sits on a
// bottom boundary.
enum class TwoBodySide {
  kUp = 0,
  kDown,
  kLeft,
  kRight,
};

CornerMask two_body_corners(TwoBodySide side) noexcept;

std::optional<ExtendedBasis> to_extended(const std::optional<Basis>& basis) noexcept;

// Plaquette measuring `basis` on the `used` corners. Data resets and measurements are
// only placed on the used corners that are also `touched`.
RpngDescription stabilizer_description(Basis basis, const CornerSchedule& schedule, const CornerMask& used,
                                       const std::optional<ExtendedBasis>& reset,
                                       const std::optional<ExtendedBasis>& measurement,
                                       const CornerMask& touched = kAllCorners);

RpngDescription bulk_description(Basis basis, Orientation hook, const std::optional<ExtendedBasis>& reset,
                                 const std::optional<ExtendedBasis>& measurement,
                                 const CornerMask& touched = kAllCorners);

// The two used corners take their moments from `schedule`.
RpngDescription two_body_description(Basis basis, TwoBodySide side, const CornerSchedule& schedule,
                                     const std::optional<ExtendedBasis>& reset,
                                     const std::optional<ExtendedBasis>& measurement);

Plaquettes to_plaquettes(const RpngDescriptions& descriptions);

// Descriptions of one layer given the data reset and measurement bases.
using LayerDescriptions =
    std::function<RpngDescriptions(const std::optional<Basis>& reset, const std::optional<Basis>& measurement)>;

// Init layer, `repetitions` memory layers and readout layer. Data qubits are reset and
// measured in `data_basis`.
Block memory_block(const std::shared_ptr<const RectangularTemplate>& layer_template, Basis data_basis,
                   const LinearFunction& repetitions, const LayerDescriptions& descriptions);

}  // namespace qtopo
