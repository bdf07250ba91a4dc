#pragma once

#include <string>

#include "qtopo/core/geometry/position.h"
#include "qtopo/core/templates/template.h"

namespace qtopo {

enum class SpatialBlockBorder {
  kXNegative = 0,
  kXPositive,
  kYNegative,
  kYPositive,
};

enum class TemporalBlockBorder {
  kZNegative = 0,
  kZPositive,
};

// X- is LEFT, X+ is RIGHT, Y- is TOP and Y+ is BOTTOM (y grows downwards).
TemplateBorder to_template_border(SpatialBlockBorder border) noexcept;

// Throws std::invalid_argument for the Z direction.
SpatialBlockBorder spatial_border_from_signed_direction(const SignedDirection3D& direction);
TemporalBlockBorder opposite(TemporalBlockBorder border) noexcept;

std::string to_string(SpatialBlockBorder border);
std::string to_string(TemporalBlockBorder border);

}  // namespace qtopo
