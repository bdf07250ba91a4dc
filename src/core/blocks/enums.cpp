#include "qtopo/core/blocks/enums.h"

#include <stdexcept>

namespace qtopo {

TemplateBorder to_template_border(SpatialBlockBorder border) noexcept {
  switch (border) {
    case SpatialBlockBorder::kXNegative:
      return TemplateBorder::kLeft;
    case SpatialBlockBorder::kXPositive:
      return TemplateBorder::kRight;
    case SpatialBlockBorder::kYNegative:
      return TemplateBorder::kTop;
    case SpatialBlockBorder::kYPositive:
      return TemplateBorder::kBottom;
  }
  return TemplateBorder::kTop;
}

SpatialBlockBorder spatial_border_from_signed_direction(const SignedDirection3D& direction) {
  switch (direction.direction) {
    case Direction3D::kX:
      return direction.towards_positive ? SpatialBlockBorder::kXPositive : SpatialBlockBorder::kXNegative;
    case Direction3D::kY:
      return direction.towards_positive ? SpatialBlockBorder::kYPositive : SpatialBlockBorder::kYNegative;
    case Direction3D::kZ:
      break;
  }
  throw std::invalid_argument("The Z direction does not designate a spatial border");
}

TemporalBlockBorder opposite(TemporalBlockBorder border) noexcept {
  return border == TemporalBlockBorder::kZNegative ? TemporalBlockBorder::kZPositive
                                                   : TemporalBlockBorder::kZNegative;
}

std::string to_string(SpatialBlockBorder border) {
  switch (border) {
    case SpatialBlockBorder::kXNegative:
      return "X_NEGATIVE";
    case SpatialBlockBorder::kXPositive:
      return "X_POSITIVE";
    case SpatialBlockBorder::kYNegative:
      return "Y_NEGATIVE";
    case SpatialBlockBorder::kYPositive:
      return "Y_POSITIVE";
  }
  return "?";
}

std::string to_string(TemporalBlockBorder border) {
  return border == TemporalBlockBorder::kZNegative ? "Z_NEGATIVE" : "Z_POSITIVE";
}

}  // namespace qtopo
