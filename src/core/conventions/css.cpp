#include "qtopo/core/conventions/css.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "qtopo/core/blocks/layers.h"
#include "qtopo/core/templates/qubit_templates.h"
#include "qtopo/core/utils/errors.h"

namespace qtopo {
namespace {

// 2-body plaquettes of this convention all follow the 1-2-3-5 schedule and never
// reset nor measure data qubits on their own.
RpngDescription two_body(Basis basis, TwoBodySide side) {
  return two_body_description(basis, side, kHorizontalHookSchedule, std::nullopt, std::nullopt);
}

RpngDescription bulk(Basis basis, Orientation hook, const std::optional<Basis>& reset,
                     const std::optional<Basis>& measurement, const CornerMask& touched = kAllCorners) {
  return bulk_description(basis, hook, to_extended(reset), to_extended(measurement), touched);
}

Orientation pipe_z_orientation(const PipeKind& kind) {
  if (kind.direction() == Direction3D::kX) {
    return kind.y() == Basis::kX ? Orientation::kHorizontal : Orientation::kVertical;
  }
  return kind.x() == Basis::kZ ? Orientation::kHorizontal : Orientation::kVertical;
}

Block spatial_cube_block(const CubeSpec& spec, const LinearFunction& repetitions) {
  const Basis boundary_basis = spec.kind.x();
  const SpatialArms arms = spec.arms;
  return memory_block(std::make_shared<const QubitSpatialCubeTemplate>(), spec.kind.z(), repetitions,
                      [boundary_basis, arms](const std::optional<Basis>& reset, const std::optional<Basis>& measurement) {
                        return spatial_cube_descriptions(boundary_basis, arms, reset, measurement);
                      });
}

Block spatial_arm_block(const PipeSpec& spec, const LinearFunction& repetitions) {
  const Basis boundary_basis = spec.kind.x() ? *spec.kind.x() : *spec.kind.y();
  const SpatialArms arms = spec.arms();
  std::shared_ptr<const RectangularTemplate> arm_template;
  if (arms.left || arms.right) {
    arm_template = std::make_shared<const QubitVerticalBorders>();
  } else {
    arm_template = std::make_shared<const QubitHorizontalBorders>();
  }
  const CubeSpec u = spec.u;
  const CubeSpec v = spec.v;
  return memory_block(arm_template, *spec.kind.z(), repetitions,
                      [=](const std::optional<Basis>& reset, const std::optional<Basis>& measurement) {
                        return spatial_arm_descriptions(boundary_basis, arms, u, v, reset, measurement);
                      });
}

}  // namespace

RpngDescriptions memory_qubit_descriptions(Orientation z_orientation, std::optional<Basis> reset,
                                           std::optional<Basis> measurement) {
  const bool vertical = z_orientation == Orientation::kVertical;
  const std::size_t up = vertical ? 6 : 5;
  const std::size_t down = vertical ? 13 : 14;
  const std::size_t left = vertical ? 7 : 8;
  const std::size_t right = vertical ? 12 : 11;
  const Basis hbasis = vertical ? Basis::kX : Basis::kZ;
  const Basis vbasis = flipped(hbasis);
  const Orientation zhook = flipped(z_orientation);
  const Orientation xhook = flipped(zhook);
  return {
      {up, two_body(vbasis, TwoBodySide::kUp)},
      {left, two_body(hbasis, TwoBodySide::kLeft)},
      {9, bulk(Basis::kZ, zhook, reset, measurement)},
      {10, bulk(Basis::kX, xhook, reset, measurement)},
      {right, two_body(hbasis, TwoBodySide::kRight)},
      {down, two_body(vbasis, TwoBodySide::kDown)},
  };
}

RpngDescriptions memory_vertical_boundary_descriptions(Orientation z_orientation, std::optional<Basis> reset,
                                                       std::optional<Basis> measurement) {
  const bool vertical = z_orientation == Orientation::kVertical;
  const std::size_t up = vertical ? 2 : 1;
  const std::size_t down = vertical ? 3 : 4;
  const Basis vbasis = vertical ? Basis::kZ : Basis::kX;
  const Orientation zhook = flipped(z_orientation);
  const Orientation xhook = flipped(zhook);
  // The left column touches the right data qubits of its plaquettes and conversely.
  const CornerMask left_column = corner_mask({1, 3});
  const CornerMask right_column = corner_mask({0, 2});
  return {
      {up, two_body(vbasis, TwoBodySide::kUp)},
      {down, two_body(vbasis, TwoBodySide::kDown)},
      {5, bulk(Basis::kZ, zhook, reset, measurement, left_column)},
      {6, bulk(Basis::kX, xhook, reset, measurement, left_column)},
      {7, bulk(Basis::kX, xhook, reset, measurement, right_column)},
      {8, bulk(Basis::kZ, zhook, reset, measurement, right_column)},
  };
}

RpngDescriptions memory_horizontal_boundary_descriptions(Orientation z_orientation, std::optional<Basis> reset,
                                                         std::optional<Basis> measurement) {
  const bool vertical = z_orientation == Orientation::kVertical;
  const std::size_t left = vertical ? 1 : 3;
  const std::size_t right = vertical ? 4 : 2;
  const Basis hbasis = vertical ? Basis::kX : Basis::kZ;
  const Orientation zhook = flipped(z_orientation);
  const Orientation xhook = flipped(zhook);
  const CornerMask top_row = corner_mask({2, 3});
  const CornerMask bottom_row = corner_mask({0, 1});
  return {
      {left, two_body(hbasis, TwoBodySide::kLeft)},
      {right, two_body(hbasis, TwoBodySide::kRight)},
      {5, bulk(Basis::kZ, zhook, reset, measurement, top_row)},
      {6, bulk(Basis::kX, xhook, reset, measurement, top_row)},
      {7, bulk(Basis::kX, xhook, reset, measurement, bottom_row)},
      {8, bulk(Basis::kZ, zhook, reset, measurement, bottom_row)},
  };
}

std::array<RpngDescription, 4> three_body_descriptions(std::optional<Basis> reset, std::optional<Basis> measurement) {
  // Hook errors do not exist on 3-body stabilizers; each corner keeps the schedule of
  // the bulk plaquettes around it.
  const std::optional<ExtendedBasis> r = to_extended(reset);
  const std::optional<ExtendedBasis> m = to_extended(measurement);
  return {
      stabilizer_description(Basis::kZ, {0, 4, 3, 5}, corner_mask({1, 2, 3}), r, m),
      stabilizer_description(Basis::kX, {1, 0, 3, 5}, corner_mask({0, 2, 3}), r, m),
      stabilizer_description(Basis::kX, {1, 2, 0, 5}, corner_mask({0, 1, 3}), r, m),
      stabilizer_description(Basis::kZ, {1, 4, 3, 0}, corner_mask({0, 1, 2}), r, m),
  };
}

RpngDescriptions spatial_cube_descriptions(Basis boundary_basis, const SpatialArms& arms,
                                           std::optional<Basis> reset, std::optional<Basis> measurement) {
  if (arms.is_straight()) {
    throw NotImplementedError("Spatial cube with straight arms " + arms.str() +
                              " should be built as a regular memory patch");
  }
  const bool boundary_is_z = boundary_basis == Basis::kZ;
  RpngDescriptions mapping;
  auto set = [&mapping](std::size_t index, const RpngDescription& description) {
    mapping.insert_or_assign(index, description);
  };

  // Closed sides. Outer corners may be set twice and are removed below when both of
  // their sides are closed.
  if (!arms.up) {
    const RpngDescription side = two_body(boundary_basis, TwoBodySide::kUp);
    set(boundary_is_z ? 1 : 2, side);
    set(boundary_is_z ? 10 : 9, side);
  }
  if (!arms.right) {
    const RpngDescription side = two_body(boundary_basis, TwoBodySide::kRight);
    set(boundary_is_z ? 4 : 2, side);
    set(boundary_is_z ? 21 : 22, side);
  }
  if (!arms.down) {
    const RpngDescription side = two_body(boundary_basis, TwoBodySide::kDown);
    set(boundary_is_z ? 4 : 3, side);
    set(boundary_is_z ? 23 : 24, side);
  }
  if (!arms.left) {
    const RpngDescription side = two_body(boundary_basis, TwoBodySide::kLeft);
    set(boundary_is_z ? 1 : 3, side);
    set(boundary_is_z ? 12 : 11, side);
  }
  const bool closed_top_left = !arms.left && !arms.up && boundary_is_z;
  const bool closed_top_right = !arms.up && !arms.right && !boundary_is_z;
  const bool closed_bottom_left = !arms.down && !arms.left && !boundary_is_z;
  const bool closed_bottom_right = !arms.right && !arms.down && boundary_is_z;
  if (closed_top_left) {
    mapping.erase(1);
  }
  if (closed_top_right) {
    mapping.erase(2);
  }
  if (closed_bottom_left) {
    mapping.erase(3);
  }
  if (closed_bottom_right) {
    mapping.erase(4);
  }

  // Bulk triangles. A side without an arm flips its hook orientation so that hook
  // errors cannot shorten the distance along that boundary.
  const Orientation z_vertical_sides = boundary_is_z ? Orientation::kVertical : Orientation::kHorizontal;
  const Orientation z_horizontal_sides = flipped(z_vertical_sides);
  const Orientation zup = arms.up ? z_vertical_sides : flipped(z_vertical_sides);
  const Orientation zdown = arms.down ? z_vertical_sides : flipped(z_vertical_sides);
  const Orientation zright = arms.right ? z_horizontal_sides : flipped(z_horizontal_sides);
  const Orientation zleft = arms.left ? z_horizontal_sides : flipped(z_horizontal_sides);
  set(5, bulk(Basis::kZ, zup, reset, measurement));
  set(13, bulk(Basis::kZ, zup, reset, measurement));
  set(8, bulk(Basis::kZ, zdown, reset, measurement));
  set(15, bulk(Basis::kZ, zdown, reset, measurement));
  set(14, bulk(Basis::kZ, zright, reset, measurement));
  set(16, bulk(Basis::kZ, zleft, reset, measurement));
  set(6, bulk(Basis::kX, flipped(zup), reset, measurement));
  set(17, bulk(Basis::kX, flipped(zup), reset, measurement));
  set(7, bulk(Basis::kX, flipped(zdown), reset, measurement));
  set(19, bulk(Basis::kX, flipped(zdown), reset, measurement));
  set(18, bulk(Basis::kX, flipped(zright), reset, measurement));
  set(20, bulk(Basis::kX, flipped(zleft), reset, measurement));

  // Inner corners next to a removed outer corner measure a 3-body stabilizer.
  const std::array<RpngDescription, 4> corners = three_body_descriptions(reset, measurement);
  if (closed_top_left) {
    set(5, corners[0]);
  }
  if (closed_top_right) {
    set(6, corners[1]);
  }
  if (closed_bottom_left) {
    set(7, corners[2]);
  }
  if (closed_bottom_right) {
    set(8, corners[3]);
  }
  return mapping;
}

RpngDescriptions spatial_arm_descriptions(Basis boundary_basis, const SpatialArms& arms, const CubeSpec& u,
                                          const CubeSpec& v, std::optional<Basis> reset,
                                          std::optional<Basis> measurement) {
  const bool horizontal_arm = arms.left || arms.right;
  const bool vertical_arm = arms.up || arms.down;
  if (horizontal_arm == vertical_arm) {
    throw std::invalid_argument("A pipe implements LEFT/RIGHT or UP/DOWN arms, got " + arms.str());
  }
  const bool boundary_is_z = boundary_basis == Basis::kZ;
  const std::array<RpngDescription, 4> corners = three_body_descriptions();
  RpngDescriptions mapping;
  if (horizontal_arm) {
    const Orientation zhook = boundary_is_z ? Orientation::kHorizontal : Orientation::kVertical;
    const std::size_t up = boundary_is_z ? 2 : 1;
    const std::size_t down = boundary_is_z ? 3 : 4;
    mapping = {
        {up, two_body(boundary_basis, TwoBodySide::kUp)},
        {down, two_body(boundary_basis, TwoBodySide::kDown)},
        {5, bulk(Basis::kZ, zhook, reset, measurement, corner_mask({1, 3}))},
        {6, bulk(Basis::kX, flipped(zhook), reset, measurement, corner_mask({1, 3}))},
        {7, bulk(Basis::kX, flipped(zhook), reset, measurement, corner_mask({0, 2}))},
        {8, bulk(Basis::kZ, zhook, reset, measurement, corner_mask({0, 2}))},
    };
    if (arms.left && boundary_is_z && v.arms.up) {
      mapping.insert_or_assign(up, corners[0]);
    }
    if (arms.right && !boundary_is_z && u.arms.up) {
      mapping.insert_or_assign(up, corners[1]);
    }
    if (arms.left && !boundary_is_z && v.arms.down) {
      mapping.insert_or_assign(down, corners[2]);
    }
    if (arms.right && boundary_is_z && u.arms.down) {
      mapping.insert_or_assign(down, corners[3]);
    }
    return mapping;
  }
  const Orientation zhook = boundary_is_z ? Orientation::kVertical : Orientation::kHorizontal;
  const std::size_t left = boundary_is_z ? 3 : 1;
  const std::size_t right = boundary_is_z ? 2 : 4;
  mapping = {
      {left, two_body(boundary_basis, TwoBodySide::kLeft)},
      {right, two_body(boundary_basis, TwoBodySide::kRight)},
      {5, bulk(Basis::kZ, zhook, reset, measurement, corner_mask({2, 3}))},
      {6, bulk(Basis::kX, flipped(zhook), reset, measurement, corner_mask({2, 3}))},
      {7, bulk(Basis::kX, flipped(zhook), reset, measurement, corner_mask({0, 1}))},
      {8, bulk(Basis::kZ, zhook, reset, measurement, corner_mask({0, 1}))},
  };
  if (arms.up && boundary_is_z && v.arms.left) {
    mapping.insert_or_assign(left, corners[0]);
  }
  if (arms.up && !boundary_is_z && v.arms.right) {
    mapping.insert_or_assign(right, corners[1]);
  }
  if (arms.down && !boundary_is_z && u.arms.left) {
    mapping.insert_or_assign(left, corners[2]);
  }
  if (arms.down && boundary_is_z && u.arms.right) {
    mapping.insert_or_assign(right, corners[3]);
  }
  return mapping;
}

Block build_css_cube(const CubeSpec& spec, const LinearFunction& repetitions) {
  if (spec.is_spatial()) {
    return spatial_cube_block(spec, repetitions);
  }
  const Orientation z_orientation = spec.kind.x() == Basis::kZ ? Orientation::kHorizontal : Orientation::kVertical;
  return memory_block(std::make_shared<const QubitTemplate>(), spec.kind.z(), repetitions,
                      [z_orientation](const std::optional<Basis>& reset, const std::optional<Basis>& measurement) {
                        return memory_qubit_descriptions(z_orientation, reset, measurement);
                      });
}

Block build_css_pipe(const PipeSpec& spec, const LinearFunction& repetitions) {
  const PipeKind& kind = spec.kind;
  if (kind.has_hadamard()) {
    throw NotImplementedError("Hadamard pipe " + kind.str() + " is not supported by the CSS convention");
  }
  if (kind.is_temporal()) {
    const Orientation z_orientation = kind.x() == Basis::kZ ? Orientation::kHorizontal : Orientation::kVertical;
    std::vector<Layer> layers;
    layers.push_back(PlaquetteLayer(std::make_shared<const QubitTemplate>(),
                                    to_plaquettes(memory_qubit_descriptions(z_orientation))));
    return Block(std::move(layers));
  }
  if (spec.touches_spatial_cube()) {
    return spatial_arm_block(spec, repetitions);
  }
  const Orientation z_orientation = pipe_z_orientation(kind);
  if (kind.direction() == Direction3D::kX) {
    return memory_block(std::make_shared<const QubitVerticalBorders>(), *kind.z(), repetitions,
                        [z_orientation](const std::optional<Basis>& reset, const std::optional<Basis>& measurement) {
                          return memory_vertical_boundary_descriptions(z_orientation, reset, measurement);
                        });
  }
  return memory_block(std::make_shared<const QubitHorizontalBorders>(), *kind.z(), repetitions,
                      [z_orientation](const std::optional<Basis>& reset, const std::optional<Basis>& measurement) {
                        return memory_horizontal_boundary_descriptions(z_orientation, reset, measurement);
                      });
}

CompilationConvention css_convention() { return {"css", build_css_cube, build_css_pipe}; }

}  // namespace qtopo
