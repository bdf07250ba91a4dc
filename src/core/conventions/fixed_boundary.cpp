#include "qtopo/core/conventions/fixed_boundary.h"

#include <memory>
#include <utility>
#include <vector>

#include "qtopo/core/blocks/layers.h"
#include "qtopo/core/templates/qubit_templates.h"
#include "qtopo/core/utils/errors.h"

namespace qtopo {

namespace fixed_boundary {
namespace {

// 2-body plaquettes take the moments of the vertical hook schedule and never reset nor
// measure data qubits, except for the H gates of a temporal Hadamard.
RpngDescription two_body(Basis basis, TwoBodySide side, bool hadamard = false) {
  const std::optional<ExtendedBasis> after = hadamard ? std::optional<ExtendedBasis>(ExtendedBasis::kH) : std::nullopt;
  return two_body_description(basis, side, kVerticalHookSchedule, std::nullopt, after);
}

RpngDescription bulk(Basis basis, Orientation hook, const std::optional<Basis>& reset,
                     const std::optional<Basis>& measurement, const CornerMask& touched = kAllCorners) {
  return bulk_description(basis, hook, to_extended(reset), to_extended(measurement), touched);
}

Basis horizontal_sides_basis(Orientation z_orientation) {
  return z_orientation == Orientation::kHorizontal ? Basis::kZ : Basis::kX;
}

}  // namespace

RpngDescriptions memory_qubit_descriptions(Orientation z_orientation, std::optional<Basis> reset,
                                           std::optional<Basis> measurement) {
  const Basis hbasis = horizontal_sides_basis(z_orientation);
  const Basis vbasis = flipped(hbasis);
  return {
      {6, two_body(vbasis, TwoBodySide::kUp)},
      {7, two_body(hbasis, TwoBodySide::kLeft)},
      {9, bulk(vbasis, Orientation::kHorizontal, reset, measurement)},
      {10, bulk(hbasis, Orientation::kVertical, reset, measurement)},
      {12, two_body(hbasis, TwoBodySide::kRight)},
      {13, two_body(vbasis, TwoBodySide::kDown)},
  };
}

RpngDescriptions vertical_boundary_descriptions(Orientation z_orientation, std::optional<Basis> reset,
                                                std::optional<Basis> measurement) {
  const Basis vbasis = z_orientation == Orientation::kVertical ? Basis::kZ : Basis::kX;
  const Basis hbasis = flipped(vbasis);
  const CornerMask left_column = corner_mask({1, 3});
  const CornerMask right_column = corner_mask({0, 2});
  return {
      {2, two_body(vbasis, TwoBodySide::kUp)},
      {3, two_body(vbasis, TwoBodySide::kDown)},
      {5, bulk(vbasis, Orientation::kHorizontal, reset, measurement, left_column)},
      {6, bulk(hbasis, Orientation::kVertical, reset, measurement, left_column)},
      {7, bulk(hbasis, Orientation::kVertical, reset, measurement, right_column)},
      {8, bulk(vbasis, Orientation::kHorizontal, reset, measurement, right_column)},
  };
}

RpngDescriptions horizontal_boundary_descriptions(Orientation z_orientation, std::optional<Basis> reset,
                                                  std::optional<Basis> measurement) {
  const Basis hbasis = horizontal_sides_basis(z_orientation);
  const Basis vbasis = flipped(hbasis);
  const CornerMask top_row = corner_mask({2, 3});
  const CornerMask bottom_row = corner_mask({0, 1});
  return {
      {1, two_body(hbasis, TwoBodySide::kLeft)},
      {4, two_body(hbasis, TwoBodySide::kRight)},
      {5, bulk(vbasis, Orientation::kHorizontal, reset, measurement, top_row)},
      {6, bulk(hbasis, Orientation::kVertical, reset, measurement, top_row)},
      {7, bulk(hbasis, Orientation::kVertical, reset, measurement, bottom_row)},
      {8, bulk(vbasis, Orientation::kHorizontal, reset, measurement, bottom_row)},
  };
}

RpngDescriptions temporal_hadamard_descriptions(Orientation z_orientation) {
  const Basis hbasis = horizontal_sides_basis(z_orientation);
  const Basis vbasis = flipped(hbasis);
  const std::optional<ExtendedBasis> h = ExtendedBasis::kH;
  return {
      {6, two_body(vbasis, TwoBodySide::kUp, true)},
      {7, two_body(hbasis, TwoBodySide::kLeft, true)},
      {9, bulk_description(vbasis, Orientation::kHorizontal, std::nullopt, h)},
      {10, bulk_description(hbasis, Orientation::kVertical, std::nullopt, h)},
      {12, two_body(hbasis, TwoBodySide::kRight, true)},
      {13, two_body(vbasis, TwoBodySide::kDown, true)},
  };
}

}  // namespace fixed_boundary

namespace {

Orientation cube_z_orientation(const ZXCube& kind) {
  return kind.x() == Basis::kZ ? Orientation::kHorizontal : Orientation::kVertical;
}

PlaquetteLayer memory_layer(Orientation z_orientation) {
  return PlaquetteLayer(std::make_shared<const QubitTemplate>(),
                        to_plaquettes(fixed_boundary::memory_qubit_descriptions(z_orientation)));
}

}  // namespace

Block build_fixed_boundary_cube(const CubeSpec& spec, const LinearFunction& repetitions) {
  if (spec.is_spatial()) {
    throw NotImplementedError("Spatial cube " + spec.kind.str() + " is not supported by the fixed-boundary convention");
  }
  const Orientation z_orientation = cube_z_orientation(spec.kind);
  return memory_block(std::make_shared<const QubitTemplate>(), spec.kind.z(), repetitions,
                      [z_orientation](const std::optional<Basis>& reset, const std::optional<Basis>& measurement) {
                        return fixed_boundary::memory_qubit_descriptions(z_orientation, reset, measurement);
                      });
}

Block build_fixed_boundary_pipe(const PipeSpec& spec, const LinearFunction& repetitions) {
  const PipeKind& kind = spec.kind;
  if (kind.is_temporal()) {
    // x() is the basis seen by the lower cube.
    const Orientation z_orientation = kind.x() == Basis::kZ ? Orientation::kHorizontal : Orientation::kVertical;
    std::vector<Layer> layers;
    if (kind.has_hadamard()) {
      layers.push_back(PlaquetteLayer(std::make_shared<const QubitTemplate>(),
                                      to_plaquettes(fixed_boundary::temporal_hadamard_descriptions(z_orientation))));
      layers.push_back(memory_layer(flipped(z_orientation)));
    } else {
      layers.push_back(memory_layer(z_orientation));
      layers.push_back(memory_layer(z_orientation));
    }
    return Block(std::move(layers));
  }
  if (kind.has_hadamard()) {
    throw NotImplementedError("Spatial Hadamard pipe " + kind.str() +
                              " is not supported by the fixed-boundary convention");
  }
  if (spec.touches_spatial_cube()) {
    throw NotImplementedError("Pipe " + kind.str() + " touches a spatial cube, which the fixed-boundary convention "
                              "does not support");
  }
  if (kind.direction() == Direction3D::kX) {
    const Orientation z_orientation = kind.y() == Basis::kX ? Orientation::kHorizontal : Orientation::kVertical;
    return memory_block(std::make_shared<const QubitVerticalBorders>(), *kind.z(), repetitions,
                        [z_orientation](const std::optional<Basis>& reset, const std::optional<Basis>& measurement) {
                          return fixed_boundary::vertical_boundary_descriptions(z_orientation, reset, measurement);
                        });
  }
  const Orientation z_orientation = kind.x() == Basis::kZ ? Orientation::kHorizontal : Orientation::kVertical;
  return memory_block(std::make_shared<const QubitHorizontalBorders>(), *kind.z(), repetitions,
                      [z_orientation](const std::optional<Basis>& reset, const std::optional<Basis>& measurement) {
                        return fixed_boundary::horizontal_boundary_descriptions(z_orientation, reset, measurement);
                      });
}

CompilationConvention fixed_boundary_convention() {
  return {"fixed_boundary", build_fixed_boundary_cube, build_fixed_boundary_pipe};
}

}  // namespace qtopo
