#pragma once

#include <array>
#include <cstddef>
#include <optional>

#include "qtopo/core/blocks/block.h"
#include "qtopo/core/conventions/descriptions.h"
#include "qtopo/core/conventions/specs.h"
#include "qtopo/core/scale/linear_function.h"
#include "qtopo/core/utils/enums.h"

namespace qtopo {

// Plaquettes of a QubitTemplate running one memory round. `z_orientation` is the
// orientation of the Z observable: with kHorizontal the left and right boundaries are
// Z boundaries. `reset` and `measurement` act on every data qubit of the patch.
RpngDescriptions memory_qubit_descriptions(Orientation z_orientation, std::optional<Basis> reset = std::nullopt,
                                           std::optional<Basis> measurement = std::nullopt);

// Plaquettes of a QubitVerticalBorders template joining two patches along X. Only the
// data qubits shared by the two patches are reset and measured.
RpngDescriptions memory_vertical_boundary_descriptions(Orientation z_orientation,
                                                       std::optional<Basis> reset = std::nullopt,
                                                       std::optional<Basis> measurement = std::nullopt);

// Same for a QubitHorizontalBorders template joining two patches along Y.
RpngDescriptions memory_horizontal_boundary_descriptions(Orientation z_orientation,
                                                         std::optional<Basis> reset = std::nullopt,
                                                         std::optional<Basis> measurement = std::nullopt);

// The four 3-body plaquettes closing the corners of a spatial cube, ordered top-left,
// top-right, bottom-left, bottom-right.
std::array<RpngDescription, 4> three_body_descriptions(std::optional<Basis> reset = std::nullopt,
                                                       std::optional<Basis> measurement = std::nullopt);

// Plaquettes of a QubitSpatialCubeTemplate whose boundaries all measure
// `boundary_basis` stabilizers, except where `arms` leave the cube. Throws
// NotImplementedError for straight arms.
RpngDescriptions spatial_cube_descriptions(Basis boundary_basis, const SpatialArms& arms,
                                           std::optional<Basis> reset = std::nullopt,
                                           std::optional<Basis> measurement = std::nullopt);

// Plaquettes of the pipe implementing `arms` between the cubes `u` and `v`, at least one
// of them spatial. LEFT/RIGHT arms use a QubitVerticalBorders template, UP/DOWN arms a
// QubitHorizontalBorders one.
RpngDescriptions spatial_arm_descriptions(Basis boundary_basis, const SpatialArms& arms, const CubeSpec& u,
                                          const CubeSpec& v, std::optional<Basis> reset = std::nullopt,
                                          std::optional<Basis> measurement = std::nullopt);

// CSS surface code with a fixed bulk: the top-left bulk plaquette always measures a Z
// stabilizer. Hadamard pipes throw NotImplementedError.
CompilationConvention css_convention();

Block build_css_cube(const CubeSpec& spec, const LinearFunction& repetitions);
Block build_css_pipe(const PipeSpec& spec, const LinearFunction& repetitions);

}  // namespace qtopo
