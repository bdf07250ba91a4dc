#pragma once

#include <optional>

#include "qtopo/core/blocks/block.h"
#include "qtopo/core/conventions/descriptions.h"
#include "qtopo/core/conventions/specs.h"
#include "qtopo/core/scale/linear_function.h"
#include "qtopo/core/utils/enums.h"

namespace qtopo {

namespace fixed_boundary {

// Memory round of a QubitTemplate. The 2-body plaquettes always sit at indices 6, 7, 12
// and 13, so the basis of the top-left bulk plaquette follows `z_orientation`.
RpngDescriptions memory_qubit_descriptions(Orientation z_orientation, std::optional<Basis> reset = std::nullopt,
                                           std::optional<Basis> measurement = std::nullopt);

RpngDescriptions vertical_boundary_descriptions(Orientation z_orientation, std::optional<Basis> reset = std::nullopt,
                                                std::optional<Basis> measurement = std::nullopt);

RpngDescriptions horizontal_boundary_descriptions(Orientation z_orientation,
                                                  std::optional<Basis> reset = std::nullopt,
                                                  std::optional<Basis> measurement = std::nullopt);

// Last round of a patch before a transversal Hadamard: the stabilizers of
// memory_qubit_descriptions(z_orientation) are measured, then every data qubit gets an
// H gate. The next round uses the flipped orientation.
RpngDescriptions temporal_hadamard_descriptions(Orientation z_orientation);

}  // namespace fixed_boundary

// Surface code whose 2-body boundary plaquettes keep the same template positions for
// both orientations. Temporal Hadamard pipes are supported; spatial cubes and spatial
// Hadamard pipes throw NotImplementedError.
CompilationConvention fixed_boundary_convention();

Block build_fixed_boundary_cube(const CubeSpec& spec, const LinearFunction& repetitions);
Block build_fixed_boundary_pipe(const PipeSpec& spec, const LinearFunction& repetitions);

}  // namespace qtopo
