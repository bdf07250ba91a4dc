#include "qtopo/core/computation/block_graph.h"
#include "qtopo/core/conventions/css.h"
#include "qtopo/core/conventions/descriptions.h"
#include "qtopo/core/conventions/fixed_boundary.h"
#include "qtopo/core/conventions/specs.h"
#include "qtopo/core/plaquette/rpng.h"
#include "qtopo/core/utils/errors.h"

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace {

using namespace qtopo;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

bool measures(const RpngDescription& description, Basis basis) {
  for (const Rpng& corner : description.corners()) {
    if (corner.pauli && *corner.pauli != basis) {
      return false;
    }
  }
  return !description.is_empty();
}

std::size_t used_corners(const RpngDescription& description) {
  std::size_t used = 0;
  for (const Rpng& corner : description.corners()) {
    used += corner.pauli ? 1 : 0;
  }
  return used;
}

}  // namespace

int main() {
  const std::array<RpngDescription, 4> corners = three_body_descriptions();
  expect(used_corners(corners[0]) == 3 && measures(corners[0], Basis::kZ), "Top-left corner is a Z 3-body");
  expect(!corners[0].corners()[0].pauli, "Top-left 3-body drops its top-left data qubit");
  expect(measures(corners[1], Basis::kX) && measures(corners[2], Basis::kX), "Off-diagonal corners are X");

  // Closed Z cube: the Z corners are removed and replaced by 3-body plaquettes inside.
  const RpngDescriptions closed_z = spatial_cube_descriptions(Basis::kZ, SpatialArms{});
  expect(closed_z.count(1) == 0 && closed_z.count(4) == 0, "Closed Z corners are removed");
  expect(closed_z.count(2) == 0 && closed_z.count(3) == 0, "X corners never hold a Z boundary plaquette");
  expect(closed_z.at(5) == corners[0] && closed_z.at(8) == corners[3], "Inner Z corners become 3-body");
  expect(used_corners(closed_z.at(10)) == 2 && used_corners(closed_z.at(23)) == 2, "Sides are 2-body");
  expect(measures(closed_z.at(21), Basis::kZ) && measures(closed_z.at(12), Basis::kZ), "Every side measures Z");
  expect(measures(closed_z.at(6), Basis::kX) && used_corners(closed_z.at(6)) == 4, "Inner X corners stay 4-body");

  const RpngDescriptions closed_x = spatial_cube_descriptions(Basis::kX, SpatialArms{});
  expect(closed_x.count(2) == 0 && closed_x.count(3) == 0, "Closed X corners are removed");
  expect(closed_x.at(6) == corners[1] && closed_x.at(7) == corners[2], "Inner X corners become 3-body");

  SpatialArms up_right;
  up_right.up = true;
  up_right.right = true;
  expect(up_right.str() == "UP|RIGHT", "Arms print in clockwise order");
  const RpngDescriptions l_shaped = spatial_cube_descriptions(Basis::kZ, up_right, Basis::kX);
  expect(l_shaped.count(10) == 0 && l_shaped.count(21) == 0, "Sides with an arm are left to the pipes");
  expect(l_shaped.count(1) == 1 && l_shaped.count(4) == 1, "Corners next to an arm stay 2-body");
  expect(used_corners(l_shaped.at(5)) == 4, "No 3-body plaquette next to an arm");
  expect(l_shaped.at(5).corners()[0].reset == ExtendedBasis::kX, "Bulk plaquettes reset their data qubits");
  expect(!l_shaped.at(1).corners()[1].reset, "2-body plaquettes never reset data qubits");

  SpatialArms straight;
  straight.left = true;
  straight.right = true;
  bool rejected = false;
  try {
    spatial_cube_descriptions(Basis::kZ, straight);
  } catch (const NotImplementedError&) {
    rejected = true;
  }
  expect(rejected, "Straight spatial cubes are regular memory patches");

  // ZXX above, XZX on the right of a ZZX cube.
  BlockGraph junction("junction");
  junction.add_cube({0, 0, 0}, ZXCube::from_string("ZZX"));
  junction.add_cube({1, 0, 0}, ZXCube::from_string("XZX"));
  junction.add_cube({0, -1, 0}, ZXCube::from_string("ZXX"));
  junction.add_pipe({0, 0, 0}, {1, 0, 0});
  junction.add_pipe({0, -1, 0}, {0, 0, 0});
  const CubeSpec spatial = CubeSpec::of(junction, {0, 0, 0});
  expect(spatial.arms == up_right, "Arms follow the spatial pipes of the cube");
  expect(CubeSpec::of(junction, {1, 0, 0}).arms.empty(), "Regular cubes carry no arms");
  for (const Pipe& pipe : junction.pipes()) {
    const PipeSpec spec = PipeSpec::of(junction, pipe);
    SpatialArms expected;
    (pipe.direction() == Direction3D::kX ? expected.right : expected.up) = true;
    expect(spec.arms() == expected, "A pipe is the arm of the spatial cube it touches");
  }

  // RIGHT arm of a spatial cube that also has a DOWN arm: the bottom corner of the pipe
  // closes with a 3-body plaquette.
  SpatialArms right;
  right.right = true;
  SpatialArms up_down;
  up_down.up = true;
  up_down.down = true;
  const CubeSpec with_down{ZXCube::from_string("ZZX"), up_down};
  const CubeSpec regular{ZXCube::from_string("XZX"), {}};
  const RpngDescriptions arm = spatial_arm_descriptions(Basis::kZ, right, with_down, regular);
  expect(arm.at(3) == corners[3], "A DOWN arm next to a RIGHT arm closes the bottom corner");
  expect(used_corners(arm.at(2)) == 2, "The UP side of the arm stays 2-body");
  const RpngDescriptions lone_arm = spatial_arm_descriptions(Basis::kZ, right, spatial, regular, Basis::kX);
  expect(lone_arm.at(5).corners()[1].reset == ExtendedBasis::kX && !lone_arm.at(5).corners()[0].reset,
         "Arms only reset the data qubits they add");
  rejected = false;
  try {
    spatial_arm_descriptions(Basis::kZ, up_right, spatial, regular);
  } catch (const std::invalid_argument&) {
    rejected = true;
  }
  expect(rejected, "A pipe cannot be a vertical and a horizontal arm");

  // Fixed boundary: the 2-body plaquettes keep their indices, the bulk changes basis.
  const RpngDescriptions horizontal = fixed_boundary::memory_qubit_descriptions(Orientation::kHorizontal);
  const RpngDescriptions vertical = fixed_boundary::memory_qubit_descriptions(Orientation::kVertical);
  expect(measures(horizontal.at(9), Basis::kX) && measures(vertical.at(9), Basis::kZ), "Bulk basis flips");
  expect(measures(horizontal.at(7), Basis::kZ) && measures(vertical.at(7), Basis::kX), "Left side basis flips");
  const RpngDescriptions hadamard = fixed_boundary::temporal_hadamard_descriptions(Orientation::kHorizontal);
  for (const auto& [index, description] : hadamard) {
    expect(horizontal.count(index) == 1, "The Hadamard round measures the memory stabilizers");
    for (const Rpng& corner : description.corners()) {
      expect(!corner.pauli || corner.measurement == ExtendedBasis::kH, "Every data qubit gets an H gate");
    }
  }
  return 0;
}
