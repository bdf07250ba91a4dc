#include "qtopo/core/computation/block_graph.h"
#include "qtopo/core/observables/abstract_observable.h"
#include "qtopo/core/observables/builder.h"
#include "qtopo/core/utils/errors.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace qtopo;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

}  // namespace

int main() {
  const ZXCube zxz = ZXCube::from_string("ZXZ");

  // Readout line of a k = 1 patch (4 x 4 plaquettes) crosses three data qubits.
  const std::vector<LocalCoordinates> horizontal = cube_top_readout_qubits({4, 4}, Orientation::kHorizontal);
  expect(horizontal.size() == 3, "Horizontal readout line holds d qubits");
  for (const LocalCoordinates& qubit : horizontal) {
    expect(qubit.y == 2.0, "Horizontal readout line sits in the middle row");
  }
  expect(cube_top_readout_qubits({6, 6}, Orientation::kVertical).size() == 5, "d = 5 at k = 2");
  const std::vector<LocalCoordinates> junction = pipe_top_readout_qubits({4, 4}, Direction3D::kX);
  expect(junction.size() == 1 && junction.front().x == 4.0, "X pipe readout sits on the shared column");

  BlockGraph single;
  single.add_cube({0, 0, 0}, zxz);
  const std::vector<AbstractObservable> single_observables = find_memory_observables(single);
  expect(single_observables.size() == 1, "A lone cube carries one observable");
  expect(single_observables.front().top_readout_cubes.size() == 1, "Observable reads the cube out");

  BlockGraph column;
  column.add_cube({0, 0, 0}, zxz);
  column.add_cube({0, 0, 1}, zxz);
  column.add_pipe({0, 0, 0}, {0, 0, 1});
  const std::vector<AbstractObservable> column_observables = find_memory_observables(column);
  expect(column_observables.size() == 1, "A column carries one observable");
  expect(column_observables.front().top_readout_cubes.front().position.z == 1, "Only the top cube is read out");
  expect(column_observables.front().slice_at_z(0).empty(), "Nothing is read out at the bottom");
  expect(!column_observables.front().slice_at_z(1).empty(), "Readout happens at the top");
  expect(column_observables.front().shifted_by(0, 0, 3).top_readout_cubes.front().position.z == 4,
         "Shift moves the readout cubes");

  BlockGraph line;
  line.add_cube({0, 0, 0}, zxz);
  line.add_cube({1, 0, 0}, zxz);
  line.add_pipe({0, 0, 0}, {1, 0, 0});
  const std::vector<AbstractObservable> line_observables = find_memory_observables(line);
  expect(line_observables.size() == 1, "A line carries one observable");
  expect(line_observables.front().top_readout_cubes.size() == 2, "Both cubes are read out");
  expect(line_observables.front().top_readout_pipes.size() == 1, "The pipe junction qubit is read out");

  BlockGraph two;
  two.add_cube({0, 0, 0}, zxz);
  two.add_cube({4, 0, 0}, zxz);
  expect(find_memory_observables(two).size() == 2, "One observable per component");

  BlockGraph mixed;
  mixed.add_cube({0, 0, 0}, zxz);
  mixed.add_cube({1, 0, 0}, zxz);
  mixed.add_cube({0, 0, 1}, zxz);
  mixed.add_pipe({0, 0, 0}, {1, 0, 0});
  mixed.add_pipe({0, 0, 0}, {0, 0, 1});
  bool rejected = false;
  try {
    find_memory_observables(mixed);
  } catch (const NotImplementedError&) {
    rejected = true;
  }
  expect(rejected, "Mixing spatial and temporal pipes is not supported");
  return 0;
}
