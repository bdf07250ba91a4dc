#include "qtopo/core/computation/block_graph.h"
#include "qtopo/core/utils/errors.h"

#include <sstream>
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

template <typename Error, typename Fn>
bool throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

}  // namespace

int main() {
  const ZXCube zxz = ZXCube::from_string("ZXZ");
  expect(zxz.x() == Basis::kZ && zxz.y() == Basis::kX && zxz.z() == Basis::kZ, "ZXZ bases");
  expect(zxz.str() == "ZXZ", "Kind prints back to its source");
  expect(!zxz.is_spatial(), "ZXZ is not a spatial cube");
  expect(ZXCube::from_string("XXZ").is_spatial(), "XXZ is a spatial cube");
  expect(throws<std::invalid_argument>([] { ZXCube::from_string("ZZZ"); }), "ZZZ has no logical qubit");
  expect(throws<std::invalid_argument>([] { ZXCube::from_string("ZYZ"); }), "Y boundaries are not supported");

  const PipeKind oxz = PipeKind::from_string("OXZ");
  expect(oxz.direction() == Direction3D::kX && oxz.is_spatial(), "OXZ runs along X");
  expect(PipeKind::from_string("ZXO").is_temporal(), "ZXO runs along Z");
  expect(PipeKind::from_string("OXZH").has_hadamard(), "Trailing H marks a Hadamard pipe");
  expect(throws<std::invalid_argument>([] { PipeKind::from_string("OZZ"); }), "Pipe walls must differ");
  expect(throws<std::invalid_argument>([] { PipeKind::from_string("ZXZ"); }), "Pipe needs one open direction");
  expect(PipeKind::from_cube_kind(zxz, Direction3D::kX, true) == oxz, "Pipe walls are taken from the cube");
  expect(throws<std::invalid_argument>([&] { PipeKind::from_cube_kind(zxz, Direction3D::kY, true); }),
         "ZXZ has no pipe along Y");

  BlockGraph graph("memory");
  graph.add_cube({0, 0, 0}, zxz);
  graph.add_cube({0, 0, 1}, zxz);
  graph.add_cube({5, 5, 5}, zxz);
  expect(throws<CompilationError>([&] { graph.add_cube({0, 0, 0}, zxz); }), "Position already taken");
  graph.add_pipe({0, 0, 1}, {0, 0, 0});
  expect(graph.has_pipe({0, 0, 0}, {0, 0, 1}), "Pipe ends are ordered");
  expect(graph.pipes().front().kind() == PipeKind::from_string("ZXO"), "Temporal pipe kind is inferred");
  expect(throws<CompilationError>([&] { graph.add_pipe({0, 0, 0}, {5, 5, 5}); }), "Pipe ends must be neighbours");
  expect(throws<CompilationError>([&] { graph.add_pipe({0, 0, 1}, {0, 0, 2}); }), "Pipe ends must be cubes");
  expect(throws<CompilationError>([&] {
           graph.add_pipe({0, 0, 0}, {0, 0, 1}, PipeKind::from_string("ZXO"));
         }),
         "Duplicate pipe");

  const std::vector<BlockGraph> components = graph.connected_components();
  expect(components.size() == 2, "Column and isolated cube are two components");
  expect(components.front().num_cubes() == 2 && components.front().num_pipes() == 1,
         "First component is the column");
  expect(graph.min_z() == 0 && graph.max_z() == 5, "Depth range");
  const BlockGraph shifted = graph.shifted_by(1, 0, -5);
  expect(shifted.has_cube({1, 0, -5}) && shifted.has_pipe({1, 0, -5}, {1, 0, -4}), "Shift moves cubes and pipes");

  BlockGraph mismatched;
  mismatched.add_cube({0, 0, 0}, zxz);
  mismatched.add_cube({1, 0, 0}, ZXCube::from_string("XZZ"));
  expect(throws<CompilationError>([&] { mismatched.add_pipe({0, 0, 0}, {1, 0, 0}, PipeKind::from_string("OXZ")); }),
         "Pipe walls must match both cubes");

  std::istringstream text(
      "# two cubes joined along x\n"
      "cube 0 0 0 ZXZ left\n"
      "cube 1 0 0 ZXZ\n"
      "pipe 0 0 0 1 0 0 OXZ\n");
  const BlockGraph parsed = BlockGraph::from_text(text, "line");
  expect(parsed.num_cubes() == 2 && parsed.num_pipes() == 1, "Parsed graph has two cubes and one pipe");
  expect(parsed.get_cube({0, 0, 0}).label == "left", "Optional label is kept");
  expect(throws<LookupError>([&] { parsed.get_cube({9, 9, 9}); }), "Missing cube lookup");

  std::istringstream broken("cube 0 0 ZXZ\n");
  expect(throws<std::invalid_argument>([&] { BlockGraph::from_text(broken); }), "Malformed line must be rejected");
  std::istringstream unknown("block 0 0 0 ZXZ\n");
  expect(throws<std::invalid_argument>([&] { BlockGraph::from_text(unknown); }), "Unknown statement");
  return 0;
}
