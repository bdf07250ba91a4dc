#include "qtopo/core/blocks/block.h"
#include "qtopo/core/blocks/layers.h"
#include "qtopo/core/computation/block_graph.h"
#include "qtopo/core/conventions/css.h"
#include "qtopo/core/conventions/specs.h"
#include "qtopo/core/graph/topological_graph.h"
#include "qtopo/core/utils/errors.h"

#include <set>
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

template <typename Fn>
bool throws_compilation_error(Fn&& fn) {
  try {
    fn();
  } catch (const CompilationError&) {
    return true;
  }
  return false;
}

const std::set<SpatialBlockBorder>& bottom_trimmed_borders(const Block& block) {
  return block.layers().front().as<PlaquetteLayer>().trimmed_spatial_borders();
}

}  // namespace

int main() {
  const LinearFunction repetitions(2, -1);
  const CubeSpec zxz{ZXCube::from_string("ZXZ"), {}};
  const Block cube = build_css_cube(zxz, repetitions);
  const Block x_pipe = build_css_pipe({PipeKind::from_string("OXZ"), zxz, zxz}, repetitions);
  const Block temporal_pipe = build_css_pipe({PipeKind::from_string("ZXO"), zxz, zxz}, repetitions);

  expect(cube.is_cube(), "CSS cube must scale in every direction");
  expect(x_pipe.is_pipe() && !x_pipe.is_temporal_pipe(), "X pipe has a constant width");
  expect(temporal_pipe.is_temporal_pipe(), "Temporal pipe has a constant duration");
  expect(cube.scalable_timesteps() == LinearFunction(2, 1), "Cube lasts 2k + 1 layers");

  // Spatial junction: both cubes are trimmed before the pipe is stored.
  TopologicalComputationGraph spatial(cube.scalable_shape());
  spatial.add_cube({0, 0, 0}, cube);
  spatial.add_cube({1, 0, 0}, cube);
  expect(throws_compilation_error([&] { spatial.add_cube({0, 0, 0}, cube); }), "Duplicate cube must be rejected");
  expect(throws_compilation_error([&] { spatial.add_cube({2, 0, 0}, x_pipe); }), "Pipe is not a cube");

  spatial.add_junction({0, 0, 0}, {1, 0, 0}, x_pipe);
  expect(spatial.blocks().size() == 3, "Junction is stored next to both cubes");
  expect(spatial.has_junction({0, 0, 0}, {1, 0, 0}), "Junction must be registered");
  expect(bottom_trimmed_borders(spatial.cube_at({0, 0, 0})) == std::set<SpatialBlockBorder>{SpatialBlockBorder::kXPositive},
         "Source cube loses its X+ border");
  expect(bottom_trimmed_borders(spatial.cube_at({1, 0, 0})) == std::set<SpatialBlockBorder>{SpatialBlockBorder::kXNegative},
         "Sink cube loses its X- border");
  expect(throws_compilation_error([&] { spatial.add_junction({0, 0, 0}, {1, 0, 0}, x_pipe); }),
         "Duplicate junction must be rejected");

  const std::vector<Layer> layers = spatial.layout_layers(0);
  expect(layers.size() == 3, "Depth 0 holds init, memory and readout layers");
  expect(layers.front().as<LayoutLayer>().layers().size() == 3, "Layout holds two cubes and the pipe");
  expect(spatial.layout_layers(1).empty(), "Empty depth has no layer");

  // A failed junction leaves the graph untouched.
  TopologicalComputationGraph lonely(cube.scalable_shape());
  lonely.add_cube({0, 0, 0}, cube);
  expect(throws_compilation_error([&] { lonely.add_junction({0, 0, 0}, {1, 0, 0}, x_pipe); }),
         "Junction to a missing cube must be rejected");
  expect(lonely.cube_at({0, 0, 0}) == cube, "Rejected junction must not trim the existing cube");
  expect(throws_compilation_error([&] { lonely.add_junction({0, 0, 0}, {2, 0, 0}, x_pipe); }),
         "Junction between non-neighbours must be rejected");
  expect(throws_compilation_error([&] { lonely.add_junction({0, 0, 0}, {0, 0, 1}, cube); }),
         "A cube cannot be used as a junction");

  // Temporal junction: the facing layers of both cubes are replaced by the pipe.
  TopologicalComputationGraph column(cube.scalable_shape());
  column.add_cube({0, 0, 0}, cube);
  column.add_cube({0, 0, 1}, cube);
  column.add_junction({0, 0, 0}, {0, 0, 1}, temporal_pipe);
  expect(column.blocks().size() == 2, "Temporal junctions are not stored as blocks");
  expect(column.has_junction({0, 0, 0}, {0, 0, 1}), "Temporal junction must be registered");
  const Layer memory = temporal_pipe.get_temporal_border(TemporalBlockBorder::kZNegative);
  expect(column.cube_at({0, 0, 0}).get_temporal_border(TemporalBlockBorder::kZPositive) == memory,
         "Source readout is replaced by memory");
  expect(column.cube_at({0, 0, 1}).get_temporal_border(TemporalBlockBorder::kZNegative) == memory,
         "Sink initialisation is replaced by memory");
  expect(column.cube_at({0, 0, 0}).scalable_timesteps() == LinearFunction(2, 1), "Duration is unchanged");
  expect(column.min_z() == 0 && column.max_z() == 1, "Depth range covers both cubes");

  const LayerTree tree = column.to_layer_tree();
  expect(tree.depths() == std::vector<Coordinate>({0, 1}), "Tree has one child per depth");
  expect(tree.root().children().size() == 2, "Root sequence holds both depths");
  expect(tree.root().leaves().size() == 6, "Each depth has two atomic leaves plus a repeated one");

  // A pipe with distinct end layers: its bottom ends the source, its top starts the sink.
  const Layer pipe_bottom = cube.layers().back();
  const Layer pipe_top = cube.layers().front();
  const Block two_layer_pipe({pipe_bottom, pipe_top});
  expect(two_layer_pipe.is_temporal_pipe(), "Two constant layers form a temporal pipe");
  TopologicalComputationGraph oriented(cube.scalable_shape());
  oriented.add_cube({0, 0, 0}, cube);
  oriented.add_cube({0, 0, 1}, cube);
  oriented.add_junction({0, 0, 0}, {0, 0, 1}, two_layer_pipe);
  expect(oriented.cube_at({0, 0, 0}).get_temporal_border(TemporalBlockBorder::kZPositive) == pipe_bottom,
         "Source cube ends with the bottom layer of the pipe");
  expect(oriented.cube_at({0, 0, 1}).get_temporal_border(TemporalBlockBorder::kZNegative) == pipe_top,
         "Sink cube starts with the top layer of the pipe");

  TopologicalComputationGraph empty(cube.scalable_shape());
  expect(throws_compilation_error([&] { empty.to_layer_tree(); }), "Empty graph has no layer tree");
  return 0;
}
