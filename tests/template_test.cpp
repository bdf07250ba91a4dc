#include "qtopo/core/templates/layout_template.h"
#include "qtopo/core/templates/qubit_templates.h"
#include "qtopo/core/templates/template.h"

#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

std::set<std::size_t> indices_in(const qtopo::IndexGrid& grid) {
  std::set<std::size_t> indices;
  for (const auto& row : grid) {
    for (std::size_t index : row) {
      if (index != 0) {
        indices.insert(index);
      }
    }
  }
  return indices;
}

}  // namespace

int main() {
  using namespace qtopo;

  const QubitTemplate qubit;
  const IndexGrid k1 = qubit.instantiate(1);
  const IndexGrid expected = {{1, 5, 6, 2}, {7, 9, 10, 11}, {8, 10, 9, 12}, {3, 13, 14, 4}};
  expect(k1 == expected, "QubitTemplate at k = 1 does not match its layout");
  const IndexGrid k3 = qubit.instantiate(3);
  expect(k3.size() == 8 && k3.front().size() == 8, "QubitTemplate at k = 3 must be 8 x 8");
  expect(indices_in(k3).size() == 14, "Every plaquette index must appear at k = 3");

  bool rejected = false;
  try {
    qubit.instantiate(0);
  } catch (const std::invalid_argument&) {
    rejected = true;
  }
  expect(rejected, "k = 0 must be rejected");

  // Trimming every border leaves the bulk only, which is never empty for k >= 1.
  std::set<std::size_t> border;
  for (TemplateBorder b : {TemplateBorder::kTop, TemplateBorder::kBottom, TemplateBorder::kLeft, TemplateBorder::kRight}) {
    const auto& indices = qubit.get_border_indices(b).indices();
    border.insert(indices.begin(), indices.end());
  }
  for (std::int64_t k = 1; k < 5; ++k) {
    std::set<std::size_t> kept;
    for (std::size_t index : indices_in(qubit.instantiate(k))) {
      if (border.count(index) == 0) {
        kept.insert(index);
      }
    }
    expect(!kept.empty(), "Trimming four borders must keep plaquettes");
    for (std::size_t index : kept) {
      expect(index == 9 || index == 10, "Only bulk plaquettes may survive trimming");
    }
  }

  const QubitVerticalBorders vertical;
  const std::map<std::size_t, std::size_t> to_cube =
      vertical.get_border_indices(TemplateBorder::kLeft).to(qubit.get_border_indices(TemplateBorder::kRight));
  expect(to_cube.at(1) == 2 && to_cube.at(5) == 11 && to_cube.at(6) == 12 && to_cube.at(3) == 4,
         "Left column of a vertical pipe maps onto the right border of a cube");
  expect(vertical.instantiate(2).front().size() == 2, "Vertical borders are two plaquettes wide");

  const QubitHorizontalBorders horizontal;
  expect(horizontal.instantiate(2).size() == 2, "Horizontal borders are two plaquettes high");

  const QubitSpatialCubeTemplate spatial_cube;
  const IndexGrid spatial_k1 = spatial_cube.instantiate(1);
  const IndexGrid expected_spatial_k1 = {{1, 9, 10, 2}, {11, 5, 6, 21}, {12, 7, 8, 22}, {3, 23, 24, 4}};
  expect(spatial_k1 == expected_spatial_k1, "QubitSpatialCubeTemplate at k = 1 only holds the inner corners");
  const IndexGrid spatial_k4 = spatial_cube.instantiate(4);
  expect(spatial_k4[1] == std::vector<std::size_t>({11, 5, 17, 13, 17, 13, 17, 13, 6, 21}),
         "Second row of the spatial cube belongs to the top triangle");
  expect(spatial_k4[5] == std::vector<std::size_t>({11, 16, 20, 16, 19, 15, 18, 14, 18, 21}),
         "Sixth row of the spatial cube crosses the left, bottom and right triangles");
  expect(spatial_k4[9] == std::vector<std::size_t>({3, 23, 24, 23, 24, 23, 24, 23, 24, 4}),
         "Last row of the spatial cube is its bottom border");
  expect(indices_in(spatial_k4).size() == 24, "Every spatial cube index appears at k = 4");
  const std::map<std::size_t, std::size_t> arm_to_spatial =
      vertical.get_border_indices(TemplateBorder::kLeft)
          .to(spatial_cube.get_border_indices(TemplateBorder::kRight));
  expect(arm_to_spatial.at(5) == 21 && arm_to_spatial.at(6) == 22, "An arm replaces the right border of a spatial cube");

  std::map<BlockPosition2D, std::shared_ptr<const RectangularTemplate>> elements;
  elements[{0, 0}] = std::make_shared<const QubitTemplate>();
  elements[{1, 0}] = std::make_shared<const QubitTemplate>();
  const LayoutTemplate layout(elements);
  expect(layout.expected_plaquettes_number() == 28, "Two qubit templates hold 28 plaquettes");
  const auto indices_map = layout.get_indices_map_for_instantiation();
  expect(indices_map.at({0, 0}).at(1) == 1, "First element keeps its indices");
  expect(indices_map.at({1, 0}).at(1) == 15, "Second element is offset by 14");
  const IndexGrid layout_grid = layout.instantiate(1);
  expect(layout_grid.size() == 4 && layout_grid.front().size() == 8, "Layout of two k = 1 qubits is 8 x 4");
  expect(layout_grid[0][4] == 15, "Second element starts right after the first one");
  return 0;
}
