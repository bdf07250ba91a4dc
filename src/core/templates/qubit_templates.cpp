#include "qtopo/core/templates/qubit_templates.h"

#include <stdexcept>

namespace qtopo {
namespace {

IndexGrid make_grid(std::size_t width, std::size_t height) {
  return IndexGrid(height, std::vector<std::size_t>(width, 0));
}

// Value for the interior cell `i` (1 <= i <= n-2) of an alternating line.
std::size_t alternate(std::size_t i, std::size_t odd_value, std::size_t even_value) {
  return i % 2 == 1 ? odd_value : even_value;
}

std::invalid_argument missing_border(const std::string& name, TemplateBorder border) {
  return std::invalid_argument(name + " has no " + to_string(border) + " border");
}

}  // namespace

BorderIndices QubitTemplate::get_border_indices(TemplateBorder border) const {
  switch (border) {
    case TemplateBorder::kTop:
      return BorderIndices({1, 5, 6, 2});
    case TemplateBorder::kBottom:
      return BorderIndices({3, 13, 14, 4});
    case TemplateBorder::kLeft:
      return BorderIndices({1, 7, 8, 3});
    case TemplateBorder::kRight:
      return BorderIndices({2, 11, 12, 4});
  }
  throw missing_border(name(), border);
}

IndexGrid QubitTemplate::do_instantiate(std::int64_t k, const std::vector<std::size_t>& p) const {
  const auto n = static_cast<std::size_t>(2 * k + 2);
  IndexGrid grid = make_grid(n, n);
  grid[0][0] = p[0];
  grid[0][n - 1] = p[1];
  grid[n - 1][0] = p[2];
  grid[n - 1][n - 1] = p[3];
  for (std::size_t i = 1; i + 1 < n; ++i) {
    grid[0][i] = alternate(i, p[4], p[5]);
    grid[i][0] = alternate(i, p[6], p[7]);
    grid[i][n - 1] = alternate(i, p[10], p[11]);
    grid[n - 1][i] = alternate(i, p[12], p[13]);
    for (std::size_t j = 1; j + 1 < n; ++j) {
      grid[i][j] = (i + j) % 2 == 0 ? p[8] : p[9];
    }
  }
  return grid;
}

BorderIndices QubitSpatialCubeTemplate::get_border_indices(TemplateBorder border) const {
  switch (border) {
    case TemplateBorder::kTop:
      return BorderIndices({1, 9, 10, 2});
    case TemplateBorder::kBottom:
      return BorderIndices({3, 23, 24, 4});
    case TemplateBorder::kLeft:
      return BorderIndices({1, 11, 12, 3});
    case TemplateBorder::kRight:
      return BorderIndices({2, 21, 22, 4});
  }
  throw missing_border(name(), border);
}

IndexGrid QubitSpatialCubeTemplate::do_instantiate(std::int64_t k, const std::vector<std::size_t>& p) const {
  const auto n = static_cast<std::size_t>(2 * k + 2);
  IndexGrid grid = make_grid(n, n);
  grid[0][0] = p[0];
  grid[0][n - 1] = p[1];
  grid[n - 1][0] = p[2];
  grid[n - 1][n - 1] = p[3];
  for (std::size_t i = 1; i + 1 < n; ++i) {
    grid[0][i] = alternate(i, p[8], p[9]);
    grid[i][0] = alternate(i, p[10], p[11]);
    grid[i][n - 1] = alternate(i, p[20], p[21]);
    grid[n - 1][i] = alternate(i, p[22], p[23]);
    for (std::size_t j = 1; j + 1 < n; ++j) {
      const std::size_t offset = (i + j) % 2 == 1 ? 4 : 0;
      const std::size_t mirrored = n - 1 - j;
      if (i <= j && i <= mirrored) {
        grid[i][j] = p[12 + offset];
      } else if (i < j && i > mirrored) {
        grid[i][j] = p[13 + offset];
      } else if (i >= j && i >= mirrored) {
        grid[i][j] = p[14 + offset];
      } else {
        grid[i][j] = p[15 + offset];
      }
    }
  }
  grid[1][1] = p[4];
  grid[1][n - 2] = p[5];
  grid[n - 2][1] = p[6];
  grid[n - 2][n - 2] = p[7];
  return grid;
}

BorderIndices QubitVerticalBorders::get_border_indices(TemplateBorder border) const {
  switch (border) {
    case TemplateBorder::kLeft:
      return BorderIndices({1, 5, 6, 3});
    case TemplateBorder::kRight:
      return BorderIndices({2, 7, 8, 4});
    default:
      break;
  }
  throw missing_border(name(), border);
}

IndexGrid QubitVerticalBorders::do_instantiate(std::int64_t k, const std::vector<std::size_t>& p) const {
  const auto n = static_cast<std::size_t>(2 * k + 2);
  IndexGrid grid = make_grid(2, n);
  grid[0][0] = p[0];
  grid[0][1] = p[1];
  grid[n - 1][0] = p[2];
  grid[n - 1][1] = p[3];
  for (std::size_t i = 1; i + 1 < n; ++i) {
    grid[i][0] = alternate(i, p[4], p[5]);
    grid[i][1] = alternate(i, p[6], p[7]);
  }
  return grid;
}

BorderIndices QubitHorizontalBorders::get_border_indices(TemplateBorder border) const {
  switch (border) {
    case TemplateBorder::kTop:
      return BorderIndices({1, 5, 6, 2});
    case TemplateBorder::kBottom:
      return BorderIndices({3, 7, 8, 4});
    default:
      break;
  }
  throw missing_border(name(), border);
}

IndexGrid QubitHorizontalBorders::do_instantiate(std::int64_t k, const std::vector<std::size_t>& p) const {
  const auto n = static_cast<std::size_t>(2 * k + 2);
  IndexGrid grid = make_grid(n, 2);
  grid[0][0] = p[0];
  grid[0][n - 1] = p[1];
  grid[1][0] = p[2];
  grid[1][n - 1] = p[3];
  for (std::size_t i = 1; i + 1 < n; ++i) {
    grid[0][i] = alternate(i, p[4], p[5]);
    grid[1][i] = alternate(i, p[6], p[7]);
  }
  return grid;
}

}  // namespace qtopo
