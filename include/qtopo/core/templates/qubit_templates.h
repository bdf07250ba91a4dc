#pragma once

#include "qtopo/core/templates/template.h"

namespace qtopo {

// Plaquettes of one logical qubit, a (2k+2) x (2k+2) square:
//
//   1  5  6  5  6 ...  2
//   7  9 10  9 10 ... 11
//   8 10  9 10  9 ... 12
//   .                  .
//   3 13 14 13 14 ...  4
class QubitTemplate final : public RectangularTemplate {
 public:
  QubitTemplate() = default;

  std::string name() const override { return "QubitTemplate"; }
  Scalable2D scalable_shape() const override { return {LinearFunction(2, 2), LinearFunction(2, 2)}; }
  std::size_t expected_plaquettes_number() const override { return 14; }
  BorderIndices get_border_indices(TemplateBorder border) const override;

 protected:
  IndexGrid do_instantiate(std::int64_t k, const std::vector<std::size_t>& plaquette_indices) const override;
};

// One logical qubit whose four spatial boundaries share a basis. The bulk is split in
// four triangles (top 13/17, right 14/18, bottom 15/19, left 16/20) so that each side
// can pick its own hook orientation. For k = 4:
//
//    1  9 10  9 10  9 10  9 10  2
//   11  5 17 13 17 13 17 13  6 21
//   12 20 13 17 13 17 13 17 14 22
//   11 16 20 13 17 13 17 14 18 21
//   12 20 16 20 13 17 14 18 14 22
//   11 16 20 16 19 15 18 14 18 21
//   12 20 16 19 15 19 15 18 14 22
//   11 16 19 15 19 15 19 15 18 21
//   12  7 15 19 15 19 15 19  8 22
//    3 23 24 23 24 23 24 23 24  4
//
// For k = 1 the interior only holds 5 to 8.
class QubitSpatialCubeTemplate final : public RectangularTemplate {
 public:
  QubitSpatialCubeTemplate() = default;

  std::string name() const override { return "QubitSpatialCubeTemplate"; }
  Scalable2D scalable_shape() const override { return {LinearFunction(2, 2), LinearFunction(2, 2)}; }
  std::size_t expected_plaquettes_number() const override { return 24; }
  BorderIndices get_border_indices(TemplateBorder border) const override;

 protected:
  IndexGrid do_instantiate(std::int64_t k, const std::vector<std::size_t>& plaquette_indices) const override;
};

// Two columns of plaquettes, used by pipes along X:
//
//   1  2
//   5  7
//   6  8
//   .  .
//   3  4
class QubitVerticalBorders final : public RectangularTemplate {
 public:
  QubitVerticalBorders() = default;

  std::string name() const override { return "QubitVerticalBorders"; }
  Scalable2D scalable_shape() const override { return {LinearFunction(0, 2), LinearFunction(2, 2)}; }
  std::size_t expected_plaquettes_number() const override { return 8; }
  BorderIndices get_border_indices(TemplateBorder border) const override;

 protected:
  IndexGrid do_instantiate(std::int64_t k, const std::vector<std::size_t>& plaquette_indices) const override;
};

// Two rows of plaquettes, used by pipes along Y:
//
//   1  5  6  5 ...  2
//   3  7  8  7 ...  4
class QubitHorizontalBorders final : public RectangularTemplate {
 public:
  QubitHorizontalBorders() = default;

  std::string name() const override { return "QubitHorizontalBorders"; }
  Scalable2D scalable_shape() const override { return {LinearFunction(2, 2), LinearFunction(0, 2)}; }
  std::size_t expected_plaquettes_number() const override { return 8; }
  BorderIndices get_border_indices(TemplateBorder border) const override;

 protected:
  IndexGrid do_instantiate(std::int64_t k, const std::vector<std::size_t>& plaquette_indices) const override;
};

}  // namespace qtopo
