#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "qtopo/core/geometry/position.h"
#include "qtopo/core/scale/linear_function.h"

namespace qtopo {

// Row-major grid of plaquette indices; 0 marks a cell without plaquette.
using IndexGrid = std::vector<std::vector<std::size_t>>;

enum class TemplateBorder {
  kTop = 0,
  kBottom,
  kLeft,
  kRight,
};

std::string to_string(TemplateBorder border);

// Plaquette indices along one border, ordered from the top-left end.
class BorderIndices {
 public:
  explicit BorderIndices(std::vector<std::size_t> indices) : indices_(std::move(indices)) {}

  const std::vector<std::size_t>& indices() const noexcept { return indices_; }

  // Pairs up the i-th index of this border with the i-th index of `other`.
  std::map<std::size_t, std::size_t> to(const BorderIndices& other) const;

 private:
  std::vector<std::size_t> indices_;
};

// Rectangular arrangement of plaquettes whose size scales with k.
class RectangularTemplate {
 public:
  explicit RectangularTemplate(Shift2D default_increments = {2, 2}) : increments_(default_increments) {}
  virtual ~RectangularTemplate() = default;

  virtual std::string name() const = 0;
  // Shape in plaquettes.
  virtual Scalable2D scalable_shape() const = 0;
  virtual std::size_t expected_plaquettes_number() const = 0;
  // Throws std::invalid_argument for a border the template does not have.
  virtual BorderIndices get_border_indices(TemplateBorder border) const = 0;

  // Throws std::invalid_argument if `plaquette_indices` does not have
  // expected_plaquettes_number() entries or k < 1.
  IndexGrid instantiate(std::int64_t k, const std::vector<std::size_t>& plaquette_indices) const;
  // Uses indices 1..expected_plaquettes_number().
  IndexGrid instantiate(std::int64_t k) const;

  Shape2D shape(std::int64_t k) const { return scalable_shape().to_shape_2d(k); }
  const Shift2D& increments() const noexcept { return increments_; }

  bool operator==(const RectangularTemplate& other) const {
    return name() == other.name() && increments_ == other.increments_;
  }
  bool operator!=(const RectangularTemplate& other) const { return !(*this == other); }

 protected:
  virtual IndexGrid do_instantiate(std::int64_t k, const std::vector<std::size_t>& plaquette_indices) const = 0;

 private:
  Shift2D increments_;
};

}  // namespace qtopo
