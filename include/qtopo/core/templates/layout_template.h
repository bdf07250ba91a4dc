#pragma once

#include <cstddef>
#include <map>
#include <memory>

#include "qtopo/core/geometry/position.h"
#include "qtopo/core/plaquette/plaquette.h"
#include "qtopo/core/templates/template.h"

namespace qtopo {

// Several templates of identical scalable shape placed on block positions. Each element
// gets its own consecutive range of global plaquette indices, in position order.
class LayoutTemplate {
 public:
  // Throws CompilationError if `element_layout` is empty or mixes shapes.
  explicit LayoutTemplate(std::map<BlockPosition2D, std::shared_ptr<const RectangularTemplate>> element_layout);

  const std::map<BlockPosition2D, std::shared_ptr<const RectangularTemplate>>& element_layout() const noexcept {
    return element_layout_;
  }

  // Top-left-most block position over all elements.
  BlockPosition2D origin() const noexcept { return origin_; }
  const Scalable2D& element_scalable_shape() const noexcept { return element_shape_; }
  Shape2D element_shape(std::int64_t k) const { return element_shape_.to_shape_2d(k); }
  // Shape of the bounding box in plaquettes.
  Scalable2D scalable_shape() const;
  std::size_t expected_plaquettes_number() const;

  // Block position -> (element index -> global index).
  std::map<BlockPosition2D, std::map<std::size_t, std::size_t>> get_indices_map_for_instantiation() const;

  // Element at `p` fills the cells starting at (p - origin) * element_shape; cells outside
  // every element are 0.
  IndexGrid instantiate(std::int64_t k) const;

  // Re-keys each element's plaquettes with global indices. Throws CompilationError if a
  // position is missing or if the elements disagree on the default plaquette.
  Plaquettes get_global_plaquettes(const std::map<BlockPosition2D, Plaquettes>& plaquettes) const;

 private:
  std::map<BlockPosition2D, std::shared_ptr<const RectangularTemplate>> element_layout_;
  BlockPosition2D origin_;
  BlockPosition2D max_position_;
  Scalable2D element_shape_;
};

}  // namespace qtopo
