#include "qtopo/core/templates/layout_template.h"

#include <algorithm>
#include <utility>
#include <vector>

#include "qtopo/core/utils/errors.h"

namespace qtopo {

LayoutTemplate::LayoutTemplate(std::map<BlockPosition2D, std::shared_ptr<const RectangularTemplate>> element_layout)
    : element_layout_(std::move(element_layout)) {
  if (element_layout_.empty()) {
    throw CompilationError("A layout template needs at least one element");
  }
  element_shape_ = element_layout_.begin()->second->scalable_shape();
  origin_ = element_layout_.begin()->first;
  max_position_ = origin_;
  for (const auto& [position, element] : element_layout_) {
    if (element->scalable_shape() != element_shape_) {
      throw CompilationError("Layout elements must share one scalable shape, found " + element_shape_.str() +
                             " and " + element->scalable_shape().str());
    }
    origin_.x = std::min(origin_.x, position.x);
    origin_.y = std::min(origin_.y, position.y);
    max_position_.x = std::max(max_position_.x, position.x);
    max_position_.y = std::max(max_position_.y, position.y);
  }
}

Scalable2D LayoutTemplate::scalable_shape() const {
  return {element_shape_.x * Fraction(max_position_.x - origin_.x + 1),
          element_shape_.y * Fraction(max_position_.y - origin_.y + 1)};
}

std::size_t LayoutTemplate::expected_plaquettes_number() const {
  std::size_t total = 0;
  for (const auto& entry : element_layout_) {
    total += entry.second->expected_plaquettes_number();
  }
  return total;
}

std::map<BlockPosition2D, std::map<std::size_t, std::size_t>> LayoutTemplate::get_indices_map_for_instantiation() const {
  std::map<BlockPosition2D, std::map<std::size_t, std::size_t>> out;
  std::size_t next = 1;
  for (const auto& [position, element] : element_layout_) {
    std::map<std::size_t, std::size_t>& mapping = out[position];
    for (std::size_t i = 1; i <= element->expected_plaquettes_number(); ++i) {
      mapping[i] = next++;
    }
  }
  return out;
}

IndexGrid LayoutTemplate::instantiate(std::int64_t k) const {
  const Shape2D element = element_shape(k);
  const Shape2D total = scalable_shape().to_shape_2d(k);
  IndexGrid grid(static_cast<std::size_t>(total.y), std::vector<std::size_t>(static_cast<std::size_t>(total.x), 0));
  const auto indices_map = get_indices_map_for_instantiation();
  for (const auto& [position, element_template] : element_layout_) {
    const std::map<std::size_t, std::size_t>& mapping = indices_map.at(position);
    std::vector<std::size_t> indices;
    indices.reserve(mapping.size());
    for (const auto& entry : mapping) {
      indices.push_back(entry.second);
    }
    const IndexGrid local = element_template->instantiate(k, indices);
    const auto row0 = static_cast<std::size_t>((position.y - origin_.y) * element.y);
    const auto col0 = static_cast<std::size_t>((position.x - origin_.x) * element.x);
    for (std::size_t i = 0; i < local.size(); ++i) {
      std::copy(local[i].begin(), local[i].end(), grid[row0 + i].begin() + static_cast<std::ptrdiff_t>(col0));
    }
  }
  return grid;
}

Plaquettes LayoutTemplate::get_global_plaquettes(const std::map<BlockPosition2D, Plaquettes>& plaquettes) const {
  const auto indices_map = get_indices_map_for_instantiation();
  std::map<std::size_t, Plaquette> global;
  const Plaquette* default_plaquette = nullptr;
  for (const auto& [position, mapping] : indices_map) {
    const auto it = plaquettes.find(position);
    if (it == plaquettes.end()) {
      throw CompilationError("No plaquettes given for the layout element at " + position.str());
    }
    if (default_plaquette == nullptr) {
      default_plaquette = &it->second.default_plaquette();
    } else if (*default_plaquette != it->second.default_plaquette()) {
      throw CompilationError("Layout elements disagree on the default plaquette");
    }
    for (const auto& [local, global_index] : mapping) {
      global.emplace(global_index, it->second[local]);
    }
  }
  return Plaquettes(std::move(global), *default_plaquette);
}

}  // namespace qtopo
