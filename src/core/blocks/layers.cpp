#include "qtopo/core/blocks/layers.h"

#include <algorithm>
#include <string>
#include <utility>

#include "qtopo/core/utils/errors.h"

namespace qtopo {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

bool is_x_border(SpatialBlockBorder border) {
  return border == SpatialBlockBorder::kXNegative || border == SpatialBlockBorder::kXPositive;
}

std::optional<Layer> replace_atomic_layer(const Layer& layer, const BorderReplacements& replacements) {
  if (replacements.empty()) {
    return layer;
  }
  if (replacements.size() > 1) {
    for (const auto& entry : replacements) {
      if (entry.second.has_value()) {
        throw CompilationError("Unclear semantic: cannot replace both temporal borders of an atomic layer");
      }
    }
    return std::nullopt;
  }
  return replacements.begin()->second;
}

bool contains_layout_layer(const Layer& layer) {
  if (layer.is<LayoutLayer>()) {
    return true;
  }
  if (layer.is<SequencedLayers>()) {
    const auto& children = layer.as<SequencedLayers>().layer_sequence();
    return std::any_of(children.begin(), children.end(), contains_layout_layer);
  }
  if (layer.is<RepeatedLayer>()) {
    return contains_layout_layer(layer.as<RepeatedLayer>().internal_layer());
  }
  return false;
}

LinearFunction max_num_moments(const std::vector<LinearFunction>& moments) {
  if (moments.empty()) {
    return LinearFunction(0, 0);
  }
  return unambiguous_max_on_positives(moments);
}

}  // namespace

// ---------------------------------------------------------------- PlaquetteLayer

PlaquetteLayer::PlaquetteLayer(std::shared_ptr<const RectangularTemplate> layer_template, Plaquettes plaquettes,
                               std::set<SpatialBlockBorder> trimmed_spatial_borders)
    : template_(std::move(layer_template)),
      plaquettes_(std::move(plaquettes)),
      trimmed_(std::move(trimmed_spatial_borders)) {
  if (!template_) {
    throw CompilationError("A plaquette layer needs a template");
  }
  if (template_->increments() != Shift2D{2, 2}) {
    throw CompilationError("Plaquette layers only support templates with (2, 2) increments, got template " +
                           template_->name());
  }
  const Scalable2D shape = trimmed_template_shape();
  const Shape2D smallest = shape.to_shape_2d(1);
  if (smallest.x <= 0 || smallest.y <= 0) {
    throw CompilationError("Trimming template " + template_->name() + " leaves an empty shape " + shape.str());
  }
  if (shape.x.slope() < Fraction(0) || shape.y.slope() < Fraction(0)) {
    throw CompilationError("Template " + template_->name() + " shrinks with k: " + shape.str());
  }
}

Scalable2D PlaquetteLayer::trimmed_template_shape() const {
  Scalable2D shape = template_->scalable_shape();
  for (SpatialBlockBorder border : trimmed_) {
    if (is_x_border(border)) {
      shape.x = shape.x - LinearFunction(0, 1);
    } else {
      shape.y = shape.y - LinearFunction(0, 1);
    }
  }
  return shape;
}

Scalable2D PlaquetteLayer::scalable_shape() const {
  const Scalable2D shape = trimmed_template_shape();
  const Shift2D& increments = template_->increments();
  return {shape.x * Fraction(increments.x) + LinearFunction(0, 1),
          shape.y * Fraction(increments.y) + LinearFunction(0, 1)};
}

LinearFunction PlaquetteLayer::scalable_num_moments() const {
  int moments = 0;
  auto account = [&moments](const Plaquette& plaquette) {
    if (!plaquette.is_empty()) {
      moments = std::max(moments, plaquette.circuit().schedule().back() + 1);
    }
  };
  account(plaquettes_.default_plaquette());
  for (const auto& entry : plaquettes_.collection()) {
    account(entry.second);
  }
  return LinearFunction(0, moments);
}

PlaquetteLayer PlaquetteLayer::with_spatial_borders_trimmed(const std::set<SpatialBlockBorder>& borders) const {
  std::set<std::size_t> removed;
  std::set<SpatialBlockBorder> trimmed = trimmed_;
  for (SpatialBlockBorder border : borders) {
    const BorderIndices indices = template_->get_border_indices(to_template_border(border));
    removed.insert(indices.indices().begin(), indices.indices().end());
    trimmed.insert(border);
  }
  return PlaquetteLayer(template_, plaquettes_.without_plaquettes(removed), std::move(trimmed));
}

bool PlaquetteLayer::operator==(const PlaquetteLayer& other) const {
  return *template_ == *other.template_ && plaquettes_ == other.plaquettes_ && trimmed_ == other.trimmed_;
}

// ---------------------------------------------------------------- RawCircuitLayer

RawCircuitLayer::RawCircuitLayer(CircuitFactory factory, Scalable2D scalable_raw_shape,
                                 LinearFunction scalable_num_moments)
    : factory_(std::make_shared<const CircuitFactory>(std::move(factory))),
      shape_(std::move(scalable_raw_shape)),
      num_moments_(std::move(scalable_num_moments)) {
  if (!*factory_) {
    throw CompilationError("A raw circuit layer needs a circuit factory");
  }
}

RawCircuitLayer RawCircuitLayer::with_spatial_borders_trimmed(const std::set<SpatialBlockBorder>& borders) const {
  if (!borders.empty()) {
    throw NotImplementedError("Cannot trim the spatial borders of a raw circuit layer");
  }
  return *this;
}

Scalable2D scalable_shape(const AtomicLayer& layer) {
  return std::visit([](const auto& atomic) -> Scalable2D { return atomic.scalable_shape(); }, layer);
}

// ---------------------------------------------------------------- LayoutLayer

LayoutLayer::LayoutLayer(std::map<LayoutPosition2D, AtomicLayer> layers, Scalable2D element_shape)
    : layers_(std::move(layers)), element_shape_(std::move(element_shape)) {
  if (layers_.empty()) {
    throw CompilationError("A layout layer needs at least one layer");
  }
}

std::pair<BlockPosition2D, BlockPosition2D> LayoutLayer::bounds() const {
  BlockPosition2D low = layers_.begin()->first.to_block_position();
  BlockPosition2D high = low;
  for (const auto& entry : layers_) {
    const BlockPosition2D position = entry.first.to_block_position();
    low.x = std::min(low.x, position.x);
    low.y = std::min(low.y, position.y);
    high.x = std::max(high.x, position.x);
    high.y = std::max(high.y, position.y);
  }
  return {low, high};
}

Scalable2D LayoutLayer::scalable_shape() const {
  const auto [low, high] = bounds();
  const LinearFunction one(0, 1);
  return {(element_shape_.x - one) * Fraction(high.x - low.x + 1) + one,
          (element_shape_.y - one) * Fraction(high.y - low.y + 1) + one};
}

LinearFunction LayoutLayer::scalable_num_moments() const {
  std::vector<LinearFunction> moments;
  for (const auto& entry : layers_) {
    moments.push_back(
        std::visit([](const auto& layer) -> LinearFunction { return layer.scalable_num_moments(); }, entry.second));
  }
  return max_num_moments(moments);
}

std::pair<LayoutTemplate, Plaquettes> LayoutLayer::to_template_and_plaquettes() const {
  std::map<BlockPosition2D, std::shared_ptr<const RectangularTemplate>> templates;
  std::map<BlockPosition2D, Plaquettes> plaquettes;
  for (const auto& [position, layer] : layers_) {
    if (!std::holds_alternative<PlaquetteLayer>(layer)) {
      throw NotImplementedError("Layout layer at " + position.str() + " is not made of plaquettes");
    }
    if (position.is_cube()) {
      const auto& cube = std::get<PlaquetteLayer>(layer);
      templates.emplace(position.to_block_position(), cube.shared_template());
      plaquettes.emplace(position.to_block_position(), cube.plaquettes());
    }
  }
  // Pipes write their border plaquettes into the matching border of both cubes.
  for (const auto& [position, layer] : layers_) {
    if (position.is_cube()) {
      continue;
    }
    const auto& pipe = std::get<PlaquetteLayer>(layer);
    const bool along_x = position.x() % 2 != 0;
    const BlockPosition2D u = position.to_block_position();
    const BlockPosition2D v = along_x ? u + Shift2D{1, 0} : u + Shift2D{0, 1};
    const std::pair<BlockPosition2D, std::pair<TemplateBorder, TemplateBorder>> sides[] = {
        {u, along_x ? std::make_pair(TemplateBorder::kLeft, TemplateBorder::kRight)
                    : std::make_pair(TemplateBorder::kTop, TemplateBorder::kBottom)},
        {v, along_x ? std::make_pair(TemplateBorder::kRight, TemplateBorder::kLeft)
                    : std::make_pair(TemplateBorder::kBottom, TemplateBorder::kTop)},
    };
    for (const auto& [cube, borders] : sides) {
      const auto it = templates.find(cube);
      if (it == templates.end()) {
        throw CompilationError("Pipe at " + position.str() + " has no cube at " + cube.str());
      }
      const std::map<std::size_t, std::size_t> mapping =
          pipe.layer_template().get_border_indices(borders.first).to(it->second->get_border_indices(borders.second));
      std::map<std::size_t, Plaquette> updates;
      for (const auto& [pipe_index, cube_index] : mapping) {
        if (pipe.plaquettes().contains(pipe_index)) {
          updates.insert_or_assign(cube_index, pipe.plaquettes()[pipe_index]);
        }
      }
      plaquettes.at(cube) = plaquettes.at(cube).with_updated_plaquettes(updates);
    }
  }
  LayoutTemplate layout(std::move(templates));
  Plaquettes global = layout.get_global_plaquettes(plaquettes);
  return {std::move(layout), std::move(global)};
}

Shift2D LayoutLayer::cube_offset(const BlockPosition2D& position, std::int64_t k) const {
  const Shape2D element = element_shape_.to_shape_2d(k);
  return {position.x * (element.x - 1), position.y * (element.y - 1)};
}

std::vector<PlacedPlaquette> LayoutLayer::placed_plaquettes(std::int64_t k) const {
  const auto [layout, plaquettes] = to_template_and_plaquettes();
  const IndexGrid grid = layout.instantiate(k);
  const Shift2D origin = cube_offset(layout.origin(), k);
  const Shift2D& increments = layout.element_layout().begin()->second->increments();
  std::vector<PlacedPlaquette> placed;
  for (std::size_t row = 0; row < grid.size(); ++row) {
    for (std::size_t col = 0; col < grid[row].size(); ++col) {
      const std::size_t index = grid[row][col];
      if (index == 0 || plaquettes[index].is_empty()) {
        continue;
      }
      const GridQubit position{static_cast<Coordinate>(col) * increments.x + origin.x,
                               static_cast<Coordinate>(row) * increments.y + origin.y};
      placed.push_back({position, plaquettes[index]});
    }
  }
  return placed;
}

ScheduledCircuit LayoutLayer::to_circuit(std::int64_t k) const {
  std::size_t raw_count = 0;
  for (const auto& entry : layers_) {
    if (std::holds_alternative<RawCircuitLayer>(entry.second)) {
      ++raw_count;
    }
  }
  std::vector<ScheduledCircuit> circuits;
  if (raw_count == 0) {
    std::set<std::string> mergeable;
    for (const PlacedPlaquette& placed : placed_plaquettes(k)) {
      circuits.push_back(placed.plaquette.circuit().shifted(Shift2D{placed.origin.x, placed.origin.y}));
      mergeable.insert(placed.plaquette.mergeable_instructions().begin(),
                       placed.plaquette.mergeable_instructions().end());
    }
    return merge_scheduled_circuits(circuits, mergeable);
  }
  if (raw_count != layers_.size()) {
    throw NotImplementedError("Layout layers mixing raw circuits and plaquettes are not supported");
  }
  for (const auto& [position, layer] : layers_) {
    const auto& raw = std::get<RawCircuitLayer>(layer);
    circuits.push_back(raw.circuit(k).shifted(cube_offset(position.to_block_position(), k)));
  }
  return merge_scheduled_circuits(circuits, {});
}

// ---------------------------------------------------------------- SequencedLayers

SequencedLayers::SequencedLayers(std::vector<Layer> layer_sequence) : layers_(std::move(layer_sequence)) {
  if (layers_.empty()) {
    throw CompilationError("A layer sequence cannot be empty");
  }
  // Layout layers of different depths may cover different footprints.
  if (std::any_of(layers_.begin(), layers_.end(), contains_layout_layer)) {
    return;
  }
  const Scalable2D shape = layers_.front().scalable_shape();
  for (const Layer& layer : layers_) {
    if (layer.scalable_shape() != shape) {
      throw CompilationError("Sequenced layers must share one spatial shape, found " + shape.str() + " and " +
                             layer.scalable_shape().str());
    }
  }
}

std::vector<LinearFunction> SequencedLayers::schedule() const {
  std::vector<LinearFunction> durations;
  durations.reserve(layers_.size());
  for (const Layer& layer : layers_) {
    durations.push_back(layer.scalable_timesteps());
  }
  return durations;
}

LinearFunction SequencedLayers::scalable_timesteps() const { return sum(schedule()); }

Scalable2D SequencedLayers::scalable_shape() const {
  if (std::any_of(layers_.begin(), layers_.end(), contains_layout_layer)) {
    throw NotImplementedError("The shape of a sequence of layout layers is not defined");
  }
  return layers_.front().scalable_shape();
}

bool SequencedLayers::operator==(const SequencedLayers& other) const { return layers_ == other.layers_; }

// ---------------------------------------------------------------- RepeatedLayer

RepeatedLayer::RepeatedLayer(Layer internal_layer, LinearFunction repetitions)
    : internal_(std::make_shared<const Layer>(std::move(internal_layer))), repetitions_(std::move(repetitions)) {
  const LinearFunction body = internal_->scalable_timesteps();
  if (body.is_scalable() && repetitions_.is_scalable()) {
    throw CompilationError("Cannot repeat a scalable body " + body.str() + " a scalable number of times " +
                           repetitions_.str());
  }
  if (body.slope() < Fraction(0) || repetitions_.slope() < Fraction(0)) {
    throw CompilationError("Repeated layers cannot shrink with k");
  }
}

LinearFunction RepeatedLayer::scalable_timesteps() const {
  return safe_mul(repetitions_, internal_->scalable_timesteps());
}

bool RepeatedLayer::operator==(const RepeatedLayer& other) const {
  return repetitions_ == other.repetitions_ && *internal_ == *other.internal_;
}

// ---------------------------------------------------------------- Layer

Layer::Layer(const AtomicLayer& layer)
    : layer_(std::visit([](const auto& atomic) -> Variant { return atomic; }, layer)) {}

AtomicLayer Layer::to_atomic_layer() const {
  if (is<PlaquetteLayer>()) {
    return as<PlaquetteLayer>();
  }
  if (is<RawCircuitLayer>()) {
    return as<RawCircuitLayer>();
  }
  throw CompilationError("Expected a plaquette or raw circuit layer");
}

Scalable2D Layer::scalable_shape() const {
  return std::visit([](const auto& layer) -> Scalable2D { return layer.scalable_shape(); }, layer_);
}

LinearFunction Layer::scalable_timesteps() const {
  return std::visit(Overloaded{
                        [](const SequencedLayers& layer) { return layer.scalable_timesteps(); },
                        [](const RepeatedLayer& layer) { return layer.scalable_timesteps(); },
                        [](const auto&) { return LinearFunction(0, 1); },
                    },
                    layer_);
}

LinearFunction Layer::scalable_num_moments() const {
  return std::visit(Overloaded{
                        [](const SequencedLayers& layer) {
                          LinearFunction total;
                          for (const Layer& child : layer.layer_sequence()) {
                            total = total + child.scalable_num_moments();
                          }
                          return total;
                        },
                        [](const RepeatedLayer& layer) {
                          return safe_mul(layer.repetitions(), layer.internal_layer().scalable_num_moments());
                        },
                        [](const auto& layer) -> LinearFunction { return layer.scalable_num_moments(); },
                    },
                    layer_);
}

Layer Layer::with_spatial_borders_trimmed(const std::set<SpatialBlockBorder>& borders) const {
  return std::visit(Overloaded{
                        [&](const PlaquetteLayer& layer) -> Layer { return layer.with_spatial_borders_trimmed(borders); },
                        [&](const RawCircuitLayer& layer) -> Layer { return layer.with_spatial_borders_trimmed(borders); },
                        [&](const LayoutLayer&) -> Layer {
                          throw CompilationError("Layout layers cannot have their spatial borders trimmed");
                        },
                        [&](const SequencedLayers& layer) -> Layer {
                          std::vector<Layer> trimmed;
                          for (const Layer& child : layer.layer_sequence()) {
                            trimmed.push_back(child.with_spatial_borders_trimmed(borders));
                          }
                          return SequencedLayers(std::move(trimmed));
                        },
                        [&](const RepeatedLayer& layer) -> Layer {
                          return RepeatedLayer(layer.internal_layer().with_spatial_borders_trimmed(borders),
                                               layer.repetitions());
                        },
                    },
                    layer_);
}

std::optional<Layer> Layer::with_temporal_borders_replaced(const BorderReplacements& replacements) const {
  if (is_atomic()) {
    return replace_atomic_layer(*this, replacements);
  }
  if (replacements.empty()) {
    return *this;
  }
  const auto bottom = replacements.find(TemporalBlockBorder::kZNegative);
  const auto top = replacements.find(TemporalBlockBorder::kZPositive);

  if (is<SequencedLayers>()) {
    std::vector<Layer> layers = as<SequencedLayers>().layer_sequence();
    if (bottom != replacements.end()) {
      std::optional<Layer> first = layers.front().with_temporal_borders_replaced({*bottom});
      if (first) {
        layers.front() = std::move(*first);
      } else {
        layers.erase(layers.begin());
      }
    }
    if (top != replacements.end() && !layers.empty()) {
      std::optional<Layer> last = layers.back().with_temporal_borders_replaced({*top});
      if (last) {
        layers.back() = std::move(*last);
      } else {
        layers.pop_back();
      }
    }
    if (layers.empty()) {
      return std::nullopt;
    }
    return Layer(SequencedLayers(std::move(layers)));
  }

  const auto& repeated = as<RepeatedLayer>();
  const auto replaced = static_cast<std::int64_t>(replacements.size());
  if (repeated.repetitions().is_constant() && repeated.repetitions().offset() < Fraction(replaced)) {
    throw CompilationError("Cannot replace " + std::to_string(replaced) + " borders of a layer repeated " +
                           repeated.repetitions().str() + " times");
  }
  // The peeled repetitions keep the body and only swap its outermost layer.
  std::vector<Layer> layers;
  if (bottom != replacements.end()) {
    std::optional<Layer> first = repeated.internal_layer().with_temporal_borders_replaced({*bottom});
    if (first) {
      layers.push_back(std::move(*first));
    }
  }
  const LinearFunction remaining = repeated.repetitions() - LinearFunction(0, replaced);
  if (remaining == LinearFunction(0, 1)) {
    layers.push_back(repeated.internal_layer());
  } else if (remaining != LinearFunction(0, 0)) {
    layers.push_back(RepeatedLayer(repeated.internal_layer(), remaining));
  }
  if (top != replacements.end()) {
    std::optional<Layer> last = repeated.internal_layer().with_temporal_borders_replaced({*top});
    if (last) {
      layers.push_back(std::move(*last));
    }
  }
  if (layers.empty()) {
    return std::nullopt;
  }
  if (layers.size() == 1) {
    return std::move(layers.front());
  }
  return Layer(SequencedLayers(std::move(layers)));
}

std::vector<Layer> Layer::all_layers(std::int64_t k) const {
  if (is<SequencedLayers>()) {
    std::vector<Layer> layers;
    for (const Layer& child : as<SequencedLayers>().layer_sequence()) {
      std::vector<Layer> child_layers = child.all_layers(k);
      layers.insert(layers.end(), child_layers.begin(), child_layers.end());
    }
    return layers;
  }
  if (is<RepeatedLayer>()) {
    const auto& repeated = as<RepeatedLayer>();
    const std::vector<Layer> body = repeated.internal_layer().all_layers(k);
    const std::int64_t repetitions = repeated.repetitions().integer_eval(k);
    std::vector<Layer> layers;
    for (std::int64_t i = 0; i < repetitions; ++i) {
      layers.insert(layers.end(), body.begin(), body.end());
    }
    return layers;
  }
  return {*this};
}

Layer Layer::to_sequenced_layer_with_schedule(const std::vector<LinearFunction>& schedule) const {
  if (is_atomic()) {
    throw CompilationError("Atomic layers cannot follow a schedule");
  }
  const LinearFunction duration = sum(schedule);
  if (duration != scalable_timesteps()) {
    throw CompilationError("Schedule lasts " + duration.str() + " timesteps but the layer lasts " +
                           scalable_timesteps().str());
  }
  if (is<SequencedLayers>()) {
    if (as<SequencedLayers>().schedule() == schedule) {
      return *this;
    }
    throw NotImplementedError("Rescheduling a sequence of layers is not supported");
  }
  const auto& repeated = as<RepeatedLayer>();
  const LinearFunction body = repeated.internal_layer().scalable_timesteps();
  if (!body.is_constant() || !body.offset().is_integer()) {
    throw NotImplementedError("Cannot reschedule a repeated layer with a scalable body");
  }
  std::vector<Layer> layers;
  for (const LinearFunction& entry : schedule) {
    const LinearFunction count = entry.exact_integer_div(body.offset().to_integer());
    if (count == LinearFunction(0, 1)) {
      layers.push_back(repeated.internal_layer());
    } else {
      layers.push_back(RepeatedLayer(repeated.internal_layer(), count));
    }
  }
  return SequencedLayers(std::move(layers));
}

Layer Layer::get_temporal_layer_on_border(TemporalBlockBorder border) const {
  if (is<SequencedLayers>()) {
    const auto& layers = as<SequencedLayers>().layer_sequence();
    const Layer& end = border == TemporalBlockBorder::kZNegative ? layers.front() : layers.back();
    return end.get_temporal_layer_on_border(border);
  }
  if (is<RepeatedLayer>()) {
    return as<RepeatedLayer>().internal_layer().get_temporal_layer_on_border(border);
  }
  return *this;
}

bool Layer::operator==(const Layer& other) const { return layer_ == other.layer_; }

}  // namespace qtopo
