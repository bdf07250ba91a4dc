#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <utility>
#include <variant>
#include <vector>

#include "qtopo/core/blocks/enums.h"
#include "qtopo/core/circuit/qubit_map.h"
#include "qtopo/core/circuit/scheduled_circuit.h"
#include "qtopo/core/geometry/layout_position.h"
#include "qtopo/core/plaquette/plaquette.h"
#include "qtopo/core/scale/linear_function.h"
#include "qtopo/core/templates/layout_template.h"
#include "qtopo/core/templates/template.h"

namespace qtopo {

class Layer;

// Replacement for each temporal border; std::nullopt removes the layer on that border.
using BorderReplacements = std::map<TemporalBlockBorder, std::optional<Layer>>;

// One timestep of a template filled with plaquettes.
class PlaquetteLayer {
 public:
  // Throws CompilationError unless the template increments are (2, 2) and the trimmed
  // template keeps a positive, non-decreasing size.
  PlaquetteLayer(std::shared_ptr<const RectangularTemplate> layer_template, Plaquettes plaquettes,
                 std::set<SpatialBlockBorder> trimmed_spatial_borders = {});

  const RectangularTemplate& layer_template() const noexcept { return *template_; }
  const std::shared_ptr<const RectangularTemplate>& shared_template() const noexcept { return template_; }
  const Plaquettes& plaquettes() const noexcept { return plaquettes_; }
  const std::set<SpatialBlockBorder>& trimmed_spatial_borders() const noexcept { return trimmed_; }

  // In qubits: trimmed template shape * increments + 1.
  Scalable2D scalable_shape() const;
  LinearFunction scalable_num_moments() const;

  // Drops the plaquettes sitting on the given borders.
  PlaquetteLayer with_spatial_borders_trimmed(const std::set<SpatialBlockBorder>& borders) const;

  bool operator==(const PlaquetteLayer& other) const;

 private:
  Scalable2D trimmed_template_shape() const;

  std::shared_ptr<const RectangularTemplate> template_;
  Plaquettes plaquettes_;
  std::set<SpatialBlockBorder> trimmed_;
};

// One timestep given verbatim as a circuit, generated per k.
class RawCircuitLayer {
 public:
  using CircuitFactory = std::function<ScheduledCircuit(std::int64_t k)>;

  RawCircuitLayer(CircuitFactory factory, Scalable2D scalable_raw_shape, LinearFunction scalable_num_moments);

  ScheduledCircuit circuit(std::int64_t k) const { return (*factory_)(k); }
  const Scalable2D& scalable_shape() const noexcept { return shape_; }
  const LinearFunction& scalable_num_moments() const noexcept { return num_moments_; }

  // Throws NotImplementedError for any non-empty set of borders.
  RawCircuitLayer with_spatial_borders_trimmed(const std::set<SpatialBlockBorder>& borders) const;

  // Two raw layers are equal when they share the same factory and shape.
  bool operator==(const RawCircuitLayer& other) const {
    return factory_ == other.factory_ && shape_ == other.shape_ && num_moments_ == other.num_moments_;
  }

 private:
  std::shared_ptr<const CircuitFactory> factory_;
  Scalable2D shape_;
  LinearFunction num_moments_;
};

using AtomicLayer = std::variant<PlaquetteLayer, RawCircuitLayer>;

Scalable2D scalable_shape(const AtomicLayer& layer);

// Plaquette whose syndrome qubit sits at `origin` on the global grid.
struct PlacedPlaquette {
  GridQubit origin;
  Plaquette plaquette;
};

// Atomic layers of every cube and spatial pipe at one depth, merged into one timestep.
class LayoutLayer {
 public:
  // Throws CompilationError if `layers` is empty.
  LayoutLayer(std::map<LayoutPosition2D, AtomicLayer> layers, Scalable2D element_shape);

  const std::map<LayoutPosition2D, AtomicLayer>& layers() const noexcept { return layers_; }
  // Qubit shape of one cube.
  const Scalable2D& element_shape() const noexcept { return element_shape_; }

  // Smallest and largest cube positions covered.
  std::pair<BlockPosition2D, BlockPosition2D> bounds() const;
  Scalable2D scalable_shape() const;
  LinearFunction scalable_num_moments() const;

  // Cube templates plus cube plaquettes where every pipe wrote its border plaquettes.
  // Throws NotImplementedError unless every layer is a PlaquetteLayer.
  std::pair<LayoutTemplate, Plaquettes> to_template_and_plaquettes() const;
  // Non-empty plaquettes at their syndrome position for the given k.
  std::vector<PlacedPlaquette> placed_plaquettes(std::int64_t k) const;
  ScheduledCircuit to_circuit(std::int64_t k) const;

  bool operator==(const LayoutLayer& other) const {
    return layers_ == other.layers_ && element_shape_ == other.element_shape_;
  }

 private:
  // Qubit coordinate of the top-left syndrome of the cube at `position`.
  Shift2D cube_offset(const BlockPosition2D& position, std::int64_t k) const;

  std::map<LayoutPosition2D, AtomicLayer> layers_;
  Scalable2D element_shape_;
};

// Layers executed one after the other.
class SequencedLayers {
 public:
  // Throws CompilationError if `layer_sequence` is empty or mixes spatial shapes. Sequences
  // holding layout layers are not shape-checked.
  explicit SequencedLayers(std::vector<Layer> layer_sequence);

  const std::vector<Layer>& layer_sequence() const noexcept { return layers_; }
  std::vector<LinearFunction> schedule() const;
  LinearFunction scalable_timesteps() const;
  // Throws NotImplementedError for sequences holding layout layers.
  Scalable2D scalable_shape() const;

  bool operator==(const SequencedLayers& other) const;

 private:
  std::vector<Layer> layers_;
};

// A layer repeated a scalable number of times.
class RepeatedLayer {
 public:
  // Throws CompilationError if both the body duration and the repetitions scale with k,
  // or if either decreases with k.
  RepeatedLayer(Layer internal_layer, LinearFunction repetitions);

  const Layer& internal_layer() const noexcept { return *internal_; }
  const LinearFunction& repetitions() const noexcept { return repetitions_; }
  LinearFunction scalable_timesteps() const;

  bool operator==(const RepeatedLayer& other) const;

 private:
  std::shared_ptr<const Layer> internal_;
  LinearFunction repetitions_;
};

// Closed sum over every layer kind.
class Layer {
 public:
  using Variant = std::variant<PlaquetteLayer, RawCircuitLayer, LayoutLayer, SequencedLayers, RepeatedLayer>;

  Layer(PlaquetteLayer layer) : layer_(std::move(layer)) {}
  Layer(RawCircuitLayer layer) : layer_(std::move(layer)) {}
  Layer(LayoutLayer layer) : layer_(std::move(layer)) {}
  Layer(SequencedLayers layer) : layer_(std::move(layer)) {}
  Layer(RepeatedLayer layer) : layer_(std::move(layer)) {}
  Layer(const AtomicLayer& layer);

  const Variant& variant() const noexcept { return layer_; }

  template <typename T>
  bool is() const noexcept {
    return std::holds_alternative<T>(layer_);
  }
  template <typename T>
  const T& as() const {
    return std::get<T>(layer_);
  }

  // Plaquette, raw and layout layers span exactly one timestep.
  bool is_atomic() const noexcept { return !is_composed(); }
  bool is_composed() const noexcept { return is<SequencedLayers>() || is<RepeatedLayer>(); }
  // Throws CompilationError unless this is a PlaquetteLayer or a RawCircuitLayer.
  AtomicLayer to_atomic_layer() const;

  Scalable2D scalable_shape() const;
  LinearFunction scalable_timesteps() const;
  LinearFunction scalable_num_moments() const;

  Layer with_spatial_borders_trimmed(const std::set<SpatialBlockBorder>& borders) const;
  // std::nullopt when nothing is left after the replacement.
  std::optional<Layer> with_temporal_borders_replaced(const BorderReplacements& replacements) const;

  // Atomic layers in execution order for the given k.
  std::vector<Layer> all_layers(std::int64_t k) const;

  // Rewrites a composed layer as a SequencedLayers following `schedule`.
  Layer to_sequenced_layer_with_schedule(const std::vector<LinearFunction>& schedule) const;

  // Atomic layer executed first (kZNegative) or last (kZPositive).
  Layer get_temporal_layer_on_border(TemporalBlockBorder border) const;

  bool operator==(const Layer& other) const;
  bool operator!=(const Layer& other) const { return !(*this == other); }

 private:
  Variant layer_;
};

}  // namespace qtopo
