#include "qtopo/core/tree/tree.h"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <variant>
#include <utility>

#include "stim/circuit/circuit.h"

#include "qtopo/core/circuit/measurement_map.h"
#include "qtopo/core/utils/errors.h"

namespace qtopo {

namespace {

class CircuitAnnotationWalker : public NodeWalker {
 public:
  explicit CircuitAnnotationWalker(std::int64_t k) : k_(k) {}

  void visit_node(LayerNode& node) override {
    if (node.is_leaf()) {
      LayerNodeAnnotations& annotations = node.annotations(k_);
      annotations.circuit = node.layout_layer().to_circuit(k_);
      annotations.detectors.clear();
      annotations.observables.clear();
    }
  }

 private:
  std::int64_t k_;
};

const ScheduledCircuit& leaf_circuit(const LayerNode& node, std::int64_t k) {
  const LayerNodeAnnotations& annotations = node.get_annotations(k);
  if (!annotations.circuit) {
    throw LookupError("Leaf has no circuit annotation for k = " + std::to_string(k));
  }
  return *annotations.circuit;
}

MeasurementRecordsMap leaf_measurements(const LayerNode& node, std::int64_t k) {
  const ScheduledCircuit& circuit = leaf_circuit(node, k);
  return MeasurementRecordsMap(circuit.get_circuit(false), circuit.qubit_map());
}

bool only_plaquette_layers(const LayoutLayer& layer) {
  return std::all_of(layer.layers().begin(), layer.layers().end(),
                     [](const auto& entry) { return std::holds_alternative<PlaquetteLayer>(entry.second); });
}

// Walks the leaves in execution order and remembers the leaf executed last. Bodies of
// repeated layers are visited twice when repeated more than once: detectors must hold
// both when entering the loop and when wrapping around it.
class DetectorAnnotator {
 public:
  DetectorAnnotator(std::int64_t k, std::int64_t manhattan_radius, DetectorDatabase* database,
                    const DetectorComputer& computer)
      : k_(k), manhattan_radius_(manhattan_radius), database_(database), computer_(computer) {}

  void annotate(LayerNode& node, const LayerNode*& previous) {
    if (node.is_leaf()) {
      const DetectorLayerView* previous_view = previous != nullptr ? &view(*previous) : nullptr;
      node.annotations(k_).detectors = computer_.compute(previous_view, view(node), manhattan_radius_, database_);
      previous = &node;
      return;
    }
    if (!node.is_repeated()) {
      for (LayerNode& child : node.children()) {
        annotate(child, previous);
      }
      return;
    }
    LayerNode& body = node.children().front();
    const std::int64_t repetitions = node.repetitions().integer_eval(k_);
    // A body that never runs measures nothing the next leaf could compare against.
    if (repetitions <= 0) {
      return;
    }
    annotate(body, previous);
    if (repetitions == 1) {
      return;
    }
    const std::vector<LayerNode*> leaves = body.leaves();
    std::vector<std::vector<DetectorAnnotation>> entering;
    for (const LayerNode* leaf : leaves) {
      entering.push_back(leaf->get_annotations(k_).detectors);
    }
    const LayerNode* wrapped = previous;
    annotate(body, wrapped);
    for (std::size_t i = 0; i < leaves.size(); ++i) {
      std::vector<DetectorAnnotation>& looping = leaves[i]->annotations(k_).detectors;
      std::vector<DetectorAnnotation> kept;
      for (DetectorAnnotation& detector : entering[i]) {
        if (std::find(looping.begin(), looping.end(), detector) != looping.end()) {
          kept.push_back(std::move(detector));
        }
      }
      looping = std::move(kept);
    }
  }

 private:
  const DetectorLayerView& view(const LayerNode& node) {
    const auto it = views_.find(&node);
    if (it != views_.end()) {
      return it->second;
    }
    DetectorLayerView layer_view;
    if (only_plaquette_layers(node.layout_layer())) {
      layer_view.plaquettes = node.layout_layer().placed_plaquettes(k_);
    }
    layer_view.measurements = leaf_measurements(node, k_);
    return views_.emplace(&node, std::move(layer_view)).first->second;
  }

  std::int64_t k_;
  std::int64_t manhattan_radius_;
  DetectorDatabase* database_;
  const DetectorComputer& computer_;
  std::map<const LayerNode*, DetectorLayerView> views_;
};

// Leaf executed first (or last) in the subtree. Throws NotImplementedError when that
// leaf sits inside a repeated layer.
LayerNode& edge_leaf(LayerNode& node, bool first) {
  if (node.is_leaf()) {
    return node;
  }
  if (node.is_repeated()) {
    throw NotImplementedError("Observables on a layer inside a repeated block are not supported");
  }
  return edge_leaf(first ? node.children().front() : node.children().back(), first);
}

void annotate_observable_at_leaf(LayerNode& leaf, std::int64_t k, const AbstractObservable& slice,
                                 const ObservableBuilder& builder, ObservableComponent component,
                                 std::size_t index) {
  const auto template_and_plaquettes = leaf.layout_layer().to_template_and_plaquettes();
  const std::set<GridQubit> qubits =
      compute_observable_qubits(k, slice, template_and_plaquettes.first, builder, component);
  if (qubits.empty()) {
    return;
  }
  ObservableAnnotation annotation = observable_with_measurement_records(qubits, leaf_measurements(leaf, k), index);
  if (!annotation.measurement_offsets.empty()) {
    leaf.annotations(k).observables.push_back(std::move(annotation));
  }
}

}  // namespace

LayerTree::LayerTree(const SequencedLayers& root, std::vector<Coordinate> depths)
    : root_(Layer(root)), depths_(std::move(depths)) {
  if (depths_.size() != root_.children().size()) {
    throw CompilationError("Expected " + std::to_string(root_.children().size()) + " depths, got " +
                           std::to_string(depths_.size()));
  }
}

void LayerTree::annotate_circuits(std::int64_t k) {
  if (k < 1) {
    throw std::invalid_argument("k must be at least 1, got " + std::to_string(k));
  }
  CircuitAnnotationWalker walker(k);
  root_.walk(walker);
}

void LayerTree::annotate_detectors(std::int64_t k, std::int64_t manhattan_radius, DetectorDatabase* database,
                                   const DetectorComputer* computer) {
  const PlaquetteDetectorComputer default_computer;
  DetectorAnnotator annotator(k, manhattan_radius, database, computer != nullptr ? *computer : default_computer);
  const LayerNode* previous = nullptr;
  annotator.annotate(root_, previous);
}

void LayerTree::annotate_observables(std::int64_t k, const std::vector<AbstractObservable>& observables,
                                     const ObservableBuilder& builder) {
  for (LayerNode* leaf : root_.leaves()) {
    leaf->annotations(k).observables.clear();
  }
  for (std::size_t index = 0; index < observables.size(); ++index) {
    for (std::size_t child = 0; child < depths_.size(); ++child) {
      const AbstractObservable slice = observables[index].slice_at_z(depths_[child]);
      if (slice.empty()) {
        continue;
      }
      LayerNode& subtree = root_.children()[child];
      annotate_observable_at_leaf(edge_leaf(subtree, true), k, slice, builder,
                                  ObservableComponent::kBottomStabilizers, index);
      annotate_observable_at_leaf(edge_leaf(subtree, false), k, slice, builder, ObservableComponent::kTopReadouts,
                                  index);
    }
  }
}

QubitMap LayerTree::global_qubit_map(std::int64_t k) const {
  std::vector<GridQubit> qubits;
  for (const LayerNode* leaf : root_.leaves()) {
    const std::vector<GridQubit> leaf_qubits = leaf_circuit(*leaf, k).qubit_map().qubits();
    qubits.insert(qubits.end(), leaf_qubits.begin(), leaf_qubits.end());
  }
  return QubitMap::from_qubits(std::move(qubits));
}

stim::Circuit LayerTree::generate_circuit(std::int64_t k, bool include_qubit_coords) const {
  const QubitMap global_map = global_qubit_map(k);
  stim::Circuit circuit;
  if (include_qubit_coords) {
    global_map.append_qubit_coords(&circuit);
  }
  circuit += root_.generate_circuit(k, global_map);
  return circuit;
}

}  // namespace qtopo
